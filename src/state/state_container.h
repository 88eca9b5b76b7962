#pragma once
#ifndef AEGIS_STATE_CONTAINER_H
#define AEGIS_STATE_CONTAINER_H

#include <complex>
#include <cstdint>
#include <string>
#include <vector>
#include "common/clock.h"

namespace aegis {

constexpr int MIN_DIMENSION = 2;
constexpr int MAX_DIMENSION = 256;
constexpr double NORMALIZATION_TOLERANCE = 1e-9;
constexpr double ZERO_NORM_EPSILON = 1e-12;

using Amplitude = std::complex<double>;
using Matrix = std::vector<std::vector<Amplitude>>;

struct StateRecord {
    int dimension = 0;
    std::vector<Amplitude> amplitudes;
    std::string state_hash;
    std::string proof;
    int64_t timestamp = 0;
};

struct Measurement {
    int outcome;
    double probability;
    std::string proof;
};

struct Correlation {
    double value;
    std::string proof;
};

// Normalized complex state with a recomputable integrity fingerprint.
//
// A container has one logical owner. evolve() replaces the state in place and
// must not run concurrently with anything else on the same instance; the const
// members are safe for concurrent readers.
class StateContainer {
public:
    // Dimension is clamped to [MIN_DIMENSION, MAX_DIMENSION]; coordinates are
    // drawn from the secure RNG in [-1,1] and normalized.
    explicit StateContainer(int dimension, const Clock& clock = system_clock());

    int dimension() const { return dimension_; }
    const std::vector<Amplitude>& amplitudes() const { return amplitudes_; }
    const std::string& state_hash() const { return state_hash_; }
    const std::string& proof() const { return proof_; }
    int64_t timestamp() const { return timestamp_; }

    // Throws ValidationError(DimensionMismatch) unless matrix is dimension x dimension.
    void evolve(const Matrix& matrix);

    // Samples an outcome from |a_i|^2 without collapsing the state. basis_index
    // must lie in [0, dimension) and is bound into the sampling hash.
    Measurement measure(int basis_index) const;

    bool verify() const;

    // Overlap magnitude over the common prefix; indices past the shorter state
    // contribute zero.
    Correlation correlate(const StateContainer& other) const;

    StateRecord to_record() const;

    // Throws ValidationError(InvalidDimension or MalformedRecord) or IntegrityError.
    // A record must be normalized within NORMALIZATION_TOLERANCE.
    static StateContainer from_record(const StateRecord& record, const Clock& clock = system_clock());

    // Resets to (1,0,...) when the norm is below ZERO_NORM_EPSILON.
    static void normalize(std::vector<Amplitude>& amplitudes);
    static double total_probability(const std::vector<Amplitude>& amplitudes);
    static std::string compute_state_hash(const std::vector<Amplitude>& amplitudes, int64_t timestamp);
    static std::string compute_proof(const std::string& state_hash, int64_t timestamp);

private:
    StateContainer(const StateRecord& record, const Clock& clock);

    void refresh_fingerprint();

    const Clock* clock_;
    int dimension_;
    std::vector<Amplitude> amplitudes_;
    std::string state_hash_;
    std::string proof_;
    int64_t timestamp_ = 0;
};

}  // namespace aegis

#endif  // AEGIS_STATE_CONTAINER_H
