#include "state/state_container.h"
#include "common/errors.h"
#include "integrity/fingerprint.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace aegis {

StateContainer::StateContainer(int dimension, const Clock& clock)
    : clock_(&clock),
      dimension_(std::clamp(dimension, MIN_DIMENSION, MAX_DIMENSION)) {
    if (dimension_ != dimension) {
        spdlog::debug("State dimension {} clamped to {}", dimension, dimension_);
    }
    amplitudes_.reserve(static_cast<size_t>(dimension_));
    for (int i = 0; i < dimension_; ++i) {
        double re = secure_uniform(-1.0, 1.0);
        double im = secure_uniform(-1.0, 1.0);
        amplitudes_.emplace_back(re, im);
    }
    normalize(amplitudes_);
    refresh_fingerprint();
}

StateContainer::StateContainer(const StateRecord& record, const Clock& clock)
    : clock_(&clock),
      dimension_(record.dimension),
      amplitudes_(record.amplitudes),
      state_hash_(record.state_hash),
      proof_(record.proof),
      timestamp_(record.timestamp) {}

void StateContainer::normalize(std::vector<Amplitude>& amplitudes) {
    double norm = std::sqrt(total_probability(amplitudes));
    if (norm < ZERO_NORM_EPSILON || !std::isfinite(norm)) {
        std::fill(amplitudes.begin(), amplitudes.end(), Amplitude(0.0, 0.0));
        if (!amplitudes.empty()) amplitudes[0] = Amplitude(1.0, 0.0);
        return;
    }
    for (auto& a : amplitudes) {
        a /= norm;
    }
}

double StateContainer::total_probability(const std::vector<Amplitude>& amplitudes) {
    double sum = 0.0;
    for (const auto& a : amplitudes) {
        sum += std::norm(a);
    }
    return sum;
}

std::string StateContainer::compute_state_hash(const std::vector<Amplitude>& amplitudes,
                                               int64_t timestamp) {
    std::string payload;
    payload.reserve(amplitudes.size() * 40 + 24);
    for (const auto& a : amplitudes) {
        payload += canonical_double(a.real());
        payload += ',';
        payload += canonical_double(a.imag());
        payload += ';';
    }
    payload += std::to_string(timestamp);
    return sha256_hex(payload);
}

std::string StateContainer::compute_proof(const std::string& state_hash, int64_t timestamp) {
    return sha256_hex(state_hash + ":" + std::to_string(timestamp));
}

void StateContainer::refresh_fingerprint() {
    // Strictly increasing so every evolution yields a fresh fingerprint.
    timestamp_ = std::max(clock_->now_ms(), timestamp_ + 1);
    state_hash_ = compute_state_hash(amplitudes_, timestamp_);
    proof_ = compute_proof(state_hash_, timestamp_);
}

void StateContainer::evolve(const Matrix& matrix) {
    auto n = static_cast<size_t>(dimension_);
    if (matrix.size() != n) {
        throw ValidationError(ValidationReason::DimensionMismatch,
                              "matrix has " + std::to_string(matrix.size()) + " rows, expected " +
                                  std::to_string(n));
    }
    for (size_t r = 0; r < n; ++r) {
        if (matrix[r].size() != n) {
            throw ValidationError(ValidationReason::DimensionMismatch,
                                  "matrix row " + std::to_string(r) + " has " +
                                      std::to_string(matrix[r].size()) + " columns, expected " +
                                      std::to_string(n));
        }
    }

    std::vector<Amplitude> next(n, Amplitude(0.0, 0.0));
    for (size_t r = 0; r < n; ++r) {
        Amplitude acc(0.0, 0.0);
        for (size_t c = 0; c < n; ++c) {
            acc += matrix[r][c] * amplitudes_[c];
        }
        next[r] = acc;
    }
    normalize(next);
    amplitudes_ = std::move(next);
    refresh_fingerprint();
}

Measurement StateContainer::measure(int basis_index) const {
    if (basis_index < 0 || basis_index >= dimension_) {
        throw ValidationError(ValidationReason::InvalidBasis,
                              "basis index " + std::to_string(basis_index) + " outside [0," +
                                  std::to_string(dimension_) + ")");
    }

    int64_t now = clock_->now_ms();
    // The nonce keeps back-to-back samples in the same millisecond independent.
    std::string payload = state_hash_ + "|" + std::to_string(basis_index) + "|" +
                          std::to_string(now) + "|" + secure_random_hex(8);
    double u = keyed_unit_interval(proof_, payload);

    int outcome = dimension_ - 1;
    double cumulative = 0.0;
    for (int i = 0; i < dimension_; ++i) {
        cumulative += std::norm(amplitudes_[static_cast<size_t>(i)]);
        if (u < cumulative) {
            outcome = i;
            break;
        }
    }

    double probability = std::norm(amplitudes_[static_cast<size_t>(outcome)]);
    std::string proof = sha256_hex(state_hash_ + ":" + std::to_string(outcome) + ":" +
                                   canonical_double(probability) + ":" + std::to_string(now));
    return Measurement{outcome, probability, proof};
}

bool StateContainer::verify() const {
    auto expected_hash = compute_state_hash(amplitudes_, timestamp_);
    auto expected_proof = compute_proof(expected_hash, timestamp_);
    return fingerprints_equal(expected_hash, state_hash_) &&
           fingerprints_equal(expected_proof, proof_);
}

Correlation StateContainer::correlate(const StateContainer& other) const {
    size_t common = std::min(amplitudes_.size(), other.amplitudes_.size());
    Amplitude overlap(0.0, 0.0);
    for (size_t i = 0; i < common; ++i) {
        overlap += amplitudes_[i] * std::conj(other.amplitudes_[i]);
    }
    double value = std::abs(overlap);
    std::string proof = sha256_hex(state_hash_ + ":" + other.state_hash_ + ":" + canonical_double(value));
    return Correlation{value, proof};
}

StateRecord StateContainer::to_record() const {
    StateRecord record;
    record.dimension = dimension_;
    record.amplitudes = amplitudes_;
    record.state_hash = state_hash_;
    record.proof = proof_;
    record.timestamp = timestamp_;
    return record;
}

StateContainer StateContainer::from_record(const StateRecord& record, const Clock& clock) {
    if (record.dimension < MIN_DIMENSION || record.dimension > MAX_DIMENSION) {
        throw ValidationError(ValidationReason::InvalidDimension,
                              "dimension " + std::to_string(record.dimension) + " out of range");
    }
    if (record.amplitudes.size() != static_cast<size_t>(record.dimension)) {
        throw ValidationError(ValidationReason::MalformedRecord,
                              "expected " + std::to_string(record.dimension) + " amplitudes, got " +
                                  std::to_string(record.amplitudes.size()));
    }
    for (const auto& a : record.amplitudes) {
        if (!std::isfinite(a.real()) || !std::isfinite(a.imag())) {
            throw ValidationError(ValidationReason::MalformedRecord, "non-finite amplitude");
        }
    }
    double total = total_probability(record.amplitudes);
    if (std::abs(total - 1.0) > NORMALIZATION_TOLERANCE) {
        throw ValidationError(ValidationReason::MalformedRecord,
                              "amplitudes not normalized (total probability " + canonical_double(total) + ")");
    }
    if (record.state_hash.empty() || record.proof.empty()) {
        throw ValidationError(ValidationReason::MalformedRecord, "missing fingerprint");
    }

    StateContainer container(record, clock);
    if (!container.verify()) {
        spdlog::warn("State record failed verification (hash {})", record.state_hash);
        throw IntegrityError("state record fingerprint mismatch");
    }
    return container;
}

}  // namespace aegis
