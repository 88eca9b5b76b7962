#pragma once
#ifndef AEGIS_FINGERPRINT_H
#define AEGIS_FINGERPRINT_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace aegis {

// Tamper-evidence helpers over OpenSSL. These are integrity checksums,
// not security proofs.

// Lowercase hex SHA-256 of payload.
std::string sha256_hex(const std::string& payload);

// Lowercase hex HMAC-SHA256 of payload under key.
std::string hmac_sha256_hex(const std::string& key, const std::string& payload);

// Uniform value in [0,1) taken from the first 8 bytes of HMAC-SHA256(key, payload).
double keyed_unit_interval(const std::string& key, const std::string& payload);

// Constant-time equality for fingerprints of equal length.
bool fingerprints_equal(const std::string& a, const std::string& b);

// Secure entropy. Throws std::runtime_error when the RNG fails.
void secure_random_bytes(unsigned char* out, size_t len);
uint64_t secure_random_u64();
double secure_uniform(double lo, double hi);
std::string secure_random_hex(size_t bytes);

// Deterministic text for a double that round-trips exactly.
std::string canonical_double(double value);

}  // namespace aegis

#endif  // AEGIS_FINGERPRINT_H
