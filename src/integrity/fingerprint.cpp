#include "integrity/fingerprint.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <cstdio>
#include <stdexcept>

namespace aegis {

namespace {

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

uint64_t leading_u64(const unsigned char* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

// 53 high bits mapped onto [0,1).
double to_unit(uint64_t bits) {
    return static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);
}

void hmac_raw(const std::string& key, const std::string& payload,
              unsigned char* out, unsigned int* out_len) {
    auto* result = HMAC(EVP_sha256(),
                        key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
                        out, out_len);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
}

}  // namespace

std::string sha256_hex(const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(payload.data(), payload.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(digest, digest_len);
}

std::string hmac_sha256_hex(const std::string& key, const std::string& payload) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    hmac_raw(key, payload, mac, &mac_len);
    return to_hex(mac, mac_len);
}

double keyed_unit_interval(const std::string& key, const std::string& payload) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    hmac_raw(key, payload, mac, &mac_len);
    return to_unit(leading_u64(mac));
}

bool fingerprints_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

void secure_random_bytes(unsigned char* out, size_t len) {
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        throw std::runtime_error("secure entropy source unavailable");
    }
}

uint64_t secure_random_u64() {
    unsigned char bytes[8];
    secure_random_bytes(bytes, sizeof(bytes));
    return leading_u64(bytes);
}

double secure_uniform(double lo, double hi) {
    return lo + (hi - lo) * to_unit(secure_random_u64());
}

std::string secure_random_hex(size_t bytes) {
    std::string raw(bytes, '\0');
    secure_random_bytes(reinterpret_cast<unsigned char*>(raw.data()), bytes);
    return to_hex(reinterpret_cast<const unsigned char*>(raw.data()), bytes);
}

std::string canonical_double(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return std::string(buffer);
}

}  // namespace aegis
