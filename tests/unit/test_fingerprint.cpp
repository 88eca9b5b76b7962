#include <gtest/gtest.h>
#include "integrity/fingerprint.h"
#include <set>

using namespace aegis;

TEST(FingerprintTest, test_sha256_known_vector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

TEST(FingerprintTest, test_hmac_known_vector) {
    // RFC 4231 test case 2
    EXPECT_EQ(hmac_sha256_hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(FingerprintTest, test_keyed_unit_interval_range_and_determinism) {
    for (int i = 0; i < 200; ++i) {
        double u = keyed_unit_interval("key", "payload-" + std::to_string(i));
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);
    }
    EXPECT_DOUBLE_EQ(keyed_unit_interval("k", "p"), keyed_unit_interval("k", "p"));
    EXPECT_NE(keyed_unit_interval("k1", "p"), keyed_unit_interval("k2", "p"));
}

TEST(FingerprintTest, test_fingerprints_equal) {
    EXPECT_TRUE(fingerprints_equal("abcd", "abcd"));
    EXPECT_FALSE(fingerprints_equal("abcd", "abce"));
    EXPECT_FALSE(fingerprints_equal("abcd", "abc"));
}

TEST(FingerprintTest, test_secure_uniform_range) {
    for (int i = 0; i < 1000; ++i) {
        double v = secure_uniform(-1.0, 1.0);
        EXPECT_GE(v, -1.0);
        EXPECT_LT(v, 1.0);
    }
}

TEST(FingerprintTest, test_secure_random_hex_unique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto hex = secure_random_hex(8);
        EXPECT_EQ(hex.size(), 16u);
        seen.insert(hex);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(FingerprintTest, test_canonical_double_round_trips) {
    double value = 0.1 + 0.2;
    EXPECT_EQ(std::stod(canonical_double(value)), value);
}
