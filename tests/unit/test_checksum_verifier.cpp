/**
 * @file test_checksum_verifier.cpp
 * @brief Chunk digest computation and comparison
 */

#include <gtest/gtest.h>
#include "ChecksumVerifier.h"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace Tessera::Transfer;

namespace {
    const std::string HELLO_SHA256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

    std::vector<uint8_t> bytesOf(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

TEST(ChecksumVerifierTest, DigestIsLowercaseSha256Hex) {
    EXPECT_EQ(ChecksumVerifier::digest(bytesOf("hello")), HELLO_SHA256);
}

TEST(ChecksumVerifierTest, DigestOfEmptyPayload) {
    EXPECT_EQ(ChecksumVerifier::digest({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChecksumVerifierTest, MatchesExpectedDigest) {
    EXPECT_TRUE(ChecksumVerifier::matches(bytesOf("hello"), HELLO_SHA256));
    EXPECT_FALSE(ChecksumVerifier::matches(bytesOf("hellO"), HELLO_SHA256));
}

TEST(ChecksumVerifierTest, ComparisonIgnoresCase) {
    std::string upper = HELLO_SHA256;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    EXPECT_TRUE(ChecksumVerifier::matches(bytesOf("hello"), upper));
    EXPECT_TRUE(ChecksumVerifier::digestsEqual(upper, HELLO_SHA256));
}

TEST(ChecksumVerifierTest, DifferentLengthsNeverMatch) {
    EXPECT_FALSE(ChecksumVerifier::digestsEqual(HELLO_SHA256, HELLO_SHA256.substr(0, 32)));
    EXPECT_FALSE(ChecksumVerifier::matches(bytesOf("hello"), ""));
}
