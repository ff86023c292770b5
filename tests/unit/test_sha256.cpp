/**
 * @file test_sha256.cpp
 * @brief SHA-256 helper over OpenSSL EVP
 */

#include <gtest/gtest.h>
#include "SHA256.h"
#include "TestHelpers.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace Tessera;

TEST(SHA256Test, StringHash) {
    EXPECT_EQ(SHA256::hash("hello"), "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(SHA256::hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, BytesHash) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    EXPECT_EQ(SHA256::hashBytes(data), "039058c6f2c0cb492c533b0a4d14ef77cc0f78abccced5287d84a1a2011cfb81");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    Tessera::SHA256 hasher;
    ASSERT_TRUE(hasher.update("hel", 3));
    ASSERT_TRUE(hasher.update("lo", 2));
    EXPECT_EQ(hasher.finalHex(), SHA256::hash("hello"));
}

TEST(SHA256Test, FileHashSpansReadBuffers) {
    auto path = Testing::uniqueTempPath("tessera_sha256").string();
    // Larger than one HASH_READ_BUFFER_SIZE read
    std::string content(200 * 1024, 'x');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    EXPECT_EQ(SHA256::hashFile(path), SHA256::hash(content));
    std::filesystem::remove(path);
}

TEST(SHA256Test, MissingFileHashesToEmpty) {
    EXPECT_EQ(SHA256::hashFile("/nonexistent/tessera/file"), "");
}
