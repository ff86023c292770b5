/**
 * @file test_transfer_manifest.cpp
 * @brief Manifest parsing, validation and chunk offsets
 */

#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "TransferManifest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace Tessera::Transfer;

namespace {
    void expectInvalid(const std::string& text) {
        auto parsed = TransferManifest::fromString(text);
        ASSERT_TRUE(parsed.isError()) << text;
        EXPECT_EQ(parsed.error().code, tsr::ErrorCode::InvalidManifest) << text;
    }

    TransferManifest threeChunks() {
        TransferManifest manifest;
        manifest.fileSize = 2900;
        manifest.chunks = {{0, 1000, std::string("aa")}, {1, 1000, std::nullopt}, {2, 1000, std::string("cc")}};
        return manifest;
    }
}

TEST(TransferManifestTest, ParsesAndSortsChunks) {
    auto parsed = TransferManifest::fromString(R"({
        "fileSize": 2500,
        "chunks": [
            {"index": 2, "encryptedSize": 500, "checksum": "c2"},
            {"index": 0, "encryptedSize": 1000, "checksum": "c0"},
            {"index": 1, "encryptedSize": 1000}
        ]})");
    ASSERT_TRUE(parsed) << parsed.error().message;

    EXPECT_EQ(parsed->fileSize, 2500u);
    ASSERT_EQ(parsed->chunkCount(), 3u);
    EXPECT_EQ(parsed->chunks[0].index, 0u);
    EXPECT_EQ(parsed->chunks[0].checksum, std::optional<std::string>("c0"));
    EXPECT_FALSE(parsed->chunks[1].checksum.has_value());
    EXPECT_EQ(parsed->chunks[2].encryptedSize, 500u);
    EXPECT_EQ(parsed->totalEncryptedSize(), 2500u);
}

TEST(TransferManifestTest, OffsetsArePrefixSums) {
    TransferManifest manifest;
    manifest.fileSize = 1;
    manifest.chunks = {{0, 1000, std::nullopt}, {1, 24, std::nullopt}, {2, 7, std::nullopt}};
    EXPECT_EQ(manifest.computeOffsets(), (std::vector<uint64_t>{0, 1000, 1024}));
}

TEST(TransferManifestTest, RejectsBrokenManifests) {
    expectInvalid("not json");
    expectInvalid("[]");
    expectInvalid(R"({"chunks": [{"index": 0, "encryptedSize": 10}]})");
    expectInvalid(R"({"fileSize": 0, "chunks": [{"index": 0, "encryptedSize": 10}]})");
    expectInvalid(R"({"fileSize": -5, "chunks": [{"index": 0, "encryptedSize": 10}]})");
    expectInvalid(R"({"fileSize": 10, "chunks": []})");
    expectInvalid(R"({"fileSize": 10, "chunks": {}})");
    expectInvalid(R"({"fileSize": 10, "chunks": [{"index": 0, "encryptedSize": 0}]})");
    expectInvalid(R"({"fileSize": 10, "chunks": [{"index": 0, "encryptedSize": 5}, {"index": 2, "encryptedSize": 5}]})");
    expectInvalid(R"({"fileSize": 10, "chunks": [{"index": 0, "encryptedSize": 5}, {"index": 0, "encryptedSize": 5}]})");
    expectInvalid(R"({"fileSize": 10, "chunks": [{"index": 0, "encryptedSize": 5, "checksum": 12}]})");
    expectInvalid(R"({"fileSize": 10, "chunks": [{"encryptedSize": 5}]})");
}

TEST(TransferManifestTest, ValidateDirectly) {
    auto manifest = threeChunks();
    EXPECT_TRUE(manifest.validate());

    manifest.chunks[1].index = 5;
    auto invalid = manifest.validate();
    ASSERT_TRUE(invalid.isError());
    EXPECT_EQ(invalid.error().code, tsr::ErrorCode::InvalidManifest);
}

TEST(TransferManifestTest, JsonFormIsStable) {
    auto manifest = threeChunks();
    auto again = TransferManifest::fromString(manifest.toString());
    ASSERT_TRUE(again);
    EXPECT_EQ(again->fileSize, manifest.fileSize);
    ASSERT_EQ(again->chunkCount(), 3u);
    EXPECT_EQ(again->chunks[0].checksum, manifest.chunks[0].checksum);
    EXPECT_FALSE(again->chunks[1].checksum.has_value());
    EXPECT_FALSE(manifest.toJson()["chunks"][1].isMember("checksum"));
}

TEST(TransferManifestTest, LoadFromFile) {
    auto path = Tessera::Testing::uniqueTempPath("tessera_manifest").string() + ".json";
    {
        std::ofstream out(path);
        out << threeChunks().toString();
    }

    auto loaded = TransferManifest::loadFromFile(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->chunkCount(), 3u);

    auto missing = TransferManifest::loadFromFile(path);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, tsr::ErrorCode::FileNotFound);
}
