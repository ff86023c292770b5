#include "TransferManifest.h"

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>

namespace Tessera {
namespace Transfer {

namespace {

bool readUnsigned(const Json::Value& node, const char* field, uint64_t& out) {
    // isUInt64() also accepts integral doubles such as 1000.0
    const Json::Value& value = node[field];
    if (!value.isUInt64()) {
        return false;
    }
    out = value.asUInt64();
    return true;
}

} // namespace

uint64_t TransferManifest::totalEncryptedSize() const {
    uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.encryptedSize;
    }
    return total;
}

std::vector<uint64_t> TransferManifest::computeOffsets() const {
    std::vector<uint64_t> offsets;
    offsets.reserve(chunks.size());
    uint64_t running = 0;
    for (const auto& chunk : chunks) {
        offsets.push_back(running);
        running += chunk.encryptedSize;
    }
    return offsets;
}

tsr::Result<void> TransferManifest::validate() const {
    using tsr::ErrorCode;

    if (fileSize == 0) {
        return tsr::Err(ErrorCode::InvalidManifest, "fileSize must be positive");
    }
    if (chunks.empty()) {
        return tsr::Err(ErrorCode::InvalidManifest, "manifest has no chunks");
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            return tsr::Err(ErrorCode::InvalidManifest,
                            "chunk indices are not contiguous at position " + std::to_string(i) +
                            " (found index " + std::to_string(chunks[i].index) + ")");
        }
        if (chunks[i].encryptedSize == 0) {
            return tsr::Err(ErrorCode::InvalidManifest,
                            "chunk " + std::to_string(i) + " has zero encryptedSize");
        }
    }
    return tsr::Ok();
}

Json::Value TransferManifest::toJson() const {
    Json::Value root(Json::objectValue);
    root["fileSize"] = Json::UInt64(fileSize);
    root["chunks"] = Json::Value(Json::arrayValue);
    for (const auto& chunk : chunks) {
        Json::Value entry(Json::objectValue);
        entry["index"] = Json::UInt64(chunk.index);
        entry["encryptedSize"] = Json::UInt64(chunk.encryptedSize);
        if (chunk.checksum) {
            entry["checksum"] = *chunk.checksum;
        }
        root["chunks"].append(entry);
    }
    return root;
}

std::string TransferManifest::toString() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson());
}

tsr::Result<TransferManifest> TransferManifest::fromJson(const Json::Value& root) {
    using tsr::ErrorCode;

    if (!root.isObject()) {
        return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "manifest is not a JSON object");
    }

    TransferManifest manifest;
    if (!readUnsigned(root, "fileSize", manifest.fileSize)) {
        return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "fileSize missing or not a non-negative integer");
    }

    const Json::Value& chunks = root["chunks"];
    if (!chunks.isArray()) {
        return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "chunks missing or not an array");
    }

    for (Json::ArrayIndex i = 0; i < chunks.size(); ++i) {
        const Json::Value& node = chunks[i];
        if (!node.isObject()) {
            return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "chunk entry " + std::to_string(i) + " is not an object");
        }

        ChunkDescriptor chunk;
        uint64_t index = 0;
        if (!readUnsigned(node, "index", index)) {
            return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "chunk entry " + std::to_string(i) + " has no valid index");
        }
        chunk.index = static_cast<size_t>(index);
        if (!readUnsigned(node, "encryptedSize", chunk.encryptedSize)) {
            return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "chunk entry " + std::to_string(i) + " has no valid encryptedSize");
        }

        const Json::Value& checksum = node["checksum"];
        if (checksum.isString() && !checksum.asString().empty()) {
            chunk.checksum = checksum.asString();
        } else if (!checksum.isNull() && !checksum.isString()) {
            return tsr::Err<TransferManifest>(ErrorCode::InvalidManifest, "chunk entry " + std::to_string(i) + " has a non-string checksum");
        }

        manifest.chunks.push_back(std::move(chunk));
    }

    std::stable_sort(manifest.chunks.begin(), manifest.chunks.end(),
                     [](const ChunkDescriptor& a, const ChunkDescriptor& b) { return a.index < b.index; });

    auto valid = manifest.validate();
    if (!valid) {
        return valid.error();
    }
    return manifest;
}

tsr::Result<TransferManifest> TransferManifest::fromString(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return tsr::Err<TransferManifest>(tsr::ErrorCode::InvalidManifest, "manifest is not valid JSON: " + errors);
    }
    return fromJson(root);
}

tsr::Result<TransferManifest> TransferManifest::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tsr::Err<TransferManifest>(tsr::ErrorCode::FileNotFound, "cannot open manifest " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str());
}

} // namespace Transfer
} // namespace Tessera
