#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "Result.h"

namespace Tessera {
namespace Signaling {

enum class EnvelopeType {
    Register,       // client -> relay: {"type":"register","clientId":id}
    Registered,     // relay -> client: {"type":"registered","clientId":id}
    Peers,          // relay -> client: {"type":"peers","peers":[id, ...]}
    Message,        // both ways: {"type":"message","to":id,"from":id,"message":payload}
    Ping,           // both ways: {"type":"ping","ts":ms}
    Pong,
    Unknown         // anything else; kept verbatim in Envelope::raw
};

const char* envelopeTypeName(EnvelopeType type);

/**
 * @brief Decoded relay envelope
 *
 * Only the fields that belong to `type` are meaningful. `raw` always holds
 * the full JSON object as received, so unknown envelope types can still be
 * handed to the application.
 */
struct Envelope {
    EnvelopeType type = EnvelopeType::Unknown;
    std::string typeName;
    std::string clientId;
    std::vector<std::string> peers;
    std::string to;
    std::string from;
    Json::Value message;
    int64_t ts = 0;
    Json::Value raw;

    static Envelope makeRegister(const std::string& clientId);
    static Envelope makeRegistered(const std::string& clientId);
    static Envelope makePeers(const std::vector<std::string>& peers);
    static Envelope makeMessage(const std::string& to, const std::string& from, const Json::Value& message);
    static Envelope makePing(int64_t ts);
    static Envelope makePong(int64_t ts);
};

Json::Value envelopeToJson(const Envelope& envelope);

/// Compact single-line JSON
std::string encodeEnvelope(const Envelope& envelope);

/**
 * @brief Parse one envelope
 *
 * ProtocolError for invalid JSON, a non-object, a missing "type", or a
 * known type whose required fields are missing or mistyped ("peers" not
 * an array of strings, "message" without "to").
 */
tsr::Result<Envelope> decodeEnvelope(const std::string& text);

} // namespace Signaling
} // namespace Tessera
