#include "Envelope.h"

#include <memory>

namespace Tessera {
namespace Signaling {

namespace {

EnvelopeType typeFromName(const std::string& name) {
    if (name == "register") return EnvelopeType::Register;
    if (name == "registered") return EnvelopeType::Registered;
    if (name == "peers") return EnvelopeType::Peers;
    if (name == "message") return EnvelopeType::Message;
    if (name == "ping") return EnvelopeType::Ping;
    if (name == "pong") return EnvelopeType::Pong;
    return EnvelopeType::Unknown;
}

Envelope make(EnvelopeType type) {
    Envelope envelope;
    envelope.type = type;
    envelope.typeName = envelopeTypeName(type);
    return envelope;
}

tsr::Result<Envelope> protocolError(const std::string& what) {
    return tsr::Err<Envelope>(tsr::ErrorCode::ProtocolError, what);
}

} // namespace

const char* envelopeTypeName(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::Register: return "register";
        case EnvelopeType::Registered: return "registered";
        case EnvelopeType::Peers: return "peers";
        case EnvelopeType::Message: return "message";
        case EnvelopeType::Ping: return "ping";
        case EnvelopeType::Pong: return "pong";
        default: return "unknown";
    }
}

Envelope Envelope::makeRegister(const std::string& clientId) {
    Envelope envelope = make(EnvelopeType::Register);
    envelope.clientId = clientId;
    return envelope;
}

Envelope Envelope::makeRegistered(const std::string& clientId) {
    Envelope envelope = make(EnvelopeType::Registered);
    envelope.clientId = clientId;
    return envelope;
}

Envelope Envelope::makePeers(const std::vector<std::string>& peers) {
    Envelope envelope = make(EnvelopeType::Peers);
    envelope.peers = peers;
    return envelope;
}

Envelope Envelope::makeMessage(const std::string& to, const std::string& from, const Json::Value& message) {
    Envelope envelope = make(EnvelopeType::Message);
    envelope.to = to;
    envelope.from = from;
    envelope.message = message;
    return envelope;
}

Envelope Envelope::makePing(int64_t ts) {
    Envelope envelope = make(EnvelopeType::Ping);
    envelope.ts = ts;
    return envelope;
}

Envelope Envelope::makePong(int64_t ts) {
    Envelope envelope = make(EnvelopeType::Pong);
    envelope.ts = ts;
    return envelope;
}

Json::Value envelopeToJson(const Envelope& envelope) {
    if (envelope.type == EnvelopeType::Unknown) {
        return envelope.raw;
    }

    Json::Value root(Json::objectValue);
    root["type"] = envelopeTypeName(envelope.type);

    switch (envelope.type) {
        case EnvelopeType::Register:
        case EnvelopeType::Registered:
            root["clientId"] = envelope.clientId;
            break;
        case EnvelopeType::Peers:
            root["peers"] = Json::Value(Json::arrayValue);
            for (const auto& id : envelope.peers) {
                root["peers"].append(id);
            }
            break;
        case EnvelopeType::Message:
            root["to"] = envelope.to;
            if (!envelope.from.empty()) {
                root["from"] = envelope.from;
            }
            root["message"] = envelope.message;
            break;
        case EnvelopeType::Ping:
        case EnvelopeType::Pong:
            root["ts"] = Json::Int64(envelope.ts);
            break;
        default:
            break;
    }
    return root;
}

std::string encodeEnvelope(const Envelope& envelope) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, envelopeToJson(envelope));
}

tsr::Result<Envelope> decodeEnvelope(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value parsed;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &parsed, &errors)) {
        return protocolError("invalid JSON: " + errors);
    }

    // Const view: lookups must not insert null members into raw
    const Json::Value& root = parsed;
    if (!root.isObject()) {
        return protocolError("envelope is not a JSON object");
    }
    if (!root["type"].isString()) {
        return protocolError("envelope has no type");
    }

    Envelope envelope;
    envelope.typeName = root["type"].asString();
    envelope.type = typeFromName(envelope.typeName);
    envelope.raw = root;

    if (root["from"].isString()) {
        envelope.from = root["from"].asString();
    }

    switch (envelope.type) {
        case EnvelopeType::Register:
        case EnvelopeType::Registered:
            // An absent clientId on register asks the relay to assign one
            if (root.isMember("clientId") && !root["clientId"].isString() && !root["clientId"].isNull()) {
                return protocolError(envelope.typeName + ": clientId must be a string");
            }
            envelope.clientId = root["clientId"].isString() ? root["clientId"].asString() : "";
            if (envelope.type == EnvelopeType::Registered && envelope.clientId.empty()) {
                return protocolError("registered: missing clientId");
            }
            break;

        case EnvelopeType::Peers: {
            const Json::Value& peers = root["peers"];
            if (!peers.isArray()) {
                return protocolError("peers: missing peer array");
            }
            for (const auto& id : peers) {
                if (!id.isString()) {
                    return protocolError("peers: non-string peer id");
                }
                envelope.peers.push_back(id.asString());
            }
            break;
        }

        case EnvelopeType::Message:
            if (!root["to"].isString() || root["to"].asString().empty()) {
                return protocolError("message: missing recipient");
            }
            envelope.to = root["to"].asString();
            envelope.message = root["message"];
            break;

        case EnvelopeType::Ping:
        case EnvelopeType::Pong:
            envelope.ts = root["ts"].isInt64() ? root["ts"].asInt64() : 0;
            break;

        case EnvelopeType::Unknown:
            break;
    }

    return envelope;
}

} // namespace Signaling
} // namespace Tessera
