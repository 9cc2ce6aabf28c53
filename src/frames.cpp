#include "onyxnet/frames.hpp"

#include <nlohmann/json.hpp>

#include "onyxnet/crypto.hpp"
#include "onyxnet/errors.hpp"

using json = nlohmann::json;

namespace OnyxNet {

namespace {

std::string require_string(const json& object, const char* field) {
    auto it = object.find(field);
    if (it == object.end() || !it->is_string()) {
        throw InvalidArgument(std::string("missing or non-string field '") + field + "'");
    }
    return it->get<std::string>();
}

byte_vector require_base64(const json& object, const char* field) {
    try {
        return Crypto::from_base64(require_string(object, field));
    } catch (const InvalidArgument& e) {
        throw InvalidArgument(std::string("field '") + field + "': " + e.what());
    }
}

HandshakeFrame parse_handshake(const json& frame) {
    HandshakeFrame handshake;
    handshake.sender_id = require_string(frame, "sender_id");
    handshake.public_key_pem = require_string(frame, "pubkey");
    return handshake;
}

ChatFrame parse_chat(const json& frame) {
    ChatFrame chat;
    chat.sender_id = require_string(frame, "sender_id");

    auto payload = frame.find("payload");
    if (payload == frame.end() || !payload->is_object()) {
        throw InvalidArgument("missing or non-object field 'payload'");
    }

    chat.envelope.iv = require_base64(*payload, "iv");
    chat.envelope.tag = require_base64(*payload, "tag");
    chat.envelope.ciphertext = require_base64(*payload, "ciphertext");

    auto keys = payload->find("keys");
    if (keys == payload->end() || !keys->is_object()) {
        throw InvalidArgument("missing or non-object field 'keys'");
    }
    for (auto it = keys->begin(); it != keys->end(); ++it) {
        if (!it.value().is_string()) {
            throw InvalidArgument("wrapped key for '" + it.key() + "' is not a string");
        }
        try {
            chat.envelope.wrapped_keys[it.key()] = Crypto::from_base64(it.value().get<std::string>());
        } catch (const InvalidArgument& e) {
            throw InvalidArgument("wrapped key for '" + it.key() + "': " + e.what());
        }
    }
    return chat;
}

} // namespace

std::string HandshakeFrame::serialize() const {
    json frame = {
        {"type", FrameTypes::HANDSHAKE},
        {"sender_id", sender_id},
        {"pubkey", public_key_pem},
    };
    return frame.dump();
}

std::string ChatFrame::serialize() const {
    json keys = json::object();
    for (const auto& [id, wrapped] : envelope.wrapped_keys) {
        keys[id] = Crypto::to_base64(wrapped);
    }

    json frame = {
        {"type", FrameTypes::MESSAGE},
        {"sender_id", sender_id},
        {"payload", {
            {"iv", Crypto::to_base64(envelope.iv)},
            {"tag", Crypto::to_base64(envelope.tag)},
            {"ciphertext", Crypto::to_base64(envelope.ciphertext)},
            {"keys", keys},
        }},
    };
    return frame.dump();
}

Frame parse_frame(const std::string& text) {
    json frame = json::parse(text, nullptr, false);
    if (frame.is_discarded()) {
        return UnknownFrame{"", "not valid JSON"};
    }
    if (!frame.is_object()) {
        return UnknownFrame{"", "frame is not a JSON object"};
    }

    auto type_it = frame.find("type");
    if (type_it == frame.end() || !type_it->is_string()) {
        return UnknownFrame{"", "missing or non-string field 'type'"};
    }
    const std::string type = type_it->get<std::string>();

    try {
        if (type == FrameTypes::HANDSHAKE) {
            return parse_handshake(frame);
        }
        if (type == FrameTypes::MESSAGE) {
            return parse_chat(frame);
        }
    } catch (const InvalidArgument& e) {
        return UnknownFrame{type, e.what()};
    }

    return UnknownFrame{type, "unrecognized frame type"};
}

} // namespace OnyxNet
