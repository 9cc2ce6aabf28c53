#include "onyxnet/session.hpp"
#include "onyxnet/errors.hpp"

#include <iostream>
#include <variant>

namespace OnyxNet {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING:
            return "Connecting";
        case ConnectionState::CONNECTED:
            return "Connected";
        case ConnectionState::DISCONNECTED:
            return "Disconnected";
        case ConnectionState::FAILED:
            return "Failed";
    }
    return "Unknown";
}

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

SessionController::SessionController(const Identity& identity, Transport& transport, SessionHost& host)
    : identity_(identity),
      transport_(transport),
      host_(host),
      handshake_(identity, directory_),
      envelopes_(directory_) {}

// --- Connection events ---

void SessionController::on_connecting() {
    set_state(ConnectionState::CONNECTING);
}

void SessionController::on_open() {
    set_state(ConnectionState::CONNECTED);
    host_.on_system_notice("Connected to relay as " + short_id(identity_.id()), NoticeLevel::INFO);

    // Without this nobody would ever learn our key.
    send(handshake_.announcement().serialize(), "handshake");
}

void SessionController::on_close() {
    set_state(ConnectionState::DISCONNECTED);
}

void SessionController::on_fail() {
    set_state(ConnectionState::FAILED);
}

void SessionController::set_state(ConnectionState state) {
    if (state == state_) {
        return;
    }
    state_ = state;
    host_.on_connection_state_change(state);
}

// --- Inbound frames ---

void SessionController::on_frame(const std::string& text) {
    Frame frame = parse_frame(text);
    std::visit([this](const auto& f) { handle(f); }, frame);
}

void SessionController::handle(const HandshakeFrame& frame) {
    HandshakeResult result = handshake_.handle(frame);

    switch (result.outcome) {
        case HandshakeOutcome::PEER_ADDED:
            host_.on_system_notice("New peer: " + short_id(frame.sender_id) + " (" +
                                       std::to_string(directory_.size() + 1) + " participants)",
                                   NoticeLevel::INFO);
            send(result.reply->serialize(), "handshake reply");
            break;
        case HandshakeOutcome::IMPORT_FAILED:
            std::cerr << "Key import failed for " << frame.sender_id << ": " << result.error << std::endl;
            host_.on_system_notice("Rejected key from " + short_id(frame.sender_id) + ": " + result.error,
                                   NoticeLevel::ERROR);
            break;
        case HandshakeOutcome::ALREADY_KNOWN:
            if (result.key_changed) {
                std::cerr << "Ignoring different key offered for known peer " << frame.sender_id << std::endl;
                host_.on_system_notice("Ignored new key from " + short_id(frame.sender_id) +
                                           ": peer is already bound to another key",
                                       NoticeLevel::WARNING);
            }
            break;
        case HandshakeOutcome::SELF_ECHO:
            break;
    }
}

void SessionController::handle(const ChatFrame& frame) {
    // Our own message echoed back: never even try to open it.
    if (frame.sender_id == identity_.id()) {
        return;
    }

    try {
        std::string plaintext = EnvelopeEngine::decrypt(frame.envelope, identity_.id(), identity_.private_key());
        host_.on_peer_message(frame.sender_id, plaintext);
    } catch (const NoKeyForRecipient&) {
        host_.on_system_notice("Unreadable msg from " + short_id(frame.sender_id) + " (not addressed to us)",
                               NoticeLevel::MUTED);
    } catch (const DecryptError& e) {
        std::cerr << "Decryption failed for message from " << frame.sender_id << ": " << e.what() << std::endl;
        host_.on_system_notice("Unreadable msg from " + short_id(frame.sender_id), NoticeLevel::WARNING);
    } catch (const Exception& e) {
        std::cerr << "Message processing failed: " << e.what() << std::endl;
        host_.on_system_notice("Unreadable msg from " + short_id(frame.sender_id), NoticeLevel::WARNING);
    }
}

void SessionController::handle(const UnknownFrame& frame) {
    std::cerr << "Discarding frame";
    if (!frame.type.empty()) {
        std::cerr << " of type '" << frame.type << "'";
    }
    std::cerr << ": " << frame.reason << std::endl;
}

// --- Outbound ---

bool SessionController::submit(const std::string& plaintext) {
    if (plaintext.empty()) {
        return false;
    }

    if (!transport_.is_open()) {
        host_.on_system_notice("Send failed: not connected to relay", NoticeLevel::ERROR);
        return false;
    }

    std::vector<std::string> recipients = directory_.known_ids();
    if (recipients.empty()) {
        host_.on_system_notice("No peers yet: nobody will be able to read this message", NoticeLevel::WARNING);
    }

    ChatFrame frame;
    frame.sender_id = identity_.id();
    try {
        frame.envelope = envelopes_.encrypt(plaintext, recipients);
    } catch (const Exception& e) {
        host_.on_system_notice(std::string("Send failed: ") + e.what(), NoticeLevel::ERROR);
        return false;
    }

    return send(frame.serialize(), "message");
}

bool SessionController::send(const std::string& text, const char* what) {
    try {
        transport_.send_text(text);
        return true;
    } catch (const DisconnectedError&) {
        host_.on_system_notice(std::string("Send failed (") + what + "): disconnected", NoticeLevel::ERROR);
    } catch (const RuntimeError& e) {
        host_.on_system_notice(std::string("Send failed (") + what + "): " + e.what(), NoticeLevel::ERROR);
    }
    return false;
}

} // namespace OnyxNet
