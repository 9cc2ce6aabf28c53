#include "onyxnet/handshake.hpp"

#include "onyxnet/errors.hpp"

namespace OnyxNet {

HandshakeProtocol::HandshakeProtocol(const Identity& identity, PeerDirectory& directory)
    : identity_(identity), directory_(directory) {}

HandshakeFrame HandshakeProtocol::announcement() const {
    return HandshakeFrame{identity_.id(), identity_.export_public_pem()};
}

HandshakeResult HandshakeProtocol::handle(const HandshakeFrame& frame) {
    // 1. The relay echoes our own frames back to us.
    if (frame.sender_id == identity_.id()) {
        return {HandshakeOutcome::SELF_ECHO, std::nullopt, {}};
    }

    // 2. First key wins. A repeated or rebinding handshake is dropped without a reply.
    // A peer that rejoins under the same id with a fresh key stays bound to the old one.
    if (directory_.has(frame.sender_id)) {
        HandshakeResult result{HandshakeOutcome::ALREADY_KNOWN, std::nullopt, {}};
        if (frame.public_key_pem != directory_.announced_pem(frame.sender_id)) {
            result.key_changed = flagged_ids_.insert(frame.sender_id).second;
        }
        return result;
    }

    // 3. New peer: import, then announce ourselves so it learns our key too.
    try {
        directory_.import_and_insert(frame.sender_id, frame.public_key_pem);
    } catch (const KeyImportError& e) {
        return {HandshakeOutcome::IMPORT_FAILED, std::nullopt, e.what()};
    }

    return {HandshakeOutcome::PEER_ADDED, announcement(), {}};
}

} // namespace OnyxNet
