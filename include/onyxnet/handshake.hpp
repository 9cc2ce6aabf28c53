#ifndef ONYXNET_HANDSHAKE_HPP
#define ONYXNET_HANDSHAKE_HPP

#include "frames.hpp"
#include "identity.hpp"
#include "peer_directory.hpp"

#include <optional>
#include <string>
#include <unordered_set>

namespace OnyxNet {

    enum class HandshakeOutcome {
        SELF_ECHO,      // our own announcement, echoed back by the relay
        ALREADY_KNOWN,  // id already bound; nothing imported, no reply
        PEER_ADDED,     // new peer imported; reply with our own announcement
        IMPORT_FAILED   // new id but its key did not parse; peer not added
    };

    struct HandshakeResult {
        HandshakeOutcome outcome;
        std::optional<HandshakeFrame> reply;  // set only for PEER_ADDED
        std::string error;                    // set only for IMPORT_FAILED
        bool key_changed = false;             // ALREADY_KNOWN with a different key, first time for this id
    };

    /**
     * @brief Handles inbound key announcements.
     *
     * Everything it learns lives in the directory. A reply is produced only on first
     * contact with an id, which keeps the exchange symmetric under the relay's broadcast
     * while bounding reply traffic to one per peer. A known id is never re-imported:
     * a different key offered for it is flagged once and otherwise ignored.
     */
    class HandshakeProtocol {
    public:
        HandshakeProtocol(const Identity& identity, PeerDirectory& directory);

        // Our own announcement: sent on connect and as the reply to a new peer.
        HandshakeFrame announcement() const;

        /**
         * @brief Applies one inbound handshake frame to the directory.
         *
         * A key-import failure is reported through the result and never thrown.
         */
        HandshakeResult handle(const HandshakeFrame& frame);

    private:
        const Identity& identity_;
        PeerDirectory& directory_;
        std::unordered_set<std::string> flagged_ids_;
    };

} // namespace OnyxNet

#endif // ONYXNET_HANDSHAKE_HPP
