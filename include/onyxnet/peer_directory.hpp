#ifndef ONYXNET_PEER_DIRECTORY_HPP
#define ONYXNET_PEER_DIRECTORY_HPP

#include "keys.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace OnyxNet {

    /**
     * @brief Peers whose public keys this client has learned, keyed by peer id.
     *
     * An id is bound at most once for the lifetime of the session. A later key for
     * the same id is never accepted, so a known identity cannot be rebound to a
     * different key mid-session. Entries never expire.
     */
    class PeerDirectory {
    public:
        bool has(const std::string& id) const;

        /**
         * @brief Parses @p pem and binds it to @p id.
         * @throws LogicError if @p id is already present; callers check has() first.
         * @throws KeyImportError if @p pem is not an SPKI RSA public key. Nothing is inserted.
         */
        void import_and_insert(const std::string& id, const std::string& pem);

        // Current recipient set. Order is unspecified.
        std::vector<std::string> known_ids() const;

        /**
         * @throws InvalidArgument if @p id is not present.
         */
        const PublicKey& public_key(const std::string& id) const;

        /**
         * @brief The PEM text @p id was bound with, exactly as it was announced.
         * @throws InvalidArgument if @p id is not present.
         */
        const std::string& announced_pem(const std::string& id) const;

        size_t size() const { return peers_.size(); }
        bool empty() const { return peers_.empty(); }

    private:
        struct Entry {
            PublicKey key;
            std::string pem;
        };

        const Entry& entry(const std::string& id) const;

        std::unordered_map<std::string, Entry> peers_;
    };

} // namespace OnyxNet

#endif // ONYXNET_PEER_DIRECTORY_HPP
