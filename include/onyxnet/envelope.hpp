#ifndef ONYXNET_ENVELOPE_HPP
#define ONYXNET_ENVELOPE_HPP

#include "keys.hpp"
#include "peer_directory.hpp"

#include <map>
#include <string>
#include <vector>

namespace OnyxNet {

    /**
     * @brief One plaintext sealed once under a one-time AES-256-GCM key, with that
     *        key wrapped separately for every recipient.
     */
    struct Envelope {
        byte_vector iv;          // 12 bytes
        byte_vector tag;         // 16 bytes, the trailing GCM output
        byte_vector ciphertext;  // GCM output without the tag
        std::map<std::string, byte_vector> wrapped_keys;  // peer id -> RSA-OAEP(symmetric key)
    };

    /**
     * @brief Seals plaintext for the peers of a directory and opens envelopes
     *        addressed to us.
     */
    class EnvelopeEngine {
    public:
        explicit EnvelopeEngine(const PeerDirectory& directory);

        /**
         * @brief Encrypts @p plaintext for every id in @p recipients.
         *
         * A fresh key and IV are drawn for every call. An empty recipient list still
         * yields a valid envelope with no wrapped keys.
         *
         * @param recipients Snapshot of PeerDirectory::known_ids().
         * @throws CryptoError if the cipher or a key wrap fails.
         * @throws InvalidArgument if a recipient is not in the directory.
         */
        Envelope encrypt(const std::string& plaintext, const std::vector<std::string>& recipients) const;

        /**
         * @brief Opens an envelope with our own private key.
         * @return The message text, guaranteed to be well-formed UTF-8.
         * @throws NoKeyForRecipient if @p own_id has no wrapped key in the envelope.
         * @throws KeyUnwrapError if the wrapped key does not decrypt to an AES-256 key.
         * @throws AuthenticationError if the tag does not verify or the plaintext is not UTF-8.
         */
        static std::string decrypt(const Envelope& envelope,
                                   const std::string& own_id,
                                   const PrivateKey& own_private_key);

    private:
        const PeerDirectory& directory_;
    };

} // namespace OnyxNet

#endif // ONYXNET_ENVELOPE_HPP
