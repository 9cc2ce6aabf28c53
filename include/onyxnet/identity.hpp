#ifndef ONYXNET_IDENTITY_HPP
#define ONYXNET_IDENTITY_HPP

#include "keys.hpp"

#include <string>

namespace OnyxNet {

    /**
     * @brief This participant's session id and RSA key pair.
     *
     * Created once per process and immutable afterwards. Not copyable, so the
     * private key stays inside the one instance that generated it.
     */
    class Identity {
    public:
        /**
         * @brief Initializes the crypto libraries and generates a fresh identity.
         * @throws KeyGenerationError if the provider is unavailable or key generation fails.
         */
        static Identity generate();

        Identity(Identity&&) noexcept = default;
        Identity& operator=(Identity&&) noexcept = default;
        Identity(const Identity&) = delete;
        Identity& operator=(const Identity&) = delete;

        const std::string& id() const { return id_; }

        // PEM-encoded SPKI of the public half, as sent in handshake frames.
        const std::string& export_public_pem() const { return public_pem_; }

        const PublicKey& public_key() const { return keys_.publicKey; }
        const PrivateKey& private_key() const { return keys_.privateKey; }

    private:
        Identity(std::string id, KeyPair keys, std::string public_pem);

        std::string id_;
        KeyPair keys_;
        std::string public_pem_;
    };

} // namespace OnyxNet

#endif // ONYXNET_IDENTITY_HPP
