#ifndef ONYXNET_KEYS_HPP
#define ONYXNET_KEYS_HPP

#include <openssl/evp.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace OnyxNet {

    using byte_vector = std::vector<uint8_t>;

    struct EvpPkeyDeleter {
        void operator()(EVP_PKEY* pkey) const noexcept {
            EVP_PKEY_free(pkey);
        }
    };

    // A public key. Only ever used to encrypt (wrap) data for its owner.
    // Shared, since one imported key may be referenced by several envelopes in flight.
    struct PublicKey {
        std::shared_ptr<EVP_PKEY> handle;
    };

    // A private key. Move-only, so it cannot be copied out of its owner.
    struct PrivateKey {
        std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> handle;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

} // namespace OnyxNet

#endif // ONYXNET_KEYS_HPP
