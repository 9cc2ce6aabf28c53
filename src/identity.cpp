#include "onyxnet/identity.hpp"

#include "onyxnet/crypto.hpp"
#include "onyxnet/errors.hpp"

namespace OnyxNet {

Identity::Identity(std::string id, KeyPair keys, std::string public_pem)
    : id_(std::move(id)), keys_(std::move(keys)), public_pem_(std::move(public_pem)) {}

Identity Identity::generate() {
    if (Crypto::init() != 0) {
        throw KeyGenerationError("Cryptographic provider is unavailable.");
    }

    KeyPair keys = Crypto::generate_rsa_keypair();

    std::string pem;
    try {
        pem = Crypto::export_public_pem(keys.publicKey);
    } catch (const RuntimeError& e) {
        throw KeyGenerationError(std::string("Failed to export public key: ") + e.what());
    }

    return Identity(Crypto::generate_session_id(), std::move(keys), std::move(pem));
}

} // namespace OnyxNet
