#ifndef ONYXNET_CRYPTO_HPP
#define ONYXNET_CRYPTO_HPP

#include "keys.hpp"

#include <cstddef>
#include <string>

namespace OnyxNet {

    // RSA modulus size for identity keys.
    constexpr int RSA_KEY_BITS = 2048;

    // AES-256-GCM parameters. The tag length is part of the wire format.
    constexpr size_t SYMMETRIC_KEY_BYTES = 32;
    constexpr size_t IV_BYTES = 12;
    constexpr size_t TAG_BYTES = 16;

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic libraries. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates an RSA-2048 key pair (e = 65537).
         * @return A KeyPair whose public half holds no private material.
         * @throws KeyGenerationError if the provider fails.
         */
        static KeyPair generate_rsa_keypair();

        /**
         * @brief Serializes a public key as PEM-encoded SubjectPublicKeyInfo.
         * @return "-----BEGIN PUBLIC KEY-----" framed text, 64 columns per line.
         */
        static std::string export_public_pem(const PublicKey& public_key);

        /**
         * @brief Parses a PEM SubjectPublicKeyInfo string into an RSA public key.
         * @throws KeyImportError if the text is not a PEM RSA public key.
         */
        static PublicKey import_public_pem(const std::string& pem);

        /**
         * @brief Encrypts a short secret with RSA-OAEP (SHA-256, MGF1-SHA-256, no label).
         * @throws CryptoError on provider failure.
         */
        static byte_vector wrap_key(const byte_vector& key, const PublicKey& public_key);

        /**
         * @brief Reverses wrap_key with the matching private key.
         * @throws KeyUnwrapError if padding does not verify or the provider fails.
         */
        static byte_vector unwrap_key(const byte_vector& wrapped, const PrivateKey& private_key);

        /**
         * @brief AES-256-GCM encryption without associated data.
         * @return ciphertext || 16-byte tag.
         * @throws CryptoError on provider failure.
         */
        static byte_vector aead_encrypt(const byte_vector& plaintext, const byte_vector& key, const byte_vector& iv);

        /**
         * @brief AES-256-GCM decryption of ciphertext || tag.
         * @throws AuthenticationError if the tag does not verify.
         */
        static byte_vector aead_decrypt(const byte_vector& ciphertext_with_tag,
                                        const byte_vector& key,
                                        const byte_vector& iv);

        // Bytes from the libsodium CSPRNG.
        static byte_vector random_bytes(size_t count);

        /**
         * @brief Generates a random 128-bit session id shaped like a UUID v4,
         *        e.g. "3f0c9a4e-6b1d-4f8a-9c2e-51d7a0b8e413".
         */
        static std::string generate_session_id();

        // Standard padded base64, as every other client on the wire expects.
        static std::string to_base64(const byte_vector& data);

        /**
         * @throws InvalidArgument if the text is not valid padded base64.
         */
        static byte_vector from_base64(const std::string& text);

        // Overwrites the buffer with zeros in a way the compiler keeps.
        static void wipe(byte_vector& data);
    };

} // namespace OnyxNet

#endif // ONYXNET_CRYPTO_HPP
