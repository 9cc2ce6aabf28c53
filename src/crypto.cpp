#include "onyxnet/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <sodium.h>

#include <atomic>

#include "onyxnet/errors.hpp"

namespace OnyxNet {

    namespace {

        struct EvpPkeyCtxDeleter {
            void operator()(EVP_PKEY_CTX* ctx) const {
                EVP_PKEY_CTX_free(ctx);
            }
        };
        using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;

        struct EvpCipherCtxDeleter {
            void operator()(EVP_CIPHER_CTX* ctx) const {
                EVP_CIPHER_CTX_free(ctx);
            }
        };
        using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

        struct BioDeleter {
            void operator()(BIO* bio) const {
                BIO_free(bio);
            }
        };
        using BioPtr = std::unique_ptr<BIO, BioDeleter>;

        constexpr int BASE64_VARIANT = sodium_base64_VARIANT_ORIGINAL;

        // Pops the most recent OpenSSL error and clears the rest of the queue.
        std::string openssl_error() {
            unsigned long err = ERR_peek_last_error();
            ERR_clear_error();
            if (err == 0) {
                return "unknown OpenSSL error";
            }
            char buffer[256];
            ERR_error_string_n(err, buffer, sizeof(buffer));
            return std::string(buffer);
        }

        // Configures an encrypt/decrypt context for RSA-OAEP with SHA-256 for both digests.
        bool set_oaep_sha256(EVP_PKEY_CTX* ctx) {
            return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
                   EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
                   EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
        }

    } // namespace

    static std::atomic<bool> g_sodium_initialized{false};

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_rsa_keypair() {
        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
            throw KeyGenerationError("RSA key generation unavailable: " + openssl_error());
        }
        if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), RSA_KEY_BITS) <= 0) {
            throw KeyGenerationError("Failed to set RSA modulus size: " + openssl_error());
        }

        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
            throw KeyGenerationError("RSA key generation failed: " + openssl_error());
        }

        KeyPair kp;
        kp.privateKey.handle.reset(raw);

        // Re-import our own SPKI so the public half carries no private material.
        try {
            PublicKey full{std::shared_ptr<EVP_PKEY>(raw, [](EVP_PKEY*) {})};
            kp.publicKey = import_public_pem(export_public_pem(full));
        } catch (const RuntimeError& e) {
            throw KeyGenerationError(std::string("Failed to derive public key: ") + e.what());
        }
        return kp;
    }

    std::string Crypto::export_public_pem(const PublicKey& public_key) {
        if (!public_key.handle) {
            throw InvalidArgument("Cannot export an empty public key.");
        }

        BioPtr bio(BIO_new(BIO_s_mem()));
        if (!bio || PEM_write_bio_PUBKEY(bio.get(), public_key.handle.get()) != 1) {
            throw CryptoError("Failed to write public key PEM: " + openssl_error());
        }

        char* data = nullptr;
        long len = BIO_get_mem_data(bio.get(), &data);
        if (len <= 0 || data == nullptr) {
            throw CryptoError("Public key PEM is empty.");
        }
        return std::string(data, static_cast<size_t>(len));
    }

    PublicKey Crypto::import_public_pem(const std::string& pem) {
        if (pem.empty()) {
            throw KeyImportError("Public key PEM is empty.");
        }

        BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) {
            throw KeyImportError("Failed to allocate PEM buffer: " + openssl_error());
        }

        EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
        if (raw == nullptr) {
            throw KeyImportError("Not a PEM public key: " + openssl_error());
        }

        PublicKey key{std::shared_ptr<EVP_PKEY>(raw, EvpPkeyDeleter())};
        if (EVP_PKEY_get_base_id(raw) != EVP_PKEY_RSA) {
            throw KeyImportError("Public key is not an RSA key.");
        }
        return key;
    }

    byte_vector Crypto::wrap_key(const byte_vector& key, const PublicKey& public_key) {
        if (!public_key.handle) {
            throw InvalidArgument("Cannot wrap a key for an empty public key.");
        }

        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(public_key.handle.get(), nullptr));
        if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get())) {
            throw CryptoError("Failed to set up RSA-OAEP: " + openssl_error());
        }

        size_t out_len = 0;
        if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, key.data(), key.size()) <= 0) {
            throw CryptoError("RSA-OAEP size query failed: " + openssl_error());
        }

        byte_vector wrapped(out_len);
        if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_len, key.data(), key.size()) <= 0) {
            throw CryptoError("RSA-OAEP encryption failed: " + openssl_error());
        }
        wrapped.resize(out_len);
        return wrapped;
    }

    byte_vector Crypto::unwrap_key(const byte_vector& wrapped, const PrivateKey& private_key) {
        if (!private_key.handle) {
            throw InvalidArgument("Cannot unwrap with an empty private key.");
        }
        if (wrapped.empty()) {
            throw KeyUnwrapError("Wrapped key is empty.");
        }

        EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(private_key.handle.get(), nullptr));
        if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get())) {
            throw KeyUnwrapError("Failed to set up RSA-OAEP: " + openssl_error());
        }

        size_t out_len = 0;
        if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(), wrapped.size()) <= 0) {
            throw KeyUnwrapError("RSA-OAEP size query failed: " + openssl_error());
        }

        byte_vector key(out_len);
        if (EVP_PKEY_decrypt(ctx.get(), key.data(), &out_len, wrapped.data(), wrapped.size()) <= 0) {
            wipe(key);
            throw KeyUnwrapError("RSA-OAEP decryption failed: " + openssl_error());
        }
        key.resize(out_len);
        return key;
    }

    byte_vector Crypto::aead_encrypt(const byte_vector& plaintext, const byte_vector& key, const byte_vector& iv) {
        if (key.size() != SYMMETRIC_KEY_BYTES) {
            throw InvalidArgument("Invalid key size for encryption.");
        }
        if (iv.size() != IV_BYTES) {
            throw InvalidArgument("Invalid IV size for encryption.");
        }

        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            throw CryptoError("Failed to initialize AES-256-GCM: " + openssl_error());
        }

        byte_vector output(plaintext.size() + TAG_BYTES);
        int len = 0;
        int ciphertext_len = 0;
        if (!plaintext.empty()) {
            if (EVP_EncryptUpdate(ctx.get(), output.data(), &len, plaintext.data(),
                                  static_cast<int>(plaintext.size())) != 1) {
                throw CryptoError("AES-256-GCM encryption failed: " + openssl_error());
            }
            ciphertext_len = len;
        }

        if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &len) != 1) {
            throw CryptoError("AES-256-GCM finalization failed: " + openssl_error());
        }
        ciphertext_len += len;

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_BYTES),
                                output.data() + ciphertext_len) != 1) {
            throw CryptoError("Failed to read AES-256-GCM tag: " + openssl_error());
        }

        output.resize(static_cast<size_t>(ciphertext_len) + TAG_BYTES);
        return output;
    }

    byte_vector Crypto::aead_decrypt(const byte_vector& ciphertext_with_tag,
                                     const byte_vector& key,
                                     const byte_vector& iv) {
        if (key.size() != SYMMETRIC_KEY_BYTES) {
            throw InvalidArgument("Invalid key size for decryption.");
        }
        if (iv.size() != IV_BYTES) {
            throw InvalidArgument("Invalid IV size for decryption.");
        }
        if (ciphertext_with_tag.size() < TAG_BYTES) {
            throw AuthenticationError("Ciphertext too small to carry an authentication tag.");
        }

        const size_t ciphertext_len = ciphertext_with_tag.size() - TAG_BYTES;
        byte_vector tag(ciphertext_with_tag.begin() + ciphertext_len, ciphertext_with_tag.end());

        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
            throw AuthenticationError("Failed to initialize AES-256-GCM: " + openssl_error());
        }

        byte_vector plaintext(ciphertext_len + TAG_BYTES);
        int len = 0;
        int plaintext_len = 0;
        if (ciphertext_len > 0) {
            if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext_with_tag.data(),
                                  static_cast<int>(ciphertext_len)) != 1) {
                wipe(plaintext);
                throw AuthenticationError("AES-256-GCM decryption failed: " + openssl_error());
            }
            plaintext_len = len;
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_BYTES), tag.data()) != 1) {
            wipe(plaintext);
            throw AuthenticationError("Failed to set AES-256-GCM tag: " + openssl_error());
        }

        if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) != 1) {
            wipe(plaintext);
            ERR_clear_error();
            throw AuthenticationError("Failed to decrypt message. Authentication tag may be invalid.");
        }
        plaintext_len += len;

        plaintext.resize(static_cast<size_t>(plaintext_len));
        return plaintext;
    }

    byte_vector Crypto::random_bytes(size_t count) {
        byte_vector out(count);
        if (count > 0) {
            randombytes_buf(out.data(), out.size());
        }
        return out;
    }

    std::string Crypto::generate_session_id() {
        byte_vector raw = random_bytes(16);
        raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);  // version 4
        raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

        char hex[33];
        sodium_bin2hex(hex, sizeof(hex), raw.data(), raw.size());

        std::string id(hex, 32);
        id.insert(20, 1, '-');
        id.insert(16, 1, '-');
        id.insert(12, 1, '-');
        id.insert(8, 1, '-');
        return id;
    }

    std::string Crypto::to_base64(const byte_vector& data) {
        const size_t encoded_len = sodium_base64_encoded_len(data.size(), BASE64_VARIANT);
        std::string out(encoded_len, '\0');
        sodium_bin2base64(&out[0], encoded_len, data.data(), data.size(), BASE64_VARIANT);
        out.resize(encoded_len - 1);  // drop the trailing NUL
        return out;
    }

    byte_vector Crypto::from_base64(const std::string& text) {
        byte_vector out(text.size() / 4 * 3 + 3);
        size_t bin_len = 0;
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &bin_len, nullptr,
                              BASE64_VARIANT) != 0) {
            throw InvalidArgument("Invalid base64 data.");
        }
        out.resize(bin_len);
        return out;
    }

    void Crypto::wipe(byte_vector& data) {
        if (!data.empty()) {
            sodium_memzero(data.data(), data.size());
        }
    }

} // namespace OnyxNet
