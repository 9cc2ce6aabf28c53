#include "onyxnet/envelope.hpp"

#include "onyxnet/crypto.hpp"
#include "onyxnet/errors.hpp"

namespace OnyxNet {

    namespace {

        // Wipes the one-time key on every exit path.
        class ScopedKey {
        public:
            explicit ScopedKey(byte_vector key) : key_(std::move(key)) {}
            ~ScopedKey() { Crypto::wipe(key_); }
            ScopedKey(const ScopedKey&) = delete;
            ScopedKey& operator=(const ScopedKey&) = delete;

            const byte_vector& bytes() const { return key_; }

        private:
            byte_vector key_;
        };

        // Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
        bool is_valid_utf8(const byte_vector& text) {
            size_t i = 0;
            while (i < text.size()) {
                const uint8_t lead = text[i];
                size_t length = 0;
                uint8_t min_next = 0x80;
                uint8_t max_next = 0xBF;

                if (lead < 0x80) {
                    ++i;
                    continue;
                } else if (lead >= 0xC2 && lead <= 0xDF) {
                    length = 2;
                } else if (lead >= 0xE0 && lead <= 0xEF) {
                    length = 3;
                    if (lead == 0xE0) {
                        min_next = 0xA0;
                    } else if (lead == 0xED) {
                        max_next = 0x9F;
                    }
                } else if (lead >= 0xF0 && lead <= 0xF4) {
                    length = 4;
                    if (lead == 0xF0) {
                        min_next = 0x90;
                    } else if (lead == 0xF4) {
                        max_next = 0x8F;
                    }
                } else {
                    return false;
                }

                if (text.size() - i < length) {
                    return false;
                }
                if (text[i + 1] < min_next || text[i + 1] > max_next) {
                    return false;
                }
                for (size_t k = 2; k < length; ++k) {
                    if (text[i + k] < 0x80 || text[i + k] > 0xBF) {
                        return false;
                    }
                }
                i += length;
            }
            return true;
        }

    } // namespace

    EnvelopeEngine::EnvelopeEngine(const PeerDirectory& directory) : directory_(directory) {}

    Envelope EnvelopeEngine::encrypt(const std::string& plaintext, const std::vector<std::string>& recipients) const {
        ScopedKey key(Crypto::random_bytes(SYMMETRIC_KEY_BYTES));

        Envelope envelope;
        envelope.iv = Crypto::random_bytes(IV_BYTES);

        byte_vector message(plaintext.begin(), plaintext.end());
        byte_vector sealed = Crypto::aead_encrypt(message, key.bytes(), envelope.iv);
        Crypto::wipe(message);

        // The wire carries the tag as its own field: the last 16 bytes are the tag.
        const auto split = sealed.end() - static_cast<std::ptrdiff_t>(TAG_BYTES);
        envelope.ciphertext.assign(sealed.begin(), split);
        envelope.tag.assign(split, sealed.end());

        for (const auto& id : recipients) {
            envelope.wrapped_keys[id] = Crypto::wrap_key(key.bytes(), directory_.public_key(id));
        }

        return envelope;
    }

    std::string EnvelopeEngine::decrypt(const Envelope& envelope,
                                        const std::string& own_id,
                                        const PrivateKey& own_private_key) {
        auto it = envelope.wrapped_keys.find(own_id);
        if (it == envelope.wrapped_keys.end()) {
            throw NoKeyForRecipient("Message carries no key for this participant.");
        }

        ScopedKey key(Crypto::unwrap_key(it->second, own_private_key));
        if (key.bytes().size() != SYMMETRIC_KEY_BYTES) {
            throw KeyUnwrapError("Unwrapped key has the wrong length.");
        }
        if (envelope.iv.size() != IV_BYTES || envelope.tag.size() != TAG_BYTES) {
            throw AuthenticationError("Malformed IV or authentication tag.");
        }

        byte_vector combined;
        combined.reserve(envelope.ciphertext.size() + envelope.tag.size());
        combined.insert(combined.end(), envelope.ciphertext.begin(), envelope.ciphertext.end());
        combined.insert(combined.end(), envelope.tag.begin(), envelope.tag.end());

        byte_vector plaintext = Crypto::aead_decrypt(combined, key.bytes(), envelope.iv);
        if (!is_valid_utf8(plaintext)) {
            Crypto::wipe(plaintext);
            throw AuthenticationError("Decrypted message is not valid UTF-8 text.");
        }
        std::string text(plaintext.begin(), plaintext.end());
        Crypto::wipe(plaintext);
        return text;
    }

} // namespace OnyxNet
