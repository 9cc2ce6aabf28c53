#include "onyxnet/crypto.hpp"

#include <gtest/gtest.h>
#include <openssl/pem.h>

#include <sstream>
#include <string>
#include <vector>

#include "onyxnet/errors.hpp"

namespace {

// Ed25519 SPKI PEM: a valid public key, but not an RSA one.
std::string ed25519_public_pem() {
    EVP_PKEY* raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519");
    EXPECT_NE(raw, nullptr);
    std::unique_ptr<EVP_PKEY, OnyxNet::EvpPkeyDeleter> key(raw);

    BIO* bio = BIO_new(BIO_s_mem());
    EXPECT_EQ(PEM_write_bio_PUBKEY(bio, key.get()), 1);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<size_t>(len));
    BIO_free(bio);
    return pem;
}

} // namespace

TEST(CryptoTest, GeneratedKeyExportsAsWrappedSpkiPem) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    auto kp = OnyxNet::Crypto::generate_rsa_keypair();
    ASSERT_TRUE(kp.publicKey.handle);
    ASSERT_TRUE(kp.privateKey.handle);
    EXPECT_EQ(EVP_PKEY_get_bits(kp.publicKey.handle.get()), OnyxNet::RSA_KEY_BITS);

    std::string pem = OnyxNet::Crypto::export_public_pem(kp.publicKey);
    EXPECT_EQ(pem.rfind("-----BEGIN PUBLIC KEY-----\n", 0), 0u);
    EXPECT_NE(pem.find("-----END PUBLIC KEY-----\n"), std::string::npos);

    std::istringstream lines(pem);
    std::string line;
    while (std::getline(lines, line)) {
        EXPECT_LE(line.size(), 64u) << line;
    }

    // Re-importing yields the same key.
    auto imported = OnyxNet::Crypto::import_public_pem(pem);
    EXPECT_EQ(OnyxNet::Crypto::export_public_pem(imported), pem);
}

TEST(CryptoTest, ImportRejectsNonRsaAndGarbage) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    EXPECT_THROW(OnyxNet::Crypto::import_public_pem(""), OnyxNet::KeyImportError);
    EXPECT_THROW(OnyxNet::Crypto::import_public_pem("not a key"), OnyxNet::KeyImportError);
    EXPECT_THROW(OnyxNet::Crypto::import_public_pem("-----BEGIN PUBLIC KEY-----\nAAAA\n-----END PUBLIC KEY-----\n"),
                 OnyxNet::KeyImportError);
    EXPECT_THROW(OnyxNet::Crypto::import_public_pem(ed25519_public_pem()), OnyxNet::KeyImportError);
}

TEST(CryptoTest, WrapAndUnwrapKey) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    auto owner = OnyxNet::Crypto::generate_rsa_keypair();
    auto stranger = OnyxNet::Crypto::generate_rsa_keypair();
    auto key = OnyxNet::Crypto::random_bytes(OnyxNet::SYMMETRIC_KEY_BYTES);

    auto wrapped = OnyxNet::Crypto::wrap_key(key, owner.publicKey);
    EXPECT_EQ(wrapped.size(), 256u);  // one RSA-2048 block

    EXPECT_EQ(OnyxNet::Crypto::unwrap_key(wrapped, owner.privateKey), key);
    EXPECT_THROW(OnyxNet::Crypto::unwrap_key(wrapped, stranger.privateKey), OnyxNet::KeyUnwrapError);

    // OAEP is randomized.
    EXPECT_NE(OnyxNet::Crypto::wrap_key(key, owner.publicKey), wrapped);
}

TEST(CryptoTest, AeadDetectsTampering) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    auto key = OnyxNet::Crypto::random_bytes(OnyxNet::SYMMETRIC_KEY_BYTES);
    auto iv = OnyxNet::Crypto::random_bytes(OnyxNet::IV_BYTES);
    OnyxNet::byte_vector message = {'s', 'e', 'c', 'r', 'e', 't'};

    auto sealed = OnyxNet::Crypto::aead_encrypt(message, key, iv);
    ASSERT_EQ(sealed.size(), message.size() + OnyxNet::TAG_BYTES);
    EXPECT_EQ(OnyxNet::Crypto::aead_decrypt(sealed, key, iv), message);

    sealed[0] ^= 0x01;
    EXPECT_THROW(OnyxNet::Crypto::aead_decrypt(sealed, key, iv), OnyxNet::AuthenticationError);

    OnyxNet::byte_vector too_short(OnyxNet::TAG_BYTES - 1, 0);
    EXPECT_THROW(OnyxNet::Crypto::aead_decrypt(too_short, key, iv), OnyxNet::AuthenticationError);

    OnyxNet::byte_vector short_key(16, 0);
    EXPECT_THROW(OnyxNet::Crypto::aead_encrypt(message, short_key, iv), OnyxNet::InvalidArgument);
}

TEST(CryptoTest, AeadMatchesKnownVector) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    // AES-256-GCM, all-zero key and IV, empty plaintext (NIST GCM test case 13).
    OnyxNet::byte_vector key(32, 0);
    OnyxNet::byte_vector iv(12, 0);

    auto sealed = OnyxNet::Crypto::aead_encrypt({}, key, iv);
    EXPECT_EQ(OnyxNet::Crypto::to_base64(sealed), "Uw+K+8dFNrmpY7TxxMtziw==");
    EXPECT_TRUE(OnyxNet::Crypto::aead_decrypt(sealed, key, iv).empty());
}

TEST(CryptoTest, Base64IsStandardPadded) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    OnyxNet::byte_vector hello = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(OnyxNet::Crypto::to_base64(hello), "aGVsbG8=");
    EXPECT_EQ(OnyxNet::Crypto::from_base64("aGVsbG8="), hello);

    OnyxNet::byte_vector high = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(OnyxNet::Crypto::to_base64(high), "+/+/");

    EXPECT_EQ(OnyxNet::Crypto::to_base64({}), "");
    EXPECT_TRUE(OnyxNet::Crypto::from_base64("").empty());

    EXPECT_THROW(OnyxNet::Crypto::from_base64("aGVsbG8"), OnyxNet::InvalidArgument);   // unpadded
    EXPECT_THROW(OnyxNet::Crypto::from_base64("aGVs-G8="), OnyxNet::InvalidArgument);  // url-safe alphabet
    EXPECT_THROW(OnyxNet::Crypto::from_base64("@@@@"), OnyxNet::InvalidArgument);
}

TEST(CryptoTest, SessionIdLooksLikeUuidV4) {
    ASSERT_EQ(OnyxNet::Crypto::init(), 0);

    std::string id = OnyxNet::Crypto::generate_session_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef-"), std::string::npos);

    EXPECT_NE(OnyxNet::Crypto::generate_session_id(), id);
}
