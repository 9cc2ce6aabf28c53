#include "onyxnet/handshake.hpp"

#include <gtest/gtest.h>

#include "onyxnet/crypto.hpp"

TEST(HandshakeTest, IgnoresOwnEcho) {
    auto self = OnyxNet::Identity::generate();
    OnyxNet::PeerDirectory directory;
    OnyxNet::HandshakeProtocol protocol(self, directory);

    auto result = protocol.handle(protocol.announcement());

    EXPECT_EQ(result.outcome, OnyxNet::HandshakeOutcome::SELF_ECHO);
    EXPECT_FALSE(result.reply.has_value());
    EXPECT_TRUE(directory.empty());
}

TEST(HandshakeTest, NewPeerIsImportedAndAnsweredOnce) {
    auto self = OnyxNet::Identity::generate();
    auto peer = OnyxNet::Identity::generate();
    OnyxNet::PeerDirectory directory;
    OnyxNet::HandshakeProtocol protocol(self, directory);

    OnyxNet::HandshakeFrame hello{peer.id(), peer.export_public_pem()};

    // 1. First contact: import and reply with our own key.
    auto first = protocol.handle(hello);
    EXPECT_EQ(first.outcome, OnyxNet::HandshakeOutcome::PEER_ADDED);
    ASSERT_TRUE(first.reply.has_value());
    EXPECT_EQ(first.reply->sender_id, self.id());
    EXPECT_EQ(first.reply->public_key_pem, self.export_public_pem());
    EXPECT_TRUE(directory.has(peer.id()));

    // 2. Same frame again: nothing changes, no second reply.
    auto second = protocol.handle(hello);
    EXPECT_EQ(second.outcome, OnyxNet::HandshakeOutcome::ALREADY_KNOWN);
    EXPECT_FALSE(second.reply.has_value());
    EXPECT_FALSE(second.key_changed);
    EXPECT_EQ(directory.size(), 1u);
}

TEST(HandshakeTest, KnownIdCannotBeRebound) {
    auto self = OnyxNet::Identity::generate();
    auto peer = OnyxNet::Identity::generate();
    auto impostor = OnyxNet::Identity::generate();
    OnyxNet::PeerDirectory directory;
    OnyxNet::HandshakeProtocol protocol(self, directory);

    protocol.handle({peer.id(), peer.export_public_pem()});
    auto result = protocol.handle({peer.id(), impostor.export_public_pem()});

    EXPECT_EQ(result.outcome, OnyxNet::HandshakeOutcome::ALREADY_KNOWN);
    EXPECT_TRUE(result.key_changed);
    EXPECT_FALSE(result.reply.has_value());
    EXPECT_EQ(OnyxNet::Crypto::export_public_pem(directory.public_key(peer.id())), peer.export_public_pem());

    // Flagged once per id; later attempts, even unparsable ones, are dropped quietly.
    EXPECT_FALSE(protocol.handle({peer.id(), impostor.export_public_pem()}).key_changed);
    auto garbage = protocol.handle({peer.id(), "not a key"});
    EXPECT_EQ(garbage.outcome, OnyxNet::HandshakeOutcome::ALREADY_KNOWN);
    EXPECT_FALSE(garbage.key_changed);
    EXPECT_EQ(directory.announced_pem(peer.id()), peer.export_public_pem());
}

TEST(HandshakeTest, BadKeyIsReportedAndNotStored) {
    auto self = OnyxNet::Identity::generate();
    auto peer = OnyxNet::Identity::generate();
    OnyxNet::PeerDirectory directory;
    OnyxNet::HandshakeProtocol protocol(self, directory);

    auto failed = protocol.handle({peer.id(), "-----BEGIN PUBLIC KEY-----\nbroken\n-----END PUBLIC KEY-----\n"});
    EXPECT_EQ(failed.outcome, OnyxNet::HandshakeOutcome::IMPORT_FAILED);
    EXPECT_FALSE(failed.reply.has_value());
    EXPECT_FALSE(failed.error.empty());
    EXPECT_FALSE(directory.has(peer.id()));

    // Nothing was bound, so a later valid announcement is still accepted.
    auto retry = protocol.handle({peer.id(), peer.export_public_pem()});
    EXPECT_EQ(retry.outcome, OnyxNet::HandshakeOutcome::PEER_ADDED);
}
