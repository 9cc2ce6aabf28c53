#include "onyxnet/peer_directory.hpp"

#include "onyxnet/crypto.hpp"
#include "onyxnet/errors.hpp"

namespace OnyxNet {

bool PeerDirectory::has(const std::string& id) const {
    return peers_.find(id) != peers_.end();
}

void PeerDirectory::import_and_insert(const std::string& id, const std::string& pem) {
    if (has(id)) {
        throw LogicError("Peer " + id + " is already bound to a key.");
    }

    // Parse first, so a bad PEM leaves the directory untouched.
    PublicKey key = Crypto::import_public_pem(pem);
    peers_.emplace(id, Entry{std::move(key), pem});
}

std::vector<std::string> PeerDirectory::known_ids() const {
    std::vector<std::string> ids;
    ids.reserve(peers_.size());
    for (const auto& [id, entry] : peers_) {
        ids.push_back(id);
    }
    return ids;
}

const PublicKey& PeerDirectory::public_key(const std::string& id) const {
    return entry(id).key;
}

const std::string& PeerDirectory::announced_pem(const std::string& id) const {
    return entry(id).pem;
}

const PeerDirectory::Entry& PeerDirectory::entry(const std::string& id) const {
    auto it = peers_.find(id);
    if (it == peers_.end()) {
        throw InvalidArgument("Unknown peer: " + id);
    }
    return it->second;
}

} // namespace OnyxNet
