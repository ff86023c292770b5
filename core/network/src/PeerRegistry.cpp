#include "PeerRegistry.h"
#include "RelaySession.h"

#include <algorithm>

namespace Tessera {
namespace Signaling {

PeerRegistry::SessionPtr PeerRegistry::insert(const std::string& clientId, SessionPtr session) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionPtr previous;
    auto it = peers_.find(clientId);
    if (it != peers_.end()) {
        previous = std::move(it->second.session);
        peers_.erase(it);
    }
    peers_.emplace(clientId, Record{std::move(session), nextSequence_++});
    return previous;
}

bool PeerRegistry::remove(const std::string& clientId, const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(clientId);
    if (it == peers_.end() || it->second.session != session) {
        return false;
    }
    peers_.erase(it);
    return true;
}

PeerRegistry::SessionPtr PeerRegistry::find(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(clientId);
    return it != peers_.end() ? it->second.session : nullptr;
}

bool PeerRegistry::contains(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.count(clientId) > 0;
}

// Caller holds mutex_
std::vector<const std::pair<const std::string, PeerRegistry::Record>*> PeerRegistry::ordered() const {
    std::vector<const std::pair<const std::string, Record>*> entries;
    entries.reserve(peers_.size());
    for (const auto& entry : peers_) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) {
        return a->second.sequence < b->second.sequence;
    });
    return entries;
}

std::vector<std::string> PeerRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto* entry : ordered()) {
        result.push_back(entry->first);
    }
    return result;
}

std::vector<PeerRegistry::SessionPtr> PeerRegistry::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionPtr> result;
    for (const auto* entry : ordered()) {
        result.push_back(entry->second.session);
    }
    return result;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

} // namespace Signaling
} // namespace Tessera
