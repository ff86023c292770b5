#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Tessera {
namespace Signaling {

class RelaySession;

/**
 * @brief clientId -> open relay session, the relay's source of truth for peer lists
 *
 * Ids are reported in registration order. All methods are thread-safe;
 * SignalingServer additionally serializes membership changes with their
 * broadcasts so recipients never see lists out of order.
 */
class PeerRegistry {
public:
    using SessionPtr = std::shared_ptr<RelaySession>;

    /**
     * @brief Register session under clientId
     * @return The session previously registered under that id, if any
     */
    SessionPtr insert(const std::string& clientId, SessionPtr session);

    /// Remove clientId only if it still maps to session
    bool remove(const std::string& clientId, const SessionPtr& session);

    SessionPtr find(const std::string& clientId) const;
    bool contains(const std::string& clientId) const;

    std::vector<std::string> ids() const;
    std::vector<SessionPtr> sessions() const;
    size_t size() const;

private:
    struct Record {
        SessionPtr session;
        uint64_t sequence;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Record> peers_;
    uint64_t nextSequence_ = 0;

    std::vector<const std::pair<const std::string, Record>*> ordered() const;
};

} // namespace Signaling
} // namespace Tessera
