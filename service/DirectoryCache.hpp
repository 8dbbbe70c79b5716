// Remote directory listings cached per (session, path), dropped when the bus
// reports a mutation under that path or the session goes away.
#pragma once
#include "EventBus.hpp"
#include "ServiceTypes.hpp"
#include "sftpdesk/Error.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sftpdesk {

class Session;

// Directories first, then byte-wise by name (no case folding).
void sortEntries(std::vector<DirectoryEntry>& entries);

class DirectoryCache {
public:
    explicit DirectoryCache(EventBus& bus);
    ~DirectoryCache();

    DirectoryCache(const DirectoryCache&) = delete;
    DirectoryCache& operator=(const DirectoryCache&) = delete;

    // Sorted listing of an absolute remote path. A missing path fails with
    // Transfer NotFound. refresh forces a round-trip.
    bool list(const std::shared_ptr<Session>& session, const std::string& path,
              std::vector<DirectoryEntry>& out, Error& err, bool refresh = false);

    // Drops `path` and everything cached below it.
    void invalidate(std::uint64_t sessionId, const std::string& path);
    void clearSession(std::uint64_t sessionId);

    bool isCached(std::uint64_t sessionId, const std::string& path) const;
    std::size_t size() const;

private:
    using Key = std::pair<std::uint64_t, std::string>;
    using Listing = std::shared_ptr<const std::vector<DirectoryEntry>>;

    // Shared with the bus listener so a late event never touches a dead cache.
    struct State {
        mutable std::mutex mu;
        std::map<Key, Listing> entries;
        std::uint64_t generation = 0;  // bumped by every invalidation
        void invalidate(std::uint64_t sessionId, const std::string& path);
        void clearSession(std::uint64_t sessionId);
    };

    EventBus& bus_;
    std::shared_ptr<State> state_;
    std::uint64_t subscription_ = 0;
};

} // namespace sftpdesk
