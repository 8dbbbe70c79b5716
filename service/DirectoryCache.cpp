#include "DirectoryCache.hpp"
#include "SessionManager.hpp"
#include "sftpdesk/RemotePath.hpp"
#include <QLoggingCategory>
#include <QString>
#include <algorithm>

Q_LOGGING_CATEGORY(sdCache, "sftpdesk.cache")

namespace sftpdesk {

namespace {

bool isBelow(const std::string& candidate, const std::string& dir) {
    if (candidate == dir)
        return true;
    if (dir == "/")
        return true;
    return candidate.size() > dir.size() && candidate.compare(0, dir.size(), dir) == 0 &&
           candidate[dir.size()] == '/';
}

} // namespace

void sortEntries(std::vector<DirectoryEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir;
        return a.name < b.name;
    });
}

void DirectoryCache::State::invalidate(std::uint64_t sessionId, const std::string& path) {
    std::lock_guard<std::mutex> lk(mu);
    ++generation;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->first.first == sessionId && isBelow(it->first.second, path))
            it = entries.erase(it);
        else
            ++it;
    }
}

void DirectoryCache::State::clearSession(std::uint64_t sessionId) {
    std::lock_guard<std::mutex> lk(mu);
    ++generation;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->first.first == sessionId)
            it = entries.erase(it);
        else
            ++it;
    }
}

DirectoryCache::DirectoryCache(EventBus& bus)
    : bus_(bus), state_(std::make_shared<State>()) {
    std::weak_ptr<State> weak = state_;
    subscription_ = bus_.subscribe([weak](const Event& e) {
        auto state = weak.lock();
        if (!state)
            return;
        if (e.kind == EventKind::DirectoryInvalidated) {
            state->invalidate(e.session_id, RemotePath::normalize(e.path));
        } else if (e.kind == EventKind::SessionStateChanged &&
                   (e.session_state == SessionState::Disconnected ||
                    e.session_state == SessionState::Failed)) {
            state->clearSession(e.session_id);
        }
    });
}

DirectoryCache::~DirectoryCache() {
    bus_.unsubscribe(subscription_);
}

bool DirectoryCache::list(const std::shared_ptr<Session>& session, const std::string& path,
                          std::vector<DirectoryEntry>& out, Error& err, bool refresh) {
    if (!session) {
        err = Error::session(ErrorCode::ConnectionLost, "No session");
        return false;
    }
    const std::string dir = RemotePath::normalize(path);
    const Key key{session->id(), dir};
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        if (!refresh) {
            auto it = state_->entries.find(key);
            if (it != state_->entries.end()) {
                out = *it->second;
                return true;
            }
        }
        generation = state_->generation;
    }

    std::vector<FileInfo> raw;
    if (!session->run([&](SftpClient& c, Error& e) { return c.list(dir, raw, e); }, err)) {
        qCDebug(sdCache) << "listing failed" << "session=" << session->id()
                         << QString::fromStdString(dir) << QString::fromStdString(err.toString());
        return false;
    }

    auto listing = std::make_shared<std::vector<DirectoryEntry>>();
    listing->reserve(raw.size());
    for (const auto& f : raw) {
        DirectoryEntry d;
        d.name = f.name;
        d.is_dir = f.is_dir;
        d.is_symlink = f.is_symlink;
        d.size = f.size;
        d.modified_time = f.mtime;
        d.permissions = f.mode;
        listing->push_back(std::move(d));
    }
    sortEntries(*listing);
    out = *listing;

    std::lock_guard<std::mutex> lk(state_->mu);
    // An invalidation raced with the round-trip; serve the result uncached.
    if (state_->generation == generation)
        state_->entries[key] = std::move(listing);
    return true;
}

void DirectoryCache::invalidate(std::uint64_t sessionId, const std::string& path) {
    state_->invalidate(sessionId, RemotePath::normalize(path));
}

void DirectoryCache::clearSession(std::uint64_t sessionId) {
    state_->clearSession(sessionId);
}

bool DirectoryCache::isCached(std::uint64_t sessionId, const std::string& path) const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->entries.count({sessionId, RemotePath::normalize(path)}) > 0;
}

std::size_t DirectoryCache::size() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->entries.size();
}

} // namespace sftpdesk
