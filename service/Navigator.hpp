// Two-pane browsing state: a remote working directory served through the
// DirectoryCache and a local one listed straight from disk.
#pragma once
#include "DirectoryCache.hpp"
#include "ServiceTypes.hpp"
#include "sftpdesk/Error.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sftpdesk {

class Session;

class Navigator {
public:
    enum class Pane { Remote, Local };

    Navigator(DirectoryCache& cache, std::shared_ptr<Session> session,
              std::string remoteHome = "/", std::string localHome = {});

    const std::string& cwd(Pane pane) const;

    // Relative paths resolve against the pane's cwd; "." and ".." are
    // collapsed before anything is listed. cwd only moves on success.
    bool navigate(Pane pane, const std::string& path, std::vector<DirectoryEntry>& out, Error& err);
    bool up(Pane pane, std::vector<DirectoryEntry>& out, Error& err);
    bool refresh(Pane pane, std::vector<DirectoryEntry>& out, Error& err);

    // Remote rename; both parent listings are dropped from the cache.
    bool rename(const std::string& from, const std::string& to, Error& err, bool overwrite = false);

    static bool listLocal(const std::string& path, std::vector<DirectoryEntry>& out, Error& err);

private:
    DirectoryCache& cache_;
    std::shared_ptr<Session> session_;
    std::string remoteCwd_;
    std::string localCwd_;

    std::string resolveLocal(const std::string& path) const;
};

} // namespace sftpdesk
