// Trust-on-first-use record of server identities: (host, port) -> host key.
#pragma once
#include "sftpdesk/Error.hpp"
#include "sftpdesk/SftpTypes.hpp"
#include <QString>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace sftpdesk {

class KnownHostsStore {
public:
    enum class Match { Match, Mismatch, NotFound };

    struct Record {
        std::string host;
        std::uint16_t port = 22;
        std::string algorithm;
        std::string fingerprint;
    };

    explicit KnownHostsStore(QString path);

    bool load(Error& err);

    Match check(const HostKeyInfo& key) const;
    // Records (or replaces) the key for key.host:key.port and persists.
    bool remember(const HostKeyInfo& key, Error& err);
    bool forget(const std::string& host, std::uint16_t port, Error& err);
    std::vector<Record> records() const;

private:
    using Key = std::pair<std::string, std::uint16_t>;

    QString path_;
    mutable std::mutex mu_;
    std::map<Key, Record> records_;

    bool saveLocked(Error& err) const;
};

} // namespace sftpdesk
