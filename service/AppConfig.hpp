// Enumerated application settings backed by an INI file (QSettings).
// Unknown keys and out-of-range values are rejected, never ignored.
#pragma once
#include "ServiceTypes.hpp"
#include "sftpdesk/Error.hpp"
#include "sftpdesk/SftpTypes.hpp"
#include <QString>
#include <cstddef>
#include <string>
#include <vector>

namespace sftpdesk {

struct TransferSettings {
    OverwritePolicy overwrite_policy = OverwritePolicy::Prompt;
    std::size_t chunk_size_bytes = 65536;
    int concurrent_jobs_per_session = 1;
    int progress_interval_ms = 100;
    int max_retries = 3;
    bool preserve_timestamps = true;
};

struct ConnectionSettings {
    int timeout_seconds = 30;
    int keep_alive_interval_seconds = 60;  // 0 disables the probe
    int retry_ceiling = 5;
    int reconnect_grace_seconds = 0;       // 0: long enough for retry_ceiling attempts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;
};

// Where the persisted state lives.
struct DataPaths {
    QString config;
    QString profiles;
    QString known_hosts;
    QString vault_key;

    static DataPaths inDirectory(const QString& dir);
    // QStandardPaths::AppConfigLocation, overridable with SFTPDESK_HOME.
    static DataPaths defaults();
};

struct AppConfig {
    TransferSettings transfer;
    ConnectionSettings connection;
    std::string logging_level = "info";

    // A missing file yields the defaults.
    static bool load(const QString& path, AppConfig& out, Error& err);
    bool save(const QString& path, Error& err) const;

    // Sets one dotted key ("transfer.chunk_size_bytes") from its text form.
    bool set(const std::string& key, const std::string& value, Error& err);
    std::string get(const std::string& key) const;

    static const std::vector<std::string>& keys();

    // Installs QLoggingCategory filter rules for sftpdesk.* at logging_level.
    void applyLogging() const;
};

const char* knownHostsPolicyName(KnownHostsPolicy p);
bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out);

} // namespace sftpdesk
