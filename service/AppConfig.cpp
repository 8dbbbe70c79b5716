#include "AppConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QStandardPaths>
#include <algorithm>
#include <cctype>

Q_LOGGING_CATEGORY(sdConfig, "sftpdesk.config")

namespace sftpdesk {

namespace {

std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

Error invalid(const std::string& key, const std::string& why) {
    return Error::store(ErrorCode::ValidationFailed, key + ": " + why);
}

bool parseInt(const std::string& key, const std::string& value, long long lo,
              long long hi, long long& out, Error& err) {
    bool ok = false;
    const long long v = QString::fromStdString(value).trimmed().toLongLong(&ok);
    if (!ok) {
        err = invalid(key, "expected an integer, got '" + value + "'");
        return false;
    }
    if (v < lo || v > hi) {
        err = invalid(key, "value " + std::to_string(v) + " outside " +
                               std::to_string(lo) + ".." + std::to_string(hi));
        return false;
    }
    out = v;
    return true;
}

bool parseBool(const std::string& key, const std::string& value, bool& out, Error& err) {
    const std::string v = lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
        return true;
    }
    err = invalid(key, "expected a boolean, got '" + value + "'");
    return false;
}

} // namespace

const char* knownHostsPolicyName(KnownHostsPolicy p) {
    switch (p) {
    case KnownHostsPolicy::Strict:
        return "Strict";
    case KnownHostsPolicy::AcceptNew:
        return "AcceptNew";
    case KnownHostsPolicy::Off:
        return "Off";
    }
    return "Unknown";
}

bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out) {
    const std::string v = lower(text);
    if (v == "strict")
        out = KnownHostsPolicy::Strict;
    else if (v == "acceptnew" || v == "accept_new" || v == "tofu")
        out = KnownHostsPolicy::AcceptNew;
    else if (v == "off")
        out = KnownHostsPolicy::Off;
    else
        return false;
    return true;
}

DataPaths DataPaths::inDirectory(const QString& dir) {
    QDir d(dir);
    DataPaths p;
    p.config = d.filePath(QStringLiteral("config.ini"));
    p.profiles = d.filePath(QStringLiteral("profiles.json"));
    p.known_hosts = d.filePath(QStringLiteral("known_hosts.json"));
    p.vault_key = d.filePath(QStringLiteral("vault.key"));
    return p;
}

DataPaths DataPaths::defaults() {
    const QString home = qEnvironmentVariable("SFTPDESK_HOME");
    if (!home.isEmpty())
        return inDirectory(home);
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (base.isEmpty())
        base = QDir::home().filePath(QStringLiteral(".config/sftpdesk"));
    return inDirectory(base);
}

const std::vector<std::string>& AppConfig::keys() {
    static const std::vector<std::string> k = {
        "transfer.overwrite_policy",
        "transfer.chunk_size_bytes",
        "transfer.concurrent_jobs_per_session",
        "transfer.progress_interval_ms",
        "transfer.max_retries",
        "transfer.preserve_timestamps",
        "connection.timeout_seconds",
        "connection.keep_alive_interval_seconds",
        "connection.retry_ceiling",
        "connection.reconnect_grace_seconds",
        "connection.known_hosts_policy",
        "logging.level",
    };
    return k;
}

bool AppConfig::set(const std::string& key, const std::string& value, Error& err) {
    long long n = 0;
    if (key == "transfer.overwrite_policy") {
        if (!parseOverwritePolicy(value, transfer.overwrite_policy)) {
            err = invalid(key, "expected Skip, Overwrite, Rename or Prompt");
            return false;
        }
    } else if (key == "transfer.chunk_size_bytes") {
        if (!parseInt(key, value, 1024, 64LL * 1024 * 1024, n, err))
            return false;
        transfer.chunk_size_bytes = static_cast<std::size_t>(n);
    } else if (key == "transfer.concurrent_jobs_per_session") {
        if (!parseInt(key, value, 1, 16, n, err))
            return false;
        transfer.concurrent_jobs_per_session = static_cast<int>(n);
    } else if (key == "transfer.progress_interval_ms") {
        if (!parseInt(key, value, 0, 60000, n, err))
            return false;
        transfer.progress_interval_ms = static_cast<int>(n);
    } else if (key == "transfer.max_retries") {
        if (!parseInt(key, value, 0, 100, n, err))
            return false;
        transfer.max_retries = static_cast<int>(n);
    } else if (key == "transfer.preserve_timestamps") {
        if (!parseBool(key, value, transfer.preserve_timestamps, err))
            return false;
    } else if (key == "connection.timeout_seconds") {
        if (!parseInt(key, value, 1, 600, n, err))
            return false;
        connection.timeout_seconds = static_cast<int>(n);
    } else if (key == "connection.keep_alive_interval_seconds") {
        if (!parseInt(key, value, 0, 3600, n, err))
            return false;
        connection.keep_alive_interval_seconds = static_cast<int>(n);
    } else if (key == "connection.retry_ceiling") {
        if (!parseInt(key, value, 0, 100, n, err))
            return false;
        connection.retry_ceiling = static_cast<int>(n);
    } else if (key == "connection.reconnect_grace_seconds") {
        if (!parseInt(key, value, 0, 86400, n, err))
            return false;
        connection.reconnect_grace_seconds = static_cast<int>(n);
    } else if (key == "connection.known_hosts_policy") {
        if (!parseKnownHostsPolicy(value, connection.known_hosts_policy)) {
            err = invalid(key, "expected Strict, AcceptNew or Off");
            return false;
        }
    } else if (key == "logging.level") {
        const std::string v = lower(value);
        if (v != "debug" && v != "info" && v != "warning" && v != "critical") {
            err = invalid(key, "expected debug, info, warning or critical");
            return false;
        }
        logging_level = v;
    } else {
        err = invalid(key, "unknown configuration key");
        return false;
    }
    return true;
}

std::string AppConfig::get(const std::string& key) const {
    if (key == "transfer.overwrite_policy")
        return overwritePolicyName(transfer.overwrite_policy);
    if (key == "transfer.chunk_size_bytes")
        return std::to_string(transfer.chunk_size_bytes);
    if (key == "transfer.concurrent_jobs_per_session")
        return std::to_string(transfer.concurrent_jobs_per_session);
    if (key == "transfer.progress_interval_ms")
        return std::to_string(transfer.progress_interval_ms);
    if (key == "transfer.max_retries")
        return std::to_string(transfer.max_retries);
    if (key == "transfer.preserve_timestamps")
        return transfer.preserve_timestamps ? "true" : "false";
    if (key == "connection.timeout_seconds")
        return std::to_string(connection.timeout_seconds);
    if (key == "connection.keep_alive_interval_seconds")
        return std::to_string(connection.keep_alive_interval_seconds);
    if (key == "connection.retry_ceiling")
        return std::to_string(connection.retry_ceiling);
    if (key == "connection.reconnect_grace_seconds")
        return std::to_string(connection.reconnect_grace_seconds);
    if (key == "connection.known_hosts_policy")
        return knownHostsPolicyName(connection.known_hosts_policy);
    if (key == "logging.level")
        return logging_level;
    return {};
}

bool AppConfig::load(const QString& path, AppConfig& out, Error& err) {
    out = AppConfig{};
    if (!QFileInfo::exists(path)) {
        qCInfo(sdConfig) << "no config file, using defaults" << "path=" << path;
        return true;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not parse configuration file " + path.toStdString());
        return false;
    }
    AppConfig cfg;
    const QStringList all = s.allKeys();
    for (const QString& k : all) {
        // QSettings exposes "[section] key" as "section/key"; keys outside a
        // section come back as "General/key".
        QString dotted = k;
        dotted.replace(QLatin1Char('/'), QLatin1Char('.'));
        if (!cfg.set(dotted.toStdString(), s.value(k).toString().toStdString(), err)) {
            qCWarning(sdConfig) << "rejecting configuration" << "path=" << path
                                << "reason=" << QString::fromStdString(err.message);
            return false;
        }
    }
    out = cfg;
    qCInfo(sdConfig) << "configuration loaded" << "path=" << path
                     << "keys=" << all.size();
    return true;
}

bool AppConfig::save(const QString& path, Error& err) const {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QSettings s(path, QSettings::IniFormat);
    s.clear();
    for (const std::string& key : keys()) {
        QString k = QString::fromStdString(key);
        k.replace(QLatin1Char('.'), QLatin1Char('/'));
        s.setValue(k, QString::fromStdString(get(key)));
    }
    s.sync();
    if (s.status() != QSettings::NoError) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not write configuration file " + path.toStdString());
        return false;
    }
    return true;
}

void AppConfig::applyLogging() const {
    QString rules;
    if (logging_level == "debug") {
        rules = QStringLiteral("sftpdesk.*=true");
    } else if (logging_level == "info") {
        rules = QStringLiteral("sftpdesk.*.debug=false\nsftpdesk.*.info=true");
    } else if (logging_level == "warning") {
        rules = QStringLiteral("sftpdesk.*.debug=false\nsftpdesk.*.info=false");
    } else {
        rules = QStringLiteral("sftpdesk.*.debug=false\nsftpdesk.*.info=false\n"
                               "sftpdesk.*.warning=false");
    }
    QLoggingCategory::setFilterRules(rules);
}

} // namespace sftpdesk
