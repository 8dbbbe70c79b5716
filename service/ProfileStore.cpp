#include "ProfileStore.hpp"
#include "CredentialVault.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
#include <algorithm>

Q_LOGGING_CATEGORY(sdProfiles, "sftpdesk.profiles")

namespace sftpdesk {

namespace {

constexpr int kFormatVersion = 1;

QJsonObject profileToJson(const ConnectionProfile& p, bool includeSecrets) {
    QJsonObject o;
    o["name"] = QString::fromStdString(p.name);
    o["host"] = QString::fromStdString(p.host);
    o["port"] = static_cast<int>(p.port);
    o["username"] = QString::fromStdString(p.username);
    o["auth_method"] = QString::fromLatin1(authMethodName(p.auth_method));
    if (includeSecrets && !p.secret_ref.empty())
        o["secret_ref"] = QString::fromStdString(p.secret_ref);
    if (!p.key_path.empty())
        o["key_path"] = QString::fromStdString(p.key_path);
    if (includeSecrets && !p.passphrase_ref.empty())
        o["passphrase_ref"] = QString::fromStdString(p.passphrase_ref);
    o["description"] = QString::fromStdString(p.description);
    o["timeout_seconds"] = p.timeout_seconds;
    o["keep_alive_interval_seconds"] = p.keep_alive_interval_seconds;
    return o;
}

bool profileFromJson(const QJsonObject& o, ConnectionProfile& p, Error& err) {
    p = ConnectionProfile{};
    p.name = o.value("name").toString().toStdString();
    p.host = o.value("host").toString().toStdString();
    const int port = o.value("port").toInt(22);
    if (port < 1 || port > 65535) {
        err = Error::store(ErrorCode::ValidationFailed,
                           "Profile '" + p.name + "': port out of range");
        return false;
    }
    p.port = static_cast<std::uint16_t>(port);
    p.username = o.value("username").toString().toStdString();
    const std::string method = o.value("auth_method").toString("password").toStdString();
    if (!parseAuthMethod(method, p.auth_method)) {
        err = Error::store(ErrorCode::ValidationFailed,
                           "Profile '" + p.name + "': unknown auth_method '" + method + "'");
        return false;
    }
    p.secret_ref = o.value("secret_ref").toString().toStdString();
    p.key_path = o.value("key_path").toString().toStdString();
    p.passphrase_ref = o.value("passphrase_ref").toString().toStdString();
    p.description = o.value("description").toString().toStdString();
    p.timeout_seconds = o.value("timeout_seconds").toInt(0);
    p.keep_alive_interval_seconds = o.value("keep_alive_interval_seconds").toInt(0);
    return true;
}

bool readProfilesFile(const QString& path, std::vector<ConnectionProfile>& out, Error& err) {
    out.clear();
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not open " + path.toStdString() + ": " +
                               f.errorString().toStdString());
        return false;
    }
    const QByteArray data = f.readAll();
    f.close();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = Error::store(ErrorCode::IOFailure,
                           "Invalid JSON in " + path.toStdString() + ": " +
                               perr.errorString().toStdString());
        return false;
    }
    const QJsonObject root = doc.object();
    if (root.value("format").toInt(0) != kFormatVersion) {
        err = Error::store(ErrorCode::IOFailure,
                           "Unsupported profile file format in " + path.toStdString());
        return false;
    }
    const QJsonArray arr = root.value("profiles").toArray();
    out.reserve(static_cast<std::size_t>(arr.size()));
    for (const auto& v : arr) {
        if (!v.isObject()) {
            err = Error::store(ErrorCode::IOFailure, "Malformed profile entry");
            return false;
        }
        ConnectionProfile p;
        if (!profileFromJson(v.toObject(), p, err))
            return false;
        out.push_back(std::move(p));
    }
    return true;
}

bool writeProfilesFile(const QString& path, const std::vector<ConnectionProfile>& profiles,
                       bool includeSecrets, Error& err) {
    QJsonArray arr;
    for (const auto& p : profiles)
        arr.append(profileToJson(p, includeSecrets));

    QJsonObject root;
    root["format"] = kFormatVersion;
    root["profiles"] = arr;

    QDir().mkpath(QFileInfo(path).absolutePath());
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not write " + path.toStdString() + ": " +
                               f.errorString().toStdString());
        return false;
    }
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not write " + path.toStdString() + ": " +
                               f.errorString().toStdString());
        return false;
    }
    return true;
}

void upsertInto(std::vector<ConnectionProfile>& list, const ConnectionProfile& p) {
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const ConnectionProfile& x) { return x.name == p.name; });
    if (it != list.end())
        *it = p;
    else
        list.push_back(p);
}

} // namespace

bool validateProfile(const ConnectionProfile& p, Error& err, bool secretRequired) {
    auto fail = [&](const std::string& why) {
        err = Error::store(ErrorCode::ValidationFailed,
                           "Profile '" + p.name + "': " + why);
        return false;
    };
    if (p.name.empty())
        return fail("name is required");
    if (p.host.empty())
        return fail("host is required");
    if (p.username.empty())
        return fail("username is required");
    if (p.port == 0)
        return fail("port must be between 1 and 65535");
    if (p.timeout_seconds < 0 || p.keep_alive_interval_seconds < 0)
        return fail("timeouts must not be negative");
    if (p.auth_method == AuthMethod::Password) {
        if (secretRequired && p.secret_ref.empty())
            return fail("password authentication requires a stored secret");
        if (!p.key_path.empty())
            return fail("password authentication must not carry a key_path");
        if (!p.passphrase_ref.empty())
            return fail("password authentication must not carry a key passphrase");
    } else {
        if (p.key_path.empty())
            return fail("private key authentication requires key_path");
        if (!p.secret_ref.empty())
            return fail("private key authentication must not carry a password secret");
    }
    if (!p.secret_ref.empty() && !CredentialVault::isWrapped(p.secret_ref))
        return fail("secret is not vault-wrapped");
    if (!p.passphrase_ref.empty() && !CredentialVault::isWrapped(p.passphrase_ref))
        return fail("key passphrase is not vault-wrapped");
    return true;
}

ProfileStore::ProfileStore(QString path)
    : path_(std::move(path)),
      snapshot_(std::make_shared<const std::vector<ConnectionProfile>>()) {}

ProfileStore::Snapshot ProfileStore::current() const {
    std::lock_guard<std::mutex> lk(snapMutex_);
    return snapshot_;
}

bool ProfileStore::load(Error& err) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    std::vector<ConnectionProfile> loaded;
    if (QFileInfo::exists(path_)) {
        if (!readProfilesFile(path_, loaded, err)) {
            qCWarning(sdProfiles) << "load failed" << "path=" << path_
                                  << "reason=" << QString::fromStdString(err.message);
            return false;
        }
    }
    std::lock_guard<std::mutex> lk(snapMutex_);
    snapshot_ = std::make_shared<const std::vector<ConnectionProfile>>(std::move(loaded));
    qCInfo(sdProfiles) << "profiles loaded" << "count=" << snapshot_->size();
    return true;
}

bool ProfileStore::commitLocked(std::vector<ConnectionProfile> next, Error& err) {
    if (!writeProfilesFile(path_, next, true, err)) {
        qCWarning(sdProfiles) << "commit failed" << "path=" << path_
                              << "reason=" << QString::fromStdString(err.message);
        return false;
    }
    std::lock_guard<std::mutex> lk(snapMutex_);
    snapshot_ = std::make_shared<const std::vector<ConnectionProfile>>(std::move(next));
    return true;
}

std::vector<ConnectionProfile> ProfileStore::list() const {
    return *current();
}

bool ProfileStore::get(const std::string& name, ConnectionProfile& out, Error& err) const {
    const Snapshot snap = current();
    for (const auto& p : *snap) {
        if (p.name == name) {
            out = p;
            return true;
        }
    }
    err = Error::store(ErrorCode::NotFound, "No profile named '" + name + "'");
    return false;
}

bool ProfileStore::upsert(const ConnectionProfile& profile, Error& err) {
    if (!validateProfile(profile, err))
        return false;
    std::lock_guard<std::mutex> wl(writeMutex_);
    std::vector<ConnectionProfile> next = *current();
    upsertInto(next, profile);
    if (!commitLocked(std::move(next), err))
        return false;
    qCInfo(sdProfiles) << "profile saved" << "name=" << QString::fromStdString(profile.name);
    return true;
}

bool ProfileStore::remove(const std::string& name, Error& err) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    std::vector<ConnectionProfile> next = *current();
    auto it = std::find_if(next.begin(), next.end(),
                           [&](const ConnectionProfile& p) { return p.name == name; });
    if (it == next.end()) {
        err = Error::store(ErrorCode::NotFound, "No profile named '" + name + "'");
        return false;
    }
    next.erase(it);
    if (!commitLocked(std::move(next), err))
        return false;
    qCInfo(sdProfiles) << "profile deleted" << "name=" << QString::fromStdString(name);
    return true;
}

bool ProfileStore::importProfiles(const std::vector<ConnectionProfile>& profiles, Error& err,
                                  bool overwrite, ImportSummary* summary) {
    for (const auto& p : profiles) {
        if (!validateProfile(p, err, false))
            return false;
    }
    std::lock_guard<std::mutex> wl(writeMutex_);
    std::vector<ConnectionProfile> next = *current();
    ImportSummary result;
    for (const auto& p : profiles) {
        const bool taken = std::any_of(next.begin(), next.end(),
                                       [&](const ConnectionProfile& x) { return x.name == p.name; });
        if (taken && !overwrite) {
            ++result.skipped;
            continue;
        }
        upsertInto(next, p);
        if (taken)
            ++result.replaced;
        else
            ++result.added;
        if (p.auth_method == AuthMethod::Password && p.secret_ref.empty())
            result.needs_password.push_back(p.name);
    }
    if (result.added + result.replaced > 0 && !commitLocked(std::move(next), err))
        return false;
    qCInfo(sdProfiles) << "profiles imported" << "added=" << result.added
                       << "replaced=" << result.replaced << "skipped=" << result.skipped;
    if (summary)
        *summary = std::move(result);
    return true;
}

bool ProfileStore::exportToFile(const QString& path, bool includeSecrets, Error& err) const {
    const Snapshot snap = current();
    if (!writeProfilesFile(path, *snap, includeSecrets, err))
        return false;
    qCInfo(sdProfiles) << "profiles exported" << "path=" << path
                       << "count=" << snap->size() << "secrets=" << includeSecrets;
    return true;
}

bool ProfileStore::importFromFile(const QString& path, Error& err, bool overwrite,
                                  ImportSummary* summary) {
    std::vector<ConnectionProfile> incoming;
    if (!readProfilesFile(path, incoming, err))
        return false;
    return importProfiles(incoming, err, overwrite, summary);
}

bool ProfileStore::rotateVaultKey(CredentialVault& vault, Error& err) {
    std::lock_guard<std::mutex> wl(writeMutex_);
    const Snapshot before = current();

    // Collect every reference; remember where each one goes back.
    std::vector<std::string> refs;
    std::vector<std::pair<std::size_t, bool>> slots;  // profile index, is passphrase
    for (std::size_t i = 0; i < before->size(); ++i) {
        const ConnectionProfile& p = (*before)[i];
        if (!p.secret_ref.empty()) {
            refs.push_back(p.secret_ref);
            slots.emplace_back(i, false);
        }
        if (!p.passphrase_ref.empty()) {
            refs.push_back(p.passphrase_ref);
            slots.emplace_back(i, true);
        }
    }

    CredentialVault::Rotation rotation;
    if (!vault.prepareRotation(refs, rotation, err))
        return false;

    std::vector<ConnectionProfile> next = *before;
    for (std::size_t k = 0; k < slots.size(); ++k) {
        ConnectionProfile& p = next[slots[k].first];
        (slots[k].second ? p.passphrase_ref : p.secret_ref) = rotation.refs[k];
    }
    if (!commitLocked(std::move(next), err))
        return false;

    if (!vault.commitRotation(rotation, err)) {
        Error rollbackErr;
        if (!commitLocked(*before, rollbackErr)) {
            qCCritical(sdProfiles) << "rollback after failed key rotation also failed"
                                   << QString::fromStdString(rollbackErr.message);
        }
        return false;
    }
    qCInfo(sdProfiles) << "vault key rotated" << "secrets=" << refs.size();
    return true;
}

} // namespace sftpdesk
