// Durable name -> ConnectionProfile mapping kept in one JSON document.
// Every write replaces the whole file atomically (QSaveFile); readers work on
// the last committed snapshot and never see a half-applied change.
#pragma once
#include "ConnectionProfile.hpp"
#include "sftpdesk/Error.hpp"
#include <QString>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sftpdesk {

class CredentialVault;

// Field checks shared by upsert/import: required fields, port range, the
// auth_method/credential pairing and vault-format secret references. With
// secretRequired off a password profile may come without a stored secret
// (exports strip them); the password is then asked for at connect time.
bool validateProfile(const ConnectionProfile& p, Error& err, bool secretRequired = true);

struct ImportSummary {
    std::size_t added = 0;
    std::size_t replaced = 0;
    std::size_t skipped = 0;                 // name taken, overwrite not set
    std::vector<std::string> needs_password; // imported without a stored secret
};

class ProfileStore {
public:
    explicit ProfileStore(QString path);

    // Reads the file into the snapshot. A missing file is an empty store.
    bool load(Error& err);

    // Insertion order.
    std::vector<ConnectionProfile> list() const;
    bool get(const std::string& name, ConnectionProfile& out, Error& err) const;

    // Replaces an existing profile in place or appends a new one.
    bool upsert(const ConnectionProfile& profile, Error& err);
    bool remove(const std::string& name, Error& err);

    // All-or-nothing: nothing is written unless every profile validates.
    // Existing names are kept unless overwrite is set.
    bool importProfiles(const std::vector<ConnectionProfile>& profiles, Error& err,
                        bool overwrite = false, ImportSummary* summary = nullptr);
    std::vector<ConnectionProfile> exportProfiles() const { return list(); }

    // Secret references are stripped unless includeSecrets is set.
    bool exportToFile(const QString& path, bool includeSecrets, Error& err) const;
    bool importFromFile(const QString& path, Error& err, bool overwrite = false,
                        ImportSummary* summary = nullptr);

    // Re-wraps every stored secret under a fresh vault key. The store is
    // written first; if the key cannot be committed the old store is restored.
    bool rotateVaultKey(CredentialVault& vault, Error& err);

    const QString& path() const { return path_; }

private:
    using Snapshot = std::shared_ptr<const std::vector<ConnectionProfile>>;

    QString path_;
    std::mutex writeMutex_;  // single writer
    mutable std::mutex snapMutex_;
    Snapshot snapshot_;

    Snapshot current() const;
    bool commitLocked(std::vector<ConnectionProfile> next, Error& err);
};

} // namespace sftpdesk
