// Encrypts stored secrets with a per-installation key (AES-256-GCM).
// The key lives in one owner-only file; losing it loses every secret.
#pragma once
#include "sftpdesk/Error.hpp"
#include <QByteArray>
#include <QString>
#include <mutex>
#include <string>
#include <vector>

namespace sftpdesk {

class CredentialVault {
public:
    explicit CredentialVault(QString keyPath);

    // Creates the installation key on first use.
    bool wrap(const std::string& plaintext, std::string& out_ref, Error& err);
    bool unwrap(const std::string& ref, std::string& out_plain, Error& err) const;

    bool hasKey() const;
    const QString& keyPath() const { return keyPath_; }

    // Structural check only ("v1:" + base64 payload of plausible size).
    static bool isWrapped(const std::string& ref);

    // Key rotation, split so a caller can persist re-wrapped secrets before
    // the new key replaces the old one.
    struct Rotation {
        QByteArray newKey;
        std::vector<std::string> refs;  // same order as the input refs
    };
    bool prepareRotation(const std::vector<std::string>& refs, Rotation& out, Error& err) const;
    bool commitRotation(const Rotation& rotation, Error& err);

    // prepareRotation + commitRotation in one call.
    bool rotateKey(const std::vector<std::string>& refs,
                   std::vector<std::string>& out_refs,
                   Error& err);

private:
    QString keyPath_;
    std::mutex createMutex_;  // lazy key creation

    bool loadKey(QByteArray& key, Error& err) const;
    bool storeKey(const QByteArray& key, Error& err) const;
};

} // namespace sftpdesk
