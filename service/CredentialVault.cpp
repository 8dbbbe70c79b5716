// AES-256-GCM through OpenSSL EVP. Reference layout:
//   "v1:" + base64(nonce[12] | ciphertext | tag[16])
#include "CredentialVault.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

Q_LOGGING_CATEGORY(sdVault, "sftpdesk.vault")

namespace sftpdesk {

namespace {

constexpr int kKeyBytes = 32;
constexpr int kNonceBytes = 12;
constexpr int kTagBytes = 16;
const char kRefPrefix[] = "v1:";
const char kAad[] = "sftpdesk-credential-v1";

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

bool encryptWithKey(const QByteArray& key, const std::string& plaintext,
                    std::string& out_ref, Error& err) {
    QByteArray nonce(kNonceBytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(nonce.data()), kNonceBytes) != 1) {
        err = Error::vault(ErrorCode::KeyMissing, "Random generator unavailable");
        return false;
    }
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        err = Error::vault(ErrorCode::DecryptFailed, "Could not allocate cipher context");
        return false;
    }
    const auto* k = reinterpret_cast<const unsigned char*>(key.constData());
    const auto* iv = reinterpret_cast<const unsigned char*>(nonce.constData());
    int len = 0;
    QByteArray ct(static_cast<int>(plaintext.size()) + kTagBytes, '\0');
    auto* out = reinterpret_cast<unsigned char*>(ct.data());
    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceBytes, nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, k, iv) == 1 &&
              EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                                reinterpret_cast<const unsigned char*>(kAad),
                                static_cast<int>(sizeof(kAad) - 1)) == 1;
    int total = 0;
    if (ok && !plaintext.empty()) {
        ok = EVP_EncryptUpdate(ctx.get(), out, &len,
                               reinterpret_cast<const unsigned char*>(plaintext.data()),
                               static_cast<int>(plaintext.size())) == 1;
        total = len;
    }
    if (ok) {
        ok = EVP_EncryptFinal_ex(ctx.get(), out + total, &len) == 1;
        total += len;
    }
    QByteArray tag(kTagBytes, '\0');
    if (ok)
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagBytes, tag.data()) == 1;
    if (!ok) {
        err = Error::vault(ErrorCode::DecryptFailed, "Encryption failed");
        return false;
    }
    ct.truncate(total);
    const QByteArray blob = nonce + ct + tag;
    out_ref = std::string(kRefPrefix) + blob.toBase64().toStdString();
    return true;
}

bool decryptWithKey(const QByteArray& key, const std::string& ref,
                    std::string& out_plain, Error& err) {
    if (!CredentialVault::isWrapped(ref)) {
        err = Error::vault(ErrorCode::DecryptFailed, "Malformed secret reference");
        return false;
    }
    const QByteArray blob = QByteArray::fromBase64(
        QByteArray::fromStdString(ref.substr(sizeof(kRefPrefix) - 1)));
    if (blob.size() < kNonceBytes + kTagBytes) {
        err = Error::vault(ErrorCode::DecryptFailed, "Truncated secret reference");
        return false;
    }
    const QByteArray nonce = blob.left(kNonceBytes);
    const QByteArray tag = blob.right(kTagBytes);
    const QByteArray ct = blob.mid(kNonceBytes, blob.size() - kNonceBytes - kTagBytes);

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        err = Error::vault(ErrorCode::DecryptFailed, "Could not allocate cipher context");
        return false;
    }
    QByteArray plain(ct.size() + kTagBytes, '\0');
    auto* out = reinterpret_cast<unsigned char*>(plain.data());
    int len = 0;
    int total = 0;
    bool ok =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceBytes, nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr,
                           reinterpret_cast<const unsigned char*>(key.constData()),
                           reinterpret_cast<const unsigned char*>(nonce.constData())) == 1 &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const unsigned char*>(kAad),
                          static_cast<int>(sizeof(kAad) - 1)) == 1;
    if (ok && !ct.isEmpty()) {
        ok = EVP_DecryptUpdate(ctx.get(), out, &len,
                               reinterpret_cast<const unsigned char*>(ct.constData()),
                               ct.size()) == 1;
        total = len;
    }
    if (ok)
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagBytes,
                                 const_cast<char*>(tag.constData())) == 1;
    // Final fails on tag mismatch: wrong key or tampered data.
    if (ok) {
        ok = EVP_DecryptFinal_ex(ctx.get(), out + total, &len) == 1;
        total += len;
    }
    if (!ok) {
        err = Error::vault(ErrorCode::DecryptFailed,
                           "Secret could not be decrypted (wrong key or tampered data)");
        return false;
    }
    out_plain.assign(plain.constData(), static_cast<std::size_t>(total));
    return true;
}

} // namespace

CredentialVault::CredentialVault(QString keyPath) : keyPath_(std::move(keyPath)) {}

bool CredentialVault::isWrapped(const std::string& ref) {
    const std::size_t prefixLen = sizeof(kRefPrefix) - 1;
    if (ref.size() <= prefixLen || ref.compare(0, prefixLen, kRefPrefix) != 0)
        return false;
    for (std::size_t i = prefixLen; i < ref.size(); ++i) {
        const char c = ref[i];
        const bool b64 = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                         (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
        if (!b64)
            return false;
    }
    // base64 of at least nonce + tag
    return ref.size() - prefixLen >= 40;
}

bool CredentialVault::hasKey() const {
    QByteArray key;
    Error ignored;
    return loadKey(key, ignored);
}

bool CredentialVault::loadKey(QByteArray& key, Error& err) const {
    QFile f(keyPath_);
    if (!f.exists()) {
        err = Error::vault(ErrorCode::KeyMissing, "Vault key not found");
        return false;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        err = Error::vault(ErrorCode::KeyMissing,
                           "Vault key unreadable: " + f.errorString().toStdString());
        return false;
    }
    const QByteArray raw = QByteArray::fromBase64(f.readAll().trimmed());
    if (raw.size() != kKeyBytes) {
        err = Error::vault(ErrorCode::KeyMissing, "Vault key is corrupted");
        return false;
    }
    key = raw;
    return true;
}

bool CredentialVault::storeKey(const QByteArray& key, Error& err) const {
    QDir().mkpath(QFileInfo(keyPath_).absolutePath());
    QSaveFile f(keyPath_);
    if (!f.open(QIODevice::WriteOnly)) {
        err = Error::vault(ErrorCode::KeyMissing,
                           "Cannot write vault key: " + f.errorString().toStdString());
        return false;
    }
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    f.write(key.toBase64());
    f.write("\n");
    if (!f.commit()) {
        err = Error::vault(ErrorCode::KeyMissing,
                           "Cannot commit vault key: " + f.errorString().toStdString());
        return false;
    }
    QFile::setPermissions(keyPath_, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

bool CredentialVault::wrap(const std::string& plaintext, std::string& out_ref, Error& err) {
    QByteArray key;
    {
        std::lock_guard<std::mutex> lk(createMutex_);
        if (!QFile::exists(keyPath_)) {
            key.resize(kKeyBytes);
            if (RAND_bytes(reinterpret_cast<unsigned char*>(key.data()), kKeyBytes) != 1) {
                err = Error::vault(ErrorCode::KeyMissing, "Random generator unavailable");
                return false;
            }
            if (!storeKey(key, err))
                return false;
            qCInfo(sdVault) << "generated installation key" << "path=" << keyPath_;
        } else if (!loadKey(key, err)) {
            return false;
        }
    }
    return encryptWithKey(key, plaintext, out_ref, err);
}

bool CredentialVault::unwrap(const std::string& ref, std::string& out_plain, Error& err) const {
    QByteArray key;
    if (!loadKey(key, err))
        return false;
    if (!decryptWithKey(key, ref, out_plain, err)) {
        qCWarning(sdVault) << "unwrap failed" << QString::fromStdString(err.message);
        return false;
    }
    return true;
}

bool CredentialVault::prepareRotation(const std::vector<std::string>& refs,
                                      Rotation& out, Error& err) const {
    QByteArray oldKey;
    if (!loadKey(oldKey, err))
        return false;
    Rotation r;
    r.newKey.resize(kKeyBytes);
    if (RAND_bytes(reinterpret_cast<unsigned char*>(r.newKey.data()), kKeyBytes) != 1) {
        err = Error::vault(ErrorCode::KeyMissing, "Random generator unavailable");
        return false;
    }
    r.refs.reserve(refs.size());
    for (const std::string& ref : refs) {
        std::string plain;
        std::string rewrapped;
        if (!decryptWithKey(oldKey, ref, plain, err))
            return false;
        if (!encryptWithKey(r.newKey, plain, rewrapped, err))
            return false;
        r.refs.push_back(std::move(rewrapped));
    }
    out = std::move(r);
    return true;
}

bool CredentialVault::commitRotation(const Rotation& rotation, Error& err) {
    std::lock_guard<std::mutex> lk(createMutex_);
    if (rotation.newKey.size() != kKeyBytes) {
        err = Error::vault(ErrorCode::KeyMissing, "Rotation carries no key");
        return false;
    }
    if (!storeKey(rotation.newKey, err))
        return false;
    qCInfo(sdVault) << "installation key rotated" << "secrets=" << rotation.refs.size();
    return true;
}

bool CredentialVault::rotateKey(const std::vector<std::string>& refs,
                                std::vector<std::string>& out_refs,
                                Error& err) {
    Rotation r;
    if (!prepareRotation(refs, r, err) || !commitRotation(r, err))
        return false;
    out_refs = r.refs;
    return true;
}

} // namespace sftpdesk
