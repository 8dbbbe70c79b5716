#include "sftpdesk/Error.hpp"
#include <utility>

namespace sftpdesk {

const char* errorDomainName(ErrorDomain d) {
    switch (d) {
    case ErrorDomain::None: return "None";
    case ErrorDomain::Vault: return "VaultError";
    case ErrorDomain::Store: return "StoreError";
    case ErrorDomain::Session: return "SessionError";
    case ErrorDomain::Transfer: return "TransferError";
    }
    return "Unknown";
}

const char* errorCodeName(ErrorCode c) {
    switch (c) {
    case ErrorCode::None: return "None";
    case ErrorCode::KeyMissing: return "KeyMissing";
    case ErrorCode::DecryptFailed: return "DecryptFailed";
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::ValidationFailed: return "ValidationFailed";
    case ErrorCode::IOFailure: return "IOFailure";
    case ErrorCode::AuthFailed: return "AuthFailed";
    case ErrorCode::HostKeyMismatch: return "HostKeyMismatch";
    case ErrorCode::Timeout: return "Timeout";
    case ErrorCode::ConnectionLost: return "ConnectionLost";
    case ErrorCode::Unsupported: return "Unsupported";
    case ErrorCode::PermissionDenied: return "PermissionDenied";
    case ErrorCode::QuotaExceeded: return "QuotaExceeded";
    case ErrorCode::Cancelled: return "Cancelled";
    case ErrorCode::RetryExhausted: return "RetryExhausted";
    }
    return "Unknown";
}

std::string Error::toString() const {
    if (ok())
        return "ok";
    std::string out = std::string(errorDomainName(domain)) + "." +
                      errorCodeName(code);
    if (!message.empty())
        out += ": " + message;
    if (!path.empty())
        out += " [" + path + "]";
    if (offset > 0)
        out += " @" + std::to_string(offset);
    return out;
}

Error Error::vault(ErrorCode c, std::string msg) {
    Error e;
    e.domain = ErrorDomain::Vault;
    e.code = c;
    e.message = std::move(msg);
    return e;
}

Error Error::store(ErrorCode c, std::string msg) {
    Error e;
    e.domain = ErrorDomain::Store;
    e.code = c;
    e.message = std::move(msg);
    return e;
}

Error Error::session(ErrorCode c, std::string msg) {
    Error e;
    e.domain = ErrorDomain::Session;
    e.code = c;
    e.message = std::move(msg);
    return e;
}

Error Error::transfer(ErrorCode c, std::string msg, std::string path) {
    Error e;
    e.domain = ErrorDomain::Transfer;
    e.code = c;
    e.message = std::move(msg);
    e.path = std::move(path);
    return e;
}

} // namespace sftpdesk
