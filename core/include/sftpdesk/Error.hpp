// Error taxonomy shared by every layer. Operations return bool and fill an
// Error describing the failure (domain + code + human readable message).
#pragma once
#include <cstdint>
#include <string>

namespace sftpdesk {

enum class ErrorDomain { None, Vault, Store, Session, Transfer };

enum class ErrorCode {
    None,
    // Vault
    KeyMissing,
    DecryptFailed,
    // Store / Transfer
    NotFound,
    ValidationFailed,
    IOFailure,
    // Session
    AuthFailed,
    HostKeyMismatch,
    Timeout,
    ConnectionLost,
    Unsupported,
    // Transfer
    PermissionDenied,
    QuotaExceeded,
    Cancelled,
    RetryExhausted
};

struct Error {
    ErrorDomain domain = ErrorDomain::None;
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::string path;           // offending path, if any
    std::uint64_t offset = 0;   // last confirmed byte offset (transfers)

    bool ok() const { return code == ErrorCode::None; }
    void clear() { *this = Error{}; }

    bool is(ErrorDomain d, ErrorCode c) const { return domain == d && code == c; }

    // Only a dropped or unresponsive connection is worth retrying.
    bool isTransient() const {
        return domain == ErrorDomain::Session &&
               (code == ErrorCode::ConnectionLost || code == ErrorCode::Timeout);
    }

    std::string toString() const;

    static Error vault(ErrorCode c, std::string msg);
    static Error store(ErrorCode c, std::string msg);
    static Error session(ErrorCode c, std::string msg);
    static Error transfer(ErrorCode c, std::string msg, std::string path = {});
};

const char* errorDomainName(ErrorDomain d);
const char* errorCodeName(ErrorCode c);

} // namespace sftpdesk
