// Named connection parameters. Secrets never appear here in clear text:
// secret_ref / passphrase_ref hold CredentialVault references.
#pragma once
#include <cstdint>
#include <string>

namespace sftpdesk {

enum class AuthMethod { Password, PrivateKey };

inline const char* authMethodName(AuthMethod m) {
    return m == AuthMethod::Password ? "password" : "private_key";
}

inline bool parseAuthMethod(const std::string& text, AuthMethod& out) {
    if (text == "password") {
        out = AuthMethod::Password;
        return true;
    }
    if (text == "private_key" || text == "key") {
        out = AuthMethod::PrivateKey;
        return true;
    }
    return false;
}

struct ConnectionProfile {
    std::string name;  // unique key
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    AuthMethod auth_method = AuthMethod::Password;
    std::string secret_ref;       // Password auth
    std::string key_path;         // PrivateKey auth
    std::string passphrase_ref;   // optional, encrypted private key
    std::string description;
    int timeout_seconds = 0;              // 0: connection.timeout_seconds
    int keep_alive_interval_seconds = 0;  // 0: connection.keep_alive_interval_seconds

    bool operator==(const ConnectionProfile& o) const {
        return name == o.name && host == o.host && port == o.port &&
               username == o.username && auth_method == o.auth_method &&
               secret_ref == o.secret_ref && key_path == o.key_path &&
               passphrase_ref == o.passphrase_ref && description == o.description &&
               timeout_seconds == o.timeout_seconds &&
               keep_alive_interval_seconds == o.keep_alive_interval_seconds;
    }
    bool operator!=(const ConnectionProfile& o) const { return !(*this == o); }
};

} // namespace sftpdesk
