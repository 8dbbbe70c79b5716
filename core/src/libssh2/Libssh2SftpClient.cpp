// libssh2 backend: manages the TCP socket, SSH session and SFTP channel.
// Host identity is reported to SessionOptions::hostkey_verify_cb; the caller
// owns the known-hosts decision.
#include "sftpdesk/Libssh2SftpClient.hpp"
#include "sftpdesk/Log.hpp"
#include "sftpdesk/RemotePath.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftpdesk {

namespace detail {

struct Libssh2Connection {
    int sock = -1;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;

    ~Libssh2Connection() {
        if (sftp) {
            libssh2_sftp_shutdown(sftp);
            sftp = nullptr;
        }
        if (session) {
            libssh2_session_disconnect(session, "bye");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != -1) {
            ::close(sock);
            sock = -1;
        }
    }
};

} // namespace detail

namespace {

std::once_flag g_libssh2_once;

std::string lastSessionMessage(LIBSSH2_SESSION* s) {
    if (!s)
        return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

// Maps the last libssh2/SFTP failure onto the error taxonomy.
Error mapFailure(detail::Libssh2Connection* c, const char* what,
                 const std::string& path) {
    const int rc = c && c->session ? libssh2_session_last_errno(c->session) : 0;
    const std::string detailMsg = c ? lastSessionMessage(c->session) : std::string();
    const std::string base = detailMsg.empty()
                                 ? std::string(what)
                                 : std::string(what) + " (" + detailMsg + ")";
    switch (rc) {
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        return Error::session(ErrorCode::Timeout, base);
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        return Error::session(ErrorCode::ConnectionLost, base);
    default:
        break;
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && c && c->sftp) {
        const unsigned long fx = libssh2_sftp_last_error(c->sftp);
        switch (fx) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return Error::transfer(ErrorCode::NotFound, base, path);
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return Error::transfer(ErrorCode::PermissionDenied, base, path);
        case LIBSSH2_FX_QUOTA_EXCEEDED:
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
            return Error::transfer(ErrorCode::QuotaExceeded, base, path);
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return Error::session(ErrorCode::ConnectionLost, base);
        case LIBSSH2_FX_OP_UNSUPPORTED:
            return Error::session(ErrorCode::Unsupported, base);
        default:
            break;
        }
    }
    return Error::transfer(ErrorCode::IOFailure, base, path);
}

FileInfo fromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileInfo fi{};
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fi.mode = static_cast<std::uint32_t>(attrs.permissions);
        fi.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        fi.is_symlink = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    return fi;
}

const char* hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
#endif
    default: return "UNKNOWN";
    }
}

// Keyboard-interactive: answer every prompt with the password (or the
// username when the prompt asks for it).
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

void kbint_password_callback(const char* name, int name_len,
                             const char* instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    (void)name; (void)name_len; (void)instruction; (void)instruction_len;
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text),
                          prompts[i].length);
        for (char& ch : prompt)
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0)
            continue;
        char* buf = static_cast<char*>(std::malloc(alen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(alen);
    }
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<detail::Libssh2Connection> conn,
                      LIBSSH2_SFTP_HANDLE* h, std::string path)
        : conn_(std::move(conn)), handle_(h), path_(std::move(path)) {}

    ~Libssh2RemoteFile() override {
        if (handle_)
            libssh2_sftp_close(handle_);
    }

    bool read(char* buf, std::size_t len, std::size_t& got, Error& err) override {
        got = 0;
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            err = mapFailure(conn_.get(), "Remote read failed", path_);
            return false;
        }
        got = static_cast<std::size_t>(n);
        return true;
    }

    bool write(const char* buf, std::size_t len, Error& err) override {
        const char* p = buf;
        std::size_t remain = len;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(handle_, p, remain);
            if (w < 0) {
                err = mapFailure(conn_.get(), "Remote write failed", path_);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
        return true;
    }

    bool seek(std::uint64_t offset, Error& err) override {
        (void)err;
        libssh2_sftp_seek64(handle_, static_cast<libssh2_uint64_t>(offset));
        return true;
    }

private:
    std::shared_ptr<detail::Libssh2Connection> conn_;
    LIBSSH2_SFTP_HANDLE* handle_ = nullptr;
    std::string path_;
};

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, []() {
        const int rc = libssh2_init(0);
        if (rc != 0)
            LOGE("libssh2_init failed rc=%d", rc);
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::requireConnection(Error& err) const {
    if (!connected_ || !conn_ || !conn_->sftp) {
        err = Error::session(ErrorCode::ConnectionLost, "Not connected");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, std::uint16_t port,
                                   int timeoutSeconds, Error& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = Error::session(ErrorCode::ConnectionLost,
                             std::string("getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    bool timedOut = false;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the profile timeout bounds the attempt.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            const int pr = ::poll(&pfd, 1, timeoutSeconds * 1000);
            if (pr == 0) {
                timedOut = true;
                rc = -1;
            } else if (pr > 0) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = (soErr == 0) ? 0 : -1;
            } else {
                rc = -1;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            conn_->sock = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    if (timedOut) {
        err = Error::session(ErrorCode::Timeout,
                             "No response from host within " +
                                 std::to_string(timeoutSeconds) + "s");
    } else {
        err = Error::session(ErrorCode::ConnectionLost,
                             "Could not connect to host/port");
    }
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, Error& err) {
    std::size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(conn_->session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = Error::session(ErrorCode::HostKeyMismatch, "Could not obtain host key");
        return false;
    }

    HostKeyInfo info;
    info.host = opt.host;
    info.port = opt.port;
    info.algorithm = hostKeyAlgorithmName(keytype);
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(conn_->session, LIBSSH2_HOSTKEY_HASH_SHA256));
    const int hashLen = 32;
    const char* prefix = "SHA256:";
#else
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(conn_->session, LIBSSH2_HOSTKEY_HASH_SHA1));
    const int hashLen = 20;
    const char* prefix = "SHA1:";
#endif
    if (!h) {
        err = Error::session(ErrorCode::HostKeyMismatch, "Could not hash host key");
        return false;
    }
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    info.fingerprint = oss.str();

    if (!opt.hostkey_verify_cb)
        return true;
    std::string reason;
    if (!opt.hostkey_verify_cb(info, reason)) {
        LOGW("host key %s for %s rejected", info.fingerprint.c_str(),
             redacted(opt.host).c_str());
        err = Error::session(ErrorCode::HostKeyMismatch,
                             reason.empty() ? "Host key rejected" : reason);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, Error& err) {
    LIBSSH2_SESSION* s = conn_->session;
    if (opt.private_key_path.has_value()) {
        const char* passphrase =
            opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(s, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = Error::session(ErrorCode::AuthFailed,
                                 "Key authentication failed: " + lastSessionMessage(s));
            return false;
        }
        return true;
    }

    if (!opt.password.has_value()) {
        err = Error::session(ErrorCode::AuthFailed, "No credentials available");
        return false;
    }

    int rc_pw = libssh2_userauth_password(s, opt.username.c_str(), opt.password->c_str());
    if (rc_pw == 0)
        return true;
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = Error::session(ErrorCode::ConnectionLost,
                             "Server closed the connection after the password attempt");
        return false;
    }
    if (rc_pw == LIBSSH2_ERROR_TIMEOUT) {
        err = Error::session(ErrorCode::Timeout, "Password authentication timed out");
        return false;
    }

    // Password refused but the session is alive: some servers only offer
    // keyboard-interactive for password logins.
    char* methods = libssh2_userauth_list(s, opt.username.c_str(),
                                          static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
        void** abs = libssh2_session_abstract(s);
        if (abs)
            *abs = &ctx;
        int rc_kbd = libssh2_userauth_keyboard_interactive(s, opt.username.c_str(),
                                                           kbint_password_callback);
        if (abs)
            *abs = nullptr;
        if (rc_kbd == 0)
            return true;
    }
    err = Error::session(ErrorCode::AuthFailed,
                         "Password authentication failed" +
                             (authlist.empty() ? std::string()
                                               : " (methods: " + authlist + ")"));
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, Error& err) {
    if (connected_) {
        err = Error::session(ErrorCode::Unsupported, "Already connected");
        return false;
    }
    const int timeout = opt.timeout_seconds > 0 ? opt.timeout_seconds : 30;
    conn_ = std::make_shared<detail::Libssh2Connection>();
    if (!tcpConnect(opt.host, opt.port, timeout, err)) {
        conn_.reset();
        return false;
    }

    conn_->session = libssh2_session_init();
    if (!conn_->session) {
        err = Error::session(ErrorCode::ConnectionLost, "libssh2_session_init failed");
        conn_.reset();
        return false;
    }
    libssh2_session_set_blocking(conn_->session, 1);
    libssh2_session_set_timeout(conn_->session, static_cast<long>(timeout) * 1000);

    if (libssh2_session_handshake(conn_->session, conn_->sock) != 0) {
        err = mapFailure(conn_.get(), "SSH handshake failed", {});
        if (err.domain != ErrorDomain::Session)
            err = Error::session(ErrorCode::ConnectionLost, err.message);
        conn_.reset();
        return false;
    }

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        conn_.reset();
        return false;
    }

    conn_->sftp = libssh2_sftp_init(conn_->session);
    if (!conn_->sftp) {
        err = Error::session(ErrorCode::Unsupported, "Could not initialize SFTP subsystem");
        conn_.reset();
        return false;
    }

    LOGI("connected to %s:%u as %s", redacted(opt.host).c_str(),
         static_cast<unsigned>(opt.port), redacted(opt.username).c_str());
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (conn_ && conn_->sock != -1) {
        // Open handles may keep the connection object alive; make sure the
        // transport is dead for them as well.
        ::shutdown(conn_->sock, SHUT_RDWR);
    }
    conn_.reset();
    connected_ = false;
}

bool Libssh2SftpClient::keepAlive(Error& err) {
    if (!requireConnection(err))
        return false;
    int nextSecs = 0;
    if (libssh2_keepalive_send(conn_->session, &nextSecs) != 0) {
        err = mapFailure(conn_.get(), "keepalive send failed", {});
        if (err.domain != ErrorDomain::Session)
            err = Error::session(ErrorCode::ConnectionLost, err.message);
        return false;
    }
    // keepalive_send does not wait for a reply; a stat does.
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(conn_->sftp, ".", 1, LIBSSH2_SFTP_STAT, &st) != 0) {
        err = mapFailure(conn_.get(), "keepalive probe failed", ".");
        LOGW("keep-alive failed: %s", err.message.c_str());
        if (err.domain != ErrorDomain::Session)
            err = Error::session(ErrorCode::ConnectionLost, err.message);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             Error& err) {
    if (!requireConnection(err))
        return false;

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(conn_->sftp, path.c_str());
    if (!dir) {
        err = mapFailure(conn_.get(), "opendir failed", path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi = fromAttrs(attrs);
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            if (fi.is_symlink) {
                // Display attributes follow the link target.
                const std::string full = RemotePath::join(path, fi.name);
                LIBSSH2_SFTP_ATTRIBUTES target{};
                if (libssh2_sftp_stat_ex(conn_->sftp, full.c_str(),
                                         static_cast<unsigned>(full.size()),
                                         LIBSSH2_SFTP_STAT, &target) == 0) {
                    fi.is_dir = (target.permissions & LIBSSH2_SFTP_S_IFMT) ==
                                LIBSSH2_SFTP_S_IFDIR;
                }
            }
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = mapFailure(conn_.get(), "readdir failed", path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path,
                             FileInfo& info,
                             Error& err) {
    if (!requireConnection(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(conn_->sftp, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_LSTAT, &st);
    if (rc != 0) {
        err = mapFailure(conn_.get(), "stat failed", remote_path);
        return false;
    }
    info = fromAttrs(st);
    if (info.is_symlink) {
        // Type and size come from the target; a dangling link stays a plain link.
        LIBSSH2_SFTP_ATTRIBUTES target{};
        if (libssh2_sftp_stat_ex(conn_->sftp, remote_path.c_str(),
                                 static_cast<unsigned>(remote_path.size()),
                                 LIBSSH2_SFTP_STAT, &target) == 0) {
            info = fromAttrs(target);
            info.is_symlink = true;
        }
    }
    info.name = RemotePath::baseName(remote_path);
    return true;
}

bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               Error& err) {
    isDir = false;
    FileInfo info;
    Error e;
    if (stat(remote_path, info, e)) {
        isDir = info.is_dir;
        return true;
    }
    if (e.is(ErrorDomain::Transfer, ErrorCode::NotFound)) {
        err.clear();
        return false;
    }
    err = e;
    return false;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::open(const std::string& remote_path,
                                                    OpenMode mode,
                                                    Error& err) {
    if (!requireConnection(err))
        return nullptr;
    unsigned long flags = LIBSSH2_FXF_READ;
    long perms = 0;
    if (mode == OpenMode::WriteTruncate) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
        perms = 0644;
    } else if (mode == OpenMode::WriteKeep) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
        perms = 0644;
    }
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
        conn_->sftp, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        flags, perms, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = mapFailure(conn_.get(), "open failed", remote_path);
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(conn_, h, remote_path);
}

bool Libssh2SftpClient::setTimes(const std::string& remote_path,
                                 std::uint64_t atime,
                                 std::uint64_t mtime,
                                 Error& err) {
    if (!requireConnection(err))
        return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(atime);
    a.mtime = static_cast<unsigned long>(mtime);
    int rc = libssh2_sftp_stat_ex(conn_->sftp, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        err = mapFailure(conn_.get(), "setstat failed", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir,
                              Error& err,
                              unsigned int mode) {
    if (!requireConnection(err))
        return false;
    int rc = libssh2_sftp_mkdir(conn_->sftp, remote_dir.c_str(), static_cast<long>(mode));
    if (rc != 0) {
        err = mapFailure(conn_.get(), "mkdir failed", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   Error& err) {
    if (!requireConnection(err))
        return false;
    if (libssh2_sftp_unlink(conn_->sftp, remote_path.c_str()) != 0) {
        err = mapFailure(conn_.get(), "unlink failed", remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir,
                                  Error& err) {
    if (!requireConnection(err))
        return false;
    if (libssh2_sftp_rmdir(conn_->sftp, remote_dir.c_str()) != 0) {
        err = mapFailure(conn_.get(), "rmdir failed (directory not empty?)", remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               Error& err,
                               bool overwrite) {
    if (!requireConnection(err))
        return false;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(conn_->sftp,
                                    from.c_str(), static_cast<unsigned>(from.size()),
                                    to.c_str(), static_cast<unsigned>(to.size()),
                                    flags);
    if (rc != 0) {
        err = mapFailure(conn_.get(), "rename failed", from);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::symlink(const std::string& target,
                                const std::string& link_path,
                                Error& err) {
    if (!requireConnection(err))
        return false;
    std::string link = link_path;
    int rc = libssh2_sftp_symlink_ex(conn_->sftp,
                                     target.c_str(), static_cast<unsigned>(target.size()),
                                     &link[0], static_cast<unsigned>(link.size()),
                                     LIBSSH2_SFTP_SYMLINK);
    if (rc != 0) {
        err = mapFailure(conn_.get(), "symlink failed", link_path);
        return false;
    }
    return true;
}

std::unique_ptr<SftpClient> Libssh2SftpClient::newConnectionLike(const SessionOptions& opt,
                                                                 Error& err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err))
        return nullptr;
    return ptr;
}

} // namespace sftpdesk
