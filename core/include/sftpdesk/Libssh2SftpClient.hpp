#pragma once
#include "SftpClient.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sftpdesk {

namespace detail {
struct Libssh2Connection;
}

// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Open RemoteFile handles share the connection so it outlives disconnect()
// until the last handle is closed.
class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions& opt, Error& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool keepAlive(Error& err) override;

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Error& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              Error& err) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                Error& err) override;

    std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                     OpenMode mode,
                                     Error& err) override;

    bool supportsOffsetWrite() const override { return true; }

    bool setTimes(const std::string& remote_path,
                  std::uint64_t atime,
                  std::uint64_t mtime,
                  Error& err) override;

    bool mkdir(const std::string& remote_dir,
               Error& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    Error& err) override;

    bool removeDir(const std::string& remote_dir,
                   Error& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                Error& err,
                bool overwrite = false) override;

    // Creates link_path pointing at target (OpenSSH argument order).
    bool symlink(const std::string& target,
                 const std::string& link_path,
                 Error& err);

    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                  Error& err) override;

private:
    bool connected_ = false;
    std::shared_ptr<detail::Libssh2Connection> conn_;

    bool tcpConnect(const std::string& host, std::uint16_t port,
                    int timeoutSeconds, Error& err);
    bool verifyHostKey(const SessionOptions& opt, Error& err);
    bool authenticate(const SessionOptions& opt, Error& err);
    bool requireConnection(Error& err) const;
};

} // namespace sftpdesk
