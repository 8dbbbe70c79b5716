#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sftpdesk {

// In-memory remote filesystem shared by every MockSftpClient connected to it.
// Besides the file tree it carries the fault switches used by the tests:
// connection drops after N writes/reads, failing keep-alive probes, forced
// errors per path and an unreachable-server flag.
class MockSftpServer {
public:
  MockSftpServer();

  // Tree setup / inspection
  void addDir(const std::string& path);
  void addFile(const std::string& path, const std::string& data, std::uint64_t mtime = 1700000000);
  void addSymlink(const std::string& path, const std::string& target);
  bool readFile(const std::string& path, std::string& out) const;
  bool hasPath(const std::string& path) const;

  // Identity / authentication
  void setHostKey(const std::string& algorithm, const std::string& fingerprint);
  void setExpectedPassword(std::optional<std::string> password);
  void setExpectedKeyPath(std::optional<std::string> keyPath);
  void setOffsetWriteSupported(bool on);
  bool offsetWriteSupported() const;

  // Faults
  void dropAfterWrites(int n);   // the (n+1)-th write drops every connection
  void dropAfterReads(int n);
  void dropConnections();
  void setAvailable(bool up);    // false: connect attempts fail
  void failProbes(int n);        // next n keep-alive probes time out
  void failOn(const std::string& path, const Error& e);
  void clearFailures();
  void setIoDelayMs(int ms);     // per read/write call

  // Counters
  int connectCount() const { return connects_.load(); }
  int writeCount() const { return writes_.load(); }
  // Successful mkdir and write-open calls, in server order ("mkdir /a", "open /a/f").
  std::vector<std::string> mutationLog() const;

private:
  friend class MockSftpClient;
  friend class MockRemoteFile;

  struct Node {
    FileInfo info;
    std::string data;
    std::string link_target;
  };

  mutable std::mutex mu_;
  std::map<std::string, Node> nodes_;
  std::map<std::string, Error> forced_;
  std::vector<std::string> mutations_;
  std::string hostAlg_ = "ED25519";
  std::string hostFp_ = "SHA256:00:11:22:33:44:55:66:77:88:99:AA:BB:CC:DD:EE:FF:"
                        "00:11:22:33:44:55:66:77:88:99:AA:BB:CC:DD:EE:FF";
  std::optional<std::string> expectedPassword_;
  std::optional<std::string> expectedKeyPath_;
  bool offsetWrite_ = true;
  bool available_ = true;
  int dropWritesAfter_ = -1;
  int dropReadsAfter_ = -1;
  int probeFailures_ = 0;
  int ioDelayMs_ = 0;
  std::uint64_t epoch_ = 1;
  std::atomic<int> connects_{0};
  std::atomic<int> writes_{0};

  // Helpers below expect mu_ to be held.
  const Node* resolveLocked(const std::string& path) const;
  bool forcedLocked(const std::string& path, Error& err) const;
  void addDirLocked(const std::string& path);
  void ioDelay() const;
};

// Test/development backend. Every operation works against the shared
// MockSftpServer; a dropped connection is only recovered by connecting a new
// client (newConnectionLike), as with a real transport.
class MockSftpClient : public SftpClient {
public:
  explicit MockSftpClient(std::shared_ptr<MockSftpServer> server = std::make_shared<MockSftpServer>());

  bool connect(const SessionOptions& opt, Error& err) override;
  void disconnect() override;
  bool isConnected() const override;

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
  bool supportsOffsetWrite() const override;

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

  std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                Error& err) override;

  const std::shared_ptr<MockSftpServer>& server() const { return server_; }

private:
  std::shared_ptr<MockSftpServer> server_;
  bool connected_ = false;
  std::uint64_t epoch_ = 0;
  SessionOptions lastOpt_{};

  // Requires server_->mu_ held.
  bool aliveLocked(Error& err) const;
};

} // namespace sftpdesk
