#include "sftpdesk/MockSftpClient.hpp"
#include "sftpdesk/RemotePath.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace sftpdesk {

namespace {

FileInfo makeInfo(const std::string& path, bool dir, std::uint64_t size, std::uint64_t mtime) {
  FileInfo fi;
  fi.name = RemotePath::baseName(path);
  fi.is_dir = dir;
  fi.size = size;
  fi.mtime = mtime;
  fi.mode = dir ? (0040000u | 0755u) : (0100000u | 0644u);
  fi.uid = 1000;
  fi.gid = 1000;
  return fi;
}

Error lostError() {
  return Error::session(ErrorCode::ConnectionLost, "Connection reset by peer");
}

} // namespace

// ---------------------------------------------------------------------------
// MockSftpServer

MockSftpServer::MockSftpServer() {
  // Small seeded tree so listings work out of the box
  addDirLocked("/");
  addDirLocked("/home");
  addDirLocked("/home/alice");
  addDirLocked("/home/alice/projects");
  addDirLocked("/home/guest");
  addDirLocked("/var");
  addDirLocked("/var/log");
  nodes_["/readme.txt"] = Node{makeInfo("/readme.txt", false, 1280, 1700000000), std::string(1280, 'r'), {}};
  nodes_["/home/notes.md"] = Node{makeInfo("/home/notes.md", false, 2048, 1700000000), std::string(2048, 'n'), {}};
  nodes_["/home/alice/photo.jpg"] = Node{makeInfo("/home/alice/photo.jpg", false, 34567, 1700000000), std::string(34567, 'p'), {}};
}

void MockSftpServer::addDirLocked(const std::string& path) {
  const std::string p = RemotePath::normalize(path);
  if (nodes_.count(p)) return;
  if (p != "/") addDirLocked(RemotePath::parent(p));
  nodes_[p] = Node{makeInfo(p, true, 0, 1700000000), {}, {}};
}

void MockSftpServer::addDir(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  addDirLocked(path);
}

void MockSftpServer::addFile(const std::string& path, const std::string& data, std::uint64_t mtime) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string p = RemotePath::normalize(path);
  addDirLocked(RemotePath::parent(p));
  nodes_[p] = Node{makeInfo(p, false, data.size(), mtime), data, {}};
}

void MockSftpServer::addSymlink(const std::string& path, const std::string& target) {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string p = RemotePath::normalize(path);
  addDirLocked(RemotePath::parent(p));
  Node n{makeInfo(p, false, 0, 1700000000), {}, RemotePath::normalize(target)};
  n.info.is_symlink = true;
  n.info.mode = 0120000u | 0777u;
  nodes_[p] = n;
}

bool MockSftpServer::readFile(const std::string& path, std::string& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  const Node* n = resolveLocked(path);
  if (!n || n->info.is_dir) return false;
  out = n->data;
  return true;
}

bool MockSftpServer::hasPath(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  return nodes_.count(RemotePath::normalize(path)) > 0;
}

void MockSftpServer::setHostKey(const std::string& algorithm, const std::string& fingerprint) {
  std::lock_guard<std::mutex> lk(mu_);
  hostAlg_ = algorithm;
  hostFp_ = fingerprint;
}

void MockSftpServer::setExpectedPassword(std::optional<std::string> password) {
  std::lock_guard<std::mutex> lk(mu_);
  expectedPassword_ = std::move(password);
}

void MockSftpServer::setExpectedKeyPath(std::optional<std::string> keyPath) {
  std::lock_guard<std::mutex> lk(mu_);
  expectedKeyPath_ = std::move(keyPath);
}

void MockSftpServer::setOffsetWriteSupported(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  offsetWrite_ = on;
}

bool MockSftpServer::offsetWriteSupported() const {
  std::lock_guard<std::mutex> lk(mu_);
  return offsetWrite_;
}

void MockSftpServer::dropAfterWrites(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  dropWritesAfter_ = n;
}

void MockSftpServer::dropAfterReads(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  dropReadsAfter_ = n;
}

void MockSftpServer::dropConnections() {
  std::lock_guard<std::mutex> lk(mu_);
  ++epoch_;
}

void MockSftpServer::setAvailable(bool up) {
  std::lock_guard<std::mutex> lk(mu_);
  available_ = up;
}

void MockSftpServer::failProbes(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  probeFailures_ = n;
}

void MockSftpServer::failOn(const std::string& path, const Error& e) {
  std::lock_guard<std::mutex> lk(mu_);
  Error copy = e;
  copy.path = RemotePath::normalize(path);
  forced_[copy.path] = copy;
}

void MockSftpServer::clearFailures() {
  std::lock_guard<std::mutex> lk(mu_);
  forced_.clear();
  dropWritesAfter_ = -1;
  dropReadsAfter_ = -1;
  probeFailures_ = 0;
}

void MockSftpServer::setIoDelayMs(int ms) {
  std::lock_guard<std::mutex> lk(mu_);
  ioDelayMs_ = ms;
}

std::vector<std::string> MockSftpServer::mutationLog() const {
  std::lock_guard<std::mutex> lk(mu_);
  return mutations_;
}

void MockSftpServer::ioDelay() const {
  int ms = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ms = ioDelayMs_;
  }
  if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

const MockSftpServer::Node* MockSftpServer::resolveLocked(const std::string& path) const {
  std::string p = RemotePath::normalize(path);
  for (int hops = 0; hops < 8; ++hops) {
    auto it = nodes_.find(p);
    if (it == nodes_.end()) return nullptr;
    if (it->second.link_target.empty()) return &it->second;
    p = it->second.link_target;
  }
  return nullptr;  // link loop
}

bool MockSftpServer::forcedLocked(const std::string& path, Error& err) const {
  auto it = forced_.find(RemotePath::normalize(path));
  if (it == forced_.end()) return false;
  err = it->second;
  return true;
}

// ---------------------------------------------------------------------------
// MockRemoteFile

class MockRemoteFile : public RemoteFile {
public:
  MockRemoteFile(std::shared_ptr<MockSftpServer> server, std::string path, std::uint64_t epoch)
    : server_(std::move(server)), path_(std::move(path)), epoch_(epoch) {}

  bool read(char* buf, std::size_t len, std::size_t& got, Error& err) override {
    got = 0;
    server_->ioDelay();
    std::lock_guard<std::mutex> lk(server_->mu_);
    if (server_->epoch_ != epoch_) { err = lostError(); return false; }
    if (server_->dropReadsAfter_ == 0) {
      server_->dropReadsAfter_ = -1;
      ++server_->epoch_;
      err = lostError();
      return false;
    }
    if (server_->forcedLocked(path_, err)) return false;
    const MockSftpServer::Node* n = server_->resolveLocked(path_);
    if (!n) { err = Error::transfer(ErrorCode::NotFound, "No such file", path_); return false; }
    if (pos_ < n->data.size()) {
      got = std::min<std::size_t>(len, n->data.size() - static_cast<std::size_t>(pos_));
      std::memcpy(buf, n->data.data() + pos_, got);
      pos_ += got;
    }
    if (server_->dropReadsAfter_ > 0) --server_->dropReadsAfter_;
    return true;
  }

  bool write(const char* buf, std::size_t len, Error& err) override {
    server_->ioDelay();
    std::lock_guard<std::mutex> lk(server_->mu_);
    if (server_->epoch_ != epoch_) { err = lostError(); return false; }
    if (server_->dropWritesAfter_ == 0) {
      server_->dropWritesAfter_ = -1;
      ++server_->epoch_;
      err = lostError();
      return false;
    }
    if (server_->forcedLocked(path_, err)) return false;
    auto it = server_->nodes_.find(path_);
    if (it == server_->nodes_.end()) {
      err = Error::transfer(ErrorCode::NotFound, "File vanished", path_);
      return false;
    }
    std::string& data = it->second.data;
    if (data.size() < pos_ + len) data.resize(static_cast<std::size_t>(pos_ + len), '\0');
    std::memcpy(&data[static_cast<std::size_t>(pos_)], buf, len);
    pos_ += len;
    it->second.info.size = data.size();
    if (server_->dropWritesAfter_ > 0) --server_->dropWritesAfter_;
    ++server_->writes_;
    return true;
  }

  bool seek(std::uint64_t offset, Error& err) override {
    std::lock_guard<std::mutex> lk(server_->mu_);
    if (server_->epoch_ != epoch_) { err = lostError(); return false; }
    pos_ = offset;
    return true;
  }

private:
  std::shared_ptr<MockSftpServer> server_;
  std::string path_;
  std::uint64_t epoch_;
  std::uint64_t pos_ = 0;
};

// ---------------------------------------------------------------------------
// MockSftpClient

MockSftpClient::MockSftpClient(std::shared_ptr<MockSftpServer> server)
  : server_(std::move(server)) {}

bool MockSftpClient::aliveLocked(Error& err) const {
  if (!connected_ || server_->epoch_ != epoch_) {
    err = connected_ ? lostError() : Error::session(ErrorCode::ConnectionLost, "Not connected");
    return false;
  }
  return true;
}

bool MockSftpClient::connect(const SessionOptions& opt, Error& err) {
  if (opt.host.empty() || opt.username.empty()) {
    err = Error::session(ErrorCode::AuthFailed, "Host and user are required");
    return false;
  }
  HostKeyInfo key;
  {
    std::lock_guard<std::mutex> lk(server_->mu_);
    if (!server_->available_) {
      err = Error::session(ErrorCode::ConnectionLost, "Connection refused");
      return false;
    }
    key.host = opt.host;
    key.port = opt.port;
    key.algorithm = server_->hostAlg_;
    key.fingerprint = server_->hostFp_;
  }
  // The verify callback may take its own locks; call it unlocked.
  if (opt.hostkey_verify_cb) {
    std::string reason;
    if (!opt.hostkey_verify_cb(key, reason)) {
      err = Error::session(ErrorCode::HostKeyMismatch, reason.empty() ? "Host key rejected" : reason);
      return false;
    }
  }
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (opt.private_key_path) {
    if (server_->expectedKeyPath_ && *server_->expectedKeyPath_ != *opt.private_key_path) {
      err = Error::session(ErrorCode::AuthFailed, "Public key rejected");
      return false;
    }
  } else if (server_->expectedPassword_ &&
             (!opt.password || *opt.password != *server_->expectedPassword_)) {
    err = Error::session(ErrorCode::AuthFailed, "Password authentication failed");
    return false;
  }
  connected_ = true;
  epoch_ = server_->epoch_;
  lastOpt_ = opt;
  ++server_->connects_;
  return true;
}

void MockSftpClient::disconnect() {
  connected_ = false;
}

bool MockSftpClient::isConnected() const {
  std::lock_guard<std::mutex> lk(server_->mu_);
  return connected_ && server_->epoch_ == epoch_;
}

bool MockSftpClient::keepAlive(Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  if (server_->probeFailures_ > 0) {
    --server_->probeFailures_;
    err = Error::session(ErrorCode::Timeout, "Keep-alive probe got no response");
    return false;
  }
  return true;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string path = RemotePath::normalize(remote_path.empty() ? "/" : remote_path);
  if (server_->forcedLocked(path, err)) return false;
  const MockSftpServer::Node* dir = server_->resolveLocked(path);
  if (!dir) {
    err = Error::transfer(ErrorCode::NotFound, "No such directory", path);
    return false;
  }
  if (!dir->info.is_dir) {
    err = Error::transfer(ErrorCode::IOFailure, "Not a directory", path);
    return false;
  }
  // A symlinked directory lists its target's children.
  std::string realPath = path;
  for (auto it = server_->nodes_.find(realPath);
       it != server_->nodes_.end() && !it->second.link_target.empty();
       it = server_->nodes_.find(realPath)) {
    realPath = it->second.link_target;
  }

  out.clear();
  for (const auto& kv : server_->nodes_) {
    if (kv.first == "/" || RemotePath::parent(kv.first) != realPath) continue;
    FileInfo fi = kv.second.info;
    if (!kv.second.link_target.empty()) {
      const MockSftpServer::Node* target = server_->resolveLocked(kv.first);
      fi.is_dir = target && target->info.is_dir;
    }
    out.push_back(fi);
  }
  return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string path = RemotePath::normalize(remote_path);
  if (server_->forcedLocked(path, err)) return false;
  const MockSftpServer::Node* n = server_->resolveLocked(path);
  if (!n) {
    err = Error::transfer(ErrorCode::NotFound, "No such file", path);
    return false;
  }
  info = n->info;
  info.name = RemotePath::baseName(path);
  info.is_symlink = !server_->nodes_.at(path).link_target.empty();
  return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
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

std::unique_ptr<RemoteFile> MockSftpClient::open(const std::string& remote_path,
                                                 OpenMode mode,
                                                 Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return nullptr;
  const std::string path = RemotePath::normalize(remote_path);
  if (server_->forcedLocked(path, err)) return nullptr;
  auto it = server_->nodes_.find(path);
  if (mode == OpenMode::Read) {
    const MockSftpServer::Node* n = server_->resolveLocked(path);
    if (!n) {
      err = Error::transfer(ErrorCode::NotFound, "No such file", path);
      return nullptr;
    }
    if (n->info.is_dir) {
      err = Error::transfer(ErrorCode::IOFailure, "Is a directory", path);
      return nullptr;
    }
  } else {
    const MockSftpServer::Node* parent = server_->resolveLocked(RemotePath::parent(path));
    if (!parent || !parent->info.is_dir) {
      err = Error::transfer(ErrorCode::NotFound, "Parent directory does not exist", path);
      return nullptr;
    }
    if (it != server_->nodes_.end() && it->second.info.is_dir) {
      err = Error::transfer(ErrorCode::IOFailure, "Is a directory", path);
      return nullptr;
    }
    if (it == server_->nodes_.end()) {
      server_->nodes_[path] = MockSftpServer::Node{makeInfo(path, false, 0, 0), {}, {}};
    } else if (mode == OpenMode::WriteTruncate) {
      it->second.data.clear();
      it->second.info.size = 0;
    }
    server_->mutations_.push_back("open " + path);
  }
  return std::make_unique<MockRemoteFile>(server_, path, epoch_);
}

bool MockSftpClient::supportsOffsetWrite() const {
  return server_->offsetWriteSupported();
}

bool MockSftpClient::setTimes(const std::string& remote_path,
                              std::uint64_t atime,
                              std::uint64_t mtime,
                              Error& err) {
  (void)atime;
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  auto it = server_->nodes_.find(RemotePath::normalize(remote_path));
  if (it == server_->nodes_.end()) {
    err = Error::transfer(ErrorCode::NotFound, "No such file", remote_path);
    return false;
  }
  it->second.info.mtime = mtime;
  return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           Error& err,
                           unsigned int mode) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string path = RemotePath::normalize(remote_dir);
  if (server_->forcedLocked(path, err)) return false;
  if (server_->nodes_.count(path)) {
    err = Error::transfer(ErrorCode::IOFailure, "Already exists", path);
    return false;
  }
  const MockSftpServer::Node* parent = server_->resolveLocked(RemotePath::parent(path));
  if (!parent || !parent->info.is_dir) {
    err = Error::transfer(ErrorCode::NotFound, "Parent directory does not exist", path);
    return false;
  }
  MockSftpServer::Node n{makeInfo(path, true, 0, 1700000000), {}, {}};
  n.info.mode = 0040000u | (mode & 07777u);
  server_->nodes_[path] = n;
  server_->mutations_.push_back("mkdir " + path);
  return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string path = RemotePath::normalize(remote_path);
  if (server_->forcedLocked(path, err)) return false;
  auto it = server_->nodes_.find(path);
  if (it == server_->nodes_.end()) {
    err = Error::transfer(ErrorCode::NotFound, "No such file", path);
    return false;
  }
  if (it->second.info.is_dir) {
    err = Error::transfer(ErrorCode::IOFailure, "Is a directory", path);
    return false;
  }
  server_->nodes_.erase(it);
  return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               Error& err) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string path = RemotePath::normalize(remote_dir);
  if (server_->forcedLocked(path, err)) return false;
  auto it = server_->nodes_.find(path);
  if (it == server_->nodes_.end()) {
    err = Error::transfer(ErrorCode::NotFound, "No such directory", path);
    return false;
  }
  if (!it->second.info.is_dir || path == "/") {
    err = Error::transfer(ErrorCode::IOFailure, "Not a removable directory", path);
    return false;
  }
  for (const auto& kv : server_->nodes_) {
    if (kv.first != path && RemotePath::parent(kv.first) == path) {
      err = Error::transfer(ErrorCode::IOFailure, "Directory not empty", path);
      return false;
    }
  }
  server_->nodes_.erase(it);
  return true;
}

bool MockSftpClient::rename(const std::string& from,
                            const std::string& to,
                            Error& err,
                            bool overwrite) {
  std::lock_guard<std::mutex> lk(server_->mu_);
  if (!aliveLocked(err)) return false;
  const std::string src = RemotePath::normalize(from);
  const std::string dst = RemotePath::normalize(to);
  if (server_->forcedLocked(src, err)) return false;
  if (!server_->nodes_.count(src)) {
    err = Error::transfer(ErrorCode::NotFound, "No such file", src);
    return false;
  }
  if (server_->nodes_.count(dst)) {
    if (!overwrite) {
      err = Error::transfer(ErrorCode::IOFailure, "Destination exists", dst);
      return false;
    }
    server_->nodes_.erase(dst);
  }
  // Move the node and everything below it.
  std::vector<std::pair<std::string, MockSftpServer::Node>> moved;
  const std::string prefix = src + "/";
  for (auto it = server_->nodes_.begin(); it != server_->nodes_.end();) {
    if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
      moved.emplace_back(dst + it->first.substr(src.size()), it->second);
      it = server_->nodes_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& m : moved) {
    m.second.info.name = RemotePath::baseName(m.first);
    server_->nodes_[m.first] = m.second;
  }
  return true;
}

std::unique_ptr<SftpClient> MockSftpClient::newConnectionLike(const SessionOptions& opt,
                                                              Error& err) {
  auto ptr = std::make_unique<MockSftpClient>(server_);
  if (!ptr->connect(opt, err)) return nullptr;
  return ptr;
}

} // namespace sftpdesk
