// Abstract interface for SFTP operations. Concrete backends (libssh2, mock)
// implement it so the service layer never depends on a specific library.
// Instances are not thread-safe: callers serialize access (see Session).
#pragma once
#include "Error.hpp"
#include "SftpTypes.hpp"
#include <cstddef>
#include <memory>

namespace sftpdesk {

// Open handle on a remote file. Handles stay valid (but may fail with
// ConnectionLost) after the owning client disconnects.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Reads up to len bytes; got == 0 signals end of file.
    virtual bool read(char* buf, std::size_t len, std::size_t& got, Error& err) = 0;
    // Writes the whole buffer or fails.
    virtual bool write(const char* buf, std::size_t len, Error& err) = 0;
    virtual bool seek(std::uint64_t offset, Error& err) = 0;
};

enum class OpenMode {
    Read,
    WriteTruncate,  // create or truncate
    WriteKeep       // create if missing, keep existing bytes (resume)
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, Error& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Liveness round-trip. Fails with Session Timeout/ConnectionLost.
    virtual bool keepAlive(Error& err) = 0;

    // Remote directory listing (unsorted, without "." and "..")
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      Error& err) = 0;

    // Detailed metadata. Missing paths fail with Transfer NotFound. Symlinks
    // are not followed for is_symlink; the other fields describe the target.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      Error& err) = 0;

    // Check existence (returns false with err cleared when it does not exist)
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        Error& err) = 0;

    virtual std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                             OpenMode mode,
                                             Error& err) = 0;

    // Whether an upload can continue at an offset instead of restarting.
    virtual bool supportsOffsetWrite() const = 0;

    // Adjust remote times (atime/mtime) if the server supports it
    virtual bool setTimes(const std::string& remote_path,
                          std::uint64_t atime,
                          std::uint64_t mtime,
                          Error& err) = 0;

    // Remote file/folder operations
    virtual bool mkdir(const std::string& remote_dir,
                       Error& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            Error& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           Error& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        Error& err,
                        bool overwrite = false) = 0;

    // Create a new connection of the same type with the given options.
    virtual std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions& opt,
                                                          Error& err) = 0;
};

} // namespace sftpdesk
