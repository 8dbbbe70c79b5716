// Value types shared by the service components. Jobs and entries are handed
// out as snapshots; only the owning component mutates the originals.
#pragma once
#include "sftpdesk/Error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sftpdesk {

enum class SessionState { Disconnected, Connecting, Connected, Reconnecting, Failed };

enum class JobKind { UploadFile, DownloadFile, UploadDir, DownloadDir, Delete, Mkdir };

enum class JobState {
    Queued,
    Running,
    Paused,
    AwaitingDecision,  // Prompt overwrite policy, waiting for resolveOverwrite()
    Completed,
    Failed,
    Cancelled
};

// Side a Mkdir/Delete job acts on. Transfers always know their sides.
enum class JobTarget { Remote, Local };

enum class OverwritePolicy { Skip, Overwrite, Rename, Prompt };
enum class OverwriteDecision { Skip, Overwrite, Rename };

const char* sessionStateName(SessionState s);
const char* jobKindName(JobKind k);
const char* jobStateName(JobState s);
const char* overwritePolicyName(OverwritePolicy p);
bool parseOverwritePolicy(const std::string& text, OverwritePolicy& out);

inline bool isTerminal(JobState s) {
    return s == JobState::Completed || s == JobState::Failed || s == JobState::Cancelled;
}

inline bool isDirectoryKind(JobKind k) {
    return k == JobKind::UploadDir || k == JobKind::DownloadDir;
}

// Outcome of one job produced by a directory expansion.
struct ChildOutcome {
    std::uint64_t job_id = 0;
    JobKind kind = JobKind::UploadFile;
    std::string path;       // destination path
    JobState state = JobState::Queued;
    bool skipped = false;
    Error error;
};

struct TransferJob {
    std::uint64_t id = 0;
    std::uint64_t session_id = 0;
    std::uint64_t parent_id = 0;  // directory job that produced this one
    std::uint64_t after_id = 0;   // must reach a terminal state first (Mkdir)
    JobKind kind = JobKind::UploadFile;
    JobTarget target = JobTarget::Remote;
    std::string source_path;
    std::string dest_path;
    JobState state = JobState::Queued;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_done = 0;
    int retry_count = 0;
    bool skipped = false;           // finished without copying (Skip policy)
    bool follow_symlinks = false;
    std::optional<OverwritePolicy> overwrite_policy;  // unset: engine default
    Error error;                    // cause + last confirmed offset on failure
    std::vector<ChildOutcome> children;
};

// What a caller hands to TransferEngine::enqueue.
struct TransferRequest {
    JobKind kind = JobKind::UploadFile;
    std::string source_path;
    std::string dest_path;          // Delete/Mkdir: the path acted on
    JobTarget target = JobTarget::Remote;
    bool follow_symlinks = false;
    std::optional<OverwritePolicy> overwrite_policy;
};

struct DirectoryEntry {
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
    std::uint64_t size = 0;
    std::uint64_t modified_time = 0;  // epoch seconds
    std::uint32_t permissions = 0;    // POSIX mode bits
};

} // namespace sftpdesk
