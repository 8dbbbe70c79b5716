#include "ServiceTypes.hpp"
#include <algorithm>
#include <cctype>

namespace sftpdesk {

const char* sessionStateName(SessionState s) {
    switch (s) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Connecting:
        return "Connecting";
    case SessionState::Connected:
        return "Connected";
    case SessionState::Reconnecting:
        return "Reconnecting";
    case SessionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* jobKindName(JobKind k) {
    switch (k) {
    case JobKind::UploadFile:
        return "UploadFile";
    case JobKind::DownloadFile:
        return "DownloadFile";
    case JobKind::UploadDir:
        return "UploadDir";
    case JobKind::DownloadDir:
        return "DownloadDir";
    case JobKind::Delete:
        return "Delete";
    case JobKind::Mkdir:
        return "Mkdir";
    }
    return "Unknown";
}

const char* jobStateName(JobState s) {
    switch (s) {
    case JobState::Queued:
        return "Queued";
    case JobState::Running:
        return "Running";
    case JobState::Paused:
        return "Paused";
    case JobState::AwaitingDecision:
        return "AwaitingDecision";
    case JobState::Completed:
        return "Completed";
    case JobState::Failed:
        return "Failed";
    case JobState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char* overwritePolicyName(OverwritePolicy p) {
    switch (p) {
    case OverwritePolicy::Skip:
        return "Skip";
    case OverwritePolicy::Overwrite:
        return "Overwrite";
    case OverwritePolicy::Rename:
        return "Rename";
    case OverwritePolicy::Prompt:
        return "Prompt";
    }
    return "Unknown";
}

bool parseOverwritePolicy(const std::string& text, OverwritePolicy& out) {
    std::string v = text;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "skip")
        out = OverwritePolicy::Skip;
    else if (v == "overwrite")
        out = OverwritePolicy::Overwrite;
    else if (v == "rename")
        out = OverwritePolicy::Rename;
    else if (v == "prompt")
        out = OverwritePolicy::Prompt;
    else
        return false;
    return true;
}

} // namespace sftpdesk
