// Transfer queue: per-session worker pools executing chunked uploads and
// downloads, with pause/cancel at chunk boundaries and retry across
// reconnects.
#include "TransferEngine.hpp"
#include "SessionManager.hpp"
#include "sftpdesk/RemotePath.hpp"
#include "sftpdesk/SftpClient.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSet>
#include <algorithm>
#include <deque>
#include <tuple>

Q_LOGGING_CATEGORY(sdXfer, "sftpdesk.transfer")

namespace sftpdesk {

namespace {

// Recursion guard for followed symlinks on the remote side.
constexpr int kMaxRemoteDepth = 64;

std::string renamedPath(const std::string& path, int n) {
    const auto slash = path.find_last_of('/');
    const std::string dir = slash == std::string::npos ? std::string() : path.substr(0, slash + 1);
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const auto dot = name.find_last_of('.');
    const std::string suffix = " (" + std::to_string(n) + ")";
    if (dot == std::string::npos || dot == 0)
        return dir + name + suffix;
    return dir + name.substr(0, dot) + suffix + name.substr(dot);
}

Error localFileError(const QFile& f, const std::string& path, const char* what, bool reading) {
    const std::string msg = std::string(what) + ": " + f.errorString().toStdString();
    switch (f.error()) {
    case QFileDevice::PermissionsError:
        return Error::transfer(ErrorCode::PermissionDenied, msg, path);
    case QFileDevice::ResourceError:
        return Error::transfer(ErrorCode::QuotaExceeded, msg, path);
    default:
        break;
    }
    if (reading && !QFileInfo::exists(QString::fromStdString(path)))
        return Error::transfer(ErrorCode::NotFound, "No such local file", path);
    return Error::transfer(ErrorCode::IOFailure, msg, path);
}

Event jobEvent(EventKind kind, const TransferJob& job) {
    Event e;
    e.kind = kind;
    e.session_id = job.session_id;
    e.job_id = job.id;
    e.job_state = job.state;
    e.bytes_done = job.bytes_done;
    e.bytes_total = job.bytes_total;
    e.path = job.dest_path;
    e.error = job.error;
    return e;
}

std::chrono::milliseconds retryDelay(int retry) {
    const int shift = std::min(std::max(retry - 1, 0), 5);
    return std::min(std::chrono::milliseconds(100 * (1 << shift)), std::chrono::milliseconds(2000));
}

} // namespace

TransferEngine::TransferEngine(EventBus& bus, TransferSettings settings)
    : bus_(bus), settings_(settings), hook_(std::make_shared<Hook>()) {
    hook_->engine = this;
    std::weak_ptr<Hook> weak = hook_;
    subscription_ = bus_.subscribe([weak](const Event& e) {
        if (e.kind != EventKind::SessionStateChanged ||
            (e.session_state != SessionState::Disconnected &&
             e.session_state != SessionState::Failed))
            return;
        auto hook = weak.lock();
        if (!hook)
            return;
        std::lock_guard<std::recursive_mutex> lk(hook->mu);
        if (hook->engine)
            hook->engine->sessionEnded(e.session_id);
    });
}

TransferEngine::~TransferEngine() {
    bus_.unsubscribe(subscription_);
    {
        std::lock_guard<std::recursive_mutex> lk(hook_->mu);
        hook_->engine = nullptr;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
        for (auto& kv : jobs_) {
            if (!isTerminal(kv.second.job.state))
                kv.second.cancelRequested = true;
        }
    }
    cv_.notify_all();
    for (auto& kv : lanes_) {
        for (auto& t : kv.second->workers) {
            if (t.joinable())
                t.join();
        }
    }
}

// ---------------------------------------------------------------------------
// Bookkeeping

TransferEngine::JobRecord* TransferEngine::findLocked(std::uint64_t id) {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

const TransferEngine::JobRecord* TransferEngine::findLocked(std::uint64_t id) const {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : &it->second;
}

TransferJob TransferEngine::snapshotLocked(const JobRecord& rec) const {
    TransferJob out = rec.job;
    if (rec.childIds.empty())
        return out;
    out.bytes_done = 0;
    out.bytes_total = 0;
    out.children.clear();
    for (std::uint64_t cid : rec.childIds) {
        const JobRecord* c = findLocked(cid);
        if (!c)
            continue;
        out.bytes_done += c->job.bytes_done;
        out.bytes_total += c->job.bytes_total;
        ChildOutcome o;
        o.job_id = c->job.id;
        o.kind = c->job.kind;
        o.path = c->job.dest_path;
        o.state = c->job.state;
        o.skipped = c->job.skipped;
        o.error = c->job.error;
        out.children.push_back(std::move(o));
    }
    return out;
}

std::size_t TransferEngine::laneCount() {
    std::vector<std::unique_ptr<Lane>> reaped;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        reapLocked(reaped);
        count = lanes_.size();
    }
    joinLanes(reaped);
    return count;
}

void TransferEngine::reapLocked(std::vector<std::unique_ptr<Lane>>& out) {
    for (auto it = lanes_.begin(); it != lanes_.end();) {
        Lane& lane = *it->second;
        if (lane.draining && lane.exited == lane.workers.size()) {
            qCInfo(sdXfer) << "worker pool released" << "session=" << it->first;
            out.push_back(std::move(it->second));
            it = lanes_.erase(it);
        } else {
            ++it;
        }
    }
}

void TransferEngine::joinLanes(std::vector<std::unique_ptr<Lane>>& lanes) {
    for (auto& lane : lanes) {
        for (auto& t : lane->workers) {
            if (t.joinable())
                t.join();
        }
    }
    lanes.clear();
}

// Jobs of an ended session that no worker holds fail right away; running
// ones finish through their worker.
void TransferEngine::drainLocked(Lane& lane, std::vector<Event>& events) {
    const std::uint64_t sid = lane.session->id();
    std::vector<std::uint64_t> idle;
    for (const auto& kv : jobs_) {
        const JobRecord& r = kv.second;
        if (r.job.session_id == sid && !r.finished && !r.running && r.childIds.empty())
            idle.push_back(kv.first);
    }
    for (std::uint64_t id : idle) {
        JobRecord* r = findLocked(id);
        if (!r || r->finished)
            continue;
        Error e = Error::session(ErrorCode::ConnectionLost, "Session ended");
        e.path = r->job.dest_path;
        e.offset = r->job.bytes_done;
        finalizeLocked(*r, JobState::Failed, e, false, events);
    }
}

void TransferEngine::sessionEnded(std::uint64_t sessionId) {
    std::vector<Event> events;
    std::vector<std::unique_ptr<Lane>> reaped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = lanes_.find(sessionId);
        if (it == lanes_.end() || it->second->draining)
            return;
        it->second->draining = true;
        drainLocked(*it->second, events);
        reapLocked(reaped);
    }
    cv_.notify_all();
    qCInfo(sdXfer) << "session ended, worker pool draining" << "session=" << sessionId;
    publishAll(events);
    joinLanes(reaped);
}

TransferEngine::Lane& TransferEngine::laneLocked(const std::shared_ptr<Session>& session) {
    auto& slot = lanes_[session->id()];
    if (!slot) {
        slot = std::make_unique<Lane>();
        slot->session = session;
        const int workers = std::max(1, settings_.concurrent_jobs_per_session);
        Lane* lane = slot.get();
        for (int i = 0; i < workers; ++i)
            lane->workers.emplace_back([this, lane] { workerLoop(lane); });
        qCInfo(sdXfer) << "worker pool started" << "session=" << session->id()
                       << "workers=" << workers;
    }
    return *slot;
}

std::uint64_t TransferEngine::addJobLocked(const std::shared_ptr<Session>& session,
                                           TransferJob job, Lane& lane, bool queued) {
    job.id = nextId_++;
    job.session_id = session->id();
    job.state = JobState::Queued;
    JobRecord rec;
    rec.job = std::move(job);
    rec.session = session;
    const std::uint64_t id = rec.job.id;
    jobs_.emplace(id, std::move(rec));
    if (queued)
        lane.queue.push_back(id);
    return id;
}

void TransferEngine::removeFromQueueLocked(const JobRecord& rec) {
    auto it = lanes_.find(rec.job.session_id);
    if (it == lanes_.end())
        return;
    auto& q = it->second->queue;
    q.erase(std::remove(q.begin(), q.end(), rec.job.id), q.end());
}

void TransferEngine::finalizeLocked(JobRecord& rec, JobState state, const Error& error,
                                    bool skipped, std::vector<Event>& events) {
    // A cancelled job stays cancelled whatever the worker managed to finish.
    if (rec.cancelRequested && state != JobState::Cancelled) {
        state = JobState::Cancelled;
    }
    rec.job.state = state;
    rec.job.skipped = skipped;
    if (state == JobState::Cancelled && error.code != ErrorCode::Cancelled) {
        rec.job.error = Error::transfer(ErrorCode::Cancelled, "Cancelled by user", rec.job.dest_path);
        rec.job.error.offset = rec.job.bytes_done;
    } else {
        rec.job.error = error;
    }
    rec.finished = true;
    removeFromQueueLocked(rec);

    Event e = jobEvent(state == JobState::Completed ? EventKind::TransferCompleted
                                                    : EventKind::TransferFailed,
                       snapshotLocked(rec));
    if (skipped)
        e.message = "skipped: destination exists";
    else if (!rec.job.error.ok())
        e.message = rec.job.error.toString();
    events.push_back(std::move(e));

    if (rec.job.parent_id)
        updateParentLocked(rec.job.parent_id, events);
    cv_.notify_all();
}

void TransferEngine::updateParentLocked(std::uint64_t parentId, std::vector<Event>& events) {
    JobRecord* p = findLocked(parentId);
    if (!p || p->finished)
        return;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    const JobRecord* firstFailure = nullptr;
    for (std::uint64_t cid : p->childIds) {
        const JobRecord* c = findLocked(cid);
        if (!c)
            continue;
        if (!isTerminal(c->job.state))
            return;
        if (c->job.state == JobState::Failed) {
            ++failed;
            if (!firstFailure)
                firstFailure = c;
        } else if (c->job.state == JobState::Cancelled) {
            ++cancelled;
        }
    }
    JobState state = JobState::Completed;
    Error err;
    if (failed > 0) {
        state = JobState::Failed;
        err = firstFailure->job.error;
        err.message = std::to_string(failed) + " of " + std::to_string(p->childIds.size()) +
                      " entries failed; first: " + firstFailure->job.error.message;
        err.path = firstFailure->job.dest_path;
    } else if (cancelled > 0 || p->cancelRequested) {
        state = JobState::Cancelled;
        err = Error::transfer(ErrorCode::Cancelled, "Cancelled by user", p->job.dest_path);
    }
    qCInfo(sdXfer) << "directory job finished" << "id=" << p->job.id
                   << "state=" << jobStateName(state) << "children=" << p->childIds.size()
                   << "failed=" << failed << "cancelled=" << cancelled;
    finalizeLocked(*p, state, err, false, events);
}

void TransferEngine::cancelLocked(JobRecord& rec, std::vector<Event>& events) {
    if (rec.finished || (isTerminal(rec.job.state) && !rec.running))
        return;
    rec.cancelRequested = true;
    if (!rec.childIds.empty()) {
        rec.job.state = JobState::Cancelled;
        for (std::uint64_t cid : rec.childIds) {
            if (JobRecord* c = findLocked(cid))
                cancelLocked(*c, events);
        }
        updateParentLocked(rec.job.id, events);
        return;
    }
    if (rec.running) {
        // The worker publishes the final event at the next chunk boundary.
        rec.job.state = JobState::Cancelled;
        cv_.notify_all();
        return;
    }
    finalizeLocked(rec, JobState::Cancelled, {}, false, events);
}

void TransferEngine::publishAll(const std::vector<Event>& events) {
    for (const auto& e : events)
        bus_.publish(e);
}

// ---------------------------------------------------------------------------
// Public API

std::uint64_t TransferEngine::enqueue(const std::shared_ptr<Session>& session,
                                      const TransferRequest& request,
                                      Error& err) {
    if (!session) {
        err = Error::session(ErrorCode::ConnectionLost, "No session");
        return 0;
    }
    TransferRequest req = request;
    const bool needsSource = req.kind != JobKind::Delete && req.kind != JobKind::Mkdir;
    if ((needsSource && req.source_path.empty()) || req.dest_path.empty()) {
        err = Error::transfer(ErrorCode::NotFound, "Source and destination are required",
                              req.source_path);
        return 0;
    }
    // Remote paths are always absolute and normalized.
    switch (req.kind) {
    case JobKind::UploadFile:
    case JobKind::UploadDir:
        req.dest_path = RemotePath::normalize(req.dest_path);
        break;
    case JobKind::DownloadFile:
    case JobKind::DownloadDir:
        req.source_path = RemotePath::normalize(req.source_path);
        break;
    case JobKind::Delete:
    case JobKind::Mkdir:
        if (req.target == JobTarget::Remote)
            req.dest_path = RemotePath::normalize(req.dest_path);
        break;
    }

    TransferJob job;
    job.kind = req.kind;
    job.target = req.target;
    job.source_path = req.source_path;
    job.dest_path = req.dest_path;
    job.follow_symlinks = req.follow_symlinks;
    job.overwrite_policy = req.overwrite_policy;

    std::vector<PlannedJob> plan;
    if (req.kind == JobKind::UploadFile) {
        const QFileInfo fi(QString::fromStdString(req.source_path));
        if (!fi.exists() || fi.isDir()) {
            err = Error::transfer(ErrorCode::NotFound, "No such local file", req.source_path);
            return 0;
        }
        job.bytes_total = static_cast<std::uint64_t>(fi.size());
    } else if (req.kind == JobKind::UploadDir) {
        if (!planUpload(req, plan, err))
            return 0;
    } else if (req.kind == JobKind::DownloadDir) {
        if (!planDownload(*session, req, plan, err))
            return 0;
    }

    std::uint64_t id = 0;
    std::vector<std::unique_ptr<Lane>> reaped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        reapLocked(reaped);
        if (stopping_) {
            err = Error::transfer(ErrorCode::Cancelled, "Transfer engine is shutting down");
            return 0;
        }
        // Checked under mu_: a session ending after this point still finds
        // the lane in sessionEnded().
        const SessionState st = session->state();
        auto existing = lanes_.find(session->id());
        if (st == SessionState::Disconnected || st == SessionState::Failed ||
            (existing != lanes_.end() && existing->second->draining)) {
            err = Error::session(ErrorCode::ConnectionLost, "Session has ended");
            return 0;
        }
        Lane& lane = laneLocked(session);
        const bool isDir = isDirectoryKind(req.kind);
        id = addJobLocked(session, job, lane, !isDir);
        if (isDir) {
            std::vector<std::uint64_t> ids;
            ids.reserve(plan.size());
            for (auto& pj : plan) {
                pj.job.parent_id = id;
                pj.job.follow_symlinks = req.follow_symlinks;
                pj.job.overwrite_policy = req.overwrite_policy;
                if (pj.after >= 0)
                    pj.job.after_id = ids[static_cast<std::size_t>(pj.after)];
                ids.push_back(addJobLocked(session, pj.job, lane, true));
            }
            jobs_.at(id).childIds = ids;
        }
        topLevel_.push_back(id);
    }
    cv_.notify_all();
    joinLanes(reaped);
    qCInfo(sdXfer) << "job queued" << "id=" << id << "kind=" << jobKindName(req.kind)
                   << "children=" << plan.size();
    return id;
}

bool TransferEngine::cancel(std::uint64_t id, Error& err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec) {
            err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
            return false;
        }
        cancelLocked(*rec, events);
    }
    publishAll(events);
    return true;
}

bool TransferEngine::pause(std::uint64_t id, Error& err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec) {
            err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
            return false;
        }
        auto pauseOne = [&](JobRecord& r) {
            if (r.job.state == JobState::Queued) {
                r.job.state = JobState::Paused;
                events.push_back(jobEvent(EventKind::TransferStateChanged, r.job));
            } else if (r.job.state == JobState::Running || (r.running && !isTerminal(r.job.state))) {
                r.pauseRequested = true;
            }
        };
        if (rec->childIds.empty()) {
            pauseOne(*rec);
        } else if (!isTerminal(rec->job.state)) {
            for (std::uint64_t cid : rec->childIds) {
                if (JobRecord* c = findLocked(cid))
                    pauseOne(*c);
            }
            rec->job.state = JobState::Paused;
            events.push_back(jobEvent(EventKind::TransferStateChanged, rec->job));
        }
    }
    cv_.notify_all();
    publishAll(events);
    return true;
}

bool TransferEngine::resume(std::uint64_t id, Error& err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec) {
            err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
            return false;
        }
        if (rec->job.state == JobState::AwaitingDecision) {
            err = Error::transfer(ErrorCode::Unsupported,
                                  "Job is waiting for an overwrite decision", rec->job.dest_path);
            return false;
        }
        auto resumeOne = [&](JobRecord& r) {
            if (r.running) {
                // Still inside the worker (before its boundary or waiting on
                // the session): just withdraw the request.
                r.pauseRequested = false;
                return;
            }
            if (r.job.state == JobState::Paused) {
                r.job.state = JobState::Queued;
                r.resumeFromOffset = r.job.bytes_done > 0;
                events.push_back(jobEvent(EventKind::TransferStateChanged, r.job));
            }
        };
        if (rec->childIds.empty()) {
            resumeOne(*rec);
        } else if (!isTerminal(rec->job.state)) {
            for (std::uint64_t cid : rec->childIds) {
                if (JobRecord* c = findLocked(cid))
                    resumeOne(*c);
            }
            rec->job.state = JobState::Running;
            events.push_back(jobEvent(EventKind::TransferStateChanged, rec->job));
        }
    }
    cv_.notify_all();
    publishAll(events);
    return true;
}

bool TransferEngine::status(std::uint64_t id, TransferJob& out, Error& err) const {
    std::lock_guard<std::mutex> lk(mu_);
    const JobRecord* rec = findLocked(id);
    if (!rec) {
        err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
        return false;
    }
    out = snapshotLocked(*rec);
    return true;
}

bool TransferEngine::resolveOverwrite(std::uint64_t id, OverwriteDecision decision, Error& err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec) {
            err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
            return false;
        }
        if (rec->job.state != JobState::AwaitingDecision) {
            err = Error::transfer(ErrorCode::Unsupported, "Job is not waiting for a decision",
                                  rec->job.dest_path);
            return false;
        }
        rec->decision = decision;
        rec->job.state = JobState::Queued;
        events.push_back(jobEvent(EventKind::TransferStateChanged, rec->job));
    }
    cv_.notify_all();
    publishAll(events);
    return true;
}

bool TransferEngine::retry(std::uint64_t id, Error& err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec) {
            err = Error::transfer(ErrorCode::NotFound, "No job " + std::to_string(id));
            return false;
        }
        auto lane = lanes_.find(rec->job.session_id);
        if (rec->job.state == JobState::Failed &&
            (lane == lanes_.end() || lane->second->draining)) {
            err = Error::session(ErrorCode::ConnectionLost, "Session has ended");
            return false;
        }
        auto requeue = [&](JobRecord& r) {
            if (r.running || r.job.state != JobState::Failed)
                return false;
            r.job.state = JobState::Queued;
            r.job.error.clear();
            r.job.retry_count = 0;
            r.cancelRequested = false;
            r.pauseRequested = false;
            r.finished = false;
            r.resumeFromOffset = r.job.bytes_done > 0;
            lane->second->queue.push_back(r.job.id);
            events.push_back(jobEvent(EventKind::TransferStateChanged, r.job));
            return true;
        };
        if (rec->childIds.empty()) {
            if (!requeue(*rec)) {
                err = Error::transfer(ErrorCode::Unsupported,
                                      "Only failed jobs can be retried",
                                      rec->job.dest_path);
                return false;
            }
        } else {
            if (rec->job.state != JobState::Failed) {
                err = Error::transfer(ErrorCode::Unsupported,
                                      "Only failed jobs can be retried",
                                      rec->job.dest_path);
                return false;
            }
            for (std::uint64_t cid : rec->childIds) {
                if (JobRecord* c = findLocked(cid))
                    requeue(*c);
            }
            rec->job.state = JobState::Running;
            rec->job.error.clear();
            rec->cancelRequested = false;
            rec->finished = false;
            events.push_back(jobEvent(EventKind::TransferStateChanged, rec->job));
        }
    }
    cv_.notify_all();
    publishAll(events);
    return true;
}

std::size_t TransferEngine::clearFinished() {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t removed = 0;
    auto done = [this](std::uint64_t jid) {
        const JobRecord* r = findLocked(jid);
        return !r || (r->finished && !r->running);
    };
    for (auto it = topLevel_.begin(); it != topLevel_.end();) {
        const JobRecord* rec = findLocked(*it);
        bool clear = !rec || done(*it);
        if (rec && clear) {
            for (std::uint64_t cid : rec->childIds)
                clear = clear && done(cid);
        }
        if (!clear) {
            ++it;
            continue;
        }
        if (rec) {
            for (std::uint64_t cid : rec->childIds)
                jobs_.erase(cid);
            jobs_.erase(*it);
        }
        it = topLevel_.erase(it);
        ++removed;
    }
    return removed;
}

bool TransferEngine::waitFor(std::uint64_t id, std::chrono::milliseconds timeout,
                             TransferJob& out) {
    std::unique_lock<std::mutex> lk(mu_);
    const bool reached = cv_.wait_for(lk, timeout, [&] {
        const JobRecord* rec = findLocked(id);
        return !rec || (rec->finished && !rec->running);
    });
    const JobRecord* rec = findLocked(id);
    if (rec)
        out = snapshotLocked(*rec);
    return reached && rec != nullptr;
}

std::vector<TransferJob> TransferEngine::jobs() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<TransferJob> out;
    out.reserve(topLevel_.size());
    for (std::uint64_t id : topLevel_) {
        if (const JobRecord* rec = findLocked(id))
            out.push_back(snapshotLocked(*rec));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Directory expansion

bool TransferEngine::planUpload(const TransferRequest& req, std::vector<PlannedJob>& plan,
                                Error& err) {
    const QFileInfo root(QString::fromStdString(req.source_path));
    if (!root.exists() || !root.isDir()) {
        err = Error::transfer(ErrorCode::NotFound, "No such local directory", req.source_path);
        return false;
    }
    PlannedJob top;
    top.job.kind = JobKind::Mkdir;
    top.job.target = JobTarget::Remote;
    top.job.dest_path = req.dest_path;
    plan.push_back(top);

    QSet<QString> visited;
    visited.insert(root.canonicalFilePath());
    std::deque<std::tuple<QString, std::string, int>> pending;
    pending.emplace_back(root.absoluteFilePath(), req.dest_path, 0);
    while (!pending.empty()) {
        QString localDir;
        std::string remoteDir;
        int mkdirIndex = 0;
        std::tie(localDir, remoteDir, mkdirIndex) = pending.front();
        pending.pop_front();
        const QFileInfoList entries = QDir(localDir).entryInfoList(
            QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
            QDir::DirsFirst | QDir::Name);
        for (const QFileInfo& fi : entries) {
            const std::string remote = RemotePath::join(remoteDir, fi.fileName().toStdString());
            if (fi.isDir()) {
                if (fi.isSymLink() && !req.follow_symlinks) {
                    qCInfo(sdXfer) << "not following symlinked directory" << fi.filePath();
                    continue;
                }
                const QString canonical = fi.canonicalFilePath();
                if (visited.contains(canonical)) {
                    qCWarning(sdXfer) << "directory cycle skipped" << fi.filePath();
                    continue;
                }
                visited.insert(canonical);
                PlannedJob mk;
                mk.job.kind = JobKind::Mkdir;
                mk.job.target = JobTarget::Remote;
                mk.job.dest_path = remote;
                mk.after = mkdirIndex;
                plan.push_back(mk);
                pending.emplace_back(fi.absoluteFilePath(), remote, static_cast<int>(plan.size() - 1));
            } else if (fi.isFile()) {
                PlannedJob up;
                up.job.kind = JobKind::UploadFile;
                up.job.source_path = fi.absoluteFilePath().toStdString();
                up.job.dest_path = remote;
                up.job.bytes_total = static_cast<std::uint64_t>(fi.size());
                up.after = mkdirIndex;
                plan.push_back(up);
            }
        }
    }
    return true;
}

bool TransferEngine::planDownload(Session& session, const TransferRequest& req,
                                  std::vector<PlannedJob>& plan, Error& err) {
    FileInfo rootInfo;
    if (!session.run([&](SftpClient& c, Error& e) { return c.stat(req.source_path, rootInfo, e); },
                     err))
        return false;
    if (!rootInfo.is_dir) {
        err = Error::transfer(ErrorCode::IOFailure, "Not a directory", req.source_path);
        return false;
    }
    PlannedJob top;
    top.job.kind = JobKind::Mkdir;
    top.job.target = JobTarget::Local;
    top.job.dest_path = req.dest_path;
    plan.push_back(top);

    std::deque<std::tuple<std::string, QString, int, int>> pending;
    pending.emplace_back(req.source_path, QString::fromStdString(req.dest_path), 0, 0);
    while (!pending.empty()) {
        std::string remoteDir;
        QString localDir;
        int mkdirIndex = 0;
        int depth = 0;
        std::tie(remoteDir, localDir, mkdirIndex, depth) = pending.front();
        pending.pop_front();
        std::vector<FileInfo> entries;
        if (!session.run([&](SftpClient& c, Error& e) { return c.list(remoteDir, entries, e); },
                         err))
            return false;
        std::sort(entries.begin(), entries.end(), [](const FileInfo& a, const FileInfo& b) {
            if (a.is_dir != b.is_dir)
                return a.is_dir;
            return a.name < b.name;
        });
        for (const FileInfo& fi : entries) {
            const std::string remote = RemotePath::join(remoteDir, fi.name);
            const QString local = QDir(localDir).filePath(QString::fromStdString(fi.name));
            if (fi.is_dir) {
                if (fi.is_symlink && !req.follow_symlinks) {
                    qCInfo(sdXfer) << "not following remote symlinked directory"
                                   << QString::fromStdString(remote);
                    continue;
                }
                if (depth + 1 >= kMaxRemoteDepth) {
                    qCWarning(sdXfer) << "remote tree too deep, skipped"
                                      << QString::fromStdString(remote);
                    continue;
                }
                PlannedJob mk;
                mk.job.kind = JobKind::Mkdir;
                mk.job.target = JobTarget::Local;
                mk.job.dest_path = local.toStdString();
                mk.after = mkdirIndex;
                plan.push_back(mk);
                pending.emplace_back(remote, local, static_cast<int>(plan.size() - 1), depth + 1);
            } else {
                PlannedJob down;
                down.job.kind = JobKind::DownloadFile;
                down.job.source_path = remote;
                down.job.dest_path = local.toStdString();
                down.job.bytes_total = fi.size;
                down.after = mkdirIndex;
                plan.push_back(down);
            }
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// Workers

std::uint64_t TransferEngine::pickLocked(Lane& lane, std::vector<Event>& events) {
    bool rescan = true;
    while (rescan) {
        rescan = false;
        for (std::uint64_t id : lane.queue) {
            JobRecord* rec = findLocked(id);
            if (!rec || rec->running || rec->job.state != JobState::Queued)
                continue;
            if (rec->job.after_id) {
                const JobRecord* dep = findLocked(rec->job.after_id);
                if (dep && !(dep->finished && !dep->running))
                    continue;
                if (dep && dep->job.state != JobState::Completed) {
                    Error e = dep->job.error;
                    e.message = "Parent directory unavailable: " + e.message;
                    e.path = rec->job.dest_path;
                    e.offset = 0;
                    finalizeLocked(*rec,
                                   dep->job.state == JobState::Cancelled ? JobState::Cancelled
                                                                         : JobState::Failed,
                                   e, false, events);
                    rescan = true;  // the queue changed under the iterator
                    break;
                }
            }
            rec->running = true;
            rec->job.state = JobState::Running;
            events.push_back(jobEvent(EventKind::TransferStateChanged, rec->job));
            if (rec->job.parent_id) {
                JobRecord* parent = findLocked(rec->job.parent_id);
                if (parent && parent->job.state == JobState::Queued)
                    parent->job.state = JobState::Running;
            }
            return id;
        }
    }
    return 0;
}

void TransferEngine::workerLoop(Lane* lane) {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        std::vector<Event> events;
        const std::uint64_t id = pickLocked(*lane, events);
        if (id == 0 && events.empty()) {
            if (lane->draining && lane->busy == 0)
                break;
            cv_.wait(lk);
            continue;
        }
        if (id != 0)
            ++lane->busy;
        lk.unlock();
        publishAll(events);
        if (id != 0)
            execute(id);
        lk.lock();
        if (id != 0)
            --lane->busy;
    }
    // The lane may be reaped as soon as the lock is released.
    ++lane->exited;
    cv_.notify_all();
}

bool TransferEngine::interrupted(std::uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    const JobRecord* rec = findLocked(id);
    return !rec || rec->cancelRequested || rec->pauseRequested || stopping_;
}

TransferEngine::Outcome TransferEngine::interruptionOutcome(std::uint64_t id) {
    std::lock_guard<std::mutex> lk(mu_);
    const JobRecord* rec = findLocked(id);
    if (!rec || rec->cancelRequested || stopping_)
        return Outcome::Cancelled;
    return Outcome::Paused;
}

void TransferEngine::reportProgress(std::uint64_t id, std::uint64_t done, bool force,
                                    std::chrono::steady_clock::time_point& lastEmit) {
    Event e;
    bool emit = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        JobRecord* rec = findLocked(id);
        if (!rec)
            return;
        rec->job.bytes_done = done;
        const auto now = std::chrono::steady_clock::now();
        const bool due = force || settings_.progress_interval_ms <= 0 ||
                         now - lastEmit >= std::chrono::milliseconds(settings_.progress_interval_ms);
        // After a restart bytes_done climbs back from zero; only bytes past
        // what was already reported produce events.
        if (due && done > rec->reported) {
            e = jobEvent(EventKind::TransferProgress, rec->job);
            e.delta = done - rec->reported;
            rec->reported = done;
            lastEmit = now;
            emit = true;
        }
    }
    if (emit)
        bus_.publish(e);
}

void TransferEngine::invalidate(const JobRecord& rec, const std::string& dir) {
    Event e;
    e.kind = EventKind::DirectoryInvalidated;
    e.session_id = rec.job.session_id;
    e.job_id = rec.job.id;
    e.path = dir;
    bus_.publish(e);
}

void TransferEngine::execute(std::uint64_t id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(mu_);
        session = findLocked(id)->session;
    }
    while (true) {
        Error err;
        const Outcome outcome = attempt(id, err);

        std::vector<Event> events;
        std::unique_lock<std::mutex> lk(mu_);
        JobRecord& rec = *findLocked(id);
        bool again = false;
        switch (outcome) {
        case Outcome::Completed:
        case Outcome::Skipped:
            qCInfo(sdXfer) << "job finished" << "id=" << id
                           << "bytes=" << rec.job.bytes_done
                           << "skipped=" << (outcome == Outcome::Skipped);
            finalizeLocked(rec, JobState::Completed, {}, outcome == Outcome::Skipped, events);
            break;
        case Outcome::Cancelled:
            finalizeLocked(rec, JobState::Cancelled, {}, false, events);
            break;
        case Outcome::Paused:
            rec.job.state = JobState::Paused;
            rec.pauseRequested = false;
            rec.resumeFromOffset = rec.job.bytes_done > 0;
            events.push_back(jobEvent(EventKind::TransferStateChanged, rec.job));
            break;
        case Outcome::AwaitingDecision: {
            rec.job.state = JobState::AwaitingDecision;
            Event e = jobEvent(EventKind::OverwriteDecisionRequested, rec.job);
            e.message = "Destination exists: " + rec.job.dest_path;
            events.push_back(std::move(e));
            break;
        }
        case Outcome::Failed:
            err.offset = rec.job.bytes_done;
            if (err.path.empty())
                err.path = rec.job.dest_path;
            if (rec.cancelRequested || stopping_) {
                finalizeLocked(rec, JobState::Cancelled, {}, false, events);
                break;
            }
            if (!err.isTransient()) {
                qCWarning(sdXfer) << "job failed" << "id=" << id
                                  << QString::fromStdString(err.toString());
                finalizeLocked(rec, JobState::Failed, err, false, events);
                break;
            }
            if (++rec.job.retry_count > settings_.max_retries) {
                Error ex = Error::transfer(ErrorCode::RetryExhausted,
                                           "Gave up after " + std::to_string(settings_.max_retries) +
                                               " retries: " + err.toString(),
                                           err.path);
                ex.offset = rec.job.bytes_done;
                qCWarning(sdXfer) << "job failed" << "id=" << id
                                  << QString::fromStdString(ex.toString());
                finalizeLocked(rec, JobState::Failed, ex, false, events);
                break;
            }
            {
                // Paused until the session is back; the worker keeps the job.
                rec.job.state = JobState::Paused;
                rec.job.error = err;
                events.push_back(jobEvent(EventKind::TransferStateChanged, rec.job));
                const int retryNo = rec.job.retry_count;
                qCInfo(sdXfer) << "transient failure, waiting for session" << "id=" << id
                               << "retry=" << retryNo << "offset=" << rec.job.bytes_done;
                lk.unlock();
                publishAll(events);
                events.clear();

                Error waitErr;
                const bool back = session->waitUntilConnected(
                    session->reconnectBudget(), [this, id] { return interrupted(id); }, waitErr);

                lk.lock();
                if (back && !rec.cancelRequested && !rec.pauseRequested && !stopping_) {
                    cv_.wait_for(lk, retryDelay(retryNo), [&] {
                        return stopping_ || rec.cancelRequested || rec.pauseRequested;
                    });
                }
                if (rec.cancelRequested || stopping_) {
                    finalizeLocked(rec, JobState::Cancelled, {}, false, events);
                } else if (rec.pauseRequested) {
                    rec.job.state = JobState::Paused;
                    rec.pauseRequested = false;
                    rec.resumeFromOffset = rec.job.bytes_done > 0;
                    events.push_back(jobEvent(EventKind::TransferStateChanged, rec.job));
                } else if (back) {
                    rec.job.state = JobState::Running;
                    rec.job.error.clear();
                    rec.resumeFromOffset = true;
                    events.push_back(jobEvent(EventKind::TransferStateChanged, rec.job));
                    again = true;
                } else {
                    waitErr.offset = rec.job.bytes_done;
                    waitErr.path = rec.job.dest_path;
                    qCWarning(sdXfer) << "session did not come back" << "id=" << id
                                      << QString::fromStdString(waitErr.toString());
                    finalizeLocked(rec, JobState::Failed, waitErr, false, events);
                }
            }
            break;
        }
        if (!again) {
            rec.running = false;
            // A job parked (paused, awaiting a decision) on an ended session
            // has nobody left to run it.
            auto lane = lanes_.find(rec.job.session_id);
            if (lane != lanes_.end() && lane->second->draining)
                drainLocked(*lane->second, events);
        }
        cv_.notify_all();
        lk.unlock();
        publishAll(events);
        if (!again)
            return;
    }
}

TransferEngine::Outcome TransferEngine::attempt(std::uint64_t id, Error& err) {
    JobRecord* rec = nullptr;
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(mu_);
        rec = findLocked(id);
        session = rec->session;
    }
    if (interrupted(id))
        return interruptionOutcome(id);
    switch (rec->job.kind) {
    case JobKind::UploadFile:
        return attemptUpload(*rec, *session, err);
    case JobKind::DownloadFile:
        return attemptDownload(*rec, *session, err);
    case JobKind::Mkdir:
        return attemptMkdir(*rec, *session, err);
    case JobKind::Delete:
        return attemptDelete(*rec, *session, err);
    case JobKind::UploadDir:
    case JobKind::DownloadDir:
        break;
    }
    err = Error::transfer(ErrorCode::IOFailure, "Directory jobs run through their children");
    return Outcome::Failed;
}

std::optional<TransferEngine::Outcome> TransferEngine::checkOverwrite(JobRecord& rec,
                                                                      Session& session,
                                                                      bool remoteDest,
                                                                      Error& err) {
    std::string dest;
    OverwritePolicy policy;
    std::optional<OverwriteDecision> decision;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (rec.overwriteChecked)
            return std::nullopt;
        dest = rec.job.dest_path;
        policy = rec.job.overwrite_policy.value_or(settings_.overwrite_policy);
        decision = rec.decision;
    }
    auto destExists = [&](const std::string& path, bool& exists) {
        if (!remoteDest) {
            exists = QFileInfo::exists(QString::fromStdString(path));
            return true;
        }
        bool isDir = false;
        return session.run([&](SftpClient& c, Error& e) {
            exists = c.exists(path, isDir, e);
            return exists || e.ok();
        }, err);
    };

    bool exists = false;
    if (!destExists(dest, exists))
        return Outcome::Failed;
    if (exists) {
        OverwriteDecision d = OverwriteDecision::Overwrite;
        if (decision) {
            d = *decision;
        } else {
            switch (policy) {
            case OverwritePolicy::Skip:
                d = OverwriteDecision::Skip;
                break;
            case OverwritePolicy::Overwrite:
                d = OverwriteDecision::Overwrite;
                break;
            case OverwritePolicy::Rename:
                d = OverwriteDecision::Rename;
                break;
            case OverwritePolicy::Prompt:
                return Outcome::AwaitingDecision;
            }
        }
        if (d == OverwriteDecision::Skip) {
            std::lock_guard<std::mutex> lk(mu_);
            rec.overwriteChecked = true;
            return Outcome::Skipped;
        }
        if (d == OverwriteDecision::Rename) {
            std::string candidate;
            for (int n = 1;; ++n) {
                candidate = renamedPath(dest, n);
                bool taken = false;
                if (!destExists(candidate, taken))
                    return Outcome::Failed;
                if (!taken)
                    break;
            }
            qCInfo(sdXfer) << "destination exists, renaming" << "id=" << rec.job.id
                           << "to=" << QString::fromStdString(candidate);
            std::lock_guard<std::mutex> lk(mu_);
            rec.job.dest_path = candidate;
        }
    }
    std::lock_guard<std::mutex> lk(mu_);
    rec.overwriteChecked = true;
    return std::nullopt;
}

TransferEngine::Outcome TransferEngine::attemptUpload(JobRecord& rec, Session& session,
                                                      Error& err) {
    const std::uint64_t id = rec.job.id;
    const std::string src = rec.job.source_path;
    bool resume = false;
    std::uint64_t offset = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        resume = rec.resumeFromOffset;
        offset = rec.job.bytes_done;
    }

    QFile in(QString::fromStdString(src));
    if (!in.open(QIODevice::ReadOnly)) {
        err = localFileError(in, src, "Cannot open local file", true);
        return Outcome::Failed;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        rec.job.bytes_total = static_cast<std::uint64_t>(in.size());
    }

    if (resume) {
        bool offsetWrite = false;
        if (!session.run([&](SftpClient& c, Error&) {
                offsetWrite = c.supportsOffsetWrite();
                return true;
            }, err))
            return Outcome::Failed;
        if (!offsetWrite) {
            qCInfo(sdXfer) << "server cannot write at an offset, restarting" << "id=" << id;
            resume = false;
        }
    }
    if (!resume || offset > static_cast<std::uint64_t>(in.size()))
        offset = 0;
    resume = resume && offset > 0;

    if (auto o = checkOverwrite(rec, session, true, err))
        return *o;
    std::string dest;
    {
        std::lock_guard<std::mutex> lk(mu_);
        dest = rec.job.dest_path;
        rec.job.bytes_done = offset;
    }
    if (interrupted(id))
        return interruptionOutcome(id);

    std::unique_ptr<RemoteFile> out;
    if (!session.run([&](SftpClient& c, Error& e) {
            out = c.open(dest, resume ? OpenMode::WriteKeep : OpenMode::WriteTruncate, e);
            return out && (!resume || out->seek(offset, e));
        }, err)) {
        session.closeFile(out);
        return Outcome::Failed;
    }
    if (resume && !in.seek(static_cast<qint64>(offset))) {
        err = Error::transfer(ErrorCode::IOFailure, "Cannot seek local file", src);
        session.closeFile(out);
        return Outcome::Failed;
    }
    if (resume)
        qCInfo(sdXfer) << "resuming upload" << "id=" << id << "offset=" << offset;

    std::vector<char> buf(settings_.chunk_size_bytes);
    std::uint64_t done = offset;
    std::chrono::steady_clock::time_point lastEmit{};
    while (true) {
        if (interrupted(id)) {
            session.closeFile(out);
            return interruptionOutcome(id);
        }
        const qint64 n = in.read(buf.data(), static_cast<qint64>(buf.size()));
        if (n < 0) {
            err = localFileError(in, src, "Local read failed", true);
            session.closeFile(out);
            return Outcome::Failed;
        }
        if (n == 0)
            break;
        if (!session.run([&](SftpClient&, Error& e) {
                return out->write(buf.data(), static_cast<std::size_t>(n), e);
            }, err)) {
            session.closeFile(out);
            return Outcome::Failed;
        }
        done += static_cast<std::uint64_t>(n);
        reportProgress(id, done, false, lastEmit);
    }
    reportProgress(id, done, true, lastEmit);
    session.closeFile(out);

    if (settings_.preserve_timestamps) {
        const std::uint64_t mtime =
            static_cast<std::uint64_t>(QFileInfo(QString::fromStdString(src)).lastModified().toSecsSinceEpoch());
        Error timesErr;
        if (!session.run([&](SftpClient& c, Error& e) { return c.setTimes(dest, mtime, mtime, e); },
                         timesErr)) {
            qCWarning(sdXfer) << "could not preserve timestamps" << "id=" << id
                              << QString::fromStdString(timesErr.toString());
        }
    }
    invalidate(rec, RemotePath::parent(dest));
    return Outcome::Completed;
}

TransferEngine::Outcome TransferEngine::attemptDownload(JobRecord& rec, Session& session,
                                                        Error& err) {
    const std::uint64_t id = rec.job.id;
    const std::string src = rec.job.source_path;
    bool resume = false;
    std::uint64_t offset = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        resume = rec.resumeFromOffset;
        offset = rec.job.bytes_done;
    }

    FileInfo info;
    if (!session.run([&](SftpClient& c, Error& e) { return c.stat(src, info, e); }, err))
        return Outcome::Failed;
    if (info.is_dir) {
        err = Error::transfer(ErrorCode::IOFailure, "Is a directory", src);
        return Outcome::Failed;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        rec.job.bytes_total = info.size;
    }

    if (auto o = checkOverwrite(rec, session, false, err))
        return *o;
    std::string dest;
    {
        std::lock_guard<std::mutex> lk(mu_);
        dest = rec.job.dest_path;
    }
    const QString localPath = QString::fromStdString(dest);
    QDir().mkpath(QFileInfo(localPath).absolutePath());

    QFile out(localPath);
    if (resume && (offset == 0 || offset > info.size ||
                   static_cast<std::uint64_t>(QFileInfo(localPath).size()) < offset))
        resume = false;
    if (!resume)
        offset = 0;
    const QIODevice::OpenMode mode =
        resume ? QIODevice::ReadWrite : (QIODevice::WriteOnly | QIODevice::Truncate);
    if (!out.open(mode)) {
        err = localFileError(out, dest, "Cannot open local file", false);
        return Outcome::Failed;
    }
    if (resume && (!out.resize(static_cast<qint64>(offset)) || !out.seek(static_cast<qint64>(offset)))) {
        err = localFileError(out, dest, "Cannot position local file", false);
        return Outcome::Failed;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        rec.job.bytes_done = offset;
    }
    if (interrupted(id))
        return interruptionOutcome(id);

    std::unique_ptr<RemoteFile> in;
    if (!session.run([&](SftpClient& c, Error& e) {
            in = c.open(src, OpenMode::Read, e);
            return in && (offset == 0 || in->seek(offset, e));
        }, err)) {
        session.closeFile(in);
        return Outcome::Failed;
    }
    if (resume)
        qCInfo(sdXfer) << "resuming download" << "id=" << id << "offset=" << offset;

    std::vector<char> buf(settings_.chunk_size_bytes);
    std::uint64_t done = offset;
    std::chrono::steady_clock::time_point lastEmit{};
    while (true) {
        if (interrupted(id)) {
            session.closeFile(in);
            return interruptionOutcome(id);
        }
        std::size_t got = 0;
        if (!session.run([&](SftpClient&, Error& e) {
                return in->read(buf.data(), buf.size(), got, e);
            }, err)) {
            session.closeFile(in);
            return Outcome::Failed;
        }
        if (got == 0)
            break;
        if (out.write(buf.data(), static_cast<qint64>(got)) != static_cast<qint64>(got)) {
            err = localFileError(out, dest, "Local write failed", false);
            session.closeFile(in);
            return Outcome::Failed;
        }
        done += got;
        reportProgress(id, done, false, lastEmit);
    }
    session.closeFile(in);
    if (!out.flush()) {
        err = localFileError(out, dest, "Local write failed", false);
        return Outcome::Failed;
    }
    reportProgress(id, done, true, lastEmit);
    if (settings_.preserve_timestamps && info.mtime > 0) {
        if (!out.setFileTime(QDateTime::fromSecsSinceEpoch(static_cast<qint64>(info.mtime)),
                             QFileDevice::FileModificationTime)) {
            qCWarning(sdXfer) << "could not preserve timestamps" << "id=" << id << localPath;
        }
    }
    out.close();
    return Outcome::Completed;
}

TransferEngine::Outcome TransferEngine::attemptMkdir(JobRecord& rec, Session& session,
                                                     Error& err) {
    const std::string path = rec.job.dest_path;
    if (rec.job.target == JobTarget::Local) {
        if (!QDir().mkpath(QString::fromStdString(path))) {
            const QFileInfo parent(QFileInfo(QString::fromStdString(path)).absolutePath());
            err = Error::transfer(parent.exists() && !parent.isWritable() ? ErrorCode::PermissionDenied
                                                                           : ErrorCode::IOFailure,
                                  "Cannot create local directory", path);
            return Outcome::Failed;
        }
        return Outcome::Completed;
    }
    if (session.run([&](SftpClient& c, Error& e) { return c.mkdir(path, e); }, err)) {
        invalidate(rec, RemotePath::parent(path));
        return Outcome::Completed;
    }
    if (err.isTransient())
        return Outcome::Failed;
    // Already there is fine; anything else is a real failure.
    bool isDir = false;
    bool exists = false;
    Error probeErr;
    if (session.run([&](SftpClient& c, Error& e) {
            exists = c.exists(path, isDir, e);
            return exists || e.ok();
        }, probeErr) &&
        exists && isDir) {
        err.clear();
        return Outcome::Completed;
    }
    return Outcome::Failed;
}

TransferEngine::Outcome TransferEngine::attemptDelete(JobRecord& rec, Session& session,
                                                      Error& err) {
    const std::string path = rec.job.dest_path;
    if (rec.job.target == JobTarget::Local) {
        const QString local = QString::fromStdString(path);
        const QFileInfo fi(local);
        if (!fi.exists() && !fi.isSymLink()) {
            err = Error::transfer(ErrorCode::NotFound, "No such local path", path);
            return Outcome::Failed;
        }
        const bool ok = fi.isDir() && !fi.isSymLink() ? QDir().rmdir(local) : QFile::remove(local);
        if (!ok) {
            const QFileInfo parent(fi.absolutePath());
            err = Error::transfer(!parent.isWritable() ? ErrorCode::PermissionDenied
                                                       : ErrorCode::IOFailure,
                                  "Cannot delete local path (directory not empty?)", path);
            return Outcome::Failed;
        }
        return Outcome::Completed;
    }
    FileInfo info;
    if (!session.run([&](SftpClient& c, Error& e) { return c.stat(path, info, e); }, err))
        return Outcome::Failed;
    const bool dir = info.is_dir && !info.is_symlink;
    if (!session.run([&](SftpClient& c, Error& e) {
            return dir ? c.removeDir(path, e) : c.removeFile(path, e);
        }, err))
        return Outcome::Failed;
    invalidate(rec, RemotePath::parent(path));
    if (dir)
        invalidate(rec, path);
    return Outcome::Completed;
}

} // namespace sftpdesk
