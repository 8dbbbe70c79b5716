// Queued, cancellable, chunked transfers between the local filesystem and a
// session. Each session gets its own bounded worker pool; directory jobs are
// expanded at enqueue time into Mkdir and file jobs.
#pragma once
#include "AppConfig.hpp"
#include "EventBus.hpp"
#include "ServiceTypes.hpp"
#include "sftpdesk/Error.hpp"
#include <QString>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace sftpdesk {

class Session;

class TransferEngine {
public:
    TransferEngine(EventBus& bus, TransferSettings settings);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Returns the job id, or 0 with err set. Directory requests list their
    // source tree here (remote listings go through the session).
    std::uint64_t enqueue(const std::shared_ptr<Session>& session,
                          const TransferRequest& request,
                          Error& err);

    // Queued/paused jobs stop at once; running ones at the next chunk
    // boundary. Partially written destinations are left in place.
    bool cancel(std::uint64_t id, Error& err);
    bool pause(std::uint64_t id, Error& err);
    bool resume(std::uint64_t id, Error& err);
    bool status(std::uint64_t id, TransferJob& out, Error& err) const;

    // Answers an OverwriteDecisionRequested event.
    bool resolveOverwrite(std::uint64_t id, OverwriteDecision decision, Error& err);

    // Re-queues a failed job (directory jobs: their failed children) under the
    // same id. Cancelled jobs stay cancelled; enqueue them again instead.
    bool retry(std::uint64_t id, Error& err);

    // Drops finished top-level jobs and their children. Returns how many
    // top-level jobs were removed.
    std::size_t clearFinished();

    // Blocking variant: waits until the job is terminal. out receives the
    // latest snapshot either way.
    bool waitFor(std::uint64_t id, std::chrono::milliseconds timeout, TransferJob& out);

    // Top-level jobs in enqueue order.
    std::vector<TransferJob> jobs() const;

    // Worker pools still alive. Pools of ended sessions are joined here once
    // their workers have left.
    std::size_t laneCount();

    const TransferSettings& settings() const { return settings_; }

private:
    struct JobRecord {
        TransferJob job;
        std::shared_ptr<Session> session;
        bool running = false;          // owned by a worker right now
        bool finished = false;         // terminal event published
        bool cancelRequested = false;
        bool pauseRequested = false;
        bool resumeFromOffset = false;
        bool overwriteChecked = false;
        std::optional<OverwriteDecision> decision;
        std::uint64_t reported = 0;    // highest bytes_done already published
        std::vector<std::uint64_t> childIds;
    };

    struct Lane {
        std::shared_ptr<Session> session;
        std::deque<std::uint64_t> queue;  // FIFO of jobs that still have to run
        std::vector<std::thread> workers;
        int busy = 0;           // jobs inside execute()
        std::size_t exited = 0; // workers that returned from workerLoop
        bool draining = false;  // session ended; no new work

        ~Lane() {
            for (auto& t : workers) {
                if (t.joinable())
                    t.join();
            }
        }
    };

    // Lets a bus listener reach the engine only while it is alive. Recursive:
    // events published from sessionEnded() may end another session.
    struct Hook {
        std::recursive_mutex mu;
        TransferEngine* engine = nullptr;
    };

    enum class Outcome { Completed, Skipped, Failed, Cancelled, Paused, AwaitingDecision };

    // Directory expansion result; `after` indexes the Mkdir a job waits for.
    struct PlannedJob {
        TransferJob job;
        int after = -1;
    };

    EventBus& bus_;
    const TransferSettings settings_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<std::uint64_t, JobRecord> jobs_;
    std::vector<std::uint64_t> topLevel_;
    std::map<std::uint64_t, std::unique_ptr<Lane>> lanes_;  // by session id
    std::uint64_t nextId_ = 1;
    bool stopping_ = false;

    std::shared_ptr<Hook> hook_;
    std::uint64_t subscription_ = 0;

    // Worker side
    void workerLoop(Lane* lane);
    void sessionEnded(std::uint64_t sessionId);
    void drainLocked(Lane& lane, std::vector<Event>& events);
    void reapLocked(std::vector<std::unique_ptr<Lane>>& out);
    static void joinLanes(std::vector<std::unique_ptr<Lane>>& lanes);
    std::uint64_t pickLocked(Lane& lane, std::vector<Event>& events);
    void execute(std::uint64_t id);
    Outcome attempt(std::uint64_t id, Error& err);
    Outcome attemptUpload(JobRecord& rec, Session& session, Error& err);
    Outcome attemptDownload(JobRecord& rec, Session& session, Error& err);
    Outcome attemptMkdir(JobRecord& rec, Session& session, Error& err);
    Outcome attemptDelete(JobRecord& rec, Session& session, Error& err);
    // nullopt: go ahead with the (possibly renamed) destination.
    std::optional<Outcome> checkOverwrite(JobRecord& rec, Session& session, bool remoteDest,
                                          Error& err);

    bool interrupted(std::uint64_t id) const;
    Outcome interruptionOutcome(std::uint64_t id);
    void reportProgress(std::uint64_t id, std::uint64_t done, bool force,
                        std::chrono::steady_clock::time_point& lastEmit);
    void invalidate(const JobRecord& rec, const std::string& dir);

    // Bookkeeping; callers hold mu_ and publish the collected events afterwards.
    std::uint64_t addJobLocked(const std::shared_ptr<Session>& session, TransferJob job,
                               Lane& lane, bool queued);
    Lane& laneLocked(const std::shared_ptr<Session>& session);
    void finalizeLocked(JobRecord& rec, JobState state, const Error& error, bool skipped,
                        std::vector<Event>& events);
    void updateParentLocked(std::uint64_t parentId, std::vector<Event>& events);
    void removeFromQueueLocked(const JobRecord& rec);
    void cancelLocked(JobRecord& rec, std::vector<Event>& events);
    JobRecord* findLocked(std::uint64_t id);
    const JobRecord* findLocked(std::uint64_t id) const;
    TransferJob snapshotLocked(const JobRecord& rec) const;
    void publishAll(const std::vector<Event>& events);

    // Directory expansion, done before the engine lock is taken.
    bool planUpload(const TransferRequest& req, std::vector<PlannedJob>& plan, Error& err);
    bool planDownload(Session& session, const TransferRequest& req,
                      std::vector<PlannedJob>& plan, Error& err);
};

} // namespace sftpdesk
