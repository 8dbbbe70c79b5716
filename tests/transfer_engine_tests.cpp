// Transfer engine tests against the in-memory SFTP server (run via CTest).
#include "CredentialVault.hpp"
#include "EventBus.hpp"
#include "KnownHostsStore.hpp"
#include "SessionManager.hpp"
#include "TransferEngine.hpp"
#include "sftpdesk/MockSftpClient.hpp"
#include "sftpdesk/RemotePath.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

using namespace sftpdesk;
using namespace std::chrono_literals;

constexpr std::size_t kMiB = 1024 * 1024;

std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>((i * 31 + i / 4096) % 251);
    return data;
}

bool writeLocal(const QString &path, const std::string &data) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(data.data(), static_cast<qint64>(data.size())) ==
           static_cast<qint64>(data.size());
}

std::string readLocal(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll().toStdString();
}

TransferSettings testSettings() {
    TransferSettings s;
    s.chunk_size_bytes = 64 * 1024;
    s.concurrent_jobs_per_session = 1;
    s.progress_interval_ms = 0;
    s.max_retries = 3;
    return s;
}

// One mock server, one connected session and an engine on top of it.
struct Fixture {
    QTemporaryDir dir;
    std::shared_ptr<MockSftpServer> server = std::make_shared<MockSftpServer>();
    CredentialVault vault{dir.filePath("vault.key")};
    KnownHostsStore knownHosts{dir.filePath("known_hosts.json")};
    EventBus bus;
    std::unique_ptr<SessionManager> manager;
    ConnectionProfile profile;
    std::shared_ptr<Session> session;
    std::unique_ptr<TransferEngine> engine;

    explicit Fixture(TransferSettings settings = testSettings()) {
        ConnectionSettings cs;
        cs.timeout_seconds = 1;
        cs.keep_alive_interval_seconds = 0;
        cs.retry_ceiling = 5;
        cs.reconnect_grace_seconds = 10;
        cs.known_hosts_policy = KnownHostsPolicy::Off;
        ReconnectPolicy rp;
        rp.backoff_base = 5ms;
        rp.backoff_cap = 20ms;
        auto srv = server;
        manager = std::make_unique<SessionManager>(
            vault, knownHosts, bus, cs,
            [srv] { return std::make_unique<MockSftpClient>(srv); }, rp);

        profile.name = "mock";
        profile.host = "sftp.example.test";
        profile.username = "alice";
        Error err;
        vault.wrap("pw", profile.secret_ref, err);
        session = manager->connect(profile, err);
        engine = std::make_unique<TransferEngine>(bus, settings);
    }

    ~Fixture() {
        engine.reset();
        session.reset();
        manager.reset();
    }

    QString local(const QString &name) const { return dir.filePath(name); }

    std::uint64_t upload(const QString &src, const std::string &dest, Error &err,
                         std::optional<OverwritePolicy> policy = std::nullopt) {
        TransferRequest r;
        r.kind = JobKind::UploadFile;
        r.source_path = src.toStdString();
        r.dest_path = dest;
        r.overwrite_policy = policy;
        return engine->enqueue(session, r, err);
    }

    std::uint64_t download(const std::string &src, const QString &dest, Error &err,
                           std::optional<OverwritePolicy> policy = std::nullopt) {
        TransferRequest r;
        r.kind = JobKind::DownloadFile;
        r.source_path = src;
        r.dest_path = dest.toStdString();
        r.overwrite_policy = policy;
        return engine->enqueue(session, r, err);
    }
};

// Collects events until the job's terminal event shows up.
bool collectUntilDone(EventQueue &queue, std::uint64_t id, std::vector<Event> &out,
                      std::chrono::milliseconds timeout = 30s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        Event e;
        if (!queue.waitNext(e, 50ms))
            continue;
        out.push_back(e);
        if (e.job_id == id &&
            (e.kind == EventKind::TransferCompleted || e.kind == EventKind::TransferFailed))
            return true;
    }
    return false;
}

std::vector<Event> progressOf(const std::vector<Event> &events, std::uint64_t id) {
    std::vector<Event> out;
    for (const Event &e : events)
        if (e.kind == EventKind::TransferProgress && e.job_id == id)
            out.push_back(e);
    return out;
}

bool waitForJobState(TransferEngine &engine, std::uint64_t id, JobState want,
                     std::chrono::milliseconds timeout = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        TransferJob job;
        Error err;
        if (engine.status(id, job, err) && job.state == want)
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

void test_upload_and_progress(TestContext &t) {
    Fixture f;
    EventQueue events(f.bus);
    const std::string data = pattern(300 * 1024 + 17);
    t.check(writeLocal(f.local("report.pdf"), data), "write local source");

    Error err;
    const auto id = f.upload(f.local("report.pdf"), "/home/alice/report.pdf", err);
    t.check(id != 0, "enqueue upload: " + err.toString());
    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "upload finishes");

    TransferJob job;
    t.check(f.engine->status(id, job, err), "status of finished upload");
    t.check(job.state == JobState::Completed, "upload Completed");
    t.check(job.bytes_done == data.size() && job.bytes_total == data.size(),
            "bytes_done reaches bytes_total");
    std::string remote;
    t.check(f.server->readFile("/home/alice/report.pdf", remote) && remote == data,
            "remote content matches");

    const auto progress = progressOf(seen, id);
    std::uint64_t sum = 0;
    std::uint64_t last = 0;
    bool monotonic = true;
    for (const Event &e : progress) {
        monotonic = monotonic && e.bytes_done > last;
        last = e.bytes_done;
        sum += e.delta;
    }
    t.check(!progress.empty(), "progress events were published");
    t.check(monotonic, "progress never goes backwards");
    t.check(sum == data.size(), "progress deltas add up to the file size");
    t.check(last == data.size(), "last progress reports the full size");

    bool invalidated = false;
    for (const Event &e : seen)
        if (e.kind == EventKind::DirectoryInvalidated && e.path == "/home/alice")
            invalidated = true;
    t.check(invalidated, "upload invalidates the destination directory");
}

void test_resume_after_drop(TestContext &t) {
    TransferSettings s = testSettings();
    s.chunk_size_bytes = kMiB;
    Fixture f(s);
    EventQueue events(f.bus);
    const std::string data = pattern(10 * kMiB);
    t.check(writeLocal(f.local("big.bin"), data), "write 10 MiB source");

    f.server->dropAfterWrites(4);
    Error err;
    const auto id = f.upload(f.local("big.bin"), "/home/alice/big.bin", err);
    t.check(id != 0, "enqueue big upload");
    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "big upload finishes");

    TransferJob job;
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Completed, "upload survives the dropped connection");
    t.check(job.retry_count == 1, "one retry was needed");
    std::string remote;
    t.check(f.server->readFile("/home/alice/big.bin", remote) && remote == data,
            "resumed content is byte-identical");
    t.check(f.server->writeCount() == 10, "resume continues at the confirmed offset");

    const auto progress = progressOf(seen, id);
    t.check(progress.size() == 10, "exactly ten progress events for ten chunks");
    std::uint64_t sum = 0;
    for (const Event &e : progress)
        sum += e.delta;
    t.check(sum == data.size(), "deltas count every byte once");

    bool paused = false;
    for (const Event &e : seen)
        if (e.kind == EventKind::TransferStateChanged && e.job_id == id &&
            e.job_state == JobState::Paused)
            paused = true;
    t.check(paused, "job reports Paused while the session reconnects");
}

void test_restart_without_offset_write(TestContext &t) {
    TransferSettings s = testSettings();
    s.chunk_size_bytes = kMiB;
    Fixture f(s);
    EventQueue events(f.bus);
    const std::string data = pattern(6 * kMiB);
    t.check(writeLocal(f.local("restart.bin"), data), "write restart source");

    f.server->setOffsetWriteSupported(false);
    f.server->dropAfterWrites(2);
    Error err;
    const auto id = f.upload(f.local("restart.bin"), "/restart.bin", err);
    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "restarted upload finishes");
    TransferJob job;
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Completed, "restarted upload Completed");
    std::string remote;
    t.check(f.server->readFile("/restart.bin", remote) && remote == data,
            "restarted upload content matches");
    t.check(f.server->writeCount() == 8, "restart writes the whole file again");

    const auto progress = progressOf(seen, id);
    std::uint64_t sum = 0;
    std::uint64_t last = 0;
    bool monotonic = true;
    for (const Event &e : progress) {
        monotonic = monotonic && e.bytes_done > last;
        last = e.bytes_done;
        sum += e.delta;
    }
    t.check(monotonic, "restart does not report progress going backwards");
    t.check(sum == data.size(), "restart does not double count bytes");
}

void test_download_resume(TestContext &t) {
    TransferSettings s = testSettings();
    s.chunk_size_bytes = kMiB;
    Fixture f(s);
    EventQueue events(f.bus);
    const std::string data = pattern(5 * kMiB);
    f.server->addFile("/data/archive.tar", data, 1600000000);

    f.server->dropAfterReads(2);
    Error err;
    const QString dest = f.local("downloads/archive.tar");
    const auto id = f.download("/data/archive.tar", dest, err);
    t.check(id != 0, "enqueue download: " + err.toString());
    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "download finishes");
    TransferJob job;
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Completed, "download survives the dropped connection");
    t.check(readLocal(dest) == data, "downloaded content matches");
    t.check(progressOf(seen, id).size() == 5, "one progress event per chunk");
    t.check(QFileInfo(dest).lastModified().toSecsSinceEpoch() == 1600000000,
            "remote modification time is kept");

    err.clear();
    const auto missing = f.download("/data/nope.bin", f.local("nope.bin"), err);
    TransferJob failed;
    t.check(f.engine->waitFor(missing, 10s, failed), "missing download finishes");
    t.check(failed.state == JobState::Failed, "missing source fails");
    t.check(failed.error.code == ErrorCode::NotFound, "missing source reports NotFound");
    t.check(failed.error.path == "/data/nope.bin", "error names the missing path");
}

void test_cancel(TestContext &t) {
    Fixture f;
    EventQueue events(f.bus);
    const std::string data = pattern(2 * kMiB);
    t.check(writeLocal(f.local("slow.bin"), data), "write slow source");
    f.server->setIoDelayMs(20);

    Error err;
    const auto id = f.upload(f.local("slow.bin"), "/slow.bin", err);
    t.check(waitForJobState(*f.engine, id, JobState::Running), "upload starts running");
    std::this_thread::sleep_for(100ms);
    t.check(f.engine->cancel(id, err), "cancel a running job");

    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "cancelled job reports its end");
    TransferJob job;
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Cancelled, "job ends Cancelled");
    t.check(job.error.code == ErrorCode::Cancelled, "cancellation is the recorded cause");
    t.check(job.bytes_done < data.size(), "cancel stops before the end");
    bool completed = false;
    for (const Event &e : seen)
        if (e.kind == EventKind::TransferCompleted && e.job_id == id)
            completed = true;
    t.check(!completed, "a cancelled job never reports completion");

    err.clear();
    t.check(f.engine->cancel(id, err), "cancelling again is harmless");
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Cancelled, "state stays Cancelled");
}

void test_pause_resume(TestContext &t) {
    Fixture f;
    const std::string data = pattern(2 * kMiB);
    t.check(writeLocal(f.local("pause.bin"), data), "write pause source");
    f.server->setIoDelayMs(10);

    Error err;
    const auto id = f.upload(f.local("pause.bin"), "/pause.bin", err);
    t.check(waitForJobState(*f.engine, id, JobState::Running), "upload starts");
    std::this_thread::sleep_for(100ms);
    t.check(f.engine->pause(id, err), "pause a running job");
    t.check(waitForJobState(*f.engine, id, JobState::Paused), "job reaches Paused");
    TransferJob job;
    f.engine->status(id, job, err);
    const std::uint64_t pausedAt = job.bytes_done;
    t.check(pausedAt > 0 && pausedAt < data.size(), "pause keeps the partial offset");

    f.server->setIoDelayMs(0);
    const int writesBefore = f.server->writeCount();
    t.check(f.engine->resume(id, err), "resume the paused job");
    t.check(f.engine->waitFor(id, 30s, job), "resumed job finishes");
    t.check(job.state == JobState::Completed, "resumed job Completed");
    std::string remote;
    t.check(f.server->readFile("/pause.bin", remote) && remote == data,
            "paused and resumed content matches");
    const int chunks = static_cast<int>(data.size() / (64 * 1024));
    t.check(f.server->writeCount() - writesBefore < chunks, "resume does not start over");
}

void test_partial_failure_isolation(TestContext &t) {
    Fixture f;
    const QString root = f.local("site");
    t.check(writeLocal(root + "/a.txt", "alpha"), "write a.txt");
    t.check(writeLocal(root + "/b.txt", "bravo"), "write b.txt");
    t.check(writeLocal(root + "/c.txt", "charlie"), "write c.txt");
    f.server->failOn("/srv/site/b.txt",
                     Error::transfer(ErrorCode::PermissionDenied, "Permission denied"));
    f.server->addDir("/srv");

    TransferRequest r;
    r.kind = JobKind::UploadDir;
    r.source_path = root.toStdString();
    r.dest_path = "/srv/site";
    Error err;
    const auto id = f.engine->enqueue(f.session, r, err);
    t.check(id != 0, "enqueue directory upload: " + err.toString());
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "directory upload finishes");
    t.check(job.state == JobState::Failed, "directory job reports the failure");
    t.check(job.children.size() == 4, "one mkdir and three file jobs");
    t.checkContains(job.error.message, "1 of 4 entries failed", "summary counts failures");
    t.check(job.error.path == "/srv/site/b.txt", "summary names the first failure");

    std::string content;
    t.check(f.server->readFile("/srv/site/a.txt", content) && content == "alpha",
            "a.txt uploaded despite the failure");
    t.check(f.server->readFile("/srv/site/c.txt", content) && content == "charlie",
            "c.txt uploaded despite the failure");
    for (const ChildOutcome &c : job.children) {
        if (c.path == "/srv/site/b.txt") {
            t.check(c.state == JobState::Failed, "b.txt failed");
            t.check(c.error.code == ErrorCode::PermissionDenied, "b.txt failure keeps its cause");
        }
    }

    // Only the failed child runs again.
    f.server->clearFailures();
    t.check(f.engine->retry(id, err), "retry the directory job");
    t.check(f.engine->waitFor(id, 30s, job), "retried directory finishes");
    t.check(job.state == JobState::Completed, "retry completes the directory");
    t.check(f.server->readFile("/srv/site/b.txt", content) && content == "bravo",
            "b.txt uploaded on retry");
}

void test_upload_tree(TestContext &t) {
    Fixture f;
    const QString root = f.local("project");
    t.check(writeLocal(root + "/README", "readme"), "write README");
    t.check(writeLocal(root + "/src/main.cpp", "int main() {}"), "write src/main.cpp");
    t.check(writeLocal(root + "/src/util/strings.hpp", "#pragma once"), "write nested file");
    QDir().mkpath(root + "/empty");

    TransferRequest r;
    r.kind = JobKind::UploadDir;
    r.source_path = root.toStdString();
    r.dest_path = "/home/alice/projects/project";
    Error err;
    const auto id = f.engine->enqueue(f.session, r, err);
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "tree upload finishes");
    t.check(job.state == JobState::Completed, "tree upload Completed");
    t.check(f.server->hasPath("/home/alice/projects/project/empty"), "empty directory created");
    std::string content;
    t.check(f.server->readFile("/home/alice/projects/project/src/util/strings.hpp", content) &&
                content == "#pragma once",
            "nested file uploaded");
    t.check(job.bytes_total == job.bytes_done, "directory totals add up");

    err.clear();
    r.source_path = f.local("missing-dir").toStdString();
    t.check(f.engine->enqueue(f.session, r, err) == 0, "missing source directory is rejected");
    t.check(err.code == ErrorCode::NotFound, "missing source directory is NotFound");
}

void test_download_tree(TestContext &t) {
    Fixture f;
    const QString dest = f.local("home-copy");
    TransferRequest r;
    r.kind = JobKind::DownloadDir;
    r.source_path = "/home";
    r.dest_path = dest.toStdString();
    Error err;
    const auto id = f.engine->enqueue(f.session, r, err);
    t.check(id != 0, "enqueue directory download: " + err.toString());
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "tree download finishes");
    t.check(job.state == JobState::Completed, "tree download Completed");
    t.check(QFileInfo(dest + "/alice/projects").isDir(), "nested directory created locally");
    t.check(QFileInfo(dest + "/guest").isDir(), "empty directory created locally");
    t.check(QFileInfo(dest + "/notes.md").size() == 2048, "notes.md downloaded");
    t.check(QFileInfo(dest + "/alice/photo.jpg").size() == 34567, "photo.jpg downloaded");
}

void test_prompt_does_not_block(TestContext &t) {
    Fixture f;
    EventQueue events(f.bus);
    t.check(writeLocal(f.local("notes.md"), "fresh notes"), "write replacement notes");
    t.check(writeLocal(f.local("todo.txt"), "todo"), "write unrelated file");

    Error err;
    const auto conflicting = f.upload(f.local("notes.md"), "/home/notes.md", err);
    bool asked = false;
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (!asked && std::chrono::steady_clock::now() < deadline) {
        Event e;
        if (events.waitNext(e, 50ms) && e.kind == EventKind::OverwriteDecisionRequested &&
            e.job_id == conflicting)
            asked = e.path == "/home/notes.md";
    }
    t.check(asked, "a decision is requested for the destination");
    t.check(waitForJobState(*f.engine, conflicting, JobState::AwaitingDecision),
            "conflict waits for a decision");

    const auto other = f.upload(f.local("todo.txt"), "/home/todo.txt", err);
    TransferJob job;
    t.check(f.engine->waitFor(other, 10s, job) && job.state == JobState::Completed,
            "other jobs run while one waits for a decision");
    f.engine->status(conflicting, job, err);
    t.check(job.state == JobState::AwaitingDecision, "conflicting job is still waiting");

    err.clear();
    t.check(!f.engine->resume(conflicting, err), "resume cannot answer a decision");
    t.check(err.code == ErrorCode::Unsupported, "resume on a waiting job is Unsupported");

    t.check(f.engine->resolveOverwrite(conflicting, OverwriteDecision::Overwrite, err),
            "answer the decision");
    t.check(f.engine->waitFor(conflicting, 10s, job) && job.state == JobState::Completed,
            "answered job completes");
    std::string content;
    t.check(f.server->readFile("/home/notes.md", content) && content == "fresh notes",
            "overwrite replaced the content");

    err.clear();
    t.check(!f.engine->resolveOverwrite(conflicting, OverwriteDecision::Skip, err),
            "a finished job takes no decision");
}

void test_skip_and_rename(TestContext &t) {
    Fixture f;
    EventQueue events(f.bus);
    t.check(writeLocal(f.local("readme.txt"), "replacement"), "write readme");

    Error err;
    const auto skipped = f.upload(f.local("readme.txt"), "/readme.txt", err, OverwritePolicy::Skip);
    std::vector<Event> seen;
    t.check(collectUntilDone(events, skipped, seen), "skip job finishes");
    TransferJob job;
    f.engine->status(skipped, job, err);
    t.check(job.state == JobState::Completed && job.skipped, "skipped job is Completed and flagged");
    t.check(!seen.empty() && seen.back().message == "skipped: destination exists",
            "skip is reported with its reason");
    std::string content;
    t.check(f.server->readFile("/readme.txt", content) && content == std::string(1280, 'r'),
            "skip leaves the destination alone");

    const auto first = f.upload(f.local("readme.txt"), "/readme.txt", err, OverwritePolicy::Rename);
    t.check(f.engine->waitFor(first, 10s, job) && job.state == JobState::Completed,
            "rename job completes");
    t.check(job.dest_path == "/readme (1).txt", "rename picks the first free name");
    const auto second = f.upload(f.local("readme.txt"), "/readme.txt", err, OverwritePolicy::Rename);
    t.check(f.engine->waitFor(second, 10s, job) && job.dest_path == "/readme (2).txt",
            "rename skips names already taken");
    t.check(f.server->readFile("/readme (2).txt", content) && content == "replacement",
            "renamed upload has the new content");

    const QString localCopy = f.local("copy.txt");
    t.check(writeLocal(localCopy, "local"), "write local destination");
    const auto down = f.download("/readme.txt", localCopy, err, OverwritePolicy::Rename);
    t.check(f.engine->waitFor(down, 10s, job) && job.state == JobState::Completed,
            "renamed download completes");
    t.check(job.dest_path == f.local("copy (1).txt").toStdString(),
            "local rename uses the same naming");
    t.check(readLocal(localCopy) == "local", "original local file untouched");
}

void test_mkdir_and_delete(TestContext &t) {
    Fixture f;
    Error err;
    TransferJob job;

    TransferRequest mk;
    mk.kind = JobKind::Mkdir;
    mk.dest_path = "/home/alice";
    auto id = f.engine->enqueue(f.session, mk, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "mkdir of an existing directory succeeds");

    mk.dest_path = "/home/alice/new";
    id = f.engine->enqueue(f.session, mk, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed, "mkdir creates");
    t.check(f.server->hasPath("/home/alice/new"), "new directory exists");

    mk.dest_path = "/no/such/parent";
    id = f.engine->enqueue(f.session, mk, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Failed,
            "mkdir without a parent fails");
    t.check(job.error.code == ErrorCode::NotFound, "missing parent is NotFound");

    mk.dest_path = "/readme.txt";
    id = f.engine->enqueue(f.session, mk, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Failed,
            "mkdir over a file fails");

    TransferRequest del;
    del.kind = JobKind::Delete;
    del.dest_path = "/home/notes.md";
    id = f.engine->enqueue(f.session, del, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed, "delete a file");
    t.check(!f.server->hasPath("/home/notes.md"), "file is gone");

    del.dest_path = "/home/alice";
    id = f.engine->enqueue(f.session, del, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Failed,
            "non-empty directory is not deleted");
    t.check(f.server->hasPath("/home/alice/photo.jpg"), "directory contents survive");

    del.dest_path = "/home/alice/new";
    id = f.engine->enqueue(f.session, del, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "empty directory is deleted");

    const QString localFile = f.local("trash.txt");
    t.check(writeLocal(localFile, "x"), "write local file to delete");
    del.target = JobTarget::Local;
    del.dest_path = localFile.toStdString();
    id = f.engine->enqueue(f.session, del, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "local delete completes");
    t.check(!QFileInfo::exists(localFile), "local file is gone");

    mk.target = JobTarget::Local;
    mk.dest_path = f.local("made/here").toStdString();
    id = f.engine->enqueue(f.session, mk, err);
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "local mkdir completes");
    t.check(QFileInfo(f.local("made/here")).isDir(), "local directory exists");
}

void test_retry_and_clear(TestContext &t) {
    Fixture f;
    t.check(writeLocal(f.local("data.csv"), "a,b,c\n"), "write csv");
    f.server->failOn("/data.csv", Error::transfer(ErrorCode::QuotaExceeded, "Disk quota exceeded"));

    Error err;
    const auto id = f.upload(f.local("data.csv"), "/data.csv", err);
    TransferJob job;
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Failed, "upload fails");
    t.check(job.error.code == ErrorCode::QuotaExceeded, "failure keeps the server cause");
    t.check(job.retry_count == 0, "non-transient failures are not retried");

    const auto done = f.upload(f.local("data.csv"), "/other.csv", err);
    t.check(f.engine->waitFor(done, 10s, job) && job.state == JobState::Completed,
            "unrelated upload completes");
    err.clear();
    t.check(!f.engine->retry(done, err), "completed jobs cannot be retried");
    t.check(err.code == ErrorCode::Unsupported, "retry of a completed job is Unsupported");

    f.server->clearFailures();
    t.check(f.engine->retry(id, err), "retry the failed upload");
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "retried upload completes");

    t.check(f.engine->jobs().size() == 2, "two top-level jobs listed");
    t.check(f.engine->clearFinished() == 2, "both finished jobs are cleared");
    t.check(f.engine->jobs().empty(), "nothing left after clearing");
    err.clear();
    t.check(!f.engine->status(id, job, err), "cleared job is gone");
    t.check(err.is(ErrorDomain::Transfer, ErrorCode::NotFound), "cleared job is NotFound");
}

void test_unknown_and_invalid(TestContext &t) {
    Fixture f;
    Error err;
    TransferJob job;
    t.check(!f.engine->status(4242, job, err), "status of unknown job fails");
    t.check(err.code == ErrorCode::NotFound, "unknown job is NotFound");
    err.clear();
    t.check(!f.engine->cancel(4242, err) && err.code == ErrorCode::NotFound,
            "cancel of unknown job is NotFound");
    err.clear();
    t.check(!f.engine->pause(4242, err) && err.code == ErrorCode::NotFound,
            "pause of unknown job is NotFound");

    err.clear();
    t.check(f.upload(f.local("absent.bin"), "/absent.bin", err) == 0,
            "upload of a missing local file is rejected");
    t.check(err.code == ErrorCode::NotFound, "missing local file is NotFound");

    err.clear();
    TransferRequest r;
    r.kind = JobKind::UploadFile;
    t.check(f.engine->enqueue(f.session, r, err) == 0, "empty request is rejected");

    err.clear();
    t.check(f.engine->enqueue(nullptr, r, err) == 0, "request without a session is rejected");
    t.check(err.is(ErrorDomain::Session, ErrorCode::ConnectionLost), "missing session is reported");
}

void test_session_failure_fails_job(TestContext &t) {
    TransferSettings s = testSettings();
    s.chunk_size_bytes = kMiB;
    Fixture f(s);
    const std::string data = pattern(3 * kMiB);
    t.check(writeLocal(f.local("doomed.bin"), data), "write source");
    f.server->setAvailable(false);
    f.server->dropAfterWrites(1);

    Error err;
    const auto id = f.upload(f.local("doomed.bin"), "/doomed.bin", err);
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "job ends once the session gives up");
    t.check(job.state == JobState::Failed, "job fails when the session does not return");
    t.check(job.error.code == ErrorCode::ConnectionLost, "cause is the lost connection");
    t.check(job.error.offset == kMiB, "error carries the last confirmed offset");
    t.check(f.session->state() == SessionState::Failed, "session ended Failed");
}

void test_symlinked_directories(TestContext &t) {
    Fixture f;
    f.server->addFile("/loop/dir/file.txt", "inside");
    f.server->addSymlink("/loop/dir/back", "/loop");

    const QString dest = f.local("loop-copy");
    TransferRequest r;
    r.kind = JobKind::DownloadDir;
    r.source_path = "/loop";
    r.dest_path = dest.toStdString();
    Error err;
    auto id = f.engine->enqueue(f.session, r, err);
    t.check(id != 0, "enqueue download of a looping tree: " + err.toString());
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "looping remote tree finishes");
    t.check(job.state == JobState::Completed, "looping remote tree Completed");
    t.check(readLocal(dest + "/dir/file.txt") == "inside", "regular file downloaded");
    t.check(!QFileInfo::exists(dest + "/dir/back"), "remote symlinked directory not followed");

    const QString root = f.local("linked");
    const QString outside = f.local("outside");
    t.check(writeLocal(root + "/sub/a.txt", "a"), "write sub/a.txt");
    t.check(writeLocal(outside + "/shared.txt", "shared"), "write outside file");
    t.check(QFile::link(root, root + "/sub/loop"), "create local loop link");
    t.check(QFile::link(outside, root + "/external"), "create local external link");

    r.kind = JobKind::UploadDir;
    r.source_path = root.toStdString();
    r.dest_path = "/up-plain";
    id = f.engine->enqueue(f.session, r, err);
    t.check(f.engine->waitFor(id, 30s, job) && job.state == JobState::Completed,
            "upload without following links completes");
    t.check(f.server->hasPath("/up-plain/sub/a.txt"), "regular file uploaded");
    t.check(!f.server->hasPath("/up-plain/external"), "linked directory left out by default");
    t.check(!f.server->hasPath("/up-plain/sub/loop"), "looping link left out by default");

    r.dest_path = "/up-follow";
    r.follow_symlinks = true;
    id = f.engine->enqueue(f.session, r, err);
    t.check(f.engine->waitFor(id, 30s, job) && job.state == JobState::Completed,
            "upload following links completes");
    std::string content;
    t.check(f.server->readFile("/up-follow/external/shared.txt", content) && content == "shared",
            "linked directory followed on request");
    t.check(!f.server->hasPath("/up-follow/sub/loop"), "cycle back to the root is not entered");
}

void test_delete_remote_symlink(TestContext &t) {
    Fixture f;
    f.server->addSymlink("/home/link", "/home/alice");

    TransferRequest del;
    del.kind = JobKind::Delete;
    del.dest_path = "/home/link";
    Error err;
    const auto id = f.engine->enqueue(f.session, del, err);
    TransferJob job;
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
            "symlink to a directory is deleted");
    t.check(!f.server->hasPath("/home/link"), "link is gone");
    t.check(f.server->hasPath("/home/alice/photo.jpg"), "link target is untouched");
}

void test_progress_throttled(TestContext &t) {
    TransferSettings s = testSettings();
    s.progress_interval_ms = 100;
    Fixture f(s);
    EventQueue events(f.bus);
    const std::string data = pattern(8 * 64 * 1024);
    t.check(writeLocal(f.local("throttled.bin"), data), "write throttled source");
    f.server->setIoDelayMs(20);

    Error err;
    const auto started = std::chrono::steady_clock::now();
    const auto id = f.upload(f.local("throttled.bin"), "/throttled.bin", err);
    std::vector<Event> seen;
    t.check(collectUntilDone(events, id, seen), "throttled upload finishes");
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();

    const auto progress = progressOf(seen, id);
    std::uint64_t sum = 0;
    for (const Event &e : progress)
        sum += e.delta;
    t.check(!progress.empty(), "throttled upload still reports progress");
    t.check(static_cast<long long>(progress.size()) <= elapsedMs / 100 + 2,
            "at most one progress event per interval plus the final one");
    t.check(progress.size() < 8, "fewer events than chunks");
    t.check(sum == data.size(), "throttled deltas still add up to the file size");
    t.check(!progress.empty() && progress.back().bytes_done == data.size(),
            "final progress is always reported");
}

void test_concurrent_tree_waits_for_mkdir(TestContext &t) {
    TransferSettings s = testSettings();
    s.concurrent_jobs_per_session = 4;
    Fixture f(s);
    const QString root = f.local("deep");
    std::vector<std::string> files;
    QString dir = root;
    std::string remoteDir = "/deep";
    for (int level = 0; level < 4; ++level) {
        for (int i = 0; i < 3; ++i) {
            const QString name = QString("f%1.txt").arg(i);
            t.check(writeLocal(dir + "/" + name, "level " + std::to_string(level)),
                    "write nested file");
            files.push_back(remoteDir + "/" + name.toStdString());
        }
        const QString sub = QString("d%1").arg(level);
        dir += "/" + sub;
        remoteDir += "/" + sub.toStdString();
    }

    TransferRequest r;
    r.kind = JobKind::UploadDir;
    r.source_path = root.toStdString();
    r.dest_path = "/deep";
    Error err;
    const auto id = f.engine->enqueue(f.session, r, err);
    TransferJob job;
    t.check(f.engine->waitFor(id, 30s, job), "concurrent tree upload finishes");
    t.check(job.state == JobState::Completed, "concurrent tree upload Completed");
    bool allDone = true;
    for (const ChildOutcome &c : job.children)
        allDone = allDone && c.state == JobState::Completed;
    t.check(allDone, "every child completed");

    const std::vector<std::string> log = f.server->mutationLog();
    auto position = [&log](const std::string &entry) {
        for (std::size_t i = 0; i < log.size(); ++i)
            if (log[i] == entry)
                return static_cast<long>(i);
        return -1L;
    };
    bool ordered = true;
    for (const std::string &file : files) {
        const long opened = position("open " + file);
        const long made = position("mkdir " + RemotePath::parent(file));
        ordered = ordered && opened >= 0 && made >= 0 && made < opened;
    }
    t.check(ordered, "no file opens before its directory is created");
}

void test_lanes_released_after_disconnect(TestContext &t) {
    Fixture f;
    t.check(writeLocal(f.local("small.txt"), "small"), "write small source");
    Error err;
    TransferJob job;
    for (int round = 0; round < 4; ++round) {
        auto s = f.manager->connect(f.profile, err);
        t.check(s != nullptr, "connect another session: " + err.toString());
        if (!s)
            return;
        TransferRequest r;
        r.kind = JobKind::UploadFile;
        r.source_path = f.local("small.txt").toStdString();
        r.dest_path = "/small-" + std::to_string(round) + ".txt";
        const auto id = f.engine->enqueue(s, r, err);
        t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Completed,
                "upload on the short-lived session completes");
        t.check(f.engine->laneCount() == 1, "the session has a worker pool");
        f.manager->disconnect(s);

        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (f.engine->laneCount() != 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(5ms);
        t.check(f.engine->laneCount() == 0, "worker pool released after disconnect");

        err.clear();
        t.check(f.engine->enqueue(s, r, err) == 0, "ended session takes no new jobs");
        t.check(err.is(ErrorDomain::Session, ErrorCode::ConnectionLost),
                "enqueue on an ended session is ConnectionLost");
        err.clear();
    }
}

void test_disconnect_fails_queued_jobs(TestContext &t) {
    Fixture f;
    const std::string data = pattern(2 * kMiB);
    t.check(writeLocal(f.local("first.bin"), data), "write first source");
    t.check(writeLocal(f.local("second.bin"), "second"), "write second source");
    f.server->setIoDelayMs(20);

    Error err;
    auto s = f.manager->connect(f.profile, err);
    t.check(s != nullptr, "connect a session to end");
    if (!s)
        return;
    TransferRequest r;
    r.kind = JobKind::UploadFile;
    r.source_path = f.local("first.bin").toStdString();
    r.dest_path = "/first.bin";
    const auto running = f.engine->enqueue(s, r, err);
    r.source_path = f.local("second.bin").toStdString();
    r.dest_path = "/second.bin";
    const auto queued = f.engine->enqueue(s, r, err);
    t.check(waitForJobState(*f.engine, running, JobState::Running), "first job starts");

    f.manager->disconnect(s);
    TransferJob job;
    t.check(f.engine->waitFor(queued, 10s, job), "queued job ends with its session");
    t.check(job.state == JobState::Failed, "queued job fails");
    t.check(job.error.is(ErrorDomain::Session, ErrorCode::ConnectionLost),
            "queued job reports the lost connection");
    t.check(f.engine->waitFor(running, 10s, job), "running job ends with its session");
    t.check(job.state == JobState::Failed, "running job fails");
    t.check(job.error.code == ErrorCode::ConnectionLost, "running job reports the lost connection");

    err.clear();
    t.check(!f.engine->retry(queued, err), "job of an ended session cannot be retried");
    t.check(err.is(ErrorDomain::Session, ErrorCode::ConnectionLost),
            "retry on an ended session is ConnectionLost");
}

void test_cancelled_job_not_retried(TestContext &t) {
    Fixture f;
    t.check(writeLocal(f.local("stop.bin"), pattern(kMiB)), "write source");
    f.server->setIoDelayMs(20);

    Error err;
    const auto id = f.upload(f.local("stop.bin"), "/stop.bin", err);
    t.check(waitForJobState(*f.engine, id, JobState::Running), "upload starts");
    t.check(f.engine->cancel(id, err), "cancel the upload");
    TransferJob job;
    t.check(f.engine->waitFor(id, 10s, job) && job.state == JobState::Cancelled,
            "upload ends Cancelled");

    err.clear();
    t.check(!f.engine->retry(id, err), "cancelled job is final");
    t.check(err.code == ErrorCode::Unsupported, "retry of a cancelled job is Unsupported");
    f.engine->status(id, job, err);
    t.check(job.state == JobState::Cancelled, "job stays Cancelled");
}

} // namespace

int main() {
    TestContext t;
    test_upload_and_progress(t);
    test_resume_after_drop(t);
    test_restart_without_offset_write(t);
    test_download_resume(t);
    test_cancel(t);
    test_pause_resume(t);
    test_partial_failure_isolation(t);
    test_upload_tree(t);
    test_download_tree(t);
    test_prompt_does_not_block(t);
    test_skip_and_rename(t);
    test_mkdir_and_delete(t);
    test_retry_and_clear(t);
    test_unknown_and_invalid(t);
    test_session_failure_fails_job(t);
    test_symlinked_directories(t);
    test_delete_remote_symlink(t);
    test_progress_throttled(t);
    test_concurrent_tree_waits_for_mkdir(t);
    test_lanes_released_after_disconnect(t);
    test_disconnect_fails_queued_jobs(t);
    test_cancelled_job_not_retried(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpdesk_transfer_tests\n";
    return EXIT_SUCCESS;
}
