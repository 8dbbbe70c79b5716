// Authenticated sessions and their keep-alive / reconnect policy.
#pragma once
#include "AppConfig.hpp"
#include "ConnectionProfile.hpp"
#include "EventBus.hpp"
#include "ServiceTypes.hpp"
#include "sftpdesk/Error.hpp"
#include "sftpdesk/SftpClient.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace sftpdesk {

class CredentialVault;
class KnownHostsStore;

struct ReconnectPolicy {
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    int retry_ceiling = 5;  // SessionManager fills this from connection.retry_ceiling
    int probe_failure_threshold = 3;
};

// One live connection. The transport is only reachable through run(), which
// serializes calls and reports dropped connections to the reconnect loop.
class Session {
public:
    using Clock = std::chrono::steady_clock;
    using Operation = std::function<bool(SftpClient&, Error&)>;

    // Only SessionManager can name a Token, so only it constructs sessions.
    class Token {
        friend class SessionManager;
        Token() {}
    };

    Session(Token, std::uint64_t id, ConnectionProfile profile, SessionOptions options,
            ReconnectPolicy policy, int keepAliveSeconds,
            std::chrono::milliseconds reconnectBudget, EventBus& bus);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::uint64_t id() const { return id_; }
    const ConnectionProfile& profile() const { return profile_; }
    SessionState state() const;

    // Default time a paused transfer waits for this session to come back.
    std::chrono::milliseconds reconnectBudget() const { return reconnectBudget_; }

    // Fails with Session ConnectionLost unless Connected. A transient failure
    // inside fn moves the session to Reconnecting.
    bool run(const Operation& fn, Error& err);

    // Destroys a handle opened through run() under the transport lock.
    void closeFile(std::unique_ptr<RemoteFile>& file);

    // Blocks until Connected. Fails with ConnectionLost once the grace window
    // runs out or the session gives up; with Cancelled when interrupted().
    bool waitUntilConnected(std::chrono::milliseconds grace,
                            const std::function<bool()>& interrupted,
                            Error& err);

private:
    friend class SessionManager;

    void setState(SessionState s, const Error& cause = {});
    // Moves from -> to only if the session is still in `from`.
    bool transition(SessionState from, SessionState to, const Error& cause = {});
    void start();
    void stop();
    void serviceLoop();
    bool probeOnce(Error& err);
    void reconnect();
    std::chrono::milliseconds backoffDelay(int attempt);

    const std::uint64_t id_;
    const ConnectionProfile profile_;
    const SessionOptions options_;
    const ReconnectPolicy policy_;
    const int keepAliveSeconds_;
    const std::chrono::milliseconds reconnectBudget_;
    EventBus& bus_;

    mutable std::mutex mu_;  // state_, lastActivity_, lastProbe_, flags
    std::condition_variable cv_;
    SessionState state_ = SessionState::Connecting;
    Clock::time_point lastActivity_;
    Clock::time_point lastProbe_;
    int probeFailures_ = 0;
    bool stopping_ = false;

    std::mutex ioMutex_;  // transport calls
    std::unique_ptr<SftpClient> client_;

    std::mt19937 rng_;  // backoff jitter, service thread only
    std::thread worker_;
};

class SessionManager {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;
    // Asked when a first-seen host key shows up under the AcceptNew policy.
    using HostKeyPrompt = std::function<bool(const HostKeyInfo&)>;

    SessionManager(CredentialVault& vault, KnownHostsStore& knownHosts, EventBus& bus,
                   ConnectionSettings settings, ClientFactory factory,
                   ReconnectPolicy policy = {});
    ~SessionManager();

    std::shared_ptr<Session> connect(const ConnectionProfile& profile, Error& err,
                                     const HostKeyPrompt& acceptNewHost = {});
    // Safe on sessions that already failed or were disconnected.
    void disconnect(const std::shared_ptr<Session>& session);

    // One keep-alive probe right now, counted like the periodic ones.
    bool probe(const std::shared_ptr<Session>& session, Error& err);

    std::vector<std::shared_ptr<Session>> sessions() const;
    std::shared_ptr<Session> find(std::uint64_t id) const;

    const ConnectionSettings& settings() const { return settings_; }

private:
    CredentialVault& vault_;
    KnownHostsStore& knownHosts_;
    EventBus& bus_;
    const ConnectionSettings settings_;
    ClientFactory factory_;
    ReconnectPolicy policy_;

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<Session>> sessions_;
    std::atomic<std::uint64_t> nextId_{1};

    bool buildOptions(const ConnectionProfile& profile, const HostKeyPrompt& acceptNewHost,
                      SessionOptions& out, Error& err);
    std::chrono::milliseconds graceWindow(int timeoutSeconds) const;
};

} // namespace sftpdesk
