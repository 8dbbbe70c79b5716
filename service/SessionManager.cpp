// Session lifecycle: connect/authenticate, host identity checks, keep-alive
// probing and the reconnect loop. Each session owns one service thread.
#include "SessionManager.hpp"
#include "CredentialVault.hpp"
#include "KnownHostsStore.hpp"
#include <QFileInfo>
#include <QLoggingCategory>
#include <algorithm>

Q_LOGGING_CATEGORY(sdSession, "sftpdesk.session")

namespace sftpdesk {

namespace {

std::chrono::milliseconds backoffStep(const ReconnectPolicy& p, int attempt) {
    const int shift = std::min(attempt, 20);
    const auto step = p.backoff_base * (1LL << shift);
    return std::min<std::chrono::milliseconds>(step, p.backoff_cap);
}

} // namespace

// ---------------------------------------------------------------------------
// Session

Session::Session(Token, std::uint64_t id, ConnectionProfile profile, SessionOptions options,
                 ReconnectPolicy policy, int keepAliveSeconds,
                 std::chrono::milliseconds reconnectBudget, EventBus& bus)
    : id_(id),
      profile_(std::move(profile)),
      options_(std::move(options)),
      policy_(policy),
      keepAliveSeconds_(keepAliveSeconds),
      reconnectBudget_(reconnectBudget),
      bus_(bus),
      lastActivity_(Clock::now()),
      lastProbe_(Clock::now()),
      rng_(std::random_device{}()) {}

Session::~Session() {
    stop();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void Session::setState(SessionState s, const Error& cause) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == s)
            return;
        state_ = s;
        if (s == SessionState::Connected) {
            probeFailures_ = 0;
            lastActivity_ = Clock::now();
            lastProbe_ = lastActivity_;
        }
    }
    cv_.notify_all();
    qCInfo(sdSession) << "session state" << "id=" << id_
                      << "profile=" << QString::fromStdString(profile_.name)
                      << "state=" << sessionStateName(s);
    Event e;
    e.kind = EventKind::SessionStateChanged;
    e.session_id = id_;
    e.session_state = s;
    e.error = cause;
    e.message = cause.ok() ? std::string() : cause.message;
    bus_.publish(e);
}

bool Session::transition(SessionState from, SessionState to, const Error& cause) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != from || stopping_)
            return false;
    }
    setState(to, cause);
    return true;
}

bool Session::run(const Operation& fn, Error& err) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != SessionState::Connected) {
            err = Error::session(ErrorCode::ConnectionLost,
                                 std::string("Session is ") + sessionStateName(state_));
            return false;
        }
    }
    bool ok = false;
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (!client_) {
            err = Error::session(ErrorCode::ConnectionLost, "Transport released");
            return false;
        }
        ok = fn(*client_, err);
    }
    if (ok) {
        std::lock_guard<std::mutex> lk(mu_);
        lastActivity_ = Clock::now();
        return true;
    }
    if (err.isTransient()) {
        if (transition(SessionState::Connected, SessionState::Reconnecting, err))
            qCWarning(sdSession) << "transport failure, reconnecting" << "id=" << id_
                                 << QString::fromStdString(err.toString());
    }
    return false;
}

void Session::closeFile(std::unique_ptr<RemoteFile>& file) {
    std::lock_guard<std::mutex> io(ioMutex_);
    file.reset();
}

bool Session::waitUntilConnected(std::chrono::milliseconds grace,
                                 const std::function<bool()>& interrupted,
                                 Error& err) {
    const auto deadline = Clock::now() + grace;
    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (state_ == SessionState::Connected)
            return true;
        if (state_ == SessionState::Failed || state_ == SessionState::Disconnected || stopping_) {
            err = Error::session(ErrorCode::ConnectionLost,
                                 std::string("Session is ") + sessionStateName(state_));
            return false;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            err = Error::session(ErrorCode::ConnectionLost,
                                 "Session did not recover within the grace window");
            return false;
        }
        if (interrupted) {
            lk.unlock();
            const bool stop = interrupted();
            lk.lock();
            if (stop) {
                err = Error::transfer(ErrorCode::Cancelled, "Interrupted while waiting for reconnect");
                return false;
            }
        }
        cv_.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(50)));
    }
}

void Session::start() {
    worker_ = std::thread([this] { serviceLoop(); });
}

void Session::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (client_) {
            client_->disconnect();
            client_.reset();
        }
    }
    SessionState current;
    {
        std::lock_guard<std::mutex> lk(mu_);
        current = state_;
    }
    if (current != SessionState::Disconnected)
        setState(SessionState::Disconnected);
}

void Session::serviceLoop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_) {
        if (state_ == SessionState::Reconnecting) {
            lk.unlock();
            reconnect();
            lk.lock();
            continue;
        }
        if (state_ != SessionState::Connected)
            break;
        auto wake = [this] { return stopping_ || state_ != SessionState::Connected; };
        if (keepAliveSeconds_ <= 0) {
            cv_.wait(lk, wake);
            continue;
        }
        const auto due = std::max(lastActivity_, lastProbe_) + std::chrono::seconds(keepAliveSeconds_);
        if (Clock::now() < due) {
            cv_.wait_until(lk, due, wake);
            continue;
        }
        lk.unlock();
        Error err;
        (void)probeOnce(err);
        lk.lock();
    }
}

bool Session::probeOnce(Error& err) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != SessionState::Connected) {
            err = Error::session(ErrorCode::ConnectionLost,
                                 std::string("Session is ") + sessionStateName(state_));
            return false;
        }
    }
    bool ok = false;
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (client_)
            ok = client_->keepAlive(err);
        else
            err = Error::session(ErrorCode::ConnectionLost, "Transport released");
    }
    bool exhausted = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        lastProbe_ = Clock::now();
        if (ok) {
            probeFailures_ = 0;
            lastActivity_ = lastProbe_;
        } else {
            ++probeFailures_;
            exhausted = probeFailures_ >= policy_.probe_failure_threshold;
        }
    }
    if (!ok) {
        qCWarning(sdSession) << "keep-alive probe failed" << "id=" << id_
                             << QString::fromStdString(err.toString());
        if (exhausted)
            transition(SessionState::Connected, SessionState::Reconnecting, err);
    }
    return ok;
}

std::chrono::milliseconds Session::backoffDelay(int attempt) {
    const auto step = backoffStep(policy_, attempt);
    std::uniform_real_distribution<double> jitter(0.5, 1.0);
    return std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(step.count()) * jitter(rng_)));
}

void Session::reconnect() {
    Error last = Error::session(ErrorCode::ConnectionLost, "Connection lost");
    for (int attempt = 0; attempt < policy_.retry_ceiling; ++attempt) {
        const auto delay = backoffDelay(attempt);
        {
            std::unique_lock<std::mutex> lk(mu_);
            if (cv_.wait_for(lk, delay, [this] { return stopping_; }))
                return;
        }
        // Only this thread replaces client_ while the session is alive, so
        // the factory call needs no transport lock.
        Error err;
        std::unique_ptr<SftpClient> fresh =
            client_ ? client_->newConnectionLike(options_, err) : nullptr;
        if (fresh) {
            {
                std::lock_guard<std::mutex> io(ioMutex_);
                if (client_)
                    client_->disconnect();
                client_ = std::move(fresh);
            }
            qCInfo(sdSession) << "reconnected" << "id=" << id_ << "attempt=" << attempt + 1;
            transition(SessionState::Reconnecting, SessionState::Connected);
            return;
        }
        if (!client_)
            err = Error::session(ErrorCode::ConnectionLost, "Transport released");
        last = err;
        qCWarning(sdSession) << "reconnect attempt failed" << "id=" << id_
                             << "attempt=" << attempt + 1 << "of" << policy_.retry_ceiling
                             << QString::fromStdString(err.toString());
        // Credentials or host identity will not fix themselves.
        if (!err.isTransient())
            break;
    }
    {
        std::lock_guard<std::mutex> io(ioMutex_);
        if (client_) {
            client_->disconnect();
            client_.reset();
        }
    }
    qCWarning(sdSession) << "giving up on session" << "id=" << id_;
    transition(SessionState::Reconnecting, SessionState::Failed, last);
}

// ---------------------------------------------------------------------------
// SessionManager

SessionManager::SessionManager(CredentialVault& vault, KnownHostsStore& knownHosts,
                               EventBus& bus, ConnectionSettings settings,
                               ClientFactory factory, ReconnectPolicy policy)
    : vault_(vault),
      knownHosts_(knownHosts),
      bus_(bus),
      settings_(settings),
      factory_(std::move(factory)),
      policy_(policy) {
    policy_.retry_ceiling = settings_.retry_ceiling;
}

SessionManager::~SessionManager() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.swap(sessions_);
    }
    for (auto& s : all)
        s->stop();
}

std::chrono::milliseconds SessionManager::graceWindow(int timeoutSeconds) const {
    if (settings_.reconnect_grace_seconds > 0)
        return std::chrono::seconds(settings_.reconnect_grace_seconds);
    // Long enough for every reconnect attempt at its longest backoff step,
    // each one running into the connect timeout.
    std::chrono::milliseconds total = policy_.backoff_base;
    for (int i = 0; i < policy_.retry_ceiling; ++i)
        total += backoffStep(policy_, i) + std::chrono::seconds(timeoutSeconds);
    return total;
}

bool SessionManager::buildOptions(const ConnectionProfile& profile,
                                  const HostKeyPrompt& acceptNewHost,
                                  SessionOptions& opt, Error& err) {
    opt = SessionOptions{};
    opt.host = profile.host;
    opt.port = profile.port;
    opt.username = profile.username;
    opt.timeout_seconds =
        profile.timeout_seconds > 0 ? profile.timeout_seconds : settings_.timeout_seconds;

    if (profile.auth_method == AuthMethod::Password) {
        if (profile.secret_ref.empty()) {
            err = Error::session(ErrorCode::AuthFailed,
                                 "Profile '" + profile.name + "' has no stored password");
            return false;
        }
        std::string password;
        if (!vault_.unwrap(profile.secret_ref, password, err))
            return false;
        opt.password = std::move(password);
    } else {
        const QFileInfo key(QString::fromStdString(profile.key_path));
        if (!key.isFile() || !key.isReadable()) {
            err = Error::session(ErrorCode::AuthFailed,
                                 "Private key is not readable: " + profile.key_path);
            return false;
        }
        opt.private_key_path = profile.key_path;
        if (!profile.passphrase_ref.empty()) {
            std::string passphrase;
            if (!vault_.unwrap(profile.passphrase_ref, passphrase, err))
                return false;
            opt.private_key_passphrase = std::move(passphrase);
        }
    }

    const KnownHostsPolicy policy = settings_.known_hosts_policy;
    KnownHostsStore* store = &knownHosts_;
    opt.hostkey_verify_cb = [policy, store, acceptNewHost](const HostKeyInfo& key,
                                                           std::string& reason) {
        if (policy == KnownHostsPolicy::Off)
            return true;
        switch (store->check(key)) {
        case KnownHostsStore::Match::Match:
            return true;
        case KnownHostsStore::Match::Mismatch:
            reason = "Host key for " + key.host + ":" + std::to_string(key.port) +
                     " does not match the recorded key (presented " + key.fingerprint + ")";
            return false;
        case KnownHostsStore::Match::NotFound:
            break;
        }
        if (policy == KnownHostsPolicy::Strict) {
            reason = "Unknown host key for " + key.host + " (strict policy)";
            return false;
        }
        if (!acceptNewHost || !acceptNewHost(key)) {
            reason = "First-seen host key for " + key.host + " was not accepted";
            return false;
        }
        Error saveErr;
        if (!store->remember(key, saveErr)) {
            qCWarning(sdSession) << "could not record accepted host key"
                                 << QString::fromStdString(saveErr.message);
        }
        return true;
    };
    return true;
}

std::shared_ptr<Session> SessionManager::connect(const ConnectionProfile& profile, Error& err,
                                                 const HostKeyPrompt& acceptNewHost) {
    SessionOptions opt;
    if (!buildOptions(profile, acceptNewHost, opt, err)) {
        qCWarning(sdSession) << "cannot prepare connection"
                             << "profile=" << QString::fromStdString(profile.name)
                             << QString::fromStdString(err.toString());
        return nullptr;
    }
    const int keepAlive = profile.keep_alive_interval_seconds > 0
                              ? profile.keep_alive_interval_seconds
                              : settings_.keep_alive_interval_seconds;
    auto session = std::make_shared<Session>(Session::Token(), nextId_++, profile, opt, policy_,
                                             keepAlive, graceWindow(opt.timeout_seconds), bus_);
    {
        Event e;
        e.kind = EventKind::SessionStateChanged;
        e.session_id = session->id();
        e.session_state = SessionState::Connecting;
        bus_.publish(e);
    }

    std::unique_ptr<SftpClient> client = factory_ ? factory_() : nullptr;
    if (!client) {
        err = Error::session(ErrorCode::Unsupported, "No transport available");
        session->setState(SessionState::Failed, err);
        return nullptr;
    }
    if (!client->connect(opt, err)) {
        qCWarning(sdSession) << "connect failed"
                             << "profile=" << QString::fromStdString(profile.name)
                             << QString::fromStdString(err.toString());
        session->setState(SessionState::Failed, err);
        return nullptr;
    }
    {
        std::lock_guard<std::mutex> io(session->ioMutex_);
        session->client_ = std::move(client);
    }
    session->setState(SessionState::Connected);
    session->start();

    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const std::shared_ptr<Session>& s) {
                                       const SessionState st = s->state();
                                       return st == SessionState::Failed ||
                                              st == SessionState::Disconnected;
                                   }),
                    sessions_.end());
    sessions_.push_back(session);
    return session;
}

void SessionManager::disconnect(const std::shared_ptr<Session>& session) {
    if (!session)
        return;
    session->stop();
    std::lock_guard<std::mutex> lk(mu_);
    sessions_.erase(std::remove(sessions_.begin(), sessions_.end(), session), sessions_.end());
}

bool SessionManager::probe(const std::shared_ptr<Session>& session, Error& err) {
    if (!session) {
        err = Error::session(ErrorCode::ConnectionLost, "No session");
        return false;
    }
    return session->probeOnce(err);
}

std::vector<std::shared_ptr<Session>> SessionManager::sessions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_;
}

std::shared_ptr<Session> SessionManager::find(std::uint64_t id) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& s : sessions_)
        if (s->id() == id)
            return s;
    return nullptr;
}

} // namespace sftpdesk
