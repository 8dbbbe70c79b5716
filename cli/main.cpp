// Headless front end: profile maintenance plus one-shot remote operations.
#include "AppConfig.hpp"
#include "CredentialVault.hpp"
#include "DirectoryCache.hpp"
#include "EventBus.hpp"
#include "KnownHostsStore.hpp"
#include "Navigator.hpp"
#include "ProfileStore.hpp"
#include "SessionManager.hpp"
#include "TransferEngine.hpp"
#include "sftpdesk/Libssh2SftpClient.hpp"
#include "sftpdesk/MockSftpClient.hpp"
#include "sftpdesk/RemotePath.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace sftpdesk;

namespace {

enum ExitCode { kOk = 0, kFailed = 1, kUsage = 2 };

int fail(const Error& err) {
    std::cerr << "error: " << err.toString() << std::endl;
    return kFailed;
}

int usage(const QString& message) {
    std::cerr << "usage: " << message.toStdString() << std::endl;
    return kUsage;
}

std::string readLine(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

std::string humanSize(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return QString::number(v, 'f', u == 0 ? 0 : 1).toStdString() + " " + units[u];
}

// Everything a command may need, built from the data directory.
struct App {
    DataPaths paths;
    AppConfig config;
    EventBus bus;
    std::unique_ptr<CredentialVault> vault;
    std::unique_ptr<ProfileStore> profiles;
    std::unique_ptr<KnownHostsStore> knownHosts;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<TransferEngine> engine;
    std::shared_ptr<MockSftpServer> demoServer;
    bool trustNewHosts = false;

    bool open(bool useMock, Error& err) {
        vault = std::make_unique<CredentialVault>(paths.vault_key);
        profiles = std::make_unique<ProfileStore>(paths.profiles);
        if (!profiles->load(err))
            return false;
        knownHosts = std::make_unique<KnownHostsStore>(paths.known_hosts);
        if (!knownHosts->load(err))
            return false;

        SessionManager::ClientFactory factory;
        if (useMock) {
            demoServer = std::make_shared<MockSftpServer>();
            auto server = demoServer;
            factory = [server] { return std::make_unique<MockSftpClient>(server); };
        } else {
            factory = [] { return std::make_unique<Libssh2SftpClient>(); };
        }
        ReconnectPolicy policy;
        policy.retry_ceiling = config.connection.retry_ceiling;
        sessions = std::make_unique<SessionManager>(*vault, *knownHosts, bus, config.connection,
                                                    factory, policy);
        engine = std::make_unique<TransferEngine>(bus, config.transfer);
        return true;
    }

    std::shared_ptr<Session> connect(const std::string& profileName, Error& err) {
        ConnectionProfile profile;
        if (!profiles->get(profileName, profile, err))
            return nullptr;
        if (profile.auth_method == AuthMethod::Password && profile.secret_ref.empty()) {
            // Imported without its secret: ask now, keep it for this run only.
            const std::string password = readLine("Password for " + profile.name + ": ");
            if (!vault->wrap(password, profile.secret_ref, err))
                return nullptr;
        }
        const bool trust = trustNewHosts;
        return sessions->connect(profile, err, [trust](const HostKeyInfo& key) {
            std::cerr << "The authenticity of host '" << key.host << ":" << key.port
                      << "' can't be established.\n"
                      << key.algorithm << " key fingerprint is " << key.fingerprint << "\n";
            if (trust)
                return true;
            const std::string answer = readLine("Trust this host and remember its key? [y/N] ");
            return answer == "y" || answer == "Y" || answer == "yes";
        });
    }
};

void printEntries(const std::vector<DirectoryEntry>& entries) {
    for (const auto& e : entries) {
        const QString when = QDateTime::fromSecsSinceEpoch(static_cast<qint64>(e.modified_time))
                                 .toString(QStringLiteral("yyyy-MM-dd HH:mm"));
        std::cout << permissionString(e.permissions, e.is_dir, e.is_symlink) << "  "
                  << QString::number(static_cast<qulonglong>(e.size)).rightJustified(12).toStdString()
                  << "  " << when.toStdString() << "  " << e.name << (e.is_dir ? "/" : "") << "\n";
    }
}

// Drives one job to completion, printing progress and answering overwrite
// prompts on the terminal.
int runJob(App& app, const std::shared_ptr<Session>& session, const TransferRequest& request) {
    EventQueue events(app.bus);
    Error err;
    const std::uint64_t id = app.engine->enqueue(session, request, err);
    if (id == 0)
        return fail(err);

    while (true) {
        Event e;
        if (!events.waitNext(e, std::chrono::milliseconds(500))) {
            TransferJob snap;
            if (app.engine->status(id, snap, err) && isTerminal(snap.state))
                break;
            continue;
        }
        switch (e.kind) {
        case EventKind::TransferProgress: {
            std::cerr << "\r" << e.path << "  " << humanSize(e.bytes_done) << " / "
                      << humanSize(e.bytes_total) << std::flush;
            if (e.bytes_done >= e.bytes_total)
                std::cerr << "\n";
            break;
        }
        case EventKind::OverwriteDecisionRequested: {
            std::string answer =
                readLine("\n" + e.path + " exists. [s]kip, [o]verwrite, [r]ename? ");
            OverwriteDecision d = OverwriteDecision::Skip;
            if (!answer.empty() && (answer[0] == 'o' || answer[0] == 'O'))
                d = OverwriteDecision::Overwrite;
            else if (!answer.empty() && (answer[0] == 'r' || answer[0] == 'R'))
                d = OverwriteDecision::Rename;
            if (!app.engine->resolveOverwrite(e.job_id, d, err))
                return fail(err);
            break;
        }
        case EventKind::SessionStateChanged:
            if (e.session_state == SessionState::Reconnecting)
                std::cerr << "\nconnection lost, reconnecting...\n";
            break;
        default:
            break;
        }
        if ((e.kind == EventKind::TransferCompleted || e.kind == EventKind::TransferFailed) &&
            e.job_id == id)
            break;
    }

    TransferJob job;
    app.engine->waitFor(id, std::chrono::milliseconds(1000), job);
    for (const auto& c : job.children) {
        if (c.state == JobState::Failed)
            std::cerr << "  failed: " << c.path << ": " << c.error.toString() << "\n";
        else if (c.skipped)
            std::cerr << "  skipped: " << c.path << "\n";
    }
    if (job.state != JobState::Completed) {
        std::cerr << jobStateName(job.state) << ": " << job.error.toString() << std::endl;
        return kFailed;
    }
    if (job.skipped)
        std::cerr << "skipped: " << job.dest_path << " already exists" << std::endl;
    return kOk;
}

int cmdProfiles(App& app) {
    for (const auto& p : app.profiles->list()) {
        std::cout << p.name << "\t" << p.username << "@" << p.host << ":" << p.port << "\t"
                  << authMethodName(p.auth_method);
        if (!p.description.empty())
            std::cout << "\t" << p.description;
        std::cout << "\n";
    }
    return kOk;
}

int cmdAddProfile(App& app, const QCommandLineParser& parser, const QStringList& args) {
    if (args.size() < 4)
        return usage(QStringLiteral("add-profile NAME HOST USER [--port N] [--key PATH] [--description TEXT]"));
    ConnectionProfile p;
    p.name = args.at(1).toStdString();
    p.host = args.at(2).toStdString();
    p.username = args.at(3).toStdString();
    bool okPort = true;
    const int port = parser.value(QStringLiteral("port")).toInt(&okPort);
    if (!okPort || port < 1 || port > 65535)
        return usage(QStringLiteral("--port must be between 1 and 65535"));
    p.port = static_cast<std::uint16_t>(port);
    p.description = parser.value(QStringLiteral("description")).toStdString();

    Error err;
    if (parser.isSet(QStringLiteral("key"))) {
        p.auth_method = AuthMethod::PrivateKey;
        p.key_path = QFileInfo(parser.value(QStringLiteral("key"))).absoluteFilePath().toStdString();
        const std::string passphrase = readLine("Key passphrase (empty for none): ");
        if (!passphrase.empty() && !app.vault->wrap(passphrase, p.passphrase_ref, err))
            return fail(err);
    } else {
        p.auth_method = AuthMethod::Password;
        const std::string password = readLine("Password: ");
        if (!app.vault->wrap(password, p.secret_ref, err))
            return fail(err);
    }
    if (!app.profiles->upsert(p, err))
        return fail(err);
    std::cout << "saved profile " << p.name << std::endl;
    return kOk;
}

int cmdConfig(App& app, const QStringList& args) {
    if (args.size() == 1) {
        for (const auto& key : AppConfig::keys())
            std::cout << key << " = " << app.config.get(key) << "\n";
        return kOk;
    }
    const std::string key = args.at(1).toStdString();
    Error err;
    if (args.size() == 2) {
        const auto& keys = AppConfig::keys();
        if (std::find(keys.begin(), keys.end(), key) == keys.end())
            return fail(Error::store(ErrorCode::ValidationFailed, "Unknown setting: " + key));
        std::cout << app.config.get(key) << std::endl;
        return kOk;
    }
    if (!app.config.set(key, args.at(2).toStdString(), err) || !app.config.save(app.paths.config, err))
        return fail(err);
    return kOk;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("sftpdesk"));
    QCoreApplication::setApplicationName(QStringLiteral("sftpdesk"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.4.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "SFTP profiles and transfers.\n\n"
        "Commands:\n"
        "  profiles                          list saved profiles\n"
        "  add-profile NAME HOST USER        add or replace a profile (prompts for the secret)\n"
        "  remove-profile NAME\n"
        "  export FILE                       write profiles to FILE\n"
        "  import FILE                       add profiles from FILE (all or nothing;\n"
        "                                    existing names are kept unless --replace)\n"
        "  rotate-key                        re-encrypt stored secrets under a new key\n"
        "  config [KEY [VALUE]]              show or change settings\n"
        "  ls PROFILE [PATH]\n"
        "  get PROFILE REMOTE [LOCAL]\n"
        "  put PROFILE LOCAL [REMOTE]\n"
        "  mkdir PROFILE REMOTE\n"
        "  rm PROFILE REMOTE\n"
        "  mv PROFILE FROM TO"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("Settings file."), QStringLiteral("file")},
        {QStringLiteral("data-dir"), QStringLiteral("Directory holding profiles, keys and known hosts."),
         QStringLiteral("dir")},
        {QStringLiteral("port"), QStringLiteral("SSH port for add-profile."), QStringLiteral("port"),
         QStringLiteral("22")},
        {QStringLiteral("key"), QStringLiteral("Private key file for add-profile."), QStringLiteral("path")},
        {QStringLiteral("description"), QStringLiteral("Profile description."), QStringLiteral("text")},
        {QStringLiteral("include-secrets"), QStringLiteral("Keep encrypted secrets in exports.")},
        {QStringLiteral("replace"), QStringLiteral("Let imported profiles replace existing names.")},
        {{QStringLiteral("r"), QStringLiteral("recursive")}, QStringLiteral("Transfer directories.")},
        {QStringLiteral("follow-symlinks"), QStringLiteral("Recurse into symlinked directories.")},
        {QStringLiteral("overwrite"), QStringLiteral("skip, overwrite, rename or prompt."),
         QStringLiteral("policy")},
        {QStringLiteral("trust-new-host"), QStringLiteral("Accept and remember unknown host keys.")},
        {QStringLiteral("demo"), QStringLiteral("Use the built-in in-memory server.")},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(kUsage);
    const QString command = args.first();

    App ctx;
    ctx.paths = parser.isSet(QStringLiteral("data-dir"))
                    ? DataPaths::inDirectory(parser.value(QStringLiteral("data-dir")))
                    : DataPaths::defaults();
    if (parser.isSet(QStringLiteral("config")))
        ctx.paths.config = parser.value(QStringLiteral("config"));
    ctx.trustNewHosts = parser.isSet(QStringLiteral("trust-new-host"));

    Error err;
    if (!AppConfig::load(ctx.paths.config, ctx.config, err))
        return fail(err);
    if (parser.isSet(QStringLiteral("overwrite")) &&
        !ctx.config.set("transfer.overwrite_policy", parser.value(QStringLiteral("overwrite")).toStdString(), err))
        return fail(err);
    ctx.config.applyLogging();
    if (!ctx.open(parser.isSet(QStringLiteral("demo")), err))
        return fail(err);

    if (command == QLatin1String("profiles"))
        return cmdProfiles(ctx);
    if (command == QLatin1String("add-profile"))
        return cmdAddProfile(ctx, parser, args);
    if (command == QLatin1String("config"))
        return cmdConfig(ctx, args);
    if (command == QLatin1String("remove-profile")) {
        if (args.size() < 2)
            return usage(QStringLiteral("remove-profile NAME"));
        return ctx.profiles->remove(args.at(1).toStdString(), err) ? kOk : fail(err);
    }
    if (command == QLatin1String("export")) {
        if (args.size() < 2)
            return usage(QStringLiteral("export FILE [--include-secrets]"));
        return ctx.profiles->exportToFile(args.at(1), parser.isSet(QStringLiteral("include-secrets")), err)
                   ? kOk
                   : fail(err);
    }
    if (command == QLatin1String("import")) {
        if (args.size() < 2)
            return usage(QStringLiteral("import FILE [--replace]"));
        ImportSummary summary;
        if (!ctx.profiles->importFromFile(args.at(1), err, parser.isSet(QStringLiteral("replace")),
                                          &summary))
            return fail(err);
        std::cout << "imported " << summary.added << " new, " << summary.replaced
                  << " replaced, " << summary.skipped << " skipped" << std::endl;
        for (const auto& name : summary.needs_password)
            std::cout << "  " << name << ": no stored password, asked for on connect" << std::endl;
        return kOk;
    }
    if (command == QLatin1String("rotate-key")) {
        if (!ctx.profiles->rotateVaultKey(*ctx.vault, err))
            return fail(err);
        std::cout << "vault key rotated" << std::endl;
        return kOk;
    }

    // Remote commands from here on.
    static const QStringList remoteCommands = {QStringLiteral("ls"), QStringLiteral("get"),
                                               QStringLiteral("put"), QStringLiteral("mkdir"),
                                               QStringLiteral("rm"), QStringLiteral("mv")};
    if (!remoteCommands.contains(command))
        return usage(QStringLiteral("unknown command '%1' (see --help)").arg(command));
    if (args.size() < 2)
        return usage(command + QStringLiteral(" PROFILE ..."));

    auto session = ctx.connect(args.at(1).toStdString(), err);
    if (!session)
        return fail(err);
    const bool recursive = parser.isSet(QStringLiteral("recursive"));
    const bool followLinks = parser.isSet(QStringLiteral("follow-symlinks"));
    int rc = kOk;

    if (command == QLatin1String("ls")) {
        DirectoryCache cache(ctx.bus);
        Navigator nav(cache, session);
        std::vector<DirectoryEntry> entries;
        const std::string path = args.size() > 2 ? args.at(2).toStdString() : std::string("/");
        rc = nav.navigate(Navigator::Pane::Remote, path, entries, err) ? kOk : fail(err);
        if (rc == kOk)
            printEntries(entries);
    } else if (command == QLatin1String("get")) {
        if (args.size() < 3) {
            rc = usage(QStringLiteral("get PROFILE REMOTE [LOCAL] [-r]"));
        } else {
            TransferRequest req;
            req.kind = recursive ? JobKind::DownloadDir : JobKind::DownloadFile;
            req.source_path = args.at(2).toStdString();
            const QString local = args.size() > 3
                                      ? args.at(3)
                                      : QString::fromStdString(RemotePath::baseName(req.source_path));
            req.dest_path = QFileInfo(local).absoluteFilePath().toStdString();
            req.follow_symlinks = followLinks;
            rc = runJob(ctx, session, req);
        }
    } else if (command == QLatin1String("put")) {
        if (args.size() < 3) {
            rc = usage(QStringLiteral("put PROFILE LOCAL [REMOTE] [-r]"));
        } else {
            TransferRequest req;
            const QFileInfo local(args.at(2));
            req.kind = recursive ? JobKind::UploadDir : JobKind::UploadFile;
            req.source_path = local.absoluteFilePath().toStdString();
            req.dest_path = args.size() > 3 ? args.at(3).toStdString()
                                            : RemotePath::join("/", local.fileName().toStdString());
            req.follow_symlinks = followLinks;
            rc = runJob(ctx, session, req);
        }
    } else if (command == QLatin1String("mkdir") || command == QLatin1String("rm")) {
        if (args.size() < 3) {
            rc = usage(command + QStringLiteral(" PROFILE REMOTE"));
        } else {
            TransferRequest req;
            req.kind = command == QLatin1String("mkdir") ? JobKind::Mkdir : JobKind::Delete;
            req.target = JobTarget::Remote;
            req.dest_path = args.at(2).toStdString();
            rc = runJob(ctx, session, req);
        }
    } else if (command == QLatin1String("mv")) {
        if (args.size() < 4) {
            rc = usage(QStringLiteral("mv PROFILE FROM TO"));
        } else {
            DirectoryCache cache(ctx.bus);
            Navigator nav(cache, session);
            rc = nav.rename(args.at(2).toStdString(), args.at(3).toStdString(), err) ? kOk : fail(err);
        }
    }

    ctx.engine.reset();
    ctx.sessions->disconnect(session);
    return rc;
}
