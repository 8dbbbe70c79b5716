// Profile store, known hosts and configuration tests (run via CTest).
#include "AppConfig.hpp"
#include "CredentialVault.hpp"
#include "KnownHostsStore.hpp"
#include "ProfileStore.hpp"

#include <QFile>
#include <QTemporaryDir>

#include <atomic>
#include <cstdlib>
#include <iostream>
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

ConnectionProfile passwordProfile(CredentialVault &vault, const std::string &name,
                                  const std::string &password = "s3cret") {
    ConnectionProfile p;
    p.name = name;
    p.host = name + ".example.test";
    p.username = "deploy";
    p.auth_method = AuthMethod::Password;
    Error err;
    vault.wrap(password, p.secret_ref, err);
    return p;
}

std::string readAll(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll().toStdString();
}

void test_upsert_get_list(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    t.check(store.load(err), "loading a missing file yields an empty store");
    t.check(store.list().empty(), "fresh store is empty");

    t.check(store.upsert(passwordProfile(vault, "prod"), err), "upsert prod");
    t.check(store.upsert(passwordProfile(vault, "staging"), err), "upsert staging");
    t.check(store.upsert(passwordProfile(vault, "dev"), err), "upsert dev");
    const auto all = store.list();
    t.check(all.size() == 3, "three profiles stored");
    if (all.size() == 3) {
        t.check(all[0].name == "prod" && all[1].name == "staging" && all[2].name == "dev",
                "list keeps insertion order");
    }

    ConnectionProfile got;
    t.check(store.get("staging", got, err), "get existing profile");
    t.check(got.host == "staging.example.test", "get returns the stored profile");

    err.clear();
    t.check(!store.get("missing", got, err), "get unknown profile fails");
    t.check(err.is(ErrorDomain::Store, ErrorCode::NotFound), "get unknown reports NotFound");

    err.clear();
    t.check(!store.remove("missing", err), "delete unknown profile fails");
    t.check(err.is(ErrorDomain::Store, ErrorCode::NotFound), "delete unknown reports NotFound");
    t.check(store.remove("staging", err), "delete existing profile");
    t.check(store.list().size() == 2, "delete removes exactly one profile");
}

void test_upsert_idempotent(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    const ConnectionProfile p = passwordProfile(vault, "prod");
    t.check(store.upsert(p, err), "first upsert");
    t.check(store.upsert(p, err), "second upsert of the same profile");
    t.check(store.list().size() == 1, "same profile twice yields one entry");

    ConnectionProfile changed = p;
    changed.port = 2222;
    t.check(store.upsert(changed, err), "upsert with a changed field");
    ConnectionProfile got;
    t.check(store.get("prod", got, err) && got.port == 2222, "upsert overwrites in place");
    t.check(store.list().size() == 1, "overwrite does not add an entry");
}

void test_persistence_and_no_plaintext(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("profiles.json");
    CredentialVault vault(dir.filePath("vault.key"));
    Error err;
    {
        ProfileStore store(path);
        t.check(store.upsert(passwordProfile(vault, "prod", "very-secret-password"), err),
                "upsert before reload");
    }
    t.check(readAll(path).find("very-secret-password") == std::string::npos,
            "the password never reaches the file in clear text");

    ProfileStore reloaded(path);
    t.check(reloaded.load(err), "reload from disk");
    ConnectionProfile got;
    t.check(reloaded.get("prod", got, err), "profile survives a reload");
    std::string plain;
    t.check(vault.unwrap(got.secret_ref, plain, err) && plain == "very-secret-password",
            "stored secret unwraps to the original password");
}

void test_validation(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;

    ConnectionProfile noSecret = passwordProfile(vault, "a");
    noSecret.secret_ref.clear();
    t.check(!store.upsert(noSecret, err), "password profile without secret is rejected");
    t.check(err.is(ErrorDomain::Store, ErrorCode::ValidationFailed),
            "missing secret reports ValidationFailed");

    ConnectionProfile both = passwordProfile(vault, "b");
    both.key_path = "/home/me/.ssh/id_ed25519";
    err.clear();
    t.check(!store.upsert(both, err), "password profile with key_path is rejected");

    ConnectionProfile keyOnly;
    keyOnly.name = "c";
    keyOnly.host = "h";
    keyOnly.username = "u";
    keyOnly.auth_method = AuthMethod::PrivateKey;
    err.clear();
    t.check(!store.upsert(keyOnly, err), "key profile without key_path is rejected");
    keyOnly.key_path = "/home/me/.ssh/id_ed25519";
    t.check(store.upsert(keyOnly, err), "key profile with key_path is accepted");

    ConnectionProfile plaintext = passwordProfile(vault, "d");
    plaintext.secret_ref = "hunter2";
    err.clear();
    t.check(!store.upsert(plaintext, err), "plaintext secret is rejected");
    t.checkContains(err.message, "vault", "rejection mentions the vault");

    ConnectionProfile noHost = passwordProfile(vault, "e");
    noHost.host.clear();
    err.clear();
    t.check(!store.upsert(noHost, err), "profile without host is rejected");
    t.check(store.list().size() == 1, "only the valid profile was stored");
}

void test_import_all_or_nothing(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    t.check(store.upsert(passwordProfile(vault, "existing"), err), "seed one profile");

    std::vector<ConnectionProfile> batch = {passwordProfile(vault, "one"),
                                            passwordProfile(vault, "two")};
    ConnectionProfile bad = passwordProfile(vault, "three");
    bad.secret_ref = "hunter2";
    batch.push_back(bad);
    t.check(!store.importProfiles(batch, err), "import with one invalid profile fails");
    t.check(store.list().size() == 1, "failed import changes nothing");

    batch.pop_back();
    t.check(store.importProfiles(batch, err), "import of valid profiles succeeds");
    t.check(store.list().size() == 3, "import adds every profile");
}

void test_export_import_file(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    t.check(store.upsert(passwordProfile(vault, "prod"), err), "seed for export");

    const QString bare = dir.filePath("export-bare.json");
    const QString full = dir.filePath("export-full.json");
    t.check(store.exportToFile(bare, false, err), "export without secrets");
    t.check(store.exportToFile(full, true, err), "export with secrets");
    t.check(readAll(bare).find("secret_ref") == std::string::npos,
            "secrets are stripped unless requested");
    t.check(readAll(full).find("secret_ref") != std::string::npos,
            "secrets are kept when requested");

    ProfileStore other(dir.filePath("other.json"));
    ImportSummary summary;
    t.check(other.importFromFile(bare, err, false, &summary),
            "bare export imports: " + err.toString());
    t.check(summary.added == 1 && summary.skipped == 0, "bare import adds the profile");
    t.check(summary.needs_password == std::vector<std::string>({"prod"}),
            "profile without a secret is reported");
    ConnectionProfile got;
    t.check(other.get("prod", got, err) && got.secret_ref.empty(),
            "imported profile has no stored secret");
    ConnectionProfile seeded;
    t.check(store.get("prod", seeded, err) && got.host == seeded.host &&
                got.username == seeded.username && got.port == seeded.port,
            "connection fields survive the round trip");

    t.check(other.importFromFile(full, err, false, &summary), "second import succeeds");
    t.check(summary.added == 0 && summary.replaced == 0 && summary.skipped == 1,
            "existing names are kept by default");
    t.check(other.get("prod", got, err) && got.secret_ref.empty(), "skipped profile unchanged");

    t.check(other.importFromFile(full, err, true, &summary), "import with overwrite");
    t.check(summary.replaced == 1 && summary.needs_password.empty(),
            "overwrite replaces the existing profile");
    t.check(other.exportProfiles() == store.exportProfiles(), "import reproduces the profiles");

    ConnectionProfile noSecret = passwordProfile(vault, "later");
    noSecret.secret_ref.clear();
    err.clear();
    t.check(!other.upsert(noSecret, err), "upsert still requires the secret");
    t.check(err.code == ErrorCode::ValidationFailed, "missing secret on upsert is ValidationFailed");
}

void test_corrupt_file(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("profiles.json");
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly), "write corrupt file");
    f.write("{ not json");
    f.close();

    ProfileStore store(path);
    Error err;
    t.check(!store.load(err), "corrupt file fails to load");
    t.check(err.is(ErrorDomain::Store, ErrorCode::IOFailure), "corrupt file reports IOFailure");
}

void test_concurrent_readers(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    std::vector<ConnectionProfile> seeds;
    for (int i = 0; i < 20; ++i)
        seeds.push_back(passwordProfile(vault, "p" + std::to_string(i)));

    std::atomic<bool> done{false};
    std::atomic<int> badReads{0};
    std::thread reader([&] {
        std::size_t last = 0;
        while (!done) {
            const auto snapshot = store.list();
            // Writers only ever add, so a snapshot never shrinks.
            if (snapshot.size() < last)
                ++badReads;
            last = snapshot.size();
        }
    });
    std::thread writerA([&] {
        Error e;
        for (int i = 0; i < 10; ++i)
            store.upsert(seeds[static_cast<std::size_t>(i)], e);
    });
    std::thread writerB([&] {
        Error e;
        for (int i = 10; i < 20; ++i)
            store.upsert(seeds[static_cast<std::size_t>(i)], e);
    });
    writerA.join();
    writerB.join();
    done = true;
    reader.join();

    t.check(badReads == 0, "readers always see a committed snapshot");
    t.check(store.list().size() == 20, "serialized writers lose no update");
    ProfileStore reloaded(dir.filePath("profiles.json"));
    t.check(reloaded.load(err) && reloaded.list().size() == 20,
            "the file holds the last committed state");
}

void test_rotate_vault_key(TestContext &t) {
    QTemporaryDir dir;
    CredentialVault vault(dir.filePath("vault.key"));
    ProfileStore store(dir.filePath("profiles.json"));
    Error err;
    t.check(store.upsert(passwordProfile(vault, "prod", "alpha"), err), "seed prod");
    t.check(store.upsert(passwordProfile(vault, "dev", "beta"), err), "seed dev");
    ConnectionProfile before;
    t.check(store.get("prod", before, err), "read prod before rotation");

    t.check(store.rotateVaultKey(vault, err), "rotation succeeds: " + err.toString());
    ConnectionProfile after;
    t.check(store.get("prod", after, err), "read prod after rotation");
    t.check(after.secret_ref != before.secret_ref, "secret ref changed");
    std::string plain;
    t.check(vault.unwrap(after.secret_ref, plain, err) && plain == "alpha",
            "rotated secret still unwraps to the password");
    err.clear();
    t.check(!vault.unwrap(before.secret_ref, plain, err), "old ref is dead after rotation");
}

void test_known_hosts(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("known_hosts.json");
    HostKeyInfo key;
    key.host = "h";
    key.port = 22;
    key.algorithm = "ED25519";
    key.fingerprint = "SHA256:AA";
    Error err;
    {
        KnownHostsStore hosts(path);
        t.check(hosts.load(err), "missing known hosts file loads empty");
        t.check(hosts.check(key) == KnownHostsStore::Match::NotFound, "unknown host");
        t.check(hosts.remember(key, err), "remember host");
        t.check(hosts.check(key) == KnownHostsStore::Match::Match, "remembered host matches");
    }
    KnownHostsStore reloaded(path);
    t.check(reloaded.load(err), "reload known hosts");
    t.check(reloaded.check(key) == KnownHostsStore::Match::Match, "record persists");

    HostKeyInfo changed = key;
    changed.fingerprint = "SHA256:BB";
    t.check(reloaded.check(changed) == KnownHostsStore::Match::Mismatch,
            "changed fingerprint is a mismatch");
    HostKeyInfo otherPort = key;
    otherPort.port = 2222;
    t.check(reloaded.check(otherPort) == KnownHostsStore::Match::NotFound,
            "records are keyed by host and port");
    t.check(reloaded.forget("h", 22, err), "forget host");
    t.check(reloaded.check(key) == KnownHostsStore::Match::NotFound, "forgotten host is unknown");
}

void test_config_defaults_and_roundtrip(TestContext &t) {
    QTemporaryDir dir;
    const QString path = dir.filePath("config.ini");
    AppConfig cfg;
    Error err;
    t.check(AppConfig::load(path, cfg, err), "missing config loads defaults");
    t.check(cfg.transfer.overwrite_policy == OverwritePolicy::Prompt, "default policy Prompt");
    t.check(cfg.transfer.chunk_size_bytes == 65536, "default chunk size");
    t.check(cfg.transfer.concurrent_jobs_per_session == 1, "default one job per session");
    t.check(cfg.connection.timeout_seconds == 30, "default timeout");
    t.check(cfg.connection.keep_alive_interval_seconds == 60, "default keep-alive");
    t.check(cfg.connection.retry_ceiling == 5, "default retry ceiling");

    t.check(cfg.set("transfer.overwrite_policy", "rename", err), "set policy");
    t.check(cfg.set("transfer.chunk_size_bytes", "1048576", err), "set chunk size");
    t.check(cfg.set("connection.known_hosts_policy", "Strict", err), "set known hosts policy");
    t.check(cfg.save(path, err), "save config");

    AppConfig back;
    t.check(AppConfig::load(path, back, err), "reload config: " + err.toString());
    t.check(back.transfer.overwrite_policy == OverwritePolicy::Rename, "policy round-trips");
    t.check(back.transfer.chunk_size_bytes == 1048576, "chunk size round-trips");
    t.check(back.connection.known_hosts_policy == KnownHostsPolicy::Strict,
            "known hosts policy round-trips");
    t.check(back.get("logging.level") == "info", "untouched keys keep defaults");
}

void test_config_rejections(TestContext &t) {
    QTemporaryDir dir;
    AppConfig cfg;
    Error err;
    t.check(!cfg.set("transfer.chunk_size_bytes", "12", err), "chunk size below range");
    t.check(err.is(ErrorDomain::Store, ErrorCode::ValidationFailed),
            "out of range reports ValidationFailed");
    err.clear();
    t.check(!cfg.set("transfer.concurrent_jobs_per_session", "many", err), "non-numeric value");
    err.clear();
    t.check(!cfg.set("transfer.overwrite_policy", "ask", err), "unknown policy");
    err.clear();
    t.check(!cfg.set("transfer.colour", "blue", err), "unknown key is rejected");
    t.checkContains(err.message, "transfer.colour", "rejection names the key");
    t.check(cfg.transfer.chunk_size_bytes == 65536, "failed sets leave values unchanged");

    const QString path = dir.filePath("config.ini");
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly), "write config with unknown key");
    f.write("[transfer]\nchunk_size_bytes=4096\nturbo=true\n");
    f.close();
    AppConfig loaded;
    err.clear();
    t.check(!AppConfig::load(path, loaded, err), "unknown key in file is rejected");
    t.checkContains(err.message, "transfer.turbo", "file rejection names the key");
}

} // namespace

int main() {
    TestContext t;
    test_upsert_get_list(t);
    test_upsert_idempotent(t);
    test_persistence_and_no_plaintext(t);
    test_validation(t);
    test_import_all_or_nothing(t);
    test_export_import_file(t);
    test_corrupt_file(t);
    test_concurrent_readers(t);
    test_rotate_vault_key(t);
    test_known_hosts(t);
    test_config_defaults_and_roundtrip(t);
    test_config_rejections(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpdesk_profile_tests\n";
    return EXIT_SUCCESS;
}
