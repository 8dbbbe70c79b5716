#include "KnownHostsStore.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>

Q_LOGGING_CATEGORY(sdKnownHosts, "sftpdesk.knownhosts")

namespace sftpdesk {

KnownHostsStore::KnownHostsStore(QString path) : path_(std::move(path)) {}

bool KnownHostsStore::load(Error& err) {
    std::lock_guard<std::mutex> lk(mu_);
    records_.clear();
    QFile f(path_);
    if (!f.exists())
        return true;
    if (!f.open(QIODevice::ReadOnly)) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not open known hosts: " + f.errorString().toStdString());
        return false;
    }
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = Error::store(ErrorCode::IOFailure,
                           "Invalid known hosts file: " + perr.errorString().toStdString());
        return false;
    }
    const QJsonArray arr = doc.object().value("hosts").toArray();
    for (const auto& v : arr) {
        const QJsonObject o = v.toObject();
        Record r;
        r.host = o.value("host").toString().toStdString();
        r.port = static_cast<std::uint16_t>(o.value("port").toInt(22));
        r.algorithm = o.value("algorithm").toString().toStdString();
        r.fingerprint = o.value("fingerprint").toString().toStdString();
        if (r.host.empty() || r.fingerprint.empty())
            continue;
        records_[{r.host, r.port}] = r;
    }
    return true;
}

bool KnownHostsStore::saveLocked(Error& err) const {
    QJsonArray arr;
    for (const auto& kv : records_) {
        QJsonObject o;
        o["host"] = QString::fromStdString(kv.second.host);
        o["port"] = static_cast<int>(kv.second.port);
        o["algorithm"] = QString::fromStdString(kv.second.algorithm);
        o["fingerprint"] = QString::fromStdString(kv.second.fingerprint);
        arr.append(o);
    }
    QJsonObject root;
    root["format"] = 1;
    root["hosts"] = arr;

    QDir().mkpath(QFileInfo(path_).absolutePath());
    QSaveFile f(path_);
    if (!f.open(QIODevice::WriteOnly)) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not write known hosts: " + f.errorString().toStdString());
        return false;
    }
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!f.commit()) {
        err = Error::store(ErrorCode::IOFailure,
                           "Could not write known hosts: " + f.errorString().toStdString());
        return false;
    }
    return true;
}

KnownHostsStore::Match KnownHostsStore::check(const HostKeyInfo& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find({key.host, key.port});
    if (it == records_.end())
        return Match::NotFound;
    return it->second.fingerprint == key.fingerprint ? Match::Match : Match::Mismatch;
}

bool KnownHostsStore::remember(const HostKeyInfo& key, Error& err) {
    std::lock_guard<std::mutex> lk(mu_);
    records_[{key.host, key.port}] = Record{key.host, key.port, key.algorithm, key.fingerprint};
    if (!saveLocked(err))
        return false;
    qCInfo(sdKnownHosts) << "host key recorded" << "port=" << key.port
                         << "algorithm=" << QString::fromStdString(key.algorithm)
                         << "fingerprint=" << QString::fromStdString(key.fingerprint);
    return true;
}

bool KnownHostsStore::forget(const std::string& host, std::uint16_t port, Error& err) {
    std::lock_guard<std::mutex> lk(mu_);
    if (records_.erase({host, port}) == 0) {
        err = Error::store(ErrorCode::NotFound, "No known host " + host);
        return false;
    }
    return saveLocked(err);
}

std::vector<KnownHostsStore::Record> KnownHostsStore::records() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Record> out;
    out.reserve(records_.size());
    for (const auto& kv : records_)
        out.push_back(kv.second);
    return out;
}

} // namespace sftpdesk
