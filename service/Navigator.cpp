#include "Navigator.hpp"
#include "SessionManager.hpp"
#include "sftpdesk/RemotePath.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

namespace sftpdesk {

namespace {

std::uint32_t posixMode(const QFileInfo& fi) {
    const QFile::Permissions p = fi.permissions();
    std::uint32_t m = 0;
    if (p & QFile::ReadOwner)  m |= 0400;
    if (p & QFile::WriteOwner) m |= 0200;
    if (p & QFile::ExeOwner)   m |= 0100;
    if (p & QFile::ReadGroup)  m |= 0040;
    if (p & QFile::WriteGroup) m |= 0020;
    if (p & QFile::ExeGroup)   m |= 0010;
    if (p & QFile::ReadOther)  m |= 0004;
    if (p & QFile::WriteOther) m |= 0002;
    if (p & QFile::ExeOther)   m |= 0001;
    if (fi.isSymLink())
        m |= 0120000;
    else if (fi.isDir())
        m |= 0040000;
    else
        m |= 0100000;
    return m;
}

} // namespace

Navigator::Navigator(DirectoryCache& cache, std::shared_ptr<Session> session,
                     std::string remoteHome, std::string localHome)
    : cache_(cache),
      session_(std::move(session)),
      remoteCwd_(RemotePath::normalize(remoteHome)),
      localCwd_(localHome.empty() ? QDir::homePath().toStdString()
                                  : QDir::cleanPath(QString::fromStdString(localHome)).toStdString()) {}

const std::string& Navigator::cwd(Pane pane) const {
    return pane == Pane::Remote ? remoteCwd_ : localCwd_;
}

std::string Navigator::resolveLocal(const std::string& path) const {
    const QString p = QString::fromStdString(path);
    if (QDir::isAbsolutePath(p))
        return QDir::cleanPath(p).toStdString();
    return QDir::cleanPath(QDir(QString::fromStdString(localCwd_)).filePath(p)).toStdString();
}

bool Navigator::navigate(Pane pane, const std::string& path, std::vector<DirectoryEntry>& out,
                         Error& err) {
    if (pane == Pane::Remote) {
        const std::string target = RemotePath::resolve(remoteCwd_, path);
        if (!cache_.list(session_, target, out, err))
            return false;
        remoteCwd_ = target;
        return true;
    }
    const std::string target = resolveLocal(path);
    if (!listLocal(target, out, err))
        return false;
    localCwd_ = target;
    return true;
}

bool Navigator::up(Pane pane, std::vector<DirectoryEntry>& out, Error& err) {
    return navigate(pane, "..", out, err);
}

bool Navigator::refresh(Pane pane, std::vector<DirectoryEntry>& out, Error& err) {
    if (pane == Pane::Remote)
        return cache_.list(session_, remoteCwd_, out, err, true);
    return listLocal(localCwd_, out, err);
}

bool Navigator::rename(const std::string& from, const std::string& to, Error& err,
                       bool overwrite) {
    if (!session_) {
        err = Error::session(ErrorCode::ConnectionLost, "No session");
        return false;
    }
    const std::string src = RemotePath::resolve(remoteCwd_, from);
    const std::string dst = RemotePath::resolve(remoteCwd_, to);
    const bool ok = session_->run(
        [&](SftpClient& c, Error& e) { return c.rename(src, dst, e, overwrite); }, err);
    if (ok) {
        cache_.invalidate(session_->id(), RemotePath::parent(src));
        cache_.invalidate(session_->id(), RemotePath::parent(dst));
        cache_.invalidate(session_->id(), src);
    }
    return ok;
}

bool Navigator::listLocal(const std::string& path, std::vector<DirectoryEntry>& out, Error& err) {
    const QFileInfo info(QString::fromStdString(path));
    if (!info.exists()) {
        err = Error::transfer(ErrorCode::NotFound, "No such local directory", path);
        return false;
    }
    if (!info.isDir()) {
        err = Error::transfer(ErrorCode::IOFailure, "Not a directory", path);
        return false;
    }
    if (!info.isReadable()) {
        err = Error::transfer(ErrorCode::PermissionDenied, "Cannot read directory", path);
        return false;
    }
    const QFileInfoList entries = QDir(info.absoluteFilePath())
                                      .entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot |
                                                     QDir::Hidden | QDir::System);
    out.clear();
    out.reserve(static_cast<std::size_t>(entries.size()));
    for (const QFileInfo& fi : entries) {
        DirectoryEntry d;
        d.name = fi.fileName().toStdString();
        d.is_dir = fi.isDir();  // follows symlinks, like the remote side
        d.is_symlink = fi.isSymLink();
        d.size = d.is_dir ? 0 : static_cast<std::uint64_t>(fi.size());
        d.modified_time = static_cast<std::uint64_t>(std::max<qint64>(0, fi.lastModified().toSecsSinceEpoch()));
        d.permissions = posixMode(fi);
        out.push_back(std::move(d));
    }
    sortEntries(out);
    return true;
}

} // namespace sftpdesk
