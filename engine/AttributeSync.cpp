#include "AttributeSync.hpp"
#include "Logging.hpp"

#include <QDateTime>
#include <QFileInfo>
#include <QTimeZone>

namespace openxfer {

unsigned int posixModeFromPermissions(QFile::Permissions p) {
    unsigned int m = 0;
    if (p & QFileDevice::ReadOwner)
        m |= 0400;
    if (p & QFileDevice::WriteOwner)
        m |= 0200;
    if (p & QFileDevice::ExeOwner)
        m |= 0100;
    if (p & QFileDevice::ReadGroup)
        m |= 0040;
    if (p & QFileDevice::WriteGroup)
        m |= 0020;
    if (p & QFileDevice::ExeGroup)
        m |= 0010;
    if (p & QFileDevice::ReadOther)
        m |= 0004;
    if (p & QFileDevice::WriteOther)
        m |= 0002;
    if (p & QFileDevice::ExeOther)
        m |= 0001;
    return m;
}

QFile::Permissions permissionsFromPosixMode(unsigned int mode) {
    QFile::Permissions p;
    if (mode & 0400)
        p |= QFileDevice::ReadOwner | QFileDevice::ReadUser;
    if (mode & 0200)
        p |= QFileDevice::WriteOwner | QFileDevice::WriteUser;
    if (mode & 0100)
        p |= QFileDevice::ExeOwner | QFileDevice::ExeUser;
    if (mode & 0040)
        p |= QFileDevice::ReadGroup;
    if (mode & 0020)
        p |= QFileDevice::WriteGroup;
    if (mode & 0010)
        p |= QFileDevice::ExeGroup;
    if (mode & 0004)
        p |= QFileDevice::ReadOther;
    if (mode & 0002)
        p |= QFileDevice::WriteOther;
    if (mode & 0001)
        p |= QFileDevice::ExeOther;
    return p;
}

namespace {

bool pushToRemote(SftpClient &client, const QString &localPath,
                  const QString &remotePath, const AttributeConfig &config) {
    const QFileInfo fi(localPath);
    if (!fi.exists()) {
        qCWarning(oxSync) << "Attributes: local file vanished"
                          << logValue(localPath);
        return false;
    }
    bool ok = true;
    const std::string remote = remotePath.toStdString();
    if (config.preservePermissions) {
        std::string err;
        if (!client.chmod(remote, posixModeFromPermissions(fi.permissions()),
                          err)) {
            qCWarning(oxSync) << "Failed to set permissions on"
                              << logValue(remotePath) << ":"
                              << QString::fromStdString(err);
            ok = false;
        }
    }
    if (config.preserveTimestamps) {
        const qint64 mtime = fi.lastModified().toSecsSinceEpoch();
        qint64 atime = fi.lastRead().toSecsSinceEpoch();
        if (atime <= 0)
            atime = mtime;
        std::string err;
        if (mtime > 0 && !client.setTimes(remote, (std::uint64_t)atime,
                                          (std::uint64_t)mtime, err)) {
            qCWarning(oxSync) << "Failed to set mtime on"
                              << logValue(remotePath) << ":"
                              << QString::fromStdString(err);
            ok = false;
        }
    }
    return ok;
}

bool pullFromRemote(SftpClient &client, const QString &localPath,
                    const QString &remotePath, const AttributeConfig &config) {
    FileInfo rinfo{};
    std::string err;
    if (!client.stat(remotePath.toStdString(), rinfo, err)) {
        qCWarning(oxSync) << "Attributes: cannot stat" << logValue(remotePath)
                          << ":" << QString::fromStdString(err);
        return false;
    }
    bool ok = true;
    QFile f(localPath);
    if (config.preserveTimestamps && rinfo.mtime > 0) {
        const QDateTime tsUtc = QDateTime::fromSecsSinceEpoch(
            (qint64)rinfo.mtime, QTimeZone::utc());
        if (!f.open(QIODevice::ReadWrite) ||
            !f.setFileTime(tsUtc, QFileDevice::FileModificationTime)) {
            qCWarning(oxSync) << "Failed to set mtime for"
                              << logValue(localPath) << "to" << tsUtc;
            ok = false;
        }
        f.close();
    }
    if (config.preservePermissions && rinfo.mode != 0) {
        if (!f.setPermissions(permissionsFromPosixMode(rinfo.mode & 0777))) {
            qCWarning(oxSync) << "Failed to set permissions for"
                              << logValue(localPath);
            ok = false;
        }
    }
    return ok;
}

} // namespace

bool preserveAttributes(SftpClient &client, Direction direction,
                        const QString &localPath, const QString &remotePath,
                        const AttributeConfig &config) {
    if (!config.preservePermissions && !config.preserveTimestamps)
        return true;
    return direction == Direction::Upload
               ? pushToRemote(client, localPath, remotePath, config)
               : pullFromRemote(client, localPath, remotePath, config);
}

} // namespace openxfer
