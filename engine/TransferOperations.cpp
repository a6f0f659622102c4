#include "TransferOperations.hpp"
#include "AttributeSync.hpp"
#include "IntegrityChecker.hpp"
#include "Logging.hpp"
#include "openxfer/RemotePath.hpp"

#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <memory>

namespace openxfer {

ByteProgress throttledProgress(ByteProgress progress, int intervalMs) {
    if (!progress)
        return progress;
    auto clock = std::make_shared<QElapsedTimer>();
    return [progress, clock, intervalMs](quint64 done, quint64 total) {
        if (clock->isValid() && done < total && clock->elapsed() < intervalMs)
            return;
        clock->start();
        progress(done, total);
    };
}

OperationResult classifyFailure(const SftpClient &client,
                                const CancellationToken &token,
                                const QString &message) {
    OperationResult r;
    if (token.isCancelled()) {
        r.error = TransferError::make(
            ErrorKind::TransferAborted,
            token.reason() == CancelReason::Pause
                ? QStringLiteral("Paused")
                : QStringLiteral("Canceled by user"));
    } else if (!client.isConnected()) {
        r.error = TransferError::make(
            ErrorKind::Connection,
            message.isEmpty() ? QStringLiteral("Session lost") : message);
    } else {
        r.error = TransferError::make(
            ErrorKind::Io,
            message.isEmpty() ? QStringLiteral("Transfer failed") : message);
    }
    r.sessionBroken = !client.isConnected();
    return r;
}

OperationResult transferFile(SftpClient &client, Direction direction,
                             const QString &localPath,
                             const QString &remotePath, bool resume,
                             const OperationContext &ctx,
                             const ByteProgress &progress) {
    const std::string local = localPath.toStdString();
    const std::string remote = remotePath.toStdString();
    const auto cancel = ctx.token.asCallback();
    SftpClient::ProgressCB cb = [&progress](std::uint64_t done,
                                            std::uint64_t total) {
        if (progress)
            progress(done, total);
    };

    std::string err;
    quint64 bytes = 0;
    bool ok = false;
    if (direction == Direction::Upload) {
        const QFileInfo fi(localPath);
        if (!fi.isFile()) {
            OperationResult r;
            r.error = TransferError::make(
                ErrorKind::Io,
                QStringLiteral("Local file not found: %1").arg(localPath));
            return r;
        }
        bytes = (quint64)fi.size();
        const std::string parent = remoteParentPath(remote);
        if (!parent.empty() && !ensureRemoteDirectory(client, parent, err))
            return classifyFailure(client, ctx.token,
                                   QString::fromStdString(err));
        ok = client.put(local, remote, err, cb, cancel, resume);
    } else {
        const QString parent = QFileInfo(localPath).absolutePath();
        if (!QDir().mkpath(parent)) {
            OperationResult r;
            r.error = TransferError::make(
                ErrorKind::Io,
                QStringLiteral("Cannot create local folder: %1").arg(parent));
            return r;
        }
        ok = client.get(remote, local, err, cb, cancel, resume);
        if (ok)
            bytes = (quint64)QFileInfo(localPath).size();
    }
    if (!ok)
        return classifyFailure(client, ctx.token, QString::fromStdString(err));

    OperationResult r =
        finalizeTransfer(client, direction, localPath, remotePath, bytes, ctx);
    r.bytes = bytes;
    return r;
}

OperationResult finalizeTransfer(SftpClient &client, Direction direction,
                                 const QString &localPath,
                                 const QString &remotePath, quint64 size,
                                 const OperationContext &ctx) {
    OperationResult r;
    r.bytes = size;
    const IntegrityResult ir = verifyTransferIntegrity(
        client, localPath, remotePath, size, ctx.integrity);
    if (ir.outcome == IntegrityOutcome::Mismatch) {
        r.error = TransferError::make(ErrorKind::Integrity, ir.message);
        return r;
    }
    if (ir.outcome == IntegrityOutcome::Error)
        return classifyFailure(client, ctx.token, ir.message);

    // Attribute failures are already logged and never fail the transfer.
    (void)preserveAttributes(client, direction, localPath, remotePath,
                             ctx.attributes);
    return r;
}

bool buildLocalSnapshot(const QString &root, Snapshot &out, QString &err) {
    const QDir rootDir(root);
    if (!rootDir.exists()) {
        err = QStringLiteral("Local folder not found: %1").arg(root);
        return false;
    }
    out.clear();
    QDirIterator it(root,
                    QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fi = it.fileInfo();
        if (fi.isSymLink())
            continue;
        SnapshotEntry e;
        e.isDirectory = fi.isDir();
        e.size = e.isDirectory ? 0 : (std::uint64_t)fi.size();
        e.mtimeMs = fi.lastModified().toMSecsSinceEpoch();
        out[rootDir.relativeFilePath(fi.absoluteFilePath()).toStdString()] = e;
    }
    return true;
}

OperationResult uploadDirectory(SftpClient &client, const QString &localDir,
                                const QString &remoteDir,
                                const OperationContext &ctx,
                                const ByteProgress &progress) {
    OperationResult r;
    Snapshot local, remote;
    QString lerr;
    if (!buildLocalSnapshot(localDir, local, lerr)) {
        r.error = TransferError::make(ErrorKind::Io, lerr);
        return r;
    }
    const std::string rroot = remoteDir.toStdString();
    const auto cancel = ctx.token.asCallback();
    std::string err;
    if (!buildRemoteSnapshot(client, rroot, remote, err, cancel))
        return classifyFailure(client, ctx.token, QString::fromStdString(err));

    DiffResult diff;
    if (!calculateDiff(local, remote, ctx.diff, diff, err)) {
        r.error = TransferError::make(ErrorKind::Configuration,
                                      QString::fromStdString(err));
        return r;
    }
    qCInfo(oxSync) << "Delta sync" << logValue(localDir) << "->"
                   << logValue(remoteDir) << ":" << diff.toUpload.size()
                   << "to upload," << diff.toDelete.size() << "to delete,"
                   << diff.unchanged.size() << "unchanged";

    if (!ensureRemoteDirectory(client, rroot, err))
        return classifyFailure(client, ctx.token, QString::fromStdString(err));

    // Files already in sync count as done, so a resumed or retried run
    // reports against the same total as the first one.
    quint64 synced = 0;
    for (const DiffEntry &e : diff.unchanged)
        synced += e.size;
    const quint64 total = synced + diff.uploadBytes();
    quint64 base = synced;
    if (progress)
        progress(base, total);
    const QDir ldir(localDir);
    for (const DiffEntry &e : diff.toUpload) {
        if (ctx.token.isCancelled())
            return classifyFailure(client, ctx.token, QString());
        const QString lp = ldir.filePath(QString::fromStdString(e.path));
        const std::string rp = joinRemotePath(rroot, e.path);
        const std::string parent = remoteParentPath(rp);
        if (!parent.empty() && !ensureRemoteDirectory(client, parent, err))
            return classifyFailure(client, ctx.token,
                                   QString::fromStdString(err));
        SftpClient::ProgressCB cb = [&](std::uint64_t done, std::uint64_t) {
            if (progress)
                progress(base + done, total);
        };
        if (!client.put(lp.toStdString(), rp, err, cb, cancel, false))
            return classifyFailure(client, ctx.token,
                                   QString::fromStdString(err));
        OperationResult fin =
            finalizeTransfer(client, Direction::Upload, lp,
                             QString::fromStdString(rp), e.size, ctx);
        if (!fin.error.ok())
            return fin;
        base += e.size;
        qCDebug(oxSync) << "Uploaded" << logValue(QString::fromStdString(e.path))
                        << "(" << diffReasonName(e.reason) << ")";
    }

    if (ctx.diff.deleteRemote) {
        for (const DiffEntry &e : diff.toDelete) {
            if (ctx.token.isCancelled())
                return classifyFailure(client, ctx.token, QString());
            const std::string rp = joinRemotePath(rroot, e.path);
            if (!client.removeFile(rp, err))
                return classifyFailure(client, ctx.token,
                                       QString::fromStdString(err));
            qCDebug(oxSync) << "Deleted remote"
                            << logValue(QString::fromStdString(e.path));
        }
    }
    if (progress)
        progress(total, total);
    r.bytes = total;
    return r;
}

OperationResult downloadDirectory(SftpClient &client, const QString &remoteDir,
                                  const QString &localDir,
                                  const OperationContext &ctx,
                                  const ByteProgress &progress) {
    OperationResult r;
    const std::string rroot = remoteDir.toStdString();
    const auto cancel = ctx.token.asCallback();
    std::string err;
    bool isDir = false;
    if (!client.exists(rroot, isDir, err) || !isDir) {
        if (!err.empty())
            return classifyFailure(client, ctx.token,
                                   QString::fromStdString(err));
        r.error = TransferError::make(
            ErrorKind::Io,
            QStringLiteral("Remote folder not found: %1").arg(remoteDir));
        return r;
    }
    Snapshot remote;
    if (!buildRemoteSnapshot(client, rroot, remote, err, cancel))
        return classifyFailure(client, ctx.token, QString::fromStdString(err));

    quint64 total = 0;
    for (const auto &kv : remote)
        if (!kv.second.isDirectory)
            total += kv.second.size;
    if (progress)
        progress(0, total);

    const QDir ldir(localDir);
    if (!QDir().mkpath(localDir)) {
        r.error = TransferError::make(
            ErrorKind::Io,
            QStringLiteral("Cannot create local folder: %1").arg(localDir));
        return r;
    }
    quint64 base = 0;
    // Map order puts every directory before its contents.
    for (const auto &kv : remote) {
        if (ctx.token.isCancelled())
            return classifyFailure(client, ctx.token, QString());
        const QString lp = ldir.filePath(QString::fromStdString(kv.first));
        if (kv.second.isDirectory) {
            if (!QDir().mkpath(lp)) {
                r.error = TransferError::make(
                    ErrorKind::Io,
                    QStringLiteral("Cannot create local folder: %1").arg(lp));
                return r;
            }
            continue;
        }
        if (!QDir().mkpath(QFileInfo(lp).absolutePath())) {
            r.error = TransferError::make(
                ErrorKind::Io,
                QStringLiteral("Cannot create local folder: %1")
                    .arg(QFileInfo(lp).absolutePath()));
            return r;
        }
        const std::string rp = joinRemotePath(rroot, kv.first);
        SftpClient::ProgressCB cb = [&](std::uint64_t done, std::uint64_t) {
            if (progress)
                progress(base + done, total);
        };
        if (!client.get(rp, lp.toStdString(), err, cb, cancel, false))
            return classifyFailure(client, ctx.token,
                                   QString::fromStdString(err));
        OperationResult fin =
            finalizeTransfer(client, Direction::Download, lp,
                             QString::fromStdString(rp), kv.second.size, ctx);
        if (!fin.error.ok())
            return fin;
        base += kv.second.size;
    }
    if (progress)
        progress(total, total);
    r.bytes = total;
    return r;
}

bool removePartialArtifact(SftpClient *client, Direction direction,
                           const QString &localPath,
                           const QString &remotePath) {
    if (direction == Direction::Download) {
        if (!QFile::exists(localPath))
            return true;
        if (!QFile::remove(localPath)) {
            qCWarning(oxQueue) << "Could not remove partial download"
                               << logValue(localPath);
            return false;
        }
        qCInfo(oxQueue) << "Removed partial download" << logValue(localPath);
        return true;
    }
    if (!client) {
        qCWarning(oxQueue) << "No session to remove partial upload"
                           << logValue(remotePath);
        return false;
    }
    std::string err;
    FileInfo info{};
    if (!client->stat(remotePath.toStdString(), info, err)) {
        if (!err.empty())
            qCWarning(oxQueue) << "Could not inspect partial upload"
                               << logValue(remotePath) << ":"
                               << QString::fromStdString(err);
        return err.empty();
    }
    if (!client->removeFile(remotePath.toStdString(), err)) {
        qCWarning(oxQueue) << "Could not remove partial upload"
                           << logValue(remotePath) << ":"
                           << QString::fromStdString(err);
        return false;
    }
    qCInfo(oxQueue) << "Removed partial upload" << logValue(remotePath);
    return true;
}

bool removePartialDirectory(const QString &localDir) {
    QDir dir(localDir);
    if (!dir.exists())
        return true;
    if (!dir.removeRecursively()) {
        qCWarning(oxQueue) << "Could not fully remove partial directory"
                           << logValue(localDir);
        return false;
    }
    qCInfo(oxQueue) << "Removed partial directory" << logValue(localDir);
    return true;
}

} // namespace openxfer
