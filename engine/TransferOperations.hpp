// Blocking whole-file and directory transfers over one leased session.
// Everything here runs on an I/O worker; results travel back to the engine
// thread by value.
#pragma once
#include "CancellationToken.hpp"
#include "EngineConfig.hpp"
#include "TransferErrors.hpp"
#include "TransferTypes.hpp"
#include "openxfer/DeltaDiff.hpp"
#include "openxfer/SftpClient.hpp"
#include <QString>
#include <functional>

namespace openxfer {

// (bytes done, bytes total) of the whole operation; called on the worker.
using ByteProgress = std::function<void(quint64, quint64)>;

struct OperationContext {
    CancellationToken token;
    IntegrityConfig integrity;
    AttributeConfig attributes;
    DiffOptions diff; // directory uploads
};

struct OperationResult {
    TransferError error;
    bool sessionBroken = false; // discard the lease instead of releasing it
    quint64 bytes = 0;          // size of what was transferred
};

// Wraps progress so it fires at most every intervalMs, plus on completion.
ByteProgress throttledProgress(ByteProgress progress, int intervalMs = 100);

// Aborted when the token fired, Connection when the session dropped,
// Io otherwise.
OperationResult classifyFailure(const SftpClient &client,
                                const CancellationToken &token,
                                const QString &message);

// get/put of a single file, creating missing parent directories first. With
// resume, continues from the destination's current size.
OperationResult transferFile(SftpClient &client, Direction direction,
                             const QString &localPath,
                             const QString &remotePath, bool resume,
                             const OperationContext &ctx,
                             const ByteProgress &progress);

// Integrity check and attribute preservation after the bytes landed.
OperationResult finalizeTransfer(SftpClient &client, Direction direction,
                                 const QString &localPath,
                                 const QString &remotePath, quint64 size,
                                 const OperationContext &ctx);

// Relative '/'-separated paths of every file and directory under root.
bool buildLocalSnapshot(const QString &root, Snapshot &out, QString &err);

// Delta sync of localDir into remoteDir: uploads new and changed files and,
// with diff.deleteRemote, removes remote files missing locally.
OperationResult uploadDirectory(SftpClient &client, const QString &localDir,
                                const QString &remoteDir,
                                const OperationContext &ctx,
                                const ByteProgress &progress);

// Mirrors the remote tree into localDir.
OperationResult downloadDirectory(SftpClient &client, const QString &remoteDir,
                                  const QString &localDir,
                                  const OperationContext &ctx,
                                  const ByteProgress &progress);

// Best-effort removal of the incomplete destination of a cancelled
// transfer. client may be null for downloads.
bool removePartialArtifact(SftpClient *client, Direction direction,
                           const QString &localPath,
                           const QString &remotePath);

// Best-effort removal of a local tree left by a cancelled directory download.
bool removePartialDirectory(const QString &localDir);

} // namespace openxfer
