#include "ChunkedTransfer.hpp"
#include "Logging.hpp"
#include "TransferOperations.hpp"
#include "openxfer/RemotePath.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

namespace openxfer {

namespace {

struct PrepareOutcome {
    TransferError error;
    bool resetChunks = false;
    bool sessionBroken = false;
};

constexpr quint64 kMinChunkBytes = 64 * 1024;

TransferError abortedError(const CancellationToken &token) {
    return TransferError::make(ErrorKind::TransferAborted,
                               token.reason() == CancelReason::Pause
                                   ? QStringLiteral("Paused")
                                   : QStringLiteral("Canceled by user"));
}

} // namespace

ChunkedTransferManager::ChunkedTransferManager(SessionPool &pool,
                                               IoDispatcher &io,
                                               const ParallelConfig &config,
                                               QObject *parent)
    : QObject(parent), pool_(pool), io_(io), config_(config) {}

ChunkedTransferManager::~ChunkedTransferManager() {
    shutdown();
    io_.waitForDone();
}

bool ChunkedTransferManager::shouldUseParallel(quint64 size,
                                               quint64 alreadyTransferred,
                                               bool hasChunkPlan) const {
    if (!config_.enabled || size <= config_.thresholdBytes)
        return false;
    return hasChunkPlan || alreadyTransferred == 0;
}

std::vector<Chunk> ChunkedTransferManager::planChunks(quint64 size) const {
    return splitIntoChunks(size, qMax(kMinChunkBytes, config_.chunkSizeBytes));
}

ChunkedTransferManager::RunPtr
ChunkedTransferManager::findRun(quint64 taskId) const {
    auto it = runs_.find(taskId);
    return it == runs_.end() ? RunPtr() : it->second;
}

bool ChunkedTransferManager::isCurrent(const RunPtr &run) const {
    return findRun(run->job.taskId) == run;
}

bool ChunkedTransferManager::isActive(quint64 taskId) const {
    return runs_.count(taskId) > 0;
}

void ChunkedTransferManager::start(ChunkedJob job, ChunkedCallbacks callbacks) {
    if (runs_.count(job.taskId) > 0) {
        auto done = callbacks.onFinished;
        IoDispatcher::post(this, [done]() {
            if (done)
                done(TransferError::make(
                    ErrorKind::Configuration,
                    QStringLiteral("Parallel transfer already running")));
        });
        return;
    }
    auto run = std::make_shared<Run>();
    const bool fresh = job.chunks.empty();
    run->chunks = fresh ? planChunks(job.size) : job.chunks;
    for (auto &c : run->chunks) {
        if (c.status != ChunkStatus::Completed)
            c.status = ChunkStatus::Pending;
        c.speed = 0.0;
    }
    run->job = std::move(job);
    run->callbacks = std::move(callbacks);
    runs_[run->job.taskId] = run;

    qCInfo(oxChunk) << "Parallel" << directionName(run->job.direction)
                    << logValue(run->job.direction == Direction::Upload
                                    ? run->job.localPath
                                    : run->job.remotePath)
                    << run->job.size << "bytes in" << run->chunks.size()
                    << "chunks" << (fresh ? "" : "(resumed)");
    if (run->callbacks.onPlanned)
        run->callbacks.onPlanned(run->chunks);
    prepare(run, fresh);
}

void ChunkedTransferManager::prepare(const RunPtr &run, bool fresh) {
    run->preparing = true;
    if (run->job.direction == Direction::Download)
        prepareDownload(run, fresh);
    else
        prepareUpload(run, fresh);
}

void ChunkedTransferManager::prepareDownload(const RunPtr &run, bool fresh) {
    const QString local = run->job.localPath;
    const quint64 size = run->job.size;
    io_.run(
        this,
        [local, size, fresh]() {
            PrepareOutcome o;
            const QString parent = QFileInfo(local).absolutePath();
            if (!QDir().mkpath(parent)) {
                o.error = TransferError::make(
                    ErrorKind::Io,
                    QStringLiteral("Cannot create local folder: %1")
                        .arg(parent));
                return o;
            }
            QFile f(local);
            const bool restart = fresh || !f.exists();
            o.resetChunks = restart && !fresh;
            const QIODevice::OpenMode mode =
                restart ? (QIODevice::WriteOnly | QIODevice::Truncate)
                        : QIODevice::ReadWrite;
            if (!f.open(mode)) {
                o.error = TransferError::make(
                    ErrorKind::Io,
                    QStringLiteral("Cannot open local file: %1")
                        .arg(f.errorString()));
                return o;
            }
            if ((quint64)f.size() != size && !f.resize((qint64)size)) {
                o.error = TransferError::make(
                    ErrorKind::Io,
                    QStringLiteral("Cannot reserve local file: %1")
                        .arg(f.errorString()));
            }
            return o;
        },
        [this, run](const PrepareOutcome &o) {
            onPrepared(run, o.error, o.resetChunks);
        });
}

void ChunkedTransferManager::prepareUpload(const RunPtr &run, bool fresh) {
    const quint64 ticket = pool_.acquire(
        run->job.identity, run->job.options,
        [this, run, fresh](const SessionPool::AcquireResult &ar) {
            run->stepTicket = 0;
            if (!ar.ok()) {
                onPrepared(run, ar.error, false);
                return;
            }
            const SessionLease lease = ar.lease;
            const std::string remote = run->job.remotePath.toStdString();
            const quint64 size = run->job.size;
            const CancellationToken token = run->job.token;
            io_.run(
                this,
                [lease, remote, size, fresh, token]() {
                    PrepareOutcome o;
                    SftpClient &client = *lease.client;
                    std::string err;
                    const std::string parent = remoteParentPath(remote);
                    if (!parent.empty() &&
                        !ensureRemoteDirectory(client, parent, err)) {
                        const OperationResult f = classifyFailure(
                            client, token, QString::fromStdString(err));
                        o.error = f.error;
                        o.sessionBroken = f.sessionBroken;
                        return o;
                    }
                    if (!fresh) {
                        FileInfo info{};
                        if (client.stat(remote, info, err) && info.has_size &&
                            info.size == size)
                            return o;
                        if (!err.empty()) {
                            const OperationResult f = classifyFailure(
                                client, token, QString::fromStdString(err));
                            o.error = f.error;
                            o.sessionBroken = f.sessionBroken;
                            return o;
                        }
                        // Remote copy is gone or was replaced.
                        o.resetChunks = true;
                    }
                    if (!client.allocate(remote, size, err)) {
                        const OperationResult f = classifyFailure(
                            client, token, QString::fromStdString(err));
                        o.error = f.error;
                        o.sessionBroken = f.sessionBroken;
                    }
                    return o;
                },
                [this, run, lease](const PrepareOutcome &o) {
                    if (o.sessionBroken)
                        pool_.discard(lease);
                    else
                        pool_.release(lease);
                    onPrepared(run, o.error, o.resetChunks);
                });
        });
    run->stepTicket = ticket;
}

void ChunkedTransferManager::onPrepared(const RunPtr &run,
                                        const TransferError &err,
                                        bool resetChunks) {
    run->preparing = false;
    if (!err.ok()) {
        if (!stopping(run))
            recordFailure(run, err);
        maybeFinish(run);
        return;
    }
    if (resetChunks) {
        for (auto &c : run->chunks) {
            c.transferred = 0;
            c.status = ChunkStatus::Pending;
        }
        if (run->callbacks.onPlanned)
            run->callbacks.onPlanned(run->chunks);
    }
    pump(run);
}

bool ChunkedTransferManager::stopping(const RunPtr &run) const {
    return !run->firstError.ok() || run->aborted ||
           run->job.token.isCancelled();
}

void ChunkedTransferManager::notifyChunk(const RunPtr &run, int index) {
    if (run->callbacks.onChunkProgress)
        run->callbacks.onChunkProgress(
            run->chunks[static_cast<std::size_t>(index)]);
}

void ChunkedTransferManager::pump(const RunPtr &run) {
    if (stopping(run)) {
        maybeFinish(run);
        return;
    }
    const std::size_t limit =
        static_cast<std::size_t>(qMax(1, config_.maxConcurrent));
    for (std::size_t i = 0; i < run->chunks.size(); ++i) {
        if (run->inFlight.size() + run->acquiring.size() >= limit)
            break;
        Chunk &c = run->chunks[i];
        const int idx = static_cast<int>(i);
        if (c.status != ChunkStatus::Pending || run->inFlight.count(idx) ||
            run->acquiring.count(idx))
            continue;
        if (c.transferred >= c.size) {
            c.status = ChunkStatus::Completed;
            notifyChunk(run, idx);
            continue;
        }
        // The callback is always queued, so the ticket is stored first.
        run->acquiring[idx] = pool_.acquire(
            run->job.identity, run->job.options,
            [this, run, idx](const SessionPool::AcquireResult &r) {
                onLease(run, idx, r);
            });
    }
    maybeFinish(run);
}

void ChunkedTransferManager::onLease(const RunPtr &run, int index,
                                     const SessionPool::AcquireResult &result) {
    run->acquiring.erase(index);
    if (!result.ok()) {
        if (!stopping(run))
            recordFailure(run, result.error);
        maybeFinish(run);
        return;
    }
    if (stopping(run)) {
        pool_.release(result.lease);
        maybeFinish(run);
        return;
    }

    Chunk &c = run->chunks[static_cast<std::size_t>(index)];
    c.status = ChunkStatus::Transferring;
    run->inFlight[index] = result.lease;
    notifyChunk(run, index);

    const quint64 base = c.transferred;
    const quint64 offset = c.start + base;
    const quint64 length = c.size - base;
    const SessionLease lease = result.lease;
    const Direction direction = run->job.direction;
    const std::string local = run->job.localPath.toStdString();
    const std::string remote = run->job.remotePath.toStdString();
    const CancellationToken taskToken = run->job.token;
    const CancellationToken internal = run->internal;
    const ByteProgress progress = throttledProgress(
        [this, run, index, base](quint64 done, quint64) {
            IoDispatcher::post(this, [this, run, index, base, done]() {
                onChunkBytes(run, index, base + done);
            });
        });

    io_.run(
        this,
        [lease, direction, local, remote, offset, length, taskToken, internal,
         progress]() {
            ChunkOutcome o;
            SftpClient::CancelCB cancel = [taskToken, internal]() {
                return taskToken.isCancelled() || internal.isCancelled();
            };
            SftpClient::ProgressCB cb = [&progress](std::uint64_t done,
                                                    std::uint64_t total) {
                progress(done, total);
            };
            std::string err;
            o.ok = direction == Direction::Upload
                       ? lease.client->putRange(local, remote, offset, length,
                                                err, cb, cancel)
                       : lease.client->getRange(remote, local, offset, length,
                                                err, cb, cancel);
            o.error = QString::fromStdString(err);
            o.broken = !lease.client->isConnected();
            return o;
        },
        [this, run, index, lease](const ChunkOutcome &o) {
            onChunkDone(run, index, lease, o);
        });
}

void ChunkedTransferManager::onChunkBytes(const RunPtr &run, int index,
                                          quint64 transferred) {
    if (!isCurrent(run))
        return;
    Chunk &c = run->chunks[static_cast<std::size_t>(index)];
    if (c.status != ChunkStatus::Transferring || transferred <= c.transferred)
        return;
    c.transferred = qMin(transferred, c.size);
    notifyChunk(run, index);
}

void ChunkedTransferManager::onChunkDone(const RunPtr &run, int index,
                                         const SessionLease &lease,
                                         const ChunkOutcome &o) {
    run->inFlight.erase(index);
    if (o.broken || run->interrupted)
        pool_.discard(lease);
    else
        pool_.release(lease);

    Chunk &c = run->chunks[static_cast<std::size_t>(index)];
    if (o.ok) {
        c.transferred = c.size;
        c.status = ChunkStatus::Completed;
        notifyChunk(run, index);
        qCDebug(oxChunk) << "Chunk" << index << "of task" << run->job.taskId
                         << "done";
    } else if (run->job.token.isCancelled() || run->internal.isCancelled()) {
        // Keeps its partial bytes for the next run.
        c.status = ChunkStatus::Pending;
        notifyChunk(run, index);
    } else {
        c.status = ChunkStatus::Failed;
        notifyChunk(run, index);
        recordFailure(run, TransferError::make(
                               o.broken ? ErrorKind::Connection : ErrorKind::Io,
                               QStringLiteral("Chunk %1 failed: %2")
                                   .arg(index)
                                   .arg(o.error)));
    }
    pump(run);
}

void ChunkedTransferManager::recordFailure(const RunPtr &run,
                                           const TransferError &err) {
    if (run->firstError.ok()) {
        run->firstError = err;
        qCWarning(oxChunk) << "Parallel transfer of task" << run->job.taskId
                           << "failed:" << err.message;
    }
    stopRun(run);
}

void ChunkedTransferManager::stopRun(const RunPtr &run) {
    run->internal.cancel(CancelReason::Cancel);
    for (const auto &kv : run->acquiring)
        pool_.cancelAcquire(kv.second);
    if (run->stepTicket)
        pool_.cancelAcquire(run->stepTicket);
    // A stalled read or write would not notice the token until its next
    // block; cutting the socket unblocks it.
    for (const auto &kv : run->inFlight) {
        if (kv.second.valid())
            kv.second.client->interrupt();
        run->interrupted = true;
    }
}

void ChunkedTransferManager::abort(quint64 taskId) {
    RunPtr run = findRun(taskId);
    if (!run)
        return;
    run->aborted = true;
    stopRun(run);
}

void ChunkedTransferManager::maybeFinish(const RunPtr &run) {
    if (!isCurrent(run) || run->preparing || run->finalizing ||
        !run->inFlight.empty() || !run->acquiring.empty())
        return;
    if (!run->firstError.ok()) {
        finish(run, run->firstError);
        return;
    }
    if (run->aborted || run->job.token.isCancelled()) {
        finish(run, abortedError(run->job.token));
        return;
    }
    const bool allDone = std::all_of(
        run->chunks.begin(), run->chunks.end(),
        [](const Chunk &c) { return c.status == ChunkStatus::Completed; });
    if (allDone)
        finalize(run);
}

void ChunkedTransferManager::finalize(const RunPtr &run) {
    run->finalizing = true;
    run->stepTicket = pool_.acquire(
        run->job.identity, run->job.options,
        [this, run](const SessionPool::AcquireResult &ar) {
            run->stepTicket = 0;
            if (!ar.ok()) {
                run->finalizing = false;
                finish(run, stopping(run) ? abortedError(run->job.token)
                                          : ar.error);
                return;
            }
            const SessionLease lease = ar.lease;
            const Direction direction = run->job.direction;
            const QString local = run->job.localPath;
            const QString remote = run->job.remotePath;
            const quint64 size = run->job.size;
            OperationContext ctx;
            ctx.token = run->job.token;
            ctx.integrity = run->job.integrity;
            ctx.attributes = run->job.attributes;
            io_.run(
                this,
                [lease, direction, local, remote, size, ctx]() {
                    return finalizeTransfer(*lease.client, direction, local,
                                            remote, size, ctx);
                },
                [this, run, lease](const OperationResult &r) {
                    if (r.sessionBroken)
                        pool_.discard(lease);
                    else
                        pool_.release(lease);
                    run->finalizing = false;
                    finish(run, r.error);
                });
        });
}

void ChunkedTransferManager::finish(const RunPtr &run,
                                    const TransferError &err) {
    if (!isCurrent(run))
        return;
    runs_.erase(run->job.taskId);
    if (err.ok())
        qCInfo(oxChunk) << "Parallel transfer of task" << run->job.taskId
                        << "complete";
    if (run->callbacks.onFinished)
        run->callbacks.onFinished(err);
}

void ChunkedTransferManager::shutdown() {
    const auto runs = runs_;
    for (const auto &kv : runs) {
        kv.second->aborted = true;
        stopRun(kv.second);
    }
}

} // namespace openxfer
