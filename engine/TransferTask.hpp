// One file or directory transfer: lifecycle, progress and retry state.
// Mutated only on the engine thread by the queue and the operation it
// delegates to; other threads see it only through the cancellation token.
#pragma once
#include "CancellationToken.hpp"
#include "TransferErrors.hpp"
#include "TransferTypes.hpp"
#include <QDateTime>
#include <QString>
#include <vector>

namespace openxfer {

class TransferTask {
public:
    TransferTask() = default;
    TransferTask(quint64 id, Direction direction, const QString &hostId,
                 const QString &localPath, const QString &remotePath,
                 qint64 nowMs = QDateTime::currentMSecsSinceEpoch());

    quint64 id() const { return id_; }
    Direction direction() const { return direction_; }
    TaskStatus status() const { return status_; }
    Priority priority() const { return priority_; }
    const QString &hostId() const { return hostId_; }
    const QString &localPath() const { return localPath_; }
    const QString &remotePath() const { return remotePath_; }
    QString fileName() const;
    bool isDirectory() const { return isDirectory_; }
    void setDirectory(bool dir) { isDirectory_ = dir; }
    // True when the download target did not exist before the first run.
    bool ownsLocalOutput() const { return ownsLocalOutput_; }
    void setOwnsLocalOutput(bool owns) { ownsLocalOutput_ = owns; }

    quint64 size() const { return size_; }
    bool sizeKnown() const { return sizeKnown_; }
    quint64 transferred() const { return transferred_; }
    double progress() const { return progress_; } // 0..100
    double speed() const { return speed_; }       // bytes/s
    qint64 estimatedRemainingMs() const { return etaMs_; }
    const std::vector<Chunk> &chunks() const { return chunks_; }
    bool hasChunkPlan() const { return !chunks_.empty(); }

    qint64 createdAtMs() const { return createdAtMs_; }
    qint64 startedAtMs() const { return startedAtMs_; }
    qint64 completedAtMs() const { return completedAtMs_; }

    int retryCount() const { return retryCount_; }
    int maxRetries() const { return maxRetries_; }
    void setMaxRetries(int n) { maxRetries_ = qMax(0, n); }
    const QString &lastError() const { return lastError_; }
    ErrorKind failureKind() const { return failureKind_; }

    const CancellationToken &token() const { return token_; }

    // Size discovery: updates size and re-derives priority unless it was
    // set explicitly.
    void setSize(quint64 size);
    void setPriority(Priority p);

    // pending -> running. Issues a fresh cancellation token; the
    // start time is stamped only on the first start.
    bool start(qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    // running -> paused; aborts the in-flight operation.
    bool pause();
    // paused -> pending; transferred bytes are kept for a resumed transfer.
    bool resume();
    // Anything but completed/failed -> cancelled.
    bool cancel(qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    // running -> completed, progress forced to 100.
    bool complete(qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    // pending|running -> failed. Refuses when already failed so the first
    // error message survives.
    bool fail(const QString &message, ErrorKind kind = ErrorKind::Io,
              qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    // True (and retryCount+1, failed -> pending) while retries remain.
    bool incrementRetry();
    bool canRetry() const { return retryCount_ < maxRetries_; }
    // failed -> pending with a fresh retry budget.
    bool requeueAfterFailure();

    // Never lowers transferred while the task keeps running.
    void updateProgress(quint64 transferred, quint64 total,
                        qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    void initializeChunks(std::vector<Chunk> chunks);
    bool updateChunkProgress(int index, quint64 transferred,
                             ChunkStatus status,
                             qint64 nowMs = QDateTime::currentMSecsSinceEpoch());
    // Forget partial progress so the next run starts from scratch.
    void resetTransferState();

    qint64 durationMs(qint64 nowMs = QDateTime::currentMSecsSinceEpoch()) const;
    double averageSpeed(qint64 nowMs = QDateTime::currentMSecsSinceEpoch()) const;

private:
    void recomputeProgress();

    quint64 id_ = 0;
    Direction direction_ = Direction::Upload;
    TaskStatus status_ = TaskStatus::Pending;
    Priority priority_ = Priority::Normal;
    bool priorityPinned_ = false;
    QString hostId_;
    QString localPath_;
    QString remotePath_;
    bool isDirectory_ = false;
    bool ownsLocalOutput_ = false;

    quint64 size_ = 0;
    bool sizeKnown_ = false;
    quint64 transferred_ = 0;
    double progress_ = 0.0;
    double speed_ = 0.0;
    qint64 etaMs_ = -1;
    qint64 lastSampleMs_ = 0;
    quint64 lastSampleBytes_ = 0;
    std::vector<Chunk> chunks_;
    std::vector<qint64> chunkSampleMs_;

    qint64 createdAtMs_ = 0;
    qint64 startedAtMs_ = 0;
    qint64 completedAtMs_ = 0;

    int retryCount_ = 0;
    int maxRetries_ = 3;
    QString lastError_;
    ErrorKind failureKind_ = ErrorKind::None;

    CancellationToken token_;
};

} // namespace openxfer
