#include "TransferTask.hpp"

#include <QFileInfo>

namespace openxfer {

namespace {
constexpr qint64 kSpeedSampleMs = 250;
}

TransferTask::TransferTask(quint64 id, Direction direction,
                           const QString &hostId, const QString &localPath,
                           const QString &remotePath, qint64 nowMs)
    : id_(id), direction_(direction), hostId_(hostId), localPath_(localPath),
      remotePath_(remotePath), createdAtMs_(nowMs) {}

QString TransferTask::fileName() const {
    const QString source =
        direction_ == Direction::Upload ? localPath_ : remotePath_;
    QString name = QFileInfo(source).fileName();
    return name.isEmpty() ? source : name;
}

void TransferTask::setSize(quint64 size) {
    size_ = size;
    sizeKnown_ = true;
    if (!priorityPinned_)
        priority_ = priorityForSize(size_, true);
    if (transferred_ > size_) {
        transferred_ = size_;
        progress_ = 0.0;
    }
    recomputeProgress();
}

void TransferTask::setPriority(Priority p) {
    priority_ = p;
    priorityPinned_ = true;
}

bool TransferTask::start(qint64 nowMs) {
    if (status_ != TaskStatus::Pending)
        return false;
    status_ = TaskStatus::Running;
    token_ = CancellationToken();
    if (startedAtMs_ == 0)
        startedAtMs_ = nowMs;
    completedAtMs_ = 0;
    lastSampleMs_ = 0;
    speed_ = 0.0;
    return true;
}

bool TransferTask::pause() {
    if (status_ != TaskStatus::Running)
        return false;
    status_ = TaskStatus::Paused;
    token_.cancel(CancelReason::Pause);
    speed_ = 0.0;
    etaMs_ = -1;
    return true;
}

bool TransferTask::resume() {
    if (status_ != TaskStatus::Paused)
        return false;
    status_ = TaskStatus::Pending;
    return true;
}

bool TransferTask::cancel(qint64 nowMs) {
    if (status_ == TaskStatus::Completed || status_ == TaskStatus::Failed ||
        status_ == TaskStatus::Cancelled)
        return false;
    status_ = TaskStatus::Cancelled;
    token_.cancel(CancelReason::Cancel);
    completedAtMs_ = nowMs;
    speed_ = 0.0;
    etaMs_ = -1;
    return true;
}

bool TransferTask::complete(qint64 nowMs) {
    if (status_ != TaskStatus::Running)
        return false;
    status_ = TaskStatus::Completed;
    if (sizeKnown_)
        transferred_ = size_;
    progress_ = 100.0;
    completedAtMs_ = nowMs;
    speed_ = 0.0;
    etaMs_ = 0;
    return true;
}

bool TransferTask::fail(const QString &message, ErrorKind kind, qint64 nowMs) {
    if (status_ != TaskStatus::Pending && status_ != TaskStatus::Running)
        return false;
    status_ = TaskStatus::Failed;
    lastError_ = message;
    failureKind_ = kind;
    completedAtMs_ = nowMs;
    speed_ = 0.0;
    etaMs_ = -1;
    return true;
}

bool TransferTask::incrementRetry() {
    if (retryCount_ >= maxRetries_)
        return false;
    ++retryCount_;
    if (status_ == TaskStatus::Failed) {
        status_ = TaskStatus::Pending;
        lastError_.clear();
        failureKind_ = ErrorKind::None;
        completedAtMs_ = 0;
    }
    return true;
}

bool TransferTask::requeueAfterFailure() {
    if (status_ != TaskStatus::Failed)
        return false;
    status_ = TaskStatus::Pending;
    retryCount_ = 0;
    lastError_.clear();
    failureKind_ = ErrorKind::None;
    completedAtMs_ = 0;
    return true;
}

void TransferTask::updateProgress(quint64 transferred, quint64 total,
                                  qint64 nowMs) {
    if (total > 0 && (!sizeKnown_ || total != size_)) {
        size_ = total;
        sizeKnown_ = true;
        if (!priorityPinned_)
            priority_ = priorityForSize(size_, true);
        if (transferred_ > size_) {
            transferred_ = size_;
            progress_ = 0.0;
        }
    }
    if (sizeKnown_ && transferred > size_)
        transferred = size_;
    if (status_ != TaskStatus::Running || transferred > transferred_)
        transferred_ = transferred;

    if (lastSampleMs_ == 0) {
        lastSampleMs_ = nowMs;
        lastSampleBytes_ = transferred_;
    } else if (nowMs - lastSampleMs_ >= kSpeedSampleMs) {
        const double bytes =
            static_cast<double>(transferred_ - qMin(transferred_, lastSampleBytes_));
        const double inst = bytes * 1000.0 / static_cast<double>(nowMs - lastSampleMs_);
        speed_ = speed_ <= 0.0 ? inst : speed_ * 0.7 + inst * 0.3;
        lastSampleMs_ = nowMs;
        lastSampleBytes_ = transferred_;
    }
    if (sizeKnown_ && speed_ > 0.0)
        etaMs_ = static_cast<qint64>(
            static_cast<double>(size_ - transferred_) * 1000.0 / speed_);
    recomputeProgress();
}

void TransferTask::initializeChunks(std::vector<Chunk> chunks) {
    chunks_ = std::move(chunks);
    chunkSampleMs_.assign(chunks_.size(), 0);
    quint64 sum = 0;
    for (const auto &c : chunks_)
        sum += c.transferred;
    transferred_ = qMax(transferred_, sum);
    recomputeProgress();
}

bool TransferTask::updateChunkProgress(int index, quint64 transferred,
                                       ChunkStatus status, qint64 nowMs) {
    if (index < 0 || static_cast<std::size_t>(index) >= chunks_.size())
        return false;
    Chunk &c = chunks_[static_cast<std::size_t>(index)];
    if (transferred > c.size)
        transferred = c.size;
    qint64 &last = chunkSampleMs_[static_cast<std::size_t>(index)];
    if (last > 0 && nowMs > last && transferred > c.transferred) {
        c.speed = static_cast<double>(transferred - c.transferred) * 1000.0 /
                  static_cast<double>(nowMs - last);
    }
    last = nowMs;
    c.transferred = transferred;
    c.status = status;
    if (status != ChunkStatus::Transferring)
        c.speed = 0.0;

    quint64 sum = 0;
    for (const auto &ch : chunks_)
        sum += ch.transferred;
    updateProgress(sum, size_, nowMs);
    return true;
}

void TransferTask::resetTransferState() {
    chunks_.clear();
    chunkSampleMs_.clear();
    transferred_ = 0;
    progress_ = 0.0;
    speed_ = 0.0;
    etaMs_ = -1;
    lastSampleMs_ = 0;
    lastSampleBytes_ = 0;
}

qint64 TransferTask::durationMs(qint64 nowMs) const {
    if (startedAtMs_ == 0)
        return 0;
    const qint64 end = completedAtMs_ > 0 ? completedAtMs_ : nowMs;
    return qMax<qint64>(0, end - startedAtMs_);
}

double TransferTask::averageSpeed(qint64 nowMs) const {
    const qint64 d = durationMs(nowMs);
    if (d <= 0)
        return 0.0;
    return static_cast<double>(transferred_) * 1000.0 / static_cast<double>(d);
}

void TransferTask::recomputeProgress() {
    if (!sizeKnown_ || size_ == 0)
        return;
    double p = static_cast<double>(transferred_) * 100.0 /
               static_cast<double>(size_);
    if (p > 100.0)
        p = 100.0;
    if (status_ == TaskStatus::Running && p < progress_)
        return;
    progress_ = p;
}

} // namespace openxfer
