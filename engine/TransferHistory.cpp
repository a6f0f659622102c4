#include "TransferHistory.hpp"

namespace openxfer {

HistoryRecord HistoryRecord::fromTask(const TransferTask &task) {
    HistoryRecord r;
    r.taskId = task.id();
    r.direction = task.direction();
    r.status = task.status();
    r.hostId = task.hostId();
    r.localPath = task.localPath();
    r.remotePath = task.remotePath();
    r.fileName = task.fileName();
    r.size = task.size();
    r.transferred = task.transferred();
    r.startedAtMs = task.startedAtMs();
    r.completedAtMs = task.completedAtMs();
    r.durationMs = task.durationMs(task.completedAtMs());
    r.averageSpeed = task.averageSpeed(task.completedAtMs());
    r.retryCount = task.retryCount();
    r.error = task.lastError();
    r.failureKind = task.failureKind();
    return r;
}

InMemoryTransferHistory::InMemoryTransferHistory(int capacity)
    : capacity_(qMax(1, capacity)) {}

void InMemoryTransferHistory::record(const TransferTask &task) {
    records_.push_front(HistoryRecord::fromTask(task));
    while (static_cast<int>(records_.size()) > capacity_)
        records_.pop_back();
}

QVector<HistoryRecord>
InMemoryTransferHistory::records(const HistoryFilter &filter) const {
    QVector<HistoryRecord> out;
    for (const auto &r : records_) {
        if (filter.hostId && r.hostId != *filter.hostId)
            continue;
        if (filter.status && r.status != *filter.status)
            continue;
        if (filter.direction && r.direction != *filter.direction)
            continue;
        out.push_back(r);
    }
    return out;
}

HistoryCounters InMemoryTransferHistory::counters() const {
    HistoryCounters c;
    for (const auto &r : records_) {
        c.total++;
        switch (r.status) {
        case TaskStatus::Completed:
            c.completed++;
            c.bytesTransferred += r.transferred;
            break;
        case TaskStatus::Failed:
            c.failed++;
            break;
        case TaskStatus::Cancelled:
            c.cancelled++;
            break;
        default:
            break;
        }
    }
    return c;
}

void InMemoryTransferHistory::clear() { records_.clear(); }

} // namespace openxfer
