// Records of finished tasks. The queue hands every task that reaches a
// terminal state to a sink; what the sink keeps is up to it.
#pragma once
#include "TransferTask.hpp"
#include <QString>
#include <QVector>
#include <deque>
#include <optional>

namespace openxfer {

struct HistoryRecord {
    quint64 taskId = 0;
    Direction direction = Direction::Upload;
    TaskStatus status = TaskStatus::Completed;
    QString hostId;
    QString localPath;
    QString remotePath;
    QString fileName;
    quint64 size = 0;
    quint64 transferred = 0;
    qint64 startedAtMs = 0;
    qint64 completedAtMs = 0;
    qint64 durationMs = 0;
    double averageSpeed = 0.0;
    int retryCount = 0;
    QString error;
    ErrorKind failureKind = ErrorKind::None;

    static HistoryRecord fromTask(const TransferTask &task);
};

class TransferHistorySink {
public:
    virtual ~TransferHistorySink() = default;
    virtual void record(const TransferTask &task) = 0;
};

struct HistoryFilter {
    std::optional<QString> hostId;
    std::optional<TaskStatus> status;
    std::optional<Direction> direction;
};

struct HistoryCounters {
    int total = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;
    quint64 bytesTransferred = 0; // completed tasks only
};

// Newest first, bounded; the oldest record falls off.
class InMemoryTransferHistory : public TransferHistorySink {
public:
    explicit InMemoryTransferHistory(int capacity = 100);

    void record(const TransferTask &task) override;

    QVector<HistoryRecord> records(const HistoryFilter &filter = {}) const;
    HistoryCounters counters() const;
    int size() const { return static_cast<int>(records_.size()); }
    int capacity() const { return capacity_; }
    void clear();

private:
    int capacity_;
    std::deque<HistoryRecord> records_;
};

} // namespace openxfer
