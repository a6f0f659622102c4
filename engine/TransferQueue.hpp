// Orchestrates transfer tasks: priority scheduling under a concurrency bound,
// session leasing, parallel chunking for large files, retry with backoff and
// pause/resume/cancel. All methods must be called on the queue's thread.
#pragma once
#include "ChunkedTransfer.hpp"
#include "EngineConfig.hpp"
#include "HostRegistry.hpp"
#include "IoDispatcher.hpp"
#include "SessionPool.hpp"
#include "TransferHistory.hpp"
#include "TransferTask.hpp"
#include "openxfer/DeltaDiff.hpp"
#include <QObject>
#include <QTimer>
#include <QVector>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace openxfer {

struct TaskRequest {
    Direction direction = Direction::Upload;
    QString hostId;
    QString localPath;
    QString remotePath;
    bool isDirectory = false;
    quint64 size = 0; // 0: discovered when the task starts
    std::optional<Priority> priority;
    std::optional<int> maxRetries;
};

// Result of planSync(): what a delta sync of localDir into remoteDir would do.
struct SyncPlan {
    QString hostId;
    QString localDir;
    QString remoteDir;
    DiffOptions options;
    DiffResult diff;
    TransferError error;

    bool ok() const { return error.ok(); }
};

class TransferQueue : public QObject {
    Q_OBJECT
public:
    TransferQueue(SessionPool &pool, ChunkedTransferManager &chunks,
                  IoDispatcher &io, const HostRegistry &hosts,
                  const CredentialStore &credentials,
                  const EngineConfig &config = EngineConfig(),
                  QObject *parent = nullptr);
    ~TransferQueue() override;

    // Scheduling starts with initialize(); shutdown() pauses running tasks
    // and stops scheduling.
    void initialize();
    void shutdown();

    quint64 addTask(const TaskRequest &request);
    // One scheduling pass for the whole batch.
    QVector<quint64> addTasks(const QVector<TaskRequest> &requests);

    bool pauseTask(quint64 id);
    bool resumeTask(quint64 id);
    bool cancelTask(quint64 id);
    bool removeTask(quint64 id);
    // Re-queues a permanently failed task with a fresh retry budget.
    bool retryTask(quint64 id);

    void pauseQueue();
    void resumeQueue();
    bool isQueuePaused() const { return paused_; }
    // Drops completed, failed and cancelled tasks; returns how many.
    int clearCompleted();
    void clearAll();

    void setMaxConcurrent(int n);
    int maxConcurrent() const { return config_.maxConcurrent; }
    void setRetryPolicy(const RetryPolicy &policy);
    const RetryPolicy &retryPolicy() const { return config_.retry; }
    // Not owned; may be null.
    void setHistorySink(TransferHistorySink *sink) { history_ = sink; }

    TransferStats getStats() const;
    QVector<TransferTask> tasks() const { return tasks_; }
    std::optional<TransferTask> task(quint64 id) const;
    // Tasks holding a run slot, including paused ones still unwinding.
    int runningCount() const { return static_cast<int>(active_.size()); }

    using SyncPlanCallback = std::function<void(const SyncPlan &)>;
    // Diffs localDir against remoteDir without transferring anything.
    void planSync(const QString &hostId, const QString &localDir,
                  const QString &remoteDir, const DiffOptions &options,
                  SyncPlanCallback callback);
    // Queues one upload per toUpload entry and, with options.deleteRemote,
    // removes the toDelete entries. Returns the new task ids.
    QVector<quint64> applySyncPlan(const SyncPlan &plan);

signals:
    void taskAdded(quint64 id);
    void taskUpdated(quint64 id);
    void taskProgress(quint64 id, quint64 transferred, quint64 total,
                      double speed);
    void chunkProgress(quint64 id, int chunkIndex, quint64 transferred,
                       quint64 size);
    void queueChanged();
    void taskFinished(quint64 id);

private slots:
    void schedule();

private:
    struct SessionTarget {
        HostIdentity identity;
        SessionOptions options;
    };
    struct ActiveRun {
        Direction direction = Direction::Upload;
        QString hostId;
        QString localPath;
        QString remotePath;
        SessionTarget target;
        SessionLease lease;
        quint64 ticket = 0;
        bool chunked = false;
        bool cleanupOnFinish = false;
        bool interrupted = false; // lease was cut off mid-operation
        bool directory = false;
    };

    std::vector<quint64> taskIds() const;
    TransferTask *find(quint64 id);
    const TransferTask *find(quint64 id) const;
    quint64 enqueue(const TaskRequest &request);
    bool resolveHost(const QString &hostId, SessionTarget &target,
                     TransferError &err) const;

    void startTask(quint64 id);
    void acquireFor(quint64 id, std::function<void(const SessionLease &)> then);
    void lookupRemoteSize(quint64 id, const SessionLease &lease);
    void runWholeFile(quint64 id, const SessionLease &lease);
    void runDirectory(quint64 id, const SessionLease &lease);
    void runChunked(quint64 id);
    ByteProgress progressFor(quint64 id, const CancellationToken &token);
    void onProgress(quint64 id, const CancellationToken &token,
                    quint64 transferred, quint64 total);

    void finishRunLater(quint64 id, const TransferError &err);
    void finishRun(quint64 id, const TransferError &err, bool sessionBroken);
    void handleFailure(TransferTask &task, const TransferError &err);
    void interruptRun(quint64 id);
    void dropRetryTimer(quint64 id);
    void cleanupPartial(Direction direction, const QString &hostId,
                        const QString &localPath, const QString &remotePath,
                        bool directory = false);
    void deleteRemoteEntries(const SyncPlan &plan);
    void recordHistory(const TransferTask &task);
    void scheduleLater();

    SessionPool &pool_;
    ChunkedTransferManager &chunks_;
    IoDispatcher &io_;
    const HostRegistry &hosts_;
    const CredentialStore &credentials_;
    EngineConfig config_;
    TransferHistorySink *history_ = nullptr;

    QVector<TransferTask> tasks_;
    std::map<quint64, ActiveRun> active_;
    std::map<quint64, QTimer *> retryTimers_;
    quint64 nextId_ = 1;
    bool started_ = false;
    bool paused_ = false;
};

} // namespace openxfer
