#include "TransferQueue.hpp"
#include "Logging.hpp"
#include "openxfer/RemotePath.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <algorithm>
#include <climits>

namespace openxfer {

namespace {

struct RemoteLookup {
    OperationResult result;
    bool found = false;
    FileInfo info{};
};

TransferError abortedError() {
    return TransferError::make(ErrorKind::TransferAborted,
                               QStringLiteral("Transfer interrupted"));
}

} // namespace

TransferQueue::TransferQueue(SessionPool &pool, ChunkedTransferManager &chunks,
                             IoDispatcher &io, const HostRegistry &hosts,
                             const CredentialStore &credentials,
                             const EngineConfig &config, QObject *parent)
    : QObject(parent), pool_(pool), chunks_(chunks), io_(io), hosts_(hosts),
      credentials_(credentials), config_(config) {
    config_.sanitize();
}

TransferQueue::~TransferQueue() {
    shutdown();
    io_.waitForDone();
}

void TransferQueue::initialize() {
    started_ = true;
    qCInfo(oxQueue) << "Queue started, max concurrent" << config_.maxConcurrent;
    scheduleLater();
}

void TransferQueue::shutdown() {
    if (!started_)
        return;
    started_ = false;
    for (auto &kv : retryTimers_) {
        kv.second->stop();
        kv.second->deleteLater();
    }
    retryTimers_.clear();
    // Slots may add or remove tasks, so walk a copy of the ids.
    for (quint64 id : taskIds()) {
        TransferTask *t = find(id);
        if (t && t->status() == TaskStatus::Running) {
            t->pause();
            interruptRun(id);
            emit taskUpdated(id);
        }
    }
    qCInfo(oxQueue) << "Queue shut down";
    emit queueChanged();
}

std::vector<quint64> TransferQueue::taskIds() const {
    std::vector<quint64> ids;
    ids.reserve(static_cast<std::size_t>(tasks_.size()));
    for (const auto &t : tasks_)
        ids.push_back(t.id());
    return ids;
}

TransferTask *TransferQueue::find(quint64 id) {
    for (auto &t : tasks_)
        if (t.id() == id)
            return &t;
    return nullptr;
}

const TransferTask *TransferQueue::find(quint64 id) const {
    for (const auto &t : tasks_)
        if (t.id() == id)
            return &t;
    return nullptr;
}

std::optional<TransferTask> TransferQueue::task(quint64 id) const {
    const TransferTask *t = find(id);
    if (!t)
        return std::nullopt;
    return *t;
}

bool TransferQueue::resolveHost(const QString &hostId, SessionTarget &target,
                                TransferError &err) const {
    const auto host = hosts_.findHost(hostId);
    if (!host) {
        err = TransferError::make(ErrorKind::Configuration,
                                  QStringLiteral("Host not found: %1").arg(hostId));
        return false;
    }
    const auto creds = credentials_.credentialsFor(hostId);
    if (!creds) {
        err = TransferError::make(
            ErrorKind::Configuration,
            QStringLiteral("No credentials for host: %1").arg(hostId));
        return false;
    }
    target.identity = HostIdentity::from(*host, *creds);
    target.options = makeSessionOptions(*host, *creds);
    return true;
}

quint64 TransferQueue::enqueue(const TaskRequest &request) {
    const quint64 id = nextId_++;
    TransferTask t(id, request.direction, request.hostId, request.localPath,
                   request.remotePath);
    t.setDirectory(request.isDirectory);
    t.setMaxRetries(request.maxRetries.value_or(config_.retry.maxRetries));
    if (request.size > 0)
        t.setSize(request.size);
    if (request.priority)
        t.setPriority(*request.priority);
    tasks_.push_back(t);
    qCInfo(oxQueue) << "Queued task" << id << directionName(t.direction())
                    << logValue(t.fileName()) << "priority"
                    << priorityName(t.priority());
    emit taskAdded(id);
    return id;
}

quint64 TransferQueue::addTask(const TaskRequest &request) {
    const quint64 id = enqueue(request);
    emit queueChanged();
    schedule();
    return id;
}

QVector<quint64> TransferQueue::addTasks(const QVector<TaskRequest> &requests) {
    QVector<quint64> ids;
    ids.reserve(requests.size());
    for (const auto &r : requests)
        ids.push_back(enqueue(r));
    emit queueChanged();
    schedule();
    return ids;
}

void TransferQueue::scheduleLater() {
    QMetaObject::invokeMethod(this, "schedule", Qt::QueuedConnection);
}

void TransferQueue::schedule() {
    if (!started_ || paused_)
        return;
    std::vector<const TransferTask *> pending;
    for (const auto &t : tasks_) {
        if (t.status() == TaskStatus::Pending && active_.count(t.id()) == 0)
            pending.push_back(&t);
    }
    std::sort(pending.begin(), pending.end(),
              [](const TransferTask *a, const TransferTask *b) {
                  if (a->priority() != b->priority())
                      return a->priority() > b->priority();
                  if (a->createdAtMs() != b->createdAtMs())
                      return a->createdAtMs() < b->createdAtMs();
                  return a->id() < b->id();
              });
    std::vector<quint64> order;
    for (const auto *t : pending)
        order.push_back(t->id());
    for (quint64 id : order) {
        if (runningCount() >= config_.maxConcurrent)
            break;
        startTask(id);
    }
}

void TransferQueue::startTask(quint64 id) {
    TransferTask *t = find(id);
    if (!t || active_.count(id) > 0)
        return;
    const bool firstStart = t->startedAtMs() == 0;
    if (!t->start())
        return;
    {
        ActiveRun &run = active_[id];
        run.direction = t->direction();
        run.hostId = t->hostId();
        run.localPath = t->localPath();
        run.remotePath = t->remotePath();
    }
    if (firstStart && t->direction() == Direction::Download)
        t->setOwnsLocalOutput(!QFileInfo::exists(t->localPath()));
    qCInfo(oxQueue) << "Starting task" << id << directionName(t->direction())
                    << logValue(t->fileName())
                    << (t->transferred() > 0 ? "(resume)" : "");
    emit taskUpdated(id);

    // A slot may have paused, cancelled or removed the task.
    t = find(id);
    if (!t || t->status() != TaskStatus::Running) {
        finishRunLater(id, abortedError());
        return;
    }

    TransferError err;
    if (!resolveHost(t->hostId(), active_[id].target, err)) {
        finishRunLater(id, err);
        return;
    }

    if (t->isDirectory()) {
        acquireFor(id, [this, id](const SessionLease &lease) {
            runDirectory(id, lease);
        });
        return;
    }

    if (t->direction() == Direction::Upload) {
        const QFileInfo fi(t->localPath());
        if (!fi.isFile()) {
            finishRunLater(id, TransferError::make(
                                   ErrorKind::Io,
                                   QStringLiteral("Local file not found: %1")
                                       .arg(t->localPath())));
            return;
        }
        t->setSize((quint64)fi.size());
        if (chunks_.shouldUseParallel(t->size(), t->transferred(),
                                      t->hasChunkPlan())) {
            runChunked(id);
            return;
        }
        acquireFor(id, [this, id](const SessionLease &lease) {
            runWholeFile(id, lease);
        });
        return;
    }

    // A download needs the remote size before it can pick a strategy,
    // unless an earlier run already planned chunks.
    if (t->hasChunkPlan() && t->sizeKnown() &&
        chunks_.shouldUseParallel(t->size(), t->transferred(), true)) {
        runChunked(id);
        return;
    }
    acquireFor(id, [this, id](const SessionLease &lease) {
        lookupRemoteSize(id, lease);
    });
}

void TransferQueue::acquireFor(quint64 id,
                               std::function<void(const SessionLease &)> then) {
    ActiveRun &run = active_[id];
    run.ticket = pool_.acquire(
        run.target.identity, run.target.options,
        [this, id, then](const SessionPool::AcquireResult &ar) {
            auto it = active_.find(id);
            if (it == active_.end()) {
                if (ar.ok())
                    pool_.release(ar.lease);
                return;
            }
            it->second.ticket = 0;
            if (!ar.ok()) {
                finishRun(id, ar.error, false);
                return;
            }
            it->second.lease = ar.lease;
            const TransferTask *t = find(id);
            if (!t || t->status() != TaskStatus::Running) {
                finishRun(id, abortedError(), false);
                return;
            }
            then(ar.lease);
        });
}

void TransferQueue::lookupRemoteSize(quint64 id, const SessionLease &lease) {
    const std::string remote = find(id)->remotePath().toStdString();
    const CancellationToken token = find(id)->token();
    io_.run(
        this,
        [lease, remote, token]() {
            RemoteLookup p;
            std::string err;
            p.found = lease.client->stat(remote, p.info, err);
            if (!p.found && !err.empty())
                p.result = classifyFailure(*lease.client, token,
                                           QString::fromStdString(err));
            return p;
        },
        [this, id, lease](const RemoteLookup &p) {
            TransferTask *t = find(id);
            if (!p.result.error.ok()) {
                finishRun(id, p.result.error, p.result.sessionBroken);
                return;
            }
            if (!t || t->status() != TaskStatus::Running) {
                finishRun(id, abortedError(), false);
                return;
            }
            if (!p.found) {
                finishRun(id,
                          TransferError::make(
                              ErrorKind::Io,
                              QStringLiteral("Remote file not found: %1")
                                  .arg(t->remotePath())),
                          false);
                return;
            }
            if (p.info.is_dir) {
                t->setDirectory(true);
                runDirectory(id, lease);
                return;
            }
            t->setSize(p.info.size);
            const bool parallel = chunks_.shouldUseParallel(
                t->size(), t->transferred(), t->hasChunkPlan());
            emit taskUpdated(id);
            t = find(id);
            if (!t || t->status() != TaskStatus::Running) {
                finishRun(id, abortedError(), false);
                return;
            }
            if (parallel) {
                // Chunks lease their own sessions.
                pool_.release(lease);
                active_[id].lease = SessionLease();
                runChunked(id);
                return;
            }
            runWholeFile(id, lease);
        });
}

ByteProgress TransferQueue::progressFor(quint64 id,
                                        const CancellationToken &token) {
    return throttledProgress([this, id, token](quint64 done, quint64 total) {
        IoDispatcher::post(this, [this, id, token, done, total]() {
            onProgress(id, token, done, total);
        });
    });
}

void TransferQueue::onProgress(quint64 id, const CancellationToken &token,
                               quint64 transferred, quint64 total) {
    TransferTask *t = find(id);
    if (!t || !t->token().sameAs(token) || t->status() != TaskStatus::Running)
        return;
    t->updateProgress(transferred, total);
    emit taskProgress(id, t->transferred(), t->size(), t->speed());
}

void TransferQueue::runWholeFile(quint64 id, const SessionLease &lease) {
    const TransferTask *t = find(id);
    const Direction direction = t->direction();
    const QString local = t->localPath();
    const QString remote = t->remotePath();
    const bool resume = t->transferred() > 0;
    OperationContext ctx;
    ctx.token = t->token();
    ctx.integrity = config_.integrity;
    ctx.attributes = config_.attributes;
    const ByteProgress progress = progressFor(id, ctx.token);
    io_.run(
        this,
        [lease, direction, local, remote, resume, ctx, progress]() {
            return transferFile(*lease.client, direction, local, remote,
                                resume, ctx, progress);
        },
        [this, id](const OperationResult &r) {
            finishRun(id, r.error, r.sessionBroken);
        });
}

void TransferQueue::runDirectory(quint64 id, const SessionLease &lease) {
    const TransferTask *t = find(id);
    const Direction direction = t->direction();
    const QString local = t->localPath();
    const QString remote = t->remotePath();
    OperationContext ctx;
    ctx.token = t->token();
    ctx.integrity = config_.integrity;
    ctx.attributes = config_.attributes;
    ctx.diff = config_.sync.toDiffOptions();
    const ByteProgress progress = progressFor(id, ctx.token);
    io_.run(
        this,
        [lease, direction, local, remote, ctx, progress]() {
            return direction == Direction::Upload
                       ? uploadDirectory(*lease.client, local, remote, ctx,
                                         progress)
                       : downloadDirectory(*lease.client, remote, local, ctx,
                                           progress);
        },
        [this, id](const OperationResult &r) {
            finishRun(id, r.error, r.sessionBroken);
        });
}

void TransferQueue::runChunked(quint64 id) {
    const TransferTask *t = find(id);
    ActiveRun &run = active_[id];
    run.chunked = true;

    ChunkedJob job;
    job.taskId = id;
    job.direction = t->direction();
    job.identity = run.target.identity;
    job.options = run.target.options;
    job.localPath = t->localPath();
    job.remotePath = t->remotePath();
    job.size = t->size();
    job.chunks = t->chunks();
    job.token = t->token();
    job.integrity = config_.integrity;
    job.attributes = config_.attributes;

    ChunkedCallbacks cb;
    cb.onPlanned = [this, id](const std::vector<Chunk> &chunks) {
        TransferTask *task = find(id);
        if (!task)
            return;
        task->initializeChunks(chunks);
        emit taskUpdated(id);
    };
    cb.onChunkProgress = [this, id](const Chunk &c) {
        TransferTask *task = find(id);
        if (!task)
            return;
        task->updateChunkProgress(c.index, c.transferred, c.status);
        const quint64 transferred = task->transferred();
        const quint64 size = task->size();
        const double speed = task->speed();
        emit chunkProgress(id, c.index, c.transferred, c.size);
        emit taskProgress(id, transferred, size, speed);
    };
    cb.onFinished = [this, id](const TransferError &err) {
        finishRun(id, err, false);
    };
    chunks_.start(std::move(job), std::move(cb));
}

void TransferQueue::finishRunLater(quint64 id, const TransferError &err) {
    IoDispatcher::post(this, [this, id, err]() { finishRun(id, err, false); });
}

void TransferQueue::finishRun(quint64 id, const TransferError &err,
                              bool sessionBroken) {
    auto it = active_.find(id);
    if (it == active_.end())
        return;
    const ActiveRun run = it->second;
    active_.erase(it);
    if (run.lease.valid()) {
        if (sessionBroken || run.interrupted)
            pool_.discard(run.lease);
        else
            pool_.release(run.lease);
    }

    TransferTask *t = find(id);
    if (t) {
        switch (t->status()) {
        case TaskStatus::Running:
            if (err.ok()) {
                t->complete();
                qCInfo(oxQueue) << "Task" << id << "completed" << t->size()
                                << "bytes in" << t->durationMs() << "ms";
                recordHistory(*t);
                emit taskUpdated(id);
                emit taskFinished(id);
            } else {
                handleFailure(*t, err);
            }
            break;
        case TaskStatus::Paused:
        case TaskStatus::Pending:
            qCInfo(oxQueue) << "Task" << id << "stopped at" << t->transferred()
                            << "bytes";
            emit taskUpdated(id);
            break;
        default:
            break;
        }
    }
    if (run.cleanupOnFinish)
        cleanupPartial(run.direction, run.hostId, run.localPath,
                       run.remotePath, run.directory);
    emit queueChanged();
    schedule();
}

void TransferQueue::handleFailure(TransferTask &task, const TransferError &err) {
    const quint64 id = task.id();
    if (err.kind == ErrorKind::Integrity) {
        // The mismatching output gets overwritten by a full transfer.
        task.resetTransferState();
    }
    const bool retryable = err.kind != ErrorKind::Configuration;
    if (config_.retry.enabled && retryable && task.canRetry()) {
        task.fail(err.message, err.kind);
        const int attempt = task.retryCount() + 1;
        const qint64 delay = retryDelayMs(config_.retry, attempt);
        qCWarning(oxQueue) << "Task" << id << "failed:" << err.message
                           << "- retry" << attempt << "of" << task.maxRetries()
                           << "in" << delay << "ms";
        dropRetryTimer(id);
        auto *timer = new QTimer(this);
        timer->setSingleShot(true);
        connect(timer, &QTimer::timeout, this, [this, id, timer]() {
            retryTimers_.erase(id);
            timer->deleteLater();
            TransferTask *t = find(id);
            if (!t || t->status() != TaskStatus::Failed || !t->incrementRetry())
                return;
            qCInfo(oxQueue) << "Retrying task" << id << "attempt"
                            << t->retryCount();
            emit taskUpdated(id);
            emit queueChanged();
            schedule();
        });
        retryTimers_[id] = timer;
        timer->start(static_cast<int>(qMin<qint64>(delay, INT_MAX)));
        emit taskUpdated(id);
        return;
    }

    const ErrorKind kind =
        (retryable && config_.retry.enabled && task.maxRetries() > 0)
            ? ErrorKind::RetryExhausted
            : err.kind;
    task.fail(err.message, kind);
    qCWarning(oxQueue) << "Task" << id << "failed permanently ("
                       << errorKindName(kind) << "):" << err.message;
    recordHistory(task);
    emit taskUpdated(id);
    emit taskFinished(id);
}

void TransferQueue::interruptRun(quint64 id) {
    auto it = active_.find(id);
    if (it == active_.end())
        return;
    ActiveRun &run = it->second;
    if (run.ticket)
        pool_.cancelAcquire(run.ticket);
    if (run.chunked)
        chunks_.abort(id);
    if (run.lease.valid()) {
        run.lease.client->interrupt();
        run.interrupted = true;
    }
}

void TransferQueue::dropRetryTimer(quint64 id) {
    auto it = retryTimers_.find(id);
    if (it == retryTimers_.end())
        return;
    it->second->stop();
    it->second->deleteLater();
    retryTimers_.erase(it);
}

bool TransferQueue::pauseTask(quint64 id) {
    TransferTask *t = find(id);
    if (!t || !t->pause())
        return false;
    interruptRun(id);
    qCInfo(oxQueue) << "Paused task" << id << "at" << t->transferred()
                    << "bytes";
    emit taskUpdated(id);
    emit queueChanged();
    return true;
}

bool TransferQueue::resumeTask(quint64 id) {
    TransferTask *t = find(id);
    if (!t || !t->resume())
        return false;
    qCInfo(oxQueue) << "Resumed task" << id;
    emit taskUpdated(id);
    emit queueChanged();
    schedule();
    return true;
}

bool TransferQueue::cancelTask(quint64 id) {
    TransferTask *t = find(id);
    if (!t)
        return false;
    if (t->status() == TaskStatus::Failed &&
        retryTimers_.count(id) > 0) {
        // Waiting for a retry: the retry is dropped, the failure stands.
        dropRetryTimer(id);
        qCInfo(oxQueue) << "Dropped pending retry of task" << id;
        recordHistory(*t);
        emit taskFinished(id);
        emit queueChanged();
        return false;
    }
    const bool started = t->startedAtMs() > 0;
    if (!t->cancel())
        return false;
    // A directory download only removes a tree this task created itself.
    const bool cleanup =
        started && (!t->isDirectory() ||
                    (t->direction() == Direction::Download &&
                     t->ownsLocalOutput()));
    auto it = active_.find(id);
    if (it != active_.end()) {
        interruptRun(id);
        it->second.cleanupOnFinish = cleanup;
        it->second.directory = t->isDirectory();
    } else if (cleanup) {
        cleanupPartial(t->direction(), t->hostId(), t->localPath(),
                       t->remotePath(), t->isDirectory());
    }
    qCInfo(oxQueue) << "Canceled task" << id;
    recordHistory(*t);
    emit taskUpdated(id);
    emit taskFinished(id);
    emit queueChanged();
    scheduleLater();
    return true;
}

bool TransferQueue::removeTask(quint64 id) {
    const TransferTask *t = find(id);
    if (!t)
        return false;
    if (!isTerminal(t->status()))
        cancelTask(id);
    dropRetryTimer(id);
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [id](const TransferTask &x) {
                                    return x.id() == id;
                                }),
                 tasks_.end());
    qCInfo(oxQueue) << "Removed task" << id;
    emit queueChanged();
    return true;
}

bool TransferQueue::retryTask(quint64 id) {
    TransferTask *t = find(id);
    if (!t || t->status() != TaskStatus::Failed)
        return false;
    dropRetryTimer(id);
    if (!t->requeueAfterFailure())
        return false;
    qCInfo(oxQueue) << "Manual retry of task" << id;
    emit taskUpdated(id);
    emit queueChanged();
    schedule();
    return true;
}

void TransferQueue::pauseQueue() {
    paused_ = true;
    for (quint64 id : taskIds()) {
        const TransferTask *t = find(id);
        if (t && t->status() == TaskStatus::Running)
            pauseTask(id);
    }
    qCInfo(oxQueue) << "Queue paused";
    emit queueChanged();
}

void TransferQueue::resumeQueue() {
    paused_ = false;
    for (quint64 id : taskIds()) {
        TransferTask *t = find(id);
        if (t && t->resume())
            emit taskUpdated(id);
    }
    qCInfo(oxQueue) << "Queue resumed";
    emit queueChanged();
    schedule();
}

int TransferQueue::clearCompleted() {
    const int before = static_cast<int>(tasks_.size());
    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [this](const TransferTask &t) {
                                    return isTerminal(t.status()) &&
                                           retryTimers_.count(t.id()) == 0 &&
                                           active_.count(t.id()) == 0;
                                }),
                 tasks_.end());
    const int removed = before - static_cast<int>(tasks_.size());
    qCInfo(oxQueue) << "Cleared" << removed << "finished tasks";
    emit queueChanged();
    return removed;
}

void TransferQueue::clearAll() {
    for (quint64 id : taskIds()) {
        const TransferTask *t = find(id);
        if (t && !isTerminal(t->status()))
            cancelTask(id);
        dropRetryTimer(id);
    }
    tasks_.clear();
    qCInfo(oxQueue) << "Queue cleared";
    emit queueChanged();
}

void TransferQueue::setMaxConcurrent(int n) {
    config_.maxConcurrent = qMax(1, n);
    emit queueChanged();
    schedule();
}

void TransferQueue::setRetryPolicy(const RetryPolicy &policy) {
    config_.retry = policy;
    config_.sanitize();
}

TransferStats TransferQueue::getStats() const {
    TransferStats st;
    double speedSum = 0.0;
    int speedCount = 0;
    for (const auto &t : tasks_) {
        st.total++;
        switch (t.status()) {
        case TaskStatus::Pending:
            st.pending++;
            break;
        case TaskStatus::Running:
            st.running++;
            if (t.speed() > 0.0) {
                speedSum += t.speed();
                speedCount++;
            }
            break;
        case TaskStatus::Paused:
            st.paused++;
            break;
        case TaskStatus::Completed:
            st.completed++;
            break;
        case TaskStatus::Failed:
            st.failed++;
            break;
        case TaskStatus::Cancelled:
            st.cancelled++;
            break;
        }
        st.totalBytes += t.size();
        st.transferredBytes += t.transferred();
    }
    if (speedCount > 0)
        st.averageSpeed = speedSum / speedCount;
    return st;
}

void TransferQueue::cleanupPartial(Direction direction, const QString &hostId,
                                   const QString &localPath,
                                   const QString &remotePath, bool directory) {
    if (directory) {
        // Only downloads get here: a partial remote tree is left alone.
        if (direction == Direction::Download)
            io_.start([localPath]() { (void)removePartialDirectory(localPath); });
        return;
    }
    if (direction == Direction::Download) {
        io_.start([localPath, remotePath]() {
            (void)removePartialArtifact(nullptr, Direction::Download,
                                        localPath, remotePath);
        });
        return;
    }
    SessionTarget target;
    TransferError err;
    if (!resolveHost(hostId, target, err)) {
        qCWarning(oxQueue) << "Cannot remove partial upload:" << err.message;
        return;
    }
    pool_.acquire(target.identity, target.options,
                  [this, localPath, remotePath](
                      const SessionPool::AcquireResult &ar) {
                      if (!ar.ok()) {
                          qCWarning(oxQueue)
                              << "Cannot remove partial upload"
                              << logValue(remotePath) << ":"
                              << ar.error.message;
                          return;
                      }
                      const SessionLease lease = ar.lease;
                      io_.run(
                          this,
                          [lease, localPath, remotePath]() {
                              (void)removePartialArtifact(
                                  lease.client.get(), Direction::Upload,
                                  localPath, remotePath);
                              return !lease.client->isConnected();
                          },
                          [this, lease](bool broken) {
                              if (broken)
                                  pool_.discard(lease);
                              else
                                  pool_.release(lease);
                          });
                  });
}

void TransferQueue::recordHistory(const TransferTask &task) {
    if (history_)
        history_->record(task);
}

void TransferQueue::planSync(const QString &hostId, const QString &localDir,
                             const QString &remoteDir,
                             const DiffOptions &options,
                             SyncPlanCallback callback) {
    SyncPlan plan;
    plan.hostId = hostId;
    plan.localDir = localDir;
    plan.remoteDir = remoteDir;
    plan.options = options;

    SessionTarget target;
    if (!resolveHost(hostId, target, plan.error)) {
        IoDispatcher::post(this, [callback, plan]() { callback(plan); });
        return;
    }
    pool_.acquire(
        target.identity, target.options,
        [this, plan, callback](const SessionPool::AcquireResult &ar) mutable {
            if (!ar.ok()) {
                plan.error = ar.error;
                callback(plan);
                return;
            }
            const SessionLease lease = ar.lease;
            io_.run(
                this,
                [lease, plan]() mutable {
                    Snapshot local, remote;
                    QString lerr;
                    if (!buildLocalSnapshot(plan.localDir, local, lerr)) {
                        plan.error = TransferError::make(ErrorKind::Io, lerr);
                        return plan;
                    }
                    std::string err;
                    if (!buildRemoteSnapshot(*lease.client,
                                             plan.remoteDir.toStdString(),
                                             remote, err)) {
                        plan.error = classifyFailure(
                                         *lease.client, CancellationToken(),
                                         QString::fromStdString(err))
                                         .error;
                        return plan;
                    }
                    if (!calculateDiff(local, remote, plan.options, plan.diff,
                                       err))
                        plan.error = TransferError::make(
                            ErrorKind::Configuration,
                            QString::fromStdString(err));
                    return plan;
                },
                [this, lease, callback](const SyncPlan &result) {
                    if (lease.client->isConnected())
                        pool_.release(lease);
                    else
                        pool_.discard(lease);
                    if (result.ok())
                        qCInfo(oxSync)
                            << "Sync plan" << logValue(result.localDir) << "->"
                            << logValue(result.remoteDir) << ":"
                            << result.diff.toUpload.size() << "upload,"
                            << result.diff.toDelete.size() << "delete,"
                            << result.diff.unchanged.size() << "unchanged";
                    callback(result);
                });
        });
}

QVector<quint64> TransferQueue::applySyncPlan(const SyncPlan &plan) {
    if (!plan.ok())
        return {};
    QVector<TaskRequest> requests;
    const QDir ldir(plan.localDir);
    const std::string rroot = plan.remoteDir.toStdString();
    for (const DiffEntry &e : plan.diff.toUpload) {
        TaskRequest r;
        r.direction = Direction::Upload;
        r.hostId = plan.hostId;
        r.localPath = ldir.filePath(QString::fromStdString(e.path));
        r.remotePath = QString::fromStdString(joinRemotePath(rroot, e.path));
        r.size = e.size;
        requests.push_back(r);
    }
    QVector<quint64> ids;
    if (!requests.isEmpty())
        ids = addTasks(requests);
    if (plan.options.deleteRemote && !plan.diff.toDelete.empty())
        deleteRemoteEntries(plan);
    return ids;
}

void TransferQueue::deleteRemoteEntries(const SyncPlan &plan) {
    SessionTarget target;
    TransferError err;
    if (!resolveHost(plan.hostId, target, err)) {
        qCWarning(oxSync) << "Cannot delete remote entries:" << err.message;
        return;
    }
    std::vector<std::string> paths;
    const std::string rroot = plan.remoteDir.toStdString();
    for (const DiffEntry &e : plan.diff.toDelete)
        paths.push_back(joinRemotePath(rroot, e.path));
    pool_.acquire(
        target.identity, target.options,
        [this, paths](const SessionPool::AcquireResult &ar) {
            if (!ar.ok()) {
                qCWarning(oxSync) << "Cannot delete remote entries:"
                                  << ar.error.message;
                return;
            }
            const SessionLease lease = ar.lease;
            io_.run(
                this,
                [lease, paths]() {
                    for (const auto &p : paths) {
                        std::string err;
                        if (!lease.client->removeFile(p, err)) {
                            qCWarning(oxSync)
                                << "Failed to delete remote"
                                << logValue(QString::fromStdString(p)) << ":"
                                << QString::fromStdString(err);
                            if (!lease.client->isConnected())
                                break;
                        } else {
                            qCDebug(oxSync)
                                << "Deleted remote"
                                << logValue(QString::fromStdString(p));
                        }
                    }
                    return !lease.client->isConnected();
                },
                [this, lease](bool broken) {
                    if (broken)
                        pool_.discard(lease);
                    else
                        pool_.release(lease);
                });
        });
}

} // namespace openxfer
