// End-to-end queue behaviour against the mock backend: scheduling, retries,
// pause/resume/cancel, history and delta sync.
#include "TestSupport.hpp"
#include "TransferQueue.hpp"

#include <QElapsedTimer>
#include <QTemporaryDir>
#include <algorithm>
#include <map>
#include <set>
#include <vector>

using openxfer::test::TestContext;
using openxfer::test::waitUntil;

namespace {

using openxfer::Direction;
using openxfer::TaskStatus;

openxfer::EngineConfig fastConfig() {
    openxfer::EngineConfig cfg;
    cfg.retry.retryDelayMs = 10;
    cfg.retry.backoffMultiplier = 2.0;
    cfg.ioThreads = 8;
    return cfg;
}

// Members are destroyed in reverse order: the queue first, then the chunk
// manager and the pool, then the dispatcher they all post through.
struct Harness {
    openxfer::MockSftpClient prototype;
    openxfer::IoDispatcher io;
    openxfer::SessionPool pool;
    openxfer::ChunkedTransferManager chunks;
    openxfer::test::FakeHostRegistry hosts;
    openxfer::test::FakeCredentialStore credentials;
    openxfer::InMemoryTransferHistory history;
    QTemporaryDir dir;
    openxfer::TransferQueue queue;

    explicit Harness(const openxfer::EngineConfig &cfg = fastConfig())
        : io(cfg.ioThreads), pool(prototype, io, cfg.pool),
          chunks(pool, io, cfg.parallel),
          queue(pool, chunks, io, hosts, credentials, cfg) {
        hosts.add(openxfer::test::labHost());
        credentials.set(QStringLiteral("lab"),
                        openxfer::test::passwordCredentials());
        pool.initialize();
        queue.setHistorySink(&history);
        queue.initialize();
    }

    openxfer::MockRemoteFs &fs() { return *prototype.remoteFs(); }

    QString localFile(const QString &name, int size) {
        const QString path = dir.filePath(name);
        openxfer::test::writeLocalFile(path, openxfer::test::patternData(size));
        return path;
    }

    TaskStatus status(quint64 id) const {
        const auto t = queue.task(id);
        return t ? t->status() : TaskStatus::Cancelled;
    }

    bool waitFor(quint64 id, TaskStatus s, int timeoutMs = 5000) {
        return waitUntil([this, id, s] { return status(id) == s; }, timeoutMs);
    }

    bool waitIdle(int timeoutMs = 5000) {
        return waitUntil([this] { return queue.runningCount() == 0; },
                         timeoutMs);
    }
};

openxfer::TaskRequest upload(const QString &local, const QString &remote) {
    openxfer::TaskRequest r;
    r.direction = Direction::Upload;
    r.hostId = QStringLiteral("lab");
    r.localPath = local;
    r.remotePath = remote;
    return r;
}

openxfer::TaskRequest download(const QString &remote, const QString &local) {
    openxfer::TaskRequest r;
    r.direction = Direction::Download;
    r.hostId = QStringLiteral("lab");
    r.localPath = local;
    r.remotePath = remote;
    return r;
}

void test_single_upload_runs_immediately(TestContext &t) {
    Harness h;
    const QString local = h.localFile(QStringLiteral("small.txt"), 10 * 1024);
    const quint64 id =
        h.queue.addTask(upload(local, QStringLiteral("/home/alice/up/small.txt")));
    t.check(h.status(id) == TaskStatus::Running,
            "task should be running right after addTask");
    t.check(h.queue.task(id)->priority() == openxfer::Priority::High,
            "10 KB task should be high priority");
    t.check(h.waitFor(id, TaskStatus::Completed), "upload should complete");
    const auto task = h.queue.task(id);
    t.check(task && task->progress() == 100.0 &&
                task->transferred() == 10 * 1024,
            "completed task should report 100%");
    t.check(task && task->completedAtMs() >= task->startedAtMs() &&
                task->startedAtMs() > 0,
            "timestamps should be set");
    t.check(openxfer::test::remoteData(h.fs(), "/home/alice/up/small.txt") ==
                openxfer::test::patternData(10 * 1024).toStdString(),
            "remote bytes should match");
    t.check(h.history.size() == 1 &&
                h.history.records()[0].status == TaskStatus::Completed,
            "history should hold the completed task");
}

void test_priority_then_fifo(TestContext &t) {
    auto cfg = fastConfig();
    cfg.maxConcurrent = 1;
    Harness h(cfg);
    h.fs().setBlockSize(16 * 1024);

    std::vector<quint64> startOrder;
    int maxRunning = 0;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskUpdated,
                     [&h, &startOrder, &maxRunning](quint64 id) {
                         int running = 0;
                         for (const auto &task : h.queue.tasks())
                             running += task.status() == TaskStatus::Running;
                         maxRunning = qMax(maxRunning, running);
                         if (h.status(id) == TaskStatus::Running &&
                             std::find(startOrder.begin(), startOrder.end(),
                                       id) == startOrder.end())
                             startOrder.push_back(id);
                     });

    openxfer::TaskRequest big = upload(
        h.localFile(QStringLiteral("big.bin"), 2 * 1024 * 1024),
        QStringLiteral("/home/alice/big.bin"));
    big.size = 2 * 1024 * 1024;
    openxfer::TaskRequest small1 =
        upload(h.localFile(QStringLiteral("s1.txt"), 1000),
               QStringLiteral("/home/alice/s1.txt"));
    small1.size = 1000;
    openxfer::TaskRequest small2 =
        upload(h.localFile(QStringLiteral("s2.txt"), 2000),
               QStringLiteral("/home/alice/s2.txt"));
    small2.size = 2000;

    const auto ids = h.queue.addTasks({big, small1, small2});
    t.check(ids.size() == 3, "three tasks should be queued");
    t.check(h.queue.runningCount() == 1, "only one task should hold a slot");
    t.check(waitUntil([&h, &ids] {
                for (quint64 id : ids)
                    if (h.status(id) != TaskStatus::Completed)
                        return false;
                return true;
            }, 10000),
            "all tasks should complete");
    t.check(maxRunning == 1, "never more than one running task");
    t.check(startOrder.size() == 3 && startOrder[0] == ids[1] &&
                startOrder[1] == ids[2] && startOrder[2] == ids[0],
            "high priority tasks should run first, in submission order");
}

void test_cancel_running_download(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(5);
    h.fs().writeFile("/home/alice/big.dat",
                     openxfer::test::patternData(400 * 1024).toStdString());
    const QString local = h.dir.filePath(QStringLiteral("dl/big.dat"));

    const quint64 id =
        h.queue.addTask(download(QStringLiteral("/home/alice/big.dat"), local));
    t.check(waitUntil([&local] { return QFileInfo(local).size() > 0; }),
            "download should start writing");
    t.check(h.queue.cancelTask(id), "running task should be cancellable");
    const auto task = h.queue.task(id);
    t.check(task && task->status() == TaskStatus::Cancelled &&
                task->completedAtMs() > 0,
            "cancelled task should have completedAt");
    t.check(h.waitIdle(), "cancelled run should unwind");
    t.check(waitUntil([&local] { return !QFile::exists(local); }),
            "partial local file should be removed");
    t.check(!h.queue.cancelTask(id), "cancelling twice should be refused");
    t.check(h.history.counters().cancelled == 1,
            "history should count the cancellation");
}

void test_pause_and_resume(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(5);
    const QByteArray data = openxfer::test::patternData(300 * 1024);
    h.fs().writeFile("/home/alice/movie.bin", data.toStdString());
    const QString local = h.dir.filePath(QStringLiteral("movie.bin"));

    const quint64 id = h.queue.addTask(
        download(QStringLiteral("/home/alice/movie.bin"), local));
    t.check(waitUntil([&h, id] { return h.queue.task(id)->transferred() > 0; }),
            "download should report progress");
    t.check(h.queue.pauseTask(id), "running task should pause");
    t.check(h.waitIdle(), "paused run should unwind");
    const quint64 kept = h.queue.task(id)->transferred();
    t.check(h.status(id) == TaskStatus::Paused && kept > 0 &&
                kept < static_cast<quint64>(data.size()),
            "paused task should keep partial progress");
    t.check(!h.queue.pauseTask(id), "paused task cannot pause again");

    h.fs().setBlockDelayMs(0);
    t.check(h.queue.resumeTask(id), "paused task should resume");
    t.check(h.queue.task(id)->transferred() >= kept,
            "resume should keep transferred bytes");
    t.check(h.waitFor(id, TaskStatus::Completed), "resumed task should finish");
    t.check(openxfer::test::readLocalFile(local) == data,
            "resumed download should be byte-exact");
}

void test_retry_with_backoff(TestContext &t) {
    Harness h;
    h.fs().failNextTransfers(2, "flaky link");
    std::set<TaskStatus> seen;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskUpdated,
                     [&h, &seen](quint64 id) { seen.insert(h.status(id)); });
    const quint64 id = h.queue.addTask(
        upload(h.localFile(QStringLiteral("r.txt"), 5000),
               QStringLiteral("/home/alice/r.txt")));
    t.check(h.waitFor(id, TaskStatus::Completed),
            "task should complete after retries");
    t.check(h.queue.task(id)->retryCount() == 2, "two retries should be used");
    t.check(seen.count(TaskStatus::Failed) == 1,
            "task should pass through failed while waiting to retry");
    t.check(h.history.size() == 1, "only the final outcome is recorded");
}

void test_retry_exhausted_then_manual_retry(TestContext &t) {
    Harness h;
    h.fs().failNextTransfers(100, "link down");
    openxfer::TaskRequest r = upload(h.localFile(QStringLiteral("x.txt"), 5000),
                                     QStringLiteral("/home/alice/x.txt"));
    r.maxRetries = 2;
    int finished = 0;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskFinished,
                     [&finished](quint64) { ++finished; });
    const quint64 id = h.queue.addTask(r);
    t.check(waitUntil([&finished] { return finished == 1; }),
            "task should fail permanently");
    auto task = h.queue.task(id);
    t.check(task && task->status() == TaskStatus::Failed &&
                task->failureKind() == openxfer::ErrorKind::RetryExhausted &&
                task->retryCount() == 2,
            "exhausted task should carry RetryExhausted");
    t.checkContains(task->lastError(), QStringLiteral("link down"),
                    "last error should be kept");
    t.check(h.history.counters().failed == 1, "history counts one failure");

    h.fs().failNextTransfers(0, "");
    t.check(h.queue.retryTask(id), "failed task should be retryable by hand");
    t.check(h.waitFor(id, TaskStatus::Completed),
            "manual retry should complete");
    t.check(h.queue.task(id)->retryCount() == 0,
            "manual retry should reset the retry budget");
    t.check(!h.queue.retryTask(id), "completed task cannot be retried");
}

void test_retry_disabled(TestContext &t) {
    Harness h;
    openxfer::RetryPolicy policy = h.queue.retryPolicy();
    policy.enabled = false;
    h.queue.setRetryPolicy(policy);
    t.check(!h.queue.retryPolicy().enabled, "policy should be replaced");
    h.fs().failNextTransfers(1, "one shot");
    const quint64 id = h.queue.addTask(
        upload(h.localFile(QStringLiteral("once.txt"), 100),
               QStringLiteral("/home/alice/once.txt")));
    t.check(h.waitFor(id, TaskStatus::Failed), "task should fail at once");
    openxfer::test::spinFor(50);
    const auto task = h.queue.task(id);
    t.check(task && task->status() == TaskStatus::Failed &&
                task->retryCount() == 0 &&
                task->failureKind() == openxfer::ErrorKind::Io,
            "without retries the raw failure kind is kept");
}

void test_configuration_errors(TestContext &t) {
    Harness h;
    h.hosts.add(openxfer::test::labHost(QStringLiteral("nocreds")));

    openxfer::TaskRequest unknown = upload(
        h.localFile(QStringLiteral("a.txt"), 10), QStringLiteral("/home/a.txt"));
    unknown.hostId = QStringLiteral("nope");
    const quint64 a = h.queue.addTask(unknown);

    openxfer::TaskRequest noCreds = unknown;
    noCreds.hostId = QStringLiteral("nocreds");
    const quint64 b = h.queue.addTask(noCreds);

    t.check(h.waitFor(a, TaskStatus::Failed) && h.waitFor(b, TaskStatus::Failed),
            "configuration problems should fail the tasks");
    t.check(h.queue.task(a)->failureKind() == openxfer::ErrorKind::Configuration &&
                h.queue.task(a)->retryCount() == 0,
            "unknown host should fail without retries");
    t.checkContains(h.queue.task(a)->lastError(), QStringLiteral("Host not found"),
                    "unknown host message");
    t.checkContains(h.queue.task(b)->lastError(),
                    QStringLiteral("No credentials for host"),
                    "missing credentials message");
}

void test_missing_sources(TestContext &t) {
    Harness h;
    openxfer::TaskRequest up = upload(h.dir.filePath(QStringLiteral("ghost.txt")),
                                      QStringLiteral("/home/alice/ghost.txt"));
    up.maxRetries = 0;
    const quint64 a = h.queue.addTask(up);
    openxfer::TaskRequest down =
        download(QStringLiteral("/home/alice/ghost.txt"),
                 h.dir.filePath(QStringLiteral("ghost-dl.txt")));
    down.maxRetries = 0;
    const quint64 b = h.queue.addTask(down);

    t.check(h.waitFor(a, TaskStatus::Failed) && h.waitFor(b, TaskStatus::Failed),
            "missing sources should fail");
    t.check(h.queue.task(a)->failureKind() == openxfer::ErrorKind::Io,
            "missing local file is an Io failure");
    t.checkContains(h.queue.task(a)->lastError(),
                    QStringLiteral("Local file not found"), "upload message");
    t.checkContains(h.queue.task(b)->lastError(),
                    QStringLiteral("Remote file not found"), "download message");
}

void test_queue_pause_and_stats(TestContext &t) {
    Harness h;
    h.queue.pauseQueue();
    t.check(h.queue.isQueuePaused(), "queue should report paused");
    const quint64 a = h.queue.addTask(
        upload(h.localFile(QStringLiteral("p1.txt"), 100),
               QStringLiteral("/home/alice/p1.txt")));
    const quint64 b = h.queue.addTask(
        upload(h.localFile(QStringLiteral("p2.txt"), 200),
               QStringLiteral("/home/alice/p2.txt")));
    openxfer::test::spinFor(30);
    t.check(h.status(a) == TaskStatus::Pending &&
                h.status(b) == TaskStatus::Pending,
            "paused queue should not start tasks");

    t.check(h.queue.cancelTask(b), "pending task should be cancellable");
    openxfer::TransferStats st = h.queue.getStats();
    t.check(st.total == 2 && st.pending == 1 && st.cancelled == 1,
            "stats should count pending and cancelled tasks");

    h.queue.resumeQueue();
    t.check(h.waitFor(a, TaskStatus::Completed), "task should run after resume");
    st = h.queue.getStats();
    t.check(st.completed == 1 && st.cancelled == 1 && st.transferredBytes >= 100,
            "stats should count the completed task");

    t.check(h.queue.clearCompleted() == 2, "clearCompleted removes both");
    t.check(h.queue.tasks().isEmpty(), "queue should be empty");
    t.check(!h.queue.task(a).has_value(), "cleared task should be gone");
}

void test_cancel_while_waiting_for_retry(TestContext &t) {
    auto cfg = fastConfig();
    cfg.retry.retryDelayMs = 60000;
    Harness h(cfg);
    h.fs().failNextTransfers(1, "hiccup");
    const quint64 id = h.queue.addTask(
        upload(h.localFile(QStringLiteral("w.txt"), 100),
               QStringLiteral("/home/alice/w.txt")));
    t.check(h.waitFor(id, TaskStatus::Failed), "task should fail once");
    t.check(h.queue.clearCompleted() == 0,
            "task waiting for a retry should not be cleared");
    t.check(!h.queue.cancelTask(id), "cancel should drop the pending retry");
    t.check(h.status(id) == TaskStatus::Failed, "failure should stand");
    t.check(h.history.counters().failed == 1, "history records the failure");
    t.check(h.queue.clearCompleted() == 1, "task can be cleared afterwards");
}

void test_remove_and_clear_all(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(5);
    h.fs().writeFile("/home/alice/slow.bin",
                     openxfer::test::patternData(200 * 1024).toStdString());
    const quint64 a = h.queue.addTask(
        download(QStringLiteral("/home/alice/slow.bin"),
                 h.dir.filePath(QStringLiteral("slow1.bin"))));
    h.queue.addTask(download(QStringLiteral("/home/alice/slow.bin"),
                             h.dir.filePath(QStringLiteral("slow2.bin"))));
    t.check(h.queue.removeTask(a), "running task should be removable");
    t.check(!h.queue.task(a).has_value(), "removed task should be gone");
    t.check(!h.queue.removeTask(a), "removing twice should fail");
    h.queue.clearAll();
    t.check(h.queue.tasks().isEmpty(), "clearAll should empty the queue");
    t.check(h.waitIdle(), "runs should unwind after clearAll");
    t.check(h.history.counters().cancelled == 2,
            "removed running tasks count as cancelled");
}

void test_max_concurrent(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(2);
    h.queue.setMaxConcurrent(2);
    QVector<openxfer::TaskRequest> reqs;
    for (int i = 0; i < 5; ++i)
        reqs.push_back(upload(
            h.localFile(QStringLiteral("m%1.bin").arg(i), 64 * 1024),
            QStringLiteral("/home/alice/m%1.bin").arg(i)));
    int maxRunning = 0;
    QObject::connect(&h.queue, &openxfer::TransferQueue::queueChanged,
                     [&h, &maxRunning] {
                         maxRunning = qMax(maxRunning, h.queue.getStats().running);
                     });
    h.queue.addTasks(reqs);
    t.check(waitUntil([&h] { return h.queue.getStats().completed == 5; }, 10000),
            "all five uploads should complete");
    t.check(maxRunning <= 2, "at most two tasks should run at once");
    t.check(h.queue.getStats().running == 0, "nothing should be left running");
}

void test_sync_plan(TestContext &t) {
    Harness h;
    QTemporaryDir src;
    openxfer::test::writeLocalFile(src.filePath(QStringLiteral("a.txt")),
                                   QByteArray("new file"));
    openxfer::test::writeLocalFile(src.filePath(QStringLiteral("b.txt")),
                                   QByteArray("changed contents"));
    openxfer::test::writeLocalFile(src.filePath(QStringLiteral("debug.log")),
                                   QByteArray("ignored"));
    h.fs().makeDir("/home/alice/site");
    h.fs().writeFile("/home/alice/site/b.txt", "old");
    h.fs().writeFile("/home/alice/site/c.txt", "stale");

    openxfer::DiffOptions opt;
    opt.deleteRemote = true;
    opt.excludePatterns = openxfer::defaultExcludePatterns();
    bool done = false;
    openxfer::SyncPlan plan;
    h.queue.planSync(QStringLiteral("lab"), src.path(),
                     QStringLiteral("/home/alice/site"), opt,
                     [&done, &plan](const openxfer::SyncPlan &p) {
                         plan = p;
                         done = true;
                     });
    t.check(waitUntil([&done] { return done; }), "sync plan should arrive");
    t.check(plan.ok(), "sync plan should succeed");
    t.check(plan.diff.toUpload.size() == 2 && plan.diff.toUpload[0].path == "a.txt" &&
                plan.diff.toUpload[1].path == "b.txt",
            "a.txt and b.txt should be uploaded");
    t.check(plan.diff.toDelete.size() == 1 && plan.diff.toDelete[0].path == "c.txt",
            "c.txt should be deleted");
    t.check(plan.diff.unchanged.empty(), "nothing is unchanged");

    const auto ids = h.queue.applySyncPlan(plan);
    t.check(ids.size() == 2, "two upload tasks should be queued");
    t.check(waitUntil([&h, &ids] {
                for (quint64 id : ids)
                    if (h.status(id) != TaskStatus::Completed)
                        return false;
                return true;
            }),
            "sync uploads should complete");
    t.check(waitUntil([&h] { return !h.fs().contains("/home/alice/site/c.txt"); }),
            "deleted entry should be removed remotely");
    t.check(openxfer::test::remoteData(h.fs(), "/home/alice/site/b.txt") ==
                "changed contents",
            "changed file should be replaced");
    t.check(!h.fs().contains("/home/alice/site/debug.log"),
            "excluded file should not be uploaded");

    bool failedDone = false;
    openxfer::SyncPlan bad;
    h.queue.planSync(QStringLiteral("nope"), src.path(),
                     QStringLiteral("/home/alice/site"), opt,
                     [&failedDone, &bad](const openxfer::SyncPlan &p) {
                         bad = p;
                         failedDone = true;
                     });
    t.check(waitUntil([&failedDone] { return failedDone; }) && !bad.ok() &&
                bad.error.kind == openxfer::ErrorKind::Configuration,
            "sync plan for an unknown host should fail");
    t.check(h.queue.applySyncPlan(bad).isEmpty(),
            "a failed plan should queue nothing");
}

void test_directory_tasks(TestContext &t) {
    Harness h;
    QTemporaryDir src;
    openxfer::test::writeLocalFile(src.filePath(QStringLiteral("index.html")),
                                   QByteArray("<html/>"));
    openxfer::test::writeLocalFile(src.filePath(QStringLiteral("css/site.css")),
                                   QByteArray("body{}"));
    openxfer::TaskRequest up =
        upload(src.path(), QStringLiteral("/home/alice/www"));
    up.isDirectory = true;
    const quint64 a = h.queue.addTask(up);
    t.check(h.waitFor(a, TaskStatus::Completed), "directory upload completes");
    t.check(openxfer::test::remoteData(h.fs(), "/home/alice/www/css/site.css") ==
                "body{}",
            "nested file should be uploaded");

    h.fs().makeDir("/var/log/app");
    h.fs().writeFile("/var/log/app/today.log", "line\n", 1600000000);
    const QString mirror = h.dir.filePath(QStringLiteral("logs"));
    // Not flagged as a directory: the size lookup finds out.
    const quint64 b =
        h.queue.addTask(download(QStringLiteral("/var/log"), mirror));
    t.check(h.waitFor(b, TaskStatus::Completed), "directory download completes");
    t.check(h.queue.task(b)->isDirectory(), "task should switch to directory mode");
    const QString fetched = QDir(mirror).filePath(QStringLiteral("app/today.log"));
    t.check(openxfer::test::readLocalFile(fetched) == QByteArray("line\n"),
            "nested remote file should be mirrored");
    t.check(QFileInfo(fetched).lastModified().toSecsSinceEpoch() == 1600000000,
            "remote mtime should be preserved");
}

void test_upload_preserves_attributes(TestContext &t) {
    Harness h;
    const QString local = h.localFile(QStringLiteral("key.pem"), 300);
    QFile::setPermissions(local, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    const quint64 id =
        h.queue.addTask(upload(local, QStringLiteral("/home/alice/key.pem")));
    t.check(h.waitFor(id, TaskStatus::Completed), "upload completes");
    openxfer::MockSftpClient viewer(h.prototype.remoteFs());
    std::string err;
    openxfer::FileInfo info;
    t.check(viewer.connect(openxfer::test::mockOptions(), err) &&
                viewer.stat("/home/alice/key.pem", info, err),
            "uploaded file should exist");
    t.check((info.mode & 0777) == 0600, "permissions should be preserved");
    t.check(static_cast<qint64>(info.mtime) ==
                QFileInfo(local).lastModified().toSecsSinceEpoch(),
            "mtime should be preserved");
}

void test_chunked_task(TestContext &t) {
    auto cfg = fastConfig();
    cfg.parallel.thresholdBytes = 256 * 1024;
    cfg.parallel.chunkSizeBytes = 64 * 1024;
    cfg.parallel.maxConcurrent = 3;
    Harness h(cfg);
    h.fs().setBlockSize(16 * 1024);
    const int size = 700 * 1024;
    const QString local = h.localFile(QStringLiteral("large.bin"), size);

    std::set<int> chunkIndexes;
    QObject::connect(&h.queue, &openxfer::TransferQueue::chunkProgress,
                     [&chunkIndexes](quint64, int index, quint64, quint64) {
                         chunkIndexes.insert(index);
                     });
    const quint64 id =
        h.queue.addTask(upload(local, QStringLiteral("/home/alice/large.bin")));
    t.check(h.waitFor(id, TaskStatus::Completed, 10000),
            "chunked upload should complete");
    const auto task = h.queue.task(id);
    t.check(task && task->chunks().size() == 11,
            "700 KiB in 64 KiB chunks gives 11 chunks");
    t.check(chunkIndexes.size() == 11, "every chunk should report progress");
    t.check(task && task->transferred() == static_cast<quint64>(size),
            "chunk bytes should add up to the file size");
    t.check(openxfer::test::remoteData(h.fs(), "/home/alice/large.bin") ==
                openxfer::test::patternData(size).toStdString(),
            "chunked upload should be byte-exact");

    // A chunk failure fails the task; the task-level retry finishes it.
    h.fs().failNextTransfers(1, "chunk hiccup");
    const quint64 again =
        h.queue.addTask(upload(local, QStringLiteral("/home/alice/large2.bin")));
    t.check(h.waitFor(again, TaskStatus::Completed, 10000),
            "retry after a chunk failure should complete");
    t.check(h.queue.task(again)->retryCount() == 1,
            "the chunk failure should cost one retry");
}

void test_shutdown_pauses_running(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(5);
    h.fs().writeFile("/home/alice/s.bin",
                     openxfer::test::patternData(200 * 1024).toStdString());
    const quint64 id = h.queue.addTask(
        download(QStringLiteral("/home/alice/s.bin"),
                 h.dir.filePath(QStringLiteral("s.bin"))));
    t.check(h.status(id) == TaskStatus::Running, "task should be running");
    h.queue.shutdown();
    t.check(h.status(id) == TaskStatus::Paused, "shutdown should pause it");
    t.check(h.waitIdle(), "run should unwind after shutdown");
}

void test_directory_upload_progress_across_pause(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(10);
    QTemporaryDir src;
    const int fileSize = 40 * 1024;
    for (int i = 0; i < 5; ++i)
        openxfer::test::writeLocalFile(src.filePath(QStringLiteral("f%1.bin").arg(i)),
                                       openxfer::test::patternData(fileSize));
    openxfer::TaskRequest up = upload(src.path(), QStringLiteral("/home/alice/tree"));
    up.isDirectory = true;

    bool consistent = true;
    bool resumed = false;
    double firstAfterResume = -1.0;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskProgress,
                     [&](quint64 id, quint64 transferred, quint64 total, double) {
                         const auto task = h.queue.task(id);
                         if (!task || task->status() != TaskStatus::Running)
                             return;
                         if (transferred > total ||
                             (task->progress() >= 100.0 &&
                              task->transferred() < task->size()))
                             consistent = false;
                         if (resumed && firstAfterResume < 0.0)
                             firstAfterResume = task->progress();
                     });

    const quint64 id = h.queue.addTask(up);
    t.check(waitUntil([&h, id] {
                return h.queue.task(id)->transferred() > quint64(fileSize) + 4096;
            }, 10000),
            "directory upload should get past its first file");
    t.check(h.queue.pauseTask(id), "running directory upload should pause");
    t.check(h.waitIdle(), "paused directory run should unwind");
    const auto paused = h.queue.task(id);
    t.check(paused && paused->transferred() <= paused->size() &&
                paused->progress() < 100.0,
            "paused directory task should be partway");

    h.fs().setBlockDelayMs(1);
    resumed = true;
    t.check(h.queue.resumeTask(id), "paused directory upload should resume");
    t.check(h.waitFor(id, TaskStatus::Completed, 10000),
            "resumed directory upload should complete");
    t.check(consistent, "a running task should never exceed its size or show 100% early");
    t.check(firstAfterResume >= 0.0 && firstAfterResume < 100.0,
            "first progress after resume should be below 100%");
    const auto done = h.queue.task(id);
    t.check(done && done->transferred() == done->size() && done->progress() == 100.0,
            "completed directory task should report all bytes");
    for (int i = 0; i < 5; ++i)
        t.check(openxfer::test::remoteData(
                    h.fs(), QStringLiteral("/home/alice/tree/f%1.bin").arg(i).toStdString()) ==
                    openxfer::test::patternData(fileSize).toStdString(),
                "every file should arrive byte-exact");
}

void test_cancel_unblocks_stalled_download(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(60000);
    h.fs().writeFile("/home/alice/stuck.bin",
                     openxfer::test::patternData(64 * 1024).toStdString());
    const QString local = h.dir.filePath(QStringLiteral("stuck.bin"));
    const quint64 id =
        h.queue.addTask(download(QStringLiteral("/home/alice/stuck.bin"), local));
    t.check(waitUntil([&h, id] { return h.queue.task(id)->transferred() > 0; }),
            "download should write its first block and stall");

    QElapsedTimer clock;
    clock.start();
    t.check(h.queue.cancelTask(id), "stalled task should be cancellable");
    t.check(h.waitIdle(3000), "cancel should unblock the stalled transfer");
    t.check(clock.elapsed() < 3000, "run should unwind within seconds");
    t.check(waitUntil([&local] { return !QFile::exists(local); }),
            "partial local file should be removed");
    t.check(h.pool.status().leased == 0, "interrupted session should not stay leased");

    h.fs().setBlockDelayMs(0);
    const QString again = h.dir.filePath(QStringLiteral("again.bin"));
    const quint64 next =
        h.queue.addTask(download(QStringLiteral("/home/alice/stuck.bin"), again));
    t.check(h.waitFor(next, TaskStatus::Completed), "a fresh session should serve the next task");
    t.check(openxfer::test::readLocalFile(again) == openxfer::test::patternData(64 * 1024),
            "next download should be byte-exact");
}

void test_slots_may_clear_finished_tasks(TestContext &t) {
    Harness h;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskUpdated,
                     [&h](quint64 id) {
                         const auto task = h.queue.task(id);
                         if (task && openxfer::isTerminal(task->status()))
                             h.queue.clearCompleted();
                     });

    h.queue.pauseQueue();
    const quint64 c = h.queue.addTask(
        upload(h.localFile(QStringLiteral("c.txt"), 100),
               QStringLiteral("/home/alice/c.txt")));
    t.check(h.queue.cancelTask(c), "pending task should cancel");
    t.check(!h.queue.task(c).has_value(), "slot should have cleared the cancelled task");
    h.queue.resumeQueue();

    const quint64 a = h.queue.addTask(
        upload(h.localFile(QStringLiteral("a.txt"), 2000),
               QStringLiteral("/home/alice/a.txt")));
    openxfer::TaskRequest missing = download(QStringLiteral("/home/alice/nope.bin"),
                                             h.dir.filePath(QStringLiteral("nope.bin")));
    missing.maxRetries = 0;
    const quint64 b = h.queue.addTask(missing);
    t.check(waitUntil([&h] {
                return h.queue.tasks().isEmpty() && h.queue.runningCount() == 0;
            }),
            "finished tasks should be cleared from inside the slot");

    std::map<quint64, TaskStatus> recorded;
    for (const auto &r : h.history.records())
        recorded[r.taskId] = r.status;
    t.check(h.history.size() == 3, "each task should be recorded once");
    t.check(recorded.count(a) && recorded[a] == TaskStatus::Completed,
            "completed task should be recorded under its own id");
    t.check(recorded.count(b) && recorded[b] == TaskStatus::Failed,
            "failed task should be recorded under its own id");
    t.check(recorded.count(c) && recorded[c] == TaskStatus::Cancelled,
            "cancelled task should be recorded under its own id");
}

void test_task_removed_as_it_starts(TestContext &t) {
    auto cfg = fastConfig();
    cfg.maxConcurrent = 1;
    Harness h(cfg);
    quint64 victim = 0;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskUpdated,
                     [&h, &victim](quint64 id) {
                         if (id == victim && h.status(id) == TaskStatus::Running)
                             h.queue.removeTask(id);
                     });

    h.queue.pauseQueue();
    victim = h.queue.addTask(upload(h.localFile(QStringLiteral("v.txt"), 500),
                                    QStringLiteral("/home/alice/v.txt")));
    const quint64 next = h.queue.addTask(
        upload(h.localFile(QStringLiteral("n.txt"), 500),
               QStringLiteral("/home/alice/n.txt")));
    h.queue.resumeQueue();

    t.check(!h.queue.task(victim).has_value(), "started task should be removed");
    t.check(h.waitFor(next, TaskStatus::Completed),
            "the freed slot should go to the next task");
    t.check(h.waitIdle(), "no run should be left behind");
    t.check(h.history.counters().cancelled == 1 &&
                h.history.counters().completed == 1,
            "history should hold one cancellation and one completion");
}

void test_cancel_directory_download_cleanup(TestContext &t) {
    Harness h;
    h.fs().setBlockSize(4 * 1024);
    h.fs().setBlockDelayMs(5);
    h.fs().makeDir("/home/alice/data");
    h.fs().writeFile("/home/alice/data/a.bin",
                     openxfer::test::patternData(200 * 1024).toStdString());
    h.fs().writeFile("/home/alice/data/b.bin",
                     openxfer::test::patternData(200 * 1024).toStdString());

    const QString mirror = h.dir.filePath(QStringLiteral("mirror"));
    openxfer::TaskRequest fresh = download(QStringLiteral("/home/alice/data"), mirror);
    fresh.isDirectory = true;
    const quint64 a = h.queue.addTask(fresh);
    t.check(waitUntil([&h, a] { return h.queue.task(a)->transferred() > 0; }),
            "directory download should start");
    t.check(h.queue.cancelTask(a), "directory download should cancel");
    t.check(h.waitIdle(), "cancelled directory run should unwind");
    t.check(waitUntil([&mirror] { return !QDir(mirror).exists(); }),
            "a tree created by the task should be removed");

    const QString existing = h.dir.filePath(QStringLiteral("existing"));
    openxfer::test::writeLocalFile(QDir(existing).filePath(QStringLiteral("keep.txt")),
                                   QByteArray("mine"));
    openxfer::TaskRequest into = download(QStringLiteral("/home/alice/data"), existing);
    into.isDirectory = true;
    const quint64 b = h.queue.addTask(into);
    t.check(waitUntil([&h, b] { return h.queue.task(b)->transferred() > 0; }),
            "second directory download should start");
    t.check(h.queue.cancelTask(b), "second directory download should cancel");
    t.check(h.waitIdle(), "second run should unwind");
    openxfer::test::spinFor(50);
    t.check(openxfer::test::readLocalFile(QDir(existing).filePath(QStringLiteral("keep.txt"))) ==
                QByteArray("mine"),
            "a directory that existed before the task should be kept");
}

void test_retry_delay_grows_by_multiplier(TestContext &t) {
    auto cfg = fastConfig();
    cfg.retry.retryDelayMs = 100;
    cfg.retry.backoffMultiplier = 2.0;
    Harness h(cfg);
    h.fs().failNextTransfers(2, "flaky link");

    QElapsedTimer clock;
    std::vector<qint64> failedAt;
    std::vector<qint64> requeuedAt;
    TaskStatus last = TaskStatus::Pending;
    QObject::connect(&h.queue, &openxfer::TransferQueue::taskUpdated,
                     [&](quint64 id) {
                         const TaskStatus now = h.status(id);
                         if (now == TaskStatus::Failed && last != TaskStatus::Failed)
                             failedAt.push_back(clock.elapsed());
                         if (now == TaskStatus::Pending && last == TaskStatus::Failed)
                             requeuedAt.push_back(clock.elapsed());
                         last = now;
                     });
    clock.start();
    const quint64 id = h.queue.addTask(
        upload(h.localFile(QStringLiteral("b.txt"), 3000),
               QStringLiteral("/home/alice/b.txt")));
    t.check(h.waitFor(id, TaskStatus::Completed), "task should complete after two retries");
    t.check(failedAt.size() == 2 && requeuedAt.size() == 2,
            "task should wait twice before retrying");
    if (failedAt.size() == 2 && requeuedAt.size() == 2) {
        const qint64 first = requeuedAt[0] - failedAt[0];
        const qint64 second = requeuedAt[1] - failedAt[1];
        t.check(first >= 90, "first wait should honour the base delay");
        t.check(second >= 180, "second wait should be doubled");
    }
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_single_upload_runs_immediately(t);
    test_priority_then_fifo(t);
    test_cancel_running_download(t);
    test_pause_and_resume(t);
    test_retry_with_backoff(t);
    test_retry_exhausted_then_manual_retry(t);
    test_retry_disabled(t);
    test_configuration_errors(t);
    test_missing_sources(t);
    test_queue_pause_and_stats(t);
    test_cancel_while_waiting_for_retry(t);
    test_remove_and_clear_all(t);
    test_max_concurrent(t);
    test_sync_plan(t);
    test_directory_tasks(t);
    test_upload_preserves_attributes(t);
    test_chunked_task(t);
    test_shutdown_pauses_running(t);
    test_directory_upload_progress_across_pause(t);
    test_cancel_unblocks_stalled_download(t);
    test_slots_may_clear_finished_tasks(t);
    test_task_removed_as_it_starts(t);
    test_cancel_directory_download_cleanup(t);
    test_retry_delay_grows_by_multiplier(t);
    return openxfer::test::finish(t, "openxfer_transfer_queue_tests");
}
