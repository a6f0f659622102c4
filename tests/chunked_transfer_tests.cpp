// Parallel chunked transfers over pooled mock sessions.
#include "ChunkedTransfer.hpp"
#include "TestSupport.hpp"

#include <QTemporaryDir>
#include <vector>

using openxfer::test::TestContext;
using openxfer::test::waitUntil;

namespace {

constexpr int kPayloadBytes = 600 * 1024 + 123;

openxfer::ParallelConfig smallChunks() {
    openxfer::ParallelConfig cfg;
    cfg.thresholdBytes = 256 * 1024;
    cfg.chunkSizeBytes = 64 * 1024;
    cfg.maxConcurrent = 3;
    return cfg;
}

struct Harness {
    openxfer::MockSftpClient prototype;
    openxfer::IoDispatcher io{8};
    openxfer::SessionPool pool;
    openxfer::ChunkedTransferManager manager;

    Harness()
        : pool(prototype, io), manager(pool, io, smallChunks()) {
        pool.initialize();
        fs().setBlockSize(16 * 1024);
    }

    openxfer::MockRemoteFs &fs() { return *prototype.remoteFs(); }
};

// Latest view of a job as reported through its callbacks.
struct Observed {
    std::vector<openxfer::Chunk> chunks;
    int plannedCalls = 0;
    int progressCalls = 0;
    bool finished = false;
    openxfer::TransferError error;

    openxfer::ChunkedCallbacks callbacks() {
        openxfer::ChunkedCallbacks cb;
        cb.onPlanned = [this](const std::vector<openxfer::Chunk> &plan) {
            chunks = plan;
            ++plannedCalls;
        };
        cb.onChunkProgress = [this](const openxfer::Chunk &c) {
            if (c.index >= 0 && static_cast<std::size_t>(c.index) < chunks.size())
                chunks[static_cast<std::size_t>(c.index)] = c;
            ++progressCalls;
        };
        cb.onFinished = [this](const openxfer::TransferError &e) {
            error = e;
            finished = true;
        };
        return cb;
    }

    int completedChunks() const {
        int n = 0;
        for (const auto &c : chunks)
            n += c.status == openxfer::ChunkStatus::Completed ? 1 : 0;
        return n;
    }
};

openxfer::ChunkedJob makeJob(quint64 taskId, openxfer::Direction direction,
                             const QString &local, const QString &remote) {
    openxfer::ChunkedJob job;
    job.taskId = taskId;
    job.direction = direction;
    job.identity = openxfer::HostIdentity::from(
        openxfer::test::labHost(), openxfer::test::passwordCredentials());
    job.options = openxfer::test::mockOptions();
    job.localPath = local;
    job.remotePath = remote;
    job.size = kPayloadBytes;
    return job;
}

void test_should_use_parallel(TestContext &t) {
    Harness h;
    const quint64 threshold = h.manager.config().thresholdBytes;
    t.check(!h.manager.shouldUseParallel(threshold, 0, false),
            "size equal to the threshold stays sequential");
    t.check(h.manager.shouldUseParallel(threshold + 1, 0, false),
            "size above the threshold goes parallel");
    t.check(!h.manager.shouldUseParallel(threshold + 1, 10, false),
            "an interrupted whole-file transfer stays sequential");
    t.check(h.manager.shouldUseParallel(threshold + 1, 10, true),
            "an interrupted chunked transfer stays parallel");
    openxfer::ParallelConfig off = smallChunks();
    off.enabled = false;
    h.manager.setConfig(off);
    t.check(!h.manager.shouldUseParallel(threshold * 4, 0, false),
            "disabled parallel transfers never go parallel");

    h.manager.setConfig(smallChunks());
    const auto plan = h.manager.planChunks(kPayloadBytes);
    t.check(plan.size() == 10, "600 KiB + 123 in 64 KiB chunks gives 10");
    openxfer::ParallelConfig tiny = smallChunks();
    tiny.chunkSizeBytes = 1024;
    h.manager.setConfig(tiny);
    t.check(h.manager.planChunks(kPayloadBytes).size() == 10,
            "chunk size should not drop below 64 KiB");
}

void test_parallel_upload(TestContext &t) {
    Harness h;
    QTemporaryDir dir;
    const QString local = dir.filePath(QStringLiteral("upload.bin"));
    const QByteArray data = openxfer::test::patternData(kPayloadBytes);
    t.check(openxfer::test::writeLocalFile(local, data), "seed local file");

    Observed obs;
    h.manager.start(makeJob(1, openxfer::Direction::Upload, local,
                            QStringLiteral("/home/alice/big/upload.bin")),
                    obs.callbacks());
    t.check(obs.plannedCalls == 1 && obs.chunks.size() == 10,
            "plan should be reported synchronously");
    t.check(h.manager.isActive(1), "job should be active");
    t.check(waitUntil([&obs] { return obs.finished; }, 10000),
            "upload should finish");
    t.check(obs.error.ok(), "upload should succeed: " +
                                obs.error.message.toStdString());
    t.check(openxfer::test::remoteData(h.fs(), "/home/alice/big/upload.bin") ==
                data.toStdString(),
            "remote bytes should match the local file");
    t.check(obs.completedChunks() == 10, "every chunk should be completed");
    t.check(h.fs().peakLiveConnections() <= 3,
            "chunks in flight should respect maxConcurrent");
    t.check(!h.manager.isActive(1) && h.manager.activeJobs() == 0,
            "finished job should be forgotten");
}

void test_parallel_download(TestContext &t) {
    Harness h;
    QTemporaryDir dir;
    const QByteArray data = openxfer::test::patternData(kPayloadBytes);
    h.fs().writeFile("/home/alice/big.bin", data.toStdString());
    const QString local = dir.filePath(QStringLiteral("nested/big.bin"));

    Observed obs;
    h.manager.start(makeJob(2, openxfer::Direction::Download, local,
                            QStringLiteral("/home/alice/big.bin")),
                    obs.callbacks());
    t.check(waitUntil([&obs] { return obs.finished; }, 10000),
            "download should finish");
    t.check(obs.error.ok(), "download should succeed: " +
                                obs.error.message.toStdString());
    t.check(openxfer::test::readLocalFile(local) == data,
            "local bytes should match the remote file");
    t.check(obs.progressCalls > 10, "chunk progress should be reported");
}

void test_chunk_failure_fails_task(TestContext &t) {
    Harness h;
    QTemporaryDir dir;
    h.fs().writeFile("/home/alice/big.bin",
                     openxfer::test::patternData(kPayloadBytes).toStdString());
    h.fs().failNextTransfers(1, "link reset");

    Observed obs;
    h.manager.start(makeJob(3, openxfer::Direction::Download,
                            dir.filePath(QStringLiteral("big.bin")),
                            QStringLiteral("/home/alice/big.bin")),
                    obs.callbacks());
    t.check(waitUntil([&obs] { return obs.finished; }, 10000),
            "failing job should finish");
    t.check(obs.error.kind == openxfer::ErrorKind::Io,
            "chunk failure should fail the whole task with an Io error");
    t.checkContains(obs.error.message, QStringLiteral("failed: link reset"),
                    "error should carry the chunk failure");
    t.check(obs.completedChunks() < 10, "remaining chunks should be stopped");
    t.check(waitUntil([&h] {
                const auto st = h.pool.status();
                return st.leased == 0 && st.connecting == 0;
            }),
            "every chunk lease should be returned");
}

void test_abort_then_resume(TestContext &t) {
    Harness h;
    h.fs().setBlockDelayMs(5);
    QTemporaryDir dir;
    const QByteArray data = openxfer::test::patternData(kPayloadBytes);
    h.fs().writeFile("/home/alice/big.bin", data.toStdString());
    const QString local = dir.filePath(QStringLiteral("big.bin"));

    Observed first;
    h.manager.start(makeJob(4, openxfer::Direction::Download, local,
                            QStringLiteral("/home/alice/big.bin")),
                    first.callbacks());
    t.check(waitUntil([&first] { return first.completedChunks() >= 1; }, 10000),
            "a chunk should complete before the abort");
    h.manager.abort(4);
    t.check(waitUntil([&first] { return first.finished; }, 10000),
            "aborted job should finish");
    t.check(first.error.kind == openxfer::ErrorKind::TransferAborted,
            "abort should report TransferAborted");
    t.check(first.completedChunks() < 10, "abort should leave work behind");

    h.fs().setBlockDelayMs(0);
    Observed second;
    auto job = makeJob(4, openxfer::Direction::Download, local,
                       QStringLiteral("/home/alice/big.bin"));
    job.chunks = first.chunks;
    h.manager.start(job, second.callbacks());
    t.check(second.completedChunks() == first.completedChunks(),
            "resumed plan should keep completed chunks");
    t.check(waitUntil([&second] { return second.finished; }, 10000),
            "resumed job should finish");
    t.check(second.error.ok(), "resumed job should succeed: " +
                                   second.error.message.toStdString());
    t.check(openxfer::test::readLocalFile(local) == data,
            "resumed download should be byte-exact");
}

void test_abort_interrupts_stalled_chunks(TestContext &t) {
    Harness h;
    h.fs().setBlockDelayMs(60000);
    QTemporaryDir dir;
    h.fs().writeFile("/home/alice/big.bin",
                     openxfer::test::patternData(kPayloadBytes).toStdString());

    Observed obs;
    h.manager.start(makeJob(6, openxfer::Direction::Download,
                            dir.filePath(QStringLiteral("big.bin")),
                            QStringLiteral("/home/alice/big.bin")),
                    obs.callbacks());
    t.check(waitUntil([&obs] {
                for (const auto &c : obs.chunks)
                    if (c.transferred > 0)
                        return true;
                return false;
            }),
            "chunks should move their first block and stall");

    QElapsedTimer clock;
    clock.start();
    h.manager.abort(6);
    t.check(waitUntil([&obs] { return obs.finished; }, 3000),
            "abort should unblock stalled chunks");
    t.check(clock.elapsed() < 3000, "stalled chunks should stop within seconds");
    t.check(obs.error.kind == openxfer::ErrorKind::TransferAborted,
            "abort should report TransferAborted");
    t.check(h.pool.status().leased == 0, "interrupted sessions should be given up");
    t.check(!h.manager.isActive(6), "job should be gone");
}

void test_duplicate_job_rejected(TestContext &t) {
    Harness h;
    h.fs().setBlockDelayMs(2);
    QTemporaryDir dir;
    h.fs().writeFile("/home/alice/big.bin",
                     openxfer::test::patternData(kPayloadBytes).toStdString());
    const QString local = dir.filePath(QStringLiteral("big.bin"));

    Observed a, b;
    h.manager.start(makeJob(5, openxfer::Direction::Download, local,
                            QStringLiteral("/home/alice/big.bin")),
                    a.callbacks());
    h.manager.start(makeJob(5, openxfer::Direction::Download, local,
                            QStringLiteral("/home/alice/big.bin")),
                    b.callbacks());
    t.check(waitUntil([&b] { return b.finished; }),
            "duplicate job should be answered");
    t.check(b.error.kind == openxfer::ErrorKind::Configuration,
            "duplicate job should be rejected");
    t.check(waitUntil([&a] { return a.finished; }, 10000) && a.error.ok(),
            "original job should still complete");
}

void test_integrity_verification(TestContext &t) {
    Harness h;
    QTemporaryDir dir;
    const QString local = dir.filePath(QStringLiteral("verify.bin"));
    t.check(openxfer::test::writeLocalFile(
                local, openxfer::test::patternData(kPayloadBytes)),
            "seed local file");

    h.fs().setDigestFunction(openxfer::test::qtDigest);
    auto job = makeJob(6, openxfer::Direction::Upload, local,
                       QStringLiteral("/home/alice/verify.bin"));
    job.integrity.enabled = true;
    job.integrity.thresholdBytes = 0;
    Observed ok;
    h.manager.start(job, ok.callbacks());
    t.check(waitUntil([&ok] { return ok.finished; }, 10000) && ok.error.ok(),
            "matching digests should verify");

    h.fs().setDigestFunction(
        [](const std::string &, openxfer::ChecksumAlgorithm) {
            return std::string(64, '0');
        });
    job.taskId = 7;
    Observed bad;
    h.manager.start(job, bad.callbacks());
    t.check(waitUntil([&bad] { return bad.finished; }, 10000),
            "mismatch job should finish");
    t.check(bad.error.kind == openxfer::ErrorKind::Integrity,
            "digest mismatch should fail with an Integrity error");
    t.checkContains(bad.error.message, QStringLiteral("sha256 mismatch"),
                    "mismatch message should name the algorithm");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_should_use_parallel(t);
    test_parallel_upload(t);
    test_parallel_download(t);
    test_chunk_failure_fails_task(t);
    test_abort_then_resume(t);
    test_abort_interrupts_stalled_chunks(t);
    test_duplicate_job_rejected(t);
    test_integrity_verification(t);
    return openxfer::test::finish(t, "openxfer_chunked_transfer_tests");
}
