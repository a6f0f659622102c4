// Moves one large file as byte-range chunks over several pooled sessions at
// once. Each chunk holds its own lease for the duration of its range copy.
//
// Failure policy: the first chunk that fails for a reason other than
// cancellation stops its siblings and fails the whole transfer. Retrying is
// left to the queue; chunks keep their partial progress so a resumed run
// continues every chunk where it stopped.
#pragma once
#include "CancellationToken.hpp"
#include "EngineConfig.hpp"
#include "IoDispatcher.hpp"
#include "SessionPool.hpp"
#include "TransferErrors.hpp"
#include "TransferTypes.hpp"
#include <QObject>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace openxfer {

struct ChunkedJob {
    quint64 taskId = 0;
    Direction direction = Direction::Upload;
    HostIdentity identity;
    SessionOptions options;
    QString localPath;
    QString remotePath;
    quint64 size = 0;
    // Plan of an interrupted run to continue; empty starts a fresh one.
    std::vector<Chunk> chunks;
    CancellationToken token;
    IntegrityConfig integrity;
    AttributeConfig attributes;
};

// Invoked on the manager's thread.
struct ChunkedCallbacks {
    std::function<void(const std::vector<Chunk> &)> onPlanned;
    std::function<void(const Chunk &)> onChunkProgress;
    std::function<void(const TransferError &)> onFinished;
};

class ChunkedTransferManager : public QObject {
    Q_OBJECT
public:
    ChunkedTransferManager(SessionPool &pool, IoDispatcher &io,
                           const ParallelConfig &config = ParallelConfig(),
                           QObject *parent = nullptr);
    ~ChunkedTransferManager() override;

    void setConfig(const ParallelConfig &config) { config_ = config; }
    const ParallelConfig &config() const { return config_; }

    // Enabled, strictly above the threshold, and not a whole-file transfer
    // that already stopped at a nonzero offset.
    bool shouldUseParallel(quint64 size, quint64 alreadyTransferred,
                           bool hasChunkPlan) const;

    std::vector<Chunk> planChunks(quint64 size) const;

    // onFinished fires exactly once per started job.
    void start(ChunkedJob job, ChunkedCallbacks callbacks);

    // Stops a job without failing it; onFinished reports TransferAborted.
    void abort(quint64 taskId);
    bool isActive(quint64 taskId) const;
    int activeJobs() const { return static_cast<int>(runs_.size()); }

    void shutdown();

private:
    struct Run {
        ChunkedJob job;
        ChunkedCallbacks callbacks;
        std::vector<Chunk> chunks;
        CancellationToken internal; // sibling stop on failure or abort
        std::map<int, SessionLease> inFlight; // chunk index -> its session
        std::map<int, quint64> acquiring; // chunk index -> pool ticket
        TransferError firstError;
        bool preparing = false;
        bool finalizing = false;
        bool aborted = false;
        bool interrupted = false; // in-flight sessions were cut off
        quint64 stepTicket = 0; // session request of prepare or finalize
    };
    using RunPtr = std::shared_ptr<Run>;

    struct ChunkOutcome {
        bool ok = false;
        QString error;
        bool broken = false;
    };

    RunPtr findRun(quint64 taskId) const;
    void prepare(const RunPtr &run, bool fresh);
    void prepareDownload(const RunPtr &run, bool fresh);
    void prepareUpload(const RunPtr &run, bool fresh);
    void onPrepared(const RunPtr &run, const TransferError &err,
                    bool resetChunks);
    void pump(const RunPtr &run);
    void onLease(const RunPtr &run, int index,
                 const SessionPool::AcquireResult &result);
    void onChunkBytes(const RunPtr &run, int index, quint64 transferred);
    void onChunkDone(const RunPtr &run, int index, const SessionLease &lease,
                     const ChunkOutcome &outcome);
    void notifyChunk(const RunPtr &run, int index);
    bool isCurrent(const RunPtr &run) const;
    void recordFailure(const RunPtr &run, const TransferError &err);
    void stopRun(const RunPtr &run);
    bool stopping(const RunPtr &run) const;
    void maybeFinish(const RunPtr &run);
    void finalize(const RunPtr &run);
    void finish(const RunPtr &run, const TransferError &err);

    SessionPool &pool_;
    IoDispatcher &io_;
    ParallelConfig config_;
    std::map<quint64, RunPtr> runs_;
};

} // namespace openxfer
