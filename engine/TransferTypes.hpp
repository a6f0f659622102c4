// Enumerations and small value types shared by the engine components.
#pragma once
#include <QtGlobal>
#include <vector>

namespace openxfer {

enum class Direction { Upload, Download };

// pending -> running -> {completed | failed | cancelled}
// running <-> paused, paused -> pending (resume), failed -> pending (retry)
enum class TaskStatus { Pending, Running, Paused, Completed, Failed, Cancelled };

// Ordered so that a larger value is scheduled first.
enum class Priority { Low = 0, Normal = 1, High = 2 };

enum class ChunkStatus { Pending, Transferring, Completed, Failed };

struct Chunk {
    int index = 0;
    quint64 start = 0;
    quint64 end = 0; // inclusive
    quint64 size = 0;
    quint64 transferred = 0;
    ChunkStatus status = ChunkStatus::Pending;
    double speed = 0.0; // bytes/s
};

struct RetryPolicy {
    bool enabled = true;
    int maxRetries = 3;
    qint64 retryDelayMs = 2000;
    double backoffMultiplier = 2.0;
};

struct TransferStats {
    int total = 0;
    int pending = 0;
    int running = 0;
    int paused = 0;
    int completed = 0;
    int failed = 0;
    int cancelled = 0;
    quint64 totalBytes = 0;
    quint64 transferredBytes = 0;
    double averageSpeed = 0.0; // bytes/s over running tasks
};

constexpr quint64 kHighPriorityBelowBytes = 1024ull * 1024ull;
constexpr quint64 kLowPriorityAboveBytes = 100ull * 1024ull * 1024ull;

// <1 MiB -> high, >100 MiB -> low, otherwise normal. Unknown size is normal.
Priority priorityForSize(quint64 size, bool sizeKnown = true);

// Delay before retry number `attempt` (1-based):
// retryDelayMs * backoffMultiplier^(attempt - 1).
qint64 retryDelayMs(const RetryPolicy &policy, int attempt);

// ceil(size / chunkSize) chunks with inclusive byte ranges.
std::vector<Chunk> splitIntoChunks(quint64 size, quint64 chunkSize);

bool isTerminal(TaskStatus status);

const char *directionName(Direction d);
const char *taskStatusName(TaskStatus s);
const char *priorityName(Priority p);
const char *chunkStatusName(ChunkStatus s);

} // namespace openxfer
