#include "TransferTypes.hpp"

#include <cmath>

namespace openxfer {

Priority priorityForSize(quint64 size, bool sizeKnown) {
    if (!sizeKnown)
        return Priority::Normal;
    if (size < kHighPriorityBelowBytes)
        return Priority::High;
    if (size > kLowPriorityAboveBytes)
        return Priority::Low;
    return Priority::Normal;
}

qint64 retryDelayMs(const RetryPolicy &policy, int attempt) {
    if (attempt < 1)
        attempt = 1;
    const double factor =
        std::pow(policy.backoffMultiplier, static_cast<double>(attempt - 1));
    return static_cast<qint64>(std::llround(
        static_cast<double>(policy.retryDelayMs) * factor));
}

std::vector<Chunk> splitIntoChunks(quint64 size, quint64 chunkSize) {
    std::vector<Chunk> chunks;
    if (size == 0 || chunkSize == 0)
        return chunks;
    const quint64 count = (size + chunkSize - 1) / chunkSize;
    chunks.reserve(static_cast<std::size_t>(count));
    for (quint64 i = 0; i < count; ++i) {
        Chunk c;
        c.index = static_cast<int>(i);
        c.start = i * chunkSize;
        c.end = qMin(c.start + chunkSize, size) - 1;
        c.size = c.end - c.start + 1;
        chunks.push_back(c);
    }
    return chunks;
}

bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

const char *directionName(Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

const char *taskStatusName(TaskStatus s) {
    switch (s) {
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Running:
        return "running";
    case TaskStatus::Paused:
        return "paused";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Failed:
        return "failed";
    case TaskStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

const char *priorityName(Priority p) {
    switch (p) {
    case Priority::High:
        return "high";
    case Priority::Normal:
        return "normal";
    case Priority::Low:
        return "low";
    }
    return "unknown";
}

const char *chunkStatusName(ChunkStatus s) {
    switch (s) {
    case ChunkStatus::Pending:
        return "pending";
    case ChunkStatus::Transferring:
        return "transferring";
    case ChunkStatus::Completed:
        return "completed";
    case ChunkStatus::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace openxfer
