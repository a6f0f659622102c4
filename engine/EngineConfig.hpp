// Tunables of the transfer engine, persisted with QSettings.
#pragma once
#include "TransferTypes.hpp"
#include "openxfer/DeltaDiff.hpp"
#include "openxfer/SftpTypes.hpp"
#include <QSettings>
#include <QStringList>

namespace openxfer {

struct PoolConfig {
    int maxConnections = 5; // per host identity
    qint64 idleTimeoutMs = 5 * 60 * 1000;
    qint64 sweepIntervalMs = 2 * 60 * 1000;
    qint64 acquireTimeoutMs = 30 * 1000;
    int operationLogCapacity = 16;
};

struct ParallelConfig {
    bool enabled = true;
    quint64 thresholdBytes = 100ull * 1024 * 1024;
    quint64 chunkSizeBytes = 10ull * 1024 * 1024;
    int maxConcurrent = 5; // chunks in flight per transfer
};

struct IntegrityConfig {
    bool enabled = false;
    ChecksumAlgorithm algorithm = ChecksumAlgorithm::Sha256;
    quint64 thresholdBytes = 10ull * 1024 * 1024; // verify files at least this big
};

struct AttributeConfig {
    bool preservePermissions = true;
    bool preserveTimestamps = true;
};

struct SyncConfig {
    bool deleteRemote = false;
    QStringList excludePatterns;

    SyncConfig();
    DiffOptions toDiffOptions() const;
};

struct EngineConfig {
    int maxConcurrent = 5; // tasks running at once
    int ioThreads = 16;
    RetryPolicy retry;
    PoolConfig pool;
    ParallelConfig parallel;
    IntegrityConfig integrity;
    AttributeConfig attributes;
    SyncConfig sync;

    // Clamp out-of-range values.
    void sanitize();

    static EngineConfig load(QSettings &s);
    void save(QSettings &s) const;
    // QSettings("OpenXfer", "OpenXfer")
    static EngineConfig loadDefault();
};

const char *checksumAlgorithmName(ChecksumAlgorithm a);
ChecksumAlgorithm checksumAlgorithmFromName(const QString &name,
                                            ChecksumAlgorithm fallback);

} // namespace openxfer
