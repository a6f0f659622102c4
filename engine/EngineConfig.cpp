#include "EngineConfig.hpp"

namespace openxfer {

namespace {
constexpr quint64 kMinChunkSize = 64 * 1024;
}

SyncConfig::SyncConfig() {
    for (const auto &p : defaultExcludePatterns())
        excludePatterns << QString::fromStdString(p);
}

DiffOptions SyncConfig::toDiffOptions() const {
    DiffOptions o;
    o.deleteRemote = deleteRemote;
    for (const auto &p : excludePatterns)
        o.excludePatterns.push_back(p.toStdString());
    return o;
}

const char *checksumAlgorithmName(ChecksumAlgorithm a) {
    return a == ChecksumAlgorithm::Md5 ? "md5" : "sha256";
}

ChecksumAlgorithm checksumAlgorithmFromName(const QString &name,
                                            ChecksumAlgorithm fallback) {
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("md5"))
        return ChecksumAlgorithm::Md5;
    if (n == QLatin1String("sha256"))
        return ChecksumAlgorithm::Sha256;
    return fallback;
}

void EngineConfig::sanitize() {
    maxConcurrent = qMax(1, maxConcurrent);
    ioThreads = qMax(1, ioThreads);
    retry.maxRetries = qMax(0, retry.maxRetries);
    retry.retryDelayMs = qMax<qint64>(0, retry.retryDelayMs);
    if (retry.backoffMultiplier < 1.0)
        retry.backoffMultiplier = 1.0;
    pool.maxConnections = qMax(1, pool.maxConnections);
    pool.idleTimeoutMs = qMax<qint64>(0, pool.idleTimeoutMs);
    pool.sweepIntervalMs = qMax<qint64>(1000, pool.sweepIntervalMs);
    pool.acquireTimeoutMs = qMax<qint64>(0, pool.acquireTimeoutMs);
    pool.operationLogCapacity = qMax(1, pool.operationLogCapacity);
    parallel.maxConcurrent = qMax(1, parallel.maxConcurrent);
    parallel.chunkSizeBytes = qMax(kMinChunkSize, parallel.chunkSizeBytes);
}

EngineConfig EngineConfig::load(QSettings &s) {
    EngineConfig c;
    c.maxConcurrent = s.value("Transfer/maxConcurrent", c.maxConcurrent).toInt();
    c.ioThreads = s.value("Transfer/ioThreads", c.ioThreads).toInt();

    c.retry.enabled = s.value("Retry/enabled", c.retry.enabled).toBool();
    c.retry.maxRetries = s.value("Retry/maxRetries", c.retry.maxRetries).toInt();
    c.retry.retryDelayMs =
        s.value("Retry/delayMs", c.retry.retryDelayMs).toLongLong();
    c.retry.backoffMultiplier =
        s.value("Retry/backoffMultiplier", c.retry.backoffMultiplier).toDouble();

    c.pool.maxConnections =
        s.value("Pool/maxConnections", c.pool.maxConnections).toInt();
    c.pool.idleTimeoutMs =
        s.value("Pool/idleTimeoutMs", c.pool.idleTimeoutMs).toLongLong();
    c.pool.sweepIntervalMs =
        s.value("Pool/sweepIntervalMs", c.pool.sweepIntervalMs).toLongLong();
    c.pool.acquireTimeoutMs =
        s.value("Pool/acquireTimeoutMs", c.pool.acquireTimeoutMs).toLongLong();
    c.pool.operationLogCapacity =
        s.value("Pool/operationLogCapacity", c.pool.operationLogCapacity).toInt();

    c.parallel.enabled = s.value("Parallel/enabled", c.parallel.enabled).toBool();
    c.parallel.thresholdBytes =
        s.value("Parallel/thresholdBytes", c.parallel.thresholdBytes).toULongLong();
    c.parallel.chunkSizeBytes =
        s.value("Parallel/chunkSizeBytes", c.parallel.chunkSizeBytes).toULongLong();
    c.parallel.maxConcurrent =
        s.value("Parallel/maxConcurrent", c.parallel.maxConcurrent).toInt();

    c.integrity.enabled = s.value("Integrity/enabled", c.integrity.enabled).toBool();
    c.integrity.algorithm = checksumAlgorithmFromName(
        s.value("Integrity/algorithm", checksumAlgorithmName(c.integrity.algorithm))
            .toString(),
        c.integrity.algorithm);
    c.integrity.thresholdBytes =
        s.value("Integrity/thresholdBytes", c.integrity.thresholdBytes)
            .toULongLong();

    c.attributes.preservePermissions =
        s.value("Attributes/preservePermissions", c.attributes.preservePermissions)
            .toBool();
    c.attributes.preserveTimestamps =
        s.value("Attributes/preserveTimestamps", c.attributes.preserveTimestamps)
            .toBool();

    c.sync.deleteRemote = s.value("Sync/deleteRemote", c.sync.deleteRemote).toBool();
    if (s.contains("Sync/excludePatterns"))
        c.sync.excludePatterns = s.value("Sync/excludePatterns").toStringList();

    c.sanitize();
    return c;
}

void EngineConfig::save(QSettings &s) const {
    s.setValue("Transfer/maxConcurrent", maxConcurrent);
    s.setValue("Transfer/ioThreads", ioThreads);
    s.setValue("Retry/enabled", retry.enabled);
    s.setValue("Retry/maxRetries", retry.maxRetries);
    s.setValue("Retry/delayMs", retry.retryDelayMs);
    s.setValue("Retry/backoffMultiplier", retry.backoffMultiplier);
    s.setValue("Pool/maxConnections", pool.maxConnections);
    s.setValue("Pool/idleTimeoutMs", pool.idleTimeoutMs);
    s.setValue("Pool/sweepIntervalMs", pool.sweepIntervalMs);
    s.setValue("Pool/acquireTimeoutMs", pool.acquireTimeoutMs);
    s.setValue("Pool/operationLogCapacity", pool.operationLogCapacity);
    s.setValue("Parallel/enabled", parallel.enabled);
    s.setValue("Parallel/thresholdBytes", parallel.thresholdBytes);
    s.setValue("Parallel/chunkSizeBytes", parallel.chunkSizeBytes);
    s.setValue("Parallel/maxConcurrent", parallel.maxConcurrent);
    s.setValue("Integrity/enabled", integrity.enabled);
    s.setValue("Integrity/algorithm", checksumAlgorithmName(integrity.algorithm));
    s.setValue("Integrity/thresholdBytes", integrity.thresholdBytes);
    s.setValue("Attributes/preservePermissions", attributes.preservePermissions);
    s.setValue("Attributes/preserveTimestamps", attributes.preserveTimestamps);
    s.setValue("Sync/deleteRemote", sync.deleteRemote);
    s.setValue("Sync/excludePatterns", sync.excludePatterns);
}

EngineConfig EngineConfig::loadDefault() {
    QSettings s("OpenXfer", "OpenXfer");
    return load(s);
}

} // namespace openxfer
