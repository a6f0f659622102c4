// Leases authenticated sessions keyed by host identity, reuses idle ones and
// evicts them after an idle timeout. Lives on the engine thread; sessions are
// created on the I/O dispatcher and handed out through callbacks.
#pragma once
#include "EngineConfig.hpp"
#include "HostRegistry.hpp"
#include "IoDispatcher.hpp"
#include "TransferErrors.hpp"
#include "openxfer/SftpClient.hpp"
#include <QDateTime>
#include <QMap>
#include <QObject>
#include <QTimer>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace openxfer {

// Create or Reuse is always followed by Acquire once the lease is handed out.
enum class PoolEvent { Create, Reuse, Acquire, Release, Discard, Evict };

const char *poolEventName(PoolEvent e);

struct PoolOperation {
    PoolEvent event = PoolEvent::Create;
    qint64 atMs = 0;
};

// Fixed-capacity ring of recent operations; the oldest are overwritten.
class OperationLog {
public:
    explicit OperationLog(int capacity = 16);

    void record(PoolEvent event, qint64 atMs);
    std::vector<PoolOperation> entries() const; // oldest first
    int capacity() const { return static_cast<int>(ring_.size()); }

private:
    std::vector<PoolOperation> ring_;
    std::size_t next_ = 0;
    std::size_t count_ = 0;
};

enum class EntryStatus { Connecting, Idle, Leased };

// A session handed to exactly one caller until released or discarded.
struct SessionLease {
    quint64 entryId = 0;
    HostIdentity identity;
    std::shared_ptr<SftpClient> client;

    bool valid() const { return client != nullptr; }
};

struct PoolEntryInfo {
    quint64 id = 0;
    EntryStatus status = EntryStatus::Idle;
    qint64 lastUsedMs = 0;
    int leaseCount = 0;
    std::vector<PoolOperation> operations;
};

struct PoolStatus {
    int total = 0;
    int idle = 0;
    int leased = 0;
    int connecting = 0;
    int waiters = 0;
    QMap<QString, int> perIdentity; // HostIdentity::key() -> live entries
};

class SessionPool : public QObject {
    Q_OBJECT
public:
    struct AcquireResult {
        SessionLease lease;
        TransferError error;
        bool ok() const { return lease.valid(); }
    };
    using AcquireCallback = std::function<void(const AcquireResult &)>;

    // New sessions are opened with prototype.newConnectionLike(); the
    // prototype and the dispatcher must outlive the pool.
    SessionPool(SftpClient &prototype, IoDispatcher &io,
                const PoolConfig &config = PoolConfig(),
                QObject *parent = nullptr);
    ~SessionPool() override;

    void initialize();
    void shutdown();
    bool isRunning() const { return running_; }

    void setConfig(const PoolConfig &config);
    const PoolConfig &config() const { return config_; }

    // Completes asynchronously on the pool's thread. Returns a ticket that
    // cancelAcquire() accepts while the request is still waiting.
    quint64 acquire(const HostIdentity &identity, const SessionOptions &options,
                    AcquireCallback callback);
    void cancelAcquire(quint64 ticket);

    // Back to idle. A session that reports itself disconnected is dropped.
    void release(const SessionLease &lease);
    // Releases the longest-held lease of that identity.
    bool release(const HostIdentity &identity);
    // Drops a broken session so the next acquire opens a fresh one.
    void discard(const SessionLease &lease);

    // Closes idle entries unused for longer than the idle timeout.
    int sweepIdle(qint64 nowMs = QDateTime::currentMSecsSinceEpoch());

    PoolStatus status() const;
    // Live entries of the identity with their recent operations.
    std::vector<PoolEntryInfo> operationLog(const HostIdentity &identity) const;

signals:
    void statusChanged();

private:
    struct Entry {
        quint64 id = 0;
        EntryStatus status = EntryStatus::Connecting;
        std::shared_ptr<SftpClient> client;
        qint64 lastUsedMs = 0;
        qint64 leasedAtMs = 0;
        int leaseCount = 0;
        OperationLog log;
        HostIdentity identity;
    };
    struct Waiter {
        quint64 ticket = 0;
        HostIdentity identity;
        SessionOptions options;
        AcquireCallback callback;
        QTimer *timer = nullptr;
    };

    Entry *findEntry(quint64 id, QString *keyOut = nullptr);
    int liveCount(const QString &key) const;
    void lease(Entry &e, PoolEvent event, qint64 nowMs);
    void startConnect(const HostIdentity &identity, const SessionOptions &options,
                      AcquireCallback callback);
    void onConnected(const QString &key, quint64 entryId,
                     std::shared_ptr<SftpClient> client, const QString &err,
                     AcquireCallback callback);
    void serveWaiters(const QString &key);
    void deliver(AcquireCallback callback, AcquireResult result);
    void removeEntry(const QString &key, quint64 id, PoolEvent event);
    void closeAsync(std::shared_ptr<SftpClient> client);

    SftpClient &prototype_;
    IoDispatcher &io_;
    PoolConfig config_;
    bool running_ = false; // sweep timer active
    bool closed_ = false;  // after shutdown(), until initialize()
    QTimer sweepTimer_;
    std::map<QString, std::vector<std::unique_ptr<Entry>>> entries_;
    std::map<QString, std::deque<Waiter>> waiters_;
    quint64 nextEntryId_ = 1;
    quint64 nextTicket_ = 1;
    // Serializes session creation across worker threads.
    std::shared_ptr<std::mutex> factoryMutex_;
};

} // namespace openxfer
