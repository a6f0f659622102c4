#include "SessionPool.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <climits>

namespace openxfer {

const char *poolEventName(PoolEvent e) {
    switch (e) {
    case PoolEvent::Create:
        return "create";
    case PoolEvent::Reuse:
        return "reuse";
    case PoolEvent::Acquire:
        return "acquire";
    case PoolEvent::Release:
        return "release";
    case PoolEvent::Discard:
        return "discard";
    case PoolEvent::Evict:
        return "evict";
    }
    return "unknown";
}

OperationLog::OperationLog(int capacity)
    : ring_(static_cast<std::size_t>(std::max(1, capacity))) {}

void OperationLog::record(PoolEvent event, qint64 atMs) {
    ring_[next_] = PoolOperation{event, atMs};
    next_ = (next_ + 1) % ring_.size();
    if (count_ < ring_.size())
        ++count_;
}

std::vector<PoolOperation> OperationLog::entries() const {
    std::vector<PoolOperation> out;
    out.reserve(count_);
    const std::size_t first = (next_ + ring_.size() - count_) % ring_.size();
    for (std::size_t i = 0; i < count_; ++i)
        out.push_back(ring_[(first + i) % ring_.size()]);
    return out;
}

namespace {

struct ConnectOutcome {
    std::shared_ptr<SftpClient> client;
    QString error;
};

SessionLease makeLease(quint64 id, const HostIdentity &identity,
                       const std::shared_ptr<SftpClient> &client) {
    SessionLease l;
    l.entryId = id;
    l.identity = identity;
    l.client = client;
    return l;
}

} // namespace

SessionPool::SessionPool(SftpClient &prototype, IoDispatcher &io,
                         const PoolConfig &config, QObject *parent)
    : QObject(parent), prototype_(prototype), io_(io), config_(config),
      factoryMutex_(std::make_shared<std::mutex>()) {
    connect(&sweepTimer_, &QTimer::timeout, this, [this] { sweepIdle(); });
}

SessionPool::~SessionPool() {
    shutdown();
    // Connect and close jobs still reference the prototype.
    io_.waitForDone();
}

void SessionPool::initialize() {
    closed_ = false;
    running_ = true;
    sweepTimer_.start(
        static_cast<int>(qBound<qint64>(1, config_.sweepIntervalMs, INT_MAX)));
}

void SessionPool::shutdown() {
    sweepTimer_.stop();
    running_ = false;
    closed_ = true;

    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto &kv : waiters) {
        for (auto &w : kv.second) {
            if (w.timer)
                w.timer->deleteLater();
            AcquireResult r;
            r.error = TransferError::make(ErrorKind::TransferAborted,
                                          tr("Session pool shut down"));
            deliver(w.callback, r);
        }
    }

    int closed = 0;
    for (auto &kv : entries_) {
        for (auto &e : kv.second) {
            // Leased sessions are closed when their holder gives them back;
            // connecting ones when the connect job returns.
            if (e->status == EntryStatus::Idle) {
                closeAsync(e->client);
                ++closed;
            }
        }
    }
    entries_.clear();
    if (closed > 0)
        qCInfo(oxPool) << "Shutdown closed" << closed << "idle sessions";
    emit statusChanged();
}

void SessionPool::setConfig(const PoolConfig &config) {
    config_ = config;
    if (running_)
        sweepTimer_.start(static_cast<int>(
            qBound<qint64>(1, config_.sweepIntervalMs, INT_MAX)));
    std::vector<QString> keys;
    for (const auto &kv : waiters_)
        keys.push_back(kv.first);
    for (const auto &k : keys)
        serveWaiters(k);
}

SessionPool::Entry *SessionPool::findEntry(quint64 id, QString *keyOut) {
    for (auto &kv : entries_) {
        for (auto &e : kv.second) {
            if (e->id == id) {
                if (keyOut)
                    *keyOut = kv.first;
                return e.get();
            }
        }
    }
    return nullptr;
}

int SessionPool::liveCount(const QString &key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : static_cast<int>(it->second.size());
}

void SessionPool::lease(Entry &e, PoolEvent event, qint64 nowMs) {
    e.status = EntryStatus::Leased;
    e.leaseCount++;
    e.leasedAtMs = nowMs;
    e.lastUsedMs = nowMs;
    e.log.record(event, nowMs);
    e.log.record(PoolEvent::Acquire, nowMs);
}

void SessionPool::deliver(AcquireCallback callback, AcquireResult result) {
    IoDispatcher::post(this, [callback, result]() { callback(result); });
}

void SessionPool::closeAsync(std::shared_ptr<SftpClient> client) {
    if (!client)
        return;
    io_.start([client]() { client->disconnect(); });
}

quint64 SessionPool::acquire(const HostIdentity &identity,
                             const SessionOptions &options,
                             AcquireCallback callback) {
    const quint64 ticket = nextTicket_++;
    if (closed_) {
        AcquireResult r;
        r.error = TransferError::make(ErrorKind::TransferAborted,
                                      tr("Session pool shut down"));
        deliver(callback, r);
        return ticket;
    }

    const QString key = identity.key();
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    auto &list = entries_[key];

    // Most recently used idle session first; stale ones drop out.
    while (true) {
        Entry *best = nullptr;
        for (auto &e : list) {
            if (e->status == EntryStatus::Idle &&
                (!best || e->lastUsedMs > best->lastUsedMs))
                best = e.get();
        }
        if (!best)
            break;
        if (!best->client->isConnected()) {
            qCInfo(oxPool) << "Dropping disconnected idle session"
                           << logValue(identity.displayName());
            removeEntry(key, best->id, PoolEvent::Discard);
            continue;
        }
        lease(*best, PoolEvent::Reuse, now);
        qCDebug(oxPool) << "Reuse session" << best->id << "for"
                        << logValue(identity.displayName());
        AcquireResult r;
        r.lease = makeLease(best->id, best->identity, best->client);
        deliver(callback, r);
        emit statusChanged();
        return ticket;
    }

    if (liveCount(key) < config_.maxConnections) {
        startConnect(identity, options, callback);
        return ticket;
    }

    Waiter w;
    w.ticket = ticket;
    w.identity = identity;
    w.options = options;
    w.callback = callback;
    w.timer = new QTimer(this);
    w.timer->setSingleShot(true);
    connect(w.timer, &QTimer::timeout, this, [this, key, ticket]() {
        auto it = waiters_.find(key);
        if (it == waiters_.end())
            return;
        auto &q = it->second;
        auto wit = std::find_if(q.begin(), q.end(), [ticket](const Waiter &x) {
            return x.ticket == ticket;
        });
        if (wit == q.end())
            return;
        Waiter expired = std::move(*wit);
        q.erase(wit);
        if (q.empty())
            waiters_.erase(it);
        expired.timer->deleteLater();
        qCWarning(oxPool) << "No session available for"
                          << logValue(expired.identity.displayName())
                          << "within" << config_.acquireTimeoutMs << "ms";
        AcquireResult r;
        r.error = TransferError::make(
            ErrorKind::PoolExhausted,
            tr("No session available within %1 ms")
                .arg(config_.acquireTimeoutMs));
        deliver(expired.callback, r);
        emit statusChanged();
    });
    w.timer->start(static_cast<int>(
        qBound<qint64>(0, config_.acquireTimeoutMs, INT_MAX)));
    waiters_[key].push_back(std::move(w));
    qCDebug(oxPool) << "Pool full for" << logValue(identity.displayName())
                    << "- waiting";
    emit statusChanged();
    return ticket;
}

void SessionPool::cancelAcquire(quint64 ticket) {
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
        auto &q = it->second;
        auto wit = std::find_if(q.begin(), q.end(), [ticket](const Waiter &x) {
            return x.ticket == ticket;
        });
        if (wit == q.end())
            continue;
        Waiter w = std::move(*wit);
        q.erase(wit);
        if (q.empty())
            waiters_.erase(it);
        if (w.timer)
            w.timer->deleteLater();
        AcquireResult r;
        r.error = TransferError::make(ErrorKind::TransferAborted,
                                      tr("Session request canceled"));
        deliver(w.callback, r);
        emit statusChanged();
        return;
    }
}

void SessionPool::startConnect(const HostIdentity &identity,
                               const SessionOptions &options,
                               AcquireCallback callback) {
    const QString key = identity.key();
    auto entry = std::make_unique<Entry>();
    entry->id = nextEntryId_++;
    entry->status = EntryStatus::Connecting;
    entry->identity = identity;
    entry->log = OperationLog(config_.operationLogCapacity);
    const quint64 entryId = entry->id;
    entries_[key].push_back(std::move(entry));
    emit statusChanged();

    SftpClient *proto = &prototype_;
    auto factoryMutex = factoryMutex_;
    io_.run(
        this,
        [proto, options, factoryMutex]() {
            ConnectOutcome out;
            std::string err;
            std::unique_ptr<SftpClient> conn;
            {
                // One connection setup at a time keeps backend
                // initialization single-threaded.
                std::lock_guard<std::mutex> lk(*factoryMutex);
                conn = proto->newConnectionLike(options, err);
            }
            out.client = std::shared_ptr<SftpClient>(std::move(conn));
            out.error = QString::fromStdString(err);
            return out;
        },
        [this, key, entryId, callback](const ConnectOutcome &out) {
            onConnected(key, entryId, out.client, out.error, callback);
        });
}

void SessionPool::onConnected(const QString &key, quint64 entryId,
                              std::shared_ptr<SftpClient> client,
                              const QString &err, AcquireCallback callback) {
    Entry *e = findEntry(entryId);
    AcquireResult r;
    if (!e) {
        closeAsync(client);
        r.error = TransferError::make(ErrorKind::TransferAborted,
                                      tr("Session pool shut down"));
        deliver(callback, r);
        return;
    }
    if (!client) {
        const HostIdentity identity = e->identity;
        auto &list = entries_[key];
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [entryId](const std::unique_ptr<Entry> &x) {
                                      return x->id == entryId;
                                  }),
                   list.end());
        qCWarning(oxPool) << "Connect failed for"
                          << logValue(identity.displayName()) << ":" << err;
        r.error = TransferError::make(
            ErrorKind::Connection,
            err.isEmpty() ? tr("Could not establish session") : err);
        deliver(callback, r);
        emit statusChanged();
        serveWaiters(key);
        return;
    }

    e->client = client;
    lease(*e, PoolEvent::Create, QDateTime::currentMSecsSinceEpoch());
    qCInfo(oxPool) << "Created session" << e->id << "for"
                   << logValue(e->identity.displayName());
    r.lease = makeLease(e->id, e->identity, e->client);
    deliver(callback, r);
    emit statusChanged();
}

void SessionPool::release(const SessionLease &lease) {
    if (!lease.valid())
        return;
    QString key;
    Entry *e = findEntry(lease.entryId, &key);
    if (!e || e->client != lease.client) {
        // Pool was shut down or the entry was discarded meanwhile.
        closeAsync(lease.client);
        return;
    }
    if (e->status != EntryStatus::Leased) {
        qCWarning(oxPool) << "Release of session" << e->id
                          << "that is not leased";
        return;
    }
    if (!e->client->isConnected()) {
        discard(lease);
        return;
    }
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    e->status = EntryStatus::Idle;
    e->lastUsedMs = now;
    e->log.record(PoolEvent::Release, now);
    qCDebug(oxPool) << "Released session" << e->id;
    emit statusChanged();
    serveWaiters(key);
}

bool SessionPool::release(const HostIdentity &identity) {
    auto it = entries_.find(identity.key());
    if (it == entries_.end())
        return false;
    Entry *oldest = nullptr;
    for (auto &e : it->second) {
        if (e->status == EntryStatus::Leased &&
            (!oldest || e->leasedAtMs < oldest->leasedAtMs))
            oldest = e.get();
    }
    if (!oldest)
        return false;
    release(makeLease(oldest->id, oldest->identity, oldest->client));
    return true;
}

void SessionPool::discard(const SessionLease &lease) {
    if (!lease.valid())
        return;
    QString key;
    Entry *e = findEntry(lease.entryId, &key);
    if (!e || e->client != lease.client) {
        closeAsync(lease.client);
        return;
    }
    qCInfo(oxPool) << "Discarding session" << e->id << "for"
                   << logValue(e->identity.displayName());
    removeEntry(key, lease.entryId, PoolEvent::Discard);
    emit statusChanged();
    serveWaiters(key);
}

void SessionPool::removeEntry(const QString &key, quint64 id,
                              PoolEvent event) {
    auto it = entries_.find(key);
    if (it == entries_.end())
        return;
    auto &list = it->second;
    for (auto eit = list.begin(); eit != list.end(); ++eit) {
        if ((*eit)->id != id)
            continue;
        qCDebug(oxPool) << poolEventName(event) << "session" << id;
        closeAsync((*eit)->client);
        list.erase(eit);
        break;
    }
}

void SessionPool::serveWaiters(const QString &key) {
    auto wit = waiters_.find(key);
    if (wit == waiters_.end())
        return;
    auto &q = wit->second;
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    while (!q.empty()) {
        Entry *idle = nullptr;
        auto eit = entries_.find(key);
        if (eit != entries_.end()) {
            for (auto &e : eit->second) {
                if (e->status == EntryStatus::Idle &&
                    e->client->isConnected()) {
                    idle = e.get();
                    break;
                }
            }
        }
        if (idle) {
            Waiter w = std::move(q.front());
            q.pop_front();
            if (w.timer)
                w.timer->deleteLater();
            lease(*idle, PoolEvent::Reuse, now);
            AcquireResult r;
            r.lease = makeLease(idle->id, idle->identity, idle->client);
            deliver(w.callback, r);
            continue;
        }
        if (liveCount(key) < config_.maxConnections) {
            Waiter w = std::move(q.front());
            q.pop_front();
            if (w.timer)
                w.timer->deleteLater();
            startConnect(w.identity, w.options, w.callback);
            continue;
        }
        break;
    }
    if (q.empty())
        waiters_.erase(wit);
    emit statusChanged();
}

int SessionPool::sweepIdle(qint64 nowMs) {
    int evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto &list = it->second;
        for (auto eit = list.begin(); eit != list.end();) {
            Entry &e = **eit;
            if (e.status == EntryStatus::Idle &&
                nowMs - e.lastUsedMs > config_.idleTimeoutMs) {
                qCInfo(oxPool) << "Evicting idle session" << e.id << "for"
                               << logValue(e.identity.displayName());
                e.log.record(PoolEvent::Evict, nowMs);
                closeAsync(e.client);
                eit = list.erase(eit);
                ++evicted;
            } else {
                ++eit;
            }
        }
        if (list.empty() && waiters_.find(it->first) == waiters_.end())
            it = entries_.erase(it);
        else
            ++it;
    }
    if (evicted > 0)
        emit statusChanged();
    return evicted;
}

PoolStatus SessionPool::status() const {
    PoolStatus st;
    for (const auto &kv : entries_) {
        for (const auto &e : kv.second) {
            st.total++;
            switch (e->status) {
            case EntryStatus::Idle:
                st.idle++;
                break;
            case EntryStatus::Leased:
                st.leased++;
                break;
            case EntryStatus::Connecting:
                st.connecting++;
                break;
            }
        }
        if (!kv.second.empty())
            st.perIdentity[kv.first] = static_cast<int>(kv.second.size());
    }
    for (const auto &kv : waiters_)
        st.waiters += static_cast<int>(kv.second.size());
    return st;
}

std::vector<PoolEntryInfo>
SessionPool::operationLog(const HostIdentity &identity) const {
    std::vector<PoolEntryInfo> out;
    auto it = entries_.find(identity.key());
    if (it == entries_.end())
        return out;
    for (const auto &e : it->second) {
        PoolEntryInfo info;
        info.id = e->id;
        info.status = e->status;
        info.lastUsedMs = e->lastUsedMs;
        info.leaseCount = e->leaseCount;
        info.operations = e->log.entries();
        out.push_back(info);
    }
    return out;
}

} // namespace openxfer
