// Runs blocking session calls on a bounded QThreadPool and hands results back
// to the thread of a context QObject. Coordination code never blocks; it
// only waits for these queued completions.
#pragma once
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QThreadPool>
#include <functional>
#include <utility>

namespace openxfer {

class IoDispatcher {
public:
    explicit IoDispatcher(int maxThreads = 16);
    ~IoDispatcher();

    IoDispatcher(const IoDispatcher &) = delete;
    IoDispatcher &operator=(const IoDispatcher &) = delete;

    void setMaxThreads(int n);
    int maxThreads() const { return pool_.maxThreadCount(); }

    // Fire-and-forget blocking job.
    void start(std::function<void()> job);

    // work() runs on a pool thread; done(result) runs later on context's
    // thread, and is dropped if context is gone. Both callables and the
    // result must be copyable.
    template <typename Work, typename Done>
    void run(QObject *context, Work work, Done done) {
        QPointer<QObject> guard(context);
        start([guard, work, done]() mutable {
            auto result = work();
            post(guard.data(), [guard, done, result]() mutable {
                if (guard)
                    done(std::move(result));
            });
        });
    }

    // Queues fn on context's thread.
    static void post(QObject *context, std::function<void()> fn);

    // Blocks until every started job has returned.
    void waitForDone();

private:
    QThreadPool pool_;
};

} // namespace openxfer
