#include "IoDispatcher.hpp"

namespace openxfer {

IoDispatcher::IoDispatcher(int maxThreads) { setMaxThreads(maxThreads); }

IoDispatcher::~IoDispatcher() { pool_.waitForDone(); }

void IoDispatcher::setMaxThreads(int n) { pool_.setMaxThreadCount(qMax(1, n)); }

void IoDispatcher::start(std::function<void()> job) {
    pool_.start(std::move(job));
}

void IoDispatcher::post(QObject *context, std::function<void()> fn) {
    if (!context)
        return;
    QMetaObject::invokeMethod(context, std::move(fn), Qt::QueuedConnection);
}

void IoDispatcher::waitForDone() { pool_.waitForDone(); }

} // namespace openxfer
