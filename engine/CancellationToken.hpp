// Cooperative cancellation handle shared between the engine thread and the
// I/O workers. Copies refer to the same state. Operations poll it at block
// and chunk boundaries.
#pragma once
#include <atomic>
#include <functional>
#include <memory>

namespace openxfer {

// Stronger reasons override weaker ones (Pause < Cancel < Shutdown).
enum class CancelReason { None = 0, Pause = 1, Cancel = 2, Shutdown = 3 };

class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<int>>(0)) {}

    void cancel(CancelReason reason) {
        int cur = state_->load();
        const int want = static_cast<int>(reason);
        while (cur < want && !state_->compare_exchange_weak(cur, want)) {
        }
    }

    bool isCancelled() const { return state_->load() != 0; }

    CancelReason reason() const {
        return static_cast<CancelReason>(state_->load());
    }

    bool sameAs(const CancellationToken &other) const {
        return state_ == other.state_;
    }

    std::function<bool()> asCallback() const {
        auto state = state_;
        return [state] { return state->load() != 0; };
    }

private:
    std::shared_ptr<std::atomic<int>> state_;
};

} // namespace openxfer
