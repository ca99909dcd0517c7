#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "errors.hpp"

namespace aspect {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    std::vector<std::function<void()>> callbacks;
};

} // namespace detail

/**
 * Observes a cancellation request.
 *
 * A default-constructed token can never be cancelled. Tokens are cheap to
 * copy and are passed by value as the last argument of suspending operations,
 * so an intercepted call hands the caller's token through to the real call.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool can_be_cancelled() const { return state_ != nullptr; }

    bool is_cancellation_requested() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @throws CancelledError if cancellation has been requested
     */
    void throw_if_cancellation_requested() const {
        if (is_cancellation_requested()) {
            throw CancelledError();
        }
    }

    /**
     * Run the callback when cancellation is requested. Runs it immediately
     * on the calling thread when cancellation was already requested.
     */
    void on_cancel(std::function<void()> callback) const {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled) {
                state_->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback();
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * Issues cancellation requests to every token it handed out.
 */
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }

    bool is_cancellation_requested() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * Request cancellation. Registered callbacks run once, on this thread,
     * outside the internal lock. Subsequent calls have no effect.
     */
    void cancel() {
        std::vector<std::function<void()>> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled) return;
            state_->cancelled = true;
            callbacks.swap(state_->callbacks);
        }
        for (auto& callback : callbacks) {
            callback();
        }
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace aspect
