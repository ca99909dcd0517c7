#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "errors.hpp"
#include "logging.hpp"

namespace aspect {

/**
 * Terminal state of a suspending operation.
 */
enum class Settlement {
    Pending,
    Fulfilled,
    Failed,
    Cancelled,
};

/**
 * Returns true if the exception is a CancelledError.
 */
inline bool is_cancellation(const std::exception_ptr& error) {
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const CancelledError&) {
        return true;
    } catch (...) {
        return false;
    }
}

template<typename T> class Deferred;
template<typename T> class Promise;

namespace detail {

struct Unit {};

template<typename T>
using stored_t = std::conditional_t<std::is_void<T>::value, Unit, T>;

template<typename T>
struct DeferredState {
    std::mutex mutex;
    std::condition_variable settled;
    Settlement settlement = Settlement::Pending;
    std::optional<stored_t<T>> value;
    std::exception_ptr error;
    std::vector<std::function<void()>> continuations;
};

} // namespace detail

/**
 * Handle to the eventual outcome of a suspending operation.
 *
 * An intercepted operation that returns Deferred<T> suspends: the proxy and
 * the chain executor attach continuations instead of waiting, and hand the
 * caller a Deferred of their own. A Deferred settles exactly once, as
 * fulfilled (value), failed (exception) or cancelled (CancelledError).
 *
 * Example:
 *   Promise<Product> promise;
 *   auto pending = promise.deferred();
 *   pending.on_settled([](const Deferred<Product>& d) {
 *       if (d.settlement() == Settlement::Fulfilled) use(d.get());
 *   });
 *   promise.resolve(product);
 */
template<typename T>
class Deferred {
public:
    using value_type = T;
    using Continuation = std::function<void(const Deferred<T>&)>;

    /**
     * An empty handle; valid() is false.
     */
    Deferred() = default;

    bool valid() const { return state_ != nullptr; }

    Settlement settlement() const {
        std::lock_guard<std::mutex> lock(checked_state().mutex);
        return state_->settlement;
    }

    bool is_ready() const { return settlement() != Settlement::Pending; }

    /**
     * Run the continuation once the operation settles. When it has already
     * settled the continuation runs immediately on the calling thread;
     * otherwise it runs on the thread that settles the promise.
     */
    void on_settled(Continuation continuation) const {
        auto state = state_;
        auto& s = checked_state();
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            if (s.settlement == Settlement::Pending) {
                s.continuations.push_back([state, continuation = std::move(continuation)]() {
                    continuation(Deferred<T>(state));
                });
                return;
            }
        }
        continuation(*this);
    }

    /**
     * Block until settled. The interception engine never calls this;
     * it exists for callers that choose to wait.
     */
    void wait() const {
        auto& s = checked_state();
        std::unique_lock<std::mutex> lock(s.mutex);
        s.settled.wait(lock, [&s] { return s.settlement != Settlement::Pending; });
    }

    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        auto& s = checked_state();
        std::unique_lock<std::mutex> lock(s.mutex);
        return s.settled.wait_for(lock, timeout,
                                  [&s] { return s.settlement != Settlement::Pending; });
    }

    /**
     * Wait for settlement and return the value.
     *
     * @throws the original exception if the operation failed
     * @throws CancelledError if the operation was cancelled
     */
    T get() const {
        wait();
        auto& s = checked_state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.settlement != Settlement::Fulfilled) {
            std::rethrow_exception(s.error);
        }
        if constexpr (std::is_void<T>::value) {
            return;
        } else {
            return *s.value;
        }
    }

    /**
     * The failure of a failed or cancelled operation, otherwise null.
     */
    std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(checked_state().mutex);
        return state_->error;
    }

private:
    friend class Promise<T>;

    explicit Deferred(std::shared_ptr<detail::DeferredState<T>> state)
        : state_(std::move(state)) {}

    detail::DeferredState<T>& checked_state() const {
        if (!state_) {
            throw PromiseError("Deferred has no associated promise");
        }
        return *state_;
    }

    std::shared_ptr<detail::DeferredState<T>> state_;
};

/**
 * Producer side of a Deferred.
 */
template<typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<detail::DeferredState<T>>()) {}

    Deferred<T> deferred() const { return Deferred<T>(state_); }

    template<typename U = T, std::enable_if_t<!std::is_void<U>::value, int> = 0>
    void resolve(U value) {
        require(try_resolve(std::move(value)));
    }

    template<typename U = T, std::enable_if_t<std::is_void<U>::value, int> = 0>
    void resolve() {
        require(try_resolve());
    }

    template<typename U = T, std::enable_if_t<!std::is_void<U>::value, int> = 0>
    bool try_resolve(U value) {
        return settle(Settlement::Fulfilled, detail::stored_t<T>(std::move(value)), nullptr);
    }

    template<typename U = T, std::enable_if_t<std::is_void<U>::value, int> = 0>
    bool try_resolve() {
        return settle(Settlement::Fulfilled, detail::Unit{}, nullptr);
    }

    /**
     * Settle as failed. A CancelledError settles as cancelled instead.
     */
    void fail(std::exception_ptr error) {
        require(try_fail(std::move(error)));
    }

    bool try_fail(std::exception_ptr error) {
        if (!error) {
            throw InvalidArgumentError("Promise::fail requires an exception");
        }
        auto settlement = is_cancellation(error) ? Settlement::Cancelled : Settlement::Failed;
        return settle(settlement, std::nullopt, std::move(error));
    }

    void cancel() {
        require(try_cancel());
    }

    bool try_cancel() {
        return settle(Settlement::Cancelled, std::nullopt,
                      std::make_exception_ptr(CancelledError()));
    }

private:
    static void require(bool settled) {
        if (!settled) {
            throw PromiseError("Promise already settled");
        }
    }

    bool settle(Settlement settlement, std::optional<detail::stored_t<T>> value,
                std::exception_ptr error) {
        std::vector<std::function<void()>> continuations;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->settlement != Settlement::Pending) return false;
            state_->settlement = settlement;
            state_->value = std::move(value);
            state_->error = std::move(error);
            continuations.swap(state_->continuations);
        }
        state_->settled.notify_all();
        run_continuations(continuations);
        return true;
    }

    /**
     * Run every continuation, even when one fails. Standard exceptions are
     * logged; the first exception of any other type is rethrown once all
     * continuations have run.
     */
    static void run_continuations(std::vector<std::function<void()>>& continuations) {
        std::exception_ptr unknown;
        for (auto& continuation : continuations) {
            try {
                continuation();
            } catch (const std::exception& e) {
                log_error("aspect.deferred", "continuation_failed", {{"error", e.what()}});
            } catch (...) {
                if (!unknown) unknown = std::current_exception();
            }
        }
        if (unknown) {
            std::rethrow_exception(unknown);
        }
    }

    std::shared_ptr<detail::DeferredState<T>> state_;
};

/**
 * A Deferred that is already fulfilled.
 */
template<typename T>
Deferred<T> make_ready_deferred(T value) {
    Promise<T> promise;
    promise.resolve(std::move(value));
    return promise.deferred();
}

inline Deferred<void> make_ready_deferred() {
    Promise<void> promise;
    promise.resolve();
    return promise.deferred();
}

/**
 * A Deferred that is already failed (or cancelled, for a CancelledError).
 */
template<typename T>
Deferred<T> make_failed_deferred(std::exception_ptr error) {
    Promise<T> promise;
    promise.fail(std::move(error));
    return promise.deferred();
}

template<typename T>
struct is_deferred : std::false_type {};

template<typename T>
struct is_deferred<Deferred<T>> : std::true_type {};

template<typename T>
constexpr bool is_deferred_v = is_deferred<T>::value;

/**
 * The value an operation produces: T for Deferred<T>, otherwise R itself.
 */
template<typename R>
struct settled_value {
    using type = R;
};

template<typename T>
struct settled_value<Deferred<T>> {
    using type = T;
};

template<typename R>
using settled_value_t = typename settled_value<R>::type;

/**
 * True if results of type R can be stored in a MethodCallContext:
 * void, or a copyable non-reference type.
 */
template<typename R>
constexpr bool is_storable_result_v =
    std::is_void<settled_value_t<R>>::value ||
    (!std::is_reference<settled_value_t<R>>::value &&
     std::is_copy_constructible<settled_value_t<R>>::value);

} // namespace aspect
