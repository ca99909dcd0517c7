#pragma once

#include <any>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <vector>
#include "config.hpp"
#include "context.hpp"
#include "deferred.hpp"
#include "errors.hpp"
#include "interceptor.hpp"
#include "registration.hpp"

namespace aspect {

/**
 * Interceptors applicable to one call, sorted ascending by order().
 */
using InterceptorList = std::vector<std::shared_ptr<Interceptor>>;

namespace detail {

/**
 * Run before_invoke ascending. The first failure propagates unchanged.
 */
void run_before(const InterceptorList& chain, MethodCallContext& context);

/**
 * Fold transform_result ascending over the stored result. Every output must
 * hold a value of result_type.
 *
 * @throws the hook's own exception, or InvalidArgumentError on a type change
 */
std::any run_transform(const InterceptorList& chain, MethodCallContext& context,
                       const std::type_info& result_type);

/**
 * Run after_invoke descending, notifying every interceptor even when one
 * fails. Failures are logged and recorded on the context; with strict set,
 * they are raised afterwards as one aggregated InterceptorHookError.
 */
void run_after(const InterceptorList& chain, MethodCallContext& context, bool strict);

/**
 * Store the failure on the context and run on_exception ascending on every
 * interceptor. Hook failures are logged and recorded, never raised.
 */
void run_failure(const InterceptorList& chain, MethodCallContext& context,
                 const std::exception_ptr& error);

} // namespace detail

/**
 * Runs the applicable interceptors around the real call.
 *
 * Algorithm for one call:
 *   1. resolve: union of interceptors of matching registrations, stable
 *      sorted ascending by order()
 *   2. before_invoke ascending; a failing hook fails the call and the real
 *      call is skipped
 *   3. proceed()
 *   4. success: store the result, fold transform_result ascending, run
 *      after_invoke descending, return the transformed result
 *   5. failure or cancellation: store the exception, run on_exception
 *      ascending on all interceptors, then re-raise the original failure
 *      (cancellation stays a CancelledError / a cancelled Deferred)
 *
 * Suspending operations return Deferred<T>. The executor attaches a
 * continuation and returns its own Deferred at once; it never waits.
 *
 * Registrations are fixed at construction, so a chain run never observes a
 * change in the applicable set.
 */
class ChainExecutor {
public:
    explicit ChainExecutor(std::vector<InterceptorRegistration> registrations = {},
                           InterceptionOptions options = InterceptionOptions())
        : registrations_(std::move(registrations)), options_(std::move(options)) {}

    /**
     * Applicable interceptors for an operation, in Before-phase order.
     * Registration order breaks ties between equal order() values.
     */
    InterceptorList resolve(const MethodDescriptor& method) const;

    const std::vector<InterceptorRegistration>& registrations() const { return registrations_; }

    /**
     * Options the executor was built with. It reads strict_after_hooks only;
     * the process-wide log level is set by InterceptionOptions::apply().
     */
    const InterceptionOptions& options() const { return options_; }

    /**
     * Resolve the chain for the context's operation and run an immediate call.
     * With no applicable interceptor, proceed runs directly.
     */
    template<typename R>
    R execute(MethodCallContext& context,
              const std::function<R(MethodCallContext&)>& proceed) const {
        auto chain = resolve(context.method());
        if (chain.empty()) {
            return proceed(context);
        }
        return run<R>(chain, context, proceed);
    }

    /**
     * Resolve the chain for the context's operation and run a suspending call.
     */
    template<typename T>
    Deferred<T> execute_deferred(std::shared_ptr<MethodCallContext> context,
                                 std::function<Deferred<T>(MethodCallContext&)> proceed) const {
        auto chain = resolve(context->method());
        if (chain.empty()) {
            return proceed(*context);
        }
        return run_deferred<T>(std::move(chain), std::move(context), std::move(proceed));
    }

    /**
     * Run an immediate call through an already resolved, non-empty chain.
     */
    template<typename R>
    R run(const InterceptorList& chain, MethodCallContext& context,
          const std::function<R(MethodCallContext&)>& proceed) const {
        static_assert(!std::is_reference<R>::value && is_storable_result_v<R>,
                      "results must be void or copyable values");
        std::exception_ptr failure;
        std::optional<detail::stored_t<R>> value;

        try {
            detail::run_before(chain, context);
            if constexpr (std::is_void<R>::value) {
                proceed(context);
                value.emplace();
            } else {
                value.emplace(proceed(context));
            }
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            detail::run_failure(chain, context, failure);
            std::rethrow_exception(failure);
        }

        if constexpr (std::is_void<R>::value) {
            context.set_result(std::any());
            detail::run_after(chain, context, options_.strict_after_hooks);
            return;
        } else {
            try {
                context.set_result(std::any(std::move(*value)));
                context.set_result(detail::run_transform(chain, context, typeid(R)));
            } catch (...) {
                failure = std::current_exception();
            }

            if (failure) {
                detail::run_failure(chain, context, failure);
                std::rethrow_exception(failure);
            }

            detail::run_after(chain, context, options_.strict_after_hooks);
            return std::any_cast<R>(context.result());
        }
    }

    /**
     * Run a suspending call through an already resolved, non-empty chain.
     *
     * The returned Deferred settles after the wrapped operation settles and
     * the After or Exception phase has run. The context and the chain are
     * kept alive by the continuation until then, and released afterwards.
     */
    template<typename T>
    Deferred<T> run_deferred(InterceptorList chain, std::shared_ptr<MethodCallContext> context,
                             std::function<Deferred<T>(MethodCallContext&)> proceed) const {
        static_assert(is_storable_result_v<T>, "results must be void or copyable values");
        Deferred<T> pending;
        try {
            detail::run_before(chain, *context);
            pending = proceed(*context);
            if (!pending.valid()) {
                throw InvalidArgumentError(context->method().full_name() +
                                           " returned an empty Deferred");
            }
        } catch (...) {
            auto failure = std::current_exception();
            detail::run_failure(chain, *context, failure);
            return make_failed_deferred<T>(failure);
        }

        Promise<T> promise;
        auto outcome = promise.deferred();
        bool strict = options_.strict_after_hooks;

        pending.on_settled([chain = std::move(chain), context = std::move(context), promise,
                            strict](const Deferred<T>& settled) mutable {
            if (settled.settlement() != Settlement::Fulfilled) {
                auto failure = settled.error();
                detail::run_failure(chain, *context, failure);
                promise.fail(failure);
                return;
            }
            settle_success(chain, *context, settled, promise, strict);
        });

        return outcome;
    }

private:
    template<typename T>
    static void settle_success(const InterceptorList& chain, MethodCallContext& context,
                               const Deferred<T>& settled, Promise<T>& promise, bool strict) {
        std::exception_ptr failure;
        try {
            if constexpr (std::is_void<T>::value) {
                context.set_result(std::any());
            } else {
                context.set_result(std::any(settled.get()));
                context.set_result(detail::run_transform(chain, context, typeid(T)));
            }
        } catch (...) {
            failure = std::current_exception();
        }

        if (failure) {
            detail::run_failure(chain, context, failure);
            promise.fail(failure);
            return;
        }

        try {
            detail::run_after(chain, context, strict);
        } catch (...) {
            promise.fail(std::current_exception());
            return;
        }

        if constexpr (std::is_void<T>::value) {
            promise.resolve();
        } else {
            promise.resolve(std::any_cast<T>(context.result()));
        }
    }

    std::vector<InterceptorRegistration> registrations_;
    InterceptionOptions options_;
};

} // namespace aspect
