#pragma once

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "chain.hpp"
#include "config.hpp"
#include "context.hpp"
#include "deferred.hpp"
#include "descriptor.hpp"
#include "errors.hpp"
#include "registration.hpp"

namespace aspect {

/**
 * Maps an interface to the proxy class that forwards it.
 * Specialized by ASPECT_DECLARE_PROXY, or by hand for class templates.
 */
template<typename Interface>
struct proxy_traits;

/**
 * Base class for forwarding proxies.
 *
 * A proxy implements Interface by packaging every call into a
 * MethodCallContext and handing it to the ChainExecutor, with a proceed
 * callback that invokes the same operation on the target. Operations that
 * return Deferred<T> run through the suspending path; everything else runs
 * through the immediate path. Callers cannot tell a proxy from the target
 * except by interceptor side effects.
 *
 * Arguments are copied into the context as their decayed parameter types.
 * Non-const lvalue reference parameters are rejected at compile time, since
 * writes through them would land in the context copy. Results are stored the
 * same way, so operations returning references or move-only types are
 * rejected too.
 *
 * Usage (see macros.hpp):
 *   class GreeterProxy : public aspect::Proxy<Greeter> {
 *   public:
 *       ASPECT_PROXY(GreeterProxy, Greeter)
 *
 *       std::string greet(const std::string& name) override {
 *           return ASPECT_FORWARD(greet)(name);
 *       }
 *   };
 *   ASPECT_DECLARE_PROXY(Greeter, GreeterProxy)
 */
template<typename Interface>
class Proxy : public Interface {
public:
    using proxied_interface = Interface;

    /**
     * @throws InvalidArgumentError if target or executor is null
     */
    Proxy(std::shared_ptr<Interface> target, std::shared_ptr<const ChainExecutor> executor,
          std::string service)
        : target_(std::move(target)), executor_(std::move(executor)), service_(std::move(service)) {
        if (!target_) {
            throw InvalidArgumentError("proxy for " + service_ + " requires a target instance");
        }
        if (!executor_) {
            throw InvalidArgumentError("proxy for " + service_ + " requires a chain executor");
        }
    }

    const std::shared_ptr<Interface>& target() const { return target_; }

    const std::shared_ptr<const ChainExecutor>& executor() const { return executor_; }

    const std::string& service() const { return service_; }

protected:
    /**
     * Bind an operation of Interface; the returned callable forwards its
     * arguments through the chain.
     */
    template<typename R, typename... Params>
    auto forward(const char* name, R (Interface::*method)(Params...)) {
        return [this, name, method](auto&&... args) -> R {
            return this->template invoke<R, Params...>(name, method, std::forward<decltype(args)>(args)...);
        };
    }

    template<typename R, typename... Params>
    auto forward(const char* name, R (Interface::*method)(Params...) const) const {
        return [this, name, method](auto&&... args) -> R {
            return this->template invoke<R, Params...>(name, method, std::forward<decltype(args)>(args)...);
        };
    }

private:
    template<typename Param>
    using stored_param_t = std::decay_t<Param>;

    template<typename Param>
    static constexpr bool is_out_param_v =
        std::is_lvalue_reference<Param>::value &&
        !std::is_const<std::remove_reference_t<Param>>::value;

    template<typename Param>
    static decltype(auto) pass(stored_param_t<Param>& value) {
        if constexpr (std::is_rvalue_reference<Param>::value) {
            return std::move(value);
        } else {
            return (value);
        }
    }

    template<typename R, typename... Params, typename Method, std::size_t... I>
    static R call_with_arguments(Interface* target, Method method, MethodCallContext& context,
                                 std::index_sequence<I...>) {
        return (target->*method)(
            pass<Params>(context.argument<stored_param_t<Params>>(I))...);
    }

    template<typename R, typename... Params, typename Method, typename... Args>
    R invoke(const char* name, Method method, Args&&... args) const {
        static_assert(sizeof...(Params) == sizeof...(Args), "argument count mismatch");
        static_assert(!(is_out_param_v<Params> || ...),
                      "intercepted operations cannot take non-const lvalue references");
        static_assert(!std::is_reference<R>::value && is_storable_result_v<R>,
                      "intercepted operations must return void or a copyable value "
                      "(or a Deferred of one), not a reference or a move-only type");

        MethodDescriptor descriptor{service_, name, sizeof...(Params),
                                    is_deferred_v<R> ? CallKind::Suspending : CallKind::Immediate};
        Interface* target = target_.get();

        auto chain = executor_->resolve(descriptor);
        if (chain.empty()) {
            return (target->*method)(std::forward<Args>(args)...);
        }

        std::vector<std::any> arguments{
            std::any(stored_param_t<Params>(std::forward<Args>(args)))...};
        std::function<R(MethodCallContext&)> proceed = [target, method](MethodCallContext& context) -> R {
            return call_with_arguments<R, Params...>(target, method, context,
                                                     std::index_sequence_for<Params...>{});
        };

        if constexpr (is_deferred_v<R>) {
            using T = typename R::value_type;
            auto context = std::make_shared<MethodCallContext>(
                MethodCallContext::for_target(target, std::move(descriptor), std::move(arguments)));
            return executor_->template run_deferred<T>(std::move(chain), std::move(context),
                                                       std::move(proceed));
        } else {
            auto context = MethodCallContext::for_target(target, std::move(descriptor),
                                                         std::move(arguments));
            return executor_->template run<R>(chain, context, proceed);
        }
    }

    std::shared_ptr<Interface> target_;
    std::shared_ptr<const ChainExecutor> executor_;
    std::string service_;
};

/**
 * Create a proxy for target that routes every call through executor.
 *
 * @throws InvalidArgumentError if target or executor is null
 */
template<typename Interface>
std::shared_ptr<Interface> make_proxy(std::shared_ptr<Interface> target,
                                      std::shared_ptr<const ChainExecutor> executor) {
    using ProxyType = typename proxy_traits<Interface>::type;
    return std::make_shared<ProxyType>(std::move(target), std::move(executor));
}

/**
 * Create a proxy for target with its own executor over registrations.
 *
 * @throws InvalidArgumentError if target is null
 */
template<typename Interface>
std::shared_ptr<Interface> make_proxy(std::shared_ptr<Interface> target,
                                      std::vector<InterceptorRegistration> registrations,
                                      InterceptionOptions options = InterceptionOptions()) {
    auto executor = std::make_shared<const ChainExecutor>(std::move(registrations),
                                                          std::move(options));
    return make_proxy<Interface>(std::move(target), std::move(executor));
}

} // namespace aspect
