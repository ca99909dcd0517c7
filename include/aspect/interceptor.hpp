#pragma once

#include <any>
#include <functional>
#include <string>
#include "context.hpp"

namespace aspect {

/**
 * A unit of cross-cutting behavior plugged into the call chain.
 *
 * Hooks, in logical call order:
 *   before_invoke     observe or mutate arguments before the real call
 *   transform_result  layer onto the previous interceptor's output
 *   after_invoke      observe the successful context (result already transformed)
 *   on_exception      observe a failure or cancellation; cannot suppress it
 *
 * order() positions the interceptor: ascending in the Before phase and in
 * the transform pipeline, descending in the After phase.
 *
 * Interceptors are shared by every call routed through a proxy, possibly on
 * several threads at once. Keep per-call state in MethodCallContext::items
 * and synchronize anything else yourself.
 */
class Interceptor {
public:
    virtual ~Interceptor() = default;

    virtual int order() const = 0;

    /**
     * Name used in log entries and hook failure reports.
     */
    virtual std::string name() const = 0;

    virtual void before_invoke(MethodCallContext& context) = 0;

    virtual void after_invoke(MethodCallContext& context) = 0;

    virtual void on_exception(MethodCallContext& context) = 0;

    virtual std::any transform_result(MethodCallContext& context, std::any previous) = 0;
};

/**
 * Interceptor with no-op hooks. Derive and override what you need.
 */
class InterceptorBase : public Interceptor {
public:
    explicit InterceptorBase(int order = 0, std::string name = "interceptor")
        : order_(order), name_(std::move(name)) {}

    int order() const override { return order_; }
    std::string name() const override { return name_; }

    void set_order(int order) { order_ = order; }

    void before_invoke(MethodCallContext&) override {}
    void after_invoke(MethodCallContext&) override {}
    void on_exception(MethodCallContext&) override {}

    std::any transform_result(MethodCallContext&, std::any previous) override {
        return previous;
    }

private:
    int order_;
    std::string name_;
};

/**
 * Interceptor assembled from callables (functional pattern).
 *
 * Example:
 *   auto timing = std::make_shared<FunctionInterceptor>("timing", 5);
 *   timing->on_before([](MethodCallContext& ctx) { ctx.set_item("t0", clock::now()); })
 *         .on_after([](MethodCallContext& ctx) { report(ctx); });
 */
class FunctionInterceptor : public InterceptorBase {
public:
    using Hook = std::function<void(MethodCallContext&)>;
    using Transform = std::function<std::any(MethodCallContext&, std::any)>;

    explicit FunctionInterceptor(std::string name, int order = 0)
        : InterceptorBase(order, std::move(name)) {}

    FunctionInterceptor& on_before(Hook hook) {
        before_ = std::move(hook);
        return *this;
    }

    FunctionInterceptor& on_after(Hook hook) {
        after_ = std::move(hook);
        return *this;
    }

    FunctionInterceptor& on_failure(Hook hook) {
        exception_ = std::move(hook);
        return *this;
    }

    FunctionInterceptor& on_transform(Transform transform) {
        transform_ = std::move(transform);
        return *this;
    }

    void before_invoke(MethodCallContext& context) override {
        if (before_) before_(context);
    }

    void after_invoke(MethodCallContext& context) override {
        if (after_) after_(context);
    }

    void on_exception(MethodCallContext& context) override {
        if (exception_) exception_(context);
    }

    std::any transform_result(MethodCallContext& context, std::any previous) override {
        return transform_ ? transform_(context, std::move(previous)) : previous;
    }

private:
    Hook before_;
    Hook after_;
    Hook exception_;
    Transform transform_;
};

} // namespace aspect
