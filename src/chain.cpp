#include "aspect/chain.hpp"

#include <algorithm>
#include "aspect/logging.hpp"

namespace aspect {

namespace {

constexpr const char* kDomain = "aspect.chain";

InterceptorHookError record_hook_failure(MethodCallContext& context, const Interceptor& interceptor,
                                         const char* hook, std::exception_ptr error) {
    InterceptorHookError failure(interceptor.name(), hook, std::move(error));
    context.add_hook_failure(failure);
    return failure;
}

} // namespace

InterceptorList ChainExecutor::resolve(const MethodDescriptor& method) const {
    InterceptorList chain;
    for (const auto& registration : registrations_) {
        if (!registration.matches(method)) continue;
        chain.insert(chain.end(), registration.interceptors().begin(),
                     registration.interceptors().end());
    }
    std::stable_sort(chain.begin(), chain.end(),
                     [](const std::shared_ptr<Interceptor>& a, const std::shared_ptr<Interceptor>& b) {
                         return a->order() < b->order();
                     });
    return chain;
}

namespace detail {

void run_before(const InterceptorList& chain, MethodCallContext& context) {
    for (const auto& interceptor : chain) {
        try {
            interceptor->before_invoke(context);
        } catch (const std::exception& e) {
            log_warn(kDomain, "before_invoke_failed",
                     {{"method", context.method().full_name()},
                      {"interceptor", interceptor->name()},
                      {"error", e.what()}});
            throw;
        }
    }
}

std::any run_transform(const InterceptorList& chain, MethodCallContext& context,
                       const std::type_info& result_type) {
    std::any output = context.result();
    for (const auto& interceptor : chain) {
        output = interceptor->transform_result(context, std::move(output));
        if (output.type() != result_type) {
            throw InvalidArgumentError("interceptor '" + interceptor->name() +
                                       "' changed the result type of " +
                                       context.method().full_name());
        }
    }
    return output;
}

void run_after(const InterceptorList& chain, MethodCallContext& context, bool strict) {
    std::vector<InterceptorHookError> failures;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const auto& interceptor = *it;
        try {
            interceptor->after_invoke(context);
        } catch (...) {
            auto failure = record_hook_failure(context, *interceptor, "after_invoke",
                                               std::current_exception());
            log_error(kDomain, "after_invoke_failed",
                      {{"method", context.method().full_name()},
                       {"interceptor", interceptor->name()},
                       {"error", failure.what()}});
            failures.push_back(std::move(failure));
        }
    }

    if (strict && !failures.empty()) {
        throw InterceptorHookError(std::move(failures));
    }
}

void run_failure(const InterceptorList& chain, MethodCallContext& context,
                 const std::exception_ptr& error) {
    bool cancelled = is_cancellation(error);
    context.set_exception(error, cancelled);

    for (const auto& interceptor : chain) {
        try {
            interceptor->on_exception(context);
        } catch (...) {
            auto failure = record_hook_failure(context, *interceptor, "on_exception",
                                               std::current_exception());
            log_error(kDomain, "on_exception_failed",
                      {{"method", context.method().full_name()},
                       {"interceptor", interceptor->name()},
                       {"error", failure.what()}});
        }
    }
}

} // namespace detail
} // namespace aspect
