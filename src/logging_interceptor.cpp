#include "aspect/interceptors/logging_interceptor.hpp"

#include <chrono>
#include "aspect/errors.hpp"

namespace aspect {
namespace interceptors {

namespace {

using SteadyClock = std::chrono::steady_clock;

} // namespace

void LoggingInterceptor::before_invoke(MethodCallContext& context) {
    context.set_item(kStartedAtKey, SteadyClock::now());
    log_debug(domain_, "call_started",
              {{"method", context.method().full_name()},
               {"arguments", context.argument_count()}});
}

void LoggingInterceptor::after_invoke(MethodCallContext& context) {
    log_info(domain_, "call_succeeded",
             {{"method", context.method().full_name()},
              {"elapsed_ms", elapsed_ms(context)}});
}

void LoggingInterceptor::on_exception(MethodCallContext& context) {
    if (context.is_cancelled()) {
        log_warn(domain_, "call_cancelled",
                 {{"method", context.method().full_name()},
                  {"elapsed_ms", elapsed_ms(context)}});
        return;
    }
    log_error(domain_, "call_failed",
              {{"method", context.method().full_name()},
               {"elapsed_ms", elapsed_ms(context)},
               {"error", InterceptorHookError::message_of(context.exception())}});
}

double LoggingInterceptor::elapsed_ms(const MethodCallContext& context) const {
    const auto* started = context.item<SteadyClock::time_point>(kStartedAtKey);
    if (!started) return 0.0;
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - *started).count();
}

} // namespace interceptors
} // namespace aspect
