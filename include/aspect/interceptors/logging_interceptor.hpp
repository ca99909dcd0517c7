#pragma once

#include <string>
#include "aspect/interceptor.hpp"
#include "aspect/logging.hpp"

namespace aspect {
namespace interceptors {

/**
 * Logs each intercepted call with its elapsed time.
 *
 * Start is logged at debug, success at info, cancellation at warn and
 * failure at error. The start time lives in the call's items, so one
 * instance can serve concurrent calls.
 */
class LoggingInterceptor : public InterceptorBase {
public:
    static constexpr const char* kStartedAtKey = "logging.started_at";

    explicit LoggingInterceptor(int order = 0, std::string domain = "aspect.calls")
        : InterceptorBase(order, "logging"), domain_(std::move(domain)) {}

    void before_invoke(MethodCallContext& context) override;

    void after_invoke(MethodCallContext& context) override;

    void on_exception(MethodCallContext& context) override;

    const std::string& domain() const { return domain_; }

private:
    double elapsed_ms(const MethodCallContext& context) const;

    std::string domain_;
};

} // namespace interceptors
} // namespace aspect
