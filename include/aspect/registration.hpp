#pragma once

#include <memory>
#include <vector>
#include "descriptor.hpp"
#include "errors.hpp"
#include "interceptor.hpp"

namespace aspect {

/**
 * Binds a set of interceptors to a method filter.
 *
 * Several registrations may target one proxy. For each call, the applicable
 * interceptors are the union of every registration whose filter matches,
 * stable-sorted by order(). The default filter matches every operation.
 *
 * Example:
 *   InterceptorRegistration removals;
 *   removals.add_interceptor(audit)
 *           .with_method_filter(filters::named("remove"));
 */
class InterceptorRegistration {
public:
    InterceptorRegistration() : filter_(filters::all()) {}

    /**
     * @throws InvalidArgumentError if interceptor is null
     */
    InterceptorRegistration& add_interceptor(std::shared_ptr<Interceptor> interceptor) {
        if (!interceptor) {
            throw InvalidArgumentError("interceptor must not be null");
        }
        interceptors_.push_back(std::move(interceptor));
        return *this;
    }

    /**
     * Restrict this registration to operations accepted by the filter.
     * A null filter restores match-all.
     */
    InterceptorRegistration& with_method_filter(MethodFilter filter) {
        filter_ = filter ? std::move(filter) : filters::all();
        return *this;
    }

    bool matches(const MethodDescriptor& method) const { return filter_(method); }

    const std::vector<std::shared_ptr<Interceptor>>& interceptors() const { return interceptors_; }

    bool empty() const { return interceptors_.empty(); }

private:
    std::vector<std::shared_ptr<Interceptor>> interceptors_;
    MethodFilter filter_;
};

} // namespace aspect
