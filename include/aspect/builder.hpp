#pragma once

#include <memory>
#include <vector>
#include "chain.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "interceptor.hpp"
#include "proxy.hpp"
#include "registration.hpp"

namespace aspect {

template<typename Interface> class InterceptorGroup;

/**
 * Fluent builder for intercepted proxies.
 *
 * Each add_interceptor call creates its own registration; groups share one
 * method filter between several interceptors.
 *
 * Example:
 *   auto repository = InterceptorBuilder<Repository<Product>>()
 *       .add_interceptor(logging)
 *       .create_group()
 *           .add_interceptor(history)
 *           .with_method_filter(filters::any_of({"add", "update", "remove"}))
 *       .end_group()
 *       .build(std::make_shared<InMemoryRepository<Product>>());
 */
template<typename Interface>
class InterceptorBuilder {
public:
    InterceptorBuilder() : options_(InterceptionOptions()) {}

    /**
     * Register an interceptor for every operation of the interface.
     *
     * @throws InvalidArgumentError if interceptor is null
     */
    InterceptorBuilder& add_interceptor(std::shared_ptr<Interceptor> interceptor) {
        InterceptorRegistration registration;
        registration.add_interceptor(std::move(interceptor));
        registrations_.push_back(std::move(registration));
        return *this;
    }

    /**
     * Register an interceptor for operations matching the filter.
     *
     * @throws InvalidArgumentError if interceptor is null
     */
    InterceptorBuilder& add_interceptor(std::shared_ptr<Interceptor> interceptor,
                                        MethodFilter filter) {
        InterceptorRegistration registration;
        registration.add_interceptor(std::move(interceptor))
            .with_method_filter(std::move(filter));
        registrations_.push_back(std::move(registration));
        return *this;
    }

    /**
     * Start a registration shared by several interceptors.
     */
    InterceptorGroup<Interface> create_group() {
        registrations_.emplace_back();
        return InterceptorGroup<Interface>(*this, registrations_.size() - 1);
    }

    /**
     * Options for proxies built from now on. Only strict_after_hooks changes
     * proxy behavior; log_level takes effect through
     * InterceptionOptions::apply() and default_actor through the
     * UserContextAccessor given to a HistoryInterceptor.
     */
    InterceptorBuilder& with_options(InterceptionOptions options) {
        options_ = std::move(options);
        return *this;
    }

    const std::vector<InterceptorRegistration>& registrations() const { return registrations_; }

    const InterceptionOptions& options() const { return options_; }

    /**
     * Wrap target in a proxy over the registrations collected so far.
     * The builder can be reused; later changes do not affect built proxies.
     *
     * @throws InvalidArgumentError if target is null
     */
    std::shared_ptr<Interface> build(std::shared_ptr<Interface> target) const {
        return make_proxy<Interface>(std::move(target), registrations_, options_);
    }

private:
    friend class InterceptorGroup<Interface>;

    std::vector<InterceptorRegistration> registrations_;
    InterceptionOptions options_;
};

/**
 * One registration under construction, returned by
 * InterceptorBuilder::create_group(). end_group() returns to the builder.
 */
template<typename Interface>
class InterceptorGroup {
public:
    InterceptorGroup(InterceptorBuilder<Interface>& builder, std::size_t index)
        : builder_(builder), index_(index) {}

    InterceptorGroup& add_interceptor(std::shared_ptr<Interceptor> interceptor) {
        registration().add_interceptor(std::move(interceptor));
        return *this;
    }

    InterceptorGroup& with_method_filter(MethodFilter filter) {
        registration().with_method_filter(std::move(filter));
        return *this;
    }

    InterceptorBuilder<Interface>& end_group() { return builder_; }

private:
    InterceptorRegistration& registration() { return builder_.registrations_[index_]; }

    InterceptorBuilder<Interface>& builder_;
    std::size_t index_;
};

} // namespace aspect
