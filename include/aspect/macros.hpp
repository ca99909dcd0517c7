#pragma once

/**
 * Macros for declaring forwarding proxies.
 *
 * A proxy class derives from aspect::Proxy<Interface>, declares itself with
 * ASPECT_PROXY, and overrides every operation with a one-line ASPECT_FORWARD.
 * ASPECT_DECLARE_PROXY then lets make_proxy<Interface> find the class.
 *
 * Usage:
 *   class Greeter {
 *   public:
 *       virtual ~Greeter() = default;
 *       virtual std::string greet(const std::string& name) = 0;
 *       virtual aspect::Deferred<int> count(aspect::CancellationToken token) = 0;
 *   };
 *
 *   class GreeterProxy : public aspect::Proxy<Greeter> {
 *   public:
 *       ASPECT_PROXY(GreeterProxy, Greeter)
 *
 *       std::string greet(const std::string& name) override {
 *           return ASPECT_FORWARD(greet)(name);
 *       }
 *
 *       aspect::Deferred<int> count(aspect::CancellationToken token) override {
 *           return ASPECT_FORWARD(count)(token);
 *       }
 *   };
 *
 *   ASPECT_DECLARE_PROXY(Greeter, GreeterProxy)
 */

// Service name reported in MethodDescriptor::service
#define ASPECT_SERVICE_NAME(Interface) #Interface

/**
 * Declare the constructor make_proxy uses.
 * Must be in public section of class.
 */
#define ASPECT_PROXY(ProxyClass, Interface) \
    static constexpr const char* kService = ASPECT_SERVICE_NAME(Interface); \
    ProxyClass(std::shared_ptr<Interface> target, \
               std::shared_ptr<const ::aspect::ChainExecutor> executor) \
        : ::aspect::Proxy<Interface>(std::move(target), std::move(executor), kService) {}

/**
 * Forward an operation through the interceptor chain.
 * Expands to a callable; apply it to the operation's arguments.
 * The operation must not be overloaded on the interface.
 */
#define ASPECT_FORWARD(method) \
    this->forward(#method, &std::remove_pointer_t<decltype(this)>::proxied_interface::method)

/**
 * Register ProxyClass as the proxy for Interface.
 * Must be used at global namespace scope with fully qualified names.
 */
#define ASPECT_DECLARE_PROXY(Interface, ProxyClass) \
    namespace aspect { \
    template<> \
    struct proxy_traits<Interface> { \
        using type = ProxyClass; \
    }; \
    }
