#pragma once

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

namespace aspect {

/**
 * How an operation completes.
 */
enum class CallKind {
    Immediate,   // returns its value (or throws) before the call returns
    Suspending,  // returns a Deferred that settles later
};

/**
 * Describes one operation of an intercepted interface.
 * Method filters and log entries identify calls by this descriptor.
 */
struct MethodDescriptor {
    std::string service;
    std::string name;
    std::size_t arity = 0;
    CallKind kind = CallKind::Immediate;

    std::string full_name() const { return service + "." + name; }

    bool is_suspending() const { return kind == CallKind::Suspending; }
};

/**
 * Decides whether a registration applies to an operation.
 */
using MethodFilter = std::function<bool(const MethodDescriptor&)>;

namespace filters {

inline MethodFilter all() {
    return [](const MethodDescriptor&) { return true; };
}

inline MethodFilter named(const std::string& name) {
    return [name](const MethodDescriptor& method) { return method.name == name; };
}

inline MethodFilter any_of(std::vector<std::string> names) {
    return [names = std::move(names)](const MethodDescriptor& method) {
        return std::find(names.begin(), names.end(), method.name) != names.end();
    };
}

inline MethodFilter none_of(std::vector<std::string> names) {
    return [names = std::move(names)](const MethodDescriptor& method) {
        return std::find(names.begin(), names.end(), method.name) == names.end();
    };
}

inline MethodFilter suspending() {
    return [](const MethodDescriptor& method) { return method.is_suspending(); };
}

} // namespace filters
} // namespace aspect
