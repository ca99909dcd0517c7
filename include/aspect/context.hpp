#pragma once

#include <any>
#include <exception>
#include <map>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <vector>
#include "descriptor.hpp"
#include "errors.hpp"

namespace aspect {

/**
 * Per-invocation record shared by every interceptor of one call.
 *
 * Holds the (non-owning) target, the operation descriptor, a fixed-length
 * argument list, the result or exception once the call reaches a terminal
 * state, and a scratch item bag that lives exactly as long as the call.
 *
 * Arguments are stored as std::any copies of the declared parameter types
 * with references and cv-qualifiers removed. The real call reads them back
 * from the context, so changes made by BeforeInvoke hooks reach it.
 */
class MethodCallContext {
public:
    MethodCallContext(void* target, std::type_index target_type, MethodDescriptor method,
                      std::vector<std::any> arguments)
        : target_(target),
          target_type_(target_type),
          method_(std::move(method)),
          arguments_(std::move(arguments)) {}

    /**
     * Create a context for a call on interface I.
     */
    template<typename I>
    static MethodCallContext for_target(I* target, MethodDescriptor method,
                                        std::vector<std::any> arguments) {
        return MethodCallContext(static_cast<void*>(target), std::type_index(typeid(I)),
                                 std::move(method), std::move(arguments));
    }

    const MethodDescriptor& method() const { return method_; }

    /**
     * The interface the call was made through.
     */
    std::type_index target_type() const { return target_type_; }

    void* target() const { return target_; }

    /**
     * The target as interface I, or nullptr if the call targets another interface.
     */
    template<typename I>
    I* target_as() const {
        if (target_type_ != std::type_index(typeid(I))) return nullptr;
        return static_cast<I*>(target_);
    }

    std::size_t argument_count() const { return arguments_.size(); }

    const std::vector<std::any>& arguments() const { return arguments_; }

    /**
     * Typed access to an argument.
     *
     * @throws ArgumentOutOfRangeError if index >= argument_count()
     * @throws InvalidArgumentError if the argument is not a T
     */
    template<typename T>
    T& argument(std::size_t index) {
        return *checked_argument<T>(arguments_, index);
    }

    template<typename T>
    const T& argument(std::size_t index) const {
        return *checked_argument<const T>(arguments_, index);
    }

    /**
     * Replace an argument in place. The argument count and the argument's
     * type never change.
     *
     * @throws ArgumentOutOfRangeError if index >= argument_count()
     * @throws InvalidArgumentError if value is not of the stored argument's type
     */
    template<typename T>
    void set_argument(std::size_t index, T value) {
        if (index >= arguments_.size()) {
            throw ArgumentOutOfRangeError(index, arguments_.size());
        }
        if (arguments_[index].type() != typeid(T)) {
            throw InvalidArgumentError("argument " + std::to_string(index) + " of " +
                                       method_.full_name() + " is a " +
                                       arguments_[index].type().name() + ", cannot store a " +
                                       typeid(T).name());
        }
        arguments_[index] = std::move(value);
    }

    bool has_result() const { return result_.has_value(); }

    /**
     * The raw result. Empty until the call succeeds, and for void operations.
     */
    const std::any& result() const { return result_; }

    template<typename T>
    const T* result_as() const { return std::any_cast<T>(&result_); }

    /**
     * Record a successful outcome. Clears any stored exception.
     */
    void set_result(std::any result) {
        result_ = std::move(result);
        exception_ = nullptr;
        cancelled_ = false;
        completed_ = true;
    }

    bool has_exception() const { return exception_ != nullptr; }

    std::exception_ptr exception() const { return exception_; }

    /**
     * Record a failed (or cancelled) outcome. Clears any stored result.
     */
    void set_exception(std::exception_ptr error, bool cancelled = false) {
        exception_ = std::move(error);
        cancelled_ = cancelled;
        result_.reset();
        completed_ = true;
    }

    /**
     * True once set_result or set_exception has been called.
     */
    bool is_completed() const { return completed_; }

    bool is_cancelled() const { return cancelled_; }

    void set_item(const std::string& key, std::any value) {
        items_[key] = std::move(value);
    }

    bool has_item(const std::string& key) const { return items_.count(key) > 0; }

    /**
     * Item stored under key as a T, or nullptr if absent or of another type.
     */
    template<typename T>
    T* item(const std::string& key) {
        auto it = items_.find(key);
        return it == items_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    template<typename T>
    const T* item(const std::string& key) const {
        auto it = items_.find(key);
        return it == items_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    void erase_item(const std::string& key) { items_.erase(key); }

    const std::map<std::string, std::any>& items() const { return items_; }

    void add_hook_failure(InterceptorHookError failure) {
        hook_failures_.push_back(std::move(failure));
    }

    /**
     * Hook failures recovered during this call, in the order they occurred.
     */
    const std::vector<InterceptorHookError>& hook_failures() const { return hook_failures_; }

private:
    template<typename T, typename Args>
    static T* checked_argument(Args& arguments, std::size_t index) {
        if (index >= arguments.size()) {
            throw ArgumentOutOfRangeError(index, arguments.size());
        }
        auto* value = std::any_cast<std::remove_const_t<T>>(&arguments[index]);
        if (!value) {
            throw InvalidArgumentError("argument " + std::to_string(index) + " is a " +
                                       arguments[index].type().name() + ", not the requested type");
        }
        return value;
    }

    void* target_;
    std::type_index target_type_;
    MethodDescriptor method_;
    std::vector<std::any> arguments_;
    std::any result_;
    std::exception_ptr exception_;
    bool cancelled_ = false;
    bool completed_ = false;
    std::map<std::string, std::any> items_;
    std::vector<InterceptorHookError> hook_failures_;
};

} // namespace aspect
