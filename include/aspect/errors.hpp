#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>

namespace aspect {

/**
 * Base exception for all errors raised by the interception library.
 */
class AspectError : public std::runtime_error {
public:
    explicit AspectError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if an argument index was past the argument count.
     */
    virtual bool is_out_of_range() const { return false; }

    /**
     * Returns true if the operation was cancelled.
     */
    virtual bool is_cancelled() const { return false; }

    /**
     * Returns true if an interceptor hook failed.
     */
    virtual bool is_hook_failure() const { return false; }

    /**
     * Returns true if an entity could not be found.
     */
    virtual bool is_not_found() const { return false; }
};

/**
 * Thrown when a required argument is missing or has the wrong type.
 */
class InvalidArgumentError : public AspectError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : AspectError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when a call argument is requested past the argument count.
 */
class ArgumentOutOfRangeError : public AspectError {
public:
    ArgumentOutOfRangeError(std::size_t index, std::size_t count)
        : AspectError("argument index " + std::to_string(index) +
                      " out of range for " + std::to_string(count) + " argument(s)"),
          index_(index), count_(count) {}

    std::size_t index() const { return index_; }
    std::size_t count() const { return count_; }

    bool is_out_of_range() const override { return true; }

private:
    std::size_t index_;
    std::size_t count_;
};

/**
 * Signals that an operation was cancelled before it settled.
 *
 * Propagated distinctly from other failures: callers catch CancelledError
 * to tell "I cancelled this" apart from "this failed".
 */
class CancelledError : public AspectError {
public:
    explicit CancelledError(const std::string& message = "operation cancelled")
        : AspectError(message) {}

    bool is_cancelled() const override { return true; }
};

/**
 * Thrown when a Promise is settled twice or an unsettled Deferred is read.
 */
class PromiseError : public AspectError {
public:
    explicit PromiseError(const std::string& message)
        : AspectError(message) {}
};

/**
 * An interceptor hook raised an exception.
 *
 * Carries the interceptor and hook names plus the original exception.
 * Hook failures are recorded on the call context and logged; they never
 * replace the failure of the real operation.
 */
class InterceptorHookError : public AspectError {
public:
    InterceptorHookError(const std::string& interceptor, const std::string& hook,
                         std::exception_ptr cause)
        : AspectError(describe(interceptor, hook, cause)),
          interceptor_(interceptor), hook_(hook), cause_(std::move(cause)) {}

    /**
     * Aggregate several hook failures into one error.
     */
    explicit InterceptorHookError(std::vector<InterceptorHookError> failures)
        : AspectError(describe_all(failures)), failures_(std::move(failures)) {}

    const std::string& interceptor() const { return interceptor_; }
    const std::string& hook() const { return hook_; }
    std::exception_ptr cause() const { return cause_; }

    /**
     * Individual failures when this error aggregates several.
     */
    const std::vector<InterceptorHookError>& failures() const { return failures_; }

    bool is_hook_failure() const override { return true; }

    /**
     * Extract the message of an exception_ptr, if it holds a std::exception.
     */
    static std::string message_of(const std::exception_ptr& error) {
        if (!error) return "";
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

private:
    static std::string describe(const std::string& interceptor, const std::string& hook,
                                const std::exception_ptr& cause) {
        return "interceptor '" + interceptor + "' failed in " + hook + ": " + message_of(cause);
    }

    static std::string describe_all(const std::vector<InterceptorHookError>& failures) {
        std::string message = std::to_string(failures.size()) + " interceptor hook(s) failed";
        for (const auto& failure : failures) {
            message += "; ";
            message += failure.what();
        }
        return message;
    }

    std::string interceptor_;
    std::string hook_;
    std::exception_ptr cause_;
    std::vector<InterceptorHookError> failures_;
};

/**
 * Thrown by repositories when the requested entity does not exist.
 */
class EntityNotFoundError : public AspectError {
public:
    explicit EntityNotFoundError(const std::string& message)
        : AspectError(message) {}

    bool is_not_found() const override { return true; }
};

/**
 * Thrown by repositories when an entity with the same id already exists.
 */
class DuplicateEntityError : public AspectError {
public:
    explicit DuplicateEntityError(const std::string& message)
        : AspectError(message) {}
};

/**
 * Map a failure to a gRPC status.
 *
 * Hosts that expose proxied services over RPC use this to translate the
 * failure of an intercepted call. A null pointer maps to OK.
 */
grpc::Status to_grpc_status(const std::exception_ptr& error);

} // namespace aspect
