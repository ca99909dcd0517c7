#pragma once

#include <string>
#include "logging.hpp"

namespace aspect {

/**
 * Process-level settings for the interception engine.
 *
 * Production deployments configure the engine through environment
 * variables so the same binary runs unchanged in every environment:
 *
 *   ASPECT_LOG_LEVEL           debug | info | warn | error   (default info)
 *   ASPECT_STRICT_AFTER_HOOKS  1 | true | yes               (default off)
 *   ASPECT_DEFAULT_ACTOR       actor recorded in history    (default System)
 */
struct InterceptionOptions {
    /**
     * Minimum level of emitted log entries. Takes effect through apply(),
     * never through an executor or builder holding the options.
     */
    LogLevel log_level = LogLevel::Info;

    /**
     * When set, failures of AfterInvoke hooks are raised to the caller as
     * one aggregated InterceptorHookError once every After hook has run.
     * Otherwise they are logged and recorded on the call context only.
     */
    bool strict_after_hooks = false;

    std::string default_actor = "System";

    /**
     * Read options from the environment, falling back to defaults.
     */
    static InterceptionOptions from_env();

    /**
     * Apply process-wide settings (currently the log level).
     */
    void apply() const;
};

/**
 * Read an environment variable, returning the fallback when it is unset.
 */
std::string env_or(const std::string& env_var, const std::string& fallback);

/**
 * Interpret "1", "true", "yes" and "on" (case-insensitive) as true.
 */
bool parse_flag(const std::string& value);

} // namespace aspect
