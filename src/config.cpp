#include "aspect/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace aspect {

std::string env_or(const std::string& env_var, const std::string& fallback) {
    const char* value = std::getenv(env_var.c_str());
    return value ? value : fallback;
}

bool parse_flag(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

InterceptionOptions InterceptionOptions::from_env() {
    InterceptionOptions options;
    options.log_level = parse_log_level(env_or("ASPECT_LOG_LEVEL", "info"), LogLevel::Info);
    options.strict_after_hooks = parse_flag(env_or("ASPECT_STRICT_AFTER_HOOKS", "0"));

    auto actor = env_or("ASPECT_DEFAULT_ACTOR", "");
    if (!actor.empty()) {
        options.default_actor = actor;
    }
    return options;
}

void InterceptionOptions::apply() const {
    set_log_level(log_level);
}

} // namespace aspect
