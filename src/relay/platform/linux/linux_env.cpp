#include "platform/platform_env.hpp"

#include <cstdlib>

namespace platform {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return fallback;
    return value;
}

std::string task_root() {
    return env_or("LAMBDA_TASK_ROOT", ".");
}

std::string runtime_api() {
    return env_or("AWS_LAMBDA_RUNTIME_API");
}

} // namespace platform
