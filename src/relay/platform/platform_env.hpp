#pragma once

#include <string>

namespace platform {

// Value of an environment variable, or `fallback` when unset or empty.
std::string env_or(const char* name, const std::string& fallback = {});

// Directory the function package was unpacked into (LAMBDA_TASK_ROOT).
std::string task_root();

// host:port of the Lambda Runtime API, empty outside the sandbox.
std::string runtime_api();

} // namespace platform
