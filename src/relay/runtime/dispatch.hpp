#pragma once

#include "runtime_api.hpp"

#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

using InvocationHandler = std::function<std::expected<nlohmann::json, InvocationError>(
    const nlohmann::json& event, const InvocationContext& context)>;

// Runs one invocation and posts its outcome. A payload that is not JSON is
// posted as an InvalidEvent error without calling the handler. The returned
// error means the Runtime API itself could not be reached.
std::expected<void, std::string>
dispatch_invocation(RuntimeApi& api, const Invocation& invocation,
                    const InvocationHandler& handler);
