#pragma once

#include "invocation.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// The calls a custom runtime makes against the sandbox.
class RuntimeApi {
public:
    virtual ~RuntimeApi() = default;

    virtual std::expected<Invocation, std::string> next_invocation() = 0;
    virtual std::expected<void, std::string>
        post_response(const std::string& request_id, const nlohmann::json& response) = 0;
    virtual std::expected<void, std::string>
        post_error(const std::string& request_id, const InvocationError& error) = 0;
};
