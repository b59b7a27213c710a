#pragma once

#include "runtime_api.hpp"

#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Client for the Lambda Runtime API (2018-06-01) a custom runtime polls.
class RuntimeClient : public RuntimeApi {
public:
    // endpoint: host:port from AWS_LAMBDA_RUNTIME_API
    explicit RuntimeClient(const std::string& endpoint);
    ~RuntimeClient() override;

    RuntimeClient(const RuntimeClient&) = delete;
    RuntimeClient& operator=(const RuntimeClient&) = delete;

    // Blocks until the sandbox hands over the next event.
    std::expected<Invocation, std::string> next_invocation() override;

    std::expected<void, std::string>
        post_response(const std::string& request_id, const nlohmann::json& response) override;
    std::expected<void, std::string>
        post_error(const std::string& request_id, const InvocationError& error) override;

private:
    std::expected<void, std::string>
        post(const std::string& path, const std::string& body, const std::string& error_type);

    std::string base_url_;
};

// Header names are expected lower-cased.
InvocationContext context_from_headers(const std::map<std::string, std::string>& headers);

nlohmann::json error_document(const InvocationError& error);

// Headers for a POST to the Runtime API; error_type is empty for responses.
std::vector<std::string> request_headers(const std::string& error_type);

// Serialized body. Invalid UTF-8 (e.g. from whisper-cli stderr) is replaced.
std::string to_body(const nlohmann::json& doc);
