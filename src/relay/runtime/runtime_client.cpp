#include "runtime_client.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <format>
#include <stdexcept>

namespace {

constexpr const char* kApiVersion = "2018-06-01";

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    size_t len = size * nitems;
    std::string line(buffer, len);

    auto colon = line.find(':');
    if (colon == std::string::npos) return len;

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto start = line.find_first_not_of(" \t", colon + 1);
    auto end = line.find_last_not_of(" \t\r\n");
    std::string value;
    if (start != std::string::npos && end != std::string::npos && end >= start) {
        value = line.substr(start, end - start + 1);
    }
    (*headers)[name] = value;
    return len;
}

std::string header_or_empty(const std::map<std::string, std::string>& headers,
                            const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
}

} // namespace

RuntimeClient::RuntimeClient(const std::string& endpoint)
    : base_url_(std::format("http://{}/{}/runtime", endpoint, kApiVersion)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RuntimeClient::~RuntimeClient() {
    curl_global_cleanup();
}

std::expected<Invocation, std::string> RuntimeClient::next_invocation() {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = base_url_ + "/invocation/next";
    std::string body;
    std::map<std::string, std::string> headers;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    // Long poll: the sandbox freezes us here between events.
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (code != 200) {
        return std::unexpected(std::format("invocation/next returned HTTP {}: {}", code, body));
    }

    auto context = context_from_headers(headers);
    if (context.request_id.empty()) {
        return std::unexpected("invocation/next response has no request id");
    }

    return Invocation{
        .context = std::move(context),
        .payload = std::move(body),
    };
}

std::expected<void, std::string>
RuntimeClient::post_response(const std::string& request_id, const nlohmann::json& response) {
    return post("/invocation/" + request_id + "/response", to_body(response), {});
}

std::expected<void, std::string>
RuntimeClient::post_error(const std::string& request_id, const InvocationError& error) {
    return post("/invocation/" + request_id + "/error", to_body(error_document(error)), error.type);
}

std::expected<void, std::string>
RuntimeClient::post(const std::string& path, const std::string& body,
                    const std::string& error_type) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = base_url_ + path;
    std::string response_body;
    curl_slist* headers = nullptr;
    for (auto& h : request_headers(error_type)) {
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (code != 202) {
        return std::unexpected(std::format("POST {} returned HTTP {}: {}", path, code, response_body));
    }
    return {};
}

InvocationContext context_from_headers(const std::map<std::string, std::string>& headers) {
    InvocationContext ctx;
    ctx.request_id = header_or_empty(headers, "lambda-runtime-aws-request-id");
    ctx.function_arn = header_or_empty(headers, "lambda-runtime-invoked-function-arn");
    ctx.trace_id = header_or_empty(headers, "lambda-runtime-trace-id");

    auto deadline = header_or_empty(headers, "lambda-runtime-deadline-ms");
    if (!deadline.empty()) {
        try {
            ctx.deadline_ms = std::stoll(deadline);
        } catch (const std::exception&) {
            ctx.deadline_ms = 0;
        }
    }
    return ctx;
}

nlohmann::json error_document(const InvocationError& error) {
    return {
        {"errorMessage", error.message},
        {"errorType", error.type},
    };
}

std::vector<std::string> request_headers(const std::string& error_type) {
    std::vector<std::string> headers = {"Content-Type: application/json"};
    if (!error_type.empty()) {
        headers.push_back("Lambda-Runtime-Function-Error-Type: " + error_type);
    }
    return headers;
}

std::string to_body(const nlohmann::json& doc) {
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
