#include "s3_object_store.hpp"

#include "../platform/platform_env.hpp"

#include <cstdio>
#include <curl/curl.h>
#include <filesystem>
#include <format>

struct DownloadSink {
    CURL* curl;
    FILE* file;
    std::string error_body;
    bool write_failed = false;
};

// Object bytes go to the file; an error response body is kept for the message.
static size_t download_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t len = size * nmemb;

    long code = 0;
    curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &code);
    if (code >= 300) {
        sink->error_body.append(ptr, len);
        return len;
    }

    if (std::fwrite(ptr, 1, len, sink->file) != len) {
        sink->write_failed = true;
        return 0;
    }
    return len;
}

static size_t string_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::string trim_trailing_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

S3Options S3Options::from_environment(std::string region, std::string endpoint,
                                      bool path_style) {
    S3Options opts;
    opts.region = std::move(region);
    opts.endpoint = std::move(endpoint);
    opts.path_style = path_style;
    opts.access_key_id = platform::env_or("AWS_ACCESS_KEY_ID");
    opts.secret_access_key = platform::env_or("AWS_SECRET_ACCESS_KEY");
    opts.session_token = platform::env_or("AWS_SESSION_TOKEN");
    return opts;
}

std::string encode_object_key(const std::string& key) {
    CURL* curl = curl_easy_init();
    if (!curl) return key;

    std::string out;
    size_t start = 0;
    while (true) {
        auto slash = key.find('/', start);
        auto segment = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        if (!segment.empty()) {
            char* escaped = curl_easy_escape(curl, segment.data(), static_cast<int>(segment.size()));
            if (escaped) {
                out += escaped;
                curl_free(escaped);
            }
        }

        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }

    curl_easy_cleanup(curl);
    return out;
}

S3ObjectStore::S3ObjectStore(S3Options options)
    : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

S3ObjectStore::~S3ObjectStore() {
    curl_global_cleanup();
}

std::string S3ObjectStore::object_url(const std::string& bucket, const std::string& key) const {
    auto path = encode_object_key(key);

    if (!options_.endpoint.empty()) {
        return std::format("{}/{}/{}", trim_trailing_slash(options_.endpoint), bucket, path);
    }
    if (options_.path_style) {
        return std::format("https://s3.{}.amazonaws.com/{}/{}", options_.region, bucket, path);
    }
    return std::format("https://{}.s3.{}.amazonaws.com/{}", bucket, options_.region, path);
}

static curl_slist* signing_headers(const S3Options& opts, curl_slist* headers) {
    // Tells SigV4 not to hash the body.
    headers = curl_slist_append(headers, "x-amz-content-sha256: UNSIGNED-PAYLOAD");
    if (!opts.session_token.empty()) {
        auto token = "x-amz-security-token: " + opts.session_token;
        headers = curl_slist_append(headers, token.c_str());
    }
    return headers;
}

static void apply_signing(CURL* curl, const S3Options& opts, const std::string& sigv4) {
    curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl, CURLOPT_USERNAME, opts.access_key_id.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, opts.secret_access_key.c_str());
}

std::expected<void, std::string>
S3ObjectStore::download(const std::string& bucket, const std::string& key,
                        const std::string& local_path) {
    FILE* file = std::fopen(local_path.c_str(), "wb");
    if (!file) {
        return std::unexpected("could not open " + local_path + " for writing");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(file);
        return std::unexpected("curl_easy_init failed");
    }

    auto url = object_url(bucket, key);
    auto sigv4 = "aws:amz:" + options_.region + ":s3";
    curl_slist* headers = signing_headers(options_, nullptr);
    DownloadSink sink{.curl = curl, .file = file, .error_body = {}};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, download_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    apply_signing(curl, options_, sigv4);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    bool close_failed = std::fclose(file) != 0;

    auto fail = [&](std::string msg) -> std::expected<void, std::string> {
        std::error_code ec;
        std::filesystem::remove(local_path, ec);
        return std::unexpected(std::move(msg));
    };

    if (sink.write_failed || close_failed) {
        return fail("write to " + local_path + " failed");
    }
    if (res != CURLE_OK) {
        return fail(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (code >= 300) {
        return fail(std::format("S3 GetObject s3://{}/{} failed (HTTP {}): {}",
                                bucket, key, code, sink.error_body));
    }

    return {};
}

std::expected<void, std::string>
S3ObjectStore::put(const std::string& bucket, const std::string& key,
                   const std::string& body, const std::string& content_type) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = object_url(bucket, key);
    auto sigv4 = "aws:amz:" + options_.region + ":s3";
    auto content_type_header = "Content-Type: " + content_type;
    curl_slist* headers = curl_slist_append(nullptr, content_type_header.c_str());
    headers = signing_headers(options_, headers);
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    apply_signing(curl, options_, sigv4);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (code >= 300) {
        return std::unexpected(std::format("S3 PutObject s3://{}/{} failed (HTTP {}): {}",
                                           bucket, key, code, response_body));
    }

    return {};
}
