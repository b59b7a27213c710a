#pragma once

#include "object_store.hpp"

#include <string>

struct S3Options {
    std::string region = "us-east-1";
    std::string endpoint;           // e.g. http://localhost:9000 for MinIO
    bool path_style = false;
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    // Region/endpoint as given, credentials from the AWS_* environment.
    static S3Options from_environment(std::string region, std::string endpoint,
                                      bool path_style);
};

// S3 REST GetObject/PutObject over libcurl, signed with SigV4.
class S3ObjectStore : public ObjectStore {
public:
    explicit S3ObjectStore(S3Options options);
    ~S3ObjectStore() override;

    S3ObjectStore(const S3ObjectStore&) = delete;
    S3ObjectStore& operator=(const S3ObjectStore&) = delete;

    std::expected<void, std::string>
        download(const std::string& bucket, const std::string& key,
                 const std::string& local_path) override;

    std::expected<void, std::string>
        put(const std::string& bucket, const std::string& key,
            const std::string& body, const std::string& content_type) override;

    std::string object_url(const std::string& bucket, const std::string& key) const;

private:
    S3Options options_;
};

// Percent-encodes each path segment of an object key, keeping the '/' separators.
std::string encode_object_key(const std::string& key);
