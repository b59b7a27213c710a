#pragma once

#include <expected>
#include <string>

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Writes the object to local_path, replacing any existing file.
    virtual std::expected<void, std::string>
        download(const std::string& bucket, const std::string& key,
                 const std::string& local_path) = 0;

    // Creates or fully overwrites the object.
    virtual std::expected<void, std::string>
        put(const std::string& bucket, const std::string& key,
            const std::string& body, const std::string& content_type) = 0;
};
