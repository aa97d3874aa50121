#pragma once

#include <string>

// Parsed form of an instance base address such as "http://ride-service:3005".
struct BackendUrlInfo {
    std::string url;
    std::string backend_host;
    int backend_port = 0;
    bool is_https = false;

    bool operator==(const BackendUrlInfo& other) const {
        return url == other.url;
    }

    // Value for the Host header of requests sent to this backend.
    std::string hostHeader() const {
        return backend_host + ":" + std::to_string(backend_port);
    }
};
