#ifndef MOCKBACKENDRESPONSES_HPP
#define MOCKBACKENDRESPONSES_HPP

#include <string>

#include <nlohmann/json.hpp>

namespace MockBackendResponses {

    inline std::string healthBody(const std::string& instance, bool healthy) {
        nlohmann::json body = {
            {"status", healthy ? "ok" : "unhealthy"},
            {"instance", instance}
        };
        return body.dump();
    }

    inline std::string echoBody(const std::string& instance,
                                const std::string& method,
                                const std::string& path,
                                const std::string& request_id,
                                const std::string& forwarded_for,
                                const std::string& request_body) {
        nlohmann::json body = {
            {"instance", instance},
            {"method", method},
            {"path", path},
            {"requestId", request_id},
            {"forwardedFor", forwarded_for},
            {"body", request_body}
        };
        // Echoed bodies are not guaranteed to be valid UTF-8.
        return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

}

#endif // MOCKBACKENDRESPONSES_HPP
