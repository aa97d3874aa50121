#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "MockBackendResponses.hpp"

// Stand-in for one ride service instance, for exercising the gateway by hand.
//
//   port=<n>            listening port (default 9001)
//   name=<s>            instance name echoed back in responses
//   fail_health=true    /health answers 503 from the start
//   delay_ms=<n>        delay applied to every echo response
//
// POST /admin/health?healthy=false|true toggles the health endpoint at runtime.

std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
    std::map<std::string, std::string> argMap;
    for (const std::string& arg : args) {
        size_t delimiterPos = arg.find('=');
        if (delimiterPos != std::string::npos && delimiterPos > 0) {
            argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
        } else {
            std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
            return std::nullopt;
        }
    }
    return argMap;
}

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    std::optional<std::map<std::string, std::string>> parsedArgsOpt = parseArguments(args);
    if (!parsedArgsOpt) {
        std::cerr << "Failed to parse command-line arguments. Exiting." << std::endl;
        return 1;
    }
    std::map<std::string, std::string> startupArguments = *parsedArgsOpt;

    int port = 9001;
    std::string name = "mock-backend";
    std::atomic<bool> healthy{true};
    int delay_ms = 0;

    try {
        if (startupArguments.count("port")) {
            port = std::stoi(startupArguments["port"]);
            if (port <= 0 || port > 65535) {
                std::cerr << "Invalid port number '" << startupArguments["port"] << "'." << std::endl;
                return 1;
            }
        }
        if (startupArguments.count("delay_ms")) {
            delay_ms = std::stoi(startupArguments["delay_ms"]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }
    if (startupArguments.count("name")) {
        name = startupArguments["name"];
    }
    if (startupArguments.count("fail_health")) {
        healthy = startupArguments["fail_health"] != "true";
    }

    httplib::Server server;

    server.Get("/health", [&healthy, &name](const httplib::Request&, httplib::Response& res) {
        const bool is_healthy = healthy;
        res.status = is_healthy ? 200 : 503;
        res.set_content(MockBackendResponses::healthBody(name, is_healthy), "application/json");
    });

    server.Post("/admin/health", [&healthy, &name](const httplib::Request& req, httplib::Response& res) {
        healthy = req.get_param_value("healthy") != "false";
        std::cout << name << " health set to " << (healthy ? "healthy" : "unhealthy") << std::endl;
        res.set_content(healthy ? "healthy" : "unhealthy", "text/plain");
    });

    // Echoes method, path and selected gateway headers for every other request.
    auto echo = [&name, delay_ms](const httplib::Request& req, httplib::Response& res) {
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        res.status = 200;
        res.set_content(MockBackendResponses::echoBody(name, req.method, req.path,
                                                       req.get_header_value("X-Request-ID"),
                                                       req.get_header_value("X-Forwarded-For"),
                                                       req.body),
                        "application/json");
    };
    server.Get(".*", echo);
    server.Post(".*", echo);
    server.Put(".*", echo);
    server.Patch(".*", echo);
    server.Delete(".*", echo);

    std::cout << "Starting " << name << " on 0.0.0.0:" << port << "..." << std::endl;
    if (!server.listen("0.0.0.0", port)) {
        std::cerr << "Failed to start server on port " << port << "." << std::endl;
        return 1;
    }

    std::cout << "Server stopped." << std::endl;
    return 0;
}
