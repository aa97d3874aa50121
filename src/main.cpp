#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/BeastTransport.hpp"
#include "core/Gateway.hpp"
#include "core/HealthChecker.hpp"
#include "core/HttpHealthProbe.hpp"
#include "core/RequestRouter.hpp"
#include "core/ServiceRegistry.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

// STATSD_SERVER=host:port selects the real client; anything else falls back to the no-op one.
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (!statsd_server_endpoint.empty()) {
        try {
            logger->setup("Sending metrics to " + statsd_server_endpoint);
            return StatsDClient::getInstance(config, logger, statsd_server_endpoint);
        } catch (const std::exception& e) {
            logger->error(std::string("StatsDClient could not be created: ") + e.what());
        }
    }

    logger->setup("Metrics disabled, using DummyStatsDClient.");
    return DummyStatsDClient::getInstance();
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger = ConsoleLogger::getInstance(config.log_level);
        logger->setup("Configuration loaded.");
        logger->setup(config.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config, logger);

        ServiceRegistry registry(logger, statsd_client);
        for (const auto& service : config.services) {
            registry.registerService(service);
        }

        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        auto transport = std::make_shared<BeastTransport>(ioc, logger);
        auto router = std::make_shared<RequestRouter>(registry, transport, logger, statsd_client);
        auto gateway = std::make_shared<Gateway>(registry, router, logger, statsd_client);
        auto health_checker = std::make_shared<HealthChecker>(
            ioc,
            registry,
            std::make_shared<HttpHealthProbe>(transport),
            std::chrono::milliseconds(config.health_check_interval_in_millis),
            std::chrono::milliseconds(config.health_check_timeout_in_millis),
            logger,
            statsd_client);

        auto const address = net::ip::make_address("0.0.0.0");
        auto const port = static_cast<unsigned short>(config.frontend_port);
        auto server = std::make_shared<BeastHttpServer>(ioc, tcp::endpoint{address, port}, gateway, logger, config);

        logger->setup("Starting " + std::to_string(config.num_io_threads) + " I/O threads.");
        std::vector<std::thread> ioc_threads;
        for (unsigned int i = 0; i < config.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger->error("Exception in I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger->debug("I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        if (config.health_check_on_startup) {
            logger->setup("Running initial health check, " + std::to_string(health_checker->checkNow()) + " probe(s) issued.");
        }
        health_checker->start();
        server->run();
        logger->setup(Constants::GATEWAY_NAME + " is running on port " + std::to_string(config.frontend_port)
            + " with " + std::to_string(registry.serviceNames().size()) + " service(s). Press Ctrl+C to exit.");

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    return;
                }
                logger->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                server->stop();
                health_checker->stop();
                transport->cancelAll();
                work_guard.reset();
                ioc.stop();
            });

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger->setup("All I/O threads joined. Exiting.");
        return 0;
    } catch (const ConfigurationError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
