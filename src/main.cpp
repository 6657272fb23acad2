#include <csignal>
#include <cstdlib>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>

#include "cache/InMemoryStore.hpp"
#include "cache/RedisStore.hpp"
#include "cache/StaticFallbackStore.hpp"
#include "config/AppConfig.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/CacheStatistics.hpp"
#include "core/LiveFetcher.hpp"
#include "core/ThreadPoolQueue.hpp"
#include "core/TieredCacheCoordinator.hpp"
#include "core/Vitify.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using namespace std;

// --- Helper Function to Initialize the Volatile Store ---
// A Redis store that cannot connect yet is still returned: it reports UNAVAILABLE per
// call and reconnects lazily, which is how the tiers degrade.
std::shared_ptr<IVolatileStore> initializeVolatileStore(const AppConfig& config_, std::shared_ptr<ILogger> logger_) {
    if (config_.use_redis) {
        auto redis_store = std::make_shared<RedisStore>(config_, logger_);
        if (redis_store->isConnected()) {
            logger_->setup("Redis store connected at " + config_.redis_host + ":" + std::to_string(config_.redis_port));
        } else {
            logger_->warn("Redis unreachable at startup; short-term and long-term tiers will miss until it recovers");
        }
        return redis_store;
    }
    logger_->setup("use_redis=0. Creating InMemoryStore.");
    return std::make_shared<InMemoryStore>(config_.fallback_cache_ttl, static_cast<size_t>(config_.in_memory_cache_max_size));
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
#ifdef _WIN32
    char* statsd_server_value = nullptr;
    size_t len;
    errno_t err = _dupenv_s(&statsd_server_value, &len, "STATSD_SERVER");
    if (err == 0 && statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
        free(statsd_server_value);
    }
#else
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }
#endif

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Metrics disabled.");
        return DummyStatsDClient::create();
    }

    try {
        logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient creation failed: " + std::string(e.what()) + ". Metrics disabled.");
    }
    return DummyStatsDClient::create();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Expected key=value pairs. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<IVolatileStore> store = initializeVolatileStore(config_, logger_);

        auto static_store = std::make_shared<StaticFallbackStore>(
            config_.csv_fallback_dir,
            static_cast<size_t>(config_.static_cache_max_size),
            std::chrono::seconds(config_.static_cache_ttl),
            logger_);
        logger_->setup("Static fallback store reading from " + config_.csv_fallback_dir);

        auto statistics = std::make_shared<CacheStatistics>();
        auto coordinator = std::make_shared<TieredCacheCoordinator>(
            store, static_store, statistics, config_, logger_, statsd_client);

        // --- Boost.Asio io_context shared by the server and the upstream client ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        auto fetcher = std::make_shared<LiveFetcher>(ioc, config_, logger_, statsd_client);
        auto workers = std::make_shared<ThreadPoolQueue>(static_cast<size_t>(config_.number_of_worker_threads), logger_);

        auto vitify_service = std::make_shared<Vitify>(
            store, static_store, fetcher, coordinator, workers, statsd_client, config_, logger_);

        auto const address = net::ip::make_address("0.0.0.0");
        auto const port = static_cast<unsigned short>(config_.frontend_port);
        auto beast_server = std::make_shared<BeastHttpServer>(
            ioc,
            tcp::endpoint{address, port},
            vitify_service,
            logger_,
            config_);
        beast_server->run();

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.number_of_io_threads) + " I/O threads for Boost.Asio.");
        for (int i = 0; i < config_.number_of_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
                }
            });
        }

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const&, int signal_number) {
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                beast_server->stop();
                vitify_service->cancel_active_fetches();
                work_guard.reset();
                ioc.stop();
            });

        logger_->setup("Vitify server running on port " + std::to_string(config_.frontend_port) + ". Press Ctrl+C to exit.");
        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        // Workers may still reference the service; drain them before it goes away
        workers->shutdown();
        logger_->setup("All threads joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
