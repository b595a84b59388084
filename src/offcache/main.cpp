#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "offcache/common/logger.h"
#include "offcache/core/config.h"
#include "offcache/core/config_loader.h"
#include "offcache/net/http_fetcher.h"
#include "offcache/routing/router.h"
#include "offcache/runtime/background_processor.h"
#include "offcache/server/proxy_server.h"
#include "offcache/store/file_cache_store.h"
#include "offcache/store/memory_cache_store.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE        JSON configuration file" << std::endl;
    std::cout << "  --origin URL         Origin to proxy (default: http://localhost:3000)" << std::endl;
    std::cout << "  --listen ADDRESS     Listen address (default: 127.0.0.1)" << std::endl;
    std::cout << "  --port PORT          Listen port (default: 8080)" << std::endl;
    std::cout << "  --store BACKEND      Cache store backend: memory or file (default: memory)" << std::endl;
    std::cout << "  --store-dir DIR      Directory for the file store (default: ./offcache-data)" << std::endl;
    std::cout << "  --version VERSION    Cache version, e.g. v2 (default: v1)" << std::endl;
    std::cout << "  --log-level LEVEL    Log level (trace, debug, info, warn, error, critical, off)" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

struct Overrides {
    std::optional<std::string> origin;
    std::optional<std::string> listen;
    std::optional<uint16_t> port;
    std::optional<std::string> store;
    std::optional<std::string> store_dir;
    std::optional<std::string> version;
};

void Apply(const Overrides& o, offcache::core::Config& config) {
    if (o.origin) config.origin.origin = *o.origin;
    if (o.listen) config.server.listen_address = *o.listen;
    if (o.port) config.server.port = *o.port;
    if (o.store) config.store.backend = *o.store;
    if (o.store_dir) config.store.directory = *o.store_dir;
    if (o.version) config.cache.version = *o.version;
}

std::shared_ptr<offcache::store::CacheStore> CreateStore(const offcache::core::StoreConfig& config) {
    if (config.backend == "file") {
        auto store = std::make_shared<offcache::store::FileCacheStore>(config);
        if (store->corrupt_entries() > 0) {
            OFFCACHE_WARN("Skipped {} unreadable entries in {}", store->corrupt_entries(), config.directory);
        }
        return store;
    }
    return std::make_shared<offcache::store::MemoryCacheStore>(config);
}

} // namespace

int main(int argc, char* argv[]) {
    // Set up signal handling
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    offcache::common::Logger::Init();

    std::string config_path;
    Overrides overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--origin" && i + 1 < argc) {
            overrides.origin = argv[++i];
        } else if (arg == "--listen" && i + 1 < argc) {
            overrides.listen = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    throw std::out_of_range(value);
                }
                overrides.port = static_cast<uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--store" && i + 1 < argc) {
            overrides.store = argv[++i];
        } else if (arg == "--store-dir" && i + 1 < argc) {
            overrides.store_dir = argv[++i];
        } else if (arg == "--version" && i + 1 < argc) {
            overrides.version = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level_str = argv[++i];
            auto level = offcache::common::Logger::ParseLevel(level_str);
            if (level) {
                offcache::common::Logger::SetLevel(*level);
            } else {
                std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
            }
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    offcache::core::Config config;
    if (!config_path.empty()) {
        auto loaded = offcache::core::ConfigLoader::LoadFile(config_path, config);
        if (!loaded.ok()) {
            std::cerr << "Failed to load " << config_path << ": " << loaded.error() << std::endl;
            return 1;
        }
    }
    Apply(overrides, config);
    auto valid = config.Validate();
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    try {
        auto store = CreateStore(config.store);
        auto fetcher = std::make_shared<offcache::net::HttpFetcher>(config.fetcher);

        offcache::runtime::BackgroundProcessorConfig bg_config;
        bg_config.num_workers = config.background_workers;
        bg_config.max_queue_size = config.background_queue_size;
        bg_config.reserved_fetch_workers = config.background_fetch_workers;
        auto background = std::make_shared<offcache::runtime::BackgroundProcessor>(bg_config);
        auto init = background->initialize();
        if (!init.ok()) {
            std::cerr << "Failed to start background processor: " << init.error() << std::endl;
            return 1;
        }

        auto router = std::make_shared<offcache::routing::Router>(config, store, fetcher, background);
        auto started = router->start();
        if (!started.ok()) {
            auto serving = router->serving_version();
            OFFCACHE_ERROR("Install of cache version {} failed: {}; serving {}", config.cache.version,
                           started.error(), serving ? "cache version " + *serving : std::string("uncached"));
        }

        offcache::server::ProxyServer server(config, router, store, background);
        server.Start();
        OFFCACHE_INFO("offcache running (cache version {}). Press Ctrl+C to stop.", config.cache.version);

        const auto retry_interval = config.cache.install_retry_interval;
        auto last_attempt = std::chrono::steady_clock::now();
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (retry_interval.count() == 0 ||
                router->state() != offcache::lifecycle::LifecycleState::REDUNDANT ||
                std::chrono::steady_clock::now() - last_attempt < retry_interval) {
                continue;
            }
            last_attempt = std::chrono::steady_clock::now();
            OFFCACHE_INFO("Retrying install of cache version {}", config.cache.version);
            auto retried = router->start();
            if (!retried.ok()) {
                OFFCACHE_WARN("Install retry failed: {}", retried.error());
            }
        }

        OFFCACHE_INFO("Shutting down...");
        server.Stop();
        background->shutdown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
