#include "offcache/server/proxy_server.h"

#include <atomic>
#include <thread>

#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "offcache/common/logger.h"
#include "offcache/common/url.h"
#include "offcache/core/error.h"

namespace offcache {
namespace server {

namespace {

const char* kCommandPath = "/__offcache/command";
const char* kStatsPath = "/__offcache/stats";
const char* kHealthPath = "/__offcache/health";

// Connection-level headers, plus the pseudo headers httplib adds for the peer
bool forwardable(const std::string& name) {
    return name != "host" && name != "connection" && name != "keep-alive" &&
           name != "proxy-connection" && name != "transfer-encoding" && name != "upgrade" &&
           name != "te" && name != "trailer" && name != "content-length" &&
           name != "remote_addr" && name != "remote_port" &&
           name != "local_addr" && name != "local_port";
}

rapidjson::Value str(const std::string& s, rapidjson::Document::AllocatorType& allocator) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

std::string to_json(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

} // namespace

class ProxyServer::Impl {
public:
    Impl(const core::Config& config,
         std::shared_ptr<routing::Router> router,
         std::shared_ptr<store::CacheStore> store,
         std::shared_ptr<runtime::BackgroundProcessor> background)
        : config_(config.server), router_(std::move(router)), store_(std::move(store)),
          background_(std::move(background)), server_(std::make_unique<httplib::Server>()) {
        auto origin = common::Url::Parse(config.origin.origin);
        if (!origin) {
            throw core::InvalidArgumentError("Invalid origin: '" + config.origin.origin + "'");
        }
        origin_ = origin->origin();

        if (config_.num_threads > 0) {
            size_t threads = config_.num_threads;
            server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        }

        server_->Post(kCommandPath, [this](const httplib::Request& req, httplib::Response& res) {
            HandleCommand(req, res);
        });
        server_->Get(kStatsPath, [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(GetStatsJson(), "application/json");
        });
        server_->Get(kHealthPath, [this](const httplib::Request&, httplib::Response& res) {
            rapidjson::Document doc;
            doc.SetObject();
            auto& allocator = doc.GetAllocator();
            doc.AddMember("status", "up", allocator);
            doc.AddMember("state", rapidjson::StringRef(lifecycle::to_string(router_->state())), allocator);
            doc.AddMember("version", str(router_->version(), allocator), allocator);
            res.set_content(to_json(doc), "application/json");
        });

        auto proxy = [this](const httplib::Request& req, httplib::Response& res) {
            HandleProxy(req, res);
        };
        server_->Get(".*", proxy);
        server_->Post(".*", proxy);
        server_->Put(".*", proxy);
        server_->Patch(".*", proxy);
        server_->Delete(".*", proxy);
        server_->Options(".*", proxy);
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw core::InternalError("Server is already running");
        }

        bool bound;
        if (config_.port == 0) {
            int port = server_->bind_to_any_port(config_.listen_address);
            bound = port > 0;
            port_ = port;
        } else {
            bound = server_->bind_to_port(config_.listen_address, config_.port);
            port_ = config_.port;
        }
        if (!bound) {
            throw core::UnavailableError("Failed to bind " + config_.listen_address + ":" +
                                         std::to_string(config_.port));
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                OFFCACHE_ERROR("Proxy server on port {} stopped unexpectedly", port_.load());
            }
        });
        OFFCACHE_INFO("Proxying {} on {}:{}", origin_, config_.listen_address, port_.load());
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
    }

    bool IsRunning() const { return server_->is_running(); }

    int Port() const { return port_.load(); }

    std::string GetStatsJson() const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        auto router_stats = router_->stats();
        rapidjson::Value router(rapidjson::kObjectType);
        router.AddMember("requests", router_stats.requests, allocator);
        router.AddMember("intercepted", router_stats.intercepted, allocator);
        router.AddMember("passed_through", router_stats.passed_through, allocator);
        router.AddMember("served_from_cache", router_stats.served_from_cache, allocator);
        router.AddMember("served_from_network", router_stats.served_from_network, allocator);
        router.AddMember("offline_fallbacks", router_stats.offline_fallbacks, allocator);
        router.AddMember("failures", router_stats.failures, allocator);
        router.AddMember("commands_handled", router_stats.commands_handled, allocator);
        router.AddMember("commands_ignored", router_stats.commands_ignored, allocator);
        rapidjson::Value classes(rapidjson::kObjectType);
        for (auto c : core::kAllClassifications) {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("requests", router_stats.classified(c), allocator);
            entry.AddMember("failures", router_stats.failed(c), allocator);
            classes.AddMember(rapidjson::StringRef(core::to_string(c)), entry, allocator);
        }
        router.AddMember("classifications", classes, allocator);
        doc.AddMember("router", router, allocator);

        auto bg = background_->getStats();
        rapidjson::Value background(rapidjson::kObjectType);
        background.AddMember("tasks_submitted", bg.tasks_submitted, allocator);
        background.AddMember("tasks_processed", bg.tasks_processed, allocator);
        background.AddMember("tasks_failed", bg.tasks_failed, allocator);
        background.AddMember("tasks_rejected", bg.tasks_rejected, allocator);
        background.AddMember("tasks_dropped", bg.tasks_dropped, allocator);
        background.AddMember("queue_size", bg.queue_size, allocator);
        doc.AddMember("background", background, allocator);

        rapidjson::Value partitions(rapidjson::kObjectType);
        for (const auto& name : store_->partitions()) {
            rapidjson::Value key = str(name, allocator);
            rapidjson::Value count(static_cast<uint64_t>(store_->size(name)));
            partitions.AddMember(key, count, allocator);
        }
        doc.AddMember("partitions", partitions, allocator);
        doc.AddMember("state", rapidjson::StringRef(lifecycle::to_string(router_->state())), allocator);
        doc.AddMember("version", str(router_->version(), allocator), allocator);
        auto serving = router_->serving_version();
        rapidjson::Value serving_version(rapidjson::kNullType);
        if (serving) {
            serving_version = str(*serving, allocator);
        }
        doc.AddMember("serving_version", serving_version, allocator);

        return to_json(doc);
    }

private:
    void HandleCommand(const httplib::Request& req, httplib::Response& res) {
        auto router = router_;
        std::string message = req.body;
        auto spawned = background_->spawnDetached(
            runtime::BackgroundTaskType::COMMAND,
            [router, message]() -> core::Result<void> {
                router->on_command(message);
                return core::Result<void>();
            },
            "command");
        if (!spawned.ok()) {
            res.status = 503;
            res.set_content(spawned.error(), "text/plain");
            return;
        }
        res.status = 202;
    }

    void HandleProxy(const httplib::Request& req, httplib::Response& res) {
        core::Request request(req.method, origin_ + req.target);
        for (const auto& kv : req.headers) {
            auto name = core::Headers::normalize(kv.first);
            if (forwardable(name)) {
                request.headers.add(name, kv.second);
            }
        }
        request.body = req.body;

        auto result = router_->on_intercept(request);
        if (!result.ok()) {
            res.status = 502;
            res.set_content("Bad Gateway: " + result.error(), "text/plain");
            return;
        }

        const auto& response = result.value();
        res.status = response.status;
        std::string content_type;
        for (const auto& kv : response.headers) {
            if (kv.first == "content-type") {
                content_type = kv.second;
            } else if (forwardable(kv.first)) {
                for (const auto& value : response.headers.values(kv.first)) {
                    res.set_header(kv.first, value);
                }
            }
        }
        if (content_type.empty()) {
            content_type = "application/octet-stream";
        }
        res.set_content(response.body, content_type);
    }

    core::ServerConfig config_;
    std::string origin_;
    std::shared_ptr<routing::Router> router_;
    std::shared_ptr<store::CacheStore> store_;
    std::shared_ptr<runtime::BackgroundProcessor> background_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<int> port_{0};
};

ProxyServer::ProxyServer(const core::Config& config,
                         std::shared_ptr<routing::Router> router,
                         std::shared_ptr<store::CacheStore> store,
                         std::shared_ptr<runtime::BackgroundProcessor> background)
    : impl_(std::make_unique<Impl>(config, std::move(router), std::move(store), std::move(background))) {}

ProxyServer::~ProxyServer() {
    Stop();
}

void ProxyServer::Start() {
    impl_->Start();
}

void ProxyServer::Stop() {
    impl_->Stop();
}

bool ProxyServer::IsRunning() const {
    return impl_->IsRunning();
}

int ProxyServer::Port() const {
    return impl_->Port();
}

std::string ProxyServer::GetStatsJson() const {
    return impl_->GetStatsJson();
}

} // namespace server
} // namespace offcache
