#include <httplib.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "http_api.hpp"
#include "retrieval_service.hpp"
#include "service_config.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<httplib::Server*> g_server{nullptr};

void signal_handler(int) {
    if (auto* server = g_server.load()) server->stop();
}

fs::path resolve_config_path(int argc, char* argv[]) {
    if (argc > 1) return argv[1];

    std::vector<std::string> search_paths = {
        "config.json",      // 1. Current Working Directory
        "../config.json"    // 2. Parent Directory (running from build/)
    };
    for (const auto& path : search_paths) {
        if (fs::exists(path)) return path;
    }
    return "config.json";
}

} // namespace

class RetrievalServer {
public:
    explicit RetrievalServer(const pulse_rag::ServiceConfig& config)
        : config_(config),
          service_(std::shared_ptr<pulse_rag::Embedder>(pulse_rag::create_embedder(config)),
                   config.retrieval_options()),
          api_(service_, config.default_k)
    {
        int workers = config_.worker_threads > 0 ? config_.worker_threads : 1;
        server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
        api_.register_routes(server_);
    }

    int run() {
        service_.initialize();

        g_server = &server_;
        spdlog::info("🚀 Starting retrieval service on {}:{}", config_.host, config_.port);
        bool ok = server_.listen(config_.host, config_.port);
        g_server = nullptr;

        if (!ok) {
            spdlog::error("❌ Could not listen on {}:{}", config_.host, config_.port);
            return 1;
        }
        spdlog::info("Server stopped.");
        return 0;
    }

private:
    pulse_rag::ServiceConfig config_;
    pulse_rag::RetrievalService service_;
    pulse_rag::HttpApi api_;
    httplib::Server server_;
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    pulse_rag::ServiceConfig config;
    try {
        auto config_path = resolve_config_path(argc, argv);
        config = pulse_rag::ServiceConfig::load(config_path);
        config.apply_env_overrides();
        spdlog::info("Config path: {}{}", config_path.string(), fs::exists(config_path) ? "" : " (not found, using defaults)");
    } catch (const std::exception& e) {
        spdlog::critical("💥 Failed to load configuration: {}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        RetrievalServer server(config);
        return server.run();
    } catch (const std::exception& e) {
        spdlog::critical("💥 Retrieval service failed: {}", e.what());
        return 1;
    }
}
