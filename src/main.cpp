#include <boost/asio.hpp>
#include <curl/curl.h>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include "../config/Config.hpp"
#include "cache/ResolutionCache.hpp"
#include "core/RelayService.hpp"
#include "core/StreamingProxy.hpp"
#include "network/CurlTransport.hpp"
#include "network/UpstreamClient.hpp"
#include "parser/PageExtractor.hpp"
#include "server/HttpServer.hpp"
#include "utils/Logger.hpp"

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    // Load Config
    auto& config = Anime1Relay::Config::GetInstance();
    try {
        if (std::filesystem::exists(config_path)) {
            config.Load(config_path_str);
            Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Info, "Configuration loaded from: " + config_path_str);
        } else {
            Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            config.CreateDefault(config_path_str);
        }
    } catch (const std::exception& e) {
        Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }

    Anime1Relay::Logger::Init(config.log_to_file ? exe_dir.string() : std::string(),
                              Anime1Relay::Logger::FromString(config.log_level));

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    int exit_code = 0;
    {
        // Setup Core Components
        Anime1Relay::CurlTransport transport(config);
        Anime1Relay::PageExtractor extractor;
        Anime1Relay::UpstreamClient upstream(config, transport, extractor);
        Anime1Relay::ResolutionCache cache(upstream, config.cache_max_size);
        Anime1Relay::StreamingProxy proxy(transport, upstream);
        Anime1Relay::RelayService service(upstream, cache, proxy);

        try {
            service.Preheat();

            boost::asio::io_context ioc;
            auto server = std::make_shared<Anime1Relay::HttpServer>(ioc, config.listen_host, config.listen_port, service);
            server->run();

            boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
            signals.async_wait([&ioc](const boost::system::error_code&, int signal_number) {
                Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Info, "Received signal " + std::to_string(signal_number) + ", shutting down");
                ioc.stop();
            });

            // SIGHUP drops the upstream cookies and connections without restarting.
            boost::asio::signal_set reset_signal(ioc, SIGHUP);
            std::function<void()> wait_for_reset;
            wait_for_reset = [&]() {
                reset_signal.async_wait([&](const boost::system::error_code& ec, int) {
                    if (ec) return;
                    try {
                        service.Reset();
                    } catch (const std::exception& e) {
                        Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Error, "Reset failed: " + std::string(e.what()));
                    }
                    wait_for_reset();
                });
            };
            wait_for_reset();

            Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Info,
                "Listening on http://" + config.listen_host + ":" + std::to_string(config.listen_port));
            ioc.run();

            server->stop();
        } catch (const std::exception& e) {
            Anime1Relay::Logger::Log(Anime1Relay::LogLevel::Error, "Server error: " + std::string(e.what()));
            exit_code = 1;
        }

        service.Shutdown();
    }

    // Cleanup global resources
    curl_global_cleanup();
    return exit_code;
}
