#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Anime1Relay {
    struct Config {
        std::string listen_host = "127.0.0.1";
        unsigned short listen_port = 8520;
        long http_connect_timeout_ms = 10000;
        long http_timeout_ms = 30000; // page and API calls; streams have no total timeout
        long stream_stall_timeout_sec = 30;
        size_t max_page_bytes = 8388608; // 8MB
        size_t stream_chunk_bytes = 65536;
        size_t cache_max_size = 128;
        std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/118.0.0.0 Safari/537.36";
        std::string accept_language = "zh-CN,zh;q=0.9,en;q=0.8";
        std::string log_level = "info";
        bool log_to_file = true;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);

        nlohmann::json ToJson() const;
    };
}
