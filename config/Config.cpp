#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace Anime1Relay {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data = nlohmann::json::parse(f);
    const Config defaults;

    listen_host = data.value("listen_host", defaults.listen_host);
    listen_port = data.value("listen_port", defaults.listen_port);
    http_connect_timeout_ms = data.value("http_connect_timeout_ms", defaults.http_connect_timeout_ms);
    http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
    stream_stall_timeout_sec = data.value("stream_stall_timeout_sec", defaults.stream_stall_timeout_sec);
    max_page_bytes = data.value("max_page_bytes", defaults.max_page_bytes);
    stream_chunk_bytes = data.value("stream_chunk_bytes", defaults.stream_chunk_bytes);
    cache_max_size = data.value("cache_max_size", defaults.cache_max_size);
    user_agent = data.value("user_agent", defaults.user_agent);
    accept_language = data.value("accept_language", defaults.accept_language);
    log_level = data.value("log_level", defaults.log_level);
    log_to_file = data.value("log_to_file", defaults.log_to_file);

    if (cache_max_size == 0) {
        throw std::runtime_error("cache_max_size must be greater than zero");
    }
    if (stream_chunk_bytes == 0) {
        stream_chunk_bytes = defaults.stream_chunk_bytes;
    }

    // Append keys introduced by newer versions; unknown keys are left alone.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (const auto& item : current.items()) {
        if (!data.contains(item.key())) { data[item.key()] = item.value(); changed = true; }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up config before update: " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            Logger::Log(LogLevel::Warn, "Could not write new config keys to: " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaultConfig.ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["listen_host"] = listen_host;
    data["listen_port"] = listen_port;
    data["http_connect_timeout_ms"] = http_connect_timeout_ms;
    data["http_timeout_ms"] = http_timeout_ms;
    data["stream_stall_timeout_sec"] = stream_stall_timeout_sec;
    data["max_page_bytes"] = max_page_bytes;
    data["stream_chunk_bytes"] = stream_chunk_bytes;
    data["cache_max_size"] = cache_max_size;
    data["user_agent"] = user_agent;
    data["accept_language"] = accept_language;
    data["log_level"] = log_level;
    data["log_to_file"] = log_to_file;
    return data;
}

}
