#include "hub_config.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <unistd.h>

#include "check.hpp"
#include "logger.h"

namespace {

uint16_t parse_port(std::string_view name, const std::string& value) {
    size_t        consumed = 0;
    unsigned long port     = 0;
    try {
        port = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + ": not a number: '" + value + "'");
    }
    require(consumed == value.size(), std::string(name) + ": not a number: '" + value + "'");
    require(port > 0 && port <= 65535, std::string(name) + ": out of range: " + value);
    return static_cast<uint16_t>(port);
}

uint16_t port_from_json(std::string_view name, const nlohmann::json& value) {
    if (value.is_string()) {
        return parse_port(name, value.get<std::string>());
    }
    require(value.is_number_integer(), std::string(name) + ": expected a port number");
    auto port = value.get<int64_t>();
    require(port > 0 && port <= 65535, std::string(name) + ": out of range");
    return static_cast<uint16_t>(port);
}

// Durations are given in (fractional) seconds
HubConfig::duration seconds_from_json(std::string_view name, const nlohmann::json& value) {
    require(value.is_number(), std::string(name) + ": expected seconds");
    auto seconds = value.get<double>();
    require(seconds >= 0.0, std::string(name) + ": must not be negative");
    return std::chrono::duration_cast<HubConfig::duration>(std::chrono::duration<double>(seconds));
}

DeviceId parse_device_id(const std::string& hex) {
    auto id = device_id_from_hex(hex);
    require(id.has_value(), "device_id: expected 16 hex characters, got '" + hex + "'");
    return *id;
}

}  // namespace

HubConfig HubConfig::load(int argc, char** argv) {
    HubConfig config;
    config.device_id = default_device_id();

    if (argc > 1) {
        std::string   path = argv[1];
        std::ifstream file(path);
        require(file.is_open(), "Cannot open config file: " + path);
        try {
            config.apply_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config file " + path + ": " + e.what());
        }
    }

    config.apply_env(process_env());
    return config;
}

void HubConfig::apply_json(const nlohmann::json& json) {
    require(json.is_object(), "config: expected a JSON object");

    auto str = [&](const char* key, std::string& out) {
        if (json.contains(key)) {
            require(json[key].is_string(), std::string(key) + ": expected a string");
            out = json[key].get<std::string>();
        }
    };
    auto port = [&](const char* key, uint16_t& out) {
        if (json.contains(key)) {
            out = port_from_json(key, json[key]);
        }
    };
    auto seconds = [&](const char* key, duration& out) {
        if (json.contains(key)) {
            out = seconds_from_json(key, json[key]);
        }
    };

    str("multicast_group", multicast_group);
    port("multicast_port", audio_port);
    port("http_port", http_port);
    port("ws_port", ws_port);
    str("chimes_path", chimes_path);
    str("bundled_chimes_path", bundled_chimes_path);
    str("device_name", device_name);
    str("log_level", log_level);
    str("log_file", log_file);

    if (json.contains("device_id")) {
        require(json["device_id"].is_string(), "device_id: expected a string");
        device_id = parse_device_id(json["device_id"].get<std::string>());
    }

    seconds("rx_timeout", rx_timeout);
    seconds("channel_wait_timeout", channel_wait_timeout);
    seconds("web_ptt_idle_timeout", web_ptt_idle_timeout);
    seconds("ptt_queue_timeout", ptt_queue_timeout);
    seconds("housekeeping_interval", housekeeping_interval);
    seconds("metrics_report_interval", metrics_report_interval);

    require(housekeeping_interval > duration::zero(), "housekeeping_interval: must be positive");
    require(metrics_report_interval > duration::zero(), "metrics_report_interval: must be positive");
}

void HubConfig::apply_env(const EnvLookup& lookup) {
    if (auto v = lookup("MULTICAST_GROUP")) multicast_group = *v;
    if (auto v = lookup("MULTICAST_PORT")) audio_port = parse_port("MULTICAST_PORT", *v);
    if (auto v = lookup("HTTP_PORT")) http_port = parse_port("HTTP_PORT", *v);
    if (auto v = lookup("WS_PORT")) ws_port = parse_port("WS_PORT", *v);
    if (auto v = lookup("CHIMES_PATH")) chimes_path = *v;
    if (auto v = lookup("BUNDLED_CHIMES_PATH")) bundled_chimes_path = *v;
    if (auto v = lookup("DEVICE_NAME")) device_name = *v;
    if (auto v = lookup("DEVICE_ID")) device_id = parse_device_id(*v);
    if (auto v = lookup("LOG_LEVEL")) log_level = *v;
    if (auto v = lookup("LOG_FILE")) log_file = *v;
}

ChannelArbiter::Timeouts HubConfig::arbiter_timeouts() const {
    ChannelArbiter::Timeouts timeouts;
    timeouts.rx_timeout   = rx_timeout;
    timeouts.channel_wait = channel_wait_timeout;
    timeouts.web_ptt_idle = web_ptt_idle_timeout;
    return timeouts;
}

DeviceId HubConfig::default_device_id() {
    char host[256] = {};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        Log::warn("gethostname failed, using a fixed hub id seed");
        return device_id_for_host("intercom-hub");
    }
    return device_id_for_host(host);
}

// 64-bit FNV-1a of the host name, big-endian
DeviceId HubConfig::device_id_for_host(const std::string& host) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (char c: host) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 0x100000001b3ULL;
    }
    DeviceId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>(hash >> (8 * (id.size() - 1 - i)));
    }
    return id;
}

HubConfig::EnvLookup HubConfig::process_env() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}
