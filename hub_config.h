#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "channel_arbiter.h"
#include "protocol.h"

using namespace std::chrono_literals;

// Defaults

namespace hub_config {
constexpr const char* VERSION = "2.5.4";

constexpr uint16_t    HTTP_PORT           = 8099;
constexpr uint16_t    WS_PORT             = 8098;
constexpr const char* CHIMES_PATH         = "/data/chimes";
constexpr const char* BUNDLED_CHIMES_PATH = "./chimes";
constexpr const char* DEVICE_NAME         = "Intercom Hub";
constexpr size_t      RECV_BUF_SIZE       = MAX_PACKET_SIZE;
constexpr int         RX_SOCKET_BUFFER    = 65536;  // absorbs bursts while the RX path is busy

constexpr auto RX_TIMEOUT              = 500ms;
constexpr auto CHANNEL_WAIT_TIMEOUT    = 5s;
constexpr auto WEB_PTT_IDLE_TIMEOUT    = 5s;
constexpr auto PTT_QUEUE_TIMEOUT       = 30s;
constexpr auto PTT_DRAIN_GAP           = 750ms;
constexpr auto HOUSEKEEPING_INTERVAL   = 100ms;
constexpr auto METRICS_REPORT_INTERVAL = 60s;

constexpr int MAX_CONSECUTIVE_SEND_ERRORS = 5;
}  // namespace hub_config

struct HubConfig {
    using duration = std::chrono::steady_clock::duration;

    std::string multicast_group = DEFAULT_MULTICAST_GROUP;
    uint16_t    audio_port      = DEFAULT_AUDIO_PORT;
    uint16_t    http_port       = hub_config::HTTP_PORT;
    uint16_t    ws_port         = hub_config::WS_PORT;

    std::string chimes_path         = hub_config::CHIMES_PATH;
    std::string bundled_chimes_path = hub_config::BUNDLED_CHIMES_PATH;
    std::string device_name         = hub_config::DEVICE_NAME;
    DeviceId    device_id{};

    std::string log_level = "info";
    std::string log_file;  // empty = no file sink

    duration rx_timeout              = hub_config::RX_TIMEOUT;
    duration channel_wait_timeout    = hub_config::CHANNEL_WAIT_TIMEOUT;
    duration web_ptt_idle_timeout    = hub_config::WEB_PTT_IDLE_TIMEOUT;
    duration ptt_queue_timeout       = hub_config::PTT_QUEUE_TIMEOUT;
    duration ptt_drain_gap           = hub_config::PTT_DRAIN_GAP;
    duration housekeeping_interval   = hub_config::HOUSEKEEPING_INTERVAL;
    duration metrics_report_interval = hub_config::METRICS_REPORT_INTERVAL;

    using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

    // Defaults, then the JSON file at argv[1] if given, then the process environment.
    // Throws std::runtime_error on unreadable files or invalid values.
    static HubConfig load(int argc, char** argv);

    void apply_json(const nlohmann::json& json);
    void apply_env(const EnvLookup& lookup);

    ChannelArbiter::Timeouts arbiter_timeouts() const;

    // 8 bytes derived from the host name, stable across restarts
    static DeviceId default_device_id();
    static DeviceId device_id_for_host(const std::string& host);

    static EnvLookup process_env();
};
