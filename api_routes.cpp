#include "api_routes.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "audio_constants.h"
#include "logger.h"
#include "message_validator.h"

using json = nlohmann::json;

namespace {

// Whole-string decimal number, as Python's float() reads it
std::optional<double> parse_number(const std::string& raw) {
    std::string value = message_validator::sanitize_string(raw, 64);
    size_t      used  = 0;
    double      parsed = 0;
    try {
        parsed = std::stod(value, &used);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
    if (used == 0 || used != value.size() || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<json> parse_object(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

std::string string_member(const json& object, const char* key, const std::string& fallback = {}) {
    auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_boolean()) {
        return it->get<bool>() ? "ON" : "OFF";
    }
    if (it->is_number()) {
        return it->dump();
    }
    return fallback;
}

double round_to(double value, double step) {
    return std::round(value / step) * step;
}

json chime_json(const ChimeInfo& info) {
    return {{"name", info.name}, {"frames", info.frames}, {"duration", round_to(info.duration, 0.01)}};
}

HttpResponse ok(json extra = json::object()) {
    extra["result"] = "ok";
    return HttpResponse::json(HttpResponse::HTTP_OK, extra);
}

HttpResponse bad_request(const std::string& message) {
    return HttpResponse::error(HttpResponse::HTTP_BAD_REQUEST, message);
}

// s16le mono samples; odd trailing byte rejected by the caller
std::vector<int16_t> pcm_from_le_bytes(const std::string& body) {
    std::vector<int16_t> pcm(body.size() / 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        auto lo = static_cast<uint8_t>(body[2 * i]);
        auto hi = static_cast<uint8_t>(body[2 * i + 1]);
        pcm[i]  = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return pcm;
}

void register_stats_routes(HttpRouter& router, HubContext& ctx) {
    router.add_endpoint("GET", "/api/audio_stats", [&ctx](const HttpRequest& request) {
        RxStatsQuery query;

        if (const std::string* raw = request.query_param("window")) {
            auto window = parse_number(*raw);
            if (!window) {
                return bad_request("Invalid 'window' parameter");
            }
            query.window = std::max(0.0, *window);
        }

        if (const std::string* raw = request.query_param("sender")) {
            std::string sender = message_validator::sanitize_string(*raw, 64);
            std::transform(sender.begin(), sender.end(), sender.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (!message_validator::is_sender_hex(sender)) {
                return bad_request("Invalid 'sender' parameter");
            }
            query.sender = sender;
        }

        if (const std::string* raw = request.query_param("since")) {
            auto since = parse_number(*raw);
            if (!since) {
                return bad_request("Invalid 'since' parameter");
            }
            query.since = *since;
        }

        json senders = json::object();
        for (const auto& [sender, view]: ctx.rx_stats.query(query)) {
            senders[sender] = {
                {"first_rx", view.entry.first_rx},
                {"last_rx", view.entry.last_rx},
                {"packet_count", view.entry.packet_count},
                {"seq_min", view.entry.seq_min},
                {"seq_max", view.entry.seq_max},
                {"priority", static_cast<int>(view.entry.priority)},
                {"age_seconds", round_to(view.age_seconds, 0.001)},
                {"duration_seconds", round_to(view.duration_seconds, 0.001)},
            };
        }

        ChannelSnapshot snapshot = ctx.arbiter.snapshot();
        json            current_sender =
            snapshot.current_sender.empty() ? json(nullptr) : json(snapshot.current_sender);
        return HttpResponse::json(HttpResponse::HTTP_OK,
                                  {{"current_state", channel_mode_name(snapshot.mode)},
                                   {"current_sender", current_sender},
                                   {"senders", senders}});
    });

    router.add_endpoint("POST", "/api/audio_stats", [&ctx](const HttpRequest& request) {
        double older_than = 0.0;

        // A missing or non-JSON body clears everything
        auto body = parse_object(request.body);
        if (body && body->contains("older_than")) {
            const json&           value = (*body)["older_than"];
            std::optional<double> parsed;
            if (value.is_number()) {
                parsed = value.get<double>();
            } else if (value.is_string()) {
                parsed = parse_number(value.get<std::string>());
            }
            if (!parsed) {
                return bad_request("Invalid 'older_than' value, expected a number");
            }
            older_than = std::max(0.0, *parsed);
        }

        size_t cleared = ctx.rx_stats.clear(older_than);
        Log::info("Audio RX stats cleared: {} entries", cleared);
        return ok({{"cleared", cleared}});
    });
}

void register_chime_routes(HttpRouter& router, HubContext& ctx) {
    router.add_endpoint("GET", "/api/chimes", [&ctx](const HttpRequest&) {
        json chimes = json::array();
        for (const auto& info: ctx.chimes.list()) {
            chimes.push_back(chime_json(info));
        }
        return HttpResponse::json(HttpResponse::HTTP_OK,
                                  {{"chimes", chimes}, {"current", ctx.chimes.current()}});
    });

    router.add_endpoint("POST", "/api/chimes/upload", [&ctx](const HttpRequest& request) {
        const std::string* raw = request.query_param("name");
        if (raw == nullptr || raw->empty()) {
            return bad_request("Missing 'name' parameter");
        }
        std::string name = *raw;
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
            return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
        });

        auto        bytes = std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(request.body.data()), request.body.size());
        std::string error;
        auto        info = ctx.chimes.upload(name, bytes, error);
        if (!info) {
            return bad_request(error);
        }
        ctx.publisher.publish_state("chimes", ctx.chimes.names());
        return HttpResponse::json(HttpResponse::HTTP_OK, chime_json(*info));
    });

    router.add_prefix_endpoint("DELETE", "/api/chimes/", [&ctx](const HttpRequest& request) {
        std::string name     = request.path.substr(std::string("/api/chimes/").size());
        std::string previous = ctx.chimes.current();

        switch (ctx.chimes.remove(name)) {
            case ChimeDelete::InvalidName:
                return bad_request("Invalid chime name");
            case ChimeDelete::Protected:
                return bad_request(std::string("Cannot delete the default '") + DEFAULT_CHIME +
                                   "' chime");
            case ChimeDelete::NotFound:
                return HttpResponse::error(HttpResponse::HTTP_NOT_FOUND,
                                           "Chime '" + name + "' not found");
            case ChimeDelete::Deleted:
                break;
        }

        std::string current = ctx.chimes.current();
        if (current != previous) {
            ctx.publisher.publish_state("chime", current);
        }
        ctx.publisher.publish_state("chimes", ctx.chimes.names());
        return HttpResponse::json(HttpResponse::HTTP_OK, {{"deleted", name}, {"current", current}});
    });
}

void register_control_routes(HttpRouter& router, HubContext& ctx, ControlBridge& bridge) {
    router.add_endpoint("GET", "/api/state", [&ctx, &bridge](const HttpRequest&) {
        json state = bridge.state_json();

        json sessions = json::array();
        for (const auto& info: ctx.sessions.get_all_info()) {
            sessions.push_back({{"connection_id", info.connection_id},
                                {"client_id", info.client_id ? json(*info.client_id) : json(nullptr)},
                                {"remote_address", info.remote_address},
                                {"transmitting", info.transmitting}});
        }
        state["sessions"] = sessions;

        TransportCounters counters = ctx.metrics.snapshot();
        state["transport"]         = {{"tx_packets", counters.tx_packets},
                                      {"tx_errors", counters.tx_errors},
                                      {"rx_packets", counters.rx_packets},
                                      {"sequence_gaps", counters.sequence_gaps},
                                      {"duplicates", counters.duplicates},
                                      {"malformed", counters.malformed}};
        return HttpResponse::json(HttpResponse::HTTP_OK, state);
    });

    router.add_endpoint("POST", "/api/control", [&bridge](const HttpRequest& request) {
        auto body = parse_object(request.body);
        if (!body) {
            return bad_request("Expected a JSON object");
        }
        std::string field = string_member(*body, "field");
        if (field.empty() || !body->contains("value")) {
            return bad_request("Expected 'field' and 'value'");
        }
        if (!bridge.handle_command(field, string_member(*body, "value"))) {
            return bad_request("Rejected value for '" + field + "'");
        }
        return ok({{"state", bridge.state_json()}});
    });

    router.add_endpoint("POST", "/api/call", [&bridge](const HttpRequest& request) {
        auto body = parse_object(request.body);
        if (!body) {
            return bad_request("Expected a JSON object");
        }
        std::string target = string_member(*body, "target");
        if (target.empty()) {
            return bad_request("Missing 'target'");
        }
        bridge.on_call(target, string_member(*body, "caller", "Intercom"));
        return ok();
    });

    router.add_endpoint("POST", "/api/devices", [&ctx, &bridge](const HttpRequest& request) {
        auto body = parse_object(request.body);
        if (!body) {
            return bad_request("Expected a JSON object");
        }
        std::string id = string_member(*body, "id");
        bridge.on_device_discovered(id, string_member(*body, "room"), string_member(*body, "ip"));

        auto stored = ctx.devices.find(
            message_validator::sanitize_string(id, message_validator::MAX_CLIENT_ID_LENGTH));
        if (!stored) {
            return bad_request("Invalid device info");
        }
        return ok({{"targets", ctx.devices.target_options()}});
    });

    router.add_prefix_endpoint("DELETE", "/api/devices/", [&ctx, &bridge](const HttpRequest& request) {
        std::string id = request.path.substr(std::string("/api/devices/").size());
        if (!ctx.devices.find(id)) {
            return HttpResponse::error(HttpResponse::HTTP_NOT_FOUND, "Device not found");
        }
        bridge.on_device_offline(id);
        return ok({{"targets", ctx.devices.target_options()}});
    });

    router.add_prefix_endpoint("POST", "/api/devices/", [&bridge](const HttpRequest& request) {
        static const std::string suffix = "/state";
        std::string rest = request.path.substr(std::string("/api/devices/").size());
        if (rest.size() <= suffix.size() || !rest.ends_with(suffix)) {
            return HttpResponse::error(HttpResponse::HTTP_NOT_FOUND, "Endpoint not found");
        }
        std::string device = rest.substr(0, rest.size() - suffix.size());

        auto body = parse_object(request.body);
        if (!body) {
            return bad_request("Expected a JSON object");
        }
        bridge.on_device_state(device, string_member(*body, "state"),
                               string_member(*body, "target"));
        return ok();
    });

    router.add_endpoint("POST", "/api/announce", [&bridge](const HttpRequest& request) {
        if (request.body.empty() || request.body.size() % 2 != 0) {
            return bad_request("Expected 16-bit little-endian PCM at 16 kHz mono");
        }
        std::vector<int16_t> pcm     = pcm_from_le_bytes(request.body);
        const size_t         samples = pcm.size();
        if (!bridge.on_announce(std::move(pcm))) {
            return HttpResponse::error(HttpResponse::HTTP_CONFLICT, "Channel busy");
        }
        return ok({{"samples", samples},
                   {"duration", round_to(static_cast<double>(samples) / audio_constants::SAMPLE_RATE,
                                         0.01)}});
    });
}

}  // namespace

void register_api_routes(HttpRouter& router, HubContext& ctx, ControlBridge& bridge) {
    register_stats_routes(router, ctx);
    register_chime_routes(router, ctx);
    register_control_routes(router, ctx, bridge);
}
