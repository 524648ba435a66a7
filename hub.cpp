#include <csignal>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <utility>

#include <asio.hpp>
#include <spdlog/common.h>

#include "api_routes.h"
#include "audio_receiver.h"
#include "check.hpp"
#include "control_bridge.h"
#include "control_plane.h"
#include "http_api_server.h"
#include "http_router.h"
#include "hub_config.h"
#include "hub_context.h"
#include "logger.h"
#include "opus_decoder.h"
#include "opus_encoder.h"
#include "outbound_streamer.h"
#include "periodic_timer.h"
#include "udp_transport.h"
#include "web_ptt_handler.h"
#include "websocket_server.h"

namespace {

std::unique_ptr<FrameDecoder> make_rx_decoder() {
    auto decoder = OpusDecoderWrapper::factory()();
    require(decoder != nullptr, "opus decoder for the receive path");
    return decoder;
}

}  // namespace

// Owns every hub component. The audio io_context (UDP receive, idle detection) runs on its own
// thread; HTTP, metrics and signals share the control io_context on the main thread.
class Hub {
public:
    Hub(asio::io_context& control_io, HubConfig config)
        : ctx_(std::move(config), publisher_, OpusEncoderWrapper::factory()),
          transport_(audio_io_, ctx_.config, ctx_.metrics),
          streamer_(ctx_, transport_),
          bridge_(ctx_, streamer_),
          receiver_(ctx_, make_rx_decoder()),
          ptt_(ctx_, transport_,
               [this](const std::string& target, const std::string& caller) {
                   bridge_.place_call(target, caller);
               }),
          http_(control_io, ctx_.config.http_port, router_),
          websocket_(ctx_.config.ws_port, ptt_),
          housekeeping_timer_(audio_io_, "housekeeping", ctx_.config.housekeeping_interval,
                              [this]() { housekeeping(); }),
          metrics_timer_(control_io, "metrics", ctx_.config.metrics_report_interval,
                         [this]() { ctx_.metrics.report_and_reset(); }) {
        if (ctx_.chimes.load_all() > 0) {
            ctx_.chimes.select_or_fallback(DEFAULT_CHIME);
        } else {
            Log::warn("No chimes loaded, calls will be silent");
        }

        register_api_routes(router_, ctx_, bridge_);
        websocket_.start();

        transport_.start_receive(
            [this](std::span<const uint8_t> datagram) { receiver_.on_datagram(datagram); });
        housekeeping_timer_.start();
        metrics_timer_.start();

        bridge_.publish_all();
        audio_thread_ = std::thread([this]() { run_audio(); });

        Log::info("{} v{} ready (id {})", ctx_.config.device_name, hub_config::VERSION,
                  to_hex(ctx_.config.device_id));
    }

    ~Hub() {
        shutdown();
    }

    Hub(const Hub&)            = delete;
    Hub& operator=(const Hub&) = delete;

    void shutdown() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        Log::info("Shutting down");

        metrics_timer_.stop();
        http_.stop();
        websocket_.stop();
        streamer_.join();

        asio::post(audio_io_, [this]() {
            housekeeping_timer_.stop();
            transport_.stop();
        });
        audio_work_.reset();
        if (audio_thread_.joinable()) {
            audio_thread_.join();
        }
        ctx_.metrics.report_and_reset();
        Logger::instance().flush();
    }

private:
    void housekeeping() {
        receiver_.check_idle();
        ptt_.check_watchdog();
    }

    void run_audio() {
        try {
            audio_io_.run();
        } catch (const std::exception& e) {
            Log::error("Audio loop stopped: {}", e.what());
        }
    }

    asio::io_context                                                   audio_io_;
    asio::executor_work_guard<asio::io_context::executor_type>         audio_work_{
        audio_io_.get_executor()};
    RetainedStatePublisher                                             publisher_;
    HubContext                                                         ctx_;
    UdpTransport                                                       transport_;
    OutboundStreamer                                                   streamer_;
    ControlBridge                                                      bridge_;
    AudioReceiver                                                      receiver_;
    WebPttHandler                                                      ptt_;
    HttpRouter                                                         router_;
    HttpApiServer                                                      http_;
    WebSocketServer                                                    websocket_;
    PeriodicTimer                                                      housekeeping_timer_;
    PeriodicTimer                                                      metrics_timer_;
    std::thread                                                        audio_thread_;
    bool                                                               stopped_ = false;
};

int main(int argc, char** argv) {
    auto& log = Logger::instance();
    log.init(true, true, false, "", spdlog::level::info);

    try {
        HubConfig config = HubConfig::load(argc, argv);

        log.set_level(Logger::parse_level(config.log_level));
        if (!config.log_file.empty()) {
            log.init(true, true, true, config.log_file, Logger::parse_level(config.log_level));
        }

        asio::io_context control_io;
        Hub              hub(control_io, std::move(config));

        asio::signal_set signals(control_io, SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code error_code, int signal_number) {
            if (!error_code) {
                Log::info("Signal {} received", signal_number);
            }
            hub.shutdown();
            control_io.stop();
        });

        control_io.run();
    } catch (const std::exception& e) {
        Log::error("ERR: {}", e.what());
        log.flush();
        return 1;
    }
    log.flush();
    return 0;
}
