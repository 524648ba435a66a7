#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include "audio_transmitter.h"
#include "hub_config.h"
#include "protocol.h"
#include "transport_metrics.h"

// Multicast/unicast UDP for the audio bus. One socket joined to the group for receiving,
// one for sending (TTL 1, no loopback). Packets carry the hub id and a per-hub sequence.
class UdpTransport : public AudioTransmitter {
public:
    using DatagramHandler = std::function<void(std::span<const uint8_t> datagram)>;

    // Opens and binds both sockets; throws std::runtime_error when that fails
    UdpTransport(asio::io_context& io_context, const HubConfig& config, TransportMetrics& metrics);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&)            = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    // Starts the receive loop on the io_context
    void start_receive(DatagramHandler handler);
    void stop();

    bool send_audio(std::span<const uint8_t> opus, Priority priority,
                    const std::optional<std::string>& unicast_ip) override;

    uint32_t next_sequence() const {
        return sequence_.load();
    }

private:
    void do_receive();
    void on_receive(std::error_code error_code, std::size_t bytes);

    const DeviceId    device_id_;
    const uint16_t    port_;
    TransportMetrics& metrics_;

    asio::ip::udp::socket   rx_socket_;
    asio::ip::udp::endpoint rx_remote_;
    asio::ip::udp::endpoint group_endpoint_;
    std::array<uint8_t, hub_config::RECV_BUF_SIZE> recv_buf_{};
    DatagramHandler                                handler_;

    std::mutex            tx_mutex_;
    asio::ip::udp::socket tx_socket_;
    std::atomic<uint32_t> sequence_{0};
};
