#include "udp_transport.h"

#include <utility>

#include "check.hpp"
#include "logger.h"
#include "packet_codec.h"

using asio::ip::udp;

UdpTransport::UdpTransport(asio::io_context& io_context, const HubConfig& config,
                           TransportMetrics& metrics)
    : device_id_(config.device_id),
      port_(config.audio_port),
      metrics_(metrics),
      rx_socket_(io_context),
      tx_socket_(io_context) {
    std::error_code ec;

    auto group = asio::ip::make_address(config.multicast_group, ec);
    throw_if_err(ec, "multicast group '" + config.multicast_group + "'");
    require(group.is_v4() && group.is_multicast(),
            "multicast group must be an IPv4 multicast address: " + config.multicast_group);
    group_endpoint_ = udp::endpoint(group, port_);

    // TX: stays on the local segment and never hears itself
    tx_socket_.open(udp::v4(), ec);
    throw_if_err(ec, "tx socket open");
    tx_socket_.set_option(asio::ip::multicast::hops(1), ec);
    throw_if_err(ec, "tx multicast ttl");
    tx_socket_.set_option(asio::ip::multicast::enable_loopback(false), ec);
    throw_if_err(ec, "tx multicast loopback");

    // RX: shared port, enlarged buffer, joined to the group
    rx_socket_.open(udp::v4(), ec);
    throw_if_err(ec, "rx socket open");
    rx_socket_.set_option(udp::socket::reuse_address(true), ec);
    throw_if_err(ec, "rx reuse_address");
    rx_socket_.set_option(asio::socket_base::receive_buffer_size(hub_config::RX_SOCKET_BUFFER),
                          ec);
    if (ec) {
        Log::warn("Could not enlarge RX buffer: {}", ec.message());
        ec.clear();
    }
    rx_socket_.bind(udp::endpoint(asio::ip::address_v4::any(), port_), ec);
    throw_if_err(ec, "rx bind port " + std::to_string(port_));
    rx_socket_.set_option(asio::ip::multicast::join_group(group.to_v4()), ec);
    throw_if_err(ec, "join multicast group " + config.multicast_group);

    Log::info("UDP audio on {}:{} (hub id {})", config.multicast_group, port_,
              to_hex(device_id_));
}

UdpTransport::~UdpTransport() {
    stop();
}

void UdpTransport::start_receive(DatagramHandler handler) {
    handler_ = std::move(handler);
    do_receive();
}

void UdpTransport::stop() {
    std::error_code ec;
    rx_socket_.close(ec);
    std::lock_guard<std::mutex> lock(tx_mutex_);
    tx_socket_.close(ec);
}

void UdpTransport::do_receive() {
    rx_socket_.async_receive_from(asio::buffer(recv_buf_), rx_remote_,
                                  [this](std::error_code error_code, std::size_t bytes) {
                                      on_receive(error_code, bytes);
                                  });
}

void UdpTransport::on_receive(std::error_code error_code, std::size_t bytes) {
    if (error_code) {
        if (error_code == asio::error::operation_aborted) {
            return;  // socket closed
        }
        Log::error("RX error: {}", error_code.message());
        do_receive();  // keep listening
        return;
    }

    if (handler_) {
        handler_(std::span<const uint8_t>(recv_buf_.data(), bytes));
    }

    do_receive();  // start next receive immediately
}

bool UdpTransport::send_audio(std::span<const uint8_t> opus, Priority priority,
                              const std::optional<std::string>& unicast_ip) {
    udp::endpoint target = group_endpoint_;
    if (unicast_ip) {
        std::error_code ec;
        auto            address = asio::ip::make_address(*unicast_ip, ec);
        if (ec) {
            Log::error("Invalid unicast address '{}': {}", *unicast_ip, ec.message());
            metrics_.record_tx(false);
            return false;
        }
        target = udp::endpoint(address, port_);
    }

    Bytes packet = packet_codec::encode(device_id_, sequence_.fetch_add(1), priority, opus);

    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(tx_mutex_);
        tx_socket_.send_to(asio::buffer(packet), target, 0, ec);
    }
    if (ec) {
        metrics_.record_tx(false);
        Log::error("sending {}: {}", unicast_ip ? "unicast to " + *unicast_ip : "multicast",
                   ec.message());
        return false;
    }
    metrics_.record_tx(true);
    return true;
}
