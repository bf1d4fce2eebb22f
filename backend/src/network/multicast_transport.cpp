/**
 * MulticastTransport — group membership and datagram I/O.
 *
 * Uses standalone ASIO. Receive completions run on the io_context thread,
 * which is the same thread that owns the Node, so handlers never race.
 */

#include "network/multicast_transport.h"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

using asio::ip::udp;

namespace {

bool fail(const char* what, const asio::error_code& ec) {
    spdlog::error("Multicast {} failed: {}", what, ec.message());
    return false;
}

std::string endpoint_to_string(const udp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

MulticastTransport::MulticastTransport(asio::io_context& io, const NetworkConfig& config)
    : config_(config), socket_(io), send_socket_(io) {}

bool MulticastTransport::open() {
    asio::error_code ec;

    const auto group = asio::ip::make_address_v4(config_.group, ec);
    if (ec) return fail("group address", ec);
    if (!group.is_multicast()) {
        spdlog::error("{} is not a multicast address", config_.group);
        return false;
    }
    group_ = udp::endpoint(group, config_.port);

    asio::ip::address_v4 iface = asio::ip::address_v4::any();
    if (!config_.interface_address.empty()) {
        iface = asio::ip::make_address_v4(config_.interface_address, ec);
        if (ec) return fail("interface address", ec);
    }

    socket_.open(udp::v4(), ec);
    if (ec) return fail("socket create", ec);
    socket_.set_option(udp::socket::reuse_address(true), ec);
    if (ec) return fail("SO_REUSEADDR", ec);
    socket_.bind(udp::endpoint(asio::ip::address_v4::any(), config_.port), ec);
    if (ec) return fail("bind", ec);
    socket_.set_option(asio::ip::multicast::join_group(group, iface), ec);
    if (ec) return fail("join", ec);

    send_socket_.open(udp::v4(), ec);
    if (ec) return fail("send socket create", ec);
    if (!config_.interface_address.empty()) {
        send_socket_.set_option(asio::ip::multicast::outbound_interface(iface), ec);
        if (ec) return fail("outbound interface", ec);
    }
    send_socket_.bind(udp::endpoint(asio::ip::address_v4::any(), 0), ec);
    if (ec) return fail("send socket bind", ec);

    spdlog::info("Joined multicast group {}{}", endpoint_to_string(group_),
                 config_.interface_address.empty() ? "" : " via " + config_.interface_address);
    return true;
}

void MulticastTransport::start() {
    do_receive();
}

void MulticastTransport::stop() {
    asio::error_code ec;
    socket_.close(ec);
    if (ec) spdlog::warn("Closing multicast socket: {}", ec.message());
    send_socket_.close(ec);
    if (ec) spdlog::warn("Closing send socket: {}", ec.message());
}

void MulticastTransport::set_on_datagram(DatagramCallback cb) {
    on_datagram_ = std::move(cb);
}

void MulticastTransport::broadcast(const Bytes& payload) {
    if (payload.size() > kReceiveBufferSize) {
        spdlog::warn("Sending {} byte datagram, listeners will truncate it", payload.size());
    }
    auto buf = std::make_shared<Bytes>(payload);
    send_socket_.async_send_to(
        asio::buffer(*buf), group_,
        [buf](const asio::error_code& ec, std::size_t /*sent*/) {
            if (ec && ec != asio::error::operation_aborted) {
                spdlog::error("Multicast send failed: {}", ec.message());
            }
        });
}

void MulticastTransport::do_receive() {
    socket_.async_receive_from(
        asio::buffer(buffer_), sender_,
        [this](const asio::error_code& ec, std::size_t n) {
            if (ec == asio::error::operation_aborted) return;
            if (ec) {
                spdlog::error("Multicast receive failed: {}", ec.message());
            } else if (n > 0 && on_datagram_) {
                on_datagram_(buffer_.data(), n, endpoint_to_string(sender_));
            }
            if (socket_.is_open()) do_receive();
        });
}
