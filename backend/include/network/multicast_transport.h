#pragma once

#include <asio.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "config/config.h"
#include "protocol/messages.h"

/**
 * UDP multicast transport: one socket joined to the group for receiving,
 * one on an ephemeral port for sending. Delivery is unreliable, unordered
 * and may duplicate.
 */
class MulticastTransport {
public:
    using DatagramCallback = std::function<void(const uint8_t* data,
                                                std::size_t size,
                                                const std::string& from)>;

    static constexpr std::size_t kReceiveBufferSize = 1024;

    MulticastTransport(asio::io_context& io, const NetworkConfig& config);

    /// Create, bind and join. Returns false (after logging) on any failure.
    bool open();

    /// Start the asynchronous receive loop.
    void start();
    void stop();

    /// Set the callback invoked for every datagram received.
    void set_on_datagram(DatagramCallback cb);

    /// Send `payload` to the group. Errors are logged, never retried.
    void broadcast(const Bytes& payload);

private:
    void do_receive();

    NetworkConfig config_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::socket send_socket_;
    asio::ip::udp::endpoint group_;
    asio::ip::udp::endpoint sender_;
    std::array<uint8_t, kReceiveBufferSize> buffer_{};
    DatagramCallback on_datagram_;
};
