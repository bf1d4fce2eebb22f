#pragma once

#include <asio.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <termios.h>

#include "config/config.h"
#include "network/multicast_transport.h"
#include "node/node.h"

/// `base` with line buffering and echo turned off, so each key is
/// delivered as soon as it is pressed.
termios keyboard_mode(const termios& base);

/**
 * Merges every event source onto one io_context thread: multicast
 * receive, frame / announce / status timers, keyboard input and
 * termination signals. Exactly one handler runs at a time.
 */
class EventLoop {
public:
    EventLoop(asio::io_context& io, Node& node, MulticastTransport& transport,
              const TimingConfig& timing);

    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Arm all sources. io_context::run() returns once stop() has been called.
    void start();
    void stop();

    void handle_command(Command cmd);

private:
    void schedule(asio::steady_timer& timer, std::chrono::milliseconds interval,
                  std::function<void()> tick);
    void read_input();
    void restore_terminal();

    Node& node_;
    MulticastTransport& transport_;
    TimingConfig timing_;

    asio::steady_timer frame_timer_;
    asio::steady_timer announce_timer_;
    asio::steady_timer status_timer_;
    asio::posix::stream_descriptor input_;
    asio::signal_set signals_;
    std::array<char, 64> input_buf_{};
    std::optional<termios> saved_termios_;  // set while stdin is in keyboard mode
    bool stopped_ = false;
};
