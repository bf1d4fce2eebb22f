/**
 * EventLoop — single-threaded merge of all event sources.
 *
 * Timers are rescheduled from their previous expiry, not from "now", so a
 * slow handler does not make the announce rate drift.
 *
 * When stdin is a terminal it is switched out of canonical mode for the
 * life of the loop and restored on stop.
 */

#include "node/event_loop.h"

#include <csignal>
#include <iostream>
#include <unistd.h>
#include <utility>

#include <spdlog/spdlog.h>

#include "view/status_view.h"

EventLoop::EventLoop(asio::io_context& io, Node& node, MulticastTransport& transport,
                     const TimingConfig& timing)
    : node_(node),
      transport_(transport),
      timing_(timing),
      frame_timer_(io),
      announce_timer_(io),
      status_timer_(io),
      input_(io),
      signals_(io, SIGINT, SIGTERM) {}

EventLoop::~EventLoop() {
    restore_terminal();
}

termios keyboard_mode(const termios& base) {
    termios mode = base;
    mode.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    mode.c_cc[VMIN] = 1;
    mode.c_cc[VTIME] = 0;
    return mode;
}

void EventLoop::start() {
    transport_.start();

    const auto now = asio::steady_timer::clock_type::now();
    frame_timer_.expires_at(now);
    announce_timer_.expires_at(now);
    status_timer_.expires_at(now);

    schedule(frame_timer_, timing_.frame, [this] { node_.on_frame(); });
    schedule(announce_timer_, timing_.announce,
             [this] { node_.on_announce_tick(Clock::now()); });
    schedule(status_timer_, timing_.status, [this] { node_.on_status_tick(); });

    signals_.async_wait([this](const asio::error_code& ec, int signo) {
        if (ec) return;
        spdlog::info("Caught signal {}, shutting down", signo);
        stop();
    });

    asio::error_code ec;
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        spdlog::warn("No keyboard input available");
        return;
    }
    input_.assign(fd, ec);
    if (ec) {
        // Regular files and /dev/null cannot be polled.
        spdlog::warn("Keyboard input disabled: {}", ec.message());
        ::close(fd);
        return;
    }

    if (::isatty(STDIN_FILENO)) {
        termios base{};
        if (::tcgetattr(STDIN_FILENO, &base) != 0) {
            spdlog::warn("Cannot read terminal mode, keys need Enter");
        } else {
            const termios mode = keyboard_mode(base);
            if (::tcsetattr(STDIN_FILENO, TCSANOW, &mode) != 0) {
                spdlog::warn("Cannot set terminal mode, keys need Enter");
            } else {
                saved_termios_ = base;
            }
        }
    }
    read_input();
}

void EventLoop::stop() {
    if (stopped_) return;
    stopped_ = true;

    frame_timer_.cancel();
    announce_timer_.cancel();
    status_timer_.cancel();

    asio::error_code ec;
    signals_.cancel(ec);
    input_.close(ec);
    restore_terminal();
    transport_.stop();
}

void EventLoop::restore_terminal() {
    if (!saved_termios_) return;
    if (::tcsetattr(STDIN_FILENO, TCSANOW, &*saved_termios_) != 0) {
        spdlog::warn("Cannot restore terminal mode");
    }
    saved_termios_.reset();
}

void EventLoop::handle_command(Command cmd) {
    switch (cmd) {
    case Command::AddBall:
        node_.add_ball();
        break;
    case Command::Redraw:
        render_status(std::cout, node_.peers().snapshot(), node_.balls());
        break;
    case Command::Quit:
        spdlog::info("Quit requested");
        stop();
        break;
    }
}

void EventLoop::schedule(asio::steady_timer& timer, std::chrono::milliseconds interval,
                         std::function<void()> tick) {
    timer.expires_at(timer.expiry() + interval);
    timer.async_wait([this, &timer, interval, tick = std::move(tick)](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || stopped_) return;
        if (ec) {
            spdlog::error("Timer failed: {}", ec.message());
            return;
        }
        tick();
        if (!stopped_) schedule(timer, interval, tick);
    });
}

void EventLoop::read_input() {
    input_.async_read_some(
        asio::buffer(input_buf_),
        [this](const asio::error_code& ec, std::size_t n) {
            if (ec) {
                if (ec == asio::error::eof) {
                    spdlog::info("Input closed, keyboard commands disabled");
                } else if (ec != asio::error::operation_aborted) {
                    spdlog::error("Input read failed: {}", ec.message());
                }
                return;
            }
            for (std::size_t i = 0; i < n && !stopped_; ++i) {
                if (const auto cmd = command_from_key(input_buf_[i])) {
                    handle_command(*cmd);
                }
            }
            if (!stopped_) read_input();
        });
}
