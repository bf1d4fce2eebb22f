#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ball/ball.h"

using PeerId = uint32_t;
using Bytes = std::vector<uint8_t>;

/**
 * Wire format: one tag byte followed by a MessagePack map.
 *
 *   0 WANT  { id, name, wants }
 *   1 SEND  { dest, ball: { y, x, sy, sx, color } }
 *   2 TAKE  reserved, empty body
 */
enum class MessageType : uint8_t {
    Want = 0,
    Send = 1,
    Take = 2,
};

/// "I am here", and whether the sender is waiting for a ball.
struct WantMessage {
    PeerId id = 0;
    std::string name;
    bool wants = true;

    bool operator==(const WantMessage& o) const {
        return id == o.id && name == o.name && wants == o.wants;
    }
};

/// A ball addressed to one node. Every listener sees it; only `dest` keeps it.
struct SendMessage {
    PeerId dest = 0;
    Ball ball;

    bool operator==(const SendMessage& o) const {
        return dest == o.dest && ball == o.ball;
    }
};

struct TakeMessage {
    bool operator==(const TakeMessage&) const { return true; }
};

using Message = std::variant<WantMessage, SendMessage, TakeMessage>;

Bytes encode_want(const WantMessage& msg);
Bytes encode_send(const SendMessage& msg);
Bytes encode_message(const Message& msg);

/// Decode a datagram. Malformed input is logged and yields std::nullopt.
std::optional<Message> decode_message(const uint8_t* data, std::size_t size);

inline std::optional<Message> decode_message(const Bytes& bytes) {
    return decode_message(bytes.data(), bytes.size());
}
