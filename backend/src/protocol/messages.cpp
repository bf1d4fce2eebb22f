/**
 * Message codec — WANT / SEND / TAKE datagrams.
 *
 * Bodies are MessagePack maps produced by nlohmann::json, so fields can be
 * added later without breaking older listeners: unknown keys are ignored
 * and optional keys fall back to their defaults.
 */

#include "protocol/messages.h"

#include <limits>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

Bytes with_tag(MessageType type, const json& body) {
    Bytes out;
    out.push_back(static_cast<uint8_t>(type));
    json::to_msgpack(body, out);
    return out;
}

std::optional<PeerId> read_peer_id(const json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || !it->is_number_unsigned()) return std::nullopt;
    const auto value = it->get<uint64_t>();
    if (value > std::numeric_limits<PeerId>::max()) return std::nullopt;
    return static_cast<PeerId>(value);
}

json ball_to_json(const Ball& b) {
    return json{{"y", b.y}, {"x", b.x}, {"sy", b.sy}, {"sx", b.sx}, {"color", b.color}};
}

std::optional<int> read_ball_field(const json& ball, const char* key, int lo, int hi) {
    const auto it = ball.find(key);
    if (it == ball.end() || !it->is_number_integer()) return std::nullopt;
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(hi)) {
        return std::nullopt;
    }
    const auto value = it->get<int64_t>();
    if (value < lo || value > hi) return std::nullopt;
    return static_cast<int>(value);
}

// Every field must be an integer within physics range, or the ball is rejected.
std::optional<Ball> ball_from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    const auto y = read_ball_field(j, "y", -kMaxBallValue, kMaxBallValue);
    const auto x = read_ball_field(j, "x", -kMaxBallValue, kMaxBallValue);
    const auto sy = read_ball_field(j, "sy", -kMaxBallValue, kMaxBallValue);
    const auto sx = read_ball_field(j, "sx", -kMaxBallValue, kMaxBallValue);
    const auto color = read_ball_field(j, "color", kMinColor, kMaxColor);
    if (!y || !x || !sy || !sx || !color) return std::nullopt;

    Ball b;
    b.y = *y;
    b.x = *x;
    b.sy = *sy;
    b.sx = *sx;
    b.color = *color;
    return b;
}

} // namespace

Bytes encode_want(const WantMessage& msg) {
    return with_tag(MessageType::Want,
                    json{{"id", msg.id}, {"name", msg.name}, {"wants", msg.wants}});
}

Bytes encode_send(const SendMessage& msg) {
    return with_tag(MessageType::Send,
                    json{{"dest", msg.dest}, {"ball", ball_to_json(msg.ball)}});
}

Bytes encode_message(const Message& msg) {
    struct Encoder {
        Bytes operator()(const WantMessage& m) const { return encode_want(m); }
        Bytes operator()(const SendMessage& m) const { return encode_send(m); }
        Bytes operator()(const TakeMessage&) const {
            return with_tag(MessageType::Take, json::object());
        }
    };
    return std::visit(Encoder{}, msg);
}

std::optional<Message> decode_message(const uint8_t* data, std::size_t size) {
    if (size == 0) {
        spdlog::warn("Dropping empty datagram");
        return std::nullopt;
    }

    const auto tag = data[0];
    try {
        const json body = json::from_msgpack(data + 1, data + size);
        if (!body.is_object()) {
            spdlog::warn("Dropping message with tag {}: body is not a map", tag);
            return std::nullopt;
        }

        switch (static_cast<MessageType>(tag)) {
        case MessageType::Want: {
            const auto id = read_peer_id(body, "id");
            if (!id) break;
            WantMessage want;
            want.id = *id;
            want.name = body.at("name").get<std::string>();
            want.wants = body.value("wants", true);
            return want;
        }
        case MessageType::Send: {
            const auto dest = read_peer_id(body, "dest");
            if (!dest) break;
            const auto ball = ball_from_json(body.at("ball"));
            if (!ball) {
                spdlog::warn("Dropping SEND for {}: invalid ball", *dest);
                return std::nullopt;
            }
            SendMessage send;
            send.dest = *dest;
            send.ball = *ball;
            return send;
        }
        case MessageType::Take:
            return TakeMessage{};
        default:
            spdlog::warn("Dropping message with unknown tag {}", tag);
            return std::nullopt;
        }
        spdlog::warn("Dropping message with tag {}: missing or invalid peer id", tag);
    } catch (const json::exception& e) {
        spdlog::warn("Dropping malformed message with tag {}: {}", tag, e.what());
    }
    return std::nullopt;
}
