#include <doctest/doctest.h>

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "node/node.h"

using namespace std::chrono_literals;

namespace {

AppConfig test_config(AnnouncePolicy announce = AnnouncePolicy::Always) {
    AppConfig cfg;
    cfg.field = FieldConfig{40, 10};
    cfg.announce_policy = announce;
    return cfg;
}

/// In-memory multicast group: every datagram reaches every node, sender included.
class FakeGroup {
public:
    Node& join(PeerId id, const AppConfig& cfg = test_config()) {
        const std::string addr = "10.0.0." + std::to_string(id) + ":7777";
        nodes_.push_back(std::make_unique<Node>(
            cfg, id, "node" + std::to_string(id),
            [this, addr](const Bytes& b) { queue_.push_back({addr, b}); }, id));
        return *nodes_.back();
    }

    /// Deliver everything queued so far.
    void flush(Clock::time_point now) {
        while (!queue_.empty()) {
            const auto [from, bytes] = queue_.front();
            queue_.pop_front();
            for (auto& node : nodes_) {
                node->on_datagram(bytes.data(), bytes.size(), from, now);
            }
        }
    }

    /// Queued SENDs, decoded.
    std::vector<SendMessage> pending_sends() const {
        std::vector<SendMessage> out;
        for (const auto& d : queue_) {
            const auto msg = decode_message(d.second);
            if (msg && std::holds_alternative<SendMessage>(*msg)) {
                out.push_back(std::get<SendMessage>(*msg));
            }
        }
        return out;
    }

    std::size_t pending() const { return queue_.size(); }
    void drop_pending() { queue_.clear(); }

private:
    std::vector<std::unique_ptr<Node>> nodes_;
    std::deque<std::pair<std::string, Bytes>> queue_;
};

} // namespace

TEST_SUITE("node") {

TEST_CASE("command keys") {
    CHECK(command_from_key('b') == Command::AddBall);
    CHECK(command_from_key('r') == Command::Redraw);
    CHECK(command_from_key('q') == Command::Quit);
    CHECK_FALSE(command_from_key('x').has_value());
}

TEST_CASE("own announcements are not recorded as peers") {
    FakeGroup group;
    Node& a = group.join(3);
    REQUIRE(a.id() == 3);
    const auto t0 = Clock::now();
    a.on_announce_tick(t0);
    group.flush(t0);
    CHECK(a.peers().empty());
}

TEST_CASE("peer table tracks distinct announcers within the window") {
    FakeGroup group;
    Node& observer = group.join(1);
    std::vector<Node*> others;
    for (PeerId id = 2; id <= 6; ++id) others.push_back(&group.join(id));

    const auto t0 = Clock::now();
    for (int round = 0; round < 3; ++round) {
        for (Node* n : others) n->on_announce_tick(t0);
        group.flush(t0);
    }
    CHECK(observer.peers().size() == 5);
    CHECK(observer.peers().snapshot().front().address == "10.0.0.2:7777");
}

TEST_CASE("silent peers expire on the announce tick") {
    FakeGroup group;
    Node& a = group.join(3);
    Node& b = group.join(9);
    const auto t0 = Clock::now();

    b.on_announce_tick(t0);
    group.flush(t0);
    REQUIRE(a.peers().contains(9));

    a.on_announce_tick(t0 + 2s);
    group.drop_pending();
    CHECK(a.peers().contains(9));

    a.on_announce_tick(t0 + 4s);
    group.drop_pending();
    CHECK_FALSE(a.peers().contains(9));
}

TEST_CASE("two nodes hand one ball across") {
    FakeGroup group;
    Node& a = group.join(3);
    Node& b = group.join(9);
    const auto t0 = Clock::now();

    a.add_ball();
    REQUIRE(a.balls().size() == 1);
    CHECK(a.balls()[0].sx == 0);

    // B has nothing and asks for a ball.
    b.on_announce_tick(t0);
    group.flush(t0);
    REQUIRE(a.peers().contains(9));
    CHECK(a.balls()[0].sx == kKickSpeed);  // toward the higher id

    for (int i = 0; i < 16; ++i) a.on_frame();
    CHECK(a.balls().size() == 1);
    CHECK(group.pending() == 0);

    a.on_frame();
    CHECK(a.balls().empty());
    const auto sends = group.pending_sends();
    REQUIRE(sends.size() == 1);
    CHECK(sends[0].dest == 9);

    group.flush(t0);
    CHECK(a.balls().empty());
    REQUIRE(b.balls().size() == 1);
    CHECK(b.balls()[0].x == 0);
    CHECK(b.balls()[0].sx == kKickSpeed);
}

TEST_CASE("a busy holder's announcement does not attract its ball") {
    FakeGroup group;
    Node& a = group.join(3);
    Node& b = group.join(9);
    const auto t0 = Clock::now();

    a.add_ball();
    b.add_ball();
    // Both hold a ball, so both announce with wants = false.
    a.on_announce_tick(t0);
    b.on_announce_tick(t0);
    group.flush(t0);

    CHECK(a.peers().contains(9));
    CHECK(b.peers().contains(3));
    CHECK(a.balls()[0].sx == 0);
    CHECK(b.balls()[0].sx == 0);
}

TEST_CASE("isolated node bounces its ball instead of sending") {
    FakeGroup group;
    Node& a = group.join(3);
    const auto t0 = Clock::now();

    // A ball arrives from a node A has never heard announce.
    Ball ball;
    ball.y = 500;
    ball.sx = kKickSpeed;
    const Bytes send = encode_send(SendMessage{3, ball});
    a.on_datagram(send.data(), send.size(), "10.0.0.7:7777", t0);
    REQUIRE(a.balls().size() == 1);
    REQUIRE(a.peers().empty());

    for (int i = 0; i < 60; ++i) a.on_frame();
    CHECK(group.pending() == 0);
    REQUIRE(a.balls().size() == 1);
    CHECK(a.balls()[0].sx == -kKickSpeed);
}

TEST_CASE("losing the last peer halts seeking balls") {
    FakeGroup group;
    Node& a = group.join(3);
    Node& b = group.join(9);
    const auto t0 = Clock::now();

    a.add_ball();
    b.on_announce_tick(t0);
    group.flush(t0);
    REQUIRE(a.balls()[0].sx != 0);

    a.on_announce_tick(t0 + 4s);
    CHECK(a.peers().empty());
    CHECK(a.balls()[0].sx == 0);
}

TEST_CASE("SENDs for other nodes are all ignored") {
    FakeGroup group;
    Node& d = group.join(14);
    const auto t0 = Clock::now();

    for (PeerId dest : {11u, 12u, 13u}) {
        const Bytes send = encode_send(SendMessage{dest, Ball{500, 0, 0, kKickSpeed, 1}});
        d.on_datagram(send.data(), send.size(), "10.0.0.1:7777", t0);
    }
    CHECK(d.balls().empty());
}

TEST_CASE("malformed datagrams leave the node untouched") {
    FakeGroup group;
    Node& a = group.join(3);
    a.add_ball();
    const auto t0 = Clock::now();

    const uint8_t junk[] = {1, 0xff, 0x00, 0x13};
    a.on_datagram(junk, sizeof(junk), "10.0.0.66:7777", t0);
    const Bytes take = encode_message(TakeMessage{});
    a.on_datagram(take.data(), take.size(), "10.0.0.66:7777", t0);

    CHECK(a.peers().empty());
    CHECK(a.balls().size() == 1);
}

TEST_CASE("when_idle policy keeps ball holders quiet") {
    FakeGroup group;
    Node& a = group.join(3, test_config(AnnouncePolicy::WhenIdle));
    const auto t0 = Clock::now();

    a.on_announce_tick(t0);
    CHECK(group.pending() == 1);
    group.drop_pending();

    a.add_ball();
    a.on_announce_tick(t0 + 1s);
    CHECK(group.pending() == 0);
}

} // TEST_SUITE
