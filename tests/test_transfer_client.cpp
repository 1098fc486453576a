#include "dropshare/client/transfer_client.hpp"
#include "support/loopback.hpp"
#include "support/manual_scheduler.hpp"
#include "support/recorders.hpp"

#include <gtest/gtest.h>

#include <map>
#include <regex>
#include <stdexcept>

using namespace dropshare;
using namespace dropshare::client;
using namespace dropshare::testing;
using namespace std::chrono_literals;

namespace {

std::vector<std::uint8_t> random_bytes(std::size_t n, std::uint32_t seed) {
    std::vector<std::uint8_t> out(n);
    std::uint32_t x = seed;
    for (auto& b : out) {
        x = x * 1664525u + 1013904223u;
        b = static_cast<std::uint8_t>(x >> 24);
    }
    return out;
}

class SizeOnlySource : public ChunkSource {
public:
    explicit SizeOnlySource(std::uint64_t size) : size_(size) {}
    std::uint64_t size() const override { return size_; }
    std::vector<std::uint8_t> read(std::uint64_t, std::size_t) override { return {}; }

private:
    std::uint64_t size_;
};

} // namespace

class TransferClientTest : public ::testing::Test {
protected:
    TransferClientTest()
        : net(scheduler),
          alice(net.add("alice")),
          bob(net.add("bob")),
          carol(net.add("carol")) {
        alice.client().on_send_finished([this](const SenderPipeline& p) { sent[p.session().file_id] = p.state(); });
    }

    void join_all(const std::string& code) {
        for (auto* d : {&alice, &bob, &carol}) {
            net.connect(*d);
            d->client().join_room(code);
            scheduler.flush();
        }
    }

    std::vector<std::uint8_t> received_by(LoopbackNetwork::Device& d, const std::string& file_id) {
        auto file = d.client().receiver().take(file_id);
        return file ? file->data : std::vector<std::uint8_t>{};
    }

    std::map<std::string, SendState> sent;
    ManualScheduler scheduler;
    LoopbackNetwork net;
    LoopbackNetwork::Device& alice;
    LoopbackNetwork::Device& bob;
    LoopbackNetwork::Device& carol;
};

TEST_F(TransferClientTest, JoiningTracksPeersAndRoomStatus) {
    join_all("abc123");
    EXPECT_EQ(alice.client().id(), alice.connection_id());
    EXPECT_EQ(alice.client().room(), std::optional<std::string>("ABC123"));
    EXPECT_EQ(alice.client().peers(), (std::set<ConnectionId>{bob.connection_id(), carol.connection_id()}));
    EXPECT_EQ(carol.client().peers().size(), 2u);
    EXPECT_EQ(alice.client().room_status()["userCount"], 3);
    EXPECT_EQ(net.relay().registry().member_count("ABC123"), 3u);
}

TEST_F(TransferClientTest, CreatedRoomCanBeJoinedByCode) {
    net.connect(alice);
    auto code = alice.client().create_room();
    EXPECT_TRUE(is_valid_room_code(code));
    scheduler.flush();
    net.connect(bob);
    bob.client().join_room(code);
    scheduler.flush();
    EXPECT_EQ(bob.client().peers(), std::set<ConnectionId>{alice.connection_id()});
    EXPECT_TRUE(net.relay().registry().is_member(bob.connection_id(), code));
}

TEST_F(TransferClientTest, RejectedJoinReportsErrorAndLeavesNoRoom) {
    net.connect(alice);
    alice.client().join_room("ab");
    scheduler.flush();
    ASSERT_TRUE(alice.client().last_error().has_value());
    EXPECT_EQ(*alice.client().last_error(), "Room code must be 6 alphanumeric characters.");
    EXPECT_FALSE(alice.client().room().has_value());
}

TEST_F(TransferClientTest, SendingRequiresARoomWithOtherDevices) {
    net.connect(alice);
    EXPECT_THROW(alice.client().send_file(std::make_unique<MemorySource>(random_bytes(10, 1)), "a", "b"),
                 std::logic_error);
    alice.client().join_room("SOLO01");
    scheduler.flush();
    EXPECT_THROW(alice.client().send_file(std::make_unique<MemorySource>(random_bytes(10, 1)), "a", "b"),
                 std::logic_error);
}

TEST_F(TransferClientTest, FileIdsAreTimestampedAndUnique) {
    auto a = alice.client().generate_file_id();
    auto b = alice.client().generate_file_id();
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::regex_match(a, std::regex("[0-9]+-[0-9a-f]{8}")));
    EXPECT_EQ(a.substr(0, a.find('-')), std::to_string(scheduler.now_ms()));
}

TEST_F(TransferClientTest, EveryReceiverGetsAnIdenticalCopy) {
    join_all("ROOM42");
    auto payload = random_bytes(1'000'123, 7);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "photo.jpg", "image/jpeg");
    ASSERT_NE(alice.client().sender(id), nullptr);
    EXPECT_EQ(alice.client().sender(id)->chunk_count(), 16u);
    scheduler.advance(5s);

    EXPECT_EQ(sent[id], SendState::Done);
    EXPECT_EQ(alice.client().sender(id), nullptr) << "finished senders are dropped";

    auto at_bob = bob.client().receiver().take(id);
    ASSERT_TRUE(at_bob.has_value());
    EXPECT_EQ(at_bob->session.file_name, "photo.jpg");
    EXPECT_EQ(at_bob->session.mime_type, "image/jpeg");
    EXPECT_EQ(at_bob->session.sender_id, alice.connection_id());
    EXPECT_TRUE(at_bob->data == payload);
    EXPECT_TRUE(received_by(carol, id) == payload);
    EXPECT_FALSE(alice.client().receiver().take(id).has_value()) << "sender never receives its own chunks";
    EXPECT_FALSE(alice.client().has_active_transfers());
}

TEST_F(TransferClientTest, WindowedTransferOfManyChunksCompletes) {
    join_all("ROOM42");
    auto payload = random_bytes(3 * 1024 * 1024 + 17, 11);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "big.bin", "application/octet-stream");
    scheduler.advance(10s);
    EXPECT_EQ(sent[id], SendState::Done);
    EXPECT_TRUE(received_by(bob, id) == payload);
    EXPECT_TRUE(received_by(carol, id) == payload);
}

TEST_F(TransferClientTest, SenderReconnectResumesFromPersistedOffset) {
    join_all("ROOM42");
    auto payload = random_bytes(20 * 65536 + 5, 3);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "video.mp4", "video/mp4");
    scheduler.advance(32ms);

    net.disconnect(alice);
    scheduler.flush();
    auto* sender = alice.client().sender(id);
    ASSERT_EQ(sender->state(), SendState::Paused);
    auto paused_at = sender->next_index();
    EXPECT_GT(paused_at, 0u);
    EXPECT_LT(paused_at, sender->chunk_count());
    EXPECT_EQ(bob.client().peers().count(alice.connection_id()), 0u);

    scheduler.advance(100ms);
    net.connect(alice);
    scheduler.advance(10s);

    EXPECT_EQ(sent[id], SendState::Done);
    EXPECT_TRUE(received_by(bob, id) == payload);
    EXPECT_TRUE(received_by(carol, id) == payload);
}

TEST_F(TransferClientTest, ReceiverReconnectRepairsMissedChunks) {
    join_all("ROOM42");
    auto payload = random_bytes(40 * 65536, 5);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "archive.zip", "application/zip");
    scheduler.advance(22ms);

    net.disconnect(bob);
    scheduler.advance(20ms);
    net.connect(bob);
    scheduler.advance(20s);

    EXPECT_TRUE(received_by(carol, id) == payload);
    EXPECT_TRUE(received_by(bob, id) == payload);
    EXPECT_TRUE(bob.client().receiver().failures().empty());
    EXPECT_EQ(sent[id], SendState::Done);
}

TEST_F(TransferClientTest, LeavingPeerDoesNotBlockTheSender) {
    join_all("ROOM42");
    auto payload = random_bytes(30 * 65536, 9);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "doc.pdf", "application/pdf");
    scheduler.advance(20ms);
    bob.client().leave_room();
    scheduler.advance(5s);

    EXPECT_EQ(sent[id], SendState::Done);
    EXPECT_TRUE(received_by(carol, id) == payload);
    EXPECT_EQ(alice.client().peers().size(), 1u);
    EXPECT_FALSE(bob.client().room().has_value());
}

TEST_F(TransferClientTest, HeartbeatRoundTripsThroughRelay) {
    join_all("ROOM42");
    scheduler.advance(10s);
    auto& monitor = alice.client().monitor();
    EXPECT_EQ(monitor.health(), Health::Healthy);
    ASSERT_TRUE(monitor.latency_ms().has_value());
    EXPECT_EQ(*monitor.latency_ms(), 0);
    EXPECT_EQ(monitor.quality(), LinkQuality::Excellent);
}

TEST_F(TransferClientTest, RepeatedTransfersLeaveNoStateBehind) {
    join_all("ROOM42");
    std::vector<std::string> ids;
    for (std::uint32_t i = 0; i < 3; ++i) {
        auto payload = random_bytes(200'000 + i, 20 + i);
        ids.push_back(alice.client().send_file(std::make_unique<MemorySource>(payload), "part.bin",
                                               "application/octet-stream"));
        scheduler.advance(5s);
        EXPECT_TRUE(received_by(bob, ids.back()) == payload);
        EXPECT_TRUE(received_by(carol, ids.back()) == payload);
    }
    for (auto& id : ids) EXPECT_EQ(sent[id], SendState::Done);
    EXPECT_EQ(alice.client().sender_count(), 0u);
    EXPECT_EQ(bob.client().receiver().delivered_count(), 3u);

    scheduler.advance(61s);
    EXPECT_EQ(bob.client().receiver().delivered_count(), 0u);
    EXPECT_EQ(carol.client().receiver().delivered_count(), 0u);
    EXPECT_TRUE(bob.client().receiver().failures().empty());
}

TEST_F(TransferClientTest, OversizedOrBlockedFilesAreRefused) {
    join_all("ROOM42");
    TransferConfig limits;
    EXPECT_THROW(alice.client().send_file(std::make_unique<SizeOnlySource>(limits.max_file_size + 1), "movie.mkv",
                                          "video/x-matroska"),
                 std::invalid_argument);
    for (const char* name : {"setup.exe", "RUN.BAT", "script.Cmd", "saver.scr"})
        EXPECT_THROW(alice.client().send_file(std::make_unique<MemorySource>(random_bytes(10, 2)), name,
                                              "application/octet-stream"),
                     std::invalid_argument)
            << name;
    EXPECT_EQ(alice.client().sender_count(), 0u);

    auto id = alice.client().send_file(std::make_unique<MemorySource>(random_bytes(10, 2)), "readme.exe.txt",
                                       "text/plain");
    scheduler.advance(1s);
    EXPECT_EQ(sent[id], SendState::Done);
}

TEST_F(TransferClientTest, ForgedTransferFramesCannotCrashAReceiver) {
    join_all("ROOM42");
    bob.client().handle_frame(R"({"event":"file-info","data":{"fileId":"x1","fileSize":10,)"
                              R"("chunkCount":4000000000,"sender":"mallory"}})");
    bob.client().handle_frame(R"({"event":"file-chunk","data":{"fileId":"x1","chunkIndex":3999999999,)"
                              R"("data":"QQ==","sender":"mallory"}})");
    EXPECT_FALSE(bob.client().receiver().has_active());

    auto payload = random_bytes(70'000, 4);
    auto id = alice.client().send_file(std::make_unique<MemorySource>(payload), "after.bin", "application/octet-stream");
    scheduler.advance(5s);
    EXPECT_TRUE(received_by(bob, id) == payload);
}

TEST(TransferClient, AckAndResendIndicesBeyond32BitsAreIgnored) {
    RecordingChannel channel;
    ManualScheduler scheduler;
    TransferClient client(channel, scheduler);
    client.handle_event("room-status", nlohmann::json{{"roomId", "ROOM42"}, {"userCount", 2}});
    client.handle_event("user-joined", "r1");

    auto id = client.send_file(std::make_unique<MemorySource>(random_bytes(20 * 65536, 8)), "wide.bin",
                               "application/octet-stream");
    scheduler.advance(1s);
    ASSERT_EQ(channel.of("file-chunk").size(), 16u) << "window holds without acks";

    client.handle_event("file-ack", nlohmann::json{{"fileId", id}, {"received", 4294967312ull}, {"sender", "r1"}});
    client.handle_event("file-resend", nlohmann::json{{"fileId", id},
                                                      {"chunks", nlohmann::json::array({4294967296ull})},
                                                      {"sender", "r1"}});
    scheduler.advance(1s);
    EXPECT_EQ(channel.of("file-chunk").size(), 16u);
    ASSERT_NE(client.sender(id), nullptr);
    EXPECT_EQ(client.sender(id)->state(), SendState::Streaming);
}
