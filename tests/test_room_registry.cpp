#include "dropshare/room_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace dropshare;

TEST(RoomRegistry, JoinCreatesRoomAndIncrementsCount) {
    RoomRegistry reg;
    EXPECT_FALSE(reg.has_room("ABC123"));
    auto r = reg.join("c1", "abc123");
    EXPECT_EQ(r.status, JoinStatus::Joined);
    EXPECT_EQ(r.code, "ABC123");
    EXPECT_EQ(reg.member_count("ABC123"), 1u);
    reg.join("c2", "ABC123");
    EXPECT_EQ(reg.member_count("ABC123"), 2u);
    EXPECT_EQ(reg.members("ABC123"), (std::vector<ConnectionId>{"c1", "c2"}));
}

TEST(RoomRegistry, RejectsCodesThatAreNotSixCharacters) {
    RoomRegistry reg;
    EXPECT_EQ(reg.join("c1", "AB-12").status, JoinStatus::InvalidCode);
    EXPECT_EQ(reg.join("c1", "!!!").status, JoinStatus::InvalidCode);
    EXPECT_EQ(reg.room_count(), 0u);
}

TEST(RoomRegistry, RepeatedJoinDoesNotDuplicateMember) {
    RoomRegistry reg;
    reg.join("c1", "ABC123");
    auto again = reg.join("c1", "ABC123");
    EXPECT_EQ(again.status, JoinStatus::Joined);
    EXPECT_EQ(reg.member_count("ABC123"), 1u);
}

TEST(RoomRegistry, RejectsEleventhMember) {
    RoomRegistry reg;
    for (int i = 0; i < 10; ++i) EXPECT_EQ(reg.join("c" + std::to_string(i), "ROOM01").status, JoinStatus::Joined);
    EXPECT_EQ(reg.join("late", "ROOM01").status, JoinStatus::RoomFull);
    EXPECT_EQ(reg.member_count("ROOM01"), 10u);
    // A current member re-joining is not a capacity violation.
    EXPECT_EQ(reg.join("c3", "ROOM01").status, JoinStatus::Joined);
}

TEST(RoomRegistry, LeaveRemovesAndDeletesEmptyRoom) {
    RoomRegistry reg;
    reg.join("c1", "ABC123");
    reg.join("c2", "ABC123");

    auto d = reg.leave("c1", "ABC123");
    ASSERT_TRUE(d);
    EXPECT_EQ(d->remaining, std::vector<ConnectionId>{"c2"});
    EXPECT_FALSE(d->room_deleted);

    d = reg.leave("c2", "ABC123");
    ASSERT_TRUE(d);
    EXPECT_TRUE(d->remaining.empty());
    EXPECT_TRUE(d->room_deleted);
    EXPECT_FALSE(reg.has_room("ABC123"));
}

TEST(RoomRegistry, LeaveByNonMemberIsIgnored) {
    RoomRegistry reg;
    reg.join("c1", "ABC123");
    EXPECT_FALSE(reg.leave("c9", "ABC123"));
    EXPECT_FALSE(reg.leave("c1", "ZZZ999"));
    EXPECT_EQ(reg.member_count("ABC123"), 1u);
}

TEST(RoomRegistry, RemoveEverywhereCleansEveryMembership) {
    RoomRegistry reg;
    reg.join("c1", "AAAAAA");
    reg.join("c1", "BBBBBB");
    reg.join("c2", "BBBBBB");

    auto departures = reg.remove_everywhere("c1");
    EXPECT_EQ(departures.size(), 2u);
    EXPECT_FALSE(reg.has_room("AAAAAA"));
    EXPECT_EQ(reg.members("BBBBBB"), std::vector<ConnectionId>{"c2"});
    EXPECT_TRUE(reg.remove_everywhere("c1").empty());
}

TEST(RoomRegistry, SweepHasNothingToDoWhenCleanupIsEager) {
    RoomRegistry reg;
    reg.join("c1", "ABC123");
    reg.leave("c1", "ABC123");
    EXPECT_EQ(reg.sweep_empty(), 0u);
    EXPECT_EQ(reg.room_count(), 0u);
}

TEST(RoomRegistry, ConcurrentJoinsAtNineMembersAdmitExactlyOne) {
    for (int round = 0; round < 50; ++round) {
        RoomRegistry reg;
        for (int i = 0; i < 9; ++i) reg.join("m" + std::to_string(i), "ROOM01");

        std::atomic<bool> go{false};
        std::atomic<int> joined{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 2; ++t) {
            threads.emplace_back([&, t] {
                while (!go.load()) {}
                if (reg.join("racer" + std::to_string(t), "ROOM01").status == JoinStatus::Joined) ++joined;
            });
        }
        go = true;
        for (auto& th : threads) th.join();

        EXPECT_EQ(joined.load(), 1);
        EXPECT_EQ(reg.member_count("ROOM01"), 10u);
    }
}
