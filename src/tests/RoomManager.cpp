#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "../core/MemoryStateStore.hpp"
#include "../core/RoomManager.hpp"
#include "../core/TradeRules.hpp"
#include "TestSupport.hpp"

using namespace parley::core;
using parley::test::ErrorCodeOf;
using parley::test::FailingStore;

namespace
{
template <class Store = MemoryStateStore>
struct Fixture
{
    RoomStore rooms;
    SessionRegistry sessions;
    Store store;
    TradeRules rules;
    RoomManager mgr{rooms, sessions, store, rules, Config{}};
};
} // anonymous namespace

TEST(RoomManager, Create_Has_Four_Empty_Seats)
{
    Fixture<> f;
    Room const room = f.mgr.CreateRoom("  Friday night  ");
    EXPECT_EQ(room.name, "Friday night");
    EXPECT_EQ(room.room_id.size(), 32u);
    ASSERT_EQ(room.seats.size(), 4u);
    for (std::size_t i{}; i < 4; ++i)
    {
        EXPECT_EQ(room.seats[i].color, SeatOrder[i]);
        EXPECT_FALSE(room.seats[i].user_name.has_value());
    }
    EXPECT_FALSE(room.started);
    EXPECT_GE(room.board_seed, 1u);
    EXPECT_LT(room.board_seed, uint64_t{1} << 63);

    EXPECT_EQ(f.mgr.CreateRoom("   ").name, "Room");
    std::vector<Room> const listed = f.mgr.ListRooms();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_GE(listed[0].created_at, listed[1].created_at);
}

TEST(RoomManager, Join_Fills_Seats_In_Order)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;

    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    JoinResult const b = f.mgr.JoinRoom(id, " bob ");
    EXPECT_EQ(a.session.seat, Color::Red);
    EXPECT_EQ(b.session.seat, Color::Blue);
    EXPECT_EQ(b.session.name, "bob");
    EXPECT_FALSE(a.is_spectator);
    EXPECT_EQ(b.room.seats[1].user_name, "bob");

    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.JoinRoom(id, "  "); }), error::Code::Validation);
    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.JoinRoom("missing", "carol"); }), error::Code::NotFound);
}

TEST(RoomManager, Rejoin_Keeps_Seat)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const first = f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");
    JoinResult const again = f.mgr.JoinRoom(id, "alice");

    EXPECT_EQ(again.session.seat, Color::Red);
    EXPECT_NE(again.session.token, first.session.token);
    EXPECT_TRUE(f.sessions.Lookup(first.session.token).has_value());
    EXPECT_EQ(f.mgr.GetRoom(id).OccupiedCount(), 2u);
}

TEST(RoomManager, Full_Room_Makes_Spectators)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    for (std::string name : {"a", "b", "c", "d"}) f.mgr.JoinRoom(id, name);

    JoinResult const e = f.mgr.JoinRoom(id, "e");
    EXPECT_TRUE(e.is_spectator);
    EXPECT_FALSE(e.session.seat.has_value());
    EXPECT_EQ(f.mgr.GetRoom(id).OccupiedCount(), 4u);
}

TEST(RoomManager, Leave_Before_Start_Frees_Seat)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");

    Room const after = f.mgr.LeaveRoom(a.session);
    EXPECT_FALSE(after.seats[0].user_name.has_value());
    EXPECT_FALSE(f.sessions.Lookup(a.session.token).has_value());

    JoinResult const d = f.mgr.JoinRoom(id, "dave");
    EXPECT_EQ(d.session.seat, Color::Red);
}

TEST(RoomManager, Leave_After_Start)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");
    f.mgr.StartRoom(a.session);

    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.LeaveRoom(a.session); }), error::Code::Validation);
    EXPECT_EQ(f.mgr.GetRoom(id).seats[0].user_name, "alice");
    EXPECT_TRUE(f.sessions.Lookup(a.session.token).has_value());

    JoinResult const late = f.mgr.JoinRoom(id, "carol");
    EXPECT_TRUE(late.is_spectator);
    f.mgr.LeaveRoom(late.session);
    EXPECT_FALSE(f.sessions.Lookup(late.session.token).has_value());

    // Seated players reconnect by name after the start.
    EXPECT_EQ(f.mgr.JoinRoom(id, "bob").session.seat, Color::Blue);
}

TEST(RoomManager, Refresh_Board_Host_Only_Before_Start)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    JoinResult const b = f.mgr.JoinRoom(id, "bob");
    uint64_t const seed = f.mgr.GetRoom(id).board_seed;

    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.RefreshBoard(b.session); }), error::Code::Authorization);
    EXPECT_EQ(f.mgr.GetRoom(id).board_seed, seed);

    Room const refreshed = f.mgr.RefreshBoard(a.session);
    EXPECT_NE(refreshed.board_seed, seed);
    EXPECT_EQ(f.mgr.GetRoom(id).board_seed, refreshed.board_seed);

    f.mgr.StartRoom(a.session);
    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.RefreshBoard(a.session); }), error::Code::Validation);
}

TEST(RoomManager, Start_Needs_Two_Players)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");

    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.StartRoom(a.session); }), error::Code::Validation);
    EXPECT_FALSE(f.mgr.GetRoom(id).started);
    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.GetRoomGame(a.session, std::nullopt); }), error::Code::Validation);

    JoinResult const b = f.mgr.JoinRoom(id, "bob");
    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.StartRoom(b.session); }), error::Code::Authorization);

    GameId const game = f.mgr.StartRoom(a.session);
    Room const room = f.mgr.GetRoom(id);
    EXPECT_TRUE(room.started);
    EXPECT_EQ(room.game_id, game);
    EXPECT_EQ(room.latest_version, Version{0});

    Snapshot const snap = f.mgr.GetRoomGame(b.session, std::nullopt);
    EXPECT_EQ(snap.version, 0u);
    EXPECT_EQ(snap.state->Colors(), (std::vector{Color::Red, Color::Blue}));
    EXPECT_EQ(snap.state->board.seed, room.board_seed);
    EXPECT_EQ(f.store.ListEvents(game, std::string{events::GameCreated}).size(), 1u);

    EXPECT_EQ(f.mgr.StartRoom(a.session), game);
    EXPECT_EQ(f.store.ListSummaries(10).size(), 1u);
}

TEST(RoomManager, Start_Skips_Empty_Seats)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    JoinResult const b = f.mgr.JoinRoom(id, "bob");
    f.mgr.JoinRoom(id, "carol");
    f.mgr.LeaveRoom(b.session);

    f.mgr.StartRoom(a.session);
    Snapshot const snap = f.mgr.GetRoomGame(a.session, 0);
    EXPECT_EQ(snap.state->Colors(), (std::vector{Color::Red, Color::White}));
}

TEST(RoomManager, Failed_Start_Leaves_Room_Unstarted)
{
    Fixture<FailingStore> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");

    f.store.fail_appends = true;
    EXPECT_EQ(ErrorCodeOf([&] { f.mgr.StartRoom(a.session); }), error::Code::Internal);
    Room const room = f.mgr.GetRoom(id);
    EXPECT_FALSE(room.started);
    EXPECT_FALSE(room.game_id.has_value());
    EXPECT_TRUE(f.store.ListSummaries(10).empty());

    f.store.fail_appends = false;
    EXPECT_NO_THROW(f.mgr.StartRoom(a.session));
    EXPECT_TRUE(f.mgr.GetRoom(id).started);
}

TEST(RoomManager, Concurrent_Joins_Assign_Distinct_Seats)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;

    constexpr int Joiners = 16;
    std::vector<JoinResult> results(Joiners);
    std::vector<std::thread> pool;
    for (int i{}; i < Joiners; ++i)
    {
        pool.emplace_back([&, i] { results[i] = f.mgr.JoinRoom(id, fmt::format("player{}", i)); });
    }
    for (std::thread& th : pool) th.join();

    std::set<Color> seats;
    int spectators{};
    for (JoinResult const& r : results)
    {
        if (r.session.seat.has_value()) seats.insert(*r.session.seat);
        else ++spectators;
    }
    EXPECT_EQ(seats.size(), 4u);
    EXPECT_EQ(spectators, Joiners - 4);
    EXPECT_EQ(f.mgr.GetRoom(id).OccupiedCount(), 4u);
}

TEST(RoomManager, Concurrent_Starts_Create_One_Game)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    JoinResult const a = f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");

    constexpr int Starters = 8;
    std::vector<GameId> ids(Starters);
    std::vector<std::thread> pool;
    for (int i{}; i < Starters; ++i)
    {
        pool.emplace_back([&, i] { ids[i] = f.mgr.StartRoom(a.session); });
    }
    for (std::thread& th : pool) th.join();

    EXPECT_TRUE(std::ranges::all_of(ids, [&](GameId const& g) { return g == ids.front(); }));
    EXPECT_EQ(f.store.ListSummaries(10).size(), 1u);
}

TEST(RoomManager, Room_View_Marks_Caller)
{
    Fixture<> f;
    RoomId const id = f.mgr.CreateRoom("r").room_id;
    f.mgr.JoinRoom(id, "alice");
    f.mgr.JoinRoom(id, "bob");

    RoomView const v = MakeRoomView(f.mgr.GetRoom(id), Color::Blue);
    ASSERT_EQ(v.seats.size(), 4u);
    EXPECT_FALSE(v.seats[0].is_you);
    EXPECT_TRUE(v.seats[1].is_you);
    EXPECT_EQ(v.seats[1].user_name, "bob");
    EXPECT_EQ(v.board_preview.tiles.size(), constants::TileCount);
    EXPECT_EQ(v.created_at.back(), 'Z');

    RoomView const anon = MakeRoomView(f.mgr.GetRoom(id), std::nullopt);
    EXPECT_TRUE(std::ranges::none_of(anon.seats, [](SeatInfo const& s) { return s.is_you; }));
}
