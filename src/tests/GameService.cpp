#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "../core/GameService.hpp"
#include "../core/MemoryStateStore.hpp"
#include "../core/TradeRules.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace parley::core;
using parley::test::ErrorCodeOf;
using parley::test::OfferPayload;
using parley::test::Payload;
using parley::test::ScriptedFactory;
using parley::test::Throws;

namespace
{
struct Games
{
    explicit Games(Config cfg = Config{1, 77}) : svc{store, rules, advancer, cfg} {}

    MemoryStateStore store;
    TradeRules rules;
    PlayerFactory players;
    TurnAdvancer advancer{rules, players};
    GameService svc;
};

constexpr auto H = PlayerKind::Human;
constexpr auto R = PlayerKind::Random;
constexpr auto G = PlayerKind::Greedy;
} // anonymous namespace

TEST(GameService, Create_Needs_Two_To_Four)
{
    Games g;
    std::vector<PlayerKind> const one{H};
    std::vector<PlayerKind> const five{H, H, H, H, H};
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.CreateGame(one); }), error::Code::Validation);
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.CreateGame(five); }), error::Code::Validation);
    EXPECT_TRUE(g.svc.ListGames().empty());

    std::vector<PlayerKind> const four{H, R, G, H};
    GameId const id = g.svc.CreateGame(four);
    Snapshot const snap = g.svc.GetGame(id, std::nullopt);
    EXPECT_EQ(snap.version, 0u);
    EXPECT_EQ(snap.state->Colors(), (std::vector{Color::Red, Color::Blue, Color::White, Color::Orange}));
    EXPECT_TRUE(snap.view.seats[1].is_bot);
    EXPECT_FALSE(snap.view.seats[3].is_bot);
    EXPECT_EQ(snap.state->board.seed, 77u);

    std::vector<Event> const created = g.svc.ListEvents(id, std::string{events::GameCreated});
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].payload.at("players"), "HUMAN,RANDOM,GREEDY,HUMAN");
    EXPECT_EQ(g.svc.ListGames().size(), 1u);
}

TEST(GameService, Human_Turn_Needs_Payload)
{
    Games g;
    std::vector<PlayerKind> const kinds{H, R};
    GameId const id = g.svc.CreateGame(kinds);

    try
    {
        g.svc.PostAction(id, std::nullopt);
        FAIL() << "expected a validation error";
    }
    catch (error::ValidationError const& e)
    {
        EXPECT_EQ(e.what(), "action payload required when it's a human player's turn");
    }

    EXPECT_EQ(ErrorCodeOf([&] { g.svc.PostAction(id, Payload(Color::Blue, "ROLL")); }), error::Code::Validation);
    EXPECT_EQ(g.svc.PostAction(id, Payload(Color::Red, "ROLL")).version, 1u);
    EXPECT_EQ(g.svc.PostAction(id, Payload(Color::Red, "END_TURN")).view.current_color, Color::Blue);
}

TEST(GameService, Bot_Tick_Advances_One_Action)
{
    Games g;
    std::vector<PlayerKind> const kinds{R, H};
    GameId const id = g.svc.CreateGame(kinds);

    Snapshot const snap = g.svc.PostAction(id, std::nullopt);
    EXPECT_EQ(snap.version, 1u);
    EXPECT_TRUE(snap.state->rolled);

    std::vector<Event> const applied = g.svc.ListEvents(id, std::string{events::ActionApplied});
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied[0].payload.at("action"), "RED:ROLL");
    EXPECT_EQ(applied[0].payload.at("bot"), "true");
}

TEST(GameService, Human_Offer_Is_Answered_By_Bots)
{
    Games g;
    std::vector<PlayerKind> const kinds{H, G, R};
    GameId const id = g.svc.CreateGame(kinds);

    g.svc.PostAction(id, Payload(Color::Red, "ROLL"));
    Snapshot const snap = g.svc.PostAction(id, OfferPayload(Color::Red, {1, 0, 0, 0, 0}, {0, 1, 0, 0, 0}));

    // v1 roll, v2 offer, v3 both bot answers
    EXPECT_EQ(snap.version, 3u);
    EXPECT_NE(snap.view.prompt, Prompt::DecideTrade);
    EXPECT_EQ(snap.view.current_color, Color::Red);

    std::vector<Event> const answers = g.svc.ListEvents(id, std::string{events::BotResponses});
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].version, Version{3});
    EXPECT_EQ(answers[0].payload.at("count"), "2");
    debug::CheckLedger(g.store, id);
}

TEST(GameService, Forced_Reject_Is_Recorded_In_Bot_Responses)
{
    MemoryStateStore store;
    TradeRules rules;
    ScriptedFactory players;
    players.Script(Color::Blue, Throws("bot crashed"));
    TurnAdvancer advancer{rules, players};
    GameService svc{store, rules, advancer, Config{1, 77}};

    std::vector<PlayerKind> const kinds{H, R};
    GameId const id = svc.CreateGame(kinds);
    svc.PostAction(id, Payload(Color::Red, "ROLL"));
    Snapshot const snap = svc.PostAction(id, OfferPayload(Color::Red, {1, 0, 0, 0, 0}, {0, 1, 0, 0, 0}));
    EXPECT_EQ(snap.view.prompt, Prompt::PlayTurn);
    EXPECT_FALSE(snap.view.negotiation.has_value());

    std::vector<Event> const answers = svc.ListEvents(id, std::string{events::BotResponses});
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].payload.at("count"), "1");
    EXPECT_EQ(answers[0].payload.at("forced"), "BLUE");

    // Forced rejects live inside BOT_RESPONSES; no other event type is written.
    std::set<std::string> types;
    for (Event const& ev : svc.ListEvents(id, std::nullopt)) types.insert(ev.type);
    EXPECT_EQ(types, (std::set<std::string>{std::string{events::GameCreated}, std::string{events::ActionApplied},
                                            std::string{events::BotResponses}}));
}

TEST(GameService, Decided_Game_Returns_Latest)
{
    Games g{Config{1, 5}};
    std::vector<PlayerKind> const kinds{H, R};
    GameId const id = g.svc.CreateGame(kinds);
    g.svc.PostAction(id, Payload(Color::Red, "ROLL"));
    ActionPayload build = Payload(Color::Red, "BUILD");
    build.structure = "SETTLEMENT";
    Snapshot const won = g.svc.PostAction(id, build);
    ASSERT_EQ(won.view.winner, Color::Red);

    Snapshot const again = g.svc.PostAction(id, Payload(Color::Red, "END_TURN"));
    EXPECT_EQ(again.version, won.version);
    EXPECT_EQ(g.svc.PostAction(id, std::nullopt).version, won.version);
}

TEST(GameService, Delete_And_Lookups)
{
    Games g;
    std::vector<PlayerKind> const kinds{R, R};
    GameId const id = g.svc.CreateGame(kinds);
    g.svc.PostAction(id, std::nullopt);

    EXPECT_EQ(g.svc.GetGame(id, 0).version, 0u);
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.GetGame(id, 9); }), error::Code::NotFound);

    g.svc.DeleteGame(id);
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.GetGame(id, std::nullopt); }), error::Code::NotFound);
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.DeleteGame(id); }), error::Code::NotFound);
    EXPECT_EQ(ErrorCodeOf([&] { g.svc.PostAction(id, std::nullopt); }), error::Code::NotFound);
    EXPECT_TRUE(g.svc.ListEvents(id, std::nullopt).empty());
}
