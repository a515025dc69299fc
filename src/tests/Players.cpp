#include <gtest/gtest.h>

#include <algorithm>

#include "../core/GreedyAi.hpp"
#include "../core/PlayerFactory.hpp"
#include "../core/RandomAi.hpp"
#include "../core/TradeRules.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"
#include "TestSupport.hpp"

using namespace parley::core;
using parley::test::Counts;

namespace
{
auto two_bots(uint64_t seed) -> GameState
{
    std::vector<SeatSpec> seats{{Color::Red, PlayerKind::Random}, {Color::Blue, PlayerKind::Random}};
    Config cfg{};
    cfg.seed = seed;
    return TradeRules{}.Initial(std::move(seats), BuildBoard(seed), cfg);
}
} // anonymous namespace

TEST(RandomAI, Only_Picks_Legal_Actions)
{
    TradeRules const rules;
    for (uint64_t seed : {1ull, 2ull, 3ull})
    {
        GameState s = two_bots(seed);
        RandomAI ai{seed};
        for (int step{}; step < 300 && !s.winner.has_value(); ++step)
        {
            std::vector<Action> const legal = rules.LegalActions(s);
            ASSERT_FALSE(legal.empty());
            Action const a = ai.Decide(s, legal);
            ASSERT_NE(std::ranges::find(legal, a), legal.end()) << Describe(a);
            ASSERT_TRUE(Execute(rules, s, a).has_value()) << Describe(a);
            parley::core::debug::CheckState(s);
        }
    }
}

TEST(GreedyAI, Accepts_Only_Helpful_Trades)
{
    TradeRules const rules;
    GameState s = two_bots(9);
    ASSERT_TRUE(Execute(rules, s, Action{Color::Red, RollAction{}}).has_value());
    s.hands[0] = Counts(0, 0, 3, 0, 0);
    s.hands[1] = Counts(2, 1, 0, 1, 0);

    // Sheep for wood: Blue swaps a spare wood for the sheep it lacks.
    GameState helpful = s;
    ASSERT_TRUE(Execute(rules, helpful,
        Action{Color::Red, OfferTradeAction{Counts(0, 0, 1, 0, 0), Counts(1, 0, 0, 0, 0)}}).has_value());
    GreedyAI greedy;
    EXPECT_EQ(greedy.Decide(helpful, rules.LegalActions(helpful)), (Action{Color::Blue, AcceptTradeAction{}}));

    // Brick and wheat for three sheep only costs Blue progress.
    s.hands[0] = Counts(0, 0, 3, 0, 0);
    GameState harmful = s;
    ASSERT_TRUE(Execute(rules, harmful,
        Action{Color::Red, OfferTradeAction{Counts(0, 0, 3, 0, 0), Counts(0, 1, 0, 1, 0)}}).has_value());
    EXPECT_EQ(greedy.Decide(harmful, rules.LegalActions(harmful)), (Action{Color::Blue, RejectTradeAction{}}));
}

TEST(GreedyAI, Builds_Before_Trading)
{
    TradeRules const rules;
    GameState s = two_bots(4);
    ASSERT_TRUE(Execute(rules, s, Action{Color::Red, RollAction{}}).has_value());
    GreedyAI greedy;

    s.hands[0] = Counts(1, 1, 1, 2, 3);
    EXPECT_EQ(greedy.Decide(s, rules.LegalActions(s)), (Action{Color::Red, BuildAction{Structure::City}}));

    s.hands[0] = Counts(1, 1, 1, 1, 0);
    EXPECT_EQ(greedy.Decide(s, rules.LegalActions(s)), (Action{Color::Red, BuildAction{Structure::Settlement}}));

    // Two spare ore: swapping one for wood moves toward a settlement.
    s.hands[0] = Counts(0, 1, 1, 1, 5);
    Action const a = greedy.Decide(s, rules.LegalActions(s));
    auto const* offer = std::get_if<OfferTradeAction>(&a.kind);
    ASSERT_NE(offer, nullptr) << Describe(a);
    EXPECT_GT(GreedyAI::Progress(Counts(1, 1, 1, 1, 4)), GreedyAI::Progress(s.hands[0]));

    // One offer per turn, then it ends the turn.
    s.offers_this_turn = 1;
    EXPECT_EQ(greedy.Decide(s, rules.LegalActions(s)), (Action{Color::Red, EndTurnAction{}}));
}

TEST(PlayerFactory, Creates_By_Kind)
{
    PlayerFactory const f;
    EXPECT_FALSE(f.Create(SeatSpec{Color::Red, PlayerKind::Human}, 1)->IsBot());
    EXPECT_TRUE(f.Create(SeatSpec{Color::Red, PlayerKind::Random}, 1)->IsBot());
    EXPECT_TRUE(f.Create(SeatSpec{Color::Red, PlayerKind::Greedy}, 1)->IsBot());

    parley::core::debug::RecordingFactory rec;
    GameState s = two_bots(2);
    TradeRules const rules;
    auto p = rec.Create(s.seats[0], 2);
    std::vector<Action> const legal = rules.LegalActions(s);
    Action const a = p->Decide(s, legal);
    ASSERT_EQ(rec.Log().size(), 1u);
    EXPECT_EQ(rec.Log().front(), a);
}
