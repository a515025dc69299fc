#include <gtest/gtest.h>

#include <algorithm>
#include <ranges>
#include <utility>

#include "../core/TradeRules.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace parley::core;
using parley::test::Counts;
using RVC = parley::core::error::RuleViolationCode;

namespace
{
auto make_state(std::size_t n_players, uint8_t vp_to_win = 10) -> GameState
{
    std::vector<SeatSpec> seats;
    for (std::size_t i{}; i < n_players; ++i) seats.push_back(SeatSpec{SeatOrder[i], PlayerKind::Human});
    Config cfg{};
    cfg.vp_to_win = vp_to_win;
    cfg.seed = 42;
    return TradeRules{}.Initial(std::move(seats), BuildBoard(42), cfg);
}

auto run(TradeRules const& rules, GameState& s, Action const& a) -> void
{
    auto const ok = Execute(rules, s, a);
    ASSERT_TRUE(ok.has_value()) << Describe(a) << ": " << error::describe(ok.error());
    debug::CheckState(s);
}

auto violation(TradeRules const& rules, GameState const& s, Action const& a) -> RVC
{
    auto const ok = rules.Validate(s, a);
    EXPECT_FALSE(ok.has_value()) << Describe(a) << " unexpectedly legal";
    return ok.has_value() ? RVC::Internal_Unreachable : ok.error().code;
}

auto offer(Color c, ResourceCounts give, ResourceCounts get) -> Action
{
    return Action{c, OfferTradeAction{give, get}};
}

// Red has rolled and holds the given hand; nobody else has moved.
auto rolled_state(std::size_t n_players, ResourceCounts red_hand) -> GameState
{
    TradeRules const rules;
    GameState s = make_state(n_players);
    run(rules, s, Action{Color::Red, RollAction{}});
    s.hands[0] = red_hand;
    return s;
}
} // anonymous namespace

TEST(TradeRules, Initial_State)
{
    GameState const s = make_state(3);
    EXPECT_EQ(s.SeatCount(), 3u);
    EXPECT_EQ(s.Colors(), (std::vector{Color::Red, Color::Blue, Color::White}));
    for (ResourceCounts const& hand : s.hands) EXPECT_EQ(hand, Counts(1, 1, 1, 1, 1));
    EXPECT_EQ(s.prompt, Prompt::PlayTurn);
    EXPECT_EQ(s.CurrentColor(), Color::Red);
    EXPECT_FALSE(s.rolled);
    EXPECT_FALSE(s.negotiation.has_value());
    EXPECT_EQ(s.board.tiles.size(), constants::TileCount);
    debug::CheckState(s);
}

TEST(TradeRules, Board_Is_Deterministic)
{
    Board const a = BuildBoard(7);
    Board const b = BuildBoard(7);
    ASSERT_EQ(a.tiles.size(), b.tiles.size());
    std::size_t deserts{};
    for (std::size_t i{}; i < a.tiles.size(); ++i)
    {
        EXPECT_EQ(a.tiles[i].resource, b.tiles[i].resource);
        EXPECT_EQ(a.tiles[i].number, b.tiles[i].number);
        if (!a.tiles[i].resource.has_value())
        {
            ++deserts;
            EXPECT_EQ(a.tiles[i].number, 0);
        }
        else
        {
            EXPECT_NE(a.tiles[i].number, 7);
        }
    }
    EXPECT_EQ(deserts, 1u);
}

TEST(TradeRules, Only_Roll_Before_Rolling)
{
    TradeRules const rules;
    GameState const s = make_state(2);
    std::vector<Action> const legal = rules.LegalActions(s);
    ASSERT_EQ(legal.size(), 1u);
    EXPECT_EQ(legal.front(), (Action{Color::Red, RollAction{}}));

    EXPECT_EQ(violation(rules, s, Action{Color::Red, EndTurnAction{}}), RVC::NotRolledYet);
    EXPECT_EQ(violation(rules, s, Action{Color::Red, BuildAction{Structure::Settlement}}), RVC::NotRolledYet);
    EXPECT_EQ(violation(rules, s, Action{Color::Blue, RollAction{}}), RVC::WrongActor_TurnHolderRequired);
    EXPECT_EQ(violation(rules, s, Action{Color::Orange, RollAction{}}), RVC::UnknownActor);
}

TEST(TradeRules, Roll_Pays_Tile_Owners)
{
    TradeRules const rules;
    GameState s = make_state(3);
    GameState const before = s;
    run(rules, s, Action{Color::Red, RollAction{}});

    uint8_t const roll = TradeRules::RollDice(before.dice_seed, before.action_count);
    EXPECT_EQ(s.last_roll, roll);
    EXPECT_TRUE(s.rolled);

    std::vector<ResourceCounts> expected = before.hands;
    if (roll != 7)
    {
        for (std::size_t i{}; i < s.board.tiles.size(); ++i)
        {
            Tile const& t = s.board.tiles[i];
            if (t.resource.has_value() && t.number == roll)
            {
                ++expected[TileOwner(i, 3)][std::to_underlying(*t.resource)];
            }
        }
    }
    EXPECT_EQ(s.hands, expected);
    EXPECT_EQ(violation(rules, s, Action{Color::Red, RollAction{}}), RVC::Roll_AlreadyRolled);
}

TEST(TradeRules, Dice_Stay_In_Range)
{
    for (uint64_t n{}; n < 500; ++n)
    {
        uint8_t const r = TradeRules::RollDice(0xC0FFEE, n);
        EXPECT_GE(r, 2);
        EXPECT_LE(r, 12);
    }
}

TEST(TradeRules, Build_Pays_Cost_And_Scores)
{
    TradeRules const rules;
    GameState s = rolled_state(2, Counts(1, 1, 1, 3, 3));

    std::vector<Action> const legal = rules.LegalActions(s);
    EXPECT_NE(std::ranges::find(legal, Action{Color::Red, BuildAction{Structure::Settlement}}), legal.end());
    EXPECT_NE(std::ranges::find(legal, Action{Color::Red, BuildAction{Structure::City}}), legal.end());

    run(rules, s, Action{Color::Red, BuildAction{Structure::City}});
    EXPECT_EQ(s.hands[0], Counts(1, 1, 1, 1, 0));
    EXPECT_EQ(s.victory_points[0], 1);

    run(rules, s, Action{Color::Red, BuildAction{Structure::Settlement}});
    EXPECT_EQ(s.hands[0], Counts(0, 0, 0, 0, 0));
    EXPECT_EQ(s.victory_points[0], 2);

    EXPECT_EQ(violation(rules, s, Action{Color::Red, BuildAction{Structure::Settlement}}), RVC::Build_CannotAfford);
}

TEST(TradeRules, Reaching_Target_Ends_Game)
{
    TradeRules const rules;
    GameState s = make_state(2, 1);
    run(rules, s, Action{Color::Red, RollAction{}});
    s.hands[0] = Counts(1, 1, 1, 1, 0);
    run(rules, s, Action{Color::Red, BuildAction{Structure::Settlement}});

    EXPECT_EQ(s.WinnerColor(), Color::Red);
    EXPECT_FALSE(s.CurrentColor().has_value());
    EXPECT_TRUE(rules.LegalActions(s).empty());
    EXPECT_EQ(violation(rules, s, Action{Color::Red, EndTurnAction{}}), RVC::GameOver);
}

TEST(TradeRules, End_Turn_Passes_Control)
{
    TradeRules const rules;
    GameState s = make_state(3);
    run(rules, s, Action{Color::Red, RollAction{}});
    run(rules, s, Action{Color::Red, EndTurnAction{}});
    EXPECT_EQ(s.CurrentColor(), Color::Blue);
    EXPECT_FALSE(s.rolled);
    EXPECT_EQ(s.turn_number, 1u);

    run(rules, s, Action{Color::Blue, RollAction{}});
    run(rules, s, Action{Color::Blue, EndTurnAction{}});
    run(rules, s, Action{Color::White, RollAction{}});
    run(rules, s, Action{Color::White, EndTurnAction{}});
    EXPECT_EQ(s.CurrentColor(), Color::Red);
}

TEST(TradeRules, Offer_Validation)
{
    TradeRules const rules;
    GameState const s = rolled_state(2, Counts(2, 0, 0, 0, 0));

    EXPECT_EQ(violation(rules, s, offer(Color::Red, Counts(0, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0))),
              RVC::Offer_Empty);
    EXPECT_EQ(violation(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(0, 0, 0, 0, 0))),
              RVC::Offer_Empty);
    EXPECT_EQ(violation(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(1, 1, 0, 0, 0))),
              RVC::Offer_Overlap);
    EXPECT_EQ(violation(rules, s, offer(Color::Red, Counts(3, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0))),
              RVC::Offer_CannotAfford);
    EXPECT_TRUE(rules.Validate(s, offer(Color::Red, Counts(2, 0, 0, 0, 0), Counts(0, 1, 0, 0, 1))).has_value());
}

TEST(TradeRules, Negotiation_All_Reject_Returns_To_Offerer)
{
    TradeRules const rules;
    GameState s = rolled_state(3, Counts(1, 0, 0, 0, 0));
    run(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0)));

    EXPECT_EQ(s.prompt, Prompt::DecideTrade);
    EXPECT_EQ(s.CurrentColor(), Color::Blue);
    EXPECT_EQ(s.offers_this_turn, 1);
    EXPECT_EQ(violation(rules, s, Action{Color::Red, RejectTradeAction{}}), RVC::Respond_IsOfferer);
    EXPECT_EQ(violation(rules, s, Action{Color::Red, EndTurnAction{}}), RVC::WrongPrompt_PlayTurnRequired);

    // Out-of-order responses are fine; control stays with the first seat still owing one.
    run(rules, s, Action{Color::White, RejectTradeAction{}});
    EXPECT_EQ(s.CurrentColor(), Color::Blue);
    EXPECT_EQ(violation(rules, s, Action{Color::White, RejectTradeAction{}}), RVC::Respond_AlreadyResponded);

    run(rules, s, Action{Color::Blue, RejectTradeAction{}});
    EXPECT_EQ(s.prompt, Prompt::PlayTurn);
    EXPECT_FALSE(s.negotiation.has_value());
    EXPECT_EQ(s.CurrentColor(), Color::Red);
    EXPECT_EQ(s.hands[0], Counts(1, 0, 0, 0, 0));
}

TEST(TradeRules, Negotiation_Accept_Confirm_Swaps)
{
    TradeRules const rules;
    GameState s = rolled_state(3, Counts(2, 0, 0, 0, 0));
    s.hands[1] = Counts(0, 1, 0, 0, 0);
    s.hands[2] = Counts(0, 0, 0, 0, 0);
    run(rules, s, offer(Color::Red, Counts(2, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0)));

    std::vector<Action> const white_options = [&]
    {
        GameState peek = s;
        peek.actor_idx = 2;
        return rules.LegalActions(peek);
    }();
    EXPECT_EQ(white_options, (std::vector{Action{Color::White, RejectTradeAction{}}}));
    EXPECT_EQ(violation(rules, s, Action{Color::White, AcceptTradeAction{}}), RVC::Accept_CannotAfford);

    run(rules, s, Action{Color::Blue, AcceptTradeAction{}});
    run(rules, s, Action{Color::White, RejectTradeAction{}});
    ASSERT_EQ(s.prompt, Prompt::DecideAcceptees);
    EXPECT_EQ(s.CurrentColor(), Color::Red);

    std::vector<Action> const legal = rules.LegalActions(s);
    EXPECT_EQ(legal, (std::vector{Action{Color::Red, ConfirmTradeAction{Color::Blue}},
                                  Action{Color::Red, CancelTradeAction{}}}));
    EXPECT_EQ(violation(rules, s, Action{Color::Red, ConfirmTradeAction{Color::White}}),
              RVC::Confirm_PartnerDidNotAccept);
    EXPECT_EQ(violation(rules, s, Action{Color::Blue, ConfirmTradeAction{Color::Blue}}), RVC::Confirm_NotOfferer);

    run(rules, s, Action{Color::Red, ConfirmTradeAction{Color::Blue}});
    EXPECT_EQ(s.hands[0], Counts(0, 1, 0, 0, 0));
    EXPECT_EQ(s.hands[1], Counts(2, 0, 0, 0, 0));
    EXPECT_EQ(s.prompt, Prompt::PlayTurn);
    EXPECT_EQ(s.CurrentColor(), Color::Red);
    EXPECT_TRUE(s.rolled);
}

TEST(TradeRules, Offerer_May_Cancel)
{
    TradeRules const rules;
    GameState s = rolled_state(2, Counts(1, 0, 0, 0, 0));
    run(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0)));

    EXPECT_EQ(violation(rules, s, Action{Color::Blue, CancelTradeAction{}}), RVC::Cancel_NotOfferer);
    run(rules, s, Action{Color::Red, CancelTradeAction{}});
    EXPECT_EQ(s.prompt, Prompt::PlayTurn);
    EXPECT_EQ(s.hands[0], Counts(1, 0, 0, 0, 0));
    EXPECT_EQ(violation(rules, s, Action{Color::Red, CancelTradeAction{}}), RVC::WrongPrompt_DecideTradeRequired);
}

TEST(TradeRules, Confirm_Rechecks_Partner_Hand)
{
    TradeRules const rules;
    GameState s = rolled_state(2, Counts(1, 0, 0, 0, 0));
    s.hands[1] = Counts(0, 1, 0, 0, 0);
    run(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0)));
    run(rules, s, Action{Color::Blue, AcceptTradeAction{}});

    s.hands[1] = Counts(0, 0, 0, 0, 0);
    EXPECT_EQ(violation(rules, s, Action{Color::Red, ConfirmTradeAction{Color::Blue}}),
              RVC::Confirm_PartnerCannotAfford);
    EXPECT_EQ(rules.LegalActions(s), (std::vector{Action{Color::Red, CancelTradeAction{}}}));
}

TEST(TradeRules, Rejected_Action_Leaves_State)
{
    TradeRules const rules;
    GameState s = make_state(2);
    GameState const before = s;
    EXPECT_FALSE(Execute(rules, s, Action{Color::Blue, RollAction{}}).has_value());
    EXPECT_EQ(s.action_count, before.action_count);
    EXPECT_EQ(s.hands, before.hands);
    EXPECT_EQ(s.rolled, before.rolled);
}

TEST(TradeRules, View_Lists_Playable_Actions)
{
    TradeRules const rules;
    GameState s = rolled_state(2, Counts(1, 0, 0, 0, 0));
    run(rules, s, offer(Color::Red, Counts(1, 0, 0, 0, 0), Counts(0, 1, 0, 0, 0)));

    GameView const v = MakeView(rules, s);
    EXPECT_EQ(v.current_color, Color::Blue);
    EXPECT_EQ(v.prompt, Prompt::DecideTrade);
    ASSERT_TRUE(v.negotiation.has_value());
    EXPECT_EQ(v.negotiation->offerer, Color::Red);
    EXPECT_TRUE(v.negotiation->responded.empty());
    EXPECT_EQ(v.playable_actions, rules.LegalActions(s));
    ASSERT_EQ(v.seats.size(), 2u);
    EXPECT_EQ(v.seats[0].resources, Counts(1, 0, 0, 0, 0));
}
