//
// TradeRules.cpp
//

#include "TradeRules.hpp"

#include <algorithm>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>

namespace
{
    inline auto Viol(parley::core::error::RuleViolationCode code) -> parley::core::error::RuleViolation
    {
        return parley::core::error::RuleViolation{ .code = code };
    }

    inline auto SplitMix64(uint64_t x) noexcept -> uint64_t
    {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

    inline auto Unit(std::size_t idx) -> parley::core::ResourceCounts
    {
        parley::core::ResourceCounts rc{};
        rc[idx] = 1;
        return rc;
    }
}

namespace parley::core
{
    auto TradeRules::CostOf(Structure const s) noexcept -> ResourceCounts const&
    {
        return s == Structure::City ? CityCost : SettlementCost;
    }

    auto TradeRules::RollDice(uint64_t const dice_seed, uint64_t const action_count) noexcept -> uint8_t
    {
        uint64_t const x = SplitMix64(dice_seed ^ SplitMix64(action_count));
        auto const d1 = static_cast<uint8_t>(x % 6 + 1);
        auto const d2 = static_cast<uint8_t>((x >> 32) % 6 + 1);
        return static_cast<uint8_t>(d1 + d2);
    }

    auto TradeRules::Initial(std::vector<SeatSpec> seats, Board board, Config const& cfg) const -> GameState
    {
        PRL_ASSERT(seats.size() >= constants::MinPlayersToStart, "Less than 2 seats while initialising game");
        PRL_ASSERT(seats.size() <= constants::SeatCount, "More seats than colors while initialising game");

        GameState s{};
        std::size_t const n = seats.size();
        s.seats = std::move(seats);
        s.dice_seed = SplitMix64(cfg.seed != 0 ? cfg.seed : board.seed);
        s.board = std::move(board);
        s.vp_to_win = cfg.vp_to_win;

        ResourceCounts starting{};
        starting.fill(1);
        s.hands.assign(n, starting);
        s.victory_points.assign(n, 0);

        s.turn_idx = 0;
        s.actor_idx = 0;
        s.prompt = Prompt::PlayTurn;
        return s;
    }

    auto TradeRules::NextUnresponded(GameState const& state) -> std::optional<SeatIdxT>
    {
        Negotiation const& neg = *state.negotiation;
        for (SeatIdxT i{}; i < state.SeatCount(); ++i)
        {
            if (i == neg.offerer_seat) continue;
            if (!neg.responded[i]) return i;
        }
        return std::nullopt;
    }

    auto TradeRules::CloseNegotiation(GameState& state) -> void
    {
        state.negotiation.reset();
        state.prompt = Prompt::PlayTurn;
        state.actor_idx = state.turn_idx;
    }

    auto TradeRules::Validate(GameState const& state, Action const& a) const -> CheckResult
    {
        using RVC = ::parley::core::error::RuleViolationCode;

        if (state.winner.has_value())
            return std::unexpected(Viol(RVC::GameOver).with_actor(a.actor));

        std::optional<SeatIdxT> const seat_opt = state.SeatOf(a.actor);
        if (!seat_opt.has_value())
            return std::unexpected(Viol(RVC::UnknownActor).with_actor(a.actor));

        SeatIdxT const seat = *seat_opt;
        Color const holder = state.seats[state.actor_idx].color;
        ResourceCounts const& hand = state.hands[seat];

        // Shared checks for actions of the turn holder in PLAY_TURN
        auto turn_action = [&](bool needs_roll) -> CheckResult
        {
            if (state.prompt != Prompt::PlayTurn)
                return std::unexpected(Viol(RVC::WrongPrompt_PlayTurnRequired).with_actor(a.actor));
            if (seat != state.actor_idx)
                return std::unexpected(Viol(RVC::WrongActor_TurnHolderRequired)
                                       .with_actor(a.actor).with_expected(holder));
            if (needs_roll && !state.rolled)
                return std::unexpected(Viol(RVC::NotRolledYet).with_actor(a.actor));
            return {};
        };

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollAction>)
            {
                if (auto const ok = turn_action(false); !ok) return ok;
                if (state.rolled)
                    return std::unexpected(Viol(RVC::Roll_AlreadyRolled).with_actor(a.actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, BuildAction>)
            {
                if (auto const ok = turn_action(true); !ok) return ok;
                if (!Covers(hand, CostOf(act.structure)))
                    return std::unexpected(Viol(RVC::Build_CannotAfford).with_actor(a.actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, OfferTradeAction>)
            {
                if (auto const ok = turn_action(true); !ok) return ok;
                if (Total(act.offer) == 0 || Total(act.request) == 0)
                    return std::unexpected(Viol(RVC::Offer_Empty).with_actor(a.actor));
                for (std::size_t i{}; i < constants::ResourceKinds; ++i)
                {
                    if (act.offer[i] != 0 && act.request[i] != 0)
                        return std::unexpected(Viol(RVC::Offer_Overlap)
                                               .with_actor(a.actor).with_resource(static_cast<Resource>(i)));
                }
                if (!Covers(hand, act.offer))
                    return std::unexpected(Viol(RVC::Offer_CannotAfford).with_actor(a.actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, AcceptTradeAction> || std::is_same_v<T, RejectTradeAction>)
            {
                if (!state.AwaitingResponses())
                    return std::unexpected(Viol(RVC::WrongPrompt_DecideTradeRequired).with_actor(a.actor));
                Negotiation const& neg = *state.negotiation;
                if (seat == neg.offerer_seat)
                    return std::unexpected(Viol(RVC::Respond_IsOfferer).with_actor(a.actor));
                if (neg.responded[seat])
                    return std::unexpected(Viol(RVC::Respond_AlreadyResponded).with_actor(a.actor));
                if constexpr (std::is_same_v<T, AcceptTradeAction>)
                {
                    if (!Covers(hand, neg.request))
                        return std::unexpected(Viol(RVC::Accept_CannotAfford).with_actor(a.actor));
                }
                return {};
            }
            else if constexpr (std::is_same_v<T, ConfirmTradeAction>)
            {
                if (!state.negotiation.has_value() || state.prompt != Prompt::DecideAcceptees)
                    return std::unexpected(Viol(RVC::WrongPrompt_DecideAccepteesRequired).with_actor(a.actor));
                Negotiation const& neg = *state.negotiation;
                if (seat != neg.offerer_seat)
                    return std::unexpected(Viol(RVC::Confirm_NotOfferer)
                                           .with_actor(a.actor).with_expected(state.seats[neg.offerer_seat].color));
                std::optional<SeatIdxT> const partner = state.SeatOf(act.partner);
                if (!partner.has_value() || !neg.accepted[*partner])
                    return std::unexpected(Viol(RVC::Confirm_PartnerDidNotAccept).with_actor(a.actor));
                if (!Covers(state.hands[*partner], neg.request))
                    return std::unexpected(Viol(RVC::Confirm_PartnerCannotAfford).with_actor(a.actor));
                if (!Covers(hand, neg.offer))
                    return std::unexpected(Viol(RVC::Confirm_OffererCannotAfford).with_actor(a.actor));
                return {};
            }
            else if constexpr (std::is_same_v<T, CancelTradeAction>)
            {
                if (!state.negotiation.has_value() || state.prompt == Prompt::PlayTurn)
                    return std::unexpected(Viol(RVC::WrongPrompt_DecideTradeRequired).with_actor(a.actor));
                if (seat != state.negotiation->offerer_seat)
                    return std::unexpected(Viol(RVC::Cancel_NotOfferer).with_actor(a.actor));
                return {};
            }
            else
            {
                return turn_action(true);
            }
        }, a.kind);
    }

    auto TradeRules::Apply(GameState& state, Action const& a) const -> void
    {
        std::optional<SeatIdxT> const seat_opt = state.SeatOf(a.actor);
        PRL_ASSERT(seat_opt.has_value(), "Apply called for a color without a seat");
        SeatIdxT const seat = *seat_opt;
        std::size_t const n = state.SeatCount();

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollAction>)
            {
                uint8_t const roll = RollDice(state.dice_seed, state.action_count);
                state.last_roll = roll;
                state.rolled = true;
                if (roll == 7) return;
                for (std::size_t i{}; i < state.board.tiles.size(); ++i)
                {
                    Tile const& t = state.board.tiles[i];
                    if (!t.resource.has_value() || t.number != roll) continue;
                    ++state.hands[TileOwner(i, n)][std::to_underlying(*t.resource)];
                }
            }
            else if constexpr (std::is_same_v<T, BuildAction>)
            {
                ResourceCounts const& cost = CostOf(act.structure);
                for (std::size_t i{}; i < constants::ResourceKinds; ++i)
                {
                    PRL_ASSERT(state.hands[seat][i] >= cost[i], "Build applied without resources");
                    state.hands[seat][i] -= cost[i];
                }
                ++state.victory_points[seat];
                if (state.victory_points[seat] >= state.vp_to_win)
                {
                    state.winner = seat;
                }
            }
            else if constexpr (std::is_same_v<T, OfferTradeAction>)
            {
                Negotiation neg{};
                neg.offerer_seat = seat;
                neg.offer = act.offer;
                neg.request = act.request;
                neg.responded.assign(n, false);
                neg.accepted.assign(n, false);
                state.negotiation = std::move(neg);
                ++state.offers_this_turn;
                state.prompt = Prompt::DecideTrade;
                std::optional<SeatIdxT> const next = NextUnresponded(state);
                PRL_ASSERT(next.has_value(), "Offer opened with nobody to respond");
                state.actor_idx = *next;
            }
            else if constexpr (std::is_same_v<T, AcceptTradeAction> || std::is_same_v<T, RejectTradeAction>)
            {
                PRL_ASSERT(state.negotiation.has_value(), "Trade response without an open offer");
                Negotiation& neg = *state.negotiation;
                neg.responded[seat] = true;
                neg.accepted[seat] = std::is_same_v<T, AcceptTradeAction>;

                if (std::optional<SeatIdxT> const next = NextUnresponded(state); next.has_value())
                {
                    state.actor_idx = *next;
                }
                else if (std::ranges::any_of(neg.accepted, [](bool b) { return b; }))
                {
                    state.prompt = Prompt::DecideAcceptees;
                    state.actor_idx = neg.offerer_seat;
                }
                else
                {
                    CloseNegotiation(state);
                }
            }
            else if constexpr (std::is_same_v<T, ConfirmTradeAction>)
            {
                PRL_ASSERT(state.negotiation.has_value(), "Confirm without an open offer");
                std::optional<SeatIdxT> const partner = state.SeatOf(act.partner);
                PRL_ASSERT(partner.has_value(), "Confirm with a partner outside the game");
                Negotiation const& neg = *state.negotiation;
                ResourceCounts& mine = state.hands[seat];
                ResourceCounts& theirs = state.hands[*partner];
                for (std::size_t i{}; i < constants::ResourceKinds; ++i)
                {
                    PRL_ASSERT(mine[i] >= neg.offer[i] && theirs[i] >= neg.request[i],
                               "Confirm applied without resources");
                    mine[i] = static_cast<uint16_t>(mine[i] - neg.offer[i] + neg.request[i]);
                    theirs[i] = static_cast<uint16_t>(theirs[i] - neg.request[i] + neg.offer[i]);
                }
                CloseNegotiation(state);
            }
            else if constexpr (std::is_same_v<T, CancelTradeAction>)
            {
                CloseNegotiation(state);
            }
            else
            {
                state.turn_idx = static_cast<SeatIdxT>((state.turn_idx + 1) % n);
                state.actor_idx = state.turn_idx;
                state.rolled = false;
                state.offers_this_turn = 0;
                ++state.turn_number;
            }
        }, a.kind);

        ++state.action_count;
    }

    auto TradeRules::LegalActions(GameState const& state) const -> std::vector<Action>
    {
        std::vector<Action> out;
        if (state.winner.has_value()) return out;

        SeatIdxT const seat = state.actor_idx;
        Color const me = state.seats[seat].color;
        ResourceCounts const& hand = state.hands[seat];

        switch (state.prompt)
        {
        case Prompt::PlayTurn:
        {
            if (!state.rolled)
            {
                out.push_back(Action{me, RollAction{}});
                return out;
            }
            out.push_back(Action{me, EndTurnAction{}});
            for (Structure const s : {Structure::Settlement, Structure::City})
            {
                if (Covers(hand, CostOf(s))) out.push_back(Action{me, BuildAction{s}});
            }
            // One-for-one offers only; larger bundles still validate when submitted.
            for (std::size_t give{}; give < constants::ResourceKinds; ++give)
            {
                if (hand[give] == 0) continue;
                for (std::size_t get{}; get < constants::ResourceKinds; ++get)
                {
                    if (get == give) continue;
                    out.push_back(Action{me, OfferTradeAction{Unit(give), Unit(get)}});
                }
            }
            return out;
        }
        case Prompt::DecideTrade:
        {
            if (!state.negotiation.has_value()) return out;
            Negotiation const& neg = *state.negotiation;
            if (seat == neg.offerer_seat || neg.responded[seat]) return out;
            if (Covers(hand, neg.request)) out.push_back(Action{me, AcceptTradeAction{}});
            out.push_back(Action{me, RejectTradeAction{}});
            return out;
        }
        case Prompt::DecideAcceptees:
        {
            if (!state.negotiation.has_value()) return out;
            Negotiation const& neg = *state.negotiation;
            for (SeatIdxT i{}; i < state.SeatCount(); ++i)
            {
                if (!neg.accepted[i]) continue;
                if (!Covers(state.hands[i], neg.request) || !Covers(hand, neg.offer)) continue;
                out.push_back(Action{me, ConfirmTradeAction{state.seats[i].color}});
            }
            out.push_back(Action{me, CancelTradeAction{}});
            return out;
        }
        }
        return out;
    }
}
