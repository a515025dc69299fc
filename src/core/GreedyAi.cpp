//
// GreedyAi.cpp
//

#include "GreedyAi.hpp"

#include <algorithm>

#include "TradeRules.hpp"

namespace parley::core
{
    namespace
    {
        auto AfterSwap(ResourceCounts hand, ResourceCounts const& give, ResourceCounts const& get) -> ResourceCounts
        {
            for (std::size_t i{}; i < constants::ResourceKinds; ++i)
            {
                hand[i] = static_cast<uint16_t>(hand[i] - std::min(hand[i], give[i]) + get[i]);
            }
            return hand;
        }

        template <class T>
        auto FindKind(std::span<Action const> legal) -> std::optional<Action>
        {
            auto const it = std::ranges::find_if(legal, [](Action const& a)
                { return std::holds_alternative<T>(a.kind); });
            if (it == legal.end()) return std::nullopt;
            return *it;
        }
    }

    auto GreedyAI::Progress(ResourceCounts const& hand) noexcept -> uint32_t
    {
        uint32_t score{};
        for (std::size_t i{}; i < constants::ResourceKinds; ++i)
        {
            score += std::min<uint32_t>(hand[i], TradeRules::SettlementCost[i]);
            score += std::min<uint32_t>(hand[i], TradeRules::CityCost[i]);
        }
        return score;
    }

    auto GreedyAI::Decide(GameState const& state, std::span<Action const> legal) -> Action
    {
        PRL_ASSERT(!legal.empty(), "GreedyAI asked to decide with no legal actions");

        SeatIdxT const me = state.actor_idx;
        ResourceCounts const& hand = state.hands[me];

        switch (state.prompt)
        {
        case Prompt::DecideTrade:
        {
            auto const accept = FindKind<AcceptTradeAction>(legal);
            if (accept.has_value() && state.negotiation.has_value())
            {
                Negotiation const& neg = *state.negotiation;
                if (Progress(AfterSwap(hand, neg.request, neg.offer)) > Progress(hand)) return *accept;
            }
            if (auto const reject = FindKind<RejectTradeAction>(legal)) return *reject;
            return legal.front();
        }
        case Prompt::DecideAcceptees:
        {
            if (auto const confirm = FindKind<ConfirmTradeAction>(legal)) return *confirm;
            return legal.front();
        }
        case Prompt::PlayTurn:
            break;
        }

        if (auto const roll = FindKind<RollAction>(legal)) return *roll;

        // Cities first: they draw on the plentiful wheat/ore pool.
        for (Action const& a : legal)
        {
            if (auto const* b = std::get_if<BuildAction>(&a.kind); b && b->structure == Structure::City) return a;
        }
        if (auto const build = FindKind<BuildAction>(legal)) return *build;

        if (state.offers_this_turn == 0)
        {
            std::optional<Action> best;
            uint32_t best_score = Progress(hand);
            for (Action const& a : legal)
            {
                auto const* o = std::get_if<OfferTradeAction>(&a.kind);
                if (o == nullptr) continue;
                uint32_t const score = Progress(AfterSwap(hand, o->offer, o->request));
                if (score > best_score)
                {
                    best_score = score;
                    best = a;
                }
            }
            if (best.has_value()) return *best;
        }

        if (auto const end = FindKind<EndTurnAction>(legal)) return *end;
        return legal.front();
    }
}
