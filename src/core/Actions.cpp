//
// Actions.cpp
//

#include "Actions.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace parley::core
{
    auto TypeName(ActionKind const& k) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const&) -> std::string_view
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, RollAction>) return "ROLL";
            else if constexpr (std::is_same_v<T, BuildAction>) return "BUILD";
            else if constexpr (std::is_same_v<T, OfferTradeAction>) return "OFFER_TRADE";
            else if constexpr (std::is_same_v<T, AcceptTradeAction>) return "ACCEPT_TRADE";
            else if constexpr (std::is_same_v<T, RejectTradeAction>) return "REJECT_TRADE";
            else if constexpr (std::is_same_v<T, ConfirmTradeAction>) return "CONFIRM_TRADE";
            else if constexpr (std::is_same_v<T, CancelTradeAction>) return "CANCEL_TRADE";
            else return "END_TURN";
        }, k);
    }

    auto ToString(Prompt const p) -> std::string_view
    {
        switch (p)
        {
        case Prompt::PlayTurn: return "PLAY_TURN";
        case Prompt::DecideTrade: return "DECIDE_TRADE";
        case Prompt::DecideAcceptees: return "DECIDE_ACCEPTEES";
        }
        return "UNKNOWN";
    }

    auto ToString(Structure const s) -> std::string_view
    {
        return s == Structure::City ? "CITY" : "SETTLEMENT";
    }

    auto Describe(Action const& a) -> std::string
    {
        std::string out = fmt::format("{}:{}", ToString(a.actor), TypeName(a.kind));
        if (auto const* b = std::get_if<BuildAction>(&a.kind))
        {
            out += fmt::format("[{}]", ToString(b->structure));
        }
        else if (auto const* o = std::get_if<OfferTradeAction>(&a.kind))
        {
            out += fmt::format("[offer={} request={}]", fmt::join(o->offer, ","), fmt::join(o->request, ","));
        }
        else if (auto const* c = std::get_if<ConfirmTradeAction>(&a.kind))
        {
            out += fmt::format("[partner={}]", ToString(c->partner));
        }
        return out;
    }
}
