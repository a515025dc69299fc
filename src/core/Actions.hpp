//
// Actions.hpp
//

#ifndef PARLEY_ACTIONS_HPP
#define PARLEY_ACTIONS_HPP

#include <string>
#include <variant>

#include "Types.hpp"

namespace parley::core
{
    enum class Structure : uint8_t
    {
        Settlement,
        City
    };

    struct RollAction
    {
        auto operator==(RollAction const&) const -> bool = default;
    };
    struct BuildAction
    {
        Structure structure{Structure::Settlement};
        auto operator==(BuildAction const&) const -> bool = default;
    };
    struct OfferTradeAction
    {
        ResourceCounts offer{};
        ResourceCounts request{};
        auto operator==(OfferTradeAction const&) const -> bool = default;
    };
    struct AcceptTradeAction
    {
        auto operator==(AcceptTradeAction const&) const -> bool = default;
    };
    struct RejectTradeAction
    {
        auto operator==(RejectTradeAction const&) const -> bool = default;
    };
    struct ConfirmTradeAction
    {
        Color partner{};
        auto operator==(ConfirmTradeAction const&) const -> bool = default;
    };
    struct CancelTradeAction
    {
        auto operator==(CancelTradeAction const&) const -> bool = default;
    };
    struct EndTurnAction
    {
        auto operator==(EndTurnAction const&) const -> bool = default;
    };

    using ActionKind = std::variant<
      RollAction, BuildAction, OfferTradeAction, AcceptTradeAction,
      RejectTradeAction, ConfirmTradeAction, CancelTradeAction, EndTurnAction>;

    struct Action
    {
        Color actor{};
        ActionKind kind{};
        auto operator==(Action const&) const -> bool = default;
    };

    enum class Prompt : uint8_t
    {
        PlayTurn,
        DecideTrade,
        DecideAcceptees
    };

    inline auto IsTradeResponse(Action const& a) -> bool
    {
        return std::holds_alternative<AcceptTradeAction>(a.kind) ||
               std::holds_alternative<RejectTradeAction>(a.kind);
    }

    inline auto ForcedReject(Color actor) -> Action
    {
        return Action{actor, RejectTradeAction{}};
    }

    auto TypeName(ActionKind const& k) -> std::string_view;
    auto ToString(Prompt p) -> std::string_view;
    auto ToString(Structure s) -> std::string_view;
    // e.g. "RED:OFFER_TRADE[offer=1,0,0,0,0 request=0,1,0,0,0]"
    auto Describe(Action const& a) -> std::string;
} // namespace parley::core

#endif //PARLEY_ACTIONS_HPP
