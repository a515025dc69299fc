//
// ActionPayload.cpp
//

#include "ActionPayload.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace parley::core
{
    namespace
    {
        using DecodeFn = auto (*)(ActionPayload const&) -> std::expected<ActionKind, ParseError>;

        auto Fail(std::string msg) -> std::unexpected<ParseError>
        {
            return std::unexpected(ParseError{std::move(msg)});
        }

        auto Counts(std::vector<int64_t> const& v, std::string_view field)
            -> std::expected<ResourceCounts, ParseError>
        {
            if (v.size() != constants::ResourceKinds)
                return Fail(fmt::format("{} must hold {} resource counts, got {}", field,
                                        constants::ResourceKinds, v.size()));
            ResourceCounts out{};
            for (std::size_t i{}; i < v.size(); ++i)
            {
                if (v[i] < 0 || v[i] > std::numeric_limits<uint16_t>::max())
                    return Fail(fmt::format("{}[{}] out of range: {}", field, i, v[i]));
                out[i] = static_cast<uint16_t>(v[i]);
            }
            return out;
        }

        auto NoArgs(ActionPayload const& p) -> std::expected<void, ParseError>
        {
            if (!p.offer.empty() || !p.request.empty() || p.structure || p.partner)
                return Fail(fmt::format("{} takes no arguments", p.type));
            return {};
        }

        template <class T>
        auto DecodeBare(ActionPayload const& p) -> std::expected<ActionKind, ParseError>
        {
            if (auto const ok = NoArgs(p); !ok) return std::unexpected(ok.error());
            return T{};
        }

        auto DecodeBuild(ActionPayload const& p) -> std::expected<ActionKind, ParseError>
        {
            if (!p.structure.has_value()) return Fail("BUILD requires a structure");
            if (*p.structure == "SETTLEMENT") return BuildAction{Structure::Settlement};
            if (*p.structure == "CITY") return BuildAction{Structure::City};
            return Fail(fmt::format("Unknown structure '{}'", *p.structure));
        }

        auto DecodeOffer(ActionPayload const& p) -> std::expected<ActionKind, ParseError>
        {
            auto const offer = Counts(p.offer, "offer");
            if (!offer) return std::unexpected(offer.error());
            auto const request = Counts(p.request, "request");
            if (!request) return std::unexpected(request.error());
            return OfferTradeAction{*offer, *request};
        }

        auto DecodeConfirm(ActionPayload const& p) -> std::expected<ActionKind, ParseError>
        {
            if (!p.partner.has_value()) return Fail("CONFIRM_TRADE requires a partner");
            std::optional<Color> const c = ParseColor(*p.partner);
            if (!c.has_value()) return Fail(fmt::format("Unknown partner color '{}'", *p.partner));
            return ConfirmTradeAction{*c};
        }

        constexpr std::array<std::pair<std::string_view, DecodeFn>, 8> Decoders{{
            {"ROLL", &DecodeBare<RollAction>},
            {"BUILD", &DecodeBuild},
            {"OFFER_TRADE", &DecodeOffer},
            {"ACCEPT_TRADE", &DecodeBare<AcceptTradeAction>},
            {"REJECT_TRADE", &DecodeBare<RejectTradeAction>},
            {"CONFIRM_TRADE", &DecodeConfirm},
            {"CANCEL_TRADE", &DecodeBare<CancelTradeAction>},
            {"END_TURN", &DecodeBare<EndTurnAction>},
        }};
    }

    auto DecodeAction(ActionPayload const& p) -> std::expected<Action, ParseError>
    {
        std::optional<Color> const actor = ParseColor(p.actor);
        if (!actor.has_value()) return Fail(fmt::format("Unknown actor color '{}'", p.actor));

        auto const it = std::ranges::find_if(Decoders, [&](auto const& d) { return d.first == p.type; });
        if (it == Decoders.end()) return Fail(fmt::format("Unknown action type '{}'", p.type));

        auto kind = it->second(p);
        if (!kind) return std::unexpected(kind.error());
        return Action{*actor, std::move(*kind)};
    }

    auto EncodeAction(Action const& a) -> ActionPayload
    {
        ActionPayload p{};
        p.actor = std::string{ToString(a.actor)};
        p.type = std::string{TypeName(a.kind)};
        if (auto const* b = std::get_if<BuildAction>(&a.kind))
        {
            p.structure = std::string{ToString(b->structure)};
        }
        else if (auto const* o = std::get_if<OfferTradeAction>(&a.kind))
        {
            p.offer.assign(o->offer.begin(), o->offer.end());
            p.request.assign(o->request.begin(), o->request.end());
        }
        else if (auto const* c = std::get_if<ConfirmTradeAction>(&a.kind))
        {
            p.partner = std::string{ToString(c->partner)};
        }
        return p;
    }
}
