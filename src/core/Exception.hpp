//
// Exception.hpp
//

#ifndef PARLEY_EXCEPTION_HPP
#define PARLEY_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"

namespace parley::core::error
{
    enum class Code : unsigned
    {
        Validation, // malformed input or illegal action
        Auth, // missing or unknown session token
        Authorization, // wrong actor, wrong phase, non-host
        NotFound, // unknown room, game or version
        Conflict, // stale expected version
        Internal // store/engine failure or broken invariant
    };

    struct ValidationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AuthError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AuthorizationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NotFoundError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConflictError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InternalError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    using Error = OmegaException<Code>;

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Validation: throw ValidationError(std::move(msg), c, loc);
        case Code::Auth: throw AuthError(std::move(msg), c, loc);
        case Code::Authorization: throw AuthorizationError(std::move(msg), c, loc);
        case Code::NotFound: throw NotFoundError(std::move(msg), c, loc);
        case Code::Conflict: throw ConflictError(std::move(msg), c, loc);
        case Code::Internal: throw InternalError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

    inline auto StatusOf(Code c) noexcept -> uint16_t
    {
        switch (c)
        {
        case Code::Validation: return 400;
        case Code::Auth: return 401;
        case Code::Authorization: return 403;
        case Code::NotFound: return 404;
        case Code::Conflict: return 409;
        case Code::Internal: return 500;
        }
        return 500;
    }

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Validation: return "Validation";
        case Code::Auth: return "Auth";
        case Code::Authorization: return "Authorization";
        case Code::NotFound: return "NotFound";
        case Code::Conflict: return "Conflict";
        case Code::Internal: return "Internal";
        }
        return "Unknown";
    }

#define PRL_THROW(code_enum, msg) ::parley::core::error::fail((code_enum), (msg))
#define PRL_ASSERT(cond, msg) do { if(!(cond)) ::parley::core::error::fail(::parley::core::error::Code::Internal, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        GameOver,
        UnknownActor,
        WrongActor_TurnHolderRequired,
        WrongPrompt_PlayTurnRequired,
        WrongPrompt_DecideTradeRequired,
        WrongPrompt_DecideAccepteesRequired,

        // Roll
        Roll_AlreadyRolled,

        // Build / turn flow
        NotRolledYet,
        Build_CannotAfford,

        // Offer
        Offer_Empty,
        Offer_Overlap,
        Offer_CannotAfford,

        // Responses
        Respond_IsOfferer,
        Respond_AlreadyResponded,
        Accept_CannotAfford,

        // Confirm / cancel
        Confirm_NotOfferer,
        Confirm_PartnerDidNotAccept,
        Confirm_PartnerCannotAfford,
        Confirm_OffererCannotAfford,
        Cancel_NotOfferer,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Color> actor{};
        std::optional<Color> expected{};
        std::optional<Resource> resource{};

        auto with_actor(Color c) -> RuleViolation&
        {
            actor = c;
            return *this;
        }

        auto with_expected(Color c) -> RuleViolation&
        {
            expected = c;
            return *this;
        }

        auto with_resource(Resource r) -> RuleViolation&
        {
            resource = r;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameOver: return "Game is already decided";
        case E::UnknownActor: return "Actor does not hold a seat in this game";
        case E::WrongActor_TurnHolderRequired: return "Wrong actor (turn holder required)";
        case E::WrongPrompt_PlayTurnRequired: return "Wrong prompt (PLAY_TURN required)";
        case E::WrongPrompt_DecideTradeRequired: return "Wrong prompt (DECIDE_TRADE required)";
        case E::WrongPrompt_DecideAccepteesRequired: return "Wrong prompt (DECIDE_ACCEPTEES required)";

        case E::Roll_AlreadyRolled: return "Roll: dice already rolled this turn";
        case E::NotRolledYet: return "Dice must be rolled first";
        case E::Build_CannotAfford: return "Build: not enough resources";

        case E::Offer_Empty: return "Offer: offer and request must both be non-empty";
        case E::Offer_Overlap: return "Offer: a resource appears on both sides";
        case E::Offer_CannotAfford: return "Offer: offerer does not hold the offer";

        case E::Respond_IsOfferer: return "Respond: offerer cannot respond to own offer";
        case E::Respond_AlreadyResponded: return "Respond: seat already responded";
        case E::Accept_CannotAfford: return "Accept: responder does not hold the request";

        case E::Confirm_NotOfferer: return "Confirm: only the offerer may confirm";
        case E::Confirm_PartnerDidNotAccept: return "Confirm: partner did not accept";
        case E::Confirm_PartnerCannotAfford: return "Confirm: partner no longer holds the request";
        case E::Confirm_OffererCannotAfford: return "Confirm: offerer no longer holds the offer";
        case E::Cancel_NotOfferer: return "Cancel: only the offerer may withdraw";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.actor) s += fmt::format(" | actor={}", ToString(*v.actor));
        if (v.expected) s += fmt::format(" | expected={}", ToString(*v.expected));
        if (v.resource) s += fmt::format(" | resource={}", ToString(*v.resource));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //PARLEY_EXCEPTION_HPP
