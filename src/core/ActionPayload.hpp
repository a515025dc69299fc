//
// ActionPayload.hpp
//

#ifndef PARLEY_ACTIONPAYLOAD_HPP
#define PARLEY_ACTIONPAYLOAD_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "Actions.hpp"

namespace parley::core
{
    struct ParseError
    {
        std::string message;
    };

    // Untyped action as it arrives from a client, before boundary validation.
    struct ActionPayload
    {
        std::string actor;               // "RED"
        std::string type;                // "OFFER_TRADE"
        std::vector<int64_t> offer;      // 5 counts, OFFER_TRADE only
        std::vector<int64_t> request;    // 5 counts, OFFER_TRADE only
        std::optional<std::string> structure; // BUILD only
        std::optional<std::string> partner;   // CONFIRM_TRADE only
    };

    // One decode routine per action type, selected by `type`.
    auto DecodeAction(ActionPayload const& p) -> std::expected<Action, ParseError>;

    auto EncodeAction(Action const& a) -> ActionPayload;
}

#endif //PARLEY_ACTIONPAYLOAD_HPP
