//
// ActionGateway.hpp
//

#ifndef PARLEY_ACTIONGATEWAY_HPP
#define PARLEY_ACTIONGATEWAY_HPP

#include <optional>

#include "ActionPayload.hpp"
#include "RoomStore.hpp"
#include "Rules.hpp"
#include "SessionRegistry.hpp"
#include "StateStore.hpp"
#include "TurnAdvancer.hpp"

namespace parley::core
{
    // Optimistic-concurrency entry point for room games. Runs entirely under
    // the room lease so appends for one game never interleave.
    class ActionGateway
    {
    public:
        ActionGateway(RoomStore& rooms, StateStore& store, Rules const& rules, TurnAdvancer const& advancer);

        auto SubmitAction(Session const& session,
                          ActionPayload const& payload,
                          std::optional<Version> expected_version) -> Snapshot;

    private:
        static auto Authorize(GameState const& state, Action const& action, Color seat) -> void;

        RoomStore& rooms_;
        StateStore& store_;
        Rules const& rules_;
        TurnAdvancer const& advancer_;
    };
}

#endif //PARLEY_ACTIONGATEWAY_HPP
