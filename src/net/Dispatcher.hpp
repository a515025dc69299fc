//
// Dispatcher.hpp
//

#ifndef PARLEY_DISPATCHER_HPP
#define PARLEY_DISPATCHER_HPP

#include <cstddef>
#include <functional>
#include <span>

#include <flatbuffers/flatbuffers.h>

#include "../core/Service.hpp"
#include "codec.hpp"

namespace parley::core::net
{
    // One request frame in, one response frame out. Every failure becomes an ErrorRes.
    class Dispatcher
    {
    public:
        // Called with the game id whenever a returned snapshot carries a winner.
        using GameOverFn = std::function<void(GameId const&)>;

        explicit Dispatcher(Service& service, GameOverFn on_game_over = {});

        auto Handle(std::span<std::byte const> frame) -> flatbuffers::DetachedBuffer;
        auto Handle(DecodedRequest const& request) -> flatbuffers::DetachedBuffer;

    private:
        auto Route(Request const& request, std::uint64_t id) -> flatbuffers::DetachedBuffer;
        auto Reply(Snapshot const& snap, std::uint64_t id) -> flatbuffers::DetachedBuffer;

        Service& service_;
        GameOverFn on_game_over_;
    };
}

#endif //PARLEY_DISPATCHER_HPP
