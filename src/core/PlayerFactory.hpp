//
// PlayerFactory.hpp
//

#ifndef PARLEY_PLAYERFACTORY_HPP
#define PARLEY_PLAYERFACTORY_HPP

#include <memory>

#include "Player.hpp"
#include "State.hpp"

namespace parley::core
{
    // Builds the decision maker for a seat. Tests override Create to script bots.
    class PlayerFactory
    {
    public:
        virtual ~PlayerFactory() = default;

        virtual auto Create(SeatSpec const& seat, uint64_t seed) const -> std::unique_ptr<Player>;
    };
}

#endif //PARLEY_PLAYERFACTORY_HPP
