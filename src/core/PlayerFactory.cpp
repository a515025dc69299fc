//
// PlayerFactory.cpp
//

#include "PlayerFactory.hpp"

#include "GreedyAi.hpp"
#include "RandomAi.hpp"

#include <utility>

namespace parley::core
{
    auto PlayerFactory::Create(SeatSpec const& seat, uint64_t const seed) const -> std::unique_ptr<Player>
    {
        switch (seat.kind)
        {
        case PlayerKind::Human: return std::make_unique<HumanPlayer>();
        case PlayerKind::Random: return std::make_unique<RandomAI>(seed ^ std::to_underlying(seat.color));
        case PlayerKind::Greedy: return std::make_unique<GreedyAI>();
        }
        PRL_THROW(error::Code::Internal, "Unknown player kind");
    }
}
