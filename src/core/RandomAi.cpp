//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <algorithm>
#include <vector>

namespace parley::core
{
    RandomAI::RandomAI(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomAI::Decide(GameState const& state, std::span<Action const> legal) -> Action
    {
        (void)state;
        PRL_ASSERT(!legal.empty(), "RandomAI asked to decide with no legal actions");

        // Offers are plentiful; one sampled offer competes with everything else.
        std::vector<Action> pool;
        std::vector<Action> offers;
        for (Action const& a : legal)
        {
            if (std::holds_alternative<OfferTradeAction>(a.kind)) offers.push_back(a);
            else pool.push_back(a);
        }
        if (!offers.empty()) pool.push_back(offers[pick(offers)]);
        return pool[pick(pool)];
    }
}
