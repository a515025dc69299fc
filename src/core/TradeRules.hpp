//
// TradeRules.hpp
//

#ifndef PARLEY_TRADERULES_HPP
#define PARLEY_TRADERULES_HPP

#include "Rules.hpp"

namespace parley::core
{
    class TradeRules final : public Rules
    {
    public:
        static constexpr ResourceCounts SettlementCost{1, 1, 1, 1, 0};
        static constexpr ResourceCounts CityCost{0, 0, 0, 2, 3};

        auto Initial(std::vector<SeatSpec> seats, Board board, Config const& cfg) const -> GameState override;
        auto Validate(GameState const& state, Action const& a) const -> CheckResult override;
        auto Apply(GameState& state, Action const& a) const -> void override;
        auto LegalActions(GameState const& state) const -> std::vector<Action> override;

        static auto CostOf(Structure s) noexcept -> ResourceCounts const&;
        // Both dice for the roll made at `action_count`.
        static auto RollDice(uint64_t dice_seed, uint64_t action_count) noexcept -> uint8_t;

    private:
        static auto NextUnresponded(GameState const& state) -> std::optional<SeatIdxT>;
        static auto CloseNegotiation(GameState& state) -> void;
    };
}

#endif //PARLEY_TRADERULES_HPP
