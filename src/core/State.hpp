//
// State.hpp
//

#ifndef PARLEY_STATE_HPP
#define PARLEY_STATE_HPP

#include <optional>
#include <vector>

#include "Actions.hpp"
#include "Board.hpp"
#include "Types.hpp"

namespace parley::core
{
    enum class PlayerKind : uint8_t
    {
        Human,
        Random,
        Greedy
    };

    struct SeatSpec
    {
        Color color{};
        PlayerKind kind{PlayerKind::Human};
    };

    // Present only while a trade offer is pending (DECIDE_TRADE or DECIDE_ACCEPTEES).
    struct Negotiation
    {
        SeatIdxT offerer_seat{};
        ResourceCounts offer{};
        ResourceCounts request{};
        std::vector<bool> responded; // [seat]
        std::vector<bool> accepted;  // [seat]
    };

    // Authoritative game state. Plain value: copied to produce the next version.
    struct GameState
    {
        std::vector<SeatSpec> seats;
        Board board;
        uint8_t vp_to_win{10};

        std::vector<ResourceCounts> hands;   // [seat]
        std::vector<uint8_t> victory_points; // [seat]

        SeatIdxT turn_idx{0};  // seat holding the turn
        SeatIdxT actor_idx{0}; // seat in control right now
        Prompt prompt{Prompt::PlayTurn};
        bool rolled{false};
        uint8_t last_roll{0};
        uint8_t offers_this_turn{0};

        std::optional<Negotiation> negotiation;
        std::optional<SeatIdxT> winner;

        uint32_t turn_number{0};
        uint64_t action_count{0};
        uint64_t dice_seed{0};

        auto SeatCount() const noexcept -> std::size_t { return seats.size(); }
        auto SeatOf(Color c) const -> std::optional<SeatIdxT>;
        auto CurrentColor() const -> std::optional<Color>;
        auto WinnerColor() const -> std::optional<Color>;
        auto Colors() const -> std::vector<Color>;
        // True while accept/reject responses are still being collected.
        auto AwaitingResponses() const noexcept -> bool
        {
            return negotiation.has_value() && prompt == Prompt::DecideTrade;
        }
        auto HasResponded(SeatIdxT seat) const -> bool;
    };

    struct SeatView
    {
        Color color{};
        bool is_bot{false};
        ResourceCounts resources{};
        uint8_t victory_points{0};
    };

    struct NegotiationView
    {
        Color offerer{};
        ResourceCounts offer{};
        ResourceCounts request{};
        std::vector<Color> responded;
        std::vector<Color> accepted;
    };

    // Display projection stored beside every snapshot.
    struct GameView
    {
        std::vector<SeatView> seats;
        std::optional<Color> current_color;
        Prompt prompt{Prompt::PlayTurn};
        bool rolled{false};
        uint8_t last_roll{0};
        std::optional<Color> winner;
        std::optional<NegotiationView> negotiation;
        std::vector<Action> playable_actions;
        uint32_t turn_number{0};
    };

    auto IsBot(PlayerKind k) noexcept -> bool;
    auto ToString(PlayerKind k) -> std::string_view;
    auto ParsePlayerKind(std::string_view s) -> std::optional<PlayerKind>;
}

#endif //PARLEY_STATE_HPP
