//
// RecordingPlayer.hpp
//

#ifndef PARLEY_RECORDINGPLAYER_HPP
#define PARLEY_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"
#include "../core/PlayerFactory.hpp"

namespace parley::core::debug
{
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner, std::vector<Action>* sink = nullptr)
            : inner_{std::move(inner)}, sink_{sink}
        {
        }

        auto Decide(GameState const& state, std::span<Action const> legal) -> Action override
        {
            Action a = inner_->Decide(state, legal);
            decisions_.push_back(a);
            if (sink_ != nullptr) sink_->push_back(a);
            return a;
        }

        auto IsBot() const noexcept -> bool override { return inner_->IsBot(); }

        auto Decisions() const -> std::vector<Action> const& { return decisions_; }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<Action>* sink_;
        std::vector<Action> decisions_;
    };

    // Wraps every player the base factory makes; keeps all decisions in one log.
    class RecordingFactory final : public PlayerFactory
    {
    public:
        auto Create(SeatSpec const& seat, uint64_t seed) const -> std::unique_ptr<Player> override
        {
            return std::make_unique<RecordingPlayer>(PlayerFactory::Create(seat, seed), &log_);
        }

        auto Log() const -> std::vector<Action> const& { return log_; }

    private:
        mutable std::vector<Action> log_;
    };
} // namespace parley::core::debug

#endif //PARLEY_RECORDINGPLAYER_HPP
