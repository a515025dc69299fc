//
// AuditLogger.hpp
//

#ifndef PARLEY_AUDITLOGGER_HPP
#define PARLEY_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>

#include "../core/StateStore.hpp"

namespace parley::core::debug
{
    // Plain-text transcript of one game's ledger.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        auto is_open() const -> bool { return out_.is_open(); }

        // Header: id, seats, board seed.
        auto start(Snapshot const& first) -> void;

        // One line per version, plus the events logged against it.
        auto version(Snapshot const& s, std::span<Event const> events) -> void;

        // Footer from the summary.
        auto end(Summary const& sum) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    // Writes the full ledger of `game_id` to `path`. Returns false if the file could not be opened.
    auto WriteTranscript(StateStore const& store, GameId const& game_id, std::string const& path) -> bool;
}

#endif //PARLEY_AUDITLOGGER_HPP
