#include "AuditLogger.hpp"

#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace parley::core;

namespace
{

auto s_counts(ResourceCounts const& rc) -> std::string
{
    return fmt::format("{}", fmt::join(rc, ","));
}

auto s_color(std::optional<Color> const c) -> std::string_view
{
    return c.has_value() ? ToString(*c) : std::string_view{"-"};
}

auto serialize_hands(GameView const& v) -> std::string
{
    std::string serial;
    for (std::size_t i{}; i < v.seats.size(); ++i)
    {
        SeatView const& seat = v.seats[i];
        serial += (i ? " " : "");
        serial += fmt::format("{}{}:[{}]vp={}", ToString(seat.color), seat.is_bot ? "*" : "",
                              s_counts(seat.resources), seat.victory_points);
    }
    return serial;
}

} // anonymous namespace

namespace parley::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Snapshot const& first) -> void
{
    out_ << fmt::format("Game={}\n", first.game_id);
    out_ << fmt::format("BoardSeed={}\n", first.state->board.seed);
    out_ << fmt::format("Players={}\n", first.state->SeatCount());
    for (SeatSpec const& s : first.state->seats)
    {
        out_ << fmt::format("Seat {} {}\n", ToString(s.color), ToString(s.kind));
    }
    out_.flush();
}

auto AuditLogger::version(Snapshot const& s, std::span<Event const> events) -> void
{
    GameView const& v = s.view;
    out_ << fmt::format("v{} turn={} prompt={} actor={} roll={} hands=[{}]\n",
                        s.version, v.turn_number, ToString(v.prompt), s_color(v.current_color),
                        v.last_roll, serialize_hands(v));
    if (v.negotiation.has_value())
    {
        NegotiationView const& n = *v.negotiation;
        out_ << fmt::format("  Offer: {} gives [{}] for [{}] responded={} accepted={}\n",
                            ToString(n.offerer), s_counts(n.offer), s_counts(n.request),
                            n.responded.size(), n.accepted.size());
    }
    for (Event const& e : events)
    {
        std::string body;
        for (auto const& [k, val] : e.payload)
        {
            body += fmt::format(" {}={}", k, val);
        }
        out_ << fmt::format("  Event {}:{}\n", e.type, body);
    }
}

auto AuditLogger::end(Summary const& sum) -> void
{
    out_ << fmt::format("Versions={}\n", sum.latest_version + 1);
    out_ << fmt::format("Winner={}\n", s_color(sum.winner));
    out_ << fmt::format("Updated={}\n", IsoTime(sum.updated_at));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

auto WriteTranscript(StateStore const& store, GameId const& game_id, std::string const& path) -> bool
{
    AuditLogger log{path};
    if (!log.is_open()) return false;

    Summary const sum = store.GetSummary(game_id);
    std::vector<Event> const events = store.ListEvents(game_id, std::nullopt);

    for (Version v{}; v <= sum.latest_version; ++v)
    {
        Snapshot const snap = store.GetSnapshot(game_id, v);
        if (v == 0) log.start(snap);

        std::vector<Event> at;
        for (Event const& e : events)
        {
            if (e.version == std::optional<Version>{v}) at.push_back(e);
        }
        log.version(snap, at);
    }
    log.end(sum);
    return true;
}

} // namespace parley::core::debug
