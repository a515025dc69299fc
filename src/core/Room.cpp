//
// Room.cpp
//

#include "Room.hpp"

#include <algorithm>

namespace parley::core
{
    auto Room::SeatNamed(std::string_view const name) const -> std::optional<Color>
    {
        for (Seat const& s : seats)
        {
            if (s.user_name.has_value() && *s.user_name == name) return s.color;
        }
        return std::nullopt;
    }

    auto Room::FirstEmptySeat() -> Seat*
    {
        auto const it = std::ranges::find_if(seats, [](Seat const& s) { return !s.user_name.has_value(); });
        return it == seats.end() ? nullptr : &*it;
    }

    auto Room::FindSeat(Color const c) -> Seat*
    {
        auto const it = std::ranges::find(seats, c, &Seat::color);
        return it == seats.end() ? nullptr : &*it;
    }

    auto Room::OccupiedCount() const -> std::size_t
    {
        return static_cast<std::size_t>(
            std::ranges::count_if(seats, [](Seat const& s) { return s.user_name.has_value(); }));
    }

    auto MakeRoomView(Room const& room, std::optional<Color> const you) -> RoomView
    {
        RoomView v{};
        v.room_id = room.room_id;
        v.name = room.name;
        v.seats.reserve(room.seats.size());
        for (Seat const& s : room.seats)
        {
            v.seats.push_back(SeatInfo{s.color, s.user_name, you.has_value() && *you == s.color});
        }
        v.started = room.started;
        v.game_id = room.game_id;
        v.latest_version = room.latest_version;
        v.created_at = IsoTime(room.created_at);
        v.updated_at = IsoTime(room.updated_at);
        v.board_preview = BuildBoard(room.board_seed);
        return v;
    }
}
