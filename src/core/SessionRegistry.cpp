//
// SessionRegistry.cpp
//

#include "SessionRegistry.hpp"

#include "Util.hpp"

namespace parley::core
{
    auto SessionRegistry::Issue(std::string name, RoomId room_id, std::optional<Color> const seat) -> Session
    {
        Session s{};
        s.name = std::move(name);
        s.room_id = std::move(room_id);
        s.seat = seat;

        std::scoped_lock lk(mtx_);
        do
        {
            s.token = util::RandomHex128();
        } while (sessions_.contains(s.token));
        sessions_.emplace(s.token, s);
        return s;
    }

    auto SessionRegistry::Lookup(Token const& token) const -> std::optional<Session>
    {
        std::scoped_lock lk(mtx_);
        auto const it = sessions_.find(token);
        if (it == sessions_.end()) return std::nullopt;
        return it->second;
    }

    auto SessionRegistry::Revoke(Token const& token) -> bool
    {
        std::scoped_lock lk(mtx_);
        return sessions_.erase(token) > 0;
    }

    auto SessionRegistry::Size() const -> std::size_t
    {
        std::scoped_lock lk(mtx_);
        return sessions_.size();
    }
}
