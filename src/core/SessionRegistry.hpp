//
// SessionRegistry.hpp
//

#ifndef PARLEY_SESSIONREGISTRY_HPP
#define PARLEY_SESSIONREGISTRY_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "Types.hpp"

namespace parley::core
{
    struct Session
    {
        Token token;
        std::string name;
        RoomId room_id;
        std::optional<Color> seat; // nullopt = spectator
    };

    // Ephemeral token map. Never persisted: a restart drops every session.
    class SessionRegistry
    {
    public:
        SessionRegistry() = default;
        SessionRegistry(SessionRegistry const&) = delete;
        auto operator=(SessionRegistry const&) -> SessionRegistry& = delete;

        auto Issue(std::string name, RoomId room_id, std::optional<Color> seat) -> Session;
        auto Lookup(Token const& token) const -> std::optional<Session>;
        auto Revoke(Token const& token) -> bool;
        auto Size() const -> std::size_t;

    private:
        mutable std::mutex mtx_;
        std::unordered_map<Token, Session> sessions_;
    };
}

#endif //PARLEY_SESSIONREGISTRY_HPP
