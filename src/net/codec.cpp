//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

namespace fbn = parley::gen::net;

namespace
{
    using parley::core::ActionPayload;

    inline auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    // Absent and empty strings both mean "not supplied".
    inline auto OptStr(flatbuffers::String const* s) -> std::optional<std::string>
    {
        if (s == nullptr || s->size() == 0) return std::nullopt;
        return s->str();
    }

    inline auto OptVersion(bool has, uint64_t v) -> std::optional<parley::core::Version>
    {
        return has ? std::optional<parley::core::Version>{v} : std::nullopt;
    }

    inline auto OptString(flatbuffers::FlatBufferBuilder& fbb, std::optional<std::string_view> s)
        -> flatbuffers::Offset<flatbuffers::String>
    {
        return s.has_value() ? fbb.CreateString(*s) : flatbuffers::Offset<flatbuffers::String>{};
    }

    inline auto OptColor(flatbuffers::FlatBufferBuilder& fbb, std::optional<parley::core::Color> c)
        -> flatbuffers::Offset<flatbuffers::String>
    {
        return c.has_value() ? fbb.CreateString(parley::core::ToString(*c)) : flatbuffers::Offset<flatbuffers::String>{};
    }

    auto ColorList(flatbuffers::FlatBufferBuilder& fbb, std::vector<parley::core::Color> const& colors)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>>
    {
        std::vector<std::string> names;
        names.reserve(colors.size());
        for (parley::core::Color const c : colors) names.emplace_back(parley::core::ToString(c));
        return fbb.CreateVectorOfStrings(names);
    }

    auto ToPayload(fbn::ActionMsg const* m) -> ActionPayload
    {
        ActionPayload p{};
        p.actor = Str(m->actor());
        p.type = Str(m->type());
        if (auto const* v = m->offer()) p.offer.assign(v->begin(), v->end());
        if (auto const* v = m->request()) p.request.assign(v->begin(), v->end());
        p.structure = OptStr(m->structure());
        p.partner = OptStr(m->partner());
        return p;
    }

    auto ToFbAction(flatbuffers::FlatBufferBuilder& fbb, ActionPayload const& p) -> flatbuffers::Offset<fbn::ActionMsg>
    {
        auto const actor = fbb.CreateString(p.actor);
        auto const type = fbb.CreateString(p.type);
        flatbuffers::Offset<flatbuffers::Vector<int64_t>> offer{};
        flatbuffers::Offset<flatbuffers::Vector<int64_t>> request{};
        if (!p.offer.empty()) offer = fbb.CreateVector(p.offer);
        if (!p.request.empty()) request = fbb.CreateVector(p.request);
        auto const structure = OptString(fbb, p.structure);
        auto const partner = OptString(fbb, p.partner);
        return fbn::CreateActionMsg(fbb, actor, type, offer, request, structure, partner);
    }

    auto ToFbCounts(flatbuffers::FlatBufferBuilder& fbb, parley::core::ResourceCounts const& rc)
        -> flatbuffers::Offset<flatbuffers::Vector<uint16_t>>
    {
        return fbb.CreateVector(rc.data(), rc.size());
    }

    auto ToFbRoom(flatbuffers::FlatBufferBuilder& fbb, parley::core::RoomView const& r)
        -> flatbuffers::Offset<fbn::RoomView>
    {
        std::vector<flatbuffers::Offset<fbn::SeatInfo>> seats;
        seats.reserve(r.seats.size());
        for (parley::core::SeatInfo const& s : r.seats)
        {
            auto const color = fbb.CreateString(parley::core::ToString(s.color));
            auto const user = OptString(fbb, s.user_name);
            seats.push_back(fbn::CreateSeatInfo(fbb, color, user, s.is_you));
        }
        auto const seats_vec = fbb.CreateVector(seats);

        std::vector<flatbuffers::Offset<fbn::Tile>> tiles;
        tiles.reserve(r.board_preview.tiles.size());
        for (parley::core::Tile const& t : r.board_preview.tiles)
        {
            auto const res = t.resource.has_value()
                                 ? fbb.CreateString(parley::core::ToString(*t.resource))
                                 : flatbuffers::Offset<flatbuffers::String>{};
            tiles.push_back(fbn::CreateTile(fbb, res, t.number));
        }
        auto const preview = fbn::CreateBoardPreview(fbb, r.board_preview.seed, fbb.CreateVector(tiles));

        auto const room_id = fbb.CreateString(r.room_id);
        auto const name = fbb.CreateString(r.name);
        auto const game_id = OptString(fbb, r.game_id);
        auto const created = fbb.CreateString(r.created_at);
        auto const updated = fbb.CreateString(r.updated_at);

        return fbn::CreateRoomView(
            fbb,
            room_id,
            name,
            seats_vec,
            r.started,
            game_id,
            /*has_latest_version*/ r.latest_version.has_value(),
            /*latest_version*/ r.latest_version.value_or(0),
            created,
            updated,
            preview);
    }

    inline auto FinishResponse(flatbuffers::FlatBufferBuilder& fbb,
                               std::uint64_t request_id,
                               fbn::Response type,
                               flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateResponseEnvelope(fbb, request_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    inline auto FinishRequest(flatbuffers::FlatBufferBuilder& fbb,
                              std::uint64_t request_id,
                              fbn::Request type,
                              flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateRequestEnvelope(fbb, request_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace parley::core::net
{
    // ---------- Decode (server <- inbound wire) ----------

    auto DecodeRequest(std::span<std::byte const> bytes) -> std::expected<DecodedRequest, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyRequestEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"malformed request envelope"});

        auto const* env = fbn::GetRequestEnvelope(data);
        DecodedRequest out{};
        out.request_id = env->request_id();

        switch (env->request_type())
        {
        case fbn::Request::CreateRoomReq:
        {
            auto const* r = env->request_as_CreateRoomReq();
            out.request = req::CreateRoom{Str(r->name())};
            return out;
        }
        case fbn::Request::ListRoomsReq:
            out.request = req::ListRooms{};
            return out;

        case fbn::Request::JoinRoomReq:
        {
            auto const* r = env->request_as_JoinRoomReq();
            out.request = req::JoinRoom{Str(r->room_id()), Str(r->name())};
            return out;
        }
        case fbn::Request::RoomStatusReq:
        {
            auto const* r = env->request_as_RoomStatusReq();
            out.request = req::RoomStatus{Str(r->room_id()), OptStr(r->token())};
            return out;
        }
        case fbn::Request::LeaveRoomReq:
            out.request = req::LeaveRoom{OptStr(env->request_as_LeaveRoomReq()->token())};
            return out;

        case fbn::Request::RefreshBoardReq:
            out.request = req::RefreshBoard{OptStr(env->request_as_RefreshBoardReq()->token())};
            return out;

        case fbn::Request::StartRoomReq:
            out.request = req::StartRoom{OptStr(env->request_as_StartRoomReq()->token())};
            return out;

        case fbn::Request::GetRoomGameReq:
        {
            auto const* r = env->request_as_GetRoomGameReq();
            out.request = req::GetRoomGame{OptStr(r->token()), OptVersion(r->has_version(), r->version())};
            return out;
        }
        case fbn::Request::SubmitActionReq:
        {
            auto const* r = env->request_as_SubmitActionReq();
            if (r->action() == nullptr)
                return std::unexpected(ParseError{"action field is required"});
            out.request = req::SubmitAction{
                OptStr(r->token()),
                ToPayload(r->action()),
                OptVersion(r->has_expected_version(), r->expected_version())};
            return out;
        }
        case fbn::Request::CreateGameReq:
        {
            auto const* r = env->request_as_CreateGameReq();
            req::CreateGame cg{};
            if (auto const* v = r->players())
            {
                for (auto const* s : *v)
                {
                    std::optional<PlayerKind> const k = ParsePlayerKind(s->string_view());
                    if (!k.has_value())
                        return std::unexpected(ParseError{"unknown player kind '" + s->str() + "'"});
                    cg.players.push_back(*k);
                }
            }
            out.request = std::move(cg);
            return out;
        }
        case fbn::Request::ListGamesReq:
            out.request = req::ListGames{};
            return out;

        case fbn::Request::GetGameReq:
        {
            auto const* r = env->request_as_GetGameReq();
            out.request = req::GetGame{Str(r->game_id()), OptVersion(r->has_version(), r->version())};
            return out;
        }
        case fbn::Request::GameActionReq:
        {
            auto const* r = env->request_as_GameActionReq();
            std::optional<ActionPayload> action;
            if (r->action() != nullptr) action = ToPayload(r->action());
            out.request = req::GameAction{Str(r->game_id()), std::move(action)};
            return out;
        }
        case fbn::Request::DeleteGameReq:
            out.request = req::DeleteGame{Str(env->request_as_DeleteGameReq()->game_id())};
            return out;

        case fbn::Request::ListEventsReq:
        {
            auto const* r = env->request_as_ListEventsReq();
            out.request = req::ListEvents{Str(r->game_id()), OptStr(r->type())};
            return out;
        }
        default:
            return std::unexpected(ParseError{"unknown request variant"});
        }
    }

    // ---------- Builders (server -> client) ----------

    auto BuildRoomView(RoomView const& room, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateRoomViewRes(fbb, ToFbRoom(fbb, room));
        return FinishResponse(fbb, request_id, fbn::Response::RoomViewRes, r.Union());
    }

    auto BuildRoomList(std::span<RoomView const> rooms, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<flatbuffers::Offset<fbn::RoomView>> vec;
        vec.reserve(rooms.size());
        for (RoomView const& r : rooms) vec.push_back(ToFbRoom(fbb, r));
        auto const r = fbn::CreateRoomListRes(fbb, fbb.CreateVector(vec));
        return FinishResponse(fbb, request_id, fbn::Response::RoomListRes, r.Union());
    }

    auto BuildJoin(JoinView const& join, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const room = ToFbRoom(fbb, join.room);
        auto const token = fbb.CreateString(join.token);
        auto const seat = OptColor(fbb, join.seat);
        auto const r = fbn::CreateJoinRes(fbb, token, seat, join.is_spectator, room);
        return FinishResponse(fbb, request_id, fbn::Response::JoinRes, r.Union());
    }

    auto BuildStarted(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateStartRes(fbb, fbb.CreateString(game_id));
        return FinishResponse(fbb, request_id, fbn::Response::StartRes, r.Union());
    }

    auto BuildSnapshot(Snapshot const& snap, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        GameView const& v = snap.view;

        std::vector<flatbuffers::Offset<fbn::SeatState>> seats;
        seats.reserve(v.seats.size());
        for (SeatView const& s : v.seats)
        {
            auto const color = fbb.CreateString(ToString(s.color));
            seats.push_back(fbn::CreateSeatState(fbb, color, s.is_bot, ToFbCounts(fbb, s.resources),
                                                 s.victory_points));
        }
        auto const seats_vec = fbb.CreateVector(seats);

        flatbuffers::Offset<fbn::NegotiationView> neg{};
        if (v.negotiation.has_value())
        {
            NegotiationView const& n = *v.negotiation;
            auto const offerer = fbb.CreateString(ToString(n.offerer));
            auto const offer = ToFbCounts(fbb, n.offer);
            auto const request = ToFbCounts(fbb, n.request);
            auto const responded = ColorList(fbb, n.responded);
            auto const accepted = ColorList(fbb, n.accepted);
            neg = fbn::CreateNegotiationView(fbb, offerer, offer, request, responded, accepted);
        }

        std::vector<flatbuffers::Offset<fbn::ActionMsg>> playable;
        playable.reserve(v.playable_actions.size());
        for (Action const& a : v.playable_actions) playable.push_back(ToFbAction(fbb, EncodeAction(a)));
        auto const playable_vec = fbb.CreateVector(playable);

        auto const game_id = fbb.CreateString(snap.game_id);
        auto const current = OptColor(fbb, v.current_color);
        auto const prompt = fbb.CreateString(ToString(v.prompt));
        auto const winner = OptColor(fbb, v.winner);

        auto const r = fbn::CreateSnapshotRes(
            fbb,
            game_id,
            snap.version,
            seats_vec,
            current,
            prompt,
            v.rolled,
            v.last_roll,
            winner,
            neg,
            playable_vec,
            v.turn_number);
        return FinishResponse(fbb, request_id, fbn::Response::SnapshotRes, r.Union());
    }

    auto BuildGameList(std::span<Summary const> games, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<flatbuffers::Offset<fbn::SummaryMsg>> vec;
        vec.reserve(games.size());
        for (Summary const& s : games)
        {
            auto const id = fbb.CreateString(s.game_id);
            auto const colors = ColorList(fbb, s.seat_colors);
            auto const current = OptColor(fbb, s.current_color);
            auto const winner = OptColor(fbb, s.winner);
            auto const updated = fbb.CreateString(IsoTime(s.updated_at));
            vec.push_back(fbn::CreateSummaryMsg(fbb, id, s.latest_version, colors, current, winner, updated));
        }
        auto const r = fbn::CreateGameListRes(fbb, fbb.CreateVector(vec));
        return FinishResponse(fbb, request_id, fbn::Response::GameListRes, r.Union());
    }

    auto BuildGameCreated(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateGameCreatedRes(fbb, fbb.CreateString(game_id));
        return FinishResponse(fbb, request_id, fbn::Response::GameCreatedRes, r.Union());
    }

    auto BuildDeleted(GameId const& game_id, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateDeletedRes(fbb, fbb.CreateString(game_id), true);
        return FinishResponse(fbb, request_id, fbn::Response::DeletedRes, r.Union());
    }

    auto BuildEventList(std::span<Event const> events, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<flatbuffers::Offset<fbn::EventMsg>> vec;
        vec.reserve(events.size());
        for (Event const& e : events)
        {
            std::vector<flatbuffers::Offset<fbn::KeyValue>> kvs;
            kvs.reserve(e.payload.size());
            for (auto const& [k, val] : e.payload)
            {
                auto const key = fbb.CreateString(k);
                auto const value = fbb.CreateString(val);
                kvs.push_back(fbn::CreateKeyValue(fbb, key, value));
            }
            auto const payload = fbb.CreateVector(kvs);
            auto const id = fbb.CreateString(e.game_id);
            auto const type = fbb.CreateString(e.type);
            auto const created = fbb.CreateString(IsoTime(e.created_at));
            vec.push_back(fbn::CreateEventMsg(fbb, e.id, id, e.version.has_value(), e.version.value_or(0), type,
                                              payload, created));
        }
        auto const r = fbn::CreateEventListRes(fbb, fbb.CreateVector(vec));
        return FinishResponse(fbb, request_id, fbn::Response::EventListRes, r.Union());
    }

    auto BuildError(error::Code code, std::string_view message, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fbb.CreateString(error::to_string(code));
        auto const m = fbb.CreateString(message);
        auto const r = fbn::CreateErrorRes(fbb, error::StatusOf(code), c, m);
        return FinishResponse(fbb, request_id, fbn::Response::ErrorRes, r.Union());
    }

    // ---------- Builders (client -> server) ----------

    auto BuildCreateRoomReq(std::string_view name, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateCreateRoomReq(fbb, fbb.CreateString(name));
        return FinishRequest(fbb, request_id, fbn::Request::CreateRoomReq, r.Union());
    }

    auto BuildJoinRoomReq(RoomId const& room_id, std::string_view name, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(room_id);
        auto const n = fbb.CreateString(name);
        auto const r = fbn::CreateJoinRoomReq(fbb, id, n);
        return FinishRequest(fbb, request_id, fbn::Request::JoinRoomReq, r.Union());
    }

    auto BuildStartRoomReq(Token const& token, std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbn::CreateStartRoomReq(fbb, fbb.CreateString(token));
        return FinishRequest(fbb, request_id, fbn::Request::StartRoomReq, r.Union());
    }

    auto BuildSubmitActionReq(Token const& token,
                              ActionPayload const& action,
                              std::optional<Version> expected_version,
                              std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const t = fbb.CreateString(token);
        auto const a = ToFbAction(fbb, action);
        auto const r = fbn::CreateSubmitActionReq(fbb, t, a, expected_version.has_value(),
                                                  expected_version.value_or(0));
        return FinishRequest(fbb, request_id, fbn::Request::SubmitActionReq, r.Union());
    }

    auto BuildCreateGameReq(std::span<PlayerKind const> players, std::uint64_t request_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        std::vector<std::string> names;
        names.reserve(players.size());
        for (PlayerKind const k : players) names.emplace_back(ToString(k));
        auto const r = fbn::CreateCreateGameReq(fbb, fbb.CreateVectorOfStrings(names));
        return FinishRequest(fbb, request_id, fbn::Request::CreateGameReq, r.Union());
    }

    auto BuildGameActionReq(GameId const& game_id,
                            std::optional<ActionPayload> const& action,
                            std::uint64_t request_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(game_id);
        flatbuffers::Offset<fbn::ActionMsg> a{};
        if (action.has_value()) a = ToFbAction(fbb, *action);
        auto const r = fbn::CreateGameActionReq(fbb, id, a);
        return FinishRequest(fbb, request_id, fbn::Request::GameActionReq, r.Union());
    }

    auto ReadResponse(std::span<std::byte const> bytes) -> fbn::ResponseEnvelope const*
    {
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!verifier.VerifyBuffer<fbn::ResponseEnvelope>(nullptr)) return nullptr;
        return flatbuffers::GetRoot<fbn::ResponseEnvelope>(data);
    }
} // namespace parley::core::net
