// File: src/ParleyServerMain.cpp
//
// Allman style. Explicit types. No K&R.
//
// Authoritative room/game server over WebSocket++ (no TLS) on Boost.Asio.
// The network thread only queues binary frames; a pool of workers decodes each
// request, runs it against the Service start to finish, and replies on the
// same connection.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/MemoryStateStore.hpp"
#include "core/PlayerFactory.hpp"
#include "core/Service.hpp"
#include "core/TradeRules.hpp"
#include "debug/AuditLogger.hpp"
#include "net/Dispatcher.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;

    struct Frame
    {
        websocketpp::connection_hdl hdl{};
        std::vector<std::uint8_t> bytes;
    };

    class InboundQueue
    {
    public:
        InboundQueue() = default;

        void push(Frame f)
        {
            std::lock_guard<std::mutex> lock(m_);
            q_.push_back(std::move(f));
            cv_.notify_one();
        }

        // Blocks until a frame arrives or the queue is closed; false once closed and drained.
        bool pop(Frame& out)
        {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait(lock, [this]() { return closed_ || !q_.empty(); });
            if (q_.empty())
            {
                return false;
            }
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void close()
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
            cv_.notify_all();
        }

    private:
        std::mutex m_;
        std::condition_variable cv_;
        std::deque<Frame> q_;
        bool closed_{false};
    };

    struct CmdLine
    {
        std::uint16_t port{9002};
        std::uint32_t workers{4};
        std::uint8_t vp_to_win{10};
        std::string log_level{"info"};
        std::optional<std::string> audit_dir;
    };

    CmdLine ParseArgs(int argc, char** argv)
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string key = argv[i];
            auto read_u32 = [&](std::uint32_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_u16 = [&](std::uint16_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_u8 = [&](std::uint8_t& dst)
            {
                if (i + 1 < argc)
                {
                    dst = static_cast<std::uint8_t>(std::strtoul(argv[++i], nullptr, 10));
                }
            };
            auto read_str = [&](std::string& dst)
            {
                if (i + 1 < argc)
                {
                    dst = argv[++i];
                }
            };

            if (key == "--port") { read_u16(c.port); }
            else if (key == "--workers") { read_u32(c.workers); }
            else if (key == "--vp-to-win") { read_u8(c.vp_to_win); }
            else if (key == "--log-level") { read_str(c.log_level); }
            else if (key == "--audit-dir")
            {
                std::string dir;
                read_str(dir);
                if (!dir.empty())
                {
                    c.audit_dir = std::move(dir);
                }
            }
            else
            {
                spdlog::warn("[Server] Ignoring unknown argument '{}'", key);
            }
        }
        if (c.workers == 0)
        {
            c.workers = 1;
        }
        if (c.vp_to_win == 0)
        {
            c.vp_to_win = 10;
        }
        return c;
    }

    // Writes one transcript per finished game.
    class AuditSink
    {
    public:
        AuditSink(parley::core::StateStore const& store, std::optional<std::string> dir)
            : store_(store)
              , dir_(std::move(dir))
        {
        }

        void operator()(parley::core::GameId const& game_id)
        {
            if (!dir_.has_value())
            {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(m_);
                if (!written_.insert(game_id).second)
                {
                    return;
                }
            }
            std::filesystem::path const path = std::filesystem::path(*dir_) / fmt::format("{}.txt", game_id);
            if (parley::core::debug::WriteTranscript(store_, game_id, path.string()))
            {
                spdlog::info("[Audit] Game {} transcript -> {}", game_id, path.string());
            }
            else
            {
                spdlog::error("[Audit] Could not open {}", path.string());
            }
        }

    private:
        parley::core::StateStore const& store_;
        std::optional<std::string> dir_;
        std::mutex m_;
        std::unordered_set<parley::core::GameId> written_;
    };
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = ParseArgs(argc, argv);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    if (cfg.audit_dir.has_value())
    {
        std::error_code ec;
        std::filesystem::create_directories(*cfg.audit_dir, ec);
        if (ec)
        {
            spdlog::error("[Server] Cannot create audit dir {}: {}", *cfg.audit_dir, ec.message());
            return 1;
        }
    }

    parley::core::Config gcfg{};
    gcfg.vp_to_win = cfg.vp_to_win;

    parley::core::MemoryStateStore store;
    parley::core::TradeRules const rules;
    parley::core::PlayerFactory const players;
    parley::core::Service service(store, rules, players, gcfg);
    AuditSink audit(store, cfg.audit_dir);
    parley::core::net::Dispatcher dispatcher(service, [&audit](parley::core::GameId const& id) { audit(id); });

    spdlog::info("[Server] Booting on port {} | {} worker(s) | {} VP to win",
                 cfg.port, cfg.workers, static_cast<int>(cfg.vp_to_win));

    WsServer server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.set_access_channels(websocketpp::log::alevel::connect |
        websocketpp::log::alevel::disconnect);
    server.init_asio();
    server.set_reuse_addr(true);

    InboundQueue inbox;

    server.set_message_handler([&](websocketpp::connection_hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            spdlog::warn("[Server] Ignoring non-binary frame from client");
            return;
        }

        std::string const& payload = msg->get_payload();
        Frame f{};
        f.hdl = hdl;
        f.bytes.assign(reinterpret_cast<const std::uint8_t*>(payload.data()),
                       reinterpret_cast<const std::uint8_t*>(payload.data()) + payload.size());
        inbox.push(std::move(f));
    });

    std::vector<std::thread> workers;
    workers.reserve(cfg.workers);
    for (std::uint32_t w = 0; w < cfg.workers; ++w)
    {
        workers.emplace_back([&server, &inbox, &dispatcher, w]()
        {
            Frame f{};
            while (inbox.pop(f))
            {
                std::span<const std::byte> bytes{
                    reinterpret_cast<const std::byte*>(f.bytes.data()),
                    f.bytes.size()
                };
                flatbuffers::DetachedBuffer reply = dispatcher.Handle(bytes);

                websocketpp::lib::error_code ec;
                server.send(f.hdl, reply.data(), reply.size(), websocketpp::frame::opcode::binary, ec);
                if (ec)
                {
                    spdlog::warn("[Server] Worker {} send failed: {}", w, ec.message());
                }
            }
        });
    }

    websocketpp::lib::asio::signal_set signals(server.get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&server](websocketpp::lib::asio::error_code const&, int sig)
    {
        spdlog::info("[Server] Signal {} received, shutting down", sig);
        websocketpp::lib::error_code ec;
        server.stop_listening(ec);
        if (ec)
        {
            spdlog::warn("[Server] stop_listening failed: {}", ec.message());
        }
        server.stop();
    });

    websocketpp::lib::error_code listen_ec;
    server.listen(cfg.port, listen_ec);
    if (listen_ec)
    {
        spdlog::error("[Server] Cannot listen on {}: {}", cfg.port, listen_ec.message());
        inbox.close();
        for (std::thread& t : workers)
        {
            t.join();
        }
        return 1;
    }
    server.start_accept();
    server.run();

    inbox.close();
    for (std::thread& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
    spdlog::info("[Server] Stopped");
    return 0;
}
