/**
 * kizunad — Engine Daemon Entry Point
 *
 * Loads config, brings the engine up, rescans the network once per discovery
 * window and logs engine events until SIGINT or SIGTERM.
 */

#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "common/error.h"
#include "config/engine_config.h"
#include "engine/engine.h"

using namespace kizuna;

static void log_event(const EngineEvent& event) {
    const auto peer = event.peer_id.substr(0, 16);
    switch (event.type) {
    case EngineEventType::peer_discovered:
        spdlog::info("kizunad: discovered {} ({}) via {} method(s)", peer, event.peer ? event.peer->name : "",
                     event.peer ? event.peer->discovery_methods.size() : 0);
        break;
    case EngineEventType::session_established:
        spdlog::info("kizunad: session with {} over {}", peer,
                     event.session ? event.session->remote_address : "");
        break;
    case EngineEventType::session_closed:
        spdlog::info("kizunad: session with {} closed{}", peer,
                     event.error ? " (" + event.error.message() + ")" : std::string());
        break;
    case EngineEventType::incoming_transfer:
    case EngineEventType::transfer_completed:
    case EngineEventType::transfer_failed:
        if (event.transfer)
            spdlog::info("kizunad: {} {} from {} ({} bytes)", to_string(event.type), event.transfer->file_name,
                         peer, event.transfer->size);
        break;
    case EngineEventType::transfer_progress:
        if (event.transfer)
            spdlog::debug("kizunad: {} {:.0f}%", event.transfer->file_name, event.transfer->progress() * 100.0);
        break;
    case EngineEventType::stream_started:
    case EngineEventType::stream_stopped:
    case EngineEventType::stream_quality_changed:
        if (event.stream)
            spdlog::info("kizunad: {} {} {} quality {}", to_string(event.type), to_string(event.stream->kind),
                         peer, event.stream->quality);
        break;
    }
}

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config.json";

    EngineConfig config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "kizunad: " << e.what() << "\n";
        return 1;
    }

    Engine engine(config);
    engine.set_event_handler(log_event);
    // Without an operator at the console, manual-mode requests are declined.
    engine.set_approval_handler([](const PeerRecord& peer, TrustManager::ApprovalResponder respond) {
        spdlog::warn("kizunad: declining unattended approval request from {} ({})", peer.id.substr(0, 16),
                     peer.name);
        respond(false);
    });

    if (auto ec = engine.init()) {
        spdlog::error("kizunad: engine failed to start: {}", ec.message());
        return 1;
    }
    spdlog::info("kizunad: {} listening on tcp port {}", engine.local_peer_id().substr(0, 16), engine.listen_port());

    asio::io_context io;
    asio::steady_timer rescan(io);
    asio::signal_set signals(io, SIGINT, SIGTERM);

    std::function<void(std::chrono::milliseconds)> schedule_rescan = [&](std::chrono::milliseconds delay) {
        rescan.expires_after(delay);
        rescan.async_wait([&](std::error_code ec) {
            if (ec)
                return;
            engine.async_discover_peers(config.discovery.timeout, config.discovery.interval,
                                        [](std::error_code ec, std::vector<PeerRecord> peers) {
                                            if (ec && ec != make_error_code(errc::cancelled))
                                                spdlog::warn("kizunad: discovery: {}", ec.message());
                                            else
                                                spdlog::debug("kizunad: discovery saw {} peer(s)", peers.size());
                                        });
            schedule_rescan(config.discovery.timeout);
        });
    };

    signals.async_wait([&](std::error_code ec, int signo) {
        if (ec)
            return;
        spdlog::info("kizunad: signal {} received, shutting down", signo);
        rescan.cancel();
    });

    schedule_rescan(std::chrono::milliseconds(0));
    io.run();

    engine.shutdown();
    return 0;
}
