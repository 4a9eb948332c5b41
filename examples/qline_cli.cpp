#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "qline/auth/authenticator.hpp"
#include "qline/config/config.hpp"
#include "qline/crypto/crypto.hpp"
#include "qline/session/session_orchestrator.hpp"
#include "qline/transport/tcp_transport.hpp"
#include "qline/utils/logging.hpp"

using namespace qline;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    g_running = false;
}

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(200);

// 0 clean close; 2 eavesdropping; 3 authentication; 4 transport or timeout; 1 other
int exit_code_for(const session::SessionState& state) {
    if (state.phase == session::SessionPhase::CLOSED || state.last_error == ErrorCode::NONE) {
        return 0;
    }
    switch (state.last_error) {
        case ErrorCode::EAVESDROPPING_SUSPECTED:
            return 2;
        case ErrorCode::AUTHENTICATION_FAILURE:
        case ErrorCode::TAG_MISMATCH:
        case ErrorCode::REPLAY_DETECTED:
        case ErrorCode::KEY_CONFIRMATION_FAILED:
            return 3;
        case ErrorCode::TRANSPORT_ERROR:
        case ErrorCode::TIMEOUT:
            return 4;
        default:
            return 1;
    }
}

std::unique_ptr<auth::Authenticator> make_authenticator(const config::NodeConfig& config) {
    if (config.identity_seed.empty()) {
        return std::make_unique<auth::Ed25519Authenticator>();
    }
    auth::IdentitySeed seed{};
    std::copy(config.identity_seed.begin(), config.identity_seed.end(), seed.begin());
    auto authenticator = std::make_unique<auth::Ed25519Authenticator>(seed);
    crypto::secure_zero(seed.data(), seed.size());
    return authenticator;
}

int run_listener(const config::NodeConfig& config, const auth::Authenticator& authenticator) {
    transport::TcpListener listener;
    if (!listener.open({config.host, config.port})) {
        spdlog::error("Cannot listen on {}:{}", config.host, config.port);
        return 4;
    }
    spdlog::info("Listening on {}", listener.local_address().to_string());

    std::unique_ptr<transport::TcpStream> stream;
    while (g_running && !stream) {
        stream = listener.accept(POLL_INTERVAL);
    }
    if (!stream) {
        return 0;
    }
    spdlog::info("Accepted connection from {}", stream->peer().to_string());

    session::SessionOrchestrator session(Role::RESPONDER, config.session, *stream, authenticator);
    if (!session.establish()) {
        return exit_code_for(session.state());
    }
    spdlog::info("Session established with peer {}", config::to_hex(session.peer_identity()));

    while (g_running && session.is_active()) {
        auto message = session.receive(POLL_INTERVAL);
        if (!message) {
            continue;
        }
        spdlog::info("Received {} bytes", message->size());
        if (!session.send(*message)) {
            break;
        }
    }

    if (session.is_active()) {
        session.close();
    }
    stream->close();
    return exit_code_for(session.state());
}

int run_connector(const config::NodeConfig& config,
                  const auth::Authenticator& authenticator,
                  const std::vector<std::string>& messages) {
    transport::SocketAddress peer{config.host, config.port};
    spdlog::info("Connecting to {}", peer.to_string());

    auto stream = transport::tcp_connect(peer, config.session.handshake_timeout);
    if (!stream) {
        spdlog::error("Cannot connect to {}", peer.to_string());
        return 4;
    }

    session::SessionOrchestrator session(Role::INITIATOR, config.session, *stream, authenticator);
    if (!session.establish()) {
        return exit_code_for(session.state());
    }
    spdlog::info("Session established with peer {}", config::to_hex(session.peer_identity()));

    for (const auto& text : messages) {
        if (!g_running) {
            break;
        }
        std::vector<uint8_t> data(text.begin(), text.end());
        if (!session.send(data)) {
            break;
        }

        std::optional<std::vector<uint8_t>> echo;
        while (g_running && session.is_active() && !echo) {
            echo = session.receive(POLL_INTERVAL);
        }
        if (!echo) {
            break;
        }
        std::cout << std::string(echo->begin(), echo->end()) << std::endl;
    }

    session.close();
    stream->close();
    return exit_code_for(session.state());
}

}  // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto cli = config::parse_cli(argc, argv, exit_code);
    if (!cli) {
        return exit_code;
    }

    // Logging first so configuration problems are reported
    utils::init_logging(utils::string_to_log_level(cli->log_level.value_or("info")));

    config::NodeConfig config;
    if (!cli->config_path.empty()) {
        auto loaded = config::load_config(cli->config_path);
        if (!loaded) {
            return 1;
        }
        config = std::move(*loaded);
    }
    config = config::merge_config(config, *cli);
    utils::set_log_level(config.log_level);

    auto validation = config::validate_config(config);
    for (const auto& warning : validation.warnings) {
        spdlog::warn("Config: {}", warning);
    }
    if (!validation.valid) {
        for (const auto& error : validation.errors) {
            spdlog::error("Config: {}", error);
        }
        return 1;
    }

    // Initialize crypto
    if (!crypto::init()) {
        spdlog::error("Failed to initialize crypto subsystem");
        return 1;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto authenticator = make_authenticator(config);
    spdlog::info("Local identity {}", config::to_hex(authenticator->public_identity()));

    int rc = cli->mode == config::Mode::LISTEN
                 ? run_listener(config, *authenticator)
                 : run_connector(config, *authenticator, cli->messages);

    spdlog::info("qline finished");
    return rc;
}
