#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "qline/session/session_orchestrator.hpp"
#include "qline/utils/logging.hpp"

namespace qline::config {

// Everything one node needs: session parameters, endpoint, identity
struct NodeConfig {
    session::SessionConfig session;

    std::string host{"127.0.0.1"};
    uint16_t port{7400};

    // Ed25519 seed (32 bytes); empty generates a fresh identity per run
    std::vector<uint8_t> identity_seed;

    utils::LogLevel log_level{utils::LogLevel::INFO};
};

enum class Mode {
    LISTEN,
    CONNECT
};

// Command line as parsed; unset options leave the file value alone
struct CliOptions {
    Mode mode{Mode::CONNECT};
    std::string config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> log_level;
    std::optional<double> error_rate;
    std::vector<std::string> messages;
};

// Parse configuration from an INI file; nullopt if unreadable or malformed
std::optional<NodeConfig> load_config(const std::string& path);

// Parse CLI arguments. On nullopt, exit_code holds the process exit status
// (0 after --help).
std::optional<CliOptions> parse_cli(int argc, char* argv[], int& exit_code);

// Save configuration to file
bool save_config(const NodeConfig& config, const std::string& path);

// Apply CLI options over a loaded configuration
NodeConfig merge_config(const NodeConfig& base, const CliOptions& cli);

// Hex string (optional 0x prefix) to bytes; nullopt on odd length or bad digit
std::optional<std::vector<uint8_t>> parse_hex(const std::string& hex);
std::string to_hex(const std::vector<uint8_t>& bytes);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const NodeConfig& config);

}  // namespace qline::config
