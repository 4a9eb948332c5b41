#include "qline/config/config.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "qline/packet/wire.hpp"

namespace qline::config {

namespace {

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
        size_t line;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;
        size_t line_number = 0;

        while (std::getline(input, line)) {
            ++line_number;

            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key=value
            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                // Trim
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value, line_number});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// std::stoull accepts a leading '-' and wraps; reject it
uint64_t parse_unsigned(const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("expected an unsigned integer");
    }
    size_t used = 0;
    uint64_t result = std::stoull(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

double parse_double(const std::string& value) {
    size_t used = 0;
    double result = std::stod(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

std::vector<uint8_t> parse_hex_or_throw(const std::string& value) {
    auto bytes = parse_hex(value);
    if (!bytes) {
        throw std::invalid_argument("expected a hex string");
    }
    return *bytes;
}

// Apply one entry; throws std::invalid_argument / std::out_of_range on bad values.
// Returns false for an unknown key.
bool apply_entry(NodeConfig& config, const std::string& section, const std::string& key,
                 const std::string& value) {
    auto& session = config.session;

    if (section == "qkd") {
        if (key == "raw_bits") {
            session.raw_bits = parse_unsigned(value);
        } else if (key == "channel_error_rate") {
            session.channel_error_rate = parse_double(value);
        } else if (key == "qber_threshold") {
            session.qber_threshold = parse_double(value);
        } else if (key == "sample_fraction") {
            session.sample_fraction = parse_double(value);
        } else if (key == "min_sifted_bits") {
            session.min_sifted_bits = parse_unsigned(value);
        } else if (key == "reconciliation_passes") {
            session.reconciliation_passes = parse_unsigned(value);
        } else {
            return false;
        }
    } else if (section == "session") {
        if (key == "key_length_bits") {
            session.key_length_bits = parse_unsigned(value);
        } else if (key == "rotation_interval_ms") {
            session.rotation.interval = std::chrono::milliseconds(parse_unsigned(value));
        } else if (key == "rotation_byte_limit") {
            session.rotation.byte_limit = parse_unsigned(value);
        } else if (key == "handshake_timeout_ms") {
            session.handshake_timeout = std::chrono::milliseconds(parse_unsigned(value));
        } else if (key == "max_handshake_attempts") {
            session.max_handshake_attempts = static_cast<uint32_t>(parse_unsigned(value));
        } else {
            return false;
        }
    } else if (section == "security") {
        if (key == "psk") {
            session.psk = parse_hex_or_throw(value);
        } else if (key == "peer_identity") {
            session.peer_identity = parse_hex_or_throw(value);
        } else if (key == "identity_seed") {
            config.identity_seed = parse_hex_or_throw(value);
        } else {
            return false;
        }
    } else if (section == "network" || section.empty()) {
        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            uint64_t port = parse_unsigned(value);
            if (port > 65535) {
                throw std::out_of_range("port above 65535");
            }
            config.port = static_cast<uint16_t>(port);
        } else {
            return false;
        }
    } else if (section == "logging") {
        if (key == "level") {
            auto level = utils::parse_log_level(value);
            if (!level) {
                throw std::invalid_argument("unknown log level");
            }
            config.log_level = *level;
        } else {
            return false;
        }
    } else {
        return false;
    }
    return true;
}

}  // namespace

std::optional<std::vector<uint8_t>> parse_hex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(digits[i])) ||
            !std::isxdigit(static_cast<unsigned char>(digits[i + 1]))) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream out;
    for (auto b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return out.str();
}

std::optional<NodeConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open configuration file {}", path);
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    NodeConfig config;

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        try {
            if (!apply_entry(config, section, key, entry.value)) {
                spdlog::warn("{}:{}: ignoring unknown key [{}] {}", path, entry.line, section, key);
            }
        } catch (const std::exception& e) {
            spdlog::error("{}:{}: invalid value for [{}] {}: {}", path, entry.line, section, key, e.what());
            return std::nullopt;
        }
    }

    return config;
}

std::optional<CliOptions> parse_cli(int argc, char* argv[], int& exit_code) {
    CLI::App app{"qline - hybrid QKD secure channel"};
    app.require_subcommand(1);
    app.fallthrough();

    CliOptions options;
    std::string host;
    uint16_t port = 0;
    std::string log_level;
    double error_rate = 0.0;

    app.add_option("-c,--config", options.config_path, "Configuration file (INI)");
    auto* level_opt = app.add_option("-l,--log-level", log_level,
                                     "Log level (trace, debug, info, warn, error, off)")
                          ->check([](const std::string& value) {
                              return utils::parse_log_level(value) ? std::string()
                                                                   : "unknown log level " + value;
                          });
    auto* rate_opt = app.add_option("--error-rate", error_rate,
                                    "Simulated quantum channel error rate")
                         ->check(CLI::Range(0.0, 1.0));

    auto* listen = app.add_subcommand("listen", "Accept one session and echo every message");
    auto* listen_port = listen->add_option("-p,--port", port, "Listen port");
    auto* listen_bind = listen->add_option("-b,--bind", host, "Bind address");

    auto* connect = app.add_subcommand("connect", "Connect, send each message and print the echo");
    auto* connect_host = connect->add_option("-H,--host", host, "Peer host");
    auto* connect_port = connect->add_option("-p,--port", port, "Peer port");
    connect->add_option("-m,--message", options.messages, "Message to send (repeatable)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    if (listen->parsed()) {
        options.mode = Mode::LISTEN;
        if (listen_bind->count() > 0) options.host = host;
        if (listen_port->count() > 0) options.port = port;
    } else {
        options.mode = Mode::CONNECT;
        if (connect_host->count() > 0) options.host = host;
        if (connect_port->count() > 0) options.port = port;
    }
    if (level_opt->count() > 0) options.log_level = log_level;
    if (rate_opt->count() > 0) options.error_rate = error_rate;

    exit_code = 0;
    return options;
}

bool save_config(const NodeConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    const auto& session = config.session;

    file << "[qkd]\n";
    file << "raw_bits = " << session.raw_bits << "\n";
    file << "channel_error_rate = " << session.channel_error_rate << "\n";
    file << "qber_threshold = " << session.qber_threshold << "\n";
    file << "sample_fraction = " << session.sample_fraction << "\n";
    file << "min_sifted_bits = " << session.min_sifted_bits << "\n";
    file << "reconciliation_passes = " << session.reconciliation_passes << "\n";
    file << "\n";

    file << "[session]\n";
    file << "key_length_bits = " << session.key_length_bits << "\n";
    file << "rotation_interval_ms = " << session.rotation.interval.count() << "\n";
    file << "rotation_byte_limit = " << session.rotation.byte_limit << "\n";
    file << "handshake_timeout_ms = " << session.handshake_timeout.count() << "\n";
    file << "max_handshake_attempts = " << session.max_handshake_attempts << "\n";
    file << "\n";

    file << "[security]\n";
    if (!session.psk.empty()) {
        file << "psk = 0x" << to_hex(session.psk) << "\n";
    }
    if (!session.peer_identity.empty()) {
        file << "peer_identity = " << to_hex(session.peer_identity) << "\n";
    }
    if (!config.identity_seed.empty()) {
        file << "identity_seed = " << to_hex(config.identity_seed) << "\n";
    }
    file << "\n";

    file << "[network]\n";
    file << "host = " << config.host << "\n";
    file << "port = " << config.port << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << utils::log_level_to_string(config.log_level) << "\n";

    return static_cast<bool>(file);
}

NodeConfig merge_config(const NodeConfig& base, const CliOptions& cli) {
    NodeConfig result = base;

    if (cli.host) {
        result.host = *cli.host;
    }
    if (cli.port) {
        result.port = *cli.port;
    }
    if (cli.log_level) {
        result.log_level = utils::string_to_log_level(*cli.log_level);
    }
    if (cli.error_rate) {
        result.session.channel_error_rate = *cli.error_rate;
    }

    return result;
}

ValidationResult validate_config(const NodeConfig& config) {
    ValidationResult result;
    const auto& session = config.session;

    auto error = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    // Quantum exchange
    if (session.raw_bits == 0) {
        error("raw_bits must be positive");
    } else if (session.raw_bits > packet::MAX_RAW_BITS) {
        error("raw_bits must not exceed " + std::to_string(packet::MAX_RAW_BITS) +
              " - larger handshake messages do not fit one frame");
    } else if (session.raw_bits < 2 * session.min_sifted_bits) {
        result.warnings.push_back("raw_bits below 2 x min_sifted_bits - sifting will often fall short");
    }
    if (session.channel_error_rate < 0.0 || session.channel_error_rate > 1.0) {
        error("channel_error_rate must be in [0, 1]");
    }
    if (session.qber_threshold < 0.0 || session.qber_threshold > 1.0) {
        error("qber_threshold must be in [0, 1]");
    } else if (session.qber_threshold > 0.11) {
        result.warnings.push_back("qber_threshold above 0.11 exceeds the BB84 security bound");
    }
    if (session.sample_fraction <= 0.0 || session.sample_fraction >= 1.0) {
        error("sample_fraction must be in (0, 1)");
    }
    if (session.min_sifted_bits == 0) {
        error("min_sifted_bits must be positive");
    }
    if (session.reconciliation_passes == 0) {
        result.warnings.push_back("Reconciliation is disabled - any channel noise fails key confirmation");
    }

    // Keys
    if (session.key_length_bits != 256) {
        error("key_length_bits must be 256");
    }
    if (session.rotation.interval.count() == 0 && session.rotation.byte_limit == 0) {
        result.warnings.push_back("Key rotation is disabled - not recommended");
    }

    // Handshake
    if (session.handshake_timeout.count() <= 0) {
        error("handshake_timeout_ms must be positive");
    }
    if (session.max_handshake_attempts == 0) {
        error("max_handshake_attempts must be at least 1");
    }

    // Security
    if (session.psk.empty()) {
        result.warnings.push_back("No pre-shared key configured");
    } else if (session.psk.size() < 16) {
        result.warnings.push_back("Pre-shared key shorter than 128 bits");
    }
    if (!session.peer_identity.empty() && session.peer_identity.size() != auth::ED25519_PUBLIC_KEY_SIZE) {
        error("peer_identity must be a 32-byte Ed25519 public key");
    }
    if (!config.identity_seed.empty() && config.identity_seed.size() != auth::ED25519_SEED_SIZE) {
        error("identity_seed must be 32 bytes");
    }

    // Network
    if (config.port == 0) {
        result.warnings.push_back("Port is 0 - will use ephemeral port");
    }

    return result;
}

}  // namespace qline::config
