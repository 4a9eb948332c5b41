#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "qline/config/config.hpp"
#include "qline/packet/wire.hpp"
#include "qline/utils/logging.hpp"

namespace qline::config {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "qline_config_test_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini";
    }

    void TearDown() override { std::remove(path_.c_str()); }

    void write_file(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    // argv for CLI11, which wants mutable C strings
    std::optional<CliOptions> parse(std::vector<std::string> args, int& exit_code) {
        args.insert(args.begin(), "qline");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_cli(static_cast<int>(argv.size()), argv.data(), exit_code);
    }

    std::string path_;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    NodeConfig config;
    config.session.psk.assign(32, 0x01);

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 7400);
    EXPECT_EQ(config.log_level, utils::LogLevel::INFO);
}

TEST_F(ConfigTest, LoadFullFile) {
    write_file(
        "# qline node\n"
        "[qkd]\n"
        "raw_bits = 4096\n"
        "channel_error_rate = 0.05\n"
        "qber_threshold = 0.1\n"
        "sample_fraction = 0.25\n"
        "min_sifted_bits = 512\n"
        "reconciliation_passes = 6\n"
        "\n"
        "[session]\n"
        "key_length_bits = 256\n"
        "rotation_interval_ms = 60000\n"
        "rotation_byte_limit = 1048576\n"
        "handshake_timeout_ms = 2500\n"
        "max_handshake_attempts = 5\n"
        "\n"
        "[security]\n"
        "psk = 0xA0A1A2A3\n"
        "peer_identity = \"00ff\"\n"
        "\n"
        "; endpoint\n"
        "[network]\n"
        "host = 10.0.0.7\n"
        "port = 9001\n"
        "\n"
        "[logging]\n"
        "level = DEBUG\n");

    auto config = load_config(path_);
    ASSERT_TRUE(config.has_value());

    const auto& session = config->session;
    EXPECT_EQ(session.raw_bits, 4096u);
    EXPECT_DOUBLE_EQ(session.channel_error_rate, 0.05);
    EXPECT_DOUBLE_EQ(session.qber_threshold, 0.1);
    EXPECT_DOUBLE_EQ(session.sample_fraction, 0.25);
    EXPECT_EQ(session.min_sifted_bits, 512u);
    EXPECT_EQ(session.reconciliation_passes, 6u);
    EXPECT_EQ(session.rotation.interval.count(), 60000);
    EXPECT_EQ(session.rotation.byte_limit, 1048576u);
    EXPECT_EQ(session.handshake_timeout.count(), 2500);
    EXPECT_EQ(session.max_handshake_attempts, 5u);
    EXPECT_THAT(session.psk, ElementsAre(0xA0, 0xA1, 0xA2, 0xA3));
    EXPECT_THAT(session.peer_identity, ElementsAre(0x00, 0xFF));
    EXPECT_EQ(config->host, "10.0.0.7");
    EXPECT_EQ(config->port, 9001);
    EXPECT_EQ(config->log_level, utils::LogLevel::DEBUG);
}

TEST_F(ConfigTest, SaveThenLoad) {
    NodeConfig original;
    original.session.raw_bits = 8192;
    original.session.channel_error_rate = 0.25;
    original.session.rotation.byte_limit = 4096;
    original.session.psk = {0xDE, 0xAD, 0xBE, 0xEF};
    original.session.peer_identity.assign(32, 0x11);
    original.identity_seed.assign(32, 0x22);
    original.host = "192.168.0.3";
    original.port = 7500;
    original.log_level = utils::LogLevel::WARN;

    ASSERT_TRUE(save_config(original, path_));
    auto loaded = load_config(path_);
    ASSERT_TRUE(loaded.has_value());

    EXPECT_EQ(loaded->session.raw_bits, original.session.raw_bits);
    EXPECT_DOUBLE_EQ(loaded->session.channel_error_rate, 0.25);
    EXPECT_EQ(loaded->session.rotation.byte_limit, 4096u);
    EXPECT_EQ(loaded->session.rotation.interval, original.session.rotation.interval);
    EXPECT_EQ(loaded->session.psk, original.session.psk);
    EXPECT_EQ(loaded->session.peer_identity, original.session.peer_identity);
    EXPECT_EQ(loaded->identity_seed, original.identity_seed);
    EXPECT_EQ(loaded->host, original.host);
    EXPECT_EQ(loaded->port, original.port);
    EXPECT_EQ(loaded->log_level, utils::LogLevel::WARN);
}

TEST_F(ConfigTest, UnknownKeysIgnored) {
    write_file(
        "[qkd]\n"
        "raw_bits = 1024\n"
        "detector_efficiency = 0.9\n"
        "[telemetry]\n"
        "endpoint = nowhere\n");

    auto config = load_config(path_);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->session.raw_bits, 1024u);
}

TEST_F(ConfigTest, BadValuesRejected) {
    const std::vector<std::string> bad = {
        "[qkd]\nraw_bits = -5\n",
        "[qkd]\nraw_bits = abc\n",
        "[qkd]\nraw_bits = 12x\n",
        "[qkd]\nqber_threshold = high\n",
        "[network]\nport = 70000\n",
        "[security]\npsk = 0xABC\n",
        "[security]\npeer_identity = zz\n",
        "[logging]\nlevel = verbose\n",
    };

    for (size_t i = 0; i < bad.size(); ++i) {
        write_file(bad[i]);
        EXPECT_FALSE(load_config(path_).has_value()) << "case " << i;
    }
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(load_config(path_ + ".missing").has_value());
}

TEST_F(ConfigTest, ValidationErrors) {
    NodeConfig config;
    config.session.raw_bits = 0;
    config.session.sample_fraction = 1.0;
    config.session.key_length_bits = 128;
    config.session.max_handshake_attempts = 0;
    config.session.peer_identity = {1, 2, 3};

    auto result = validate_config(config);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, Contains(HasSubstr("raw_bits")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("sample_fraction")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("key_length_bits")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("max_handshake_attempts")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("peer_identity")));
}

TEST_F(ConfigTest, RawBitsCappedByFrameSize) {
    NodeConfig config;
    config.session.psk.assign(32, 0x01);

    config.session.raw_bits = packet::MAX_RAW_BITS;
    EXPECT_TRUE(validate_config(config).valid);

    config.session.raw_bits = packet::MAX_RAW_BITS + 1;
    auto result = validate_config(config);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.errors, Contains(HasSubstr("raw_bits")));
}

TEST_F(ConfigTest, LogLevelNames) {
    EXPECT_EQ(utils::parse_log_level("Warning"), std::optional<utils::LogLevel>(utils::LogLevel::WARN));
    EXPECT_EQ(utils::parse_log_level("ERR"), std::optional<utils::LogLevel>(utils::LogLevel::ERROR));
    EXPECT_FALSE(utils::parse_log_level("loud").has_value());
    EXPECT_EQ(utils::string_to_log_level("loud"), utils::LogLevel::INFO);

    for (auto level : {utils::LogLevel::TRACE, utils::LogLevel::DEBUG, utils::LogLevel::INFO,
                       utils::LogLevel::WARN, utils::LogLevel::ERROR, utils::LogLevel::CRITICAL,
                       utils::LogLevel::OFF}) {
        EXPECT_EQ(utils::parse_log_level(utils::log_level_to_string(level)),
                  std::optional<utils::LogLevel>(level))
            << utils::log_level_to_string(level);
    }
}

TEST_F(ConfigTest, ValidationWarnings) {
    NodeConfig config;
    config.session.qber_threshold = 0.2;
    config.session.rotation.interval = std::chrono::milliseconds(0);
    config.session.rotation.byte_limit = 0;
    config.session.psk.assign(8, 0x01);
    config.port = 0;

    auto result = validate_config(config);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.warnings, Contains(HasSubstr("qber_threshold")));
    EXPECT_THAT(result.warnings, Contains(HasSubstr("rotation")));
    EXPECT_THAT(result.warnings, Contains(HasSubstr("Pre-shared key")));
    EXPECT_THAT(result.warnings, Contains(HasSubstr("Port")));
}

TEST_F(ConfigTest, HexParsing) {
    EXPECT_THAT(*parse_hex("0x0aFF"), ElementsAre(0x0A, 0xFF));
    EXPECT_THAT(*parse_hex("0aFF"), ElementsAre(0x0A, 0xFF));
    EXPECT_TRUE(parse_hex("")->empty());
    EXPECT_FALSE(parse_hex("abc").has_value());
    EXPECT_FALSE(parse_hex("0xg0").has_value());

    EXPECT_EQ(to_hex({0x00, 0x0F, 0xA0, 0xFF}), "000fa0ff");
    EXPECT_EQ(to_hex({}), "");
}

TEST_F(ConfigTest, MergeOverridesOnlySetOptions) {
    NodeConfig base;
    base.host = "10.1.1.1";
    base.port = 8000;
    base.session.channel_error_rate = 0.01;

    CliOptions cli;
    cli.port = 9000;
    cli.log_level = "trace";
    cli.error_rate = 0.05;

    auto merged = merge_config(base, cli);
    EXPECT_EQ(merged.host, "10.1.1.1");
    EXPECT_EQ(merged.port, 9000);
    EXPECT_EQ(merged.log_level, utils::LogLevel::TRACE);
    EXPECT_DOUBLE_EQ(merged.session.channel_error_rate, 0.05);
}

TEST_F(ConfigTest, CliListen) {
    int exit_code = -1;
    auto options = parse({"-l", "debug", "listen", "-p", "7600", "-b", "0.0.0.0"}, exit_code);
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(exit_code, 0);
    EXPECT_EQ(options->mode, Mode::LISTEN);
    EXPECT_EQ(options->port, std::optional<uint16_t>(7600));
    EXPECT_EQ(options->host, std::optional<std::string>("0.0.0.0"));
    EXPECT_EQ(options->log_level, std::optional<std::string>("debug"));
    EXPECT_FALSE(options->error_rate.has_value());
}

TEST_F(ConfigTest, CliConnectWithMessages) {
    int exit_code = -1;
    auto options = parse({"-c", "node.ini", "--error-rate", "0.02", "connect", "-H", "10.0.0.2", "-p",
                          "9000", "-m", "hello", "-m", "world"},
                         exit_code);
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->mode, Mode::CONNECT);
    EXPECT_EQ(options->config_path, "node.ini");
    EXPECT_EQ(options->host, std::optional<std::string>("10.0.0.2"));
    EXPECT_EQ(options->port, std::optional<uint16_t>(9000));
    ASSERT_TRUE(options->error_rate.has_value());
    EXPECT_DOUBLE_EQ(*options->error_rate, 0.02);
    EXPECT_THAT(options->messages, ElementsAre("hello", "world"));
}

TEST_F(ConfigTest, CliConnectLeavesUnsetOptionsEmpty) {
    int exit_code = -1;
    auto options = parse({"connect"}, exit_code);
    ASSERT_TRUE(options.has_value());
    EXPECT_FALSE(options->host.has_value());
    EXPECT_FALSE(options->port.has_value());
    EXPECT_FALSE(options->log_level.has_value());
    EXPECT_TRUE(options->messages.empty());
}

TEST_F(ConfigTest, CliHelpExitsCleanly) {
    int exit_code = -1;
    EXPECT_FALSE(parse({"--help"}, exit_code).has_value());
    EXPECT_EQ(exit_code, 0);
}

TEST_F(ConfigTest, CliRejectsBadInput) {
    int exit_code = 0;
    EXPECT_FALSE(parse({"--error-rate", "1.5", "listen"}, exit_code).has_value());
    EXPECT_NE(exit_code, 0);

    exit_code = 0;
    EXPECT_FALSE(parse({}, exit_code).has_value());
    EXPECT_NE(exit_code, 0);

    exit_code = 0;
    EXPECT_FALSE(parse({"listen", "-p", "notaport"}, exit_code).has_value());
    EXPECT_NE(exit_code, 0);

    exit_code = 0;
    EXPECT_FALSE(parse({"-l", "loud", "listen"}, exit_code).has_value());
    EXPECT_NE(exit_code, 0);
}

}  // namespace
}  // namespace qline::config
