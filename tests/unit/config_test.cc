#include <gtest/gtest.h>
#include "core/config.hh"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace pledge {
namespace {

const std::string TOKEN = "0x7000000000000000000000000000000000000000000000000000000000000001";
const std::string AUTHORITY = "0xaa00000000000000000000000000000000000000000000000000000000000002";
const std::string INSTANCE = "0x1a00000000000000000000000000000000000000000000000000000000000003";

std::string base_config() {
    return "token = " + TOKEN + "\n" +
           "authority = " + AUTHORITY + "\n" +
           "instance = " + INSTANCE + "\n";
}

TEST(ConfigTest, ParsesAddressesAndDefaults) {
    auto config = parse_config(base_config());
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->ledger.token, *Address::from_hex(TOKEN));
    EXPECT_EQ(config->ledger.authority, *Address::from_hex(AUTHORITY));
    EXPECT_EQ(config->ledger.instance, *Address::from_hex(INSTANCE));
    EXPECT_EQ(config->log.default_level, LogLevel::INFO);
    EXPECT_FALSE(config->log.file_enabled);
}

TEST(ConfigTest, ParsesLoggingKeysAndComments) {
    std::string text =
        "# ledger for pool operators\n"
        "\n" + base_config() +
        "log.level = debug   # verbose while testing\n"
        "log.file = /tmp/pledge-test.log\n"
        "log.colors = false\n"
        "log.async = yes\n";

    auto config = parse_config(text);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log.default_level, LogLevel::DEBUG);
    EXPECT_TRUE(config->log.file_enabled);
    EXPECT_EQ(config->log.file_path, "/tmp/pledge-test.log");
    EXPECT_FALSE(config->log.console_colors);
    EXPECT_TRUE(config->log.async_logging);
}

TEST(ConfigTest, RejectsMissingAddress) {
    std::string text = "token = " + TOKEN + "\nauthority = " + AUTHORITY + "\n";
    EXPECT_FALSE(parse_config(text).has_value());
}

TEST(ConfigTest, RejectsMalformedLines) {
    EXPECT_FALSE(parse_config(base_config() + "log.level\n").has_value());
    EXPECT_FALSE(parse_config(base_config() + "log.level = loud\n").has_value());
    EXPECT_FALSE(parse_config(base_config() + "log.async = maybe\n").has_value());
    EXPECT_FALSE(parse_config(base_config() + "unbond_delay = 5\n").has_value());
    EXPECT_FALSE(parse_config("token = 0x1234\n").has_value());
}

TEST(ConfigTest, RejectsInvalidLedgerConfig) {
    std::string zero = "0x" + std::string(64, '0');
    std::string text = "token = " + zero + "\nauthority = " + AUTHORITY +
                       "\ninstance = " + INSTANCE + "\n";
    EXPECT_FALSE(parse_config(text).has_value());

    text = "token = " + TOKEN + "\nauthority = " + AUTHORITY +
           "\ninstance = " + burn_sink_address().to_hex() + "\n";
    EXPECT_FALSE(parse_config(text).has_value());
}

TEST(ConfigTest, LoadConfigFromFile) {
    auto path = std::filesystem::temp_directory_path() / "pledge_config_test.conf";
    {
        std::ofstream out(path);
        out << base_config() << "log.level = warn\n";
    }

    auto config = load_config(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log.default_level, LogLevel::WARN);
}

TEST(ConfigTest, LoadConfigMissingFile) {
    EXPECT_FALSE(load_config("/nonexistent/pledge.conf").has_value());
}

}  // namespace
}  // namespace pledge
