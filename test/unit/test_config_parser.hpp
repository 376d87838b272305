#ifndef TRIAGEGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define TRIAGEGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "../../config/guard_config.hpp"
#include "../../src/util/config_parser.hpp"
#include "../../src/util/logger.hpp"

namespace {

using triageguard::config::GuardConfig;
using triageguard::util::ConfigParser;

TEST(ConfigParserTest, DefaultsWithoutFile) {
    GuardConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("does_not_exist.conf"));
    EXPECT_EQ(cfg.vaultLocation, "memory");
    EXPECT_EQ(cfg.secretKeyRef, "env:TRIAGEGUARD_HMAC_KEY");
    EXPECT_EQ(cfg.retentionIncomingInputSeconds, (uint64_t)3600);
    EXPECT_EQ(cfg.placeholderTagLength, (uint32_t)12);
    EXPECT_EQ(cfg.maxInFlightToolCalls, (uint32_t)4);
}

TEST(ConfigParserTest, LoadsFile) {
    const std::string file = "triageguard_test.conf";
    {
        std::ofstream ofs(file);
        ofs << "# guard settings\n"
            << "secret_key_ref = file:/etc/triageguard/hmac.key\n"
            << "vault_location=sqlite:/var/lib/triageguard/vault.db\n"
            << "\n"
            << "retention_tool_results_seconds = 120\n"
            << "max_in_flight_tool_calls = 2\n"
            << "max_steps = 10\n"
            << "log_level = debug\n"
            << "not_a_key = ignored\n";
    }

    GuardConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(file));
    EXPECT_EQ(cfg.secretKeyRef, "file:/etc/triageguard/hmac.key");
    EXPECT_EQ(cfg.vaultLocation, "sqlite:/var/lib/triageguard/vault.db");
    EXPECT_EQ(cfg.retentionToolResultsSeconds, (uint64_t)120);
    EXPECT_EQ(cfg.retentionIncomingInputSeconds, (uint64_t)3600);
    EXPECT_EQ(cfg.maxInFlightToolCalls, (uint32_t)2);
    EXPECT_EQ(cfg.maxSteps, (uint32_t)10);
    EXPECT_EQ(triageguard::util::logger::parseLogLevel(cfg.logLevel),
              triageguard::util::logger::LogLevel::DEBUG);

    std::remove(file.c_str());
}

TEST(ConfigParserTest, RejectsMalformedInput) {
    GuardConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("max_steps 10\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("max_steps = -3\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("tool_deadline_millis = soon\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("max_tool_retries = 99999999999\n"), std::runtime_error);
}

TEST(ConfigParserTest, RejectsOversizedDurations) {
    GuardConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("retention_incoming_input_seconds = 10000000000\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("retention_tool_results_seconds = 18446744073709551615\n"),
                 std::runtime_error);
    EXPECT_THROW(parser.loadFromString("request_budget_millis = 9223372036854775808\n"), std::runtime_error);
    EXPECT_EQ(cfg.retentionIncomingInputSeconds, (uint64_t)3600);

    parser.loadFromString("retention_final_output_seconds = " +
                          std::to_string(triageguard::config::kMaxDurationSeconds) + "\n");
    EXPECT_EQ(cfg.retentionFinalOutputSeconds, triageguard::config::kMaxDurationSeconds);
}

} // anonymous namespace

#endif // TRIAGEGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
