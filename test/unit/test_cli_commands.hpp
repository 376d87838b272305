#ifndef TRIAGEGUARD_TEST_UNIT_TEST_CLI_COMMANDS_HPP
#define TRIAGEGUARD_TEST_UNIT_TEST_CLI_COMMANDS_HPP

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "../../config/guard_config.hpp"
#include "../../src/cli/cli_commands.hpp"
#include "../../src/core/errors.hpp"
#include "../../src/guard/guard_orchestrator.hpp"
#include "../../src/vault/in_memory_vault.hpp"
#include "../test_helpers.hpp"

namespace {

using nlohmann::json;
using triageguard::cli::RunCommand;

// Writes always fail, so any mask with an identifier fails.
class UnwritableVault : public triageguard::vault::InMemoryVault {
  public:
    triageguard::vault::UpsertOutcome Upsert(const triageguard::core::MappingRecord&) override {
        throw triageguard::core::VaultUnavailableError("disk full");
    }
};

TEST(CliCommandsTest, MaskAcceptsInvalidUtf8) {
    auto guard = triageguard::test::MakeGuard();
    std::ostringstream out;
    ASSERT_EQ(RunCommand(*guard, "mask", "caf\xe9 PROJ-12\n", out), 0);

    json report = json::parse(out.str());
    const std::string masked = report["masked"].get<std::string>();
    EXPECT_EQ(masked.find("PROJ-12"), std::string::npos);
    EXPECT_FALSE(triageguard::test::FindToken(masked, "TICKET").empty());
    EXPECT_EQ(report["session"].get<std::string>().size(), (size_t)32);
}

TEST(CliCommandsTest, RoundtripRestoresAndPurges) {
    auto guard = triageguard::test::MakeGuard();
    std::ostringstream out;
    ASSERT_EQ(RunCommand(*guard, "roundtrip", "Ticket PROJ-1234 on jenkins.internal", out), 0);

    json report = json::parse(out.str());
    EXPECT_EQ(report["restored"], "Ticket PROJ-1234 on jenkins.internal");
    EXPECT_TRUE(report["unresolved"].empty());
    EXPECT_EQ(guard->GetVault()->SessionCount(), (size_t)0);
}

TEST(CliCommandsTest, ScrubPrintsRedactedText) {
    auto guard = triageguard::test::MakeGuard();
    std::ostringstream out;
    ASSERT_EQ(RunCommand(*guard, "scrub", "Authorization: Bearer abc.def.ghi", out), 0);
    EXPECT_EQ(out.str(), "Authorization: [REDACTED_SECRET]\n");
}

TEST(CliCommandsTest, FailuresReturnErrorCode) {
    triageguard::config::GuardConfig cfg;
    triageguard::guard::GuardOrchestrator guard(cfg, triageguard::test::TestKeyRing(),
                                                std::make_shared<UnwritableVault>());
    std::ostringstream out;
    EXPECT_EQ(RunCommand(guard, "mask", "Ticket PROJ-1234", out), 1);
    EXPECT_EQ(RunCommand(guard, "unmask", "anything", out), 1);
    EXPECT_TRUE(out.str().empty());
}

} // anonymous namespace

#endif // TRIAGEGUARD_TEST_UNIT_TEST_CLI_COMMANDS_HPP
