#ifndef TRIAGEGUARD_TEST_UNIT_TEST_DEEP_SUBSTITUTION_HPP
#define TRIAGEGUARD_TEST_UNIT_TEST_DEEP_SUBSTITUTION_HPP

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../src/core/errors.hpp"
#include "../../src/core/placeholder_syntax.hpp"
#include "../../src/mint/placeholder_mint.hpp"
#include "../../src/recognizer/recognizer_engine.hpp"
#include "../../src/substitution/deep_substitution.hpp"
#include "../../src/substitution/schema_filter.hpp"
#include "../../src/vault/in_memory_vault.hpp"
#include "../test_helpers.hpp"

namespace {

using nlohmann::json;
using triageguard::core::Namespace;
using triageguard::substitution::DeepSubstitutionEngine;
using triageguard::substitution::Mode;
using triageguard::substitution::NamespaceContext;
using triageguard::substitution::TransformReport;

class DeepSubstitutionTest : public ::testing::Test {
  protected:
    DeepSubstitutionTest()
        : m_vault(std::make_shared<triageguard::vault::InMemoryVault>()),
          m_engine(std::make_shared<triageguard::recognizer::RecognizerEngine>(),
                   std::make_shared<triageguard::mint::PlaceholderMint>(triageguard::test::TestKeyRing(), m_vault),
                   m_vault) {}

    json mask(const json& value, const std::string& session = "s1") {
        TransformReport report;
        NamespaceContext ctx;
        return m_engine.Transform(value, Mode::Mask, session, ctx, report);
    }

    json restore(const json& value, TransformReport& report, const std::string& session = "s1") {
        NamespaceContext ctx;
        return m_engine.Transform(value, Mode::Restore, session, ctx, report);
    }

    std::shared_ptr<triageguard::vault::InMemoryVault> m_vault;
    DeepSubstitutionEngine m_engine;
};

TEST_F(DeepSubstitutionTest, PreservesShapeAndScalars) {
    json input = {
        {"title", "PROJ-12 broke on db01.corp.internal"},
        {"count", 3},
        {"ratio", 0.5},
        {"flaky", true},
        {"owner", nullptr},
        {"hosts", {"10.1.2.3", "build02.corp.internal", 7}},
        {"nested", {{"deeper", {{"mail", "ops@example.org"}}}}},
        {"ops@example.org", "key stays"}};
    json out = mask(input);

    ASSERT_TRUE(out.is_object());
    EXPECT_EQ(out.size(), input.size());
    EXPECT_EQ(out["count"], 3);
    EXPECT_EQ(out["ratio"], 0.5);
    EXPECT_EQ(out["flaky"], true);
    EXPECT_TRUE(out["owner"].is_null());
    ASSERT_EQ(out["hosts"].size(), (size_t)3);
    EXPECT_EQ(out["hosts"][2], 7);
    EXPECT_TRUE(triageguard::core::IsPlaceholder(out["hosts"][0].get<std::string>()));
    EXPECT_TRUE(triageguard::core::IsPlaceholder(out["nested"]["deeper"]["mail"].get<std::string>()));
    EXPECT_TRUE(out.contains("ops@example.org"));
    EXPECT_EQ(out["title"].get<std::string>().find("PROJ-12"), std::string::npos);
}

TEST_F(DeepSubstitutionTest, MaskIsIdempotent) {
    const std::string text = "PROJ-77 on https://git.corp.internal/repo and ops@example.org";
    json once = mask(text);
    json twice = mask(once);
    EXPECT_EQ(once, twice);

    // already-masked text with a new raw value only gains the new placeholder
    json mixed = mask(once.get<std::string>() + " plus OPS-5");
    EXPECT_EQ(mixed.get<std::string>().rfind(once.get<std::string>(), 0), (size_t)0);
    EXPECT_EQ(mixed.get<std::string>().find("OPS-5"), std::string::npos);
}

TEST_F(DeepSubstitutionTest, UrlKeepsSchemeAndPath) {
    json out = mask("see http://jenkins.internal/build/55");
    const std::string s = out.get<std::string>();
    EXPECT_EQ(s.rfind("see http://<<HOST_", 0), (size_t)0);
    EXPECT_NE(s.find(">>/build/55"), std::string::npos);
}

TEST_F(DeepSubstitutionTest, RestoreRoundTrip) {
    json input = {{"ticket", "PROJ-1234"}, {"list", {"ops@example.org", "10.0.0.12"}}};
    json masked = mask(input);
    TransformReport report;
    json restored = restore(masked, report);

    EXPECT_EQ(restored, input);
    EXPECT_TRUE(report.unresolved.empty());
    EXPECT_EQ(report.restored, (size_t)3);
}

TEST_F(DeepSubstitutionTest, RestoreWithoutPlaceholdersIsNoOp) {
    TransformReport report;
    json value = {{"a", "plain text"}, {"b", {1, 2}}};
    EXPECT_EQ(restore(value, report), value);
    EXPECT_TRUE(report.unresolved.empty());
}

TEST_F(DeepSubstitutionTest, UnknownPlaceholderLeftIntactAndReported) {
    TransformReport report;
    json out = restore("look at <<TICKET_0123456789ab>> twice <<TICKET_0123456789ab>>", report);

    EXPECT_EQ(out, "look at <<TICKET_0123456789ab>> twice <<TICKET_0123456789ab>>");
    ASSERT_EQ(report.unresolved.size(), (size_t)1);
    EXPECT_EQ(report.unresolved[0], "<<TICKET_0123456789ab>>");
}

TEST_F(DeepSubstitutionTest, OtherSessionCannotRestore) {
    json masked = mask("PROJ-1234", "s1");
    TransformReport report;
    json out = restore(masked, report, "s2");
    EXPECT_EQ(out, masked);
    EXPECT_EQ(report.unresolved.size(), (size_t)1);
}

TEST_F(DeepSubstitutionTest, SecretsAreNeverRestorable) {
    json masked = mask({{"hdr", "Authorization: Bearer abc.def.ghi"}, {"cfg", "password=hunter2"}});
    EXPECT_EQ(masked["hdr"], "Authorization: [REDACTED_SECRET]");
    EXPECT_EQ(masked["cfg"], "password=[REDACTED_SECRET]");
    EXPECT_EQ(m_vault->CountRecords("s1"), (size_t)0);

    TransformReport report;
    json restored = restore(masked, report);
    EXPECT_EQ(restored, masked);
}

TEST_F(DeepSubstitutionTest, RestorePassScrubsSecrets) {
    TransformReport report;
    json out = restore("token=abcdefgh1234", report);
    EXPECT_EQ(out, "token=[REDACTED_SECRET]");
    EXPECT_EQ(report.scrubbed, (size_t)1);
}

TEST_F(DeepSubstitutionTest, CollectsPlaceholders) {
    json value = {{"a", "<<HOST_0123456789ab>> and <<EMAIL_0123456789ab>>"},
                  {"b", {"<<HOST_0123456789ab>>", 1}}};
    auto found = DeepSubstitutionEngine::CollectPlaceholders(value);
    ASSERT_EQ(found.size(), (size_t)2);
}

TEST(SchemaFilterTest, DropsUndeclaredKeys) {
    json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "ticket": {"type": "string"},
            "options": {"type": "object", "properties": {"verbose": {"type": "boolean"}}}
        },
        "required": ["ticket"]})");
    json args = json::parse(R"({"ticket": "PROJ-1", "_session": "abc",
                                "options": {"verbose": true, "_trace": 1}})");

    std::vector<std::string> dropped;
    json out = triageguard::substitution::FilterBySchema(args, schema, dropped);

    EXPECT_EQ(out, json::parse(R"({"ticket": "PROJ-1", "options": {"verbose": true}})"));
    ASSERT_EQ(dropped.size(), (size_t)2);
    EXPECT_EQ(dropped[0], "_session");
    EXPECT_EQ(dropped[1], "options._trace");
}

TEST(SchemaFilterTest, RecursesIntoArrayItems) {
    json schema = json::parse(R"({"type": "array",
                                  "items": {"type": "object", "properties": {"id": {"type": "string"}}}})");
    json args = json::parse(R"([{"id": "a", "x": 1}, {"id": "b"}])");

    std::vector<std::string> dropped;
    json out = triageguard::substitution::FilterBySchema(args, schema, dropped);
    EXPECT_EQ(out, json::parse(R"([{"id": "a"}, {"id": "b"}])"));
    ASSERT_EQ(dropped.size(), (size_t)1);
    EXPECT_EQ(dropped[0], "[0].x");
}

TEST(SchemaFilterTest, AdditionalPropertiesKeepsExtras) {
    json schema = json::parse(R"({"properties": {"q": {"type": "string"}}, "additionalProperties": true})");
    std::vector<std::string> dropped;
    json out = triageguard::substitution::FilterBySchema(json::parse(R"({"q": "x", "extra": 1})"), schema, dropped);
    EXPECT_EQ(out.size(), (size_t)2);
    EXPECT_TRUE(dropped.empty());
}

TEST(SchemaFilterTest, MissingRequiredKeyThrows) {
    json schema = json::parse(R"({"properties": {"q": {"type": "string"}}, "required": ["q"]})");
    std::vector<std::string> dropped;
    EXPECT_THROW(triageguard::substitution::FilterBySchema(json::parse(R"({"other": 1})"), schema, dropped),
                 triageguard::core::ToolSchemaError);
    EXPECT_THROW(triageguard::substitution::FilterBySchema(json("not an object"), schema, dropped),
                 triageguard::core::ToolSchemaError);
}

} // anonymous namespace

#endif // TRIAGEGUARD_TEST_UNIT_TEST_DEEP_SUBSTITUTION_HPP
