#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PlanFormatter.hpp"

using namespace ghostdb;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

class PlanFormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.tables["users"] = {
            {"id", strategy::Keep{}},
            {"email", strategy::Email{}},
            {"address", strategy::Fixed{"ANONYMIZED ADDRESS"}},
        };
        config_.tables["audit"] = {};
    }

    StrategyConfig config_;
};

// YAML
TEST_F(PlanFormatterTest, ToYAMLIsSortedAndReadable) {
    auto yaml = PlanFormatter::toYAML(config_);

    EXPECT_THAT(yaml, HasSubstr("tables:"));
    EXPECT_THAT(yaml, HasSubstr("email: email"));
    EXPECT_THAT(yaml, HasSubstr("id: keep"));
    EXPECT_THAT(yaml, HasSubstr("fixed: ANONYMIZED ADDRESS"));
    EXPECT_LT(yaml.find("audit"), yaml.find("users"));
    EXPECT_LT(yaml.find("address"), yaml.find("email"));
}

TEST_F(PlanFormatterTest, ToYAMLParsesBack) {
    auto parsed = StrategyConfig::fromYAML(PlanFormatter::toYAML(config_));

    EXPECT_EQ(parsed.tables, config_.tables);
}

TEST_F(PlanFormatterTest, EmptyConfigStillHasTablesKey) {
    auto yaml = PlanFormatter::toYAML(StrategyConfig{});

    EXPECT_TRUE(StrategyConfig::fromYAML(yaml).tables.empty());
}

// JSON
TEST_F(PlanFormatterTest, ToJSONShape) {
    auto value = PlanFormatter::toJSONValue(config_);

    EXPECT_EQ(value["tables"]["users"]["columns"]["email"], "email");
    EXPECT_EQ(value["tables"]["users"]["columns"]["address"]["fixed"], "ANONYMIZED ADDRESS");
    EXPECT_TRUE(value["tables"]["audit"]["columns"].is_object());
    EXPECT_TRUE(value["tables"]["audit"]["columns"].empty());
}

TEST_F(PlanFormatterTest, CompactJSON) {
    auto text = PlanFormatter::toJSON(config_, false);

    EXPECT_THAT(text, Not(HasSubstr("\n")));
    EXPECT_EQ(json::parse(text), PlanFormatter::toJSONValue(config_));
}

TEST_F(PlanFormatterTest, ParseFormat) {
    EXPECT_EQ(PlanFormatter::parseFormat("yaml"), PlanFormat::YAML);
    EXPECT_EQ(PlanFormatter::parseFormat("YML"), PlanFormat::YAML);
    EXPECT_EQ(PlanFormatter::parseFormat("Json"), PlanFormat::JSON);
    EXPECT_FALSE(PlanFormatter::parseFormat("csv").has_value());
}

TEST_F(PlanFormatterTest, FormatDispatch) {
    EXPECT_EQ(PlanFormatter::format(config_, PlanFormat::YAML), PlanFormatter::toYAML(config_));
    EXPECT_EQ(PlanFormatter::format(config_, PlanFormat::JSON), PlanFormatter::toJSON(config_));
}

// Summary
TEST_F(PlanFormatterTest, SummaryListsOnlyRewrittenColumns) {
    auto text = PlanFormatter::summary(config_);

    EXPECT_EQ(text,
              "Table: audit\n"
              "Table: users\n"
              "  - address -> Fixed(\"ANONYMIZED ADDRESS\")\n"
              "  - email -> Email\n");
}

TEST_F(PlanFormatterTest, StatsToJSON) {
    ProcessStats stats;
    stats.lines_processed = 10;
    stats.statements_anonymized = 4;
    stats.mismatched_lines = 1;
    stats.untracked_statements = 2;

    auto value = json::parse(PlanFormatter::statsToJSON(stats));

    EXPECT_EQ(value["lines_processed"], 10);
    EXPECT_EQ(value["statements_anonymized"], 4);
    EXPECT_EQ(value["mismatched_lines"], 1);
    EXPECT_EQ(value["untracked_statements"], 2);
}

TEST_F(PlanFormatterTest, SortedNames) {
    EXPECT_THAT(PlanFormatter::sortedTableNames(config_), ElementsAre("audit", "users"));
    EXPECT_THAT(PlanFormatter::sortedColumnNames(config_.tables.at("users")),
                ElementsAre("address", "email", "id"));
}
