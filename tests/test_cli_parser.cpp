// EN: Unit tests for CliParser
// FR: Tests unitaires pour CliParser

#include <gtest/gtest.h>
#include "tnorm/infrastructure/cli/cli_parser.hpp"
#include "tnorm/infrastructure/config/config_manager.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

using namespace TNORM;

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();

        parser_.addStandardOptions();

        CliOptionDefinition dry_run;
        dry_run.long_name = "dry-run";
        dry_run.short_name = 'n';
        dry_run.type = CliOptionType::BOOLEAN;
        dry_run.description = "List matches only";
        parser_.addOption(dry_run);

        CliOptionDefinition sample;
        sample.long_name = "sample-rows";
        sample.type = CliOptionType::INTEGER;
        sample.default_value = "10";
        parser_.addOption(sample);

        CliOptionDefinition order;
        order.long_name = "order";
        order.type = CliOptionType::STRING_LIST;
        parser_.addOption(order);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
    }

    CliParser parser_;
};

TEST_F(CliParserTest, ParsesPositionalsAndOptionForms) {
    const CliParseResult result =
        parser_.parse({"normalize", "in/a.csv", "--log-level=debug", "-c", "tnorm.yaml", "--presets-dir", "p"});

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.positionals, (std::vector<std::string>{"normalize", "in/a.csv"}));
    EXPECT_EQ(result.getString("log-level"), "debug");
    EXPECT_EQ(result.getString("config"), "tnorm.yaml");
    EXPECT_EQ(result.getOptionalString("presets-dir"), "p");
    EXPECT_FALSE(result.getOptionalString("log-file").has_value());
}

TEST_F(CliParserTest, BooleanFlags) {
    EXPECT_TRUE(parser_.parse({"-n"}).getFlag("dry-run"));
    EXPECT_FALSE(parser_.parse({"--dry-run=off"}).getFlag("dry-run", true));
    EXPECT_FALSE(parser_.parse({}).getFlag("dry-run"));

    const CliParseResult bad = parser_.parse({"--dry-run=maybe"});
    EXPECT_EQ(bad.status, CliParseStatus::INVALID_VALUE);
}

TEST_F(CliParserTest, IntegersAndDefaults) {
    EXPECT_EQ(parser_.parse({}).getInt("sample-rows"), 10);
    EXPECT_EQ(parser_.parse({"--sample-rows", "3"}).getInt("sample-rows"), 3);

    const CliParseResult bad = parser_.parse({"--sample-rows", "3x"});
    EXPECT_EQ(bad.status, CliParseStatus::INVALID_VALUE);
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0], "Option --sample-rows expects an integer, got: 3x");
}

TEST_F(CliParserTest, ListsSplitAndAccumulate) {
    const CliParseResult result = parser_.parse({"--order", "jan,,title", "--order", "price",
                                                 "--roots", "/a;/b"});
    EXPECT_EQ(result.getList("order"), (std::vector<std::string>{"jan", "title", "price"}));
    EXPECT_EQ(result.getList("roots"), (std::vector<std::string>{"/a", "/b"}));
    EXPECT_TRUE(result.getList("missing").empty());
}

TEST_F(CliParserTest, DoubleDashEndsOptions) {
    const CliParseResult result = parser_.parse({"--", "--not-an-option", "-"});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.positionals, (std::vector<std::string>{"--not-an-option", "-"}));
}

TEST_F(CliParserTest, ErrorsAreReported) {
    EXPECT_EQ(parser_.parse({"--bogus"}).status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(parser_.parse({"--config"}).status, CliParseStatus::MISSING_VALUE);

    CliParser strict;
    CliOptionDefinition output;
    output.long_name = "output";
    output.required = true;
    strict.addOption(output);
    const CliParseResult missing = strict.parse({});
    EXPECT_EQ(missing.status, CliParseStatus::MISSING_REQUIRED);
    EXPECT_EQ(cliParseStatusToString(missing.status), "MISSING_REQUIRED");
}

TEST_F(CliParserTest, FirstErrorDecidesStatus) {
    const CliParseResult result = parser_.parse({"--bogus", "--sample-rows", "x"});
    EXPECT_EQ(result.status, CliParseStatus::INVALID_OPTION);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(CliParserTest, HelpAndVersion) {
    const CliParseResult help = parser_.parse({"inspect", "--help", "--bogus"});
    EXPECT_EQ(help.status, CliParseStatus::HELP_REQUESTED);
    EXPECT_NE(help.help_text.find("--presets-dir VALUE"), std::string::npos);
    EXPECT_NE(help.help_text.find("(default: 10)"), std::string::npos);
    EXPECT_EQ(help.help_text.find("--dry-run VALUE"), std::string::npos);

    EXPECT_EQ(parser_.parse({"-V"}).status, CliParseStatus::VERSION_REQUESTED);
}

TEST_F(CliParserTest, RedefiningAnOptionReplacesIt) {
    CliOptionDefinition level;
    level.long_name = "log-level";
    level.short_name = 'l';
    parser_.addOption(level);

    EXPECT_TRUE(parser_.hasOption("log-level"));
    EXPECT_EQ(parser_.parse({"-l", "warn"}).getString("log-level"), "warn");
    EXPECT_TRUE(parser_.parse({"-l", "warn"}).overrides.empty());
}

TEST_F(CliParserTest, OverridesFlowIntoConfiguration) {
    const CliParseResult result = parser_.parse({"--roots", "/srv/a;/srv/b", "--log-level", "warn"});
    ASSERT_EQ(result.overrides.size(), 2u);

    ConfigManager& config = ConfigManager::getInstance();
    CliParser::applyOverrides(result, config);
    EXPECT_EQ(config.get("engine", "allowed_roots").asStringList(),
              (std::vector<std::string>{"/srv/a", "/srv/b"}));
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "warn");
}
