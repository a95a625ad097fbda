#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "Config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <vector>

using namespace ghostdb;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test files
        tempDir_ = std::filesystem::temp_directory_path() / "ghostdb_cli_test";
        std::filesystem::create_directories(tempDir_);
        unsetenv("GHOSTDB_SEED");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
        unsetenv("GHOSTDB_SEED");
    }

    std::filesystem::path tempDir_;

    std::string writeFile(const std::string& filename, const std::string& content) {
        auto path = tempDir_ / filename;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    static Config parse(std::vector<std::string> args) {
        args.insert(args.begin(), "ghostdb");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return Config::parseArgs(static_cast<int>(argv.size()), argv.data());
    }
};

// Defaults
TEST_F(ConfigTest, DefaultConfig) {
    Config config;

    EXPECT_EQ(config.command, Command::SmartRun);
    EXPECT_EQ(config.run.seed, 42u);
    EXPECT_FALSE(config.run.seed_from_cli);
    EXPECT_EQ(config.scan.format, "yaml");
    EXPECT_FALSE(config.scan.interactive);
    EXPECT_FALSE(config.logging.debug);
}

// Argument parsing
TEST_F(ConfigTest, ParseRunCommand) {
    auto config = parse({"run", "-i", "in.sql", "-o", "out.sql", "-c", "s.yaml", "-s", "7",
                         "--report", "stats.json"});

    EXPECT_EQ(config.command, Command::Run);
    EXPECT_EQ(config.input, "in.sql");
    EXPECT_EQ(config.output, "out.sql");
    EXPECT_EQ(config.run.strategy_file, "s.yaml");
    EXPECT_EQ(config.run.seed, 7u);
    EXPECT_TRUE(config.run.seed_from_cli);
    EXPECT_EQ(config.run.report_file, "stats.json");
}

TEST_F(ConfigTest, RunSeedDefaultsTo42) {
    auto config = parse({"run", "--input", "in.sql", "--output", "out.sql", "--config", "s.yaml"});

    EXPECT_EQ(config.run.seed, 42u);
    EXPECT_FALSE(config.run.seed_from_cli);
}

TEST_F(ConfigTest, ParseScanCommand) {
    auto config = parse({"scan", "-i", "in.sql", "-I", "--format", "json", "-o", "plan.json"});

    EXPECT_EQ(config.command, Command::Scan);
    EXPECT_EQ(config.input, "in.sql");
    EXPECT_TRUE(config.scan.interactive);
    EXPECT_EQ(config.scan.format, "json");
    EXPECT_EQ(config.output, "plan.json");
}

TEST_F(ConfigTest, SmartRunDefaultsOutputName) {
    auto config = parse({"-i", "dumps/prod.sql"});

    EXPECT_EQ(config.command, Command::SmartRun);
    EXPECT_EQ(config.input, "dumps/prod.sql");
    EXPECT_EQ(config.output, "prod_anonymized.sql");
}

TEST_F(ConfigTest, LoggingFlags) {
    auto config = parse({"-d", "--log-file", "ghostdb.log", "-i", "a.sql", "-o", "b.sql"});

    EXPECT_TRUE(config.logging.debug);
    EXPECT_EQ(config.logging.log_file, "ghostdb.log");
    EXPECT_EQ(config.output, "b.sql");
}

TEST_F(ConfigTest, DefaultOutputFor) {
    EXPECT_EQ(Config::defaultOutputFor("/var/backups/shop.sql"), "shop_anonymized.sql");
    EXPECT_EQ(Config::defaultOutputFor("dump"), "dump_anonymized.sql");
}

// Seed resolution
TEST_F(ConfigTest, EnvironmentSeedAppliesWithoutFlag) {
    setenv("GHOSTDB_SEED", "1234", 1);
    Config config;

    config.resolveSeed();

    EXPECT_EQ(config.run.seed, 1234u);
}

TEST_F(ConfigTest, SeedFlagOverridesEnvironment) {
    setenv("GHOSTDB_SEED", "1234", 1);

    auto config = parse({"run", "-i", "in.sql", "-o", "out.sql", "-c", "s.yaml", "-s", "9"});

    EXPECT_EQ(config.run.seed, 9u);
}

TEST_F(ConfigTest, InvalidEnvironmentSeedIsIgnored) {
    Config config;

    for (const char* value : {"abc", "-5", "12x", ""}) {
        setenv("GHOSTDB_SEED", value, 1);
        config.resolveSeed();
        EXPECT_EQ(config.run.seed, 42u) << value;
    }
}

// Validation
TEST_F(ConfigTest, ValidateRequiresExistingInput) {
    Config config;
    EXPECT_FALSE(config.validate());

    config.input = (tempDir_ / "missing.sql").string();
    config.output = (tempDir_ / "out.sql").string();
    EXPECT_FALSE(config.validate());

    config.input = tempDir_.string();
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateSmartRun) {
    Config config;
    config.input = writeFile("in.sql", "-- x\n");
    config.output = (tempDir_ / "out.sql").string();

    EXPECT_TRUE(config.validate());

    config.output = config.input;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidateRunNeedsStrategyFile) {
    Config config;
    config.command = Command::Run;
    config.input = writeFile("in.sql", "-- x\n");
    config.output = (tempDir_ / "out.sql").string();

    EXPECT_FALSE(config.validate());

    config.run.strategy_file = (tempDir_ / "missing.yaml").string();
    EXPECT_FALSE(config.validate());

    config.run.strategy_file = writeFile("s.yaml", "tables: {}\n");
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ValidateScanFormat) {
    Config config;
    config.command = Command::Scan;
    config.input = writeFile("in.sql", "-- x\n");

    EXPECT_TRUE(config.validate());

    config.scan.format = "xml";
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, CommandToString) {
    EXPECT_EQ(commandToString(Command::SmartRun), "smart-run");
    EXPECT_EQ(commandToString(Command::Run), "run");
    EXPECT_EQ(commandToString(Command::Scan), "scan");
}
