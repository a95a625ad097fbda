#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

namespace ghostdb {

enum class Command {
    SmartRun,  // ghostdb -i dump.sql: scan, review, anonymize
    Run,       // ghostdb run: anonymize with a strategy file
    Scan       // ghostdb scan: propose a strategy file
};

struct RunConfig {
    std::string strategy_file;
    uint64_t seed = 42;
    bool seed_from_cli = false;
    std::string report_file;
};

struct ScanConfig {
    bool interactive = false;
    std::string format = "yaml";  // yaml, json
};

struct LoggingConfig {
    bool debug = false;
    std::string log_file;
};

struct Config {
    Command command = Command::SmartRun;
    std::string input;
    std::string output;

    RunConfig run;
    ScanConfig scan;
    LoggingConfig logging;

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration for the selected command
    bool validate() const;

    // Take the seed from GHOSTDB_SEED if --seed was not given
    void resolveSeed();

    // "<input stem>_anonymized.sql" in the working directory
    static std::string defaultOutputFor(const std::filesystem::path& input);
};

std::string commandToString(Command command);

}  // namespace ghostdb
