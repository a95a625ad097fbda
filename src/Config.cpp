#include "Config.hpp"
#include "PlanFormatter.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace ghostdb {

namespace {

std::optional<uint64_t> parseSeed(const std::string& value) {
    if (value.empty() || value.front() == '-') {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(parsed);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

}  // namespace

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"GhostDB - deterministic anonymization of SQL dump files"};
    app.require_subcommand(0, 1);
    app.fallthrough();

    // Smart run (no subcommand)
    app.add_option("-i,--input", config.input, "Input SQL dump");
    app.add_option("-o,--output", config.output,
                   "Output file (default: <input>_anonymized.sql)");

    // Logging options
    app.add_flag("-d,--debug", config.logging.debug, "Enable debug output");
    app.add_option("--log-file", config.logging.log_file, "Also write logs to this file");

    // run
    auto* run = app.add_subcommand("run", "Anonymize a dump using a strategy file");
    run->add_option("-i,--input", config.input, "Input SQL dump")->required();
    run->add_option("-o,--output", config.output, "Output SQL file")->required();
    run->add_option("-c,--config", config.run.strategy_file, "Strategy file (YAML)")
        ->required();
    auto* seed = run->add_option("-s,--seed", config.run.seed,
                                 "Global seed for generated values (or GHOSTDB_SEED env)")
        ->default_val(42);
    run->add_option("--report", config.run.report_file,
                    "Write run statistics as JSON to this file");

    // scan
    auto* scan = app.add_subcommand("scan", "Scan a dump and propose a strategy file");
    scan->add_option("-i,--input", config.input, "Input SQL dump")->required();
    scan->add_flag("-I,--interactive", config.scan.interactive,
                   "Review the proposed strategies in a wizard");
    scan->add_option("--format", config.scan.format, "Output format (yaml, json)")
        ->default_val("yaml");
    scan->add_option("-o,--output", config.output,
                     "Write the strategy file here instead of stdout");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (run->parsed()) {
        config.command = Command::Run;
        config.run.seed_from_cli = seed->count() > 0;
    } else if (scan->parsed()) {
        config.command = Command::Scan;
    } else {
        config.command = Command::SmartRun;
        if (config.output.empty() && !config.input.empty()) {
            config.output = defaultOutputFor(config.input);
        }
    }

    config.resolveSeed();

    return config;
}

bool Config::validate() const {
    if (input.empty()) {
        spdlog::error("No input file provided. Use --input or a subcommand.");
        return false;
    }

    if (!std::filesystem::exists(input)) {
        spdlog::error("Input file does not exist: {}", input);
        return false;
    }

    if (std::filesystem::is_directory(input)) {
        spdlog::error("Input is a directory: {}", input);
        return false;
    }

    if (command == Command::Run || command == Command::SmartRun) {
        if (output.empty()) {
            spdlog::error("Output file is required");
            return false;
        }

        std::error_code ec;
        if (std::filesystem::equivalent(input, output, ec)) {
            spdlog::error("Output file must differ from the input file: {}", output);
            return false;
        }
    }

    if (command == Command::Run) {
        if (run.strategy_file.empty()) {
            spdlog::error("Strategy file is required (use -c option)");
            return false;
        }
        if (!std::filesystem::exists(run.strategy_file)) {
            spdlog::error("Strategy file not found: {}", run.strategy_file);
            return false;
        }
    }

    if (command == Command::Scan && !PlanFormatter::parseFormat(scan.format)) {
        spdlog::error("Unknown scan format: {} (expected yaml or json)", scan.format);
        return false;
    }

    return true;
}

void Config::resolveSeed() {
    if (run.seed_from_cli) {
        return;
    }

    const char* env_seed = std::getenv("GHOSTDB_SEED");
    if (!env_seed || !*env_seed) {
        return;
    }

    auto parsed = parseSeed(env_seed);
    if (!parsed) {
        spdlog::warn("Ignoring invalid GHOSTDB_SEED value '{}', using seed {}", env_seed, run.seed);
        return;
    }
    run.seed = *parsed;
}

std::string Config::defaultOutputFor(const std::filesystem::path& input) {
    return input.stem().string() + "_anonymized.sql";
}

std::string commandToString(Command command) {
    switch (command) {
        case Command::SmartRun: return "smart-run";
        case Command::Run: return "run";
        case Command::Scan: return "scan";
    }
    return "unknown";
}

}  // namespace ghostdb
