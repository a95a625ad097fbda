#include "Config.hpp"
#include "DumpProcessor.hpp"
#include "ErrorHandler.hpp"
#include "PlanFormatter.hpp"
#include "SchemaScanner.hpp"
#include "StrategyConfig.hpp"
#include "StrategyTable.hpp"
#include "Wizard.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace ghostdb;

namespace {

constexpr const char* kVersion = "0.1.0";

void setupLogging(bool debug, const std::string& logFile = "") {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console logging goes to stderr; stdout may carry a scan result
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("ghostdb", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printBanner() {
    std::cout << R"(
   ____ _               _   ____  ____
  / ___| |__   ___  ___| |_|  _ \| __ )
 | |  _| '_ \ / _ \/ __| __| | | |  _ \
 | |_| | | | | (_) \__ \ |_| |_| | |_) |
  \____|_| |_|\___/|___/\__|____/|____/

 GhostDB v0.1.0
 Deterministic anonymization for SQL dumps

)" << std::endl;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [run|scan] ...\n\n";
    std::cout << "Smart Run:\n";
    std::cout << "  -i, --input <file>       Scan the dump, review the plan, anonymize\n";
    std::cout << "  -o, --output <file>      Output file (default: <input>_anonymized.sql)\n";
    std::cout << "\nrun:\n";
    std::cout << "  -i, --input <file>       Input SQL dump\n";
    std::cout << "  -o, --output <file>      Output SQL file\n";
    std::cout << "  -c, --config <file>      Strategy file (YAML)\n";
    std::cout << "  -s, --seed <N>           Global seed (default: 42, or GHOSTDB_SEED env)\n";
    std::cout << "  --report <file>          Write run statistics as JSON\n";
    std::cout << "\nscan:\n";
    std::cout << "  -i, --input <file>       Input SQL dump\n";
    std::cout << "  -I, --interactive        Review proposed strategies in a wizard\n";
    std::cout << "  --format <yaml|json>     Output format (default: yaml)\n";
    std::cout << "  -o, --output <file>      Write the strategy file instead of printing it\n";
    std::cout << "\nLogging:\n";
    std::cout << "  -d, --debug              Enable debug output\n";
    std::cout << "  --log-file <file>        Also write logs to this file\n";
    std::cout << "\nOther Options:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -V, --version            Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " scan -i prod.sql > strategies.yaml\n";
    std::cout << "  " << program << " run -i prod.sql -o staging.sql -c strategies.yaml -s 7\n";
    std::cout << "  " << program << " -i prod.sql\n";
    std::cout << std::endl;
}

ProcessStats anonymize(const Config& config, const StrategyConfig& strategies, uint64_t seed) {
    StrategyTable table(strategies);
    if (table.empty()) {
        spdlog::warn("No tables configured; output will be a copy of the input");
    }

    DumpProcessor processor(table, seed);
    return processor.processFile(config.input, config.output);
}

void writeReport(const std::string& path, const ProcessStats& stats) {
    std::ofstream report(path);
    if (!report.is_open()) {
        throw GhostDBException(ErrorKind::OutputCreate,
                               "Failed to create report file " + path + ": " +
                                   ErrorHandler::describeErrno(errno),
                               path);
    }
    report << PlanFormatter::statsToJSON(stats) << '\n';
    report.flush();
    if (!report) {
        throw GhostDBException(ErrorKind::Write, "Failed to write report file " + path, path);
    }
}

int runCommand(const Config& config) {
    ErrorContext ctx("run");

    auto strategies = StrategyConfig::loadFromFile(config.run.strategy_file);
    spdlog::info("Loaded strategies for {} tables from {}", strategies.tables.size(),
                 config.run.strategy_file);

    auto stats = anonymize(config, strategies, config.run.seed);

    if (!config.run.report_file.empty()) {
        writeReport(config.run.report_file, stats);
        spdlog::info("Report written to {}", config.run.report_file);
    }
    return 0;
}

int scanCommand(const Config& config) {
    ErrorContext ctx("scan");

    auto strategies = SchemaScanner::scanFile(config.input);
    spdlog::info("Found {} tables", strategies.tables.size());

    if (config.scan.interactive) {
        Wizard wizard(std::cin, std::cout);
        wizard.run(strategies);
    }

    auto format = PlanFormatter::parseFormat(config.scan.format).value_or(PlanFormat::YAML);

    if (config.output.empty()) {
        std::cout << PlanFormatter::format(strategies, format) << std::endl;
        return 0;
    }

    if (format == PlanFormat::YAML) {
        strategies.saveToFile(config.output);
    } else {
        std::ofstream out(config.output);
        if (!out.is_open()) {
            throw GhostDBException(ErrorKind::OutputCreate,
                                   "Failed to create " + config.output + ": " +
                                       ErrorHandler::describeErrno(errno),
                                   config.output);
        }
        out << PlanFormatter::toJSON(strategies) << '\n';
        out.flush();
        if (!out) {
            throw GhostDBException(ErrorKind::Write, "Failed to write " + config.output,
                                   config.output);
        }
    }
    spdlog::info("Strategy file written to {}", config.output);
    return 0;
}

int smartRunCommand(const Config& config) {
    ErrorContext ctx("smart-run");

    spdlog::info("Starting Smart Run...");
    spdlog::info("Input: {}", config.input);

    std::cout << "Scanning file for schema..." << std::endl;
    auto strategies = SchemaScanner::scanFile(config.input);
    std::cout << "Found " << strategies.tables.size() << " tables." << std::endl;

    std::cout << "\nProposed Anonymization Plan:\n" << PlanFormatter::summary(strategies);

    Wizard wizard(std::cin, std::cout);
    switch (wizard.confirmPlan()) {
        case Wizard::PlanChoice::Customize:
            wizard.run(strategies);
            [[fallthrough]];
        case Wizard::PlanChoice::Run:
            std::cout << "Anonymizing to " << config.output << "..." << std::endl;
            anonymize(config, strategies, config.run.seed);
            break;
        case Wizard::PlanChoice::Quit:
            std::cout << "Bye!" << std::endl;
            break;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Quick help check
    if (argc < 2) {
        printBanner();
        printUsage(argv[0]);
        return ErrorHandler::EXIT_USAGE;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printBanner();
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-V" || arg == "--version") {
            std::cout << "ghostdb version " << kVersion << std::endl;
            return 0;
        }
    }

    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ErrorHandler::EXIT_USAGE;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.logging.log_file);

    spdlog::debug("Command: {}", commandToString(config.command));

    // Validate configuration
    if (!config.validate()) {
        return ErrorHandler::EXIT_USAGE;
    }

    try {
        switch (config.command) {
            case Command::Run:
                return runCommand(config);
            case Command::Scan:
                return scanCommand(config);
            case Command::SmartRun:
                return smartRunCommand(config);
        }
    } catch (const GhostDBException& e) {
        spdlog::error("{}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return ErrorHandler::EXIT_SOFTWARE;
    }

    return ErrorHandler::EXIT_SOFTWARE;
}
