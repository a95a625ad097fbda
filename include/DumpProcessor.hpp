#pragma once

#include "StrategyTable.hpp"
#include "ValueGenerator.hpp"
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace ghostdb {

// Running totals for one pass over a dump
struct ProcessStats {
    uint64_t lines_processed = 0;
    uint64_t statements_anonymized = 0;
    uint64_t mismatched_lines = 0;      // column/value count differs, passed through
    uint64_t untracked_statements = 0;  // INSERT for a table with no strategies
};

enum class LineOutcome {
    Passthrough,  // not a single-line INSERT
    Untracked,    // INSERT into a table that is not configured
    Mismatch,     // column and value counts differ
    Anonymized    // value list rewritten
};

// Rewrites INSERT value lists line by line, in input order
class DumpProcessor {
public:
    DumpProcessor(const StrategyTable& strategies, uint64_t seed);

    // Non-copyable
    DumpProcessor(const DumpProcessor&) = delete;
    DumpProcessor& operator=(const DumpProcessor&) = delete;

    // Transform one line. `out` receives the text to emit (without newline).
    LineOutcome processLine(const std::string& line, std::string& out) const;

    // Process a whole stream. Output is flushed before returning.
    // Throws GhostDBException(Read/Write) on stream failure.
    ProcessStats process(std::istream& in, std::ostream& out);

    // Open, process and flush. Throws GhostDBException on I/O failure.
    ProcessStats processFile(const std::filesystem::path& input,
                             const std::filesystem::path& output);

    const ProcessStats& stats() const { return m_stats; }

    static constexpr uint64_t PROGRESS_INTERVAL = 100000;

private:
    const StrategyTable& m_strategies;
    ValueGenerator m_generator;
    ProcessStats m_stats;
};

std::string outcomeToString(LineOutcome outcome);

}  // namespace ghostdb
