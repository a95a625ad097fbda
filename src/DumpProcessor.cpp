#include "DumpProcessor.hpp"
#include "ErrorHandler.hpp"
#include "InsertParser.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <istream>
#include <ostream>

namespace ghostdb {

DumpProcessor::DumpProcessor(const StrategyTable& strategies, uint64_t seed)
    : m_strategies(strategies)
    , m_generator(seed) {
}

LineOutcome DumpProcessor::processLine(const std::string& line, std::string& out) const {
    auto statement = InsertParser::match(line);
    if (!statement) {
        out = line;
        return LineOutcome::Passthrough;
    }

    const TableConfig* table = m_strategies.findTable(statement->table);
    if (!table) {
        out = line;
        return LineOutcome::Untracked;
    }

    auto columns = InsertParser::splitColumns(statement->columns);
    auto values = InsertParser::splitValues(statement->values);

    if (columns.size() != values.size()) {
        out = line;
        return LineOutcome::Mismatch;
    }

    std::vector<std::string> substitutes;
    substitutes.reserve(values.size());

    for (size_t i = 0; i < columns.size(); ++i) {
        auto columnStrategy = StrategyTable::resolveColumn(*table, columns[i]);
        substitutes.push_back(m_generator.generate(values[i], columnStrategy));
    }

    out = InsertParser::rebuild(*statement, substitutes);
    return LineOutcome::Anonymized;
}

ProcessStats DumpProcessor::process(std::istream& in, std::ostream& out) {
    m_stats = ProcessStats{};

    std::string line;
    std::string result;

    while (std::getline(in, line)) {
        m_stats.lines_processed++;

        if (m_stats.lines_processed % PROGRESS_INTERVAL == 0) {
            spdlog::info("Processed {} lines...", m_stats.lines_processed);
        }

        switch (processLine(line, result)) {
            case LineOutcome::Anonymized:
                m_stats.statements_anonymized++;
                break;
            case LineOutcome::Mismatch:
                m_stats.mismatched_lines++;
                spdlog::warn("Column count mismatch. Skipping line {}", m_stats.lines_processed);
                break;
            case LineOutcome::Untracked:
                m_stats.untracked_statements++;
                break;
            case LineOutcome::Passthrough:
                break;
        }

        out << result << '\n';
        if (!out) {
            throw GhostDBException(ErrorKind::Write,
                                   "Failed to write output at line " +
                                       std::to_string(m_stats.lines_processed));
        }
    }

    if (in.bad()) {
        throw GhostDBException(ErrorKind::Read,
                               "Error reading line " +
                                   std::to_string(m_stats.lines_processed + 1) + " from input");
    }

    out.flush();
    if (!out) {
        throw GhostDBException(ErrorKind::Write, "Failed to flush output buffer");
    }

    spdlog::info("Done! Processed {} lines. Anonymized {} statements.",
                 m_stats.lines_processed, m_stats.statements_anonymized);
    if (m_stats.mismatched_lines > 0) {
        spdlog::warn("{} lines had a column/value count mismatch and were copied unchanged",
                     m_stats.mismatched_lines);
    }

    return m_stats;
}

ProcessStats DumpProcessor::processFile(const std::filesystem::path& input,
                                        const std::filesystem::path& output) {
    ErrorContext ctx(input.filename().string());

    std::ifstream in(input);
    if (!in.is_open()) {
        throw GhostDBException(ErrorKind::InputOpen,
                               "Failed to open input file " + input.string() + ": " +
                                   ErrorHandler::describeErrno(errno),
                               input.string());
    }

    std::ofstream out(output, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw GhostDBException(ErrorKind::OutputCreate,
                               "Failed to create output file " + output.string() + ": " +
                                   ErrorHandler::describeErrno(errno),
                               output.string());
    }

    spdlog::debug("Anonymizing {} -> {} (seed {})", input.string(), output.string(),
                  m_generator.seed());

    auto stats = process(in, out);

    out.close();
    if (out.fail()) {
        throw GhostDBException(ErrorKind::Write,
                               "Failed to close output file " + output.string(),
                               output.string());
    }

    return stats;
}

std::string outcomeToString(LineOutcome outcome) {
    switch (outcome) {
        case LineOutcome::Passthrough: return "passthrough";
        case LineOutcome::Untracked: return "untracked";
        case LineOutcome::Mismatch: return "mismatch";
        case LineOutcome::Anonymized: return "anonymized";
    }
    return "unknown";
}

}  // namespace ghostdb
