#include "SchemaScanner.hpp"
#include "ErrorHandler.hpp"
#include "InsertParser.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <map>
#include <set>

namespace ghostdb {

namespace {

std::string toLower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& str, const char* needle) {
    return str.find(needle) != std::string::npos;
}

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool containsAny(const std::string& str, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&str](const char* needle) { return contains(str, needle); });
}

}  // namespace

ColumnStrategy SchemaScanner::guessStrategy(const std::string& columnName) {
    auto lower = toLower(columnName);

    // Keys and identifiers
    if (lower == "id" || endsWith(lower, "_id") || endsWith(lower, "uuid") ||
        endsWith(lower, "guid")) {
        return strategy::Keep{};
    }

    // Timestamps
    if (contains(lower, "date") || contains(lower, "time") || endsWith(lower, "_at")) {
        return strategy::Keep{};
    }

    // Money
    if (containsAny(lower, {"amount", "price", "sum", "total", "balance", "cost", "currency"})) {
        return strategy::Keep{};
    }

    if (contains(lower, "email")) {
        return strategy::Email{};
    }
    if (contains(lower, "phone") || contains(lower, "mobile")) {
        return strategy::Phone{};
    }
    if (lower == "first_name" || lower == "firstname") {
        return strategy::FirstName{};
    }
    if (lower == "last_name" || lower == "lastname" || lower == "surname") {
        return strategy::LastName{};
    }
    if (contains(lower, "name") && !containsAny(lower, {"user", "file", "domain"})) {
        return strategy::FullName{};
    }
    if (containsAny(lower, {"address", "city", "street"})) {
        return strategy::Fixed{"ANONYMIZED ADDRESS"};
    }
    if (containsAny(lower, {"password", "token", "secret", "key"})) {
        return strategy::Fixed{"REDACTED_SECRET"};
    }
    if (containsAny(lower, {"description", "comment", "note"})) {
        return strategy::Mask{};
    }

    return strategy::Keep{};
}

StrategyConfig SchemaScanner::scan(std::istream& in) {
    std::map<std::string, std::set<std::string>> discovered;
    std::string line;
    uint64_t lineNumber = 0;

    while (std::getline(in, line)) {
        lineNumber++;
        auto header = InsertParser::matchHeader(line);
        if (!header) {
            continue;
        }

        auto& columns = discovered[header->table];
        for (auto& column : InsertParser::splitColumns(header->columns)) {
            columns.insert(std::move(column));
        }
    }

    if (in.bad()) {
        throw GhostDBException(ErrorKind::Read,
                               "Error reading line " + std::to_string(lineNumber + 1) +
                                   " while scanning");
    }

    StrategyConfig config;
    for (const auto& [table, columns] : discovered) {
        TableConfig tableConfig;
        for (const auto& column : columns) {
            tableConfig[column] = guessStrategy(column);
        }
        spdlog::debug("Discovered table {} with {} columns", table, columns.size());
        config.tables[table] = std::move(tableConfig);
    }

    return config;
}

StrategyConfig SchemaScanner::scanFile(const std::filesystem::path& path) {
    ErrorContext ctx("scan " + path.filename().string());

    std::ifstream in(path);
    if (!in.is_open()) {
        throw GhostDBException(ErrorKind::InputOpen,
                               "Failed to open input file " + path.string() + ": " +
                                   ErrorHandler::describeErrno(errno),
                               path.string());
    }

    spdlog::info("Scanning file: {}", path.string());
    return scan(in);
}

}  // namespace ghostdb
