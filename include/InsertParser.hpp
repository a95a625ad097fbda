#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ghostdb {

// Raw fragments of a single-line INSERT statement, reproduced byte-for-byte
struct InsertStatement {
    std::string table;    // as written, possibly schema-qualified
    std::string columns;  // text between the first parentheses
    std::string values;   // text between the VALUES parentheses
    std::string trailing; // whitespace after ");", including a CR
};

// Table and column list only, used when discovering the schema
struct InsertHeader {
    std::string table;
    std::string columns;
};

class InsertParser {
public:
    // Match "INSERT INTO <table> (<columns>) VALUES (<values>);" on one line.
    // Keywords are case-insensitive; trailing whitespace after ");" is allowed.
    static std::optional<InsertStatement> match(const std::string& line);

    // Lighter match: requires only "INSERT INTO <table> (<columns>) VALUES"
    static std::optional<InsertHeader> matchHeader(const std::string& line);

    // Split a VALUES fragment on commas outside single-quoted strings.
    // A backslash copies the next character verbatim. Unbalanced quotes
    // are tolerated; tokens are trimmed.
    static std::vector<std::string> splitValues(std::string_view values);

    // Split a column list on commas, trimming whitespace and double quotes
    static std::vector<std::string> splitColumns(std::string_view columns);

    // True when the token is wrapped in single quotes
    static bool isQuoted(std::string_view token);

    // Token content without its surrounding single quotes, if any
    static std::string_view unquote(std::string_view token);

    // Re-emit the statement with a new value list, keeping its trailing whitespace
    static std::string rebuild(const InsertStatement& statement,
                               const std::vector<std::string>& values);

private:
    static std::string trim(std::string_view str);
};

}  // namespace ghostdb
