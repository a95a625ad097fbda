#include "InsertParser.hpp"
#include <cctype>
#include <regex>
#include <utility>

namespace ghostdb {

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

// Only the fixed keyword prefix goes through the regex. Table name, column
// list and value list are found by plain string scanning; libstdc++ runs
// std::regex recursively and overflows the stack on long variable-length
// matches.
const std::regex& keywordHead() {
    static const std::regex re(R"(INSERT\s+INTO\s+)",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

bool isSpace(char c) {
    return std::string_view(kWhitespace).find(c) != std::string_view::npos;
}

size_t skipSpace(const std::string& line, size_t pos) {
    while (pos < line.size() && isSpace(line[pos])) {
        ++pos;
    }
    return pos;
}

bool startsWithKeyword(const std::string& line, size_t pos, std::string_view keyword) {
    if (line.size() - pos < keyword.size()) {
        return false;
    }
    for (size_t i = 0; i < keyword.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(line[pos + i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

// Earliest ")" after `from` followed by VALUES (and "(" when `valuesParen`).
// Returns the ")" position and the position just past the match.
std::optional<std::pair<size_t, size_t>> findColumnsEnd(const std::string& line, size_t from,
                                                        bool valuesParen) {
    for (auto close = line.find_first_of(")\r\n", from); close != std::string::npos;
         close = line.find_first_of(")\r\n", close + 1)) {
        // the column list never spans a line break
        if (line[close] != ')') {
            return std::nullopt;
        }

        auto pos = skipSpace(line, close + 1);
        if (!startsWithKeyword(line, pos, "VALUES")) {
            continue;
        }
        pos += 6;
        if (!valuesParen) {
            return std::make_pair(close, pos);
        }

        pos = skipSpace(line, pos);
        if (pos < line.size() && line[pos] == '(') {
            return std::make_pair(close, pos + 1);
        }
    }
    return std::nullopt;
}

struct Head {
    std::string table;
    std::string columns;
    size_t end;  // just past "VALUES" or "VALUES ("
};

// "INSERT INTO <table> (<columns>) VALUES" at the start of the line.
// The table is the longest run of non-space characters that still leaves
// a column list behind it.
std::optional<Head> matchHead(const std::string& line, bool valuesParen) {
    std::smatch m;
    if (!std::regex_search(line, m, keywordHead(), std::regex_constants::match_continuous)) {
        return std::nullopt;
    }

    auto start = static_cast<size_t>(m.length(0));
    auto tokenEnd = start;
    while (tokenEnd < line.size() && !isSpace(line[tokenEnd])) {
        ++tokenEnd;
    }
    if (tokenEnd == start) {
        return std::nullopt;
    }

    // Candidate table ends: the whole token, then each "(" inside it, last first
    std::vector<size_t> tableEnds{tokenEnd};
    for (auto k = tokenEnd - 1; k > start; --k) {
        if (line[k] == '(') {
            tableEnds.push_back(k);
        }
    }

    for (auto tableEnd : tableEnds) {
        auto open = tableEnd == tokenEnd ? skipSpace(line, tokenEnd) : tableEnd;
        if (open >= line.size() || line[open] != '(') {
            continue;
        }

        auto columnsEnd = findColumnsEnd(line, open + 1, valuesParen);
        if (!columnsEnd) {
            continue;
        }

        return Head{line.substr(start, tableEnd - start),
                    line.substr(open + 1, columnsEnd->first - open - 1),
                    columnsEnd->second};
    }

    return std::nullopt;
}

}  // namespace

std::string InsertParser::trim(std::string_view str) {
    auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(kWhitespace);
    return std::string(str.substr(start, end - start + 1));
}

std::optional<InsertStatement> InsertParser::match(const std::string& line) {
    auto head = matchHead(line, true);
    if (!head) {
        return std::nullopt;
    }

    std::string_view rest(line);
    rest.remove_prefix(head->end);

    auto last = rest.find_last_not_of(kWhitespace);
    if (last == std::string_view::npos || last < 1) {
        return std::nullopt;
    }
    auto trailing = rest.substr(last + 1);
    rest = rest.substr(0, last + 1);
    if (rest.substr(rest.size() - 2) != ");") {
        return std::nullopt;
    }

    InsertStatement stmt;
    stmt.table = std::move(head->table);
    stmt.columns = std::move(head->columns);
    stmt.values = std::string(rest.substr(0, rest.size() - 2));
    stmt.trailing = std::string(trailing);
    return stmt;
}

std::optional<InsertHeader> InsertParser::matchHeader(const std::string& line) {
    auto head = matchHead(line, false);
    if (!head) {
        return std::nullopt;
    }
    return InsertHeader{std::move(head->table), std::move(head->columns)};
}

std::vector<std::string> InsertParser::splitValues(std::string_view values) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;
    bool escape = false;

    for (char c : values) {
        if (escape) {
            current += c;
            escape = false;
            continue;
        }

        switch (c) {
            case '\'':
                in_quotes = !in_quotes;
                current += c;
                break;
            case '\\':
                escape = true;
                current += c;
                break;
            case ',':
                if (in_quotes) {
                    current += c;
                } else {
                    result.push_back(trim(current));
                    current.clear();
                }
                break;
            default:
                current += c;
                break;
        }
    }

    auto tail = trim(current);
    if (!tail.empty()) {
        result.push_back(std::move(tail));
    }

    return result;
}

std::vector<std::string> InsertParser::splitColumns(std::string_view columns) {
    std::vector<std::string> result;
    size_t start = 0;

    while (true) {
        auto comma = columns.find(',', start);
        auto name = trim(columns.substr(start, comma == std::string_view::npos
                                                   ? std::string_view::npos
                                                   : comma - start));

        auto first = name.find_first_not_of('"');
        if (first == std::string::npos) {
            name.clear();
        } else {
            name = name.substr(first, name.find_last_not_of('"') - first + 1);
        }
        result.push_back(std::move(name));

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }

    return result;
}

bool InsertParser::isQuoted(std::string_view token) {
    return token.size() >= 2 && token.front() == '\'' && token.back() == '\'';
}

std::string_view InsertParser::unquote(std::string_view token) {
    if (isQuoted(token)) {
        return token.substr(1, token.size() - 2);
    }
    return token;
}

std::string InsertParser::rebuild(const InsertStatement& statement,
                                  const std::vector<std::string>& values) {
    std::string out;
    out.reserve(statement.table.size() + statement.columns.size() +
                statement.values.size() + statement.trailing.size() + 32);

    out += "INSERT INTO ";
    out += statement.table;
    out += " (";
    out += statement.columns;
    out += ") VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    out += ");";
    out += statement.trailing;
    return out;
}

}  // namespace ghostdb
