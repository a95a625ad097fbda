#pragma once

#include "StrategyConfig.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>

namespace ghostdb {

// Builds a proposed StrategyConfig from the INSERT statements of a dump:
// every table and column seen gets a strategy guessed from the column name.
class SchemaScanner {
public:
    static StrategyConfig scan(std::istream& in);

    // Throws GhostDBException(InputOpen/Read)
    static StrategyConfig scanFile(const std::filesystem::path& path);

    static ColumnStrategy guessStrategy(const std::string& columnName);
};

}  // namespace ghostdb
