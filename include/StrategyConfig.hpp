#pragma once

#include "ColumnStrategy.hpp"
#include <string>
#include <unordered_map>
#include <filesystem>

namespace ghostdb {

// Column name (as written in the dump) -> strategy
using TableConfig = std::unordered_map<std::string, ColumnStrategy>;

// Table name, possibly schema-qualified -> column strategies.
// Built once per run (from a strategy file or a schema scan) and
// read-only while a dump is processed.
struct StrategyConfig {
    std::unordered_map<std::string, TableConfig> tables;

    // Load a YAML strategy file. Throws GhostDBException (ConfigOpen or
    // ConfigParse) when the file cannot be read or is malformed.
    static StrategyConfig loadFromFile(const std::filesystem::path& path);

    // Parse YAML text; throws GhostDBException(ConfigParse)
    static StrategyConfig fromYAML(const std::string& text);

    // Write the YAML form; throws GhostDBException(OutputCreate or Write)
    void saveToFile(const std::filesystem::path& path) const;

    size_t columnCount() const;
};

}  // namespace ghostdb
