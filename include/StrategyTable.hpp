#pragma once

#include "StrategyConfig.hpp"
#include <optional>
#include <string>

namespace ghostdb {

// Read-only lookup from (table, column) to the strategy that applies.
//
// Table names resolve in two tiers: the name exactly as written in the dump,
// then its last dot-separated segment ("public.users" -> "users"). A table
// that resolves neither way is untracked and its statements pass through.
class StrategyTable {
public:
    StrategyTable() = default;
    explicit StrategyTable(StrategyConfig config);

    // Column strategies for a table, or nullptr when the table is untracked
    const TableConfig* findTable(const std::string& tableName) const;

    // Strategy for one column; nullopt when the table is untracked,
    // Keep when the table is tracked but the column is not listed
    std::optional<ColumnStrategy> resolve(const std::string& tableName,
                                          const std::string& columnName) const;

    static ColumnStrategy resolveColumn(const TableConfig& table,
                                        const std::string& columnName);

    // Last segment of a dotted name, or the name itself
    static std::string unqualifiedName(const std::string& tableName);

    const StrategyConfig& config() const { return m_config; }
    size_t tableCount() const { return m_config.tables.size(); }
    bool empty() const { return m_config.tables.empty(); }

private:
    StrategyConfig m_config;
};

}  // namespace ghostdb
