#include "StrategyTable.hpp"

namespace ghostdb {

StrategyTable::StrategyTable(StrategyConfig config)
    : m_config(std::move(config)) {
}

std::string StrategyTable::unqualifiedName(const std::string& tableName) {
    auto dot = tableName.rfind('.');
    if (dot == std::string::npos) {
        return tableName;
    }
    return tableName.substr(dot + 1);
}

const TableConfig* StrategyTable::findTable(const std::string& tableName) const {
    auto it = m_config.tables.find(tableName);
    if (it != m_config.tables.end()) {
        return &it->second;
    }

    auto shortName = unqualifiedName(tableName);
    if (shortName != tableName) {
        it = m_config.tables.find(shortName);
        if (it != m_config.tables.end()) {
            return &it->second;
        }
    }

    return nullptr;
}

std::optional<ColumnStrategy> StrategyTable::resolve(const std::string& tableName,
                                                     const std::string& columnName) const {
    const TableConfig* table = findTable(tableName);
    if (!table) {
        return std::nullopt;
    }
    return resolveColumn(*table, columnName);
}

ColumnStrategy StrategyTable::resolveColumn(const TableConfig& table,
                                            const std::string& columnName) {
    auto it = table.find(columnName);
    if (it == table.end()) {
        return strategy::Keep{};
    }
    return it->second;
}

}  // namespace ghostdb
