#include "PlanFormatter.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ghostdb {

namespace {

void emitStrategy(YAML::Emitter& out, const ColumnStrategy& columnStrategy) {
    if (const auto* fixed = std::get_if<strategy::Fixed>(&columnStrategy)) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "fixed" << YAML::Value << fixed->text;
        out << YAML::EndMap;
    } else {
        out << strategyName(columnStrategy);
    }
}

json strategyToJSON(const ColumnStrategy& columnStrategy) {
    if (const auto* fixed = std::get_if<strategy::Fixed>(&columnStrategy)) {
        return json{{"fixed", fixed->text}};
    }
    return strategyName(columnStrategy);
}

}  // namespace

std::vector<std::string> PlanFormatter::sortedTableNames(const StrategyConfig& config) {
    std::vector<std::string> names;
    names.reserve(config.tables.size());
    for (const auto& [name, table] : config.tables) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PlanFormatter::sortedColumnNames(const TableConfig& table) {
    std::vector<std::string> names;
    names.reserve(table.size());
    for (const auto& [name, columnStrategy] : table) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string PlanFormatter::toYAML(const StrategyConfig& config) {
    YAML::Emitter out;

    out << YAML::BeginMap;
    out << YAML::Key << "tables" << YAML::Value;

    if (config.tables.empty()) {
        out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
    } else {
        out << YAML::BeginMap;
        for (const auto& tableName : sortedTableNames(config)) {
            const auto& table = config.tables.at(tableName);

            out << YAML::Key << tableName << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "columns" << YAML::Value;

            if (table.empty()) {
                out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
            } else {
                out << YAML::BeginMap;
                for (const auto& column : sortedColumnNames(table)) {
                    out << YAML::Key << column << YAML::Value;
                    emitStrategy(out, table.at(column));
                }
                out << YAML::EndMap;
            }

            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    return out.c_str();
}

json PlanFormatter::toJSONValue(const StrategyConfig& config) {
    json tables = json::object();

    for (const auto& [tableName, table] : config.tables) {
        json columns = json::object();
        for (const auto& [column, columnStrategy] : table) {
            columns[column] = strategyToJSON(columnStrategy);
        }
        tables[tableName] = json{{"columns", std::move(columns)}};
    }

    return json{{"tables", std::move(tables)}};
}

std::string PlanFormatter::toJSON(const StrategyConfig& config, bool pretty) {
    auto value = toJSONValue(config);
    return pretty ? value.dump(2) : value.dump();
}

std::string PlanFormatter::format(const StrategyConfig& config, PlanFormat format) {
    switch (format) {
        case PlanFormat::YAML:
            return toYAML(config);
        case PlanFormat::JSON:
            return toJSON(config);
    }
    return toYAML(config);
}

std::optional<PlanFormat> PlanFormatter::parseFormat(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "yaml" || lower == "yml") return PlanFormat::YAML;
    if (lower == "json") return PlanFormat::JSON;
    return std::nullopt;
}

std::string PlanFormatter::summary(const StrategyConfig& config) {
    std::ostringstream out;

    for (const auto& tableName : sortedTableNames(config)) {
        const auto& table = config.tables.at(tableName);
        out << "Table: " << tableName << "\n";

        for (const auto& column : sortedColumnNames(table)) {
            const auto& columnStrategy = table.at(column);
            if (isKeep(columnStrategy)) continue;
            out << "  - " << column << " -> " << strategyLabel(columnStrategy) << "\n";
        }
    }

    return out.str();
}

std::string PlanFormatter::statsToJSON(const ProcessStats& stats, bool pretty) {
    json obj = {
        {"lines_processed", stats.lines_processed},
        {"statements_anonymized", stats.statements_anonymized},
        {"mismatched_lines", stats.mismatched_lines},
        {"untracked_statements", stats.untracked_statements},
    };
    return pretty ? obj.dump(2) : obj.dump();
}

}  // namespace ghostdb
