#include "StrategyConfig.hpp"
#include "ErrorHandler.hpp"
#include "PlanFormatter.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace ghostdb {

namespace {

ColumnStrategy parseStrategy(const YAML::Node& node, const std::string& table,
                             const std::string& column) {
    auto where = "'" + table + "." + column + "'";

    // Tagged scalar: `address: !fixed ANONYMIZED ADDRESS`
    if (node.Tag() == "!fixed") {
        return strategy::Fixed{node.IsNull() ? "" : node.as<std::string>()};
    }

    if (node.IsScalar()) {
        auto name = node.as<std::string>();
        if (name == "fixed") {
            throw GhostDBException(ErrorKind::ConfigParse,
                                   "Strategy 'fixed' for " + where + " requires a value");
        }
        auto parsed = strategyFromName(name);
        if (!parsed) {
            throw GhostDBException(ErrorKind::ConfigParse,
                                   "Unknown strategy '" + name + "' for " + where);
        }
        return *parsed;
    }

    if (node.IsMap() && node.size() == 1 && node["fixed"]) {
        const auto& text = node["fixed"];
        return strategy::Fixed{text.IsNull() ? "" : text.as<std::string>()};
    }

    throw GhostDBException(ErrorKind::ConfigParse, "Invalid strategy for " + where);
}

TableConfig parseTable(const YAML::Node& node, const std::string& table) {
    TableConfig config;

    if (!node || node.IsNull()) {
        return config;
    }
    if (!node.IsMap()) {
        throw GhostDBException(ErrorKind::ConfigParse,
                               "Table '" + table + "' must be a mapping");
    }

    const auto& columns = node["columns"];
    if (!columns || columns.IsNull()) {
        return config;
    }
    if (!columns.IsMap()) {
        throw GhostDBException(ErrorKind::ConfigParse,
                               "Columns of table '" + table + "' must be a mapping");
    }

    for (const auto& entry : columns) {
        auto column = entry.first.as<std::string>();
        config[column] = parseStrategy(entry.second, table, column);
    }

    return config;
}

}  // namespace

StrategyConfig StrategyConfig::fromYAML(const std::string& text) {
    StrategyConfig config;

    try {
        YAML::Node root = YAML::Load(text);

        // Empty document: nothing configured
        if (!root || root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw GhostDBException(ErrorKind::ConfigParse,
                                   "Configuration root must be a mapping");
        }

        const auto& tables = root["tables"];
        if (!tables) {
            throw GhostDBException(ErrorKind::ConfigParse,
                                   "Configuration is missing the 'tables' key");
        }
        if (tables.IsNull()) {
            return config;
        }
        if (!tables.IsMap()) {
            throw GhostDBException(ErrorKind::ConfigParse, "'tables' must be a mapping");
        }

        for (const auto& entry : tables) {
            auto table = entry.first.as<std::string>();
            config.tables[table] = parseTable(entry.second, table);
        }
    } catch (const YAML::Exception& e) {
        throw GhostDBException(ErrorKind::ConfigParse,
                               "Failed to parse YAML configuration: " + std::string(e.what()));
    }

    return config;
}

StrategyConfig StrategyConfig::loadFromFile(const std::filesystem::path& path) {
    ErrorContext ctx("config " + path.string());

    std::ifstream file(path);
    if (!file.is_open()) {
        throw GhostDBException(ErrorKind::ConfigOpen,
                               "Failed to open configuration file " + path.string() + ": " +
                                   ErrorHandler::describeErrno(errno),
                               path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw GhostDBException(ErrorKind::ConfigOpen,
                               "Failed to read configuration file " + path.string(),
                               path.string());
    }

    auto config = fromYAML(buffer.str());
    spdlog::debug("Loaded {} tables ({} columns) from {}", config.tables.size(),
                  config.columnCount(), path.string());
    return config;
}

void StrategyConfig::saveToFile(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw GhostDBException(ErrorKind::OutputCreate,
                               "Failed to create configuration file " + path.string() + ": " +
                                   ErrorHandler::describeErrno(errno),
                               path.string());
    }

    file << PlanFormatter::toYAML(*this) << '\n';
    file.flush();
    if (!file) {
        throw GhostDBException(ErrorKind::Write,
                               "Failed to write configuration file " + path.string(),
                               path.string());
    }
}

size_t StrategyConfig::columnCount() const {
    size_t count = 0;
    for (const auto& [name, table] : tables) {
        count += table.size();
    }
    return count;
}

}  // namespace ghostdb
