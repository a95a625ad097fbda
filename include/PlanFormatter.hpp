#pragma once

#include "DumpProcessor.hpp"
#include "StrategyConfig.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ghostdb {

using json = nlohmann::json;

enum class PlanFormat {
    YAML,
    JSON
};

// Renders strategy plans and run statistics.
// Tables and columns are always emitted in sorted order.
class PlanFormatter {
public:
    // Strategy file form, readable by StrategyConfig::fromYAML
    static std::string toYAML(const StrategyConfig& config);

    // Same shape as the YAML form
    static json toJSONValue(const StrategyConfig& config);
    static std::string toJSON(const StrategyConfig& config, bool pretty = true);

    static std::string format(const StrategyConfig& config, PlanFormat format);
    static std::optional<PlanFormat> parseFormat(const std::string& name);

    // Human-readable listing of every non-keep column
    static std::string summary(const StrategyConfig& config);

    static std::string statsToJSON(const ProcessStats& stats, bool pretty = true);

    static std::vector<std::string> sortedTableNames(const StrategyConfig& config);
    static std::vector<std::string> sortedColumnNames(const TableConfig& table);
};

}  // namespace ghostdb
