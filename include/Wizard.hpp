#pragma once

#include "StrategyConfig.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ghostdb {

// Numbered text menus for reviewing and editing a strategy plan.
// End of input on any prompt leaves the current menu.
class Wizard {
public:
    enum class PlanChoice {
        Run,
        Customize,
        Quit
    };

    Wizard(std::istream& in, std::ostream& out);

    // Table menu loop until "Save and Proceed" or end of input
    void run(StrategyConfig& config);

    // Column menu loop for one table until "Back to Tables"
    void configureTable(const std::string& tableName, TableConfig& table);

    // Strategy menu; Fixed asks for its text. nullopt on end of input.
    std::optional<ColumnStrategy> selectStrategy(const std::string& columnName);

    // "Ready to proceed?" for the smart run; Quit on end of input
    PlanChoice confirmPlan();

    // Print items numbered from 1 and read a choice. Empty input selects
    // `defaultIndex`; invalid input re-prompts. nullopt on end of input.
    std::optional<size_t> select(const std::string& title,
                                 const std::vector<std::string>& items,
                                 size_t defaultIndex = 0);

    std::optional<std::string> prompt(const std::string& text);

private:
    std::istream& m_in;
    std::ostream& m_out;
};

}  // namespace ghostdb
