#include "Wizard.hpp"
#include "PlanFormatter.hpp"
#include <spdlog/spdlog.h>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace ghostdb {

namespace {

struct StrategyOption {
    const char* label;
    ColumnStrategy value;
};

const std::vector<StrategyOption>& strategyOptions() {
    static const std::vector<StrategyOption> options = {
        {"Keep (Original Value)", strategy::Keep{}},
        {"Email (fake@example.com)", strategy::Email{}},
        {"First Name (Alice)", strategy::FirstName{}},
        {"Last Name (Smith)", strategy::LastName{}},
        {"Full Name (Alice Smith)", strategy::FullName{}},
        {"Phone (+1-555...)", strategy::Phone{}},
        {"Mask (a***@example.com)", strategy::Mask{}},
        {"Fixed Value...", strategy::Fixed{}},
    };
    return options;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace

Wizard::Wizard(std::istream& in, std::ostream& out)
    : m_in(in)
    , m_out(out) {
}

std::optional<std::string> Wizard::prompt(const std::string& text) {
    m_out << text << ": " << std::flush;

    std::string line;
    if (!std::getline(m_in, line)) {
        m_out << "\n";
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<size_t> Wizard::select(const std::string& title,
                                     const std::vector<std::string>& items,
                                     size_t defaultIndex) {
    if (items.empty()) {
        return std::nullopt;
    }

    while (true) {
        m_out << title << "\n";
        for (size_t i = 0; i < items.size(); ++i) {
            m_out << "  " << (i + 1) << ") " << items[i] << "\n";
        }

        auto answer = prompt("Choice [" + std::to_string(defaultIndex + 1) + "]");
        if (!answer) {
            return std::nullopt;
        }

        auto choice = trim(*answer);
        if (choice.empty()) {
            return defaultIndex;
        }

        try {
            size_t consumed = 0;
            auto number = std::stoul(choice, &consumed);
            if (consumed == choice.size() && number >= 1 && number <= items.size()) {
                return static_cast<size_t>(number - 1);
            }
        } catch (const std::logic_error&) {
            // not a number; fall through to re-prompt
        }

        m_out << "Please enter a number between 1 and " << items.size() << ".\n";
    }
}

void Wizard::run(StrategyConfig& config) {
    m_out << "GhostDB Interactive Config Wizard\n";

    while (true) {
        auto tableNames = PlanFormatter::sortedTableNames(config);

        auto choices = tableNames;
        choices.push_back("Save and Proceed");

        auto selection = select("Select a table to configure", choices);
        if (!selection || *selection == tableNames.size()) {
            break;
        }

        const auto& tableName = tableNames[*selection];
        configureTable(tableName, config.tables[tableName]);
    }
}

void Wizard::configureTable(const std::string& tableName, TableConfig& table) {
    while (true) {
        auto columnNames = PlanFormatter::sortedColumnNames(table);

        std::vector<std::string> choices;
        choices.reserve(columnNames.size() + 1);
        for (const auto& column : columnNames) {
            choices.push_back(column + " [" + strategyLabel(table.at(column)) + "]");
        }
        choices.push_back("Back to Tables");

        auto selection = select("Configure columns for table '" + tableName + "'", choices);
        if (!selection || *selection == columnNames.size()) {
            break;
        }

        const auto& column = columnNames[*selection];
        auto chosen = selectStrategy(column);
        if (!chosen) {
            break;
        }

        spdlog::debug("{}.{} -> {}", tableName, column, strategyLabel(*chosen));
        table[column] = std::move(*chosen);
    }
}

std::optional<ColumnStrategy> Wizard::selectStrategy(const std::string& columnName) {
    const auto& options = strategyOptions();

    std::vector<std::string> labels;
    labels.reserve(options.size());
    for (const auto& option : options) {
        labels.emplace_back(option.label);
    }

    auto selection = select("Select strategy for column '" + columnName + "'", labels);
    if (!selection) {
        return std::nullopt;
    }

    const auto& chosen = options[*selection].value;
    if (std::holds_alternative<strategy::Fixed>(chosen)) {
        auto text = prompt("Enter the fixed value");
        if (!text) {
            return std::nullopt;
        }
        return strategy::Fixed{*text};
    }

    return chosen;
}

Wizard::PlanChoice Wizard::confirmPlan() {
    static const std::vector<std::string> options = {
        "Run (Execute Plan)",
        "Customize Plan",
        "Quit",
    };

    auto selection = select("Ready to proceed?", options);
    if (!selection) {
        return PlanChoice::Quit;
    }

    switch (*selection) {
        case 0: return PlanChoice::Run;
        case 1: return PlanChoice::Customize;
        default: return PlanChoice::Quit;
    }
}

}  // namespace ghostdb
