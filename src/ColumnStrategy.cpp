#include "ColumnStrategy.hpp"

namespace ghostdb {

std::string strategyName(const ColumnStrategy& columnStrategy) {
    return std::visit(Overloaded{
        [](const strategy::Keep&) -> std::string { return "keep"; },
        [](const strategy::FirstName&) -> std::string { return "first_name"; },
        [](const strategy::LastName&) -> std::string { return "last_name"; },
        [](const strategy::FullName&) -> std::string { return "full_name"; },
        [](const strategy::Email&) -> std::string { return "email"; },
        [](const strategy::Phone&) -> std::string { return "phone"; },
        [](const strategy::Mask&) -> std::string { return "mask"; },
        [](const strategy::Fixed&) -> std::string { return "fixed"; },
    }, columnStrategy);
}

std::string strategyLabel(const ColumnStrategy& columnStrategy) {
    return std::visit(Overloaded{
        [](const strategy::Keep&) -> std::string { return "Keep"; },
        [](const strategy::FirstName&) -> std::string { return "FirstName"; },
        [](const strategy::LastName&) -> std::string { return "LastName"; },
        [](const strategy::FullName&) -> std::string { return "FullName"; },
        [](const strategy::Email&) -> std::string { return "Email"; },
        [](const strategy::Phone&) -> std::string { return "Phone"; },
        [](const strategy::Mask&) -> std::string { return "Mask"; },
        [](const strategy::Fixed& f) -> std::string { return "Fixed(\"" + f.text + "\")"; },
    }, columnStrategy);
}

std::optional<ColumnStrategy> strategyFromName(const std::string& name) {
    if (name == "keep") return strategy::Keep{};
    if (name == "first_name") return strategy::FirstName{};
    if (name == "last_name") return strategy::LastName{};
    if (name == "full_name") return strategy::FullName{};
    if (name == "email") return strategy::Email{};
    if (name == "phone") return strategy::Phone{};
    if (name == "mask") return strategy::Mask{};
    return std::nullopt;
}

const std::vector<std::string>& simpleStrategyNames() {
    static const std::vector<std::string> names = {
        "keep", "first_name", "last_name", "full_name", "email", "phone", "mask"
    };
    return names;
}

}  // namespace ghostdb
