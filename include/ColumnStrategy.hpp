#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ghostdb {

// One empty tag type per strategy; Fixed carries its replacement text
namespace strategy {

struct Keep {
    bool operator==(const Keep&) const = default;
};
struct FirstName {
    bool operator==(const FirstName&) const = default;
};
struct LastName {
    bool operator==(const LastName&) const = default;
};
struct FullName {
    bool operator==(const FullName&) const = default;
};
struct Email {
    bool operator==(const Email&) const = default;
};
struct Phone {
    bool operator==(const Phone&) const = default;
};
struct Mask {
    bool operator==(const Mask&) const = default;
};
struct Fixed {
    std::string text;
    bool operator==(const Fixed&) const = default;
};

}  // namespace strategy

// How the values of one column are rewritten
using ColumnStrategy = std::variant<strategy::Keep,
                                    strategy::FirstName,
                                    strategy::LastName,
                                    strategy::FullName,
                                    strategy::Email,
                                    strategy::Phone,
                                    strategy::Mask,
                                    strategy::Fixed>;

// Helper for std::visit with a set of lambdas
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// snake_case name used in strategy files ("keep", "first_name", ..., "fixed")
std::string strategyName(const ColumnStrategy& columnStrategy);

// Display form for plans and menus, e.g. "Email" or "Fixed(\"REDACTED\")"
std::string strategyLabel(const ColumnStrategy& columnStrategy);

// Parse a payload-free strategy name; "fixed" is rejected since it needs text
std::optional<ColumnStrategy> strategyFromName(const std::string& name);

// Names of every payload-free strategy, in declaration order
const std::vector<std::string>& simpleStrategyNames();

inline bool isKeep(const ColumnStrategy& columnStrategy) {
    return std::holds_alternative<strategy::Keep>(columnStrategy);
}

}  // namespace ghostdb
