#include "ValueGenerator.hpp"
#include "FakeData.hpp"
#include "InsertParser.hpp"
#include <algorithm>

namespace ghostdb {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

constexpr std::string_view kMaskFill = "***";
constexpr std::string_view kUnknownEmail = "***@unknown.com";

// First UTF-8 encoded character, so multi-byte text is never cut mid-sequence
std::string_view firstCharacter(std::string_view text) {
    if (text.empty()) {
        return text;
    }
    size_t len = 1;
    while (len < text.size() &&
           (static_cast<unsigned char>(text[len]) & 0xC0) == 0x80) {
        ++len;
    }
    return text.substr(0, len);
}

}  // namespace

ValueGenerator::ValueGenerator(uint64_t globalSeed)
    : m_seed(globalSeed) {
}

std::string ValueGenerator::generate(const std::string& token,
                                     const ColumnStrategy& columnStrategy) const {
    return generate(token, columnStrategy, m_seed);
}

uint64_t ValueGenerator::deriveSeed(uint64_t globalSeed, std::string_view content) {
    uint64_t h = kFnvOffsetBasis;
    for (int i = 0; i < 8; ++i) {
        h ^= (globalSeed >> (8 * i)) & 0xFF;
        h *= kFnvPrime;
    }
    for (char c : content) {
        h ^= static_cast<uint8_t>(c);
        h *= kFnvPrime;
    }
    return h;
}

std::string ValueGenerator::mask(std::string_view value) {
    auto ats = std::count(value.begin(), value.end(), '@');

    if (ats == 1) {
        auto at = value.find('@');
        auto local = value.substr(0, at);
        auto domain = value.substr(at + 1);

        std::string out;
        if (local.size() > 1) {
            out += firstCharacter(local);
            out += kMaskFill;
        } else {
            out += kMaskFill;
        }
        out += '@';
        out += domain;
        return out;
    }

    if (ats > 1) {
        return std::string(kUnknownEmail);
    }

    if (value.size() > 1) {
        return std::string(firstCharacter(value)) + std::string(kMaskFill);
    }
    return "*";
}

std::string ValueGenerator::generate(const std::string& token, const ColumnStrategy& columnStrategy,
                                     uint64_t globalSeed) {
    if (isKeep(columnStrategy)) {
        return token;
    }

    bool quoted = InsertParser::isQuoted(token);
    auto content = InsertParser::unquote(token);

    fake::Engine rng(deriveSeed(globalSeed, content));

    auto value = std::visit(Overloaded{
        [&](const strategy::Keep&) { return token; },
        [&](const strategy::FirstName&) { return fake::firstName(rng); },
        [&](const strategy::LastName&) { return fake::lastName(rng); },
        [&](const strategy::FullName&) { return fake::fullName(rng); },
        [&](const strategy::Email&) { return fake::safeEmail(rng); },
        [&](const strategy::Phone&) { return fake::phoneNumber(rng); },
        [&](const strategy::Mask&) { return mask(content); },
        [&](const strategy::Fixed& f) { return f.text; },
    }, columnStrategy);

    if (quoted) {
        return "'" + value + "'";
    }
    return value;
}

}  // namespace ghostdb
