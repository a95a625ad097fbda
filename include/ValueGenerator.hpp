#pragma once

#include "ColumnStrategy.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace ghostdb {

// Produces the substitute for one value token.
//
// generate() is a pure function of (token, strategy, global seed): the
// per-value engine is seeded from a stable hash of the global seed and the
// unquoted token content, so the same literal maps to the same substitute in
// every column, every position and every run.
class ValueGenerator {
public:
    static constexpr uint64_t DEFAULT_SEED = 42;

    explicit ValueGenerator(uint64_t globalSeed = DEFAULT_SEED);

    std::string generate(const std::string& token, const ColumnStrategy& strategy) const;

    static std::string generate(const std::string& token, const ColumnStrategy& strategy,
                                uint64_t globalSeed);

    // FNV-1a over the little-endian seed bytes followed by the content bytes
    static uint64_t deriveSeed(uint64_t globalSeed, std::string_view content);

    // Partial masking of unquoted text; keeps the domain of email addresses
    static std::string mask(std::string_view value);

    uint64_t seed() const { return m_seed; }

private:
    uint64_t m_seed;
};

}  // namespace ghostdb
