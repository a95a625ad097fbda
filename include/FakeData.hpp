#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace ghostdb {

// Synthetic personal data drawn from compiled-in English word lists.
//
// Every function consumes raw std::mt19937_64 output only; the standard
// distributions are implementation-defined and would make results differ
// between standard libraries.
namespace fake {

using Engine = std::mt19937_64;

std::string firstName(Engine& rng);
std::string lastName(Engine& rng);
std::string fullName(Engine& rng);
std::string safeEmail(Engine& rng);
std::string phoneNumber(Engine& rng);

// Uniform index in [0, bound) from one engine draw
uint64_t pickIndex(Engine& rng, uint64_t bound);

}  // namespace fake

}  // namespace ghostdb
