#include "FakeData.hpp"
#include <array>
#include <cctype>
#include <string_view>

namespace ghostdb::fake {

namespace {

constexpr std::array<std::string_view, 64> kFirstNames = {
    "James", "Mary", "John", "Patricia", "Robert", "Jennifer", "Michael", "Linda",
    "William", "Elizabeth", "David", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
    "Thomas", "Sarah", "Charles", "Karen", "Christopher", "Nancy", "Daniel", "Lisa",
    "Matthew", "Betty", "Anthony", "Margaret", "Mark", "Sandra", "Donald", "Ashley",
    "Steven", "Kimberly", "Paul", "Emily", "Andrew", "Donna", "Joshua", "Michelle",
    "Kenneth", "Carol", "Kevin", "Amanda", "Brian", "Melissa", "George", "Deborah",
    "Edward", "Stephanie", "Ronald", "Rebecca", "Timothy", "Laura", "Jason", "Sharon",
    "Jeffrey", "Cynthia", "Ryan", "Kathleen", "Jacob", "Amy", "Gary", "Shirley",
};

constexpr std::array<std::string_view, 64> kLastNames = {
    "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
    "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson", "Thomas",
    "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez", "Thompson", "White",
    "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson", "Walker", "Young",
    "Allen", "King", "Wright", "Scott", "Torres", "Nguyen", "Hill", "Flores",
    "Green", "Adams", "Nelson", "Baker", "Hall", "Rivera", "Campbell", "Mitchell",
    "Carter", "Roberts", "Gomez", "Phillips", "Evans", "Turner", "Diaz", "Parker",
    "Cruz", "Edwards", "Collins", "Reyes", "Stewart", "Morris", "Morales", "Murphy",
};

// Reserved documentation domains only
constexpr std::array<std::string_view, 3> kSafeDomains = {
    "example.com", "example.net", "example.org",
};

// '#' is any digit, '^' is 2-9 (valid NANP area/exchange lead digit)
constexpr std::array<std::string_view, 6> kPhoneFormats = {
    "^##-^##-####",
    "(^##) ^##-####",
    "1-^##-^##-####",
    "^##.^##.####",
    "+1-^##-^##-####",
    "^##-^##-#### x###",
};

std::string lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

template<size_t N>
std::string_view pick(Engine& rng, const std::array<std::string_view, N>& items) {
    return items[pickIndex(rng, N)];
}

}  // namespace

uint64_t pickIndex(Engine& rng, uint64_t bound) {
    if (bound == 0) {
        return 0;
    }
    return rng() % bound;
}

std::string firstName(Engine& rng) {
    return std::string(pick(rng, kFirstNames));
}

std::string lastName(Engine& rng) {
    return std::string(pick(rng, kLastNames));
}

std::string fullName(Engine& rng) {
    auto first = firstName(rng);
    return first + " " + lastName(rng);
}

std::string safeEmail(Engine& rng) {
    auto first = lower(pick(rng, kFirstNames));
    std::string user;

    switch (pickIndex(rng, 3)) {
        case 0:
            user = first + "." + lower(pick(rng, kLastNames));
            break;
        case 1:
            user = first + std::to_string(pickIndex(rng, 100));
            break;
        default:
            user = first + "_" + lower(pick(rng, kLastNames));
            break;
    }

    return user + "@" + std::string(pick(rng, kSafeDomains));
}

std::string phoneNumber(Engine& rng) {
    auto format = pick(rng, kPhoneFormats);
    std::string out;
    out.reserve(format.size());

    for (char c : format) {
        if (c == '#') {
            out += static_cast<char>('0' + pickIndex(rng, 10));
        } else if (c == '^') {
            out += static_cast<char>('2' + pickIndex(rng, 8));
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace ghostdb::fake
