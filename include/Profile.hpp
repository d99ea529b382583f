#pragma once
#include <string>
#include <cstdint>

// Character classes in their fixed enumeration order. The order is part of
// the algorithm: it decides alphabet layout and repair order.
enum class CharClass : std::uint8_t {
    Lower  = 0,
    Upper  = 1,
    Digit  = 2,
    Symbol = 3
};

constexpr std::size_t CHAR_CLASS_COUNT = 4;

// Small bit set over CharClass. The raw mask is what gets framed and stored.
class CharClassSet {
public:
    constexpr CharClassSet() = default;
    constexpr explicit CharClassSet(std::uint8_t mask) : m_mask(mask) {}

    static constexpr CharClassSet all() { return CharClassSet(0x0F); }

    constexpr bool contains(CharClass c) const {
        return (m_mask & bit(c)) != 0;
    }
    CharClassSet& insert(CharClass c) {
        m_mask = static_cast<std::uint8_t>(m_mask | bit(c));
        return *this;
    }
    CharClassSet& erase(CharClass c) {
        m_mask = static_cast<std::uint8_t>(m_mask & ~bit(c));
        return *this;
    }

    std::size_t size() const;
    bool empty() const { return (m_mask & 0x0F) == 0; }
    // Any bit outside the four known classes makes the set invalid.
    bool wellFormed() const { return (m_mask & ~0x0F) == 0; }
    std::uint8_t mask() const { return m_mask; }

    // "luds" style spelling used by the CLI and for display.
    std::string toString() const;
    // Throws FramingError on unknown letters or an empty result.
    static CharClassSet parse(const std::string& spec);

    bool operator==(const CharClassSet& o) const { return m_mask == o.m_mask; }
    bool operator!=(const CharClassSet& o) const { return m_mask != o.m_mask; }

private:
    static constexpr std::uint8_t bit(CharClass c) {
        return static_cast<std::uint8_t>(1u << static_cast<unsigned>(c));
    }

    std::uint8_t m_mask = 0;
};

// Bumping the version is how cost parameters, alphabets or encoding rules
// change without breaking passwords derived under an older version.
enum class AlgorithmVersion : std::uint8_t {
    V1 = 1
};

constexpr AlgorithmVersion CURRENT_ALGORITHM = AlgorithmVersion::V1;

// Per-site generation policy. Read-only input to every derivation.
struct Profile {
    std::string      siteLabel;
    std::uint32_t    length  = 16;
    CharClassSet     classes = CharClassSet::all();
    std::uint32_t    counter = 0;
    AlgorithmVersion version = CURRENT_ALGORITHM;

    static constexpr std::uint32_t MIN_LENGTH = 4;
    static constexpr std::uint32_t MAX_LENGTH = 64;
};

// Throws FramingError if the profile cannot be satisfied:
// empty site label, empty/unknown classes, length outside
// [MIN_LENGTH, MAX_LENGTH], length < |classes|, unknown algorithm version.
void validateProfile(const Profile& profile);

bool isKnownAlgorithm(AlgorithmVersion v);

// Decimal length as typed by the user. The whole string must be digits and
// the value must lie in [MIN_LENGTH, MAX_LENGTH]; throws FramingError otherwise.
std::uint32_t parseLength(const std::string& text);
