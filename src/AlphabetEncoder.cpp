#include "AlphabetEncoder.hpp"
#include "errors.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace {
    const std::array<std::string, CHAR_CLASS_COUNT> ALPHABETS = {
        "abcdefghijklmnopqrstuvwxyz",
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ",
        "0123456789",
        "!@#$%^&*()-_=+[]{};:,.?/"
    };
}

const std::string& classAlphabet(CharClass c) {
    return ALPHABETS[static_cast<std::size_t>(c)];
}

std::string fullAlphabet(CharClassSet classes) {
    std::string out;
    for (std::size_t i = 0; i < CHAR_CLASS_COUNT; ++i) {
        if (classes.contains(static_cast<CharClass>(i))) out += ALPHABETS[i];
    }
    return out;
}

std::size_t EntropyCursor::uniform(std::size_t bound) {
    if (bound == 0 || bound > 65536) {
        throw std::invalid_argument("EntropyCursor::uniform: bound must be in [1, 65536]");
    }

    const std::size_t width = bound <= 256 ? 1 : 2;
    const std::size_t range = width == 1 ? 256 : 65536;
    const std::size_t limit = range - range % bound;

    for (;;) {
        if (m_size - m_pos < width) {
            throw DerivationError(DerivationError::Kind::BufferExhausted,
                                  "encoder: entropy buffer exhausted after "
                                  + std::to_string(m_pos) + " bytes");
        }
        std::size_t value = m_data[m_pos];
        if (width == 2) value = (value << 8) | m_data[m_pos + 1];
        m_pos += width;

        if (value < limit) return value % bound;
    }
}

std::string encode(const std::vector<std::uint8_t>& buffer,
                   std::size_t length,
                   CharClassSet classes) {
    if (!classes.wellFormed() || classes.empty()) {
        throw FramingError("encode: no character classes requested");
    }
    if (length < classes.size()) {
        throw FramingError("encode: length is shorter than the number of required classes");
    }

    // owner[k] = class of full[k]
    const std::string full = fullAlphabet(classes);
    std::vector<std::size_t> owner;
    owner.reserve(full.size());
    for (std::size_t i = 0; i < CHAR_CLASS_COUNT; ++i) {
        if (classes.contains(static_cast<CharClass>(i))) owner.insert(owner.end(), ALPHABETS[i].size(), i);
    }

    EntropyCursor cursor(buffer);
    std::string out(length, '\0');
    std::vector<std::size_t> posClass(length);
    std::array<std::size_t, CHAR_CLASS_COUNT> counts{};

    for (std::size_t i = 0; i < length; ++i) {
        std::size_t k = cursor.uniform(full.size());
        out[i] = full[k];
        posClass[i] = owner[k];
        ++counts[owner[k]];
    }

    std::vector<bool> repaired(length, false);
    std::vector<std::size_t> candidates;
    candidates.reserve(length);

    for (std::size_t c = 0; c < CHAR_CLASS_COUNT; ++c) {
        if (!classes.contains(static_cast<CharClass>(c)) || counts[c] > 0) continue;

        candidates.clear();
        for (std::size_t i = 0; i < length; ++i) {
            if (!repaired[i] && counts[posClass[i]] >= 2) candidates.push_back(i);
        }
        // Non-empty whenever length >= |classes| (pigeonhole over present classes).
        if (candidates.empty()) {
            throw FramingError("encode: no position available for class repair");
        }

        std::size_t pos = candidates[cursor.uniform(candidates.size())];
        const std::string& sub = ALPHABETS[c];
        char ch = sub[cursor.uniform(sub.size())];

        --counts[posClass[pos]];
        out[pos] = ch;
        posClass[pos] = c;
        ++counts[c];
        repaired[pos] = true;
    }

    return out;
}
