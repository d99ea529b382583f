#pragma once
#include "Profile.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Sub-alphabet for one class. Fixed for AlgorithmVersion::V1.
const std::string& classAlphabet(CharClass c);

// Union of the requested classes' alphabets, in CharClass order.
std::string fullAlphabet(CharClassSet classes);

// Reads a finite byte buffer as a stream of unbiased indices.
// Each draw rejects values outside the largest multiple of `bound` that
// fits the word (1 byte for bound <= 256, 2 bytes big-endian up to 65536),
// so every index in [0, bound) is equally likely.
class EntropyCursor {
public:
    explicit EntropyCursor(const std::vector<std::uint8_t>& buffer)
        : m_data(buffer.data()), m_size(buffer.size()) {}

    // Throws DerivationError(BufferExhausted) when the buffer runs dry
    // before a value is accepted.
    std::size_t uniform(std::size_t bound);

    std::size_t consumed() const { return m_pos; }
    std::size_t remaining() const { return m_size - m_pos; }

private:
    const std::uint8_t* m_data;
    std::size_t m_size;
    std::size_t m_pos = 0;
};

// Render `length` characters drawn from `classes`, with at least one
// character of every requested class.
//
//  1. Each position takes fullAlphabet[cursor.uniform(|full|)].
//  2. Repair, classes visited in CharClass order: for each class still
//     missing, the candidate positions are those not yet repaired whose
//     current class occurs at least twice (ascending index order). One is
//     picked with cursor.uniform(|candidates|) and overwritten with
//     classAlphabet(c)[cursor.uniform(|sub|)]. A replaced character never
//     removes the last occurrence of its class.
//
// Pure function of (buffer, length, classes). Throws FramingError for an
// unsatisfiable request and DerivationError(BufferExhausted) if the buffer
// is too short; never returns a partial string.
std::string encode(const std::vector<std::uint8_t>& buffer,
                   std::size_t length,
                   CharClassSet classes);
