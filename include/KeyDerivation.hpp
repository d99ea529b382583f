#pragma once
#include "Profile.hpp"

#include <cstdint>
#include <vector>

// Argon2id cost parameters. These are pinned per AlgorithmVersion and never
// taken from library defaults.
struct KdfParams {
    std::uint32_t tCost;       // iterations
    std::uint32_t mCostKiB;    // memory in KiB
    std::uint32_t parallelism; // lanes
    std::size_t   outputLen;   // bytes handed to the alphabet encoder
};

// V1: Argon2id v0x13, t=2, m=19 MiB, p=1, 512 bytes of output.
// 512 bytes covers a 64-character password plus class repair with a huge
// margin even at the worst rejection rate (86-symbol alphabet, ~33% rejects).
KdfParams kdfParamsFor(AlgorithmVersion version);

// Stretch the framed input with Argon2id and the installation salt.
// Pure: no I/O, no shared state, safe to call concurrently.
//
// Throws DerivationError(ParameterInvalid) when outputLen exceeds the
// primitive's maximum or libargon2 rejects a parameter (memory cost,
// salt length, output length, ...).
std::vector<std::uint8_t> deriveBytes(const std::vector<std::uint8_t>& framed,
                                      const std::vector<std::uint8_t>& salt,
                                      std::size_t outputLen,
                                      const KdfParams& params);
