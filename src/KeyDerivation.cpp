#include "KeyDerivation.hpp"
#include "errors.hpp"

#include <argon2.h>
#include <string>

KdfParams kdfParamsFor(AlgorithmVersion version) {
    switch (version) {
    case AlgorithmVersion::V1:
        return KdfParams{ 2, 19 * 1024, 1, 512 };
    }
    throw DerivationError(DerivationError::Kind::ParameterInvalid,
                          "kdfParamsFor: unknown algorithm version "
                          + std::to_string(static_cast<unsigned>(version)));
}

std::vector<std::uint8_t> deriveBytes(const std::vector<std::uint8_t>& framed,
                                      const std::vector<std::uint8_t>& salt,
                                      std::size_t outputLen,
                                      const KdfParams& params) {
    // Checked before allocating: the buffer would be enormous otherwise.
    if (outputLen > ARGON2_MAX_OUTLEN) {
        throw DerivationError(DerivationError::Kind::ParameterInvalid,
                              "deriveBytes: output length " + std::to_string(outputLen)
                              + " exceeds the Argon2 maximum");
    }

    std::vector<std::uint8_t> out(outputLen);
    int rc = argon2_hash(
        params.tCost,
        params.mCostKiB,
        params.parallelism,
        framed.data(), framed.size(),
        salt.data(), salt.size(),
        out.data(), out.size(),
        nullptr, 0,          // no encoded (PHC) string
        Argon2_id,
        ARGON2_VERSION_13    // pinned, independent of the library default
    );
    if (rc != ARGON2_OK) {
        throw DerivationError(DerivationError::Kind::ParameterInvalid,
                              std::string("argon2_hash failed: ") + argon2_error_message(rc));
    }
    return out;
}
