#include <catch2/catch_all.hpp>
#include "KeyDerivation.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <argon2.h>

namespace {
    // Small enough to keep the tests quick
    const KdfParams FAST{ 1, 64, 1, 64 };

    std::vector<std::uint8_t> bytes(const std::string& s) {
        return std::vector<std::uint8_t>(s.begin(), s.end());
    }
}

TEST_CASE("KDF: v1 parameters are pinned", "[kdf]") {
    KdfParams p = kdfParamsFor(AlgorithmVersion::V1);
    REQUIRE(p.tCost == 2);
    REQUIRE(p.mCostKiB == 19456);
    REQUIRE(p.parallelism == 1);
    REQUIRE(p.outputLen == 512);
}

TEST_CASE("KDF: deterministic, salt- and input-sensitive", "[kdf]") {
    auto salt = zeroSalt();
    auto a = deriveBytes(bytes("framed"), salt, 64, FAST);
    REQUIRE(a.size() == 64);
    REQUIRE(a == deriveBytes(bytes("framed"), salt, 64, FAST));
    REQUIRE(a != deriveBytes(bytes("framee"), salt, 64, FAST));

    salt[31] = 1;
    REQUIRE(a != deriveBytes(bytes("framed"), salt, 64, FAST));
}

TEST_CASE("KDF: parameter errors surface as ParameterInvalid", "[kdf]") {
    auto check = [](auto&& fn) {
        try {
            fn();
            FAIL("expected DerivationError");
        } catch (const DerivationError& ex) {
            REQUIRE(ex.kind() == DerivationError::Kind::ParameterInvalid);
        }
    };

    SECTION("memory cost below the primitive's minimum") {
        check([] { deriveBytes(bytes("x"), zeroSalt(), 32, KdfParams{ 1, 1, 1, 32 }); });
    }
    SECTION("zero iterations") {
        check([] { deriveBytes(bytes("x"), zeroSalt(), 32, KdfParams{ 0, 64, 1, 32 }); });
    }
    SECTION("salt shorter than 8 bytes") {
        check([] { deriveBytes(bytes("x"), std::vector<std::uint8_t>(4, 0), 32, FAST); });
    }
    SECTION("output shorter than the minimum") {
        check([] { deriveBytes(bytes("x"), zeroSalt(), 3, FAST); });
    }
    SECTION("output longer than the maximum") {
        const std::size_t tooLong = static_cast<std::size_t>(ARGON2_MAX_OUTLEN) + 1;
        check([&] { deriveBytes(bytes("x"), zeroSalt(), tooLong, FAST); });
    }
}
