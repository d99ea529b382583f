#pragma once
#include "Profile.hpp"

#include <vector>
#include <string>
#include <cstdint>

class RandomSource;
class UnlockedSession;

// Per-installation record, created once at first setup.
struct Installation {
    std::vector<std::uint8_t> salt;     // 32 random bytes, never derived from user input
    std::vector<std::uint8_t> verifier; // SHA-256(secret || salt || "s2k.verifier.v1")
    AlgorithmVersion algorithm = CURRENT_ALGORITHM;
};

class AuthManager {
public:
    explicit AuthManager(RandomSource& rng) : m_rng(rng) {}

    // First run: fresh salt from the injected source + verifier for `secret`.
    Installation createInstallation(const std::string& secret) const;

    // Checks `secret` against the installation's verifier and hands back the
    // unlocked session holding it. Throws AuthError(SecretMismatch).
    UnlockedSession unlock(std::string secret, const Installation& installation) const;

    // Plain SHA-256, not memory-hard: this runs on every unlock attempt.
    static std::vector<std::uint8_t> makeVerifier(const std::string& secret,
                                                  const std::vector<std::uint8_t>& salt);

    // Recompute and compare in constant time. Wrong-sized input is a mismatch.
    static bool checkVerifier(const std::string& secret,
                              const std::vector<std::uint8_t>& salt,
                              const std::vector<std::uint8_t>& stored);

    static constexpr std::size_t SALT_LEN     = 32;
    static constexpr std::size_t VERIFIER_LEN = 32;

private:
    static bool constTimeEqual(const std::vector<std::uint8_t>& a,
                               const std::vector<std::uint8_t>& b);

    RandomSource& m_rng;
};
