#pragma once
#include "Profile.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class KeySize {
    Bits256 = 32,
    Bits512 = 64
};

// frame -> Argon2id (one call) -> encode. Deterministic in all three
// inputs, no shared state, safe to run concurrently for different profiles.
// Throws FramingError, DerivationError.
std::string derivePassword(const std::string& secret,
                           const Profile& profile,
                           const std::vector<std::uint8_t>& salt);

// Base64 of a 32 or 64 byte Argon2id output for the same profile. Framed
// with FramePurpose::RawKey, so it is unrelated to the profile's password.
std::string deriveRawKey(const std::string& secret,
                         const Profile& profile,
                         const std::vector<std::uint8_t>& salt,
                         KeySize size);
