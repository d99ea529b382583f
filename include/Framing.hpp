#pragma once
#include "Profile.hpp"

#include <string>
#include <vector>
#include <cstdint>

// What the framed bytes are going to be stretched into. Part of the
// framing so a raw key and a password never share a KDF input.
enum class FramePurpose : std::uint8_t {
    Password = 0x01,
    RawKey   = 0x02
};

// Canonical, injective encoding of (secret, profile) used as the KDF input.
//
// Layout (all integers big-endian):
//   "s2k.frame.v1"           12 bytes, fixed
//   purpose                  u8
//   algorithm version        u8
//   len(secret) | secret     u32 | bytes
//   len(site)   | site       u32 | bytes
//   counter                  u32
//   class mask               u8   (bit i = CharClass i)
//   length                   u16
//
// Validates the profile first and throws FramingError before producing
// anything. The result contains the secret: callers wipe it after use.
std::vector<std::uint8_t> frame(const std::string& secret,
                                const Profile& profile,
                                FramePurpose purpose = FramePurpose::Password);
