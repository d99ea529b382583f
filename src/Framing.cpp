#include "Framing.hpp"
#include "errors.hpp"

#include <limits>

namespace {
    const char FRAME_TAG[] = "s2k.frame.v1";

    void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
        out.push_back(static_cast<std::uint8_t>(v >> 8));
        out.push_back(static_cast<std::uint8_t>(v));
    }

    void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
        out.push_back(static_cast<std::uint8_t>(v >> 24));
        out.push_back(static_cast<std::uint8_t>(v >> 16));
        out.push_back(static_cast<std::uint8_t>(v >> 8));
        out.push_back(static_cast<std::uint8_t>(v));
    }

    void check_field(const std::string& field, const char* name) {
        if (field.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw FramingError(std::string("frame: ") + name + " is too long");
        }
    }

    // Length-prefixed field; the prefix is what keeps ("ab", 1) and ("a", "b1") apart.
    void put_field(std::vector<std::uint8_t>& out, const std::string& field) {
        put_u32(out, static_cast<std::uint32_t>(field.size()));
        out.insert(out.end(), field.begin(), field.end());
    }
}

std::vector<std::uint8_t> frame(const std::string& secret,
                                const Profile& profile,
                                FramePurpose purpose) {
    validateProfile(profile);
    check_field(secret, "secret");
    check_field(profile.siteLabel, "site label");

    std::vector<std::uint8_t> out;
    out.reserve(sizeof(FRAME_TAG) - 1 + 2 + 4 + secret.size() + 4 + profile.siteLabel.size() + 4 + 1 + 2);

    out.insert(out.end(), FRAME_TAG, FRAME_TAG + sizeof(FRAME_TAG) - 1);
    out.push_back(static_cast<std::uint8_t>(purpose));
    out.push_back(static_cast<std::uint8_t>(profile.version));
    put_field(out, secret);
    put_field(out, profile.siteLabel);
    put_u32(out, profile.counter);
    out.push_back(profile.classes.mask());
    put_u16(out, static_cast<std::uint16_t>(profile.length)); // <= MAX_LENGTH after validation
    return out;
}
