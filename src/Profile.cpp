#include "Profile.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <string>

namespace {
    const char CLASS_LETTERS[CHAR_CLASS_COUNT] = { 'l', 'u', 'd', 's' };
}

std::size_t CharClassSet::size() const {
    std::size_t n = 0;
    for (std::size_t i = 0; i < CHAR_CLASS_COUNT; ++i) {
        if (contains(static_cast<CharClass>(i))) ++n;
    }
    return n;
}

std::string CharClassSet::toString() const {
    std::string out;
    for (std::size_t i = 0; i < CHAR_CLASS_COUNT; ++i) {
        if (contains(static_cast<CharClass>(i))) out.push_back(CLASS_LETTERS[i]);
    }
    return out;
}

CharClassSet CharClassSet::parse(const std::string& spec) {
    CharClassSet set;
    for (char ch : spec) {
        bool matched = false;
        for (std::size_t i = 0; i < CHAR_CLASS_COUNT; ++i) {
            if (ch == CLASS_LETTERS[i]) {
                set.insert(static_cast<CharClass>(i));
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw FramingError(std::string("unknown character class '") + ch + "' (use l, u, d, s)");
        }
    }
    if (set.empty()) {
        throw FramingError("at least one character class is required");
    }
    return set;
}

std::uint32_t parseLength(const std::string& text) {
    // stoul would skip leading blanks, accept a sign and stop at trailing junk
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw FramingError("length must be a decimal number, got '" + text + "'");
    }
    unsigned long v = 0;
    try {
        v = std::stoul(text);
    } catch (const std::out_of_range&) {
        v = Profile::MAX_LENGTH + 1ul;
    }
    if (v < Profile::MIN_LENGTH || v > Profile::MAX_LENGTH) {
        throw FramingError("length must be in [" + std::to_string(Profile::MIN_LENGTH)
                           + ", " + std::to_string(Profile::MAX_LENGTH) + "]");
    }
    return static_cast<std::uint32_t>(v);
}

bool isKnownAlgorithm(AlgorithmVersion v) {
    return v == AlgorithmVersion::V1;
}

void validateProfile(const Profile& profile) {
    if (profile.siteLabel.empty()) {
        throw FramingError("profile: site label must not be empty");
    }
    if (!profile.classes.wellFormed() || profile.classes.empty()) {
        throw FramingError("profile: character classes must be a non-empty subset of l,u,d,s");
    }
    if (profile.length < Profile::MIN_LENGTH || profile.length > Profile::MAX_LENGTH) {
        throw FramingError("profile: length must be in [" + std::to_string(Profile::MIN_LENGTH)
                           + ", " + std::to_string(Profile::MAX_LENGTH) + "]");
    }
    if (profile.length < profile.classes.size()) {
        throw FramingError("profile: length is shorter than the number of required classes");
    }
    if (!isKnownAlgorithm(profile.version)) {
        throw FramingError("profile: unknown algorithm version "
                           + std::to_string(static_cast<unsigned>(profile.version)));
    }
}
