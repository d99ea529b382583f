#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <openssl/crypto.h>

// Zero secret material in place (OPENSSL_cleanse is not optimised away),
// then drop the contents.
// Strings are wiped over their whole capacity: a moved-from or shrunk
// string can still hold old bytes in its (small-string) buffer.
inline void secure_wipe(std::string& s) noexcept {
    s.resize(s.capacity());
    if (!s.empty()) {
        OPENSSL_cleanse(&s[0], s.size());
    }
    s.clear();
}

inline void secure_wipe(std::vector<std::uint8_t>& v) noexcept {
    if (!v.empty()) {
        OPENSSL_cleanse(v.data(), v.size());
    }
    v.clear();
}
