#include "PasswordDeriver.hpp"
#include "AlphabetEncoder.hpp"
#include "Framing.hpp"
#include "KeyDerivation.hpp"
#include "secure_wipe.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace {
    // Owns the intermediate buffers so they are wiped on every exit path.
    struct Scratch {
        std::vector<std::uint8_t> framed;
        std::vector<std::uint8_t> stretched;
        ~Scratch() {
            secure_wipe(framed);
            secure_wipe(stretched);
        }
    };

    std::string base64_encode(const std::vector<std::uint8_t>& data) {
        // EVP_EncodeBlock writes ceil(n/3)*4 chars + NUL
        std::vector<unsigned char> out((data.size() + 2) / 3 * 4 + 1);
        int len = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
        if (len < 0) throw std::runtime_error("EVP_EncodeBlock failed");
        return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
    }
}

std::string derivePassword(const std::string& secret,
                           const Profile& profile,
                           const std::vector<std::uint8_t>& salt) {
    Scratch s;
    s.framed = frame(secret, profile, FramePurpose::Password);

    const KdfParams params = kdfParamsFor(profile.version);
    s.stretched = deriveBytes(s.framed, salt, params.outputLen, params);

    return encode(s.stretched, profile.length, profile.classes);
}

std::string deriveRawKey(const std::string& secret,
                         const Profile& profile,
                         const std::vector<std::uint8_t>& salt,
                         KeySize size) {
    Scratch s;
    s.framed = frame(secret, profile, FramePurpose::RawKey);

    const KdfParams params = kdfParamsFor(profile.version);
    s.stretched = deriveBytes(s.framed, salt, static_cast<std::size_t>(size), params);

    return base64_encode(s.stretched);
}
