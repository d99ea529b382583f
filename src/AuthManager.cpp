#include "AuthManager.hpp"
#include "RandomSource.hpp"
#include "Session.hpp"
#include "errors.hpp"
#include "secure_wipe.hpp"

#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {
    const char VERIFIER_TAG[] = "s2k.verifier.v1";
}

Installation AuthManager::createInstallation(const std::string& secret) const {
    Installation inst;
    inst.salt = m_rng.bytes(SALT_LEN);
    inst.verifier = makeVerifier(secret, inst.salt);
    inst.algorithm = CURRENT_ALGORITHM;
    return inst;
}

UnlockedSession AuthManager::unlock(std::string secret, const Installation& installation) const {
    if (!checkVerifier(secret, installation.salt, installation.verifier)) {
        secure_wipe(secret);
        throw AuthError(AuthError::Kind::SecretMismatch, "master secret does not match");
    }
    return UnlockedSession(std::move(secret), installation.salt);
}

std::vector<std::uint8_t> AuthManager::makeVerifier(const std::string& secret,
                                                    const std::vector<std::uint8_t>& salt) {
    EVP_MD_CTX* raw = EVP_MD_CTX_new();
    if (!raw) throw std::runtime_error("EVP_MD_CTX_new failed");
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(raw, &EVP_MD_CTX_free);

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("DigestInit sha256 failed");
    if (EVP_DigestUpdate(ctx.get(), secret.data(), secret.size()) != 1)
        throw std::runtime_error("DigestUpdate secret failed");
    if (EVP_DigestUpdate(ctx.get(), salt.data(), salt.size()) != 1)
        throw std::runtime_error("DigestUpdate salt failed");
    if (EVP_DigestUpdate(ctx.get(), VERIFIER_TAG, sizeof(VERIFIER_TAG) - 1) != 1)
        throw std::runtime_error("DigestUpdate tag failed");

    std::vector<std::uint8_t> out(VERIFIER_LEN);
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &outLen) != 1 || outLen != VERIFIER_LEN)
        throw std::runtime_error("DigestFinal sha256 failed");
    return out;
}

bool AuthManager::checkVerifier(const std::string& secret,
                                const std::vector<std::uint8_t>& salt,
                                const std::vector<std::uint8_t>& stored) {
    if (stored.size() != VERIFIER_LEN) {
        return false;
    }
    return constTimeEqual(makeVerifier(secret, salt), stored);
}

bool AuthManager::constTimeEqual(const std::vector<std::uint8_t>& a,
                                 const std::vector<std::uint8_t>& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}
