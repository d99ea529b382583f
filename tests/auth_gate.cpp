// tests/auth_gate.cpp
#include <catch2/catch_all.hpp>
#include "AuthManager.hpp"
#include "Session.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <iomanip>
#include <sstream>

static std::string toHex(const std::vector<std::uint8_t>& v) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : v) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
}

TEST_CASE("Verifier: pinned SHA-256 construction", "[auth]") {
    auto v = AuthManager::makeVerifier("correct horse battery staple", zeroSalt());
    REQUIRE(v.size() == AuthManager::VERIFIER_LEN);
    REQUIRE(toHex(v) == "95504510b9645c70ce56888d10dcf56dd50ae34a6ff9738ff7bfd333ff03231b");
}

TEST_CASE("Verifier: accepts the secret, rejects anything else", "[auth]") {
    const auto salt = zeroSalt();
    const auto v = AuthManager::makeVerifier("correct horse battery staple", salt);

    REQUIRE(AuthManager::checkVerifier("correct horse battery staple", salt, v));
    REQUIRE_FALSE(AuthManager::checkVerifier("Tr0ub4dor&3", salt, v));
    REQUIRE_FALSE(AuthManager::checkVerifier("correct horse battery staplf", salt, v));
    REQUIRE_FALSE(AuthManager::checkVerifier("", salt, v));

    auto otherSalt = salt;
    otherSalt[5] = 1;
    REQUIRE_FALSE(AuthManager::checkVerifier("correct horse battery staple", otherSalt, v));

    auto truncated = v;
    truncated.pop_back();
    REQUIRE_FALSE(AuthManager::checkVerifier("correct horse battery staple", salt, truncated));
}

TEST_CASE("AuthManager: installation uses the injected random source", "[auth]") {
    CountingRandomSource rng(0x10);
    AuthManager auth(rng);
    Installation inst = auth.createInstallation("correct horse battery staple");

    REQUIRE(rng.calls() == 1);
    REQUIRE(inst.salt.size() == AuthManager::SALT_LEN);
    REQUIRE(inst.salt.front() == 0x10);
    REQUIRE(inst.salt.back() == 0x10 + 31);
    REQUIRE(inst.algorithm == CURRENT_ALGORITHM);
    REQUIRE(inst.verifier == AuthManager::makeVerifier("correct horse battery staple", inst.salt));

    // A second installation gets a different salt
    Installation other = auth.createInstallation("correct horse battery staple");
    REQUIRE(other.salt != inst.salt);
    REQUIRE(other.verifier != inst.verifier);
}

TEST_CASE("AuthManager: unlock gate", "[auth]") {
    CountingRandomSource rng;
    AuthManager auth(rng);
    Installation inst = auth.createInstallation("correct horse battery staple");

    SECTION("Correct secret unlocks") {
        UnlockedSession s = auth.unlock("correct horse battery staple", inst);
        REQUIRE(s.state() == SessionState::Unlocked);
    }
    SECTION("Wrong secret fails with SecretMismatch") {
        try {
            auth.unlock("Tr0ub4dor&3", inst);
            FAIL("expected AuthError");
        } catch (const AuthError& ex) {
            REQUIRE(ex.kind() == AuthError::Kind::SecretMismatch);
        }
    }
    SECTION("Real OS random source") {
        OpenSslRandomSource osRng;
        AuthManager real(osRng);
        Installation a = real.createInstallation("pw");
        Installation b = real.createInstallation("pw");
        REQUIRE(a.salt.size() == AuthManager::SALT_LEN);
        REQUIRE(a.salt != b.salt);
        REQUIRE_NOTHROW(real.unlock("pw", a));
    }
}
