#pragma once
#include "PasswordDeriver.hpp"
#include "Profile.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct Installation;

// Setup   : no installation yet, the next step creates salt + verifier.
// Locked  : installation exists, secret not held.
// Unlocked: secret verified and held by an UnlockedSession.
enum class SessionState {
    Setup,
    Locked,
    Unlocked
};

SessionState initialState(const std::optional<Installation>& installation);

// The verified master secret, held by the caller for as long as it wants to
// derive passwords. Move-only; the secret is wiped on lock(), when moved
// from and on destruction. Obtained from AuthManager::unlock().
class UnlockedSession {
public:
    using Clock = std::chrono::steady_clock;

    UnlockedSession(std::string secret,
                    std::vector<std::uint8_t> salt,
                    Clock::time_point now = Clock::now());
    ~UnlockedSession();

    UnlockedSession(UnlockedSession&& other) noexcept;
    UnlockedSession& operator=(UnlockedSession&& other) noexcept;
    UnlockedSession(const UnlockedSession&) = delete;
    UnlockedSession& operator=(const UnlockedSession&) = delete;

    // Throw AuthError(Locked) once the session has been locked.
    std::string derivePassword(const Profile& profile) const;
    std::string deriveRawKey(const Profile& profile, KeySize size) const;

    // Record user activity for the idle auto-lock.
    void touch(Clock::time_point now = Clock::now());
    bool idleExpired(Clock::time_point now, std::chrono::seconds timeout) const;
    // Time left before idleExpired() turns true, zero once expired.
    // Timeouts too large for milliseconds saturate to milliseconds::max().
    std::chrono::milliseconds idleRemaining(Clock::time_point now, std::chrono::seconds timeout) const;

    void lock() noexcept;
    bool locked() const { return m_locked; }
    SessionState state() const { return m_locked ? SessionState::Locked : SessionState::Unlocked; }

private:
    void requireUnlocked() const;

    std::string m_secret;
    std::vector<std::uint8_t> m_salt;
    Clock::time_point m_lastActivity;
    bool m_locked = false;
};
