#include "Session.hpp"
#include "AuthManager.hpp"
#include "errors.hpp"
#include "secure_wipe.hpp"

#include <utility>

SessionState initialState(const std::optional<Installation>& installation) {
    return installation.has_value() ? SessionState::Locked : SessionState::Setup;
}

UnlockedSession::UnlockedSession(std::string secret,
                                 std::vector<std::uint8_t> salt,
                                 Clock::time_point now)
    : m_secret(std::move(secret)), m_salt(std::move(salt)), m_lastActivity(now)
{
}

UnlockedSession::~UnlockedSession() {
    lock();
}

UnlockedSession::UnlockedSession(UnlockedSession&& other) noexcept
    : m_secret(std::move(other.m_secret)),
      m_salt(std::move(other.m_salt)),
      m_lastActivity(other.m_lastActivity),
      m_locked(other.m_locked)
{
    other.lock();
}

UnlockedSession& UnlockedSession::operator=(UnlockedSession&& other) noexcept {
    if (this != &other) {
        lock();
        m_secret = std::move(other.m_secret);
        m_salt = std::move(other.m_salt);
        m_lastActivity = other.m_lastActivity;
        m_locked = other.m_locked;
        other.lock();
    }
    return *this;
}

std::string UnlockedSession::derivePassword(const Profile& profile) const {
    requireUnlocked();
    return ::derivePassword(m_secret, profile, m_salt);
}

std::string UnlockedSession::deriveRawKey(const Profile& profile, KeySize size) const {
    requireUnlocked();
    return ::deriveRawKey(m_secret, profile, m_salt, size);
}

void UnlockedSession::touch(Clock::time_point now) {
    m_lastActivity = now;
}

bool UnlockedSession::idleExpired(Clock::time_point now, std::chrono::seconds timeout) const {
    return idleRemaining(now, timeout) == std::chrono::milliseconds::zero();
}

std::chrono::milliseconds UnlockedSession::idleRemaining(Clock::time_point now,
                                                         std::chrono::seconds timeout) const {
    using std::chrono::milliseconds;

    // seconds -> milliseconds multiplies by 1000; stay clear of overflow
    if (timeout >= std::chrono::duration_cast<std::chrono::seconds>(milliseconds::max())) {
        return milliseconds::max();
    }
    const milliseconds budget = timeout;
    const milliseconds elapsed = std::chrono::duration_cast<milliseconds>(now - m_lastActivity);
    if (elapsed >= budget) return milliseconds::zero();
    return budget - elapsed;
}

void UnlockedSession::lock() noexcept {
    secure_wipe(m_secret);
    m_locked = true;
}

void UnlockedSession::requireUnlocked() const {
    if (m_locked) {
        throw AuthError(AuthError::Kind::Locked, "session is locked");
    }
}
