#pragma once
#include <stdexcept>
#include <string>

// Malformed Profile (empty classes, length out of range, length < |classes|).
// Always a caller bug; raised before any hashing happens.
class FramingError : public std::invalid_argument {
public:
    explicit FramingError(const std::string& what) : std::invalid_argument(what) {}
};

class DerivationError : public std::runtime_error {
public:
    enum class Kind {
        ParameterInvalid, // KDF rejected its cost / length parameters
        BufferExhausted   // encoder ran out of entropy bytes
    };

    DerivationError(Kind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};

class AuthError : public std::runtime_error {
public:
    enum class Kind {
        SecretMismatch, // verifier check failed
        Locked          // session was locked, secret already discarded
    };

    AuthError(Kind kind, const std::string& what)
        : std::runtime_error(what), m_kind(kind) {}

    Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};
