#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

// Source of salt bytes. Passed in explicitly so tests can substitute a
// deterministic source.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Fill [out, out+len) with random bytes or throw std::runtime_error.
    virtual void fill(std::uint8_t* out, std::size_t len) = 0;

    std::vector<std::uint8_t> bytes(std::size_t len) {
        std::vector<std::uint8_t> v(len);
        if (len > 0) fill(v.data(), v.size());
        return v;
    }
};

// OS CSPRNG through OpenSSL.
class OpenSslRandomSource : public RandomSource {
public:
    void fill(std::uint8_t* out, std::size_t len) override;
};
