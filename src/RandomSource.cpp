#include "RandomSource.hpp"

#include <openssl/rand.h>   // RAND_bytes
#include <limits>
#include <stdexcept>

void OpenSslRandomSource::fill(std::uint8_t* out, std::size_t len) {
    // RAND_bytes takes an int length
    while (len > 0) {
        int chunk = len > static_cast<std::size_t>(std::numeric_limits<int>::max())
                        ? std::numeric_limits<int>::max()
                        : static_cast<int>(len);
        if (RAND_bytes(out, chunk) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        out += chunk;
        len -= static_cast<std::size_t>(chunk);
    }
}
