#include "Checksum.hpp"
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

static_assert(Checksum::SIZE >= crypto_generichash_BYTES_MIN &&
    Checksum::SIZE <= crypto_generichash_BYTES_MAX, "checksum size outside BLAKE2b range");

Checksum Checksum::compute(const std::uint8_t* data, std::size_t len) {
    // sodium_init() is idempotent: 0 on first call, 1 afterwards
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed");
        throw std::runtime_error("sodium_init failed");
    }

    Checksum sum;
    if (crypto_generichash(sum.bytes.data(), sum.bytes.size(),
        data, static_cast<unsigned long long>(len),
        nullptr, 0) != 0)
    {
        spdlog::error("crypto_generichash failed over {} byte(s)", len);
        throw std::runtime_error("crypto_generichash failed");
    }
    return sum;
}

Checksum Checksum::compute(const std::vector<std::uint8_t>& data) {
    return compute(data.data(), data.size());
}

std::string Checksum::toHex() const {
    char hex[2 * SIZE + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes.data(), bytes.size());
    return std::string(hex);
}
