// SPDX-License-Identifier: MIT
#include "monocurve/support/checksum.hpp"

#include <array>

namespace monocurve {

namespace {

constexpr uint64_t kPolyReflected = 0xC96C5795D7870F42ULL;

constexpr std::array<uint64_t, 256> make_table() {
    std::array<uint64_t, 256> table{};
    for (uint64_t i = 0; i < 256; ++i) {
        uint64_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ kPolyReflected : (crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

constexpr std::array<uint64_t, 256> kTable = make_table();

}  // namespace

uint64_t crc64(std::span<const uint8_t> bytes) noexcept {
    uint64_t crc = 0;
    for (uint8_t b : bytes) {
        crc = (crc >> 8) ^ kTable[static_cast<uint8_t>(crc ^ b)];
    }
    return crc;
}

uint64_t crc64(std::span<const double> values) noexcept {
    auto bytes = std::as_bytes(values);
    return crc64(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

}  // namespace monocurve
