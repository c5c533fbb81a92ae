// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace monocurve {

/// CRC64-ECMA-182 (reflected polynomial 0xC96C5795D7870F42, init 0, no final XOR)
///
/// Used to detect corruption of persisted coefficient vectors.
[[nodiscard]] uint64_t crc64(std::span<const uint8_t> bytes) noexcept;

/// CRC64 over the in-memory representation of a double array
[[nodiscard]] uint64_t crc64(std::span<const double> values) noexcept;

}  // namespace monocurve
