#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstddef>
#include <cstdint>

namespace rdt {

// incremental CRC-32, answer current state of shift register. final answer is typically inverted.

uint32_t crc32_le(uint32_t crc, const void *buf, size_t len); // little-endian (reflected, IEEE 802.3)
uint32_t crc32_le(const void *buf, size_t len); // little-endian, initialize register with 0xFFFFFFFF

// The common finished CRC-32 (zlib, PNG, Ethernet): ~crc32_le(buf, len).
uint32_t crc32(const void *buf, size_t len);

} // namespace rdt
