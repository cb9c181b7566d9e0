#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace rdt {

// Variable Length Unsigned integer: big-endian groups of 7 bits, the high bit
// of each byte set if another byte follows.
class VLU {
public:
	static const size_t MAX_VLU_SIZE = ((sizeof(uintmax_t) * 8) + 6) / 7;

	static size_t size(uintmax_t val);
	static size_t encode(uintmax_t val, void *dst); // dst may be null to just measure
	static void   append(uintmax_t val, std::vector<uint8_t> &dst);

	// Answer the number of bytes consumed, or 0 if the VLU runs past limit or
	// doesn't fit in a uintmax_t.
	static size_t parse(const uint8_t *src, const uint8_t *limit, uintmax_t *val);
};

} // namespace rdt
