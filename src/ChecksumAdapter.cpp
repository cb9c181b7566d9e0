// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "../include/rdt/ChecksumAdapter.hpp"
#include "../include/rdt/Checksums.hpp"
#include "../include/rdt/params.hpp"

namespace rdt {

bool IChecksumAdapter::verify(const uint8_t *expected, const uint8_t *msg, size_t len) const
{
	uint8_t computed[MAX_DIGEST_LENGTH];
	size_t digestLength = getDigestLength();
	uint8_t diff = 0;

	if((digestLength > sizeof(computed)) or not digest(computed, msg, len))
		return false;

	for(size_t x = 0; x < digestLength; x++)
		diff |= computed[x] ^ expected[x];

	return 0 == diff;
}

size_t Crc32ChecksumAdapter::getDigestLength() const
{
	return 4;
}

bool Crc32ChecksumAdapter::digest(uint8_t *dst, const uint8_t *msg, size_t len) const
{
	uint32_t crc = crc32(msg, len);

	dst[0] = (crc >> 24) & 0xff;
	dst[1] = (crc >> 16) & 0xff;
	dst[2] = (crc >>  8) & 0xff;
	dst[3] = (crc      ) & 0xff;

	return true;
}

} // namespace rdt
