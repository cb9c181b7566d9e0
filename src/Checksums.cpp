// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rdt/Checksums.hpp"

namespace rdt {

namespace {

const uint32_t CRC32_POLY_REFLECTED = 0xEDB88320;

}

uint32_t crc32_le(uint32_t crc, const void *buf_, size_t len)
{
	const uint8_t *buf = (const uint8_t *)buf_;

	while(len--)
	{
		crc ^= *buf++;
		for(int bit = 0; bit < 8; bit++)
			crc = (crc >> 1) ^ ((crc & 1) ? CRC32_POLY_REFLECTED : 0);
	}

	return crc;
}

uint32_t crc32_le(const void *buf, size_t len)
{
	return crc32_le(0xFFFFFFFF, buf, len);
}

uint32_t crc32(const void *buf, size_t len)
{
	return ~crc32_le(buf, len);
}

} // namespace rdt
