// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstring>

#include "../include/rdt/VLU.hpp"

namespace rdt {

size_t VLU::size(uintmax_t val)
{
	size_t rv = 1;
	while(val >>= 7)
		rv++;
	return rv;
}

size_t VLU::encode(uintmax_t val, void *dst)
{
	uint8_t buf[MAX_VLU_SIZE];
	int i = sizeof(buf);
	size_t rv = 0;

	do
	{
		i--;
		buf[i] = (uint8_t)(val & 0x7f) | (rv ? 0x80 : 0);
		rv++;
		val >>= 7;
	} while(val);

	if(dst)
		memmove(dst, buf + i, rv);

	return rv;
}

void VLU::append(uintmax_t val, std::vector<uint8_t> &dst)
{
	uint8_t buf[MAX_VLU_SIZE];
	size_t rv = encode(val, buf);
	dst.insert(dst.end(), buf, buf + rv);
}

size_t VLU::parse(const uint8_t *src, const uint8_t *limit, uintmax_t *val)
{
	const uintmax_t MAX_BEFORE_OVERFLOW = UINTMAX_MAX >> 7;
	uintmax_t value = 0;
	size_t rv = 0;

	while(src < limit)
	{
		if(value > MAX_BEFORE_OVERFLOW)
			return 0;

		value = (value << 7) + (*src & 0x7f);
		rv++;

		if(not (*src & 0x80))
		{
			if(val)
				*val = value;
			return rv;
		}

		src++;
	}

	return 0; // ran off the end
}

} // namespace rdt
