// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cctype>
#include <cstdint>

#include "../include/rdt/Hex.hpp"

namespace rdt {

namespace {

const char hexDigits[] = "0123456789abcdef";

}

void Hex::print(FILE *out, const char *msg, const void *bytes_, size_t len)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;

	fprintf(out, "%s (%lu)\n", msg, (unsigned long)len);
	for(size_t x = 0; x < len; x += 16)
	{
		char printable[17] = { 0 };

		fprintf(out, "%08lx  ", (unsigned long)x);
		for(size_t y = 0; y < 16; y++)
		{
			if(x + y < len)
			{
				uint8_t b = bytes[x + y];
				fprintf(out, "%02x ", b);
				printable[y] = isprint(b) ? (char)b : '.';
			}
			else
				fprintf(out, "   ");
		}

		fprintf(out, " |%s|\n", printable);
	}
	fprintf(out, "%08lx\n", (unsigned long)len);
}

void Hex::print(FILE *out, const char *msg, const std::vector<uint8_t> &bytes)
{
	print(out, msg, bytes.data(), bytes.size());
}

std::string Hex::encode(const void *bytes_, size_t len)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;
	std::string rv;

	rv.reserve(len * 2);
	for(size_t x = 0; x < len; x++)
	{
		rv.push_back(hexDigits[bytes[x] >> 4]);
		rv.push_back(hexDigits[bytes[x] & 0x0f]);
	}

	return rv;
}

std::string Hex::encode(const std::vector<uint8_t> &bytes)
{
	return encode(bytes.data(), bytes.size());
}

int Hex::decodeDigit(char d)
{
	if((d >= '0') and (d <= '9'))
		return d - '0';
	if((d >= 'a') and (d <= 'f'))
		return d - 'a' + 0x0a;
	if((d >= 'A') and (d <= 'F'))
		return d - 'A' + 0x0a;
	return -1;
}

bool Hex::decode(const char *hex, std::vector<uint8_t> &dst)
{
	size_t originalSize = dst.size();
	int high = -1;
	char d;

	while((d = *hex++))
	{
		if(isspace((unsigned char)d))
		{
			if(high >= 0)
				goto fail; // split pair
			continue;
		}

		int digit = decodeDigit(d);
		if(digit < 0)
			goto fail;

		if(high < 0)
			high = digit;
		else
		{
			dst.push_back((uint8_t)((high << 4) + digit));
			high = -1;
		}
	}

	if(high < 0)
		return true;

fail:
	dst.resize(originalSize);
	return false;
}

} // namespace rdt
