#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdio>
#include <string>
#include <vector>

namespace rdt {

class Hex {
public:
	// hexdump -C style listing to out.
	static void print(FILE *out, const char *msg, const void *bytes, size_t len);
	static void print(FILE *out, const char *msg, const std::vector<uint8_t> &bytes);

	static std::string encode(const void *bytes, size_t len);
	static std::string encode(const std::vector<uint8_t> &bytes);

	// Append the bytes of hex to dst. Whitespace between byte pairs is skipped.
	// On error answer false and leave dst as it was.
	static bool decode(const char *hex, std::vector<uint8_t> &dst);

	static int decodeDigit(char d); // answer 0-15 or -1 if not a hex digit
};

} // namespace rdt
