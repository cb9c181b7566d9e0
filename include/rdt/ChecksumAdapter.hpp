#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

// Integrity digests for the packet codec. Both ends of a session must use the
// same adapter with the same parameters.

#include <cstddef>
#include <cstdint>

namespace rdt {

class IChecksumAdapter {
public:
	virtual ~IChecksumAdapter() {}

	// Answer the fixed length of every digest this adapter produces.
	virtual size_t getDigestLength() const = 0;

	// Compute the digest of msg into dst, which has room for getDigestLength() bytes.
	// Answer false if the digest couldn't be computed.
	virtual bool digest(uint8_t *dst, const uint8_t *msg, size_t len) const = 0;

	// Compare in time independent of where the first difference is.
	bool verify(const uint8_t *expected, const uint8_t *msg, size_t len) const;
};

// CRC-32 (IEEE 802.3) in network byte order. Detects every single-bit error
// and every burst error up to 32 bits.
class Crc32ChecksumAdapter : public IChecksumAdapter {
public:
	size_t getDigestLength() const override;
	bool digest(uint8_t *dst, const uint8_t *msg, size_t len) const override;
};

} // namespace rdt
