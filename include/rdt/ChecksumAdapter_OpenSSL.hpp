#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

// This module provides SHA-256 based integrity digests using OpenSSL.

#include <vector>

#include "ChecksumAdapter.hpp"

namespace rdt {

// SHA-256 of the packet, or HMAC-SHA256 if a key is set, truncated to
// digestLength bytes (4 to 32).
class Sha256ChecksumAdapter_OpenSSL : public IChecksumAdapter {
public:
	Sha256ChecksumAdapter_OpenSSL(size_t digestLength = 8);

	// Use HMAC-SHA256 with key. An empty key switches back to plain SHA-256.
	void setKey(const std::vector<uint8_t> &key);
	bool isKeyed() const;

	size_t getDigestLength() const override;
	bool digest(uint8_t *dst, const uint8_t *msg, size_t len) const override;

	static const size_t MIN_DIGEST_LENGTH = 4;
	static const size_t SHA256_LENGTH = 32;

protected:
	size_t m_digestLength;
	std::vector<uint8_t> m_key;
};

} // namespace rdt
