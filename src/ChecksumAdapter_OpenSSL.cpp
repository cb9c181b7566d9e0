// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <cstring>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "../include/rdt/ChecksumAdapter_OpenSSL.hpp"

namespace rdt {

Sha256ChecksumAdapter_OpenSSL::Sha256ChecksumAdapter_OpenSSL(size_t digestLength) :
	m_digestLength(digestLength)
{
	if(m_digestLength < MIN_DIGEST_LENGTH)
		m_digestLength = MIN_DIGEST_LENGTH;
	if(m_digestLength > SHA256_LENGTH)
		m_digestLength = SHA256_LENGTH;
}

void Sha256ChecksumAdapter_OpenSSL::setKey(const std::vector<uint8_t> &key)
{
	m_key = key;
}

bool Sha256ChecksumAdapter_OpenSSL::isKeyed() const
{
	return not m_key.empty();
}

size_t Sha256ChecksumAdapter_OpenSSL::getDigestLength() const
{
	return m_digestLength;
}

bool Sha256ChecksumAdapter_OpenSSL::digest(uint8_t *dst, const uint8_t *msg, size_t len) const
{
	uint8_t md[EVP_MAX_MD_SIZE];
	unsigned int mdLen = 0;
	bool ok;

	if(isKeyed())
		ok = nullptr != HMAC(EVP_sha256(), m_key.data(), (int)m_key.size(), msg, len, md, &mdLen);
	else
	{
		EVP_MD_CTX *ctx = EVP_MD_CTX_new();
		ok = ctx
		 and EVP_DigestInit_ex(ctx, EVP_sha256(), NULL)
		 and EVP_DigestUpdate(ctx, msg, len)
		 and EVP_DigestFinal_ex(ctx, md, &mdLen);
		EVP_MD_CTX_free(ctx);
	}

	if((not ok) or (mdLen < m_digestLength))
		return false;

	memcpy(dst, md, m_digestLength);
	return true;
}

} // namespace rdt
