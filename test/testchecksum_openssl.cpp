#include <cassert>
#include <cstdio>
#include <cstring>

#include "rdt/ChecksumAdapter_OpenSSL.hpp"
#include "rdt/Hex.hpp"
#include "rdt/Packet.hpp"

using namespace rdt;

static Bytes hexBytes(const char *hex)
{
	Bytes rv;
	bool ok = Hex::decode(hex, rv);
	assert(ok);
	return rv;
}

static bool digestEquals(const IChecksumAdapter &adapter, const char *msg, const Bytes &expected)
{
	Bytes dst(adapter.getDigestLength());
	if(not adapter.digest(dst.data(), (const uint8_t *)msg, strlen(msg)))
		return false;
	printf("digest of '%s': %s\n", msg, Hex::encode(dst).c_str());
	return 0 == memcmp(dst.data(), expected.data(), dst.size());
}

int main(int argc, char *argv[])
{
	Bytes sha256_abc = hexBytes("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
	Bytes hmac_jefe = hexBytes("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"); // RFC 4231 test case 2

	Sha256ChecksumAdapter_OpenSSL full(32);
	assert(32 == full.getDigestLength());
	assert(not full.isKeyed());
	assert(digestEquals(full, "abc", sha256_abc));

	Sha256ChecksumAdapter_OpenSSL truncated; // 8 by default
	assert(8 == truncated.getDigestLength());
	assert(digestEquals(truncated, "abc", sha256_abc));

	assert(Sha256ChecksumAdapter_OpenSSL(1).getDigestLength() == Sha256ChecksumAdapter_OpenSSL::MIN_DIGEST_LENGTH);
	assert(Sha256ChecksumAdapter_OpenSSL(64).getDigestLength() == Sha256ChecksumAdapter_OpenSSL::SHA256_LENGTH);

	Sha256ChecksumAdapter_OpenSSL keyed(32);
	keyed.setKey(Bytes({ 'J', 'e', 'f', 'e' }));
	assert(keyed.isKeyed());
	assert(digestEquals(keyed, "what do ya want for nothing?", hmac_jefe));

	keyed.setKey(Bytes());
	assert(not keyed.isKeyed());
	assert(digestEquals(keyed, "abc", sha256_abc));

	// the codec with a keyed digest: a peer without the key can't forge or read as valid
	Sha256ChecksumAdapter_OpenSSL alice(16);
	Sha256ChecksumAdapter_OpenSSL bob(16);
	Sha256ChecksumAdapter_OpenSSL mallory(16);
	alice.setKey(Bytes({ 1, 2, 3, 4 }));
	bob.setKey(Bytes({ 1, 2, 3, 4 }));
	mallory.setKey(Bytes({ 4, 3, 2, 1 }));

	PacketCodec aliceCodec(&alice, 64);
	PacketCodec bobCodec(&bob, 64);
	PacketCodec malloryCodec(&mallory, 64);

	Packet packet = Packet::data(42, "secret", 6);
	Bytes encoded = aliceCodec.encode(packet);
	assert(not encoded.empty());

	Packet decoded;
	assert(DECODE_OK == bobCodec.decode(encoded, &decoded));
	assert(decoded == packet);
	assert(DECODE_BAD_CHECKSUM == malloryCodec.decode(encoded, &decoded));

	Bytes forged = malloryCodec.encode(packet);
	assert(DECODE_BAD_CHECKSUM == bobCodec.decode(forged, &decoded));

	for(size_t bit = 0; bit < encoded.size() * 8; bit++)
	{
		Bytes corrupt = encoded;
		corrupt[bit / 8] ^= 1 << (bit % 8);
		assert(DECODE_OK != bobCodec.decode(corrupt, &decoded));
	}

	return 0;
}
