#include <cassert>
#include <cstdio>
#include <cstring>

#include "rdt/Hex.hpp"
#include "rdt/Packet.hpp"
#include "rdt/params.hpp"

using namespace rdt;

namespace {

// answers false for everything, like a crypto library that failed to initialize
class BrokenChecksumAdapter : public IChecksumAdapter {
public:
	size_t getDigestLength() const override { return 4; }
	bool digest(uint8_t *dst, const uint8_t *msg, size_t len) const override { return false; }
};

}

static void expectDecode(const PacketCodec &codec, const Bytes &bytes, DecodeResult expected, const char *what)
{
	Packet packet;
	DecodeResult result = codec.decode(bytes, &packet);
	printf("%s: %s\n", what, PacketCodec::describe(result));
	assert(expected == result);
}

int main(int argc, char *argv[])
{
	Crc32ChecksumAdapter crc;
	PacketCodec codec(&crc, 100);

	assert(100 == codec.getMaxPayloadLength());

	// data round trip
	Packet p1 = Packet::data(300, "hello", 5);
	Bytes checksum;
	Bytes e1 = codec.encode(p1, &checksum);
	Hex::print(stdout, "data 300 hello", e1);
	assert(e1.size() == codec.getEncodedLength(p1));
	assert(2 + 2 + 1 + 5 + 4 == e1.size());
	{
		uint8_t expected[] = { WIRE_VERSION, KIND_DATA, 0x82, 0x2c, 0x05, 'h', 'e', 'l', 'l', 'o' };
		assert(0 == memcmp(expected, e1.data(), sizeof(expected)));
	}
	assert(4 == checksum.size());
	assert(0 == memcmp(checksum.data(), e1.data() + e1.size() - 4, 4));

	Packet d1;
	assert(DECODE_OK == codec.decode(e1, &d1));
	assert(d1 == p1);
	assert(d1.isData());
	assert(d1.checksum == checksum);

	// deterministic
	assert(codec.encode(p1) == e1);

	// ack round trip
	Packet p2 = Packet::ack(1);
	Bytes e2 = codec.encode(p2);
	Hex::print(stdout, "ack 1", e2);
	assert(2 + 1 + 4 == e2.size());
	Packet d2;
	assert(DECODE_OK == codec.decode(e2, &d2));
	assert(d2.isAck());
	assert(1 == d2.id);
	assert(d2.payload.empty());
	assert(d2 == p2);
	assert(d2 != d1);

	// empty data payload is still a data packet
	Packet p3 = Packet::data(7, "", 0);
	Bytes e3 = codec.encode(p3);
	Packet d3;
	assert(DECODE_OK == codec.decode(e3, &d3));
	assert(d3.isData() and (7 == d3.id) and d3.payload.empty());

	// largest id and largest payload
	Packet p4 = Packet::data(UINTMAX_MAX, Bytes(100, 'x').data(), 100);
	Bytes e4 = codec.encode(p4);
	assert(not e4.empty());
	Packet d4;
	assert(DECODE_OK == codec.decode(e4, &d4));
	assert(d4 == p4);

	// can't be encoded
	assert(codec.encode(Packet::data(1, Bytes(101, 'x').data(), 101)).empty());
	assert(codec.encode(Packet(KIND_ACK, 1, Bytes(1, 'x'))).empty());
	assert(codec.encode(Packet((PacketKind)0x33, 1)).empty());

	// every single bit error is caught
	for(auto *each : { &e1, &e2, &e4 })
	{
		for(size_t bit = 0; bit < each->size() * 8; bit++)
		{
			Bytes corrupt = *each;
			corrupt[bit / 8] ^= 1 << (bit % 8);
			Packet dst;
			dst.id = 12345;
			assert(DECODE_OK != codec.decode(corrupt, &dst));
			assert(12345 == dst.id); // untouched
		}
	}

	// digest problems that keep the structure intact
	{
		Bytes corrupt = e1;
		corrupt[5] ^= 0x20; // 'h' -> 'H'
		expectDecode(codec, corrupt, DECODE_BAD_CHECKSUM, "payload bit flip");

		corrupt = e1;
		corrupt.back() ^= 0x01;
		expectDecode(codec, corrupt, DECODE_BAD_CHECKSUM, "digest bit flip");
	}

	// structural problems
	expectDecode(codec, Bytes(), DECODE_MALFORMED, "empty");
	{
		Bytes truncated = e1;
		truncated.pop_back();
		expectDecode(codec, truncated, DECODE_MALFORMED, "truncated");

		Bytes trailing = e2;
		trailing.insert(trailing.begin() + 3, 0x00);
		expectDecode(codec, trailing, DECODE_MALFORMED, "ack with a body");

		Bytes badVersion = e2;
		badVersion[0] = 0x02;
		expectDecode(codec, badVersion, DECODE_MALFORMED, "bad version");

		Bytes badKind = e2;
		badKind[1] = 0x11;
		expectDecode(codec, badKind, DECODE_MALFORMED, "bad kind");
	}

	// well formed apart from a non-shortest VLU, with a correct digest
	{
		uint8_t body[] = { WIRE_VERSION, KIND_ACK, 0x80, 0x01, 0, 0, 0, 0 };
		crc.digest(body + 4, body, 4);
		expectDecode(codec, Bytes(body, body + sizeof(body)), DECODE_MALFORMED, "non-canonical id");
	}

	// declared payload length doesn't match
	{
		uint8_t body[] = { WIRE_VERSION, KIND_DATA, 0x01, 0x03, 'a', 'b', 0, 0, 0, 0 };
		crc.digest(body + 6, body, 6);
		expectDecode(codec, Bytes(body, body + sizeof(body)), DECODE_MALFORMED, "short payload");
	}

	// payload bigger than this codec allows
	{
		PacketCodec bigger(&crc, 200);
		Bytes big = bigger.encode(Packet::data(1, Bytes(150, 'x').data(), 150));
		assert(not big.empty());
		expectDecode(bigger, big, DECODE_OK, "150 bytes with 200 max");
		expectDecode(codec, big, DECODE_MALFORMED, "150 bytes with 100 max");
	}

	// a failing digest never produces a packet
	{
		BrokenChecksumAdapter broken;
		PacketCodec brokenCodec(&broken, 100);
		assert(brokenCodec.encode(p1).empty());
		expectDecode(brokenCodec, e1, DECODE_BAD_CHECKSUM, "broken checksum adapter");
	}

	return 0;
}
