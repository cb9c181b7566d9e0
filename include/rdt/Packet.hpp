#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <vector>

#include "ChecksumAdapter.hpp"
#include "packet.hpp"

namespace rdt {

using Bytes = std::vector<uint8_t>;

struct Packet {
	Packet();
	Packet(PacketKind kind, uintmax_t id, const Bytes &payload = Bytes());

	static Packet data(uintmax_t id, const void *payload, size_t len);
	static Packet ack(uintmax_t id);

	bool isData() const { return KIND_DATA == kind; }
	bool isAck()  const { return KIND_ACK == kind; }

	// checksum isn't compared, it is a function of the other fields.
	bool operator== (const Packet &rhs) const;
	bool operator!= (const Packet &rhs) const { return not (*this == rhs); }

	PacketKind kind;
	uintmax_t  id;
	Bytes      payload;
	Bytes      checksum; // filled in by PacketCodec
};

enum DecodeResult {
	DECODE_OK,
	DECODE_MALFORMED,    // failed structural validity
	DECODE_BAD_CHECKSUM  // parsed, but the digest didn't match
};

// Encodes and decodes Packets in the wire format in packet.hpp. The codec
// doesn't own the checksum adapter.
class PacketCodec {
public:
	PacketCodec(const IChecksumAdapter *checksum, size_t maxPayloadLength);
	PacketCodec() = delete;

	// Deterministic: equal packets always encode to equal bytes. Answers an
	// empty vector if the packet can't be encoded (payload on an ack, payload
	// too long, or a digest failure). The digest is also copied to outChecksum
	// if given.
	Bytes encode(const Packet &packet, Bytes *outChecksum = nullptr) const;

	// Structure is checked first, then the checksum. dst is only written on
	// DECODE_OK.
	DecodeResult decode(const uint8_t *bytes, size_t len, Packet *dst) const;
	DecodeResult decode(const Bytes &bytes, Packet *dst) const;

	size_t getMaxPayloadLength() const;
	size_t getEncodedLength(const Packet &packet) const;

	static const char *describe(DecodeResult result);

protected:
	const IChecksumAdapter *m_checksum;
	size_t m_maxPayloadLength;
};

} // namespace rdt
