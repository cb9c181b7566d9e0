// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "../include/rdt/Packet.hpp"
#include "../include/rdt/VLU.hpp"

namespace rdt {

// --- Packet

Packet::Packet() :
	kind(KIND_DATA),
	id(0)
{ }

Packet::Packet(PacketKind kind_, uintmax_t id_, const Bytes &payload_) :
	kind(kind_),
	id(id_),
	payload(payload_)
{ }

Packet Packet::data(uintmax_t id, const void *payload, size_t len)
{
	const uint8_t *bytes = (const uint8_t *)payload;
	return Packet(KIND_DATA, id, Bytes(bytes, bytes + len));
}

Packet Packet::ack(uintmax_t id)
{
	return Packet(KIND_ACK, id);
}

bool Packet::operator== (const Packet &rhs) const
{
	return (kind == rhs.kind) and (id == rhs.id) and (payload == rhs.payload);
}

// --- PacketCodec

namespace {

// VLUs must be in shortest form, so each packet has exactly one encoding.
size_t parseCanonicalVLU(const uint8_t *cursor, const uint8_t *limit, uintmax_t *val)
{
	size_t rv = VLU::parse(cursor, limit, val);
	if(rv and (rv != VLU::size(*val)))
		return 0;
	return rv;
}

}

PacketCodec::PacketCodec(const IChecksumAdapter *checksum, size_t maxPayloadLength) :
	m_checksum(checksum),
	m_maxPayloadLength(maxPayloadLength)
{ }

size_t PacketCodec::getMaxPayloadLength() const
{
	return m_maxPayloadLength;
}

size_t PacketCodec::getEncodedLength(const Packet &packet) const
{
	size_t rv = PACKET_FIXED_HEADER_LENGTH + VLU::size(packet.id) + m_checksum->getDigestLength();
	if(packet.isData())
		rv += VLU::size(packet.payload.size()) + packet.payload.size();
	return rv;
}

Bytes PacketCodec::encode(const Packet &packet, Bytes *outChecksum) const
{
	Bytes rv;

	if((packet.isAck() and not packet.payload.empty()) or (packet.payload.size() > m_maxPayloadLength))
		return rv;
	if((not packet.isAck()) and (not packet.isData()))
		return rv;

	size_t digestLength = m_checksum->getDigestLength();
	rv.reserve(getEncodedLength(packet));

	rv.push_back(WIRE_VERSION);
	rv.push_back(packet.kind);
	VLU::append(packet.id, rv);
	if(packet.isData())
	{
		VLU::append(packet.payload.size(), rv);
		rv.insert(rv.end(), packet.payload.begin(), packet.payload.end());
	}

	size_t coveredLength = rv.size();
	rv.resize(coveredLength + digestLength);
	if(not m_checksum->digest(rv.data() + coveredLength, rv.data(), coveredLength))
		return Bytes();

	if(outChecksum)
		outChecksum->assign(rv.begin() + coveredLength, rv.end());

	return rv;
}

DecodeResult PacketCodec::decode(const uint8_t *bytes, size_t len, Packet *dst) const
{
	size_t digestLength = m_checksum->getDigestLength();
	uintmax_t id = 0;
	uintmax_t payloadLength = 0;
	const uint8_t *payload = nullptr;
	size_t rv;

	if(len < PACKET_FIXED_HEADER_LENGTH + 1 + digestLength)
		return DECODE_MALFORMED;

	const uint8_t *cursor = bytes;
	const uint8_t *limit = bytes + len - digestLength; // covered bytes end here

	if(WIRE_VERSION != *cursor++)
		return DECODE_MALFORMED;

	uint8_t kind = *cursor++;
	if((KIND_DATA != kind) and (KIND_ACK != kind))
		return DECODE_MALFORMED;

	if(0 == (rv = parseCanonicalVLU(cursor, limit, &id)))
		return DECODE_MALFORMED;
	cursor += rv;

	if(KIND_DATA == kind)
	{
		if(0 == (rv = parseCanonicalVLU(cursor, limit, &payloadLength)))
			return DECODE_MALFORMED;
		cursor += rv;

		if((payloadLength > m_maxPayloadLength) or (payloadLength != (uintmax_t)(limit - cursor)))
			return DECODE_MALFORMED;

		payload = cursor;
		cursor += payloadLength;
	}

	if(cursor != limit)
		return DECODE_MALFORMED; // trailing junk, or an ack with a body

	if(not m_checksum->verify(limit, bytes, limit - bytes))
		return DECODE_BAD_CHECKSUM;

	if(dst)
	{
		dst->kind = (PacketKind)kind;
		dst->id = id;
		if(payload)
			dst->payload.assign(payload, payload + payloadLength);
		else
			dst->payload.clear();
		dst->checksum.assign(limit, limit + digestLength);
	}

	return DECODE_OK;
}

DecodeResult PacketCodec::decode(const Bytes &bytes, Packet *dst) const
{
	return decode(bytes.data(), bytes.size(), dst);
}

const char * PacketCodec::describe(DecodeResult result)
{
	switch(result)
	{
	case DECODE_OK: return "ok";
	case DECODE_MALFORMED: return "malformed";
	case DECODE_BAD_CHECKSUM: return "bad checksum";
	}

	return "unknown";
}

} // namespace rdt
