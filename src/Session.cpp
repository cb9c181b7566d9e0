// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "../include/rdt/Session.hpp"

namespace rdt {

Session::Stats::Stats() :
	packetsSent(0),
	dataPacketsSent(0),
	retransmissions(0),
	acksSent(0),
	sendFailures(0),
	packetsReceived(0),
	malformedPackets(0),
	badChecksumPackets(0),
	unknownPeerPackets(0),
	outOfOrderPackets(0),
	duplicatePackets(0),
	messagesDelivered(0)
{ }

Session::Session(RunLoop *runloop, Channel *channel, const SessionConfig &config, const IChecksumAdapter *checksum) :
	m_runloop(runloop),
	m_channel(channel),
	m_config(config),
	m_codec(checksum ? checksum : &m_defaultChecksum, config.maxSegmentSize),
	m_hasPeer(false),
	m_open(true)
{
	m_sender = share_ref(new Sender(this), false);
	m_receiver = share_ref(new Receiver(this), false);
}

std::shared_ptr<Session> Session::makeSession(RunLoop *runloop, Channel *channel, const SessionConfig &config, const IChecksumAdapter *checksum, std::string *outReason)
{
	std::shared_ptr<Session> rv;

	if((not runloop) or (not channel))
	{
		if(outReason)
			*outReason = "no run loop or channel";
		return rv;
	}

	if(not config.validate(outReason))
		return rv;

	rv = share_ref(new Session(runloop, channel, config, checksum), false);

	Session *session = rv.get(); // weak, cleared in ~Session
	channel->onPacket = [session] (const uint8_t *bytes, size_t len, const Address &src) {
		session->onReceivePacket(bytes, len, src);
	};

	return rv;
}

Session::~Session()
{
	m_channel->onPacket = nullptr;
	m_open = false;
	m_sender->close();
	m_receiver->close();
}

void Session::setPeerAddress(const Address &addr)
{
	m_peerAddress = addr;
	m_hasPeer = true;
}

Address Session::getPeerAddress() const
{
	return m_peerAddress;
}

bool Session::hasPeer() const
{
	return m_hasPeer;
}

std::shared_ptr<Sender> Session::getSender() const
{
	return m_sender;
}

std::shared_ptr<Receiver> Session::getReceiver() const
{
	return m_receiver;
}

void Session::close()
{
	if(not m_open)
		return;
	m_open = false;

	auto myself = share_ref(this); // callbacks might release the last outside reference
	m_sender->close();
	m_receiver->close();
}

bool Session::isOpen() const
{
	return m_open;
}

const SessionConfig & Session::getConfig() const
{
	return m_config;
}

const PacketCodec & Session::getCodec() const
{
	return m_codec;
}

const Session::Stats & Session::getStats() const
{
	return m_stats;
}

RunLoop * Session::getRunLoop() const
{
	return m_runloop;
}

Time Session::getCurrentTime() const
{
	return m_runloop->getCurrentTime();
}

void Session::onReceivePacket(const uint8_t *bytes, size_t len, const Address &src)
{
	m_stats.packetsReceived++;

	Packet packet;
	switch(m_codec.decode(bytes, len, &packet))
	{
	case DECODE_OK:
		break;
	case DECODE_MALFORMED:
		m_stats.malformedPackets++;
		discard(bytes, len, src, DISCARD_MALFORMED);
		return;
	case DECODE_BAD_CHECKSUM:
		m_stats.badChecksumPackets++;
		discard(bytes, len, src, DISCARD_BAD_CHECKSUM);
		return;
	}

	if(not m_hasPeer)
		setPeerAddress(src);
	else if(src != m_peerAddress)
	{
		m_stats.unknownPeerPackets++;
		discard(bytes, len, src, DISCARD_UNKNOWN_PEER);
		return;
	}

	auto myself = share_ref(this);

	if(packet.isAck())
	{
		if(not m_sender->isOpen())
		{
			discard(bytes, len, src, DISCARD_CLOSED);
			return;
		}
		m_sender->onAck(packet.id);
		return;
	}

	if(not m_receiver->isOpen())
	{
		discard(bytes, len, src, DISCARD_CLOSED);
		return;
	}
	if(not m_receiver->onData(packet.id, packet.payload))
	{
		m_stats.outOfOrderPackets++;
		discard(bytes, len, src, DISCARD_OUT_OF_ORDER);
	}
}

const char *Session::describe(DiscardReason reason)
{
	switch(reason)
	{
	case DISCARD_MALFORMED: return "malformed";
	case DISCARD_BAD_CHECKSUM: return "bad checksum";
	case DISCARD_UNKNOWN_PEER: return "unknown peer";
	case DISCARD_OUT_OF_ORDER: return "out of order";
	case DISCARD_CLOSED: return "closed";
	}
	return "unknown";
}

// ---

bool Session::sendPacket(const Bytes &bytes)
{
	if((not m_open) or (not m_hasPeer))
		return false;

	m_stats.packetsSent++;
	if(m_channel->send(m_peerAddress, bytes.data(), bytes.size()))
		return true;

	m_stats.sendFailures++;
	return false;
}

bool Session::sendAck(uintmax_t id)
{
	Bytes encoded = m_codec.encode(Packet::ack(id));
	if(encoded.empty())
		return false;

	m_stats.acksSent++;
	return sendPacket(encoded);
}

void Session::discard(const uint8_t *bytes, size_t len, const Address &src, DiscardReason reason)
{
	if(onPacketDiscarded)
		onPacketDiscarded(bytes, len, src, reason);
}

} // namespace rdt
