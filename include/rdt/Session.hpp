#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <string>

#include "Channel.hpp"
#include "Receiver.hpp"
#include "RunLoop.hpp"
#include "Sender.hpp"
#include "SessionConfig.hpp"

namespace rdt {

// One reliable association with a single peer over a Channel. A Session has
// a Sender for outgoing data and a Receiver for incoming data, so both ends
// can send at once. Everything runs on the RunLoop's thread.
//
// The Session doesn't own the RunLoop, the Channel or the checksum adapter,
// which must outlive it.
class Session : public Object {
public:
	enum DiscardReason {
		DISCARD_MALFORMED,
		DISCARD_BAD_CHECKSUM,
		DISCARD_UNKNOWN_PEER,  // valid packet from somewhere other than the peer
		DISCARD_OUT_OF_ORDER,  // data ahead of the receiver's window
		DISCARD_CLOSED         // arrived for a closed sender or receiver
	};

	struct Stats {
		Stats();

		size_t packetsSent;
		size_t dataPacketsSent;
		size_t retransmissions;
		size_t acksSent;
		size_t sendFailures;        // Channel::send() answered false
		size_t packetsReceived;
		size_t malformedPackets;
		size_t badChecksumPackets;
		size_t unknownPeerPackets;
		size_t outOfOrderPackets;
		size_t duplicatePackets;    // data below next expected, re-acked
		size_t messagesDelivered;
	};

	// Answer a new Session, or an empty shared_ptr if config is invalid (the
	// reason is put in outReason). With no checksum adapter, CRC-32 is used.
	static std::shared_ptr<Session> makeSession(RunLoop *runloop, Channel *channel, const SessionConfig &config, const IChecksumAdapter *checksum = nullptr, std::string *outReason = nullptr);

	~Session();

	// Where packets are sent. If never set, the source of the first valid
	// packet received becomes the peer. Once there is a peer, packets from
	// anywhere else are discarded.
	void    setPeerAddress(const Address &addr);
	Address getPeerAddress() const;
	bool    hasPeer() const;

	std::shared_ptr<Sender>   getSender() const;
	std::shared_ptr<Receiver> getReceiver() const;

	// Close both directions now. Unfinished submissions fail.
	void close();
	bool isOpen() const;

	const SessionConfig &getConfig() const;
	const PacketCodec   &getCodec() const;
	const Stats         &getStats() const;
	RunLoop             *getRunLoop() const;
	Time                 getCurrentTime() const;

	// Feed one received datagram. makeSession() hooks this up to the channel.
	void onReceivePacket(const uint8_t *bytes, size_t len, const Address &src);

	// Called for every received datagram that doesn't reach the application.
	std::function<void(const uint8_t *bytes, size_t len, const Address &src, DiscardReason reason)> onPacketDiscarded;

	static const char *describe(DiscardReason reason);

protected:
	friend class Sender;
	friend class Receiver;

	Session(RunLoop *runloop, Channel *channel, const SessionConfig &config, const IChecksumAdapter *checksum);
	Session() = delete;

	bool sendPacket(const Bytes &bytes);
	bool sendAck(uintmax_t id);
	void discard(const uint8_t *bytes, size_t len, const Address &src, DiscardReason reason);

	RunLoop                  *m_runloop;
	Channel                  *m_channel;
	SessionConfig             m_config;
	Crc32ChecksumAdapter      m_defaultChecksum;
	PacketCodec               m_codec;
	Address                   m_peerAddress;
	bool                      m_hasPeer;
	bool                      m_open;
	Stats                     m_stats;
	std::shared_ptr<Sender>   m_sender;
	std::shared_ptr<Receiver> m_receiver;
};

} // namespace rdt
