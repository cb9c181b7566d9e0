#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "Channel.hpp"
#include "RunLoop.hpp"

namespace rdt {

// Channel over a non-blocking UDP socket watched by a RunLoop.
class UdpChannel : public Channel {
public:
	static const size_t RECEIVE_BUFFER_LENGTH = 8192;

	UdpChannel(RunLoop *runloop);
	~UdpChannel();

	// Open and bind the socket. Answers the bound address, or an empty Address
	// on error.
	Address bind(int port = 0, int family = AF_INET);
	Address bind(const Address &addr);

	bool isOpen() const;
	int  getDescriptor() const;

	bool send(const Address &dst, const void *bytes, size_t len) override;
	void close() override;

	// Read one datagram into buf. Answers its length, or -1 when the socket
	// would block (or on error).
	long receiveOne(uint8_t *buf, size_t len, Address *outSrc);

protected:
	void onReadable();

	RunLoop *m_runloop;
	int      m_fd;
};

} // namespace rdt
