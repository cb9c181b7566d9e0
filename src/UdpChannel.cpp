// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <cstring>

#include "../include/rdt/UdpChannel.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace rdt {

UdpChannel::UdpChannel(RunLoop *runloop) :
	m_runloop(runloop),
	m_fd(-1)
{ }

UdpChannel::~UdpChannel()
{
	close();
}

Address UdpChannel::bind(int port, int family)
{
	Address addr;
	if(not addr.setFamily(family))
		return Address();
	addr.setPort(port);

	return bind(addr);
}

Address UdpChannel::bind(const Address &addr)
{
	if(isOpen() or addr.isEmpty())
		return Address();

	if((m_fd = socket(addr.getFamily(), SOCK_DGRAM, 0)) < 0)
		return Address();

	if(AF_INET6 == addr.getFamily())
	{
		// the safe and portable thing is to always have separate sockets for each family.
		int on = 1;
		setsockopt(m_fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on));
	}

	{
		int flags = fcntl(m_fd, F_GETFL);
		fcntl(m_fd, F_SETFL, flags | O_NONBLOCK);
		fcntl(m_fd, F_SETFD, FD_CLOEXEC);
	}

	Address::in_sockaddr boundAddr;
	socklen_t addrLen = sizeof(boundAddr);
	if( (::bind(m_fd, addr.getSockaddr(), addr.getSockaddrLen()))
	 or (getsockname(m_fd, &boundAddr.s, &addrLen))
	 or (not m_runloop->registerDescriptor(m_fd, RunLoop::READABLE, [this] { onReadable(); }))
	)
	{
		::close(m_fd);
		m_fd = -1;
		return Address();
	}

	return Address(&boundAddr.s);
}

bool UdpChannel::isOpen() const
{
	return m_fd >= 0;
}

int UdpChannel::getDescriptor() const
{
	return m_fd;
}

bool UdpChannel::send(const Address &dst, const void *bytes, size_t len)
{
	if((not isOpen()) or dst.isEmpty())
		return false;

	ssize_t rv;
	do {
		rv = ::sendto(m_fd, bytes, len, 0, dst.getSockaddr(), dst.getSockaddrLen());
	} while((rv < 0) and (EINTR == errno));

	return rv >= 0;
}

void UdpChannel::close()
{
	if(isOpen())
	{
		m_runloop->unregisterDescriptor(m_fd);
		::close(m_fd);
		m_fd = -1;
	}

	onPacket = nullptr;
}

long UdpChannel::receiveOne(uint8_t *buf, size_t len, Address *outSrc)
{
	if(not isOpen())
		return -1;

	Address::in_sockaddr addr_u;
	socklen_t addrLen = sizeof(addr_u);

	ssize_t rv;
	do {
		rv = ::recvfrom(m_fd, buf, len, 0, &addr_u.s, &addrLen);
	} while((rv < 0) and (EINTR == errno));

	if((rv >= 0) and outSrc)
		outSrc->setSockaddr(&addr_u.s);

	return (long)rv;
}

void UdpChannel::onReadable()
{
	uint8_t buf[RECEIVE_BUFFER_LENGTH];
	Address src;
	long rv;

	// drain until the socket would block. onPacket may close us.
	while(isOpen() and ((rv = receiveOne(buf, sizeof(buf), &src)) >= 0))
	{
		if(onPacket)
			onPacket(buf, (size_t)rv, src);
	}
}

} // namespace rdt
