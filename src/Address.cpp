// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rdt/Address.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <cstdio>
#include <cstring>

namespace rdt {

Address::Address()
{
	erase();
}

Address::Address(const struct sockaddr *addr)
{
	erase();
	setSockaddr(addr);
}

void Address::erase()
{
	memset(&m_addr, 0, sizeof(m_addr));
}

bool Address::isEmpty() const
{
	return (AF_INET != getFamily()) and (AF_INET6 != getFamily());
}

bool Address::setFamily(int family)
{
	if((AF_INET != family) and (AF_INET6 != family))
		return false;

	if(getFamily() == family)
		return true;

	unsigned savedPort = getPort();
	erase();
	m_addr.s.sa_family = family;
	setPort(savedPort);

	return true;
}

void Address::setPort(unsigned port)
{
	switch(getFamily())
	{
	case AF_INET:
		m_addr.s4.sin_port = htons(port);
		break;

	case AF_INET6:
		m_addr.s6.sin6_port = htons(port);
		break;
	}
}

unsigned Address::getPort() const
{
	switch(getFamily())
	{
	case AF_INET: return ntohs(m_addr.s4.sin_port);
	case AF_INET6: return ntohs(m_addr.s6.sin6_port);
	default: return 0;
	}
}

bool Address::setSockaddr(const struct sockaddr *addr)
{
	if(not addr)
		return false;

	switch(addr->sa_family)
	{
	case AF_INET:
		erase();
		memmove(&m_addr.s4, addr, sizeof(m_addr.s4));
		return true;

	case AF_INET6:
		erase();
		memmove(&m_addr.s6, addr, sizeof(m_addr.s6));
		return true;
	}

	return false;
}

socklen_t Address::getSockaddrLen() const
{
	switch(getFamily())
	{
	case AF_INET: return sizeof(struct sockaddr_in);
	case AF_INET6: return sizeof(struct sockaddr_in6);
	}

	return 0;
}

size_t Address::getIPAddressLength() const
{
	switch(getFamily())
	{
	case AF_INET: return 4;
	case AF_INET6: return 16;
	}

	return 0;
}

const uint8_t * Address::getIPAddressPtr() const
{
	switch(getFamily())
	{
	case AF_INET: return (const uint8_t *)&m_addr.s4.sin_addr;
	case AF_INET6: return (const uint8_t *)&m_addr.s6.sin6_addr;
	}

	return (const uint8_t *)&m_addr;
}

bool Address::operator== (const Address &rhs) const
{
	return (getFamily() == rhs.getFamily())
	   and (0 == memcmp(getIPAddressPtr(), rhs.getIPAddressPtr(), getIPAddressLength()))
	   and (getPort() == rhs.getPort());
}

std::string Address::toPresentation(bool withPort) const
{
	char buf[INET6_ADDRSTRLEN]; // big enough for INET too
	char dst[INET6_ADDRSTRLEN + 8];

	if(isEmpty() or not inet_ntop(getFamily(), getIPAddressPtr(), buf, sizeof(buf)))
		return std::string();

	if(not withPort)
		return std::string(buf);

	if(AF_INET == getFamily())
		snprintf(dst, sizeof(dst), "%s:%u", buf, getPort());
	else
		snprintf(dst, sizeof(dst), "[%s]:%u", buf, getPort());

	return std::string(dst);
}

bool Address::setFromPresentation(const char *src, bool withPort)
{
	char ip[INET6_ADDRSTRLEN]; // INET6_ADDRSTRLEN is 46
	unsigned port = 0;
	bool is6 = strchr(src, ':') != strrchr(src, ':'); // more than one colon

	if(withPort)
	{
		if(2 != sscanf(src, "[%45[0-9a-fA-F:.]]:%u", ip, &port))
		{
			if(is6)
				return false;

			if(2 != sscanf(src, "%45[0-9.]:%u", ip, &port))
				return false;
		}
		if(port > 65535)
			return false;
	}
	else
	{
		if((1 != sscanf(src, "[%45[^]]]", ip)) and (1 != sscanf(src, "%45s", ip)))
			return false;
	}

	in_sockaddr tmp;
	memset(&tmp, 0, sizeof(tmp));
	if(is6)
	{
		tmp.s6.sin6_family = AF_INET6;
		if(inet_pton(AF_INET6, ip, &tmp.s6.sin6_addr) < 1)
			return false;
	}
	else
	{
		tmp.s4.sin_family = AF_INET;
		if(inet_pton(AF_INET, ip, &tmp.s4.sin_addr) < 1)
			return false;
	}

	setSockaddr(&tmp.s);
	setPort(port);

	return true;
}

bool Address::resolve(const char *host, const char *port)
{
	struct addrinfo hints;
	struct addrinfo *results = nullptr;
	bool rv = false;

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_DGRAM;

	if(getaddrinfo(host, port, &hints, &results))
		return false;

	for(int family : { AF_INET, AF_INET6 })
	{
		for(struct addrinfo *each = results; each and not rv; each = each->ai_next)
			if(each->ai_family == family)
				rv = setSockaddr(each->ai_addr);
		if(rv)
			break;
	}

	freeaddrinfo(results);

	return rv;
}

} // namespace rdt
