#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <sys/socket.h>
#include <netinet/in.h>

#include <string>

namespace rdt {

// An IPv4 or IPv6 socket address (peer of a Session).
class Address {
public:
	union in_sockaddr {
		struct sockaddr     s;
		struct sockaddr_in  s4;
		struct sockaddr_in6 s6;
	};

	Address();
	Address(const struct sockaddr *addr);

	void erase();
	bool isEmpty() const;

	bool setFamily(int family);
	int  getFamily() const { return m_addr.s.sa_family; };

	void      setPort(unsigned port);
	unsigned  getPort() const;

	bool                   setSockaddr(const struct sockaddr *addr);
	const struct sockaddr *getSockaddr() const { return &m_addr.s; };
	socklen_t              getSockaddrLen() const;

	bool operator== (const Address &rhs) const;
	bool operator!= (const Address &rhs) const { return not (*this == rhs); }

	// "1.2.3.4:5" or "[::1]:5". Answer false on parse error.
	std::string toPresentation(bool withPort = true) const;
	bool setFromPresentation(const char *src, bool withPort = true);

	// Resolve host (name or literal) and port with getaddrinfo. Prefers IPv4.
	bool resolve(const char *host, const char *port);

protected:
	size_t getIPAddressLength() const;
	const uint8_t *getIPAddressPtr() const;

	union in_sockaddr m_addr;
};

} // namespace rdt
