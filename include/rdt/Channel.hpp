#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "Address.hpp"
#include "Object.hpp"

namespace rdt {

// An unreliable datagram channel. Nothing is assumed about delivery, ordering
// or duplication. Implementations hand each received datagram to onPacket.
class Channel : public Object {
public:
	// Send one datagram. Answers false if it could not be queued locally,
	// which the protocol treats the same as loss in the network.
	virtual bool send(const Address &dst, const void *bytes, size_t len) = 0;

	// Stop delivering and release any OS resources.
	virtual void close() = 0;

	std::function<void(const uint8_t *bytes, size_t len, const Address &src)> onPacket;
};

} // namespace rdt
