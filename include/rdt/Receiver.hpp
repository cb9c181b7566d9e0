#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <deque>
#include <map>

#include "Packet.hpp"
#include "Timer.hpp"

namespace rdt {

class Session;

// The receiving half of a Session. Payloads are delivered exactly once and in
// id order. Packets ahead of the next expected id are dropped unacknowledged,
// unless they fall inside the configured reorder window, in which case they
// are held and acknowledged.
class Receiver : public Object {
public:
	~Receiver();

	// Called for each payload in order. If not set, payloads are queued for read().
	std::function<void(const uint8_t *bytes, size_t len, uintmax_t id)> onMessage;

	// Called once when the receiver closes.
	Task onComplete;

	// Take the next queued payload. Answers false if none is available right now.
	bool   read(Bytes &dst);
	size_t getReadableCount() const;

	// True once closed and every queued payload has been read. The sequence of
	// payloads can't be restarted.
	bool isFinished() const;
	bool isOpen() const;

	void close();

	uintmax_t getNextExpectedId() const;
	size_t    getBufferedCount() const; // held in the reorder window
	size_t    getDeliveredCount() const;

protected:
	friend class Session;

	Receiver(Session *session);

	bool onData(uintmax_t id, const Bytes &payload); // false if discarded
	void acceptInOrder(uintmax_t id, const Bytes &payload);
	void deliver(uintmax_t id, const Bytes &payload);
	bool isInReorderWindow(uintmax_t id) const;
	void resetIdleTimer();

	Session  *m_session; // weak ref
	bool      m_open;
	uintmax_t m_nextExpectedId;
	size_t    m_reorderWindow;
	Duration  m_idleLimit;
	size_t    m_deliveredCount;
	std::map<uintmax_t, Bytes> m_reorderBuffer;
	std::deque<Bytes>          m_readable;
	std::shared_ptr<Timer>     m_idleTimer;
};

} // namespace rdt
