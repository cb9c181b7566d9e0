#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <deque>
#include <map>

#include "DeliveryReceipt.hpp"
#include "Packet.hpp"
#include "RTOEstimator.hpp"

namespace rdt {

class Session;

// The sending half of a Session. Application data is cut into packets of at
// most maxSegmentSize bytes with consecutive ids, and at most windowCapacity
// of them are unacknowledged at once; the rest wait in a queue. Every packet
// in flight has its own retransmission timer.
class Sender : public Object {
public:
	enum State {
		S_ACTIVE,   // accepting and sending data
		S_DRAINING, // finish() called, waiting for the last acks
		S_CLOSED
	};

	~Sender();

	// Queue data for reliable delivery. Answers a DeliveryReceipt, or an empty
	// shared_ptr if len is 0, the sender isn't S_ACTIVE, or the data can't be
	// encoded.
	std::shared_ptr<DeliveryReceipt> submit(const void *bytes, size_t len);
	std::shared_ptr<DeliveryReceipt> submit(const Bytes &bytes);

	// No more data. The sender closes once every submission has finished.
	void finish();

	// Close now. Timers are canceled and every unfinished submission fails.
	void close();

	// Process an acknowledgment. Unknown and already retired ids are ignored.
	void onAck(uintmax_t id);

	State getState() const;
	bool  isOpen() const; // not S_CLOSED

	// True if S_ACTIVE and a submission would be transmitted right away.
	bool isWritable() const;

	void notifyWhenWritable(); // Trigger callbacks to onWritable.

	// Called after notifyWhenWritable() while isWritable() and while this
	// function answers true. Answer false to stop being called until after
	// the next call to notifyWhenWritable().
	std::function<bool(void)> onWritable;

	size_t    getOutstandingCount() const; // packets in flight
	size_t    getQueuedCount() const;      // packets waiting for window space
	uintmax_t getNextId() const;           // id the next packet will get
	size_t    getRetransmitCount() const;  // total retransmissions so far
	bool      anyFailed() const;           // true if any submission failed

	const RTOEstimator &getRTOEstimator() const;

	// Called after a packet is sent again, with its retransmission count so far
	// and the timeout now running for it.
	std::function<void(uintmax_t id, size_t retransmitCount, Duration timeout)> onRetransmit;

	// Called when a packet exhausts its retries, after its receipt has failed.
	std::function<void(uintmax_t id)> onExhausted;

	// Called once when the sender reaches S_CLOSED.
	std::function<void(bool anyFailed)> onClosed;

protected:
	friend class Session;

	struct InFlight;

	Sender(Session *session);

	void transmit(const std::shared_ptr<InFlight> &packet);
	void onTimerFire(uintmax_t id, const std::shared_ptr<Timer> &timer, Time now);
	void fillWindow();
	void checkDrained();
	void queueWritableNotify();
	void doWritable();
	void gotoStateClosed();

	Session     *m_session; // weak ref
	RTOEstimator m_rto;
	State        m_state;
	uintmax_t    m_nextId;
	size_t       m_windowCapacity;
	size_t       m_maxSegmentSize;
	size_t       m_maxRetries;
	size_t       m_retransmitCount;
	bool         m_anyFailed;
	bool         m_shouldNotifyWhenWritable;
	bool         m_writablePending;
	std::map<uintmax_t, std::shared_ptr<InFlight> > m_inflight;
	std::deque<std::shared_ptr<InFlight> >          m_queue;
};

} // namespace rdt
