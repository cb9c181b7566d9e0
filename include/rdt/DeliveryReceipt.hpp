#pragma once

// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "Timer.hpp"

namespace rdt {

// Tracks one Sender::submit(). A submission larger than the maximum segment
// size is carried in several packets with consecutive ids; it is delivered
// when all of them are acknowledged, and failed as soon as any one of them
// exhausts its retries or the session closes first.
class DeliveryReceipt : public Object {
public:
	DeliveryReceipt(Time origin, uintmax_t firstId, size_t segmentCount);
	DeliveryReceipt() = delete;

	Time      createdAt()       const; // When the data was submitted.
	uintmax_t getFirstId()      const; // id of the first packet carrying this data.
	uintmax_t getLastId()       const;
	size_t    getSegmentCount() const;
	size_t    getAckedCount()   const; // How many of the packets have been acknowledged.

	bool isStarted()   const; // True if any packet has been transmitted at least once.
	bool isDelivered() const; // True if every packet was acknowledged.
	bool isFailed()    const; // True if delivery was given up.
	bool isFinished()  const; // True if delivered or failed.

	// Called once, when the receipt finishes.
	std::function<void(bool failed)> onFinished;

protected:
	friend class Sender;

	void start();
	void segmentAcked();
	void fail();

	Time      m_origin;
	uintmax_t m_firstId;
	size_t    m_segmentCount;
	size_t    m_ackedCount;
	bool      m_started;
	bool      m_failed;
};

} // namespace rdt
