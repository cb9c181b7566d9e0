// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <vector>

#include "../include/rdt/Session.hpp"

namespace rdt {

struct Sender::InFlight : public Object {
	InFlight(uintmax_t id_, const Bytes &encoded_, std::shared_ptr<DeliveryReceipt> receipt_) :
		id(id_),
		encoded(encoded_),
		sentAt(-1),
		retransmits(0),
		timeout(0),
		receipt(receipt_)
	{}

	uintmax_t id;
	Bytes     encoded; // sent again unchanged on every retransmission
	Time      sentAt;  // first transmission
	size_t    retransmits;
	Duration  timeout; // what the timer was last set for
	std::shared_ptr<Timer> timer;
	std::shared_ptr<DeliveryReceipt> receipt;
};

Sender::Sender(Session *session) :
	m_session(session),
	m_rto(session->getConfig()),
	m_state(S_ACTIVE),
	m_nextId(FIRST_PACKET_ID),
	m_windowCapacity(session->getConfig().windowCapacity),
	m_maxSegmentSize(session->getConfig().maxSegmentSize),
	m_maxRetries(session->getConfig().maxRetriesPerPacket),
	m_retransmitCount(0),
	m_anyFailed(false),
	m_shouldNotifyWhenWritable(false),
	m_writablePending(false)
{ }

Sender::~Sender()
{
	onClosed = nullptr;
	close();
}

std::shared_ptr<DeliveryReceipt> Sender::submit(const Bytes &bytes)
{
	return submit(bytes.data(), bytes.size());
}

std::shared_ptr<DeliveryReceipt> Sender::submit(const void *bytes_, size_t len)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;
	std::shared_ptr<DeliveryReceipt> rv;

	if((S_ACTIVE != m_state) or (0 == len))
		return rv;

	size_t segmentCount = (len + m_maxSegmentSize - 1) / m_maxSegmentSize;
	rv = share_ref(new DeliveryReceipt(m_session->getCurrentTime(), m_nextId, segmentCount), false);

	// encode everything first, so a failure doesn't use up any ids.
	std::vector<std::shared_ptr<InFlight> > packets;
	uintmax_t id = m_nextId;
	for(size_t offset = 0; offset < len; offset += m_maxSegmentSize)
	{
		size_t segmentLength = std::min(m_maxSegmentSize, len - offset);
		Bytes encoded = m_session->getCodec().encode(Packet::data(id, bytes + offset, segmentLength));
		if(encoded.empty())
			return std::shared_ptr<DeliveryReceipt>();
		packets.push_back(share_ref(new InFlight(id, encoded, rv), false));
		id++;
	}

	m_nextId = id;
	m_queue.insert(m_queue.end(), packets.begin(), packets.end());

	fillWindow();

	return rv;
}

void Sender::finish()
{
	if(S_ACTIVE != m_state)
		return;

	m_state = S_DRAINING;
	m_shouldNotifyWhenWritable = false;

	checkDrained();
}

void Sender::close()
{
	if(S_CLOSED == m_state)
		return;

	m_state = S_CLOSED;
	m_shouldNotifyWhenWritable = false;
	onWritable = nullptr;

	std::vector<std::shared_ptr<DeliveryReceipt> > receipts;
	for(auto it = m_inflight.begin(); it != m_inflight.end(); it++)
	{
		auto &each = it->second;
		if(each->timer)
			each->timer->cancel();
		each->timer.reset();
		receipts.push_back(each->receipt);
	}
	for(auto it = m_queue.begin(); it != m_queue.end(); it++)
		receipts.push_back((*it)->receipt);
	m_inflight.clear();
	m_queue.clear();

	for(auto it = receipts.begin(); it != receipts.end(); it++)
	{
		if(not (*it)->isFinished())
		{
			m_anyFailed = true;
			(*it)->fail();
		}
	}

	gotoStateClosed();
}

void Sender::onAck(uintmax_t id)
{
	if(S_CLOSED == m_state)
		return;

	auto it = m_inflight.find(id);
	if(it == m_inflight.end())
		return; // never sent, already acked, or exhausted

	auto packet = it->second;
	m_inflight.erase(it);
	if(packet->timer)
		packet->timer->cancel();
	packet->timer.reset();

	if(0 == packet->retransmits)
		m_rto.onSample(m_session->getCurrentTime() - packet->sentAt);

	packet->receipt->segmentAcked();

	fillWindow();
	checkDrained();
	queueWritableNotify();
}

Sender::State Sender::getState() const
{
	return m_state;
}

bool Sender::isOpen() const
{
	return S_CLOSED != m_state;
}

bool Sender::isWritable() const
{
	return (S_ACTIVE == m_state) and m_queue.empty() and (m_inflight.size() < m_windowCapacity);
}

void Sender::notifyWhenWritable()
{
	m_shouldNotifyWhenWritable = true;
	queueWritableNotify();
}

size_t Sender::getOutstandingCount() const
{
	return m_inflight.size();
}

size_t Sender::getQueuedCount() const
{
	return m_queue.size();
}

uintmax_t Sender::getNextId() const
{
	return m_nextId;
}

size_t Sender::getRetransmitCount() const
{
	return m_retransmitCount;
}

bool Sender::anyFailed() const
{
	return m_anyFailed;
}

const RTOEstimator & Sender::getRTOEstimator() const
{
	return m_rto;
}

// ---

void Sender::transmit(const std::shared_ptr<InFlight> &packet)
{
	Time now = m_session->getCurrentTime();
	uintmax_t id = packet->id;

	packet->sentAt = now;
	packet->timeout = m_rto.currentTimeout();
	packet->receipt->start();
	m_inflight[id] = packet;

	packet->timer = m_session->getRunLoop()->schedule([this, id] (const std::shared_ptr<Timer> &sender, Time fireTime) {
		onTimerFire(id, sender, fireTime);
	}, now + packet->timeout);

	m_session->m_stats.dataPacketsSent++;
	m_session->sendPacket(packet->encoded);
}

void Sender::onTimerFire(uintmax_t id, const std::shared_ptr<Timer> &timer, Time now)
{
	auto it = m_inflight.find(id);
	if(it == m_inflight.end())
		return;
	auto packet = it->second;
	auto myself = share_ref(this); // the receipt's onFinished might release our session

	if(packet->retransmits >= m_maxRetries)
	{
		m_inflight.erase(it);
		packet->timer.reset(); // not rescheduled, so canceled after this action returns
		m_anyFailed = true;
		packet->receipt->fail();
		if(onExhausted)
			onExhausted(id);

		fillWindow();
		checkDrained();
		queueWritableNotify();
		return;
	}

	packet->retransmits++;
	packet->timeout = m_rto.onTimeoutBackoff(packet->timeout);
	timer->setNextFireTime(now + packet->timeout);

	m_retransmitCount++;
	m_session->m_stats.retransmissions++;
	m_session->sendPacket(packet->encoded);

	if(onRetransmit)
		onRetransmit(id, packet->retransmits, packet->timeout);
}

void Sender::fillWindow()
{
	while(isOpen() and (not m_queue.empty()) and (m_inflight.size() < m_windowCapacity))
	{
		auto packet = m_queue.front();
		m_queue.pop_front();
		transmit(packet);
	}
}

void Sender::checkDrained()
{
	if((S_DRAINING == m_state) and m_inflight.empty() and m_queue.empty())
	{
		m_state = S_CLOSED;
		gotoStateClosed();
	}
}

void Sender::queueWritableNotify()
{
	if(m_shouldNotifyWhenWritable and isOpen() and not m_writablePending)
	{
		auto myself = share_ref(this);
		m_session->getRunLoop()->doLater([myself] { myself->doWritable(); });
		m_writablePending = true;
	}
}

void Sender::doWritable()
{
	m_writablePending = false;
	while(m_shouldNotifyWhenWritable and isWritable())
	{
		auto handler = onWritable; // might close() us
		m_shouldNotifyWhenWritable = handler ? handler() : false;
	}
}

void Sender::gotoStateClosed()
{
	auto closed = onClosed;
	onClosed = nullptr;
	onRetransmit = nullptr;
	onExhausted = nullptr;
	if(closed)
		closed(m_anyFailed);
}

} // namespace rdt
