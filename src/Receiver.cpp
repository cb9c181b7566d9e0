// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include <cmath>

#include "../include/rdt/Session.hpp"

namespace rdt {

Receiver::Receiver(Session *session) :
	m_session(session),
	m_open(true),
	m_nextExpectedId(FIRST_PACKET_ID),
	m_reorderWindow(session->getConfig().reorderWindow),
	m_idleLimit(session->getConfig().idleLimit),
	m_deliveredCount(0)
{ }

Receiver::~Receiver()
{
	onComplete = nullptr;
	close();
}

bool Receiver::read(Bytes &dst)
{
	if(m_readable.empty())
		return false;

	dst.swap(m_readable.front());
	m_readable.pop_front();
	return true;
}

size_t Receiver::getReadableCount() const
{
	return m_readable.size();
}

bool Receiver::isFinished() const
{
	return (not m_open) and m_readable.empty();
}

bool Receiver::isOpen() const
{
	return m_open;
}

void Receiver::close()
{
	if(not m_open)
		return;

	m_open = false;
	m_reorderBuffer.clear();
	if(m_idleTimer)
		m_idleTimer->cancel();
	m_idleTimer.reset();
	onMessage = nullptr;

	auto complete = onComplete;
	onComplete = nullptr;
	if(complete)
		complete();
}

uintmax_t Receiver::getNextExpectedId() const
{
	return m_nextExpectedId;
}

size_t Receiver::getBufferedCount() const
{
	return m_reorderBuffer.size();
}

size_t Receiver::getDeliveredCount() const
{
	return m_deliveredCount;
}

// ---

bool Receiver::onData(uintmax_t id, const Bytes &payload)
{
	if(id < m_nextExpectedId)
	{
		// our ack was lost or is still on its way. say it again, don't deliver again.
		m_session->m_stats.duplicatePackets++;
		m_session->sendAck(id);
		return true;
	}

	if(id == m_nextExpectedId)
	{
		acceptInOrder(id, payload);
		return true;
	}

	if(isInReorderWindow(id))
	{
		if(0 == m_reorderBuffer.count(id))
			m_reorderBuffer[id] = payload;
		else
			m_session->m_stats.duplicatePackets++;
		m_session->sendAck(id);
		return true;
	}

	return false; // ahead of what we can hold. no ack, the sender will retransmit.
}

void Receiver::acceptInOrder(uintmax_t id, const Bytes &payload)
{
	m_nextExpectedId = id + 1;
	m_session->sendAck(id);
	resetIdleTimer();
	deliver(id, payload);

	while(m_open)
	{
		auto it = m_reorderBuffer.find(m_nextExpectedId);
		if(it == m_reorderBuffer.end())
			break;

		Bytes next;
		next.swap(it->second);
		uintmax_t nextId = it->first;
		m_reorderBuffer.erase(it);
		m_nextExpectedId = nextId + 1;
		deliver(nextId, next); // already acked when it was buffered
	}
}

void Receiver::deliver(uintmax_t id, const Bytes &payload)
{
	m_deliveredCount++;
	m_session->m_stats.messagesDelivered++;

	if(onMessage)
	{
		auto handler = onMessage; // might close() us
		handler(payload.data(), payload.size(), id);
	}
	else
		m_readable.push_back(payload);
}

bool Receiver::isInReorderWindow(uintmax_t id) const
{
	return (id > m_nextExpectedId) and (id - m_nextExpectedId <= m_reorderWindow);
}

void Receiver::resetIdleTimer()
{
	if(std::isinf(m_idleLimit))
		return;

	Time deadline = m_session->getCurrentTime() + m_idleLimit;
	if(m_idleTimer)
	{
		m_idleTimer->setNextFireTime(deadline);
		return;
	}

	m_idleTimer = m_session->getRunLoop()->schedule(Timer::makeAction([this] {
		auto myself = share_ref(this);
		m_idleTimer.reset();
		close();
	}), deadline);
}

} // namespace rdt
