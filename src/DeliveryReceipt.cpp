// Copyright © 2026 The rdt Authors
// SPDX-License-Identifier: MIT

#include "../include/rdt/DeliveryReceipt.hpp"

namespace rdt {

DeliveryReceipt::DeliveryReceipt(Time origin, uintmax_t firstId, size_t segmentCount) :
	m_origin(origin),
	m_firstId(firstId),
	m_segmentCount(segmentCount),
	m_ackedCount(0),
	m_started(false),
	m_failed(false)
{ }

Time DeliveryReceipt::createdAt() const
{
	return m_origin;
}

uintmax_t DeliveryReceipt::getFirstId() const
{
	return m_firstId;
}

uintmax_t DeliveryReceipt::getLastId() const
{
	return m_firstId + m_segmentCount - 1;
}

size_t DeliveryReceipt::getSegmentCount() const
{
	return m_segmentCount;
}

size_t DeliveryReceipt::getAckedCount() const
{
	return m_ackedCount;
}

bool DeliveryReceipt::isStarted() const
{
	return m_started;
}

bool DeliveryReceipt::isDelivered() const
{
	return (m_ackedCount == m_segmentCount) and not m_failed;
}

bool DeliveryReceipt::isFailed() const
{
	return m_failed;
}

bool DeliveryReceipt::isFinished() const
{
	return isDelivered() or isFailed();
}

void DeliveryReceipt::start()
{
	m_started = true;
}

void DeliveryReceipt::segmentAcked()
{
	if(isFinished())
		return;

	if(++m_ackedCount == m_segmentCount)
	{
		auto finished = onFinished;
		onFinished = nullptr; // in case of circular references
		if(finished)
			finished(false);
	}
}

void DeliveryReceipt::fail()
{
	if(isFinished())
		return;

	m_failed = true;

	auto finished = onFinished;
	onFinished = nullptr;
	if(finished)
		finished(true);
}

} // namespace rdt
