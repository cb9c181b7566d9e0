// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>

#include "../include/rdt/Timer.hpp"

namespace rdt {

// --- Timer

Timer::Timer(Time when) :
	m_when(when),
	m_sequence(0),
	m_timerList(nullptr),
	m_canceled(false),
	m_rescheduled(false),
	m_firing(false)
{ }

bool Timer::isDue(Time now) const
{
	return m_when <= now;
}

Time Timer::getNextFireTime() const
{
	return m_when;
}

void Timer::setNextFireTime(Time when)
{
	if(isCanceled())
		return;

	// our position in the list depends on m_when, so take us out while it changes.
	if(m_timerList)
	{
		std::shared_ptr<Timer> myself = share_ref(this);
		TimerList *timerList = m_timerList;
		timerList->removeTimer(myself);
		m_when = when;
		timerList->addTimer(myself);
	}
	else
		m_when = when;

	m_rescheduled = true;
}

void Timer::cancel()
{
	m_canceled = true;
	if(not m_firing)
		action = nullptr; // break reference cycles through captured shared_ptrs

	if(m_timerList)
		m_timerList->removeTimer(share_ref(this));
	m_timerList = nullptr;
}

bool Timer::isCanceled() const
{
	return m_canceled;
}

bool Timer::operator< (const Timer &rhs) const
{
	if(m_when == rhs.m_when)
		return m_sequence < rhs.m_sequence;
	return m_when < rhs.m_when;
}

Timer::Action Timer::makeAction(const std::function<void(Time now)> &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time now) { fn(now); };
}

Timer::Action Timer::makeAction(const Task &fn)
{
	return [=] (const std::shared_ptr<Timer> &, Time) { fn(); };
}

void Timer::basicFire(const std::shared_ptr<Timer> &myself, Time now)
{
	if(isCanceled())
		return;

	TimerList *timerList = m_timerList;
	m_timerList = nullptr; // already removed by fireDueTimers
	m_rescheduled = false;

	m_firing = true;
	if(action)
		action(myself, now);
	m_firing = false;

	if(m_rescheduled and not isCanceled())
	{
		if(timerList and not m_timerList)
			timerList->addTimer(myself);
	}
	else
		cancel();
}

// --- TimerList

TimerList::TimerList() :
	m_nextSequence(0)
{ }

TimerList::~TimerList()
{
	clear();
}

std::shared_ptr<Timer> TimerList::schedule(Time when)
{
	auto rv = share_ref<Timer>(new Timer(when), false);
	addTimer(rv);
	return rv;
}

std::shared_ptr<Timer> TimerList::schedule(const Timer::Action &action, Time when)
{
	auto rv = schedule(when);
	rv->action = action;
	return rv;
}

Duration TimerList::howLongToNextFire(Time now, Duration maxInterval) const
{
	if(m_timers.empty())
		return maxInterval;

	return std::max(Duration(0), std::min(maxInterval, getNextFireTime() - now));
}

Time TimerList::getNextFireTime() const
{
	if(m_timers.empty())
		return INFINITY;
	return (*m_timers.begin())->getNextFireTime();
}

size_t TimerList::fireDueTimers(Time now)
{
	size_t rv = 0;

	while(not m_timers.empty())
	{
		auto it = m_timers.begin();
		std::shared_ptr<Timer> each = *it;

		if(not each->isDue(now))
			break;

		m_timers.erase(it);
		each->basicFire(each, now);
		rv++;
	}

	return rv;
}

void TimerList::addTimer(const std::shared_ptr<Timer> &timer)
{
	if((not timer) or timer->isCanceled())
		return;

	if(timer->m_timerList)
		timer->m_timerList->removeTimer(timer); // its sequence is about to change

	timer->m_timerList = this;
	timer->m_sequence = m_nextSequence++;
	m_timers.insert(timer);
}

void TimerList::removeTimer(const std::shared_ptr<Timer> &timer)
{
	if(not timer)
		return;

	timer->m_timerList = nullptr;
	m_timers.erase(timer);
}

size_t TimerList::size() const
{
	return m_timers.size();
}

void TimerList::clear()
{
	// cancel everything to clear potential circular references
	while(not m_timers.empty())
	{
		auto it = m_timers.begin();
		auto each = *it;
		m_timers.erase(it);
		each->m_timerList = nullptr;
		each->cancel();
	}
}

} // namespace rdt
