// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rdt/RunLoop.hpp"

namespace rdt {

RunLoop::RunLoop() :
	m_origin(std::chrono::steady_clock::now()),
	m_timeCache(0),
	m_timeIsCached(false),
	m_stopping(false)
{ }

bool RunLoop::registerDescriptor(int fd, Condition cond, const Task &task)
{
	if(not task)
		return registerDescriptor(fd, cond, Action());
	return registerDescriptor(fd, cond, [task] (RunLoop *, int, Condition) { task(); });
}

void RunLoop::unregisterDescriptor(int fd)
{
	unregisterDescriptor(fd, READABLE);
	unregisterDescriptor(fd, WRITABLE);
	unregisterDescriptor(fd, EXCEPTION);
}

std::shared_ptr<Timer> RunLoop::schedule(Time when)
{
	return m_timers.schedule(when);
}

std::shared_ptr<Timer> RunLoop::schedule(const Timer::Action &action, Time when)
{
	return m_timers.schedule(action, when);
}

std::shared_ptr<Timer> RunLoop::scheduleRel(Duration delta)
{
	return schedule(getCurrentTime() + delta);
}

std::shared_ptr<Timer> RunLoop::scheduleRel(const Timer::Action &action, Duration delta)
{
	return schedule(action, getCurrentTime() + delta);
}

void RunLoop::doLater(const Task &task)
{
	m_doLaters.push(task);
}

void RunLoop::stop()
{
	m_stopping = true;
}

bool RunLoop::isStopping() const
{
	return m_stopping;
}

Time RunLoop::getCurrentTime() const
{
	return m_timeIsCached ? m_timeCache : getCurrentTimeNoCache();
}

Time RunLoop::getCurrentTimeNoCache() const
{
	using namespace std::chrono;
	return duration_cast<duration<Time>>(steady_clock::now() - m_origin).count();
}

size_t RunLoop::getPendingTimerCount() const
{
	return m_timers.size();
}

void RunLoop::cacheTime()
{
	m_timeCache = getCurrentTimeNoCache();
	m_timeIsCached = true;
}

void RunLoop::uncacheTime()
{
	m_timeIsCached = false;
}

Duration RunLoop::howLongToSleep() const
{
	if(hasDoLaters())
		return 0;
	return m_timers.howLongToNextFire(getCurrentTime());
}

void RunLoop::afterWait()
{
	processDoLaters();

	if(not m_stopping)
		m_timers.fireDueTimers(getCurrentTime());

	if(onEveryCycle and not m_stopping)
		onEveryCycle();
}

bool RunLoop::hasDoLaters() const
{
	return not m_doLaters.empty();
}

void RunLoop::processDoLaters()
{
	while((not m_stopping) and hasDoLaters())
	{
		Task task = m_doLaters.front();
		m_doLaters.pop();
		if(task)
			task();
	}
}

void RunLoop::clear()
{
	m_timers.clear();

	while(hasDoLaters()) // std::queue doesn't have a clear
		m_doLaters.pop();
}

} // namespace rdt
