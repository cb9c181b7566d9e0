#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <chrono>
#include <cmath>
#include <queue>

#include "Timer.hpp"

namespace rdt {

// A single-threaded event loop waiting on three kinds of event sources at
// once: descriptors becoming readable/writable, the nearest Timer deadline,
// and tasks queued with doLater(). Every wait is bounded by the nearest
// deadline, so a quiet network never delays a retransmission.
class RunLoop : public Object {
public:
	static const size_t NUM_CONDITIONS = 3;

	enum Condition { READABLE, WRITABLE, EXCEPTION };
	using Action = std::function<void(RunLoop *sender, int fd, Condition cond)>;

	RunLoop();

	// Answers false if fd can't be watched for cond (epoll refuses regular
	// files, select refuses fds past FD_SETSIZE) or action is empty.
	virtual bool registerDescriptor(int fd, Condition cond, const Action &action) = 0;
	virtual bool registerDescriptor(int fd, Condition cond, const Task &task);
	virtual void unregisterDescriptor(int fd, Condition cond) = 0;
	virtual void unregisterDescriptor(int fd); // unregister any actions for fd

	std::shared_ptr<Timer> schedule(Time when);
	std::shared_ptr<Timer> schedule(const Timer::Action &action, Time when);

	std::shared_ptr<Timer> scheduleRel(Duration delta);
	std::shared_ptr<Timer> scheduleRel(const Timer::Action &action, Duration delta);

	virtual void doLater(const Task &task);

	// Run until stop() or runInterval seconds elapse.
	virtual void run(Duration runInterval = INFINITY) = 0;
	virtual void stop();
	bool isStopping() const;

	virtual Time getCurrentTime() const;
	virtual Time getCurrentTimeNoCache() const;

	size_t getPendingTimerCount() const;

	virtual void clear();

	// called every time through the run loop
	Task onEveryCycle;

protected:
	void cacheTime();
	void uncacheTime();

	Duration howLongToSleep() const;
	void     afterWait(); // doLaters, due timers, onEveryCycle

	bool hasDoLaters() const;
	void processDoLaters();

	std::chrono::steady_clock::time_point m_origin;
	Time             m_timeCache;
	bool             m_timeIsCached;
	TimerList        m_timers;
	volatile bool    m_stopping;
	std::queue<Task> m_doLaters;
};

} // namespace rdt
