#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <set>

#include "Object.hpp"

namespace rdt {

class TimerList;

using Time = long double; // A point in time, as seconds since an epoch.
using Duration = long double; // A period of time in seconds.

// A one-shot deadline. Rescheduling from within the action keeps the timer
// alive, otherwise it is canceled after firing.
class Timer : public Object {
public:
	Timer(Time when);
	Timer() = delete;

	using Action = std::function<void(const std::shared_ptr<Timer> &sender, Time now)>;
	Action action;

	bool isDue(Time now) const;
	Time getNextFireTime() const;
	void setNextFireTime(Time when);

	void cancel();
	bool isCanceled() const;

	static Action makeAction(const std::function<void(Time now)> &fn);
	static Action makeAction(const Task &fn);

	bool operator< (const Timer &rhs) const;

protected:
	friend class TimerList;

	void basicFire(const std::shared_ptr<Timer> &myself, Time now);

	Time       m_when;
	uintmax_t  m_sequence; // when added to its list, to fire equal deadlines first-come first-served
	TimerList *m_timerList;
	bool       m_canceled    :1;
	bool       m_rescheduled :1;
	bool       m_firing      :1;
};

// Timers ordered by deadline, so the next deadline is always at the front.
// Timers with the same deadline fire in the order they were scheduled.
class TimerList : public Object {
public:
	TimerList();
	~TimerList();

	std::shared_ptr<Timer> schedule(Time when);
	std::shared_ptr<Timer> schedule(const Timer::Action &action, Time when);

	Duration howLongToNextFire(Time now, Duration maxInterval = 5) const;
	Time     getNextFireTime() const; // INFINITY if empty

	size_t fireDueTimers(Time now); // answer number of timers fired

	void addTimer(const std::shared_ptr<Timer> &timer);
	void removeTimer(const std::shared_ptr<Timer> &timer);

	size_t size() const;
	void   clear();

protected:
	std::set<std::shared_ptr<Timer>, deref_less<std::shared_ptr<Timer> > > m_timers;
	uintmax_t m_nextSequence;
};

} // namespace rdt
