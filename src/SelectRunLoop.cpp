// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <queue>

#include <sys/select.h>

#include "../include/rdt/SelectRunLoop.hpp"

namespace rdt {

struct SelectRunLoop::Item {
	Item(int fd, Condition cond, const Action &action) :
		m_fd(fd),
		m_condition(cond),
		m_action(action),
		m_canceled(false)
	{ }

	int       m_fd;
	Condition m_condition;
	Action    m_action;
	bool      m_canceled;
};

namespace {

using ItemMap = std::map<int, std::shared_ptr<SelectRunLoop::Item> >;

void fillFdset(fd_set *fdset, int &maxFd, const ItemMap &items)
{
	FD_ZERO(fdset);

	for(auto it = items.begin(); it != items.end(); it++)
	{
		FD_SET(it->first, fdset);
		if(it->first > maxFd)
			maxFd = it->first;
	}
}

void collectActivated(fd_set *fdset, const ItemMap &items, std::queue<std::shared_ptr<SelectRunLoop::Item> > &queue)
{
	for(auto it = items.begin(); it != items.end(); it++)
		if(FD_ISSET(it->first, fdset))
			queue.push(it->second);
}

void cancelItems(ItemMap &items)
{
	for(auto it = items.begin(); it != items.end(); it++)
		it->second->m_canceled = true;
	items.clear();
}

} // anonymous namespace

bool SelectRunLoop::registerDescriptor(int fd, Condition cond, const Action &action)
{
	if((fd < 0) or (fd >= FD_SETSIZE))
		return false;

	unregisterDescriptor(fd, cond);

	if(not action)
		return false;

	m_items[cond][fd] = std::make_shared<Item>(fd, cond, action);
	return true;
}

void SelectRunLoop::unregisterDescriptor(int fd, Condition cond)
{
	auto it = m_items[cond].find(fd);
	if(it != m_items[cond].end())
	{
		it->second->m_canceled = true;
		m_items[cond].erase(it);
	}
}

void SelectRunLoop::run(Duration runInterval)
{
	std::queue<std::shared_ptr<Item> > activatedItems;

	m_stopping = false;
	std::shared_ptr<Timer> stopTimer = schedule(Timer::makeAction([this] { stop(); }), getCurrentTimeNoCache() + runInterval);

	cacheTime();

	do {
		Duration sleepTime = howLongToSleep() + 0.0000005; // round up 1/2 µs
		struct timeval timeout;
		timeout.tv_sec = (time_t)sleepTime;
		timeout.tv_usec = (suseconds_t)((sleepTime - timeout.tv_sec) * 1000000);

		fd_set readfds, writefds, errorfds;
		int maxFd = -1;
		fillFdset(&readfds,  maxFd, m_items[READABLE]);
		fillFdset(&writefds, maxFd, m_items[WRITABLE]);
		fillFdset(&errorfds, maxFd, m_items[EXCEPTION]);

		uncacheTime();
		int rv = select(maxFd + 1, &readfds, &writefds, &errorfds, &timeout);
		cacheTime();

		if(rv > 0)
		{
			collectActivated(&errorfds, m_items[EXCEPTION], activatedItems); // exceptions first
			collectActivated(&readfds,  m_items[READABLE],  activatedItems);
			collectActivated(&writefds, m_items[WRITABLE],  activatedItems);

			while(not activatedItems.empty())
			{
				std::shared_ptr<Item> each = activatedItems.front();
				activatedItems.pop();
				if((not each->m_canceled) and (not m_stopping))
					each->m_action(this, each->m_fd, each->m_condition);
			}
		}
		else if((rv < 0) and (EINTR != errno))
			break;

		afterWait();
	} while(not m_stopping);

	uncacheTime();

	stopTimer->cancel();
}

void SelectRunLoop::clear()
{
	RunLoop::clear();
	cancelItems(m_items[READABLE]);
	cancelItems(m_items[WRITABLE]);
	cancelItems(m_items[EXCEPTION]);
}

} // namespace rdt
