#pragma once

// Copyright © 2022 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>
#include <queue>

#include "RunLoop.hpp"

namespace rdt {

// RunLoop on Linux epoll(7). On other systems it is declared but not usable;
// use PreferredRunLoop from RunLoops.hpp.
class EPollRunLoop : public RunLoop {
public:
	EPollRunLoop();
	~EPollRunLoop();

	using RunLoop::registerDescriptor;
	using RunLoop::unregisterDescriptor;

	bool registerDescriptor(int fd, Condition cond, const Action &action) override;
	void unregisterDescriptor(int fd, Condition cond) override;

	void run(Duration runInterval = INFINITY) override;

	void clear() override;

protected:
	struct Descriptor;
	struct DescriptorItem;

	void processActivatedItems(std::queue<std::shared_ptr<DescriptorItem>> &activatedItems, Condition cond);

	int m_epoll;
	std::map<int, std::shared_ptr<Descriptor>> m_descriptors;
};

} // namespace rdt
