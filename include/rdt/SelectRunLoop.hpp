#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>

#include "RunLoop.hpp"

namespace rdt {

// Portable RunLoop on select(2).
class SelectRunLoop : public RunLoop {
public:
	using RunLoop::registerDescriptor;
	using RunLoop::unregisterDescriptor;

	bool registerDescriptor(int fd, Condition cond, const Action &action) override;
	void unregisterDescriptor(int fd, Condition cond) override;

	void run(Duration runInterval = INFINITY) override;

	void clear() override;

	struct Item;

protected:
	std::map<int, std::shared_ptr<Item> > m_items[NUM_CONDITIONS];
};

} // namespace rdt
