#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <atomic>
#include <functional>
#include <memory>

namespace rdt {

// Base for reference counted protocol objects (sessions, senders, receipts,
// timers). Objects are created with a count of one and handed out as
// shared_ptrs via share_ref().
class Object {
public:
	Object() : m_refcount(1) {}
	virtual ~Object() {}

	void retain()  { m_refcount++; }
	void release() { if(0 == --m_refcount) delete this; }

	static void retain(Object *obj)  { if(obj) obj->retain(); }
	static void release(Object *obj) { if(obj) obj->release(); }

	// used by pointer only.
	Object(const Object&) = delete;
	Object& operator= (const Object&) = delete;

protected:
	std::atomic_long m_refcount;
};

// Answer a shared_ptr that owns one reference to obj. Pass retain=false to adopt
// the reference that came with new.
template <class T> std::shared_ptr<T> share_ref(T *obj, bool retain = true)
{
	if(retain)
		Object::retain(obj);
	return std::shared_ptr<T>(obj, [] (Object *p) { Object::release(p); });
}

template <class T> struct deref_less {
	bool operator() (const T& l, const T& r) const
	{
		if(r and not l)
			return true;
		if(not r)
			return false;
		return *l < *r;
	}
};

using Task = std::function<void(void)>;

} // namespace rdt
