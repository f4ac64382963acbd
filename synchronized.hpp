#pragma once

#include <mutex>
#include <utility>

namespace exptrack {

// Holds the lock for as long as it lives.
template<typename T, class Mutex>
class synchronized_proxy
{
	template<typename X, class Y>
	friend class synchronized;

private:
	synchronized_proxy() = delete;
	synchronized_proxy(const synchronized_proxy &) = delete;
	synchronized_proxy & operator=(const synchronized_proxy &) = delete;
	synchronized_proxy & operator=(synchronized_proxy &&) = delete;

	synchronized_proxy(Mutex & m, T & obj)
		:lock(m)
		,t(&obj)
	{}
	synchronized_proxy(Mutex & m, T & obj, int)
		:lock(m, std::try_to_lock)
		,t((lock)?&obj:nullptr)
	{}

public:
	synchronized_proxy(synchronized_proxy && other)
		:lock(std::move(other.lock))
		,t(other.t)
	{
		other.t = nullptr;
	}

	bool operator!() const { return !lock; }
	explicit operator bool() const { return bool(lock); }

	const T * operator->() const { return t; }
	      T * operator->()       { return t; }

	const T & operator*() const { return *t; }
	      T & operator*()       { return *t; }

private:
	std::unique_lock<Mutex> lock;
	T * t;
};


// Serializes every access to a T through a Mutex. Works with std::mutex
// across threads and with boost::fibers::mutex across fibers.
template<typename T, class Mutex=std::mutex>
class synchronized
{
public:
	using proxy_type = synchronized_proxy<T,Mutex>;

	synchronized() = default;

	template<typename... Args>
	explicit synchronized(Args&&... args)
		:t(std::forward<Args>(args)...)
	{}

	proxy_type     lock() { return proxy_type(mutex, t   ); }
	proxy_type try_lock() { return proxy_type(mutex, t, 0); }

	proxy_type operator->() {
		return proxy_type(mutex, t);
	}
	proxy_type operator*() {
		return proxy_type(mutex, t);
	}

protected:
	T t;
	Mutex mutex;
};

} // namespace
