#ifndef _library_threads__hpp__included__
#define _library_threads__hpp__included__

#include <cstdint>
#include <stdexcept>
#include <string>

#ifdef NATIVE_THREADS
#include <thread>
#include <condition_variable>
#include <mutex>
#include <future>
#include <exception>
#else
#ifndef BOOST_THREAD_PROVIDES_FUTURE
#define BOOST_THREAD_PROVIDES_FUTURE
#endif
#include <boost/thread.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/future.hpp>
#include <boost/exception_ptr.hpp>
#endif

namespace threads
{
#ifdef NATIVE_THREADS
typedef std::thread thread;
typedef std::condition_variable cv;
typedef std::mutex lock;
typedef std::unique_lock<std::mutex> alock;
typedef std::chrono::microseconds ustime;
template<typename T> using promise = std::promise<T>;
template<typename T> using future = std::future<T>;
inline void sleep(const ustime& t)
{
	std::this_thread::sleep_for(t);
}
template<typename T> inline void fail_promise(promise<T>& p, const std::string& msg)
{
	p.set_exception(std::make_exception_ptr(std::runtime_error(msg)));
}
#else
typedef boost::thread thread;
typedef boost::condition_variable cv;
typedef boost::mutex lock;
typedef boost::unique_lock<boost::mutex> alock;
typedef boost::posix_time::microseconds ustime;
template<typename T> using promise = boost::promise<T>;
template<typename T> using future = boost::future<T>;
inline void sleep(const ustime& t)
{
	boost::this_thread::sleep(t);
}
template<typename T> inline void fail_promise(promise<T>& p, const std::string& msg)
{
	p.set_exception(boost::copy_exception(std::runtime_error(msg)));
}
#endif

/**
 * Get a future that has already failed with std::runtime_error.
 *
 * Parameter msg: The error message.
 * Returns: The failed future.
 */
template<typename T> inline future<T> failed_future(const std::string& msg)
{
	promise<T> p;
	fail_promise(p, msg);
	return p.get_future();
}
}

#endif
