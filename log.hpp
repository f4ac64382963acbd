#pragma once

#include <iostream>
#include <map>
#include <memory>
#include <vector>
#include <mutex>
#include <string>
#include <boost/fiber/all.hpp>

#include "timestamp.hpp"

namespace exptrack {

template<size_t S=0>
struct Log
{
	std::vector<std::ostream*> & outs;
	std::scoped_lock<std::recursive_mutex> lock;
	bool do_log;

	Log(std::vector<std::ostream*> & outs, std::recursive_mutex & mutex, bool do_log)
		: outs(outs)
		, lock(mutex)
		, do_log(do_log)
	{}
};
template<typename T, size_t S=0>
std::unique_ptr<Log<S>> operator<<(std::unique_ptr<Log<S>> log, const T & t)
{
	if (log->do_log)
		for (auto & out : log->outs)
			*out << t;
	return log;
}
template<size_t S=0>
std::unique_ptr<Log<S>> operator<<(std::unique_ptr<Log<S>> log, const char * t)
{
	if (log->do_log)
		for (auto & out : log->outs)
			*out << t;
	return log;
}
// support for std::endl and other modifiers
template<size_t S=0>
std::unique_ptr<Log<S>> operator<<(std::unique_ptr<Log<S>> log, std::ostream& (*f)(std::ostream&))
{
	if (log->do_log)
		for (auto & out : log->outs)
			f(*out);
	return log;
}

enum class LogLevel
{
	DEBUG,
	INFO,
	WARNING,
	ERROR,
	FATAL,
	MUST_HAVE,
};
static inline const char * LogLevelNames[] =
{
	"DEBUG",
	"INFO",
	"WARNING",
	"ERROR",
	"FATAL",
	"MUST_HAVE",
};

// unknown names map to INFO
inline LogLevel parse_log_level(const std::string & name)
{
	if (name == "debug")
		return LogLevel::DEBUG;
	else if (name == "warning")
		return LogLevel::WARNING;
	else if (name == "error")
		return LogLevel::ERROR;
	else if (name == "fatal")
		return LogLevel::FATAL;
	else
		return LogLevel::INFO;
}

template<size_t S>
struct LogWithPrefix_
{
	std::string prefix;
	LogLevel level;
	std::vector<std::ostream*> outs;

	static inline std::recursive_mutex cout_mutex;

	LogWithPrefix_(std::string prefix = "")
		: prefix(std::move(prefix))
		, level(LogLevel::INFO)
	{}
	LogWithPrefix_(std::string prefix, const LogWithPrefix_ & other)
		: prefix(std::move(prefix))
		, level(other.level)
		, outs(other.outs)
	{}

	void set_level(LogLevel l) { level = l; }
	void add(std::ostream & out)
	{
		outs.push_back(&out);
	}
	void flush()
	{
		for (auto & out : outs)
			out->flush();
	}
};
template<size_t S=0>
std::unique_ptr<Log<S>> operator<<(LogWithPrefix_<S> & log, LogLevel level)
{
	return std::make_unique<Log<S>>(log.outs, LogWithPrefix_<S>::cout_mutex, level >= log.level) << UTCTimestampISO8601() << " [" << log.prefix << "] [" << LogLevelNames[(int)level] << "] ";
}

using LogWithPrefix = LogWithPrefix_<0>;


inline LogWithPrefix & default_logger()
{
	static LogWithPrefix log("");
	return log;
}
template<typename... Args>
LogWithPrefix & default_logger(std::ostream & o, Args&... args)
{
	LogWithPrefix & df = default_logger();
	df.add(o);
	return default_logger(args...);
}

// One logger per fiber, inheriting outputs and level from the default logger
// the first time a fiber asks for it. Threads not running fibers get the id of
// their main context.
inline LogWithPrefix & fiber_local_logger(std::string prefix = "")
{
	thread_local std::map<boost::fibers::fiber::id, LogWithPrefix> logs;
	auto p = logs.insert({boost::this_fiber::get_id(), {prefix, default_logger()}});
	return p.first->second;
}

inline std::unique_ptr<Log<0>>     debug() { return fiber_local_logger() << LogLevel::DEBUG    ; }
inline std::unique_ptr<Log<0>>      info() { return fiber_local_logger() << LogLevel::INFO     ; }
inline std::unique_ptr<Log<0>>   warning() { return fiber_local_logger() << LogLevel::WARNING  ; }
inline std::unique_ptr<Log<0>>     fatal() { return fiber_local_logger() << LogLevel::FATAL    ; }
inline std::unique_ptr<Log<0>> must_have() { return fiber_local_logger() << LogLevel::MUST_HAVE; }

} // namespace
