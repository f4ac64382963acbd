#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace exptrack {

// 2026-10-16T08:30:00.123Z
inline std::string UTCTimestampISO8601()
{
	auto now = std::chrono::system_clock::now();
	std::time_t t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::tm tm;
	gmtime_r(&t, &tm);

	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
	    << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
	return oss.str();
}

} // namespace
