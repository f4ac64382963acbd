#pragma once

#include <string>
#include <stdexcept>

#include <boost/stacktrace.hpp>
#include <boost/exception/all.hpp>

namespace exptrack {

typedef boost::error_info<struct tag_stacktrace, boost::stacktrace::stacktrace> traced;

[[noreturn]] inline void throw_invalid_argument(const std::string & what)
{
	throw boost::enable_error_info(std::invalid_argument(what))
		<< traced(boost::stacktrace::stacktrace());
}

template<typename O>
void print_trace(O & out, const std::exception & e)
{
	const boost::stacktrace::stacktrace* st = boost::get_error_info<traced>(e);
	if (st)
		out << *st << '\n';
}

} // namespace
