#pragma once

#include <algorithm>
#include <iterator>

namespace exptrack {

template<typename C>
bool in(const typename C::value_type & t, const C & c)
{
	return std::find(std::begin(c), std::end(c), t) != std::end(c);
}

// first element whose pointee equals *p, null p matches nothing
template<typename C, typename P>
auto find_pointee(C & c, const P & p)
{
	if ( ! p)
		return std::end(c);
	return std::find_if(std::begin(c), std::end(c), [&p](const auto & elm) { return elm && *elm == *p; });
}

} // namespace
