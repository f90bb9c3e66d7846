/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_ASSERT_HPP_INCLUDED
#define BENCODE_ASSERT_HPP_INCLUDED

#include "bencode/config.hpp"

#ifdef _MSC_VER
#define BENCODE_WHILE_0  \
	__pragma( warning(push) ) \
	__pragma( warning(disable:4127) ) \
	while (false) \
	__pragma( warning(pop) )
#else
#define BENCODE_WHILE_0 while (false)
#endif

namespace bencode {

	// internal. Prints the failed expression and where it is, then aborts
	[[noreturn]] BENCODE_EXPORT void assert_fail(char const* expr, int line
		, char const* file, char const* function);
}

#if BENCODE_USE_ASSERTS
#define BENCODE_ASSERT(x) \
	do { if (x) {} else bencode::assert_fail(#x, __LINE__, __FILE__, __func__); } BENCODE_WHILE_0
#else
#define BENCODE_ASSERT(x) do {} BENCODE_WHILE_0
#endif

#endif // BENCODE_ASSERT_HPP_INCLUDED
