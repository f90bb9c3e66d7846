/*

Copyright (c) 2007-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace bencode {

	void assert_fail(char const* expr, int const line
		, char const* file, char const* function)
	{
		std::fprintf(stderr, "assertion failed in libbencode\n"
			"file: '%s'\n"
			"line: %d\n"
			"function: %s\n"
			"expression: %s\n"
			, file, line, function, expr);
		std::fflush(stderr);
		std::abort();
	}
}
