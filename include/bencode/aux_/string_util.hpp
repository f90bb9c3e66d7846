/*

Copyright (c) 2012-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_STRING_UTIL_HPP_INCLUDED
#define BENCODE_STRING_UTIL_HPP_INCLUDED

#include "bencode/config.hpp"
#include "bencode/span.hpp"

#include <string>
#include <cstdint>

namespace bencode::aux {

	// decimal representation of n, including INT64_MIN
	std::string to_string(std::int64_t n);

	inline bool is_digit(char const c)
	{ return c >= '0' && c <= '9'; }

	// printable 7-bit ASCII, space included
	bool is_print(char c);

	// true if to_string() should print this string as hex
	bool is_binary(span<char const> str);

	std::string to_hex(span<char const> in);
}

#endif // BENCODE_STRING_UTIL_HPP_INCLUDED
