/*

Copyright (c) 2012-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/aux_/string_util.hpp"

#include <algorithm>

namespace bencode::aux {

	std::string to_string(std::int64_t const n)
	{
		// the magnitude is computed unsigned, -INT64_MIN does not fit an int64
		std::uint64_t mag = n < 0 ? 0 - std::uint64_t(n) : std::uint64_t(n);
		char digits[24];
		char* p = digits + sizeof(digits);
		do
		{
			*--p = char('0' + mag % 10);
			mag /= 10;
		} while (mag != 0);
		if (n < 0) *--p = '-';
		return std::string(p, digits + sizeof(digits));
	}

	bool is_print(char const c)
	{
		return c >= 0x20 && c <= 0x7e;
	}

	bool is_binary(span<char const> str)
	{
		return !std::all_of(str.begin(), str.end(), &is_print);
	}

	std::string to_hex(span<char const> in)
	{
		static char const digits[] = "0123456789abcdef";
		std::string ret(std::size_t(in.size()) * 2, '0');
		std::size_t i = 0;
		for (char const c : in)
		{
			ret[i++] = digits[(std::uint8_t(c) >> 4) & 0xf];
			ret[i++] = digits[std::uint8_t(c) & 0xf];
		}
		return ret;
	}
}
