/*

Copyright (c) 2019-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/bdecode.hpp"

#include <cstdint>
#include <cstddef>

// decoding any input must either fail cleanly or produce a tree that can be
// walked and printed
extern "C" int LLVMFuzzerTestOneInput(std::uint8_t const* data, std::size_t size)
{
	bencode::error_code ec;
	int pos = -1;
	bencode::span<char const> const buf(reinterpret_cast<char const*>(data)
		, std::ptrdiff_t(size));
	bencode::entry const e = bencode::bdecode(buf, ec, &pos);
	if (ec) return 0;

	char error[200];
	if (bencode::has_soft_error(e, error)) return 0;
	e.to_string();
	return 0;
}
