/*

Copyright (c) 2019-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "bencode/bdecode.hpp"

using namespace bencode::literals;

namespace {

void print_usage()
{
	std::cerr << "usage: dump_bdecode file [options]\n"
		"\n"
		"decodes a bencoded file and prints it.\n"
		"\n"
		"OPTIONS:\n"
		"--items-limit <count>  the max number of values to decode\n"
		"--depth-limit <count>  the max nesting of lists and dictionaries\n"
		"--soft-errors          fail if a dictionary has unsorted keys\n";
}

// parses a non-negative int command line argument. Returns false if it's
// not a number or out of range
bool parse_limit(char const* str, int& out)
{
	char* end = nullptr;
	errno = 0;
	long const v = std::strtol(str, &end, 10);
	if (end == str || *end != '\0' || errno == ERANGE || v < 0 || v > INT_MAX)
		return false;
	out = int(v);
	return true;
}

} // anonymous namespace

int main(int argc, char const* argv[])
{
	if (argc < 2)
	{
		print_usage();
		return 1;
	}

	char const* filename = argv[1];
	int depth_limit = 1000;
	int items_limit = 2000000;
	bool soft_errors = false;

	for (int i = 2; i < argc; ++i)
	{
		bencode::string_view const opt = argv[i];
		if (opt == "--soft-errors"_sv)
		{
			soft_errors = true;
			continue;
		}

		int* limit = opt == "--items-limit"_sv ? &items_limit
			: opt == "--depth-limit"_sv ? &depth_limit
			: nullptr;
		if (limit == nullptr)
		{
			std::cerr << "unknown option: " << opt << "\n";
			print_usage();
			return 1;
		}
		if (i + 1 == argc || !parse_limit(argv[i + 1], *limit))
		{
			std::cerr << opt << " expects a non-negative number\n";
			return 1;
		}
		++i;
	}

	std::ifstream in(filename, std::ios_base::binary);
	if (!in)
	{
		std::cerr << "failed to open \"" << filename << "\": "
			<< std::strerror(errno) << "\n";
		return 1;
	}
	std::string const buf{std::istreambuf_iterator<char>(in)
		, std::istreambuf_iterator<char>()};

	bencode::error_code ec;
	int pos = -1;
	bencode::entry const e = bencode::bdecode(buf, ec, &pos, depth_limit
		, items_limit);
	if (ec)
	{
		std::cerr << "failed to decode: '" << ec.message()
			<< "' at character: " << pos << "\n";
		return 1;
	}

	std::cout << e << "\n";

	char error[200];
	if (soft_errors && bencode::has_soft_error(e, error))
	{
		std::cerr << "soft error: " << error << "\n";
		return 2;
	}
	return 0;
}
