/*

Copyright (c) 2019-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(std::uint8_t const*, std::size_t);

// replays test case files when not linked against libFuzzer
int main(int const argc, char const** argv)
{
	if (argc < 2)
	{
		std::cerr << "usage: " << argv[0] << " test-case-file...\n";
		return 1;
	}

	for (int i = 1; i < argc; ++i)
	{
		std::ifstream f(argv[i], std::ios_base::binary);
		if (!f)
		{
			std::cerr << "failed to open: " << argv[i] << "\n";
			return 1;
		}
		std::vector<char> const buf{std::istreambuf_iterator<char>(f)
			, std::istreambuf_iterator<char>()};
		std::cout << argv[i] << " (" << buf.size() << " bytes)\n";
		LLVMFuzzerTestOneInput(reinterpret_cast<std::uint8_t const*>(buf.data())
			, buf.size());
	}
	return 0;
}
