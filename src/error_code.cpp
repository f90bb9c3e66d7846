/*

Copyright (c) 2008-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/error_code.hpp"

#include <string>

namespace bencode {

namespace {

	struct entry_error_category final : boost::system::error_category
	{
		char const* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "bencode"; }

		std::string message(int const ev) const override
		{
			switch (ev)
			{
				case errors::no_error: return "no error";
				case errors::invalid_entry_type: return "invalid type requested from entry";
			}
			return "Unknown error";
		}

		boost::system::error_condition default_error_condition(
			int const ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};
}

	boost::system::error_category& bencode_category()
	{
		static entry_error_category cat;
		return cat;
	}

	error_code errors::make_error_code(error_code_enum const e)
	{
		return {e, bencode_category()};
	}
}
