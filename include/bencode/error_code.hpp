/*

Copyright (c) 2008-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_ERROR_CODE_HPP_INCLUDED
#define BENCODE_ERROR_CODE_HPP_INCLUDED

#include "bencode/config.hpp"

#include "bencode/aux_/disable_warnings_push.hpp"
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include "bencode/aux_/disable_warnings_pop.hpp"

namespace bencode {

	using boost::system::error_code;
	using boost::system::system_error;

	// errors raised by entry. Decoding errors have their own category, see
	// bdecode_category()
	namespace errors
	{
		enum error_code_enum
		{
			no_error = 0,
			// an accessor was called for a type the entry doesn't hold, or
			// a const dictionary lookup did not find its key
			invalid_entry_type,

			error_code_max
		};

		// hidden
		BENCODE_EXPORT error_code make_error_code(error_code_enum e);
	}

	// the category of errors::error_code_enum, named "bencode"
	BENCODE_EXPORT boost::system::error_category& bencode_category();
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<bencode::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif // BENCODE_ERROR_CODE_HPP_INCLUDED
