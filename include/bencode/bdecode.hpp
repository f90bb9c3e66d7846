/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_BDECODE_HPP_INCLUDED
#define BENCODE_BDECODE_HPP_INCLUDED

#include <string>
#include <cstddef>

#include "bencode/config.hpp"
#include "bencode/assert.hpp"
#include "bencode/error_code.hpp"
#include "bencode/entry.hpp"
#include "bencode/span.hpp"

/*

This is a strict recursive descent bdecoder. It decodes a complete buffer
into an owning entry tree. Every production is chosen by a single byte of
lookahead:

	<BE>    ::= <DICT> | <LIST> | <STR> | <INT>
	<DICT>  ::= "d" 1 * (<STR> <BE>) "e"
	<LIST>  ::= "l" 1 * <BE> "e"
	<STR>   ::= <NUM> ":" n * <CHAR>     ; n equals <NUM>
	<INT>   ::= "i" <SNUM> "e"
	<SNUM>  ::= "-" <NUM> / <NUM>
	<NUM>   ::= 1 * <DIGIT>

Note that lists and dictionaries must have at least one element. "le" and
"de" are rejected. Numbers may not have leading zeros (except "0" itself)
and "-0" is not a valid integer.

The buffer must contain exactly one value. Bytes following the first
complete value are an error.

*/

namespace bencode {

	// hidden
	BENCODE_EXPORT boost::system::error_category& bdecode_category();

namespace bdecode_errors
{
	// libbencode uses boost.system's ``error_code`` class to represent
	// errors. The decoder has its own error category bdecode_category()
	// with the error codes defined by error_code_enum.
	enum error_code_enum
	{
		// Not an error
		no_error = 0,
		// the buffer to decode is empty
		empty_input,
		// expected value (list, dict, int or string) in bencoded string. This
		// is also reported for a missing digit or a non-string dictionary key
		invalid_grammar,
		// unexpected end of file in bencoded string
		unexpected_eof,
		// a delimiter (':' or 'e') was expected, but something else was found
		unexpected_byte,
		// an integer or string length has a leading zero
		leading_zero,
		// the integer "-0" is not allowed
		negative_zero,
		// a string's length prefix is greater than the remaining buffer
		truncated_string,
		// there are bytes left after the bencoded value
		trailing_data,
		// bencoded recursion depth limit exceeded
		depth_exceeded,
		// bencoded item count limit exceeded
		limit_exceeded,
		// integer overflow
		overflow,

		// the number of error codes
		error_code_max
	};

	// hidden
	BENCODE_EXPORT boost::system::error_code make_error_code(error_code_enum e);
}

	// The exception thrown by the throwing overload of bdecode(). In addition
	// to the error code, it holds the byte offset into the buffer where the
	// decoder detected the error.
	struct BENCODE_EXPORT bdecode_error : system_error
	{
		bdecode_error(error_code const& ec, int pos);
		bdecode_error(bdecode_error const&) = default;
		bdecode_error& operator=(bdecode_error const&) = default;
		~bdecode_error() override;

		// the byte offset into the decoded buffer where the error was detected
		int position() const noexcept { return m_pos; }

	private:
		int m_pos;
	};

	// This function decodes/parses bencoded data (for example a .torrent file).
	// The data structure is returned as an owning entry. The buffer to parse is
	// specified by ``buffer``. If the buffer fails to parse, the function
	// returns an entry of type ``undefined_t`` and fills in ``ec`` with the
	// error code. The optional argument ``error_pos``, if set to non-null,
	// will be set to the byte offset into the buffer where the parse failure
	// occurred.
	//
	// ``depth_limit`` specifies the max number of nested lists or dictionaries
	// allowed in the data structure. This bounds the stack usage of the
	// function, be careful not to set it too high.
	//
	// ``token_limit`` is the max number of values (strings, integers, lists
	// and dictionaries, not counting dictionary keys) allowed to be parsed
	// from the buffer. This is simply a sanity check to not have unbounded
	// memory usage.
	//
	// The returned entry does not refer back into ``buffer``, the buffer may
	// be freed as soon as this function returns.
	//
	// The overload without an error_code argument throws bdecode_error on
	// failure.
	BENCODE_EXPORT entry bdecode(span<char const> buffer
		, error_code& ec, int* error_pos = nullptr, int depth_limit = 100
		, int token_limit = 1000000);
	BENCODE_EXPORT entry bdecode(span<char const> buffer
		, int depth_limit = 100, int token_limit = 1000000);

namespace aux {
	// the length of a character array, not counting a terminating null
	template <std::size_t N>
	std::ptrdiff_t text_length(char const (&buf)[N])
	{ return std::ptrdiff_t(buf[N - 1] == '\0' ? N - 1 : N); }
}

	// character arrays, such as string literals. A terminating null is not
	// part of the buffer
	template <std::size_t N>
	entry bdecode(char const (&buffer)[N], error_code& ec
		, int* error_pos = nullptr, int depth_limit = 100
		, int token_limit = 1000000)
	{
		return bdecode(span<char const>(buffer, aux::text_length(buffer))
			, ec, error_pos, depth_limit, token_limit);
	}

	template <std::size_t N>
	entry bdecode(char const (&buffer)[N]
		, int depth_limit = 100, int token_limit = 1000000)
	{
		return bdecode(span<char const>(buffer, aux::text_length(buffer))
			, depth_limit, token_limit);
	}

	// The same as above, with the buffer specified by its ``start`` and
	// ``end`` (one past the last byte). Returns 0 on success and -1 on
	// failure.
	BENCODE_EXPORT int bdecode(char const* start, char const* end, entry& ret
		, error_code& ec, int* error_pos = nullptr, int depth_limit = 100
		, int token_limit = 1000000);

	// checks a decoded tree for issues that are not errors in the grammar, but
	// that a bencoded buffer produced by a conforming encoder would not
	// have. Currently this is dictionary keys that are not sorted in
	// ascending byte-wise order. Returns true if an issue was found, and
	// writes a null-terminated description into ``error``.
	BENCODE_EXPORT bool has_soft_error(entry const& e, span<char> error);
}

namespace boost { namespace system {

	template<> struct is_error_code_enum<bencode::bdecode_errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif // BENCODE_BDECODE_HPP_INCLUDED
