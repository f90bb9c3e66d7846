/*

Copyright (c) 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/bdecode.hpp"
#include "bencode/aux_/string_util.hpp"
#include "bencode/aux_/throw.hpp"

#include <limits>
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdio> // for snprintf

#ifndef BOOST_SYSTEM_NOEXCEPT
#define BOOST_SYSTEM_NOEXCEPT throw()
#endif

namespace bencode {

	struct bdecode_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(
			int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* bdecode_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "bdecode";
	}

	std::string bdecode_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"empty bencoded buffer",
			"expected value (list, dict, int or string) in bencoded string",
			"unexpected end of file in bencoded string",
			"unexpected character in bencoded string",
			"leading zero in bencoded integer",
			"negative zero in bencoded integer",
			"bencoded string length exceeds buffer",
			"trailing data after bencoded value",
			"bencoded nesting depth exceeded",
			"bencoded item count limit exceeded",
			"integer overflow",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& bdecode_category()
	{
		static bdecode_error_category bdecode_category;
		return bdecode_category;
	}

	namespace bdecode_errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, bdecode_category()};
		}
	}

	bdecode_error::bdecode_error(error_code const& ec, int const pos)
		: system_error(ec)
		, m_pos(pos)
	{}

	bdecode_error::~bdecode_error() = default;

#define BENCODE_FAIL_BDECODE(code) do { \
	ec = code; \
	if (error_pos) *error_pos = int(start - orig_start); \
	return false; \
	} BENCODE_WHILE_0

namespace {

	// the cursor of a single call to bdecode(). Every decode_* function
	// expects the cursor to point to the first byte of its production, and
	// leaves it pointing to the first byte after it. They return false on
	// failure, with ec and *error_pos filled in. Nothing is consumed beyond
	// the byte where an error is detected.
	struct bdecoder
	{
		bdecoder(span<char const> buffer, error_code& e, int* pos
			, int const depth, int const tokens)
			: start(buffer.data())
			, end(buffer.data() + buffer.size())
			, orig_start(buffer.data())
			, ec(e)
			, error_pos(pos)
			, depth_limit(depth)
			, token_limit(tokens)
		{}

		bool decode_value(entry& ret, int depth);

		// called once the top level value has been decoded
		bool finish()
		{
			if (start != end)
				BENCODE_FAIL_BDECODE(bdecode_errors::trailing_data);
			return true;
		}

	private:

		bool peek(char const c) const { return start != end && *start == c; }
		bool peek_digit() const { return start != end && aux::is_digit(*start); }

		bool decode_dict(entry& ret, int depth);
		bool decode_list(entry& ret, int depth);
		bool decode_int(entry& ret);
		bool decode_string(string_view& str);
		bool decode_number(std::uint64_t& val, std::uint64_t limit);

		char const* start;
		char const* const end;
		char const* const orig_start;
		error_code& ec;
		int* error_pos;
		int const depth_limit;
		int token_limit;
	};

	bool bdecoder::decode_value(entry& ret, int const depth)
	{
		if (start == end)
			BENCODE_FAIL_BDECODE(bdecode_errors::invalid_grammar);

		--token_limit;
		if (token_limit < 0)
			BENCODE_FAIL_BDECODE(bdecode_errors::limit_exceeded);

		switch (*start)
		{
			case 'd': return decode_dict(ret, depth);
			case 'l': return decode_list(ret, depth);
			case 'i': return decode_int(ret);
			default:
			{
				// this is the case for strings. The start character is any
				// numeric digit
				if (!aux::is_digit(*start))
					BENCODE_FAIL_BDECODE(bdecode_errors::invalid_grammar);

				string_view str;
				if (!decode_string(str)) return false;
				ret = str;
				return true;
			}
		}
	}

	bool bdecoder::decode_dict(entry& ret, int const depth)
	{
		BENCODE_ASSERT(peek('d'));
		if (depth >= depth_limit)
			BENCODE_FAIL_BDECODE(bdecode_errors::depth_exceeded);
		++start;

		entry::dictionary_type& dict = ret.dict();

		// while the keys arrive in ascending order, every new key is greater
		// than all keys before it. Once a key is out of order, duplicates are
		// looked up in this index instead.
		std::unordered_map<std::string, std::size_t> index;
		bool sorted = true;

		// a dictionary has at least one key-value pair, "de" fails on the
		// first key
		for (;;)
		{
			if (start == end)
				BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_eof);

			string_view key;
			if (!decode_string(key)) return false;

			entry value;
			if (!decode_value(value, depth + 1)) return false;

			if (sorted && (dict.empty() || key > string_view(dict.back().first)))
			{
				dict.emplace_back(std::string(key), std::move(value));
			}
			else
			{
				if (sorted)
				{
					sorted = false;
					for (std::size_t i = 0; i < dict.size(); ++i)
						index.emplace(dict[i].first, i);
				}

				auto const i = index.find(std::string(key));
				if (i != index.end())
				{
					// a repeated key replaces the value, but keeps the position
					// of the first occurrence
					dict[i->second].second = std::move(value);
				}
				else
				{
					index.emplace(std::string(key), dict.size());
					dict.emplace_back(std::string(key), std::move(value));
				}
			}

			if (peek('e')) break;
		}

		// skip 'e'
		++start;
		return true;
	}

	bool bdecoder::decode_list(entry& ret, int const depth)
	{
		BENCODE_ASSERT(peek('l'));
		if (depth >= depth_limit)
			BENCODE_FAIL_BDECODE(bdecode_errors::depth_exceeded);
		++start;

		entry::list_type& list = ret.list();

		// a list has at least one item, "le" fails on the first one
		for (;;)
		{
			if (start == end)
				BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_eof);

			list.emplace_back();
			if (!decode_value(list.back(), depth + 1)) return false;

			if (peek('e')) break;
		}

		// skip 'e'
		++start;
		return true;
	}

	bool bdecoder::decode_int(entry& ret)
	{
		BENCODE_ASSERT(peek('i'));
		++start;

		bool negative = false;
		if (peek('-'))
		{
			negative = true;
			++start;
			if (peek('0'))
				BENCODE_FAIL_BDECODE(bdecode_errors::negative_zero);
		}

		// the magnitude of INT64_MIN is one greater than INT64_MAX
		std::uint64_t const max_value = std::uint64_t(std::numeric_limits<std::int64_t>::max());
		std::uint64_t const limit = negative ? max_value + 1 : max_value;

		std::uint64_t val = 0;
		if (!decode_number(val, limit)) return false;

		if (start == end)
			BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_eof);
		if (*start != 'e')
			BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_byte);

		// skip 'e'
		++start;

		if (!negative)
			ret = entry::integer_type(val);
		else if (val > max_value)
			ret = std::numeric_limits<entry::integer_type>::min();
		else
			ret = -entry::integer_type(val);
		return true;
	}

	// <NUM> ::= 1 * <DIGIT>, without leading zeros. Values greater than
	// 'limit' fail with overflow.
	bool bdecoder::decode_number(std::uint64_t& val, std::uint64_t const limit)
	{
		if (!peek_digit())
			BENCODE_FAIL_BDECODE(bdecode_errors::invalid_grammar);

		val = 0;
		if (*start == '0')
		{
			++start;
			if (peek_digit())
				BENCODE_FAIL_BDECODE(bdecode_errors::leading_zero);
			return true;
		}

		while (peek_digit())
		{
			std::uint64_t const digit = std::uint64_t(*start - '0');
			if (val > (limit - digit) / 10)
				BENCODE_FAIL_BDECODE(bdecode_errors::overflow);
			val = val * 10 + digit;
			++start;
		}
		return true;
	}

	// the returned string_view points into the decoded buffer
	bool bdecoder::decode_string(string_view& str)
	{
		std::uint64_t len = 0;
		if (!decode_number(len, std::uint64_t(std::numeric_limits<std::int64_t>::max())))
			return false;

		if (start == end)
			BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_eof);
		if (*start != ':')
			BENCODE_FAIL_BDECODE(bdecode_errors::unexpected_byte);

		// skip ':'
		++start;

		// remaining buffer size excluding ':'
		if (len > std::uint64_t(end - start))
			BENCODE_FAIL_BDECODE(bdecode_errors::truncated_string);

		str = string_view(start, std::size_t(len));
		start += len;
		return true;
	}

} // anonymous namespace

	int bdecode(char const* start, char const* end, entry& ret
		, error_code& ec, int* error_pos, int const depth_limit, int const token_limit)
	{
		ret = bdecode(span<char const>(start, end - start), ec, error_pos, depth_limit, token_limit);
		return ec ? -1 : 0;
	}

	entry bdecode(span<char const> buffer, int const depth_limit, int const token_limit)
	{
		error_code ec;
		int pos = 0;
		entry ret = bdecode(buffer, ec, &pos, depth_limit, token_limit);
		if (ec) aux::throw_ex<bdecode_error>(ec, pos);
		return ret;
	}

	entry bdecode(span<char const> buffer
		, error_code& ec, int* error_pos, int const depth_limit, int const token_limit)
	{
		ec.clear();

		if (buffer.size() > std::numeric_limits<int>::max())
		{
			if (error_pos) *error_pos = 0;
			ec = bdecode_errors::limit_exceeded;
			return entry();
		}

		if (buffer.empty())
		{
			if (error_pos) *error_pos = 0;
			ec = bdecode_errors::empty_input;
			return entry();
		}

		bdecoder d(buffer, ec, error_pos, depth_limit, token_limit);

		entry ret;
		if (!d.decode_value(ret, 0) || !d.finish())
		{
			BENCODE_ASSERT(ec);
			// never hand out a partially decoded tree
			return entry();
		}
		return ret;
	}

	bool has_soft_error(entry const& e, span<char> error)
	{
		// we don't know the depth of the tree
		// so this has to go on the heap
		std::vector<entry const*> stack;
		stack.push_back(&e);

		while (!stack.empty())
		{
			entry const* const n = stack.back();
			stack.pop_back();

			switch (n->type())
			{
			case entry::list_t:
				for (auto const& item : n->list())
					stack.push_back(&item);
				break;
			case entry::dictionary_t:
			{
				entry::dictionary_type const& d = n->dict();
				for (std::size_t i = 0; i < d.size(); ++i)
				{
					if (i > 0 && d[i - 1].first >= d[i].first)
					{
						if (!error.empty())
						{
							std::snprintf(error.data(), std::size_t(error.size()), "%s"
								, d[i - 1].first == d[i].first
								? "duplicate dictionary key"
								: "unsorted dictionary key");
						}
						return true;
					}
					stack.push_back(&d[i].second);
				}
				break;
			}
			case entry::int_t:
			case entry::string_t:
			case entry::undefined_t:
				break;
			}
		}
		return false;
	}
}
