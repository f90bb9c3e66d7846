/*

Copyright (c) 2016-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_SPAN_HPP_INCLUDED
#define BENCODE_SPAN_HPP_INCLUDED

#include <type_traits>
#include <cstddef>
#include "bencode/assert.hpp"

namespace bencode {

	// a pointer and a length, referring to memory owned by someone else.
	// span<char const> binds to anything with data() and size() members,
	// such as std::string, std::vector<char> and string_view.
	//
	// a char array only binds to a mutable span (an output buffer). A
	// character array holding bencoded text is usually a string literal, whose
	// terminating null is not part of the text, so that conversion is left to
	// the bdecode() overload for arrays.
	template <typename T>
	struct span
	{
		span() noexcept : m_ptr(nullptr), m_len(0) {}

		span(T* p, std::ptrdiff_t const len) noexcept // NOLINT
			: m_ptr(p), m_len(len)
		{ BENCODE_ASSERT(len >= 0); }

		template <std::size_t N, typename U = T
			, typename = typename std::enable_if<!std::is_const<U>::value>::type>
		span(T (&arr)[N]) noexcept // NOLINT
			: m_ptr(arr), m_len(std::ptrdiff_t(N)) {}

		template <typename Cont, typename = typename std::enable_if<
			std::is_convertible<decltype(std::declval<Cont&>().data()), T*>::value>::type>
		span(Cont& c) // NOLINT
			: m_ptr(c.data()), m_len(std::ptrdiff_t(c.size())) {}

		// temporaries and const containers only bind to a span of const
		template <typename Cont, typename U = T, typename = typename std::enable_if<
			std::is_const<U>::value
			&& std::is_convertible<decltype(std::declval<Cont const&>().data()), T*>::value>::type>
		span(Cont const& c) // NOLINT
			: m_ptr(c.data()), m_len(std::ptrdiff_t(c.size())) {}

		std::ptrdiff_t size() const noexcept { return m_len; }
		bool empty() const noexcept { return m_len == 0; }
		T* data() const noexcept { return m_ptr; }

		T* begin() const noexcept { return m_ptr; }
		T* end() const noexcept { return m_ptr + m_len; }

		span<T> subspan(std::ptrdiff_t const offset) const
		{
			BENCODE_ASSERT(offset >= 0 && offset <= m_len);
			return { m_ptr + offset, m_len - offset };
		}

		T& operator[](std::ptrdiff_t const idx) const
		{
			BENCODE_ASSERT(idx >= 0 && idx < m_len);
			return m_ptr[idx];
		}

	private:
		T* m_ptr;
		std::ptrdiff_t m_len;
	};
}

#endif // BENCODE_SPAN_HPP_INCLUDED
