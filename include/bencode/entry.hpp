/*

Copyright (c) 2003-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_ENTRY_HPP_INCLUDED
#define BENCODE_ENTRY_HPP_INCLUDED

#include "bencode/config.hpp"

#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <variant>
#include <type_traits>
#if BENCODE_USE_IOSTREAM
#include <iosfwd>
#endif

#include "bencode/error_code.hpp"
#include "bencode/string_view.hpp"

namespace bencode {

	struct entry;

	namespace entry_types {

		using integer_type = std::int64_t;
		// arbitrary bytes. Not necessarily UTF-8, may contain nulls
		using string_type = std::string;
		using list_type = std::vector<entry>;
		// key-value pairs in insertion order. For a decoded entry that is the
		// order of the input. Keys are unique
		using dictionary_type = std::vector<std::pair<std::string, entry>>;
		struct uninitialized_type {
			bool operator==(uninitialized_type const&) const { return true; }
		};

		// the order of the alternatives matches entry::data_type
		using variant_type = std::variant<integer_type
			, string_type
			, list_type
			, dictionary_type
			, uninitialized_type>;
	}

	// one node of a decoded bencoded structure. It owns its children, and
	// does not refer back to the buffer it was decoded from.
	//
	// A default constructed entry is undefined. bdecode() returns an
	// undefined entry when it fails, a successful decode never contains one.
	struct BENCODE_EXPORT entry : entry_types::variant_type
	{
		using integer_type = entry_types::integer_type;
		using string_type = entry_types::string_type;
		using list_type = entry_types::list_type;
		using dictionary_type = entry_types::dictionary_type;
		using uninitialized_type = entry_types::uninitialized_type;
		using variant_type = entry_types::variant_type;

		enum data_type
		{
			int_t,
			string_t,
			list_t,
			dictionary_t,
			undefined_t,
		};

		data_type type() const;

		entry();
		// an empty value of the given type
		entry(data_type t); // NOLINT
		entry(integer_type); // NOLINT
		entry(string_view); // NOLINT
		entry(string_type); // NOLINT
		entry(list_type); // NOLINT
		entry(dictionary_type); // NOLINT

		// string literals. A template, so that a literal 0 picks the integer
		// constructor rather than this one
		template <typename U, typename = typename std::enable_if<
			std::is_same<U, char const*>::value>::type>
		entry(U str) : entry(string_view(str)) {} // NOLINT

		entry(entry const&);
		entry(entry&&) noexcept;
		~entry();

		entry& operator=(entry const&) &;
		entry& operator=(entry&&) &;
		entry& operator=(integer_type) &;
		entry& operator=(string_view) &;
		entry& operator=(string_type) &;
		entry& operator=(list_type) &;
		entry& operator=(dictionary_type) &;

		template <typename U, typename = typename std::enable_if<
			std::is_same<U, char const*>::value>::type>
		entry& operator=(U str) & { return *this = string_view(str); }

		// typed access. The const overloads throw system_error with
		// errors::invalid_entry_type unless the entry holds exactly that
		// type. The non-const overloads do the same, except that an undefined
		// entry is first turned into an empty value of the requested type.
		integer_type& integer();
		integer_type const& integer() const;
		string_type& string();
		string_type const& string() const;
		list_type& list();
		list_type const& list() const;
		dictionary_type& dict();
		dictionary_type const& dict() const;

		using variant_type::swap;

		// dictionary lookup. Throws system_error if this is not a dictionary.
		// The non-const operator[] appends an undefined value under ``key``
		// if there is none. The const one throws instead.
		entry& operator[](string_view key);
		entry const& operator[](string_view key) const;

		// like operator[], but returns nullptr for a missing key
		entry* find_key(string_view key);
		entry const* find_key(string_view key) const;

		// a human readable rendering. Dictionaries print as
		// ``{ 'key': value }``, lists as ``[ a, b ]`` and strings in single
		// quotes, hex encoded if any byte is unprintable. Unless
		// ``single_line`` is set, each element goes on its own line, indented
		// one space per level.
		std::string to_string(bool single_line = false) const;

	private:

		template <typename T> T& get();
		template <typename T> T const& get() const;
	};

	// deep comparison. Dictionaries compare in order, so the same pairs in a
	// different order are not equal
	BENCODE_EXPORT bool operator==(entry const& lhs, entry const& rhs);
	inline bool operator!=(entry const& lhs, entry const& rhs) { return !(lhs == rhs); }

#if BENCODE_USE_IOSTREAM
	// writes e.to_string()
	BENCODE_EXPORT std::ostream& operator<<(std::ostream& os, entry const& e);
#endif
}

#endif // BENCODE_ENTRY_HPP_INCLUDED
