/*

Copyright (c) 2003-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "bencode/config.hpp"
#include "bencode/entry.hpp"
#include "bencode/aux_/throw.hpp"
#include "bencode/aux_/string_util.hpp"

#include <algorithm>
#if BENCODE_USE_IOSTREAM
#include <ostream>
#endif

namespace bencode {

namespace {

	[[noreturn]] void throw_type_error()
	{ aux::throw_ex<system_error>(errors::invalid_entry_type); }

	template <typename Dict>
	auto find_item(Dict& d, string_view const key)
	{
		return std::find_if(d.begin(), d.end()
			, [key](auto const& item) { return item.first == key; });
	}
}

	entry::entry() : variant_type(uninitialized_type{}) {}
	entry::entry(entry const&) = default;
	entry::entry(entry&&) noexcept = default;
	entry::~entry() = default;

	entry::entry(data_type const t)
	{
		switch (t)
		{
			case int_t: emplace<integer_type>(); break;
			case string_t: emplace<string_type>(); break;
			case list_t: emplace<list_type>(); break;
			case dictionary_t: emplace<dictionary_type>(); break;
			case undefined_t: emplace<uninitialized_type>(); break;
		}
	}

	entry::entry(integer_type const v) : variant_type(v) {}
	entry::entry(string_view const v) : variant_type(string_type(v)) {}
	entry::entry(string_type v) : variant_type(std::move(v)) {}
	entry::entry(list_type v) : variant_type(std::move(v)) {}
	entry::entry(dictionary_type v) : variant_type(std::move(v)) {}

	entry& entry::operator=(entry const&) & = default;
	entry& entry::operator=(entry&&) & = default;

	entry& entry::operator=(integer_type const v) &
	{
		emplace<integer_type>(v);
		return *this;
	}

	entry& entry::operator=(string_view const v) &
	{
		emplace<string_type>(v);
		return *this;
	}

	entry& entry::operator=(string_type v) &
	{
		emplace<string_type>(std::move(v));
		return *this;
	}

	entry& entry::operator=(list_type v) &
	{
		emplace<list_type>(std::move(v));
		return *this;
	}

	entry& entry::operator=(dictionary_type v) &
	{
		emplace<dictionary_type>(std::move(v));
		return *this;
	}

	entry::data_type entry::type() const
	{
		return data_type(index());
	}

	template <typename T>
	T& entry::get()
	{
		if (type() == undefined_t) return emplace<T>();
		T* ret = std::get_if<T>(this);
		if (ret == nullptr) throw_type_error();
		return *ret;
	}

	template <typename T>
	T const& entry::get() const
	{
		T const* ret = std::get_if<T>(this);
		if (ret == nullptr) throw_type_error();
		return *ret;
	}

	entry::integer_type& entry::integer() { return get<integer_type>(); }
	entry::integer_type const& entry::integer() const { return get<integer_type>(); }
	entry::string_type& entry::string() { return get<string_type>(); }
	entry::string_type const& entry::string() const { return get<string_type>(); }
	entry::list_type& entry::list() { return get<list_type>(); }
	entry::list_type const& entry::list() const { return get<list_type>(); }
	entry::dictionary_type& entry::dict() { return get<dictionary_type>(); }
	entry::dictionary_type const& entry::dict() const { return get<dictionary_type>(); }

	entry& entry::operator[](string_view const key)
	{
		dictionary_type& d = dict();
		auto const i = find_item(d, key);
		if (i != d.end()) return i->second;
		d.emplace_back(std::string(key), entry());
		return d.back().second;
	}

	entry const& entry::operator[](string_view const key) const
	{
		entry const* ret = find_key(key);
		if (ret == nullptr) throw_type_error();
		return *ret;
	}

	entry* entry::find_key(string_view const key)
	{
		dictionary_type& d = dict();
		auto const i = find_item(d, key);
		return i == d.end() ? nullptr : &i->second;
	}

	entry const* entry::find_key(string_view const key) const
	{
		dictionary_type const& d = dict();
		auto const i = find_item(d, key);
		return i == d.end() ? nullptr : &i->second;
	}

	bool operator==(entry const& lhs, entry const& rhs)
	{
		return static_cast<entry::variant_type const&>(lhs)
			== static_cast<entry::variant_type const&>(rhs);
	}

namespace {

	void print_quoted(std::string& out, std::string const& str)
	{
		out += '\'';
		out += aux::is_binary(str) ? aux::to_hex(str) : str;
		out += '\'';
	}

	struct printer
	{
		std::string& out;
		bool const single_line;
		int depth = 0;

		// the separator before the n:th element of a container
		void separator(bool const first)
		{
			if (!first) out += ',';
			if (single_line)
			{
				out += ' ';
				return;
			}
			out += '\n';
			out.append(std::size_t(depth), ' ');
		}

		void operator()(entry::integer_type const i) { out += aux::to_string(i); }
		void operator()(entry::string_type const& s) { print_quoted(out, s); }
		void operator()(entry::uninitialized_type) { out += "<uninitialized>"; }

		void operator()(entry::list_type const& l)
		{
			out += '[';
			++depth;
			for (auto i = l.begin(); i != l.end(); ++i)
			{
				separator(i == l.begin());
				print(*i);
			}
			--depth;
			out += " ]";
		}

		void operator()(entry::dictionary_type const& d)
		{
			out += '{';
			++depth;
			for (auto i = d.begin(); i != d.end(); ++i)
			{
				separator(i == d.begin());
				print_quoted(out, i->first);
				out += ": ";
				print(i->second);
			}
			--depth;
			out += " }";
		}

		void print(entry const& e)
		{
			std::visit(*this, static_cast<entry::variant_type const&>(e));
		}
	};
}

	std::string entry::to_string(bool const single_line) const
	{
		std::string ret;
		printer p{ret, single_line};
		p.print(*this);
		return ret;
	}

#if BENCODE_USE_IOSTREAM
	std::ostream& operator<<(std::ostream& os, entry const& e)
	{
		return os << e.to_string();
	}
#endif
}
