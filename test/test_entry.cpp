/*

Copyright (c) 2005, 2008, 2015-2020, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"
#include "bencode/entry.hpp"
#include "bencode/bdecode.hpp"

#include <sstream>
#include <string>

using namespace bencode;

BENCODE_TEST(construct_types)
{
	TEST_EQUAL(entry().type(), entry::undefined_t);
	TEST_EQUAL(entry(entry::int_t).type(), entry::int_t);
	TEST_EQUAL(entry(entry::string_t).type(), entry::string_t);
	TEST_EQUAL(entry(entry::list_t).type(), entry::list_t);
	TEST_EQUAL(entry(entry::dictionary_t).type(), entry::dictionary_t);
	TEST_EQUAL(entry(entry::undefined_t).type(), entry::undefined_t);

	TEST_EQUAL(entry(entry::int_t).integer(), 0);
	TEST_CHECK(entry(entry::string_t).string().empty());
	TEST_CHECK(entry(entry::list_t).list().empty());
	TEST_CHECK(entry(entry::dictionary_t).dict().empty());
}

BENCODE_TEST(construct_values)
{
	TEST_EQUAL(entry(1337).integer(), 1337);
	TEST_EQUAL(entry("spam").string(), "spam");
	TEST_EQUAL(entry(std::string("eggs")).string(), "eggs");
	TEST_EQUAL(entry("moo"_sv).string(), "moo");

	std::string const bytes("a\0b", 3);
	TEST_EQUAL(entry(string_view(bytes)).string(), bytes);
	TEST_EQUAL(entry(string_view(bytes)).string().size(), 3);
}

BENCODE_TEST(implicit_construct)
{
	entry e(entry::list_t);
	e.list().push_back(entry::list_t);
	TEST_EQUAL(e.list().back().type(), entry::list_t);
}

BENCODE_TEST(undefined_accessor)
{
	// the non-const accessors turn an undefined entry into the requested type
	entry e;
	e.integer() = 10;
	TEST_EQUAL(e.type(), entry::int_t);

	entry l;
	l.list().push_back(entry(1));
	TEST_EQUAL(l.type(), entry::list_t);
	TEST_EQUAL(l.list().size(), 1);
}

BENCODE_TEST(wrong_type)
{
	entry e(3);
	TEST_THROW(e.string());
	TEST_THROW(e.list());
	TEST_THROW(e.dict());
	TEST_THROW(e["foo"]);
	TEST_NOTHROW(e.integer());

	entry const& ce = e;
	TEST_THROW(ce.string());

	entry const u;
	TEST_THROW(u.integer());

	bool thrown = false;
	try
	{
		entry const s("foo");
		s.integer();
	}
	catch (system_error const& err)
	{
		thrown = true;
		TEST_EQUAL(err.code(), error_code(errors::invalid_entry_type));
	}
	TEST_CHECK(thrown);
}

BENCODE_TEST(error_category)
{
	TEST_EQUAL(std::string(bencode_category().name()), "bencode");
	TEST_EQUAL(error_code(errors::invalid_entry_type).message()
		, "invalid type requested from entry");
}

BENCODE_TEST(dict_lookup)
{
	entry e;
	e["spam"] = "eggs";
	e["cow"] = "moo";
	e["spam"] = 3;
	TEST_EQUAL(e.type(), entry::dictionary_t);
	TEST_EQUAL(e.dict().size(), 2);
	TEST_EQUAL(e.dict()[0].first, "spam");
	TEST_EQUAL(e["spam"].integer(), 3);

	TEST_CHECK(e.find_key("cow") != nullptr);
	TEST_EQUAL(e.find_key("cow")->string(), "moo");
	TEST_CHECK(e.find_key("horse") == nullptr);

	entry const& ce = e;
	TEST_EQUAL(ce["cow"].string(), "moo");
	TEST_THROW(ce["horse"]);
	TEST_CHECK(ce.find_key("horse") == nullptr);
	// a failed const lookup doesn't insert anything
	TEST_EQUAL(e.dict().size(), 2);
}

BENCODE_TEST(equality)
{
	error_code ec;
	entry const decoded = bdecode("d3:cow3:moo4:spaml4:eggsi-1eee"_sv, ec);
	TEST_CHECK(!ec);

	entry e;
	e["cow"] = "moo";
	e["spam"].list().push_back(entry("eggs"));
	e["spam"].list().push_back(entry(-1));
	TEST_CHECK(decoded == e);

	e["spam"].list().back() = 1;
	TEST_CHECK(decoded != e);

	// dictionaries with the same items in a different order are different
	entry reordered;
	reordered["spam"] = decoded["spam"];
	reordered["cow"] = "moo";
	TEST_CHECK(decoded != reordered);

	TEST_CHECK(entry() == entry());
	TEST_CHECK(entry(1) != entry("1"));
}

BENCODE_TEST(copy_and_move)
{
	entry e;
	e["a"].list().push_back(entry("b"));
	entry copy(e);
	TEST_CHECK(copy == e);
	copy["a"].list().clear();
	TEST_CHECK(copy != e);

	entry moved(std::move(copy));
	TEST_EQUAL(moved["a"].list().size(), 0);

	entry swapped(1);
	swapped.swap(e);
	TEST_EQUAL(e.integer(), 1);
	TEST_EQUAL(swapped["a"].list().size(), 1);
}

BENCODE_TEST(print_dict_single_line)
{
	entry e;
	e["foo"] = "bar";
	e["bar"] = "foo";
	TEST_EQUAL(e.to_string(true), "{ 'foo': 'bar', 'bar': 'foo' }");
}

BENCODE_TEST(print_dict)
{
	entry e;
	e["foo"] = "bar";
	e["bar"] = "foo";
	TEST_EQUAL(e.to_string(), "{\n 'foo': 'bar',\n 'bar': 'foo' }");
}

BENCODE_TEST(print_list_single_line)
{
	entry e;
	e.list().push_back(entry("foo"));
	e.list().push_back(entry("bar"));
	TEST_EQUAL(e.to_string(true), "[ 'foo', 'bar' ]");
}

BENCODE_TEST(print_list)
{
	entry e;
	e.list().push_back(entry("foo"));
	e.list().push_back(entry("bar"));
	TEST_EQUAL(e.to_string(), "[\n 'foo',\n 'bar' ]");
}

BENCODE_TEST(print_int)
{
	TEST_EQUAL(entry(1337).to_string(), "1337");
	TEST_EQUAL(entry(-42).to_string(true), "-42");
}

BENCODE_TEST(print_string)
{
	TEST_EQUAL(entry("foobar").to_string(), "'foobar'");
	TEST_EQUAL(entry(std::string("\x01\xff", 2)).to_string(), "'01ff'");
}

BENCODE_TEST(print_undefined)
{
	TEST_EQUAL(entry().to_string(), "<uninitialized>");
}

BENCODE_TEST(print_deep_dict_single_line)
{
	entry e;
	e["strings"].list().push_back(entry("foo"));
	e["strings"].list().push_back(entry("bar"));
	e["ints"].list().push_back(entry(1));
	e["ints"].list().push_back(entry(2));
	e["ints"].list().push_back(entry(3));
	e["a"] = "foobar";
	TEST_EQUAL(e.to_string(true), "{ 'strings': [ 'foo', 'bar' ], 'ints': [ 1, 2, 3 ], 'a': 'foobar' }");
}

BENCODE_TEST(print_deep_dict)
{
	entry e;
	e["strings"].list().push_back(entry("foo"));
	e["ints"].list().push_back(entry(1));
	e["ints"].list().push_back(entry(2));
	TEST_EQUAL(e.to_string(), R"({
 'strings': [
  'foo' ],
 'ints': [
  1,
  2 ] })");
}

BENCODE_TEST(print_stream)
{
	std::stringstream str;
	str << entry("foo");
	TEST_EQUAL(str.str(), "'foo'");
}
