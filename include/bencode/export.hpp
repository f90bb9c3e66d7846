/*

Copyright (c) 2005-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_EXPORT_HPP_INCLUDED
#define BENCODE_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

// BENCODE_BUILDING_SHARED is set while compiling libbencode as a shared
// library, BENCODE_LINKING_SHARED by code linking against it. Static builds
// set neither.
#if defined BENCODE_BUILDING_SHARED
# define BENCODE_EXPORT BOOST_SYMBOL_EXPORT
#elif defined BENCODE_LINKING_SHARED
# define BENCODE_EXPORT BOOST_SYMBOL_IMPORT
#else
# define BENCODE_EXPORT
#endif

#endif // BENCODE_EXPORT_HPP_INCLUDED
