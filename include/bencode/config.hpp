/*

Copyright (c) 2005-2021, Arvid Norberg
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef BENCODE_CONFIG_HPP_INCLUDED
#define BENCODE_CONFIG_HPP_INCLUDED

#include "bencode/aux_/disable_warnings_push.hpp"

#include <boost/config.hpp>
#include <boost/version.hpp>

#include "bencode/aux_/disable_warnings_pop.hpp"

#include "bencode/export.hpp"

#if !defined BOOST_VERSION || BOOST_VERSION < 106600
#error "libbencode requires boost 1.66 or later"
#endif

#if defined BOOST_MSVC
// class X needs to have dll-interface to be used by clients of class Y
#pragma warning(disable:4251)
#endif

// entry's operator<< is only available with iostreams
#ifndef BENCODE_USE_IOSTREAM
#ifndef BOOST_NO_IOSTREAM
#define BENCODE_USE_IOSTREAM 1
#else
#define BENCODE_USE_IOSTREAM 0
#endif
#endif

// BENCODE_ASSERT() is a no-op unless this is set. The CMake build sets it
// for Debug configurations
#ifndef BENCODE_USE_ASSERTS
#define BENCODE_USE_ASSERTS 0
#endif

#endif // BENCODE_CONFIG_HPP_INCLUDED
