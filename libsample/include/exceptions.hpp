/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// exceptions.hpp -- definitions for exception handling

#ifndef INCLUDED_EXCEPTIONS
#define INCLUDED_EXCEPTIONS

#include <boost/exception/all.hpp>
#include <string>

struct exception_base: virtual std::exception, virtual boost::exception { };

struct parse_error: virtual exception_base { };
struct syntax_error: virtual parse_error { };

struct math_error: virtual exception_base { };
struct floating_point_error: virtual math_error { };
// not enough distinct, non-collinear points to interpolate or build a hull
struct degenerate_input_error: virtual math_error { };
// fewer than two stable compositions on the lower hull
struct insufficient_hull_error: virtual math_error { };
// query point falls outside the sampled domain (no extrapolation)
struct out_of_domain_error: virtual math_error { };

struct range_check_error: virtual exception_base { };

struct internal_error: virtual exception_base { };

struct io_error: virtual exception_base { };
struct file_error: virtual io_error { };
struct read_error: virtual io_error { };
struct file_read_error: virtual file_error, virtual read_error { };

typedef boost::error_info<struct spec_err,std::string> specific_errinfo; // info for specific token that caused exception
typedef boost::error_info<struct str_err,std::string> str_errinfo; // user friendly error message
typedef boost::error_info<struct line_err,std::size_t> line_errinfo; // line number in an input file

#endif
