/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_grammar.cpp -- grammar construction for sample file rows

//#define BOOST_SPIRIT_DEBUG
#include "libsample/include/libsample_pch.hpp"
#include "libsample/include/grammars/sample_grammar.hpp"
#include <boost/spirit/include/qi.hpp>

namespace qi = boost::spirit::qi;

sample_row_grammar::sample_row_grammar() : sample_row_grammar::base_type(row)
{
	using qi::double_;
	using qi::lit;

	separator = lit(',') | lit(';');
	row = double_ % -separator;

	BOOST_SPIRIT_DEBUG_NODE(row);
}
