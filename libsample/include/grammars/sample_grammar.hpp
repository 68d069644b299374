/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_grammar.hpp -- grammar declaration for one row of a delimited sample file

#ifndef INCLUDED_SAMPLE_GRAMMAR
#define INCLUDED_SAMPLE_GRAMMAR

#include <boost/spirit/include/qi.hpp>
#include <string>
#include <vector>

// Numeric fields separated by ',' or ';' and/or whitespace
struct sample_row_grammar: boost::spirit::qi::grammar<std::string::const_iterator, boost::spirit::ascii::space_type, std::vector<double>()> {
	sample_row_grammar();
	boost::spirit::qi::rule<std::string::const_iterator, boost::spirit::ascii::space_type, std::vector<double>()> row;
	boost::spirit::qi::rule<std::string::const_iterator, boost::spirit::ascii::space_type> separator;
};

#endif
