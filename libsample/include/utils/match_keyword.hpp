/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// header for abbreviated keyword matching (column names, command line keywords)

#ifndef INCLUDED_MATCH_KEYWORD
#define INCLUDED_MATCH_KEYWORD

#include <boost/optional.hpp>
#include <string>
#include <set>

// Is test an abbreviated form of fullword? Parts separated by '_' or '-' are abbreviated independently.
bool is_abbreviation_of(const std::string &fullword, const std::string &test);

// Full keyword for an abbreviation, or none if nothing matches; throws syntax_error if ambiguous
boost::optional<std::string> find_keyword(const std::string &test_string, const std::set<std::string> &keywords);

// Full keyword for an abbreviation; throws syntax_error if unknown or ambiguous
std::string match_keyword(const std::string &test_string, const std::set<std::string> &keywords);

#endif
