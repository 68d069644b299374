/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// Keyword matching for abbreviations

#include "libsample/include/libsample_pch.hpp"
#include "libsample/include/utils/match_keyword.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/algorithm/string.hpp>
#include <vector>

bool is_abbreviation_of (const std::string &fullword, const std::string &test) {
	if (test.empty()) return false;
	if (boost::istarts_with(fullword, test)) return true; // trivial case
	std::vector<std::string> test_splitargs, full_splitargs;
	boost::split(full_splitargs, fullword, boost::is_any_of("_-")); // split by the separators
	boost::split(test_splitargs, test, boost::is_any_of("_-"));
	if (test_splitargs.size() > full_splitargs.size()) return false;
	auto test_iter = test_splitargs.begin();
	auto full_iter = full_splitargs.begin();
	const auto test_end = test_splitargs.end();
	while (test_iter != test_end) {
		if (!boost::istarts_with(*full_iter, *test_iter)) return false;
		++test_iter;
		++full_iter;
	}
	return true; // test string never failed a comparison and reached the end
}

boost::optional<std::string> find_keyword(const std::string &test_string, const std::set<std::string> &keywords) {
	std::vector<std::string> ret_strings;
	for (auto i = keywords.begin(); i != keywords.end(); ++i) {
		// an exact match is never ambiguous
		if (boost::iequals(*i, test_string)) return *i;
		if (is_abbreviation_of(*i, test_string)) ret_strings.push_back(*i);
	}
	if (ret_strings.size() > 1) {
		std::string errstring;
		errstring = "Ambiguous keyword " + test_string + ". Possible matches: ";
		for (auto i = ret_strings.begin(); i != ret_strings.end(); ++i) {
			errstring += *i;
			errstring += " ";
		}
		BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("Ambiguous keyword") << specific_errinfo(errstring));
	}
	if (ret_strings.empty()) return boost::none;
	return ret_strings[0];
}

std::string match_keyword(const std::string &test_string, const std::set<std::string> &keywords) {
	boost::optional<std::string> match = find_keyword(test_string, keywords);
	if (!match) {
		BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("Unknown keyword") << specific_errinfo(test_string));
	}
	return *match;
}
