/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// keyword_test.cpp -- test suites for keyword abbreviations and calculation conditions

#include "test/include/test_pch.hpp"
#include "libsample/include/utils/match_keyword.hpp"
#include "libsample/include/conditions.hpp"
#include <limits>
#include <set>
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

struct KeywordFixture
{
	KeywordFixture()
		: keywords { "E_LI_BULK", "TEMPERATURES", "NPTS", "NGRID", "TOLERANCE", "OUTPUT", "VERBOSE" }
	{
	}
	std::set<std::string> keywords;
};

BOOST_FIXTURE_TEST_SUITE(KeywordSuite, KeywordFixture)
	BOOST_AUTO_TEST_CASE(Abbreviations)
	{
		BOOST_CHECK(is_abbreviation_of("TEMPERATURES", "temp"));
		BOOST_CHECK(is_abbreviation_of("E_LI_BULK", "E_L_B"));
		BOOST_CHECK(is_abbreviation_of("E_LI_BULK", "e-li"));
		BOOST_CHECK(!is_abbreviation_of("E_LI_BULK", "E_B"));
		BOOST_CHECK(!is_abbreviation_of("NPTS", "NPTSX"));
		BOOST_CHECK(!is_abbreviation_of("NPTS", "N_P_T_S_X"));
		BOOST_CHECK(!is_abbreviation_of("NPTS", ""));
	}
	BOOST_AUTO_TEST_CASE(MatchKeyword)
	{
		BOOST_CHECK_EQUAL(match_keyword("temp", keywords), "TEMPERATURES");
		BOOST_CHECK_EQUAL(match_keyword("TO", keywords), "TOLERANCE");
		BOOST_CHECK_EQUAL(match_keyword("np", keywords), "NPTS");
		BOOST_CHECK_EQUAL(match_keyword("NG", keywords), "NGRID");
		BOOST_CHECK_EQUAL(match_keyword("E_L_B", keywords), "E_LI_BULK");
		BOOST_CHECK_EQUAL(match_keyword("verbose", keywords), "VERBOSE");
	}
	BOOST_AUTO_TEST_CASE(AmbiguousKeyword)
	{
		BOOST_CHECK_THROW(match_keyword("N", keywords), syntax_error);
		BOOST_CHECK_THROW(match_keyword("T", keywords), syntax_error);
		BOOST_CHECK_THROW(find_keyword("N", keywords), syntax_error);
	}
	BOOST_AUTO_TEST_CASE(UnknownKeyword)
	{
		BOOST_CHECK_THROW(match_keyword("PRESSURE", keywords), syntax_error);
		BOOST_CHECK(!find_keyword("PRESSURE", keywords));
		BOOST_CHECK(!find_keyword("", keywords));
	}
	BOOST_AUTO_TEST_CASE(ExactMatchIsNeverAmbiguous)
	{
		std::set<std::string> prefixed { "T", "TEMPERATURES" };
		BOOST_CHECK_EQUAL(match_keyword("t", prefixed), "T");
		BOOST_CHECK_EQUAL(match_keyword("TE", prefixed), "TEMPERATURES");
	}
BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConditionsSuite)
	BOOST_AUTO_TEST_CASE(Defaults)
	{
		voltage_conditions conditions;
		BOOST_CHECK(!conditions.li_reference_energy);
		BOOST_CHECK_EQUAL(conditions.formation_points, 100);
		BOOST_CHECK_EQUAL(conditions.voltage_points, 500);
		BOOST_CHECK_EQUAL(conditions.hull_tolerance, 0);
		// the reference energy has no default
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.li_reference_energy = -1.95;
		BOOST_CHECK_NO_THROW(check_conditions(conditions));
	}
	BOOST_AUTO_TEST_CASE(InvalidConditions)
	{
		voltage_conditions conditions;
		conditions.li_reference_energy = -1.95;
		conditions.formation_points = 2;
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.formation_points = 3;
		conditions.voltage_points = 1;
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.voltage_points = 2;
		conditions.hull_tolerance = -1e-6;
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.hull_tolerance = 0;
		conditions.temperatures.push_back(-5);
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.temperatures.back() = std::numeric_limits<double>::quiet_NaN();
		BOOST_CHECK_THROW(check_conditions(conditions), floating_point_error);
		conditions.temperatures.back() = 300;
		BOOST_CHECK_NO_THROW(check_conditions(conditions));
		conditions.li_reference_energy = std::numeric_limits<double>::infinity();
		BOOST_CHECK_THROW(check_conditions(conditions), floating_point_error);
	}
	BOOST_AUTO_TEST_CASE(GridSizeUpperBound)
	{
		voltage_conditions conditions;
		conditions.li_reference_energy = -1.95;
		conditions.formation_points = max_grid_points;
		conditions.voltage_points = max_grid_points;
		BOOST_CHECK_NO_THROW(check_conditions(conditions));
		conditions.formation_points = max_grid_points + 1;
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
		conditions.formation_points = 100;
		conditions.voltage_points = static_cast<std::size_t>(-5);
		BOOST_CHECK_THROW(check_conditions(conditions), range_check_error);
	}
	BOOST_AUTO_TEST_CASE(PointCountsFromText)
	{
		BOOST_CHECK_EQUAL(parse_point_count("NPTS", "101"), 101);
		BOOST_CHECK_EQUAL(parse_point_count("NGRID", "500"), 500);
		BOOST_CHECK_THROW(parse_point_count("NPTS", "-5"), syntax_error);
		BOOST_CHECK_THROW(parse_point_count("NPTS", "0"), syntax_error);
		BOOST_CHECK_THROW(parse_point_count("NGRID", "12.5"), syntax_error);
		BOOST_CHECK_THROW(parse_point_count("NGRID", "many"), syntax_error);
		BOOST_CHECK_THROW(parse_point_count("NGRID", ""), syntax_error);
	}
BOOST_AUTO_TEST_SUITE_END()
