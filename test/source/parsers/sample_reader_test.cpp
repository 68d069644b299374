/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_reader_test.cpp -- test suites for the sample table and the sample file reader

#include "test/include/test_pch.hpp"
#include "libsample/include/sample_table.hpp"
#include "libsample/include/sample_reader.hpp"
#include <limits>
#include <sstream>
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

struct SampleReaderFixture
{
	SampleTable read(const std::string &contents)
	{
		std::istringstream stream(contents);
		return read_sample_table(stream);
	}
	// Line number attached to the parse error, or 0 if none
	std::size_t error_line(const std::string &contents)
	{
		try {
			read(contents);
		}
		catch (parse_error &e) {
			if (std::size_t const * line = boost::get_error_info<line_errinfo>(e)) return *line;
		}
		return 0;
	}
};

BOOST_AUTO_TEST_SUITE(SampleTableSuite)
	BOOST_AUTO_TEST_CASE(KeepsInsertionOrder)
	{
		SampleTable table;
		table.add_sample(0.5, 300, -10.3);
		table.add_sample(0, 300, -10.0);
		table.add_sample(Sample(1, 400, -10.1));
		BOOST_REQUIRE_EQUAL(table.size(), 3);
		BOOST_CHECK_EQUAL(table[0].lithiation, 0.5);
		BOOST_CHECK_EQUAL(table[1].energy, -10.0);
		BOOST_CHECK_EQUAL(table[2].temperature, 400);
	}
	BOOST_AUTO_TEST_CASE(ParallelColumns)
	{
		std::vector<double> x {0, 0.5, 1};
		std::vector<double> T {300, 300, 300};
		std::vector<double> E {-10.0, -10.3, -10.1};
		SampleTable table(x, T, E);
		BOOST_CHECK_EQUAL(table.size(), 3);
		BOOST_CHECK_EQUAL(table.temperatures().size(), 1);
		BOOST_CHECK_EQUAL(table.lithiations().size(), 3);
		E.pop_back();
		BOOST_CHECK_THROW(SampleTable(x, T, E), range_check_error);
	}
	BOOST_AUTO_TEST_CASE(Bounds)
	{
		SampleTable table;
		BOOST_CHECK_THROW(table.temperature_bounds(), degenerate_input_error);
		table.add_sample(0.25, 500, -1);
		table.add_sample(0.75, 300, -1);
		table.add_sample(0.5, 400, -1);
		BOOST_CHECK_EQUAL(table.temperature_bounds().first, 300);
		BOOST_CHECK_EQUAL(table.temperature_bounds().second, 500);
		BOOST_CHECK_EQUAL(table.lithiation_bounds().first, 0.25);
		BOOST_CHECK_EQUAL(table.lithiation_bounds().second, 0.75);
	}
	BOOST_AUTO_TEST_CASE(RejectsInvalidSamples)
	{
		SampleTable table;
		table.add_sample(0.5, 300, -10.3);
		BOOST_CHECK_THROW(table.add_sample(0.5, 300, -9.0), degenerate_input_error);
		BOOST_CHECK_THROW(table.add_sample(1.5, 300, -9.0), range_check_error);
		BOOST_CHECK_THROW(table.add_sample(-0.1, 300, -9.0), range_check_error);
		BOOST_CHECK_THROW(table.add_sample(0.5, 0, -9.0), range_check_error);
		BOOST_CHECK_THROW(table.add_sample(0.5, 400, std::numeric_limits<double>::quiet_NaN()), floating_point_error);
		BOOST_CHECK_THROW(table.add_sample(0.5, std::numeric_limits<double>::infinity(), -9.0), floating_point_error);
		BOOST_CHECK_EQUAL(table.size(), 1);
		// same lithiation at another temperature is a new sample
		table.add_sample(0.5, 400, -9.0);
		BOOST_CHECK_EQUAL(table.size(), 2);
	}
BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SampleReaderSuite, SampleReaderFixture)
	BOOST_AUTO_TEST_CASE(HeaderlessCommaSeparated)
	{
		SampleTable table = read("0,300,-10.0\n0.5,300,-10.3\n1,300,-10.1\n");
		BOOST_REQUIRE_EQUAL(table.size(), 3);
		BOOST_CHECK_EQUAL(table[1].lithiation, 0.5);
		BOOST_CHECK_EQUAL(table[1].temperature, 300);
		BOOST_CHECK_CLOSE_FRACTION(table[1].energy, -10.3, 1e-15);
	}
	BOOST_AUTO_TEST_CASE(CommentsBlankLinesAndSpaces)
	{
		SampleTable table = read("# Monte Carlo run 12\n\n  0 300 -10.0\n# restart\n0.5\t300\t-10.3\n\n1 300 -1.01e1\n");
		BOOST_REQUIRE_EQUAL(table.size(), 3);
		BOOST_CHECK_CLOSE_FRACTION(table[2].energy, -10.1, 1e-15);
	}
	BOOST_AUTO_TEST_CASE(SemicolonSeparated)
	{
		SampleTable table = read("0;300;-10.0\n0.5;300;-10.3\n");
		BOOST_CHECK_EQUAL(table.size(), 2);
	}
	BOOST_AUTO_TEST_CASE(HeaderReordersColumns)
	{
		SampleTable table = read("energy,temperature,lithiation\n-10.0,300,0\n-10.3,300,0.5\n");
		BOOST_REQUIRE_EQUAL(table.size(), 2);
		BOOST_CHECK_EQUAL(table[1].lithiation, 0.5);
		BOOST_CHECK_EQUAL(table[1].temperature, 300);
		BOOST_CHECK_CLOSE_FRACTION(table[1].energy, -10.3, 1e-15);
	}
	BOOST_AUTO_TEST_CASE(HeaderAbbreviationsAndExtraColumns)
	{
		SampleTable table = read("T lith step E\n300 0.25 17 -10.1\n300 0.75 18 -10.2\n");
		BOOST_REQUIRE_EQUAL(table.size(), 2);
		BOOST_CHECK_EQUAL(table[0].lithiation, 0.25);
		BOOST_CHECK_EQUAL(table[0].temperature, 300);
		BOOST_CHECK_CLOSE_FRACTION(table[1].energy, -10.2, 1e-15);
	}
	BOOST_AUTO_TEST_CASE(HeaderErrors)
	{
		BOOST_CHECK_THROW(read("temperature,energy\n300,-10.0\n"), parse_error);
		BOOST_CHECK_THROW(read("T,temp,E,lith\n300,300,-10.0,0\n"), parse_error);
		BOOST_CHECK_EQUAL(error_line("# header follows\nT,E\n300,-10\n"), 2);
	}
	BOOST_AUTO_TEST_CASE(RowErrors)
	{
		BOOST_CHECK_THROW(read("0,300,-10.0\n0.5,300\n"), parse_error);
		BOOST_CHECK_THROW(read("0,300,-10.0\n0.5,300,-10.3,4\n"), parse_error);
		BOOST_CHECK_THROW(read("0,300,-10.0\n0.5,abc,-10.3\n"), parse_error);
		BOOST_CHECK_EQUAL(error_line("0,300,-10.0\n\n# comment\n0.5,300\n"), 4);
		BOOST_CHECK_EQUAL(error_line("lithiation,temperature,energy\n0,300,-10.0\n0.5,300,-10.3,1\n"), 3);
	}
	BOOST_AUTO_TEST_CASE(InvalidSampleValues)
	{
		BOOST_CHECK_THROW(read("0,300,-10.0\n0,300,-10.2\n"), degenerate_input_error);
		BOOST_CHECK_THROW(read("1.5,300,-10.0\n"), range_check_error);
		BOOST_CHECK_THROW(read("0.5,300,nan\n"), floating_point_error);
	}
	BOOST_AUTO_TEST_CASE(EmptyInput)
	{
		BOOST_CHECK(read("").empty());
		BOOST_CHECK(read("# nothing here\n\n").empty());
	}
	BOOST_AUTO_TEST_CASE(MissingFile)
	{
		BOOST_CHECK_THROW(read_sample_file("this_file_does_not_exist.csv"), file_read_error);
		BOOST_CHECK_THROW(read_sample_file("this_file_does_not_exist.csv"), io_error);
	}
BOOST_AUTO_TEST_SUITE_END()
