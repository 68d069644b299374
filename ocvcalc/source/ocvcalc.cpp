/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// ocvcalc -- open-circuit voltage curves from Monte Carlo energy samples

#include "libsample/include/conditions.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include "libsample/include/sample_reader.hpp"
#include "libsample/include/utils/match_keyword.hpp"
#include "libvoltage/include/pipeline.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace journal;
using namespace Voltage;

namespace {
const char usage[] =
	"Usage: ocvcalc samples.csv E_LI_BULK=<energy> TEMPERATURES=<T1,T2,...> [NPTS=100] [NGRID=500]\n"
	"               [TOLERANCE=0] [OUTPUT=<prefix>] [VERBOSE=0]\n"
	"Keywords may be abbreviated.";

struct command_line {
	std::string sample_file;
	std::string output_prefix;
	bool verbose;
	voltage_conditions conditions;
	command_line() : verbose(false) { }
};

std::vector<double> parse_temperatures(const std::string &value) {
	std::vector<std::string> splitargs;
	std::vector<double> temperatures;
	boost::split(splitargs, value, boost::is_any_of(","));
	for (auto i = splitargs.begin(); i != splitargs.end(); ++i) {
		boost::trim(*i);
		if (i->empty()) continue;
		temperatures.push_back(boost::lexical_cast<double>(*i));
	}
	return temperatures;
}

// Throws syntax_error for malformed arguments
command_line parse_command_line(int argc, char* argv[]) {
	const std::set<std::string> keywords {
		"E_LI_BULK", "TEMPERATURES", "NPTS", "NGRID", "TOLERANCE", "OUTPUT", "VERBOSE"
	};
	command_line cmd;
	for (int i = 1; i < argc; ++i) {
		const std::string argument(argv[i]);
		const std::size_t equals = argument.find('=');
		if (equals == std::string::npos) {
			if (!cmd.sample_file.empty()) {
				BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("More than one sample file") << specific_errinfo(argument));
			}
			cmd.sample_file = argument;
			continue;
		}
		const std::string keyword = match_keyword(argument.substr(0, equals), keywords);
		const std::string value = boost::trim_copy(argument.substr(equals + 1));
		try {
			if (keyword == "E_LI_BULK") cmd.conditions.li_reference_energy = boost::lexical_cast<double>(value);
			else if (keyword == "TEMPERATURES") cmd.conditions.temperatures = parse_temperatures(value);
			else if (keyword == "NPTS") cmd.conditions.formation_points = parse_point_count(keyword, value);
			else if (keyword == "NGRID") cmd.conditions.voltage_points = parse_point_count(keyword, value);
			else if (keyword == "TOLERANCE") cmd.conditions.hull_tolerance = boost::lexical_cast<double>(value);
			else if (keyword == "OUTPUT") cmd.output_prefix = value;
			else if (keyword == "VERBOSE") cmd.verbose = boost::lexical_cast<int>(value) != 0;
		}
		catch (boost::bad_lexical_cast &) {
			BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("Invalid value for " + keyword) << specific_errinfo(value));
		}
	}
	if (cmd.sample_file.empty()) {
		BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("No sample file given"));
	}
	return cmd;
}

void write_result_files(const std::string &prefix, const VoltageResult &result) {
	const std::string stem = result.file_stem(prefix);
	std::ofstream formation_file((stem + "_formation.csv").c_str());
	if (!formation_file) {
		BOOST_THROW_EXCEPTION(file_error() << str_errinfo("Cannot open output file") << boost::errinfo_file_name(stem + "_formation.csv"));
	}
	result.write_formation_csv(formation_file);
	std::ofstream voltage_file((stem + "_ocv.csv").c_str());
	if (!voltage_file) {
		BOOST_THROW_EXCEPTION(file_error() << str_errinfo("Cannot open output file") << boost::errinfo_file_name(stem + "_ocv.csv"));
	}
	result.write_voltage_csv(voltage_file);
}
}

int main(int argc, char* argv[])
{
	command_line cmd;
	try {
		cmd = parse_command_line(argc, argv);
	}
	catch (syntax_error &e) {
		std::cerr << "Error: ";
		if (std::string const * mi = boost::get_error_info<str_errinfo>(e) ) std::cerr << *mi;
		if (std::string const * mi = boost::get_error_info<specific_errinfo>(e) ) std::cerr << ": " << *mi;
		std::cerr << std::endl << usage << std::endl;
		return 1;
	}

	init_logging(cmd.verbose ? debug : warning);
	src::severity_channel_logger<severity_level,std::string> slg(keywords::channel = "pipeline");

	try {
		// read the samples and build the energy surface once for every temperature
		SampleTable samples = read_sample_file(cmd.sample_file);
		BOOST_LOG_SEV(slg, routine) << "Read " << samples.size() << " samples from " << cmd.sample_file;
		VoltagePipeline pipeline(samples, cmd.conditions);
		SweepResult sweep_result = pipeline.sweep();

		for (auto result = sweep_result.results.begin(); result != sweep_result.results.end(); ++result) {
			std::cout << result->print() << std::endl;
			if (!cmd.output_prefix.empty()) write_result_files(cmd.output_prefix, *result);
		}
		for (auto skip = sweep_result.skipped.begin(); skip != sweep_result.skipped.end(); ++skip) {
			std::cout << "Skipped T=" << skip->first << " K: " << skip->second << std::endl;
		}
		if (sweep_result.results.empty()) return 2;
	}
	catch (boost::exception &e) {
		// catch any Boost-enabled exceptions here
		std::string specific_info, err_msg; // error message strings
		if (std::string const * mi = boost::get_error_info<specific_errinfo>(e) ) {
			specific_info = *mi;
		}
		if (std::string const * mi = boost::get_error_info<str_errinfo>(e) ) {
			err_msg = *mi;
		}
		BOOST_LOG_SEV(slg, critical) << "Exception: " << err_msg;
		BOOST_LOG_SEV(slg, critical) << "Reason: " << specific_info;
		BOOST_LOG_SEV(slg, debug) << boost::diagnostic_information(e);
		return 1;
	}
	catch (std::exception &e) {
		// last ditch effort to prevent the crash
		BOOST_LOG_SEV(slg, critical) << "Exception: " << e.what();
		return 1;
	}
	return 0;
}
