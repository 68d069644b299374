/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_reader.cpp -- parser for delimited sample files

#include "libsample/include/libsample_pch.hpp"
#include "libsample/include/sample_reader.hpp"
#include "libsample/include/grammars/sample_grammar.hpp"
#include "libsample/include/utils/match_keyword.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include <set>
#include <vector>

namespace {
const std::set<std::string> column_keywords = { "LITHIATION", "TEMPERATURE", "ENERGY" };

// Maps each named column to its position in a row
struct column_layout {
	std::size_t lithiation;
	std::size_t temperature;
	std::size_t energy;
	std::size_t width; // number of fields expected per row
	column_layout() : lithiation(0), temperature(1), energy(2), width(3) { }
};

bool parse_row(const std::string &line, const sample_row_grammar &grammar, std::vector<double> &values) {
	using boost::spirit::ascii::space;
	std::string::const_iterator iter = line.begin();
	std::string::const_iterator end = line.end();
	values.clear();
	bool r = boost::spirit::qi::phrase_parse(iter, end, grammar, space, values);
	return r && iter == end;
}

column_layout parse_header(const std::string &line, logger &data_log) {
	std::vector<std::string> names;
	if (line.find_first_of(",;\t") != std::string::npos) {
		boost::split(names, line, boost::is_any_of(",;\t"));
	}
	else {
		boost::split(names, line, boost::is_any_of(" "), boost::token_compress_on);
	}
	std::map<std::string,std::size_t> positions;
	for (std::size_t i = 0; i < names.size(); ++i) {
		std::string name = boost::trim_copy(names[i]);
		boost::optional<std::string> keyword = find_keyword(name, column_keywords);
		if (!keyword) {
			BOOST_LOG_SEV(data_log, debug) << "Ignoring column \"" << name << "\"";
			continue;
		}
		if (!positions.insert(std::make_pair(*keyword, i)).second) {
			BOOST_THROW_EXCEPTION(parse_error() << str_errinfo("Column named more than once") << specific_errinfo(*keyword));
		}
	}
	for (auto keyword : column_keywords) {
		if (positions.find(keyword) == positions.end()) {
			BOOST_THROW_EXCEPTION(parse_error() << str_errinfo("Missing column in header") << specific_errinfo(keyword));
		}
	}
	column_layout layout;
	layout.lithiation = positions["LITHIATION"];
	layout.temperature = positions["TEMPERATURE"];
	layout.energy = positions["ENERGY"];
	layout.width = names.size();
	return layout;
}
}

SampleTable read_sample_table(std::istream &input) {
	BOOST_LOG_NAMED_SCOPE("read_sample_table");
	logger data_log(journal::keywords::channel = "data");
	sample_row_grammar grammar;
	column_layout layout;
	SampleTable table;
	std::vector<double> values;
	std::string line;
	std::size_t linenum = 0;
	bool first_record = true;

	while (std::getline(input, line)) {
		++linenum;
		boost::trim(line);
		if (line.empty() || line[0] == '#') continue;
		const bool numeric = parse_row(line, grammar, values);
		if (first_record) {
			first_record = false;
			if (!numeric) {
				try {
					layout = parse_header(line, data_log);
				}
				catch (parse_error &e) {
					e << line_errinfo(linenum);
					throw; // push exception up the call stack
				}
				BOOST_LOG_SEV(data_log, debug) << "Header found on line " << linenum;
				continue;
			}
		}
		if (!numeric) {
			BOOST_THROW_EXCEPTION(parse_error() << str_errinfo("Malformed sample row") << specific_errinfo(line) << line_errinfo(linenum));
		}
		if (values.size() != layout.width) {
			std::string argnum (boost::lexical_cast<std::string>(values.size())); // convert number to string
			std::string err_msg("Wrong number of fields (" + argnum + ")");
			BOOST_THROW_EXCEPTION(parse_error() << str_errinfo(err_msg) << specific_errinfo(line) << line_errinfo(linenum));
		}
		try {
			table.add_sample(values[layout.lithiation], values[layout.temperature], values[layout.energy]);
		}
		catch (exception_base &e) {
			e << line_errinfo(linenum);
			throw;
		}
	}
	if (input.bad()) {
		BOOST_THROW_EXCEPTION(read_error() << str_errinfo("Error reading sample stream") << line_errinfo(linenum));
	}
	BOOST_LOG_SEV(data_log, routine) << "Read " << table.size() << " samples";
	return table;
}

SampleTable read_sample_file(const std::string &filename) {
	BOOST_LOG_NAMED_SCOPE("read_sample_file");
	logger data_log(journal::keywords::channel = "data");
	std::ifstream samplefile(filename.c_str());
	if (!samplefile.good()) {
		BOOST_THROW_EXCEPTION(file_read_error() << str_errinfo("Cannot open sample file") << boost::errinfo_file_name(filename));
	}
	BOOST_LOG_SEV(data_log, routine) << "Reading samples from " << filename;
	try {
		return read_sample_table(samplefile);
	}
	catch (exception_base &e) {
		e << boost::errinfo_file_name(filename);
		throw;
	}
}
