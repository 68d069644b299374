/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_reader.hpp -- reading a SampleTable from delimited text

#ifndef INCLUDED_SAMPLE_READER
#define INCLUDED_SAMPLE_READER

#include "libsample/include/sample_table.hpp"
#include <istream>
#include <string>

/*
 * One sample per line, fields separated by ',', ';', tabs or spaces.
 * Blank lines and lines starting with '#' are skipped.
 * An optional header names the columns; names are matched by abbreviation
 * against LITHIATION, TEMPERATURE and ENERGY, and other columns are ignored.
 * Without a header the columns are lithiation, temperature, energy.
 */
SampleTable read_sample_table(std::istream &input);
SampleTable read_sample_file(const std::string &filename);

#endif
