/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// conditions.hpp -- header file for voltage calculation conditions

#ifndef INCLUDED_CONDITIONS
#define INCLUDED_CONDITIONS
#include <boost/optional.hpp>
#include <cstddef>
#include <string>
#include <vector>

// Largest formation energy or voltage grid accepted
const std::size_t max_grid_points = 10000000;

struct voltage_conditions {
	boost::optional<double> li_reference_energy; // energy of bulk Li metal (e_li_bulk); must be supplied
	std::size_t formation_points; // resolution of the formation energy grid (npts)
	std::size_t voltage_points; // resolution of the voltage grid (ngrid)
	double hull_tolerance; // lower hull facets keep vertices with E_form <= hull_tolerance
	std::vector<double> temperatures; // query temperatures (K)
	voltage_conditions() : formation_points(100), voltage_points(500), hull_tolerance(0) { }
};

// Throws range_check_error or floating_point_error if the conditions cannot be used
void check_conditions(const voltage_conditions &conditions);

// Grid size given as text (NPTS, NGRID); throws syntax_error unless it is a positive integer
std::size_t parse_point_count(const std::string &keyword, const std::string &value);

#endif
