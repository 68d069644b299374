/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Piecewise-linear interpolation over strictly increasing abscissae

#ifndef INCLUDED_PIECEWISE_LINEAR
#define INCLUDED_PIECEWISE_LINEAR

#include <cstddef>
#include <utility>
#include <vector>

namespace Voltage {

/* Queries outside [front, back] throw out_of_domain_error; there is no extrapolation.
 * Queries within domain_tolerance of an end are clamped onto it.
 */
class PiecewiseLinearInterpolator {
public:
	PiecewiseLinearInterpolator(const std::vector<double> &abscissae, const std::vector<double> &ordinates,
	                            const double domain_tolerance = 1e-12);
	double operator() (const double x) const;
	double slope(const std::size_t segment) const; // slope between knots segment and segment+1
	std::size_t knot_count() const { return knots_x.size(); }
	std::pair<double,double> domain() const { return std::make_pair(knots_x.front(), knots_x.back()); }
	const std::vector<double>& abscissae() const { return knots_x; }
private:
	std::vector<double> knots_x;
	std::vector<double> knots_y;
	double tolerance;
};

} // namespace Voltage

#endif
