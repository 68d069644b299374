/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Linear interpolation of energy over scattered (lithiation, temperature) samples

#ifndef INCLUDED_GRID_INTERPOLATOR
#define INCLUDED_GRID_INTERPOLATOR

#include "libvoltage/include/interpolation/piecewise_linear.hpp"
#include "libvoltage/include/utils/simplicial_facet.hpp"
#include "libsample/include/sample_table.hpp"
#include "libsample/include/logging.hpp"
#include <boost/optional.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace Voltage {

/* GridInterpolator is the energy surface energy(x, T).
 * The sample coordinates are rescaled to the unit square and triangulated
 * (Delaunay); a query is answered by barycentric interpolation inside the
 * triangle that contains it. Queries outside the triangulated domain throw
 * out_of_domain_error.
 *
 * If every sample shares one temperature, the surface collapses to
 * piecewise-linear interpolation along x at that temperature, and every
 * other temperature is out of the domain.
 */
class GridInterpolator {
public:
	explicit GridInterpolator(const SampleTable &samples);
	double operator() (const double lithiation, const double temperature) const;
	bool single_temperature() const { return static_cast<bool>(line_interpolator); }
	std::size_t cell_count() const { return cells.size(); }
	std::pair<double,double> lithiation_bounds() const { return std::make_pair(x_min, x_min + x_span); }
	std::pair<double,double> temperature_bounds() const { return std::make_pair(T_min, T_min + T_span); }
private:
	typedef details::SimplicialFacet<double> CellType;
	std::vector<double> energies;
	std::vector<CellType> cells;
	double x_min, x_span;
	double T_min, T_span;
	boost::optional<PiecewiseLinearInterpolator> line_interpolator; // single-temperature tables only
	mutable logger class_log;
	double interpolate_line(const double lithiation, const double temperature) const;
	double interpolate_surface(const double lithiation, const double temperature) const;
};

} // namespace Voltage

#endif
