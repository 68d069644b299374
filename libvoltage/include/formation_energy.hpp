/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Formation energy relative to the end members at the same temperature

#ifndef INCLUDED_FORMATION_ENERGY
#define INCLUDED_FORMATION_ENERGY

#include "libvoltage/include/curves.hpp"
#include "libvoltage/include/interpolation/grid_interpolator.hpp"
#include <cstddef>
#include <vector>

namespace Voltage {

/* E_form(x, T) = E(x, T) - x E(1, T) - (1-x) E(0, T)
 * The end members are always evaluated at the temperature of the query.
 * The evaluator refers to the energy surface; the surface must outlive it.
 */
class FormationEnergyEvaluator {
public:
	explicit FormationEnergyEvaluator(const GridInterpolator &surface) : energy_surface(surface) { }
	double operator() (const double lithiation, const double temperature) const;
	// point_count evenly spaced lithiation values on [0,1], endpoints included
	FormationEnergyCurve curve(const double temperature, const std::size_t point_count = 100) const;
	// One curve per temperature
	std::vector<FormationEnergyCurve> map(const std::vector<double> &temperatures, const std::size_t point_count = 100) const;
private:
	const GridInterpolator &energy_surface;
};

} // namespace Voltage

#endif
