/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Open-circuit voltage from the lower hull of the formation energy

#ifndef INCLUDED_VOLTAGE_CURVE
#define INCLUDED_VOLTAGE_CURVE

#include "libvoltage/include/curves.hpp"
#include <cstddef>
#include <vector>

namespace Voltage {

/* V(x) = -(dE/dx - li_reference_energy), where E is the hull-restricted
 * formation energy sampled on grid_points evenly spaced values of x in [0,1]
 * and dE/dx is its finite difference derivative.
 * Throws insufficient_hull_error with fewer than 2 stable compositions and
 * out_of_domain_error if the stable compositions do not span [0,1].
 */
OCVCurve derive_voltage_curve(const FormationEnergyCurve &curve, const LowerHullSegments &segments,
                              const double li_reference_energy, const std::size_t grid_points = 500);

// Exact voltage of every hull segment between neighbouring stable compositions
std::vector<VoltagePlateau> voltage_plateaus(const FormationEnergyCurve &curve, const LowerHullSegments &segments,
                                             const double li_reference_energy);

} // namespace Voltage

#endif
