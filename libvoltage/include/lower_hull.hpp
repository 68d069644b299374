/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Lower convex hull of a formation energy curve and the stable compositions on it

#ifndef INCLUDED_LOWER_HULL
#define INCLUDED_LOWER_HULL

#include "libvoltage/include/curves.hpp"
#include "libvoltage/include/interpolation/piecewise_linear.hpp"
#include <vector>

namespace Voltage {

/* Hull facets of the curve whose vertices all have E_form <= energy_tolerance,
 * sorted by their smallest lithiation. An empty result means no stable facet
 * and is not an error.
 */
LowerHullSegments extract_lower_hull(const FormationEnergyCurve &curve, const double energy_tolerance = 0);

// Distinct hull vertices as (x, E_form), sorted by x
std::vector<CurvePoint> stable_compositions(const FormationEnergyCurve &curve, const LowerHullSegments &segments);

// Interpolation of E_form through the stable compositions only.
// Throws insufficient_hull_error if there are fewer than 2 of them.
PiecewiseLinearInterpolator hull_restricted_interpolator(const FormationEnergyCurve &curve, const LowerHullSegments &segments);

} // namespace Voltage

#endif
