/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Value types passed between the stages of the voltage calculation

#ifndef INCLUDED_CURVES
#define INCLUDED_CURVES

#include "libvoltage/include/utils/simplicial_facet.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace Voltage {

typedef std::pair<double,double> CurvePoint; // (lithiation fraction, value)

// A quantity sampled over lithiation at one temperature, ordered by lithiation
struct CompositionCurve {
	double temperature;
	std::vector<CurvePoint> points;
	CompositionCurve() : temperature(0) { }
	explicit CompositionCurve(const double T) : temperature(T) { }
	std::size_t size() const { return points.size(); }
	bool empty() const { return points.empty(); }
};

typedef CompositionCurve FormationEnergyCurve; // (x, E_form)
typedef CompositionCurve OCVCurve; // (x, voltage)

// A lower hull facet; vertices index into the FormationEnergyCurve
typedef details::SimplicialFacet<double> HullSegment;
typedef std::vector<HullSegment> LowerHullSegments;

// Constant voltage between two neighbouring stable compositions
struct VoltagePlateau {
	double lithiation_begin;
	double lithiation_end;
	double voltage;
};

} // namespace Voltage

#endif
