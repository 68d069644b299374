/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#ifndef INCLUDED_PIPELINE
#define INCLUDED_PIPELINE

// declaration for VoltagePipeline object

#include "libvoltage/include/curves.hpp"
#include "libvoltage/include/formation_energy.hpp"
#include "libvoltage/include/interpolation/grid_interpolator.hpp"
#include "libvoltage/include/voltage_result.hpp"
#include "libsample/include/conditions.hpp"
#include "libsample/include/logging.hpp"
#include "libsample/include/sample_table.hpp"
#include <boost/noncopyable.hpp>
#include <vector>

namespace Voltage {

/*
 * VoltagePipeline owns a copy of the samples and the conditions, and builds the
 * energy surface once. Every stage is a const member that returns a new value,
 * so one pipeline can answer any number of temperature queries.
 *
 * Per temperature:
 * 1) formation energy curve on conditions.formation_points values of x
 * 2) lower hull facets with E_form <= conditions.hull_tolerance
 * 3) stable compositions and voltage plateaus
 * 4) OCV curve on conditions.voltage_points values of x
 */
class VoltagePipeline : private boost::noncopyable {
private:
	const SampleTable samples;
	const voltage_conditions conditions;
	const GridInterpolator energy_surface;
	const FormationEnergyEvaluator formation;
	mutable logger class_log;
public:
	VoltagePipeline(const SampleTable &sample_table, const voltage_conditions &conds);
	FormationEnergyCurve formation_energy_curve(const double temperature) const;
	LowerHullSegments lower_hull(const FormationEnergyCurve &curve) const;
	OCVCurve voltage_curve(const FormationEnergyCurve &curve, const LowerHullSegments &segments) const;
	VoltageResult calculate(const double temperature) const;
	// calculate() at every conditioned temperature; temperatures outside the sampled
	// domain or without enough stable compositions are skipped and reported
	SweepResult sweep() const;
	const GridInterpolator& surface() const { return energy_surface; }
};

} // namespace Voltage

#endif
