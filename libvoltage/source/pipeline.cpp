/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// definition for VoltagePipeline and its stages

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/pipeline.hpp"
#include "libvoltage/include/lower_hull.hpp"
#include "libvoltage/include/voltage_curve.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/timer/timer.hpp>

namespace Voltage {

namespace {
// validate before anything is built from the conditions
const voltage_conditions& checked(const voltage_conditions &conds) {
	check_conditions(conds);
	return conds;
}
}

VoltagePipeline::VoltagePipeline(const SampleTable &sample_table, const voltage_conditions &conds)
: samples(sample_table), conditions(checked(conds)), energy_surface(samples), formation(energy_surface),
  class_log(journal::keywords::channel = "pipeline") {
	BOOST_LOG_NAMED_SCOPE("VoltagePipeline::VoltagePipeline");
	BOOST_LOG_SEV(class_log, debug) << "Energy surface built from " << samples.size() << " samples";
}

FormationEnergyCurve VoltagePipeline::formation_energy_curve(const double temperature) const {
	return formation.curve(temperature, conditions.formation_points);
}

LowerHullSegments VoltagePipeline::lower_hull(const FormationEnergyCurve &curve) const {
	return extract_lower_hull(curve, conditions.hull_tolerance);
}

OCVCurve VoltagePipeline::voltage_curve(const FormationEnergyCurve &curve, const LowerHullSegments &segments) const {
	return derive_voltage_curve(curve, segments, *conditions.li_reference_energy, conditions.voltage_points);
}

VoltageResult VoltagePipeline::calculate(const double temperature) const {
	BOOST_LOG_NAMED_SCOPE("VoltagePipeline::calculate");
	BOOST_LOG_SEV(class_log, debug) << "enter function";
	boost::timer::cpu_timer timer; // tracking wall clock time for the calculation
	VoltageResult result;
	result.temperature = temperature;
	result.li_reference_energy = *conditions.li_reference_energy;
	result.formation_energy = formation_energy_curve(temperature);
	result.lower_hull = lower_hull(result.formation_energy);
	if (result.lower_hull.empty()) {
		// Uniformly unfavourable mixing; nothing to differentiate
		BOOST_LOG_SEV(class_log, warning) << "No stable phases at T=" << temperature << "; voltage curve is empty";
		result.voltage = OCVCurve(temperature);
	}
	else {
		result.stable_compositions = stable_compositions(result.formation_energy, result.lower_hull);
		result.plateaus = voltage_plateaus(result.formation_energy, result.lower_hull, result.li_reference_energy);
		result.voltage = voltage_curve(result.formation_energy, result.lower_hull);
	}
	timer.stop();
	result.walltime = timer.elapsed().wall * 1e-9; // timer.elapsed().wall is in nanoseconds
	BOOST_LOG_SEV(class_log, routine) << "T=" << temperature << ": " << result.stable_compositions.size()
		<< " stable compositions, " << result.plateaus.size() << " voltage plateaus";
	return result;
}

SweepResult VoltagePipeline::sweep() const {
	BOOST_LOG_NAMED_SCOPE("VoltagePipeline::sweep");
	SweepResult sweep_result;
	if (conditions.temperatures.empty()) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("No temperatures to sweep"));
	}
	for (auto T : conditions.temperatures) {
		try {
			sweep_result.results.push_back(calculate(T));
		}
		catch (insufficient_hull_error &) {
			BOOST_LOG_SEV(class_log, warning) << "Skipping T=" << T << ": too few stable compositions";
			sweep_result.skipped.emplace_back(T, "too few stable compositions");
		}
		catch (out_of_domain_error &e) {
			std::string reason = "outside the sampled domain";
			if (std::string const * mi = boost::get_error_info<specific_errinfo>(e)) {
				reason += " at " + *mi;
			}
			BOOST_LOG_SEV(class_log, warning) << "Skipping T=" << T << ": " << reason;
			sweep_result.skipped.emplace_back(T, reason);
		}
	}
	return sweep_result;
}

} // namespace Voltage
