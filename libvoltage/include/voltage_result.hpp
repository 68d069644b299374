/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Result of a voltage calculation at one temperature

#ifndef INCLUDED_VOLTAGE_RESULT
#define INCLUDED_VOLTAGE_RESULT

#include "libvoltage/include/curves.hpp"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace Voltage {

struct VoltageResult {
	double temperature; // K
	double li_reference_energy;
	FormationEnergyCurve formation_energy;
	LowerHullSegments lower_hull;
	std::vector<CurvePoint> stable_compositions;
	std::vector<VoltagePlateau> plateaus;
	OCVCurve voltage; // empty if the lower hull is empty
	double walltime; // seconds
	VoltageResult() : temperature(0), li_reference_energy(0), walltime(0) { }
	// Human-readable report
	std::string print() const;
	// x, E_form, on_hull
	void write_formation_csv(std::ostream &stream) const;
	// x, voltage
	void write_voltage_csv(std::ostream &stream) const;
	// "<prefix>_<T>K", with T at the default stream precision
	std::string file_stem(const std::string &prefix) const;
};

// Results of a temperature sweep; temperatures that could not be calculated are listed with the reason
struct SweepResult {
	std::vector<VoltageResult> results;
	std::vector<std::pair<double,std::string>> skipped;
};

} // namespace Voltage

#endif
