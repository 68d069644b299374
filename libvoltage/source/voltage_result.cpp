/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Printing and tabulation of voltage results

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/voltage_result.hpp"
#include <boost/io/ios_state.hpp>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace Voltage {

std::string VoltageResult::print() const {
	std::stringstream stream;
	stream << "Output from LIBVOLTAGE" << std::endl;
	stream << "Solved in " << std::setprecision(3) << walltime << " secs" << std::endl;
	stream << std::setprecision(6);
	stream << "Temperature " << temperature << " K (" << (temperature-273.15) << " C), "
	       << "E(Li bulk) " << li_reference_energy << std::endl;
	stream << "Formation energy grid " << formation_energy.size() << " points, "
	       << "voltage grid " << voltage.size() << " points" << std::endl;
	stream << std::endl;

	stream << std::scientific; // switch to scientific notation for doubles
	stream << "STABLE COMPOSITIONS " << stable_compositions.size() << std::endl;
	for (auto vertex : stable_compositions) {
		stream << "\tx=" << std::fixed << std::setprecision(4) << vertex.first
		       << "\tE_form=" << std::scientific << std::setprecision(6) << vertex.second << std::endl;
	}
	stream << std::endl;
	stream << "VOLTAGE PLATEAUS " << plateaus.size() << std::endl;
	for (auto plateau : plateaus) {
		stream << "\t" << std::fixed << std::setprecision(4) << plateau.lithiation_begin
		       << " <= x <= " << plateau.lithiation_end
		       << "\tV=" << std::setprecision(6) << plateau.voltage << std::endl;
	}
	if (plateaus.empty()) {
		stream << "\tno stable phases" << std::endl;
	}
	return stream.str();
}

void VoltageResult::write_formation_csv(std::ostream &stream) const {
	boost::io::ios_flags_saver ifs( stream ); // preserve original state of the stream once we leave scope
	boost::io::ios_precision_saver ips( stream );
	std::set<std::size_t> on_hull;
	for (auto segment : lower_hull) on_hull.insert(segment.vertices.cbegin(), segment.vertices.cend());
	stream << std::setprecision(std::numeric_limits<double>::max_digits10);
	stream << "lithiation,formation_energy,on_hull" << "\n";
	for (std::size_t i = 0; i < formation_energy.size(); ++i) {
		stream << formation_energy.points[i].first << "," << formation_energy.points[i].second << ","
		       << (on_hull.count(i) ? 1 : 0) << "\n";
	}
}

void VoltageResult::write_voltage_csv(std::ostream &stream) const {
	boost::io::ios_flags_saver ifs( stream );
	boost::io::ios_precision_saver ips( stream );
	stream << std::setprecision(std::numeric_limits<double>::max_digits10);
	stream << "lithiation,voltage" << "\n";
	for (auto pt : voltage.points) {
		stream << pt.first << "," << pt.second << "\n";
	}
}

std::string VoltageResult::file_stem(const std::string &prefix) const {
	std::stringstream stream;
	stream << prefix << "_" << temperature << "K";
	return stream.str();
}

} // namespace Voltage
