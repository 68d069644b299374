/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/formation_energy.hpp"
#include "libvoltage/include/utils/uniform_grid.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include <boost/lexical_cast.hpp>
#include <string>

namespace Voltage {

double FormationEnergyEvaluator::operator() (const double lithiation, const double temperature) const {
	const double delithiated = energy_surface(0, temperature);
	const double lithiated = energy_surface(1, temperature);
	return energy_surface(lithiation, temperature) - lithiation * lithiated - (1 - lithiation) * delithiated;
}

FormationEnergyCurve FormationEnergyEvaluator::curve(const double temperature, const std::size_t point_count) const {
	BOOST_LOG_NAMED_SCOPE("FormationEnergyEvaluator::curve");
	logger voltage_log(journal::keywords::channel = "voltage");
	if (point_count < 2) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Formation energy grid needs at least 2 points")
			<< specific_errinfo(boost::lexical_cast<std::string>(point_count)));
	}
	// The end members are shared by every point of the curve
	const double delithiated = energy_surface(0, temperature);
	const double lithiated = energy_surface(1, temperature);
	FormationEnergyCurve retcurve(temperature);
	retcurve.points.reserve(point_count);
	UniformGrid::sample(0, 1, point_count, [&] (const double x) {
		const double formation = energy_surface(x, temperature) - x * lithiated - (1 - x) * delithiated;
		retcurve.points.emplace_back(x, formation);
	});
	BOOST_LOG_SEV(voltage_log, debug) << "Formation energy at T=" << temperature << " on " << point_count << " points";
	return retcurve;
}

std::vector<FormationEnergyCurve> FormationEnergyEvaluator::map(const std::vector<double> &temperatures,
                                                                const std::size_t point_count) const {
	std::vector<FormationEnergyCurve> curves;
	curves.reserve(temperatures.size());
	for (auto T : temperatures) curves.push_back(curve(T, point_count));
	return curves;
}

} // namespace Voltage
