/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/voltage_curve.hpp"
#include "libvoltage/include/lower_hull.hpp"
#include "libvoltage/include/utils/gradient.hpp"
#include "libvoltage/include/utils/uniform_grid.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include <boost/lexical_cast.hpp>
#include <string>

namespace Voltage {

OCVCurve derive_voltage_curve(const FormationEnergyCurve &curve, const LowerHullSegments &segments,
                              const double li_reference_energy, const std::size_t grid_points) {
	BOOST_LOG_NAMED_SCOPE("derive_voltage_curve");
	logger voltage_log(journal::keywords::channel = "voltage");
	if (grid_points < 2) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Voltage grid needs at least 2 points")
			<< specific_errinfo(boost::lexical_cast<std::string>(grid_points)));
	}
	const PiecewiseLinearInterpolator hull_energy = hull_restricted_interpolator(curve, segments);
	BOOST_LOG_SEV(voltage_log, debug) << hull_energy.knot_count() << " stable compositions at T=" << curve.temperature;

	const std::vector<double> grid = UniformGrid::points(0, 1, grid_points);
	std::vector<double> energies;
	energies.reserve(grid.size());
	for (auto x : grid) energies.push_back(hull_energy(x));

	const std::vector<double> slopes = details::gradient(energies, UniformGrid::spacing(0, 1, grid_points));
	OCVCurve ocv(curve.temperature);
	ocv.points.reserve(grid.size());
	for (std::size_t i = 0; i < grid.size(); ++i) {
		ocv.points.emplace_back(grid[i], -(slopes[i] - li_reference_energy));
	}
	return ocv;
}

std::vector<VoltagePlateau> voltage_plateaus(const FormationEnergyCurve &curve, const LowerHullSegments &segments,
                                             const double li_reference_energy) {
	const PiecewiseLinearInterpolator hull_energy = hull_restricted_interpolator(curve, segments);
	const std::vector<double> &knots = hull_energy.abscissae();
	std::vector<VoltagePlateau> plateaus;
	plateaus.reserve(knots.size() - 1);
	for (std::size_t i = 0; i + 1 < knots.size(); ++i) {
		VoltagePlateau plateau;
		plateau.lithiation_begin = knots[i];
		plateau.lithiation_end = knots[i+1];
		plateau.voltage = -(hull_energy.slope(i) - li_reference_energy);
		plateaus.push_back(plateau);
	}
	return plateaus;
}

} // namespace Voltage
