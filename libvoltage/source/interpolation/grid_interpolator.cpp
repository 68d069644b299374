/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/interpolation/grid_interpolator.hpp"
#include "libvoltage/include/utils/barycentric.hpp"
#include "libvoltage/include/utils/convex_hull.hpp"
#include "libvoltage/include/utils/geometry/orientation.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace Voltage {

namespace {
const double barycentric_tolerance = 1e-10; // admits points on cell edges
const double temperature_match_tolerance = 1e-9; // relative, for single-temperature tables

std::string query_string(const double lithiation, const double temperature) {
	return "(" + boost::lexical_cast<std::string>(lithiation) + ", "
	           + boost::lexical_cast<std::string>(temperature) + ")";
}
}

GridInterpolator::GridInterpolator(const SampleTable &samples)
: x_min(0), x_span(0), T_min(0), T_span(0), class_log(journal::keywords::channel = "interpolation") {
	BOOST_LOG_NAMED_SCOPE("GridInterpolator::GridInterpolator");
	BOOST_LOG_SEV(class_log, debug) << "enter ctor";
	if (samples.size() < 3) {
		std::string count (boost::lexical_cast<std::string>(samples.size()));
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("At least 3 samples are required") << specific_errinfo(count));
	}
	const auto x_bounds = samples.lithiation_bounds();
	const auto T_bounds = samples.temperature_bounds();
	x_min = x_bounds.first;
	x_span = x_bounds.second - x_bounds.first;
	T_min = T_bounds.first;
	T_span = T_bounds.second - T_bounds.first;

	if (T_span == 0) {
		// Special case: one temperature, interpolate along lithiation only
		std::vector<std::pair<double,double>> line;
		line.reserve(samples.size());
		for (auto sample : samples) line.emplace_back(sample.lithiation, sample.energy);
		std::sort(line.begin(), line.end());
		std::vector<double> line_x, line_energy;
		for (auto pt : line) {
			line_x.push_back(pt.first);
			line_energy.push_back(pt.second);
		}
		line_interpolator = PiecewiseLinearInterpolator(line_x, line_energy);
		BOOST_LOG_SEV(class_log, routine) << "All " << samples.size() << " samples are at T=" << T_min
			<< "; interpolating along lithiation only";
		return;
	}
	if (x_span == 0) {
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("All samples have the same lithiation")
			<< specific_errinfo(boost::lexical_cast<std::string>(x_min)));
	}

	std::vector<std::vector<double>> scaled_points; // sample coordinates in the unit square
	scaled_points.reserve(samples.size());
	energies.reserve(samples.size());
	for (auto sample : samples) {
		std::vector<double> point(2);
		point[0] = (sample.lithiation - x_min) / x_span;
		point[1] = (sample.temperature - T_min) / T_span;
		scaled_points.push_back(point);
		energies.push_back(sample.energy);
	}
	if (is_collinear(scaled_points)) {
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Sample coordinates are collinear"));
	}
	cells = details::delaunay_triangulation(scaled_points);
	BOOST_LOG_SEV(class_log, debug) << "Triangulated " << samples.size() << " samples into " << cells.size() << " cells";
	BOOST_LOG_SEV(class_log, debug) << "exit ctor";
}

double GridInterpolator::operator() (const double lithiation, const double temperature) const {
	if (!std::isfinite(lithiation) || !std::isfinite(temperature)) {
		BOOST_THROW_EXCEPTION(floating_point_error() << str_errinfo("Interpolation point is not finite")
			<< specific_errinfo(query_string(lithiation, temperature)));
	}
	if (line_interpolator) return interpolate_line(lithiation, temperature);
	return interpolate_surface(lithiation, temperature);
}

double GridInterpolator::interpolate_line(const double lithiation, const double temperature) const {
	if (std::fabs(temperature - T_min) > temperature_match_tolerance * std::max(1.0, std::fabs(T_min))) {
		BOOST_THROW_EXCEPTION(out_of_domain_error() << str_errinfo("Samples exist only at one temperature")
			<< specific_errinfo(query_string(lithiation, temperature)));
	}
	try {
		return (*line_interpolator)(lithiation);
	}
	catch (out_of_domain_error &e) {
		e << specific_errinfo(query_string(lithiation, temperature));
		throw;
	}
}

double GridInterpolator::interpolate_surface(const double lithiation, const double temperature) const {
	std::vector<double> point(2);
	point[0] = (lithiation - x_min) / x_span;
	point[1] = (temperature - T_min) / T_span;
	const bool inside_box = point[0] >= -barycentric_tolerance && point[0] <= 1 + barycentric_tolerance
	                     && point[1] >= -barycentric_tolerance && point[1] <= 1 + barycentric_tolerance;
	if (inside_box) {
		for (auto cell = cells.cbegin(); cell != cells.cend(); ++cell) {
			const std::vector<double> weights = details::barycentric_coordinates(*cell, point);
			if (*std::min_element(weights.cbegin(), weights.cend()) < -barycentric_tolerance) continue;
			double energy = 0;
			for (std::size_t i = 0; i < weights.size(); ++i) {
				energy += weights[i] * energies[cell->vertices[i]];
			}
			return energy;
		}
	}
	BOOST_LOG_SEV(class_log, debug) << "No cell contains " << query_string(lithiation, temperature);
	BOOST_THROW_EXCEPTION(out_of_domain_error() << str_errinfo("Interpolation point is outside the sampled domain")
		<< specific_errinfo(query_string(lithiation, temperature)));
}

} // namespace Voltage
