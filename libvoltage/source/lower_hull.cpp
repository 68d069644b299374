/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/lower_hull.hpp"
#include "libvoltage/include/utils/convex_hull.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <set>
#include <string>

namespace Voltage {

LowerHullSegments extract_lower_hull(const FormationEnergyCurve &curve, const double energy_tolerance) {
	BOOST_LOG_NAMED_SCOPE("extract_lower_hull");
	logger hull_log(journal::keywords::channel = "hull");
	std::vector<std::vector<double>> points;
	points.reserve(curve.size());
	for (auto pt : curve.points) {
		std::vector<double> point(2);
		point[0] = pt.first;
		point[1] = pt.second;
		points.push_back(point);
	}
	LowerHullSegments segments = details::lower_convex_hull(points, energy_tolerance);
	if (segments.empty()) {
		BOOST_LOG_SEV(hull_log, warning) << "No stable hull facets at T=" << curve.temperature;
	}
	else {
		BOOST_LOG_SEV(hull_log, debug) << segments.size() << " lower hull facets at T=" << curve.temperature;
	}
	return segments;
}

std::vector<CurvePoint> stable_compositions(const FormationEnergyCurve &curve, const LowerHullSegments &segments) {
	std::set<std::size_t> vertex_ids;
	for (auto segment : segments) {
		for (auto id : segment.vertices) {
			if (id >= curve.size()) {
				BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Hull vertex is not a point of the curve")
					<< specific_errinfo(boost::lexical_cast<std::string>(id)));
			}
			vertex_ids.insert(id);
		}
	}
	std::vector<CurvePoint> vertices;
	vertices.reserve(vertex_ids.size());
	for (auto id : vertex_ids) vertices.push_back(curve.points[id]);
	std::sort(vertices.begin(), vertices.end());
	// Keep one vertex per lithiation value
	auto new_end = std::unique(vertices.begin(), vertices.end(),
		[] (const CurvePoint &a, const CurvePoint &b) { return a.first == b.first; });
	vertices.erase(new_end, vertices.end());
	return vertices;
}

PiecewiseLinearInterpolator hull_restricted_interpolator(const FormationEnergyCurve &curve, const LowerHullSegments &segments) {
	const std::vector<CurvePoint> vertices = stable_compositions(curve, segments);
	if (vertices.size() < 2) {
		std::string count (boost::lexical_cast<std::string>(vertices.size()));
		BOOST_THROW_EXCEPTION(insufficient_hull_error() << str_errinfo("At least 2 stable compositions are required")
			<< specific_errinfo(count));
	}
	std::vector<double> knots_x, knots_y;
	knots_x.reserve(vertices.size());
	knots_y.reserve(vertices.size());
	for (auto vertex : vertices) {
		knots_x.push_back(vertex.first);
		knots_y.push_back(vertex.second);
	}
	return PiecewiseLinearInterpolator(knots_x, knots_y);
}

} // namespace Voltage
