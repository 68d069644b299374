/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// lower_hull_test.cpp -- test suite for the lower convex hull of formation energies

#include "test/include/test_pch.hpp"
#include "test/include/fixtures/fixture_samples.hpp"
#include "libvoltage/include/lower_hull.hpp"
#include <algorithm>
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

using namespace Voltage;

namespace {
// Smallest lithiation among the vertices of a segment
double segment_start(const FormationEnergyCurve &curve, const HullSegment &segment) {
	double start = curve.points[segment.vertices.front()].first;
	for (auto id : segment.vertices) start = std::min(start, curve.points[id].first);
	return start;
}
}

BOOST_FIXTURE_TEST_SUITE(LowerHullSuite, SampleFixture)
	BOOST_AUTO_TEST_CASE(SegmentsAreOrderedAndStable)
	{
		FormationEnergyCurve curve = make_curve({0, 0.25, 0.5, 0.75, 1}, {0, -0.075, -0.1, -0.075, 0});
		LowerHullSegments segments = extract_lower_hull(curve);
		BOOST_REQUIRE(!segments.empty());
		double previous_start = -1;
		for (auto segment : segments) {
			BOOST_CHECK_EQUAL(segment.vertices.size(), 2);
			BOOST_CHECK_EQUAL(segment.normal.size(), 2);
			const double start = segment_start(curve, segment);
			BOOST_CHECK_GE(start, previous_start);
			previous_start = start;
			for (auto id : segment.vertices) {
				BOOST_CHECK_LE(curve.points[id].second, 0);
			}
		}
		BOOST_CHECK_EQUAL(stable_compositions(curve, segments).size(), 5);
	}
	BOOST_AUTO_TEST_CASE(PointsAboveTheHullAreNotStable)
	{
		FormationEnergyCurve curve = make_curve({0, 0.25, 0.5, 0.75, 1}, {0, -0.2, -0.05, -0.2, 0});
		LowerHullSegments segments = extract_lower_hull(curve);
		std::vector<CurvePoint> stable = stable_compositions(curve, segments);
		BOOST_REQUIRE_EQUAL(stable.size(), 4);
		BOOST_CHECK_EQUAL(stable[0].first, 0);
		BOOST_CHECK_EQUAL(stable[1].first, 0.25);
		BOOST_CHECK_EQUAL(stable[2].first, 0.75);
		BOOST_CHECK_EQUAL(stable[3].first, 1);
		// the hull is a lower bound for every point of the curve
		PiecewiseLinearInterpolator hull = hull_restricted_interpolator(curve, segments);
		for (auto pt : curve.points) {
			BOOST_CHECK_LE(hull(pt.first), pt.second + 1e-14);
		}
		BOOST_CHECK_CLOSE_FRACTION(hull(0.5), -0.2, 1e-12);
	}
	BOOST_AUTO_TEST_CASE(UnfavourableMixingKeepsTheEndMembers)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, 0.15, 0});
		LowerHullSegments segments = extract_lower_hull(curve);
		BOOST_REQUIRE_EQUAL(segments.size(), 1);
		std::vector<CurvePoint> stable = stable_compositions(curve, segments);
		BOOST_REQUIRE_EQUAL(stable.size(), 2);
		BOOST_CHECK_EQUAL(stable.front().first, 0);
		BOOST_CHECK_EQUAL(stable.back().first, 1);
	}
	BOOST_AUTO_TEST_CASE(ToleranceAdmitsPositiveVertices)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, 0.15, 0});
		BOOST_CHECK_EQUAL(extract_lower_hull(curve, 0.2).size(), 3);
		BOOST_CHECK_EQUAL(extract_lower_hull(curve, 0.1).size(), 1);
	}
	BOOST_AUTO_TEST_CASE(NoStableFacets)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0.1, 0.2, 0.1});
		LowerHullSegments segments;
		BOOST_CHECK_NO_THROW(segments = extract_lower_hull(curve));
		BOOST_CHECK(segments.empty());
		BOOST_CHECK(stable_compositions(curve, segments).empty());
		BOOST_CHECK_THROW(hull_restricted_interpolator(curve, segments), insufficient_hull_error);
	}
	BOOST_AUTO_TEST_CASE(DegenerateCurves)
	{
		BOOST_CHECK_THROW(extract_lower_hull(make_curve({0, 1}, {0, 0})), degenerate_input_error);
		BOOST_CHECK_THROW(extract_lower_hull(make_curve({0, 0.5, 1}, {0, -0.1, -0.2})), degenerate_input_error);
	}
	BOOST_AUTO_TEST_CASE(SegmentsMustReferToTheCurve)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, -0.25, 0});
		LowerHullSegments segments(1);
		segments[0].vertices.push_back(0);
		segments[0].vertices.push_back(7);
		BOOST_CHECK_THROW(stable_compositions(curve, segments), range_check_error);
	}
BOOST_AUTO_TEST_SUITE_END()
