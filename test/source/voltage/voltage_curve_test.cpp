/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// voltage_curve_test.cpp -- test suite for open-circuit voltage curves

#include "test/include/test_pch.hpp"
#include "test/include/fixtures/fixture_samples.hpp"
#include "libvoltage/include/lower_hull.hpp"
#include "libvoltage/include/voltage_curve.hpp"
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

using namespace Voltage;

BOOST_FIXTURE_TEST_SUITE(VoltageCurveSuite, SampleFixture)
	BOOST_AUTO_TEST_CASE(TwoPlateaus)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, -0.25, 0});
		LowerHullSegments segments = extract_lower_hull(curve);
		OCVCurve ocv = derive_voltage_curve(curve, segments, -1.95, 11);
		BOOST_REQUIRE_EQUAL(ocv.size(), 11);
		BOOST_CHECK_EQUAL(ocv.temperature, 300);
		BOOST_CHECK_EQUAL(ocv.points.front().first, 0);
		BOOST_CHECK_EQUAL(ocv.points.back().first, 1);
		// slope -0.5 below x=0.5 and +0.5 above
		for (std::size_t i = 0; i < 5; ++i) {
			BOOST_CHECK_CLOSE_FRACTION(ocv.points[i].second, -1.45, 1e-9);
		}
		for (std::size_t i = 6; i < 11; ++i) {
			BOOST_CHECK_CLOSE_FRACTION(ocv.points[i].second, -2.45, 1e-9);
		}
		// the central difference straddles the phase boundary
		BOOST_CHECK_CLOSE_FRACTION(ocv.points[5].second, -1.95, 1e-9);
	}
	BOOST_AUTO_TEST_CASE(ExactPlateaus)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, -0.25, 0});
		std::vector<VoltagePlateau> plateaus = voltage_plateaus(curve, extract_lower_hull(curve), -1.95);
		BOOST_REQUIRE_EQUAL(plateaus.size(), 2);
		BOOST_CHECK_EQUAL(plateaus[0].lithiation_begin, 0);
		BOOST_CHECK_EQUAL(plateaus[0].lithiation_end, 0.5);
		BOOST_CHECK_CLOSE_FRACTION(plateaus[0].voltage, -1.45, 1e-12);
		BOOST_CHECK_EQUAL(plateaus[1].lithiation_begin, 0.5);
		BOOST_CHECK_EQUAL(plateaus[1].lithiation_end, 1);
		BOOST_CHECK_CLOSE_FRACTION(plateaus[1].voltage, -2.45, 1e-12);
	}
	BOOST_AUTO_TEST_CASE(UnstablePointsDoNotShapeTheCurve)
	{
		// x=0.5 lies above the hull and must not create a step
		FormationEnergyCurve curve = make_curve({0, 0.25, 0.5, 0.75, 1}, {0, -0.2, -0.05, -0.2, 0});
		LowerHullSegments segments = extract_lower_hull(curve);
		OCVCurve ocv = derive_voltage_curve(curve, segments, 0, 9);
		BOOST_REQUIRE_EQUAL(ocv.size(), 9);
		BOOST_CHECK_CLOSE_FRACTION(ocv.points[0].second, 0.8, 1e-9);
		BOOST_CHECK_SMALL(ocv.points[4].second, 1e-9);
		BOOST_CHECK_CLOSE_FRACTION(ocv.points[8].second, -0.8, 1e-9);
		BOOST_CHECK_EQUAL(voltage_plateaus(curve, segments, 0).size(), 3);
	}
	BOOST_AUTO_TEST_CASE(ConstantVoltageWithoutMixing)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, 0.15, 0});
		OCVCurve ocv = derive_voltage_curve(curve, extract_lower_hull(curve), -1.95, 50);
		BOOST_REQUIRE_EQUAL(ocv.size(), 50);
		for (auto pt : ocv.points) {
			BOOST_CHECK_CLOSE_FRACTION(pt.second, -1.95, 1e-12);
		}
	}
	BOOST_AUTO_TEST_CASE(InsufficientHull)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0.1, 0.2, 0.1});
		LowerHullSegments segments = extract_lower_hull(curve);
		BOOST_CHECK_THROW(derive_voltage_curve(curve, segments, -1.95), insufficient_hull_error);
		BOOST_CHECK_THROW(voltage_plateaus(curve, segments, -1.95), insufficient_hull_error);
	}
	BOOST_AUTO_TEST_CASE(StableRangeMustSpanTheGrid)
	{
		// only x=0.5 and x=0.75 are stable; the voltage grid covers [0,1]
		FormationEnergyCurve curve = make_curve({0, 0.5, 0.75, 1}, {0.3, -0.2, -0.1, 0.3});
		LowerHullSegments segments = extract_lower_hull(curve);
		BOOST_REQUIRE_EQUAL(stable_compositions(curve, segments).size(), 2);
		BOOST_CHECK_THROW(derive_voltage_curve(curve, segments, -1.95), out_of_domain_error);
	}
	BOOST_AUTO_TEST_CASE(GridNeedsTwoPoints)
	{
		FormationEnergyCurve curve = make_curve({0, 0.5, 1}, {0, -0.25, 0});
		BOOST_CHECK_THROW(derive_voltage_curve(curve, extract_lower_hull(curve), -1.95, 1), range_check_error);
	}
BOOST_AUTO_TEST_SUITE_END()
