/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// conditions.cpp -- validation of voltage calculation conditions

#include "libsample/include/libsample_pch.hpp"
#include "libsample/include/conditions.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/lexical_cast.hpp>
#include <cmath>

void check_conditions(const voltage_conditions &conditions) {
	if (!conditions.li_reference_energy) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Reference energy of bulk Li is not set") << specific_errinfo("E_LI_BULK"));
	}
	if (!std::isfinite(*conditions.li_reference_energy)) {
		BOOST_THROW_EXCEPTION(floating_point_error() << str_errinfo("Reference energy of bulk Li is not finite") << specific_errinfo("E_LI_BULK"));
	}
	if (conditions.formation_points < 3) {
		std::string pts (boost::lexical_cast<std::string>(conditions.formation_points));
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Formation energy grid needs at least 3 points") << specific_errinfo(pts));
	}
	if (conditions.formation_points > max_grid_points) {
		std::string pts (boost::lexical_cast<std::string>(conditions.formation_points));
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Formation energy grid is too large") << specific_errinfo(pts));
	}
	if (conditions.voltage_points < 2) {
		std::string pts (boost::lexical_cast<std::string>(conditions.voltage_points));
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Voltage grid needs at least 2 points") << specific_errinfo(pts));
	}
	if (conditions.voltage_points > max_grid_points) {
		std::string pts (boost::lexical_cast<std::string>(conditions.voltage_points));
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Voltage grid is too large") << specific_errinfo(pts));
	}
	if (!std::isfinite(conditions.hull_tolerance)) {
		BOOST_THROW_EXCEPTION(floating_point_error() << str_errinfo("Hull tolerance is not finite"));
	}
	if (conditions.hull_tolerance < 0) {
		std::string tol (boost::lexical_cast<std::string>(conditions.hull_tolerance));
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Hull tolerance must be non-negative") << specific_errinfo(tol));
	}
	for (auto T : conditions.temperatures) {
		if (!std::isfinite(T)) {
			BOOST_THROW_EXCEPTION(floating_point_error() << str_errinfo("Temperature is not finite"));
		}
		if (T <= 0) {
			BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Temperature must be positive") << specific_errinfo(boost::lexical_cast<std::string>(T)));
		}
	}
}

std::size_t parse_point_count(const std::string &keyword, const std::string &value) {
	long count = 0;
	try {
		// signed, so that a negative count is not wrapped into a huge unsigned one
		count = boost::lexical_cast<long>(value);
	}
	catch (boost::bad_lexical_cast &) {
		BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("Invalid value for " + keyword) << specific_errinfo(value));
	}
	if (count <= 0) {
		BOOST_THROW_EXCEPTION(syntax_error() << str_errinfo("Point count for " + keyword + " must be positive") << specific_errinfo(value));
	}
	return static_cast<std::size_t>(count);
}
