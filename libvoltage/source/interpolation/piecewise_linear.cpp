/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/interpolation/piecewise_linear.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace Voltage {

PiecewiseLinearInterpolator::PiecewiseLinearInterpolator(
		const std::vector<double> &abscissae, const std::vector<double> &ordinates, const double domain_tolerance)
: knots_x(abscissae), knots_y(ordinates), tolerance(domain_tolerance) {
	if (knots_x.size() != knots_y.size()) {
		BOOST_THROW_EXCEPTION(internal_error() << str_errinfo("Knot coordinate arrays have different lengths"));
	}
	if (knots_x.size() < 2) {
		std::string count (boost::lexical_cast<std::string>(knots_x.size()));
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Piecewise-linear interpolation needs 2 knots") << specific_errinfo(count));
	}
	for (std::size_t i = 1; i < knots_x.size(); ++i) {
		if (!(knots_x[i] > knots_x[i-1])) {
			BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Knots are not strictly increasing")
				<< specific_errinfo(boost::lexical_cast<std::string>(knots_x[i])));
		}
	}
}

double PiecewiseLinearInterpolator::operator() (const double x) const {
	if (!(x >= knots_x.front() - tolerance && x <= knots_x.back() + tolerance)) {
		BOOST_THROW_EXCEPTION(out_of_domain_error() << str_errinfo("Interpolation point is outside the knot range")
			<< specific_errinfo(boost::lexical_cast<std::string>(x)));
	}
	if (x <= knots_x.front()) return knots_y.front();
	if (x >= knots_x.back()) return knots_y.back();
	// first knot strictly greater than x; x lies in [knots_x[upper-1], knots_x[upper])
	const std::size_t upper = std::distance(knots_x.cbegin(), std::upper_bound(knots_x.cbegin(), knots_x.cend(), x));
	const std::size_t lower = upper - 1;
	const double fraction = (x - knots_x[lower]) / (knots_x[upper] - knots_x[lower]);
	return knots_y[lower] + fraction * (knots_y[upper] - knots_y[lower]);
}

double PiecewiseLinearInterpolator::slope(const std::size_t segment) const {
	if (segment + 1 >= knots_x.size()) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("No such segment")
			<< specific_errinfo(boost::lexical_cast<std::string>(segment)));
	}
	return (knots_y[segment+1] - knots_y[segment]) / (knots_x[segment+1] - knots_x[segment]);
}

} // namespace Voltage
