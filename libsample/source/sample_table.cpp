/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_table.cpp -- implementation of the SampleTable container

#include "libsample/include/libsample_pch.hpp"
#include "libsample/include/sample_table.hpp"
#include "libsample/include/exceptions.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace {
std::string coordinate_string(const double lithiation, const double temperature) {
	return "(" + boost::lexical_cast<std::string>(lithiation) + ", "
	           + boost::lexical_cast<std::string>(temperature) + ")";
}
}

SampleTable::SampleTable(const std::vector<double> &lithiation, const std::vector<double> &temperature,
                         const std::vector<double> &energy) {
	if (lithiation.size() != temperature.size() || lithiation.size() != energy.size()) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Sample columns have different lengths"));
	}
	samples.reserve(lithiation.size());
	for (std::size_t i = 0; i < lithiation.size(); ++i) {
		add_sample(lithiation[i], temperature[i], energy[i]);
	}
}

void SampleTable::add_sample(const Sample &sample) {
	add_sample(sample.lithiation, sample.temperature, sample.energy);
}

void SampleTable::add_sample(const double lithiation, const double temperature, const double energy) {
	const std::string where = coordinate_string(lithiation, temperature);
	if (!std::isfinite(lithiation) || !std::isfinite(temperature) || !std::isfinite(energy)) {
		BOOST_THROW_EXCEPTION(floating_point_error() << str_errinfo("Sample contains a non-finite value") << specific_errinfo(where));
	}
	if (lithiation < 0 || lithiation > 1) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Lithiation fraction must lie in [0,1]") << specific_errinfo(where));
	}
	if (temperature <= 0) {
		BOOST_THROW_EXCEPTION(range_check_error() << str_errinfo("Temperature must be positive") << specific_errinfo(where));
	}
	if (!coordinates.insert(std::make_pair(lithiation, temperature)).second) {
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Duplicate sample coordinates") << specific_errinfo(where));
	}
	samples.emplace_back(lithiation, temperature, energy);
}

std::set<double> SampleTable::temperatures() const {
	std::set<double> retset;
	for (auto sample : samples) retset.insert(sample.temperature);
	return retset;
}

std::set<double> SampleTable::lithiations() const {
	std::set<double> retset;
	for (auto sample : samples) retset.insert(sample.lithiation);
	return retset;
}

std::pair<double,double> SampleTable::temperature_bounds() const {
	if (samples.empty()) {
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Sample table is empty"));
	}
	auto minmax = std::minmax_element(samples.cbegin(), samples.cend(),
		[] (const Sample &a, const Sample &b) { return a.temperature < b.temperature; });
	return std::make_pair(minmax.first->temperature, minmax.second->temperature);
}

std::pair<double,double> SampleTable::lithiation_bounds() const {
	if (samples.empty()) {
		BOOST_THROW_EXCEPTION(degenerate_input_error() << str_errinfo("Sample table is empty"));
	}
	auto minmax = std::minmax_element(samples.cbegin(), samples.cend(),
		[] (const Sample &a, const Sample &b) { return a.lithiation < b.lithiation; });
	return std::make_pair(minmax.first->lithiation, minmax.second->lithiation);
}
