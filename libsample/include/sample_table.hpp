/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// sample_table.hpp -- Monte Carlo samples over lithiation and temperature

#ifndef INCLUDED_SAMPLE_TABLE
#define INCLUDED_SAMPLE_TABLE

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

// One Monte Carlo result; energy is per formula unit
struct Sample {
	double lithiation; // fraction of occupied Li sites, in [0,1]
	double temperature; // K
	double energy;
	Sample(double x, double T, double E) : lithiation(x), temperature(T), energy(E) { }
};

/* SampleTable keeps the samples in insertion order.
 * Samples are validated as they are added: non-finite values, lithiation
 * outside [0,1], non-positive temperatures and repeated (lithiation, temperature)
 * pairs are rejected with an exception.
 */
class SampleTable {
public:
	typedef std::vector<Sample> SampleCollection;
	typedef SampleCollection::const_iterator const_iterator;
	SampleTable() { }
	SampleTable(const std::vector<double> &lithiation, const std::vector<double> &temperature,
	            const std::vector<double> &energy);
	void add_sample(const double lithiation, const double temperature, const double energy);
	void add_sample(const Sample &sample);
	std::size_t size() const { return samples.size(); }
	bool empty() const { return samples.empty(); }
	const Sample& operator[] (const std::size_t index) const { return samples[index]; }
	const_iterator begin() const { return samples.cbegin(); }
	const_iterator end() const { return samples.cend(); }
	std::set<double> temperatures() const; // distinct temperatures, ascending
	std::set<double> lithiations() const; // distinct lithiation values, ascending
	std::pair<double,double> temperature_bounds() const;
	std::pair<double,double> lithiation_bounds() const;
private:
	SampleCollection samples;
	std::set<std::pair<double,double>> coordinates; // (lithiation, temperature) pairs already present
};

#endif
