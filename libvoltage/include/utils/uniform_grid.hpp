/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// One-dimensional uniform grid

#ifndef INCLUDED_UNIFORM_GRID
#define INCLUDED_UNIFORM_GRID

#include <cstddef>
#include <vector>

struct UniformGrid {
	// Spacing between neighbouring points of a grid with point_count points
	static double spacing(
			const double min_extent,
			const double max_extent,
			const std::size_t point_count) {
		if (point_count < 2) return 0;
		return (max_extent - min_extent) / static_cast<double>(point_count - 1);
	}
	// Calls func(location) for point_count evenly spaced locations, both extents included exactly
	template <typename Func> static void sample(
			const double min_extent,
			const double max_extent,
			const std::size_t point_count,
			const Func &func) {
		if (point_count == 0) return;
		if (point_count == 1) {
			func(min_extent);
			return;
		}
		const double step = UniformGrid::spacing(min_extent, max_extent, point_count);
		for (std::size_t j = 0; j < point_count - 1; ++j) {
			func(min_extent + step*j);
		}
		func(max_extent); // avoid roundoff at the upper extent
	}
	static std::vector<double> points(
			const double min_extent,
			const double max_extent,
			const std::size_t point_count) {
		std::vector<double> locations;
		locations.reserve(point_count);
		UniformGrid::sample(min_extent, max_extent, point_count,
				[&locations] (const double location) { locations.push_back(location); });
		return locations;
	}
};

#endif
