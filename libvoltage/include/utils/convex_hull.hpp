/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

#ifndef INCLUDED_CONVEX_HULL
#define INCLUDED_CONVEX_HULL

#include "libvoltage/include/utils/simplicial_facet.hpp"
#include <vector>

namespace Voltage {
    namespace details {
        
        /* Lower convex hull of a set of (composition, energy) points.
         * Facets are kept only if the energy (last coordinate) of every vertex is
         * at most energy_tolerance. Each facet's vertices are ordered by composition,
         * and the facets are sorted by the composition of their first vertex.
         */
        std::vector<SimplicialFacet<double>> lower_convex_hull (
            const std::vector<std::vector<double>> &points,
            const double energy_tolerance
        );
        
        // Delaunay triangulation of planar points; each cell carries its basis matrix
        std::vector<SimplicialFacet<double>> delaunay_triangulation (
            const std::vector<std::vector<double>> &points
        );
    }
}

#endif
