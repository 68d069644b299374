/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Simplicial facet of a convex hull or a Delaunay triangulation

#ifndef INCLUDED_SIMPLICIAL_FACET
#define INCLUDED_SIMPLICIAL_FACET

#include <boost/numeric/ublas/matrix.hpp>
#include <cstddef>
#include <vector>

namespace Voltage { namespace details {
template <typename CoordinateType = double>
struct SimplicialFacet {
    typedef std::vector<CoordinateType> PointType;
    typedef boost::numeric::ublas::matrix<CoordinateType> MatrixType;
    PointType normal; // outward normal of a hull facet; empty for triangulation cells
    std::vector<std::size_t> vertices; // indices into the input point set
    /* basis_matrix is the inverse of the matrix of vertices.
     * The purpose is to be able to quickly calculate the barycentric
     * coordinates of a point with respect to the facet.
     * Prior to inversion:
     * Each row is the coordinates of one vertex, with the last
     * column as all 1's.
     */
    MatrixType basis_matrix;
};
} // namespace details
} // namespace Voltage
#endif
