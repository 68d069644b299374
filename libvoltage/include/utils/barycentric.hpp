/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Barycentric coordinates with respect to a simplex

#ifndef INCLUDED_BARYCENTRIC
#define INCLUDED_BARYCENTRIC

#include "libvoltage/include/utils/simplicial_facet.hpp"
#include <boost/numeric/ublas/vector.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/triangular.hpp>
#include <boost/numeric/ublas/lu.hpp>
#include <vector>

namespace Voltage { namespace details {

/* Matrix inversion routine
 * Uses lu_factorize and lu_substitute to invert a matrix
 * Reference: Numerical Recipies in C, 2nd ed., by Press, Teukolsky, Vetterling & Flannery.
 */
template<class T>
bool invert_matrix (const boost::numeric::ublas::matrix<T>& input,
                    boost::numeric::ublas::matrix<T>& inverse) {
    using namespace boost::numeric::ublas;
    typedef permutation_matrix<std::size_t> pmatrix;
    matrix<T> A(input);
    pmatrix pm(A.size1());
    if (lu_factorize(A,pm) != 0) return false; // singular
    inverse.resize(A.size1(), A.size2(), false);
    inverse.assign(identity_matrix<T>(A.size1()));
    lu_substitute(A, pm, inverse);
    return true;
}

// Fill facet.basis_matrix from the vertex coordinates; false if the simplex is degenerate
template <typename CoordinateType, typename PointContainer>
bool build_basis_matrix (SimplicialFacet<CoordinateType> &facet, const PointContainer &points) {
    const std::size_t vertex_count = facet.vertices.size();
    typename SimplicialFacet<CoordinateType>::MatrixType vertex_matrix ( vertex_count, vertex_count );
    for (std::size_t row = 0; row < vertex_count; ++row) {
        const auto &pt = points[facet.vertices[row]];
        for (std::size_t col = 0; col < vertex_count-1; ++col) {
            vertex_matrix ( row, col ) = pt[col];
        }
        vertex_matrix ( row, vertex_count-1 ) = 1;
    }
    return invert_matrix ( vertex_matrix, facet.basis_matrix );
}

// Weights w with sum(w) == 1 and sum(w_i * vertex_i) == point
template <typename CoordinateType, typename PointType>
std::vector<CoordinateType> barycentric_coordinates (const SimplicialFacet<CoordinateType> &facet,
                                                     const PointType &point) {
    const std::size_t vertex_count = facet.basis_matrix.size1();
    boost::numeric::ublas::vector<CoordinateType> augmented_point ( vertex_count );
    for (std::size_t i = 0; i < vertex_count-1; ++i) augmented_point ( i ) = point[i];
    augmented_point ( vertex_count-1 ) = 1;
    // Row vector times the inverse vertex matrix
    boost::numeric::ublas::vector<CoordinateType> weights =
        boost::numeric::ublas::prod ( augmented_point, facet.basis_matrix );
    return std::vector<CoordinateType> ( weights.begin(), weights.end() );
}

} // namespace details
} // namespace Voltage

#endif
