/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Orientation of planar point triples and collinearity of planar point sets

#ifndef INCLUDED_ORIENTATION
#define INCLUDED_ORIENTATION
#include "libvoltage/include/utils/determinant.hpp"
#include <boost/numeric/ublas/matrix.hpp>
#include <cmath>
#include <cstddef>

/* The orientation is twice the signed area of the triangle (a, b, c):
 * positive for a counter-clockwise turn, negative for clockwise, zero if collinear.
 * Reference: Computing in Euclidean Geometry, 2nd ed., 1995, edited by Ding-Zhu Du and Frank Hwang
 */
template <typename PointType>
double orientation ( const PointType &a, const PointType &b, const PointType &c ) {
    using namespace boost::numeric::ublas;
    matrix<double> orientation_test_matrix ( 3, 3 );
    const PointType* vertices[] = { &a, &b, &c };
    for (std::size_t i = 0; i < 3; ++i) {
        orientation_test_matrix ( i, 0 ) = (*vertices[i])[0];
        orientation_test_matrix ( i, 1 ) = (*vertices[i])[1];
        orientation_test_matrix ( i, 2 ) = 1; // last column is all 1's
    }
    return determinant ( orientation_test_matrix );
}

/* True if every point lies on one line (or there are fewer than three distinct points).
 * The test is scale-free: a triple counts as collinear when the sine of the angle
 * it spans at the anchor point is below relative_tolerance.
 */
template <typename PointContainer>
bool is_collinear ( const PointContainer &points, const double relative_tolerance = 1e-10 ) {
    if ( points.size() < 3 ) return true;
    auto distance = [] ( const typename PointContainer::value_type &p, const typename PointContainer::value_type &q ) {
        return std::hypot ( q[0]-p[0], q[1]-p[1] );
    };
    // Anchor the line on the first point and the point farthest from it
    const auto &anchor = *points.begin();
    auto farthest = points.begin();
    for ( auto pt = points.begin(); pt != points.end(); ++pt ) {
        if ( distance ( anchor, *pt ) > distance ( anchor, *farthest ) ) farthest = pt;
    }
    const double baseline = distance ( anchor, *farthest );
    if ( baseline == 0 ) return true; // all points coincide
    for ( auto pt = points.begin(); pt != points.end(); ++pt ) {
        const double arm = distance ( anchor, *pt );
        if ( arm == 0 ) continue;
        const double sine = std::fabs ( orientation ( anchor, *farthest, *pt ) ) / ( baseline * arm );
        if ( sine > relative_tolerance ) return false;
    }
    return true;
}
#endif
