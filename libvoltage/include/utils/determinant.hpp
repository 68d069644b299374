/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Calculation of the determinant of a matrix

#ifndef INCLUDED_DETERMINANT
#define INCLUDED_DETERMINANT

#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/lu.hpp>

// A singular matrix has determinant zero; lu_factorize reports it instead of failing
template <typename T>
T determinant ( const boost::numeric::ublas::matrix<T> &input ) {
    using namespace boost::numeric::ublas;
    matrix<T> A ( input ); // copy input matrix to A
    T det = 1;
    permutation_matrix<std::size_t> pm ( A.size1() );
    const std::size_t singular_row = lu_factorize ( A, pm ); // calculate LU factorization of A; save in A
    if ( singular_row != 0 ) return T(0);
    for (std::size_t i = 0; i < A.size1(); ++i) {
        det *= (pm(i) == i ? 1 : -1) * A ( i,i );
    }
    return det;
}

#endif
