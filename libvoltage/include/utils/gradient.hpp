/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Finite difference derivative of values sampled on a uniform grid

#ifndef INCLUDED_GRADIENT
#define INCLUDED_GRADIENT

#include <boost/assert.hpp>
#include <cstddef>
#include <vector>

namespace Voltage { namespace details {
// Central differences in the interior, one-sided differences at the two ends
template <typename T>
std::vector<T> gradient ( const std::vector<T> &values, const T spacing ) {
    BOOST_ASSERT ( values.size() >= 2 );
    BOOST_ASSERT ( spacing > 0 );
    const std::size_t count = values.size();
    std::vector<T> derivative ( count );
    derivative.front() = ( values[1] - values[0] ) / spacing;
    for (std::size_t i = 1; i < count-1; ++i) {
        derivative[i] = ( values[i+1] - values[i-1] ) / ( 2*spacing );
    }
    derivative.back() = ( values[count-1] - values[count-2] ) / spacing;
    return derivative;
}
} // namespace details
} // namespace Voltage

#endif
