/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// libvoltage_pch.hpp -- list of headers to precompile for libVoltage

#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include "libsample/include/sample_table.hpp"
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>
