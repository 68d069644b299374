/*=============================================================================
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

// libsample_pch.hpp -- list of precompiled headers for libSample

#include <boost/config/warning_disable.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/spirit/include/qi.hpp>
#include "libsample/include/exceptions.hpp"
