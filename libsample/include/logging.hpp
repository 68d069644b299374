/*=============================================================================
    Copyright (c) 2007-2013 Andrey Semashev
	Copyright (c) 2026 The OCVHull developers

    Distributed under the Boost Software License, Version 1.0. (See accompanying
    file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
=============================================================================*/

#ifndef INCLUDED_LOGGING
#define INCLUDED_LOGGING

#include <cstddef>
#include <string>
#include <ostream>
#include <boost/shared_ptr.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace journal {
namespace logging = boost::log;
namespace src = boost::log::sources;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;
namespace attrs = boost::log::attributes;
}

enum severity_level
{
	debug,
    routine,
    warning,
    critical
};

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(channel, "Channel", std::string)

std::ostream& operator<< (std::ostream& strm, severity_level level);

/* Channels: "data" (sample input), "interpolation", "hull", "voltage" and "pipeline".
 * init_logging() sends every record to ocvhull_NNNNN.log. The console shows
 * "data" and "pipeline" from routine up and the other channels from warning up;
 * console_level lowers that threshold for all channels (debug = verbose).
 */
void init_logging(const severity_level console_level = warning);

typedef journal::src::severity_channel_logger_mt<severity_level,std::string> logger;

#endif
