/*=============================================================================
 Copyright (c) 2026 The OCVHull developers
 
 Distributed under the Boost Software License, Version 1.0. (See accompanying
 file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
 =============================================================================*/

// Calculate convex hulls and triangulations using Qhull / libqhullcpp

#include "libvoltage/include/libvoltage_pch.hpp"
#include "libvoltage/include/utils/convex_hull.hpp"
#include "libvoltage/include/utils/barycentric.hpp"
#include "libvoltage/include/utils/geometry/orientation.hpp"
#include "libsample/include/exceptions.hpp"
#include "libsample/include/logging.hpp"
#include <libqhullcpp/Qhull.h>
#include <libqhullcpp/QhullError.h>
#include <libqhullcpp/QhullFacet.h>
#include <libqhullcpp/QhullFacetList.h>
#include <libqhullcpp/QhullHyperplane.h>
#include <libqhullcpp/QhullLinkedList.h>
#include <libqhullcpp/QhullPoint.h>
#include <libqhullcpp/QhullVertex.h>
#include <libqhullcpp/QhullVertexSet.h>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <string>

using orgQhull::Qhull;
using orgQhull::QhullError;
using orgQhull::QhullFacet;
using orgQhull::QhullFacetList;
using orgQhull::QhullVertex;
using orgQhull::QhullVertexSet;

namespace Voltage { namespace details {

namespace {
// Flatten the points into the coordinate buffer layout Qhull expects
std::vector<double> qhull_coordinates ( const std::vector<std::vector<double>> &points ) {
    std::vector<double> coordinates;
    coordinates.reserve ( points.size() * 2 );
    for (auto pt : points) {
        coordinates.push_back ( pt[0] );
        coordinates.push_back ( pt[1] );
    }
    return coordinates;
}

void check_planar_input ( const std::vector<std::vector<double>> &points ) {
    if ( points.size() < 3 ) {
        std::string count ( boost::lexical_cast<std::string>(points.size()) );
        BOOST_THROW_EXCEPTION ( degenerate_input_error() << str_errinfo("At least 3 points are required") << specific_errinfo(count) );
    }
    for (auto pt : points) {
        if ( pt.size() != 2 ) {
            BOOST_THROW_EXCEPTION ( internal_error() << str_errinfo("Expected planar points") );
        }
    }
    if ( is_collinear ( points ) ) {
        BOOST_THROW_EXCEPTION ( degenerate_input_error() << str_errinfo("All points are collinear") );
    }
}

void run_qhull ( Qhull &qhull, const std::vector<double> &coordinates, const char *qhull_command ) {
    try {
        qhull.runQhull ( "", 2, static_cast<int>(coordinates.size()/2), &coordinates[0], qhull_command );
    }
    catch (QhullError &e) {
        BOOST_THROW_EXCEPTION ( degenerate_input_error() << str_errinfo("Qhull failed") << specific_errinfo(e.what()) );
    }
}
}

// QuickHull in the plane; the lower envelope is selected by vertex energy
std::vector<SimplicialFacet<double>> lower_convex_hull (
    const std::vector<std::vector<double>> &points,
    const double energy_tolerance
) {
    BOOST_LOG_NAMED_SCOPE ( "lower_convex_hull" );
    logger hull_log ( journal::keywords::channel = "hull" );
    check_planar_input ( points );
    std::vector<SimplicialFacet<double>> candidates;
    const std::vector<double> coordinates = qhull_coordinates ( points );

    // Make the call to Qhull
    Qhull qhull;
    run_qhull ( qhull, coordinates, "" );
    // Get all of the facets
    QhullFacetList facets = qhull.facetList();
    std::size_t facet_count = 0;

    for (auto facet : facets) {
        if ( !facet.isDefined() || !facet.isGood() ) continue;
        ++facet_count;
        QhullVertexSet vertices = facet.vertices();
        SimplicialFacet<double> new_facet;
        bool below_tolerance = true;
        for ( auto vertex = vertices.begin(); vertex != vertices.end(); ++vertex ) {
            const std::size_t point_id = static_cast<std::size_t>( (*vertex).point().id() );
            if ( points[point_id].back() > energy_tolerance ) below_tolerance = false;
            new_facet.vertices.push_back ( point_id );
        }
        if ( !below_tolerance ) continue;
        for ( auto coord : facet.hyperplane() ) {
            new_facet.normal.push_back ( coord );
        }
        std::sort ( new_facet.vertices.begin(), new_facet.vertices.end(),
                    [&points] ( const std::size_t a, const std::size_t b ) {
                        return points[a][0] < points[b][0] || ( points[a][0] == points[b][0] && a < b );
                    } );
        candidates.push_back ( new_facet );
    }
    // Left-to-right traversal of the stable boundary
    std::stable_sort ( candidates.begin(), candidates.end(),
                       [&points] ( const SimplicialFacet<double> &a, const SimplicialFacet<double> &b ) {
                           return points[a.vertices.front()][0] < points[b.vertices.front()][0];
                       } );
    BOOST_LOG_SEV ( hull_log, debug ) << "Kept " << candidates.size() << " of " << facet_count << " hull facets";
    return candidates;
}

// Delaunay triangulation by lifting to the paraboloid; only lower facets are cells
std::vector<SimplicialFacet<double>> delaunay_triangulation (
    const std::vector<std::vector<double>> &points
) {
    BOOST_LOG_NAMED_SCOPE ( "delaunay_triangulation" );
    logger hull_log ( journal::keywords::channel = "interpolation" );
    check_planar_input ( points );
    std::vector<SimplicialFacet<double>> cells;
    const std::vector<double> coordinates = qhull_coordinates ( points );

    // "Qt" triangulates cells of co-circular grid points, "Qz" adds a point at infinity
    Qhull qhull;
    run_qhull ( qhull, coordinates, "d Qt Qbb Qc Qz" );
    QhullFacetList facets = qhull.facetList();

    for (auto facet : facets) {
        if ( !facet.isDefined() || facet.isUpperDelaunay() ) continue;
        QhullVertexSet vertices = facet.vertices();
        SimplicialFacet<double> cell;
        bool finite_cell = true;
        for ( auto vertex = vertices.begin(); vertex != vertices.end(); ++vertex ) {
            const std::size_t point_id = static_cast<std::size_t>( (*vertex).point().id() );
            if ( point_id >= points.size() ) finite_cell = false; // the point at infinity
            cell.vertices.push_back ( point_id );
        }
        if ( !finite_cell || cell.vertices.size() != 3 ) continue;
        std::sort ( cell.vertices.begin(), cell.vertices.end() );
        if ( !build_basis_matrix ( cell, points ) ) {
            BOOST_LOG_SEV ( hull_log, debug ) << "Skipping flat Delaunay cell ("
                << cell.vertices[0] << "," << cell.vertices[1] << "," << cell.vertices[2] << ")";
            continue;
        }
        cells.push_back ( cell );
    }
    if ( cells.empty() ) {
        BOOST_THROW_EXCEPTION ( degenerate_input_error() << str_errinfo("Delaunay triangulation has no cells") );
    }
    BOOST_LOG_SEV ( hull_log, debug ) << "Delaunay triangulation has " << cells.size() << " cells";
    return cells;
}
} // namespace details
} // namespace Voltage
