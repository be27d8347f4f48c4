/*
 * SphMesh: Spherical Meshes and Geodesic Bounded Regions
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <string>
#include <vector>
#include <boost/geometry/srs/spheroid.hpp>
#include <sphmesh/constants.hpp>
#include <sphmesh/Mesh.hpp>

namespace sphmesh {

/** Parallel longitude/latitude sequences (degrees) */
struct LonLats {
    std::vector<double> lons;
    std::vector<double> lats;

    size_t size() const { return lons.size(); }
};

/** Geodesic computations on a named ellipsoid.  Solves the inverse
and direct geodesic problems with Karney's algorithms. */
class Geod {
    std::string _ellps;
    boost::geometry::srs::spheroid<double> _spheroid;

public:
    /** @param ellps One of "WGS84", "GRS80", "sphere"
    @throw InvalidEllipsoidError */
    explicit Geod(std::string const &ellps = ELLIPSE);

    std::string const &ellps() const { return _ellps; }

    /** Distance (m) and forward azimuth (degrees) from point 1 to point 2 */
    void inverse(double lon1, double lat1, double lon2, double lat2,
        double &azimuth, double &distance) const;

    /** Point reached from point 1 along azimuth (degrees) after distance (m) */
    void direct(double lon1, double lat1, double azimuth, double distance,
        double &lon2, double &lat2) const;

    /** npts equally spaced points along the geodesic from start to end.
    With i0 = (include_start ? 0 : 1) and i1 = (include_end ? 0 : 1),
    point k lies at (i0+k) * distance / (npts-1+i0+i1).
    Longitudes are wrapped. */
    LonLats npts(double start_lon, double start_lat,
        double end_lon, double end_lat,
        int npts, bool include_start, bool include_end) const;
};

/** The Geod of the default ellipsoid */
extern Geod const &default_geod();

/** Equally spaced points along the geodesic between two points.
@param geod OPTIONAL: default_geod() if not given. */
extern LonLats npoints(
    double start_lon, double start_lat,
    double end_lon, double end_lat,
    int npts = GEODESIC_NPTS,
    bool include_start = false, bool include_end = false,
    Geod const *geod = 0);

/** As npoints(), with the endpoints looked up by position in lons/lats. */
extern LonLats npoints_by_idx(
    std::vector<double> const &lons, std::vector<double> const &lats,
    int start_idx, int end_idx,
    int npts = GEODESIC_NPTS,
    bool include_start = false, bool include_end = false,
    Geod const *geod = 0);

/** A polyline mesh following the geodesics through two or more points.
A closed input ring (last point repeating the first) is opened.
@param npts Points per segment, including the segment's start.
@param close Join the last point back to the first.
@throw ShapeMismatchError, InsufficientGeometryError */
extern Mesh line(
    std::vector<double> const &lons, std::vector<double> const &lats,
    int npts = GEODESIC_NPTS,
    std::string const &ellps = ELLIPSE,
    double radius = LINE_RADIUS,
    bool close = false);

}   // namespace
