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

#include <array>
#include <cmath>
#include <limits>
#include <vector>
#include <boost/optional.hpp>
#include <blitz/array.h>
#include <sphmesh/constants.hpp>
#include <sphmesh/error.hpp>
#include <sphmesh/Mesh.hpp>

namespace sphmesh {

/** Whether a and b are equal within tolerance:
<pre>|a - b| <= atol + rtol * |b|</pre> */
inline bool isclose(double a, double b, double rtol=1e-5, double atol=1e-8)
    { return std::abs(a - b) <= atol + rtol * std::abs(b); }

/** Wraps a value into the half-open interval [base, base+period). */
extern double wrap(double value, double base=BASE, double period=PERIOD);

extern std::vector<double> wrap(std::vector<double> const &values,
    double base=BASE, double period=PERIOD);

// ------------------------------------------------------------
/** Geodetic (degrees) to geocentric xyz on a sphere. */
extern Point3 to_xyz(double lon, double lat, double radius=RADIUS);

/** @return (n,3) array of geocentric xyz */
extern blitz::Array<double,2> to_xyz(
    std::vector<double> const &lons,
    std::vector<double> const &lats,
    double radius=RADIUS);

/** Geocentric xyz to {lon, lat}.  The asin() argument is clamped to
[-1,1]; points on the polar axis get longitude 0.
@param radians Return radians instead of degrees. */
extern std::array<double,2> to_lonlat(Point3 const &xyz,
    double radius=RADIUS, bool radians=false);

/** @param xyz (n,3) array
@return (n,2) array of (lon, lat) */
extern blitz::Array<double,2> to_lonlats(blitz::Array<double,2> const &xyz,
    double radius=RADIUS, bool radians=false);

/** Radius of a spherical mesh: distance of its first point from origin,
snapped to the mesh's gvRadius field (or RADIUS) when close to it.
@throw NotSphericalError if the mesh is flat along some axis. */
extern double calculate_radius(Mesh const &mesh, Point3 const &origin = Point3());

/** (lon, lat, 0) of every point of a spherical mesh.
@param radius Radius of the mesh; computed by calculate_radius() if not given.
@param closed_interval Move seam points (marked REMESH_SEAM in the
    gvRemeshPointIds point data) from -180 to +180. */
extern blitz::Array<double,2> to_xy0(Mesh const &mesh,
    boost::optional<double> radius = boost::none,
    bool closed_interval = false);

/** True if the mesh has faces, and all of them are triangles. */
inline bool triangulated(Mesh const &mesh)
    { return mesh.faces.uniform_npoints() == 3; }

/** Converts data to double, replacing masked entries with NaN.
@param mask OPTIONAL (extent 0 = no mask); true means masked. */
template<class T>
blitz::Array<double,1> nan_mask(
    blitz::Array<T,1> const &data,
    blitz::Array<bool,1> const &mask)
{
    if (mask.extent(0) != 0 && mask.extent(0) != data.extent(0))
        throw ShapeMismatchError(boost::format(
            "Mask has %d values, data has %d") % mask.extent(0) % data.extent(0));

    blitz::Array<double,1> ret(data.extent(0));
    for (int i=0; i<data.extent(0); ++i) {
        if (mask.extent(0) != 0 && mask(i))
            ret(i) = std::numeric_limits<double>::quiet_NaN();
        else
            ret(i) = (double)data(i);
    }
    return ret;
}

}   // namespace
