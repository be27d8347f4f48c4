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

#include <algorithm>
#include <boost/geometry/formulas/karney_direct.hpp>
#include <boost/geometry/formulas/karney_inverse.hpp>
#include <sphmesh/common.hpp>
#include <sphmesh/geodesic.hpp>
#include <sphmesh/Proj2.hpp>

namespace bgf = boost::geometry::formula;

namespace sphmesh {

// Boost 1.74's Karney formulas take and return degrees
typedef bgf::karney_inverse<double, true, true> KarneyInverse;
typedef bgf::karney_direct<double, true> KarneyDirect;

// Keeps longitude meaningful at the poles
static double const POLE_LAT = 90. - 1e-10;

static double off_pole(double lat)
    { return std::max(-POLE_LAT, std::min(POLE_LAT, lat)); }

// --------------------------------------------------------
struct Ellipsoid {
    char const *name;
    double a;       // equatorial radius (m)
    double b;       // polar radius (m)
};

static Ellipsoid const ellipsoids[] = {
    {"WGS84", 6378137.0, 6356752.314245},
    {"GRS80", 6378137.0, 6356752.314140},
    {"sphere", 6370997.0, 6370997.0}
};

static boost::geometry::srs::spheroid<double> lookup_spheroid(std::string const &ellps)
{
    for (auto const &e : ellipsoids) {
        if (ellps == e.name)
            return boost::geometry::srs::spheroid<double>(e.a, e.b);
    }
    throw InvalidEllipsoidError(boost::format(
        "Unknown ellipsoid '%s', expected one of WGS84, GRS80, sphere") % ellps);
}

Geod::Geod(std::string const &ellps) :
    _ellps(ellps), _spheroid(lookup_spheroid(ellps)) {}

void Geod::inverse(double lon1, double lat1, double lon2, double lat2,
    double &azimuth, double &distance) const
{
    KarneyInverse::result_type const res(KarneyInverse::apply(
        lon1, off_pole(lat1), lon2, off_pole(lat2), _spheroid));
    azimuth = res.azimuth;
    distance = res.distance;
}

void Geod::direct(double lon1, double lat1, double azimuth, double distance,
    double &lon2, double &lat2) const
{
    KarneyDirect::result_type const res(KarneyDirect::apply(
        lon1, off_pole(lat1), distance, azimuth, _spheroid));
    lon2 = res.lon2;
    lat2 = res.lat2;
}

LonLats Geod::npts(double start_lon, double start_lat,
    double end_lon, double end_lat,
    int npts, bool include_start, bool include_end) const
{
    if (npts < 0) throw InvalidGeometryError(boost::format(
        "Cannot interpolate %d geodesic points") % npts);

    LonLats ret;
    ret.lons.reserve(npts);
    ret.lats.reserve(npts);

    int const i0 = (include_start ? 0 : 1);
    int const i1 = (include_end ? 0 : 1);
    int const nsteps = npts - 1 + i0 + i1;

    double azimuth, distance;
    inverse(start_lon, start_lat, end_lon, end_lat, azimuth, distance);
    double const step = (nsteps > 0 ? distance / nsteps : 0);

    for (int k=0; k<npts; ++k) {
        double const d = (i0 + k) * step;
        double lon, lat;
        if (d == 0) {
            lon = start_lon;
            lat = start_lat;
        } else if (include_end && k == npts-1) {
            lon = end_lon;
            lat = end_lat;
        } else {
            direct(start_lon, start_lat, azimuth, d, lon, lat);
        }
        ret.lons.push_back(wrap(lon));
        ret.lats.push_back(lat);
    }
    return ret;
}

// --------------------------------------------------------
Geod const &default_geod()
{
    static Geod const geod(ELLIPSE);
    return geod;
}

LonLats npoints(
    double start_lon, double start_lat,
    double end_lon, double end_lat,
    int npts, bool include_start, bool include_end,
    Geod const *geod)
{
    if (!geod) geod = &default_geod();
    return geod->npts(start_lon, start_lat, end_lon, end_lat,
        npts, include_start, include_end);
}

LonLats npoints_by_idx(
    std::vector<double> const &lons, std::vector<double> const &lats,
    int start_idx, int end_idx,
    int npts, bool include_start, bool include_end,
    Geod const *geod)
{
    if (lons.size() != lats.size()) throw ShapeMismatchError(boost::format(
        "Require longitudes and latitudes of equal length, got %d and %d")
        % lons.size() % lats.size());
    int const n = lons.size();
    if (start_idx < 0 || start_idx >= n || end_idx < 0 || end_idx >= n)
        throw ShapeMismatchError(boost::format(
            "Geodesic endpoint index (%d, %d) out of range for %d points")
            % start_idx % end_idx % n);

    return npoints(lons[start_idx], lats[start_idx], lons[end_idx], lats[end_idx],
        npts, include_start, include_end, geod);
}

// --------------------------------------------------------
Mesh line(
    std::vector<double> const &lons, std::vector<double> const &lats,
    int npts, std::string const &ellps, double radius, bool close)
{
    if (lons.size() != lats.size()) throw ShapeMismatchError(boost::format(
        "Require longitudes and latitudes of equal length, got %d and %d")
        % lons.size() % lats.size());

    size_t n = lons.size();
    if (n > 2 && isclose(wrap(lons[0]), wrap(lons[n-1])) && isclose(lats[0], lats[n-1]))
        --n;
    if (n < 2) throw InsufficientGeometryError(boost::format(
        "A geodesic line requires at least 2 points, got %d") % n);

    Geod const geod(ellps);

    // npts points per segment, starting at its first corner
    LonLats ll;
    size_t const nsegs = (close ? n : n-1);
    for (size_t i=0; i<nsegs; ++i) {
        size_t const j = (i+1) % n;
        LonLats seg(geod.npts(lons[i], lats[i], lons[j], lats[j], npts, true, false));
        ll.lons.insert(ll.lons.end(), seg.lons.begin(), seg.lons.end());
        ll.lats.insert(ll.lats.end(), seg.lats.begin(), seg.lats.end());
    }
    if (!close) {
        ll.lons.push_back(wrap(lons[n-1]));
        ll.lats.push_back(lats[n-1]);
    }

    std::vector<long> ids(ll.size());
    for (size_t i=0; i<ids.size(); ++i) ids[i] = i;
    if (close) ids.push_back(0);

    Mesh ret(to_xyz(ll.lons, ll.lats, radius), CellArray());
    ret.lines.add(ids);
    ret.string_fields[GV_FIELD_CRS] = WGS84_WKT;
    ret.double_fields[GV_FIELD_RADIUS] = radius;
    return ret;
}

}   // namespace
