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
#include <sphmesh/common.hpp>

namespace sphmesh {

std::string const ELLIPSE("WGS84");
std::string const GV_FIELD_CRS("gvCRS");
std::string const GV_FIELD_NAME("gvName");
std::string const GV_FIELD_RADIUS("gvRadius");
std::string const GV_REMESH_POINT_IDS("gvRemeshPointIds");
std::string const DEFAULT_NAME_POINTS("point_data");
std::string const DEFAULT_NAME_CELLS("cell_data");

double wrap(double value, double base, double period)
{
    // Values already in the interval are returned bit-for-bit
    if (base <= value && value < base + period) return value;

    double ret = std::fmod(value - base + 2.*period, period);
    // fmod() keeps the sign of its first argument
    if (ret < 0) ret += period;
    if (ret >= period) ret -= period;
    return ret + base;
}

std::vector<double> wrap(std::vector<double> const &values,
    double base, double period)
{
    std::vector<double> ret;
    ret.reserve(values.size());
    for (double v : values) ret.push_back(wrap(v, base, period));
    return ret;
}

// ------------------------------------------------------------
Point3 to_xyz(double lon, double lat, double radius)
{
    double const theta = (90. - lat) * D2R;
    double const phi = lon * D2R;
    double const rsin = radius * std::sin(theta);
    return Point3(
        rsin * std::cos(phi),
        rsin * std::sin(phi),
        radius * std::cos(theta));
}

blitz::Array<double,2> to_xyz(
    std::vector<double> const &lons,
    std::vector<double> const &lats,
    double radius)
{
    if (lons.size() != lats.size()) throw ShapeMismatchError(boost::format(
        "Require longitudes and latitudes of equal length, got %d and %d")
        % lons.size() % lats.size());

    blitz::Array<double,2> ret(lons.size(), 3);
    for (size_t i=0; i<lons.size(); ++i) {
        Point3 const p(to_xyz(lons[i], lats[i], radius));
        ret(i,0) = p.x;
        ret(i,1) = p.y;
        ret(i,2) = p.z;
    }
    return ret;
}

std::array<double,2> to_lonlat(Point3 const &xyz, double radius, bool radians)
{
    double const r = std::abs(radius);
    double const horiz = std::hypot(xyz.x, xyz.y);

    double lon = 0;
    if (horiz > 1e-12 * r) lon = wrap(std::atan2(xyz.y, xyz.x) * R2D);

    double const zr = std::max(-1., std::min(1., xyz.z / r));
    double lat = std::asin(zr) * R2D;

    if (radians) {
        lon *= D2R;
        lat *= D2R;
    }
    std::array<double,2> ret = {{lon, lat}};
    return ret;
}

blitz::Array<double,2> to_lonlats(blitz::Array<double,2> const &xyz,
    double radius, bool radians)
{
    if (xyz.extent(1) != 3) throw ShapeMismatchError(boost::format(
        "Require (n,3) xyz array, got (%d,%d)") % xyz.extent(0) % xyz.extent(1));

    blitz::Array<double,2> ret(xyz.extent(0), 2);
    for (int i=0; i<xyz.extent(0); ++i) {
        std::array<double,2> ll(to_lonlat(
            Point3(xyz(i,0), xyz(i,1), xyz(i,2)), radius, radians));
        ret(i,0) = ll[0];
        ret(i,1) = ll[1];
    }
    return ret;
}

// ------------------------------------------------------------
double calculate_radius(Mesh const &mesh, Point3 const &origin)
{
    if (mesh.n_points() == 0) throw NotSphericalError(
        "Cannot calculate the radius of an empty mesh");

    std::array<double,6> const bounds(mesh.bounds());
    static char const *axes[] = {"x", "y", "z"};
    for (int d=0; d<3; ++d) {
        if (isclose(bounds[2*d+1] - bounds[2*d], 0.))
            throw NotSphericalError(boost::format(
                "Mesh is not spherical: it has no extent along the %s-axis")
                % axes[d]);
    }

    Point3 const p(mesh.point(0));
    double const dx = p.x - origin.x;
    double const dy = p.y - origin.y;
    double const dz = p.z - origin.z;
    double const radius = std::sqrt(dx*dx + dy*dy + dz*dz);

    auto ii(mesh.double_fields.find(GV_FIELD_RADIUS));
    double const nominal = (ii == mesh.double_fields.end() ? RADIUS : ii->second);
    return (isclose(radius, nominal) ? nominal : radius);
}

blitz::Array<double,2> to_xy0(Mesh const &mesh,
    boost::optional<double> radius,
    bool closed_interval)
{
    double const r = (radius ? *radius : calculate_radius(mesh));
    blitz::Array<double,2> lonlat(to_lonlats(mesh.points, r));

    blitz::Array<double,2> ret(mesh.n_points(), 3);
    ret = 0;
    for (int i=0; i<ret.extent(0); ++i) {
        ret(i,0) = lonlat(i,0);
        ret(i,1) = lonlat(i,1);
    }

    if (closed_interval) {
        auto ii(mesh.point_data.find(GV_REMESH_POINT_IDS));
        if (ii != mesh.point_data.end()) {
            blitz::Array<double,1> const &ids(ii->second);
            for (int i=0; i<ret.extent(0); ++i) {
                if (ids(i) == REMESH_SEAM && isclose(std::abs(ret(i,0)), 180.))
                    ret(i,0) = 180.;
            }
        }
    }
    return ret;
}

}   // namespace
