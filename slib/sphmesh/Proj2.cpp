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

#include <sphmesh/Proj2.hpp>
#include <sphmesh/constants.hpp>
#include <sphmesh/error.hpp>

namespace sphmesh {

std::string const WGS84_WKT(
    "GEOGCS[\"WGS 84\","
        "DATUM[\"WGS_1984\","
            "SPHEROID[\"WGS 84\",6378137,298.257223563,AUTHORITY[\"EPSG\",\"7030\"]],"
            "AUTHORITY[\"EPSG\",\"6326\"]],"
        "PRIMEM[\"Greenwich\",0,AUTHORITY[\"EPSG\",\"8901\"]],"
        "UNIT[\"degree\",0.0174532925199433,AUTHORITY[\"EPSG\",\"9122\"]],"
        "AUTHORITY[\"EPSG\",\"4326\"]]");

Proj2::Proj2(std::string const &_sproj, Direction _direction) :
sproj(_sproj), direction(_direction)
    { realize(); }

Proj2::Proj2(Proj2 const &rhs) :
sproj(rhs.sproj), direction(rhs.direction)
    { realize(); }

void Proj2::realize()
{
    if (sproj == "") return;

    Proj proj(sproj);
    if (!proj.is_valid()) throw ProjectionError(boost::format(
        "Cannot initialize projection '%s': %s")
        % sproj % pj_strerrno(*pj_get_errno_ref()));

    // Geographic input: leave invalid, transform() is the identity
    if (proj.is_latlong()) return;

    _llproj = proj.latlong_from_proj();
    _proj = std::move(proj);
}

void Proj2::transform(double x0, double y0, double &x1, double &y1) const
{
    std::vector<double> xs {x0};
    std::vector<double> ys {y0};
    transform(xs, ys);
    x1 = xs[0];
    y1 = ys[0];
}

void Proj2::transform(std::vector<double> &xs, std::vector<double> &ys) const
{
    if (xs.size() != ys.size()) throw ShapeMismatchError(boost::format(
        "Require x and y of equal length, got %d and %d")
        % xs.size() % ys.size());
    if (!is_valid() || xs.empty()) return;

    int ret;
    if (direction == Direction::XY2LL) {
        ret = sphmesh::transform(_proj, _llproj, xs.size(), xs.data(), ys.data());
        for (size_t i=0; i<xs.size(); ++i) {
            xs[i] *= R2D;
            ys[i] *= R2D;
        }
    } else {
        for (size_t i=0; i<xs.size(); ++i) {
            xs[i] *= D2R;
            ys[i] *= D2R;
        }
        ret = sphmesh::transform(_llproj, _proj, xs.size(), xs.data(), ys.data());
    }

    if (ret != 0) throw ProjectionError(boost::format(
        "Projection '%s' failed: %s") % sproj % pj_strerrno(ret));
}

}   // namespace
