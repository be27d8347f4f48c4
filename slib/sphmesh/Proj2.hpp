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
#include <sphmesh/Proj.hpp>

namespace sphmesh {

/** OGC WKT of the geographic WGS84 CRS, the CRS of every produced mesh. */
extern std::string const WGS84_WKT;

/** Joins together a pair of Proj instances, to implement both the
forward and backward translation together in one.  Instances have a
<i>direction</i>: spherical-to-map, or map-to-spherical.

An empty projection string, or a geographic one, is the identity. */
class Proj2 {
public:
    /** The proj.4 projection string. */
    std::string sproj;
    /** Direction enums for latlon-to-xy, and xy-to-latlon */
    enum class Direction {LL2XY, XY2LL};
    Direction direction;
protected:
    Proj _proj, _llproj;
    void realize();
public:

    /** True if transform() changes coordinates */
    bool is_valid() const { return _proj.is_valid(); }

    /** @throw ProjectionError if the proj.4 string cannot be parsed. */
    Proj2(std::string const &_sproj, Direction _direction);

    Proj2() : direction(Direction::XY2LL) {}

    Proj2(Proj2 const &rhs);

    /** Transforms a single coordinate pair (degrees for lon/lat). */
    void transform(double x0, double y0, double &x1, double &y1) const;

    /** Transforms arrays of coordinates in place (degrees for lon/lat).
    @throw ProjectionError if proj.4 reports an error. */
    void transform(std::vector<double> &xs, std::vector<double> &ys) const;
};

}   // namespace
