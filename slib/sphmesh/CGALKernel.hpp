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

#include <sphmesh/GeometryKernel.hpp>

namespace sphmesh {

/** GeometryKernel on top of CGAL's Polygon Mesh Processing package */
class CGALKernel : public GeometryKernel {
public:
    /** Builds the triangulated shell, its side-of-mesh classifier and
    (for tolerance > 0) its AABB tree once. */
    std::unique_ptr<PreparedSolid> prepare(
        Mesh const &solid, double tolerance) const;

    std::vector<bool> select_enclosed(
        blitz::Array<double,2> const &points,
        Mesh const &solid,
        double tolerance) const;

    std::vector<std::array<int,3>> triangulate_face(
        std::vector<Point3> const &polygon) const;
};

/** Kernel used when none is supplied */
extern GeometryKernel const &default_kernel();

}   // namespace
