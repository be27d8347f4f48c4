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
#include <memory>
#include <vector>
#include <blitz/array.h>
#include <sphmesh/Mesh.hpp>

namespace sphmesh {

/** A solid made ready for classifying many batches of points against
it.  Refers to the solid it was prepared from, which must outlive it. */
class PreparedSolid {
public:
    virtual ~PreparedSolid() {}

    /** @param points (n,3) query points
    @return One flag per point, true if enclosed. */
    virtual std::vector<bool> select_enclosed(
        blitz::Array<double,2> const &points) const = 0;
};

/** The numerical geometry behind the enclosure query and face
triangulation.  Implementations must be stateless between calls. */
class GeometryKernel {
public:
    virtual ~GeometryKernel() {}

    /** Prepares solid for repeated select_enclosed() calls with the
    same tolerance.  The default defers each batch to
    select_enclosed(points, solid, tolerance). */
    virtual std::unique_ptr<PreparedSolid> prepare(
        Mesh const &solid, double tolerance) const;

    /** Point-in-solid classification.
    @param points (n,3) query points
    @param solid A closed polygonal surface
    @param tolerance Points within tolerance * (diagonal of the solid's
        bounding box) of the surface count as enclosed.  Points on the
        surface always count as enclosed.
    @return One flag per point, true if enclosed. */
    virtual std::vector<bool> select_enclosed(
        blitz::Array<double,2> const &points,
        Mesh const &solid,
        double tolerance) const = 0;

    /** Splits a planar-ish polygon into triangles.
    @return Triangles as index triples into polygon */
    virtual std::vector<std::array<int,3>> triangulate_face(
        std::vector<Point3> const &polygon) const = 0;
};

/** A copy of mesh with every face of more than 3 vertices split into
triangles.  Cell data is repeated for each triangle of a face. */
extern Mesh triangulate(Mesh const &mesh, GeometryKernel const &kernel);

}   // namespace
