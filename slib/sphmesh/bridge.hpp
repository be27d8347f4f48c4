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
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <blitz/array.h>
#include <sphmesh/common.hpp>
#include <sphmesh/constants.hpp>
#include <sphmesh/Mesh.hpp>

namespace sphmesh {

/** Parameters shared by every form of Transform */
struct TransformParams {
    /** PROJ.4 string of the CRS of the x/y values.
    Empty (or geographic) = already longitude/latitude. */
    std::string crs;
    double radius;
    /** Proportional multiplier for z-levels */
    double zfactor;
    /** Radius is |radius| * (1 + zlevel*zfactor) */
    int zlevel;
    /** Merge duplicate points, drop unused points and degenerate faces */
    bool clean;
    /** Base (0 or 1) of explicit connectivity; inferred if not set. */
    boost::optional<int> start_index;

    TransformParams() :
        radius(RADIUS), zfactor(ZLEVEL_FACTOR), zlevel(0), clean(false) {}
};

/** Data to attach to the points or faces of a mesh. */
struct MeshData {
    blitz::Array<double,1> values;
    /** Empty = gvName is point_data or cell_data, by size */
    std::string name;

    MeshData() {}

    /** @param mask OPTIONAL; masked values become NaN */
    template<class T>
    MeshData(blitz::Array<T,1> const &data,
        std::string const &_name = "",
        blitz::Array<bool,1> const &mask = blitz::Array<bool,1>())
    : values(nan_mask(data, mask)), name(_name) {}
};

/** One axis of a rectilinear grid: either (N+1,) values, or an (N,2)
array of contiguous bounds. */
struct AxisBounds {
    blitz::Array<double,1> values;
    blitz::Array<double,2> bounds;
    bool is_bounds;

    AxisBounds(blitz::Array<double,1> const &_values) :
        values(_values), is_bounds(false) {}
    AxisBounds(blitz::Array<double,2> const &_bounds) :
        bounds(_bounds), is_bounds(true) {}
    AxisBounds(std::vector<double> const &_values);

    /** @return The (N+1,) values
    @throw ShapeMismatchError, InsufficientGeometryError, NonContiguousBoundsError */
    std::vector<double> contiguous(char const *kind) const;
};

/** (faces, vertices per face) of sequentially numbered connectivity */
struct Shape {
    long rows;
    long cols;

    Shape(long _rows, long _cols) : rows(_rows), cols(_cols) {}
};

/** Connectivity of an unstructured mesh: an (M,N) index array, a
ragged list of faces, or a Shape. */
typedef boost::variant<
    blitz::Array<long,2>,
    std::vector<std::vector<long>>,
    Shape> Connectivity;

// ------------------- Input forms of a Transform
struct Input1D {
    AxisBounds xs, ys;
};

/** (M+1,N+1) corners, shared between faces */
struct Input2D {
    blitz::Array<double,2> xs, ys;
};

/** (M,N,4) corners of each face */
struct InputCorners {
    blitz::Array<double,3> xs, ys;
};

struct InputUnstructured {
    std::vector<double> xs, ys;
    Connectivity connectivity;
};

typedef boost::variant<Input1D, Input2D, InputCorners, InputUnstructured> TransformInput;

// -------------------------------------------------------------------
/** Builds spherical meshes from x/y coordinates, connectivity, data and
CRS metadata.  All forms of input are normalized to unstructured points
plus connectivity, then assembled in one place.

The produced meshes carry the fields gvCRS (WKT of WGS84) and
gvRadius, and gvName if data was attached.

The static from_*() methods build one mesh.  An instance is built once
from a TransformInput, then called to stamp out meshes of the same
structure with different data. */
class Transform {
    Mesh _mesh;

public:
    // ------------------------------------------------
    /** Quad mesh from contiguous 1-D x and y axes: (N+1,) or (N,2)
    along x, (M+1,) or (M,2) along y; M*N faces. */
    static Mesh from_1d(AxisBounds const &xs, AxisBounds const &ys,
        TransformParams const &params = TransformParams(),
        MeshData const *data = 0);

    /** Quad mesh from (M+1,N+1) corner grids */
    static Mesh from_2d(
        blitz::Array<double,2> const &xs, blitz::Array<double,2> const &ys,
        TransformParams const &params = TransformParams(),
        MeshData const *data = 0);

    /** Quad mesh from (M,N,4) per-face corners (no shared points) */
    static Mesh from_2d(
        blitz::Array<double,3> const &xs, blitz::Array<double,3> const &ys,
        TransformParams const &params = TransformParams(),
        MeshData const *data = 0);

    /** Mesh from unstructured points and connectivity */
    static Mesh from_unstructured(
        std::vector<double> const &xs, std::vector<double> const &ys,
        Connectivity const &connectivity,
        TransformParams const &params = TransformParams(),
        MeshData const *data = 0);

    /** Mesh from (M,N) x/y values: M faces of N points each */
    static Mesh from_unstructured(
        blitz::Array<double,2> const &xs, blitz::Array<double,2> const &ys,
        TransformParams const &params = TransformParams(),
        MeshData const *data = 0);

    // ------------------------------------------------
    Transform(TransformInput const &input,
        TransformParams const &params = TransformParams());

    long n_points() const { return _mesh.n_points(); }
    long n_cells() const { return _mesh.n_cells(); }

    /** A mesh of this structure, with data optionally attached.
    @throw DataSizeMismatchError */
    Mesh operator()(MeshData const *data = 0) const;
    Mesh operator()(MeshData const &data) const
        { return (*this)(&data); }
};

}   // namespace
