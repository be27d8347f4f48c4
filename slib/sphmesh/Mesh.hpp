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
#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <blitz/array.h>
#include <netcdf>

#include <sphmesh/error.hpp>

namespace sphmesh {

// --------------------------------------------------
struct Point3 {
    double x;
    double y;
    double z;

    Point3() : x(0), y(0), z(0) {}
    Point3(double _x, double _y, double _z) : x(_x), y(_y), z(_z) {}
};

// ----------------------------------------------------
/** Variable-sized cells, stored in the VTK serialization
<pre>[n0, i0_0 ... i0_{n0-1}, n1, i1_0 ... ]</pre>
Iterate through with:
<pre>for (size_t i=0; i<cells.size(); ++i) {
    long const *ids = cells.ids(i);
    for (int k=0; k<cells.npoints(i); ++k) printf("%ld\n", ids[k]);
}</pre>
*/
class CellArray {
    std::vector<long> _data;
    /** Position of each cell's count within _data */
    std::vector<size_t> _offsets;

public:
    size_t size() const { return _offsets.size(); }
    bool empty() const { return _offsets.empty(); }

    void clear() { _data.clear(); _offsets.clear(); }
    void reserve(size_t ncells, int npoints_per_cell)
    {
        _offsets.reserve(ncells);
        _data.reserve(ncells * (npoints_per_cell+1));
    }

    void add(long const *ids, int n)
    {
        _offsets.push_back(_data.size());
        _data.push_back(n);
        _data.insert(_data.end(), ids, ids+n);
    }
    void add(std::vector<long> const &ids)
        { add(ids.data(), ids.size()); }

    /** Number of points in cell i */
    int npoints(size_t i) const { return _data[_offsets[i]]; }

    /** Point ids of cell i */
    long const *ids(size_t i) const { return &_data[_offsets[i]+1]; }

    /** The [count, ids...] serialization */
    std::vector<long> const &serialized() const { return _data; }

    /** Rebuilds from a [count, ids...] serialization */
    static CellArray from_serialized(std::vector<long> const &data);

    /** @return Number of points per cell, if all cells have the same
        number of points; 0 if mixed or empty. */
    int uniform_npoints() const;

    /** Largest point id referenced; -1 if empty. */
    long max_id() const;

    bool operator==(CellArray const &other) const
        { return _data == other._data; }
    bool operator!=(CellArray const &other) const
        { return !(*this == other); }
};

// ----------------------------------------------------
/** A polygonal mesh: points, polygonal faces, polylines, data
arrays attached to points or faces, and mesh-level field metadata.

Meshes are values.  The blitz arrays inside may be shared between
copies, so no operation here modifies a mesh's arrays in place. */
class Mesh {
public:
    /** (n_points, 3) geocentric xyz */
    blitz::Array<double,2> points;
    CellArray faces;
    CellArray lines;

    std::map<std::string, blitz::Array<double,1>> point_data;
    std::map<std::string, blitz::Array<double,1>> cell_data;

    std::map<std::string, std::string> string_fields;
    std::map<std::string, double> double_fields;

    Mesh() : points(0,3) {}

    Mesh(blitz::Array<double,2> const &_points, CellArray &&_faces);

    /** Shares the arrays of rhs (blitz::Array::operator= would copy
    elementwise, into an array of the wrong shape). */
    Mesh &operator=(Mesh const &rhs);

    long n_points() const { return points.extent(0); }
    long n_faces() const { return faces.size(); }
    long n_lines() const { return lines.size(); }
    long n_cells() const { return n_faces() + n_lines(); }

    Point3 point(long i) const
        { return Point3(points(i,0), points(i,1), points(i,2)); }

    /** @return {xmin, xmax, ymin, ymax, zmin, zmax} */
    std::array<double,6> bounds() const;

    /** Attaches data, checking its size against points/faces */
    void add_point_data(std::string const &name, blitz::Array<double,1> const &data);
    void add_cell_data(std::string const &name, blitz::Array<double,1> const &data);

    /** Geometry, topology and field metadata; no data arrays. */
    Mesh copy_structure() const;

    /** One point per face at the mean of its vertices.  Face data
    becomes point data of the result. */
    Mesh cell_centers() const;

    /** Sub-mesh of the faces for which keep[i] is true.  Unused points
    are dropped (keeping their relative order); point and cell data are
    subset to match. */
    Mesh extract_cells(std::vector<bool> const &keep) const;

    /** Sub-mesh of the faces having at least one point for which
    selected[i] is true. */
    Mesh extract_cells_by_point_mask(std::vector<bool> const &selected) const;

    /** Merges duplicate points (within tolerance, absolute), removes
    unused points and removes degenerate faces (fewer than 3 distinct
    points) and lines (fewer than 2). */
    Mesh clean(double tolerance = 0) const;

    // ------------------------------------------------
    void nc_write(netCDF::NcGroup *nc, std::string const &vname) const;
    void nc_read(netCDF::NcGroup *nc, std::string const &vname);
};

}   // namespace

std::ostream &operator<<(std::ostream &out, sphmesh::Mesh const &mesh);
