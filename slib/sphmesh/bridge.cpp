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
#include <limits>
#include <sphmesh/bridge.hpp>
#include <sphmesh/Proj2.hpp>

namespace sphmesh {

AxisBounds::AxisBounds(std::vector<double> const &_values) :
    values(_values.size()), is_bounds(false)
{
    for (size_t i=0; i<_values.size(); ++i) values(i) = _values[i];
}

std::vector<double> AxisBounds::contiguous(char const *kind) const
{
    std::vector<double> ret;
    if (!is_bounds) {
        if (values.extent(0) < 2) throw InsufficientGeometryError(boost::format(
            "Require a 1-D %s array with minimal shape (2,), i.e. one face "
            "with two bounds, got (%d,)") % kind % values.extent(0));
        for (int i=0; i<values.extent(0); ++i) ret.push_back(values(i));
        return ret;
    }

    if (bounds.extent(1) != 2) throw ShapeMismatchError(boost::format(
        "Require a 1-D (N+1,) %s array, or 2-D (N,2) %s array, got (%d,%d)")
        % kind % kind % bounds.extent(0) % bounds.extent(1));
    int const n = bounds.extent(0);
    if (n < 1) throw InsufficientGeometryError(boost::format(
        "Require a (N,2) %s bounds array with at least one face") % kind);

    // Right bound of each face must be the left bound of the next
    ret.push_back(bounds(0,0));
    for (int i=0; i<n-1; ++i) {
        if (!isclose(bounds(i,1), bounds(i+1,0))) throw NonContiguousBoundsError(
            boost::format("The %s bounds array, shape (%d,2), is not contiguous")
            % kind % n);
        ret.push_back(bounds(i,1));
    }
    ret.push_back(bounds(n-1,1));
    return ret;
}

// =================================================================
namespace {

/** Unstructured points plus connectivity: what every input form is
reduced to before assembly. */
struct Canonical {
    std::vector<double> xs, ys;
    CellArray faces;
    /** Connectivity was generated, so is already 0-based */
    bool ignore_start_index;

    Canonical() : ignore_start_index(true) {}
};

void check_points(size_t nx, size_t ny)
{
    if (nx != ny) throw ShapeMismatchError(boost::format(
        "Require x-values and y-values with the same shape, got %d and %d values")
        % nx % ny);
    if (nx < 3) throw InsufficientGeometryError(boost::format(
        "Require a mesh to have at least one face with three points/vertices, "
        "got %d x-values/y-values") % nx);
}

/** Flattens a blitz array in C (row-major) order */
template<int RANK>
std::vector<double> flatten(blitz::Array<double,RANK> const &arr)
{
    std::vector<double> ret;
    ret.reserve(arr.numElements());
    blitz::Array<double,RANK> carr(arr.shape());    // C storage order
    carr = arr;
    ret.insert(ret.end(), carr.data(), carr.data() + carr.numElements());
    return ret;
}

/** Connectivity of the (rows-1)*(cols-1) quads of a (rows,cols) point grid.
Anti-clockwise, starting at the lower left:
<pre>
    3---2
    |   |
    0---1
</pre>
(row r+1 is "below" row r) */
CellArray connectivity_m1n1(long rows, long cols)
{
    CellArray ret;
    ret.reserve((rows-1)*(cols-1), 4);
    for (long r=0; r<rows-1; ++r) {
        for (long k=0; k<cols-1; ++k) {
            long const quad[4] = {
                (r+1)*cols + k, (r+1)*cols + k+1,
                r*cols + k+1, r*cols + k};
            ret.add(quad, 4);
        }
    }
    return ret;
}

/** Sequential connectivity of nfaces faces of npoints points each */
CellArray connectivity_sequential(long nfaces, long npoints)
{
    CellArray ret;
    ret.reserve(nfaces, npoints);
    std::vector<long> ids(npoints);
    for (long i=0; i<nfaces; ++i) {
        for (long k=0; k<npoints; ++k) ids[k] = i*npoints + k;
        ret.add(ids);
    }
    return ret;
}

/** Converts explicit connectivity to a CellArray */
class ConnectivityVisitor : public boost::static_visitor<void> {
    Canonical &can;
public:
    explicit ConnectivityVisitor(Canonical &_can) : can(_can) {}

    void operator()(blitz::Array<long,2> const &conn) const
    {
        if (conn.extent(1) < 3) throw DegenerateFaceError(boost::format(
            "Require a connectivity array defining at least 3 vertices per "
            "face, i.e. minimal shape (M,3), got (%d,%d)")
            % conn.extent(0) % conn.extent(1));

        std::vector<long> ids(conn.extent(1));
        can.faces.reserve(conn.extent(0), conn.extent(1));
        for (int i=0; i<conn.extent(0); ++i) {
            for (int k=0; k<conn.extent(1); ++k) ids[k] = conn(i,k);
            can.faces.add(ids);
        }
        can.ignore_start_index = false;
    }

    void operator()(std::vector<std::vector<long>> const &conn) const
    {
        for (size_t i=0; i<conn.size(); ++i) {
            if (conn[i].size() < 3) throw DegenerateFaceError(boost::format(
                "Face %d has %d vertices, require at least 3")
                % i % conn[i].size());
            can.faces.add(conn[i]);
        }
        can.ignore_start_index = false;
    }

    void operator()(Shape const &shape) const
    {
        if (shape.cols < 3) throw DegenerateFaceError(boost::format(
            "Require connectivity with at least 3 vertices per face, "
            "i.e. minimal shape (M,3), got (%d,%d)") % shape.rows % shape.cols);
        long const npts = shape.rows * shape.cols;
        if (npts != (long)can.xs.size()) throw ShapeMismatchError(boost::format(
            "Connectivity with shape (%d,%d) requires %d x-values/y-values, "
            "but %d have been provided")
            % shape.rows % shape.cols % npts % can.xs.size());
        can.faces = connectivity_sequential(shape.rows, shape.cols);
        can.ignore_start_index = true;
    }
};

/** Subtracts the start index, and checks the result against the points */
void normalize_start_index(Canonical &can, boost::optional<int> const &start_index)
{
    long const n = can.xs.size();
    if (!can.ignore_start_index) {
        long si;
        if (start_index) {
            si = *start_index;
        } else {
            si = std::numeric_limits<long>::max();
            std::vector<long> const &data(can.faces.serialized());
            for (size_t i=0; i<can.faces.size(); ++i) {
                long const *ids = can.faces.ids(i);
                for (int k=0; k<can.faces.npoints(i); ++k) si = std::min(si, ids[k]);
            }
            if (data.empty()) si = 0;
        }

        if (si != 0 && si != 1) throw InvalidStartIndexError(boost::format(
            "Require a start index in the closed interval [0, 1], got %d") % si);

        if (si != 0) {
            CellArray shifted;
            std::vector<long> ids;
            for (size_t i=0; i<can.faces.size(); ++i) {
                long const *fids = can.faces.ids(i);
                ids.assign(fids, fids + can.faces.npoints(i));
                for (long &id : ids) id -= si;
                shifted.add(ids);
            }
            can.faces = std::move(shifted);
        }
    }

    for (size_t i=0; i<can.faces.size(); ++i) {
        long const *ids = can.faces.ids(i);
        for (int k=0; k<can.faces.npoints(i); ++k) {
            if (ids[k] < 0 || ids[k] >= n) throw ShapeMismatchError(boost::format(
                "Face %d refers to point %d, but only %d points were provided")
                % i % ids[k] % n);
        }
    }
}

/** Attaches data to the points or faces of mesh, by its size */
void attach_data(Mesh &mesh, MeshData const &data)
{
    long const size = data.values.extent(0);
    if (size != mesh.n_points() && size != mesh.n_faces())
        throw DataSizeMismatchError(boost::format(
            "Require mesh data with either %d points or %d cells, got %d values")
            % mesh.n_points() % mesh.n_faces() % size);

    bool const on_points = (size == mesh.n_points());
    std::string name(data.name);
    if (name.empty()) name = (on_points ? DEFAULT_NAME_POINTS : DEFAULT_NAME_CELLS);

    mesh.string_fields[GV_FIELD_NAME] = name;
    if (on_points) mesh.add_point_data(name, data.values);
    else mesh.add_cell_data(name, data.values);
}

/** The shared final stage of every input form */
Mesh assemble(Canonical &&can,
    TransformParams const &params,
    MeshData const *data)
{
    check_points(can.xs.size(), can.ys.size());

    // Reproject to lon/lat
    Proj2 const proj(params.crs, Proj2::Direction::XY2LL);
    proj.transform(can.xs, can.ys);

    for (double &x : can.xs) x = wrap(x);

    normalize_start_index(can, params.start_index);

    // Reduce singularities at the poles to a single point
    for (size_t i=0; i<can.xs.size(); ++i) {
        if (isclose(std::abs(can.ys[i]), 90.)) can.xs[i] = 0;
    }

    double radius = std::abs(params.radius);
    radius += radius * params.zlevel * params.zfactor;

    Mesh mesh(to_xyz(can.xs, can.ys, radius), std::move(can.faces));
    mesh.string_fields[GV_FIELD_CRS] = WGS84_WKT;
    mesh.double_fields[GV_FIELD_RADIUS] = radius;

    if (data) attach_data(mesh, *data);
    if (params.clean) mesh = mesh.clean();

    if (verbose) fprintf(stderr, "Transform: n_points=%ld n_faces=%ld radius=%g\n",
        mesh.n_points(), mesh.n_faces(), radius);
    return mesh;
}

}   // anonymous namespace

// =================================================================
Mesh Transform::from_1d(AxisBounds const &xs, AxisBounds const &ys,
    TransformParams const &params, MeshData const *data)
{
    std::vector<double> const cxs(xs.contiguous("x-axis"));
    std::vector<double> const cys(ys.contiguous("y-axis"));

    // meshgrid(), "xy" indexing
    int const rows = cys.size();
    int const cols = cxs.size();
    blitz::Array<double,2> mxs(rows, cols);
    blitz::Array<double,2> mys(rows, cols);
    for (int r=0; r<rows; ++r) {
        for (int k=0; k<cols; ++k) {
            mxs(r,k) = cxs[k];
            mys(r,k) = cys[r];
        }
    }
    return from_2d(mxs, mys, params, data);
}

Mesh Transform::from_2d(
    blitz::Array<double,2> const &xs, blitz::Array<double,2> const &ys,
    TransformParams const &params, MeshData const *data)
{
    if (xs.extent(0) != ys.extent(0) || xs.extent(1) != ys.extent(1))
        throw ShapeMismatchError(boost::format(
            "Require x-values and y-values with the same shape, got (%d,%d) and (%d,%d)")
            % xs.extent(0) % xs.extent(1) % ys.extent(0) % ys.extent(1));
    if (xs.extent(0) < 2 || xs.extent(1) < 2) throw InsufficientGeometryError(
        boost::format("Require a quad-mesh with at least one face and four "
        "points, i.e. minimal shape (2,2), got (%d,%d)")
        % xs.extent(0) % xs.extent(1));

    Canonical can;
    can.xs = flatten(xs);
    can.ys = flatten(ys);
    can.faces = connectivity_m1n1(xs.extent(0), xs.extent(1));
    return assemble(std::move(can), params, data);
}

Mesh Transform::from_2d(
    blitz::Array<double,3> const &xs, blitz::Array<double,3> const &ys,
    TransformParams const &params, MeshData const *data)
{
    for (int d=0; d<3; ++d) {
        if (xs.extent(d) != ys.extent(d)) throw ShapeMismatchError(boost::format(
            "Require x-values and y-values with the same shape, got (%d,%d,%d) and (%d,%d,%d)")
            % xs.extent(0) % xs.extent(1) % xs.extent(2)
            % ys.extent(0) % ys.extent(1) % ys.extent(2));
    }
    if (xs.extent(2) != 4) throw ShapeMismatchError(boost::format(
        "Require 3-D x-values with shape (M,N,4), got (%d,%d,%d)")
        % xs.extent(0) % xs.extent(1) % xs.extent(2));

    Canonical can;
    can.xs = flatten(xs);
    can.ys = flatten(ys);
    can.faces = connectivity_sequential(xs.extent(0) * xs.extent(1), 4);
    return assemble(std::move(can), params, data);
}

Mesh Transform::from_unstructured(
    std::vector<double> const &xs, std::vector<double> const &ys,
    Connectivity const &connectivity,
    TransformParams const &params, MeshData const *data)
{
    check_points(xs.size(), ys.size());

    Canonical can;
    can.xs = xs;
    can.ys = ys;
    boost::apply_visitor(ConnectivityVisitor(can), connectivity);
    return assemble(std::move(can), params, data);
}

Mesh Transform::from_unstructured(
    blitz::Array<double,2> const &xs, blitz::Array<double,2> const &ys,
    TransformParams const &params, MeshData const *data)
{
    if (xs.extent(0) != ys.extent(0) || xs.extent(1) != ys.extent(1))
        throw ShapeMismatchError(boost::format(
            "Require x-values and y-values with the same shape, got (%d,%d) and (%d,%d)")
            % xs.extent(0) % xs.extent(1) % ys.extent(0) % ys.extent(1));

    return from_unstructured(flatten(xs), flatten(ys),
        Connectivity(Shape(xs.extent(0), xs.extent(1))), params, data);
}

// =================================================================
namespace {

class InputVisitor : public boost::static_visitor<Mesh> {
    TransformParams const &params;
public:
    explicit InputVisitor(TransformParams const &_params) : params(_params) {}

    Mesh operator()(Input1D const &in) const
        { return Transform::from_1d(in.xs, in.ys, params); }
    Mesh operator()(Input2D const &in) const
        { return Transform::from_2d(in.xs, in.ys, params); }
    Mesh operator()(InputCorners const &in) const
        { return Transform::from_2d(in.xs, in.ys, params); }
    Mesh operator()(InputUnstructured const &in) const
        { return Transform::from_unstructured(in.xs, in.ys, in.connectivity, params); }
};

}

Transform::Transform(TransformInput const &input, TransformParams const &params)
    : _mesh(boost::apply_visitor(InputVisitor(params), input)) {}

Mesh Transform::operator()(MeshData const *data) const
{
    Mesh mesh(_mesh.copy_structure());
    if (data) attach_data(mesh, *data);
    return mesh;
}

}   // namespace
