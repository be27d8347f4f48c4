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

#include <sphmesh/GeometryKernel.hpp>

namespace sphmesh {

namespace {

class DeferredSolid : public PreparedSolid {
    GeometryKernel const &kernel;
    Mesh const &solid;
    double const tolerance;
public:
    DeferredSolid(GeometryKernel const &_kernel, Mesh const &_solid, double _tolerance) :
        kernel(_kernel), solid(_solid), tolerance(_tolerance) {}

    std::vector<bool> select_enclosed(blitz::Array<double,2> const &points) const
        { return kernel.select_enclosed(points, solid, tolerance); }
};

}

std::unique_ptr<PreparedSolid> GeometryKernel::prepare(
    Mesh const &solid, double tolerance) const
{
    return std::unique_ptr<PreparedSolid>(new DeferredSolid(*this, solid, tolerance));
}

// ------------------------------------------------------------

Mesh triangulate(Mesh const &mesh, GeometryKernel const &kernel)
{
    CellArray tris;
    tris.reserve(mesh.n_faces() * 2, 3);

    // Face each output triangle came from
    std::vector<long> source;
    source.reserve(mesh.n_faces() * 2);

    std::vector<Point3> polygon;
    for (size_t i=0; i<mesh.faces.size(); ++i) {
        long const *ids = mesh.faces.ids(i);
        int const n = mesh.faces.npoints(i);
        if (n == 3) {
            tris.add(ids, 3);
            source.push_back(i);
            continue;
        }

        polygon.clear();
        for (int k=0; k<n; ++k) polygon.push_back(mesh.point(ids[k]));
        std::vector<std::array<int,3>> const triangles(kernel.triangulate_face(polygon));
        for (auto const &tri : triangles) {
            long const tids[3] = {ids[tri[0]], ids[tri[1]], ids[tri[2]]};
            tris.add(tids, 3);
            source.push_back(i);
        }
    }

    Mesh ret(mesh.points, std::move(tris));
    ret.lines = mesh.lines;
    ret.point_data = mesh.point_data;
    for (auto ii=mesh.cell_data.begin(); ii != mesh.cell_data.end(); ++ii) {
        blitz::Array<double,1> data(source.size());
        for (size_t j=0; j<source.size(); ++j) data(j) = ii->second(source[j]);
        ret.cell_data[ii->first].reference(data);
    }
    ret.string_fields = mesh.string_fields;
    ret.double_fields = mesh.double_fields;
    return ret;
}

}   // namespace
