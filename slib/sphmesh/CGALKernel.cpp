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

#include <cmath>
#include <memory>
#include <CGAL/Polygon_mesh_processing/orient_polygon_soup.h>
#include <CGAL/Polygon_mesh_processing/polygon_soup_to_polygon_mesh.h>
#include <CGAL/Polygon_mesh_processing/triangulate_faces.h>
#include <CGAL/Polygon_mesh_processing/triangulate_hole.h>
#include <sphmesh/cgal.hpp>
#include <sphmesh/CGALKernel.hpp>

namespace PMP = CGAL::Polygon_mesh_processing;

namespace sphmesh {

/** Converts a closed shell into a consistently oriented triangle mesh */
static void to_surface_mesh(Mesh const &solid, gc::Surface_mesh &sm)
{
    std::vector<gc::Point_3> points;
    points.reserve(solid.n_points());
    for (long i=0; i<solid.n_points(); ++i)
        points.push_back(gc::Point_3(solid.points(i,0), solid.points(i,1), solid.points(i,2)));

    std::vector<std::vector<std::size_t>> polygons;
    polygons.reserve(solid.n_faces());
    for (size_t i=0; i<solid.faces.size(); ++i) {
        long const *ids = solid.faces.ids(i);
        polygons.push_back(std::vector<std::size_t>(ids, ids + solid.faces.npoints(i)));
    }

    // The layers of a shell do not share an orientation
    if (!PMP::orient_polygon_soup(points, polygons) && verbose)
        fprintf(stderr, "CGALKernel: shell is not an orientable manifold, "
            "points were duplicated\n");

    PMP::polygon_soup_to_polygon_mesh(points, polygons, sm);
    PMP::triangulate_faces(sm);
}

namespace {

/** A closed shell, triangulated, with its classifier and (optionally)
the distance band around its surface. */
class CGALSolid : public PreparedSolid {
    gc::Surface_mesh sm;
    std::unique_ptr<gc::Side_of_triangle_mesh> inside;
    std::unique_ptr<gc::AABB_tree> tree;
    double tol2;

public:
    CGALSolid(Mesh const &solid, double tolerance) : tol2(0)
    {
        if (solid.n_faces() == 0) return;

        to_surface_mesh(solid, sm);
        if (!CGAL::is_closed(sm)) (*sphmesh_error)(-1,
            "CGALKernel: solid mesh is not closed");

        inside.reset(new gc::Side_of_triangle_mesh(sm));

        if (tolerance > 0) {
            std::array<double,6> const b(solid.bounds());
            double const diag2 =
                (b[1]-b[0])*(b[1]-b[0]) + (b[3]-b[2])*(b[3]-b[2]) + (b[5]-b[4])*(b[5]-b[4]);
            tol2 = tolerance * tolerance * diag2;
            tree.reset(new gc::AABB_tree(faces(sm).first, faces(sm).second, sm));
            tree->accelerate_distance_queries();
        }
    }

    std::vector<bool> select_enclosed(blitz::Array<double,2> const &points) const
    {
        if (points.extent(1) != 3) throw ShapeMismatchError(boost::format(
            "Require (n,3) query points, got (%d,%d)") % points.extent(0) % points.extent(1));

        int const n = points.extent(0);
        std::vector<bool> ret(n, false);
        if (!inside) return ret;

        for (int i=0; i<n; ++i) {
            gc::Point_3 const p(points(i,0), points(i,1), points(i,2));
            if ((*inside)(p) != CGAL::ON_UNBOUNDED_SIDE) {
                ret[i] = true;
            } else if (tree) {
                ret[i] = (CGAL::to_double(tree->squared_distance(p)) <= tol2);
            }
        }
        return ret;
    }
};

}   // anonymous namespace

std::unique_ptr<PreparedSolid> CGALKernel::prepare(
    Mesh const &solid, double tolerance) const
{
    return std::unique_ptr<PreparedSolid>(new CGALSolid(solid, tolerance));
}

std::vector<bool> CGALKernel::select_enclosed(
    blitz::Array<double,2> const &points,
    Mesh const &solid,
    double tolerance) const
{
    return prepare(solid, tolerance)->select_enclosed(points);
}

std::vector<std::array<int,3>> CGALKernel::triangulate_face(
    std::vector<Point3> const &polygon) const
{
    int const n = polygon.size();
    std::vector<std::array<int,3>> ret;
    if (n < 3) return ret;
    if (n == 3) {
        ret.push_back({{0, 1, 2}});
        return ret;
    }

    std::vector<gc::Point_3> polyline;
    for (auto const &p : polygon) polyline.push_back(gc::Point_3(p.x, p.y, p.z));

    std::vector<CGAL::Triple<int,int,int>> patch;
    PMP::triangulate_hole_polyline(polyline, std::back_inserter(patch));
    if ((int)patch.size() == n-2) {
        for (auto const &t : patch) ret.push_back({{t.first, t.second, t.third}});
        return ret;
    }

    // Degenerate polygon: fall back to a fan
    for (int k=1; k<n-1; ++k) ret.push_back({{0, k, k+1}});
    return ret;
}

GeometryKernel const &default_kernel()
{
    static CGALKernel kernel;
    return kernel;
}

}   // namespace
