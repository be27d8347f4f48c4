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

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Surface_mesh.h>
#include <CGAL/AABB_tree.h>
#include <CGAL/AABB_traits.h>
#include <CGAL/AABB_face_graph_triangle_primitive.h>
#include <CGAL/Side_of_triangle_mesh.h>

namespace sphmesh {

/** (Internal Use Only).  SphMesh-specific instantiations of CGAL
templates, used when classifying points against shell meshes.

@see http://www.cgal.org/ */
namespace gc {
    typedef CGAL::Exact_predicates_inexact_constructions_kernel Kernel;
    typedef Kernel::Point_3                                     Point_3;
    typedef CGAL::Surface_mesh<Point_3>                         Surface_mesh;
    typedef CGAL::AABB_face_graph_triangle_primitive<Surface_mesh> Primitive;
    typedef CGAL::AABB_traits<Kernel, Primitive>                AABB_traits;
    typedef CGAL::AABB_tree<AABB_traits>                        AABB_tree;
    typedef CGAL::Side_of_triangle_mesh<Surface_mesh, Kernel>   Side_of_triangle_mesh;
}

}   // namespace
