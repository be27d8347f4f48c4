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

#include <iostream>
#include <string>
#include <vector>
#include <sphmesh/constants.hpp>
#include <sphmesh/geodesic.hpp>
#include <sphmesh/GeometryKernel.hpp>
#include <sphmesh/Mesh.hpp>

namespace sphmesh {

/** How strictly a face of a surface must be contained by a bounded-box
to be selected:
 - CELL: every vertex of the face is enclosed.
 - CENTER: the face centroid is enclosed.
 - POINT: at least one vertex of the face is enclosed. */
enum class Preference {CELL, CENTER, POINT};

/** Case-insensitive "cell", "center" or "point".
@throw InvalidPreferenceError */
extern Preference parse_preference(std::string const &spref);

extern std::string to_string(Preference preference);

// -------------------------------------------------------------
/** A geodesic bounded-box: a closed shell of quads between two
spheres (the inner and outer layers), bounded laterally by the
geodesic quadrilateral between four lon/lat corners and sealed by a
skirt.  Used as a solid to extract the part of a surface mesh within
the quadrilateral.

The shell has c*c faces per layer, 4*c skirt faces and (c+1)*(c+1)
points per layer.  Immutable once constructed. */
class BBox {
    /** The four (open) corners */
    std::vector<double> _lons, _lats;
    std::string _ellps;
    double _radius;
    int _c;
    bool _triangulate;

    /** lon/lat of every point of one layer */
    LonLats _bbox;
    /** Point indices of the boundary ring of one layer */
    std::vector<long> _edge;
    Mesh _mesh;

public:
    /** @param lons, lats Corners (degrees): 4, or 5 for a closed ring.
    @param c Number of faces along each edge of a layer.
    @param triangulate Split the quads of the shell into triangles.
    @param kernel OPTIONAL: Used to triangulate; default_kernel() if not given.
    @throw ShapeMismatchError, InvalidGeometryError, InvalidEllipsoidError */
    BBox(std::vector<double> const &lons,
        std::vector<double> const &lats,
        std::string const &ellps = ELLIPSE,
        double radius = RADIUS,
        int c = BBOX_C,
        bool triangulate = false,
        GeometryKernel const *kernel = 0);

    std::vector<double> const &lons() const { return _lons; }
    std::vector<double> const &lats() const { return _lats; }
    std::string const &ellps() const { return _ellps; }
    double radius() const { return _radius; }
    int c() const { return _c; }
    bool triangulate() const { return _triangulate; }
    double inner_radius() const { return _radius * (1. - RADIUS_RATIO); }
    double outer_radius() const { return _radius * (1. + RADIUS_RATIO); }

    /** The shell */
    Mesh const &mesh() const { return _mesh; }

    /** Closed polyline around the boundary of the bounded-box. */
    Mesh boundary(double radius = LINE_RADIUS) const;

    /** The part of surface enclosed by the bounded-box.  Surface points
    on the shell count as enclosed.
    @param tolerance Fraction of the diagonal of the shell's bounding box.
    @param outside Select the part outside instead.
    @return Sub-mesh with renumbered points; point/cell data and fields
        are kept.
    @throw MixedFaceTypeError for Preference::CELL over mixed face types. */
    Mesh enclosed(Mesh const &surface,
        GeometryKernel const &kernel,
        double tolerance = BBOX_TOLERANCE,
        bool outside = false,
        Preference preference = Preference::CENTER) const;

    /** As above, with default_kernel() */
    Mesh enclosed(Mesh const &surface,
        double tolerance = BBOX_TOLERANCE,
        bool outside = false,
        Preference preference = Preference::CENTER) const;

    bool operator==(BBox const &other) const;
    bool operator!=(BBox const &other) const
        { return !(*this == other); }
};

}   // namespace

std::ostream &operator<<(std::ostream &out, sphmesh::BBox const &bbox);
