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

#ifndef SPHMESH_PROJ_HPP
#define SPHMESH_PROJ_HPP

#include <proj_api.h>
#include <string>

namespace sphmesh {

/** Owns one projPJ of the proj.4 C library.  Move-only.
@see http://trac.osgeo.org/proj */
class Proj {
    projPJ pj;

    explicit Proj(projPJ _pj) : pj(_pj) {}

public:
    Proj() : pj(0) {}

    /** Check is_valid() afterwards. */
    explicit Proj(std::string const &definition)
        : pj(pj_init_plus(definition.c_str())) {}

    Proj(Proj &&rhs) : pj(rhs.pj)
        { rhs.pj = 0; }

    Proj &operator=(Proj &&rhs)
    {
        if (this == &rhs) return *this;
        if (pj) pj_free(pj);
        pj = rhs.pj;
        rhs.pj = 0;
        return *this;
    }

    Proj(Proj const &) = delete;
    Proj &operator=(Proj const &) = delete;

    ~Proj() { if (pj) pj_free(pj); }

    bool is_valid() const { return (pj != 0); }

    /** Geographic (proj=latlong) */
    bool is_latlong() const
        { return pj_is_latlong(pj) != 0; }

    /** The geographic CRS on the same datum as this one */
    Proj latlong_from_proj() const
        { return Proj(pj_latlong_from_proj(pj)); }

    friend int transform(Proj const &src, Proj const &dest,
        long point_count, double *x, double *y);
};

/** Transforms packed x/y arrays in place.
@return The proj.4 error code; 0 on success. */
inline int transform(Proj const &src, Proj const &dest,
    long point_count, double *x, double *y)
{
    return pj_transform(src.pj, dest.pj, point_count, 1, x, y, 0);
}

}   // namespace

#endif
