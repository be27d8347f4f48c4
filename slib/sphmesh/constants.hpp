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

#include <cmath>
#include <string>

namespace sphmesh {

// Radians <--> Degrees
static const double D2R = M_PI / 180.0;
static const double R2D = 180.0 / M_PI;

// ---------------------------------------------------------
// Longitude convention

/** Default base for the wrapped longitude half-open interval (degrees) */
static const double BASE = -180.0;

/** Default period for the wrapped longitude half-open interval (degrees) */
static const double PERIOD = 360.0;

/** Default radius of a spherical mesh: the S2 unit sphere. */
static const double RADIUS = 1.0;

/** Proportional multiplier for z-axis levels/offsets. */
static const double ZLEVEL_FACTOR = 1e-3;

// ---------------------------------------------------------
// Geodesics and bounded-boxes

/** Default geodesic ellipsoid */
extern std::string const ELLIPSE;

/** Number of equally spaced geodesic points between/including endpoints. */
static const int GEODESIC_NPTS = 64;

/** A bounded-box face contains BBOX_C*BBOX_C cells. */
static const int BBOX_C = 256;

/** Bounded-box tolerance on intersection. */
static const double BBOX_TOLERANCE = 0;

/** Inner/outer shell radii are radius*(1 -/+ RADIUS_RATIO) */
static const double RADIUS_RATIO = 1e-1;

/** Default radius of boundaries and lines, just proud of the unit sphere. */
static const double LINE_RADIUS = 1.0 + 1.0 / 1e4;

// ---------------------------------------------------------
// Mesh field / data array names

/** Field holding the serialized (OGC WKT) CRS of the mesh. */
extern std::string const GV_FIELD_CRS;
/** Field holding the name of the attached data array. */
extern std::string const GV_FIELD_NAME;
/** Field holding the radius of the mesh. */
extern std::string const GV_FIELD_RADIUS;
/** Point data array of remesh markers. */
extern std::string const GV_REMESH_POINT_IDS;

extern std::string const DEFAULT_NAME_POINTS;
extern std::string const DEFAULT_NAME_CELLS;

/** Remesh marker for a cell join point. */
static const int REMESH_JOIN = -3;
/** Remesh marker for a western cell boundary point. */
static const int REMESH_SEAM = -1;

}   // namespace
