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
#include <sphmesh/BBox.hpp>

namespace sphmesh {

/** Number of cubed-sphere panels */
static const int N_PANELS = 6;

/** Index (0..5) of a cubed-sphere panel by case-insensitive name:
africa, asia, pacific, americas, polar, antarctic.
@throw InvalidPanelError */
extern int panel_index(std::string const &name);

extern std::string const &panel_name(int index);

/** Bounded-box of a cubed-sphere panel.
@param kernel OPTIONAL: only used with triangulate.
@throw InvalidPanelError */
extern BBox panel(std::string const &name,
    std::string const &ellps = ELLIPSE,
    double radius = RADIUS,
    int c = BBOX_C,
    bool triangulate = false,
    GeometryKernel const *kernel = 0);

extern BBox panel(int index,
    std::string const &ellps = ELLIPSE,
    double radius = RADIUS,
    int c = BBOX_C,
    bool triangulate = false,
    GeometryKernel const *kernel = 0);

/** Pole to pole bounded-box between two meridians.
@throw InvalidWedgeError unless 0 < |lon1 - lon2| < 180 */
extern BBox wedge(double lon1, double lon2,
    std::string const &ellps = ELLIPSE,
    double radius = RADIUS,
    int c = BBOX_C,
    bool triangulate = false,
    GeometryKernel const *kernel = 0);

}   // namespace
