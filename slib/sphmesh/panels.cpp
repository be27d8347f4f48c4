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
#include <cctype>
#include <cmath>
#include <sphmesh/panels.hpp>

namespace sphmesh {

static std::string const panel_names[N_PANELS] =
    {"africa", "asia", "pacific", "americas", "polar", "antarctic"};

// Latitude of the corners of a cube inscribed in the sphere
static double const CSC = std::asin(1. / std::sqrt(3.)) * R2D;

struct PanelCorners {
    double lons[4];
    double lats[4];
};

static PanelCorners const panel_corners[N_PANELS] = {
    {{-45, 45, 45, -45}, {CSC, CSC, -CSC, -CSC}},           // africa
    {{45, 135, 135, 45}, {CSC, CSC, -CSC, -CSC}},           // asia
    {{135, -135, -135, 135}, {CSC, CSC, -CSC, -CSC}},       // pacific
    {{-135, -45, -45, -135}, {CSC, CSC, -CSC, -CSC}},       // americas
    {{-45, 45, 135, -135}, {CSC, CSC, CSC, CSC}},           // polar
    {{-45, 45, 135, -135}, {-CSC, -CSC, -CSC, -CSC}}        // antarctic
};

int panel_index(std::string const &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    for (int i=0; i<N_PANELS; ++i)
        if (lower == panel_names[i]) return i;
    throw InvalidPanelError(boost::format(
        "Panel name must be either 'africa', 'americas', 'antarctic', "
        "'asia', 'pacific' or 'polar', got '%s'") % name);
}

std::string const &panel_name(int index)
{
    if (index < 0 || index >= N_PANELS) throw InvalidPanelError(boost::format(
        "Panel index must be in the closed interval [0, %d], got %d")
        % (N_PANELS-1) % index);
    return panel_names[index];
}

BBox panel(std::string const &name,
    std::string const &ellps, double radius, int c, bool triangulate,
    GeometryKernel const *kernel)
{
    return panel(panel_index(name), ellps, radius, c, triangulate, kernel);
}

BBox panel(int index,
    std::string const &ellps, double radius, int c, bool triangulate,
    GeometryKernel const *kernel)
{
    panel_name(index);      // Validate
    PanelCorners const &pc(panel_corners[index]);
    std::vector<double> const lons(pc.lons, pc.lons + 4);
    std::vector<double> const lats(pc.lats, pc.lats + 4);
    return BBox(lons, lats, ellps, radius, c, triangulate, kernel);
}

BBox wedge(double lon1, double lon2,
    std::string const &ellps, double radius, int c, bool triangulate,
    GeometryKernel const *kernel)
{
    double const delta = std::abs(lon1 - lon2);
    if (!(delta > 0 && delta < 180)) throw InvalidWedgeError(boost::format(
        "A geodesic wedge must have an absolute longitudinal difference "
        "(degrees) in the open interval (0, 180), got %g") % delta);

    std::vector<double> const lons {lon1, lon2, lon2, lon1};
    std::vector<double> const lats {90, 90, -90, -90};
    return BBox(lons, lats, ellps, radius, c, triangulate, kernel);
}

}   // namespace
