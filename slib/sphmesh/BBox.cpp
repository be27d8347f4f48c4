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
#include <chrono>
#include <memory>
#include <sstream>
#include <sphmesh/BBox.hpp>
#include <sphmesh/CGALKernel.hpp>
#include <sphmesh/common.hpp>
#include <sphmesh/Proj2.hpp>

namespace sphmesh {

Preference parse_preference(std::string const &spref)
{
    std::string lower(spref);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "cell") return Preference::CELL;
    if (lower == "center") return Preference::CENTER;
    if (lower == "point") return Preference::POINT;
    throw InvalidPreferenceError(boost::format(
        "Preference must be either 'cell', 'center' or 'point', got '%s'") % spref);
}

std::string to_string(Preference preference)
{
    switch(preference) {
        case Preference::CELL : return "cell";
        case Preference::CENTER : return "center";
        default : return "point";
    }
}

// =============================================================
namespace {

/** Builds the points and faces of a bounded-box shell.  Lives only
for the duration of the BBox constructor. */
class BBoxBuilder {
    int const c;
    /** Interior points per edge */
    int const npts;
    Geod const &geod;

    /** (row, col) on one layer --> point index; -1 = unassigned */
    blitz::Array<long,2> idx_map;
public:
    LonLats ll;

    BBoxBuilder(int _c, Geod const &_geod) :
        c(_c), npts(_c-1), geod(_geod), idx_map(_c+1, _c+1)
    {
        idx_map = -1;
        ll.lons.reserve((c+1)*(c+1));
        ll.lats.reserve((c+1)*(c+1));
    }

    long n_points() const { return (c+1)*(c+1); }

private:
    void extend(std::vector<double> const &lons, std::vector<double> const &lats)
    {
        ll.lons.insert(ll.lons.end(), lons.begin(), lons.end());
        ll.lats.insert(ll.lats.end(), lats.begin(), lats.end());
    }

    /** Interpolates between two registered points and fills in a row
    (or col) of the index map. */
    void update(long idx1, long idx2, int row, int col)
    {
        LonLats const glonlat(npoints_by_idx(ll.lons, ll.lats, idx1, idx2,
            npts, false, false, &geod));

        long const count = ll.size();
        for (int k=0; k<=c; ++k) {
            long const ix = (k == 0 ? idx1 : k == c ? idx2 : count + k - 1);
            if (row >= 0) idx_map(row, k) = ix;
            else idx_map(k, col) = ix;
        }
        extend(glonlat.lons, glonlat.lats);
    }

public:
    /** Edges first, then interior rows */
    void generate_face(std::vector<double> const &lons, std::vector<double> const &lats)
    {
        long const c1 = 0, c2 = 1, c3 = 2, c4 = 3;

        extend(lons, lats);
        update(c1, c2, 0, -1);
        update(c4, c3, c, -1);
        update(c1, c4, -1, 0);
        update(c2, c3, -1, c);

        for (int r=1; r<c; ++r) update(idx_map(r,0), idx_map(r,c), r, -1);

        for (int r=0; r<=c; ++r) {
            for (int k=0; k<=c; ++k) {
                if (idx_map(r,k) < 0) (*sphmesh_error)(-1,
                    "BBoxBuilder: index map cell (%d,%d) was never assigned", r, k);
            }
        }
        if ((long)ll.size() != n_points()) (*sphmesh_error)(-1,
            "BBoxBuilder: generated %ld points, expected %ld",
            (long)ll.size(), n_points());
    }

    /** Boundary ring: top row, right col, bottom row reversed, left col reversed */
    std::vector<long> edge_idxs() const
    {
        std::vector<long> ret;
        ret.reserve(4*c);
        for (int k=0; k<=c; ++k) ret.push_back(idx_map(0,k));
        for (int r=1; r<=c; ++r) ret.push_back(idx_map(r,c));
        for (int k=c-1; k>=0; --k) ret.push_back(idx_map(c,k));
        for (int r=c-1; r>0; --r) ret.push_back(idx_map(r,0));
        return ret;
    }

    /** Inner layer, outer layer, then the skirt */
    CellArray faces() const
    {
        long const n = n_points();
        CellArray ret;
        ret.reserve(2*c*c + 4*c, 4);

        for (long offset : {0L, n}) {
            for (int r=0; r<c; ++r) {
                for (int k=0; k<c; ++k) {
                    long const quad[4] = {
                        idx_map(r,k) + offset, idx_map(r,k+1) + offset,
                        idx_map(r+1,k+1) + offset, idx_map(r+1,k) + offset};
                    ret.add(quad, 4);
                }
            }
        }

        std::vector<long> const edge(edge_idxs());
        for (size_t i=0; i<edge.size(); ++i) {
            long const b0 = edge[i];
            long const b1 = edge[(i+1) % edge.size()];
            long const quad[4] = {b0, b1, b1+n, b0+n};
            ret.add(quad, 4);
        }
        return ret;
    }
};

}   // anonymous namespace

// =============================================================
BBox::BBox(std::vector<double> const &lons,
    std::vector<double> const &lats,
    std::string const &ellps,
    double radius,
    int c,
    bool triangulate,
    GeometryKernel const *kernel)
: _lons(lons), _lats(lats), _ellps(ellps), _radius(radius), _c(c), _triangulate(triangulate)
{
    if (_lons.size() != _lats.size()) throw ShapeMismatchError(boost::format(
        "Require the same number of longitudes (%d) and latitudes (%d)")
        % _lons.size() % _lats.size());
    if (_lons.size() < 4 || _lons.size() > 5) throw InvalidGeometryError(boost::format(
        "Require a bounded-box geometry of 4 (open) or 5 (closed) "
        "longitude/latitude values, got %d") % _lons.size());

    // Open a closed ring
    if (_lons.size() == 5) {
        if (!(isclose(_lons[0], _lons[4]) && isclose(_lats[0], _lats[4])))
            throw InvalidGeometryError(
                "A bounded-box geometry of 5 longitude/latitude values "
                "must be a closed ring");
        _lons.pop_back();
        _lats.pop_back();
    }
    if (_c < 1) throw InvalidGeometryError(boost::format(
        "Require a bounded-box with at least one face per edge, got c=%d") % _c);

    Geod const geod(_ellps);

    if (verbose) {
        fprintf(stderr, "BBox: c=%d n_faces=%d idx_map=(%d,%d)\n",
            _c, _c*_c, _c+1, _c+1);
        fprintf(stderr, "BBox: radii %g, %g, %g\n",
            _radius, inner_radius(), outer_radius());
    }

    BBoxBuilder builder(_c, geod);
    builder.generate_face(_lons, _lats);
    _bbox = std::move(builder.ll);
    _edge = builder.edge_idxs();

    // Inner layer, then outer layer
    long const n = builder.n_points();
    blitz::Array<double,2> xyz(2*n, 3);
    blitz::Array<double,2> const inner(to_xyz(_bbox.lons, _bbox.lats, inner_radius()));
    blitz::Array<double,2> const outer(to_xyz(_bbox.lons, _bbox.lats, outer_radius()));
    xyz(blitz::Range(0, n-1), blitz::Range::all()) = inner;
    xyz(blitz::Range(n, 2*n-1), blitz::Range::all()) = outer;

    _mesh = Mesh(xyz, builder.faces());
    if (verbose) fprintf(stderr, "BBox: n_faces=%ld n_points=%ld\n",
        _mesh.n_faces(), _mesh.n_points());

    if (_triangulate) {
        _mesh = sphmesh::triangulate(_mesh, kernel ? *kernel : default_kernel());
        if (verbose) fprintf(stderr, "BBox: n_faces=%ld n_points=%ld (tri)\n",
            _mesh.n_faces(), _mesh.n_points());
    }
}

Mesh BBox::boundary(double radius) const
{
    std::vector<double> lons, lats;
    lons.reserve(_edge.size());
    lats.reserve(_edge.size());
    for (long ix : _edge) {
        lons.push_back(_bbox.lons[ix]);
        lats.push_back(_bbox.lats[ix]);
    }

    std::vector<long> ids(_edge.size());
    for (size_t i=0; i<ids.size(); ++i) ids[i] = i;
    ids.push_back(0);

    Mesh ret(to_xyz(lons, lats, radius), CellArray());
    ret.lines.add(ids);
    ret.string_fields[GV_FIELD_CRS] = WGS84_WKT;
    ret.double_fields[GV_FIELD_RADIUS] = radius;
    return ret;
}

// -------------------------------------------------------------
/** Classifies points against the shell, inverted if outside */
static std::vector<bool> classify(
    PreparedSolid const &shell,
    blitz::Array<double,2> const &points,
    bool outside)
{
    auto const t0(std::chrono::steady_clock::now());
    std::vector<bool> selected(shell.select_enclosed(points));
    if (outside) selected.flip();
    auto const t1(std::chrono::steady_clock::now());

    if (verbose) {
        long const nsel = std::count(selected.begin(), selected.end(), true);
        fprintf(stderr, "BBox::enclosed(): selected %ld of %d points [%gs]\n",
            nsel, points.extent(0),
            std::chrono::duration<double>(t1 - t0).count());
    }
    return selected;
}

Mesh BBox::enclosed(Mesh const &surface,
    GeometryKernel const &kernel,
    double tolerance,
    bool outside,
    Preference preference) const
{
    bool check_cells = false;
    if (verbose) {
        fprintf(stderr, "BBox::enclosed(): preference '%s'\n", to_string(preference).c_str());
        fprintf(stderr, "BBox::enclosed(): surface n_cells=%ld n_points=%ld\n",
            surface.n_cells(), surface.n_points());
    }

    if (preference == Preference::CELL) {
        preference = Preference::POINT;
        check_cells = true;
    }

    // One shell for all classifications of this query
    std::unique_ptr<PreparedSolid> const shell(kernel.prepare(_mesh, tolerance));

    Mesh region;
    if (preference == Preference::CENTER) {
        Mesh const centers(surface.cell_centers());
        region = surface.extract_cells(
            classify(*shell, centers.points, outside));
    } else {
        region = surface.extract_cells_by_point_mask(
            classify(*shell, surface.points, outside));
    }
    if (verbose) fprintf(stderr, "BBox::enclosed(): region n_cells=%ld n_points=%ld\n",
        region.n_cells(), region.n_points());

    if (!check_cells || region.n_faces() == 0 || region.n_points() == 0)
        return region;

    // Strict pass: every vertex of a face must be enclosed
    int const nvert = region.faces.uniform_npoints();
    if (nvert == 0) throw MixedFaceTypeError(
        "Cannot extract surface enclosed by the bounded-box when the "
        "surface has mixed face types and preference is 'cell'.  "
        "Try 'center' or 'point' instead.");

    long const nfaces = region.n_faces();
    std::vector<bool> enclosed(nfaces, true);
    blitz::Array<double,2> slot(nfaces, 3);
    for (int k=0; k<nvert; ++k) {
        for (long i=0; i<nfaces; ++i) {
            long const ix = region.faces.ids(i)[k];
            for (int d=0; d<3; ++d) slot(i,d) = region.points(ix,d);
        }
        std::vector<bool> const selected(
            classify(*shell, slot, outside));
        for (long i=0; i<nfaces; ++i)
            enclosed[i] = enclosed[i] && selected[i];
    }

    region = region.extract_cells(enclosed);
    if (verbose) fprintf(stderr, "BBox::enclosed(): region n_cells=%ld n_points=%ld\n",
        region.n_cells(), region.n_points());
    return region;
}

Mesh BBox::enclosed(Mesh const &surface,
    double tolerance,
    bool outside,
    Preference preference) const
{
    return enclosed(surface, default_kernel(), tolerance, outside, preference);
}

// -------------------------------------------------------------
static bool allclose(std::vector<double> const &a, std::vector<double> const &b)
{
    if (a.size() != b.size()) return false;
    for (size_t i=0; i<a.size(); ++i)
        if (!isclose(a[i], b[i])) return false;
    return true;
}

bool BBox::operator==(BBox const &other) const
{
    return _ellps == other._ellps
        && _c == other._c
        && _triangulate == other._triangulate
        && isclose(_radius, other._radius)
        && allclose(_lons, other._lons)
        && allclose(_lats, other._lats);
}

}   // namespace

std::ostream &operator<<(std::ostream &out, sphmesh::BBox const &bbox)
{
    out << "sphmesh.BBox<ellps=" << bbox.ellps()
        << ", c=" << bbox.c()
        << ", n_points=" << bbox.mesh().n_points()
        << ", n_cells=" << bbox.mesh().n_cells() << ">";
    return out;
}
