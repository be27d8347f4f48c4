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
#include <cmath>
#include <limits>
#include <set>
#include <sphmesh/Mesh.hpp>

using namespace netCDF;

namespace sphmesh {

// ========================================================
CellArray CellArray::from_serialized(std::vector<long> const &data)
{
    CellArray ret;
    size_t i = 0;
    while (i < data.size()) {
        long n = data[i];
        if (n < 0 || i + 1 + n > data.size()) (*sphmesh_error)(-1,
            "Corrupt cell serialization at offset %ld (count=%ld, length=%ld)",
            (long)i, n, (long)data.size());
        ret.add(&data[i+1], n);
        i += n + 1;
    }
    return ret;
}

int CellArray::uniform_npoints() const
{
    if (empty()) return 0;
    int n = npoints(0);
    for (size_t i=1; i<size(); ++i)
        if (npoints(i) != n) return 0;
    return n;
}

long CellArray::max_id() const
{
    long ret = -1;
    for (size_t i=0; i<size(); ++i) {
        long const *ii = ids(i);
        for (int k=0; k<npoints(i); ++k) ret = std::max(ret, ii[k]);
    }
    return ret;
}

// ========================================================
Mesh::Mesh(blitz::Array<double,2> const &_points, CellArray &&_faces) :
    points(_points), faces(std::move(_faces))
{
    if (points.extent(1) != 3) (*sphmesh_error)(-1,
        "Mesh points must have shape (n,3), got (%d,%d)",
        points.extent(0), points.extent(1));
    if (faces.max_id() >= n_points()) (*sphmesh_error)(-1,
        "Face refers to point %ld, but the mesh has only %ld points",
        faces.max_id(), n_points());
}

Mesh &Mesh::operator=(Mesh const &rhs)
{
    if (this == &rhs) return *this;
    points.reference(rhs.points);
    faces = rhs.faces;
    lines = rhs.lines;
    point_data = rhs.point_data;
    cell_data = rhs.cell_data;
    string_fields = rhs.string_fields;
    double_fields = rhs.double_fields;
    return *this;
}

std::array<double,6> Mesh::bounds() const
{
    std::array<double,6> ret;
    if (n_points() == 0) {
        ret.fill(0);
        return ret;
    }
    for (int d=0; d<3; ++d) {
        ret[2*d] = std::numeric_limits<double>::infinity();
        ret[2*d+1] = -std::numeric_limits<double>::infinity();
    }
    for (long i=0; i<n_points(); ++i) {
        for (int d=0; d<3; ++d) {
            ret[2*d] = std::min(ret[2*d], points(i,d));
            ret[2*d+1] = std::max(ret[2*d+1], points(i,d));
        }
    }
    return ret;
}

void Mesh::add_point_data(std::string const &name, blitz::Array<double,1> const &data)
{
    if (data.extent(0) != n_points()) (*sphmesh_error)(-1,
        "Point data '%s' has %d values, the mesh has %ld points",
        name.c_str(), data.extent(0), n_points());
    point_data[name].reference(data);
}

void Mesh::add_cell_data(std::string const &name, blitz::Array<double,1> const &data)
{
    if (data.extent(0) != n_faces()) (*sphmesh_error)(-1,
        "Cell data '%s' has %d values, the mesh has %ld faces",
        name.c_str(), data.extent(0), n_faces());
    cell_data[name].reference(data);
}

Mesh Mesh::copy_structure() const
{
    Mesh ret;
    ret.points.reference(points);
    ret.faces = faces;
    ret.lines = lines;
    ret.string_fields = string_fields;
    ret.double_fields = double_fields;
    return ret;
}

// ------------------------------------------------------------
Mesh Mesh::cell_centers() const
{
    blitz::Array<double,2> centers(n_faces(), 3);
    centers = 0;
    for (size_t i=0; i<faces.size(); ++i) {
        long const *ids = faces.ids(i);
        int const n = faces.npoints(i);
        for (int k=0; k<n; ++k) {
            for (int d=0; d<3; ++d) centers(i,d) += points(ids[k],d);
        }
        for (int d=0; d<3; ++d) centers(i,d) /= (double)n;
    }

    Mesh ret;
    ret.points.reference(centers);
    for (auto ii=cell_data.begin(); ii != cell_data.end(); ++ii)
        ret.point_data[ii->first].reference(ii->second);
    ret.string_fields = string_fields;
    ret.double_fields = double_fields;
    return ret;
}

// ------------------------------------------------------------
/** Subsets data arrays to the entries for which keep_ix lists the old
index, in order. */
static void subset_data(
    std::map<std::string, blitz::Array<double,1>> const &src,
    std::vector<long> const &keep_ix,
    std::map<std::string, blitz::Array<double,1>> &dest)
{
    for (auto ii=src.begin(); ii != src.end(); ++ii) {
        blitz::Array<double,1> arr(keep_ix.size());
        for (size_t i=0; i<keep_ix.size(); ++i) arr(i) = ii->second(keep_ix[i]);
        dest[ii->first].reference(arr);
    }
}

Mesh Mesh::extract_cells(std::vector<bool> const &keep) const
{
    if (keep.size() != (size_t)n_faces()) (*sphmesh_error)(-1,
        "extract_cells() requires one flag per face: got %ld for %ld faces",
        (long)keep.size(), n_faces());

    // Mark the points used by the kept faces
    std::vector<long> new_ix(n_points(), -1);
    std::vector<long> kept_faces;
    for (size_t i=0; i<faces.size(); ++i) {
        if (!keep[i]) continue;
        kept_faces.push_back(i);
        long const *ids = faces.ids(i);
        for (int k=0; k<faces.npoints(i); ++k) new_ix[ids[k]] = 0;
    }

    // Renumber, keeping the original order
    std::vector<long> kept_points;
    for (long i=0; i<n_points(); ++i) {
        if (new_ix[i] < 0) continue;
        new_ix[i] = kept_points.size();
        kept_points.push_back(i);
    }

    blitz::Array<double,2> npoints(kept_points.size(), 3);
    for (size_t i=0; i<kept_points.size(); ++i)
        for (int d=0; d<3; ++d) npoints(i,d) = points(kept_points[i], d);

    CellArray nfaces;
    std::vector<long> vids;
    for (long i : kept_faces) {
        long const *ids = faces.ids(i);
        vids.clear();
        for (int k=0; k<faces.npoints(i); ++k) vids.push_back(new_ix[ids[k]]);
        nfaces.add(vids);
    }

    Mesh ret(npoints, std::move(nfaces));
    subset_data(point_data, kept_points, ret.point_data);
    subset_data(cell_data, kept_faces, ret.cell_data);
    ret.string_fields = string_fields;
    ret.double_fields = double_fields;
    return ret;
}

Mesh Mesh::extract_cells_by_point_mask(std::vector<bool> const &selected) const
{
    if (selected.size() != (size_t)n_points()) (*sphmesh_error)(-1,
        "Point mask has %ld values for %ld points",
        (long)selected.size(), n_points());

    std::vector<bool> keep(n_faces(), false);
    for (size_t i=0; i<faces.size(); ++i) {
        long const *ids = faces.ids(i);
        for (int k=0; k<faces.npoints(i); ++k) {
            if (selected[ids[k]]) {
                keep[i] = true;
                break;
            }
        }
    }
    return extract_cells(keep);
}

// ------------------------------------------------------------
/** Maps each point to the first point within tolerance of it. */
static std::vector<long> merge_points(blitz::Array<double,2> const &points, double tolerance)
{
    long const n = points.extent(0);
    std::vector<long> ret(n);

    if (tolerance <= 0) {
        std::map<std::array<double,3>, long> seen;
        for (long i=0; i<n; ++i) {
            std::array<double,3> key = {{points(i,0), points(i,1), points(i,2)}};
            auto ii = seen.insert(std::make_pair(key, i));
            ret[i] = ii.first->second;
        }
        return ret;
    }

    // Bucket points on a grid of spacing tolerance; a match can only
    // be in the neighbouring 27 buckets.
    double const tol2 = tolerance * tolerance;
    std::map<std::array<long,3>, std::vector<long>> buckets;
    for (long i=0; i<n; ++i) {
        std::array<long,3> key;
        for (int d=0; d<3; ++d) key[d] = (long)std::floor(points(i,d) / tolerance);

        long match = -1;
        for (int dx=-1; dx<=1 && match<0; ++dx)
        for (int dy=-1; dy<=1 && match<0; ++dy)
        for (int dz=-1; dz<=1 && match<0; ++dz) {
            std::array<long,3> nkey = {{key[0]+dx, key[1]+dy, key[2]+dz}};
            auto ii = buckets.find(nkey);
            if (ii == buckets.end()) continue;
            for (long j : ii->second) {
                double d2 = 0;
                for (int d=0; d<3; ++d) {
                    double const delta = points(i,d) - points(j,d);
                    d2 += delta*delta;
                }
                if (d2 <= tol2) {
                    match = j;
                    break;
                }
            }
        }

        if (match < 0) {
            buckets[key].push_back(i);
            ret[i] = i;
        } else {
            ret[i] = match;
        }
    }
    return ret;
}

/** Replaces ids through the merge map and drops consecutive repeats
(including the wrap-around from last to first). */
static void merged_ids(long const *ids, int n, std::vector<long> const &merge,
    bool closed, std::vector<long> &out)
{
    out.clear();
    for (int k=0; k<n; ++k) {
        long id = merge[ids[k]];
        if (out.empty() || out.back() != id) out.push_back(id);
    }
    if (closed) {
        while (out.size() > 1 && out.front() == out.back()) out.pop_back();
    }
}

Mesh Mesh::clean(double tolerance) const
{
    std::vector<long> merge(merge_points(points, tolerance));

    // Faces and lines on the merged points, dropping the degenerate
    CellArray mfaces, mlines;
    std::vector<long> kept_faces;
    std::vector<long> vids;
    for (size_t i=0; i<faces.size(); ++i) {
        merged_ids(faces.ids(i), faces.npoints(i), merge, true, vids);
        if (std::set<long>(vids.begin(), vids.end()).size() < 3) continue;
        mfaces.add(vids);
        kept_faces.push_back(i);
    }
    for (size_t i=0; i<lines.size(); ++i) {
        merged_ids(lines.ids(i), lines.npoints(i), merge, false, vids);
        if (vids.size() < 2) continue;
        mlines.add(vids);
    }

    // Drop unused points
    std::vector<long> new_ix(n_points(), -1);
    for (CellArray const *cells : {&mfaces, &mlines}) {
        for (size_t i=0; i<cells->size(); ++i) {
            long const *ids = cells->ids(i);
            for (int k=0; k<cells->npoints(i); ++k) new_ix[ids[k]] = 0;
        }
    }
    std::vector<long> kept_points;
    for (long i=0; i<n_points(); ++i) {
        if (new_ix[i] < 0) continue;
        new_ix[i] = kept_points.size();
        kept_points.push_back(i);
    }

    blitz::Array<double,2> npoints(kept_points.size(), 3);
    for (size_t i=0; i<kept_points.size(); ++i)
        for (int d=0; d<3; ++d) npoints(i,d) = points(kept_points[i], d);

    CellArray nfaces, nlines;
    for (auto pair : {std::make_pair(&mfaces, &nfaces), std::make_pair(&mlines, &nlines)}) {
        CellArray const &src(*pair.first);
        for (size_t i=0; i<src.size(); ++i) {
            long const *ids = src.ids(i);
            vids.clear();
            for (int k=0; k<src.npoints(i); ++k) vids.push_back(new_ix[ids[k]]);
            pair.second->add(vids);
        }
    }

    Mesh ret(npoints, std::move(nfaces));
    ret.lines = std::move(nlines);
    subset_data(point_data, kept_points, ret.point_data);
    subset_data(cell_data, kept_faces, ret.cell_data);
    ret.string_fields = string_fields;
    ret.double_fields = double_fields;
    return ret;
}

// ------------------------------------------------------------
static NcDim get_or_add_dim(NcGroup *nc, std::string const &name, size_t len)
{
    NcDim dim = nc->getDim(name);
    if (dim.isNull()) dim = nc->addDim(name, len);
    return dim;
}

static void nc_write_cells(NcGroup *nc, std::string const &vname,
    CellArray const &cells)
{
    std::vector<long> const &data(cells.serialized());
    if (data.empty()) return;
    NcDim len_d = get_or_add_dim(nc, vname + "_len", data.size());
    NcVar var = nc->addVar(vname, ncInt64, len_d);
    var.putVar(data.data());
}

void Mesh::nc_write(netCDF::NcGroup *nc, std::string const &vname) const
{
    if (verbose) fprintf(stderr, "BEGIN Mesh::nc_write(%s)\n", vname.c_str());

    // ---------- Field metadata, as attributes of an info variable
    NcVar info_v = nc->addVar(vname + ".info", ncInt);
    info_v.putAtt("n_points", ncInt64, (long long)n_points());
    for (auto ii=string_fields.begin(); ii != string_fields.end(); ++ii)
        info_v.putAtt(ii->first, ii->second);
    for (auto ii=double_fields.begin(); ii != double_fields.end(); ++ii)
        info_v.putAtt(ii->first, ncDouble, ii->second);

    // ---------- Points
    if (n_points() > 0) {
        NcDim npoints_d = get_or_add_dim(nc, vname + ".n_points", n_points());
        NcDim three_d = get_or_add_dim(nc, "three", 3);
        NcVar points_v = nc->addVar(vname + ".points", ncDouble, {npoints_d, three_d});

        // Copy, points may not be contiguous
        blitz::Array<double,2> cpoints(points.copy());
        points_v.putVar(cpoints.data());

        for (auto ii=point_data.begin(); ii != point_data.end(); ++ii) {
            NcVar var = nc->addVar(vname + ".point_data." + ii->first, ncDouble, npoints_d);
            blitz::Array<double,1> data(ii->second.copy());
            var.putVar(data.data());
        }
    }

    // ---------- Faces and lines
    nc_write_cells(nc, vname + ".faces", faces);
    nc_write_cells(nc, vname + ".lines", lines);

    if (n_faces() > 0) {
        NcDim nfaces_d = get_or_add_dim(nc, vname + ".n_faces", n_faces());
        for (auto ii=cell_data.begin(); ii != cell_data.end(); ++ii) {
            NcVar var = nc->addVar(vname + ".cell_data." + ii->first, ncDouble, nfaces_d);
            blitz::Array<double,1> data(ii->second.copy());
            var.putVar(data.data());
        }
    }
    if (verbose) fprintf(stderr, "END Mesh::nc_write(%s)\n", vname.c_str());
}

// ------------------------------------------------------------
static size_t nc_var_size(NcVar const &var, int dim)
{
    std::vector<NcDim> dims(var.getDims());
    return dims[dim].getSize();
}

static CellArray nc_read_cells(NcGroup *nc, std::string const &vname)
{
    NcVar var = nc->getVar(vname);
    if (var.isNull()) return CellArray();

    std::vector<long> data(nc_var_size(var, 0));
    var.getVar(data.data());
    return CellArray::from_serialized(data);
}

/** @param vname Eg: "mesh" or "bbox" */
void Mesh::nc_read(netCDF::NcGroup *nc, std::string const &vname)
{
    *this = Mesh();

    NcVar info_v = nc->getVar(vname + ".info");
    if (info_v.isNull()) (*sphmesh_error)(-1,
        "No mesh named '%s' in the netCDF group", vname.c_str());

    // ---------- Field metadata
    std::map<std::string, NcVarAtt> atts(info_v.getAtts());
    for (auto ii=atts.begin(); ii != atts.end(); ++ii) {
        if (ii->first == "n_points") continue;
        NcVarAtt &att(ii->second);
        if (att.getType() == ncChar) {
            std::string val;
            att.getValues(val);
            string_fields[ii->first] = val;
        } else if (att.getType() == ncDouble) {
            double val;
            att.getValues(&val);
            double_fields[ii->first] = val;
        }
    }

    // ---------- Points
    NcVar points_v = nc->getVar(vname + ".points");
    if (!points_v.isNull()) {
        blitz::Array<double,2> npoints(nc_var_size(points_v, 0), 3);
        points_v.getVar(npoints.data());
        points.reference(npoints);
    }

    faces = nc_read_cells(nc, vname + ".faces");
    lines = nc_read_cells(nc, vname + ".lines");

    // ---------- Data arrays
    std::string const point_prefix(vname + ".point_data.");
    std::string const cell_prefix(vname + ".cell_data.");
    std::multimap<std::string, NcVar> vars(nc->getVars());
    for (auto ii=vars.begin(); ii != vars.end(); ++ii) {
        std::string const &name(ii->first);
        if (name.compare(0, point_prefix.size(), point_prefix) == 0) {
            blitz::Array<double,1> data(nc_var_size(ii->second, 0));
            ii->second.getVar(data.data());
            add_point_data(name.substr(point_prefix.size()), data);
        } else if (name.compare(0, cell_prefix.size(), cell_prefix) == 0) {
            blitz::Array<double,1> data(nc_var_size(ii->second, 0));
            ii->second.getVar(data.data());
            add_cell_data(name.substr(cell_prefix.size()), data);
        }
    }
}

}   // namespace

std::ostream &operator<<(std::ostream &out, sphmesh::Mesh const &mesh)
{
    out << "Mesh(n_points=" << mesh.n_points()
        << ", n_faces=" << mesh.n_faces()
        << ", n_lines=" << mesh.n_lines() << ")";
    return out;
}
