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
#include <array>
#include <cmath>
#include <memory>
#include <set>
#include <gtest/gtest.h>
#include <sphmesh/BBox.hpp>
#include <sphmesh/bridge.hpp>
#include <sphmesh/CGALKernel.hpp>
#include <sphmesh/common.hpp>
#include <sphmesh/panels.hpp>

using namespace sphmesh;

/** Deterministic kernel: a point is enclosed if its lon/lat lies
within a fixed box (boundary included).  Ignores the solid. */
class LonLatBoxKernel : public GeometryKernel {
    double lon0, lon1, lat0, lat1;
public:
    mutable int ncalls;
    mutable int nprepared;

    LonLatBoxKernel(double _lon0, double _lon1, double _lat0, double _lat1) :
        lon0(_lon0), lon1(_lon1), lat0(_lat0), lat1(_lat1), ncalls(0), nprepared(0) {}

    std::unique_ptr<PreparedSolid> prepare(Mesh const &solid, double tolerance) const
    {
        ++nprepared;
        return GeometryKernel::prepare(solid, tolerance);
    }

    std::vector<bool> select_enclosed(
        blitz::Array<double,2> const &points,
        Mesh const &solid,
        double tolerance) const
    {
        ++ncalls;
        double const eps = 1e-9;
        std::vector<bool> ret;
        for (int i=0; i<points.extent(0); ++i) {
            Point3 const p(points(i,0), points(i,1), points(i,2));
            double const r = std::sqrt(p.x*p.x + p.y*p.y + p.z*p.z);
            std::array<double,2> const ll(to_lonlat(p, r));
            ret.push_back(
                ll[0] >= lon0-eps && ll[0] <= lon1+eps &&
                ll[1] >= lat0-eps && ll[1] <= lat1+eps);
        }
        return ret;
    }

    std::vector<std::array<int,3>> triangulate_face(
        std::vector<Point3> const &polygon) const
    {
        std::vector<std::array<int,3>> ret;
        for (int k=1; k<(int)polygon.size()-1; ++k) ret.push_back({{0, k, k+1}});
        return ret;
    }
};

// The fixture for testing the enclosure query
class EnclosedTest : public ::testing::Test {
protected:
    BBox const bbox;
    Mesh surface;
    LonLatBoxKernel const box;

    // A global 10-degree grid: 36x18 faces, 37x19 points
    EnclosedTest() :
        bbox({-30., 30., 30., -30.}, {30., 30., -30., -30.}, ELLIPSE, 1., 2),
        box(-30., 30., -30., 30.)
    {
        std::vector<double> lons, lats;
        for (int lon=-180; lon<=180; lon += 10) lons.push_back(lon);
        for (int lat=-90; lat<=90; lat += 10) lats.push_back(lat);
        surface = Transform::from_1d(lons, lats);

        blitz::Array<double,1> fid(surface.n_faces());
        for (int i=0; i<fid.extent(0); ++i) fid(i) = i;
        surface.add_cell_data("fid", fid);

        blitz::Array<double,1> pid(surface.n_points());
        for (int i=0; i<pid.extent(0); ++i) pid(i) = i;
        surface.add_point_data("pid", pid);
    }

    virtual ~EnclosedTest() {}

    static std::set<long> face_ids(Mesh const &region)
    {
        std::set<long> ret;
        blitz::Array<double,1> const &fid(region.cell_data.at("fid"));
        for (int i=0; i<fid.extent(0); ++i) ret.insert((long)fid(i));
        return ret;
    }

    /** Face of the surface whose lower-left corner is (lon, lat) */
    static long face_at(int lon, int lat)
        { return ((lat + 90) / 10) * 36 + (lon + 180) / 10; }
};

TEST_F(EnclosedTest, point)
{
    Mesh const region(bbox.enclosed(surface, box, 0., false, Preference::POINT));
    EXPECT_EQ(8*8, region.n_faces());
    EXPECT_EQ(9*9, region.n_points());
    EXPECT_EQ(1, box.ncalls);

    std::set<long> const ids(face_ids(region));
    EXPECT_EQ(1, ids.count(face_at(-40, -40)));
    EXPECT_EQ(1, ids.count(face_at(30, 30)));
    EXPECT_EQ(0, ids.count(face_at(40, 0)));
}

TEST_F(EnclosedTest, cell)
{
    Mesh const region(bbox.enclosed(surface, box, 0., false, Preference::CELL));
    EXPECT_EQ(6*6, region.n_faces());
    EXPECT_EQ(7*7, region.n_points());
    // One classification of the points, then one per vertex slot,
    // all against the same prepared shell
    EXPECT_EQ(1 + 4, box.ncalls);
    EXPECT_EQ(1, box.nprepared);

    std::set<long> const ids(face_ids(region));
    EXPECT_EQ(1, ids.count(face_at(-30, -30)));
    EXPECT_EQ(1, ids.count(face_at(20, 20)));
    EXPECT_EQ(0, ids.count(face_at(30, 20)));
    EXPECT_EQ(0, ids.count(face_at(-40, 0)));
}

TEST_F(EnclosedTest, center)
{
    Mesh const region(bbox.enclosed(surface, box));
    EXPECT_EQ(6*6, region.n_faces());
    EXPECT_EQ(7*7, region.n_points());
    EXPECT_EQ(1, box.ncalls);
}

TEST_F(EnclosedTest, cell_subset_of_point)
{
    for (bool outside : {false, true}) {
        std::set<long> const cell(face_ids(bbox.enclosed(surface, box, 0., outside, Preference::CELL)));
        std::set<long> const point(face_ids(bbox.enclosed(surface, box, 0., outside, Preference::POINT)));
        EXPECT_LT(0, cell.size());
        EXPECT_LE(cell.size(), point.size());
        EXPECT_TRUE(std::includes(point.begin(), point.end(), cell.begin(), cell.end()));
    }
}

TEST_F(EnclosedTest, outside)
{
    long const total = surface.n_faces();
    EXPECT_EQ(36*18, total);

    Mesh const center(bbox.enclosed(surface, box, 0., true, Preference::CENTER));
    EXPECT_EQ(total - 6*6, center.n_faces());

    // Faces with at least one vertex outside
    Mesh const point(bbox.enclosed(surface, box, 0., true, Preference::POINT));
    EXPECT_EQ(total - 6*6, point.n_faces());

    // Faces with all vertices outside
    Mesh const cell(bbox.enclosed(surface, box, 0., true, Preference::CELL));
    EXPECT_EQ(total - 8*8, cell.n_faces());
}

TEST_F(EnclosedTest, data_preserved)
{
    Mesh const region(bbox.enclosed(surface, box, 0., false, Preference::CELL));
    ASSERT_EQ(1, region.point_data.count("pid"));
    blitz::Array<double,1> const &pid(region.point_data.at("pid"));
    ASSERT_EQ(region.n_points(), pid.extent(0));
    for (long i=0; i<region.n_points(); ++i) {
        long const orig = (long)pid(i);
        for (int d=0; d<3; ++d) EXPECT_EQ(surface.points(orig,d), region.points(i,d));
    }
    EXPECT_EQ(surface.string_fields, region.string_fields);
    EXPECT_EQ(surface.double_fields, region.double_fields);
}

TEST_F(EnclosedTest, mixed_faces)
{
    std::vector<double> const xs {0., 10., 10., 0., 20.};
    std::vector<double> const ys {0., 0., 10., 10., 0.};
    std::vector<std::vector<long>> const faces {{0, 1, 2, 3}, {1, 4, 2}};
    Mesh const mixed(Transform::from_unstructured(xs, ys, faces));

    EXPECT_EQ(2, bbox.enclosed(mixed, box, 0., false, Preference::POINT).n_faces());
    EXPECT_EQ(2, bbox.enclosed(mixed, box, 0., false, Preference::CENTER).n_faces());

    try {
        bbox.enclosed(mixed, box, 0., false, Preference::CELL);
        FAIL() << "Expected MixedFaceTypeError";
    } catch(MixedFaceTypeError const &exc) {
        std::string const what(exc.what());
        EXPECT_NE(std::string::npos, what.find("'center'"));
        EXPECT_NE(std::string::npos, what.find("'point'"));
    }

    // Nothing selected: no strict pass, so no error
    LonLatBoxKernel const far(100., 110., 0., 10.);
    EXPECT_EQ(0, bbox.enclosed(mixed, far, 0., false, Preference::CELL).n_faces());
}

// ------------------------------------------------------------
// Against a real shell, with the CGAL kernel
TEST_F(EnclosedTest, cgal_panel)
{
    BBox const africa(panel("africa", ELLIPSE, 1., 8));
    CGALKernel const kernel;

    Mesh const center(africa.enclosed(surface, kernel));
    std::set<long> const ids(face_ids(center));
    EXPECT_EQ(1, ids.count(face_at(0, 0)));
    EXPECT_EQ(1, ids.count(face_at(-40, -30)));
    EXPECT_EQ(0, ids.count(face_at(100, 0)));
    EXPECT_EQ(0, ids.count(face_at(0, 60)));
    EXPECT_EQ(0, ids.count(face_at(-60, 0)));

    // Face centers within the panel
    Mesh const centers(center.cell_centers());
    blitz::Array<double,2> const lls(to_lonlats(centers.points, calculate_radius(surface)));
    for (int i=0; i<lls.extent(0); ++i) {
        EXPECT_GE(45. + 1e-6, std::abs(lls(i,0)));
        EXPECT_GE(46., std::abs(lls(i,1)));
    }

    // Inside and outside partition the faces
    Mesh const outside(africa.enclosed(surface, kernel, 0., true));
    EXPECT_EQ(surface.n_faces(), center.n_faces() + outside.n_faces());

    std::set<long> const cell(face_ids(africa.enclosed(surface, kernel, 0., false, Preference::CELL)));
    std::set<long> const point(face_ids(africa.enclosed(surface, 0., false, Preference::POINT)));
    EXPECT_LT(0, cell.size());
    EXPECT_TRUE(std::includes(point.begin(), point.end(), cell.begin(), cell.end()));
    EXPECT_TRUE(std::includes(point.begin(), point.end(), ids.begin(), ids.end()));
}

TEST_F(EnclosedTest, cgal_tolerance)
{
    BBox const africa(panel("africa", ELLIPSE, 1., 8));
    CGALKernel const kernel;

    // (0,0) on the surface, and 0.1 beyond the outer layer's vertex there
    blitz::Array<double,2> points(2,3);
    points = 1.0, 0., 0.,
             1.2, 0., 0.;

    std::vector<bool> const strict(kernel.select_enclosed(points, africa.mesh(), 0.));
    EXPECT_TRUE(strict[0]);
    EXPECT_FALSE(strict[1]);

    // Bands are fractions of the shell's bounding-box diagonal
    std::array<double,6> const b(africa.mesh().bounds());
    double const diag = std::sqrt(
        (b[1]-b[0])*(b[1]-b[0]) + (b[3]-b[2])*(b[3]-b[2]) + (b[5]-b[4])*(b[5]-b[4]));
    double const narrow = 0.07 / diag;
    double const wide = 0.15 / diag;
    EXPECT_LT(wide, 0.1);

    std::vector<bool> const in_narrow(kernel.select_enclosed(points, africa.mesh(), narrow));
    EXPECT_TRUE(in_narrow[0]);
    EXPECT_FALSE(in_narrow[1]);

    std::vector<bool> const in_wide(kernel.select_enclosed(points, africa.mesh(), wide));
    EXPECT_TRUE(in_wide[0]);
    EXPECT_TRUE(in_wide[1]);

    // Same answers from one prepared shell, batch after batch
    std::unique_ptr<PreparedSolid> const prepared(kernel.prepare(africa.mesh(), wide));
    for (int pass=0; pass<2; ++pass)
        EXPECT_EQ(in_wide, prepared->select_enclosed(points));
}

TEST_F(EnclosedTest, cgal_wedge)
{
    // Corners meet at the poles: the shell has zero-area skirt faces
    BBox const w(wedge(-30., 30., ELLIPSE, 1., 8));
    CGALKernel const kernel;

    Mesh const center(w.enclosed(surface, kernel, 0.));
    std::set<long> const ids(face_ids(center));
    EXPECT_EQ(1, ids.count(face_at(0, 0)));
    EXPECT_EQ(1, ids.count(face_at(-10, 0)));
    EXPECT_EQ(1, ids.count(face_at(0, 70)));
    EXPECT_EQ(1, ids.count(face_at(0, 80)));
    EXPECT_EQ(1, ids.count(face_at(0, -90)));
    EXPECT_EQ(0, ids.count(face_at(90, 0)));
    EXPECT_EQ(0, ids.count(face_at(40, 0)));
    EXPECT_EQ(0, ids.count(face_at(-180, 0)));

    Mesh const outside(w.enclosed(surface, kernel, 0., true));
    EXPECT_EQ(surface.n_faces(), center.n_faces() + outside.n_faces());

    std::set<long> const cell(face_ids(w.enclosed(surface, kernel, 0., false, Preference::CELL)));
    std::set<long> const point(face_ids(w.enclosed(surface, kernel, 0., false, Preference::POINT)));
    EXPECT_LT(0, cell.size());
    EXPECT_TRUE(std::includes(point.begin(), point.end(), cell.begin(), cell.end()));
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
