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
#include <string>
#include <gtest/gtest.h>
#include <sphmesh/bridge.hpp>
#include <sphmesh/common.hpp>
#include <sphmesh/Proj2.hpp>

using namespace sphmesh;
using namespace blitz;

// The fixture for testing Transform
class BridgeTest : public ::testing::Test {
protected:
    std::vector<double> const xs;
    std::vector<double> const ys;
    TransformParams unit;

    // 3x2 points, 2x1 faces
    BridgeTest() : xs({0., 1., 2.}), ys({0., 1.})
        { unit.radius = 1.; }

    virtual ~BridgeTest() {}

    static void expect_face(Mesh const &mesh, long i, std::vector<long> const &expected)
    {
        ASSERT_EQ(expected.size(), mesh.faces.npoints(i));
        long const *ids = mesh.faces.ids(i);
        for (size_t k=0; k<expected.size(); ++k) EXPECT_EQ(expected[k], ids[k]);
    }

    static double norm(Mesh const &mesh, long i)
    {
        return std::sqrt(
            mesh.points(i,0)*mesh.points(i,0) +
            mesh.points(i,1)*mesh.points(i,1) +
            mesh.points(i,2)*mesh.points(i,2));
    }
};

// ------------------------------------------------------------
TEST_F(BridgeTest, from_1d)
{
    Mesh const mesh(Transform::from_1d(xs, ys, unit));
    EXPECT_EQ(6, mesh.n_points());
    EXPECT_EQ(2, mesh.n_faces());
    EXPECT_EQ(0, mesh.n_lines());
    expect_face(mesh, 0, {3, 4, 1, 0});
    expect_face(mesh, 1, {4, 5, 2, 1});

    EXPECT_EQ(WGS84_WKT, mesh.string_fields.at(GV_FIELD_CRS));
    EXPECT_EQ(1., mesh.double_fields.at(GV_FIELD_RADIUS));
    EXPECT_EQ(0, mesh.string_fields.count(GV_FIELD_NAME));

    // Point 4 is (lon 1, lat 1)
    std::array<double,2> const ll(to_lonlat(
        Point3(mesh.points(4,0), mesh.points(4,1), mesh.points(4,2)), 1.));
    EXPECT_NEAR(1., ll[0], 1e-12);
    EXPECT_NEAR(1., ll[1], 1e-12);
}

TEST_F(BridgeTest, from_1d_bounds)
{
    Array<double,2> bxs(2,2);
    bxs = 0., 1.,
          1., 2.;
    Array<double,2> bys(1,2);
    bys = 0., 1.;

    Mesh const mesh(Transform::from_1d(bxs, bys, unit));
    Mesh const expected(Transform::from_1d(xs, ys, unit));
    ASSERT_EQ(expected.n_points(), mesh.n_points());
    for (long i=0; i<mesh.n_points(); ++i)
    for (int d=0; d<3; ++d)
        EXPECT_EQ(expected.points(i,d), mesh.points(i,d));
    EXPECT_EQ(expected.faces, mesh.faces);

    Array<double,2> gappy(2,2);
    gappy = 0., 1.,
            1.5, 2.;
    EXPECT_THROW(Transform::from_1d(gappy, bys), NonContiguousBoundsError);

    Array<double,2> wide(2,3);
    wide = 0.;
    EXPECT_THROW(Transform::from_1d(wide, bys), ShapeMismatchError);

    EXPECT_THROW(Transform::from_1d(std::vector<double>{0.}, ys), InsufficientGeometryError);
    EXPECT_THROW(Transform::from_1d(xs, std::vector<double>{0.}), InsufficientGeometryError);
}

TEST_F(BridgeTest, from_2d)
{
    Array<double,2> mxs(2,3), mys(2,3);
    mxs = 0., 1., 2.,
          0., 1., 2.;
    mys = 0., 0., 0.,
          1., 1., 1.;
    Mesh const mesh(Transform::from_2d(mxs, mys, unit));
    EXPECT_EQ(6, mesh.n_points());
    expect_face(mesh, 0, {3, 4, 1, 0});

    Array<double,2> bad(3,2);
    bad = 0.;
    EXPECT_THROW(Transform::from_2d(mxs, bad), ShapeMismatchError);

    Array<double,2> thin(1,3);
    thin = 0.;
    EXPECT_THROW(Transform::from_2d(thin, thin), InsufficientGeometryError);
}

TEST_F(BridgeTest, from_2d_corners)
{
    // Two faces sharing an edge, corners stored per face
    double const qx[4] = {0., 1., 1., 0.};
    double const qy[4] = {0., 0., 1., 1.};
    Array<double,3> cxs(1,2,4), cys(1,2,4);
    for (int j=0; j<2; ++j) {
        for (int k=0; k<4; ++k) {
            cxs(0,j,k) = qx[k] + j;
            cys(0,j,k) = qy[k];
        }
    }

    Mesh const mesh(Transform::from_2d(cxs, cys, unit));
    EXPECT_EQ(8, mesh.n_points());
    EXPECT_EQ(2, mesh.n_faces());
    expect_face(mesh, 0, {0, 1, 2, 3});
    expect_face(mesh, 1, {4, 5, 6, 7});

    TransformParams params(unit);
    params.clean = true;
    Mesh const cleaned(Transform::from_2d(cxs, cys, params));
    EXPECT_EQ(6, cleaned.n_points());
    EXPECT_EQ(2, cleaned.n_faces());

    Array<double,3> three(1,2,3);
    three = 0.;
    EXPECT_THROW(Transform::from_2d(three, three), ShapeMismatchError);
}

// ------------------------------------------------------------
TEST_F(BridgeTest, from_unstructured)
{
    std::vector<double> const uxs {0., 1., 1., 0.};
    std::vector<double> const uys {0., 0., 1., 1.};

    Array<long,2> conn(2,3);
    conn = 0, 1, 2,
           0, 2, 3;
    Mesh const mesh(Transform::from_unstructured(uxs, uys, conn, unit));
    EXPECT_EQ(4, mesh.n_points());
    EXPECT_EQ(2, mesh.n_faces());
    expect_face(mesh, 1, {0, 2, 3});

    // Ragged connectivity
    std::vector<double> const rxs {0., 1., 1., 0., 2.};
    std::vector<double> const rys {0., 0., 1., 1., 0.};
    std::vector<std::vector<long>> const ragged {{0, 1, 2, 3}, {1, 4, 2}};
    Mesh const mixed(Transform::from_unstructured(rxs, rys, ragged, unit));
    EXPECT_EQ(2, mixed.n_faces());
    EXPECT_EQ(0, mixed.faces.uniform_npoints());
    expect_face(mixed, 1, {1, 4, 2});
}

TEST_F(BridgeTest, start_index)
{
    std::vector<double> const uxs {0., 1., 1., 0.};
    std::vector<double> const uys {0., 0., 1., 1.};

    // One-based, inferred
    Array<long,2> conn(2,3);
    conn = 1, 2, 3,
           1, 3, 4;
    Mesh const mesh(Transform::from_unstructured(uxs, uys, conn, unit));
    expect_face(mesh, 0, {0, 1, 2});
    expect_face(mesh, 1, {0, 2, 3});

    // One-based, explicit
    TransformParams params(unit);
    params.start_index = 1;
    EXPECT_EQ(mesh.faces,
        Transform::from_unstructured(uxs, uys, conn, params).faces);

    // Explicit zero-based with a one-based array is out of range
    params.start_index = 0;
    EXPECT_THROW(Transform::from_unstructured(uxs, uys, conn, params), ShapeMismatchError);

    params.start_index = 2;
    EXPECT_THROW(Transform::from_unstructured(uxs, uys, conn, params), InvalidStartIndexError);

    Array<long,2> base2(1,3);
    base2 = 2, 3, 4;
    std::vector<double> const fxs {0., 1., 1., 0., 2.};
    std::vector<double> const fys {0., 0., 1., 1., 0.};
    EXPECT_THROW(Transform::from_unstructured(fxs, fys, base2), InvalidStartIndexError);
}

TEST_F(BridgeTest, shape)
{
    std::vector<double> const uxs {0., 1., 1., 0., 1., 2., 2., 1.};
    std::vector<double> const uys {0., 0., 1., 1., 0., 0., 1., 1.};

    Mesh const mesh(Transform::from_unstructured(uxs, uys, Shape(2, 4), unit));
    expect_face(mesh, 1, {4, 5, 6, 7});

    EXPECT_THROW(Transform::from_unstructured(uxs, uys, Shape(3, 4)), ShapeMismatchError);
    EXPECT_THROW(Transform::from_unstructured(uxs, uys, Shape(4, 2)), DegenerateFaceError);

    // (M,N) x/y values
    Array<double,2> mxs(2,4), mys(2,4);
    mxs = 0., 1., 1., 0.,
          1., 2., 2., 1.;
    mys = 0., 0., 1., 1.,
          0., 0., 1., 1.;
    EXPECT_EQ(mesh.faces, Transform::from_unstructured(mxs, mys, unit).faces);
}

TEST_F(BridgeTest, unstructured_errors)
{
    std::vector<double> const uxs {0., 1., 1.};
    std::vector<double> const uys {0., 0., 1.};

    Array<long,2> two(1,2);
    two = 0, 1;
    EXPECT_THROW(Transform::from_unstructured(uxs, uys, two), DegenerateFaceError);

    std::vector<std::vector<long>> const ragged {{0, 1, 2}, {0, 1}};
    EXPECT_THROW(Transform::from_unstructured(uxs, uys, ragged), DegenerateFaceError);

    Array<long,2> tri(1,3);
    tri = 0, 1, 2;
    EXPECT_THROW(Transform::from_unstructured(
        std::vector<double>{0., 1.}, std::vector<double>{0., 0.}, tri),
        InsufficientGeometryError);
    EXPECT_THROW(Transform::from_unstructured(
        uxs, std::vector<double>{0., 0.}, tri),
        ShapeMismatchError);
}

TEST_F(BridgeTest, error_messages)
{
    Array<double,2> xs(2,3), ys(3,2);
    xs = 0.;
    ys = 0.;
    try {
        Transform::from_2d(xs, ys);
        FAIL() << "expected a ShapeMismatchError";
    } catch (Exception const &exp) {
        EXPECT_NE(nullptr, dynamic_cast<ShapeMismatchError const *>(&exp));
        EXPECT_EQ(std::string("Require x-values and y-values with the same shape, "
            "got (2,3) and (3,2)"), exp.what());
    }

    // Every validation error is a sphmesh::Exception
    EXPECT_THROW(throw InvalidPanelError(boost::format("panel %d") % 7), Exception);
    EXPECT_THROW(throw MixedFaceTypeError(std::string("mixed")), Exception);
    EXPECT_THROW(throw ProjectionError(std::string("bad crs")), Exception);
    EXPECT_EQ(std::string("panel 7"),
        InvalidPanelError(boost::format("panel %d") % 7).what());
    std::string const msg("wedge");
    EXPECT_EQ(msg, InvalidWedgeError(msg).what());
}

// ------------------------------------------------------------
TEST_F(BridgeTest, poles)
{
    Mesh const mesh(Transform::from_1d(
        std::vector<double>{0., 10.},
        std::vector<double>{-90., -80.}, unit));

    // Both points on the south pole collapse to longitude zero
    for (int d=0; d<3; ++d) EXPECT_EQ(mesh.points(0,d), mesh.points(1,d));
    EXPECT_EQ(0., mesh.points(0,1));
    EXPECT_DOUBLE_EQ(-1., mesh.points(0,2));
}

TEST_F(BridgeTest, radius)
{
    TransformParams params;
    params.radius = 2.;
    params.zlevel = 10;
    Mesh const mesh(Transform::from_1d(xs, ys, params));
    EXPECT_DOUBLE_EQ(2.02, mesh.double_fields.at(GV_FIELD_RADIUS));
    for (long i=0; i<mesh.n_points(); ++i) EXPECT_DOUBLE_EQ(2.02, norm(mesh, i));

    params.radius = -3.;
    params.zlevel = 0;
    Mesh const neg(Transform::from_1d(xs, ys, params));
    EXPECT_DOUBLE_EQ(3., neg.double_fields.at(GV_FIELD_RADIUS));
    EXPECT_DOUBLE_EQ(3., norm(neg, 0));

    Mesh const dflt(Transform::from_1d(xs, ys));
    EXPECT_DOUBLE_EQ(RADIUS, norm(dflt, 5));
}

TEST_F(BridgeTest, wrap)
{
    Mesh const a(Transform::from_1d(std::vector<double>{190., 200.}, ys, unit));
    Mesh const b(Transform::from_1d(std::vector<double>{-170., -160.}, ys, unit));
    for (long i=0; i<a.n_points(); ++i)
    for (int d=0; d<3; ++d)
        EXPECT_NEAR(b.points(i,d), a.points(i,d), 1e-12);
}

// ------------------------------------------------------------
TEST_F(BridgeTest, data)
{
    Array<double,1> cells(2);
    cells = 1., 2.;
    MeshData const cdata(cells);
    Mesh const c(Transform::from_1d(xs, ys, unit, &cdata));
    EXPECT_EQ(DEFAULT_NAME_CELLS, c.string_fields.at(GV_FIELD_NAME));
    ASSERT_EQ(1, c.cell_data.count(DEFAULT_NAME_CELLS));
    EXPECT_EQ(2., c.cell_data.at(DEFAULT_NAME_CELLS)(1));
    EXPECT_EQ(0, c.point_data.size());

    Array<double,1> points(6);
    points = 0.;
    MeshData const pdata(points);
    Mesh const p(Transform::from_1d(xs, ys, unit, &pdata));
    EXPECT_EQ(DEFAULT_NAME_POINTS, p.string_fields.at(GV_FIELD_NAME));
    EXPECT_EQ(1, p.point_data.count(DEFAULT_NAME_POINTS));

    MeshData const named(cells, "temperature");
    Mesh const n(Transform::from_1d(xs, ys, unit, &named));
    EXPECT_EQ("temperature", n.string_fields.at(GV_FIELD_NAME));
    EXPECT_EQ(1, n.cell_data.count("temperature"));

    Array<double,1> wrong(5);
    wrong = 0.;
    MeshData const bad(wrong);
    EXPECT_THROW(Transform::from_1d(xs, ys, unit, &bad), DataSizeMismatchError);
}

TEST_F(BridgeTest, data_mask)
{
    Array<int,1> ivals(2);
    ivals = 3, 4;
    Array<bool,1> mask(2);
    mask = false, true;
    MeshData const data(ivals, "", mask);

    Mesh const mesh(Transform::from_1d(xs, ys, unit, &data));
    Array<double,1> const &vals(mesh.cell_data.at(DEFAULT_NAME_CELLS));
    EXPECT_EQ(3., vals(0));
    EXPECT_TRUE(std::isnan(vals(1)));
}

// ------------------------------------------------------------
TEST_F(BridgeTest, instance)
{
    Input1D in {AxisBounds(xs), AxisBounds(ys)};
    Transform const transform(in, unit);
    EXPECT_EQ(6, transform.n_points());
    EXPECT_EQ(2, transform.n_cells());

    Mesh const bare(transform());
    EXPECT_EQ(0, bare.cell_data.size());
    EXPECT_EQ(WGS84_WKT, bare.string_fields.at(GV_FIELD_CRS));

    Array<double,1> cells(2);
    cells = 5., 6.;
    Mesh const first(transform(MeshData(cells, "a")));
    cells = 7., 8.;
    Mesh const second(transform(MeshData(cells, "b")));
    EXPECT_EQ(1, first.cell_data.count("a"));
    EXPECT_EQ(0, first.cell_data.count("b"));
    EXPECT_EQ("b", second.string_fields.at(GV_FIELD_NAME));
    EXPECT_EQ(first.faces, second.faces);

    Array<double,1> wrong(3);
    wrong = 0.;
    EXPECT_THROW(transform(MeshData(wrong)), DataSizeMismatchError);

    InputUnstructured un {{0., 1., 1.}, {0., 0., 1.}, Shape(1, 3)};
    EXPECT_EQ(1, Transform(un).n_cells());
}

TEST_F(BridgeTest, projection)
{
    std::vector<double> const mxs {0., 100000., 0.};
    std::vector<double> const mys {0., 0., 100000.};

    TransformParams params(unit);
    params.crs = "+proj=merc +ellps=WGS84";
    Mesh const mesh(Transform::from_unstructured(mxs, mys, Shape(1, 3), params));
    EXPECT_NEAR(1., mesh.points(0,0), 1e-9);
    EXPECT_NEAR(0., mesh.points(0,1), 1e-9);
    EXPECT_NEAR(0., mesh.points(0,2), 1e-9);
    EXPECT_LT(0., mesh.points(1,1));    // East of Greenwich
    EXPECT_LT(0., mesh.points(2,2));    // North of the equator

    params.crs = "+proj=nonsense";
    EXPECT_THROW(Transform::from_unstructured(mxs, mys, Shape(1, 3), params), ProjectionError);
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
