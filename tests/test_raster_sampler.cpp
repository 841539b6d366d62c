// tests/test_raster_sampler.cpp (doctest)
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "core/CoordinateReprojector.hpp"
#include "core/RasterSampler.hpp"

#include <cmath>

using namespace hydromesh;
using hydromesh_test::rect;

namespace raster_sampler_test {

// 3x3 grid over [0,3] x [0,3], values 1..9 row by row from the top
Raster grid(std::optional<double> nodata = -9999.0) {
    Raster raster;
    raster.profile.geotransform = {0.0, 1.0, 0.0, 3.0, 0.0, -1.0};
    raster.profile.width = 3;
    raster.profile.height = 3;
    raster.profile.nodata = nodata;
    raster.data = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    return raster;
}

} // namespace raster_sampler_test

using raster_sampler_test::grid;

TEST_CASE("parse_interpolation") {
    CHECK(parse_interpolation("nearest") == Interpolation::Nearest);
    CHECK(parse_interpolation("Bilinear") == Interpolation::Bilinear);
    CHECK(parse_interpolation("piecewise bilinear") == Interpolation::Bilinear);
    CHECK_THROWS_AS(parse_interpolation("cubic"), RasterError);
}

TEST_CASE("nearest sampling returns the containing pixel") {
    const Raster raster = grid();
    CHECK(RasterSampler::sample_nearest(raster, {0.5, 2.5}) == 1.0);
    CHECK(RasterSampler::sample_nearest(raster, {1.2, 1.7}) == 5.0);
    CHECK(RasterSampler::sample_nearest(raster, {2.9, 0.1}) == 9.0);
}

TEST_CASE("nearest sampling outside the grid returns nodata") {
    CHECK(RasterSampler::sample_nearest(grid(), {3.5, 1.0}) == -9999.0);
    CHECK(RasterSampler::sample_nearest(grid(), {1.0, -0.5}) == -9999.0);
    CHECK(std::isnan(RasterSampler::sample_nearest(grid(std::nullopt), {-1.0, 1.0})));
}

TEST_CASE("bilinear sampling") {
    const Raster raster = grid();
    SUBCASE("exact at pixel centres") {
        CHECK(RasterSampler::sample_bilinear(raster, {1.5, 1.5}) == 5.0);
        CHECK(RasterSampler::sample_bilinear(raster, {0.5, 2.5}) == 1.0);
    }
    SUBCASE("interpolates between centres") {
        CHECK(RasterSampler::sample_bilinear(raster, {1.0, 2.0}) == doctest::Approx(3.0));
        CHECK(RasterSampler::sample_bilinear(raster, {2.0, 1.5}) == doctest::Approx(5.5));
    }
    SUBCASE("clamps at the edges") {
        CHECK(RasterSampler::sample_bilinear(raster, {0.1, 2.9}) == doctest::Approx(1.0));
        CHECK(RasterSampler::sample_bilinear(raster, {2.9, 0.1}) == doctest::Approx(9.0));
    }
}

TEST_CASE("bilinear sampling is exact at the pixel centres of a geographic DEM") {
    // One arc-second tile corner, as SRTM-style DEMs are georeferenced
    Raster raster;
    raster.profile.geotransform = {-84.00013888889, 0.000277777777778, 0.0,
                                   36.00013888889, 0.0, -0.000277777777778};
    raster.profile.width = 4;
    raster.profile.height = 4;
    raster.profile.nodata = -9999.0;
    for (int i = 0; i < 16; ++i) {
        raster.data.push_back(550.0 + 8.6 * i);
    }
    raster.data[2] = 567.2;

    const auto& gt = raster.profile.geotransform;
    for (int row = 0; row < 4; ++row) {
        for (int col = 0; col < 4; ++col) {
            const Point2D centre(gt[0] + (col + 0.5) * gt[1], gt[3] + (row + 0.5) * gt[5]);
            CAPTURE(row);
            CAPTURE(col);
            CHECK(RasterSampler::sample_bilinear(raster, centre) == raster.at(row, col));
        }
    }
}

TEST_CASE("values_from_raster and elevate") {
    OgrReprojector reprojector;
    RasterSampler sampler(reprojector);
    const Raster raster = grid();

    std::vector<double> values = sampler.values_from_raster({{0.5, 2.5}, {2.5, 0.5}, {5.0, 5.0}}, "",
                                                            raster, Interpolation::Nearest);
    REQUIRE(values.size() == 3);
    CHECK(values[0] == 1.0);
    CHECK(values[1] == 9.0);
    CHECK(values[2] == -9999.0);

    Mesh2D mesh;
    mesh.vertices = {{0.5, 0.5}, {2.5, 0.5}, {1.5, 2.5}};
    mesh.triangles = {TriangleIndices{0, 1, 2}};
    Mesh3D elevated = sampler.elevate(mesh, "", raster, Interpolation::Bilinear);
    REQUIRE(elevated.num_vertices() == 3);
    CHECK(elevated.triangles == mesh.triangles);
    CHECK(elevated.vertices[0].z() == doctest::Approx(7.0));
    CHECK(elevated.vertices[1].z() == doctest::Approx(9.0));
    CHECK(elevated.vertices[2].z() == doctest::Approx(2.0));
    CHECK(elevated.vertices[2].x() == 1.5);
}

TEST_CASE("values_from_raster rejects data that does not match the profile") {
    OgrReprojector reprojector;
    RasterSampler sampler(reprojector);
    Raster raster = grid();
    raster.data.pop_back();
    CHECK_THROWS_AS(sampler.values_from_raster({{1, 1}}, "", raster, Interpolation::Nearest), RasterError);
}

TEST_CASE("color_raster_from_shapes paints in order") {
    Raster colored = RasterSampler::color_raster_from_shapes(
        BoundingBox(0, 0, 12, 10), 1.0, {rect(0, 0, 10, 10), rect(0, 0, 5, 5)}, {1.0, 2.0}, "", -1.0);

    CHECK(colored.profile.width == 12);
    CHECK(colored.profile.height == 10);
    REQUIRE(colored.profile.nodata.has_value());
    CHECK(*colored.profile.nodata == -1.0);

    CHECK(RasterSampler::sample_nearest(colored, {2.5, 2.5}) == 2.0);
    CHECK(RasterSampler::sample_nearest(colored, {8.5, 8.5}) == 1.0);
    CHECK(RasterSampler::sample_nearest(colored, {11.5, 5.5}) == -1.0);
}

TEST_CASE("color_raster_from_shapes grows bounds to whole pixels") {
    Raster colored = RasterSampler::color_raster_from_shapes(
        BoundingBox(0.3, 0.3, 9.7, 9.7), 2.0, {rect(0, 0, 10, 10)}, {7.0}, "", -1.0);
    const BoundingBox box = colored.bounds();
    CHECK(box.min_x <= 0.3);
    CHECK(box.min_y <= 0.3);
    CHECK(box.max_x >= 9.7);
    CHECK(box.max_y >= 9.7);
    CHECK(colored.profile.width == 5);
}

TEST_CASE("color_raster_from_shapes checks its inputs") {
    CHECK_THROWS_AS(RasterSampler::color_raster_from_shapes(BoundingBox(0, 0, 1, 1), 1.0, {rect(0, 0, 1, 1)},
                                                            {}, "", -1.0),
                    RasterError);
    CHECK_THROWS_AS(RasterSampler::color_raster_from_shapes(BoundingBox(0, 0, 1, 1), 0.0, {rect(0, 0, 1, 1)},
                                                            {1.0}, "", -1.0),
                    RasterError);
}
