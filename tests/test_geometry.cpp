// tests/test_geometry.cpp (doctest)
//
// Planar helpers, line merging and the GDAL/GEOS geometry kernel.
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "core/Geometry.hpp"
#include "core/OgrGeometryKernel.hpp"

#include <algorithm>

using namespace hydromesh;
using hydromesh_test::rect;

TEST_CASE("merge_lines joins noded segments into one chain") {
    MultiLineString pieces{
        LineString{{2, 0}, {3, 0}},
        LineString{{0, 0}, {1, 0}},
        LineString{{1, 0}, {2, 0}},
    };
    MultiLineString merged = merge_lines(pieces, 0.0);
    REQUIRE(merged.size() == 1);
    CHECK(merged[0].size() == 4);
    CHECK(merged[0].length() == doctest::Approx(3.0));
}

TEST_CASE("merge_lines stops at junctions of degree other than two") {
    MultiLineString pieces{
        LineString{{0, 0}, {1, 0}},
        LineString{{1, 0}, {2, 0}},
        LineString{{1, 0}, {1, 1}},
    };
    CHECK(merge_lines(pieces, 0.0).size() == 3);
}

TEST_CASE("merge_lines honours the node tolerance") {
    MultiLineString pieces{
        LineString{{0, 0}, {1, 0}},
        LineString{{1.0005, 0}, {2, 0}},
    };
    CHECK(merge_lines(pieces, 0.0).size() == 2);
    CHECK(merge_lines(pieces, 0.001).size() == 1);
}

TEST_CASE("merge_lines with preserve_direction never reverses a line") {
    MultiLineString head_to_head{
        LineString{{0, 0}, {1, 0}},
        LineString{{2, 0}, {1, 0}},
    };
    CHECK(merge_lines(head_to_head, 0.0, true).size() == 2);
    CHECK(merge_lines(head_to_head, 0.0, false).size() == 1);

    MultiLineString head_to_tail{
        LineString{{1, 0}, {2, 0}},
        LineString{{0, 0}, {1, 0}},
    };
    MultiLineString merged = merge_lines(head_to_tail, 0.0, true);
    REQUIRE(merged.size() == 1);
    CHECK(merged[0].front() == Point2D(0, 0));
    CHECK(merged[0].back() == Point2D(2, 0));
}

TEST_CASE("segment_intersection") {
    SUBCASE("crossing segments meet at one point") {
        auto hit = segment_intersection({0, 0}, {2, 2}, {0, 2}, {2, 0});
        REQUIRE(hit.has_value());
        CHECK(hit->x() == doctest::Approx(1.0));
        CHECK(hit->y() == doctest::Approx(1.0));
    }
    SUBCASE("collinear overlap is not a crossing") {
        CHECK_FALSE(segment_intersection({0, 0}, {2, 0}, {1, 0}, {3, 0}).has_value());
    }
    SUBCASE("disjoint segments") {
        CHECK_FALSE(segment_intersection({0, 0}, {1, 0}, {0, 1}, {1, 1}).has_value());
    }
}

TEST_CASE("polygon_area subtracts holes") {
    Polygon p = rect(0, 0, 10, 10);
    p.rings.push_back(Ring{{2, 2}, {2, 4}, {4, 4}, {4, 2}, {2, 2}});
    CHECK(polygon_area(p) == doctest::Approx(96.0));
    CHECK(ring_signed_area(rect(0, 0, 1, 1).exterior()) > 0.0);
}

TEST_CASE("PointGrid returns nearest first with ties to the lowest id") {
    PointGrid grid(1.0);
    grid.insert({1, 0}, 5);
    grid.insert({-1, 0}, 2);
    grid.insert({0, 0.5}, 9);
    grid.insert({10, 10}, 1);

    std::vector<size_t> hits = grid.query({0, 0}, 2.0);
    REQUIRE(hits.size() == 3);
    CHECK(hits[0] == 9);
    CHECK(hits[1] == 2);
    CHECK(hits[2] == 5);
}

TEST_CASE("min_and_median") {
    CHECK(min_and_median({}) == std::pair<double, double>(0.0, 0.0));
    CHECK(min_and_median({3.0, 1.0, 2.0}) == std::pair<double, double>(1.0, 2.0));
    CHECK(min_and_median({4.0, 1.0, 2.0, 3.0}) == std::pair<double, double>(1.0, 2.5));
}

TEST_CASE("assemble_rings rejects open linework") {
    MultiLineString open{LineString{{0, 0}, {1, 0}, {1, 1}}};
    CHECK_THROWS_AS(assemble_rings(open, 0.0), TopologyError);
}

TEST_CASE("OgrGeometryKernel") {
    OgrGeometryKernel kernel;

    SUBCASE("simplify keeps endpoints") {
        LineString wiggle{{0, 0}, {1, 0.01}, {2, -0.01}, {3, 0.01}, {4, 0}};
        LineString simple = kernel.simplify(wiggle, 0.1);
        CHECK(simple.size() == 2);
        CHECK(simple.front() == wiggle.front());
        CHECK(simple.back() == wiggle.back());
    }

    SUBCASE("boundary intersection of adjacent squares is their wall") {
        MultiLineString wall = merge_lines(kernel.boundary_intersection(rect(0, 0, 1, 1), rect(1, 0, 2, 1)), 0.0);
        REQUIRE(wall.size() == 1);
        CHECK(wall[0].length() == doctest::Approx(1.0));
    }

    SUBCASE("union and buffer") {
        std::vector<Polygon> merged = kernel.union_polygons({rect(0, 0, 1, 1), rect(1, 0, 2, 1)});
        REQUIRE(merged.size() == 1);
        CHECK(kernel.area(merged[0]) == doctest::Approx(2.0));

        std::vector<Polygon> grown = kernel.buffer({rect(0, 0, 10, 10)}, 1.0);
        REQUIRE(grown.size() == 1);
        CHECK(kernel.area(grown[0]) > 140.0);
        CHECK(kernel.contains(grown[0], rect(0, 0, 10, 10)));
    }

    SUBCASE("point_on_surface lies inside") {
        Polygon ell(Ring{{0, 0}, {10, 0}, {10, 1}, {1, 1}, {1, 10}, {0, 10}, {0, 0}});
        Point2D p = kernel.point_on_surface(ell);
        CHECK(kernel.contains(ell, rect(p.x() - 1e-6, p.y() - 1e-6, p.x() + 1e-6, p.y() + 1e-6)));
    }

    SUBCASE("intersects and contains") {
        CHECK(kernel.intersects(rect(0, 0, 2, 2), rect(1, 1, 3, 3)));
        CHECK_FALSE(kernel.contains(rect(0, 0, 2, 2), rect(1, 1, 3, 3)));
        CHECK_FALSE(kernel.intersects(rect(0, 0, 1, 1), rect(5, 5, 6, 6)));
        CHECK(kernel.intersects({rect(0, 0, 1, 1)}, LineString{{-1, 0.5}, {0.5, 0.5}}));
    }
}
