// tests/test_split_boundary.cpp (doctest)
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "core/Geometry.hpp"
#include "core/OgrGeometryKernel.hpp"
#include "core/SplitBoundary.hpp"

#include <set>
#include <utility>
#include <vector>

using namespace hydromesh;
using hydromesh_test::has_coordinate;
using hydromesh_test::rect;

namespace split_boundary_test {

using VertexSet = std::set<std::pair<double, double>>;

// Each ring as its set of distinct vertices, ignoring start point and direction
std::multiset<VertexSet> ring_sets(const Polygon& polygon) {
    std::multiset<VertexSet> rings;
    for (const auto& ring : polygon.rings) {
        VertexSet vertices;
        for (const auto& p : ring) vertices.emplace(p.x(), p.y());
        rings.insert(vertices);
    }
    return rings;
}

// A wall from (1,0) to (1,1) with one bump that survives simplify(0.05) and one kink that does not
std::vector<Polygon> bumped_pair() {
    Polygon left(Ring{{0, 0}, {1, 0}, {1.16, 0.3}, {1.3, 0.6}, {1, 0.8}, {1, 1}, {0, 1}, {0, 0}});
    Polygon right(Ring{{1, 0}, {2, 0}, {2, 1}, {1, 1}, {1, 0.8}, {1.3, 0.6}, {1.16, 0.3}, {1, 0}});
    return {left, right};
}

} // namespace split_boundary_test

using split_boundary_test::bumped_pair;
using split_boundary_test::ring_sets;

TEST_CASE("two adjacent squares split into one shared wall and two unique pieces") {
    OgrGeometryKernel kernel;
    SplitBoundary split = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1)}, kernel);

    CHECK(split.size() == 2);
    CHECK(split.pieces().size() == 3);

    std::vector<SplitBoundary::PieceId> shared = split.shared_piece_ids(1, 0);
    REQUIRE(shared.size() == 1);
    CHECK(split.shared_piece_ids(0, 1) == shared);

    const SplitBoundary::Piece& wall = split.piece(shared[0]);
    CHECK(wall.kind == SplitBoundary::PieceKind::Shared);
    CHECK(wall.first_owner == 0);
    REQUIRE(wall.second_owner.has_value());
    CHECK(*wall.second_owner == 1);
    CHECK(wall.line.length() == doctest::Approx(1.0));

    CHECK(split.unique_piece_ids(0).size() == 1);
    CHECK(split.unique_piece_ids(1).size() == 1);
    CHECK(split.exterior_pieces().size() == 2);
    CHECK(split.segments().size() == 3);

    auto pairs = split.adjacent_pairs();
    REQUIRE(pairs.size() == 1);
    CHECK(pairs[0] == std::make_pair<size_t, size_t>(0, 1));

    std::vector<Polygon> rebuilt = split.polygons();
    REQUIRE(rebuilt.size() == 2);
    CHECK(polygon_area(rebuilt[0]) == doctest::Approx(1.0));
    CHECK(polygon_area(rebuilt[1]) == doctest::Approx(1.0));

    std::vector<Polygon> outer = split.exterior(kernel);
    REQUIRE(outer.size() == 1);
    CHECK(polygon_area(outer[0]) == doctest::Approx(2.0));
}

TEST_CASE("a polygon with no neighbours is a single closed piece") {
    OgrGeometryKernel kernel;
    SplitBoundary split = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(5, 5, 6, 6)}, kernel);

    CHECK(split.pieces().size() == 2);
    CHECK(split.adjacent_pairs().empty());
    for (const auto& piece : split.pieces()) {
        CHECK(piece.kind == SplitBoundary::PieceKind::Unique);
        CHECK(piece.line.is_closed());
    }
}

TEST_CASE("updating the shared wall is seen by both neighbours") {
    OgrGeometryKernel kernel;
    SplitBoundary split = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1)}, kernel);
    const SplitBoundary::PieceId wall = split.shared_piece_ids(0, 1).front();

    const LineString& old_line = split.piece(wall).line;
    const Point2D mid(1.0, 0.5);
    split.update_piece(wall, LineString{old_line.front(), mid, old_line.back()});

    CHECK(has_coordinate(split.polygon(0), mid));
    CHECK(has_coordinate(split.polygon(1), mid));
    CHECK(polygon_area(split.polygon(0)) == doctest::Approx(1.0));
}

TEST_CASE("update_piece refuses to move endpoints") {
    OgrGeometryKernel kernel;
    SplitBoundary split = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1)}, kernel);
    const SplitBoundary::PieceId wall = split.shared_piece_ids(0, 1).front();
    CHECK_THROWS_AS(split.update_piece(wall, LineString{{1.0, 0.1}, {1.0, 0.9}}), TopologyError);
}

TEST_CASE("simplifying pieces keeps the collection crack-free") {
    OgrGeometryKernel kernel;
    // Both units share a wall with a small kink in it
    Polygon left(Ring{{0, 0}, {1, 0}, {1, 0.5}, {1.01, 0.6}, {1, 0.7}, {1, 1}, {0, 1}, {0, 0}});
    Polygon right(Ring{{1, 0}, {2, 0}, {2, 1}, {1, 1}, {1, 0.7}, {1.01, 0.6}, {1, 0.5}, {1, 0}});
    SplitBoundary split = SplitBoundary::intersect_and_split({left, right}, kernel);

    split.simplify(0.05, kernel);

    const SplitBoundary::PieceId wall = split.shared_piece_ids(0, 1).front();
    CHECK(split.piece(wall).line.size() == 2);
    std::vector<Polygon> rebuilt = split.polygons();
    CHECK(polygon_area(rebuilt[0]) + polygon_area(rebuilt[1]) == doctest::Approx(2.0));
}

TEST_CASE("reassembled polygons reproduce the input coordinates") {
    OgrGeometryKernel kernel;
    Polygon donut = rect(0, 0, 10, 10);
    donut.rings.push_back(Ring{{4, 4}, {4, 6}, {6, 6}, {6, 4}, {4, 4}});
    const std::vector<Polygon> inputs{donut, rect(4, 4, 6, 6), bumped_pair()[0], bumped_pair()[1]};

    SUBCASE("a unit filling another's hole") {
        SplitBoundary split = SplitBoundary::intersect_and_split({inputs[0], inputs[1]}, kernel);
        REQUIRE(split.shared_piece_ids(0, 1).size() == 1);
        std::vector<Polygon> rebuilt = split.polygons();
        REQUIRE(rebuilt.size() == 2);
        CHECK(ring_sets(rebuilt[0]) == ring_sets(inputs[0]));
        CHECK(ring_sets(rebuilt[1]) == ring_sets(inputs[1]));
    }
    SUBCASE("units sharing a bent wall") {
        SplitBoundary split = SplitBoundary::intersect_and_split({inputs[2], inputs[3]}, kernel);
        std::vector<Polygon> rebuilt = split.polygons();
        REQUIRE(rebuilt.size() == 2);
        CHECK(ring_sets(rebuilt[0]) == ring_sets(inputs[2]));
        CHECK(ring_sets(rebuilt[1]) == ring_sets(inputs[3]));
        CHECK(polygon_area(rebuilt[0]) == doctest::Approx(polygon_area(inputs[2])));
    }
}

TEST_CASE("simplify is idempotent") {
    OgrGeometryKernel kernel;
    SplitBoundary split = SplitBoundary::intersect_and_split(bumped_pair(), kernel);

    split.simplify(0.05, kernel);
    const SplitBoundary::PieceId wall = split.shared_piece_ids(0, 1).front();
    CHECK(split.piece(wall).line.size() == 4);
    CHECK_FALSE(has_coordinate(split.piece(wall).line, {1.16, 0.3}));
    CHECK(has_coordinate(split.piece(wall).line, {1.3, 0.6}));

    std::vector<LineString> once;
    for (const auto& piece : split.pieces()) once.push_back(piece.line);

    split.simplify(0.05, kernel);
    REQUIRE(split.pieces().size() == once.size());
    for (size_t i = 0; i < once.size(); ++i) {
        CAPTURE(i);
        CHECK(split.piece(i).line == once[i]);
    }
}

TEST_CASE("a wall lying on three units is a topology error") {
    OgrGeometryKernel kernel;
    // The third unit duplicates the second, so the wall x=1 lies on three boundaries
    CHECK_THROWS_AS(SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1), rect(1, 0, 2, 1)},
                                                       kernel),
                    TopologyError);
}
