// tests/test_triangulator.cpp (doctest)
//
// PSLG construction, refinement predicates and the CGAL mesher.
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "core/CgalTriangulationKernel.hpp"
#include "core/Geometry.hpp"
#include "core/OgrGeometryKernel.hpp"
#include "core/Triangulator.hpp"

#include <cmath>

using namespace hydromesh;
using hydromesh_test::rect;

namespace triangulator_test {

double mesh_area(const Mesh2D& mesh) {
    double total = 0.0;
    for (const auto& t : mesh.triangles) {
        total += std::abs(triangle_area(mesh.vertices[t[0]], mesh.vertices[t[1]], mesh.vertices[t[2]]));
    }
    return total;
}

double longest_edge(const Mesh2D& mesh) {
    double longest = 0.0;
    for (const auto& t : mesh.triangles) {
        for (int i = 0; i < 3; ++i) {
            longest = std::max(longest, distance(mesh.vertices[t[i]], mesh.vertices[t[(i + 1) % 3]]));
        }
    }
    return longest;
}

// Positive for counter-clockwise corners
double signed_area(const Mesh2D& mesh, const TriangleIndices& t) {
    const Point2D& a = mesh.vertices[t[0]];
    const Point2D& b = mesh.vertices[t[1]];
    const Point2D& c = mesh.vertices[t[2]];
    return 0.5 * ((b.x() - a.x()) * (c.y() - a.y()) - (c.x() - a.x()) * (b.y() - a.y()));
}

bool all_counter_clockwise(const Mesh2D& mesh) {
    for (const auto& t : mesh.triangles) {
        if (signed_area(mesh, t) <= 0.0) return false;
    }
    return true;
}

bool has_vertex(const Mesh2D& mesh, const Point2D& p) {
    for (const auto& v : mesh.vertices) {
        if (v == p) return true;
    }
    return false;
}

} // namespace triangulator_test

using triangulator_test::all_counter_clockwise;
using triangulator_test::has_vertex;
using triangulator_test::longest_edge;
using triangulator_test::mesh_area;

TEST_CASE("refinement predicates") {
    const std::array<Point2D, 3> small{{{0, 0}, {1, 0}, {0, 1}}};
    const std::array<Point2D, 3> long_edge{{{0, 0}, {10, 0}, {0, 0.1}}};

    SUBCASE("max area") {
        RefinePredicate refine = Triangulator::refine_from_max_area(1.0);
        CHECK_FALSE(refine(small, 0.5));
        CHECK(refine(small, 1.5));
    }

    SUBCASE("max edge length") {
        RefinePredicate refine = Triangulator::refine_from_max_edge_length(5.0);
        CHECK_FALSE(refine(small, 0.5));
        CHECK(refine(long_edge, 0.5));
    }

    SUBCASE("river distance interpolates between near and far") {
        RiverForest rivers = RiverForest::make_global_tree({LineString{{-100, 0}, {100, 0}}}, 0.1);
        RefinePredicate refine = Triangulator::refine_from_river_distance(1.0, 1.0, 11.0, 101.0, rivers);

        auto at_height = [](double y) {
            return std::array<Point2D, 3>{{{-1, y}, {1, y}, {0, y}}};
        };
        CHECK(refine(at_height(0.5), 2.0));       // near: ceiling 1
        CHECK_FALSE(refine(at_height(0.5), 0.5));
        CHECK(refine(at_height(6.0), 60.0));      // halfway: ceiling 51
        CHECK_FALSE(refine(at_height(6.0), 40.0));
        CHECK_FALSE(refine(at_height(50.0), 100.0));  // far: ceiling 101
    }

    SUBCASE("any_of") {
        CHECK_FALSE(static_cast<bool>(Triangulator::any_of({})));
        RefinePredicate refine = Triangulator::any_of({Triangulator::refine_from_max_area(100.0),
                                                       Triangulator::refine_from_max_edge_length(5.0)});
        CHECK(refine(long_edge, 0.5));
        CHECK_FALSE(refine(small, 0.5));
    }

    SUBCASE("options select predicates in a fixed order") {
        TriangulationOptions options;
        CHECK(Triangulator::predicates_from_options(options, RiverForest()).empty());
        options.refine_max_area = 10.0;
        options.refine_max_edge_length = 3.0;
        CHECK(Triangulator::predicates_from_options(options, RiverForest()).size() == 2);
    }
}

TEST_CASE("build_pslg shares vertices by coordinate") {
    OgrGeometryKernel geometry;
    CgalTriangulationKernel mesher;
    Triangulator triangulator(geometry, mesher);

    SplitBoundary boundary = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1)}, geometry);
    PSLG pslg = triangulator.build_pslg(boundary, RiverForest());

    CHECK(pslg.vertices.size() == 6);
    CHECK(pslg.segments.size() == 7);
    CHECK(pslg.segment_markers.size() == pslg.segments.size());
    CHECK(pslg.holes.empty());
}

TEST_CASE("build_pslg seeds every hole") {
    OgrGeometryKernel geometry;
    CgalTriangulationKernel mesher;
    Triangulator triangulator(geometry, mesher);

    Polygon donut = rect(0, 0, 10, 10);
    donut.rings.push_back(Ring{{4, 4}, {4, 6}, {6, 6}, {6, 4}, {4, 4}});
    SplitBoundary boundary = SplitBoundary::intersect_and_split({donut}, geometry);

    PSLG pslg = triangulator.build_pslg(boundary, RiverForest());
    REQUIRE(pslg.holes.size() == 1);
    CHECK(pslg.holes[0].x() > 4.0);
    CHECK(pslg.holes[0].x() < 6.0);
    CHECK(pslg.holes[0].y() > 4.0);
    CHECK(pslg.holes[0].y() < 6.0);
}

TEST_CASE("the kernel keeps input vertices first and in order") {
    CgalTriangulationKernel mesher;
    PSLG pslg;
    pslg.vertices = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    pslg.segments = {{0, 1}, {1, 2}, {2, 3}, {3, 0}};
    pslg.segment_markers.assign(4, SegmentMarker::Boundary);

    Mesh2D mesh = mesher.triangulate(pslg, Triangulator::refine_from_max_area(5.0), std::nullopt, false);
    REQUIRE(mesh.vertices.size() >= 4);
    for (size_t i = 0; i < pslg.vertices.size(); ++i) {
        CHECK(mesh.vertices[i] == pslg.vertices[i]);
    }
    CHECK(all_counter_clockwise(mesh));
    CHECK(mesh_area(mesh) == doctest::Approx(100.0));
}

TEST_CASE("triangulate") {
    OgrGeometryKernel geometry;
    CgalTriangulationKernel mesher;
    Triangulator triangulator(geometry, mesher);

    SUBCASE("two squares cover their combined area") {
        SplitBoundary boundary = SplitBoundary::intersect_and_split({rect(0, 0, 1, 1), rect(1, 0, 2, 1)}, geometry);
        Mesh2D mesh = triangulator.triangulate(boundary, RiverForest(), TriangulationOptions());
        CHECK(mesh.num_triangles() >= 4);
        CHECK(mesh_area(mesh) == doctest::Approx(2.0));
        CHECK(all_counter_clockwise(mesh));
    }

    SUBCASE("max edge length bounds every edge") {
        SplitBoundary boundary = SplitBoundary::intersect_and_split({rect(0, 0, 100, 100)}, geometry);
        TriangulationOptions options;
        options.refine_max_edge_length = 5.0;
        Mesh2D mesh = triangulator.triangulate(boundary, RiverForest(), options);

        CHECK(longest_edge(mesh) <= 5.0 + 1e-9);
        CHECK(mesh_area(mesh) == doctest::Approx(10000.0));
        CHECK(mesh.num_triangles() >= 2 * 20 * 20);
    }

    SUBCASE("smaller area ceilings give more triangles") {
        SplitBoundary boundary = SplitBoundary::intersect_and_split({rect(0, 0, 100, 100)}, geometry);
        TriangulationOptions coarse;
        coarse.refine_max_area = 500.0;
        TriangulationOptions fine;
        fine.refine_max_area = 50.0;

        Mesh2D coarse_mesh = triangulator.triangulate(boundary, RiverForest(), coarse);
        Mesh2D fine_mesh = triangulator.triangulate(boundary, RiverForest(), fine);
        CHECK(fine_mesh.num_triangles() > coarse_mesh.num_triangles());

        TriangleDiagnostics diag = Triangulator::diagnose(fine_mesh, RiverForest(),
                                                          Triangulator::refine_from_max_area(50.0));
        CHECK(diag.num_refinable == 0);
        CHECK(diag.area.size() == fine_mesh.num_triangles());
    }

    SUBCASE("holes are left empty") {
        Polygon donut = rect(0, 0, 10, 10);
        donut.rings.push_back(Ring{{4, 4}, {4, 6}, {6, 6}, {6, 4}, {4, 4}});
        SplitBoundary boundary = SplitBoundary::intersect_and_split({donut}, geometry);
        Mesh2D mesh = triangulator.triangulate(boundary, RiverForest(), TriangulationOptions());
        CHECK(mesh_area(mesh) == doctest::Approx(96.0));
        CHECK(all_counter_clockwise(mesh));
    }

    SUBCASE("rivers become mesh edges") {
        SplitBoundary boundary = SplitBoundary::intersect_and_split({rect(0, 0, 10, 10)}, geometry);
        RiverForest rivers = RiverForest::make_global_tree({LineString{{2, 5}, {5, 6}, {8, 5}}}, 0.1);
        TriangulationOptions options;
        options.refine_min_angle = 20.0;
        Mesh2D mesh = triangulator.triangulate(boundary, rivers, options);

        CHECK(has_vertex(mesh, Point2D(5, 6)));
        CHECK(mesh_area(mesh) == doctest::Approx(100.0));
    }
}
