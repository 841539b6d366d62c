/**
 * @file Triangulator.cpp
 * @brief PSLG construction and refinement predicates
 */

#include "Triangulator.hpp"
#include "Geometry.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <set>

namespace hydromesh {

Triangulator::Triangulator(const PlanarGeometryKernel& geometry, const ConstrainedTriangulationKernel& mesher)
    : geometry_(geometry), mesher_(mesher), logger_("Triangulator") {
}

// ============================================================================
// Refinement predicates
// ============================================================================

RefinePredicate Triangulator::refine_from_max_area(double max_area) {
    return [max_area](const std::array<Point2D, 3>&, double area) {
        return area > max_area;
    };
}

RefinePredicate Triangulator::refine_from_river_distance(double near_distance, double near_area,
                                                         double far_distance, double far_area,
                                                         const RiverForest& rivers) {
    auto lines = std::make_shared<const MultiLineString>(rivers.forest_to_list());
    return [=](const std::array<Point2D, 3>& triangle, double area) {
        const double d = point_lines_distance(centroid(triangle), *lines);
        if (d < near_distance) {
            return area > near_area;
        }
        if (d > far_distance) {
            return area > far_area;
        }
        const double fraction = (d - near_distance) / (far_distance - near_distance);
        return area > near_area + (far_area - near_area) * fraction;
    };
}

RefinePredicate Triangulator::refine_from_max_edge_length(double max_edge_length) {
    return [max_edge_length](const std::array<Point2D, 3>& triangle, double) {
        for (int i = 0; i < 3; ++i) {
            if (distance(triangle[i], triangle[(i + 1) % 3]) > max_edge_length) return true;
        }
        return false;
    };
}

RefinePredicate Triangulator::any_of(std::vector<RefinePredicate> predicates) {
    if (predicates.empty()) {
        return RefinePredicate();
    }
    return [predicates = std::move(predicates)](const std::array<Point2D, 3>& triangle, double area) {
        for (const auto& predicate : predicates) {
            if (predicate(triangle, area)) return true;
        }
        return false;
    };
}

std::vector<RefinePredicate> Triangulator::predicates_from_options(const TriangulationOptions& options,
                                                                   const RiverForest& rivers) {
    std::vector<RefinePredicate> predicates;
    if (options.refine_max_area) {
        predicates.push_back(refine_from_max_area(*options.refine_max_area));
    }
    if (options.refine_distance) {
        const auto& d = *options.refine_distance;
        predicates.push_back(refine_from_river_distance(d[0], d[1], d[2], d[3], rivers));
    }
    if (options.refine_max_edge_length) {
        predicates.push_back(refine_from_max_edge_length(*options.refine_max_edge_length));
    }
    return predicates;
}

// ============================================================================
// PSLG
// ============================================================================

PSLG Triangulator::build_pslg(const SplitBoundary& boundary, const RiverForest& rivers) const {
    PSLG pslg;
    std::map<Point2D, size_t> vertex_ids;
    std::set<std::pair<size_t, size_t>> seen_segments;

    auto vertex_id = [&](const Point2D& p) {
        auto [it, inserted] = vertex_ids.emplace(p, pslg.vertices.size());
        if (inserted) pslg.vertices.push_back(p);
        return it->second;
    };

    auto add_line = [&](const LineString& line, SegmentMarker marker) {
        for (size_t i = 0; i + 1 < line.size(); ++i) {
            size_t a = vertex_id(line.coords[i]);
            size_t b = vertex_id(line.coords[i + 1]);
            if (a == b) continue;
            if (!seen_segments.emplace(std::min(a, b), std::max(a, b)).second) continue;
            pslg.segments.push_back({a, b});
            pslg.segment_markers.push_back(marker);
        }
    };

    for (const auto& piece : boundary.pieces()) {
        add_line(piece.line, SegmentMarker::Boundary);
    }
    const size_t boundary_segments = pslg.segments.size();
    for (const auto& reach : rivers.forest_to_list()) {
        add_line(reach, SegmentMarker::River);
    }

    for (const auto& outer : boundary.exterior(geometry_)) {
        for (const auto& hole : outer.holes()) {
            pslg.holes.push_back(geometry_.point_on_surface(Polygon(hole)));
        }
    }

    logger_.detailed("PSLG: " + std::to_string(pslg.vertices.size()) + " vertices, " +
                     std::to_string(boundary_segments) + " boundary segments, " +
                     std::to_string(pslg.segments.size() - boundary_segments) + " river segments, " +
                     std::to_string(pslg.holes.size()) + " holes");
    return pslg;
}

Mesh2D Triangulator::triangulate(const SplitBoundary& boundary, const RiverForest& rivers,
                                 const TriangulationOptions& options) const {
    logger_.info("");
    logger_.info("Meshing");
    logger_.info(std::string(30, '-'));

    RefinePredicate refine = any_of(predicates_from_options(options, rivers));
    PSLG pslg = build_pslg(boundary, rivers);

    Mesh2D mesh = mesher_.triangulate(pslg, refine, options.refine_min_angle, options.enforce_delaunay);
    logger_.info("  triangulation: " + std::to_string(mesh.num_vertices()) + " vertices, " +
                 std::to_string(mesh.num_triangles()) + " triangles");

    if (options.diagnostics) {
        TriangleDiagnostics diag = diagnose(mesh, rivers, refine);
        auto dist = min_and_median(diag.river_distance);
        auto areas = min_and_median(diag.area);
        logger_.info("Triangulation diagnostics");
        logger_.info("  river distance min/median: " + std::to_string(dist.first) + " / " +
                     std::to_string(dist.second));
        logger_.info("  triangle area min/median: " + std::to_string(areas.first) + " / " +
                     std::to_string(areas.second));
        if (!diag.area.empty()) {
            logger_.info("  triangle area max: " +
                         std::to_string(*std::max_element(diag.area.begin(), diag.area.end())));
        }
        if (diag.num_refinable > 0) {
            logger_.warning(std::to_string(diag.num_refinable) +
                            " triangles still satisfy the refinement criteria");
        }
    }
    return mesh;
}

TriangleDiagnostics Triangulator::diagnose(const Mesh2D& mesh, const RiverForest& rivers,
                                           const RefinePredicate& refine) {
    TriangleDiagnostics diag;
    const MultiLineString lines = rivers.forest_to_list();

    for (const auto& tri : mesh.triangles) {
        std::array<Point2D, 3> corners{{mesh.vertices[tri[0]], mesh.vertices[tri[1]], mesh.vertices[tri[2]]}};
        const double area = triangle_area(corners[0], corners[1], corners[2]);
        diag.river_distance.push_back(point_lines_distance(centroid(corners), lines));
        diag.area.push_back(area);
        const bool refinable = refine && refine(corners, area);
        diag.still_refinable.push_back(refinable);
        if (refinable) ++diag.num_refinable;
    }
    return diag;
}

} // namespace hydromesh
