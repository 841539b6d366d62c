/**
 * @file TopologyCleaner.cpp
 * @brief Simplify, prune and snap stage
 */

#include "TopologyCleaner.hpp"
#include "Geometry.hpp"

#include <algorithm>
#include <map>

namespace hydromesh {

namespace {

struct Cut {
    size_t segment;
    Point2D point;
};

// Insert cut points after their segment's start vertex, ordered along the segment
LineString insert_points(const LineString& line, std::vector<Cut> cuts) {
    std::sort(cuts.begin(), cuts.end(), [&line](const Cut& a, const Cut& b) {
        if (a.segment != b.segment) return a.segment < b.segment;
        const Point2D& start = line.coords[a.segment];
        return distance(start, a.point) < distance(start, b.point);
    });

    std::vector<Point2D> coords;
    coords.reserve(line.size() + cuts.size());
    size_t next_cut = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        coords.push_back(line.coords[i]);
        while (next_cut < cuts.size() && cuts[next_cut].segment == i) {
            if (coords.back() != cuts[next_cut].point) {
                coords.push_back(cuts[next_cut].point);
            }
            ++next_cut;
        }
    }
    return LineString(std::move(coords));
}

BoundingBox segment_box(const Point2D& a, const Point2D& b) {
    BoundingBox box;
    box.expand(a);
    box.expand(b);
    return box;
}

} // anonymous namespace

TopologyCleaner::TopologyCleaner(const PlanarGeometryKernel& kernel)
    : kernel_(kernel), logger_("TopologyCleaner") {
}

CleanerResult TopologyCleaner::simplify_and_prune(SplitBoundary& boundary, const MultiLineString& reaches,
                                                  const CleanerOptions& options) const {
    const double tol = options.simplify;
    CleanerResult result;
    result.diagnostics.reaches_in = reaches.size();

    logger_.info("");
    logger_.info("Simplifying and pruning");
    logger_.info(std::string(30, '-'));

    logger_.info("Filtering rivers outside of the HUC space");
    MultiLineString kept = filter_rivers_to_shape(boundary.exterior(kernel_), reaches, tol);
    result.diagnostics.reaches_kept = kept.size();

    if (!kept.empty()) {
        logger_.info("Generate the river tree");
        result.forest = RiverForest::make_global_tree(kept, options.tree_tolerance);

        logger_.info("Removing rivers with fewer than " + std::to_string(options.prune_reach_size) +
                     " reaches.");
        result.diagnostics.trees_pruned = result.forest.prune_by_reach_count(options.prune_reach_size);
    } else {
        logger_.warning("No reaches intersect the HUC space; continuing without rivers");
    }

    if (!kept.empty() && result.forest.empty()) {
        logger_.warning("All rivers were pruned; continuing without rivers");
    }

    if (!result.forest.empty()) {
        logger_.info("simplifying rivers");
        result.forest.cleanup(tol, tol, tol, kernel_);
    }

    logger_.info("simplifying HUCs");
    boundary.simplify(tol, kernel_);

    if (!result.forest.empty()) {
        logger_.info("snapping rivers and HUCs");
        SnapReport report = snap(boundary, result.forest, tol, 3.0 * tol, options.cut_intersections);
        result.diagnostics.endpoints_snapped = report.endpoints_snapped;
        result.diagnostics.intersections_cut = report.intersections_cut;
    }

    logger_.info("");
    logger_.info("Simplification Diagnostics");
    logger_.info(std::string(30, '-'));
    if (!result.forest.empty()) {
        auto river = segment_diagnostics(result.forest.forest_to_list());
        result.diagnostics.river_min_segment = river.first;
        result.diagnostics.river_median_segment = river.second;
        logger_.info("  river min seg length: " + std::to_string(river.first));
        logger_.info("  river median seg length: " + std::to_string(river.second));
    }
    auto huc = segment_diagnostics(boundary.segments());
    result.diagnostics.huc_min_segment = huc.first;
    result.diagnostics.huc_median_segment = huc.second;
    logger_.info("  HUC min seg length: " + std::to_string(huc.first));
    logger_.info("  HUC median seg length: " + std::to_string(huc.second));

    return result;
}

MultiLineString TopologyCleaner::filter_rivers_to_shape(const std::vector<Polygon>& shape,
                                                        const MultiLineString& reaches, double tol) const {
    if (shape.empty() || reaches.empty()) return {};

    std::vector<Polygon> grown = tol > 0.0 ? kernel_.buffer(shape, tol) : shape;
    const BoundingBox grown_box = bounds_of(grown);

    MultiLineString kept;
    for (const auto& reach : reaches) {
        if (!grown_box.intersects(bounds_of(reach))) continue;
        if (kernel_.intersects(grown, reach)) kept.push_back(reach);
    }
    logger_.detailed("Kept " + std::to_string(kept.size()) + " of " + std::to_string(reaches.size()) +
                     " reaches within " + std::to_string(tol) + " of the boundary");
    return kept;
}

SnapReport TopologyCleaner::snap(SplitBoundary& boundary, RiverForest& forest, double tol,
                                 double snap_radius, bool cut) const {
    SnapReport report;

    std::vector<Point2D> vertices;
    PointGrid grid(std::max(tol, snap_radius / 3.0));
    for (const auto& piece : boundary.pieces()) {
        for (const auto& p : piece.line.coords) {
            grid.insert(p, vertices.size());
            vertices.push_back(p);
        }
    }

    auto target_for = [&](const Point2D& reference) -> std::optional<Point2D> {
        auto hits = grid.query(reference, snap_radius);
        if (hits.empty()) return std::nullopt;
        return vertices[hits.front()];
    };

    auto move_front = [&](LineString& reach, const Point2D& v) {
        if (reach.coords.front() != v) {
            reach.coords.front() = v;
            ++report.endpoints_snapped;
        }
    };
    auto move_back = [&](LineString& reach, const Point2D& v) {
        if (reach.coords.back() != v) {
            reach.coords.back() = v;
            ++report.endpoints_snapped;
        }
    };

    for (size_t t = 0; t < forest.size(); ++t) {
        RiverTree& tree = forest.tree(t);

        // Outlet of the whole network
        if (auto v = target_for(tree.reach(0).back())) {
            move_back(tree.reach(0), *v);
            ++report.groups_snapped;
        } else {
            ++report.groups_unsnapped;
        }

        // Each inlet together with the outlets of its tributaries
        for (size_t id = 0; id < tree.size(); ++id) {
            auto v = target_for(tree.reach(id).front());
            if (!v) {
                ++report.groups_unsnapped;
                continue;
            }
            move_front(tree.reach(id), *v);
            for (size_t child : tree.node(id).children) {
                move_back(tree.reach(child), *v);
            }
            ++report.groups_snapped;
        }

        for (size_t id = 0; id < tree.size(); ++id) {
            remove_repeated_points(tree.reach(id));
            if (tree.reach(id).size() < 2) {
                logger_.debug("Reach " + std::to_string(id) + " of river " + std::to_string(t) +
                              " collapsed onto a single boundary vertex while snapping");
            }
        }
    }

    // Reaches shorter than the snap radius can land on one vertex
    report.reaches_collapsed = forest.remove_collapsed_reaches();
    if (report.reaches_collapsed > 0) {
        logger_.warning("Removed " + std::to_string(report.reaches_collapsed) +
                        " reaches that collapsed onto a boundary vertex while snapping");
    }

    logger_.detailed("Snapped " + std::to_string(report.endpoints_snapped) + " endpoints in " +
                     std::to_string(report.groups_snapped) + " junctions; " +
                     std::to_string(report.groups_unsnapped) + " junctions out of range");

    if (cut) {
        report.intersections_cut = cut_intersections(boundary, forest);
    }
    return report;
}

size_t TopologyCleaner::cut_intersections(SplitBoundary& boundary, RiverForest& forest) const {
    std::map<SplitBoundary::PieceId, std::vector<Cut>> piece_cuts;
    size_t inserted = 0;

    std::vector<BoundingBox> piece_boxes;
    for (const auto& piece : boundary.pieces()) {
        piece_boxes.push_back(bounds_of(piece.line));
    }

    for (size_t t = 0; t < forest.size(); ++t) {
        RiverTree& tree = forest.tree(t);
        for (size_t id = 0; id < tree.size(); ++id) {
            const LineString& reach = tree.reach(id);
            if (reach.size() < 2) continue;
            const BoundingBox reach_box = bounds_of(reach);
            std::vector<Cut> reach_cuts;

            for (SplitBoundary::PieceId pid = 0; pid < boundary.pieces().size(); ++pid) {
                if (!reach_box.intersects(piece_boxes[pid])) continue;
                const LineString& piece = boundary.piece(pid).line;

                for (size_t i = 0; i + 1 < reach.size(); ++i) {
                    const BoundingBox river_seg = segment_box(reach.coords[i], reach.coords[i + 1]);
                    if (!river_seg.intersects(piece_boxes[pid])) continue;

                    for (size_t k = 0; k + 1 < piece.size(); ++k) {
                        if (!river_seg.intersects(segment_box(piece.coords[k], piece.coords[k + 1]))) continue;

                        auto hit = segment_intersection(reach.coords[i], reach.coords[i + 1],
                                                        piece.coords[k], piece.coords[k + 1]);
                        if (!hit) continue;

                        if (*hit != piece.coords[k] && *hit != piece.coords[k + 1]) {
                            piece_cuts[pid].push_back({k, *hit});
                        }
                        if (*hit != reach.coords[i] && *hit != reach.coords[i + 1]) {
                            reach_cuts.push_back({i, *hit});
                        }
                    }
                }
            }

            if (!reach_cuts.empty()) {
                LineString cut_reach = insert_points(reach, reach_cuts);
                inserted += cut_reach.size() - reach.size();
                tree.reach(id) = std::move(cut_reach);
            }
        }
    }

    for (auto& [pid, cuts] : piece_cuts) {
        const LineString& original = boundary.piece(pid).line;
        LineString cut_piece = insert_points(original, cuts);
        inserted += cut_piece.size() - original.size();
        logger_.debug("Cut boundary piece " + std::to_string(pid) + " at " +
                      std::to_string(cut_piece.size() - original.size()) + " river crossings");
        boundary.update_piece(pid, std::move(cut_piece));
    }

    logger_.detailed("Inserted " + std::to_string(inserted) + " crossing vertices");
    return inserted;
}

std::pair<double, double> TopologyCleaner::segment_diagnostics(const MultiLineString& lines) {
    std::vector<double> minima;
    for (const auto& line : lines) {
        auto lengths = segment_lengths(MultiLineString{line});
        if (lengths.empty()) continue;
        minima.push_back(*std::min_element(lengths.begin(), lengths.end()));
    }
    return min_and_median(std::move(minima));
}

} // namespace hydromesh
