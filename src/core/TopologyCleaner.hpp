/**
 * @file TopologyCleaner.hpp
 * @brief Simplify, prune and snap stage producing consistent boundary and river geometry
 */

#pragma once

#include "hydromesh.hpp"
#include "PlanarGeometryKernel.hpp"
#include "SplitBoundary.hpp"
#include "RiverForest.hpp"
#include "Logger.hpp"

#include <vector>

namespace hydromesh {

/**
 * @brief Options for simplify_and_prune
 */
struct CleanerOptions {
    double simplify = 10.0;            ///< Simplify tolerance, CRS units; also the filter and snap scale
    size_t prune_reach_size = 0;       ///< Drop river trees with fewer reaches
    bool cut_intersections = false;    ///< Insert river/boundary crossings into both geometries
    double tree_tolerance = 0.1;       ///< Outlet-to-inlet distance that still connects reaches
};

/**
 * @brief Informational segment-length statistics
 *
 * Each line contributes its shortest segment; min and median are taken
 * over those per-line minima.
 */
struct CleanerDiagnostics {
    double river_min_segment = 0.0;
    double river_median_segment = 0.0;
    double huc_min_segment = 0.0;
    double huc_median_segment = 0.0;
    size_t reaches_in = 0;
    size_t reaches_kept = 0;
    size_t trees_pruned = 0;
    size_t endpoints_snapped = 0;
    size_t intersections_cut = 0;
};

struct CleanerResult {
    RiverForest forest;
    CleanerDiagnostics diagnostics;
};

struct SnapReport {
    size_t groups_snapped = 0;
    size_t endpoints_snapped = 0;
    size_t groups_unsnapped = 0;
    size_t reaches_collapsed = 0;
    size_t intersections_cut = 0;
};

class TopologyCleaner {
public:
    explicit TopologyCleaner(const PlanarGeometryKernel& kernel);

    /**
     * @brief Full cleaning pipeline; mutates the boundary in place
     *
     * Stages: filter reaches to the buffered exterior, build the forest,
     * prune small trees, clean up reaches, simplify the boundary, snap.
     * An empty reach set or forest is a valid result, not an error.
     */
    CleanerResult simplify_and_prune(SplitBoundary& boundary, const MultiLineString& reaches,
                                     const CleanerOptions& options) const;

    /**
     * @brief Keep reaches touching the shape buffered outward by tol
     */
    MultiLineString filter_rivers_to_shape(const std::vector<Polygon>& shape,
                                           const MultiLineString& reaches, double tol) const;

    /**
     * @brief Weld river endpoints onto nearby boundary vertices
     *
     * Endpoints meeting at a junction move together: a reach's inlet and
     * its tributaries' outlets form one group, each outlet reach forms its
     * own. A group moves to the nearest boundary vertex within snap_radius
     * of its reference endpoint, ties going to the lowest vertex index in
     * piece order. Groups with no vertex in range stay where they are.
     */
    SnapReport snap(SplitBoundary& boundary, RiverForest& forest, double tol,
                    double snap_radius, bool cut_intersections) const;

    /**
     * @brief Insert each river/boundary crossing point into both lines
     * @return Number of vertices inserted across pieces and reaches
     */
    size_t cut_intersections(SplitBoundary& boundary, RiverForest& forest) const;

    /**
     * @brief Per-line minimum segment lengths, reduced to (min, median)
     */
    static std::pair<double, double> segment_diagnostics(const MultiLineString& lines);

private:
    const PlanarGeometryKernel& kernel_;
    Logger logger_;
};

} // namespace hydromesh
