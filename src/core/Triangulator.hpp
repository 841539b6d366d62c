/**
 * @file Triangulator.hpp
 * @brief Builds the PSLG from cleaned boundary and rivers and drives the mesher
 */

#pragma once

#include "hydromesh.hpp"
#include "TriangulationKernel.hpp"
#include "PlanarGeometryKernel.hpp"
#include "SplitBoundary.hpp"
#include "RiverForest.hpp"
#include "Logger.hpp"

#include <array>
#include <optional>
#include <vector>

namespace hydromesh {

/**
 * @brief Refinement and quality options for triangulate()
 */
struct TriangulationOptions {
    std::optional<double> refine_max_area;
    /// near_distance, near_area, far_distance, far_area
    std::optional<std::array<double, 4>> refine_distance;
    std::optional<double> refine_max_edge_length;
    std::optional<double> refine_min_angle;     ///< Degrees
    bool enforce_delaunay = false;
    bool diagnostics = false;                   ///< Compute and log per-triangle statistics
};

/**
 * @brief Per-triangle statistics used to judge a refinement
 */
struct TriangleDiagnostics {
    std::vector<double> river_distance;   ///< Centroid to nearest reach
    std::vector<double> area;
    std::vector<bool> still_refinable;    ///< Predicate would fire again
    size_t num_refinable = 0;
};

class Triangulator {
public:
    Triangulator(const PlanarGeometryKernel& geometry, const ConstrainedTriangulationKernel& mesher);

    /**
     * @brief Refine triangles larger than max_area
     */
    static RefinePredicate refine_from_max_area(double max_area);

    /**
     * @brief Area ceiling that grows linearly with distance from the rivers
     *
     * Below near_distance the ceiling is near_area, beyond far_distance it
     * is far_area, and it is interpolated linearly in between. Distance is
     * measured from the triangle centroid to the forest's reaches.
     */
    static RefinePredicate refine_from_river_distance(double near_distance, double near_area,
                                                      double far_distance, double far_area,
                                                      const RiverForest& rivers);

    /**
     * @brief Refine triangles with any edge longer than max_edge_length
     */
    static RefinePredicate refine_from_max_edge_length(double max_edge_length);

    /**
     * @brief Logical OR of predicates; empty when the list is empty
     */
    static RefinePredicate any_of(std::vector<RefinePredicate> predicates);

    /**
     * @brief Predicates requested by the options, in a fixed order
     */
    static std::vector<RefinePredicate> predicates_from_options(const TriangulationOptions& options,
                                                                const RiverForest& rivers);

    /**
     * @brief Boundary pieces and river reaches as one PSLG
     *
     * Vertices are shared by exact coordinate. Each hole of the boundary's
     * outer shape gets one seed point inside it.
     */
    PSLG build_pslg(const SplitBoundary& boundary, const RiverForest& rivers) const;

    Mesh2D triangulate(const SplitBoundary& boundary, const RiverForest& rivers,
                       const TriangulationOptions& options) const;

    static TriangleDiagnostics diagnose(const Mesh2D& mesh, const RiverForest& rivers,
                                        const RefinePredicate& refine);

private:
    const PlanarGeometryKernel& geometry_;
    const ConstrainedTriangulationKernel& mesher_;
    Logger logger_;
};

} // namespace hydromesh
