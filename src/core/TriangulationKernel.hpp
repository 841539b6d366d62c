/**
 * @file TriangulationKernel.hpp
 * @brief Planar straight-line graph and the constrained triangulation capability
 */

#pragma once

#include "hydromesh.hpp"

#include <array>
#include <functional>
#include <optional>
#include <vector>

namespace hydromesh {

/**
 * @brief Returns true when a triangle must be refined further
 *
 * Called with the triangle's corners (counter-clockwise) and its area.
 * May be invoked any number of times; must have no side effects.
 */
using RefinePredicate = std::function<bool(const std::array<Point2D, 3>&, double)>;

enum class SegmentMarker : int {
    Boundary = 1,
    River = 2
};

/**
 * @brief Vertices, constraint segments and hole seeds for the mesher
 */
struct PSLG {
    std::vector<Point2D> vertices;
    std::vector<std::array<size_t, 2>> segments;
    std::vector<SegmentMarker> segment_markers;
    std::vector<Point2D> holes;   ///< One interior point per hole region
};

class ConstrainedTriangulationKernel {
public:
    virtual ~ConstrainedTriangulationKernel() = default;

    /**
     * @brief Constrained, optionally refined triangulation of a PSLG
     *
     * The first pslg.vertices.size() output vertices are the input
     * vertices in input order. Triangles cover the region enclosed by the
     * constraints minus the hole regions and are counter-clockwise.
     *
     * @param refine Empty for no predicate-driven refinement
     * @param min_angle Minimum angle target in degrees
     * @param enforce_delaunay Split constraints until the mesh is conforming Delaunay
     */
    virtual Mesh2D triangulate(const PSLG& pslg, const RefinePredicate& refine,
                               std::optional<double> min_angle, bool enforce_delaunay) const = 0;
};

} // namespace hydromesh
