/**
 * @file CgalTriangulationKernel.hpp
 * @brief CGAL constrained Delaunay triangulation and Delaunay refinement
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TriangulationKernel.hpp"
#include "Logger.hpp"

namespace hydromesh {

/**
 * @brief Mesher built on CGAL::Constrained_Delaunay_triangulation_2 and Delaunay_mesher_2
 *
 * Intersecting constraints are allowed; their crossing points become
 * additional vertices. A face is imperatively bad when the refine
 * predicate fires and bad when its smallest angle is below the target.
 */
class CgalTriangulationKernel : public ConstrainedTriangulationKernel {
public:
    CgalTriangulationKernel();

    Mesh2D triangulate(const PSLG& pslg, const RefinePredicate& refine,
                       std::optional<double> min_angle, bool enforce_delaunay) const override;

private:
    Logger logger_;
};

} // namespace hydromesh
