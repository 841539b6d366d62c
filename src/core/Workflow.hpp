/**
 * @file Workflow.hpp
 * @brief High-level pipeline entry points over a ShapeSource and the core stages
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hydromesh.hpp"
#include "ShapeSource.hpp"
#include "CoordinateReprojector.hpp"
#include "PlanarGeometryKernel.hpp"
#include "TriangulationKernel.hpp"
#include "SplitBoundary.hpp"
#include "TopologyCleaner.hpp"
#include "Triangulator.hpp"
#include "RasterSampler.hpp"
#include "Logger.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hydromesh {

/**
 * @brief Normalize a HUC code: digits only, even length, at most 12
 * @throws SearchError for anything else
 */
std::string huc_str(const std::string& huc);

/**
 * @brief Fetches source data into a target CRS and runs the cleaning,
 *        meshing and elevation stages
 *
 * Every getter returns the CRS its geometry ended up in: the requested
 * one, or the source's own when none was requested.
 */
class Workflow {
public:
    Workflow(const ShapeSource& source,
             const CoordinateReprojector& reprojector,
             const PlanarGeometryKernel& geometry,
             const ConstrainedTriangulationKernel& mesher,
             WorkflowConfig config = WorkflowConfig());

    const WorkflowConfig& config() const { return config_; }

    /**
     * @brief All level-`level` HUCs inside huc, reprojected and rounded
     *
     * @param huc May be empty to select every unit of the level
     * @param level Defaults to the level of huc itself; required for an empty huc
     * @param digits Defaults to the configured rounding digits
     */
    std::pair<std::string, std::vector<HucFeature>> get_hucs(const std::string& huc,
                                                             std::optional<int> level = std::nullopt,
                                                             const std::string& crs = "",
                                                             std::optional<int> digits = std::nullopt) const;

    /**
     * @brief The single HUC with this code
     * @throws SearchError unless exactly one unit is found
     */
    std::pair<std::string, HucFeature> get_huc(const std::string& huc, const std::string& crs = "",
                                               std::optional<int> digits = std::nullopt) const;

    std::pair<std::string, SplitBoundary> get_split_form_hucs(const std::string& huc,
                                                              std::optional<int> level = std::nullopt,
                                                              const std::string& crs = "",
                                                              std::optional<int> digits = std::nullopt) const;

    /**
     * @brief Polygons of a plain shape dataset, reprojected and rounded
     *
     * filter.bounds, when given, is in crs (or the source's CRS when crs is empty).
     */
    std::pair<std::string, std::vector<Polygon>> get_shapes(const ShapeFilter& filter = ShapeFilter(),
                                                            const std::string& crs = "",
                                                            std::optional<int> digits = std::nullopt) const;

    std::pair<std::string, SplitBoundary> get_split_form_shapes(const ShapeFilter& filter = ShapeFilter(),
                                                                const std::string& crs = "",
                                                                std::optional<int> digits = std::nullopt) const;

    /**
     * @brief Reaches in a HUC and/or bounds (given in crs)
     *
     * With merge, connected non-branching reaches are joined head to tail.
     * Reaches at least `long_reach` long are dropped afterwards.
     */
    std::pair<std::string, MultiLineString> get_reaches(const std::string& huc,
                                                        const std::optional<BoundingBox>& bounds = std::nullopt,
                                                        const std::string& crs = "",
                                                        std::optional<int> digits = std::nullopt,
                                                        std::optional<double> long_reach = std::nullopt,
                                                        bool merge = true) const;

    /**
     * @brief Source raster covering the shape grown by buffer (shape units)
     *
     * The raster stays in the source's CRS unless raster_crs names another,
     * in which case it is warped onto a grid in that CRS.
     */
    Raster get_raster_on_shape(const Polygon& shape, const std::string& crs, double buffer = 0.0,
                               const std::string& raster_crs = "") const;

    /**
     * @brief As get_raster_on_shape, with pixels whose centres fall outside
     *        the shape set to nodata
     */
    Raster get_masked_raster_on_shape(const Polygon& shape, const std::string& crs,
                                      double nodata = -1.0, double buffer = 0.0) const;

    /**
     * @brief Smallest HUC containing the shape, searching down from hint
     *
     * The shape is first shrunk by shrink_factor times its equivalent
     * radius so that a shape lying on a HUC boundary still counts as
     * inside. The search descends two levels at a time and stops at a
     * sub-HUC that only partially contains the shape, or at a unit the
     * source has no finer units for.
     *
     * @throws SearchError if the shape is not inside the hinted HUC
     */
    std::string find_huc(const Polygon& shape, const std::string& crs, const std::string& hint,
                         double shrink_factor = 1.e-5) const;

    CleanerResult simplify_and_prune(SplitBoundary& hucs, const MultiLineString& reaches,
                                     const CleanerOptions& options = CleanerOptions()) const;

    Mesh2D triangulate(const SplitBoundary& hucs, const RiverForest& rivers,
                       const TriangulationOptions& options = TriangulationOptions()) const;

    Mesh3D elevate(const Mesh2D& mesh, const std::string& mesh_crs, const Raster& dem,
                   Interpolation algorithm = Interpolation::Bilinear) const;

private:
    std::string find_in(const Polygon& shape, const std::string& crs, const std::string& hint) const;

    const ShapeSource& source_;
    const CoordinateReprojector& reprojector_;
    const PlanarGeometryKernel& geometry_;
    const ConstrainedTriangulationKernel& mesher_;
    WorkflowConfig config_;
    Logger logger_;
};

} // namespace hydromesh
