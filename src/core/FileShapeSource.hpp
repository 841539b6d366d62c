/**
 * @file FileShapeSource.hpp
 * @brief ShapeSource reading local GDAL/OGR datasets
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "ShapeSource.hpp"
#include "CoordinateReprojector.hpp"
#include "Logger.hpp"

#include <string>

namespace hydromesh {

/**
 * @brief Paths of the datasets backing a FileShapeSource
 */
struct FileSourceConfig {
    std::string hucs_path;      ///< Any OGR vector dataset with HUC2..HUC12 fields or WBDHU<n> layers
    std::string shapes_path;    ///< Any OGR polygon dataset
    std::string reaches_path;   ///< Any OGR line dataset
    std::string dem_path;       ///< Any GDAL raster
};

class FileShapeSource : public ShapeSource {
public:
    FileShapeSource(const FileSourceConfig& config, const CoordinateReprojector& reprojector);

    /**
     * @brief Units keyed by the HUC<level> field, dissolving rows that share a code
     *
     * Uses layer WBDHU<level> when present, otherwise the first layer.
     * @throws SearchError if the dataset cannot be opened or lacks the field
     */
    std::pair<RasterProfile, std::vector<HucFeature>> get_hucs(const std::string& huc,
                                                               int level) const override;

    /**
     * @brief Polygons from the first layer of the shapes dataset
     *
     * A multi-part feature contributes its largest part.
     */
    std::pair<RasterProfile, std::vector<Polygon>> get_shapes(const ShapeFilter& filter,
                                                              const std::string& crs) const override;

    /**
     * @brief Reaches from the first layer, bbox-filtered when bounds are given
     *
     * Without bounds, a REACHCODE field (when present) filters by HUC prefix.
     */
    std::pair<RasterProfile, MultiLineString> get_hydro(const std::string& huc,
                                                        const std::optional<BoundingBox>& bounds,
                                                        const std::string& bounds_crs) const override;

    /**
     * @throws RasterError if the DEM cannot be read or does not overlap the shape
     */
    Raster get_raster(const Polygon& shape, const std::string& crs) const override;

private:
    FileSourceConfig config_;
    const CoordinateReprojector& reprojector_;
    Logger logger_;
};

} // namespace hydromesh
