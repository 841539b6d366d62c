/**
 * @file RasterSampler.hpp
 * @brief Raster value sampling, mesh elevation and shape rasterization
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hydromesh.hpp"
#include "CoordinateReprojector.hpp"
#include "Logger.hpp"

#include <string>
#include <vector>

namespace hydromesh {

enum class Interpolation {
    Nearest,
    Bilinear
};

/**
 * @brief Parse "nearest", "bilinear" or "piecewise bilinear"
 * @throws RasterError for any other name
 */
Interpolation parse_interpolation(const std::string& name);

std::string interpolation_name(Interpolation algorithm);

class RasterSampler {
public:
    explicit RasterSampler(const CoordinateReprojector& reprojector);

    /**
     * @brief Sample the raster at points given in points_crs
     *
     * Nearest returns the value of the pixel containing the point, or the
     * nodata value (NaN without one) outside the grid. Bilinear works on
     * pixel centres, clamped to the grid, so edge points take edge values.
     */
    std::vector<double> values_from_raster(const std::vector<Point2D>& points,
                                           const std::string& points_crs,
                                           const Raster& raster,
                                           Interpolation algorithm) const;

    /**
     * @brief Mesh vertices with z sampled from the DEM
     */
    Mesh3D elevate(const Mesh2D& mesh, const std::string& mesh_crs,
                   const Raster& dem, Interpolation algorithm) const;

    /**
     * @brief Paint shapes into a new grid, later shapes over earlier ones
     *
     * The grid covers bounds rounded outward to whole multiples of
     * pixel_size. A pixel takes a shape's color when its centre lies
     * inside the shape; unpainted pixels hold nodata.
     *
     * @throws RasterError if shapes and colors differ in length or GDAL fails
     */
    static Raster color_raster_from_shapes(const BoundingBox& bounds, double pixel_size,
                                           const std::vector<Polygon>& shapes,
                                           const std::vector<double>& colors,
                                           const std::string& crs, double nodata);

    static double sample_nearest(const Raster& raster, const Point2D& point);
    static double sample_bilinear(const Raster& raster, const Point2D& point);

private:
    const CoordinateReprojector& reprojector_;
    Logger logger_;
};

} // namespace hydromesh
