/**
 * @file CoordinateReprojector.hpp
 * @brief Coordinate reprojection capability and its GDAL/OGR implementation
 */

#pragma once

#include "hydromesh.hpp"
#include "Logger.hpp"

#include <string>
#include <vector>

namespace hydromesh {

class CoordinateReprojector {
public:
    virtual ~CoordinateReprojector() = default;

    /**
     * @brief Transform points between coordinate systems
     *
     * An empty CRS on either side means "unknown" and leaves points untouched.
     */
    virtual std::vector<Point2D> reproject(const std::vector<Point2D>& points,
                                           const std::string& src_crs,
                                           const std::string& dst_crs) const = 0;

    LineString reproject(const LineString& line, const std::string& src_crs,
                         const std::string& dst_crs) const;
    Polygon reproject(const Polygon& polygon, const std::string& src_crs,
                      const std::string& dst_crs) const;
};

/**
 * @brief OGRCoordinateTransformation with traditional GIS axis order
 */
class OgrReprojector : public CoordinateReprojector {
public:
    OgrReprojector();

    using CoordinateReprojector::reproject;

    /**
     * @throws RasterError for unknown CRS definitions or failed transforms
     */
    std::vector<Point2D> reproject(const std::vector<Point2D>& points,
                                   const std::string& src_crs,
                                   const std::string& dst_crs) const override;

private:
    Logger logger_;
};

} // namespace hydromesh
