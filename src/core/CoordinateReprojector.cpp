/**
 * @file CoordinateReprojector.cpp
 * @brief Coordinate reprojection through OGR
 */

#include "CoordinateReprojector.hpp"
#include "GdalSupport.hpp"

#include <ogr_spatialref.h>

#include <memory>

namespace hydromesh {

namespace {

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* ct) {
        OGRCoordinateTransformation::DestroyCT(ct);
    }
};

} // anonymous namespace

LineString CoordinateReprojector::reproject(const LineString& line, const std::string& src_crs,
                                            const std::string& dst_crs) const {
    return LineString(reproject(line.coords, src_crs, dst_crs));
}

Polygon CoordinateReprojector::reproject(const Polygon& polygon, const std::string& src_crs,
                                         const std::string& dst_crs) const {
    Polygon result;
    for (const auto& ring : polygon.rings) {
        result.rings.push_back(reproject(ring, src_crs, dst_crs));
    }
    return result;
}

OgrReprojector::OgrReprojector() : logger_("OgrReprojector") {
}

std::vector<Point2D> OgrReprojector::reproject(const std::vector<Point2D>& points,
                                               const std::string& src_crs,
                                               const std::string& dst_crs) const {
    if (points.empty() || src_crs.empty() || dst_crs.empty() || src_crs == dst_crs) {
        return points;
    }

    OGRSpatialReference src = make_spatial_reference(src_crs);
    OGRSpatialReference dst = make_spatial_reference(dst_crs);
    if (src.IsSame(&dst)) {
        return points;
    }

    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter> transform(
        OGRCreateCoordinateTransformation(&src, &dst));
    if (!transform) {
        throw RasterError("no transformation from '" + src_crs + "' to '" + dst_crs + "'");
    }

    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const auto& p : points) {
        xs.push_back(p.x());
        ys.push_back(p.y());
    }

    if (!transform->Transform(static_cast<int>(points.size()), xs.data(), ys.data())) {
        throw RasterError("reprojection from '" + src_crs + "' to '" + dst_crs + "' failed");
    }

    std::vector<Point2D> result;
    result.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        result.emplace_back(xs[i], ys[i]);
    }
    logger_.trace("Reprojected " + std::to_string(points.size()) + " points");
    return result;
}

} // namespace hydromesh
