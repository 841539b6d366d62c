/**
 * @file RasterSampler.cpp
 * @brief Raster value sampling, mesh elevation and shape rasterization
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterSampler.hpp"
#include "GdalSupport.hpp"
#include "OgrGeometryKernel.hpp"

#include <gdal.h>
#include <gdal_alg.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace hydromesh {

namespace {

std::array<double, 6> inverse_geotransform(const RasterProfile& profile) {
    std::array<double, 6> gt = profile.geotransform;
    std::array<double, 6> inv{};
    if (!GDALInvGeoTransform(gt.data(), inv.data())) {
        throw RasterError("raster geotransform is not invertible");
    }
    return inv;
}

// Continuous (column, row) of a world point; pixel (c, r) spans [c, c+1) x [r, r+1)
std::pair<double, double> to_pixel(const std::array<double, 6>& inv, const Point2D& p) {
    return {inv[0] + p.x() * inv[1] + p.y() * inv[2],
            inv[3] + p.x() * inv[4] + p.y() * inv[5]};
}

double nodata_or_nan(const Raster& raster) {
    return raster.profile.nodata.value_or(std::numeric_limits<double>::quiet_NaN());
}

double nearest_at(const Raster& raster, double col_f, double row_f) {
    const double col = std::floor(col_f);
    const double row = std::floor(row_f);
    if (col < 0 || row < 0 || col >= raster.profile.width || row >= raster.profile.height) {
        return nodata_or_nan(raster);
    }
    return raster.at(static_cast<int>(row), static_cast<int>(col));
}

// Pixel-centre coordinates this close to an integer are taken to lie on it
constexpr double kCentreSnap = 1.e-9;

// Lower neighbour index and weight along one axis of pixel-centre coordinates
std::pair<int, double> bracket(double centre_coord, int size) {
    if (size <= 1) return {0, 0.0};
    const double nearest = std::round(centre_coord);
    if (std::abs(centre_coord - nearest) < kCentreSnap) {
        centre_coord = nearest;
    }
    const double clamped = std::clamp(centre_coord, 0.0, static_cast<double>(size - 1));
    const int lower = std::min(static_cast<int>(std::floor(clamped)), size - 2);
    return {lower, clamped - lower};
}

double bilinear_at(const Raster& raster, double col_f, double row_f) {
    const int width = raster.profile.width;
    const int height = raster.profile.height;
    if (width <= 0 || height <= 0) {
        return nodata_or_nan(raster);
    }

    auto [c0, tx] = bracket(col_f - 0.5, width);
    auto [r0, ty] = bracket(row_f - 0.5, height);
    const int c1 = std::min(c0 + 1, width - 1);
    const int r1 = std::min(r0 + 1, height - 1);

    const double top = (1.0 - tx) * raster.at(r0, c0) + tx * raster.at(r0, c1);
    const double bottom = (1.0 - tx) * raster.at(r1, c0) + tx * raster.at(r1, c1);
    return (1.0 - ty) * top + ty * bottom;
}

} // anonymous namespace

Interpolation parse_interpolation(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "nearest") return Interpolation::Nearest;
    if (lowered == "bilinear" || lowered == "piecewise bilinear") return Interpolation::Bilinear;
    throw RasterError("unknown interpolation algorithm '" + name + "'");
}

std::string interpolation_name(Interpolation algorithm) {
    return algorithm == Interpolation::Nearest ? "nearest" : "piecewise bilinear";
}

RasterSampler::RasterSampler(const CoordinateReprojector& reprojector)
    : reprojector_(reprojector), logger_("RasterSampler") {
}

double RasterSampler::sample_nearest(const Raster& raster, const Point2D& point) {
    auto [col, row] = to_pixel(inverse_geotransform(raster.profile), point);
    return nearest_at(raster, col, row);
}

double RasterSampler::sample_bilinear(const Raster& raster, const Point2D& point) {
    auto [col, row] = to_pixel(inverse_geotransform(raster.profile), point);
    return bilinear_at(raster, col, row);
}

std::vector<double> RasterSampler::values_from_raster(const std::vector<Point2D>& points,
                                                      const std::string& points_crs,
                                                      const Raster& raster,
                                                      Interpolation algorithm) const {
    if (raster.data.size() != static_cast<size_t>(raster.profile.width) * raster.profile.height) {
        throw RasterError("raster data does not match its " + std::to_string(raster.profile.width) +
                          "x" + std::to_string(raster.profile.height) + " profile");
    }

    std::vector<Point2D> local = reprojector_.reproject(points, points_crs, raster.profile.crs);
    const auto inv = inverse_geotransform(raster.profile);

    std::vector<double> values;
    values.reserve(local.size());
    for (const auto& p : local) {
        auto [col, row] = to_pixel(inv, p);
        values.push_back(algorithm == Interpolation::Nearest ? nearest_at(raster, col, row)
                                                             : bilinear_at(raster, col, row));
    }
    logger_.debug("Sampled " + std::to_string(values.size()) + " points using " +
                  interpolation_name(algorithm));
    return values;
}

Mesh3D RasterSampler::elevate(const Mesh2D& mesh, const std::string& mesh_crs,
                              const Raster& dem, Interpolation algorithm) const {
    logger_.info("");
    logger_.info("Elevating Triangulation to DEM");
    logger_.info(std::string(30, '-'));

    std::vector<double> z = values_from_raster(mesh.vertices, mesh_crs, dem, algorithm);

    Mesh3D elevated;
    elevated.triangles = mesh.triangles;
    elevated.vertices.reserve(mesh.vertices.size());
    size_t missing = 0;
    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        if (std::isnan(z[i]) || (dem.profile.nodata && z[i] == *dem.profile.nodata)) ++missing;
        elevated.vertices.emplace_back(mesh.vertices[i].x(), mesh.vertices[i].y(), z[i]);
    }
    if (missing > 0) {
        logger_.warning(std::to_string(missing) + " vertices fall on DEM nodata");
    }
    return elevated;
}

Raster RasterSampler::color_raster_from_shapes(const BoundingBox& bounds, double pixel_size,
                                               const std::vector<Polygon>& shapes,
                                               const std::vector<double>& colors,
                                               const std::string& crs, double nodata) {
    Logger logger("RasterSampler");

    if (shapes.size() != colors.size()) {
        throw RasterError("got " + std::to_string(shapes.size()) + " shapes but " +
                          std::to_string(colors.size()) + " colors");
    }
    if (pixel_size <= 0.0 || !bounds.valid()) {
        throw RasterError("color raster needs a positive pixel size and valid bounds");
    }

    const double min_x = std::floor(bounds.min_x / pixel_size) * pixel_size;
    const double min_y = std::floor(bounds.min_y / pixel_size) * pixel_size;
    const double max_x = std::ceil(bounds.max_x / pixel_size) * pixel_size;
    const double max_y = std::ceil(bounds.max_y / pixel_size) * pixel_size;

    RasterProfile profile;
    profile.crs = crs;
    profile.width = std::max(1, static_cast<int>(std::lround((max_x - min_x) / pixel_size)));
    profile.height = std::max(1, static_cast<int>(std::lround((max_y - min_y) / pixel_size)));
    profile.geotransform = {min_x, pixel_size, 0.0, max_y, 0.0, -pixel_size};
    profile.nodata = nodata;

    logger.detailed("Coloring " + std::to_string(shapes.size()) + " shapes into a " +
                    std::to_string(profile.width) + "x" + std::to_string(profile.height) + " raster");

    GDALDatasetPtr dataset = create_mem_dataset(profile);

    // One call per shape keeps painter's order: later shapes overwrite earlier ones
    int band_list[1] = {1};
    for (size_t i = 0; i < shapes.size(); ++i) {
        OGRGeometryUniquePtr geometry = to_ogr(shapes[i]);
        OGRGeometryH handles[1] = {OGRGeometry::ToHandle(geometry.get())};
        double burn[1] = {colors[i]};
        CPLErr err = GDALRasterizeGeometries(GDALDataset::ToHandle(dataset.get()), 1, band_list,
                                             1, handles, nullptr, nullptr, burn,
                                             nullptr, nullptr, nullptr);
        if (err != CE_None) {
            throw RasterError("rasterizing shape " + std::to_string(i) + " failed");
        }
    }

    return read_raster(dataset.get(), profile, 0, 0);
}

} // namespace hydromesh
