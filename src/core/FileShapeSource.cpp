/**
 * @file FileShapeSource.cpp
 * @brief ShapeSource reading local GDAL/OGR datasets
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "FileShapeSource.hpp"
#include "GdalSupport.hpp"
#include "Geometry.hpp"
#include "OgrGeometryKernel.hpp"

#include <ogrsf_frmts.h>
#include <cpl_conv.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace hydromesh {

namespace {

GDALDatasetPtr open_vector(const std::string& path) {
    register_gdal_drivers();
    return GDALDatasetPtr(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
}

std::string layer_crs(OGRLayer* layer) {
    const OGRSpatialReference* srs = layer->GetSpatialRef();
    if (!srs) return "";
    char* wkt = nullptr;
    std::string result;
    if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt != nullptr) {
        result = wkt;
    }
    CPLFree(wkt);
    return result;
}

const Polygon& largest(const std::vector<Polygon>& polygons) {
    return *std::max_element(polygons.begin(), polygons.end(), [](const Polygon& a, const Polygon& b) {
        return polygon_area(a) < polygon_area(b);
    });
}

} // anonymous namespace

FileShapeSource::FileShapeSource(const FileSourceConfig& config, const CoordinateReprojector& reprojector)
    : config_(config), reprojector_(reprojector), logger_("FileShapeSource") {
}

std::pair<RasterProfile, std::vector<HucFeature>> FileShapeSource::get_hucs(const std::string& huc,
                                                                            int level) const {
    GDALDatasetPtr dataset = open_vector(config_.hucs_path);
    if (!dataset || dataset->GetLayerCount() == 0) {
        throw SearchError("cannot open HUC dataset '" + config_.hucs_path + "'");
    }

    const std::string field = "HUC" + std::to_string(level);
    OGRLayer* layer = dataset->GetLayerByName(("WBDHU" + std::to_string(level)).c_str());
    if (!layer) {
        layer = dataset->GetLayer(0);
    }
    const int field_index = layer->GetLayerDefn()->GetFieldIndex(field.c_str());
    if (field_index < 0) {
        throw SearchError("layer '" + std::string(layer->GetName()) + "' in '" + config_.hucs_path +
                          "' has no " + field + " field");
    }

    RasterProfile profile;
    profile.crs = layer_crs(layer);

    std::map<std::string, std::vector<Polygon>> parts;
    layer->ResetReading();
    for (auto& feature : *layer) {
        const std::string code = feature->GetFieldAsString(field_index);
        if (code.compare(0, huc.size(), huc) != 0) continue;
        for (auto& polygon : polygons_from_ogr(feature->GetGeometryRef())) {
            parts[code].push_back(std::move(polygon));
        }
    }

    std::vector<HucFeature> features;
    for (auto& [code, polygons] : parts) {
        if (polygons.empty()) continue;
        if (polygons.size() > 1) {
            OGRGeometryUniquePtr dissolved(to_ogr(polygons)->UnionCascaded());
            if (!dissolved) {
                throw GeometryKernelError("dissolving HUC " + code + " failed");
            }
            polygons = polygons_from_ogr(dissolved.get());
            if (polygons.empty()) continue;
            if (polygons.size() > 1) {
                logger_.detailed("HUC " + code + " has " + std::to_string(polygons.size()) +
                                 " parts; keeping the largest");
            }
        }
        features.push_back(HucFeature{code, largest(polygons)});
    }

    logger_.detailed("Found " + std::to_string(features.size()) + " level-" + std::to_string(level) +
                     " HUCs in '" + (huc.empty() ? std::string("*") : huc) + "'");
    return {profile, features};
}

std::pair<RasterProfile, std::vector<Polygon>> FileShapeSource::get_shapes(const ShapeFilter& filter,
                                                                          const std::string& crs) const {
    GDALDatasetPtr dataset = open_vector(config_.shapes_path);
    if (!dataset || dataset->GetLayerCount() == 0) {
        throw SearchError("cannot open shape dataset '" + config_.shapes_path + "'");
    }
    OGRLayer* layer = dataset->GetLayer(0);

    RasterProfile profile;
    profile.crs = layer_crs(layer);

    if (filter.bounds.has_value() && !filter.index.has_value()) {
        const BoundingBox& b = *filter.bounds;
        std::vector<Point2D> corners{{b.min_x, b.min_y}, {b.max_x, b.min_y},
                                     {b.max_x, b.max_y}, {b.min_x, b.max_y}};
        BoundingBox local;
        for (const auto& p : reprojector_.reproject(corners, crs, profile.crs)) local.expand(p);
        layer->SetSpatialFilterRect(local.min_x, local.min_y, local.max_x, local.max_y);
    }

    std::vector<Polygon> shapes;
    size_t position = 0;
    layer->ResetReading();
    for (auto& feature : *layer) {
        const size_t current = position++;
        if (filter.index.has_value() && current != *filter.index) continue;

        std::vector<Polygon> parts = polygons_from_ogr(feature->GetGeometryRef());
        if (parts.empty()) {
            logger_.debug("Skipping feature " + std::to_string(current) + " without polygon geometry");
            continue;
        }
        if (parts.size() > 1) {
            logger_.detailed("Shape " + std::to_string(current) + " has " + std::to_string(parts.size()) +
                             " parts; keeping the largest");
        }
        shapes.push_back(largest(parts));
    }

    if (filter.index.has_value() && shapes.empty()) {
        throw SearchError("no polygon at index " + std::to_string(*filter.index) + " of " +
                          std::to_string(position) + " features in '" + config_.shapes_path + "'");
    }
    logger_.detailed("Read " + std::to_string(shapes.size()) + " shapes from '" + config_.shapes_path + "'");
    return {profile, shapes};
}

std::pair<RasterProfile, MultiLineString> FileShapeSource::get_hydro(const std::string& huc,
                                                                     const std::optional<BoundingBox>& bounds,
                                                                     const std::string& bounds_crs) const {
    GDALDatasetPtr dataset = open_vector(config_.reaches_path);
    if (!dataset || dataset->GetLayerCount() == 0) {
        throw SearchError("cannot open reach dataset '" + config_.reaches_path + "'");
    }
    OGRLayer* layer = dataset->GetLayer(0);

    RasterProfile profile;
    profile.crs = layer_crs(layer);

    int reachcode_index = -1;
    if (bounds.has_value()) {
        std::vector<Point2D> corners{{bounds->min_x, bounds->min_y}, {bounds->max_x, bounds->min_y},
                                     {bounds->max_x, bounds->max_y}, {bounds->min_x, bounds->max_y}};
        BoundingBox local;
        for (const auto& p : reprojector_.reproject(corners, bounds_crs, profile.crs)) local.expand(p);
        layer->SetSpatialFilterRect(local.min_x, local.min_y, local.max_x, local.max_y);
    } else if (!huc.empty()) {
        reachcode_index = layer->GetLayerDefn()->GetFieldIndex("REACHCODE");
    }

    MultiLineString reaches;
    layer->ResetReading();
    for (auto& feature : *layer) {
        if (reachcode_index >= 0) {
            const std::string code = feature->GetFieldAsString(reachcode_index);
            if (code.compare(0, huc.size(), huc) != 0) continue;
        }
        for (auto& line : lines_from_ogr(feature->GetGeometryRef())) {
            reaches.push_back(std::move(line));
        }
    }

    logger_.detailed("Read " + std::to_string(reaches.size()) + " reaches from '" +
                     config_.reaches_path + "'");
    return {profile, reaches};
}

Raster FileShapeSource::get_raster(const Polygon& shape, const std::string& crs) const {
    register_gdal_drivers();
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(config_.dem_path.c_str(), GA_ReadOnly)));
    if (!dataset || dataset->GetRasterCount() < 1) {
        throw RasterError("cannot open DEM '" + config_.dem_path + "'");
    }

    std::array<double, 6> gt{};
    if (dataset->GetGeoTransform(gt.data()) != CE_None) {
        throw RasterError("DEM '" + config_.dem_path + "' has no geotransform");
    }
    std::array<double, 6> inv{};
    if (!GDALInvGeoTransform(gt.data(), inv.data())) {
        throw RasterError("DEM '" + config_.dem_path + "' geotransform is not invertible");
    }

    const std::string dem_crs = dataset->GetProjectionRef() ? dataset->GetProjectionRef() : "";
    const BoundingBox box = bounds_of(reprojector_.reproject(shape, crs, dem_crs));

    double col_min = std::numeric_limits<double>::max(), col_max = std::numeric_limits<double>::lowest();
    double row_min = col_min, row_max = col_max;
    for (const Point2D& p : {Point2D(box.min_x, box.min_y), Point2D(box.max_x, box.min_y),
                             Point2D(box.max_x, box.max_y), Point2D(box.min_x, box.max_y)}) {
        const double col = inv[0] + p.x() * inv[1] + p.y() * inv[2];
        const double row = inv[3] + p.x() * inv[4] + p.y() * inv[5];
        col_min = std::min(col_min, col);
        col_max = std::max(col_max, col);
        row_min = std::min(row_min, row);
        row_max = std::max(row_max, row);
    }

    const int col0 = std::max(0, static_cast<int>(std::floor(col_min)));
    const int row0 = std::max(0, static_cast<int>(std::floor(row_min)));
    const int col1 = std::min(dataset->GetRasterXSize(), static_cast<int>(std::ceil(col_max)));
    const int row1 = std::min(dataset->GetRasterYSize(), static_cast<int>(std::ceil(row_max)));
    if (col1 <= col0 || row1 <= row0) {
        throw RasterError("shape does not overlap DEM '" + config_.dem_path + "'");
    }

    RasterProfile profile;
    profile.crs = dem_crs;
    profile.width = col1 - col0;
    profile.height = row1 - row0;
    profile.geotransform = {gt[0] + col0 * gt[1] + row0 * gt[2], gt[1], gt[2],
                            gt[3] + col0 * gt[4] + row0 * gt[5], gt[4], gt[5]};
    int has_nodata = 0;
    const double nodata = dataset->GetRasterBand(1)->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        profile.nodata = nodata;
    }

    logger_.detailed("Reading " + std::to_string(profile.width) + "x" + std::to_string(profile.height) +
                     " DEM window at (" + std::to_string(col0) + ", " + std::to_string(row0) + ")");
    return read_raster(dataset.get(), profile, col0, row0);
}

} // namespace hydromesh
