/**
 * @file ExportOrchestrator.cpp
 * @brief Orchestrates export operations for a finished run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "../core/Geometry.hpp"
#include "../core/RasterSampler.hpp"
#include "../export/MeshExporter.hpp"
#include "../export/RasterExporter.hpp"

namespace hydromesh {

namespace {

constexpr double kColorNodata = -1.0;

} // anonymous namespace

ExportOrchestrator::ExportOrchestrator(const RunConfig& config)
    : config_(config), logger_("ExportOrchestrator") {
}

Raster ExportOrchestrator::huc_color_raster(const std::vector<Polygon>& hucs, double pixel_size,
                                            const std::string& crs) {
    std::vector<double> colors;
    colors.reserve(hucs.size());
    for (size_t i = 0; i < hucs.size(); ++i) {
        colors.push_back(static_cast<double>(i));
    }
    return RasterSampler::color_raster_from_shapes(bounds_of(hucs), pixel_size, hucs, colors,
                                                   crs, kColorNodata);
}

bool ExportOrchestrator::export_all(const RunProducts& products) {
    bool success = true;

    if (!config_.output.empty()) {
        logger_.info("");
        logger_.info("Writing mesh");
        logger_.info(std::string(30, '-'));

        MeshExporter exporter;
        const bool exported = products.elevated
            ? exporter.export_mesh(*products.elevated, products.crs, config_.output)
            : exporter.export_mesh(products.mesh, products.crs, config_.output);
        if (!exported) {
            logger_.error("Mesh export to " + config_.output + " failed");
            success = false;
        }
    }

    if (!config_.color_raster.empty()) {
        if (!config_.options.pixel_size) {
            logger_.error("--color-raster needs --pixel-size");
            return false;
        }
        if (products.hucs.empty()) {
            logger_.warning("No HUCs to color; skipping " + config_.color_raster);
            return success;
        }

        Raster colored = huc_color_raster(products.hucs, *config_.options.pixel_size, products.crs);
        RasterExporter exporter;
        if (!exporter.export_geotiff(colored, config_.color_raster)) {
            logger_.error("Color raster export to " + config_.color_raster + " failed");
            success = false;
        }
    }

    return success;
}

} // namespace hydromesh
