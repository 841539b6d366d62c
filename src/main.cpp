/**
 * @file main.cpp
 * @brief Main entry point for the hydromesh driver
 *
 * Loads hydrologic units and river reaches, cleans them into a mutually
 * consistent boundary and river network, triangulates, optionally drapes
 * the mesh onto a DEM and writes the requested outputs.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "hydromesh.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "core/CgalTriangulationKernel.hpp"
#include "core/CoordinateReprojector.hpp"
#include "core/FileShapeSource.hpp"
#include "core/Geometry.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/OgrGeometryKernel.hpp"
#include "core/Workflow.hpp"
#include <algorithm>
#include <chrono>
#include <tuple>

using namespace hydromesh;

namespace {

/**
 * @brief Check the run has the inputs it needs before touching any data
 */
void check_inputs(const RunConfig& config) {
    if (config.hucs_path.empty() && config.shapes_path.empty()) {
        throw ConfigurationError("no input polygons given; use --hucs or --shapes (or the job file)");
    }
    if (!config.hucs_path.empty() && !config.shapes_path.empty()) {
        throw ConfigurationError("--hucs and --shapes are alternatives; give only one");
    }
    if (config.shapes_path.empty() && config.huc.empty() && !config.level) {
        throw ConfigurationError("give --huc, --level or both to select hydrologic units");
    }
    if (config.shape_index && config.shapes_path.empty()) {
        throw ConfigurationError("--shape-index needs --shapes");
    }
    if (!config.color_raster.empty() && !config.options.pixel_size) {
        throw ConfigurationError("--color-raster needs --pixel-size");
    }
    InputValidator().validate_or_throw(config.options);
}

RunProducts run_pipeline(const RunConfig& config, const Logger& logger) {
    OgrReprojector reprojector;
    OgrGeometryKernel geometry;
    CgalTriangulationKernel mesher;

    FileSourceConfig source_config;
    source_config.hucs_path = config.hucs_path;
    source_config.shapes_path = config.shapes_path;
    source_config.reaches_path = config.reaches_path;
    source_config.dem_path = config.dem_path;
    FileShapeSource source(source_config, reprojector);

    Workflow workflow(source, reprojector, geometry, mesher, config.workflow);
    const std::string& crs = config.working_crs();

    std::string hucs_crs;
    SplitBoundary hucs;
    if (!config.shapes_path.empty()) {
        ShapeFilter filter;
        filter.index = config.shape_index;
        std::tie(hucs_crs, hucs) = workflow.get_split_form_shapes(filter, crs);
    } else {
        std::tie(hucs_crs, hucs) = workflow.get_split_form_hucs(config.huc, config.level, crs);
    }
    if (hucs.empty()) {
        throw SearchError("no polygons matched in '" +
                          (config.shapes_path.empty() ? config.hucs_path : config.shapes_path) + "'");
    }

    RunProducts products;
    products.crs = hucs_crs;
    const std::vector<Polygon> original = hucs.polygons();

    MultiLineString reaches;
    if (!config.reaches_path.empty()) {
        reaches = workflow.get_reaches(config.huc, bounds_of(original), hucs_crs).second;
    }

    CleanerResult cleaned = workflow.simplify_and_prune(hucs, reaches, config.options.cleaner);
    products.mesh = workflow.triangulate(hucs, cleaned.forest, config.options.triangulation);
    logger.info("Mesh has " + std::to_string(products.mesh.num_vertices()) + " vertices and " +
                std::to_string(products.mesh.num_triangles()) + " triangles");

    if (!config.dem_path.empty()) {
        std::vector<Polygon> outline = geometry.union_polygons(hucs.polygons());
        if (outline.empty()) {
            throw GeometryKernelError("union of the hydrologic units is empty");
        }
        const Polygon& basin = *std::max_element(outline.begin(), outline.end(),
            [](const Polygon& a, const Polygon& b) { return polygon_area(a) < polygon_area(b); });
        Raster dem = workflow.get_raster_on_shape(basin, hucs_crs);
        products.elevated = workflow.elevate(products.mesh, hucs_crs, dem, config.interpolation);
    }

    products.hucs = hucs.polygons();
    return products;
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger logger("hydromesh");

    try {
        CommandLineInterface cli;
        cli.set_workflow_defaults(ConfigurationManager::load_default_config());

        if (!cli.parse_arguments(argc, argv)) {
            return cli.help_shown() ? 0 : 1;
        }
        const RunConfig& config = cli.get_config();

        Logger::parseLogConfig(config.workflow.log_config);
        if (!Logger::setLogFile(config.workflow.log_file)) {
            logger.warning("Could not open log file " + config.workflow.log_file.value_or(""));
        }
        cli.print_config();

        check_inputs(config);

        if (config.dry_run) {
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        RunProducts products = run_pipeline(config, logger);

        ExportOrchestrator exporter(config);
        if (!exporter.export_all(products)) {
            logger.error("Export failed");
            return 1;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        logger.info("");
        logger.info("Completed successfully in " + std::to_string(total_duration.count()) + "ms");
        return 0;

    } catch (const ConfigurationError& e) {
        logger.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
