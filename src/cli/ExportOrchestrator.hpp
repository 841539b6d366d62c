/**
 * @file ExportOrchestrator.hpp
 * @brief Orchestrates export operations for a finished run
 *
 * Hands the mesh and the HUC color raster to the GDAL writers requested
 * by the run configuration, keeping the pipeline free of output logic.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "hydromesh.hpp"
#include "CommandLineInterface.hpp"
#include "../core/Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hydromesh {

/**
 * @brief Results of one run that may be exported
 */
struct RunProducts {
    std::string crs;
    Mesh2D mesh;
    std::optional<Mesh3D> elevated;
    std::vector<Polygon> hucs;
};

/**
 * @brief Exports run products to every configured output
 */
class ExportOrchestrator {
public:
    explicit ExportOrchestrator(const RunConfig& config);

    /**
     * @brief Export to all configured outputs
     * @return true if all exports succeeded, false if any failed
     */
    bool export_all(const RunProducts& products);

    /**
     * @brief HUC i painted with color i over the HUCs' bounds
     */
    static Raster huc_color_raster(const std::vector<Polygon>& hucs, double pixel_size,
                                   const std::string& crs);

private:
    const RunConfig& config_;
    Logger logger_;

    // Disable copy/move since we hold a reference
    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
    ExportOrchestrator(ExportOrchestrator&&) = delete;
    ExportOrchestrator& operator=(ExportOrchestrator&&) = delete;
};

} // namespace hydromesh
