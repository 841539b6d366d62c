/**
 * @file RasterExporter.cpp
 * @brief Implementation of GeoTIFF export with georeferencing
 */

#include "RasterExporter.hpp"
#include "../core/GdalSupport.hpp"
#include "../core/Logger.hpp"
#include <cpl_string.h>
#include <vector>

namespace hydromesh {

RasterExporter::RasterExporter()
    : options_() {
    register_gdal_drivers();
}

RasterExporter::RasterExporter(const Options& options)
    : options_(options) {
    register_gdal_drivers();
}

const char* RasterExporter::get_compression_option() const {
    switch (options_.compression) {
        case Options::Compression::NONE:
            return "NONE";
        case Options::Compression::LZW:
            return "LZW";
        case Options::Compression::DEFLATE:
            return "DEFLATE";
        default:
            return "DEFLATE";
    }
}

bool RasterExporter::export_geotiff(const Raster& raster, const std::string& filename) const {
    Logger logger("RasterExporter");

    const size_t expected = static_cast<size_t>(raster.profile.width) * raster.profile.height;
    if (expected == 0 || raster.data.size() != expected) {
        logger.error("Raster data does not match its " + std::to_string(raster.profile.width) + "x" +
                     std::to_string(raster.profile.height) + " profile");
        return false;
    }

    // Stage the grid in memory (georeferenced), then copy out to GeoTIFF
    GDALDatasetPtr source;
    try {
        source = mem_dataset_from_raster(raster);
    } catch (const RasterError& e) {
        logger.error("Failed to stage raster for " + filename + ": " + e.what());
        return false;
    }

    GDALDriver* gtiff_driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!gtiff_driver) {
        logger.error("GeoTIFF driver not available");
        return false;
    }

    char** options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", get_compression_option());
    if (options_.tiled) {
        options = CSLSetNameValue(options, "TILED", "YES");
        options = CSLSetNameValue(options, "BLOCKXSIZE", "256");
        options = CSLSetNameValue(options, "BLOCKYSIZE", "256");
    }

    GDALDatasetPtr gtiff_dataset(gtiff_driver->CreateCopy(
        filename.c_str(),
        source.get(),
        FALSE,      // Not strict
        options,    // Creation options
        nullptr,    // Progress function
        nullptr     // Progress data
    ));

    CSLDestroy(options);

    if (!gtiff_dataset) {
        logger.error("Failed to create GeoTIFF file: " + filename);
        return false;
    }

    logger.info("Exported GeoTIFF: " + filename + " (" +
                std::to_string(raster.profile.width) + "x" +
                std::to_string(raster.profile.height) + ")");
    return true;
}

} // namespace hydromesh
