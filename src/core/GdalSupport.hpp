/**
 * @file GdalSupport.hpp
 * @brief GDAL dataset ownership and spatial reference helpers shared by I/O code
 */

#pragma once

#include "hydromesh.hpp"

#include <gdal_priv.h>
#include <gdalwarper.h>
#include <ogr_spatialref.h>

#include <memory>
#include <string>

namespace hydromesh {

/**
 * @brief Custom deleter for GDALDataset (RAII)
 */
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief GDALAllRegister() exactly once per process
 */
void register_gdal_drivers();

/**
 * @brief Spatial reference from any GDAL user input (EPSG code, WKT, PROJ string)
 *
 * Axis order is traditional GIS (x = easting/longitude).
 * @throws RasterError if the definition is not understood
 */
OGRSpatialReference make_spatial_reference(const std::string& crs);

/**
 * @brief WKT for a CRS definition; empty input yields empty output
 */
std::string crs_to_wkt(const std::string& crs);

/**
 * @brief True when both definitions describe the same CRS (both empty counts as same)
 */
bool same_crs(const std::string& a, const std::string& b);

/**
 * @brief Single-band Float64 in-memory dataset matching the profile
 *
 * Pixels are initialized to the nodata value when set, otherwise zero.
 * @throws RasterError on creation failure
 */
GDALDatasetPtr create_mem_dataset(const RasterProfile& profile);

/**
 * @brief Read band 1 of a dataset as a Raster
 */
Raster read_raster(GDALDataset* dataset, const RasterProfile& profile, int x_offset, int y_offset);

/**
 * @brief MEM dataset holding a copy of the raster's samples
 * @throws RasterError on creation or write failure
 */
GDALDatasetPtr mem_dataset_from_raster(const Raster& raster);

/**
 * @brief Raster resampled onto a grid in another CRS
 *
 * The output grid is the one GDAL suggests for the destination CRS.
 * Pixels the source does not cover hold nodata, or zero without one.
 *
 * @throws RasterError if either CRS is missing or the warp fails
 */
Raster warp_raster(const Raster& raster, const std::string& dst_crs,
                   GDALResampleAlg resampling = GRA_NearestNeighbour);

} // namespace hydromesh
