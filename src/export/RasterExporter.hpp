/**
 * @file RasterExporter.hpp
 * @brief GeoTIFF raster export with georeferencing
 *
 * Writes single-band rasters (color rasters, masked DEM windows) with
 * their geotransform, coordinate system and nodata value.
 */

#pragma once

#include "hydromesh.hpp"
#include <string>

namespace hydromesh {

class RasterExporter {
public:
    struct Options {
        enum class Compression {
            NONE,
            LZW,
            DEFLATE
        };

        Compression compression;
        bool tiled;

        Options()
            : compression(Compression::DEFLATE),
              tiled(true) {}
    };

    RasterExporter();
    explicit RasterExporter(const Options& options);

    /**
     * @brief Export a raster as GeoTIFF
     * @return true if export succeeded
     */
    bool export_geotiff(const Raster& raster, const std::string& filename) const;

private:
    Options options_;

    const char* get_compression_option() const;
};

} // namespace hydromesh
