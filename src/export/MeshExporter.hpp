/**
 * @file MeshExporter.hpp
 * @brief Triangle mesh export as OGR vector features
 *
 * Writes one polygon feature per triangle so meshes can be inspected in
 * desktop GIS applications like QGIS.
 */

#pragma once

#include "hydromesh.hpp"
#include "../core/GdalSupport.hpp"
#include <ogrsf_frmts.h>
#include <optional>
#include <string>

namespace hydromesh {

/**
 * @brief Exports triangulations through any OGR vector driver
 *
 * The driver is chosen from the file extension: .shp, .gpkg, .geojson,
 * .json, .gml, .kml or .sqlite.
 */
class MeshExporter {
public:
    struct Options {
        std::string layer_name;
        std::string id_field_name;
        std::string elevation_field_name;
        bool overwrite;

        Options()
            : layer_name("mesh"),
              id_field_name("tri_id"),
              elevation_field_name("elevation"),
              overwrite(true) {}
    };

    MeshExporter();
    explicit MeshExporter(const Options& options);

    /**
     * @brief Export a planar mesh as Polygon features
     * @param crs Coordinate system of the vertices (any GDAL user input)
     * @return true if export succeeded
     */
    bool export_mesh(const Mesh2D& mesh, const std::string& crs, const std::string& filename) const;

    /**
     * @brief Export an elevated mesh as Polygon25D features with mean elevation
     */
    bool export_mesh(const Mesh3D& mesh, const std::string& crs, const std::string& filename) const;

    /**
     * @brief OGR driver name for a filename, by extension
     */
    static std::optional<std::string> driver_for(const std::string& filename);

private:
    Options options_;

    // Creates the dataset and layer; null on failure (already logged)
    GDALDatasetPtr create_dataset(const std::string& filename, const std::string& crs,
                                OGRwkbGeometryType geometry_type, OGRLayer*& layer) const;
};

} // namespace hydromesh
