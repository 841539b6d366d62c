/**
 * @file MeshExporter.cpp
 * @brief Implementation of triangle mesh export
 */

#include "MeshExporter.hpp"
#include "../core/Logger.hpp"
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <type_traits>

namespace hydromesh {

namespace {

template <typename Vertex>
OGRPolygon* triangle_to_ogr(const std::vector<Vertex>& vertices, const TriangleIndices& tri,
                            bool with_z) {
    OGRPolygon* polygon = new OGRPolygon();
    OGRLinearRing* ring = new OGRLinearRing();
    for (size_t k = 0; k <= 3; ++k) {
        const Vertex& v = vertices[tri[k % 3]];
        if constexpr (std::is_same_v<Vertex, Point3D>) {
            if (with_z) {
                ring->addPoint(v.x(), v.y(), v.z());
                continue;
            }
        }
        ring->addPoint(v.x(), v.y());
    }
    polygon->addRingDirectly(ring);
    return polygon;
}

} // anonymous namespace

MeshExporter::MeshExporter()
    : options_() {
    register_gdal_drivers();
}

MeshExporter::MeshExporter(const Options& options)
    : options_(options) {
    register_gdal_drivers();
}

std::optional<std::string> MeshExporter::driver_for(const std::string& filename) {
    static const std::map<std::string, std::string> drivers = {
        {".shp", "ESRI Shapefile"},
        {".gpkg", "GPKG"},
        {".geojson", "GeoJSON"},
        {".json", "GeoJSON"},
        {".gml", "GML"},
        {".kml", "KML"},
        {".sqlite", "SQLite"}
    };

    std::string extension = std::filesystem::path(filename).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = drivers.find(extension);
    if (it == drivers.end()) {
        return std::nullopt;
    }
    return it->second;
}

GDALDatasetPtr MeshExporter::create_dataset(const std::string& filename, const std::string& crs,
                                            OGRwkbGeometryType geometry_type, OGRLayer*& layer) const {
    Logger logger("MeshExporter");

    auto driver_name = driver_for(filename);
    if (!driver_name) {
        logger.error("No vector driver for '" + filename + "'; use .shp, .gpkg, .geojson, .gml, .kml or .sqlite");
        return nullptr;
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name->c_str());
    if (!driver) {
        logger.error(*driver_name + " driver not available");
        return nullptr;
    }

    if (options_.overwrite && std::filesystem::exists(filename)) {
        if (driver->Delete(filename.c_str()) != CE_None) {
            logger.error("Failed to replace existing file: " + filename);
            return nullptr;
        }
    }

    GDALDatasetPtr dataset(driver->Create(filename.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        logger.error("Failed to create " + *driver_name + " dataset: " + filename);
        return nullptr;
    }

    OGRSpatialReference srs;
    OGRSpatialReference* srs_ptr = nullptr;
    if (!crs.empty()) {
        srs = make_spatial_reference(crs);
        srs_ptr = &srs;
    }

    layer = dataset->CreateLayer(options_.layer_name.c_str(), srs_ptr, geometry_type, nullptr);
    if (!layer) {
        logger.error("Failed to create layer");
        return nullptr;
    }

    OGRFieldDefn id_field(options_.id_field_name.c_str(), OFTInteger64);
    if (layer->CreateField(&id_field) != OGRERR_NONE) {
        logger.error("Failed to create field " + options_.id_field_name);
        return nullptr;
    }
    if (geometry_type == wkbPolygon25D) {
        OGRFieldDefn elevation_field(options_.elevation_field_name.c_str(), OFTReal);
        if (layer->CreateField(&elevation_field) != OGRERR_NONE) {
            logger.error("Failed to create field " + options_.elevation_field_name);
            return nullptr;
        }
    }
    return dataset;
}

bool MeshExporter::export_mesh(const Mesh2D& mesh, const std::string& crs,
                               const std::string& filename) const {
    Logger logger("MeshExporter");

    OGRLayer* layer = nullptr;
    GDALDatasetPtr dataset = create_dataset(filename, crs, wkbPolygon, layer);
    if (!dataset) {
        return false;
    }

    size_t failed = 0;
    for (size_t i = 0; i < mesh.triangles.size(); ++i) {
        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetGeometryDirectly(triangle_to_ogr(mesh.vertices, mesh.triangles[i], false));
        feature->SetField(options_.id_field_name.c_str(), static_cast<GIntBig>(i));
        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            ++failed;
        }
    }

    if (failed > 0) {
        logger.error("Failed to write " + std::to_string(failed) + " of " +
                     std::to_string(mesh.triangles.size()) + " triangles to " + filename);
        return false;
    }
    logger.info("Exported mesh: " + filename + " (" + std::to_string(mesh.triangles.size()) + " triangles)");
    return true;
}

bool MeshExporter::export_mesh(const Mesh3D& mesh, const std::string& crs,
                               const std::string& filename) const {
    Logger logger("MeshExporter");

    OGRLayer* layer = nullptr;
    GDALDatasetPtr dataset = create_dataset(filename, crs, wkbPolygon25D, layer);
    if (!dataset) {
        return false;
    }

    size_t failed = 0;
    for (size_t i = 0; i < mesh.triangles.size(); ++i) {
        const TriangleIndices& tri = mesh.triangles[i];
        const double mean_z = (mesh.vertices[tri[0]].z() + mesh.vertices[tri[1]].z() +
                               mesh.vertices[tri[2]].z()) / 3.0;

        OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer->GetLayerDefn()));
        feature->SetGeometryDirectly(triangle_to_ogr(mesh.vertices, tri, true));
        feature->SetField(options_.id_field_name.c_str(), static_cast<GIntBig>(i));
        feature->SetField(options_.elevation_field_name.c_str(), mean_z);
        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
            ++failed;
        }
    }

    if (failed > 0) {
        logger.error("Failed to write " + std::to_string(failed) + " of " +
                     std::to_string(mesh.triangles.size()) + " triangles to " + filename);
        return false;
    }
    logger.info("Exported elevated mesh: " + filename + " (" +
                std::to_string(mesh.triangles.size()) + " triangles)");
    return true;
}

} // namespace hydromesh
