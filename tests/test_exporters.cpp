// tests/test_exporters.cpp (doctest)
//
// GDAL writers for meshes and rasters, read back through GDAL.
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "core/GdalSupport.hpp"
#include "core/RasterSampler.hpp"
#include "export/MeshExporter.hpp"
#include "export/RasterExporter.hpp"

#include <gdal_priv.h>
#include <ogrsf_frmts.h>

using namespace hydromesh;
using hydromesh_test::rect;
using hydromesh_test::TempPath;

namespace exporters_test {

Mesh2D unit_square_mesh() {
    Mesh2D mesh;
    mesh.vertices = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    mesh.triangles = {TriangleIndices{0, 1, 2}, TriangleIndices{0, 2, 3}};
    return mesh;
}

GDALDatasetPtr open_vector(const std::string& path) {
    return GDALDatasetPtr(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
}

} // namespace exporters_test

using exporters_test::open_vector;
using exporters_test::unit_square_mesh;

TEST_CASE("MeshExporter picks drivers by extension") {
    CHECK(MeshExporter::driver_for("mesh.shp") == std::optional<std::string>("ESRI Shapefile"));
    CHECK(MeshExporter::driver_for("out/mesh.GPKG") == std::optional<std::string>("GPKG"));
    CHECK(MeshExporter::driver_for("mesh.geojson") == std::optional<std::string>("GeoJSON"));
    CHECK_FALSE(MeshExporter::driver_for("mesh.obj").has_value());
    CHECK_FALSE(MeshExporter::driver_for("mesh").has_value());
}

TEST_CASE("MeshExporter writes one feature per triangle") {
    TempPath out("mesh2d.geojson");
    MeshExporter exporter;
    REQUIRE(exporter.export_mesh(unit_square_mesh(), "EPSG:5070", out.str()));

    GDALDatasetPtr dataset = open_vector(out.str());
    REQUIRE(dataset);
    OGRLayer* layer = dataset->GetLayer(0);
    REQUIRE(layer != nullptr);
    CHECK(layer->GetFeatureCount() == 2);
    CHECK(layer->GetLayerDefn()->GetFieldIndex("tri_id") >= 0);

    OGRFeatureUniquePtr feature(layer->GetNextFeature());
    REQUIRE(feature);
    const OGRGeometry* geometry = feature->GetGeometryRef();
    REQUIRE(geometry != nullptr);
    CHECK(wkbFlatten(geometry->getGeometryType()) == wkbPolygon);
    CHECK(geometry->toPolygon()->get_Area() == doctest::Approx(0.5));
}

TEST_CASE("MeshExporter writes elevated triangles with their mean elevation") {
    TempPath out("mesh3d.geojson");
    Mesh3D mesh;
    mesh.vertices = {{0, 0, 1}, {1, 0, 2}, {1, 1, 6}};
    mesh.triangles = {TriangleIndices{0, 1, 2}};

    MeshExporter exporter;
    REQUIRE(exporter.export_mesh(mesh, "", out.str()));

    GDALDatasetPtr dataset = open_vector(out.str());
    REQUIRE(dataset);
    OGRLayer* layer = dataset->GetLayer(0);
    REQUIRE(layer != nullptr);
    OGRFeatureUniquePtr feature(layer->GetNextFeature());
    REQUIRE(feature);
    CHECK(feature->GetFieldAsDouble("elevation") == doctest::Approx(3.0));
    CHECK(OGR_GT_HasZ(feature->GetGeometryRef()->getGeometryType()));
}

TEST_CASE("MeshExporter refuses unknown formats") {
    MeshExporter exporter;
    CHECK_FALSE(exporter.export_mesh(unit_square_mesh(), "", "mesh.unknown"));
}

TEST_CASE("RasterExporter writes a georeferenced GeoTIFF") {
    TempPath out("colors.tif");
    Raster raster = ExportOrchestrator::huc_color_raster({rect(0, 0, 10, 10), rect(10, 0, 20, 10)}, 1.0,
                                                         "EPSG:5070");
    CHECK(raster.profile.width == 20);
    CHECK(RasterSampler::sample_nearest(raster, {5.5, 5.5}) == 0.0);
    CHECK(RasterSampler::sample_nearest(raster, {15.5, 5.5}) == 1.0);

    RasterExporter exporter;
    REQUIRE(exporter.export_geotiff(raster, out.str()));

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(out.str().c_str(), GA_ReadOnly)));
    REQUIRE(dataset);
    CHECK(dataset->GetRasterXSize() == 20);
    CHECK(dataset->GetRasterYSize() == 10);

    double gt[6];
    REQUIRE(dataset->GetGeoTransform(gt) == CE_None);
    CHECK(gt[0] == doctest::Approx(0.0));
    CHECK(gt[1] == doctest::Approx(1.0));
    CHECK(gt[3] == doctest::Approx(10.0));

    int has_nodata = 0;
    const double nodata = dataset->GetRasterBand(1)->GetNoDataValue(&has_nodata);
    CHECK(has_nodata != 0);
    CHECK(nodata == -1.0);
    CHECK(std::string(dataset->GetProjectionRef()).find("Albers") != std::string::npos);
}
