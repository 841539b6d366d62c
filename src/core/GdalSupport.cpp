/**
 * @file GdalSupport.cpp
 * @brief GDAL dataset ownership and spatial reference helpers
 */

#include "GdalSupport.hpp"

#include <cpl_conv.h>

#include <mutex>
#include <vector>

namespace hydromesh {

void register_gdal_drivers() {
    static std::once_flag once;
    std::call_once(once, []() { GDALAllRegister(); });
}

OGRSpatialReference make_spatial_reference(const std::string& crs) {
    OGRSpatialReference srs;
    if (srs.SetFromUserInput(crs.c_str()) != OGRERR_NONE) {
        throw RasterError("unknown coordinate reference system '" + crs + "'");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

std::string crs_to_wkt(const std::string& crs) {
    if (crs.empty()) return "";
    OGRSpatialReference srs = make_spatial_reference(crs);
    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE || wkt == nullptr) {
        CPLFree(wkt);
        throw RasterError("cannot export '" + crs + "' to WKT");
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

bool same_crs(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return a.empty() && b.empty();
    if (a == b) return true;
    OGRSpatialReference sa = make_spatial_reference(a);
    OGRSpatialReference sb = make_spatial_reference(b);
    return sa.IsSame(&sb) != 0;
}

GDALDatasetPtr create_mem_dataset(const RasterProfile& profile) {
    register_gdal_drivers();

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!mem_driver) {
        throw RasterError("GDAL MEM driver not available");
    }

    GDALDatasetPtr dataset(mem_driver->Create("", profile.width, profile.height, 1, GDT_Float64, nullptr));
    if (!dataset) {
        throw RasterError("failed to create " + std::to_string(profile.width) + "x" +
                          std::to_string(profile.height) + " MEM dataset");
    }

    std::array<double, 6> gt = profile.geotransform;
    if (dataset->SetGeoTransform(gt.data()) != CE_None) {
        throw RasterError("failed to set geotransform on MEM dataset");
    }
    if (!profile.crs.empty()) {
        const std::string wkt = crs_to_wkt(profile.crs);
        if (dataset->SetProjection(wkt.c_str()) != CE_None) {
            throw RasterError("failed to set projection on MEM dataset");
        }
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    const double fill = profile.nodata.value_or(0.0);
    if (profile.nodata.has_value()) {
        band->SetNoDataValue(*profile.nodata);
    }
    if (band->Fill(fill) != CE_None) {
        throw RasterError("failed to initialize MEM dataset");
    }
    return dataset;
}

Raster read_raster(GDALDataset* dataset, const RasterProfile& profile, int x_offset, int y_offset) {
    Raster raster;
    raster.profile = profile;
    raster.data.resize(static_cast<size_t>(profile.width) * profile.height);

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw RasterError("dataset has no raster band");
    }
    CPLErr err = band->RasterIO(GF_Read, x_offset, y_offset, profile.width, profile.height,
                                raster.data.data(), profile.width, profile.height,
                                GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw RasterError("failed to read " + std::to_string(profile.width) + "x" +
                          std::to_string(profile.height) + " window at (" +
                          std::to_string(x_offset) + ", " + std::to_string(y_offset) + ")");
    }
    return raster;
}

GDALDatasetPtr mem_dataset_from_raster(const Raster& raster) {
    const RasterProfile& profile = raster.profile;
    if (raster.data.size() != static_cast<size_t>(profile.width) * profile.height) {
        throw RasterError("raster data does not match its " + std::to_string(profile.width) + "x" +
                          std::to_string(profile.height) + " profile");
    }

    GDALDatasetPtr dataset = create_mem_dataset(profile);
    std::vector<double> samples = raster.data;
    if (dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, profile.width, profile.height,
                                            samples.data(), profile.width, profile.height,
                                            GDT_Float64, 0, 0) != CE_None) {
        throw RasterError("failed to write raster samples to MEM dataset");
    }
    return dataset;
}

Raster warp_raster(const Raster& raster, const std::string& dst_crs, GDALResampleAlg resampling) {
    if (raster.profile.crs.empty() || dst_crs.empty()) {
        throw RasterError("warping a raster needs both its CRS and a destination CRS");
    }

    GDALDatasetPtr source = mem_dataset_from_raster(raster);
    const std::string src_wkt = crs_to_wkt(raster.profile.crs);
    const std::string dst_wkt = crs_to_wkt(dst_crs);

    // The warped VRT reads from source, so it must close first
    GDALDatasetPtr warped(static_cast<GDALDataset*>(GDALAutoCreateWarpedVRT(
        GDALDataset::ToHandle(source.get()), src_wkt.c_str(), dst_wkt.c_str(), resampling, 0.0, nullptr)));
    if (!warped) {
        throw RasterError("failed to warp raster to '" + dst_crs + "'");
    }

    RasterProfile profile;
    profile.crs = dst_crs;
    profile.width = warped->GetRasterXSize();
    profile.height = warped->GetRasterYSize();
    profile.nodata = raster.profile.nodata;
    std::array<double, 6> gt{};
    if (warped->GetGeoTransform(gt.data()) != CE_None) {
        throw RasterError("warped raster has no geotransform");
    }
    profile.geotransform = gt;

    return read_raster(warped.get(), profile, 0, 0);
}

} // namespace hydromesh
