/**
 * @file Workflow.cpp
 * @brief High-level pipeline entry points over a ShapeSource and the core stages
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Workflow.hpp"
#include "GdalSupport.hpp"
#include "Geometry.hpp"
#include "OgrGeometryKernel.hpp"

#include <gdal_alg.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace hydromesh {

namespace {

constexpr double kPi = 3.14159265358979323846;

void banner(const Logger& logger, const std::string& title) {
    logger.info("");
    logger.info(title);
    logger.info(std::string(30, '-'));
}

const Polygon& largest(const std::vector<Polygon>& polygons) {
    return *std::max_element(polygons.begin(), polygons.end(), [](const Polygon& a, const Polygon& b) {
        return polygon_area(a) < polygon_area(b);
    });
}

// 0 = disjoint, 1 = partially inside, 2 = fully inside
int containment(const PlanarGeometryKernel& kernel, const Polygon& shape, const Polygon& huc) {
    if (kernel.contains(huc, shape)) return 2;
    if (kernel.intersects(huc, shape)) return 1;
    return 0;
}

} // anonymous namespace

std::string huc_str(const std::string& huc) {
    const bool digits = !huc.empty() &&
        std::all_of(huc.begin(), huc.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits || huc.size() % 2 != 0 || huc.size() > 12) {
        throw SearchError("invalid HUC code '" + huc + "'");
    }
    return huc;
}

Workflow::Workflow(const ShapeSource& source,
                   const CoordinateReprojector& reprojector,
                   const PlanarGeometryKernel& geometry,
                   const ConstrainedTriangulationKernel& mesher,
                   WorkflowConfig config)
    : source_(source), reprojector_(reprojector), geometry_(geometry), mesher_(mesher),
      config_(std::move(config)), logger_("Workflow") {
}

std::pair<std::string, std::vector<HucFeature>> Workflow::get_hucs(const std::string& huc,
                                                                   std::optional<int> level,
                                                                   const std::string& crs,
                                                                   std::optional<int> digits) const {
    // An empty code selects every unit of the requested level
    const std::string code = huc.empty() ? huc : huc_str(huc);
    if (code.empty() && !level) {
        throw SearchError("a HUC level is required when no HUC code is given");
    }
    const int search_level = level.value_or(static_cast<int>(code.size()));

    banner(logger_, "Preprocessing HUC");
    logger_.info("Loading level " + std::to_string(search_level) + " HUCs in " +
                 (code.empty() ? std::string("all units") : code) + ".");

    auto [profile, hus] = source_.get_hucs(code, search_level);
    logger_.info("  found " + std::to_string(hus.size()) + " HUCs.");
    for (const auto& hu : hus) {
        logger_.info("  -- " + hu.huc);
    }

    const std::string out_crs = crs.empty() ? profile.crs : crs;
    const int round_digits = digits.value_or(config_.digits);
    for (auto& hu : hus) {
        hu.shape = reprojector_.reproject(hu.shape, profile.crs, out_crs);
        round_coordinates(hu.shape, round_digits);
    }
    return {out_crs, std::move(hus)};
}

std::pair<std::string, HucFeature> Workflow::get_huc(const std::string& huc, const std::string& crs,
                                                     std::optional<int> digits) const {
    const std::string code = huc_str(huc);
    auto [out_crs, hus] = get_hucs(code, static_cast<int>(code.size()), crs, digits);
    if (hus.size() != 1) {
        throw SearchError("expected exactly one HUC " + code + ", found " + std::to_string(hus.size()));
    }
    return {out_crs, std::move(hus.front())};
}

std::pair<std::string, SplitBoundary> Workflow::get_split_form_hucs(const std::string& huc,
                                                                    std::optional<int> level,
                                                                    const std::string& crs,
                                                                    std::optional<int> digits) const {
    auto [out_crs, hus] = get_hucs(huc, level, crs, digits);
    std::vector<Polygon> shapes;
    shapes.reserve(hus.size());
    for (auto& hu : hus) {
        shapes.push_back(std::move(hu.shape));
    }
    return {out_crs, SplitBoundary::intersect_and_split(shapes, geometry_)};
}

std::pair<std::string, std::vector<Polygon>> Workflow::get_shapes(const ShapeFilter& filter,
                                                                  const std::string& crs,
                                                                  std::optional<int> digits) const {
    banner(logger_, "Preprocessing Shapes");
    if (filter.index.has_value()) {
        logger_.info("Loading shape " + std::to_string(*filter.index));
    } else if (filter.bounds.has_value()) {
        logger_.info("Loading shapes in bounds");
    } else {
        logger_.info("Loading all shapes");
    }

    auto [profile, shapes] = source_.get_shapes(filter, crs);
    logger_.info("  found " + std::to_string(shapes.size()) + " shapes");

    const std::string out_crs = crs.empty() ? profile.crs : crs;
    const int round_digits = digits.value_or(config_.digits);
    for (auto& shape : shapes) {
        shape = reprojector_.reproject(shape, profile.crs, out_crs);
        round_coordinates(shape, round_digits);
    }
    return {out_crs, std::move(shapes)};
}

std::pair<std::string, SplitBoundary> Workflow::get_split_form_shapes(const ShapeFilter& filter,
                                                                      const std::string& crs,
                                                                      std::optional<int> digits) const {
    auto [out_crs, shapes] = get_shapes(filter, crs, digits);
    return {out_crs, SplitBoundary::intersect_and_split(shapes, geometry_)};
}

std::pair<std::string, MultiLineString> Workflow::get_reaches(const std::string& huc,
                                                              const std::optional<BoundingBox>& bounds,
                                                              const std::string& crs,
                                                              std::optional<int> digits,
                                                              std::optional<double> long_reach,
                                                              bool merge) const {
    banner(logger_, "Preprocessing Hydrography");
    logger_.info("Loading streams in HUC " + huc);
    if (bounds.has_value()) {
        logger_.info("         and/or bounds [" + std::to_string(bounds->min_x) + ", " +
                     std::to_string(bounds->min_y) + ", " + std::to_string(bounds->max_x) + ", " +
                     std::to_string(bounds->max_y) + "]");
    }

    auto [profile, reaches] = source_.get_hydro(huc, bounds, crs);
    logger_.info("  found " + std::to_string(reaches.size()) + " reaches");

    const std::string out_crs = crs.empty() ? profile.crs : crs;
    const int round_digits = digits.value_or(config_.digits);
    MultiLineString cleaned;
    cleaned.reserve(reaches.size());
    for (auto& reach : reaches) {
        LineString local = reprojector_.reproject(reach, profile.crs, out_crs);
        round_coordinates(local, round_digits);
        remove_repeated_points(local);
        if (local.size() < 2) {
            logger_.debug("dropping reach that collapsed to a point after rounding");
            continue;
        }
        cleaned.push_back(std::move(local));
    }

    if (merge) {
        cleaned = merge_lines(cleaned, 0.0, true);
        logger_.detailed("  merged into " + std::to_string(cleaned.size()) + " reaches");
    }

    if (long_reach.has_value()) {
        const size_t before = cleaned.size();
        cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(),
                                     [&](const LineString& reach) { return reach.length() >= *long_reach; }),
                      cleaned.end());
        if (cleaned.size() != before) {
            logger_.detailed("  dropped " + std::to_string(before - cleaned.size()) +
                             " reaches longer than " + std::to_string(*long_reach));
        }
    }
    return {out_crs, std::move(cleaned)};
}

Raster Workflow::get_raster_on_shape(const Polygon& shape, const std::string& crs, double buffer,
                                     const std::string& raster_crs) const {
    banner(logger_, "Preprocessing Raster");

    Polygon grown = shape;
    if (buffer != 0.0) {
        std::vector<Polygon> buffered = geometry_.buffer({shape}, buffer);
        if (buffered.empty()) {
            throw GeometryKernelError("buffering shape by " + std::to_string(buffer) + " left nothing");
        }
        grown = largest(buffered);
    }

    logger_.info("collecting raster");
    Raster raster = source_.get_raster(grown, crs);

    if (!raster_crs.empty() && !same_crs(raster.profile.crs, raster_crs)) {
        logger_.info("warping raster to " + raster_crs);
        raster = warp_raster(raster, raster_crs);
    }
    return raster;
}

Raster Workflow::get_masked_raster_on_shape(const Polygon& shape, const std::string& crs,
                                            double nodata, double buffer) const {
    Raster raster = get_raster_on_shape(shape, crs, buffer);

    // Burn 1 into a zeroed copy of the grid wherever a pixel centre is inside the shape
    RasterProfile mask_profile = raster.profile;
    mask_profile.nodata.reset();
    GDALDatasetPtr mask_dataset = create_mem_dataset(mask_profile);

    OGRGeometryUniquePtr geometry = to_ogr(reprojector_.reproject(shape, crs, raster.profile.crs));
    OGRGeometryH handles[1] = {OGRGeometry::ToHandle(geometry.get())};
    int band_list[1] = {1};
    double burn[1] = {1.0};
    if (GDALRasterizeGeometries(GDALDataset::ToHandle(mask_dataset.get()), 1, band_list, 1, handles,
                                nullptr, nullptr, burn, nullptr, nullptr, nullptr) != CE_None) {
        throw RasterError("rasterizing the raster mask failed");
    }
    const Raster mask = read_raster(mask_dataset.get(), mask_profile, 0, 0);

    for (size_t i = 0; i < raster.data.size(); ++i) {
        if (mask.data[i] == 0.0) {
            raster.data[i] = nodata;
        }
    }
    raster.profile.nodata = nodata;

    const BoundingBox box = raster.bounds();
    logger_.info(" raster bounds = (" + std::to_string(box.min_x) + ", " + std::to_string(box.min_y) +
                 ", " + std::to_string(box.max_x) + ", " + std::to_string(box.max_y) + ")");
    return raster;
}

std::string Workflow::find_huc(const Polygon& shape, const std::string& crs, const std::string& hint,
                               double shrink_factor) const {
    const std::string code = huc_str(hint);

    // Shrink a little so a shape on a HUC boundary still tests as inside
    const double radius = std::sqrt(geometry_.area(shape) / kPi);
    std::vector<Polygon> shrunk = geometry_.buffer({shape}, -shrink_factor * radius);
    if (shrunk.empty()) {
        throw SearchError("shape vanishes when shrunk by " + std::to_string(shrink_factor * radius));
    }
    const Polygon& query = largest(shrunk);

    auto [huc_crs, hint_hu] = get_huc(code, crs);
    if (containment(geometry_, query, hint_hu.shape) != 2) {
        throw SearchError("shape not found in hinted HUC '" + code + "'");
    }
    return find_in(query, crs, code);
}

std::string Workflow::find_in(const Polygon& shape, const std::string& crs, const std::string& hint) const {
    logger_.debug("searching: " + hint);
    const int search_level = static_cast<int>(hint.size()) + 2;
    if (search_level > source_.lowest_level()) {
        return hint;
    }

    auto [profile, subhus] = source_.get_hucs(hint, search_level);
    if (subhus.empty()) {
        logger_.debug("  no level-" + std::to_string(search_level) + " units below " + hint);
        return hint;
    }
    for (const auto& subhu : subhus) {
        const Polygon local = reprojector_.reproject(subhu.shape, profile.crs, crs);
        switch (containment(geometry_, shape, local)) {
        case 2:
            logger_.debug("  subhuc: " + subhu.huc + " contains");
            return find_in(shape, crs, subhu.huc);
        case 1:
            logger_.debug("  subhuc: " + subhu.huc + " partially contains");
            return hint;
        default:
            logger_.debug("  subhuc: " + subhu.huc + " does not contain");
            break;
        }
    }
    throw SearchError("no level-" + std::to_string(search_level) + " HUC in '" + hint +
                      "' intersects the shape");
}

CleanerResult Workflow::simplify_and_prune(SplitBoundary& hucs, const MultiLineString& reaches,
                                           const CleanerOptions& options) const {
    TopologyCleaner cleaner(geometry_);
    return cleaner.simplify_and_prune(hucs, reaches, options);
}

Mesh2D Workflow::triangulate(const SplitBoundary& hucs, const RiverForest& rivers,
                             const TriangulationOptions& options) const {
    Triangulator triangulator(geometry_, mesher_);
    return triangulator.triangulate(hucs, rivers, options);
}

Mesh3D Workflow::elevate(const Mesh2D& mesh, const std::string& mesh_crs, const Raster& dem,
                         Interpolation algorithm) const {
    RasterSampler sampler(reprojector_);
    return sampler.elevate(mesh, mesh_crs, dem, algorithm);
}

} // namespace hydromesh
