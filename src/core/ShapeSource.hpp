/**
 * @file ShapeSource.hpp
 * @brief Data provider capability for HUC polygons, river reaches and rasters
 */

#pragma once

#include "hydromesh.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hydromesh {

/**
 * @brief A hydrologic unit and its code
 */
struct HucFeature {
    std::string huc;
    Polygon shape;
};

/**
 * @brief Selects generic shapes: one by position, those meeting a box, or all
 */
struct ShapeFilter {
    std::optional<size_t> index;          ///< Position of the feature in the dataset
    std::optional<BoundingBox> bounds;    ///< In the CRS passed alongside the filter
};

/**
 * @brief Explicit interface implemented per data provider
 *
 * Vector results carry a profile whose only meaningful field is crs.
 */
class ShapeSource {
public:
    virtual ~ShapeSource() = default;

    /**
     * @brief All level-`level` units whose code starts with huc
     */
    virtual std::pair<RasterProfile, std::vector<HucFeature>> get_hucs(const std::string& huc,
                                                                       int level) const = 0;

    /**
     * @brief Polygons of a plain shape dataset, not keyed by HUC code
     *
     * @param crs CRS of filter.bounds
     * @throws SearchError when the dataset cannot be read or the index is out of range
     */
    virtual std::pair<RasterProfile, std::vector<Polygon>> get_shapes(const ShapeFilter& filter,
                                                                      const std::string& crs) const = 0;

    /**
     * @brief River reaches for a HUC, optionally limited to bounds given in bounds_crs
     */
    virtual std::pair<RasterProfile, MultiLineString> get_hydro(const std::string& huc,
                                                                const std::optional<BoundingBox>& bounds,
                                                                const std::string& bounds_crs) const = 0;

    /**
     * @brief Raster window covering a shape given in crs
     */
    virtual Raster get_raster(const Polygon& shape, const std::string& crs) const = 0;

    /**
     * @brief Finest HUC level the provider can deliver
     */
    virtual int lowest_level() const { return 12; }
};

} // namespace hydromesh
