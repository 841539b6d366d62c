/**
 * @file OgrGeometryKernel.hpp
 * @brief PlanarGeometryKernel backed by GDAL/OGR and its GEOS engine
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "PlanarGeometryKernel.hpp"
#include "Logger.hpp"

#include <ogr_geometry.h>

namespace hydromesh {

// Conversions between hydromesh value types and OGR geometries
OGRGeometryUniquePtr to_ogr(const Polygon& polygon);
OGRGeometryUniquePtr to_ogr(const std::vector<Polygon>& polygons);
OGRGeometryUniquePtr to_ogr(const LineString& line);
OGRGeometryUniquePtr to_ogr(const MultiLineString& lines);

/**
 * @brief Polygonal parts of any OGR geometry, collections flattened
 */
std::vector<Polygon> polygons_from_ogr(const OGRGeometry* geometry);

/**
 * @brief Linear parts of any OGR geometry; points and areas are dropped
 */
MultiLineString lines_from_ogr(const OGRGeometry* geometry);

class OgrGeometryKernel : public PlanarGeometryKernel {
public:
    /**
     * @throws GeometryKernelError if OGR was built without GEOS
     */
    OgrGeometryKernel();

    MultiLineString boundary_intersection(const Polygon& a, const Polygon& b) const override;
    MultiLineString boundary_difference(const Polygon& polygon,
                                        const MultiLineString& lines) const override;
    double boundary_overlap_length(const Polygon& polygon, const LineString& line) const override;

    std::vector<Polygon> union_polygons(const std::vector<Polygon>& polygons) const override;
    std::vector<Polygon> buffer(const std::vector<Polygon>& polygons, double distance) const override;

    bool intersects(const std::vector<Polygon>& polygons, const LineString& line) const override;
    bool intersects(const Polygon& a, const Polygon& b) const override;
    bool contains(const Polygon& outer, const Polygon& inner) const override;

    LineString simplify(const LineString& line, double tolerance) const override;
    Point2D point_on_surface(const Polygon& polygon) const override;
    double area(const Polygon& polygon) const override;

private:
    Logger logger_;
};

} // namespace hydromesh
