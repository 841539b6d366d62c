/**
 * @file OgrGeometryKernel.cpp
 * @brief GDAL/OGR (GEOS) implementation of the planar geometry capability
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "OgrGeometryKernel.hpp"

#include <ogr_api.h>

#include <memory>

namespace hydromesh {

namespace {

OGRLinearRing* make_ring(const Ring& ring) {
    auto* ogr_ring = new OGRLinearRing();
    for (const auto& p : ring) {
        ogr_ring->addPoint(p.x(), p.y());
    }
    ogr_ring->closeRings();
    return ogr_ring;
}

Ring read_ring(const OGRLineString* ring) {
    Ring coords;
    coords.reserve(ring->getNumPoints());
    for (int i = 0; i < ring->getNumPoints(); ++i) {
        coords.emplace_back(ring->getX(i), ring->getY(i));
    }
    return coords;
}

void collect_lines(const OGRGeometry* geometry, MultiLineString& out) {
    if (geometry == nullptr || geometry->IsEmpty()) return;

    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbLineString:
        case wkbLinearRing: {
            Ring coords = read_ring(geometry->toLineString());
            if (coords.size() >= 2) out.emplace_back(std::move(coords));
            break;
        }
        case wkbMultiLineString:
        case wkbGeometryCollection: {
            const auto* collection = geometry->toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_lines(collection->getGeometryRef(i), out);
            }
            break;
        }
        default:
            break;
    }
}

void collect_polygons(const OGRGeometry* geometry, std::vector<Polygon>& out) {
    if (geometry == nullptr || geometry->IsEmpty()) return;

    switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPolygon: {
            const auto* ogr_polygon = geometry->toPolygon();
            Polygon polygon;
            polygon.rings.push_back(read_ring(ogr_polygon->getExteriorRing()));
            for (int i = 0; i < ogr_polygon->getNumInteriorRings(); ++i) {
                polygon.rings.push_back(read_ring(ogr_polygon->getInteriorRing(i)));
            }
            out.push_back(std::move(polygon));
            break;
        }
        case wkbMultiPolygon:
        case wkbGeometryCollection: {
            const auto* collection = geometry->toGeometryCollection();
            for (int i = 0; i < collection->getNumGeometries(); ++i) {
                collect_polygons(collection->getGeometryRef(i), out);
            }
            break;
        }
        default:
            break;
    }
}

OGRGeometryUniquePtr checked(OGRGeometry* result, const char* operation) {
    if (result == nullptr) {
        throw GeometryKernelError(std::string(operation) + " returned no geometry");
    }
    return OGRGeometryUniquePtr(result);
}

double total_length(const MultiLineString& lines) {
    double total = 0.0;
    for (const auto& line : lines) total += line.length();
    return total;
}

} // anonymous namespace

// ============================================================================
// Conversions
// ============================================================================

OGRGeometryUniquePtr to_ogr(const Polygon& polygon) {
    auto ogr_polygon = std::make_unique<OGRPolygon>();
    for (const auto& ring : polygon.rings) {
        ogr_polygon->addRingDirectly(make_ring(ring));
    }
    return OGRGeometryUniquePtr(ogr_polygon.release());
}

OGRGeometryUniquePtr to_ogr(const std::vector<Polygon>& polygons) {
    auto multi = std::make_unique<OGRMultiPolygon>();
    for (const auto& polygon : polygons) {
        multi->addGeometryDirectly(to_ogr(polygon).release());
    }
    return OGRGeometryUniquePtr(multi.release());
}

OGRGeometryUniquePtr to_ogr(const LineString& line) {
    auto ogr_line = std::make_unique<OGRLineString>();
    for (const auto& p : line.coords) {
        ogr_line->addPoint(p.x(), p.y());
    }
    return OGRGeometryUniquePtr(ogr_line.release());
}

OGRGeometryUniquePtr to_ogr(const MultiLineString& lines) {
    auto multi = std::make_unique<OGRMultiLineString>();
    for (const auto& line : lines) {
        multi->addGeometryDirectly(to_ogr(line).release());
    }
    return OGRGeometryUniquePtr(multi.release());
}

std::vector<Polygon> polygons_from_ogr(const OGRGeometry* geometry) {
    std::vector<Polygon> polygons;
    collect_polygons(geometry, polygons);
    return polygons;
}

MultiLineString lines_from_ogr(const OGRGeometry* geometry) {
    MultiLineString lines;
    collect_lines(geometry, lines);
    return lines;
}

// ============================================================================
// OgrGeometryKernel
// ============================================================================

OgrGeometryKernel::OgrGeometryKernel() : logger_("OgrGeometryKernel") {
    if (!OGRGeometryFactory::haveGEOS()) {
        throw GeometryKernelError("GDAL was built without GEOS support");
    }
}

MultiLineString OgrGeometryKernel::boundary_intersection(const Polygon& a, const Polygon& b) const {
    auto boundary_a = checked(to_ogr(a)->Boundary(), "Boundary");
    auto boundary_b = checked(to_ogr(b)->Boundary(), "Boundary");
    auto shared = checked(boundary_a->Intersection(boundary_b.get()), "Intersection");
    return lines_from_ogr(shared.get());
}

MultiLineString OgrGeometryKernel::boundary_difference(const Polygon& polygon,
                                                       const MultiLineString& lines) const {
    auto boundary = checked(to_ogr(polygon)->Boundary(), "Boundary");
    if (lines.empty()) {
        return lines_from_ogr(boundary.get());
    }
    auto remainder = checked(boundary->Difference(to_ogr(lines).get()), "Difference");
    return lines_from_ogr(remainder.get());
}

double OgrGeometryKernel::boundary_overlap_length(const Polygon& polygon, const LineString& line) const {
    auto boundary = checked(to_ogr(polygon)->Boundary(), "Boundary");
    auto overlap = checked(boundary->Intersection(to_ogr(line).get()), "Intersection");
    return total_length(lines_from_ogr(overlap.get()));
}

std::vector<Polygon> OgrGeometryKernel::union_polygons(const std::vector<Polygon>& polygons) const {
    if (polygons.empty()) return {};
    auto merged = checked(to_ogr(polygons)->UnionCascaded(), "UnionCascaded");
    return polygons_from_ogr(merged.get());
}

std::vector<Polygon> OgrGeometryKernel::buffer(const std::vector<Polygon>& polygons, double distance) const {
    if (polygons.empty()) return {};
    auto grown = checked(to_ogr(polygons)->Buffer(distance, 30), "Buffer");
    return polygons_from_ogr(grown.get());
}

bool OgrGeometryKernel::intersects(const std::vector<Polygon>& polygons, const LineString& line) const {
    if (polygons.empty() || line.size() < 2) return false;
    return to_ogr(polygons)->Intersects(to_ogr(line).get());
}

bool OgrGeometryKernel::intersects(const Polygon& a, const Polygon& b) const {
    return to_ogr(a)->Intersects(to_ogr(b).get());
}

bool OgrGeometryKernel::contains(const Polygon& outer, const Polygon& inner) const {
    return to_ogr(outer)->Contains(to_ogr(inner).get());
}

LineString OgrGeometryKernel::simplify(const LineString& line, double tolerance) const {
    if (tolerance <= 0.0 || line.size() <= 2) {
        return line;
    }

    auto simplified = checked(to_ogr(line)->SimplifyPreserveTopology(tolerance),
                              "SimplifyPreserveTopology");
    MultiLineString parts = lines_from_ogr(simplified.get());
    if (parts.size() != 1) {
        throw GeometryKernelError("simplify produced " + std::to_string(parts.size()) +
                                  " parts from a single line");
    }

    LineString result = std::move(parts.front());
    // GEOS keeps endpoints; restore them bit-for-bit in case of round-off
    result.coords.front() = line.front();
    result.coords.back() = line.back();
    logger_.trace("simplify: " + std::to_string(line.size()) + " -> " +
                  std::to_string(result.size()) + " coordinates");
    return result;
}

Point2D OgrGeometryKernel::point_on_surface(const Polygon& polygon) const {
    auto geometry = to_ogr(polygon);
    OGRGeometryH handle = OGR_G_PointOnSurface(OGRGeometry::ToHandle(geometry.get()));
    auto point = checked(OGRGeometry::FromHandle(handle), "PointOnSurface");
    if (point->IsEmpty() || wkbFlatten(point->getGeometryType()) != wkbPoint) {
        throw GeometryKernelError("PointOnSurface returned an empty point");
    }
    return Point2D(point->toPoint()->getX(), point->toPoint()->getY());
}

double OgrGeometryKernel::area(const Polygon& polygon) const {
    return to_ogr(polygon)->toPolygon()->get_Area();
}

} // namespace hydromesh
