/**
 * @file SplitBoundary.hpp
 * @brief Polygon collection stored as uniquely-owned and pairwise-shared boundary pieces
 *
 * Adjacent hydrologic units share walls. Storing each wall exactly once
 * means simplification or vertex insertion on a wall is seen identically
 * by both neighbours, so the collection never cracks.
 */

#pragma once

#include "hydromesh.hpp"
#include "PlanarGeometryKernel.hpp"
#include "Logger.hpp"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace hydromesh {

class SplitBoundary {
public:
    using PieceId = size_t;

    enum class PieceKind {
        Unique,   ///< Boundary of exactly one polygon
        Shared    ///< Wall between exactly two polygons
    };

    struct Piece {
        LineString line;
        PieceKind kind;
        size_t first_owner;
        std::optional<size_t> second_owner;   ///< Set for shared pieces, always > first_owner
    };

    SplitBoundary();

    /**
     * @brief Split polygons into unique and shared boundary pieces
     *
     * Shared pieces come from the pairwise intersection of polygon
     * boundaries, line-merged with node_tolerance. Each polygon's unique
     * pieces are what remains of its boundary.
     *
     * @throws TopologyError if a shared piece lies on a third polygon or a
     *         polygon's pieces fail to close into rings
     */
    static SplitBoundary intersect_and_split(const std::vector<Polygon>& polygons,
                                             const PlanarGeometryKernel& kernel,
                                             double node_tolerance = 0.0);

    size_t size() const { return piece_refs_.size(); }
    bool empty() const { return piece_refs_.empty(); }

    const std::vector<Piece>& pieces() const { return pieces_; }
    const Piece& piece(PieceId id) const { return pieces_.at(id); }

    /**
     * @brief Piece ids referenced by polygon i, shared pieces first
     */
    const std::vector<PieceId>& piece_ids(size_t polygon) const { return piece_refs_.at(polygon); }

    std::vector<PieceId> unique_piece_ids(size_t polygon) const;

    /**
     * @brief Shared pieces between polygons i and j, in either argument order
     */
    std::vector<PieceId> shared_piece_ids(size_t i, size_t j) const;

    /**
     * @brief Unordered polygon pairs that share at least one piece
     */
    std::vector<std::pair<size_t, size_t>> adjacent_pairs() const;

    /**
     * @brief Rebuild polygon i from its current pieces
     * @throws TopologyError if the pieces no longer close
     */
    Polygon polygon(size_t i) const;

    std::vector<Polygon> polygons() const;

    /**
     * @brief Union of every polygon: the outer shape of the whole collection
     */
    std::vector<Polygon> exterior(const PlanarGeometryKernel& kernel) const;

    /**
     * @brief Pieces owned by a single polygon, i.e. the outer and hole boundaries
     */
    MultiLineString exterior_pieces() const;

    /**
     * @brief Flattened view of all pieces, each exactly once
     */
    MultiLineString segments() const;

    /**
     * @brief Simplify every stored piece once, endpoints fixed
     *
     * Closed pieces that would collapse below a valid ring are kept as they are.
     */
    void simplify(double tolerance, const PlanarGeometryKernel& kernel);

    /**
     * @brief Replace a piece's geometry, e.g. after inserting a cut vertex
     * @throws TopologyError if the replacement moves the piece's endpoints
     */
    void update_piece(PieceId id, LineString line);

private:
    PieceId add_piece(LineString line, PieceKind kind, size_t first, std::optional<size_t> second);

    std::vector<Piece> pieces_;
    std::vector<std::vector<PieceId>> piece_refs_;
    std::map<std::pair<size_t, size_t>, std::vector<PieceId>> shared_index_;
    double node_tolerance_;
    Logger logger_;
};

} // namespace hydromesh
