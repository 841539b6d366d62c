/**
 * @file SplitBoundary.cpp
 * @brief Split-form polygon boundary storage
 */

#include "SplitBoundary.hpp"
#include "Geometry.hpp"

#include <algorithm>
#include <sstream>

namespace hydromesh {

SplitBoundary::SplitBoundary() : node_tolerance_(0.0), logger_("SplitBoundary") {
}

SplitBoundary SplitBoundary::intersect_and_split(const std::vector<Polygon>& polygons,
                                                 const PlanarGeometryKernel& kernel,
                                                 double node_tolerance) {
    SplitBoundary split;
    split.node_tolerance_ = node_tolerance;
    split.piece_refs_.resize(polygons.size());

    std::vector<BoundingBox> boxes;
    boxes.reserve(polygons.size());
    for (const auto& polygon : polygons) {
        boxes.push_back(bounds_of(polygon));
    }

    // Pairwise shared walls
    std::vector<MultiLineString> shared_lines(polygons.size());
    for (size_t i = 0; i < polygons.size(); ++i) {
        for (size_t j = i + 1; j < polygons.size(); ++j) {
            if (!boxes[i].intersects(boxes[j], node_tolerance)) continue;

            MultiLineString walls = merge_lines(kernel.boundary_intersection(polygons[i], polygons[j]),
                                                node_tolerance);
            for (auto& wall : walls) {
                if (wall.length() == 0.0) continue;
                shared_lines[i].push_back(wall);
                shared_lines[j].push_back(wall);
                split.add_piece(std::move(wall), PieceKind::Shared, i, j);
            }
        }
    }

    // Whatever is left of each boundary belongs to that polygon alone
    for (size_t i = 0; i < polygons.size(); ++i) {
        MultiLineString remainder = merge_lines(kernel.boundary_difference(polygons[i], shared_lines[i]),
                                                node_tolerance);
        for (auto& piece : remainder) {
            if (piece.length() == 0.0) continue;
            split.add_piece(std::move(piece), PieceKind::Unique, i, std::nullopt);
        }
    }

    // A wall may only ever separate two units
    for (PieceId id = 0; id < split.pieces_.size(); ++id) {
        const Piece& piece = split.pieces_[id];
        if (piece.kind != PieceKind::Shared) continue;

        const BoundingBox piece_box = bounds_of(piece.line);
        for (size_t k = 0; k < polygons.size(); ++k) {
            if (k == piece.first_owner || k == *piece.second_owner) continue;
            if (!boxes[k].intersects(piece_box, node_tolerance)) continue;

            double overlap = kernel.boundary_overlap_length(polygons[k], piece.line);
            if (overlap > 1e-9 * piece.line.length()) {
                std::ostringstream msg;
                msg << "boundary piece " << id << " shared by polygons " << piece.first_owner
                    << " and " << *piece.second_owner << " also lies on polygon " << k;
                throw TopologyError(msg.str());
            }
        }
    }

    // Every polygon must be reconstructable from its references
    for (size_t i = 0; i < polygons.size(); ++i) {
        Polygon rebuilt = split.polygon(i);
        split.logger_.trace("polygon " + std::to_string(i) + ": " +
                            std::to_string(split.piece_refs_[i].size()) + " pieces, " +
                            std::to_string(rebuilt.num_holes()) + " holes");
    }

    split.logger_.detailed("Split " + std::to_string(polygons.size()) + " polygons into " +
                           std::to_string(split.pieces_.size()) + " pieces (" +
                           std::to_string(split.shared_index_.size()) + " adjacent pairs)");
    return split;
}

SplitBoundary::PieceId SplitBoundary::add_piece(LineString line, PieceKind kind,
                                                size_t first, std::optional<size_t> second) {
    PieceId id = pieces_.size();
    pieces_.push_back(Piece{std::move(line), kind, first, second});
    piece_refs_[first].push_back(id);
    if (second.has_value()) {
        piece_refs_[*second].push_back(id);
        shared_index_[{first, *second}].push_back(id);
    }
    return id;
}

std::vector<SplitBoundary::PieceId> SplitBoundary::unique_piece_ids(size_t polygon) const {
    std::vector<PieceId> ids;
    for (PieceId id : piece_refs_.at(polygon)) {
        if (pieces_[id].kind == PieceKind::Unique) ids.push_back(id);
    }
    return ids;
}

std::vector<SplitBoundary::PieceId> SplitBoundary::shared_piece_ids(size_t i, size_t j) const {
    auto it = shared_index_.find({std::min(i, j), std::max(i, j)});
    if (it == shared_index_.end()) return {};
    return it->second;
}

std::vector<std::pair<size_t, size_t>> SplitBoundary::adjacent_pairs() const {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (const auto& entry : shared_index_) pairs.push_back(entry.first);
    return pairs;
}

Polygon SplitBoundary::polygon(size_t i) const {
    MultiLineString lines;
    for (PieceId id : piece_refs_.at(i)) {
        lines.push_back(pieces_[id].line);
    }
    try {
        return polygon_from_rings(assemble_rings(lines, node_tolerance_));
    } catch (const TopologyError& e) {
        throw TopologyError("polygon " + std::to_string(i) + ": " + e.what());
    }
}

std::vector<Polygon> SplitBoundary::polygons() const {
    std::vector<Polygon> result;
    result.reserve(piece_refs_.size());
    for (size_t i = 0; i < piece_refs_.size(); ++i) {
        result.push_back(polygon(i));
    }
    return result;
}

std::vector<Polygon> SplitBoundary::exterior(const PlanarGeometryKernel& kernel) const {
    return kernel.union_polygons(polygons());
}

MultiLineString SplitBoundary::exterior_pieces() const {
    MultiLineString lines;
    for (const auto& piece : pieces_) {
        if (piece.kind == PieceKind::Unique) lines.push_back(piece.line);
    }
    return lines;
}

MultiLineString SplitBoundary::segments() const {
    MultiLineString lines;
    lines.reserve(pieces_.size());
    for (const auto& piece : pieces_) lines.push_back(piece.line);
    return lines;
}

void SplitBoundary::simplify(double tolerance, const PlanarGeometryKernel& kernel) {
    size_t before = 0;
    size_t after = 0;
    for (auto& piece : pieces_) {
        LineString simplified = kernel.simplify(piece.line, tolerance);
        before += piece.line.size();
        if (piece.line.is_closed() && simplified.size() < 4) {
            logger_.debug("Keeping closed piece that would collapse under tolerance " +
                          std::to_string(tolerance));
            after += piece.line.size();
            continue;
        }
        after += simplified.size();
        piece.line = std::move(simplified);
    }
    logger_.detailed("Simplified " + std::to_string(pieces_.size()) + " pieces: " +
                     std::to_string(before) + " -> " + std::to_string(after) + " coordinates");
}

void SplitBoundary::update_piece(PieceId id, LineString line) {
    Piece& piece = pieces_.at(id);
    if (line.size() < 2 || line.front() != piece.line.front() || line.back() != piece.line.back()) {
        throw TopologyError("update of piece " + std::to_string(id) + " would move its endpoints");
    }
    piece.line = std::move(line);
}

} // namespace hydromesh
