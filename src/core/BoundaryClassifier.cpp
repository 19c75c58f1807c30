#include "core/BoundaryClassifier.hpp"
#include "core/Geometry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace seamlod::core {

BoundaryVertexSet::BoundaryVertexSet(std::vector<Index> vertices)
    : vertices_(std::move(vertices)) {
    std::sort(vertices_.begin(), vertices_.end());
    vertices_.erase(std::unique(vertices_.begin(), vertices_.end()), vertices_.end());
}

bool BoundaryVertexSet::contains(Index v) const noexcept {
    return std::binary_search(vertices_.begin(), vertices_.end(), v);
}

std::vector<unsigned char> BoundaryVertexSet::toLockMask(size_t vertexCount) const {
    std::vector<unsigned char> mask(vertexCount, 0);
    for (const Index v : vertices_) {
        if (v < vertexCount) {
            mask[v] = 1;
        }
    }
    return mask;
}

BoundaryVertexSet classifyBoundary(const Mesh& mesh, std::span<const Plane> planes,
                                   const BoundaryConfig& config) {
    std::vector<Index> boundary;
    const auto& positions = mesh.vertices().positions;

    for (size_t v = 0; v < positions.size(); ++v) {
        const bool onPlane = std::any_of(planes.begin(), planes.end(), [&](const Plane& plane) {
            return std::abs(plane.signedDistance(positions[v])) <= config.epsilon;
        });
        if (onPlane) {
            boundary.push_back(static_cast<Index>(v));
        }
    }

    if (config.lockOpenEdges && !mesh.empty()) {
        const EdgeAdjacency adjacency(mesh);
        for (const auto& edge : adjacency.boundaryEdges()) {
            boundary.push_back(edge.from);
            boundary.push_back(edge.to);
        }
    }

    return BoundaryVertexSet{std::move(boundary)};
}

BoundaryVertexSet classifyBoundary(const Tile& tile, const BoundaryConfig& config) {
    auto result = classifyBoundary(tile.mesh, tile.planes, config);
    spdlog::debug("Boundary: tile {} has {} of {} vertices locked",
                  toString(tile.coord), result.size(), tile.mesh.vertexCount());
    return result;
}

} // namespace seamlod::core
