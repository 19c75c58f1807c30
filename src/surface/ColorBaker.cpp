#include "surface/ColorBaker.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace seamlod::surface {

namespace {

constexpr core::Color kWhite{255, 255, 255, 255};

double distanceSquared(const core::Vertex& a, const core::Vertex& b) noexcept {
    const double dx = double(a[0]) - b[0];
    const double dy = double(a[1]) - b[1];
    const double dz = double(a[2]) - b[2];
    return dx * dx + dy * dy + dz * dz;
}

} // namespace

NearestVertexColorSampler::NearestVertexColorSampler(core::Mesh source)
    : source_(std::move(source)) {
    if (!source_.vertices().hasColors() || source_.vertexCount() == 0) {
        return;
    }

    bounds_ = core::computeBoundingBox(source_);

    // 平均每个单元约 8 个顶点
    const auto size = bounds_.size();
    const double diagonal = std::sqrt(double(size[0]) * size[0] + double(size[1]) * size[1] + double(size[2]) * size[2]);
    const double perAxis = std::cbrt(std::max<double>(1.0, source_.vertexCount() / 8.0));
    cellSize_ = static_cast<float>(std::max(diagonal / perAxis, 1e-6));

    const auto& positions = source_.vertices().positions;
    for (size_t i = 0; i < positions.size(); ++i) {
        grid_[cellOf(positions[i])].push_back(static_cast<core::Index>(i));
    }
}

NearestVertexColorSampler::CellKey NearestVertexColorSampler::cellOf(const core::Vertex& p) const noexcept {
    return CellKey{
        static_cast<int>(std::floor((p[0] - bounds_.min[0]) / cellSize_)),
        static_cast<int>(std::floor((p[1] - bounds_.min[1]) / cellSize_)),
        static_cast<int>(std::floor((p[2] - bounds_.min[2]) / cellSize_))
    };
}

core::Color NearestVertexColorSampler::sampleColor(const core::Vertex& position) const {
    if (grid_.empty()) {
        return kWhite;
    }

    const auto& positions = source_.vertices().positions;
    const auto& colors = source_.vertices().colors;
    const CellKey center = cellOf(position);

    double best = std::numeric_limits<double>::max();
    core::Index bestIndex = 0;
    bool found = false;

    // 逐圈扩大搜索范围；找到候选后再多搜一圈
    const auto size = bounds_.size();
    const int maxRing = static_cast<int>(std::ceil(std::max({size[0], size[1], size[2]}) / cellSize_)) + 2;
    int stopRing = maxRing;
    for (int ring = 0; ring <= std::min(stopRing, maxRing); ++ring) {
        for (int dz = -ring; dz <= ring; ++dz) {
            for (int dy = -ring; dy <= ring; ++dy) {
                for (int dx = -ring; dx <= ring; ++dx) {
                    if (std::max({std::abs(dx), std::abs(dy), std::abs(dz)}) != ring) {
                        continue;
                    }
                    const auto it = grid_.find(CellKey{center.x + dx, center.y + dy, center.z + dz});
                    if (it == grid_.end()) {
                        continue;
                    }
                    for (const core::Index i : it->second) {
                        const double d = distanceSquared(position, positions[i]);
                        if (d < best) {
                            best = d;
                            bestIndex = i;
                            found = true;
                        }
                    }
                }
            }
        }
        if (found && stopRing == maxRing) {
            stopRing = ring + 1;
        }
    }

    return found ? colors[bestIndex] : kWhite;
}

std::unique_ptr<IColorSampler> createNearestVertexSampler(const core::Mesh& source) {
    return std::make_unique<NearestVertexColorSampler>(source);
}

core::Mesh bakeVertexColors(const core::Mesh& mesh, const IColorSampler& sampler) {
    auto vertices = mesh.vertices();
    vertices.colors.resize(vertices.size());
    for (size_t i = 0; i < vertices.size(); ++i) {
        vertices.colors[i] = sampler.sampleColor(vertices.positions[i]);
    }
    return mesh.withVertices(std::move(vertices));
}

} // namespace seamlod::surface
