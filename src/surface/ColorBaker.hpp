#pragma once

#include "core/Mesh.hpp"
#include "core/Geometry.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace seamlod::surface {

// 颜色采样接口：在源网格上采样给定位置的颜色
class IColorSampler {
public:
    virtual ~IColorSampler() = default;

    virtual core::Color sampleColor(const core::Vertex& position) const = 0;
};

// 取源网格上最近顶点的颜色；源网格无颜色时返回白色
class NearestVertexColorSampler : public IColorSampler {
public:
    explicit NearestVertexColorSampler(core::Mesh source);

    core::Color sampleColor(const core::Vertex& position) const override;

private:
    struct CellKey {
        int x{0};
        int y{0};
        int z{0};
        bool operator==(const CellKey&) const = default;
    };

    struct CellKeyHash {
        size_t operator()(const CellKey& k) const noexcept {
            return (size_t(k.x) * 73856093u) ^ (size_t(k.y) * 19349663u) ^ (size_t(k.z) * 83492791u);
        }
    };

    CellKey cellOf(const core::Vertex& p) const noexcept;

    core::Mesh source_;
    core::BoundingBox bounds_;
    float cellSize_{1.0f};
    std::unordered_map<CellKey, std::vector<core::Index>, CellKeyHash> grid_;
};

[[nodiscard]] std::unique_ptr<IColorSampler> createNearestVertexSampler(const core::Mesh& source);

// 对网格的每个顶点采样颜色
[[nodiscard]] core::Mesh bakeVertexColors(const core::Mesh& mesh, const IColorSampler& sampler);

} // namespace seamlod::surface
