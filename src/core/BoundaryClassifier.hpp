#pragma once

#include "Mesh.hpp"
#include "TilePartitioner.hpp"
#include <span>
#include <vector>

namespace seamlod::core {

// 边界分类配置
struct BoundaryConfig {
    double epsilon{1e-4};          // 到瓦片边界平面的容差
    bool lockOpenEdges{false};     // 同时锁定开放边（只被一个三角形使用的边）上的顶点
};

// 瓦片网格中位于切分面上的顶点集合（升序、去重）
class BoundaryVertexSet {
public:
    BoundaryVertexSet() = default;
    explicit BoundaryVertexSet(std::vector<Index> vertices);

    [[nodiscard]] bool contains(Index v) const noexcept;
    size_t size() const noexcept { return vertices_.size(); }
    bool empty() const noexcept { return vertices_.empty(); }

    const std::vector<Index>& vertices() const noexcept { return vertices_; }

    // 转为 meshoptimizer 使用的逐顶点锁定标记
    [[nodiscard]] std::vector<unsigned char> toLockMask(size_t vertexCount) const;

    bool operator==(const BoundaryVertexSet&) const = default;

private:
    std::vector<Index> vertices_;
};

// 纯函数：对瓦片的每个顶点测试到四个边界半平面的距离
[[nodiscard]] BoundaryVertexSet classifyBoundary(const Tile& tile, const BoundaryConfig& config = {});

// 同上，直接作用于网格与平面集合
[[nodiscard]] BoundaryVertexSet classifyBoundary(const Mesh& mesh, std::span<const Plane> planes,
                                                 const BoundaryConfig& config = {});

} // namespace seamlod::core
