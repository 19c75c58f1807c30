#pragma once

#include "Mesh.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace seamlod::core {

// 3D 包围盒
struct BoundingBox {
    std::array<float, 3> min{0.0f, 0.0f, 0.0f};
    std::array<float, 3> max{0.0f, 0.0f, 0.0f};

    constexpr BoundingBox() = default;
    constexpr BoundingBox(const std::array<float, 3>& min, const std::array<float, 3>& max)
        : min(min), max(max) {}

    // 查询方法
    constexpr std::array<float, 3> size() const noexcept {
        return {max[0] - min[0], max[1] - min[1], max[2] - min[2]};
    }

    // 水平面（XY）上较长一边的长度
    constexpr float longestHorizontalSide() const noexcept {
        return std::max(max[0] - min[0], max[1] - min[1]);
    }
};

// 半空间 normal·p >= offset
struct Plane {
    std::array<float, 3> normal{1.0f, 0.0f, 0.0f};
    float offset{0.0f};

    constexpr Plane() = default;
    constexpr Plane(const std::array<float, 3>& normal, float offset)
        : normal(normal), offset(offset) {}

    // 轴对齐半空间：sign * p[axis] >= sign * coordinate
    static constexpr Plane axisAligned(int axis, float coordinate, float sign) noexcept {
        std::array<float, 3> n{0.0f, 0.0f, 0.0f};
        n[axis] = sign;
        return Plane{n, sign * coordinate};
    }

    // 带符号距离（normal 为单位向量时即欧氏距离）
    double signedDistance(const Vertex& p) const noexcept {
        return double(normal[0]) * p[0] + double(normal[1]) * p[1] + double(normal[2]) * p[2] - offset;
    }
};

// 有向边
struct Edge {
    Index from{0};
    Index to{0};

    bool operator==(const Edge&) const = default;
};

// 边界环：有序顶点序列，closed 表示首尾相接
struct BoundaryLoop {
    std::vector<Index> vertices;
    bool closed{false};

    size_t edgeCount() const noexcept {
        if (vertices.empty()) {
            return 0;
        }
        return closed ? vertices.size() : vertices.size() - 1;
    }
};

// 连通分量划分结果
struct ComponentLabels {
    std::vector<uint32_t> triangleComponent;   // 每个三角形所属分量
    std::vector<size_t> vertexCounts;          // 每个分量的顶点数
    std::vector<size_t> triangleCounts;        // 每个分量的三角形数

    size_t componentCount() const noexcept { return vertexCounts.size(); }
};

// 边邻接索引：从三角形列表派生，只读；mesh 的生命周期须长于索引
class EdgeAdjacency {
public:
    explicit EdgeAdjacency(const Mesh& mesh);

    // 只被一个三角形使用的边（保持三角形内的方向）
    const std::vector<Edge>& boundaryEdges() const noexcept { return boundaryEdges_; }

    // 该无向边被多少个三角形使用
    [[nodiscard]] uint32_t edgeUseCount(Index a, Index b) const noexcept;

    [[nodiscard]] bool isBoundaryVertex(Index v) const noexcept {
        return v < boundaryVertex_.size() && boundaryVertex_[v] != 0;
    }

    // 沿边界边串联出的闭合/开放环
    [[nodiscard]] std::vector<BoundaryLoop> boundaryLoops() const;

    // 按共享顶点划分的连通分量
    [[nodiscard]] ComponentLabels connectedComponents() const;

private:
    static uint64_t edgeKey(Index a, Index b) noexcept {
        const Index lo = std::min(a, b);
        const Index hi = std::max(a, b);
        return (uint64_t(lo) << 32) | hi;
    }

    const Mesh& mesh_;
    std::unordered_map<uint64_t, uint32_t> edgeUse_;
    std::vector<Edge> boundaryEdges_;
    std::vector<uint8_t> boundaryVertex_;
};

// 纯函数：从网格计算包围盒
[[nodiscard]] BoundingBox computeBoundingBox(const Mesh& mesh) noexcept;

} // namespace seamlod::core
