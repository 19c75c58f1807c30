#pragma once

#include "Error.hpp"
#include <vector>
#include <array>
#include <cstdint>
#include <span>

namespace seamlod::core {

// 基础数据类型
using Vertex = std::array<float, 3>;
using Normal = std::array<float, 3>;
using TexCoord = std::array<float, 2>;
using Color = std::array<uint8_t, 4>;
using Index = uint32_t;

// 顶点属性集合：可选属性要么为空，要么与 positions 等长
struct VertexAttributes {
    std::vector<Vertex> positions;
    std::vector<Normal> normals;
    std::vector<TexCoord> texCoords;
    std::vector<Color> colors;

    constexpr size_t size() const noexcept { return positions.size(); }
    constexpr bool empty() const noexcept { return positions.empty(); }

    bool hasNormals() const noexcept { return !normals.empty(); }
    bool hasTexCoords() const noexcept { return !texCoords.empty(); }
    bool hasColors() const noexcept { return !colors.empty(); }

    void reserve(size_t count) {
        positions.reserve(count);
        normals.reserve(count);
        texCoords.reserve(count);
        colors.reserve(count);
    }

    void clear() noexcept {
        positions.clear();
        normals.clear();
        texCoords.clear();
        colors.clear();
    }

    // 从另一个属性集合复制一个顶点（只复制双方都有的可选属性）
    void appendFrom(const VertexAttributes& source, Index index) {
        positions.push_back(source.positions[index]);
        if (source.hasNormals()) {
            normals.push_back(source.normals[index]);
        }
        if (source.hasTexCoords()) {
            texCoords.push_back(source.texCoords[index]);
        }
        if (source.hasColors()) {
            colors.push_back(source.colors[index]);
        }
    }
};

// 不可变网格结构
class Mesh {
public:
    using Vertices = VertexAttributes;
    using Indices = std::vector<Index>;

    Mesh() = default;
    Mesh(Vertices vertices, Indices indices)
        : vertices_(std::move(vertices)), indices_(std::move(indices)) {}

    // 访问器（只读）
    const Vertices& vertices() const noexcept { return vertices_; }
    const Indices& indices() const noexcept { return indices_; }

    // 查询方法
    constexpr size_t vertexCount() const noexcept { return vertices_.size(); }
    constexpr size_t triangleCount() const noexcept { return indices_.size() / 3; }
    constexpr bool empty() const noexcept { return vertices_.empty() || indices_.empty(); }

    const Vertex& position(Index index) const noexcept { return vertices_.positions[index]; }

    std::array<Index, 3> triangle(size_t triIndex) const noexcept {
        return {indices_[triIndex * 3], indices_[triIndex * 3 + 1], indices_[triIndex * 3 + 2]};
    }

    // 创建新实例的函数式操作
    [[nodiscard]] Mesh withVertices(Vertices newVertices) const {
        return Mesh{std::move(newVertices), indices_};
    }

    [[nodiscard]] Mesh withIndices(Indices newIndices) const {
        return Mesh{vertices_, std::move(newIndices)};
    }

    // 子网格提取（按三角形编号）
    [[nodiscard]] Mesh subset(std::span<const Index> triangleIndices) const;

private:
    Vertices vertices_;
    Indices indices_;
};

// 网格统计信息
struct MeshStats {
    size_t vertexCount{0};
    size_t triangleCount{0};
    std::array<float, 3> boundingBoxMin{0, 0, 0};
    std::array<float, 3> boundingBoxMax{0, 0, 0};
    double surfaceArea{0.0};
};

// 纯函数：计算网格统计
[[nodiscard]] MeshStats computeStats(const Mesh& mesh) noexcept;

// 纯函数：三角形面积（双精度）
[[nodiscard]] double triangleArea(const Vertex& a, const Vertex& b, const Vertex& c) noexcept;

// 纯函数：网格表面积
[[nodiscard]] double surfaceArea(const Mesh& mesh) noexcept;

// 校验：顶点数为零、索引越界、属性数组长度不一致都视为 InvalidGeometry
[[nodiscard]] Result<void> validateMesh(const Mesh& mesh);

// 删除零面积三角形与不再被引用的顶点，并重新编号
[[nodiscard]] Mesh removeDegenerate(const Mesh& mesh);

// 合并距离不超过 epsilon 的顶点；epsilon <= 0 时只合并坐标完全相同的顶点
[[nodiscard]] Mesh weldNear(const Mesh& mesh, float epsilon);

// 删除未被引用的顶点，保持剩余顶点的相对顺序
[[nodiscard]] Mesh compactVertices(const Mesh& mesh);

} // namespace seamlod::core
