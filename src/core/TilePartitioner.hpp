#pragma once

#include "Mesh.hpp"
#include "Geometry.hpp"
#include "Error.hpp"
#include <array>
#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace seamlod::core {

// 网格单元坐标
struct TileCoord {
    int x{0};
    int y{0};

    auto operator<=>(const TileCoord&) const = default;
};

[[nodiscard]] std::string toString(const TileCoord& coord);

// 水平面上的正方形网格
struct GridSpec {
    int gridSize{1};
    float cellSize{0.0f};
    BoundingBox bounds;
    std::vector<float> planesX;   // gridSize + 1 个切分平面
    std::vector<float> planesY;

    // 坐标 v 所在单元（恰好落在切分面上时取右侧单元）
    [[nodiscard]] int cellLow(int axis, float v) const noexcept;
    // 坐标 v 所在单元（恰好落在切分面上时取左侧单元）
    [[nodiscard]] int cellHigh(int axis, float v) const noexcept;

    const std::vector<float>& planes(int axis) const noexcept { return axis == 0 ? planesX : planesY; }
};

// 瓦片：拥有源网格的一个几何子集
struct Tile {
    TileCoord coord;
    Mesh mesh;
    // 四个边界半空间：xmin, xmax, ymin, ymax
    std::array<Plane, 4> planes;
    // 被切分的源三角形数
    size_t clippedTriangles{0};
};

// 切分配置
struct PartitionConfig {
    int gridSize{1};   // 每个轴向的切片数
};

// 原始工具以 2 的幂次模块数配置切片；返回每轴切片数
[[nodiscard]] std::optional<int> gridFromModuleCount(int modules) noexcept;

// 计算网格；水平范围为零时返回 DegenerateBounds
[[nodiscard]] Result<GridSpec> computeGrid(const Mesh& mesh, int gridSize);

// 将网格切分为 gridSize x gridSize 个瓦片，跨单元三角形沿切分面裁剪，空单元被省略
[[nodiscard]] Result<std::vector<Tile>> partitionMesh(const Mesh& mesh, const PartitionConfig& config);

} // namespace seamlod::core
