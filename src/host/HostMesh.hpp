#pragma once

#include "core/Mesh.hpp"
#include "core/Error.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace seamlod::host {

// 宿主编辑器风格的网格表示：扁平坐标数组 + 多边形环
struct ExternalMesh {
    std::vector<float> coords;          // x0 y0 z0 x1 y1 z1 ...
    std::vector<uint32_t> loopStarts;   // 每个多边形在 loopVertices 中的起点
    std::vector<uint32_t> loopTotals;   // 每个多边形的环顶点数
    std::vector<uint32_t> loopVertices; // 环顶点 -> 顶点索引

    std::vector<float> normals;         // 可选，逐顶点 nx ny nz
    std::vector<float> loopUvs;         // 可选，逐环顶点 u v
    std::vector<float> colors;          // 可选，逐顶点 r g b a（0..1）

    size_t vertexCount() const noexcept { return coords.size() / 3; }
    size_t polygonCount() const noexcept { return loopStarts.size(); }
    size_t loopCount() const noexcept { return loopVertices.size(); }
};

// 从宿主表示复制数据；多边形按扇形三角化
[[nodiscard]] core::Result<core::Mesh> loadFrom(const ExternalMesh& external);

// 逆操作：每个三角形一个多边形，UV 展开为逐环顶点
[[nodiscard]] ExternalMesh toExternal(const core::Mesh& mesh);

} // namespace seamlod::host
