#pragma once

#include "Mesh.hpp"
#include "Error.hpp"

namespace seamlod::core {

// 清理配置
struct CleanupConfig {
    size_t minComponentVertices{0};   // 顶点数低于该值的孤立分量被删除，0 表示不删除
    size_t maxHoleEdges{0};           // 边数不超过该值的孔洞被补上，0 表示不补洞
    float mergeDistance{1e-6f};       // 近距离顶点焊接阈值
};

// 清理统计
struct CleanupStats {
    size_t verticesBefore{0};
    size_t verticesAfter{0};
    size_t trianglesBefore{0};
    size_t trianglesAfter{0};
    size_t componentsRemoved{0};
    size_t holesFilled{0};
};

struct CleanupResult {
    Mesh mesh;
    CleanupStats stats;
};

// 删除顶点数少于 minVertices 的连通分量
[[nodiscard]] Mesh removeLooseComponents(const Mesh& mesh, size_t minVertices, size_t* removedCount = nullptr);

// 以质心扇形补洞；最外圈边界（包围范围最大的环）永远不补
[[nodiscard]] Mesh fillHoles(const Mesh& mesh, size_t maxEdges, size_t* filledCount = nullptr);

// 完整清理流程：焊接 -> 去退化 -> 删孤立分量 -> 补洞 -> 去退化
[[nodiscard]] Result<CleanupResult> cleanupMesh(const Mesh& mesh, const CleanupConfig& config);

} // namespace seamlod::core
