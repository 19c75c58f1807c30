#pragma once

#include "Mesh.hpp"
#include "BoundaryClassifier.hpp"
#include "Error.hpp"
#include <variant>

namespace seamlod::core {

// 目标按比例给出（相对于输入网格）
struct TargetRatio {
    double value{1.0};
};

// 目标按绝对数量给出
struct TargetCount {
    size_t value{0};
};

using DecimationTarget = std::variant<TargetRatio, TargetCount>;

// 比例与数量所指的度量：三角形数或顶点数
enum class TargetMetric {
    Triangles,
    Vertices
};

// 简化配置
struct DecimationConfig {
    TargetMetric metric{TargetMetric::Triangles};
    float targetError{1.0f};          // 相对误差上限，1.0 表示只受目标数量约束
    bool pruneDisconnected{false};    // 允许删除细小的孤立部件
};

// 简化结果
struct DecimationResult {
    Mesh mesh;
    size_t targetCount{0};     // 按 metric 计算的目标数量
    float resultError{0.0f};
};

// 按所选度量把目标换算为数量
[[nodiscard]] size_t resolveTargetCount(const Mesh& mesh, const DecimationTarget& target,
                                        TargetMetric metric) noexcept;

// 调用 meshoptimizer 进行带锁定顶点的二次误差简化；
// 锁定顶点保持原坐标不变，目标小于锁定顶点数时返回 DecimationInfeasible
[[nodiscard]] Result<DecimationResult> decimate(const Mesh& mesh, const BoundaryVertexSet& locked,
                                                const DecimationTarget& target,
                                                const DecimationConfig& config = {});

} // namespace seamlod::core
