#include "core/Decimator.hpp"
#include <meshoptimizer.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace seamlod::core {

namespace {

constexpr const char* kComponent = "Decimator";

size_t metricSize(const Mesh& mesh, TargetMetric metric) noexcept {
    return metric == TargetMetric::Triangles ? mesh.triangleCount() : mesh.vertexCount();
}

// 法线作为附加属性参与误差度量
constexpr float kNormalWeight = 0.5f;

} // namespace

size_t resolveTargetCount(const Mesh& mesh, const DecimationTarget& target, TargetMetric metric) noexcept {
    const size_t total = metricSize(mesh, metric);
    return std::visit([total](const auto& t) -> size_t {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, TargetRatio>) {
            const double clamped = std::clamp(t.value, 0.0, 1.0);
            return static_cast<size_t>(std::llround(clamped * static_cast<double>(total)));
        } else {
            return std::min(t.value, total);
        }
    }, target);
}

Result<DecimationResult> decimate(const Mesh& mesh, const BoundaryVertexSet& locked,
                                  const DecimationTarget& target, const DecimationConfig& config) {
    if (mesh.empty()) {
        return makeError(ErrorCode::InvalidGeometry, kComponent, "cannot decimate an empty mesh");
    }

    const size_t targetCount = resolveTargetCount(mesh, target, config.metric);
    if (targetCount < locked.size()) {
        return makeError(ErrorCode::DecimationInfeasible, kComponent,
                         "target " + std::to_string(targetCount) + " is below the " +
                             std::to_string(locked.size()) + " locked boundary vertices");
    }

    DecimationResult result;
    result.targetCount = targetCount;

    const size_t current = metricSize(mesh, config.metric);
    if (targetCount >= current) {
        result.mesh = mesh;   // 已经满足目标
        return result;
    }

    // 目标三角形数（按顶点度量时按比例换算）
    size_t targetTriangles = targetCount;
    if (config.metric == TargetMetric::Vertices) {
        const double fraction = static_cast<double>(targetCount) / static_cast<double>(mesh.vertexCount());
        targetTriangles = static_cast<size_t>(std::llround(fraction * mesh.triangleCount()));
    }
    targetTriangles = std::max<size_t>(targetTriangles, 1);

    const auto& vertices = mesh.vertices();
    const auto& indices = mesh.indices();
    const std::vector<unsigned char> lockMask = locked.toLockMask(vertices.size());

    std::vector<unsigned int> outputIndices(indices.size());
    unsigned int options = 0;
    if (config.pruneDisconnected) {
        options |= meshopt_SimplifyPrune;
    }

    size_t resultCount = 0;
    if (vertices.hasNormals()) {
        const float weights[3] = {kNormalWeight, kNormalWeight, kNormalWeight};
        resultCount = meshopt_simplifyWithAttributes(
            outputIndices.data(), indices.data(), indices.size(),
            vertices.positions.front().data(), vertices.size(), sizeof(Vertex),
            vertices.normals.front().data(), sizeof(Normal), weights, 3,
            lockMask.data(), targetTriangles * 3, config.targetError, options, &result.resultError);
    } else {
        resultCount = meshopt_simplifyWithAttributes(
            outputIndices.data(), indices.data(), indices.size(),
            vertices.positions.front().data(), vertices.size(), sizeof(Vertex),
            nullptr, 0, nullptr, 0,
            lockMask.data(), targetTriangles * 3, config.targetError, options, &result.resultError);
    }
    outputIndices.resize(resultCount);

    // 顶点数据原样保留，只删除不再引用的顶点
    Mesh::Indices newIndices(outputIndices.begin(), outputIndices.end());
    result.mesh = compactVertices(mesh.withIndices(std::move(newIndices)));

    spdlog::debug("Decimate: {} -> {} triangles (target {}, {} locked, error {:.4f})",
                  mesh.triangleCount(), result.mesh.triangleCount(), targetCount,
                  locked.size(), result.resultError);
    return result;
}

} // namespace seamlod::core
