#pragma once

#include "core/Mesh.hpp"
#include "core/Error.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace seamlod::surface {

// 展开结果。图集会在接缝处复制顶点：
// vertexMap[i] 为新顶点 i 对应的输入顶点，indices 引用新顶点
struct UvLayout {
    std::vector<core::Index> vertexMap;
    std::vector<core::Index> indices;
    std::vector<core::TexCoord> uvs;     // 与 vertexMap 等长，取值 [0, 1]
};

// UV 展开接口：输入几何，输出新的顶点布局与 UV
class IUvUnwrapper {
public:
    virtual ~IUvUnwrapper() = default;

    virtual core::Result<UvLayout> unwrap(std::span<const core::Vertex> vertices,
                                          std::span<const core::Index> triangles) const = 0;
};

// xatlas 参数
struct XatlasOptions {
    uint32_t maxIterations{1};     // 图表生长迭代次数
    uint32_t padding{1};           // 图表之间的像素间隔
    uint32_t resolution{0};        // 0 表示由 texelsPerUnit 决定
    float texelsPerUnit{0.0f};     // 0 表示自动估计
    bool bruteForce{false};
};

// 基于 xatlas 的图集展开（默认）
class XatlasUvUnwrapper : public IUvUnwrapper {
public:
    explicit XatlasUvUnwrapper(XatlasOptions options = {})
        : options_(options) {}

    core::Result<UvLayout> unwrap(std::span<const core::Vertex> vertices,
                                  std::span<const core::Index> triangles) const override;

private:
    XatlasOptions options_;
};

// 投影到水平面，并按网格占地范围归一化到 [0, 1]；不复制顶点
class PlanarUvUnwrapper : public IUvUnwrapper {
public:
    core::Result<UvLayout> unwrap(std::span<const core::Vertex> vertices,
                                  std::span<const core::Index> triangles) const override;
};

[[nodiscard]] std::unique_ptr<IUvUnwrapper> createXatlasUnwrapper(XatlasOptions options = {});
[[nodiscard]] std::unique_ptr<IUvUnwrapper> createPlanarUnwrapper();

// 展开并写回网格：按 vertexMap 复制顶点属性，替换索引
// 布局与网格不一致时返回 Internal
[[nodiscard]] core::Result<core::Mesh> applyUnwrap(const core::Mesh& mesh, const IUvUnwrapper& unwrapper);

} // namespace seamlod::surface
