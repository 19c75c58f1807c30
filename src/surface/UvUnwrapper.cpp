#include "surface/UvUnwrapper.hpp"
#include <xatlas.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <numeric>
#include <string>

namespace seamlod::surface {

namespace {

constexpr const char* kComponent = "UvUnwrapper";

struct AtlasDeleter {
    void operator()(xatlas::Atlas* atlas) const noexcept { xatlas::Destroy(atlas); }
};

using AtlasPtr = std::unique_ptr<xatlas::Atlas, AtlasDeleter>;

// 不复制顶点的布局
UvLayout identityLayout(size_t vertexCount, std::span<const core::Index> triangles) {
    UvLayout layout;
    layout.vertexMap.resize(vertexCount);
    std::iota(layout.vertexMap.begin(), layout.vertexMap.end(), core::Index{0});
    layout.indices.assign(triangles.begin(), triangles.end());
    layout.uvs.assign(vertexCount, core::TexCoord{0.0f, 0.0f});
    return layout;
}

} // namespace

core::Result<UvLayout> XatlasUvUnwrapper::unwrap(std::span<const core::Vertex> vertices,
                                                 std::span<const core::Index> triangles) const {
    if (vertices.empty() || triangles.empty()) {
        return identityLayout(vertices.size(), triangles);
    }

    AtlasPtr atlas{xatlas::Create()};

    xatlas::MeshDecl decl;
    decl.vertexPositionData = vertices.data();
    decl.vertexPositionStride = sizeof(core::Vertex);
    decl.vertexCount = static_cast<uint32_t>(vertices.size());
    decl.indexData = triangles.data();
    decl.indexCount = static_cast<uint32_t>(triangles.size());
    decl.indexFormat = xatlas::IndexFormat::UInt32;

    const xatlas::AddMeshError added = xatlas::AddMesh(atlas.get(), decl, 1);
    if (added != xatlas::AddMeshError::Success) {
        return core::makeError(core::ErrorCode::Internal, kComponent,
                               std::string("xatlas rejected the mesh: ") + xatlas::StringForEnum(added));
    }

    xatlas::ChartOptions chartOptions;
    chartOptions.maxIterations = options_.maxIterations;

    xatlas::PackOptions packOptions;
    packOptions.padding = options_.padding;
    packOptions.resolution = options_.resolution;
    packOptions.texelsPerUnit = options_.texelsPerUnit;
    packOptions.bruteForce = options_.bruteForce;

    xatlas::Generate(atlas.get(), chartOptions, packOptions);

    if (atlas->meshCount != 1 || atlas->width == 0 || atlas->height == 0) {
        return core::makeError(core::ErrorCode::Internal, kComponent,
                               "xatlas produced an empty atlas (" + std::to_string(atlas->width) + " x " +
                                   std::to_string(atlas->height) + ")");
    }

    const xatlas::Mesh& output = atlas->meshes[0];
    const float width = static_cast<float>(atlas->width);
    const float height = static_cast<float>(atlas->height);

    UvLayout layout;
    layout.vertexMap.reserve(output.vertexCount);
    layout.uvs.reserve(output.vertexCount);
    for (uint32_t i = 0; i < output.vertexCount; ++i) {
        const xatlas::Vertex& v = output.vertexArray[i];
        layout.vertexMap.push_back(v.xref);
        layout.uvs.push_back({std::clamp(v.uv[0] / width, 0.0f, 1.0f),
                              std::clamp(v.uv[1] / height, 0.0f, 1.0f)});
    }
    layout.indices.assign(output.indexArray, output.indexArray + output.indexCount);

    spdlog::debug("xatlas: {} charts, {} -> {} vertices, atlas {}x{}",
                  output.chartCount, vertices.size(), output.vertexCount, atlas->width, atlas->height);
    return layout;
}

core::Result<UvLayout> PlanarUvUnwrapper::unwrap(std::span<const core::Vertex> vertices,
                                                 std::span<const core::Index> triangles) const {
    UvLayout layout = identityLayout(vertices.size(), triangles);
    if (vertices.empty()) {
        return layout;
    }

    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    for (const auto& v : vertices) {
        minX = std::min(minX, v[0]);
        minY = std::min(minY, v[1]);
        maxX = std::max(maxX, v[0]);
        maxY = std::max(maxY, v[1]);
    }

    // 两个方向使用同一尺度，保持纹理不变形
    const float extent = std::max(maxX - minX, maxY - minY);
    if (extent <= 0.0f) {
        return layout;
    }

    for (size_t i = 0; i < vertices.size(); ++i) {
        layout.uvs[i] = {(vertices[i][0] - minX) / extent, (vertices[i][1] - minY) / extent};
    }
    return layout;
}

std::unique_ptr<IUvUnwrapper> createXatlasUnwrapper(XatlasOptions options) {
    return std::make_unique<XatlasUvUnwrapper>(options);
}

std::unique_ptr<IUvUnwrapper> createPlanarUnwrapper() {
    return std::make_unique<PlanarUvUnwrapper>();
}

core::Result<core::Mesh> applyUnwrap(const core::Mesh& mesh, const IUvUnwrapper& unwrapper) {
    const auto& source = mesh.vertices();
    auto layout = unwrapper.unwrap(source.positions, mesh.indices());
    if (!layout) {
        return std::unexpected(layout.error());
    }

    auto mismatch = [](std::string message) {
        return core::makeError(core::ErrorCode::Internal, kComponent, std::move(message));
    };

    if (layout->uvs.size() != layout->vertexMap.size()) {
        return mismatch("unwrapper returned " + std::to_string(layout->uvs.size()) + " UVs for " +
                        std::to_string(layout->vertexMap.size()) + " vertices");
    }
    if (layout->indices.size() != mesh.indices().size()) {
        return mismatch("unwrapper returned " + std::to_string(layout->indices.size() / 3) +
                        " triangles, expected " + std::to_string(mesh.triangleCount()));
    }
    for (const core::Index v : layout->vertexMap) {
        if (v >= source.size()) {
            return mismatch("unwrapped vertex maps to input vertex " + std::to_string(v) + " of " +
                            std::to_string(source.size()));
        }
    }
    for (const core::Index i : layout->indices) {
        if (i >= layout->vertexMap.size()) {
            return mismatch("unwrapped triangle references vertex " + std::to_string(i) + " of " +
                            std::to_string(layout->vertexMap.size()));
        }
    }

    core::Mesh::Vertices vertices;
    vertices.reserve(layout->vertexMap.size());
    for (const core::Index v : layout->vertexMap) {
        vertices.positions.push_back(source.positions[v]);
        if (source.hasNormals()) {
            vertices.normals.push_back(source.normals[v]);
        }
        if (source.hasColors()) {
            vertices.colors.push_back(source.colors[v]);
        }
    }
    vertices.texCoords = std::move(layout->uvs);

    return core::Mesh{std::move(vertices), std::move(layout->indices)};
}

} // namespace seamlod::surface
