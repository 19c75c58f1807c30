#include "host/HostMesh.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace seamlod::host {

namespace {

constexpr const char* kComponent = "HostMesh";

core::Color toColor8(const float* rgba) noexcept {
    core::Color c{};
    for (int i = 0; i < 4; ++i) {
        c[i] = static_cast<uint8_t>(std::lround(std::clamp(rgba[i], 0.0f, 1.0f) * 255.0f));
    }
    return c;
}

} // namespace

core::Result<core::Mesh> loadFrom(const ExternalMesh& external) {
    using core::ErrorCode;

    if (external.coords.size() % 3 != 0) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent,
                               "coordinate array length is not a multiple of 3");
    }
    const size_t vertexCount = external.vertexCount();
    if (vertexCount == 0) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent, "mesh has no vertices");
    }
    if (external.loopStarts.size() != external.loopTotals.size()) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent,
                               "loop start and loop total arrays differ in length");
    }
    if (!external.normals.empty() && external.normals.size() != vertexCount * 3) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent, "normal array has wrong size");
    }
    if (!external.colors.empty() && external.colors.size() != vertexCount * 4) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent, "color array has wrong size");
    }
    if (!external.loopUvs.empty() && external.loopUvs.size() != external.loopCount() * 2) {
        return core::makeError(ErrorCode::InvalidGeometry, kComponent, "UV array has wrong size");
    }

    const bool hasUvs = !external.loopUvs.empty();

    core::Mesh::Vertices vertices;
    vertices.reserve(vertexCount);
    for (size_t v = 0; v < vertexCount; ++v) {
        vertices.positions.push_back({external.coords[v * 3], external.coords[v * 3 + 1], external.coords[v * 3 + 2]});
        if (!external.normals.empty()) {
            vertices.normals.push_back({external.normals[v * 3], external.normals[v * 3 + 1], external.normals[v * 3 + 2]});
        }
        if (!external.colors.empty()) {
            vertices.colors.push_back(toColor8(&external.colors[v * 4]));
        }
    }
    if (hasUvs) {
        vertices.texCoords.assign(vertexCount, core::TexCoord{0.0f, 0.0f});
    }

    core::Mesh::Indices indices;
    for (size_t p = 0; p < external.polygonCount(); ++p) {
        const size_t start = external.loopStarts[p];
        const size_t total = external.loopTotals[p];
        if (total < 3) {
            return core::makeError(ErrorCode::InvalidGeometry, kComponent,
                                   "polygon " + std::to_string(p) + " has fewer than 3 loops");
        }
        if (start + total > external.loopCount()) {
            return core::makeError(ErrorCode::InvalidGeometry, kComponent,
                                   "polygon " + std::to_string(p) + " loop range out of bounds");
        }
        for (size_t l = start; l < start + total; ++l) {
            const uint32_t v = external.loopVertices[l];
            if (v >= vertexCount) {
                return core::makeError(ErrorCode::InvalidGeometry, kComponent,
                                       "polygon " + std::to_string(p) + " references vertex " +
                                           std::to_string(v) + " of " + std::to_string(vertexCount));
            }
            // UV 按环存储；网格按顶点存储，取最后写入的值
            if (hasUvs) {
                vertices.texCoords[v] = {external.loopUvs[l * 2], external.loopUvs[l * 2 + 1]};
            }
        }
        for (size_t k = 1; k + 1 < total; ++k) {
            indices.insert(indices.end(), {external.loopVertices[start],
                                           external.loopVertices[start + k],
                                           external.loopVertices[start + k + 1]});
        }
    }

    core::Mesh mesh{std::move(vertices), std::move(indices)};
    if (auto valid = core::validateMesh(mesh); !valid) {
        return std::unexpected(valid.error());
    }

    spdlog::debug("Host: loaded {} polygons as {} triangles over {} vertices",
                  external.polygonCount(), mesh.triangleCount(), mesh.vertexCount());
    return mesh;
}

ExternalMesh toExternal(const core::Mesh& mesh) {
    ExternalMesh external;
    const auto& vertices = mesh.vertices();

    external.coords.reserve(vertices.size() * 3);
    for (const auto& p : vertices.positions) {
        external.coords.insert(external.coords.end(), p.begin(), p.end());
    }
    if (vertices.hasNormals()) {
        external.normals.reserve(vertices.size() * 3);
        for (const auto& n : vertices.normals) {
            external.normals.insert(external.normals.end(), n.begin(), n.end());
        }
    }
    if (vertices.hasColors()) {
        external.colors.reserve(vertices.size() * 4);
        for (const auto& c : vertices.colors) {
            for (const uint8_t channel : c) {
                external.colors.push_back(channel / 255.0f);
            }
        }
    }

    const auto& indices = mesh.indices();
    external.loopVertices.assign(indices.begin(), indices.end());
    external.loopStarts.reserve(mesh.triangleCount());
    external.loopTotals.assign(mesh.triangleCount(), 3);
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        external.loopStarts.push_back(static_cast<uint32_t>(t * 3));
    }

    if (vertices.hasTexCoords()) {
        external.loopUvs.reserve(indices.size() * 2);
        for (const auto index : indices) {
            external.loopUvs.push_back(vertices.texCoords[index][0]);
            external.loopUvs.push_back(vertices.texCoords[index][1]);
        }
    }

    return external;
}

} // namespace seamlod::host
