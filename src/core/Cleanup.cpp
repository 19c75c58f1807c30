#include "core/Cleanup.hpp"
#include "core/Geometry.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

namespace seamlod::core {

namespace {

constexpr const char* kComponent = "Cleanup";

// 环在水平面上的包围范围（取较长边）
float loopExtent(const Mesh& mesh, const BoundaryLoop& loop) noexcept {
    BoundingBox box{mesh.position(loop.vertices.front()), mesh.position(loop.vertices.front())};
    for (const Index v : loop.vertices) {
        const auto& p = mesh.position(v);
        for (int i = 0; i < 3; ++i) {
            box.min[i] = std::min(box.min[i], p[i]);
            box.max[i] = std::max(box.max[i], p[i]);
        }
    }
    return box.longestHorizontalSide();
}

// 在环的质心处追加一个顶点，属性取环上顶点的平均值
Index appendCentroid(Mesh::Vertices& vertices, const BoundaryLoop& loop) {
    const double n = static_cast<double>(loop.vertices.size());
    double pos[3] = {0, 0, 0};
    double nrm[3] = {0, 0, 0};
    double uv[2] = {0, 0};
    double rgba[4] = {0, 0, 0, 0};

    for (const Index v : loop.vertices) {
        for (int i = 0; i < 3; ++i) {
            pos[i] += vertices.positions[v][i];
        }
        if (vertices.hasNormals()) {
            for (int i = 0; i < 3; ++i) {
                nrm[i] += vertices.normals[v][i];
            }
        }
        if (vertices.hasTexCoords()) {
            uv[0] += vertices.texCoords[v][0];
            uv[1] += vertices.texCoords[v][1];
        }
        if (vertices.hasColors()) {
            for (int i = 0; i < 4; ++i) {
                rgba[i] += vertices.colors[v][i];
            }
        }
    }

    const Index index = static_cast<Index>(vertices.positions.size());
    vertices.positions.push_back({float(pos[0] / n), float(pos[1] / n), float(pos[2] / n)});

    if (vertices.hasNormals()) {
        const double len = std::sqrt(nrm[0] * nrm[0] + nrm[1] * nrm[1] + nrm[2] * nrm[2]);
        if (len > 0.0) {
            vertices.normals.push_back({float(nrm[0] / len), float(nrm[1] / len), float(nrm[2] / len)});
        } else {
            vertices.normals.push_back({0.0f, 0.0f, 1.0f});
        }
    }
    if (vertices.hasTexCoords()) {
        vertices.texCoords.push_back({float(uv[0] / n), float(uv[1] / n)});
    }
    if (vertices.hasColors()) {
        Color c{};
        for (int i = 0; i < 4; ++i) {
            c[i] = static_cast<uint8_t>(std::lround(rgba[i] / n));
        }
        vertices.colors.push_back(c);
    }

    return index;
}

} // namespace

Mesh removeLooseComponents(const Mesh& mesh, size_t minVertices, size_t* removedCount) {
    if (removedCount) {
        *removedCount = 0;
    }
    if (minVertices == 0 || mesh.empty()) {
        return mesh;
    }

    const EdgeAdjacency adjacency(mesh);
    const auto labels = adjacency.connectedComponents();

    std::vector<uint8_t> keep(labels.componentCount(), 0);
    size_t removed = 0;
    for (size_t c = 0; c < labels.componentCount(); ++c) {
        keep[c] = labels.vertexCounts[c] >= minVertices ? 1 : 0;
        if (!keep[c]) {
            ++removed;
        }
    }

    if (removedCount) {
        *removedCount = removed;
    }
    if (removed == 0) {
        return mesh;
    }

    std::vector<Index> keptTriangles;
    keptTriangles.reserve(mesh.triangleCount());
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        if (keep[labels.triangleComponent[t]]) {
            keptTriangles.push_back(static_cast<Index>(t));
        }
    }

    return mesh.subset(keptTriangles);
}

Mesh fillHoles(const Mesh& mesh, size_t maxEdges, size_t* filledCount) {
    if (filledCount) {
        *filledCount = 0;
    }
    if (maxEdges < 3 || mesh.empty()) {
        return mesh;
    }

    const EdgeAdjacency adjacency(mesh);
    const auto loops = adjacency.boundaryLoops();
    if (loops.empty()) {
        return mesh;
    }

    // 最外圈边界不是孔洞
    size_t rim = 0;
    float rimExtent = -1.0f;
    for (size_t i = 0; i < loops.size(); ++i) {
        const float extent = loopExtent(mesh, loops[i]);
        if (extent > rimExtent) {
            rimExtent = extent;
            rim = i;
        }
    }

    Mesh::Vertices vertices = mesh.vertices();
    Mesh::Indices indices = mesh.indices();
    size_t filled = 0;

    for (size_t i = 0; i < loops.size(); ++i) {
        const auto& loop = loops[i];
        if (i == rim || !loop.closed || loop.edgeCount() < 3 || loop.edgeCount() > maxEdges) {
            continue;
        }

        const auto& ring = loop.vertices;
        const size_t n = ring.size();

        // 补洞三角形与边界边方向相反
        if (n == 3) {
            indices.insert(indices.end(), {ring[2], ring[1], ring[0]});
        } else {
            const Index center = appendCentroid(vertices, loop);
            for (size_t k = 0; k < n; ++k) {
                indices.insert(indices.end(), {ring[(k + 1) % n], ring[k], center});
            }
        }
        ++filled;
    }

    if (filledCount) {
        *filledCount = filled;
    }
    return Mesh{std::move(vertices), std::move(indices)};
}

Result<CleanupResult> cleanupMesh(const Mesh& mesh, const CleanupConfig& config) {
    if (auto valid = validateMesh(mesh); !valid) {
        return std::unexpected(valid.error());
    }

    CleanupResult result;
    result.stats.verticesBefore = mesh.vertexCount();
    result.stats.trianglesBefore = mesh.triangleCount();

    Mesh current = weldNear(mesh, config.mergeDistance);
    spdlog::debug("Cleanup: weld ({}) {} -> {} vertices",
                  config.mergeDistance, mesh.vertexCount(), current.vertexCount());

    current = removeDegenerate(current);
    current = removeLooseComponents(current, config.minComponentVertices, &result.stats.componentsRemoved);
    current = fillHoles(current, config.maxHoleEdges, &result.stats.holesFilled);
    current = removeDegenerate(current);

    if (current.empty()) {
        return makeError(ErrorCode::InvalidGeometry, kComponent, "no triangles left after cleanup");
    }

    result.stats.verticesAfter = current.vertexCount();
    result.stats.trianglesAfter = current.triangleCount();
    result.mesh = std::move(current);

    spdlog::info("Cleanup: removed {} vertices, {} loose components, filled {} holes",
                 result.stats.verticesBefore - std::min(result.stats.verticesBefore, result.stats.verticesAfter),
                 result.stats.componentsRemoved, result.stats.holesFilled);
    return result;
}

} // namespace seamlod::core
