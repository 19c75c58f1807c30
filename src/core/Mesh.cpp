#include "core/Mesh.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <string>
#include <unordered_map>

namespace seamlod::core {

namespace {

constexpr const char* kComponent = "GeometryModel";

// 体素网格键，用于近邻焊接
struct CellKey {
    int64_t x, y, z;
    bool operator==(const CellKey&) const = default;
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const noexcept {
        size_t h = std::hash<int64_t>{}(key.x);
        h ^= std::hash<int64_t>{}(key.y) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<int64_t>{}(key.z) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

CellKey cellOf(const Vertex& p, double cellSize) noexcept {
    return CellKey{static_cast<int64_t>(std::floor(p[0] / cellSize)),
                   static_cast<int64_t>(std::floor(p[1] / cellSize)),
                   static_cast<int64_t>(std::floor(p[2] / cellSize))};
}

CellKey exactKeyOf(const Vertex& p) noexcept {
    // +0.0 与 -0.0 视为同一坐标
    auto bits = [](float v) { return static_cast<int64_t>(std::bit_cast<uint32_t>(v == 0.0f ? 0.0f : v)); };
    return CellKey{bits(p[0]), bits(p[1]), bits(p[2])};
}

double squaredDistance(const Vertex& a, const Vertex& b) noexcept {
    const double dx = double(a[0]) - b[0];
    const double dy = double(a[1]) - b[1];
    const double dz = double(a[2]) - b[2];
    return dx * dx + dy * dy + dz * dz;
}

// 按重映射表重建网格：丢弃退化三角形，再压缩顶点
Mesh remapAndCompact(const Mesh& mesh, const std::vector<Index>& remap) {
    Mesh::Indices newIndices;
    newIndices.reserve(mesh.indices().size());

    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        const Index a = remap[tri[0]];
        const Index b = remap[tri[1]];
        const Index c = remap[tri[2]];
        if (a == b || b == c || a == c) {
            continue;
        }
        newIndices.push_back(a);
        newIndices.push_back(b);
        newIndices.push_back(c);
    }

    return compactVertices(mesh.withIndices(std::move(newIndices)));
}

} // namespace

Mesh Mesh::subset(std::span<const Index> triangleIndices) const {
    if (triangleIndices.empty() || indices_.empty()) {
        return Mesh{};
    }

    Indices newIndices;
    newIndices.reserve(triangleIndices.size() * 3);

    for (const auto triIndex : triangleIndices) {
        if (static_cast<size_t>(triIndex) * 3 + 2 < indices_.size()) {
            newIndices.push_back(indices_[triIndex * 3]);
            newIndices.push_back(indices_[triIndex * 3 + 1]);
            newIndices.push_back(indices_[triIndex * 3 + 2]);
        }
    }

    // 顶点重映射交给 compactVertices
    return compactVertices(Mesh{vertices_, std::move(newIndices)});
}

double triangleArea(const Vertex& a, const Vertex& b, const Vertex& c) noexcept {
    const double e1[3] = {double(b[0]) - a[0], double(b[1]) - a[1], double(b[2]) - a[2]};
    const double e2[3] = {double(c[0]) - a[0], double(c[1]) - a[1], double(c[2]) - a[2]};

    const double cx = e1[1] * e2[2] - e1[2] * e2[1];
    const double cy = e1[2] * e2[0] - e1[0] * e2[2];
    const double cz = e1[0] * e2[1] - e1[1] * e2[0];

    return 0.5 * std::sqrt(cx * cx + cy * cy + cz * cz);
}

double surfaceArea(const Mesh& mesh) noexcept {
    double area = 0.0;
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        area += triangleArea(mesh.position(tri[0]), mesh.position(tri[1]), mesh.position(tri[2]));
    }
    return area;
}

MeshStats computeStats(const Mesh& mesh) noexcept {
    MeshStats stats;

    if (mesh.empty()) {
        return stats;
    }

    stats.vertexCount = mesh.vertexCount();
    stats.triangleCount = mesh.triangleCount();

    const auto& positions = mesh.vertices().positions;
    stats.boundingBoxMin = positions[0];
    stats.boundingBoxMax = positions[0];

    for (const auto& pos : positions) {
        for (int i = 0; i < 3; ++i) {
            stats.boundingBoxMin[i] = std::min(stats.boundingBoxMin[i], pos[i]);
            stats.boundingBoxMax[i] = std::max(stats.boundingBoxMax[i], pos[i]);
        }
    }

    stats.surfaceArea = surfaceArea(mesh);
    return stats;
}

Result<void> validateMesh(const Mesh& mesh) {
    const auto& vertices = mesh.vertices();
    const size_t vertexCount = vertices.size();

    if (vertexCount == 0) {
        return makeError(ErrorCode::InvalidGeometry, kComponent, "mesh has no vertices");
    }

    if (mesh.indices().size() % 3 != 0) {
        return makeError(ErrorCode::InvalidGeometry, kComponent,
                         "index count " + std::to_string(mesh.indices().size()) + " is not a multiple of 3");
    }

    for (size_t i = 0; i < mesh.indices().size(); ++i) {
        if (mesh.indices()[i] >= vertexCount) {
            return makeError(ErrorCode::InvalidGeometry, kComponent,
                             "triangle " + std::to_string(i / 3) + " references vertex " +
                                 std::to_string(mesh.indices()[i]) + " of " + std::to_string(vertexCount));
        }
    }

    const bool attributesConsistent =
        (!vertices.hasNormals() || vertices.normals.size() == vertexCount) &&
        (!vertices.hasTexCoords() || vertices.texCoords.size() == vertexCount) &&
        (!vertices.hasColors() || vertices.colors.size() == vertexCount);
    if (!attributesConsistent) {
        return makeError(ErrorCode::InvalidGeometry, kComponent, "vertex attribute arrays differ in length");
    }

    return {};
}

Mesh removeDegenerate(const Mesh& mesh) {
    Mesh::Indices kept;
    kept.reserve(mesh.indices().size());

    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        if (tri[0] == tri[1] || tri[1] == tri[2] || tri[0] == tri[2]) {
            continue;
        }
        if (triangleArea(mesh.position(tri[0]), mesh.position(tri[1]), mesh.position(tri[2])) <= 0.0) {
            continue;
        }
        kept.insert(kept.end(), tri.begin(), tri.end());
    }

    return compactVertices(mesh.withIndices(std::move(kept)));
}

Mesh weldNear(const Mesh& mesh, float epsilon) {
    const auto& positions = mesh.vertices().positions;
    std::vector<Index> remap(positions.size());

    double maxAbs = 0.0;
    for (const auto& p : positions) {
        maxAbs = std::max({maxAbs, std::abs(double(p[0])), std::abs(double(p[1])), std::abs(double(p[2]))});
    }

    if (epsilon <= 0.0f || !std::isfinite(maxAbs)) {
        std::unordered_map<CellKey, Index, CellKeyHash> exact;
        exact.reserve(positions.size());
        for (size_t i = 0; i < positions.size(); ++i) {
            auto [it, inserted] = exact.try_emplace(exactKeyOf(positions[i]), static_cast<Index>(i));
            remap[i] = it->second;
        }
        return remapAndCompact(mesh, remap);
    }

    // 网格尺寸不小于 epsilon，代表点只需在相邻 27 个格子中查找；
    // 相对坐标量级设下限，格子编号不会超出 int64
    const double cellSize = std::max(double(epsilon), std::ldexp(maxAbs, -40));
    const double epsilonSq = double(epsilon) * epsilon;
    std::unordered_map<CellKey, std::vector<Index>, CellKeyHash> grid;
    grid.reserve(positions.size());

    for (size_t i = 0; i < positions.size(); ++i) {
        const CellKey key = cellOf(positions[i], cellSize);
        Index representative = static_cast<Index>(i);
        bool found = false;

        for (int64_t dz = -1; dz <= 1 && !found; ++dz) {
            for (int64_t dy = -1; dy <= 1 && !found; ++dy) {
                for (int64_t dx = -1; dx <= 1 && !found; ++dx) {
                    auto it = grid.find(CellKey{key.x + dx, key.y + dy, key.z + dz});
                    if (it == grid.end()) {
                        continue;
                    }
                    for (const Index candidate : it->second) {
                        if (squaredDistance(positions[candidate], positions[i]) <= epsilonSq) {
                            representative = candidate;
                            found = true;
                            break;
                        }
                    }
                }
            }
        }

        if (!found) {
            grid[key].push_back(static_cast<Index>(i));
        }
        remap[i] = representative;
    }

    return remapAndCompact(mesh, remap);
}

Mesh compactVertices(const Mesh& mesh) {
    constexpr Index kUnused = ~Index{0};
    const auto& vertices = mesh.vertices();
    std::vector<Index> remap(vertices.size(), kUnused);

    for (const Index index : mesh.indices()) {
        remap[index] = 0;
    }

    Mesh::Vertices newVertices;
    Index next = 0;
    for (size_t i = 0; i < remap.size(); ++i) {
        if (remap[i] == kUnused) {
            continue;
        }
        remap[i] = next++;
        newVertices.appendFrom(vertices, static_cast<Index>(i));
    }

    Mesh::Indices newIndices;
    newIndices.reserve(mesh.indices().size());
    for (const Index index : mesh.indices()) {
        newIndices.push_back(remap[index]);
    }

    return Mesh{std::move(newVertices), std::move(newIndices)};
}

} // namespace seamlod::core
