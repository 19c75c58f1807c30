#include "core/TilePartitioner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <bit>
#include <cmath>
#include <unordered_map>
#include <utility>

namespace seamlod::core {

namespace {

constexpr const char* kComponent = "TilePartitioner";

// 裁剪点的来源。相同来源的点在任何单元中都用同一组输入、同样的顺序计算，
// 因此相邻瓦片得到逐位相同的坐标
enum class PointKind : uint8_t {
    Original,    // 源顶点 a
    EdgePoint,   // 源边 (a, b) 与切分面 axis = c 的交点，a < b
    Corner,      // 源三角形 a 内部两条切分线的交点 (x, y)
    Segment      // 兜底：按两端点插值
};

struct PointKey {
    PointKind kind{PointKind::Original};
    uint32_t a{0};
    uint32_t b{0};
    uint32_t axis{0};
    uint32_t bits0{0};
    uint32_t bits1{0};

    bool operator==(const PointKey&) const = default;
};

struct PointKeyHash {
    size_t operator()(const PointKey& key) const noexcept {
        uint64_t h = static_cast<uint64_t>(key.kind);
        for (const uint64_t part : {uint64_t(key.a), uint64_t(key.b), uint64_t(key.axis),
                                    uint64_t(key.bits0), uint64_t(key.bits1)}) {
            h ^= part + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        }
        return static_cast<size_t>(h);
    }
};

uint32_t floatBits(float v) noexcept {
    return std::bit_cast<uint32_t>(v == 0.0f ? 0.0f : v);
}

// 裁剪多边形的顶点，属性以浮点形式携带
struct ClipVertex {
    PointKey key;
    Vertex position{};
    Normal normal{};
    TexCoord uv{};
    std::array<float, 4> color{};
};

// 源网格的只读视图
struct SourceView {
    const Mesh& mesh;
    bool hasNormals;
    bool hasTexCoords;
    bool hasColors;

    explicit SourceView(const Mesh& m)
        : mesh(m),
          hasNormals(m.vertices().hasNormals()),
          hasTexCoords(m.vertices().hasTexCoords()),
          hasColors(m.vertices().hasColors()) {}

    ClipVertex original(Index i) const {
        const auto& v = mesh.vertices();
        ClipVertex cv;
        cv.key = PointKey{PointKind::Original, i, 0, 0, 0, 0};
        cv.position = v.positions[i];
        if (hasNormals) {
            cv.normal = v.normals[i];
        }
        if (hasTexCoords) {
            cv.uv = v.texCoords[i];
        }
        if (hasColors) {
            for (int k = 0; k < 4; ++k) {
                cv.color[k] = v.colors[i][k];
            }
        }
        return cv;
    }
};

// 按权重组合若干顶点的属性（位置和法线在双精度下计算）
ClipVertex blend(std::initializer_list<std::pair<const ClipVertex*, double>> parts) {
    double pos[3] = {0, 0, 0};
    double nrm[3] = {0, 0, 0};
    double uv[2] = {0, 0};
    double rgba[4] = {0, 0, 0, 0};

    for (const auto& [v, w] : parts) {
        for (int k = 0; k < 3; ++k) {
            pos[k] += w * v->position[k];
            nrm[k] += w * v->normal[k];
        }
        uv[0] += w * v->uv[0];
        uv[1] += w * v->uv[1];
        for (int k = 0; k < 4; ++k) {
            rgba[k] += w * v->color[k];
        }
    }

    ClipVertex out;
    for (int k = 0; k < 3; ++k) {
        out.position[k] = static_cast<float>(pos[k]);
    }
    const double len = std::sqrt(nrm[0] * nrm[0] + nrm[1] * nrm[1] + nrm[2] * nrm[2]);
    if (len > 0.0) {
        for (int k = 0; k < 3; ++k) {
            out.normal[k] = static_cast<float>(nrm[k] / len);
        }
    }
    out.uv = {static_cast<float>(uv[0]), static_cast<float>(uv[1])};
    for (int k = 0; k < 4; ++k) {
        out.color[k] = static_cast<float>(rgba[k]);
    }
    return out;
}

ClipVertex lerp(const ClipVertex& p, const ClipVertex& q, double t) {
    return blend({{&p, 1.0 - t}, {&q, t}});
}

// 源边与切分面的交点：始终以较小的源索引为起点
ClipVertex makeEdgePoint(const SourceView& src, Index a, Index b, int axis, float c) {
    if (a > b) {
        std::swap(a, b);
    }
    const ClipVertex va = src.original(a);
    const ClipVertex vb = src.original(b);
    const double denom = double(vb.position[axis]) - va.position[axis];
    const double t = (double(c) - va.position[axis]) / denom;

    ClipVertex out = lerp(va, vb, t);
    out.position[axis] = c;  // 精确落在切分面上
    out.key = PointKey{PointKind::EdgePoint, a, b, static_cast<uint32_t>(axis), floatBits(c), 0};
    return out;
}

// 两个端点都位于同一条源边上时返回该边
std::optional<std::pair<Index, Index>> sharedSourceEdge(const ClipVertex& p, const ClipVertex& q) noexcept {
    const auto& kp = p.key;
    const auto& kq = q.key;

    if (kp.kind == PointKind::Original && kq.kind == PointKind::Original) {
        if (kp.a != kq.a) {
            return std::make_pair(std::min(kp.a, kq.a), std::max(kp.a, kq.a));
        }
        return std::nullopt;
    }
    if (kp.kind == PointKind::Original && kq.kind == PointKind::EdgePoint) {
        if (kp.a == kq.a || kp.a == kq.b) {
            return std::make_pair(kq.a, kq.b);
        }
        return std::nullopt;
    }
    if (kp.kind == PointKind::EdgePoint && kq.kind == PointKind::Original) {
        if (kq.a == kp.a || kq.a == kp.b) {
            return std::make_pair(kp.a, kp.b);
        }
        return std::nullopt;
    }
    if (kp.kind == PointKind::EdgePoint && kq.kind == PointKind::EdgePoint) {
        if (kp.a == kq.a && kp.b == kq.b) {
            return std::make_pair(kp.a, kp.b);
        }
    }
    return std::nullopt;
}

// 单个源三角形的裁剪上下文
struct TriangleContext {
    const SourceView& src;
    Index triangleId;
    std::array<Index, 3> sorted;   // 源索引升序，保证插值顺序固定

    // 三角形内部两条切分线的交点，按 XY 重心坐标插值
    std::optional<ClipVertex> corner(float x, float y) const {
        const ClipVertex v0 = src.original(sorted[0]);
        const ClipVertex v1 = src.original(sorted[1]);
        const ClipVertex v2 = src.original(sorted[2]);

        const double x0 = v0.position[0], y0 = v0.position[1];
        const double x1 = v1.position[0], y1 = v1.position[1];
        const double x2 = v2.position[0], y2 = v2.position[1];

        const double det = (y1 - y2) * (x0 - x2) + (x2 - x1) * (y0 - y2);
        if (det == 0.0) {
            return std::nullopt;   // 竖直三角形
        }

        const double l0 = ((y1 - y2) * (double(x) - x2) + (x2 - x1) * (double(y) - y2)) / det;
        const double l1 = ((y2 - y0) * (double(x) - x2) + (x0 - x2) * (double(y) - y2)) / det;
        const double l2 = 1.0 - l0 - l1;

        ClipVertex out = blend({{&v0, l0}, {&v1, l1}, {&v2, l2}});
        out.position[0] = x;
        out.position[1] = y;
        out.key = PointKey{PointKind::Corner, triangleId, 0, 0, floatBits(x), floatBits(y)};
        return out;
    }

    ClipVertex intersect(const ClipVertex& p, const ClipVertex& q, int axis, float c) const {
        if (auto edge = sharedSourceEdge(p, q)) {
            return makeEdgePoint(src, edge->first, edge->second, axis, c);
        }

        // 不在源边上的线段只能位于另一轴向的切分线上
        const int other = 1 - axis;
        if (p.position[other] == q.position[other]) {
            float xy[2];
            xy[axis] = c;
            xy[other] = p.position[other];
            if (auto cv = corner(xy[0], xy[1])) {
                return *cv;
            }
        }

        const double t = (double(c) - p.position[axis]) / (double(q.position[axis]) - p.position[axis]);
        ClipVertex out = lerp(p, q, t);
        out.position[axis] = c;
        out.key = PointKey{PointKind::Segment, triangleId, 0, static_cast<uint32_t>(axis),
                           floatBits(out.position[0]), floatBits(out.position[1])};
        return out;
    }
};

// Sutherland–Hodgman：保留 keepGreater ? p[axis] >= c : p[axis] <= c 的一侧
std::vector<ClipVertex> clipAgainst(const std::vector<ClipVertex>& polygon, int axis, float c,
                                    bool keepGreater, const TriangleContext& ctx) {
    std::vector<ClipVertex> out;
    if (polygon.empty()) {
        return out;
    }
    out.reserve(polygon.size() + 2);

    auto side = [&](const ClipVertex& v) -> int {
        const float value = v.position[axis];
        if (value == c) {
            return 0;
        }
        const bool greater = value > c;
        return greater == keepGreater ? 1 : -1;
    };

    const size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        const ClipVertex& p = polygon[i];
        const ClipVertex& q = polygon[(i + 1) % n];
        const int sp = side(p);
        const int sq = side(q);

        if (sp >= 0) {
            out.push_back(p);
        }
        if (sp * sq < 0) {
            out.push_back(ctx.intersect(p, q, axis, c));
        }
    }
    return out;
}

// 单个瓦片的增量构建器
class TileBuilder {
public:
    TileBuilder(const SourceView& src) : src_(src) {}

    Index addVertex(const ClipVertex& cv) {
        auto [it, inserted] = lookup_.try_emplace(cv.key, static_cast<Index>(vertices_.positions.size()));
        if (!inserted) {
            return it->second;
        }

        vertices_.positions.push_back(cv.position);
        if (src_.hasNormals) {
            vertices_.normals.push_back(cv.normal);
        }
        if (src_.hasTexCoords) {
            vertices_.texCoords.push_back(cv.uv);
        }
        if (src_.hasColors) {
            Color c{};
            for (int k = 0; k < 4; ++k) {
                c[k] = static_cast<uint8_t>(std::clamp(std::lround(cv.color[k]), 0L, 255L));
            }
            vertices_.colors.push_back(c);
        }
        return it->second;
    }

    void addTriangle(const ClipVertex& a, const ClipVertex& b, const ClipVertex& c) {
        const Index ia = addVertex(a);
        const Index ib = addVertex(b);
        const Index ic = addVertex(c);
        if (ia == ib || ib == ic || ia == ic) {
            return;
        }
        indices_.insert(indices_.end(), {ia, ib, ic});
    }

    // 凸多边形扇形三角化，跳过零面积三角形
    void addPolygon(std::vector<ClipVertex> polygon) {
        auto last = std::unique(polygon.begin(), polygon.end(),
                                [](const ClipVertex& l, const ClipVertex& r) { return l.key == r.key; });
        polygon.erase(last, polygon.end());
        while (polygon.size() > 1 && polygon.front().key == polygon.back().key) {
            polygon.pop_back();
        }
        if (polygon.size() < 3) {
            return;
        }

        for (size_t k = 1; k + 1 < polygon.size(); ++k) {
            if (triangleArea(polygon[0].position, polygon[k].position, polygon[k + 1].position) <= 0.0) {
                continue;
            }
            addTriangle(polygon[0], polygon[k], polygon[k + 1]);
        }
    }

    bool empty() const noexcept { return indices_.empty(); }

    Mesh build() { return Mesh{std::move(vertices_), std::move(indices_)}; }

    size_t clippedTriangles{0};

private:
    const SourceView& src_;
    std::unordered_map<PointKey, Index, PointKeyHash> lookup_;
    Mesh::Vertices vertices_;
    Mesh::Indices indices_;
};

} // namespace

std::string toString(const TileCoord& coord) {
    return "x" + std::to_string(coord.x) + "_y" + std::to_string(coord.y);
}

int GridSpec::cellLow(int axis, float v) const noexcept {
    const auto& p = planes(axis);
    const auto it = std::upper_bound(p.begin(), p.end(), v);
    const int cell = static_cast<int>(it - p.begin()) - 1;
    return std::clamp(cell, 0, gridSize - 1);
}

int GridSpec::cellHigh(int axis, float v) const noexcept {
    const auto& p = planes(axis);
    const auto it = std::lower_bound(p.begin(), p.end(), v);
    const int cell = static_cast<int>(it - p.begin()) - 1;
    return std::clamp(cell, 0, gridSize - 1);
}

std::optional<int> gridFromModuleCount(int modules) noexcept {
    if (modules <= 0 || (modules & (modules - 1)) != 0) {
        return std::nullopt;
    }
    int grid = 1;
    while ((grid + 1) * (grid + 1) <= modules) {
        ++grid;
    }
    return grid;
}

Result<GridSpec> computeGrid(const Mesh& mesh, int gridSize) {
    if (gridSize < 1) {
        return makeError(ErrorCode::InvalidConfig, kComponent,
                         "grid size must be at least 1, got " + std::to_string(gridSize));
    }

    const BoundingBox bounds = computeBoundingBox(mesh);
    const auto extent = bounds.size();
    if (!(extent[0] > 0.0f) || !(extent[1] > 0.0f)) {
        return makeError(ErrorCode::DegenerateBounds, kComponent,
                         "bounding box has zero horizontal extent (" + std::to_string(extent[0]) +
                             " x " + std::to_string(extent[1]) + ")");
    }

    GridSpec grid;
    grid.gridSize = gridSize;
    grid.bounds = bounds;

    // 正方形单元：边长取水平包围盒的最长边 / gridSize
    const double side = double(bounds.longestHorizontalSide()) / gridSize;
    grid.cellSize = static_cast<float>(side);
    grid.planesX.resize(gridSize + 1);
    grid.planesY.resize(gridSize + 1);
    for (int k = 0; k <= gridSize; ++k) {
        grid.planesX[k] = static_cast<float>(double(bounds.min[0]) + k * side);
        grid.planesY[k] = static_cast<float>(double(bounds.min[1]) + k * side);
    }
    // 首尾切分面必须把所有顶点包含在内
    grid.planesX.front() = bounds.min[0];
    grid.planesY.front() = bounds.min[1];
    grid.planesX.back() = std::max(grid.planesX.back(), bounds.max[0]);
    grid.planesY.back() = std::max(grid.planesY.back(), bounds.max[1]);

    return grid;
}

Result<std::vector<Tile>> partitionMesh(const Mesh& mesh, const PartitionConfig& config) {
    if (auto valid = validateMesh(mesh); !valid) {
        return std::unexpected(valid.error());
    }

    auto gridResult = computeGrid(mesh, config.gridSize);
    if (!gridResult) {
        return std::unexpected(gridResult.error());
    }
    const GridSpec& grid = *gridResult;
    const int g = grid.gridSize;

    const SourceView src(mesh);
    std::vector<TileBuilder> builders;
    builders.reserve(static_cast<size_t>(g) * g);
    for (int i = 0; i < g * g; ++i) {
        builders.emplace_back(src);
    }
    auto builderAt = [&](int x, int y) -> TileBuilder& { return builders[static_cast<size_t>(y) * g + x]; };

    size_t clipped = 0;

    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        const ClipVertex v0 = src.original(tri[0]);
        const ClipVertex v1 = src.original(tri[1]);
        const ClipVertex v2 = src.original(tri[2]);

        float lo[2], hi[2];
        for (int axis = 0; axis < 2; ++axis) {
            lo[axis] = std::min({v0.position[axis], v1.position[axis], v2.position[axis]});
            hi[axis] = std::max({v0.position[axis], v1.position[axis], v2.position[axis]});
        }

        // 恰好位于切分面内的三角形只归入正侧单元
        const int x0 = grid.cellLow(0, lo[0]);
        const int x1 = std::max(x0, grid.cellHigh(0, hi[0]));
        const int y0 = grid.cellLow(1, lo[1]);
        const int y1 = std::max(y0, grid.cellHigh(1, hi[1]));

        if (x0 == x1 && y0 == y1) {
            builderAt(x0, y0).addTriangle(v0, v1, v2);
            continue;
        }

        ++clipped;
        std::array<Index, 3> sorted = tri;
        std::sort(sorted.begin(), sorted.end());
        const TriangleContext ctx{src, static_cast<Index>(t), sorted};
        const std::vector<ClipVertex> polygon{v0, v1, v2};

        for (int cy = y0; cy <= y1; ++cy) {
            for (int cx = x0; cx <= x1; ++cx) {
                auto fragment = clipAgainst(polygon, 0, grid.planesX[cx], true, ctx);
                fragment = clipAgainst(fragment, 0, grid.planesX[cx + 1], false, ctx);
                fragment = clipAgainst(fragment, 1, grid.planesY[cy], true, ctx);
                fragment = clipAgainst(fragment, 1, grid.planesY[cy + 1], false, ctx);
                if (fragment.size() < 3) {
                    continue;
                }
                auto& builder = builderAt(cx, cy);
                ++builder.clippedTriangles;
                builder.addPolygon(std::move(fragment));
            }
        }
    }

    std::vector<Tile> tiles;
    for (int y = 0; y < g; ++y) {
        for (int x = 0; x < g; ++x) {
            auto& builder = builderAt(x, y);
            if (builder.empty()) {
                continue;
            }

            Tile tile;
            tile.coord = TileCoord{x, y};
            tile.clippedTriangles = builder.clippedTriangles;
            tile.mesh = builder.build();
            // 单元超出占地范围时收缩到包围盒，外缘同样被锁定
            tile.planes = {
                Plane::axisAligned(0, std::max(grid.planesX[x], grid.bounds.min[0]), 1.0f),
                Plane::axisAligned(0, std::min(grid.planesX[x + 1], grid.bounds.max[0]), -1.0f),
                Plane::axisAligned(1, std::max(grid.planesY[y], grid.bounds.min[1]), 1.0f),
                Plane::axisAligned(1, std::min(grid.planesY[y + 1], grid.bounds.max[1]), -1.0f)
            };
            tiles.push_back(std::move(tile));
        }
    }

    spdlog::info("Partition: {} tiles from a {}x{} grid (cell {:.3f}), {} triangles clipped",
                 tiles.size(), g, g, grid.cellSize, clipped);
    return tiles;
}

} // namespace seamlod::core
