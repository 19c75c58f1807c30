#include "core/Geometry.hpp"
#include <numeric>

namespace seamlod::core {

namespace {

// 并查集，用于连通分量
class DisjointSet {
public:
    explicit DisjointSet(size_t count) : parent_(count) {
        std::iota(parent_.begin(), parent_.end(), Index{0});
    }

    Index find(Index v) noexcept {
        while (parent_[v] != v) {
            parent_[v] = parent_[parent_[v]];
            v = parent_[v];
        }
        return v;
    }

    void unite(Index a, Index b) noexcept {
        a = find(a);
        b = find(b);
        if (a != b) {
            parent_[std::max(a, b)] = std::min(a, b);
        }
    }

private:
    std::vector<Index> parent_;
};

} // namespace

EdgeAdjacency::EdgeAdjacency(const Mesh& mesh)
    : mesh_(mesh), boundaryVertex_(mesh.vertexCount(), 0) {
    edgeUse_.reserve(mesh.indices().size());

    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        for (int e = 0; e < 3; ++e) {
            ++edgeUse_[edgeKey(tri[e], tri[(e + 1) % 3])];
        }
    }

    // 按三角形顺序收集边界边，保证结果确定
    for (size_t t = 0; t < mesh.triangleCount(); ++t) {
        const auto tri = mesh.triangle(t);
        for (int e = 0; e < 3; ++e) {
            const Index a = tri[e];
            const Index b = tri[(e + 1) % 3];
            if (edgeUse_[edgeKey(a, b)] == 1) {
                boundaryEdges_.push_back(Edge{a, b});
                boundaryVertex_[a] = 1;
                boundaryVertex_[b] = 1;
            }
        }
    }
}

uint32_t EdgeAdjacency::edgeUseCount(Index a, Index b) const noexcept {
    auto it = edgeUse_.find(edgeKey(a, b));
    return it == edgeUse_.end() ? 0u : it->second;
}

std::vector<BoundaryLoop> EdgeAdjacency::boundaryLoops() const {
    // from -> 边界边编号（非流形顶点可能有多条出边）
    std::unordered_multimap<Index, size_t> outgoing;
    outgoing.reserve(boundaryEdges_.size());
    for (size_t i = 0; i < boundaryEdges_.size(); ++i) {
        outgoing.emplace(boundaryEdges_[i].from, i);
    }

    std::vector<uint8_t> used(boundaryEdges_.size(), 0);
    std::vector<BoundaryLoop> loops;

    for (size_t start = 0; start < boundaryEdges_.size(); ++start) {
        if (used[start]) {
            continue;
        }

        BoundaryLoop loop;
        size_t current = start;
        while (true) {
            used[current] = 1;
            loop.vertices.push_back(boundaryEdges_[current].from);

            const Index next = boundaryEdges_[current].to;
            if (next == boundaryEdges_[start].from) {
                loop.closed = true;
                break;
            }

            bool advanced = false;
            auto [first, last] = outgoing.equal_range(next);
            for (auto it = first; it != last; ++it) {
                if (!used[it->second]) {
                    current = it->second;
                    advanced = true;
                    break;
                }
            }

            if (!advanced) {
                // 开放链：补上末端顶点
                loop.vertices.push_back(next);
                break;
            }
        }

        loops.push_back(std::move(loop));
    }

    return loops;
}

ComponentLabels EdgeAdjacency::connectedComponents() const {
    DisjointSet sets(mesh_.vertexCount());
    for (size_t t = 0; t < mesh_.triangleCount(); ++t) {
        const auto tri = mesh_.triangle(t);
        sets.unite(tri[0], tri[1]);
        sets.unite(tri[1], tri[2]);
    }

    ComponentLabels labels;
    labels.triangleComponent.resize(mesh_.triangleCount());

    constexpr uint32_t kUnassigned = ~uint32_t{0};
    std::vector<uint32_t> rootLabel(mesh_.vertexCount(), kUnassigned);
    std::vector<uint8_t> referenced(mesh_.vertexCount(), 0);

    for (size_t t = 0; t < mesh_.triangleCount(); ++t) {
        const auto tri = mesh_.triangle(t);
        const Index root = sets.find(tri[0]);
        if (rootLabel[root] == kUnassigned) {
            rootLabel[root] = static_cast<uint32_t>(labels.vertexCounts.size());
            labels.vertexCounts.push_back(0);
            labels.triangleCounts.push_back(0);
        }

        const uint32_t label = rootLabel[root];
        labels.triangleComponent[t] = label;
        ++labels.triangleCounts[label];

        for (const Index v : tri) {
            if (!referenced[v]) {
                referenced[v] = 1;
                ++labels.vertexCounts[label];
            }
        }
    }

    return labels;
}

BoundingBox computeBoundingBox(const Mesh& mesh) noexcept {
    const auto& positions = mesh.vertices().positions;
    if (positions.empty()) {
        return BoundingBox{};
    }

    BoundingBox box{positions[0], positions[0]};
    for (const auto& p : positions) {
        for (int i = 0; i < 3; ++i) {
            box.min[i] = std::min(box.min[i], p[i]);
            box.max[i] = std::max(box.max[i], p[i]);
        }
    }
    return box;
}

} // namespace seamlod::core
