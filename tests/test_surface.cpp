#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "surface/UvUnwrapper.hpp"
#include "surface/ColorBaker.hpp"
#include "TestMeshes.hpp"
#include <cmath>

using namespace seamlod;

namespace {

// UV 空间中的三角形面积
double uvArea(const core::TexCoord& a, const core::TexCoord& b, const core::TexCoord& c) {
    return 0.5 * std::abs((double(b[0]) - a[0]) * (double(c[1]) - a[1]) -
                          (double(c[0]) - a[0]) * (double(b[1]) - a[1]));
}

// 返回固定布局的展开器
class FixedLayoutUnwrapper : public surface::IUvUnwrapper {
public:
    explicit FixedLayoutUnwrapper(surface::UvLayout layout) : layout_(std::move(layout)) {}

    core::Result<surface::UvLayout> unwrap(std::span<const core::Vertex>,
                                           std::span<const core::Index>) const override {
        return layout_;
    }

private:
    surface::UvLayout layout_;
};

} // namespace

TEST_CASE("Atlas UV unwrapping", "[surface]") {
    const auto unwrapper = surface::createXatlasUnwrapper();

    SECTION("Vertical faces get a non-degenerate chart") {
        const auto wall = test::makeWallMesh();
        auto unwrapped = surface::applyUnwrap(wall, *unwrapper);
        REQUIRE(unwrapped.has_value());
        REQUIRE(unwrapped->triangleCount() == wall.triangleCount());

        const auto& uvs = unwrapped->vertices().texCoords;
        REQUIRE(uvs.size() == unwrapped->vertexCount());
        for (size_t t = 0; t < unwrapped->triangleCount(); ++t) {
            const auto tri = unwrapped->triangle(t);
            REQUIRE(uvArea(uvs[tri[0]], uvs[tri[1]], uvs[tri[2]]) > 0.0);
        }
        for (const auto& uv : uvs) {
            REQUIRE(uv[0] >= 0.0f);
            REQUIRE(uv[0] <= 1.0f);
            REQUIRE(uv[1] >= 0.0f);
            REQUIRE(uv[1] <= 1.0f);
        }
    }

    SECTION("Split vertices keep their source positions") {
        const auto mesh = test::makeGridMesh(6, 6.0f);
        auto layout = unwrapper->unwrap(mesh.vertices().positions, mesh.indices());
        REQUIRE(layout.has_value());
        REQUIRE(layout->vertexMap.size() >= mesh.vertexCount());

        auto unwrapped = surface::applyUnwrap(mesh, *unwrapper);
        REQUIRE(unwrapped.has_value());
        REQUIRE(unwrapped->triangleCount() == mesh.triangleCount());
        REQUIRE(unwrapped->vertices().normals.size() == unwrapped->vertexCount());

        // 每个输出三角形都对应一个输入三角形的位置
        for (size_t t = 0; t < unwrapped->triangleCount(); ++t) {
            const auto tri = unwrapped->triangle(t);
            for (const auto v : tri) {
                const auto source = layout->vertexMap[v];
                REQUIRE(unwrapped->position(v) == mesh.position(source));
            }
        }

        // 边缘顶点的位置全部保留
        REQUIRE(test::verticesOnPlane(*unwrapped, 0, 0.0f).size() >= test::verticesOnPlane(mesh, 0, 0.0f).size());
    }

    SECTION("Empty input yields an empty layout") {
        auto layout = unwrapper->unwrap({}, {});
        REQUIRE(layout.has_value());
        REQUIRE(layout->uvs.empty());
        REQUIRE(layout->indices.empty());
    }
}

TEST_CASE("Planar UV unwrapping", "[surface]") {
    const auto mesh = test::makeGridMesh(4, 8.0f);
    const auto unwrapper = surface::createPlanarUnwrapper();

    SECTION("UVs cover the unit square") {
        auto unwrapped = surface::applyUnwrap(mesh, *unwrapper);
        REQUIRE(unwrapped.has_value());
        const auto& uvs = unwrapped->vertices().texCoords;
        REQUIRE(uvs.size() == mesh.vertexCount());
        for (const auto& uv : uvs) {
            REQUIRE(uv[0] >= 0.0f);
            REQUIRE(uv[0] <= 1.0f);
            REQUIRE(uv[1] >= 0.0f);
            REQUIRE(uv[1] <= 1.0f);
        }
        REQUIRE(uvs.front()[0] == Catch::Approx(0.0f));
        REQUIRE(uvs.back()[0] == Catch::Approx(1.0f));
        REQUIRE(uvs.back()[1] == Catch::Approx(1.0f));
        REQUIRE(unwrapped->indices() == mesh.indices());
    }

    SECTION("Aspect ratio is preserved") {
        core::VertexAttributes vertices;
        vertices.positions = {{0.0f, 0.0f, 0.0f}, {4.0f, 0.0f, 0.0f}, {4.0f, 2.0f, 0.0f}};
        auto layout = unwrapper->unwrap(vertices.positions, std::vector<core::Index>{0, 1, 2});
        REQUIRE(layout.has_value());
        REQUIRE(layout->uvs[2][0] == Catch::Approx(1.0f));
        REQUIRE(layout->uvs[2][1] == Catch::Approx(0.5f));
    }

    SECTION("Zero footprint maps to the origin") {
        core::VertexAttributes vertices;
        vertices.positions = {{1.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 1.0f}, {1.0f, 1.0f, 2.0f}};
        auto layout = unwrapper->unwrap(vertices.positions, std::vector<core::Index>{0, 1, 2});
        REQUIRE(layout.has_value());
        for (const auto& uv : layout->uvs) {
            REQUIRE(uv == core::TexCoord{0.0f, 0.0f});
        }
    }
}

TEST_CASE("Unwrap layout validation", "[surface]") {
    const auto wall = test::makeWallMesh();
    surface::UvLayout layout;
    layout.vertexMap = {0, 1, 2, 3};
    layout.indices = {0, 1, 2, 0, 2, 3};
    layout.uvs = {{0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};

    SECTION("A consistent layout is applied") {
        auto applied = surface::applyUnwrap(wall, FixedLayoutUnwrapper{layout});
        REQUIRE(applied.has_value());
        REQUIRE(applied->vertices().texCoords[2] == core::TexCoord{1.0f, 1.0f});
    }

    SECTION("UV count must match the vertex count") {
        layout.uvs.pop_back();
        auto applied = surface::applyUnwrap(wall, FixedLayoutUnwrapper{layout});
        REQUIRE_FALSE(applied.has_value());
        REQUIRE(applied.error().code == core::ErrorCode::Internal);
    }

    SECTION("Vertex map must stay inside the input") {
        layout.vertexMap[3] = 9;
        auto applied = surface::applyUnwrap(wall, FixedLayoutUnwrapper{layout});
        REQUIRE_FALSE(applied.has_value());
        REQUIRE(applied.error().code == core::ErrorCode::Internal);
    }

    SECTION("Triangle count must not change") {
        layout.indices.resize(3);
        auto applied = surface::applyUnwrap(wall, FixedLayoutUnwrapper{layout});
        REQUIRE_FALSE(applied.has_value());
        REQUIRE(applied.error().code == core::ErrorCode::Internal);
    }
}

TEST_CASE("Vertex color baking", "[surface]") {
    // 左半部分红色，右半部分蓝色
    auto grid = test::makeGridMesh(8, 8.0f, false, false);
    auto vertices = grid.vertices();
    for (const auto& p : vertices.positions) {
        vertices.colors.push_back(p[0] < 4.0f ? core::Color{255, 0, 0, 255} : core::Color{0, 0, 255, 255});
    }
    const auto source = grid.withVertices(std::move(vertices));

    SECTION("Nearest source vertex wins") {
        const auto sampler = surface::createNearestVertexSampler(source);
        REQUIRE(sampler->sampleColor({0.2f, 3.1f, 0.0f}) == core::Color{255, 0, 0, 255});
        REQUIRE(sampler->sampleColor({7.9f, 0.4f, 0.0f}) == core::Color{0, 0, 255, 255});
        // 网格范围之外也能找到最近顶点
        REQUIRE(sampler->sampleColor({-3.0f, 2.0f, 0.0f}) == core::Color{255, 0, 0, 255});
    }

    SECTION("Baked mesh gains a color per vertex") {
        const auto sampler = surface::createNearestVertexSampler(source);
        const auto target = test::makeGridMesh(2, 8.0f, false, false);
        auto baked = surface::bakeVertexColors(target, *sampler);
        REQUIRE(baked.vertices().colors.size() == target.vertexCount());
        REQUIRE(baked.vertices().colors.front() == core::Color{255, 0, 0, 255});
        REQUIRE(baked.vertices().colors.back() == core::Color{0, 0, 255, 255});
    }

    SECTION("Source without colors bakes white") {
        const auto sampler = surface::createNearestVertexSampler(grid);
        REQUIRE(sampler->sampleColor({1.0f, 1.0f, 0.0f}) == core::Color{255, 255, 255, 255});
    }
}
