#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "host/HostMesh.hpp"

using namespace seamlod;

namespace {

// 一个四边形加一个三角形
host::ExternalMesh makeExternal() {
    host::ExternalMesh external;
    external.coords = {
        0.0f, 0.0f, 0.0f,
        1.0f, 0.0f, 0.0f,
        1.0f, 1.0f, 0.0f,
        0.0f, 1.0f, 0.0f,
        2.0f, 0.0f, 0.0f
    };
    external.loopStarts = {0, 4};
    external.loopTotals = {4, 3};
    external.loopVertices = {0, 1, 2, 3, 1, 4, 2};
    return external;
}

} // namespace

TEST_CASE("Host mesh import", "[host]") {
    SECTION("Polygons are fan triangulated") {
        auto mesh = host::loadFrom(makeExternal());
        REQUIRE(mesh.has_value());
        REQUIRE(mesh->vertexCount() == 5);
        REQUIRE(mesh->triangleCount() == 3);
        REQUIRE(mesh->indices() == std::vector<core::Index>{0, 1, 2, 0, 2, 3, 1, 4, 2});
    }

    SECTION("Colors are converted to 8 bit") {
        auto external = makeExternal();
        external.colors.assign(external.vertexCount() * 4, 1.0f);
        external.colors[0] = 0.0f;
        auto mesh = host::loadFrom(external);
        REQUIRE(mesh.has_value());
        REQUIRE(mesh->vertices().colors[0] == core::Color{0, 255, 255, 255});
        REQUIRE(mesh->vertices().colors[4] == core::Color{255, 255, 255, 255});
    }

    SECTION("Per-loop UVs become per-vertex UVs") {
        auto external = makeExternal();
        for (const uint32_t v : external.loopVertices) {
            external.loopUvs.push_back(external.coords[v * 3] * 0.5f);
            external.loopUvs.push_back(external.coords[v * 3 + 1] * 0.5f);
        }
        auto mesh = host::loadFrom(external);
        REQUIRE(mesh.has_value());
        REQUIRE(mesh->vertices().hasTexCoords());
        REQUIRE(mesh->vertices().texCoords[4][0] == Catch::Approx(1.0f));
        REQUIRE(mesh->vertices().texCoords[2][1] == Catch::Approx(0.5f));
    }
}

TEST_CASE("Host mesh import errors", "[host]") {
    SECTION("Vertex index out of range") {
        auto external = makeExternal();
        external.loopVertices[6] = 9;
        auto mesh = host::loadFrom(external);
        REQUIRE_FALSE(mesh.has_value());
        REQUIRE(mesh.error().code == core::ErrorCode::InvalidGeometry);
    }

    SECTION("Polygon with fewer than three corners") {
        auto external = makeExternal();
        external.loopTotals[1] = 2;
        REQUIRE_FALSE(host::loadFrom(external).has_value());
    }

    SECTION("Mismatched attribute arrays") {
        auto external = makeExternal();
        external.normals = {0.0f, 0.0f, 1.0f};
        REQUIRE_FALSE(host::loadFrom(external).has_value());
    }

    SECTION("No vertices") {
        REQUIRE_FALSE(host::loadFrom(host::ExternalMesh{}).has_value());
    }
}

TEST_CASE("Host mesh export", "[host]") {
    auto mesh = host::loadFrom(makeExternal());
    REQUIRE(mesh.has_value());

    auto external = host::toExternal(*mesh);
    REQUIRE(external.vertexCount() == 5);
    REQUIRE(external.polygonCount() == 3);
    REQUIRE(external.loopTotals == std::vector<uint32_t>{3, 3, 3});
    REQUIRE(external.loopStarts == std::vector<uint32_t>{0, 3, 6});
    REQUIRE(external.normals.empty());

    auto again = host::loadFrom(external);
    REQUIRE(again.has_value());
    REQUIRE(again->indices() == mesh->indices());
}
