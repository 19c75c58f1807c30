#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Mesh.hpp"

using namespace seamlod::core;

TEST_CASE("Mesh basic operations", "[mesh]") {
    SECTION("Empty mesh") {
        Mesh mesh;
        REQUIRE(mesh.empty());
        REQUIRE(mesh.vertexCount() == 0);
        REQUIRE(mesh.triangleCount() == 0);
    }

    SECTION("Simple triangle mesh") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.5f, 1.0f, 0.0f}
        };

        std::vector<Index> indices = {0, 1, 2};

        Mesh mesh(std::move(vertices), std::move(indices));

        REQUIRE_FALSE(mesh.empty());
        REQUIRE(mesh.vertexCount() == 3);
        REQUIRE(mesh.triangleCount() == 1);
        REQUIRE(mesh.triangle(0) == std::array<Index, 3>{0, 1, 2});
    }

    SECTION("Mesh with attributes") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.5f, 1.0f, 0.0f}
        };
        vertices.normals = {
            {0.0f, 0.0f, 1.0f},
            {0.0f, 0.0f, 1.0f},
            {0.0f, 0.0f, 1.0f}
        };
        vertices.colors = {
            {255, 0, 0, 255},
            {0, 255, 0, 255},
            {0, 0, 255, 255}
        };

        std::vector<Index> indices = {0, 1, 2};

        Mesh mesh(std::move(vertices), std::move(indices));

        REQUIRE(mesh.vertices().hasNormals());
        REQUIRE(mesh.vertices().hasColors());
        REQUIRE_FALSE(mesh.vertices().hasTexCoords());
        REQUIRE(mesh.vertices().colors.size() == 3);
    }
}

TEST_CASE("Mesh statistics", "[mesh]") {
    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f},
        {2.0f, 0.0f, 0.0f},
        {1.0f, 2.0f, 0.0f},
        {1.0f, 1.0f, 1.0f}
    };

    std::vector<Index> indices = {0, 1, 2, 0, 2, 3, 1, 3, 2, 0, 3, 1};

    Mesh mesh(std::move(vertices), std::move(indices));

    auto stats = computeStats(mesh);

    REQUIRE(stats.vertexCount == 4);
    REQUIRE(stats.triangleCount == 4);

    // 检查包围盒
    REQUIRE(stats.boundingBoxMin[0] == Catch::Approx(0.0f));
    REQUIRE(stats.boundingBoxMin[1] == Catch::Approx(0.0f));
    REQUIRE(stats.boundingBoxMin[2] == Catch::Approx(0.0f));

    REQUIRE(stats.boundingBoxMax[0] == Catch::Approx(2.0f));
    REQUIRE(stats.boundingBoxMax[1] == Catch::Approx(2.0f));
    REQUIRE(stats.boundingBoxMax[2] == Catch::Approx(1.0f));

    REQUIRE(stats.surfaceArea > 0.0);
}

TEST_CASE("Triangle and surface area", "[mesh]") {
    REQUIRE(triangleArea({0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f}, {0.0f, 2.0f, 0.0f}) == Catch::Approx(2.0));
    REQUIRE(triangleArea({0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}, {2.0f, 2.0f, 2.0f}) == Catch::Approx(0.0));

    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {1.0f, 1.0f, 0.0f},
        {0.0f, 1.0f, 0.0f}
    };
    Mesh quad(std::move(vertices), {0, 1, 2, 0, 2, 3});
    REQUIRE(surfaceArea(quad) == Catch::Approx(1.0));
}

TEST_CASE("Mesh functional operations", "[mesh]") {
    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {0.5f, 1.0f, 0.0f}
    };

    std::vector<Index> indices = {0, 1, 2};

    Mesh originalMesh(vertices, indices);

    SECTION("withVertices creates new mesh") {
        VertexAttributes newVertices;
        newVertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {2.0f, 0.0f, 0.0f},
            {1.0f, 2.0f, 0.0f}
        };

        auto newMesh = originalMesh.withVertices(std::move(newVertices));

        // 原网格不变
        REQUIRE(originalMesh.vertices().positions[1][0] == Catch::Approx(1.0f));

        // 新网格有新的顶点
        REQUIRE(newMesh.vertices().positions[1][0] == Catch::Approx(2.0f));
        REQUIRE(newMesh.vertices().positions[2][1] == Catch::Approx(2.0f));

        // 索引保持不变
        REQUIRE(newMesh.indices() == originalMesh.indices());
    }

    SECTION("withIndices creates new mesh") {
        std::vector<Index> newIndices = {2, 1, 0};  // 反向

        auto newMesh = originalMesh.withIndices(std::move(newIndices));

        // 顶点保持不变
        REQUIRE(newMesh.vertices().positions == originalMesh.vertices().positions);

        // 索引改变
        REQUIRE(newMesh.indices()[0] == 2);
        REQUIRE(newMesh.indices()[1] == 1);
        REQUIRE(newMesh.indices()[2] == 0);
    }
}

TEST_CASE("Mesh subset", "[mesh]") {
    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {1.0f, 1.0f, 0.0f},
        {0.0f, 1.0f, 0.0f}
    };
    Mesh quad(std::move(vertices), {0, 1, 2, 0, 2, 3});

    SECTION("Subset keeps only referenced vertices") {
        const std::vector<Index> second = {1};
        auto part = quad.subset(second);
        REQUIRE(part.triangleCount() == 1);
        REQUIRE(part.vertexCount() == 3);
        REQUIRE(part.position(2) == Vertex{0.0f, 1.0f, 0.0f});
    }

    SECTION("Empty selection yields an empty mesh") {
        auto part = quad.subset(std::vector<Index>{});
        REQUIRE(part.empty());
    }
}

TEST_CASE("Mesh validation", "[mesh]") {
    SECTION("No vertices") {
        auto result = validateMesh(Mesh{});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidGeometry);
    }

    SECTION("Index out of range") {
        VertexAttributes vertices;
        vertices.positions = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
        auto result = validateMesh(Mesh{vertices, {0, 1, 3}});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::InvalidGeometry);
        REQUIRE(result.error().fatal());
    }

    SECTION("Attribute length mismatch") {
        VertexAttributes vertices;
        vertices.positions = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
        vertices.normals = {{0.0f, 0.0f, 1.0f}};
        REQUIRE_FALSE(validateMesh(Mesh{vertices, {0, 1, 2}}).has_value());
    }

    SECTION("Valid mesh") {
        VertexAttributes vertices;
        vertices.positions = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}};
        REQUIRE(validateMesh(Mesh{vertices, {0, 1, 2}}).has_value());
    }
}

TEST_CASE("Mesh repair operations", "[mesh]") {
    SECTION("removeDegenerate drops zero-area triangles") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f},
            {2.0f, 0.0f, 0.0f}
        };
        // 第二个三角形三点共线
        Mesh mesh(std::move(vertices), {0, 1, 2, 0, 1, 3});

        auto cleaned = removeDegenerate(mesh);
        REQUIRE(cleaned.triangleCount() == 1);
        REQUIRE(cleaned.vertexCount() == 3);
    }

    SECTION("weldNear merges duplicated corners") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {1.0f, 1.0f, 0.0f},
            {0.0f, 0.0f, 0.0f},
            {1.0f, 1.0f, 0.0f},
            {0.0f, 1.0f, 0.0f}
        };
        Mesh mesh(std::move(vertices), {0, 1, 2, 3, 4, 5});

        auto exact = weldNear(mesh, 0.0f);
        REQUIRE(exact.vertexCount() == 4);
        REQUIRE(exact.triangleCount() == 2);
    }

    SECTION("weldNear respects the distance threshold") {
        VertexAttributes vertices;
        vertices.positions = {
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f},
            {0.0f, 0.0f, 0.001f},
            {0.0f, 1.0f, 0.0f},
            {-1.0f, 0.0f, 0.0f}
        };
        Mesh mesh(std::move(vertices), {0, 1, 2, 3, 4, 5});

        REQUIRE(weldNear(mesh, 1e-6f).vertexCount() == 5);
        REQUIRE(weldNear(mesh, 0.01f).vertexCount() == 4);
    }

    SECTION("weldNear handles an epsilon far below the coordinate precision") {
        // 1e8 附近 float 的间距为 8
        constexpr float base = 1e8f;
        VertexAttributes vertices;
        vertices.positions = {
            {base, base, 0.0f},
            {base + 64.0f, base, 0.0f},
            {base, base + 64.0f, 0.0f},
            {base, base, 0.0f},
            {base + 8.0f, base, 0.0f},
            {base, base + 64.0f, 0.0f}
        };
        Mesh mesh(std::move(vertices), {0, 1, 2, 3, 4, 5});

        auto welded = weldNear(mesh, 1e-12f);
        REQUIRE(welded.vertexCount() == 4);
        REQUIRE(welded.triangleCount() == 2);
    }

    SECTION("compactVertices keeps relative order") {
        VertexAttributes vertices;
        vertices.positions = {
            {9.0f, 9.0f, 9.0f},
            {0.0f, 0.0f, 0.0f},
            {1.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f}
        };
        vertices.colors = {{1, 1, 1, 1}, {2, 2, 2, 2}, {3, 3, 3, 3}, {4, 4, 4, 4}};
        Mesh mesh(std::move(vertices), {1, 2, 3});

        auto compact = compactVertices(mesh);
        REQUIRE(compact.vertexCount() == 3);
        REQUIRE(compact.indices() == std::vector<Index>{0, 1, 2});
        REQUIRE(compact.vertices().colors[0] == Color{2, 2, 2, 2});
    }
}
