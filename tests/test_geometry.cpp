#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/Geometry.hpp"

using namespace seamlod::core;

TEST_CASE("BoundingBox basic operations", "[geometry]") {
    SECTION("Default constructor") {
        BoundingBox bbox;
        REQUIRE(bbox.size() == std::array<float, 3>{0.0f, 0.0f, 0.0f});
        REQUIRE(bbox.longestHorizontalSide() == Catch::Approx(0.0f));
    }

    SECTION("Parameterized constructor") {
        BoundingBox bbox({0.0f, 0.0f, 0.0f}, {2.0f, 4.0f, 2.0f});

        auto size = bbox.size();
        REQUIRE(size[0] == Catch::Approx(2.0f));
        REQUIRE(size[1] == Catch::Approx(4.0f));
        REQUIRE(size[2] == Catch::Approx(2.0f));

        REQUIRE(bbox.longestHorizontalSide() == Catch::Approx(4.0f));
    }

    SECTION("Height does not count as a horizontal side") {
        BoundingBox bbox({0.0f, 0.0f, -50.0f}, {3.0f, 1.0f, 50.0f});
        REQUIRE(bbox.longestHorizontalSide() == Catch::Approx(3.0f));
    }
}

TEST_CASE("BoundingBox from mesh", "[geometry]") {
    VertexAttributes vertices;
    vertices.positions = {
        {-1.0f, 2.0f, 0.5f},
        {3.0f, 0.0f, 0.0f},
        {0.0f, 5.0f, -2.0f}
    };
    Mesh mesh(std::move(vertices), {0, 1, 2});

    auto bbox = computeBoundingBox(mesh);
    REQUIRE(bbox.min == std::array<float, 3>{-1.0f, 0.0f, -2.0f});
    REQUIRE(bbox.max == std::array<float, 3>{3.0f, 5.0f, 0.5f});
}

TEST_CASE("Axis aligned planes", "[geometry]") {
    SECTION("Positive side") {
        auto plane = Plane::axisAligned(0, 2.0f, 1.0f);
        REQUIRE(plane.signedDistance({3.0f, 0.0f, 0.0f}) == Catch::Approx(1.0));
        REQUIRE(plane.signedDistance({2.0f, 7.0f, 7.0f}) == Catch::Approx(0.0));
        REQUIRE(plane.signedDistance({1.0f, 0.0f, 0.0f}) == Catch::Approx(-1.0));
    }

    SECTION("Negative side") {
        auto plane = Plane::axisAligned(1, 2.0f, -1.0f);
        REQUIRE(plane.signedDistance({0.0f, 1.5f, 0.0f}) == Catch::Approx(0.5));
        REQUIRE(plane.signedDistance({0.0f, 3.0f, 0.0f}) == Catch::Approx(-1.0));
    }
}

TEST_CASE("Edge adjacency", "[geometry]") {
    // 3x3 个正方形，去掉中间一格
    VertexAttributes vertices;
    for (int j = 0; j <= 3; ++j) {
        for (int i = 0; i <= 3; ++i) {
            vertices.positions.push_back({float(i), float(j), 0.0f});
        }
    }
    std::vector<Index> indices;
    for (int j = 0; j < 3; ++j) {
        for (int i = 0; i < 3; ++i) {
            if (i == 1 && j == 1) {
                continue;
            }
            const Index a = j * 4 + i;
            indices.insert(indices.end(), {a, a + 1, a + 5, a, a + 5, a + 4});
        }
    }
    Mesh mesh(std::move(vertices), std::move(indices));
    EdgeAdjacency adjacency(mesh);

    SECTION("Boundary edges") {
        // 外圈 12 条 + 孔洞 4 条
        REQUIRE(adjacency.boundaryEdges().size() == 16);
        REQUIRE(adjacency.edgeUseCount(0, 1) == 1);
        REQUIRE(adjacency.edgeUseCount(1, 5) == 2);
        REQUIRE(adjacency.edgeUseCount(0, 15) == 0);
        REQUIRE(adjacency.isBoundaryVertex(0));
        REQUIRE(adjacency.isBoundaryVertex(5));
    }

    SECTION("Boundary loops") {
        auto loops = adjacency.boundaryLoops();
        REQUIRE(loops.size() == 2);

        size_t totalEdges = 0;
        for (const auto& loop : loops) {
            REQUIRE(loop.closed);
            totalEdges += loop.edgeCount();
        }
        REQUIRE(totalEdges == 16);
    }

    SECTION("Connected components") {
        auto labels = adjacency.connectedComponents();
        REQUIRE(labels.componentCount() == 1);
        REQUIRE(labels.triangleCounts[0] == 16);
        REQUIRE(labels.vertexCounts[0] == 16);
    }
}
