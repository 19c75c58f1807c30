#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/TilePartitioner.hpp"
#include "TestMeshes.hpp"

using namespace seamlod::core;
using seamlod::test::makeGridMesh;
using seamlod::test::verticesOnPlane;

namespace {

const Tile* findTile(const std::vector<Tile>& tiles, int x, int y) {
    for (const auto& tile : tiles) {
        if (tile.coord.x == x && tile.coord.y == y) {
            return &tile;
        }
    }
    return nullptr;
}

double totalArea(const std::vector<Tile>& tiles) {
    double area = 0.0;
    for (const auto& tile : tiles) {
        area += surfaceArea(tile.mesh);
    }
    return area;
}

} // namespace

TEST_CASE("Grid computation", "[partitioner]") {
    auto mesh = makeGridMesh(10);

    SECTION("Square cells over the longest side") {
        auto grid = computeGrid(mesh, 2);
        REQUIRE(grid.has_value());
        REQUIRE(grid->cellSize == Catch::Approx(5.0f));
        REQUIRE(grid->planesX == std::vector<float>{0.0f, 5.0f, 10.0f});
        REQUIRE(grid->planesY == std::vector<float>{0.0f, 5.0f, 10.0f});
    }

    SECTION("Cell lookup on seam planes") {
        auto grid = computeGrid(mesh, 2);
        REQUIRE(grid.has_value());
        REQUIRE(grid->cellLow(0, 5.0f) == 1);
        REQUIRE(grid->cellHigh(0, 5.0f) == 0);
        REQUIRE(grid->cellLow(0, 0.0f) == 0);
        REQUIRE(grid->cellHigh(0, 10.0f) == 1);
        REQUIRE(grid->cellLow(1, 7.5f) == 1);
    }

    SECTION("Zero grid size is a configuration error") {
        auto grid = computeGrid(mesh, 0);
        REQUIRE_FALSE(grid.has_value());
        REQUIRE(grid.error().code == ErrorCode::InvalidConfig);
    }

    SECTION("Zero horizontal extent") {
        auto grid = computeGrid(seamlod::test::makeWallMesh(), 2);
        REQUIRE_FALSE(grid.has_value());
        REQUIRE(grid.error().code == ErrorCode::DegenerateBounds);
        REQUIRE(toString(grid.error().code) == "DegenerateBoundsError");
    }
}

TEST_CASE("Module count to grid size", "[partitioner]") {
    REQUIRE(gridFromModuleCount(1) == 1);
    REQUIRE(gridFromModuleCount(4) == 2);
    REQUIRE(gridFromModuleCount(16) == 4);
    REQUIRE(gridFromModuleCount(64) == 8);
    REQUIRE_FALSE(gridFromModuleCount(0).has_value());
    REQUIRE_FALSE(gridFromModuleCount(12).has_value());
}

TEST_CASE("Tile coordinate names", "[partitioner]") {
    REQUIRE(toString(TileCoord{3, 1}) == "x3_y1");
    REQUIRE(toString(TileCoord{0, 12}) == "x0_y12");
}

TEST_CASE("Partition along vertex-aligned seams", "[partitioner]") {
    auto mesh = makeGridMesh(10);
    auto tiles = partitionMesh(mesh, PartitionConfig{2});
    REQUIRE(tiles.has_value());
    REQUIRE(tiles->size() == 4);

    SECTION("Tiles are ordered by row then column") {
        REQUIRE((*tiles)[0].coord == TileCoord{0, 0});
        REQUIRE((*tiles)[1].coord == TileCoord{1, 0});
        REQUIRE((*tiles)[2].coord == TileCoord{0, 1});
        REQUIRE((*tiles)[3].coord == TileCoord{1, 1});
    }

    SECTION("No triangle needs clipping") {
        for (const auto& tile : *tiles) {
            REQUIRE(tile.clippedTriangles == 0);
            REQUIRE(tile.mesh.triangleCount() == 50);
            REQUIRE(tile.mesh.vertexCount() == 36);
            REQUIRE(validateMesh(tile.mesh).has_value());
        }
    }

    SECTION("Seam vertices are identical on both sides") {
        const auto* left = findTile(*tiles, 0, 0);
        const auto* right = findTile(*tiles, 1, 0);
        const auto* top = findTile(*tiles, 0, 1);
        REQUIRE(left != nullptr);
        REQUIRE(right != nullptr);
        REQUIRE(top != nullptr);

        const auto seamX = verticesOnPlane(left->mesh, 0, 5.0f);
        REQUIRE(seamX.size() == 6);
        REQUIRE(seamX == verticesOnPlane(right->mesh, 0, 5.0f));

        const auto seamY = verticesOnPlane(left->mesh, 1, 5.0f);
        REQUIRE(seamY.size() == 6);
        REQUIRE(seamY == verticesOnPlane(top->mesh, 1, 5.0f));
    }

    SECTION("Attributes follow their vertices") {
        for (const auto& tile : *tiles) {
            REQUIRE(tile.mesh.vertices().normals.size() == tile.mesh.vertexCount());
        }
    }

    SECTION("Tile planes bound the tile") {
        const auto& tile = (*tiles)[3];
        for (const auto& p : tile.mesh.vertices().positions) {
            for (const auto& plane : tile.planes) {
                REQUIRE(plane.signedDistance(p) >= 0.0);
            }
        }
    }
}

TEST_CASE("Partition with clipped triangles", "[partitioner]") {
    auto mesh = makeGridMesh(10);
    auto tiles = partitionMesh(mesh, PartitionConfig{3});
    REQUIRE(tiles.has_value());
    REQUIRE(tiles->size() == 9);

    auto grid = computeGrid(mesh, 3);
    REQUIRE(grid.has_value());

    SECTION("Surface area is preserved") {
        REQUIRE(totalArea(*tiles) == Catch::Approx(surfaceArea(mesh)).epsilon(1e-4));
    }

    SECTION("Some triangles straddle the seams") {
        size_t clipped = 0;
        for (const auto& tile : *tiles) {
            clipped += tile.clippedTriangles;
        }
        REQUIRE(clipped > 0);
    }

    SECTION("Clipped seam vertices are bit-identical across neighbours") {
        for (int y = 0; y < 3; ++y) {
            for (int x = 0; x < 2; ++x) {
                const auto* a = findTile(*tiles, x, y);
                const auto* b = findTile(*tiles, x + 1, y);
                REQUIRE(a != nullptr);
                REQUIRE(b != nullptr);
                const float c = grid->planesX[x + 1];
                const auto seam = verticesOnPlane(a->mesh, 0, c);
                REQUIRE_FALSE(seam.empty());
                REQUIRE(seam == verticesOnPlane(b->mesh, 0, c));
            }
        }
        for (int y = 0; y < 2; ++y) {
            for (int x = 0; x < 3; ++x) {
                const auto* a = findTile(*tiles, x, y);
                const auto* b = findTile(*tiles, x, y + 1);
                const float c = grid->planesY[y + 1];
                REQUIRE(verticesOnPlane(a->mesh, 1, c) == verticesOnPlane(b->mesh, 1, c));
            }
        }
    }

    SECTION("Every vertex lies inside its cell") {
        constexpr float tolerance = 1e-4f;
        for (const auto& tile : *tiles) {
            for (const auto& p : tile.mesh.vertices().positions) {
                REQUIRE(p[0] >= grid->planesX[tile.coord.x] - tolerance);
                REQUIRE(p[0] <= grid->planesX[tile.coord.x + 1] + tolerance);
                REQUIRE(p[1] >= grid->planesY[tile.coord.y] - tolerance);
                REQUIRE(p[1] <= grid->planesY[tile.coord.y + 1] + tolerance);
            }
        }
    }
}

TEST_CASE("Partition of a non-square footprint", "[partitioner]") {
    // 10 x 2 的狭长网格：单元为正方形，上方的单元为空而被省略
    VertexAttributes vertices;
    vertices.positions = {
        {0.0f, 0.0f, 0.0f},
        {10.0f, 0.0f, 0.0f},
        {10.0f, 2.0f, 0.0f},
        {0.0f, 2.0f, 0.0f}
    };
    Mesh strip(std::move(vertices), {0, 1, 2, 0, 2, 3});

    auto tiles = partitionMesh(strip, PartitionConfig{2});
    REQUIRE(tiles.has_value());
    REQUIRE(tiles->size() == 2);
    for (const auto& tile : *tiles) {
        REQUIRE(tile.coord.y == 0);
    }
    REQUIRE(totalArea(*tiles) == Catch::Approx(20.0));
}

TEST_CASE("Partition errors", "[partitioner]") {
    SECTION("Degenerate bounds") {
        auto tiles = partitionMesh(seamlod::test::makeWallMesh(), PartitionConfig{2});
        REQUIRE_FALSE(tiles.has_value());
        REQUIRE(tiles.error().code == ErrorCode::DegenerateBounds);
    }

    SECTION("Invalid geometry") {
        auto tiles = partitionMesh(Mesh{}, PartitionConfig{2});
        REQUIRE_FALSE(tiles.has_value());
        REQUIRE(tiles.error().code == ErrorCode::InvalidGeometry);
    }
}
