#include "LodAlgorithm.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace seamlod::core {

// ExplicitRatioStrategy 实现
std::vector<double> ExplicitRatioStrategy::ratios() const {
    return normalizeRatios(ratios_);
}

// GeometricReductionStrategy 实现
std::vector<double> GeometricReductionStrategy::ratios() const {
    std::vector<double> result;
    const double keep = 1.0 - reductionPercent_ / 100.0;
    for (int i = 0; i <= lodCount_; ++i) {
        result.push_back(std::max(std::pow(keep, i), minRatio_));
    }
    return normalizeRatios(result);
}

std::vector<double> normalizeRatios(std::span<const double> ratios) {
    std::vector<double> result(ratios.begin(), ratios.end());
    std::sort(result.begin(), result.end(), std::greater<>());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::string levelName(const std::string& base, const TileCoord& tile, int levelIndex) {
    return base + "_" + toString(tile) + "_lod_" + std::to_string(levelIndex);
}

Result<TileLodSet> buildTileLods(const Tile& tile, std::span<const double> ratios,
                                 const LodConfig& config, std::stop_token stopToken,
                                 const LevelCallback& onLevel) {
    TileLodSet set;
    set.coord = tile.coord;
    set.boundary = classifyBoundary(tile, config.boundary);

    const auto ordered = normalizeRatios(ratios);
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (stopToken.stop_requested()) {
            return makeError(ErrorCode::CancelledByUser, "LodBuilder",
                             "cancelled at tile " + toString(tile.coord));
        }

        const int levelIndex = static_cast<int>(i);
        const double ratio = ordered[i];

        // 比例 1.0 即瓦片本身，不做简化
        if (ratio >= 1.0) {
            LodLevel level;
            level.levelIndex = levelIndex;
            level.ratio = ratio;
            level.tile = tile.coord;
            level.mesh = tile.mesh;
            level.targetCount = config.decimation.metric == TargetMetric::Triangles
                                    ? tile.mesh.triangleCount() : tile.mesh.vertexCount();
            set.levels.push_back(std::move(level));
        } else {
            auto decimated = decimate(tile.mesh, set.boundary, TargetRatio{ratio}, config.decimation);
            if (!decimated) {
                if (decimated.error().fatal()) {
                    return std::unexpected(decimated.error());
                }
                spdlog::warn("LOD: tile {} level {} (ratio {}) skipped: {}",
                             toString(tile.coord), levelIndex, ratio, decimated.error().message);
                set.failures.push_back(LevelFailure{tile.coord, levelIndex, ratio, decimated.error()});
            } else {
                LodLevel level;
                level.levelIndex = levelIndex;
                level.ratio = ratio;
                level.tile = tile.coord;
                level.mesh = std::move(decimated->mesh);
                level.targetCount = decimated->targetCount;
                level.error = decimated->resultError;
                set.levels.push_back(std::move(level));
            }
        }

        if (onLevel) {
            onLevel(tile.coord, levelIndex);
        }
    }

    spdlog::debug("LOD: tile {} built {} levels ({} skipped)",
                  toString(tile.coord), set.levels.size(), set.failures.size());
    return set;
}

LodStats computeLodStats(std::span<const TileLodSet> tiles) {
    LodStats stats;
    stats.tileCount = tiles.size();

    for (const auto& tile : tiles) {
        stats.failedLevels += tile.failures.size();
        for (const auto& level : tile.levels) {
            stats.levelCount++;
            stats.totalTriangles += level.mesh.triangleCount();

            // 扩展统计数组
            while (static_cast<int>(stats.trianglesPerLevel.size()) <= level.levelIndex) {
                stats.trianglesPerLevel.push_back(0);
            }
            stats.trianglesPerLevel[level.levelIndex] += level.mesh.triangleCount();
        }
    }

    return stats;
}

} // namespace seamlod::core
