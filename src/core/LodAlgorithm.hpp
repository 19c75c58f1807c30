#pragma once

#include "Mesh.hpp"
#include "TilePartitioner.hpp"
#include "BoundaryClassifier.hpp"
#include "Decimator.hpp"
#include "Error.hpp"
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace seamlod::core {

// LOD 级别调度策略接口：给出由细到粗的比例序列
class ILodStrategy {
public:
    virtual ~ILodStrategy() = default;

    // 比例序列，取值 (0, 1]
    virtual std::vector<double> ratios() const = 0;

    virtual std::string name() const = 0;
};

// 显式给出的比例列表
class ExplicitRatioStrategy : public ILodStrategy {
public:
    explicit ExplicitRatioStrategy(std::vector<double> ratios)
        : ratios_(std::move(ratios)) {}

    std::vector<double> ratios() const override;
    std::string name() const override { return "explicit"; }

private:
    std::vector<double> ratios_;
};

// 几何递减：ratio_i = max((1 - p/100)^i, minRatio)，i = 0..lodCount
class GeometricReductionStrategy : public ILodStrategy {
public:
    explicit GeometricReductionStrategy(int lodCount = 3, double reductionPercent = 50.0,
                                        double minRatio = 0.01)
        : lodCount_(lodCount), reductionPercent_(reductionPercent), minRatio_(minRatio) {}

    std::vector<double> ratios() const override;
    std::string name() const override { return "geometric"; }

private:
    int lodCount_;
    double reductionPercent_;
    double minRatio_;
};

// LOD 生成配置
struct LodConfig {
    BoundaryConfig boundary;
    DecimationConfig decimation;
};

// 一个瓦片的一个 LOD 级别
struct LodLevel {
    int levelIndex{0};
    double ratio{1.0};
    TileCoord tile;
    Mesh mesh;
    size_t targetCount{0};
    float error{0.0f};
};

// 被跳过的级别
struct LevelFailure {
    TileCoord tile;
    int levelIndex{0};
    double ratio{0.0};
    Error error;
};

// 一个瓦片的全部 LOD 级别
struct TileLodSet {
    TileCoord coord;
    BoundaryVertexSet boundary;       // 由第 0 级网格计算一次，所有级别共用
    std::vector<LodLevel> levels;     // 由细到粗
    std::vector<LevelFailure> failures;

    size_t attemptedLevels() const noexcept { return levels.size() + failures.size(); }
};

// 每完成（或跳过）一个级别调用一次
using LevelCallback = std::function<void(const TileCoord& tile, int levelIndex)>;

// 比例去重并按由细到粗排序
[[nodiscard]] std::vector<double> normalizeRatios(std::span<const double> ratios);

// 级别名称：<base>_x<X>_y<Y>_lod_<i>
[[nodiscard]] std::string levelName(const std::string& base, const TileCoord& tile, int levelIndex);

// 为一个瓦片生成全部级别；不可达的级别记录在 failures 中，
// 级别之间检查 stopToken，取消时返回 CancelledByUser
[[nodiscard]] Result<TileLodSet> buildTileLods(const Tile& tile, std::span<const double> ratios,
                                               const LodConfig& config,
                                               std::stop_token stopToken = {},
                                               const LevelCallback& onLevel = {});

// LOD 统计
struct LodStats {
    size_t tileCount{0};
    size_t levelCount{0};
    size_t failedLevels{0};
    size_t totalTriangles{0};
    std::vector<size_t> trianglesPerLevel;
};

[[nodiscard]] LodStats computeLodStats(std::span<const TileLodSet> tiles);

} // namespace seamlod::core
