#pragma once

#include "core/Cleanup.hpp"
#include "core/LodAlgorithm.hpp"
#include "core/TilePartitioner.hpp"
#include "host/HostMesh.hpp"
#include "surface/ColorBaker.hpp"
#include "surface/UvUnwrapper.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace seamlod::pipeline {

// 管道状态
enum class Stage {
    Idle,
    Cleaning,
    Partitioning,
    Decimating,
    Unwrapping,
    Baking,
    Done,
    Failed,
    Cancelled
};

// 单个阶段的状态
enum class StageStatus {
    Pending,
    Running,
    Completed,
    Skipped,
    Failed,
    Cancelled
};

[[nodiscard]] std::string_view toString(Stage stage) noexcept;
[[nodiscard]] std::string_view toString(StageStatus status) noexcept;

struct StageRecord {
    Stage stage{Stage::Idle};
    StageStatus status{StageStatus::Pending};
    std::chrono::milliseconds duration{0};
};

// 一次运行：输入统计、网格、比例与各阶段状态
struct PipelineRun {
    core::MeshStats input;
    int gridSize{1};
    std::vector<double> ratios;
    Stage state{Stage::Idle};
    std::vector<StageRecord> stages{
        {Stage::Cleaning}, {Stage::Partitioning}, {Stage::Decimating},
        {Stage::Unwrapping}, {Stage::Baking}
    };

    [[nodiscard]] StageStatus status(Stage stage) const noexcept;
    StageRecord* record(Stage stage) noexcept;
};

// 进度：当前阶段 + 瓦片进度 + 级别进度
struct PipelineProgress {
    Stage stage{Stage::Idle};
    size_t tilesCompleted{0};
    size_t tilesTotal{0};
    size_t levelsCompleted{0};
    size_t levelsTotal{0};
};

// 进度回调函数类型（调用被串行化）
using ProgressCallback = std::function<void(const PipelineProgress& progress)>;
using LogCallback = std::function<void(const std::string& level, const std::string& message)>;

// 颜色采样器工厂：采样器绑定到清理后的源网格
using SamplerFactory = std::function<std::unique_ptr<surface::IColorSampler>(const core::Mesh& source)>;

// 管道配置
struct PipelineConfig {
    bool enableCleanup{true};
    core::CleanupConfig cleanup;
    core::PartitionConfig partition;
    std::shared_ptr<const core::ILodStrategy> strategy{
        std::make_shared<core::GeometricReductionStrategy>()};
    core::LodConfig lod;

    bool enableUnwrap{false};
    std::shared_ptr<const surface::IUvUnwrapper> unwrapper{
        std::make_shared<surface::XatlasUvUnwrapper>()};
    bool enableBake{false};
    SamplerFactory samplerFactory{surface::createNearestVertexSampler};

    // 处理配置
    bool enableParallelProcessing{true};
    bool enableLogging{true};
    LogCallback logCallback;
};

// 导致运行失败的阶段与错误
struct StageFailure {
    Stage stage{Stage::Idle};
    core::Error error;
};

// 管道结果
struct PipelineResult {
    PipelineRun run;
    std::vector<core::TileLodSet> tiles;
    std::vector<core::LevelFailure> partialFailures;
    std::optional<StageFailure> failure;
    core::CleanupStats cleanupStats;
    core::LodStats stats;
    std::chrono::milliseconds processingTime{0};

    [[nodiscard]] bool succeeded() const noexcept { return run.state == Stage::Done; }
};

// 函数式管道组件
namespace components {

// 清理阶段；未启用时原样返回
[[nodiscard]] core::Result<core::CleanupResult>
cleanStage(const core::Mesh& mesh, const core::CleanupConfig& config, bool enabled);

// 为每个级别重新展开 UV；任一级别失败时返回第一个错误（按瓦片、级别顺序）
[[nodiscard]] std::expected<void, core::Error>
unwrapLevels(std::vector<core::TileLodSet>& tiles, const surface::IUvUnwrapper& unwrapper, bool parallel);

// 从源网格为每个级别烘焙顶点颜色
void bakeLevels(std::vector<core::TileLodSet>& tiles, const surface::IColorSampler& sampler);

} // namespace components

// 主管道类
class LodPipeline {
public:
    explicit LodPipeline(PipelineConfig config)
        : config_(std::move(config)) {}

    // 执行完整管道；异常不会越过此边界
    [[nodiscard]] PipelineResult execute(const core::Mesh& mesh,
                                         const ProgressCallback& progressCallback = nullptr,
                                         std::stop_token stopToken = {});

    // 从宿主表示载入后执行；载入失败记为 Cleaning 阶段失败
    [[nodiscard]] PipelineResult execute(const host::ExternalMesh& source,
                                         const ProgressCallback& progressCallback = nullptr,
                                         std::stop_token stopToken = {});

    // 配置访问
    const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig config_;

    // 瓦片并行生成 LOD；返回致命错误（取消也通过错误返回）
    std::optional<core::Error> buildLods(const std::vector<core::Tile>& tiles, PipelineResult& result,
                                         const ProgressCallback& progressCallback,
                                         std::stop_token stopToken) const;

    void log(const std::string& level, const std::string& message) const;
};

// 函数式管道构建器
class PipelineBuilder {
public:
    PipelineBuilder() = default;

    // 链式配置
    PipelineBuilder& withGridSize(int gridSize) {
        config_.partition.gridSize = gridSize;
        return *this;
    }

    PipelineBuilder& withLodRatios(std::vector<double> ratios) {
        config_.strategy = std::make_shared<core::ExplicitRatioStrategy>(std::move(ratios));
        return *this;
    }

    PipelineBuilder& withReductionSchedule(int lodCount, double reductionPercent) {
        config_.strategy = std::make_shared<core::GeometricReductionStrategy>(lodCount, reductionPercent);
        return *this;
    }

    PipelineBuilder& withLodConfig(core::LodConfig lodConfig) {
        config_.lod = std::move(lodConfig);
        return *this;
    }

    PipelineBuilder& withCleanup(bool enable, core::CleanupConfig cleanup = {}) {
        config_.enableCleanup = enable;
        config_.cleanup = std::move(cleanup);
        return *this;
    }

    PipelineBuilder& withUnwrap(bool enable, std::shared_ptr<const surface::IUvUnwrapper> unwrapper = nullptr) {
        config_.enableUnwrap = enable;
        if (unwrapper) {
            config_.unwrapper = std::move(unwrapper);
        }
        return *this;
    }

    PipelineBuilder& withBake(bool enable, SamplerFactory factory = nullptr) {
        config_.enableBake = enable;
        if (factory) {
            config_.samplerFactory = std::move(factory);
        }
        return *this;
    }

    PipelineBuilder& withParallelProcessing(bool enable) {
        config_.enableParallelProcessing = enable;
        return *this;
    }

    PipelineBuilder& withLogging(bool enable, LogCallback callback = nullptr) {
        config_.enableLogging = enable;
        config_.logCallback = std::move(callback);
        return *this;
    }

    const PipelineConfig& config() const noexcept { return config_; }

    // 构建管道
    [[nodiscard]] LodPipeline build() {
        return LodPipeline{std::move(config_)};
    }

    // 直接执行（一次性使用）
    [[nodiscard]] PipelineResult execute(const core::Mesh& mesh,
                                         const ProgressCallback& progress = nullptr,
                                         std::stop_token stopToken = {}) {
        return build().execute(mesh, progress, stopToken);
    }

private:
    PipelineConfig config_;
};

// 工厂函数
[[nodiscard]] PipelineBuilder createPipeline();

// 未进入管道就失败的运行（输入读取、配置），用于照常写出报告
[[nodiscard]] PipelineResult failedRun(Stage stage, core::Error error);

// 验证配置：网格尺寸、比例列表、容差与协作对象
[[nodiscard]] std::expected<void, core::Error>
validateConfig(const PipelineConfig& config);

} // namespace seamlod::pipeline
