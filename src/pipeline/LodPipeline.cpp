#include "LodPipeline.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <execution>
#include <mutex>
#include <numeric>

namespace seamlod::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

core::Error cancelledError(Stage stage) {
    return core::Error{core::ErrorCode::CancelledByUser, "LodPipeline",
                       "cancelled during " + std::string(toString(stage))};
}

} // namespace

std::string_view toString(Stage stage) noexcept {
    switch (stage) {
        case Stage::Idle: return "Idle";
        case Stage::Cleaning: return "Cleaning";
        case Stage::Partitioning: return "Partitioning";
        case Stage::Decimating: return "Decimating";
        case Stage::Unwrapping: return "Unwrapping";
        case Stage::Baking: return "Baking";
        case Stage::Done: return "Done";
        case Stage::Failed: return "Failed";
        case Stage::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string_view toString(StageStatus status) noexcept {
    switch (status) {
        case StageStatus::Pending: return "Pending";
        case StageStatus::Running: return "Running";
        case StageStatus::Completed: return "Completed";
        case StageStatus::Skipped: return "Skipped";
        case StageStatus::Failed: return "Failed";
        case StageStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

StageStatus PipelineRun::status(Stage stage) const noexcept {
    for (const auto& r : stages) {
        if (r.stage == stage) {
            return r.status;
        }
    }
    return StageStatus::Pending;
}

StageRecord* PipelineRun::record(Stage stage) noexcept {
    for (auto& r : stages) {
        if (r.stage == stage) {
            return &r;
        }
    }
    return nullptr;
}

namespace components {

core::Result<core::CleanupResult>
cleanStage(const core::Mesh& mesh, const core::CleanupConfig& config, bool enabled) {
    if (enabled) {
        return core::cleanupMesh(mesh, config);
    }

    if (auto valid = core::validateMesh(mesh); !valid) {
        return std::unexpected(valid.error());
    }
    core::CleanupResult result;
    result.mesh = mesh;
    result.stats.verticesBefore = result.stats.verticesAfter = mesh.vertexCount();
    result.stats.trianglesBefore = result.stats.trianglesAfter = mesh.triangleCount();
    return result;
}

std::expected<void, core::Error>
unwrapLevels(std::vector<core::TileLodSet>& tiles, const surface::IUvUnwrapper& unwrapper, bool parallel) {
    std::vector<core::LodLevel*> levels;
    for (auto& tile : tiles) {
        for (auto& level : tile.levels) {
            levels.push_back(&level);
        }
    }

    // 每个级别独立写入自己的槽位，异常不得越过并行算法
    std::vector<std::optional<core::Error>> errors(levels.size());
    std::vector<size_t> order(levels.size());
    std::iota(order.begin(), order.end(), size_t{0});

    auto unwrapOne = [&](size_t i) {
        core::LodLevel& level = *levels[i];
        try {
            auto unwrapped = surface::applyUnwrap(level.mesh, unwrapper);
            if (!unwrapped) {
                errors[i] = unwrapped.error();
                return;
            }
            level.mesh = std::move(*unwrapped);
        } catch (const std::exception& e) {
            errors[i] = core::Error{core::ErrorCode::Internal, "UvUnwrapper",
                                    "tile " + core::toString(level.tile) + " level " +
                                        std::to_string(level.levelIndex) + ": " + e.what()};
        }
    };

    if (parallel) {
        std::for_each(std::execution::par, order.begin(), order.end(), unwrapOne);
    } else {
        std::for_each(order.begin(), order.end(), unwrapOne);
    }

    for (auto& error : errors) {
        if (error) {
            return std::unexpected(std::move(*error));
        }
    }
    return {};
}

void bakeLevels(std::vector<core::TileLodSet>& tiles, const surface::IColorSampler& sampler) {
    for (auto& tile : tiles) {
        for (auto& level : tile.levels) {
            level.mesh = surface::bakeVertexColors(level.mesh, sampler);
        }
    }
}

} // namespace components

// LodPipeline 实现
PipelineResult LodPipeline::execute(const core::Mesh& mesh,
                                    const ProgressCallback& progressCallback,
                                    std::stop_token stopToken) {
    PipelineResult result;
    const auto startTime = Clock::now();
    Stage current = Stage::Idle;

    std::mutex progressMutex;
    auto report = [&](const PipelineProgress& progress) {
        if (progressCallback) {
            std::lock_guard lock(progressMutex);
            progressCallback(progress);
        }
    };

    auto enter = [&](Stage stage) {
        current = stage;
        result.run.state = stage;
        if (auto* r = result.run.record(stage)) {
            r->status = StageStatus::Running;
        }
        report(PipelineProgress{stage, 0, 0, 0, 0});
        log("info", "Stage " + std::string(toString(stage)));
    };

    auto finish = [&](Stage stage, StageStatus status, Clock::time_point began) {
        if (auto* r = result.run.record(stage)) {
            r->status = status;
            r->duration = elapsedSince(began);
        }
    };

    auto fail = [&](Stage stage, core::Error error) {
        if (auto* r = result.run.record(stage)) {
            r->status = StageStatus::Failed;
        }
        log("error", std::string(toString(stage)) + " failed in " + error.component + ": " + error.message);
        result.failure = StageFailure{stage, std::move(error)};
        result.run.state = Stage::Failed;
    };

    auto cancel = [&](Stage stage) {
        if (auto* r = result.run.record(stage)) {
            r->status = StageStatus::Cancelled;
        }
        log("warn", "Run cancelled during " + std::string(toString(stage)));
        result.run.state = Stage::Cancelled;
    };

    auto skip = [&](Stage stage) {
        if (auto* r = result.run.record(stage)) {
            r->status = StageStatus::Skipped;
        }
    };

    auto finalize = [&]() {
        result.stats = core::computeLodStats(result.tiles);
        result.processingTime = elapsedSince(startTime);
        report(PipelineProgress{result.run.state, result.tiles.size(), result.tiles.size(), 0, 0});
        return std::move(result);
    };

    try {
        result.run.input = core::computeStats(mesh);
        result.run.gridSize = config_.partition.gridSize;
        if (config_.strategy) {
            result.run.ratios = config_.strategy->ratios();
        }

        if (auto valid = validateConfig(config_); !valid) {
            fail(Stage::Idle, valid.error());
            return finalize();
        }

        log("info", "Starting run: " + std::to_string(mesh.vertexCount()) + " vertices, " +
                        std::to_string(mesh.triangleCount()) + " triangles, grid " +
                        std::to_string(config_.partition.gridSize));

        // 步骤1: 清理
        if (stopToken.stop_requested()) {
            cancel(Stage::Cleaning);
            return finalize();
        }
        auto began = Clock::now();
        enter(Stage::Cleaning);
        auto cleaned = components::cleanStage(mesh, config_.cleanup, config_.enableCleanup);
        if (!cleaned) {
            fail(Stage::Cleaning, cleaned.error());
            return finalize();
        }
        result.cleanupStats = cleaned->stats;
        finish(Stage::Cleaning, config_.enableCleanup ? StageStatus::Completed : StageStatus::Skipped, began);

        // 步骤2: 切分
        if (stopToken.stop_requested()) {
            cancel(Stage::Partitioning);
            return finalize();
        }
        began = Clock::now();
        enter(Stage::Partitioning);
        auto tiles = core::partitionMesh(cleaned->mesh, config_.partition);
        if (!tiles) {
            fail(Stage::Partitioning, tiles.error());
            return finalize();
        }
        if (tiles->empty()) {
            fail(Stage::Partitioning, core::Error{core::ErrorCode::InvalidGeometry, "TilePartitioner",
                                                  "partition produced no tiles"});
            return finalize();
        }
        finish(Stage::Partitioning, StageStatus::Completed, began);

        // 步骤3: 逐瓦片生成 LOD
        began = Clock::now();
        enter(Stage::Decimating);
        if (auto error = buildLods(*tiles, result, progressCallback ? ProgressCallback(report) : nullptr,
                                   stopToken)) {
            if (error->code == core::ErrorCode::CancelledByUser) {
                cancel(Stage::Decimating);
            } else {
                fail(Stage::Decimating, std::move(*error));
            }
            return finalize();
        }
        finish(Stage::Decimating, StageStatus::Completed, began);

        // 步骤4: UV 展开
        if (!config_.enableUnwrap) {
            skip(Stage::Unwrapping);
        } else {
            if (stopToken.stop_requested()) {
                cancel(Stage::Unwrapping);
                return finalize();
            }
            began = Clock::now();
            enter(Stage::Unwrapping);
            if (auto unwrapped = components::unwrapLevels(result.tiles, *config_.unwrapper,
                                                          config_.enableParallelProcessing);
                !unwrapped) {
                fail(Stage::Unwrapping, unwrapped.error());
                return finalize();
            }
            finish(Stage::Unwrapping, StageStatus::Completed, began);
        }

        // 步骤5: 颜色烘焙（在调用线程上执行）
        if (!config_.enableBake) {
            skip(Stage::Baking);
        } else {
            if (stopToken.stop_requested()) {
                cancel(Stage::Baking);
                return finalize();
            }
            began = Clock::now();
            enter(Stage::Baking);
            const auto sampler = config_.samplerFactory(cleaned->mesh);
            components::bakeLevels(result.tiles, *sampler);
            finish(Stage::Baking, StageStatus::Completed, began);
        }

        result.run.state = Stage::Done;
        log("info", "Run finished: " + std::to_string(result.tiles.size()) + " tiles, " +
                        std::to_string(result.partialFailures.size()) + " skipped levels");
    } catch (const std::exception& e) {
        fail(current, core::Error{core::ErrorCode::Internal, "LodPipeline", e.what()});
    }

    return finalize();
}

PipelineResult LodPipeline::execute(const host::ExternalMesh& source,
                                    const ProgressCallback& progressCallback,
                                    std::stop_token stopToken) {
    core::Result<core::Mesh> mesh = core::Mesh{};
    try {
        mesh = host::loadFrom(source);
    } catch (const std::exception& e) {
        mesh = core::makeError(core::ErrorCode::Internal, "HostMesh", e.what());
    }

    // 配置错误优先，由主流程报告为 Idle 阶段失败
    if (!mesh && validateConfig(config_)) {
        log("error", "Cleaning failed in " + mesh.error().component + ": " + mesh.error().message);
        auto result = failedRun(Stage::Cleaning, mesh.error());
        result.run.gridSize = config_.partition.gridSize;
        result.run.ratios = config_.strategy->ratios();
        return result;
    }
    return execute(mesh ? *mesh : core::Mesh{}, progressCallback, stopToken);
}

std::optional<core::Error> LodPipeline::buildLods(const std::vector<core::Tile>& tiles, PipelineResult& result,
                                                  const ProgressCallback& progressCallback,
                                                  std::stop_token stopToken) const {
    const auto ratios = config_.strategy->ratios();
    const size_t levelsTotal = tiles.size() * ratios.size();

    std::atomic<size_t> tilesCompleted{0};
    std::atomic<size_t> levelsCompleted{0};

    auto report = [&]() {
        if (progressCallback) {
            progressCallback(PipelineProgress{Stage::Decimating, tilesCompleted.load(), tiles.size(),
                                              levelsCompleted.load(), levelsTotal});
        }
    };

    const core::LevelCallback onLevel = [&](const core::TileCoord&, int) {
        ++levelsCompleted;
        report();
    };

    // 每个瓦片独立写入自己的槽位
    std::vector<std::optional<core::Result<core::TileLodSet>>> slots(tiles.size());
    std::vector<size_t> order(tiles.size());
    std::iota(order.begin(), order.end(), size_t{0});

    auto buildOne = [&](size_t i) {
        if (stopToken.stop_requested()) {
            return;
        }
        // 进度回调同样在保护范围内，异常不得越过并行算法
        try {
            slots[i] = core::buildTileLods(tiles[i], ratios, config_.lod, stopToken, onLevel);
            if (slots[i]->has_value()) {
                ++tilesCompleted;
                report();
            }
        } catch (const std::exception& e) {
            slots[i] = core::makeError(core::ErrorCode::Internal, "LodBuilder",
                                       "tile " + core::toString(tiles[i].coord) + ": " + e.what());
        }
    };

    if (config_.enableParallelProcessing) {
        std::for_each(std::execution::par, order.begin(), order.end(), buildOne);
    } else {
        std::for_each(order.begin(), order.end(), buildOne);
    }

    // 先检查致命错误，再检查取消
    std::optional<core::Error> cancelled;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
            cancelled = cancelledError(Stage::Decimating);
            continue;
        }
        if (!slots[i]->has_value()) {
            const auto& error = slots[i]->error();
            if (error.code == core::ErrorCode::CancelledByUser) {
                cancelled = error;
                continue;
            }
            return error;
        }
    }

    // 只保留所有级别都已完成的瓦片，按 (y, x) 顺序
    for (auto& slot : slots) {
        if (slot && slot->has_value()) {
            auto& set = slot->value();
            result.partialFailures.insert(result.partialFailures.end(), set.failures.begin(), set.failures.end());
            result.tiles.push_back(std::move(set));
        }
    }

    if (cancelled) {
        return cancelled;
    }

    for (const auto& failure : result.partialFailures) {
        log("warn", "Tile " + core::toString(failure.tile) + " level " + std::to_string(failure.levelIndex) +
                        " skipped: " + std::string(core::toString(failure.error.code)));
    }
    return std::nullopt;
}

void LodPipeline::log(const std::string& level, const std::string& message) const {
    if (!config_.enableLogging) {
        return;
    }
    if (config_.logCallback) {
        config_.logCallback(level, message);
        return;
    }

    // 使用默认日志记录
    if (level == "error") {
        spdlog::error(message);
    } else if (level == "warn") {
        spdlog::warn(message);
    } else if (level == "info") {
        spdlog::info(message);
    } else {
        spdlog::debug(message);
    }
}

// 工厂函数
PipelineBuilder createPipeline() {
    return PipelineBuilder{};
}

PipelineResult failedRun(Stage stage, core::Error error) {
    PipelineResult result;
    if (auto* r = result.run.record(stage)) {
        r->status = StageStatus::Failed;
    }
    result.run.state = Stage::Failed;
    result.failure = StageFailure{stage, std::move(error)};
    return result;
}

std::expected<void, core::Error> validateConfig(const PipelineConfig& config) {
    auto invalid = [](std::string message) {
        return core::makeError(core::ErrorCode::InvalidConfig, "PipelineConfig", std::move(message));
    };

    if (config.partition.gridSize < 1) {
        return invalid("grid size must be at least 1");
    }
    if (!config.strategy) {
        return invalid("no LOD strategy configured");
    }

    const auto ratios = config.strategy->ratios();
    if (ratios.empty()) {
        return invalid("LOD ratio list is empty");
    }
    for (const double ratio : ratios) {
        if (!(ratio > 0.0 && ratio <= 1.0)) {
            return invalid("LOD ratio " + std::to_string(ratio) + " is outside (0, 1]");
        }
    }

    if (config.lod.boundary.epsilon < 0.0) {
        return invalid("boundary epsilon must not be negative");
    }
    if (config.cleanup.mergeDistance < 0.0f) {
        return invalid("merge distance must not be negative");
    }
    if (config.lod.decimation.targetError < 0.0f) {
        return invalid("target error must not be negative");
    }
    if (config.enableUnwrap && !config.unwrapper) {
        return invalid("unwrapping requested without an unwrapper");
    }
    if (config.enableBake && !config.samplerFactory) {
        return invalid("baking requested without a color sampler");
    }

    return {};
}

} // namespace seamlod::pipeline
