#include "ReportWriter.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>

namespace seamlod::io {

std::string toString(ReportError error) {
    switch (error) {
        case ReportError::WriteError: return "write error";
        case ReportError::InvalidPath: return "invalid path";
        case ReportError::JsonError: return "JSON error";
    }
    return "unknown";
}

nlohmann::json ReportBuilder::buildReport(const pipeline::PipelineResult& result,
                                          std::span<const ExportedFile> files) const {
    nlohmann::json report;

    report["name"] = baseName_;
    report["state"] = std::string(pipeline::toString(result.run.state));
    report["succeeded"] = result.succeeded();
    report["processingTimeMs"] = result.processingTime.count();
    report["run"] = buildRun(result.run);

    report["cleanup"] = {
        {"verticesBefore", result.cleanupStats.verticesBefore},
        {"verticesAfter", result.cleanupStats.verticesAfter},
        {"trianglesBefore", result.cleanupStats.trianglesBefore},
        {"trianglesAfter", result.cleanupStats.trianglesAfter},
        {"componentsRemoved", result.cleanupStats.componentsRemoved},
        {"holesFilled", result.cleanupStats.holesFilled}
    };

    nlohmann::json tiles = nlohmann::json::array();
    for (const auto& tile : result.tiles) {
        tiles.push_back(buildTile(tile));
    }
    report["tiles"] = tiles;

    report["stats"] = {
        {"tiles", result.stats.tileCount},
        {"levels", result.stats.levelCount},
        {"failedLevels", result.stats.failedLevels},
        {"totalTriangles", result.stats.totalTriangles},
        {"trianglesPerLevel", result.stats.trianglesPerLevel}
    };

    nlohmann::json partial = nlohmann::json::array();
    for (const auto& failure : result.partialFailures) {
        auto entry = buildFailure(failure.error);
        entry["tile"] = core::toString(failure.tile);
        entry["level"] = failure.levelIndex;
        entry["ratio"] = failure.ratio;
        partial.push_back(std::move(entry));
    }
    report["partialFailures"] = partial;

    if (result.failure) {
        auto fatal = buildFailure(result.failure->error);
        fatal["stage"] = std::string(pipeline::toString(result.failure->stage));
        report["failure"] = fatal;
    } else {
        report["failure"] = nullptr;
    }

    nlohmann::json outputs = nlohmann::json::array();
    for (const auto& file : files) {
        outputs.push_back({
            {"path", file.path.filename().string()},
            {"tile", core::toString(file.tile)},
            {"level", file.levelIndex},
            {"triangles", file.triangles}
        });
    }
    report["files"] = outputs;

    return report;
}

nlohmann::json ReportBuilder::buildRun(const pipeline::PipelineRun& run) const {
    nlohmann::json stages = nlohmann::json::array();
    for (const auto& record : run.stages) {
        stages.push_back({
            {"stage", std::string(pipeline::toString(record.stage))},
            {"status", std::string(pipeline::toString(record.status))},
            {"durationMs", record.duration.count()}
        });
    }

    return {
        {"gridSize", run.gridSize},
        {"ratios", run.ratios},
        {"inputVertices", run.input.vertexCount},
        {"inputTriangles", run.input.triangleCount},
        {"stages", stages}
    };
}

nlohmann::json ReportBuilder::buildTile(const core::TileLodSet& tile) const {
    nlohmann::json levels = nlohmann::json::array();
    for (const auto& level : tile.levels) {
        levels.push_back({
            {"name", core::levelName(baseName_, tile.coord, level.levelIndex)},
            {"level", level.levelIndex},
            {"ratio", level.ratio},
            {"vertices", level.mesh.vertexCount()},
            {"triangles", level.mesh.triangleCount()},
            {"error", level.error}
        });
    }

    return {
        {"x", tile.coord.x},
        {"y", tile.coord.y},
        {"boundaryVertices", tile.boundary.size()},
        {"levels", levels},
        {"skippedLevels", tile.failures.size()}
    };
}

nlohmann::json ReportBuilder::buildFailure(const core::Error& error) const {
    return {
        {"code", std::string(core::toString(error.code))},
        {"component", error.component},
        {"message", error.message}
    };
}

std::expected<void, ReportError> writeReport(const nlohmann::json& report, const std::filesystem::path& outputFile) {
    if (outputFile.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(outputFile.parent_path(), ec);
        if (ec) {
            return std::unexpected(ReportError::InvalidPath);
        }
    }

    std::ofstream file(outputFile);
    if (!file.is_open()) {
        return std::unexpected(ReportError::WriteError);
    }

    try {
        file << std::setw(2) << report << std::endl;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to serialize report: {}", e.what());
        return std::unexpected(ReportError::JsonError);
    }

    if (!file.good()) {
        return std::unexpected(ReportError::WriteError);
    }
    spdlog::info("Report written to {}", outputFile.string());
    return {};
}

} // namespace seamlod::io
