#pragma once

#include "pipeline/LodPipeline.hpp"
#include "io/OsgExporter.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

namespace seamlod::io {

// 报告写出错误类型
enum class ReportError {
    WriteError,
    InvalidPath,
    JsonError
};

[[nodiscard]] std::string toString(ReportError error);

// report.json 生成器
class ReportBuilder {
public:
    explicit ReportBuilder(std::string baseName = "mesh")
        : baseName_(std::move(baseName)) {}

    // 完整报告：运行状态、阶段、瓦片、部分失败与致命失败
    [[nodiscard]] nlohmann::json buildReport(const pipeline::PipelineResult& result,
                                             std::span<const ExportedFile> files = {}) const;

    [[nodiscard]] nlohmann::json buildRun(const pipeline::PipelineRun& run) const;

    [[nodiscard]] nlohmann::json buildTile(const core::TileLodSet& tile) const;

    [[nodiscard]] nlohmann::json buildFailure(const core::Error& error) const;

private:
    std::string baseName_;
};

// 写出 JSON 文件
[[nodiscard]] std::expected<void, ReportError>
writeReport(const nlohmann::json& report, const std::filesystem::path& outputFile);

} // namespace seamlod::io
