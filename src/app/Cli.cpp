#include "app/Cli.hpp"
#include "pipeline/LodPipeline.hpp"
#include "host/HostMesh.hpp"
#include "io/PlyReader.hpp"
#include "io/OsgExporter.hpp"
#include "io/ReportWriter.hpp"
#include <algorithm>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <sstream>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace seamlod::app {

namespace {

// 解析逗号分隔的比例列表
std::expected<std::vector<double>, std::string> parseRatios(const std::string& text) {
    std::vector<double> ratios;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            ratios.push_back(std::stod(item));
        } catch (const std::exception&) {
            return std::unexpected("Invalid ratio: " + item);
        }
    }
    return ratios;
}

} // namespace

std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("seamlod", "Seam-preserving tiled LOD generator for photogrammetry meshes");

        options.add_options()
            ("i,input", "Input PLY file", cxxopts::value<std::string>())
            ("o,output", "Output directory", cxxopts::value<std::string>())
            ("grid", "Slices per axis", cxxopts::value<int>()->default_value("1"))
            ("modules", "Module count (power of two), alternative to --grid", cxxopts::value<int>()->default_value("0"))
            ("ratios", "Comma separated LOD ratios, e.g. 1,0.5,0.25", cxxopts::value<std::string>())
            ("lod-count", "Number of reduced LOD levels", cxxopts::value<int>()->default_value("3"))
            ("reduction", "Reduction per level in percent", cxxopts::value<double>()->default_value("50"))
            ("metric", "Ratio metric (triangles,vertices)", cxxopts::value<std::string>()->default_value("triangles"))
            ("min-component", "Drop loose parts with fewer vertices (0=off)", cxxopts::value<size_t>()->default_value("0"))
            ("max-hole", "Fill holes with at most this many edges (0=off)", cxxopts::value<size_t>()->default_value("0"))
            ("merge-distance", "Vertex weld distance", cxxopts::value<float>()->default_value("0.000001"))
            ("boundary-epsilon", "Seam classification tolerance", cxxopts::value<double>()->default_value("0.0001"))
            ("lock-open-edges", "Also lock vertices on open edges", cxxopts::value<bool>()->default_value("false"))
            ("unwrap", "Re-unwrap UVs for every level", cxxopts::value<bool>()->default_value("false"))
            ("bake", "Bake vertex colors from the source mesh", cxxopts::value<bool>()->default_value("false"))
            ("format", "Output format (obj,osgb,osgt)", cxxopts::value<std::string>()->default_value("obj"))
            ("osg-lod", "Write one osg::LOD group per tile", cxxopts::value<bool>()->default_value("false"))
            ("parallel", "Enable parallel processing", cxxopts::value<bool>()->default_value("true"))
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("no-progress", "Disable progress bar", cxxopts::value<bool>()->default_value("false"))
            ("dry-run", "Dry run (validate only)", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("input")) {
            opts.inputFile = result["input"].as<std::string>();
        } else {
            return std::unexpected("Input file is required");
        }

        if (result.count("output")) {
            opts.outputDir = result["output"].as<std::string>();
        } else {
            return std::unexpected("Output directory is required");
        }

        opts.gridSize = result["grid"].as<int>();
        opts.modules = result["modules"].as<int>();
        if (result.count("ratios")) {
            auto ratios = parseRatios(result["ratios"].as<std::string>());
            if (!ratios) {
                return std::unexpected(ratios.error());
            }
            opts.ratios = std::move(*ratios);
        }
        opts.lodCount = result["lod-count"].as<int>();
        opts.reductionPercent = result["reduction"].as<double>();
        opts.metric = result["metric"].as<std::string>();
        if (opts.metric != "triangles" && opts.metric != "vertices") {
            return std::unexpected("Unknown metric: " + opts.metric);
        }
        opts.minComponentVertices = result["min-component"].as<size_t>();
        opts.maxHoleEdges = result["max-hole"].as<size_t>();
        opts.mergeDistance = result["merge-distance"].as<float>();
        opts.boundaryEpsilon = result["boundary-epsilon"].as<double>();
        opts.lockOpenEdges = result["lock-open-edges"].as<bool>();
        opts.unwrap = result["unwrap"].as<bool>();
        opts.bake = result["bake"].as<bool>();
        opts.format = result["format"].as<std::string>();
        opts.osgLod = result["osg-lod"].as<bool>();
        opts.enableParallel = result["parallel"].as<bool>();
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();
        opts.showProgress = !result["no-progress"].as<bool>();
        opts.dryRun = result["dry-run"].as<bool>();

        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

void setupLogging(const CommandLineOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!opts.quiet) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);
    }

    if (!opts.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.logFile, true);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("seamlod", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

namespace {

// 进度回调
void progressCallback(const pipeline::PipelineProgress& progress) {
    static auto lastUpdate = std::chrono::steady_clock::now();
    auto now = std::chrono::steady_clock::now();

    const bool finished = progress.stage == pipeline::Stage::Done ||
                          progress.stage == pipeline::Stage::Failed ||
                          progress.stage == pipeline::Stage::Cancelled;

    // 限制更新频率（每100ms）
    if (std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate).count() < 100 && !finished) {
        return;
    }
    lastUpdate = now;

    double fraction = finished ? 1.0 : 0.0;
    if (!finished && progress.levelsTotal > 0) {
        fraction = static_cast<double>(progress.levelsCompleted) / progress.levelsTotal;
    }

    // 简单的进度条
    const int barWidth = 50;
    int pos = static_cast<int>(barWidth * fraction);

    std::cout << "\r[";
    for (int i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << static_cast<int>(fraction * 100.0) << "% " << pipeline::toString(progress.stage)
              << " tiles " << progress.tilesCompleted << "/" << progress.tilesTotal;
    std::cout.flush();

    if (finished) {
        std::cout << std::endl;
    }
}

// 构建管道配置
std::expected<pipeline::PipelineConfig, std::string> buildPipelineConfig(const CommandLineOptions& opts) {
    auto builder = pipeline::createPipeline();

    int gridSize = opts.gridSize;
    if (opts.modules > 0) {
        auto grid = core::gridFromModuleCount(opts.modules);
        if (!grid) {
            return std::unexpected("Module count must be a power of two: " + std::to_string(opts.modules));
        }
        gridSize = *grid;
    }
    builder.withGridSize(gridSize);

    if (!opts.ratios.empty()) {
        builder.withLodRatios(opts.ratios);
    } else {
        builder.withReductionSchedule(opts.lodCount, opts.reductionPercent);
    }

    core::CleanupConfig cleanup;
    cleanup.minComponentVertices = opts.minComponentVertices;
    cleanup.maxHoleEdges = opts.maxHoleEdges;
    cleanup.mergeDistance = opts.mergeDistance;
    builder.withCleanup(true, cleanup);

    core::LodConfig lod;
    lod.boundary.epsilon = opts.boundaryEpsilon;
    lod.boundary.lockOpenEdges = opts.lockOpenEdges;
    lod.decimation.metric = opts.metric == "vertices" ? core::TargetMetric::Vertices : core::TargetMetric::Triangles;
    builder.withLodConfig(lod);

    builder.withUnwrap(opts.unwrap)
           .withBake(opts.bake)
           .withParallelProcessing(opts.enableParallel)
           .withLogging(true);

    return builder.config();
}

// 显示结果摘要
void showResultSummary(const pipeline::PipelineResult& result) {
    spdlog::info("=== LOD Generation {} ===", pipeline::toString(result.run.state));

    for (const auto& record : result.run.stages) {
        spdlog::info("  {:<13} {:<10} {} ms", pipeline::toString(record.stage),
                     pipeline::toString(record.status), record.duration.count());
    }

    if (result.failure) {
        spdlog::error("Failed in {} ({}): {}", pipeline::toString(result.failure->stage),
                      result.failure->error.component, result.failure->error.message);
        return;
    }

    spdlog::info("Processing time: {:.2f} seconds", result.processingTime.count() / 1000.0);
    spdlog::info("Tiles: {}", result.stats.tileCount);
    spdlog::info("Total triangles: {}", result.stats.totalTriangles);

    // 显示每层级的三角形数量
    if (!result.stats.trianglesPerLevel.empty()) {
        spdlog::info("Triangles per level:");
        for (size_t i = 0; i < result.stats.trianglesPerLevel.size(); ++i) {
            spdlog::info("  Level {}: {} triangles", i, result.stats.trianglesPerLevel[i]);
        }
    }

    for (const auto& failure : result.partialFailures) {
        spdlog::warn("Skipped tile {} level {} (ratio {}): {}", core::toString(failure.tile),
                     failure.levelIndex, failure.ratio, failure.error.message);
    }
}

} // namespace

int runCli(const CommandLineOptions& opts, std::stop_token stopToken) {
    spdlog::info("seamlod v0.1.0");
    spdlog::info("Input: {}", opts.inputFile);
    spdlog::info("Output: {}", opts.outputDir);

    const std::filesystem::path outputDir{opts.outputDir};
    const std::string baseName = std::filesystem::path(opts.inputFile).stem().string();
    const io::ReportBuilder reportBuilder{baseName};

    auto writeRunReport = [&](const pipeline::PipelineResult& result,
                              std::span<const io::ExportedFile> files) {
        if (auto written = io::writeReport(reportBuilder.buildReport(result, files), outputDir / "report.json");
            !written) {
            spdlog::error("Failed to write report: {}", io::toString(written.error()));
            return false;
        }
        return true;
    };

    // 管道开始之前的失败也写出报告
    auto reject = [&](core::Error error) {
        spdlog::error("{} ({}): {}", core::toString(error.code), error.component, error.message);
        if (!opts.dryRun) {
            writeRunReport(pipeline::failedRun(pipeline::Stage::Idle, std::move(error)), {});
        }
        return 1;
    };

    // 构建管道配置
    auto config = buildPipelineConfig(opts);
    if (!config) {
        return reject(core::Error{core::ErrorCode::InvalidConfig, "CommandLine", config.error()});
    }

    // 验证配置
    if (auto validation = pipeline::validateConfig(*config); !validation) {
        return reject(validation.error());
    }
    spdlog::info("Grid: {0}x{0}, ratios: [{1}]", config->partition.gridSize,
                 fmt::join(config->strategy->ratios(), ", "));

    const auto formats = io::getSupportedOsgFormats();
    if (std::find(formats.begin(), formats.end(), opts.format) == formats.end()) {
        return reject(core::Error{core::ErrorCode::InvalidConfig, "OsgExporter",
                                  "unsupported output format: " + opts.format});
    }

    // 读取输入
    auto reader = io::createPlyReader();
    auto external = reader->readPly(opts.inputFile);
    if (!external) {
        return reject(core::Error{core::ErrorCode::IoError, "PlyReader",
                                  opts.inputFile + ": " + io::toString(external.error())});
    }

    if (opts.dryRun) {
        if (auto mesh = host::loadFrom(*external); !mesh) {
            spdlog::error("Invalid input geometry: {}", mesh.error().message);
            return 1;
        }
        spdlog::info("Dry run completed successfully");
        return 0;
    }

    // 执行管道；载入宿主表示是运行的一部分
    spdlog::info("Starting LOD generation...");

    auto lodPipeline = pipeline::LodPipeline{std::move(*config)};
    const auto result = lodPipeline.execute(
        *external,
        opts.showProgress && !opts.quiet ? pipeline::ProgressCallback{progressCallback} : pipeline::ProgressCallback{},
        stopToken);

    // 显示结果
    showResultSummary(result);

    std::vector<io::ExportedFile> files;
    bool exportFailed = false;
    if (result.succeeded()) {
        io::OsgExportConfig exportConfig;
        exportConfig.format = opts.format;
        exportConfig.writeLodGroups = opts.osgLod;

        auto exporter = io::createOsgExporter(exportConfig);
        if (auto exported = exporter->exportAll(result.tiles, baseName, outputDir)) {
            files = std::move(*exported);
        } else {
            spdlog::error("Export failed: {}", io::toString(exported.error()));
            exportFailed = true;
        }
    }

    if (!writeRunReport(result, files)) {
        return 1;
    }
    return result.succeeded() && !exportFailed ? 0 : 1;
}

} // namespace seamlod::app
