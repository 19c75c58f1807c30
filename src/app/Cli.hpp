#pragma once

#include <cstddef>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace seamlod::app {

// 命令行选项结构
struct CommandLineOptions {
    std::string inputFile;
    std::string outputDir;
    int gridSize{1};
    int modules{0};                    // 2 的幂次模块数，0 表示使用 gridSize
    std::vector<double> ratios;        // 显式比例，为空时使用递减调度
    int lodCount{3};
    double reductionPercent{50.0};
    std::string metric{"triangles"};   // triangles, vertices
    size_t minComponentVertices{0};
    size_t maxHoleEdges{0};
    float mergeDistance{1e-6f};
    double boundaryEpsilon{1e-4};
    bool lockOpenEdges{false};
    bool unwrap{false};
    bool bake{false};
    std::string format{"obj"};
    bool osgLod{false};
    bool enableParallel{true};
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
    bool showProgress{true};
    bool dryRun{false};
};

// 解析命令行参数；--help 打印帮助后退出
[[nodiscard]] std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]);

// 设置日志系统：控制台 + 可选文件
void setupLogging(const CommandLineOptions& opts);

// 读取、执行、导出并写出 report.json；返回进程退出码。
// 只要输出目录可写，失败的运行同样写出报告（--dry-run 除外）
[[nodiscard]] int runCli(const CommandLineOptions& opts, std::stop_token stopToken = {});

} // namespace seamlod::app
