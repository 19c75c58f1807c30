#pragma once

#include "core/LodAlgorithm.hpp"
#include <osg/Geometry>
#include <osg/LOD>
#include <string>
#include <filesystem>
#include <expected>
#include <memory>
#include <span>
#include <vector>

namespace seamlod::io {

// OSG 导出错误类型
enum class OsgError {
    WriteError,
    InvalidPath,
    UnsupportedFormat,
    ConversionError
};

[[nodiscard]] std::string toString(OsgError error);

// OSG 导出配置
struct OsgExportConfig {
    std::string format{"obj"};     // obj, osgb, osgt
    bool writeLodGroups{false};    // 每个瓦片额外写一个 osg::LOD 文件
    bool optimizeGeometry{true};
    float rangeFactor{4.0f};       // LOD 切换距离 = 包围球半径 * rangeFactor * 2^level
};

// 每个文件写出的结果
struct ExportedFile {
    std::filesystem::path path;
    core::TileCoord tile;
    int levelIndex{-1};            // -1 表示 LOD 组文件
    size_t triangles{0};
};

// OSG 导出器接口
class IOsgExporter {
public:
    virtual ~IOsgExporter() = default;

    // 导出一个瓦片的全部级别
    virtual std::expected<std::vector<ExportedFile>, OsgError>
    exportTile(const core::TileLodSet& tile, const std::string& baseName,
               const std::filesystem::path& outputDir) const = 0;

    // 导出全部瓦片
    virtual std::expected<std::vector<ExportedFile>, OsgError>
    exportAll(std::span<const core::TileLodSet> tiles, const std::string& baseName,
              const std::filesystem::path& outputDir) const = 0;
};

// 标准 OSG 导出器实现
class StandardOsgExporter : public IOsgExporter {
public:
    explicit StandardOsgExporter(OsgExportConfig config = {})
        : config_(std::move(config)) {}

    std::expected<std::vector<ExportedFile>, OsgError>
    exportTile(const core::TileLodSet& tile, const std::string& baseName,
               const std::filesystem::path& outputDir) const override;

    std::expected<std::vector<ExportedFile>, OsgError>
    exportAll(std::span<const core::TileLodSet> tiles, const std::string& baseName,
              const std::filesystem::path& outputDir) const override;

private:
    OsgExportConfig config_;

    // 创建瓦片的 LOD 组
    osg::ref_ptr<osg::LOD> createLodGroup(const core::TileLodSet& tile) const;

    // 应用优化
    void optimizeNode(osg::Node* node) const;

    std::expected<void, OsgError> writeNode(osg::Node& node, const std::filesystem::path& path) const;
};

// 转换网格到 OSG 几何体
[[nodiscard]] osg::ref_ptr<osg::Geometry> meshToGeometry(const core::Mesh& mesh);

// 工厂函数
[[nodiscard]] std::unique_ptr<IOsgExporter>
createOsgExporter(const OsgExportConfig& config = {});

// 辅助函数：获取支持的格式列表
[[nodiscard]] std::vector<std::string> getSupportedOsgFormats() noexcept;

} // namespace seamlod::io
