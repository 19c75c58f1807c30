#include "OsgExporter.hpp"
#include <osg/Geode>
#include <osgDB/WriteFile>
#include <osgUtil/Optimizer>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace seamlod::io {

std::string toString(OsgError error) {
    switch (error) {
        case OsgError::WriteError: return "write error";
        case OsgError::InvalidPath: return "invalid path";
        case OsgError::UnsupportedFormat: return "unsupported format";
        case OsgError::ConversionError: return "conversion error";
    }
    return "unknown";
}

osg::ref_ptr<osg::Geometry> meshToGeometry(const core::Mesh& mesh) {
    osg::ref_ptr<osg::Geometry> geometry = new osg::Geometry;

    const auto& vertices = mesh.vertices();
    const auto& indices = mesh.indices();

    // 顶点位置
    auto vertexArray = new osg::Vec3Array;
    vertexArray->reserve(vertices.positions.size());
    for (const auto& pos : vertices.positions) {
        vertexArray->push_back(osg::Vec3(pos[0], pos[1], pos[2]));
    }
    geometry->setVertexArray(vertexArray);

    // 法线
    if (vertices.hasNormals()) {
        auto normalArray = new osg::Vec3Array;
        normalArray->reserve(vertices.normals.size());
        for (const auto& normal : vertices.normals) {
            normalArray->push_back(osg::Vec3(normal[0], normal[1], normal[2]));
        }
        geometry->setNormalArray(normalArray, osg::Array::BIND_PER_VERTEX);
    }

    // 颜色
    if (vertices.hasColors()) {
        auto colorArray = new osg::Vec4Array;
        colorArray->reserve(vertices.colors.size());
        for (const auto& color : vertices.colors) {
            colorArray->push_back(osg::Vec4(color[0] / 255.0f, color[1] / 255.0f,
                                            color[2] / 255.0f, color[3] / 255.0f));
        }
        geometry->setColorArray(colorArray, osg::Array::BIND_PER_VERTEX);
    }

    // 纹理坐标
    if (vertices.hasTexCoords()) {
        auto texCoordArray = new osg::Vec2Array;
        texCoordArray->reserve(vertices.texCoords.size());
        for (const auto& tc : vertices.texCoords) {
            texCoordArray->push_back(osg::Vec2(tc[0], tc[1]));
        }
        geometry->setTexCoordArray(0, texCoordArray);
    }

    // 索引
    auto drawElements = new osg::DrawElementsUInt(osg::PrimitiveSet::TRIANGLES);
    drawElements->reserve(indices.size());
    for (const auto& index : indices) {
        drawElements->push_back(index);
    }
    geometry->addPrimitiveSet(drawElements);

    return geometry;
}

// StandardOsgExporter 实现
std::expected<std::vector<ExportedFile>, OsgError>
StandardOsgExporter::exportTile(const core::TileLodSet& tile, const std::string& baseName,
                                const std::filesystem::path& outputDir) const {
    // 先检查全部级别，避免写出半个瓦片
    for (const auto& level : tile.levels) {
        if (auto valid = core::validateMesh(level.mesh); !valid) {
            spdlog::error("Tile {} level {} cannot be converted: {}", core::toString(tile.coord),
                          level.levelIndex, valid.error().message);
            return std::unexpected(OsgError::ConversionError);
        }
    }

    std::vector<ExportedFile> files;

    for (const auto& level : tile.levels) {
        osg::ref_ptr<osg::Geode> geode = new osg::Geode;
        geode->addDrawable(meshToGeometry(level.mesh));
        if (config_.optimizeGeometry) {
            optimizeNode(geode.get());
        }

        const auto path = outputDir / (core::levelName(baseName, tile.coord, level.levelIndex) + "." + config_.format);
        if (auto written = writeNode(*geode, path); !written) {
            return std::unexpected(written.error());
        }
        files.push_back(ExportedFile{path, tile.coord, level.levelIndex, level.mesh.triangleCount()});
    }

    if (config_.writeLodGroups && !tile.levels.empty()) {
        auto group = createLodGroup(tile);
        const auto path = outputDir / (baseName + "_" + core::toString(tile.coord) + "_lod." + config_.format);
        if (auto written = writeNode(*group, path); !written) {
            return std::unexpected(written.error());
        }
        files.push_back(ExportedFile{path, tile.coord, -1, 0});
    }

    return files;
}

std::expected<std::vector<ExportedFile>, OsgError>
StandardOsgExporter::exportAll(std::span<const core::TileLodSet> tiles, const std::string& baseName,
                               const std::filesystem::path& outputDir) const {
    const auto formats = getSupportedOsgFormats();
    if (std::find(formats.begin(), formats.end(), config_.format) == formats.end()) {
        return std::unexpected(OsgError::UnsupportedFormat);
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        spdlog::error("Cannot create output directory {}: {}", outputDir.string(), ec.message());
        return std::unexpected(OsgError::InvalidPath);
    }

    std::vector<ExportedFile> files;
    for (const auto& tile : tiles) {
        auto result = exportTile(tile, baseName, outputDir);
        if (!result) {
            return std::unexpected(result.error());
        }
        files.insert(files.end(), result->begin(), result->end());
    }

    spdlog::info("Exported {} files to {}", files.size(), outputDir.string());
    return files;
}

osg::ref_ptr<osg::LOD> StandardOsgExporter::createLodGroup(const core::TileLodSet& tile) const {
    osg::ref_ptr<osg::LOD> lodGroup = new osg::LOD;

    // 以最细级别的包围球半径确定切换距离
    const auto bounds = core::computeBoundingBox(tile.levels.front().mesh);
    const auto size = bounds.size();
    const float radius = 0.5f * std::sqrt(size[0] * size[0] + size[1] * size[1] + size[2] * size[2]);

    float minRange = 0.0f;
    for (size_t i = 0; i < tile.levels.size(); ++i) {
        const auto& level = tile.levels[i];
        osg::ref_ptr<osg::Geode> geode = new osg::Geode;
        geode->addDrawable(meshToGeometry(level.mesh));

        const bool last = i + 1 == tile.levels.size();
        const float maxRange = last ? FLT_MAX
                                    : radius * config_.rangeFactor * std::pow(2.0f, static_cast<float>(i));
        lodGroup->addChild(geode.get(), minRange, maxRange);
        minRange = maxRange;
    }

    if (config_.optimizeGeometry) {
        optimizeNode(lodGroup.get());
    }
    return lodGroup;
}

void StandardOsgExporter::optimizeNode(osg::Node* node) const {
    if (!node) return;

    // 只共享状态，不合并或改动几何，保证边界顶点原样写出
    osgUtil::Optimizer optimizer;
    optimizer.optimize(node, osgUtil::Optimizer::SHARE_DUPLICATE_STATE);
}

std::expected<void, OsgError> StandardOsgExporter::writeNode(osg::Node& node, const std::filesystem::path& path) const {
    if (!osgDB::writeNodeFile(node, path.string())) {
        spdlog::error("Failed to write {}", path.string());
        return std::unexpected(OsgError::WriteError);
    }
    spdlog::debug("Wrote {}", path.string());
    return {};
}

// 工厂函数实现
std::unique_ptr<IOsgExporter> createOsgExporter(const OsgExportConfig& config) {
    return std::make_unique<StandardOsgExporter>(config);
}

std::vector<std::string> getSupportedOsgFormats() noexcept {
    return {"obj", "osgb", "osgt"};
}

} // namespace seamlod::io
