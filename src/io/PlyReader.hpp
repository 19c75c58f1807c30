#pragma once

#include "host/HostMesh.hpp"
#include <string>
#include <vector>
#include <expected>
#include <filesystem>
#include <memory>

namespace seamlod::io {

// PLY 读取错误类型
enum class PlyError {
    FileNotFound,
    InvalidFormat,
    UnsupportedFormat,
    ReadError,
    EmptyMesh
};

[[nodiscard]] std::string toString(PlyError error);

// PLY 标量类型
enum class PlyType {
    Int8, UInt8, Int16, UInt16, Int32, UInt32, Float32, Float64
};

// 单个属性；列表属性带有计数类型
struct PlyProperty {
    std::string name;
    PlyType type{PlyType::Float32};
    bool isList{false};
    PlyType countType{PlyType::UInt8};
};

struct PlyElement {
    std::string name;
    size_t count{0};
    std::vector<PlyProperty> properties;
};

// PLY 文件元数据
struct PlyMetadata {
    size_t vertexCount{0};
    size_t faceCount{0};
    bool hasNormals{false};
    bool hasColors{false};
    bool hasTexCoords{false};
    std::string format;  // ascii, binary_little_endian, binary_big_endian
    std::vector<PlyElement> elements;
};

// PLY 读取器接口
class IPlyReader {
public:
    virtual ~IPlyReader() = default;

    // 读取 PLY 文件为宿主网格表示
    virtual std::expected<host::ExternalMesh, PlyError>
    readPly(const std::filesystem::path& filePath) const = 0;

    // 读取元数据（不加载完整网格）
    virtual std::expected<PlyMetadata, PlyError>
    readMetadata(const std::filesystem::path& filePath) const = 0;
};

// 标准 PLY 读取器：ASCII 与小端二进制
class StandardPlyReader : public IPlyReader {
public:
    StandardPlyReader() = default;

    std::expected<host::ExternalMesh, PlyError>
    readPly(const std::filesystem::path& filePath) const override;

    std::expected<PlyMetadata, PlyError>
    readMetadata(const std::filesystem::path& filePath) const override;

private:
    // 解析 PLY 头部
    std::expected<PlyMetadata, PlyError>
    parseHeader(std::istream& stream) const;

    // 按头部声明的顺序读取所有元素
    std::expected<host::ExternalMesh, PlyError>
    readBody(std::istream& stream, const PlyMetadata& metadata) const;
};

// 工厂函数
[[nodiscard]] std::unique_ptr<IPlyReader> createPlyReader();

} // namespace seamlod::io
