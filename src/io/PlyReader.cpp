#include "PlyReader.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <bit>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <algorithm>

namespace seamlod::io {

namespace {

std::optional<PlyType> parseType(const std::string& name) {
    if (name == "char" || name == "int8") return PlyType::Int8;
    if (name == "uchar" || name == "uint8") return PlyType::UInt8;
    if (name == "short" || name == "int16") return PlyType::Int16;
    if (name == "ushort" || name == "uint16") return PlyType::UInt16;
    if (name == "int" || name == "int32") return PlyType::Int32;
    if (name == "uint" || name == "uint32") return PlyType::UInt32;
    if (name == "float" || name == "float32") return PlyType::Float32;
    if (name == "double" || name == "float64") return PlyType::Float64;
    return std::nullopt;
}

size_t typeSize(PlyType type) noexcept {
    switch (type) {
        case PlyType::Int8:
        case PlyType::UInt8: return 1;
        case PlyType::Int16:
        case PlyType::UInt16: return 2;
        case PlyType::Int32:
        case PlyType::UInt32:
        case PlyType::Float32: return 4;
        case PlyType::Float64: return 8;
    }
    return 0;
}

bool isIntegral(PlyType type) noexcept {
    return type != PlyType::Float32 && type != PlyType::Float64;
}

// 数值读取源：ASCII 按空白分词，二进制按小端字节
class ValueSource {
public:
    ValueSource(std::istream& stream, bool binary) : stream_(stream), binary_(binary) {}

    std::optional<double> next(PlyType type) {
        if (!binary_) {
            double value = 0.0;
            if (!(stream_ >> value)) {
                return std::nullopt;
            }
            return value;
        }

        std::array<char, 8> raw{};
        const size_t size = typeSize(type);
        if (!stream_.read(raw.data(), static_cast<std::streamsize>(size))) {
            return std::nullopt;
        }
        if constexpr (std::endian::native == std::endian::big) {
            std::reverse(raw.begin(), raw.begin() + size);
        }

        switch (type) {
            case PlyType::Int8: { int8_t v; std::memcpy(&v, raw.data(), 1); return v; }
            case PlyType::UInt8: { uint8_t v; std::memcpy(&v, raw.data(), 1); return v; }
            case PlyType::Int16: { int16_t v; std::memcpy(&v, raw.data(), 2); return v; }
            case PlyType::UInt16: { uint16_t v; std::memcpy(&v, raw.data(), 2); return v; }
            case PlyType::Int32: { int32_t v; std::memcpy(&v, raw.data(), 4); return v; }
            case PlyType::UInt32: { uint32_t v; std::memcpy(&v, raw.data(), 4); return v; }
            case PlyType::Float32: { float v; std::memcpy(&v, raw.data(), 4); return v; }
            case PlyType::Float64: { double v; std::memcpy(&v, raw.data(), 8); return v; }
        }
        return std::nullopt;
    }

private:
    std::istream& stream_;
    bool binary_;
};

// 顶点属性在输出中的去向
enum class Slot {
    None, X, Y, Z, NX, NY, NZ, R, G, B, A, U, V
};

Slot slotFor(const std::string& name) {
    if (name == "x") return Slot::X;
    if (name == "y") return Slot::Y;
    if (name == "z") return Slot::Z;
    if (name == "nx") return Slot::NX;
    if (name == "ny") return Slot::NY;
    if (name == "nz") return Slot::NZ;
    if (name == "red" || name == "r") return Slot::R;
    if (name == "green" || name == "g") return Slot::G;
    if (name == "blue" || name == "b") return Slot::B;
    if (name == "alpha" || name == "a") return Slot::A;
    if (name == "u" || name == "s" || name == "texture_u") return Slot::U;
    if (name == "v" || name == "t" || name == "texture_v") return Slot::V;
    return Slot::None;
}

} // namespace

std::string toString(PlyError error) {
    switch (error) {
        case PlyError::FileNotFound: return "file not found";
        case PlyError::InvalidFormat: return "invalid PLY format";
        case PlyError::UnsupportedFormat: return "unsupported PLY format";
        case PlyError::ReadError: return "read error";
        case PlyError::EmptyMesh: return "empty mesh";
    }
    return "unknown";
}

// StandardPlyReader 实现
std::expected<host::ExternalMesh, PlyError> StandardPlyReader::readPly(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(PlyError::FileNotFound);
    }

    // 解析头部
    auto metadataResult = parseHeader(file);
    if (!metadataResult) {
        return std::unexpected(metadataResult.error());
    }

    auto meshResult = readBody(file, *metadataResult);
    if (!meshResult) {
        return std::unexpected(meshResult.error());
    }

    if (meshResult->vertexCount() == 0 || meshResult->polygonCount() == 0) {
        return std::unexpected(PlyError::EmptyMesh);
    }

    spdlog::info("Read {}: {} vertices, {} faces ({})", filePath.string(),
                 meshResult->vertexCount(), meshResult->polygonCount(), metadataResult->format);
    return meshResult;
}

std::expected<PlyMetadata, PlyError> StandardPlyReader::readMetadata(const std::filesystem::path& filePath) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(PlyError::FileNotFound);
    }

    return parseHeader(file);
}

std::expected<PlyMetadata, PlyError> StandardPlyReader::parseHeader(std::istream& stream) const {
    PlyMetadata metadata;
    std::string line;

    // 读取第一行，应该是 "ply"
    if (!std::getline(stream, line) || (line != "ply" && line != "ply\r")) {
        return std::unexpected(PlyError::InvalidFormat);
    }

    bool ended = false;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "format") {
            iss >> metadata.format;
        } else if (keyword == "element") {
            PlyElement element;
            if (!(iss >> element.name >> element.count)) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            if (element.name == "vertex") {
                metadata.vertexCount = element.count;
            } else if (element.name == "face") {
                metadata.faceCount = element.count;
            }
            metadata.elements.push_back(std::move(element));
        } else if (keyword == "property") {
            if (metadata.elements.empty()) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            PlyProperty property;
            std::string type;
            iss >> type;
            if (type == "list") {
                std::string countType, itemType;
                iss >> countType >> itemType >> property.name;
                auto ct = parseType(countType);
                auto it = parseType(itemType);
                if (!ct || !it) {
                    return std::unexpected(PlyError::InvalidFormat);
                }
                property.isList = true;
                property.countType = *ct;
                property.type = *it;
            } else {
                auto t = parseType(type);
                if (!t) {
                    return std::unexpected(PlyError::InvalidFormat);
                }
                property.type = *t;
                iss >> property.name;
            }

            if (metadata.elements.back().name == "vertex") {
                const Slot slot = slotFor(property.name);
                if (slot == Slot::NX || slot == Slot::NY || slot == Slot::NZ) {
                    metadata.hasNormals = true;
                } else if (slot == Slot::R || slot == Slot::G || slot == Slot::B || slot == Slot::A) {
                    metadata.hasColors = true;
                } else if (slot == Slot::U || slot == Slot::V) {
                    metadata.hasTexCoords = true;
                }
            }
            metadata.elements.back().properties.push_back(std::move(property));
        } else if (keyword == "end_header") {
            ended = true;
            break;
        }
    }

    if (!ended) {
        return std::unexpected(PlyError::InvalidFormat);
    }
    if (metadata.format != "ascii" && metadata.format != "binary_little_endian") {
        return std::unexpected(PlyError::UnsupportedFormat);
    }
    return metadata;
}

std::expected<host::ExternalMesh, PlyError> StandardPlyReader::readBody(std::istream& stream, const PlyMetadata& metadata) const {
    host::ExternalMesh mesh;
    ValueSource source(stream, metadata.format != "ascii");

    // 逐顶点 UV，读完后展开为逐环 UV
    std::vector<float> vertexUvs;

    for (const auto& element : metadata.elements) {
        if (element.name == "vertex") {
            mesh.coords.reserve(element.count * 3);
            if (metadata.hasNormals) {
                mesh.normals.reserve(element.count * 3);
            }
            if (metadata.hasColors) {
                mesh.colors.reserve(element.count * 4);
            }

            for (size_t i = 0; i < element.count; ++i) {
                float pos[3] = {0, 0, 0};
                float nrm[3] = {0, 0, 0};
                float rgba[4] = {1, 1, 1, 1};
                float uv[2] = {0, 0};

                for (const auto& property : element.properties) {
                    if (property.isList) {
                        auto n = source.next(property.countType);
                        if (!n) {
                            return std::unexpected(PlyError::ReadError);
                        }
                        for (size_t k = 0; k < static_cast<size_t>(*n); ++k) {
                            if (!source.next(property.type)) {
                                return std::unexpected(PlyError::ReadError);
                            }
                        }
                        continue;
                    }

                    auto value = source.next(property.type);
                    if (!value) {
                        return std::unexpected(PlyError::ReadError);
                    }
                    const float v = static_cast<float>(*value);
                    // 整数颜色按 0..255 归一化
                    const float c = isIntegral(property.type) ? v / 255.0f : v;
                    switch (slotFor(property.name)) {
                        case Slot::X: pos[0] = v; break;
                        case Slot::Y: pos[1] = v; break;
                        case Slot::Z: pos[2] = v; break;
                        case Slot::NX: nrm[0] = v; break;
                        case Slot::NY: nrm[1] = v; break;
                        case Slot::NZ: nrm[2] = v; break;
                        case Slot::R: rgba[0] = c; break;
                        case Slot::G: rgba[1] = c; break;
                        case Slot::B: rgba[2] = c; break;
                        case Slot::A: rgba[3] = c; break;
                        case Slot::U: uv[0] = v; break;
                        case Slot::V: uv[1] = v; break;
                        case Slot::None: break;
                    }
                }

                mesh.coords.insert(mesh.coords.end(), {pos[0], pos[1], pos[2]});
                if (metadata.hasNormals) {
                    mesh.normals.insert(mesh.normals.end(), {nrm[0], nrm[1], nrm[2]});
                }
                if (metadata.hasColors) {
                    mesh.colors.insert(mesh.colors.end(), {rgba[0], rgba[1], rgba[2], rgba[3]});
                }
                if (metadata.hasTexCoords) {
                    vertexUvs.insert(vertexUvs.end(), {uv[0], uv[1]});
                }
            }
        } else if (element.name == "face") {
            mesh.loopStarts.reserve(element.count);
            mesh.loopTotals.reserve(element.count);
            mesh.loopVertices.reserve(element.count * 3);

            for (size_t i = 0; i < element.count; ++i) {
                for (const auto& property : element.properties) {
                    const bool isIndexList = property.isList &&
                        (property.name == "vertex_indices" || property.name == "vertex_index");
                    if (!property.isList) {
                        if (!source.next(property.type)) {
                            return std::unexpected(PlyError::ReadError);
                        }
                        continue;
                    }

                    auto n = source.next(property.countType);
                    if (!n || *n < 0) {
                        return std::unexpected(PlyError::ReadError);
                    }
                    const size_t count = static_cast<size_t>(*n);
                    if (isIndexList) {
                        mesh.loopStarts.push_back(static_cast<uint32_t>(mesh.loopVertices.size()));
                        mesh.loopTotals.push_back(static_cast<uint32_t>(count));
                    }
                    for (size_t k = 0; k < count; ++k) {
                        auto index = source.next(property.type);
                        if (!index) {
                            return std::unexpected(PlyError::ReadError);
                        }
                        if (isIndexList) {
                            if (*index < 0) {
                                return std::unexpected(PlyError::InvalidFormat);
                            }
                            mesh.loopVertices.push_back(static_cast<uint32_t>(*index));
                        }
                    }
                }
            }
        } else {
            // 跳过其它元素
            for (size_t i = 0; i < element.count; ++i) {
                for (const auto& property : element.properties) {
                    size_t count = 1;
                    if (property.isList) {
                        auto n = source.next(property.countType);
                        if (!n) {
                            return std::unexpected(PlyError::ReadError);
                        }
                        count = static_cast<size_t>(*n);
                    }
                    for (size_t k = 0; k < count; ++k) {
                        if (!source.next(property.type)) {
                            return std::unexpected(PlyError::ReadError);
                        }
                    }
                }
            }
        }
    }

    if (!vertexUvs.empty()) {
        mesh.loopUvs.reserve(mesh.loopVertices.size() * 2);
        for (const uint32_t v : mesh.loopVertices) {
            if (size_t(v) * 2 + 1 >= vertexUvs.size()) {
                return std::unexpected(PlyError::InvalidFormat);
            }
            mesh.loopUvs.push_back(vertexUvs[size_t(v) * 2]);
            mesh.loopUvs.push_back(vertexUvs[size_t(v) * 2 + 1]);
        }
    }

    return mesh;
}

// 工厂函数
std::unique_ptr<IPlyReader> createPlyReader() {
    return std::make_unique<StandardPlyReader>();
}

} // namespace seamlod::io
