#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace seamlod::core {

// 错误分类
enum class ErrorCode {
    InvalidGeometry,       // 输入网格非法（致命）
    DegenerateBounds,      // 水平方向没有可用范围（致命）
    DecimationInfeasible,  // 单个 LOD 级别无法达到（可恢复）
    CancelledByUser,       // 协作式取消
    InvalidConfig,
    IoError,
    Internal               // 阶段内抛出的未预期异常
};

// 错误信息：错误码 + 来源组件 + 描述
struct Error {
    ErrorCode code{ErrorCode::InvalidGeometry};
    std::string component;
    std::string message;

    [[nodiscard]] bool fatal() const noexcept {
        return code != ErrorCode::DecimationInfeasible && code != ErrorCode::CancelledByUser;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error>
makeError(ErrorCode code, std::string component, std::string message) {
    return std::unexpected(Error{code, std::move(component), std::move(message)});
}

[[nodiscard]] constexpr std::string_view toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidGeometry: return "InvalidGeometry";
        case ErrorCode::DegenerateBounds: return "DegenerateBoundsError";
        case ErrorCode::DecimationInfeasible: return "DecimationInfeasible";
        case ErrorCode::CancelledByUser: return "CancelledByUser";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace seamlod::core
