#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <fmt/format.h>

namespace gridcalc {
namespace core {

/**
 * @brief GridCalc统一错误码
 *
 * 解析期错误（InvalidSyntax / InvalidRef）直接返回给写入方；
 * 求值期错误作为 CellValue::Error 存入单元格，不向写入方传播。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 公式解析错误 (20-39)
    InvalidSyntax = 20,
    InvalidRef = 21,

    // 公式求值错误 (40-59)
    UnknownFunction = 40,
    DivByZero = 41,
    TypeError = 42,
    CircularReference = 43,
    DepthLimitExceeded = 44,

    // 工作簿错误 (60-79)
    InvalidSheet = 60
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息，例如单元格地址

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码转单元格错误种类字符串（如 "div-by-zero"）
 *
 * 存入单元格的 CellValue::Error 使用该字符串，显示为 "#div-by-zero!"。
 */
const char* toKind(ErrorCode code) noexcept;

/**
 * @brief 种类字符串反查错误码，未知种类返回 std::nullopt
 */
std::optional<ErrorCode> fromKind(const std::string& kind) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace gridcalc::core
