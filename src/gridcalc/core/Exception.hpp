/**
 * @file Exception.hpp
 * @brief GridCalc异常类定义
 */

#ifndef GRIDCALC_EXCEPTION_HPP
#define GRIDCALC_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "gridcalc/core/ErrorCode.hpp"

namespace gridcalc {
namespace core {

/**
 * @brief GridCalc基础异常类
 *
 * 引擎内部使用 Result/Expected 传递错误，只有调用方显式要求时
 * （Expected::valueOrThrow，内部经由 throwError）才转换为异常。
 */
class GridCalcException : public std::runtime_error {
public:
    GridCalcException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }
    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（含错误码、源码位置和上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 公式相关异常（解析或求值）
 */
class FormulaException : public GridCalcException {
public:
    FormulaException(const std::string& message,
                     ErrorCode code = ErrorCode::InvalidSyntax,
                     const std::string& formula = "",
                     const char* file = nullptr, int line = 0);

    const std::string& getFormula() const { return formula_; }

private:
    std::string formula_;
};

/**
 * @brief 工作表相关异常
 */
class SheetException : public GridCalcException {
public:
    SheetException(const std::string& message,
                   const std::string& sheet_name = "",
                   ErrorCode code = ErrorCode::InvalidSheet,
                   const char* file = nullptr, int line = 0);

    const std::string& getSheetName() const { return sheet_name_; }

private:
    std::string sheet_name_;
};

/**
 * @brief 按错误码把 Error 转换成对应的异常抛出
 */
[[noreturn]] void throwError(const Error& error);

} // namespace core
} // namespace gridcalc

#endif // GRIDCALC_EXCEPTION_HPP
