/**
 * @file Exception.cpp
 * @brief GridCalc异常类实现
 */

#include "gridcalc/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace gridcalc {
namespace core {

GridCalcException::GridCalcException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string GridCalcException::getErrorCodeString() const {
    return toKind(error_code_);
}

std::string GridCalcException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void GridCalcException::addContext(const std::string& context) {
    context_.push_back(context);
}

FormulaException::FormulaException(const std::string& message,
                                   ErrorCode code,
                                   const std::string& formula,
                                   const char* file, int line)
    : GridCalcException(formula.empty() ? message : fmt::format("{} (formula: {})", message, formula),
                        code, file, line)
    , formula_(formula) {
}

SheetException::SheetException(const std::string& message,
                               const std::string& sheet_name,
                               ErrorCode code,
                               const char* file, int line)
    : GridCalcException(sheet_name.empty() ? message : fmt::format("{} (sheet: {})", message, sheet_name),
                        code, file, line)
    , sheet_name_(sheet_name) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidSyntax:
        case ErrorCode::InvalidRef:
        case ErrorCode::UnknownFunction:
        case ErrorCode::DivByZero:
        case ErrorCode::TypeError:
        case ErrorCode::CircularReference:
        case ErrorCode::DepthLimitExceeded:
            throw FormulaException(error.message, error.code, error.context);

        case ErrorCode::InvalidSheet:
            throw SheetException(error.message, error.context, error.code);

        default:
            throw GridCalcException(error.fullMessage(), error.code);
    }
}

}} // namespace gridcalc::core
