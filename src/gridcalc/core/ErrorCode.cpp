#include "gridcalc/core/ErrorCode.hpp"
#include <cstring>

namespace gridcalc {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "Success";
        case ErrorCode::InvalidArgument:    return "Invalid argument";
        case ErrorCode::InternalError:      return "Internal error";
        case ErrorCode::InvalidSyntax:      return "Invalid syntax";
        case ErrorCode::InvalidRef:         return "Invalid reference";
        case ErrorCode::UnknownFunction:    return "Unknown function";
        case ErrorCode::DivByZero:          return "Division by zero";
        case ErrorCode::TypeError:          return "Type error";
        case ErrorCode::CircularReference:  return "Circular reference";
        case ErrorCode::DepthLimitExceeded: return "Dependency depth limit exceeded";
        case ErrorCode::InvalidSheet:       return "Invalid sheet";
        default:                            return "Unknown error";
    }
}

const char* toKind(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:                 return "ok";
        case ErrorCode::InvalidArgument:    return "invalid-argument";
        case ErrorCode::InternalError:      return "internal-error";
        case ErrorCode::InvalidSyntax:      return "invalid-syntax";
        case ErrorCode::InvalidRef:         return "invalid-ref";
        case ErrorCode::UnknownFunction:    return "unknown-function";
        case ErrorCode::DivByZero:          return "div-by-zero";
        case ErrorCode::TypeError:          return "type-error";
        case ErrorCode::CircularReference:  return "circular-reference";
        case ErrorCode::DepthLimitExceeded: return "depth-limit-exceeded";
        case ErrorCode::InvalidSheet:       return "invalid-sheet";
        default:                            return "unknown-error";
    }
}

std::optional<ErrorCode> fromKind(const std::string& kind) noexcept {
    static constexpr ErrorCode kAll[] = {
        ErrorCode::InvalidArgument, ErrorCode::InternalError,
        ErrorCode::InvalidSyntax, ErrorCode::InvalidRef,
        ErrorCode::UnknownFunction, ErrorCode::DivByZero,
        ErrorCode::TypeError, ErrorCode::CircularReference,
        ErrorCode::DepthLimitExceeded, ErrorCode::InvalidSheet
    };
    for (ErrorCode code : kAll) {
        if (std::strcmp(toKind(code), kind.c_str()) == 0) {
            return code;
        }
    }
    return std::nullopt;
}

}} // namespace gridcalc::core
