#include "gridcalc/formula/Evaluator.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include "gridcalc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace gridcalc {
namespace formula {

using core::CellValue;
using core::CellType;
using core::ErrorCode;

namespace {

// 运算符的数值操作数：Empty 视为 0，其余按 asNumber 转换
core::Result<double> toOperand(const CellValue& value) {
    if (value.isEmpty()) {
        return 0.0;
    }
    if (auto number = value.asNumber()) {
        return *number;
    }
    return core::makeError(ErrorCode::TypeError,
                           fmt::format("Cannot use '{}' as a number", value.toDisplayString()));
}

core::Result<CellValue> checkedNumber(double value) {
    if (!std::isfinite(value)) {
        return core::makeError(ErrorCode::InvalidArgument, "Numeric result is not a finite number");
    }
    return CellValue::number(value);
}

enum class CompareClass { Empty, Numeric, Text, Boolean };

CompareClass classify(const CellValue& value) {
    switch (value.type()) {
        case CellType::Number:
        case CellType::Date:
            return CompareClass::Numeric;
        case CellType::Text:
            return CompareClass::Text;
        case CellType::Boolean:
            return CompareClass::Boolean;
        default:
            return CompareClass::Empty;
    }
}

template<typename T>
int threeWay(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

// 同类值的三路比较；Empty 按 cls 取该类型的零值
int compareSameClass(CompareClass cls, const CellValue& left, const CellValue& right) {
    switch (cls) {
        case CompareClass::Numeric:
            return threeWay(left.asNumber().value_or(0.0), right.asNumber().value_or(0.0));
        case CompareClass::Text:
            return threeWay(utils::CommonUtils::toUpperAscii(left.textValue()),
                            utils::CommonUtils::toUpperAscii(right.textValue()));
        case CompareClass::Boolean:
            return threeWay(static_cast<int>(left.booleanValue()), static_cast<int>(right.booleanValue()));
        case CompareClass::Empty:
            break;
    }
    return 0;
}

bool isComparison(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq: case BinaryOp::Ne:
        case BinaryOp::Lt: case BinaryOp::Le:
        case BinaryOp::Gt: case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

// 整数参数：向零截断，并限制在 double 可精确表示的范围内
int64_t toInteger(double value) {
    constexpr double kLimit = 9007199254740992.0;  // 2^53
    if (std::isnan(value)) {
        return 0;
    }
    value = std::clamp(std::trunc(value), -kLimit, kLimit);
    return static_cast<int64_t>(value);
}

} // namespace

core::Result<CellValue> Evaluator::evaluate(const FormulaExpr& expr) const {
    return std::visit([this](const auto& node) -> core::Result<CellValue> {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, LiteralExpr>) {
            return node.value;
        } else if constexpr (std::is_same_v<T, ReferenceExpr>) {
            return evaluateReference(node);
        } else if constexpr (std::is_same_v<T, RangeExpr>) {
            if (node.range.isSingleCell()) {
                return evaluateReference(ReferenceExpr{node.range.start()});
            }
            return core::makeError(ErrorCode::InvalidArgument,
                                   fmt::format("Range {} cannot be used as a single value",
                                               node.range.toRangeString()));
        } else if constexpr (std::is_same_v<T, FunctionCallExpr>) {
            return evaluateCall(node);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return evaluateBinary(node);
        } else {
            return evaluateUnary(node);
        }
    }, expr.node);
}

core::Result<CellValue> Evaluator::evaluateReference(const ReferenceExpr& expr) const {
    auto value = context_.getCell(expr.ref);
    if (!value) {
        return CellValue::empty();
    }
    return std::move(*value);
}

core::Result<CellValue> Evaluator::evaluateBinary(const BinaryExpr& expr) const {
    if (expr.op == BinaryOp::Concat) {
        return applyBinary(expr.op, evaluateAsValue(*expr.left), evaluateAsValue(*expr.right));
    }

    auto left = evaluate(*expr.left);
    if (!left) {
        return left;
    }
    auto right = evaluate(*expr.right);
    if (!right) {
        return right;
    }
    return applyBinary(expr.op, left.value(), right.value());
}

CellValue Evaluator::evaluateAsValue(const FormulaExpr& expr) const {
    auto value = evaluate(expr);
    if (!value) {
        return CellValue::error(value.error().code);
    }
    return std::move(value).value();
}

core::Result<CellValue> Evaluator::evaluateUnary(const UnaryExpr& expr) const {
    auto operand = evaluate(*expr.operand);
    if (!operand) {
        return operand;
    }
    return applyUnary(expr.op, operand.value());
}

core::Result<CellValue> Evaluator::applyBinary(BinaryOp op, const CellValue& left, const CellValue& right) {
    // 连接不传播错误，错误值按 #kind! 形式拼入文本
    if (op == BinaryOp::Concat) {
        return CellValue::text(left.toDisplayString() + right.toDisplayString());
    }

    if (left.isError()) {
        return left;
    }
    if (right.isError()) {
        return right;
    }
    if (isComparison(op)) {
        return compare(op, left, right);
    }

    auto a = toOperand(left);
    if (!a) {
        return a.error();
    }
    auto b = toOperand(right);
    if (!b) {
        return b.error();
    }

    switch (op) {
        case BinaryOp::Add:
            return checkedNumber(a.value() + b.value());
        case BinaryOp::Sub:
            return checkedNumber(a.value() - b.value());
        case BinaryOp::Mul:
            return checkedNumber(a.value() * b.value());
        case BinaryOp::Div:
            if (b.value() == 0.0) {
                return core::makeError(ErrorCode::DivByZero, "Division by zero");
            }
            return checkedNumber(a.value() / b.value());
        case BinaryOp::Pow:
            return checkedNumber(std::pow(a.value(), b.value()));
        default:
            break;
    }
    return core::makeError(ErrorCode::InternalError,
                           fmt::format("Unhandled binary operator '{}'", toString(op)));
}

core::Result<CellValue> Evaluator::applyUnary(UnaryOp op, const CellValue& operand) {
    if (operand.isError()) {
        return operand;
    }
    if (op == UnaryOp::Plus) {
        return operand;
    }

    auto number = toOperand(operand);
    if (!number) {
        return number.error();
    }
    if (op == UnaryOp::Neg) {
        return CellValue::number(-number.value());
    }
    return CellValue::number(number.value() / 100.0);
}

CellValue Evaluator::compare(BinaryOp op, const CellValue& left, const CellValue& right) {
    CompareClass left_class = classify(left);
    CompareClass right_class = classify(right);

    // Empty 采用另一侧的类型
    if (left_class == CompareClass::Empty) left_class = right_class;
    if (right_class == CompareClass::Empty) right_class = left_class;

    if (left_class != right_class) {
        return CellValue::boolean(op == BinaryOp::Ne);
    }

    int order = compareSameClass(left_class, left, right);
    switch (op) {
        case BinaryOp::Eq: return CellValue::boolean(order == 0);
        case BinaryOp::Ne: return CellValue::boolean(order != 0);
        case BinaryOp::Lt: return CellValue::boolean(order < 0);
        case BinaryOp::Le: return CellValue::boolean(order <= 0);
        case BinaryOp::Gt: return CellValue::boolean(order > 0);
        case BinaryOp::Ge: return CellValue::boolean(order >= 0);
        default:           return CellValue::boolean(false);
    }
}

core::Result<CellValue> Evaluator::evaluateCall(const FunctionCallExpr& expr) const {
    const FunctionInfo* function = FunctionLibrary::lookup(expr.name);
    if (!function) {
        return core::makeError(ErrorCode::UnknownFunction,
                               fmt::format("Unknown function '{}'", expr.name));
    }

    const size_t argc = expr.args.size();
    if (argc < function->min_args || argc > function->max_args) {
        return core::makeError(ErrorCode::InvalidArgument,
                               fmt::format("{} does not accept {} argument(s)", function->name, argc));
    }

    if (function->id == Function::If) {
        return evaluateIf(expr);
    }

    if (function->flatten_ranges) {
        auto values = collectFlattened(expr.args, function->id == Function::Concatenate);
        if (!values) {
            return values.error();
        }
        const auto& list = values.value();
        switch (function->id) {
            case Function::Sum:         return FunctionLibrary::sum(list);
            case Function::Average:     return FunctionLibrary::average(list);
            case Function::Count:       return FunctionLibrary::count(list);
            case Function::CountA:      return FunctionLibrary::counta(list);
            case Function::Max:         return FunctionLibrary::max(list);
            case Function::Min:         return FunctionLibrary::min(list);
            case Function::And:         return FunctionLibrary::andOf(list);
            case Function::Or:          return FunctionLibrary::orOf(list);
            case Function::Concatenate: return FunctionLibrary::concatenate(list);
            default:                    break;
        }
        return core::makeError(ErrorCode::InternalError,
                               fmt::format("Function {} is not an aggregate", function->name));
    }

    auto args = collectScalars(expr.args);
    if (!args) {
        return args.error();
    }
    return callScalar(*function, args.value());
}

core::Result<CellValue> Evaluator::evaluateIf(const FunctionCallExpr& expr) const {
    auto condition = evaluate(*expr.args[0]);
    if (!condition) {
        return condition;
    }
    if (condition.value().isError()) {
        return condition;
    }

    // 只对选中的分支求值
    if (condition.value().asBoolean()) {
        return evaluate(*expr.args[1]);
    }
    if (expr.args.size() > 2) {
        return evaluate(*expr.args[2]);
    }
    return CellValue::boolean(false);
}

core::Result<std::vector<CellValue>> Evaluator::collectFlattened(const std::vector<ExprPtr>& args,
                                                                  bool errors_as_values) const {
    std::vector<CellValue> values;
    for (const auto& arg : args) {
        if (const auto* range = std::get_if<RangeExpr>(&arg->node)) {
            auto cells = context_.getRangeValues(range->range);
            values.insert(values.end(), std::make_move_iterator(cells.begin()),
                          std::make_move_iterator(cells.end()));
            continue;
        }
        if (errors_as_values) {
            values.push_back(evaluateAsValue(*arg));
            continue;
        }
        auto value = evaluate(*arg);
        if (!value) {
            return value.error();
        }
        values.push_back(std::move(value).value());
    }
    return values;
}

core::Result<std::vector<CellValue>> Evaluator::collectScalars(const std::vector<ExprPtr>& args) const {
    std::vector<CellValue> values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        auto value = evaluate(*arg);
        if (!value) {
            return value.error();
        }
        values.push_back(std::move(value).value());
    }
    return values;
}

core::Result<CellValue> Evaluator::callScalar(const FunctionInfo& function,
                                              const std::vector<CellValue>& args) const {
    // 标量函数的参数中出现错误值时原样返回
    for (const auto& arg : args) {
        if (arg.isError()) {
            return arg;
        }
    }

    auto numberArg = [&](size_t index, double fallback) -> core::Result<double> {
        if (index >= args.size()) {
            return fallback;
        }
        if (args[index].isEmpty()) {
            return 0.0;
        }
        if (auto number = args[index].asNumber()) {
            return *number;
        }
        return core::makeError(ErrorCode::InvalidArgument,
                               fmt::format("{} argument {} is not a number: '{}'",
                                           function.name, index + 1, args[index].toDisplayString()));
    };

    auto integerArg = [&](size_t index, double fallback) -> core::Result<int64_t> {
        auto number = numberArg(index, fallback);
        if (!number) {
            return number.error();
        }
        return toInteger(number.value());
    };

    auto textArg = [&](size_t index) { return args[index].toDisplayString(); };

    switch (function.id) {
        case Function::Abs:
            return FunctionLibrary::abs(args[0]);

        case Function::Round: {
            auto digits = integerArg(1, 0.0);
            if (!digits) return digits.error();
            int clamped = static_cast<int>(std::clamp<int64_t>(digits.value(), -400, 400));
            return FunctionLibrary::round(args[0], clamped);
        }

        case Function::Floor:
        case Function::Ceil: {
            auto significance = numberArg(1, 1.0);
            if (!significance) return significance.error();
            return function.id == Function::Floor
                ? FunctionLibrary::floor(args[0], significance.value())
                : FunctionLibrary::ceil(args[0], significance.value());
        }

        case Function::Sqrt:
            return FunctionLibrary::sqrt(args[0]);

        case Function::Power: {
            auto exponent = numberArg(1, 1.0);
            if (!exponent) return exponent.error();
            return FunctionLibrary::power(args[0], exponent.value());
        }

        case Function::Not:
            return FunctionLibrary::notOf(args[0]);

        case Function::True:
            return CellValue::boolean(true);

        case Function::False:
            return CellValue::boolean(false);

        case Function::Len:
            return FunctionLibrary::len(textArg(0));

        case Function::Upper:
            return FunctionLibrary::upper(textArg(0));

        case Function::Lower:
            return FunctionLibrary::lower(textArg(0));

        case Function::Trim:
            return FunctionLibrary::trim(textArg(0));

        case Function::Left:
        case Function::Right: {
            auto count = integerArg(1, 1.0);
            if (!count) return count.error();
            return function.id == Function::Left
                ? FunctionLibrary::left(textArg(0), count.value())
                : FunctionLibrary::right(textArg(0), count.value());
        }

        case Function::Mid: {
            auto start = integerArg(1, 1.0);
            if (!start) return start.error();
            auto count = integerArg(2, 0.0);
            if (!count) return count.error();
            return FunctionLibrary::mid(textArg(0), start.value(), count.value());
        }

        case Function::Find: {
            auto start = integerArg(2, 1.0);
            if (!start) return start.error();
            return FunctionLibrary::find(textArg(0), textArg(1), start.value());
        }

        case Function::Substitute: {
            std::optional<int64_t> instance;
            if (args.size() > 3) {
                auto parsed = integerArg(3, 0.0);
                if (!parsed) return parsed.error();
                instance = parsed.value();
            }
            return FunctionLibrary::substitute(textArg(0), textArg(1), textArg(2), instance);
        }

        case Function::Char: {
            auto code_point = integerArg(0, 0.0);
            if (!code_point) return code_point.error();
            return FunctionLibrary::charOf(code_point.value());
        }

        case Function::Code:
            return FunctionLibrary::code(textArg(0));

        case Function::Today:
            return FunctionLibrary::today(context_.now());

        case Function::Now:
            return FunctionLibrary::now(context_.now());

        default:
            break;
    }

    FORMULA_ERROR("Function {} has no scalar implementation", function.name);
    return core::makeError(ErrorCode::InternalError,
                           fmt::format("Function {} has no scalar implementation", function.name));
}

}} // namespace gridcalc::formula
