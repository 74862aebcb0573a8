#include "gridcalc/formula/FormulaAst.hpp"
#include <fmt/format.h>
#include <type_traits>

namespace gridcalc {
namespace formula {

const char* toString(BinaryOp op) noexcept {
    switch (op) {
        case BinaryOp::Add:    return "+";
        case BinaryOp::Sub:    return "-";
        case BinaryOp::Mul:    return "*";
        case BinaryOp::Div:    return "/";
        case BinaryOp::Pow:    return "^";
        case BinaryOp::Eq:     return "=";
        case BinaryOp::Ne:     return "<>";
        case BinaryOp::Lt:     return "<";
        case BinaryOp::Le:     return "<=";
        case BinaryOp::Gt:     return ">";
        case BinaryOp::Ge:     return ">=";
        case BinaryOp::Concat: return "&";
    }
    return "?";
}

const char* toString(UnaryOp op) noexcept {
    switch (op) {
        case UnaryOp::Neg:     return "-";
        case UnaryOp::Plus:    return "+";
        case UnaryOp::Percent: return "%";
    }
    return "?";
}

ExprPtr FormulaExpr::literal(core::CellValue value) {
    return std::make_unique<FormulaExpr>(FormulaExpr{LiteralExpr{std::move(value)}});
}

ExprPtr FormulaExpr::reference(const core::CellRef& ref) {
    return std::make_unique<FormulaExpr>(FormulaExpr{ReferenceExpr{ref}});
}

ExprPtr FormulaExpr::range(const core::CellRange& range) {
    return std::make_unique<FormulaExpr>(FormulaExpr{RangeExpr{range}});
}

ExprPtr FormulaExpr::call(std::string name, std::vector<ExprPtr> args) {
    return std::make_unique<FormulaExpr>(FormulaExpr{FunctionCallExpr{std::move(name), std::move(args)}});
}

ExprPtr FormulaExpr::binary(BinaryOp op, ExprPtr left, ExprPtr right) {
    return std::make_unique<FormulaExpr>(FormulaExpr{BinaryExpr{op, std::move(left), std::move(right)}});
}

ExprPtr FormulaExpr::unary(UnaryOp op, ExprPtr operand) {
    return std::make_unique<FormulaExpr>(FormulaExpr{UnaryExpr{op, std::move(operand)}});
}

void FormulaExpr::collectReferences(std::vector<core::CellRef>& cells,
                                    std::vector<core::CellRange>& ranges) const {
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ReferenceExpr>) {
            cells.push_back(n.ref);
        } else if constexpr (std::is_same_v<T, RangeExpr>) {
            ranges.push_back(n.range);
        } else if constexpr (std::is_same_v<T, FunctionCallExpr>) {
            for (const auto& arg : n.args) {
                arg->collectReferences(cells, ranges);
            }
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            n.left->collectReferences(cells, ranges);
            n.right->collectReferences(cells, ranges);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            n.operand->collectReferences(cells, ranges);
        }
    }, node);
}

namespace {

std::string quoteText(const std::string& text) {
    std::string result = "\"";
    for (char c : text) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += '"';
    return result;
}

} // namespace

std::string FormulaExpr::toString() const {
    return std::visit([](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, LiteralExpr>) {
            if (n.value.isText()) {
                return quoteText(n.value.textValue());
            }
            return n.value.toDisplayString();
        } else if constexpr (std::is_same_v<T, ReferenceExpr>) {
            return n.ref.toA1();
        } else if constexpr (std::is_same_v<T, RangeExpr>) {
            return n.range.toRangeString();
        } else if constexpr (std::is_same_v<T, FunctionCallExpr>) {
            std::string result = n.name + "(";
            for (size_t i = 0; i < n.args.size(); ++i) {
                if (i > 0) result += ",";
                result += n.args[i]->toString();
            }
            result += ")";
            return result;
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return fmt::format("({}{}{})", n.left->toString(), formula::toString(n.op), n.right->toString());
        } else {
            if (n.op == UnaryOp::Percent) {
                return fmt::format("({}%)", n.operand->toString());
            }
            return fmt::format("({}{})", formula::toString(n.op), n.operand->toString());
        }
    }, node);
}

}} // namespace gridcalc::formula
