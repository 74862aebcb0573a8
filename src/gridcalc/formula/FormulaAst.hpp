#pragma once

#include "gridcalc/core/CellValue.hpp"
#include "gridcalc/core/CellAddress.hpp"
#include <memory>
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace gridcalc {
namespace formula {

enum class BinaryOp : uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Pow,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Concat
};

enum class UnaryOp : uint8_t {
    Neg,
    Plus,
    Percent
};

const char* toString(BinaryOp op) noexcept;
const char* toString(UnaryOp op) noexcept;

struct FormulaExpr;
using ExprPtr = std::unique_ptr<FormulaExpr>;

struct LiteralExpr {
    core::CellValue value;
};

struct ReferenceExpr {
    core::CellRef ref;
};

struct RangeExpr {
    core::CellRange range;
};

struct FunctionCallExpr {
    std::string name;            // 保留原始大小写，求值时不区分大小写解析
    std::vector<ExprPtr> args;
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
};

/**
 * @brief 公式表达式树节点
 *
 * 由 Formula 独占持有，解析完成后不再修改。
 */
struct FormulaExpr {
    using Node = std::variant<LiteralExpr, ReferenceExpr, RangeExpr, FunctionCallExpr, BinaryExpr, UnaryExpr>;

    Node node;

    static ExprPtr literal(core::CellValue value);
    static ExprPtr reference(const core::CellRef& ref);
    static ExprPtr range(const core::CellRange& range);
    static ExprPtr call(std::string name, std::vector<ExprPtr> args);
    static ExprPtr binary(BinaryOp op, ExprPtr left, ExprPtr right);
    static ExprPtr unary(UnaryOp op, ExprPtr operand);

    /**
     * @brief 收集表达式引用的全部单元格和区域（按出现顺序，可能重复）
     */
    void collectReferences(std::vector<core::CellRef>& cells, std::vector<core::CellRange>& ranges) const;

    /**
     * @brief 输出带完整括号的规范形式，例如 "((A1+2)*3)"
     */
    std::string toString() const;
};

}} // namespace gridcalc::formula
