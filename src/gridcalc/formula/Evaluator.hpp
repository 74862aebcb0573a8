#pragma once

#include "gridcalc/formula/FormulaAst.hpp"
#include "gridcalc/formula/EvaluationContext.hpp"
#include "gridcalc/formula/FunctionLibrary.hpp"
#include "gridcalc/core/Expected.hpp"
#include <optional>
#include <vector>

namespace gridcalc {
namespace formula {

/**
 * @brief 表达式求值器
 *
 * 遍历表达式树，通过 EvaluationContext 读取单元格。
 * 返回错误的情况（未知函数、除零、类型错误等）由调用方存为单元格错误值；
 * 操作数本身是错误值时原样向上传递。
 *
 * 运算规则：
 * - 算术运算把两侧转换为数值，Empty 视为 0，非数值文本为 TypeError
 * - 比较运算：数值/日期按数值比较，文本不区分大小写按字典序比较，
 *   布尔 FALSE < TRUE；Empty 采用另一侧的类型；类型不同时永不相等
 * - & 连接两侧的显示字符串
 */
class Evaluator {
public:
    explicit Evaluator(const EvaluationContext& context) : context_(context) {}

    core::Result<core::CellValue> evaluate(const FormulaExpr& expr) const;

    /**
     * @brief 二元运算，供测试和求值器内部使用
     */
    static core::Result<core::CellValue> applyBinary(BinaryOp op, const core::CellValue& left,
                                                     const core::CellValue& right);

    static core::Result<core::CellValue> applyUnary(UnaryOp op, const core::CellValue& operand);

    /**
     * @brief 比较运算，结果总是 Boolean
     */
    static core::CellValue compare(BinaryOp op, const core::CellValue& left, const core::CellValue& right);

private:
    core::Result<core::CellValue> evaluateReference(const ReferenceExpr& expr) const;
    core::Result<core::CellValue> evaluateBinary(const BinaryExpr& expr) const;
    core::Result<core::CellValue> evaluateUnary(const UnaryExpr& expr) const;

    // 求值失败时转换为错误值，用于文本连接
    core::CellValue evaluateAsValue(const FormulaExpr& expr) const;
    core::Result<core::CellValue> evaluateCall(const FunctionCallExpr& expr) const;
    core::Result<core::CellValue> evaluateIf(const FunctionCallExpr& expr) const;

    /**
     * @brief 参数求值，区域展开为非空值序列（聚合类函数）
     *
     * errors_as_values 为 true 时，参数求值失败不中止，而是作为错误值放入序列。
     */
    core::Result<std::vector<core::CellValue>> collectFlattened(const std::vector<ExprPtr>& args,
                                                                bool errors_as_values = false) const;

    /**
     * @brief 参数逐个求值为标量；区域参数为 InvalidArgument
     */
    core::Result<std::vector<core::CellValue>> collectScalars(const std::vector<ExprPtr>& args) const;

    core::Result<core::CellValue> callScalar(const FunctionInfo& function,
                                             const std::vector<core::CellValue>& args) const;

    const EvaluationContext& context_;
};

}} // namespace gridcalc::formula
