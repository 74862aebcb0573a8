#pragma once

#include "gridcalc/formula/FormulaAst.hpp"
#include "gridcalc/formula/EvaluationContext.hpp"
#include "gridcalc/core/Expected.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace gridcalc {
namespace formula {

/**
 * @brief 已解析的公式：原文 + 表达式树 + 引用列表
 *
 * 只能通过 parse() 创建；表达式树解析后不可变，对象可移动不可复制。
 */
class Formula {
public:
    // 与 Excel 的公式长度上限一致
    static constexpr size_t kMaxFormulaLength = 8192;

    /**
     * @brief 解析公式文本
     *
     * 文本去掉首尾空白后必须以 '=' 开头，否则返回 InvalidSyntax。
     * 错误的 context 字段为公式原文。
     */
    static core::Result<Formula> parse(std::string_view text);

    Formula(Formula&&) noexcept = default;
    Formula& operator=(Formula&&) noexcept = default;
    Formula(const Formula&) = delete;
    Formula& operator=(const Formula&) = delete;

    const std::string& text() const { return text_; }
    const FormulaExpr& expr() const { return *expr_; }

    // 去重后的引用，供依赖图注册
    const std::vector<core::CellRef>& referencedCells() const { return cells_; }
    const std::vector<core::CellRange>& referencedRanges() const { return ranges_; }

    core::Result<core::CellValue> evaluate(const EvaluationContext& context) const;

private:
    Formula(std::string text, ExprPtr expr);

    std::string text_;
    ExprPtr expr_;
    std::vector<core::CellRef> cells_;
    std::vector<core::CellRange> ranges_;
};

}} // namespace gridcalc::formula
