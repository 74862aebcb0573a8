#include "gridcalc/formula/Formula.hpp"
#include "gridcalc/formula/FormulaParser.hpp"
#include "gridcalc/formula/Evaluator.hpp"
#include "gridcalc/utils/AddressParser.hpp"
#include "gridcalc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace gridcalc {
namespace formula {

Formula::Formula(std::string text, ExprPtr expr)
    : text_(std::move(text)), expr_(std::move(expr)) {
    expr_->collectReferences(cells_, ranges_);

    std::sort(cells_.begin(), cells_.end());
    cells_.erase(std::unique(cells_.begin(), cells_.end()), cells_.end());

    std::vector<core::CellRange> unique_ranges;
    for (const auto& range : ranges_) {
        if (std::find(unique_ranges.begin(), unique_ranges.end(), range) == unique_ranges.end()) {
            unique_ranges.push_back(range);
        }
    }
    ranges_ = std::move(unique_ranges);
}

core::Result<Formula> Formula::parse(std::string_view text) {
    std::string_view trimmed = utils::AddressParser::trim(text);

    if (trimmed.size() > kMaxFormulaLength) {
        return core::makeError(core::ErrorCode::InvalidSyntax,
                               fmt::format("Formula exceeds {} characters", kMaxFormulaLength),
                               std::string(trimmed.substr(0, 32)));
    }
    if (trimmed.empty() || trimmed.front() != '=') {
        return core::makeError(core::ErrorCode::InvalidSyntax,
                               "Formula must start with '='", std::string(trimmed));
    }

    auto expr = FormulaParser::parse(trimmed.substr(1));
    if (!expr) {
        core::Error error = expr.error();
        error.context = std::string(trimmed);
        FORMULA_DEBUG("Parse failed for '{}': {}", trimmed, error.message);
        return error;
    }
    return Formula(std::string(trimmed), std::move(expr).value());
}

core::Result<core::CellValue> Formula::evaluate(const EvaluationContext& context) const {
    Evaluator evaluator(context);
    return evaluator.evaluate(*expr_);
}

}} // namespace gridcalc::formula
