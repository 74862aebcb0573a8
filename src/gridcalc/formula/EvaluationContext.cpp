#include "gridcalc/formula/EvaluationContext.hpp"

namespace gridcalc {
namespace formula {

std::vector<core::CellValue> EvaluationContext::getRangeValues(const core::CellRange& range) const {
    std::vector<core::CellValue> values;
    for (const auto& ref : range.cells()) {
        auto value = getCell(ref);
        if (value && !value->isEmpty()) {
            values.push_back(std::move(*value));
        }
    }
    return values;
}

}} // namespace gridcalc::formula
