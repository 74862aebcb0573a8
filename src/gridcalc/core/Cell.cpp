#include "gridcalc/core/Cell.hpp"
#include "gridcalc/utils/AddressParser.hpp"

namespace gridcalc {
namespace core {

bool CellStyle::isDefault() const {
    return *this == CellStyle();
}

bool CellStyle::operator==(const CellStyle& other) const {
    return number_format == other.number_format &&
           font_family == other.font_family &&
           font_size == other.font_size &&
           bold == other.bold &&
           italic == other.italic &&
           color == other.color &&
           background == other.background &&
           h_align == other.h_align &&
           v_align == other.v_align;
}

Cell Cell::parseInput(std::string_view input) {
    std::string_view trimmed = utils::AddressParser::trim(input);
    if (!trimmed.empty() && trimmed.front() == '=') {
        return withFormula(std::string(trimmed));
    }
    return withValue(CellValue::parseLiteral(input));
}

bool Cell::operator==(const Cell& other) const {
    return value == other.value && formula == other.formula && style == other.style;
}

}} // namespace gridcalc::core
