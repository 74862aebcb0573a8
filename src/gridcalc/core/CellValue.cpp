#include "gridcalc/core/CellValue.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include "gridcalc/utils/TimeUtils.hpp"
#include <fmt/format.h>

namespace gridcalc {
namespace core {

namespace {
const std::string kEmptyString;
}

CellValue CellValue::parseLiteral(std::string_view input) {
    if (input.empty()) {
        return CellValue::empty();
    }
    if (auto number = utils::CommonUtils::parseNumber(input)) {
        return CellValue::number(*number);
    }
    if (utils::CommonUtils::equalsIgnoreCase(input, "TRUE")) {
        return CellValue::boolean(true);
    }
    if (utils::CommonUtils::equalsIgnoreCase(input, "FALSE")) {
        return CellValue::boolean(false);
    }
    return CellValue::text(std::string(input));
}

const std::string& CellValue::textValue() const {
    if (auto* value = std::get_if<std::string>(&data_)) {
        return *value;
    }
    return kEmptyString;
}

double CellValue::numberValue() const {
    if (auto* value = std::get_if<double>(&data_)) {
        return *value;
    }
    return 0.0;
}

bool CellValue::booleanValue() const {
    if (auto* value = std::get_if<bool>(&data_)) {
        return *value;
    }
    return false;
}

const std::string& CellValue::errorKind() const {
    if (auto* value = std::get_if<ErrorValue>(&data_)) {
        return value->kind;
    }
    return kEmptyString;
}

int64_t CellValue::dateValue() const {
    if (auto* value = std::get_if<DateValue>(&data_)) {
        return value->days;
    }
    return 0;
}

std::optional<double> CellValue::asNumber() const {
    switch (type()) {
        case CellType::Number:
            return numberValue();
        case CellType::Boolean:
            return booleanValue() ? 1.0 : 0.0;
        case CellType::Text:
            return utils::CommonUtils::parseNumber(textValue());
        case CellType::Date:
            return static_cast<double>(dateValue());
        case CellType::Empty:
        case CellType::Error:
            break;
    }
    return std::nullopt;
}

bool CellValue::asBoolean() const {
    switch (type()) {
        case CellType::Boolean:
            return booleanValue();
        case CellType::Number:
            return numberValue() != 0.0;
        case CellType::Date:
            return dateValue() != 0;
        case CellType::Text: {
            if (utils::CommonUtils::equalsIgnoreCase(textValue(), "TRUE")) {
                return true;
            }
            auto number = utils::CommonUtils::parseNumber(textValue());
            return number && *number != 0.0;
        }
        case CellType::Empty:
        case CellType::Error:
            break;
    }
    return false;
}

std::string CellValue::toDisplayString() const {
    switch (type()) {
        case CellType::Empty:
            return std::string();
        case CellType::Text:
            return textValue();
        case CellType::Number:
            return utils::CommonUtils::formatNumber(numberValue());
        case CellType::Boolean:
            return booleanValue() ? "TRUE" : "FALSE";
        case CellType::Error:
            return fmt::format("#{}!", errorKind());
        case CellType::Date:
            return utils::TimeUtils::formatIsoDate(dateValue());
    }
    return std::string();
}

std::ostream& operator<<(std::ostream& os, const CellValue& value) {
    switch (value.type()) {
        case CellType::Empty:   return os << "Empty";
        case CellType::Text:    return os << "Text(\"" << value.textValue() << "\")";
        case CellType::Number:  return os << "Number(" << value.toDisplayString() << ")";
        case CellType::Boolean: return os << "Boolean(" << value.toDisplayString() << ")";
        case CellType::Error:   return os << "Error(" << value.errorKind() << ")";
        case CellType::Date:    return os << "Date(" << value.dateValue() << ")";
    }
    return os;
}

}} // namespace gridcalc::core
