#include "gridcalc/utils/CommonUtils.hpp"
#include "gridcalc/utils/AddressParser.hpp"
#include <fast_float/fast_float.h>
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <system_error>

namespace gridcalc {
namespace utils {

std::optional<double> CommonUtils::parseNumber(std::string_view text) {
    std::string_view trimmed = AddressParser::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* first = trimmed.data();
    const char* last = trimmed.data() + trimmed.size();
    auto result = fast_float::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string CommonUtils::formatNumber(double value) {
    if (value == 0.0) {
        return "0";  // 不显示 -0
    }
    return fmt::format("{}", value);
}

std::string CommonUtils::toUpperAscii(std::string_view text) {
    std::string result(text);
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string CommonUtils::toLowerAscii(std::string_view text) {
    std::string result(text);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

bool CommonUtils::equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}} // namespace gridcalc::utils
