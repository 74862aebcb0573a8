#include "gridcalc/formula/FunctionLibrary.hpp"
#include "gridcalc/utils/CommonUtils.hpp"
#include "gridcalc/utils/TimeUtils.hpp"
#include <utf8.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace gridcalc {
namespace formula {

using core::CellValue;
using core::ErrorCode;

namespace {

constexpr size_t V = FunctionLibrary::kVariadic;

// 与 Function 枚举顺序一致
const FunctionInfo kFunctions[] = {
    {Function::Sum,         "SUM",         0, V, true},
    {Function::Average,     "AVERAGE",     0, V, true},
    {Function::Count,       "COUNT",       0, V, true},
    {Function::CountA,      "COUNTA",      0, V, true},
    {Function::Max,         "MAX",         0, V, true},
    {Function::Min,         "MIN",         0, V, true},
    {Function::Abs,         "ABS",         1, 1, false},
    {Function::Round,       "ROUND",       1, 2, false},
    {Function::Floor,       "FLOOR",       1, 2, false},
    {Function::Ceil,        "CEIL",        1, 2, false},
    {Function::Sqrt,        "SQRT",        1, 1, false},
    {Function::Power,       "POWER",       2, 2, false},
    {Function::If,          "IF",          2, 3, false},
    {Function::And,         "AND",         0, V, true},
    {Function::Or,          "OR",          0, V, true},
    {Function::Not,         "NOT",         1, 1, false},
    {Function::True,        "TRUE",        0, 0, false},
    {Function::False,       "FALSE",       0, 0, false},
    {Function::Concatenate, "CONCATENATE", 0, V, true},
    {Function::Len,         "LEN",         1, 1, false},
    {Function::Upper,       "UPPER",       1, 1, false},
    {Function::Lower,       "LOWER",       1, 1, false},
    {Function::Trim,        "TRIM",        1, 1, false},
    {Function::Left,        "LEFT",        1, 2, false},
    {Function::Right,       "RIGHT",       1, 2, false},
    {Function::Mid,         "MID",         3, 3, false},
    {Function::Find,        "FIND",        2, 3, false},
    {Function::Substitute,  "SUBSTITUTE",  3, 4, false},
    {Function::Char,        "CHAR",        1, 1, false},
    {Function::Code,        "CODE",        1, 1, false},
    {Function::Today,       "TODAY",       0, 0, false},
    {Function::Now,         "NOW",         0, 0, false},
};

struct Synonym {
    const char* alias;
    Function target;
};

const Synonym kSynonyms[] = {
    {"AVG",     Function::Average},
    {"CEILING", Function::Ceil},
    {"CONCAT",  Function::Concatenate},
    {"SEARCH",  Function::Find},
    {"REPLACE", Function::Substitute},
    {"POW",     Function::Power},
    {"LENGTH",  Function::Len},
};

core::Error invalidText() {
    return core::makeError(ErrorCode::InvalidArgument, "Text is not valid UTF-8");
}

std::optional<std::u32string> decodeUtf8(const std::string& text) {
    if (!utf8::is_valid(text.begin(), text.end())) {
        return std::nullopt;
    }
    std::u32string result;
    utf8::utf8to32(text.begin(), text.end(), std::back_inserter(result));
    return result;
}

std::string encodeUtf8(std::u32string::const_iterator first, std::u32string::const_iterator last) {
    std::string result;
    utf8::utf32to8(first, last, std::back_inserter(result));
    return result;
}

// ========== 大小写映射 ==========
// 覆盖 ASCII、Latin-1、Latin Extended-A、希腊文和西里尔文基本区，其余码点不变

char32_t upperOf(char32_t c) {
    if (c >= U'a' && c <= U'z') return c - 0x20;
    if (c < 0x80) return c;
    if (c == 0xB5) return 0x39C;
    if (c >= 0xE0 && c <= 0xFE && c != 0xF7) return c - 0x20;
    if (c == 0xFF) return 0x178;
    if (c == 0x131) return U'I';
    if (c == 0x17F) return U'S';
    if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) return (c & 1) ? c - 1 : c;
    if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) return (c & 1) ? c : c - 1;
    if (c == 0x3C2) return 0x3A3;
    if (c >= 0x3B1 && c <= 0x3CB) return c - 0x20;
    if (c == 0x3AC) return 0x386;
    if (c >= 0x3AD && c <= 0x3AF) return c - 0x25;
    if (c == 0x3CC) return 0x38C;
    if (c == 0x3CD || c == 0x3CE) return c - 0x3F;
    if (c >= 0x430 && c <= 0x44F) return c - 0x20;
    if (c >= 0x450 && c <= 0x45F) return c - 0x50;
    return c;
}

char32_t lowerOf(char32_t c) {
    if (c >= U'A' && c <= U'Z') return c + 0x20;
    if (c < 0x80) return c;
    if (c >= 0xC0 && c <= 0xDE && c != 0xD7) return c + 0x20;
    if (c == 0x178) return 0xFF;
    if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) return (c & 1) ? c : c + 1;
    if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) return (c & 1) ? c + 1 : c;
    if (c >= 0x391 && c <= 0x3AB && c != 0x3A2) return c + 0x20;
    if (c == 0x386) return 0x3AC;
    if (c >= 0x388 && c <= 0x38A) return c + 0x25;
    if (c == 0x38C) return 0x3CC;
    if (c == 0x38E || c == 0x38F) return c + 0x3F;
    if (c >= 0x410 && c <= 0x42F) return c + 0x20;
    if (c >= 0x400 && c <= 0x40F) return c + 0x50;
    return c;
}

bool isCased(char32_t c) {
    return upperOf(c) != c || lowerOf(c) != c || c == 0xDF || c == 0x130 || c == 0x149;
}

std::u32string toUpperText(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    for (char32_t c : text) {
        if (c == 0xDF) {
            result += U"SS";
        } else if (c == 0x149) {
            result += U"\u02BCN";
        } else {
            result += upperOf(c);
        }
    }
    return result;
}

std::u32string toLowerText(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char32_t c = text[i];
        if (c == 0x130) {
            result += U"i\u0307";
        } else if (c == 0x3A3) {
            // 词尾的 Σ 小写为 ς
            bool after_letter = i > 0 && isCased(text[i - 1]);
            bool before_letter = i + 1 < text.size() && isCased(text[i + 1]);
            result += (after_letter && !before_letter) ? char32_t(0x3C2) : char32_t(0x3C3);
        } else {
            result += lowerOf(c);
        }
    }
    return result;
}

// 数值结果不是有限数时存为 invalid-argument 错误值
CellValue finiteNumber(double value) {
    if (!std::isfinite(value)) {
        return CellValue::error(ErrorCode::InvalidArgument);
    }
    return CellValue::number(value);
}

// 按 significance 取整；商溢出时 number 在该精度下已是整数，原样返回
template<typename F>
CellValue roundToMultiple(double number, double significance, F&& rounding) {
    double quotient = number / significance;
    if (std::isfinite(number) && std::isfinite(significance) && !std::isfinite(quotient)) {
        return finiteNumber(number);
    }
    return finiteNumber(rounding(quotient) * significance);
}

// 数值聚合的公共折叠：只统计可转换为数值的值
template<typename F>
size_t foldNumbers(const std::vector<CellValue>& values, F&& func) {
    size_t counted = 0;
    for (const auto& value : values) {
        if (auto number = value.asNumber()) {
            func(*number);
            ++counted;
        }
    }
    return counted;
}

} // namespace

const FunctionInfo* FunctionLibrary::lookup(std::string_view name) {
    for (const auto& function : kFunctions) {
        if (utils::CommonUtils::equalsIgnoreCase(name, function.name)) {
            return &function;
        }
    }
    for (const auto& synonym : kSynonyms) {
        if (utils::CommonUtils::equalsIgnoreCase(name, synonym.alias)) {
            return &info(synonym.target);
        }
    }
    return nullptr;
}

const FunctionInfo& FunctionLibrary::info(Function function) {
    return kFunctions[static_cast<size_t>(function)];
}

// ========== 聚合函数 ==========

CellValue FunctionLibrary::sum(const std::vector<CellValue>& values) {
    double total = 0.0;
    foldNumbers(values, [&](double n) { total += n; });
    return finiteNumber(total);
}

CellValue FunctionLibrary::average(const std::vector<CellValue>& values) {
    double total = 0.0;
    size_t counted = foldNumbers(values, [&](double n) { total += n; });
    if (counted == 0) {
        return CellValue::number(0.0);
    }
    return finiteNumber(total / static_cast<double>(counted));
}

CellValue FunctionLibrary::count(const std::vector<CellValue>& values) {
    auto counted = std::count_if(values.begin(), values.end(),
                                 [](const CellValue& v) { return v.isNumber(); });
    return CellValue::number(static_cast<double>(counted));
}

CellValue FunctionLibrary::counta(const std::vector<CellValue>& values) {
    auto counted = std::count_if(values.begin(), values.end(),
                                 [](const CellValue& v) { return !v.isEmpty(); });
    return CellValue::number(static_cast<double>(counted));
}

CellValue FunctionLibrary::max(const std::vector<CellValue>& values) {
    double result = 0.0;
    size_t counted = foldNumbers(values, [&, first = true](double n) mutable {
        result = first ? n : std::max(result, n);
        first = false;
    });
    if (counted == 0) {
        return CellValue::error("no-numeric-values");
    }
    return finiteNumber(result);
}

CellValue FunctionLibrary::min(const std::vector<CellValue>& values) {
    double result = 0.0;
    size_t counted = foldNumbers(values, [&, first = true](double n) mutable {
        result = first ? n : std::min(result, n);
        first = false;
    });
    if (counted == 0) {
        return CellValue::error("no-numeric-values");
    }
    return finiteNumber(result);
}

// ========== 数学函数 ==========

CellValue FunctionLibrary::abs(const CellValue& value) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    return finiteNumber(std::fabs(*number));
}

core::Result<CellValue> FunctionLibrary::round(const CellValue& value, int digits) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    // 超过 double 有效精度时舍入没有意义
    if (digits > 15) {
        return finiteNumber(*number);
    }
    digits = std::max(digits, -308);
    double multiplier = std::pow(10.0, digits);
    double scaled = *number * multiplier;
    if (std::isfinite(*number) && !std::isfinite(scaled)) {
        return finiteNumber(*number);
    }
    return finiteNumber(std::round(scaled) / multiplier);
}

CellValue FunctionLibrary::sqrt(const CellValue& value) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    if (*number < 0.0) {
        return CellValue::error("negative-sqrt");
    }
    return finiteNumber(std::sqrt(*number));
}

core::Result<CellValue> FunctionLibrary::floor(const CellValue& value, double significance) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    if (significance == 0.0) {
        return core::makeError(ErrorCode::DivByZero, "FLOOR significance is zero");
    }
    return roundToMultiple(*number, significance, [](double q) { return std::floor(q); });
}

core::Result<CellValue> FunctionLibrary::ceil(const CellValue& value, double significance) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    if (significance == 0.0) {
        return core::makeError(ErrorCode::DivByZero, "CEIL significance is zero");
    }
    return roundToMultiple(*number, significance, [](double q) { return std::ceil(q); });
}

core::Result<CellValue> FunctionLibrary::power(const CellValue& value, double exponent) {
    auto number = value.asNumber();
    if (!number) {
        return value;
    }
    return finiteNumber(std::pow(*number, exponent));
}

// ========== 逻辑函数 ==========

CellValue FunctionLibrary::andOf(const std::vector<CellValue>& values) {
    bool result = true;
    for (const auto& value : values) {
        if (value.isError()) {
            return value;
        }
        result = result && value.asBoolean();
    }
    return CellValue::boolean(result);
}

CellValue FunctionLibrary::orOf(const std::vector<CellValue>& values) {
    bool result = false;
    for (const auto& value : values) {
        if (value.isError()) {
            return value;
        }
        result = result || value.asBoolean();
    }
    return CellValue::boolean(result);
}

CellValue FunctionLibrary::notOf(const CellValue& value) {
    if (value.isError()) {
        return value;
    }
    return CellValue::boolean(!value.asBoolean());
}

// ========== 文本函数 ==========

CellValue FunctionLibrary::concatenate(const std::vector<CellValue>& values) {
    std::string result;
    for (const auto& value : values) {
        result += value.toDisplayString();
    }
    return CellValue::text(std::move(result));
}

core::Result<CellValue> FunctionLibrary::len(const std::string& text) {
    if (!utf8::is_valid(text.begin(), text.end())) {
        return invalidText();
    }
    auto length = utf8::distance(text.begin(), text.end());
    return CellValue::number(static_cast<double>(length));
}

CellValue FunctionLibrary::upper(const std::string& text) {
    auto decoded = decodeUtf8(text);
    if (!decoded) {
        return CellValue::text(utils::CommonUtils::toUpperAscii(text));
    }
    auto mapped = toUpperText(*decoded);
    return CellValue::text(encodeUtf8(mapped.begin(), mapped.end()));
}

CellValue FunctionLibrary::lower(const std::string& text) {
    auto decoded = decodeUtf8(text);
    if (!decoded) {
        return CellValue::text(utils::CommonUtils::toLowerAscii(text));
    }
    auto mapped = toLowerText(*decoded);
    return CellValue::text(encodeUtf8(mapped.begin(), mapped.end()));
}

CellValue FunctionLibrary::trim(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (c == ' ') {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return CellValue::text(std::move(result));
}

core::Result<CellValue> FunctionLibrary::left(const std::string& text, int64_t count) {
    if (count < 0) {
        return core::makeError(ErrorCode::InvalidArgument, "LEFT count must not be negative");
    }
    auto decoded = decodeUtf8(text);
    if (!decoded) {
        return invalidText();
    }
    size_t n = std::min<size_t>(static_cast<size_t>(count), decoded->size());
    return CellValue::text(encodeUtf8(decoded->cbegin(), decoded->cbegin() + n));
}

core::Result<CellValue> FunctionLibrary::right(const std::string& text, int64_t count) {
    if (count < 0) {
        return core::makeError(ErrorCode::InvalidArgument, "RIGHT count must not be negative");
    }
    auto decoded = decodeUtf8(text);
    if (!decoded) {
        return invalidText();
    }
    size_t n = std::min<size_t>(static_cast<size_t>(count), decoded->size());
    return CellValue::text(encodeUtf8(decoded->cend() - n, decoded->cend()));
}

core::Result<CellValue> FunctionLibrary::mid(const std::string& text, int64_t start, int64_t count) {
    if (start < 1) {
        return core::makeError(ErrorCode::InvalidArgument, "MID start must be at least 1");
    }
    if (count < 0) {
        return core::makeError(ErrorCode::InvalidArgument, "MID count must not be negative");
    }
    auto decoded = decodeUtf8(text);
    if (!decoded) {
        return invalidText();
    }
    size_t first = static_cast<size_t>(start - 1);
    if (first >= decoded->size()) {
        return CellValue::text(std::string());
    }
    size_t n = std::min<size_t>(static_cast<size_t>(count), decoded->size() - first);
    return CellValue::text(encodeUtf8(decoded->cbegin() + first, decoded->cbegin() + first + n));
}

core::Result<CellValue> FunctionLibrary::find(const std::string& needle, const std::string& haystack, int64_t start) {
    auto decoded_haystack = decodeUtf8(haystack);
    auto decoded_needle = decodeUtf8(needle);
    if (!decoded_haystack || !decoded_needle) {
        return invalidText();
    }
    if (start < 1 || static_cast<uint64_t>(start) > decoded_haystack->size() + 1) {
        return core::makeError(ErrorCode::InvalidArgument, "FIND start is out of range");
    }
    size_t pos = decoded_haystack->find(*decoded_needle, static_cast<size_t>(start - 1));
    if (pos == std::u32string::npos) {
        return core::makeError(ErrorCode::InvalidArgument, "FIND text not found");
    }
    return CellValue::number(static_cast<double>(pos + 1));
}

core::Result<CellValue> FunctionLibrary::substitute(const std::string& text, const std::string& old_text,
                                                    const std::string& new_text, std::optional<int64_t> instance) {
    if (instance && *instance < 1) {
        return core::makeError(ErrorCode::InvalidArgument, "SUBSTITUTE instance must be at least 1");
    }
    if (old_text.empty()) {
        return CellValue::text(text);
    }

    std::string result;
    size_t pos = 0;
    int64_t occurrence = 0;
    while (true) {
        size_t found = text.find(old_text, pos);
        if (found == std::string::npos) {
            break;
        }
        ++occurrence;
        result.append(text, pos, found - pos);
        if (!instance || *instance == occurrence) {
            result += new_text;
        } else {
            result += old_text;
        }
        pos = found + old_text.size();
        if (instance && *instance == occurrence) {
            break;
        }
    }
    result.append(text, pos, std::string::npos);
    return CellValue::text(std::move(result));
}

core::Result<CellValue> FunctionLibrary::charOf(int64_t code_point) {
    if (code_point < 1 || code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return core::makeError(ErrorCode::InvalidArgument, "CHAR code point is out of range");
    }
    std::string result;
    utf8::append(static_cast<uint32_t>(code_point), std::back_inserter(result));
    return CellValue::text(std::move(result));
}

core::Result<CellValue> FunctionLibrary::code(const std::string& text) {
    if (text.empty()) {
        return core::makeError(ErrorCode::InvalidArgument, "CODE of empty text");
    }
    if (!utf8::is_valid(text.begin(), text.end())) {
        return invalidText();
    }
    auto it = text.begin();
    uint32_t cp = utf8::next(it, text.end());
    return CellValue::number(static_cast<double>(cp));
}

// ========== 日期函数 ==========

CellValue FunctionLibrary::today(std::chrono::system_clock::time_point now) {
    return CellValue::date(utils::TimeUtils::daysSinceEpoch(now));
}

CellValue FunctionLibrary::now(std::chrono::system_clock::time_point now) {
    return CellValue::number(utils::TimeUtils::fractionalDaysSinceEpoch(now));
}

}} // namespace gridcalc::formula
