#pragma once

#include "gridcalc/core/ErrorCode.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>
#include <ostream>

namespace gridcalc {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Text = 1,
    Number = 2,
    Boolean = 3,
    Error = 4,
    Date = 5
};

/**
 * @brief 单元格值：Empty | Text | Number | Boolean | Error(kind) | Date(纪元天数)
 *
 * 只有 Empty 会让无公式的单元格从稀疏存储中移除。
 * 所有访问按 type() 分派，数值/字符串转换规则固定且完备。
 */
class CellValue {
public:
    struct ErrorValue {
        std::string kind;
        bool operator==(const ErrorValue& other) const { return kind == other.kind; }
    };

    struct DateValue {
        int64_t days;
        bool operator==(const DateValue& other) const { return days == other.days; }
    };

    CellValue() = default;

    static CellValue empty() { return CellValue(); }
    static CellValue text(std::string value) { return CellValue(Storage(std::in_place_index<1>, std::move(value))); }
    static CellValue number(double value) { return CellValue(Storage(std::in_place_index<2>, value)); }
    static CellValue boolean(bool value) { return CellValue(Storage(std::in_place_index<3>, value)); }
    static CellValue error(std::string kind) { return CellValue(Storage(std::in_place_index<4>, ErrorValue{std::move(kind)})); }
    static CellValue error(ErrorCode code) { return error(std::string(toKind(code))); }
    static CellValue date(int64_t days) { return CellValue(Storage(std::in_place_index<5>, DateValue{days})); }

    /**
     * @brief 解析编辑器输入的字面量（不含公式）
     *
     * 空文本 -> Empty，数值文本 -> Number，TRUE/FALSE（大小写不敏感）-> Boolean，
     * 其余 -> Text。
     */
    static CellValue parseLiteral(std::string_view input);

    CellType type() const { return static_cast<CellType>(data_.index()); }

    bool isEmpty() const { return type() == CellType::Empty; }
    bool isText() const { return type() == CellType::Text; }
    bool isNumber() const { return type() == CellType::Number; }
    bool isBoolean() const { return type() == CellType::Boolean; }
    bool isError() const { return type() == CellType::Error; }
    bool isDate() const { return type() == CellType::Date; }

    // 类型匹配时返回值，否则返回默认值
    const std::string& textValue() const;
    double numberValue() const;
    bool booleanValue() const;
    const std::string& errorKind() const;
    int64_t dateValue() const;

    /**
     * @brief 数值转换
     *
     * Number -> 自身，Boolean -> 0/1，Text -> 按浮点数解析，
     * Date -> 纪元天数；Empty、Error 和不可解析的文本返回 std::nullopt。
     */
    std::optional<double> asNumber() const;

    /**
     * @brief 真值判定（完备，不会失败）
     *
     * Boolean 原样；Number/Date 非零为真；Text 为 "TRUE"（大小写不敏感）
     * 或非零数值文本时为真；Empty、Error 为假。
     */
    bool asBoolean() const;

    /**
     * @brief 显示字符串回退形式
     *
     * Empty -> ""，Number -> 最短往返形式，Boolean -> TRUE/FALSE，
     * Error -> "#kind!"，Date -> YYYY-MM-DD。
     */
    std::string toDisplayString() const;

    bool operator==(const CellValue& other) const { return data_ == other.data_; }
    bool operator!=(const CellValue& other) const { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, std::string, double, bool, ErrorValue, DateValue>;

    explicit CellValue(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

std::ostream& operator<<(std::ostream& os, const CellValue& value);

}} // namespace gridcalc::core
