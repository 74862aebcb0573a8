#pragma once

#include "gridcalc/core/CellValue.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <array>
#include <cstdint>

namespace gridcalc {
namespace core {

/**
 * @brief 水平对齐方式
 */
enum class HorizontalAlign : uint8_t {
    Left = 0,
    Center = 1,
    Right = 2
};

/**
 * @brief 垂直对齐方式
 */
enum class VerticalAlign : uint8_t {
    Top = 0,
    Middle = 1,
    Bottom = 2
};

using RGBA = std::array<uint8_t, 4>;

/**
 * @brief 单元格样式
 *
 * 所有字段可选，未设置表示沿用渲染层的默认值。
 * 引擎只保存样式，不解释 number_format。
 */
struct CellStyle {
    std::optional<std::string> number_format;
    std::optional<std::string> font_family;
    std::optional<float> font_size;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<RGBA> color;        // 文字颜色
    std::optional<RGBA> background;   // 背景颜色
    std::optional<HorizontalAlign> h_align;
    std::optional<VerticalAlign> v_align;

    bool isDefault() const;

    bool operator==(const CellStyle& other) const;
    bool operator!=(const CellStyle& other) const { return !(*this == other); }
};

/**
 * @brief 存储单元：值 + 可选公式 + 样式
 *
 * formula 为空时是字面量；有公式时 value 是最近一次计算的缓存。
 */
struct Cell {
    CellValue value;
    std::optional<std::string> formula;
    CellStyle style;

    static Cell empty() { return Cell(); }

    static Cell withValue(CellValue value) {
        Cell cell;
        cell.value = std::move(value);
        return cell;
    }

    static Cell withFormula(std::string formula) {
        Cell cell;
        cell.formula = std::move(formula);
        return cell;
    }

    /**
     * @brief 解析编辑器原始输入
     *
     * 去掉首尾空白后以 '=' 开头的是公式；其余按 CellValue::parseLiteral 解析
     * （空文本为 Empty，数值文本为 Number，TRUE/FALSE 为 Boolean，其他为 Text）。
     */
    static Cell parseInput(std::string_view input);

    bool isFormula() const { return formula.has_value(); }

    /**
     * @brief 是否可以从稀疏存储中移除（值为 Empty 且无公式）
     */
    bool isBlank() const { return value.isEmpty() && !formula; }

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

}} // namespace gridcalc::core
