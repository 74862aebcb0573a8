#pragma once

#include <string>
#include <cstddef>

namespace gridcalc {
namespace core {

/**
 * @file CalcOptions.hpp
 * @brief 计算引擎的配置选项
 *
 * 每个 Spreadsheet 持有一份，新建工作表时复制给 Sheet。
 */

/**
 * @brief 单个公式单元格的计算状态
 */
enum class CellState {
    Clean,       // 缓存值有效
    Dirty,       // 依赖已变化，尚未重算
    Evaluating,  // 正在求值，再次进入即为循环引用
    Error        // 最近一次求值得到错误值
};

/**
 * @brief 计算选项配置结构体
 */
struct CalcOptions {
    // 重算选项
    bool auto_recalculate = true;          // 写入后立即重算受影响的单元格
    size_t max_dependency_depth = 4096;    // 依赖链超过该长度时存入 depth-limit-exceeded

    // 尺寸默认值
    double default_col_width = 100.0;
    double default_row_height = 24.0;

    // 工作表命名
    std::string default_sheet_name_prefix = "Sheet";  // 自动生成的名字为 Sheet1、Sheet2 ...
};

}} // namespace gridcalc::core
