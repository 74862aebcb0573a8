#pragma once

#include "gridcalc/core/CellValue.hpp"
#include "gridcalc/core/Expected.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridcalc {
namespace formula {

/**
 * @brief 内置函数
 */
enum class Function : uint8_t {
    // 数学与聚合
    Sum,
    Average,
    Count,
    CountA,
    Max,
    Min,
    Abs,
    Round,
    Floor,
    Ceil,
    Sqrt,
    Power,

    // 逻辑
    If,
    And,
    Or,
    Not,
    True,
    False,

    // 文本
    Concatenate,
    Len,
    Upper,
    Lower,
    Trim,
    Left,
    Right,
    Mid,
    Find,
    Substitute,
    Char,
    Code,

    // 日期
    Today,
    Now
};

/**
 * @brief 函数元数据：规范名与参数个数范围
 */
struct FunctionInfo {
    Function id;
    const char* name;
    size_t min_args;
    size_t max_args;
    bool flatten_ranges;   // 参数中的区域展开为值序列（聚合类函数）
};

/**
 * @brief 内置函数库
 *
 * 名字解析不区分大小写并支持别名（AVG、CEILING、CONCAT、SEARCH、REPLACE、POW、LENGTH）。
 * 各函数接收已求值的参数；文本函数作用在参数的显示字符串上，按 UTF-8 码点计数。
 */
class FunctionLibrary {
public:
    static constexpr size_t kVariadic = std::numeric_limits<size_t>::max();

    /**
     * @brief 按名字查找函数，未知名字返回 nullptr
     */
    static const FunctionInfo* lookup(std::string_view name);

    static const FunctionInfo& info(Function function);
    static const char* name(Function function) { return info(function).name; }

    // ========== 聚合函数：输入为展开后的值序列，跳过不可转换的值 ==========

    static core::CellValue sum(const std::vector<core::CellValue>& values);
    static core::CellValue average(const std::vector<core::CellValue>& values);
    static core::CellValue count(const std::vector<core::CellValue>& values);
    static core::CellValue counta(const std::vector<core::CellValue>& values);
    static core::CellValue max(const std::vector<core::CellValue>& values);
    static core::CellValue min(const std::vector<core::CellValue>& values);

    // ========== 数学函数：不可转换为数值的输入原样返回 ==========

    static core::CellValue abs(const core::CellValue& value);
    static core::Result<core::CellValue> round(const core::CellValue& value, int digits);
    static core::CellValue sqrt(const core::CellValue& value);
    static core::Result<core::CellValue> floor(const core::CellValue& value, double significance);
    static core::Result<core::CellValue> ceil(const core::CellValue& value, double significance);
    static core::Result<core::CellValue> power(const core::CellValue& value, double exponent);

    // ========== 逻辑函数 ==========

    /**
     * @brief AND/OR：遇到错误值原样返回；无参数时 AND 为 TRUE、OR 为 FALSE
     */
    static core::CellValue andOf(const std::vector<core::CellValue>& values);
    static core::CellValue orOf(const std::vector<core::CellValue>& values);
    static core::CellValue notOf(const core::CellValue& value);

    // ========== 文本函数 ==========

    static core::CellValue concatenate(const std::vector<core::CellValue>& values);
    static core::Result<core::CellValue> len(const std::string& text);

    /**
     * @brief 大小写转换，覆盖拉丁、希腊和西里尔字母；ß 大写为 SS，词尾 Σ 小写为 ς
     */
    static core::CellValue upper(const std::string& text);
    static core::CellValue lower(const std::string& text);

    /**
     * @brief 去掉首尾空格，并把内部连续空格压缩为一个
     */
    static core::CellValue trim(const std::string& text);

    static core::Result<core::CellValue> left(const std::string& text, int64_t count);
    static core::Result<core::CellValue> right(const std::string& text, int64_t count);
    static core::Result<core::CellValue> mid(const std::string& text, int64_t start, int64_t count);

    /**
     * @brief 在 haystack 中从第 start 个码点起查找 needle，返回 1 基位置（区分大小写）
     */
    static core::Result<core::CellValue> find(const std::string& needle, const std::string& haystack, int64_t start);

    /**
     * @brief 替换 old_text；instance 为空时替换全部，否则只替换第 instance 次出现
     */
    static core::Result<core::CellValue> substitute(const std::string& text, const std::string& old_text,
                                                    const std::string& new_text, std::optional<int64_t> instance);

    static core::Result<core::CellValue> charOf(int64_t code_point);
    static core::Result<core::CellValue> code(const std::string& text);

    // ========== 日期函数 ==========

    static core::CellValue today(std::chrono::system_clock::time_point now);
    static core::CellValue now(std::chrono::system_clock::time_point now);
};

}} // namespace gridcalc::formula
