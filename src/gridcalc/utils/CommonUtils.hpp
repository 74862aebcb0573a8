#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace gridcalc {
namespace utils {

/**
 * @brief 通用工具类 - 数值与字符串的辅助函数
 */
class CommonUtils {
public:
    // ========== 数值工具 ==========

    /**
     * @brief 把文本按十进制浮点数解析
     *
     * 忽略首尾空白，要求剩余部分被完整消费；与区域设置无关。
     * 非有限值（inf / nan）不算数值。
     * @return 解析结果，失败返回 std::nullopt
     */
    static std::optional<double> parseNumber(std::string_view text);

    /**
     * @brief 数值转显示字符串：最短可往返形式（6、0.5、1e+21）
     */
    static std::string formatNumber(double value);

    // ========== 字符串工具 ==========

    static std::string toUpperAscii(std::string_view text);
    static std::string toLowerAscii(std::string_view text);
    static bool equalsIgnoreCase(std::string_view a, std::string_view b);
};

}} // namespace gridcalc::utils
