#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <cstdint>

namespace gridcalc {
namespace utils {

/**
 * @brief A1 地址编解码工具
 *
 * 列字母是双射 26 进制（A=1 … Z=26, AA=27 …），行号从 1 开始；
 * 对外统一换算成 0 基索引。解析失败返回 std::nullopt，不抛异常。
 *
 * @example
 * AddressParser::parseAddress("B3");    // {2, 1}
 * AddressParser::parseAddress("aa10");  // {9, 26}
 * AddressParser::indexToAddress(0, 0);  // "A1"
 */
class AddressParser {
public:
    // 单元格坐标上限：行、列索引都必须落在 uint32_t 范围内
    static constexpr uint64_t MAX_INDEX = 0xFFFFFFFFull;

    /**
     * @brief 解析 "A1" 形式的地址
     * @param address 地址字符串，忽略首尾空白，字母大小写不敏感
     * @return {行索引, 列索引}（0 基），格式错误返回 std::nullopt
     */
    static std::optional<std::pair<uint32_t, uint32_t>> parseAddress(std::string_view address);

    /**
     * @brief 行列索引转地址，如 (1, 2) -> "C2"
     */
    static std::string indexToAddress(uint32_t row, uint32_t col);

    /**
     * @brief 列字母转 0 基索引（A->0, Z->25, AA->26）
     */
    static std::optional<uint32_t> columnStringToIndex(std::string_view col_str);

    /**
     * @brief 0 基列索引转大写列字母
     */
    static std::string indexToColumnString(uint32_t index);

    static bool isValidAddress(std::string_view address) {
        return parseAddress(address).has_value();
    }

    /**
     * @brief 去掉首尾空白
     */
    static std::string_view trim(std::string_view text);
};

}} // namespace gridcalc::utils
