#include "gridcalc/utils/AddressParser.hpp"
#include <algorithm>
#include <cctype>

namespace gridcalc {
namespace utils {

std::string_view AddressParser::trim(std::string_view text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::optional<uint32_t> AddressParser::columnStringToIndex(std::string_view col_str) {
    if (col_str.empty()) {
        return std::nullopt;
    }
    uint64_t result = 0;
    for (char c : col_str) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        result = result * 26 + static_cast<uint64_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
        if (result - 1 > MAX_INDEX) {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>(result - 1);
}

std::string AddressParser::indexToColumnString(uint32_t index) {
    std::string result;
    uint64_t n = static_cast<uint64_t>(index) + 1;  // 转成 1 基后逐位取余
    while (n > 0) {
        --n;
        result.push_back(static_cast<char>('A' + (n % 26)));
        n /= 26;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::optional<std::pair<uint32_t, uint32_t>> AddressParser::parseAddress(std::string_view address) {
    std::string_view text = trim(address);

    size_t letters = 0;
    while (letters < text.size() && std::isalpha(static_cast<unsigned char>(text[letters]))) {
        ++letters;
    }
    if (letters == 0 || letters == text.size()) {
        return std::nullopt;  // 缺少列字母或行号
    }

    auto col = columnStringToIndex(text.substr(0, letters));
    if (!col) {
        return std::nullopt;
    }

    uint64_t row = 0;
    for (size_t i = letters; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;  // 行号后有多余字符
        }
        row = row * 10 + static_cast<uint64_t>(c - '0');
        if (row > MAX_INDEX + 1) {
            return std::nullopt;
        }
    }
    if (row == 0) {
        return std::nullopt;
    }

    return std::make_pair(static_cast<uint32_t>(row - 1), *col);
}

std::string AddressParser::indexToAddress(uint32_t row, uint32_t col) {
    return indexToColumnString(col) + std::to_string(static_cast<uint64_t>(row) + 1);
}

}} // namespace gridcalc::utils
