#pragma once

#include "gridcalc/utils/AddressParser.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <iterator>
#include <functional>
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <ostream>

namespace gridcalc {
namespace core {

/**
 * @brief 单元格坐标（0 基行、列）
 *
 * 值类型，按需创建，从不原地修改。
 */
struct CellRef {
    uint32_t row = 0;
    uint32_t col = 0;

    CellRef() = default;
    CellRef(uint32_t r, uint32_t c) : row(r), col(c) {}

    /**
     * @brief 解析 A1 记法（"B3"、"aa10"），失败返回 std::nullopt
     */
    static std::optional<CellRef> parse(std::string_view text) {
        auto parsed = utils::AddressParser::parseAddress(text);
        if (!parsed) {
            return std::nullopt;
        }
        return CellRef(parsed->first, parsed->second);
    }

    /**
     * @brief 转换为规范的大写 A1 记法
     */
    std::string toA1() const {
        return utils::AddressParser::indexToAddress(row, col);
    }

    bool operator==(const CellRef& other) const { return row == other.row && col == other.col; }
    bool operator!=(const CellRef& other) const { return !(*this == other); }

    // 行优先排序
    bool operator<(const CellRef& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

inline std::ostream& operator<<(std::ostream& os, const CellRef& ref) {
    return os << ref.toA1();
}

/**
 * @brief 矩形单元格区域
 *
 * 构造时规范化：start 取两端逐维最小值，end 取逐维最大值，
 * 因此 CellRange(a, b) == CellRange(b, a)，区域永不倒置。
 */
class CellRange {
public:
    /**
     * @brief 按行优先顺序惰性遍历区域内单元格的迭代器
     */
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = CellRef;
        using difference_type = std::ptrdiff_t;
        using pointer = const CellRef*;
        using reference = const CellRef&;

        Iterator() = default;
        Iterator(const CellRange& range, CellRef current, bool done)
            : first_col_(range.start().col), last_row_(range.end().row), last_col_(range.end().col)
            , current_(current), done_(done) {}

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        Iterator& operator++() {
            if (current_.col < last_col_) {
                ++current_.col;
            } else if (current_.row < last_row_) {
                ++current_.row;
                current_.col = first_col_;
            } else {
                done_ = true;
            }
            return *this;
        }

        Iterator operator++(int) {
            Iterator copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const Iterator& other) const {
            if (done_ || other.done_) return done_ == other.done_;
            return current_ == other.current_;
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        uint32_t first_col_ = 0;
        uint32_t last_row_ = 0;
        uint32_t last_col_ = 0;
        CellRef current_;
        bool done_ = true;
    };

    class CellView;

    CellRange(const CellRef& a, const CellRef& b)
        : start_(std::min(a.row, b.row), std::min(a.col, b.col))
        , end_(std::max(a.row, b.row), std::max(a.col, b.col)) {}

    static CellRange single(const CellRef& cell) { return CellRange(cell, cell); }

    /**
     * @brief 解析 "A1:C5"；不含 ':' 的单个地址不是合法区域
     */
    static std::optional<CellRange> parse(std::string_view text) {
        size_t colon = text.find(':');
        if (colon == std::string_view::npos || text.find(':', colon + 1) != std::string_view::npos) {
            return std::nullopt;
        }
        auto first = CellRef::parse(text.substr(0, colon));
        auto last = CellRef::parse(text.substr(colon + 1));
        if (!first || !last) {
            return std::nullopt;
        }
        return CellRange(*first, *last);
    }

    const CellRef& start() const { return start_; }
    const CellRef& end() const { return end_; }

    bool contains(const CellRef& cell) const {
        return cell.row >= start_.row && cell.row <= end_.row &&
               cell.col >= start_.col && cell.col <= end_.col;
    }

    bool intersects(const CellRange& other) const {
        return start_.row <= other.end_.row && other.start_.row <= end_.row &&
               start_.col <= other.end_.col && other.start_.col <= end_.col;
    }

    uint64_t rowCount() const { return static_cast<uint64_t>(end_.row) - start_.row + 1; }
    uint64_t colCount() const { return static_cast<uint64_t>(end_.col) - start_.col + 1; }
    uint64_t cellCount() const { return rowCount() * colCount(); }
    bool isSingleCell() const { return start_ == end_; }

    /**
     * @brief 行优先的惰性单元格序列
     */
    CellView cells() const;

    std::string toRangeString() const {
        return start_.toA1() + ":" + end_.toA1();
    }

    bool operator==(const CellRange& other) const { return start_ == other.start_ && end_ == other.end_; }
    bool operator!=(const CellRange& other) const { return !(*this == other); }

private:
    CellRef start_;
    CellRef end_;
};

/**
 * @brief cells() 返回的只读视图，可重复遍历、无副作用
 */
class CellRange::CellView {
public:
    explicit CellView(const CellRange& range) : range_(range) {}
    Iterator begin() const { return Iterator(range_, range_.start(), false); }
    Iterator end() const { return Iterator(range_, range_.end(), true); }
    uint64_t size() const { return range_.cellCount(); }

private:
    CellRange range_;
};

inline CellRange::CellView CellRange::cells() const {
    return CellView(*this);
}

inline std::ostream& operator<<(std::ostream& os, const CellRange& range) {
    return os << range.toRangeString();
}

}} // namespace gridcalc::core

namespace std {

template<>
struct hash<gridcalc::core::CellRef> {
    size_t operator()(const gridcalc::core::CellRef& ref) const noexcept {
        return std::hash<uint64_t>()((static_cast<uint64_t>(ref.row) << 32) | ref.col);
    }
};

template<>
struct hash<gridcalc::core::CellRange> {
    size_t operator()(const gridcalc::core::CellRange& range) const noexcept {
        size_t h1 = std::hash<gridcalc::core::CellRef>()(range.start());
        size_t h2 = std::hash<gridcalc::core::CellRef>()(range.end());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ull + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace std
