#pragma once

#include "gridcalc/core/CellAddress.hpp"
#include <vector>
#include <unordered_set>
#include <cstdint>

namespace gridcalc {
namespace core {

/**
 * @brief 单元格选区：一个或多个区域加一个主单元格
 *
 * ranges_ 在对象存活期间永不为空；primary_ 是最近设置的端点，
 * 供编辑栏作为参考单元格。
 */
class Selection {
public:
    explicit Selection(const CellRef& cell = CellRef(0, 0));

    /**
     * @brief 以区域构造选区，主单元格为区域的 end
     */
    static Selection fromRange(const CellRange& range);

    /**
     * @brief 把选区替换为从原主单元格到 end 的单个区域（不叠加）
     */
    void extendTo(const CellRef& end);

    /**
     * @brief 追加区域（Ctrl 多选），主单元格移到区域的 end
     */
    void addRange(const CellRange& range);

    /**
     * @brief 重置为单个单元格
     */
    void set(const CellRef& cell);

    /**
     * @brief 方向键移动主单元格，在第 0 行/列处截断，并重置为单格选区
     */
    void moveBy(int64_t row_delta, int64_t col_delta);

    bool isSelected(const CellRef& cell) const;

    /**
     * @brief 所有区域单元格的并集（重叠部分去重）
     */
    std::unordered_set<CellRef> cells() const;

    size_t cellCount() const { return cells().size(); }

    const CellRef& primary() const { return primary_; }
    const CellRange& range() const { return ranges_.front(); }
    const std::vector<CellRange>& ranges() const { return ranges_; }

private:
    CellRef primary_;
    std::vector<CellRange> ranges_;
};

}} // namespace gridcalc::core
