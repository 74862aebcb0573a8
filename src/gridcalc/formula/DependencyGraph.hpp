#pragma once

#include "gridcalc/core/CellAddress.hpp"
#include <cstddef>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gridcalc {
namespace formula {

/**
 * @brief 公式单元格的依赖图
 *
 * 边从被引用的单元格（或区域）指向引用它的公式单元格。
 * 单格引用用哈希表索引；区域引用保存在列表中，按包含关系线性匹配。
 * 每当某个单元格的公式改变，先 removeDependencies 再 setDependencies。
 */
class DependencyGraph {
public:
    struct Precedents {
        std::vector<core::CellRef> cells;
        std::vector<core::CellRange> ranges;
    };

    /**
     * @brief 重算计划
     *
     * order 为拓扑序（每项附带依赖链深度，根为 0）；
     * cyclic 为拓扑排序无法消化的剩余节点，即循环引用及其下游。
     */
    struct RecalcPlan {
        std::vector<std::pair<core::CellRef, size_t>> order;
        std::vector<core::CellRef> cyclic;
    };

    void setDependencies(const core::CellRef& dependent,
                         const std::vector<core::CellRef>& cells,
                         const std::vector<core::CellRange>& ranges);

    void removeDependencies(const core::CellRef& dependent);

    /**
     * @brief 直接引用 cell 的公式单元格（去重）
     */
    std::vector<core::CellRef> directDependents(const core::CellRef& cell) const;

    /**
     * @brief 公式单元格的直接引用，不存在返回 nullptr
     */
    const Precedents* precedents(const core::CellRef& dependent) const;

    /**
     * @brief roots 以及所有传递依赖它们的单元格
     */
    std::unordered_set<core::CellRef> collectAffected(const std::vector<core::CellRef>& roots) const;

    /**
     * @brief 对节点集合做 Kahn 拓扑排序，只考虑集合内部的边
     */
    RecalcPlan plan(const std::unordered_set<core::CellRef>& nodes) const;

    /**
     * @brief 单元格在整张图中的依赖深度
     *
     * 没有引用的单元格深度为 0，公式单元格为其最深前驱加 1。
     * 与本次重算从哪里开始无关；memo 在同一次重算中复用，环上的边忽略。
     */
    size_t depthOf(const core::CellRef& cell, std::unordered_map<core::CellRef, size_t>& memo) const;

    bool hasDependencies(const core::CellRef& dependent) const {
        return precedents_.count(dependent) > 0;
    }

    size_t size() const { return precedents_.size(); }
    void clear();

private:
    // 直接前驱中自身带引用的单元格（区域按包含关系展开到这类单元格）
    std::vector<core::CellRef> dependentPrecedents(const Precedents& entry) const;

    std::unordered_map<core::CellRef, Precedents> precedents_;
    std::unordered_map<core::CellRef, std::unordered_set<core::CellRef>> cell_dependents_;
    std::vector<std::pair<core::CellRange, core::CellRef>> range_dependents_;
};

}} // namespace gridcalc::formula
