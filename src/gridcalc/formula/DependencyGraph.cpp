#include "gridcalc/formula/DependencyGraph.hpp"
#include "gridcalc/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <deque>

namespace gridcalc {
namespace formula {

using core::CellRef;
using core::CellRange;

void DependencyGraph::setDependencies(const CellRef& dependent,
                                      const std::vector<CellRef>& cells,
                                      const std::vector<CellRange>& ranges) {
    removeDependencies(dependent);
    if (cells.empty() && ranges.empty()) {
        return;
    }

    Precedents entry;
    entry.cells = cells;
    std::sort(entry.cells.begin(), entry.cells.end());
    entry.cells.erase(std::unique(entry.cells.begin(), entry.cells.end()), entry.cells.end());

    for (const auto& range : ranges) {
        if (std::find(entry.ranges.begin(), entry.ranges.end(), range) == entry.ranges.end()) {
            entry.ranges.push_back(range);
        }
    }

    for (const auto& cell : entry.cells) {
        cell_dependents_[cell].insert(dependent);
    }
    for (const auto& range : entry.ranges) {
        range_dependents_.emplace_back(range, dependent);
    }

    GRIDCALC_LOG_RECALC_TRACE("{} depends on {} cell(s) and {} range(s)",
                              dependent.toA1(), entry.cells.size(), entry.ranges.size());
    precedents_[dependent] = std::move(entry);
}

void DependencyGraph::removeDependencies(const CellRef& dependent) {
    auto it = precedents_.find(dependent);
    if (it == precedents_.end()) {
        return;
    }

    for (const auto& cell : it->second.cells) {
        auto dep_it = cell_dependents_.find(cell);
        if (dep_it == cell_dependents_.end()) {
            continue;
        }
        dep_it->second.erase(dependent);
        if (dep_it->second.empty()) {
            cell_dependents_.erase(dep_it);
        }
    }

    if (!it->second.ranges.empty()) {
        range_dependents_.erase(
            std::remove_if(range_dependents_.begin(), range_dependents_.end(),
                           [&](const auto& entry) { return entry.second == dependent; }),
            range_dependents_.end());
    }

    precedents_.erase(it);
}

std::vector<CellRef> DependencyGraph::directDependents(const CellRef& cell) const {
    std::vector<CellRef> result;

    auto it = cell_dependents_.find(cell);
    if (it != cell_dependents_.end()) {
        result.assign(it->second.begin(), it->second.end());
    }
    for (const auto& [range, dependent] : range_dependents_) {
        if (range.contains(cell)) {
            result.push_back(dependent);
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

const DependencyGraph::Precedents* DependencyGraph::precedents(const CellRef& dependent) const {
    auto it = precedents_.find(dependent);
    return it == precedents_.end() ? nullptr : &it->second;
}

std::unordered_set<CellRef> DependencyGraph::collectAffected(const std::vector<CellRef>& roots) const {
    std::unordered_set<CellRef> affected(roots.begin(), roots.end());
    std::deque<CellRef> queue(roots.begin(), roots.end());

    while (!queue.empty()) {
        CellRef current = queue.front();
        queue.pop_front();
        for (const auto& dependent : directDependents(current)) {
            if (affected.insert(dependent).second) {
                queue.push_back(dependent);
            }
        }
    }
    return affected;
}

DependencyGraph::RecalcPlan DependencyGraph::plan(const std::unordered_set<CellRef>& nodes) const {
    std::unordered_map<CellRef, std::vector<CellRef>> edges;
    std::unordered_map<CellRef, size_t> in_degree;
    std::unordered_map<CellRef, size_t> level;

    for (const auto& node : nodes) {
        in_degree.emplace(node, 0);
        level.emplace(node, 0);
    }

    for (const auto& node : nodes) {
        auto& out = edges[node];
        for (const auto& dependent : directDependents(node)) {
            if (nodes.count(dependent) > 0) {
                out.push_back(dependent);
                ++in_degree[dependent];
            }
        }
    }

    // 入度为 0 的起点按行优先排序，保证计划可复现
    std::vector<CellRef> ready;
    for (const auto& [node, degree] : in_degree) {
        if (degree == 0) {
            ready.push_back(node);
        }
    }
    std::sort(ready.begin(), ready.end());
    std::deque<CellRef> queue(ready.begin(), ready.end());

    RecalcPlan result;
    result.order.reserve(nodes.size());

    while (!queue.empty()) {
        CellRef current = queue.front();
        queue.pop_front();
        const size_t current_level = level[current];
        result.order.emplace_back(current, current_level);

        for (const auto& dependent : edges[current]) {
            size_t& dependent_level = level[dependent];
            dependent_level = std::max(dependent_level, current_level + 1);
            if (--in_degree[dependent] == 0) {
                queue.push_back(dependent);
            }
        }
    }

    if (result.order.size() < nodes.size()) {
        for (const auto& [node, degree] : in_degree) {
            if (degree > 0) {
                result.cyclic.push_back(node);
            }
        }
        std::sort(result.cyclic.begin(), result.cyclic.end());
    }

    CALC_DEBUG("Recalc plan: {} node(s), {} ordered, {} cyclic",
               nodes.size(), result.order.size(), result.cyclic.size());
    return result;
}

size_t DependencyGraph::depthOf(const CellRef& cell, std::unordered_map<CellRef, size_t>& memo) const {
    if (auto found = memo.find(cell); found != memo.end()) {
        return found->second;
    }

    // 迭代后序遍历，避免长链递归
    std::vector<std::pair<CellRef, bool>> stack{{cell, false}};
    std::unordered_set<CellRef> active;

    while (!stack.empty()) {
        const CellRef current = stack.back().first;
        const bool expanded = stack.back().second;

        if (memo.count(current) > 0) {
            stack.pop_back();
            continue;
        }
        auto it = precedents_.find(current);
        if (it == precedents_.end()) {
            memo.emplace(current, 0);
            stack.pop_back();
            continue;
        }

        auto inputs = dependentPrecedents(it->second);
        if (!expanded) {
            stack.back().second = true;
            active.insert(current);
            for (const auto& input : inputs) {
                if (memo.count(input) == 0 && active.count(input) == 0) {
                    stack.emplace_back(input, false);
                }
            }
            continue;
        }

        size_t deepest = 0;
        for (const auto& input : inputs) {
            auto found = memo.find(input);
            if (found != memo.end()) {
                deepest = std::max(deepest, found->second);
            }
        }
        memo.emplace(current, deepest + 1);
        active.erase(current);
        stack.pop_back();
    }
    return memo[cell];
}

std::vector<CellRef> DependencyGraph::dependentPrecedents(const Precedents& entry) const {
    std::vector<CellRef> result;
    for (const auto& cell : entry.cells) {
        if (precedents_.count(cell) > 0) {
            result.push_back(cell);
        }
    }
    for (const auto& range : entry.ranges) {
        for (const auto& [formula_cell, ignored] : precedents_) {
            if (range.contains(formula_cell)) {
                result.push_back(formula_cell);
            }
        }
    }
    return result;
}

void DependencyGraph::clear() {
    precedents_.clear();
    cell_dependents_.clear();
    range_dependents_.clear();
}

}} // namespace gridcalc::formula
