#include "gridcalc/core/Selection.hpp"
#include <algorithm>
#include <limits>

namespace gridcalc {
namespace core {

namespace {

uint32_t clampedMove(uint32_t value, int64_t delta) {
    int64_t moved = static_cast<int64_t>(value) + delta;
    if (moved < 0) {
        return 0;
    }
    return static_cast<uint32_t>(std::min<int64_t>(moved, std::numeric_limits<uint32_t>::max()));
}

} // namespace

Selection::Selection(const CellRef& cell)
    : primary_(cell), ranges_{CellRange::single(cell)} {
}

Selection Selection::fromRange(const CellRange& range) {
    Selection selection(range.end());
    selection.ranges_.front() = range;
    return selection;
}

void Selection::extendTo(const CellRef& end) {
    ranges_.assign(1, CellRange(primary_, end));
}

void Selection::addRange(const CellRange& range) {
    ranges_.push_back(range);
    primary_ = range.end();
}

void Selection::set(const CellRef& cell) {
    primary_ = cell;
    ranges_.assign(1, CellRange::single(cell));
}

void Selection::moveBy(int64_t row_delta, int64_t col_delta) {
    set(CellRef(clampedMove(primary_.row, row_delta), clampedMove(primary_.col, col_delta)));
}

bool Selection::isSelected(const CellRef& cell) const {
    return std::any_of(ranges_.begin(), ranges_.end(),
                       [&cell](const CellRange& range) { return range.contains(cell); });
}

std::unordered_set<CellRef> Selection::cells() const {
    std::unordered_set<CellRef> result;
    for (const auto& range : ranges_) {
        for (const auto& cell : range.cells()) {
            result.insert(cell);
        }
    }
    return result;
}

}} // namespace gridcalc::core
