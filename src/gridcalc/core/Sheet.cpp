#include "gridcalc/core/Sheet.hpp"
#include "gridcalc/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace gridcalc {
namespace core {

namespace {

std::string joinRefs(const std::vector<CellRef>& refs, size_t limit = 16) {
    std::string result;
    for (size_t i = 0; i < refs.size() && i < limit; ++i) {
        if (i > 0) result += ", ";
        result += refs[i].toA1();
    }
    if (refs.size() > limit) {
        result += fmt::format(", ... (+{})", refs.size() - limit);
    }
    return result;
}

// 追加 source 中尚未出现在 target 里的单元格，保持先后顺序
void appendUnique(std::vector<CellRef>& target, const std::vector<CellRef>& source) {
    if (target.empty()) {
        target = source;
        return;
    }
    std::unordered_set<CellRef> seen(target.begin(), target.end());
    for (const auto& ref : source) {
        if (seen.insert(ref).second) {
            target.push_back(ref);
        }
    }
}

void mergeResult(RecalcResult& target, const RecalcResult& source) {
    appendUnique(target.changed_cells, source.changed_cells);
    appendUnique(target.circular_cells, source.circular_cells);
}

bool isValidSize(double size) {
    return std::isfinite(size) && size >= 0.0;
}

} // namespace

/**
 * @brief 面向求值器的工作表视图
 *
 * 读取 Dirty 单元格时先刷新；读取正在求值的单元格即为循环引用。
 */
class Sheet::SheetContext : public formula::EvaluationContext {
public:
    explicit SheetContext(Sheet& sheet) : sheet_(sheet) {}

    std::optional<CellValue> getCell(const CellRef& ref) const override {
        auto state = sheet_.states_.find(ref);
        if (state != sheet_.states_.end()) {
            if (state->second == CellState::Evaluating) {
                return CellValue::error(ErrorCode::CircularReference);
            }
            if (state->second == CellState::Dirty) {
                sheet_.refreshDirty(ref);
            }
        }
        auto it = sheet_.cells_.find(ref);
        if (it == sheet_.cells_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    std::vector<CellValue> getRangeValues(const CellRange& range) const override {
        // 区域比已存储的单元格还多时，只遍历存储
        if (range.cellCount() <= sheet_.cells_.size()) {
            return EvaluationContext::getRangeValues(range);
        }

        std::vector<CellRef> refs;
        for (const auto& entry : sheet_.cells_) {
            if (range.contains(entry.first)) {
                refs.push_back(entry.first);
            }
        }
        std::sort(refs.begin(), refs.end());

        std::vector<CellValue> values;
        values.reserve(refs.size());
        for (const auto& ref : refs) {
            auto value = getCell(ref);
            if (value && !value->isEmpty()) {
                values.push_back(std::move(*value));
            }
        }
        return values;
    }

private:
    Sheet& sheet_;
};

Sheet::Sheet(std::string name, CalcOptions options)
    : name_(std::move(name)), options_(std::move(options)) {
}

// ========== 存储层 ==========

const Cell* Sheet::getCell(const CellRef& ref) const {
    auto it = cells_.find(ref);
    return it == cells_.end() ? nullptr : &it->second;
}

Cell* Sheet::getCellMutable(const CellRef& ref) {
    auto it = cells_.find(ref);
    return it == cells_.end() ? nullptr : &it->second;
}

void Sheet::setCell(const CellRef& ref, Cell cell) {
    detachFormula(ref);

    if (cell.isBlank()) {
        cells_.erase(ref);
        markDependentsDirty(ref);
        return;
    }

    std::optional<std::string> formula_text = cell.formula;
    cells_.insert_or_assign(ref, std::move(cell));

    if (formula_text) {
        auto parsed = formula::Formula::parse(*formula_text);
        if (parsed) {
            attachFormula(ref, std::move(parsed).value());
        } else {
            CORE_DEBUG("Stored unparsed formula at {}: {}", ref.toA1(), parsed.error().fullMessage());
        }
    }
    markDependentsDirty(ref);
}

void Sheet::clear(const CellRef& ref) {
    detachFormula(ref);
    cells_.erase(ref);
    markDependentsDirty(ref);
}

std::optional<CellRange> Sheet::getUsedRange() const {
    if (cells_.empty()) {
        return std::nullopt;
    }

    uint32_t min_row = std::numeric_limits<uint32_t>::max();
    uint32_t min_col = std::numeric_limits<uint32_t>::max();
    uint32_t max_row = 0;
    uint32_t max_col = 0;

    for (const auto& entry : cells_) {
        const CellRef& ref = entry.first;
        min_row = std::min(min_row, ref.row);
        min_col = std::min(min_col, ref.col);
        max_row = std::max(max_row, ref.row);
        max_col = std::max(max_col, ref.col);
    }
    return CellRange(CellRef(min_row, min_col), CellRef(max_row, max_col));
}

// ========== 行列尺寸 ==========

double Sheet::getColumnWidth(uint32_t col) const {
    auto it = col_widths_.find(col);
    return it == col_widths_.end() ? options_.default_col_width : it->second;
}

void Sheet::setColumnWidth(uint32_t col, double width) {
    if (!isValidSize(width)) {
        CORE_WARN("Ignored invalid width {} for column {}", width, col);
        return;
    }
    if (width == options_.default_col_width) {
        col_widths_.erase(col);
    } else {
        col_widths_[col] = width;
    }
}

double Sheet::getRowHeight(uint32_t row) const {
    auto it = row_heights_.find(row);
    return it == row_heights_.end() ? options_.default_row_height : it->second;
}

void Sheet::setRowHeight(uint32_t row, double height) {
    if (!isValidSize(height)) {
        CORE_WARN("Ignored invalid height {} for row {}", height, row);
        return;
    }
    if (height == options_.default_row_height) {
        row_heights_.erase(row);
    } else {
        row_heights_[row] = height;
    }
}

void Sheet::setDefaultColumnWidth(double width) {
    if (!isValidSize(width)) {
        CORE_WARN("Ignored invalid default column width {}", width);
        return;
    }
    options_.default_col_width = width;
    for (auto it = col_widths_.begin(); it != col_widths_.end();) {
        it = it->second == width ? col_widths_.erase(it) : std::next(it);
    }
}

void Sheet::setDefaultRowHeight(double height) {
    if (!isValidSize(height)) {
        CORE_WARN("Ignored invalid default row height {}", height);
        return;
    }
    options_.default_row_height = height;
    for (auto it = row_heights_.begin(); it != row_heights_.end();) {
        it = it->second == height ? row_heights_.erase(it) : std::next(it);
    }
}

// ========== 引擎接口 ==========

std::optional<CellValue> Sheet::getCellValue(const CellRef& ref) {
    if (isDirty(ref)) {
        refreshDirty(ref);
    }
    auto it = cells_.find(ref);
    if (it == cells_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

RecalcResult Sheet::setCellValue(const CellRef& ref, CellValue value) {
    Cell cell;
    if (const Cell* existing = getCell(ref)) {
        cell.style = existing->style;
    }
    cell.value = std::move(value);
    setCell(ref, std::move(cell));
    return afterWrite(ref);
}

Result<RecalcResult> Sheet::setCellFormula(const CellRef& ref, std::string_view text) {
    auto parsed = formula::Formula::parse(text);
    if (!parsed) {
        const Error& error = parsed.error();
        FORMULA_WARN("Rejected formula for {}: {}", ref.toA1(), error.fullMessage());
        return error;
    }

    Cell cell;
    if (const Cell* existing = getCell(ref)) {
        cell.value = existing->value;   // 作为求值前的缓存
        cell.style = existing->style;
    }
    cell.formula = parsed.value().text();

    detachFormula(ref);
    cells_.insert_or_assign(ref, std::move(cell));
    attachFormula(ref, std::move(parsed).value());
    markDependentsDirty(ref);
    return afterWrite(ref);
}

Result<RecalcResult> Sheet::setCellInput(const CellRef& ref, std::string_view input) {
    Cell parsed = Cell::parseInput(input);
    if (parsed.formula) {
        return setCellFormula(ref, *parsed.formula);
    }
    return setCellValue(ref, std::move(parsed.value));
}

RecalcResult Sheet::clearCell(const CellRef& ref) {
    clear(ref);
    return afterWrite(ref);
}

RecalcResult Sheet::recalculate() {
    std::unordered_set<CellRef> dirty;
    for (const auto& [ref, state] : states_) {
        if (state == CellState::Dirty) {
            dirty.insert(ref);
        }
    }
    if (dirty.empty()) {
        return takePending();
    }
    CALC_DEBUG("Recalculating {} dirty cell(s) on sheet '{}'", dirty.size(), name_);
    RecalcResult computed = execute(dirty);
    RecalcResult result = takePending();
    mergeResult(result, computed);
    return result;
}

std::string Sheet::formulaBarText(const CellRef& ref) const {
    const Cell* cell = getCell(ref);
    if (!cell) {
        return std::string();
    }
    if (cell->formula) {
        return *cell->formula;
    }
    return cell->value.toDisplayString();
}

bool Sheet::isDirty(const CellRef& ref) const {
    auto it = states_.find(ref);
    return it != states_.end() && it->second == CellState::Dirty;
}

std::optional<CellState> Sheet::cellState(const CellRef& ref) const {
    auto it = states_.find(ref);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Sheet::getDirtyCount() const {
    return static_cast<size_t>(std::count_if(states_.begin(), states_.end(),
        [](const auto& entry) { return entry.second == CellState::Dirty; }));
}

// ========== 内部实现 ==========

void Sheet::attachFormula(const CellRef& ref, formula::Formula parsed) {
    graph_.setDependencies(ref, parsed.referencedCells(), parsed.referencedRanges());
    formulas_.insert_or_assign(ref, std::move(parsed));
    states_[ref] = CellState::Dirty;
}

void Sheet::detachFormula(const CellRef& ref) {
    graph_.removeDependencies(ref);
    formulas_.erase(ref);
    states_.erase(ref);
}

void Sheet::markDependentsDirty(const CellRef& root) {
    for (const auto& ref : graph_.collectAffected({root})) {
        if (ref != root && formulas_.count(ref) > 0) {
            states_[ref] = CellState::Dirty;
        }
    }
}

RecalcResult Sheet::afterWrite(const CellRef& ref) {
    RecalcResult result;
    if (options_.auto_recalculate) {
        RecalcResult computed = execute(graph_.collectAffected({ref}));
        result = takePending();
        mergeResult(result, computed);
    }

    // 被写入的单元格总在最前
    auto& changed = result.changed_cells;
    changed.erase(std::remove(changed.begin(), changed.end(), ref), changed.end());
    changed.insert(changed.begin(), ref);
    return result;
}

RecalcResult Sheet::execute(const std::unordered_set<CellRef>& nodes) {
    RecalcResult result;
    if (nodes.empty()) {
        return result;
    }

    auto plan = graph_.plan(nodes);

    for (const auto& ref : plan.cyclic) {
        if (formulas_.count(ref) == 0) {
            continue;
        }
        if (storeValue(ref, CellValue::error(ErrorCode::CircularReference))) {
            result.changed_cells.push_back(ref);
        }
        result.circular_cells.push_back(ref);
    }
    if (!result.circular_cells.empty()) {
        CALC_WARN("Circular reference on sheet '{}': {}", name_, joinRefs(result.circular_cells));
    }

    // 深度按整张图计算，与本次从哪个单元格开始无关
    std::unordered_map<CellRef, size_t> depths;
    for (const auto& step : plan.order) {
        const CellRef& ref = step.first;
        if (formulas_.count(ref) == 0) {
            continue;  // 字面量根节点，不需要求值
        }
        if (evaluateCell(ref, graph_.depthOf(ref, depths))) {
            result.changed_cells.push_back(ref);
        }
    }

    CALC_DEBUG("Recalc pass on sheet '{}': {} evaluated, {} changed, {} circular",
               name_, plan.order.size(), result.changed_cells.size(), result.circular_cells.size());
    return result;
}

bool Sheet::evaluateCell(const CellRef& ref, size_t depth) {
    auto it = formulas_.find(ref);
    if (it == formulas_.end()) {
        return false;
    }

    if (depth > options_.max_dependency_depth) {
        CALC_WARN("Dependency depth {} at {} exceeds limit {}", depth, ref.toA1(), options_.max_dependency_depth);
        return storeValue(ref, CellValue::error(ErrorCode::DepthLimitExceeded));
    }

    states_[ref] = CellState::Evaluating;
    SheetContext context(*this);
    auto result = it->second.evaluate(context);

    CellValue value;
    if (result) {
        value = std::move(result).value();
    } else {
        GRIDCALC_LOG_RECALC_TRACE("{} evaluated to error: {}", ref.toA1(), result.error().fullMessage());
        value = CellValue::error(result.error().code);
    }
    return storeValue(ref, std::move(value));
}

bool Sheet::storeValue(const CellRef& ref, CellValue value) {
    auto it = cells_.find(ref);
    if (it == cells_.end()) {
        return false;
    }
    states_[ref] = value.isError() ? CellState::Error : CellState::Clean;
    if (it->second.value == value) {
        return false;
    }
    it->second.value = std::move(value);
    return true;
}

void Sheet::refreshDirty(const CellRef& ref) {
    // 沿引用方向收集所有脏的前驱
    std::unordered_set<CellRef> nodes;
    std::vector<CellRef> stack{ref};

    while (!stack.empty()) {
        CellRef current = stack.back();
        stack.pop_back();
        if (!isDirty(current) || !nodes.insert(current).second) {
            continue;
        }

        const auto* precedents = graph_.precedents(current);
        if (!precedents) {
            continue;
        }
        for (const auto& cell : precedents->cells) {
            if (isDirty(cell) && nodes.count(cell) == 0) {
                stack.push_back(cell);
            }
        }
        for (const auto& range : precedents->ranges) {
            for (const auto& [formula_ref, state] : states_) {
                if (state == CellState::Dirty && range.contains(formula_ref) && nodes.count(formula_ref) == 0) {
                    stack.push_back(formula_ref);
                }
            }
        }
    }

    GRIDCALC_LOG_RECALC_TRACE("On-demand refresh of {} pulls {} dirty cell(s)", ref.toA1(), nodes.size());
    mergeResult(pending_, execute(nodes));
}

RecalcResult Sheet::takePending() {
    RecalcResult taken;
    std::swap(taken, pending_);
    return taken;
}

}} // namespace gridcalc::core
