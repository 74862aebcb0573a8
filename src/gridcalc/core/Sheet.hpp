#pragma once

#include "gridcalc/core/Cell.hpp"
#include "gridcalc/core/CellAddress.hpp"
#include "gridcalc/core/CalcOptions.hpp"
#include "gridcalc/core/Expected.hpp"
#include "gridcalc/formula/Formula.hpp"
#include "gridcalc/formula/DependencyGraph.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <cstdint>

namespace gridcalc {
namespace core {

/**
 * @brief 一次写入或重算的结果，供界面只刷新受影响的区域
 */
struct RecalcResult {
    std::vector<CellRef> changed_cells;    // 缓存值发生变化的单元格（含被写入的单元格）
    std::vector<CellRef> circular_cells;   // 本次被判定为循环引用的单元格

    bool empty() const { return changed_cells.empty(); }
};

/**
 * @brief 工作表：稀疏单元格存储 + 行列尺寸 + 公式计算
 *
 * 存储层（getCell/setCell/clear）从不失败；setCell 写入 Empty 且无公式的单元格等价于清除。
 * 引擎层（getCellValue/setCellValue/setCellFormula/clearCell）维护依赖图并触发重算：
 * - 自动重算模式下，写入立即按拓扑序重算所有受影响的公式
 * - 手动模式下，写入只把依赖者标记为 Dirty，读取脏单元格时按需求值，recalculate() 全部重算
 * 求值错误以 CellValue::Error 存入单元格，不会返回给写入方。
 */
class Sheet {
public:
    explicit Sheet(std::string name, CalcOptions options = CalcOptions());

    Sheet(Sheet&&) = default;
    Sheet& operator=(Sheet&&) = default;
    Sheet(const Sheet&) = delete;
    Sheet& operator=(const Sheet&) = delete;

    // ========== 基本信息 ==========

    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    const CalcOptions& getOptions() const { return options_; }
    void setOptions(const CalcOptions& options) { options_ = options; }

    // ========== 存储层 ==========

    /**
     * @brief 读取已存储的单元格，未写入或已清除返回 nullptr
     */
    const Cell* getCell(const CellRef& ref) const;

    /**
     * @brief 可修改的单元格指针，用于调整样式
     *
     * 值和公式请通过 setCellValue/setCellFormula 修改，否则依赖图不会更新。
     */
    Cell* getCellMutable(const CellRef& ref);

    /**
     * @brief 原样写入单元格
     *
     * Empty 且无公式时移除该单元格。公式能解析时注册依赖并标记为 Dirty，
     * 依赖者同样标记为 Dirty；不立即重算。
     */
    void setCell(const CellRef& ref, Cell cell);

    /**
     * @brief 无条件移除单元格，依赖者标记为 Dirty
     */
    void clear(const CellRef& ref);

    bool hasCellAt(const CellRef& ref) const { return cells_.count(ref) > 0; }
    size_t getCellCount() const { return cells_.size(); }

    /**
     * @brief 所有已存储单元格的包围盒，空表返回 std::nullopt
     */
    std::optional<CellRange> getUsedRange() const;

    /**
     * @brief 遍历已存储的单元格（顺序不保证）
     */
    template<typename F>
    void forEachCell(F&& func) const {
        for (const auto& [ref, cell] : cells_) {
            func(ref, cell);
        }
    }

    // ========== 行列尺寸 ==========

    double getColumnWidth(uint32_t col) const;
    void setColumnWidth(uint32_t col, double width);
    double getRowHeight(uint32_t row) const;
    void setRowHeight(uint32_t row, double height);

    double getDefaultColumnWidth() const { return options_.default_col_width; }
    double getDefaultRowHeight() const { return options_.default_row_height; }
    void setDefaultColumnWidth(double width);
    void setDefaultRowHeight(double height);

    size_t getColumnWidthOverrideCount() const { return col_widths_.size(); }
    size_t getRowHeightOverrideCount() const { return row_heights_.size(); }

    // ========== 冻结窗格 ==========

    void freezePanes(uint32_t rows, uint32_t cols) { frozen_rows_ = rows; frozen_cols_ = cols; }
    void unfreezePanes() { freezePanes(0, 0); }
    uint32_t getFrozenRows() const { return frozen_rows_; }
    uint32_t getFrozenCols() const { return frozen_cols_; }
    bool hasFrozenPanes() const { return frozen_rows_ > 0 || frozen_cols_ > 0; }

    // ========== 引擎接口 ==========

    /**
     * @brief 读取单元格的值；脏公式单元格会先求值
     */
    std::optional<CellValue> getCellValue(const CellRef& ref);

    RecalcResult setCellValue(const CellRef& ref, CellValue value);

    /**
     * @brief 写入公式
     *
     * 解析失败（InvalidSyntax/InvalidRef）时拒绝写入并保留原值；
     * 求值错误存入单元格，不作为错误返回。
     */
    Result<RecalcResult> setCellFormula(const CellRef& ref, std::string_view text);

    /**
     * @brief 写入编辑器原始输入：'=' 开头为公式，否则按字面量解析
     */
    Result<RecalcResult> setCellInput(const CellRef& ref, std::string_view input);

    RecalcResult clearCell(const CellRef& ref);

    /**
     * @brief 重算所有 Dirty 的公式单元格
     *
     * 结果还包含上次重算以来读取脏单元格时按需求值产生的变化。
     */
    RecalcResult recalculate();

    /**
     * @brief 编辑栏文本：有公式时为公式原文，否则为显示字符串
     */
    std::string formulaBarText(const CellRef& ref) const;

    bool isDirty(const CellRef& ref) const;

    /**
     * @brief 公式单元格的计算状态；字面量或空单元格返回 std::nullopt
     */
    std::optional<CellState> cellState(const CellRef& ref) const;

    size_t getFormulaCount() const { return formulas_.size(); }
    size_t getDirtyCount() const;

private:
    class SheetContext;

    // 注册/注销公式与依赖，不触发重算
    void attachFormula(const CellRef& ref, formula::Formula parsed);
    void detachFormula(const CellRef& ref);

    // 把 roots 的所有传递依赖者（不含 roots 本身，除非位于环上）标记为 Dirty
    void markDependentsDirty(const CellRef& root);

    // 写入后的统一处理：自动模式下重算，手动模式下标记
    RecalcResult afterWrite(const CellRef& ref);

    // 按计划求值一组公式单元格
    RecalcResult execute(const std::unordered_set<CellRef>& nodes);

    // 求值单个公式单元格并写回缓存，返回值是否变化
    bool evaluateCell(const CellRef& ref, size_t depth);

    // 写回缓存值并更新状态，返回值是否变化
    bool storeValue(const CellRef& ref, CellValue value);

    // 读取脏单元格时，先求值它依赖的所有脏单元格
    void refreshDirty(const CellRef& ref);

    // 取出尚未报告的按需求值变化
    RecalcResult takePending();

    std::string name_;
    CalcOptions options_;

    std::unordered_map<CellRef, Cell> cells_;
    std::unordered_map<uint32_t, double> col_widths_;
    std::unordered_map<uint32_t, double> row_heights_;
    uint32_t frozen_rows_ = 0;
    uint32_t frozen_cols_ = 0;

    std::unordered_map<CellRef, formula::Formula> formulas_;
    std::unordered_map<CellRef, CellState> states_;
    formula::DependencyGraph graph_;
    RecalcResult pending_;
};

}} // namespace gridcalc::core
