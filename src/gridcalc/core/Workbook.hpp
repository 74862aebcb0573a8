#pragma once

#include "gridcalc/core/Sheet.hpp"
#include "gridcalc/core/CalcOptions.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridcalc {
namespace core {

/**
 * @brief 工作簿：有序的工作表集合 + 活动工作表索引
 *
 * 集合永不为空：构造时创建第一个工作表，最后一个工作表不能删除。
 * 活动索引始终有效，删除工作表后越界时收缩到新的末尾。
 */
class Workbook {
public:
    explicit Workbook(CalcOptions options = CalcOptions());

    Workbook(Workbook&&) = default;
    Workbook& operator=(Workbook&&) = default;
    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    // ========== 工作表管理 ==========

    /**
     * @brief 添加工作表并返回其索引
     *
     * 名称为空时生成 "<前缀><N>"（最小未使用的 N）；
     * 与现有名称重复（不区分大小写）时追加 " (2)"、" (3)" ...
     */
    size_t addSheet(const std::string& name = "");

    /**
     * @brief 删除工作表
     * @return 被删除的工作表；索引无效或只剩一个工作表时返回 nullptr
     */
    std::unique_ptr<Sheet> removeSheet(size_t index);

    /**
     * @brief 重命名工作表；名称为空、重复或索引无效时返回 false
     */
    bool renameSheet(size_t index, const std::string& new_name);

    size_t getSheetCount() const { return sheets_.size(); }

    Sheet* getSheet(size_t index);
    const Sheet* getSheet(size_t index) const;

    /**
     * @brief 按名称查找（不区分大小写）
     */
    std::optional<size_t> findSheet(std::string_view name) const;

    std::vector<std::string> getSheetNames() const;

    Sheet& activeSheet() { return *sheets_[active_sheet_]; }
    const Sheet& activeSheet() const { return *sheets_[active_sheet_]; }
    size_t getActiveSheetIndex() const { return active_sheet_; }

    /**
     * @brief 切换活动工作表；索引越界时忽略并返回 false
     */
    bool setActiveSheet(size_t index);

    // ========== 配置 ==========

    const CalcOptions& getOptions() const { return options_; }

    /**
     * @brief 更新配置并下发到所有工作表
     */
    void setOptions(const CalcOptions& options);

    // ========== 活动工作表的引擎接口 ==========

    std::optional<CellValue> getCellValue(const CellRef& ref) { return activeSheet().getCellValue(ref); }
    RecalcResult setCellValue(const CellRef& ref, CellValue value) {
        return activeSheet().setCellValue(ref, std::move(value));
    }
    Result<RecalcResult> setCellFormula(const CellRef& ref, std::string_view text) {
        return activeSheet().setCellFormula(ref, text);
    }
    Result<RecalcResult> setCellInput(const CellRef& ref, std::string_view input) {
        return activeSheet().setCellInput(ref, input);
    }
    RecalcResult clearCell(const CellRef& ref) { return activeSheet().clearCell(ref); }
    RecalcResult recalculate() { return activeSheet().recalculate(); }

private:
    std::string generateSheetName() const;
    std::string makeUniqueName(const std::string& base) const;
    bool isNameTaken(std::string_view name, size_t ignore_index = static_cast<size_t>(-1)) const;

    std::vector<std::unique_ptr<Sheet>> sheets_;
    size_t active_sheet_ = 0;
    CalcOptions options_;
};

using Spreadsheet = Workbook;

}} // namespace gridcalc::core
