#pragma once

// GridCalc库 - 电子表格数据引擎
// 稀疏单元格存储、A1 坐标、选区与公式计算

// === 基础设施 ===
#include "gridcalc/utils/Logger.hpp"
#include "gridcalc/core/ErrorCode.hpp"
#include "gridcalc/core/Expected.hpp"
#include "gridcalc/core/Exception.hpp"

// === 坐标与选区 ===
#include "gridcalc/core/CellAddress.hpp"
#include "gridcalc/core/Selection.hpp"

// === 存储模型 ===
#include "gridcalc/core/CellValue.hpp"
#include "gridcalc/core/Cell.hpp"
#include "gridcalc/core/CalcOptions.hpp"
#include "gridcalc/core/Sheet.hpp"
#include "gridcalc/core/Workbook.hpp"

// === 公式 ===
#include "gridcalc/formula/Formula.hpp"
#include "gridcalc/formula/EvaluationContext.hpp"
#include "gridcalc/formula/FunctionLibrary.hpp"

namespace gridcalc {

// 常用类型导出到顶层命名空间
using core::CellRef;
using core::CellRange;
using core::Selection;
using core::CellValue;
using core::Cell;
using core::CellStyle;
using core::CalcOptions;
using core::Sheet;
using core::Workbook;
using core::Spreadsheet;
using core::RecalcResult;
using core::ErrorCode;

} // namespace gridcalc
