#include <gtest/gtest.h>
#include "gridcalc/core/Sheet.hpp"
#include <algorithm>
#include <string>

using namespace gridcalc::core;

class RecalcTest : public ::testing::Test {
protected:
    static CellRef at(const char* a1) { return *CellRef::parse(a1); }

    void input(const char* a1, const std::string& text) {
        auto result = sheet.setCellInput(at(a1), text);
        ASSERT_TRUE(result) << a1 << " <- " << text << ": " << result.error().fullMessage();
    }

    CellValue valueAt(const char* a1) {
        auto value = sheet.getCellValue(at(a1));
        return value ? *value : CellValue::empty();
    }

    static bool containsRef(const std::vector<CellRef>& refs, const char* a1) {
        return std::find(refs.begin(), refs.end(), at(a1)) != refs.end();
    }

    Sheet sheet{"Calc"};
};

// 测试写入公式立即求值
TEST_F(RecalcTest, FormulaIsEvaluatedOnWrite) {
    input("A1", "10");
    input("A2", "20");
    input("A3", "=A1+A2");
    EXPECT_EQ(valueAt("A3"), CellValue::number(30));
    EXPECT_EQ(sheet.cellState(at("A3")), CellState::Clean);
    EXPECT_EQ(sheet.formulaBarText(at("A3")), "=A1+A2");
    EXPECT_EQ(sheet.formulaBarText(at("A1")), "10");
    EXPECT_EQ(sheet.formulaBarText(at("Z1")), "");
}

// 测试修改被引用的单元格会传播到所有依赖者
TEST_F(RecalcTest, ChangesPropagateThroughChain) {
    input("A1", "1");
    input("B1", "=A1*2");
    input("C1", "=B1+1");
    input("D1", "=SUM(A1:C1)");
    EXPECT_EQ(valueAt("D1"), CellValue::number(1 + 2 + 3));

    auto result = sheet.setCellValue(at("A1"), CellValue::number(5));
    EXPECT_EQ(valueAt("B1"), CellValue::number(10));
    EXPECT_EQ(valueAt("C1"), CellValue::number(11));
    EXPECT_EQ(valueAt("D1"), CellValue::number(26));

    ASSERT_FALSE(result.changed_cells.empty());
    EXPECT_EQ(result.changed_cells.front(), at("A1"));
    EXPECT_TRUE(containsRef(result.changed_cells, "B1"));
    EXPECT_TRUE(containsRef(result.changed_cells, "C1"));
    EXPECT_TRUE(containsRef(result.changed_cells, "D1"));
    EXPECT_TRUE(result.circular_cells.empty());
}

// 测试只报告值真正变化的依赖者
TEST_F(RecalcTest, UnchangedDependentsAreNotReported) {
    input("A1", "3");
    input("B1", "=IF(A1>0, 1, 0)");
    input("C1", "=A1");

    auto result = sheet.setCellValue(at("A1"), CellValue::number(4));
    EXPECT_TRUE(containsRef(result.changed_cells, "C1"));
    EXPECT_FALSE(containsRef(result.changed_cells, "B1"));
}

// 测试区域引用的依赖
TEST_F(RecalcTest, RangeDependencies) {
    input("D1", "=SUM(A1:A100)");
    EXPECT_EQ(valueAt("D1"), CellValue::number(0));

    input("A50", "7");
    EXPECT_EQ(valueAt("D1"), CellValue::number(7));

    input("A100", "3");
    EXPECT_EQ(valueAt("D1"), CellValue::number(10));

    sheet.clearCell(at("A50"));
    EXPECT_EQ(valueAt("D1"), CellValue::number(3));

    input("E1", "=COUNTA(A1:A100)");
    EXPECT_EQ(valueAt("E1"), CellValue::number(1));
}

// 测试大区域只遍历已存储的单元格
TEST_F(RecalcTest, HugeRangeOverSparseSheet) {
    input("A2", "1");
    input("XFD1048576", "2");
    input("A1", "=SUM(A2:XFD1048576)");
    EXPECT_EQ(valueAt("A1"), CellValue::number(3));
    input("B1", "=COUNT(A2:XFD1048576)");
    EXPECT_EQ(valueAt("B1"), CellValue::number(2));
}

// 测试互相引用的两个公式被标记为循环引用
TEST_F(RecalcTest, MutualReferenceIsCircular) {
    input("B1", "=A1+1");
    auto result = sheet.setCellFormula(at("A1"), "=B1+1");
    ASSERT_TRUE(result);

    EXPECT_EQ(valueAt("A1"), CellValue::error(ErrorCode::CircularReference));
    EXPECT_EQ(valueAt("B1"), CellValue::error(ErrorCode::CircularReference));
    EXPECT_EQ(sheet.cellState(at("A1")), CellState::Error);
    EXPECT_TRUE(containsRef(result.value().circular_cells, "A1"));
    EXPECT_TRUE(containsRef(result.value().circular_cells, "B1"));
}

// 测试自引用
TEST_F(RecalcTest, SelfReferenceIsCircular) {
    input("A1", "=A1+1");
    EXPECT_EQ(valueAt("A1"), CellValue::error(ErrorCode::CircularReference));

    input("B1", "=SUM(B1:B5)");
    EXPECT_EQ(valueAt("B1"), CellValue::error(ErrorCode::CircularReference));
}

// 测试打破循环后恢复正常计算
TEST_F(RecalcTest, BreakingCycleRecovers) {
    input("B1", "=A1+1");
    input("A1", "=B1+1");
    ASSERT_TRUE(valueAt("B1").isError());

    input("A1", "5");
    EXPECT_EQ(valueAt("B1"), CellValue::number(6));
    EXPECT_EQ(sheet.cellState(at("B1")), CellState::Clean);
}

// 测试依赖循环单元格的下游也得到错误
TEST_F(RecalcTest, DownstreamOfCycleGetsError) {
    input("A1", "=B1");
    input("B1", "=A1");
    input("C1", "=A1*2");
    EXPECT_EQ(valueAt("C1"), CellValue::error(ErrorCode::CircularReference));
}

// 测试求值错误存入单元格而不是返回给写入方
TEST_F(RecalcTest, EvaluationErrorsAreStoredInCell) {
    auto result = sheet.setCellFormula(at("A1"), "=1/0");
    ASSERT_TRUE(result);
    EXPECT_EQ(valueAt("A1"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(sheet.cellState(at("A1")), CellState::Error);
    EXPECT_EQ(valueAt("A1").toDisplayString(), "#div-by-zero!");

    input("B1", "=NOSUCH()");
    EXPECT_EQ(valueAt("B1"), CellValue::error(ErrorCode::UnknownFunction));

    input("C1", "=A1+1");
    EXPECT_EQ(valueAt("C1"), CellValue::error(ErrorCode::DivByZero));
}

// 测试解析失败的公式被拒绝且保留原值
TEST_F(RecalcTest, RejectedFormulaKeepsPriorValue) {
    input("A1", "42");
    auto result = sheet.setCellFormula(at("A1"), "=1+");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidSyntax);
    EXPECT_EQ(valueAt("A1"), CellValue::number(42));
    EXPECT_FALSE(sheet.getCell(at("A1"))->isFormula());

    auto bad_ref = sheet.setCellFormula(at("A1"), "=Sheet2!A1");
    ASSERT_FALSE(bad_ref);
    EXPECT_EQ(bad_ref.error().code, ErrorCode::InvalidRef);

    auto no_prefix = sheet.setCellFormula(at("B1"), "A1+1");
    ASSERT_FALSE(no_prefix);
    EXPECT_FALSE(sheet.hasCellAt(at("B1")));
}

// 测试公式被字面量覆盖后依赖关系被移除
TEST_F(RecalcTest, OverwritingFormulaDetachesIt) {
    input("A1", "1");
    input("B1", "=A1+1");
    EXPECT_EQ(sheet.getFormulaCount(), 1u);

    input("B1", "hello");
    EXPECT_EQ(sheet.getFormulaCount(), 0u);
    sheet.setCellValue(at("A1"), CellValue::number(100));
    EXPECT_EQ(valueAt("B1"), CellValue::text("hello"));
}

// 测试清除被引用的单元格
TEST_F(RecalcTest, ClearingPrecedentRecomputes) {
    input("A1", "9");
    input("B1", "=A1+1");
    auto result = sheet.clearCell(at("A1"));
    EXPECT_FALSE(sheet.hasCellAt(at("A1")));
    EXPECT_EQ(valueAt("B1"), CellValue::number(1));
    EXPECT_EQ(result.changed_cells.front(), at("A1"));
    EXPECT_TRUE(containsRef(result.changed_cells, "B1"));
}

// 测试公式保留原有样式
TEST_F(RecalcTest, WritesKeepStyle) {
    input("A1", "1");
    sheet.getCellMutable(at("A1"))->style.italic = true;
    input("A1", "=2+2");
    EXPECT_EQ(sheet.getCell(at("A1"))->style.italic, true);
    sheet.setCellValue(at("A1"), CellValue::number(3));
    EXPECT_EQ(sheet.getCell(at("A1"))->style.italic, true);
}

// 测试手动模式：写入只标记 Dirty，读取时按需求值
TEST_F(RecalcTest, ManualModeEvaluatesLazily) {
    CalcOptions options;
    options.auto_recalculate = false;
    sheet.setOptions(options);

    input("A1", "1");
    input("B1", "=A1+1");
    input("C1", "=B1*10");
    EXPECT_TRUE(sheet.isDirty(at("B1")));
    EXPECT_TRUE(sheet.isDirty(at("C1")));
    EXPECT_EQ(sheet.getDirtyCount(), 2u);

    // 读取 C1 会先刷新它依赖的 B1
    EXPECT_EQ(valueAt("C1"), CellValue::number(20));
    EXPECT_FALSE(sheet.isDirty(at("B1")));
    EXPECT_EQ(sheet.getDirtyCount(), 0u);

    auto write = sheet.setCellValue(at("A1"), CellValue::number(2));
    ASSERT_EQ(write.changed_cells.size(), 1u);
    EXPECT_TRUE(sheet.isDirty(at("B1")));
    EXPECT_TRUE(sheet.isDirty(at("C1")));

    auto recalc = sheet.recalculate();
    EXPECT_EQ(sheet.getDirtyCount(), 0u);
    EXPECT_TRUE(containsRef(recalc.changed_cells, "B1"));
    EXPECT_TRUE(containsRef(recalc.changed_cells, "C1"));
    EXPECT_EQ(valueAt("C1"), CellValue::number(30));

    EXPECT_TRUE(sheet.recalculate().empty());
}

// 测试手动模式下读取时求值产生的变化由下一次重算报告
TEST_F(RecalcTest, ManualModeReportsOnDemandChanges) {
    CalcOptions options;
    options.auto_recalculate = false;
    sheet.setOptions(options);

    input("A1", "1");
    input("B1", "=A1+1");
    input("C1", "=B1*2");
    EXPECT_EQ(valueAt("B1"), CellValue::number(2));
    sheet.recalculate();
    EXPECT_TRUE(sheet.recalculate().empty());

    sheet.setCellValue(at("A1"), CellValue::number(5));
    EXPECT_EQ(valueAt("B1"), CellValue::number(6));
    EXPECT_FALSE(sheet.isDirty(at("B1")));
    EXPECT_TRUE(sheet.isDirty(at("C1")));

    auto recalc = sheet.recalculate();
    EXPECT_TRUE(containsRef(recalc.changed_cells, "B1"));
    EXPECT_TRUE(containsRef(recalc.changed_cells, "C1"));
    EXPECT_EQ(recalc.changed_cells.size(), 2u);
    EXPECT_TRUE(sheet.recalculate().empty());

    // 没有脏单元格时也会报告
    sheet.setCellValue(at("A1"), CellValue::number(7));
    EXPECT_EQ(valueAt("C1"), CellValue::number(16));
    EXPECT_EQ(sheet.getDirtyCount(), 0u);
    recalc = sheet.recalculate();
    EXPECT_TRUE(containsRef(recalc.changed_cells, "B1"));
    EXPECT_TRUE(containsRef(recalc.changed_cells, "C1"));
}

// 测试手动模式下的循环引用
TEST_F(RecalcTest, ManualModeDetectsCycles) {
    CalcOptions options;
    options.auto_recalculate = false;
    sheet.setOptions(options);

    input("B1", "=A1+1");
    input("A1", "=B1+1");
    EXPECT_EQ(valueAt("A1"), CellValue::error(ErrorCode::CircularReference));
    EXPECT_EQ(valueAt("B1"), CellValue::error(ErrorCode::CircularReference));
}

// 测试依赖深度按整张图计算
TEST_F(RecalcTest, DepthLimit) {
    CalcOptions options;
    options.max_dependency_depth = 5;
    sheet.setOptions(options);

    input("A1", "0");
    for (uint32_t row = 1; row <= 8; ++row) {
        std::string formula = "=" + CellRef(row - 1, 0).toA1() + "+1";
        ASSERT_TRUE(sheet.setCellFormula(CellRef(row, 0), formula));
    }
    EXPECT_EQ(valueAt("A6"), CellValue::number(5));
    EXPECT_EQ(valueAt("A7"), CellValue::error(ErrorCode::DepthLimitExceeded));
    EXPECT_EQ(valueAt("A9"), CellValue::error(ErrorCode::DepthLimitExceeded));

    sheet.setCellValue(at("A1"), CellValue::number(100));
    EXPECT_EQ(valueAt("A6"), CellValue::number(105));
    EXPECT_EQ(valueAt("A7"), CellValue::error(ErrorCode::DepthLimitExceeded));
    EXPECT_EQ(valueAt("A9"), CellValue::error(ErrorCode::DepthLimitExceeded));

    // 重写链中间的单元格不会绕过限制
    ASSERT_TRUE(sheet.setCellFormula(at("A7"), "=A6+1"));
    EXPECT_EQ(valueAt("A7"), CellValue::error(ErrorCode::DepthLimitExceeded));
    EXPECT_EQ(valueAt("A9"), CellValue::error(ErrorCode::DepthLimitExceeded));
}

// 测试深度限制的结果与编辑顺序无关
TEST_F(RecalcTest, DepthLimitIgnoresEditOrder) {
    CalcOptions options;
    options.max_dependency_depth = 5;
    sheet.setOptions(options);

    Sheet reversed("Reversed", options);
    for (uint32_t row = 8; row >= 1; --row) {
        std::string formula = "=" + CellRef(row - 1, 0).toA1() + "+1";
        ASSERT_TRUE(reversed.setCellFormula(CellRef(row, 0), formula));
    }
    reversed.setCellValue(at("A1"), CellValue::number(100));

    input("A1", "100");
    for (uint32_t row = 1; row <= 8; ++row) {
        std::string formula = "=" + CellRef(row - 1, 0).toA1() + "+1";
        ASSERT_TRUE(sheet.setCellFormula(CellRef(row, 0), formula));
    }

    for (uint32_t row = 0; row <= 8; ++row) {
        EXPECT_EQ(reversed.getCellValue(CellRef(row, 0)), sheet.getCellValue(CellRef(row, 0)))
            << CellRef(row, 0).toA1();
    }
    EXPECT_EQ(reversed.getCellValue(at("A6")), CellValue::number(105));
}

// 测试写入的单元格即使位于环上也排在最前
TEST_F(RecalcTest, WrittenCellIsReportedFirst) {
    input("A1", "=B1");
    auto result = sheet.setCellFormula(at("B1"), "=A1");
    ASSERT_TRUE(result);
    const auto& changed = result.value().changed_cells;
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed.front(), at("B1"));
    EXPECT_EQ(changed.back(), at("A1"));
    EXPECT_EQ(result.value().circular_cells.size(), 2u);
}

// 测试长依赖链按迭代方式求值
TEST_F(RecalcTest, LongChainDoesNotOverflow) {
    input("A1", "1");
    const uint32_t length = 3000;
    for (uint32_t row = 1; row < length; ++row) {
        std::string formula = "=" + CellRef(row - 1, 0).toA1() + "+1";
        ASSERT_TRUE(sheet.setCellFormula(CellRef(row, 0), formula));
    }
    EXPECT_EQ(sheet.getCellValue(CellRef(length - 1, 0)), CellValue::number(length));

    sheet.setCellValue(at("A1"), CellValue::number(0));
    EXPECT_EQ(sheet.getCellValue(CellRef(length - 1, 0)), CellValue::number(length - 1));
}

// 测试编辑器输入的分类
TEST_F(RecalcTest, SetCellInputClassifiesText) {
    input("A1", "12.5");
    input("A2", "true");
    input("A3", "note");
    input("A4", "=A1*2");
    EXPECT_EQ(valueAt("A1"), CellValue::number(12.5));
    EXPECT_EQ(valueAt("A2"), CellValue::boolean(true));
    EXPECT_EQ(valueAt("A3"), CellValue::text("note"));
    EXPECT_EQ(valueAt("A4"), CellValue::number(25));

    input("A3", "");
    EXPECT_FALSE(sheet.hasCellAt(at("A3")));
}
