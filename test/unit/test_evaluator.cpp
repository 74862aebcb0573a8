#include <gtest/gtest.h>
#include "gridcalc/formula/Formula.hpp"
#include "gridcalc/formula/Evaluator.hpp"
#include "gridcalc/formula/EvaluationContext.hpp"
#include <map>
#include <string>

using namespace gridcalc::formula;
using gridcalc::core::CellRef;
using gridcalc::core::CellRange;
using gridcalc::core::CellValue;
using gridcalc::core::ErrorCode;

class EvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cells[*CellRef::parse("A1")] = CellValue::number(10);
        cells[*CellRef::parse("A2")] = CellValue::number(20);
        cells[*CellRef::parse("A3")] = CellValue::number(30);
        cells[*CellRef::parse("B1")] = CellValue::text("abc");
        cells[*CellRef::parse("B2")] = CellValue::boolean(true);
        cells[*CellRef::parse("B3")] = CellValue::error(ErrorCode::DivByZero);
        cells[*CellRef::parse("C1")] = CellValue::text("5");
    }

    // 求值公式，求值错误转换为错误值返回，解析错误直接判失败
    CellValue eval(const std::string& text) {
        auto formula = Formula::parse(text);
        EXPECT_TRUE(formula) << text << ": " << formula.error().fullMessage();
        if (!formula) {
            return CellValue::error("parse-failed");
        }
        CallbackContext context([this](const CellRef& ref) -> std::optional<CellValue> {
            auto it = cells.find(ref);
            if (it == cells.end()) {
                return std::nullopt;
            }
            return it->second;
        });
        auto result = formula.value().evaluate(context);
        if (!result) {
            return CellValue::error(result.error().code);
        }
        return result.value();
    }

    std::map<CellRef, CellValue> cells;
};

// 测试算术运算
TEST_F(EvaluatorTest, Arithmetic) {
    EXPECT_EQ(eval("=1+2*3"), CellValue::number(7));
    EXPECT_EQ(eval("=(1+2)*3"), CellValue::number(9));
    EXPECT_EQ(eval("=A1+A2"), CellValue::number(30));
    EXPECT_EQ(eval("=A3/A1"), CellValue::number(3));
    EXPECT_EQ(eval("=10-4-3"), CellValue::number(3));
    EXPECT_EQ(eval("=2^3^2"), CellValue::number(64));
    EXPECT_EQ(eval("=-2^2"), CellValue::number(4));
    EXPECT_EQ(eval("=50%"), CellValue::number(0.5));
    EXPECT_EQ(eval("=+A1"), CellValue::number(10));
}

// 测试操作数转换
TEST_F(EvaluatorTest, OperandCoercion) {
    EXPECT_EQ(eval("=C1*2"), CellValue::number(10));
    EXPECT_EQ(eval("=B2+1"), CellValue::number(2));
    EXPECT_EQ(eval("=Z99+1"), CellValue::number(1));
    EXPECT_EQ(eval("=B1+1"), CellValue::error(ErrorCode::TypeError));
    EXPECT_EQ(eval("=-B1"), CellValue::error(ErrorCode::TypeError));
}

// 测试除零与非有限结果
TEST_F(EvaluatorTest, DivisionByZero) {
    EXPECT_EQ(eval("=1/0"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=A1/Z1"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=10^400"), CellValue::error(ErrorCode::InvalidArgument));
}

// 测试错误值沿运算传播
TEST_F(EvaluatorTest, ErrorPropagation) {
    EXPECT_EQ(eval("=B3+1"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=1+B3"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=B3=1"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=-B3"), CellValue::error(ErrorCode::DivByZero));
}

// 测试字符串连接使用显示形式
TEST_F(EvaluatorTest, Concatenation) {
    EXPECT_EQ(eval("=\"a\"&\"b\""), CellValue::text("ab"));
    EXPECT_EQ(eval("=B1&A1"), CellValue::text("abc10"));
    EXPECT_EQ(eval("=B2&Z9"), CellValue::text("TRUE"));
    EXPECT_EQ(eval("=1/4&\"\""), CellValue::text("0.25"));
}

// 测试连接运算把错误值拼成 #kind! 文本而不传播
TEST_F(EvaluatorTest, ConcatenationShowsErrors) {
    EXPECT_EQ(eval("=\"x\"&B3"), CellValue::text("x#div-by-zero!"));
    EXPECT_EQ(eval("=B3&\"x\""), CellValue::text("#div-by-zero!x"));
    EXPECT_EQ(eval("=\"x\"&(1/0)"), CellValue::text("x#div-by-zero!"));
    EXPECT_EQ(eval("=NOSUCH()&1"), CellValue::text("#unknown-function!1"));
    EXPECT_EQ(eval("=CONCATENATE(\"a\", B3, 1/0)"), CellValue::text("a#div-by-zero!#div-by-zero!"));
    EXPECT_EQ(eval("=(\"x\"&B3)+1"), CellValue::error(ErrorCode::TypeError));
}

// 测试比较运算
TEST_F(EvaluatorTest, Comparisons) {
    EXPECT_EQ(eval("=A1<A2"), CellValue::boolean(true));
    EXPECT_EQ(eval("=A1>=A2"), CellValue::boolean(false));
    EXPECT_EQ(eval("=A1=10"), CellValue::boolean(true));
    EXPECT_EQ(eval("=A1<>10"), CellValue::boolean(false));
    EXPECT_EQ(eval("=\"abc\"=\"ABC\""), CellValue::boolean(true));
    EXPECT_EQ(eval("=\"apple\"<\"Banana\""), CellValue::boolean(true));
    EXPECT_EQ(eval("=FALSE<TRUE"), CellValue::boolean(true));
}

// 测试不同类型比较：永不相等
TEST_F(EvaluatorTest, MismatchedTypeComparisons) {
    EXPECT_EQ(eval("=C1=5"), CellValue::boolean(false));
    EXPECT_EQ(eval("=C1<>5"), CellValue::boolean(true));
    EXPECT_EQ(eval("=B2=1"), CellValue::boolean(false));
    EXPECT_EQ(eval("=A1<\"a\""), CellValue::boolean(false));
    EXPECT_EQ(eval("=A1>\"a\""), CellValue::boolean(false));
}

// 测试空单元格在比较中采用另一侧的类型
TEST_F(EvaluatorTest, EmptyComparisons) {
    EXPECT_EQ(eval("=Z1=0"), CellValue::boolean(true));
    EXPECT_EQ(eval("=Z1=\"\""), CellValue::boolean(true));
    EXPECT_EQ(eval("=Z1=FALSE"), CellValue::boolean(true));
    EXPECT_EQ(eval("=Z1=Z2"), CellValue::boolean(true));
    EXPECT_EQ(eval("=Z1<1"), CellValue::boolean(true));
}

// 测试区域在标量位置
TEST_F(EvaluatorTest, RangeInScalarPosition) {
    EXPECT_EQ(eval("=A1:A1+1"), CellValue::number(11));
    EXPECT_EQ(eval("=A1:A3+1"), CellValue::error(ErrorCode::InvalidArgument));
}

// 测试未知函数与参数个数
TEST_F(EvaluatorTest, FunctionResolution) {
    EXPECT_EQ(eval("=NOSUCH(1)"), CellValue::error(ErrorCode::UnknownFunction));
    EXPECT_EQ(eval("=sum(A1:A3)"), CellValue::number(60));
    EXPECT_EQ(eval("=Avg(A1:A3)"), CellValue::number(20));
    EXPECT_EQ(eval("=ABS()"), CellValue::error(ErrorCode::InvalidArgument));
    EXPECT_EQ(eval("=ABS(1,2)"), CellValue::error(ErrorCode::InvalidArgument));
    EXPECT_EQ(eval("=MID(\"abc\",1)"), CellValue::error(ErrorCode::InvalidArgument));
    EXPECT_EQ(eval("=TRUE()"), CellValue::boolean(true));
    EXPECT_EQ(eval("=FALSE()"), CellValue::boolean(false));
}

// 测试 IF 只对选中的分支求值
TEST_F(EvaluatorTest, IfIsLazy) {
    EXPECT_EQ(eval("=IF(A1>5, \"big\", 1/0)"), CellValue::text("big"));
    EXPECT_EQ(eval("=IF(A1>50, 1/0, \"small\")"), CellValue::text("small"));
    EXPECT_EQ(eval("=IF(0, 1)"), CellValue::boolean(false));
    EXPECT_EQ(eval("=IF(\"true\", 1, 2)"), CellValue::number(1));
    EXPECT_EQ(eval("=IF(Z1, 1, 2)"), CellValue::number(2));
    EXPECT_EQ(eval("=IF(B3, 1, 2)"), CellValue::error(ErrorCode::DivByZero));
}

// 测试标量函数遇到错误参数时原样返回
TEST_F(EvaluatorTest, ScalarFunctionErrorArguments) {
    EXPECT_EQ(eval("=ABS(B3)"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=LEN(1/0)"), CellValue::error(ErrorCode::DivByZero));
    EXPECT_EQ(eval("=ROUND(1.5, \"x\")"), CellValue::error(ErrorCode::InvalidArgument));
}

// 测试固定时钟下的 TODAY/NOW
TEST(EvaluatorClockTest, TodayAndNowUseContextClock) {
    auto formula_today = Formula::parse("=TODAY()");
    auto formula_now = Formula::parse("=NOW()");
    ASSERT_TRUE(formula_today);
    ASSERT_TRUE(formula_now);

    CallbackContext context(nullptr);
    // 1970-01-02 12:00:00 UTC
    context.setNow(std::chrono::system_clock::time_point(std::chrono::hours(36)));

    auto today = formula_today.value().evaluate(context);
    ASSERT_TRUE(today);
    EXPECT_EQ(today.value(), CellValue::date(1));

    auto now = formula_now.value().evaluate(context);
    ASSERT_TRUE(now);
    EXPECT_DOUBLE_EQ(now.value().numberValue(), 1.5);
}

// 测试静态运算接口
TEST(EvaluatorStaticTest, ApplyOperators) {
    auto sum = Evaluator::applyBinary(BinaryOp::Add, CellValue::number(1), CellValue::text("2"));
    ASSERT_TRUE(sum);
    EXPECT_EQ(sum.value(), CellValue::number(3));

    auto date_plus = Evaluator::applyBinary(BinaryOp::Add, CellValue::date(10), CellValue::number(1));
    ASSERT_TRUE(date_plus);
    EXPECT_EQ(date_plus.value(), CellValue::number(11));

    EXPECT_EQ(Evaluator::compare(BinaryOp::Eq, CellValue::date(3), CellValue::number(3)),
              CellValue::boolean(true));

    auto percent = Evaluator::applyUnary(UnaryOp::Percent, CellValue::number(25));
    ASSERT_TRUE(percent);
    EXPECT_EQ(percent.value(), CellValue::number(0.25));
}
