#include <gtest/gtest.h>
#include "gridcalc/core/CellAddress.hpp"
#include "gridcalc/utils/AddressParser.hpp"
#include <vector>

using namespace gridcalc::core;
using gridcalc::utils::AddressParser;

// 测试基本 A1 解析
TEST(AddressParsingTest, ParseBasicAddresses) {
    auto b3 = CellRef::parse("B3");
    ASSERT_TRUE(b3.has_value());
    EXPECT_EQ(b3->row, 2u);
    EXPECT_EQ(b3->col, 1u);

    auto aa10 = CellRef::parse("aa10");
    ASSERT_TRUE(aa10.has_value());
    EXPECT_EQ(aa10->row, 9u);
    EXPECT_EQ(aa10->col, 26u);

    EXPECT_EQ(CellRef::parse("A1"), CellRef(0, 0));
    EXPECT_EQ(CellRef::parse("Z1"), CellRef(0, 25));
    EXPECT_EQ(CellRef::parse("AZ1"), CellRef(0, 51));
    EXPECT_EQ(CellRef::parse("ZZ1"), CellRef(0, 701));
    EXPECT_EQ(CellRef::parse("AAA1"), CellRef(0, 702));
}

// 测试首尾空白被忽略
TEST(AddressParsingTest, TrimsWhitespace) {
    EXPECT_EQ(CellRef::parse("  c7 "), CellRef(6, 2));
}

// 测试非法地址
TEST(AddressParsingTest, RejectsMalformedAddresses) {
    EXPECT_FALSE(CellRef::parse("").has_value());
    EXPECT_FALSE(CellRef::parse("A").has_value());
    EXPECT_FALSE(CellRef::parse("12").has_value());
    EXPECT_FALSE(CellRef::parse("A0").has_value());
    EXPECT_FALSE(CellRef::parse("A1B").has_value());
    EXPECT_FALSE(CellRef::parse("A-1").has_value());
    EXPECT_FALSE(CellRef::parse("1A").has_value());
    EXPECT_FALSE(CellRef::parse("A 1").has_value());
    EXPECT_FALSE(CellRef::parse("$A$1").has_value());
}

// 测试规范化输出
TEST(AddressParsingTest, ToA1IsCanonical) {
    EXPECT_EQ(CellRef(0, 0).toA1(), "A1");
    EXPECT_EQ(CellRef(2, 1).toA1(), "B3");
    EXPECT_EQ(CellRef(9, 26).toA1(), "AA10");
    EXPECT_EQ(CellRef::parse("a007")->toA1(), "A7");
}

// 测试列字母换算
TEST(AddressParsingTest, ColumnConversion) {
    EXPECT_EQ(AddressParser::columnStringToIndex("A"), 0u);
    EXPECT_EQ(AddressParser::columnStringToIndex("z"), 25u);
    EXPECT_EQ(AddressParser::columnStringToIndex("AA"), 26u);
    EXPECT_FALSE(AddressParser::columnStringToIndex("").has_value());
    EXPECT_FALSE(AddressParser::columnStringToIndex("A1").has_value());

    EXPECT_EQ(AddressParser::indexToColumnString(0), "A");
    EXPECT_EQ(AddressParser::indexToColumnString(25), "Z");
    EXPECT_EQ(AddressParser::indexToColumnString(26), "AA");
    EXPECT_EQ(AddressParser::indexToColumnString(701), "ZZ");
}

// 测试往返：parse(toA1(r)) == r，且再次输出不变
TEST(AddressParsingTest, RoundTrip) {
    const std::vector<uint32_t> samples = {0, 1, 25, 26, 27, 51, 52, 701, 702, 16383, 1048575, 0xFFFFFFFFu};
    for (uint32_t row : samples) {
        for (uint32_t col : samples) {
            CellRef ref(row, col);
            std::string a1 = ref.toA1();
            auto parsed = CellRef::parse(a1);
            ASSERT_TRUE(parsed.has_value()) << a1;
            EXPECT_EQ(*parsed, ref) << a1;
            EXPECT_EQ(parsed->toA1(), a1);
        }
    }
}

// 测试行优先排序
TEST(AddressParsingTest, RowMajorOrdering) {
    EXPECT_LT(CellRef(0, 5), CellRef(1, 0));
    EXPECT_LT(CellRef(1, 0), CellRef(1, 1));
    EXPECT_FALSE(CellRef(1, 1) < CellRef(1, 1));
}

// 测试区域构造与顺序无关
TEST(CellRangeTest, ConstructionIsOrderIndependent) {
    CellRef a(4, 0);
    CellRef b(1, 3);
    CellRange r1(a, b);
    CellRange r2(b, a);
    EXPECT_EQ(r1, r2);
    EXPECT_EQ(r1.start(), CellRef(1, 0));
    EXPECT_EQ(r1.end(), CellRef(4, 3));
}

// 测试区域解析
TEST(CellRangeTest, ParseRangeString) {
    auto range = CellRange::parse("A1:C5");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start(), CellRef(0, 0));
    EXPECT_EQ(range->end(), CellRef(4, 2));
    EXPECT_EQ(range->toRangeString(), "A1:C5");

    auto inverted = CellRange::parse("C5:A1");
    ASSERT_TRUE(inverted.has_value());
    EXPECT_EQ(inverted->toRangeString(), "A1:C5");

    EXPECT_FALSE(CellRange::parse("A1").has_value());
    EXPECT_FALSE(CellRange::parse("A1:").has_value());
    EXPECT_FALSE(CellRange::parse(":B2").has_value());
    EXPECT_FALSE(CellRange::parse("A1:B2:C3").has_value());
    EXPECT_FALSE(CellRange::parse("A1-B2").has_value());
}

// 测试包含关系（含边界）
TEST(CellRangeTest, ContainsIsInclusive) {
    CellRange range(CellRef(1, 1), CellRef(3, 2));
    EXPECT_TRUE(range.contains(CellRef(1, 1)));
    EXPECT_TRUE(range.contains(CellRef(3, 2)));
    EXPECT_TRUE(range.contains(CellRef(2, 1)));
    EXPECT_FALSE(range.contains(CellRef(0, 1)));
    EXPECT_FALSE(range.contains(CellRef(2, 3)));
    EXPECT_FALSE(range.contains(CellRef(4, 2)));
}

// 测试行优先遍历且可重复遍历
TEST(CellRangeTest, CellsAreRowMajorAndRestartable) {
    CellRange range(CellRef(0, 0), CellRef(1, 2));
    std::vector<CellRef> expected = {
        CellRef(0, 0), CellRef(0, 1), CellRef(0, 2),
        CellRef(1, 0), CellRef(1, 1), CellRef(1, 2)
    };

    auto view = range.cells();
    std::vector<CellRef> first(view.begin(), view.end());
    std::vector<CellRef> second(view.begin(), view.end());
    EXPECT_EQ(first, expected);
    EXPECT_EQ(second, expected);
    EXPECT_EQ(view.size(), 6u);
}

// 测试单格区域
TEST(CellRangeTest, SingleCellRange) {
    CellRange range = CellRange::single(CellRef(4, 4));
    EXPECT_TRUE(range.isSingleCell());
    EXPECT_EQ(range.cellCount(), 1u);

    std::vector<CellRef> cells;
    for (const auto& cell : range.cells()) {
        cells.push_back(cell);
    }
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0], CellRef(4, 4));
}

// 测试尺寸与相交
TEST(CellRangeTest, DimensionsAndIntersection) {
    CellRange range(CellRef(0, 0), CellRef(9, 3));
    EXPECT_EQ(range.rowCount(), 10u);
    EXPECT_EQ(range.colCount(), 4u);
    EXPECT_EQ(range.cellCount(), 40u);
    EXPECT_FALSE(range.isSingleCell());

    EXPECT_TRUE(range.intersects(CellRange(CellRef(9, 3), CellRef(12, 12))));
    EXPECT_FALSE(range.intersects(CellRange(CellRef(10, 0), CellRef(12, 3))));
}

// 测试区域遍历到坐标上限时正常结束
TEST(CellRangeTest, IterationAtCoordinateLimit) {
    const uint32_t max = 0xFFFFFFFFu;
    CellRange range(CellRef(max - 1, max - 1), CellRef(max, max));
    size_t count = 0;
    for (const auto& cell : range.cells()) {
        EXPECT_TRUE(range.contains(cell));
        ++count;
    }
    EXPECT_EQ(count, 4u);
}
