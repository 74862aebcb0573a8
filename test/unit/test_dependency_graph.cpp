#include <gtest/gtest.h>
#include "gridcalc/formula/DependencyGraph.hpp"
#include <algorithm>
#include <unordered_map>

using namespace gridcalc::formula;
using gridcalc::core::CellRef;
using gridcalc::core::CellRange;

namespace {

CellRef ref(const char* a1) {
    return *CellRef::parse(a1);
}

CellRange range(const char* text) {
    return *CellRange::parse(text);
}

size_t positionOf(const DependencyGraph::RecalcPlan& plan, const CellRef& cell) {
    auto it = std::find_if(plan.order.begin(), plan.order.end(),
                           [&](const auto& entry) { return entry.first == cell; });
    return static_cast<size_t>(it - plan.order.begin());
}

} // namespace

class DependencyGraphTest : public ::testing::Test {
protected:
    DependencyGraph graph;
};

// 测试单格与区域依赖者查询
TEST_F(DependencyGraphTest, DirectDependents) {
    graph.setDependencies(ref("C1"), {ref("A1"), ref("B1")}, {});
    graph.setDependencies(ref("D1"), {}, {range("A1:A10")});
    graph.setDependencies(ref("E1"), {ref("A1"), ref("A1")}, {range("A1:B1")});

    std::vector<CellRef> expected = {ref("C1"), ref("D1"), ref("E1")};
    EXPECT_EQ(graph.directDependents(ref("A1")), expected);

    std::vector<CellRef> only_c1_e1 = {ref("C1"), ref("E1")};
    EXPECT_EQ(graph.directDependents(ref("B1")), only_c1_e1);

    std::vector<CellRef> only_d1 = {ref("D1")};
    EXPECT_EQ(graph.directDependents(ref("A5")), only_d1);
    EXPECT_TRUE(graph.directDependents(ref("Z9")).empty());
    EXPECT_EQ(graph.size(), 3u);
}

// 测试重新设置依赖会替换旧的边
TEST_F(DependencyGraphTest, SetDependenciesReplacesEdges) {
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("B1"), {ref("A2")}, {});

    EXPECT_TRUE(graph.directDependents(ref("A1")).empty());
    EXPECT_EQ(graph.directDependents(ref("A2")).size(), 1u);

    const auto* precedents = graph.precedents(ref("B1"));
    ASSERT_NE(precedents, nullptr);
    ASSERT_EQ(precedents->cells.size(), 1u);
    EXPECT_EQ(precedents->cells[0], ref("A2"));
}

// 测试移除依赖
TEST_F(DependencyGraphTest, RemoveDependencies) {
    graph.setDependencies(ref("B1"), {ref("A1")}, {range("C1:C3")});
    EXPECT_TRUE(graph.hasDependencies(ref("B1")));

    graph.removeDependencies(ref("B1"));
    EXPECT_FALSE(graph.hasDependencies(ref("B1")));
    EXPECT_EQ(graph.precedents(ref("B1")), nullptr);
    EXPECT_TRUE(graph.directDependents(ref("A1")).empty());
    EXPECT_TRUE(graph.directDependents(ref("C2")).empty());

    graph.setDependencies(ref("B2"), {ref("A1")}, {});
    graph.clear();
    EXPECT_EQ(graph.size(), 0u);
}

// 测试传递依赖收集
TEST_F(DependencyGraphTest, CollectAffected) {
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("C1"), {ref("B1")}, {});
    graph.setDependencies(ref("D1"), {}, {range("B1:C1")});
    graph.setDependencies(ref("Z1"), {ref("Y1")}, {});

    auto affected = graph.collectAffected({ref("A1")});
    EXPECT_EQ(affected.size(), 4u);
    EXPECT_TRUE(affected.count(ref("A1")) > 0);
    EXPECT_TRUE(affected.count(ref("D1")) > 0);
    EXPECT_EQ(affected.count(ref("Z1")), 0u);
}

// 测试拓扑序：每个单元格在它的依赖之后，且只出现一次
TEST_F(DependencyGraphTest, PlanOrdersDiamond) {
    // A1 -> B1, A1 -> C1, B1 + C1 -> D1
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("C1"), {ref("A1")}, {});
    graph.setDependencies(ref("D1"), {ref("B1"), ref("C1")}, {});

    auto plan = graph.plan(graph.collectAffected({ref("A1")}));
    ASSERT_EQ(plan.order.size(), 4u);
    EXPECT_TRUE(plan.cyclic.empty());

    EXPECT_EQ(plan.order.front().first, ref("A1"));
    EXPECT_LT(positionOf(plan, ref("B1")), positionOf(plan, ref("D1")));
    EXPECT_LT(positionOf(plan, ref("C1")), positionOf(plan, ref("D1")));
    EXPECT_EQ(plan.order.back().first, ref("D1"));
    EXPECT_EQ(plan.order.back().second, 2u);
}

// 测试链深度
TEST_F(DependencyGraphTest, PlanReportsChainDepth) {
    graph.setDependencies(ref("A2"), {ref("A1")}, {});
    graph.setDependencies(ref("A3"), {ref("A2")}, {});
    graph.setDependencies(ref("A4"), {ref("A3"), ref("A1")}, {});

    auto plan = graph.plan(graph.collectAffected({ref("A1")}));
    ASSERT_EQ(plan.order.size(), 4u);
    for (size_t i = 0; i < plan.order.size(); ++i) {
        EXPECT_EQ(plan.order[i].second, i);
    }
}

// 测试环检测：环及其下游进入 cyclic，其他节点正常排序
TEST_F(DependencyGraphTest, PlanDetectsCycles) {
    graph.setDependencies(ref("A1"), {ref("B1")}, {});
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("C1"), {ref("B1")}, {});
    graph.setDependencies(ref("E1"), {ref("D1")}, {});

    std::unordered_set<CellRef> nodes = {ref("A1"), ref("B1"), ref("C1"), ref("D1"), ref("E1")};
    auto plan = graph.plan(nodes);

    std::vector<CellRef> expected_cycle = {ref("A1"), ref("B1"), ref("C1")};
    EXPECT_EQ(plan.cyclic, expected_cycle);
    ASSERT_EQ(plan.order.size(), 2u);
    EXPECT_EQ(plan.order[0].first, ref("D1"));
    EXPECT_EQ(plan.order[1].first, ref("E1"));
}

// 测试自引用
TEST_F(DependencyGraphTest, SelfReferenceIsCycle) {
    graph.setDependencies(ref("A1"), {}, {range("A1:A3")});
    auto plan = graph.plan(graph.collectAffected({ref("A1")}));
    EXPECT_TRUE(plan.order.empty());
    ASSERT_EQ(plan.cyclic.size(), 1u);
    EXPECT_EQ(plan.cyclic[0], ref("A1"));
}

// 测试计划只考虑节点集合内部的边
TEST_F(DependencyGraphTest, PlanIgnoresEdgesOutsideNodeSet) {
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("C1"), {ref("B1")}, {});

    auto plan = graph.plan({ref("C1")});
    ASSERT_EQ(plan.order.size(), 1u);
    EXPECT_EQ(plan.order[0].first, ref("C1"));
    EXPECT_EQ(plan.order[0].second, 0u);
}

// 测试长链不会导致递归过深
TEST_F(DependencyGraphTest, LongChainIsIterative) {
    const uint32_t length = 20000;
    for (uint32_t row = 1; row < length; ++row) {
        graph.setDependencies(CellRef(row, 0), {CellRef(row - 1, 0)}, {});
    }
    auto plan = graph.plan(graph.collectAffected({CellRef(0, 0)}));
    ASSERT_EQ(plan.order.size(), length);
    EXPECT_EQ(plan.order.back().first, CellRef(length - 1, 0));
    EXPECT_EQ(plan.order.back().second, length - 1);
}

// 测试依赖深度按整张图计算，与起点无关
TEST_F(DependencyGraphTest, DepthOfUsesWholeGraph) {
    graph.setDependencies(ref("A2"), {ref("A1")}, {});
    graph.setDependencies(ref("A3"), {ref("A2")}, {});
    graph.setDependencies(ref("A4"), {ref("A3"), ref("Z9")}, {});
    graph.setDependencies(ref("B1"), {}, {range("A1:A4")});

    std::unordered_map<CellRef, size_t> memo;
    EXPECT_EQ(graph.depthOf(ref("A1"), memo), 0u);
    EXPECT_EQ(graph.depthOf(ref("A4"), memo), 3u);
    EXPECT_EQ(graph.depthOf(ref("B1"), memo), 4u);

    // 只从 A3 开始的重算计划里 A4 的层级是 1，但深度仍是 3
    auto plan = graph.plan(graph.collectAffected({ref("A3")}));
    std::unordered_map<CellRef, size_t> fresh;
    EXPECT_EQ(graph.depthOf(ref("A4"), fresh), 3u);
    EXPECT_EQ(plan.order[positionOf(plan, ref("A4"))].second, 1u);
}

// 测试环上的边在计算深度时被忽略
TEST_F(DependencyGraphTest, DepthOfToleratesCycles) {
    graph.setDependencies(ref("A1"), {ref("B1")}, {});
    graph.setDependencies(ref("B1"), {ref("A1")}, {});
    graph.setDependencies(ref("C1"), {ref("B1")}, {});

    std::unordered_map<CellRef, size_t> memo;
    EXPECT_EQ(graph.depthOf(ref("C1"), memo), 3u);
}

// 测试长链的深度计算不递归
TEST_F(DependencyGraphTest, DepthOfLongChain) {
    const uint32_t length = 20000;
    for (uint32_t row = 1; row < length; ++row) {
        graph.setDependencies(CellRef(row, 0), {CellRef(row - 1, 0)}, {});
    }
    std::unordered_map<CellRef, size_t> memo;
    EXPECT_EQ(graph.depthOf(CellRef(length - 1, 0), memo), length - 1);
}
