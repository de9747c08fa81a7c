#include <gtest/gtest.h>
#include "hierarchy/Leveling.hpp"
#include "OdooFixture.hpp"

namespace canopy {
namespace test {

static std::vector<std::string> codes(const std::vector<Node>& nodes) {
    std::vector<std::string> out;
    for (const auto& n : nodes) out.push_back(n.external_code);
    return out;
}

TEST(LevelingTest, ShallowBeforeDeep) {
    std::vector<Node> nodes = {node("C", "B", "", 3), node("A", "0", "", 1), node("B", "A", "", 2)};
    auto ordered = level_order(nodes);
    EXPECT_EQ(codes(ordered), (std::vector<std::string>{"A", "B", "C"}));
}

TEST(LevelingTest, UnleveledNodesGoLast) {
    std::vector<Node> nodes = {node("X", "0"), node("B", "A", "", 2), node("A", "0", "", 1)};
    auto ordered = level_order(nodes);
    EXPECT_EQ(codes(ordered), (std::vector<std::string>{"A", "B", "X"}));
}

TEST(LevelingTest, TiesBrokenByCode) {
    std::vector<Node> nodes = {node("20", "1", "", 2), node("10", "1", "", 2), node("15", "1", "", 2)};
    auto ordered = level_order(nodes);
    EXPECT_EQ(codes(ordered), (std::vector<std::string>{"10", "15", "20"}));
}

TEST(LevelingTest, OrderIndependentOfInputPermutation) {
    std::vector<Node> a = {node("A", "0", "", 1), node("B", "A", "", 2), node("C", "B"),
                           node("D", "A", "", 2)};
    std::vector<Node> b = {a[3], a[2], a[0], a[1]};
    EXPECT_EQ(codes(level_order(a)), codes(level_order(b)));
}

TEST(LevelingTest, CompareIsStrictWeak) {
    Node a = node("A", "0", "", 1);
    EXPECT_FALSE(level_before(a, a));
    Node b = node("B", "0");
    EXPECT_TRUE(level_before(a, b));
    EXPECT_FALSE(level_before(b, a));
}

} // namespace test
} // namespace canopy
