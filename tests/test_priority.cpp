#include <gtest/gtest.h>
#include <libprecise++/algorithms/priority.hpp>

using namespace libprecise;

class PriorityTest : public ::testing::Test {
protected:
    void SetUp() override {
        coverage_.status = CoverageStatus::COVERED;
        coverage_.valid_products["COD"] = {{"MGX", "RAP"}, {"MGX", "ULT"}, {"OPS", "FIN"}};
        coverage_.valid_products["EMR"] = {{"OPS", "FIN"}};

        table_.project_types = {"MGX", "OPS"};
        table_.solution_types = {"FIN", "RAP", "ULT"};
    }

    CoverageResult coverage_;
    PriorityTable table_;
};

TEST_F(PriorityTest, ProjectPriorityIsOutermost) {
    // FIN exists only under OPS; MGX wins because project types are ranked first
    auto selected = selectOptimal(coverage_, "COD", table_);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, ProductCombination("MGX", "RAP"));
}

TEST_F(PriorityTest, FallsBackToNextProjectType) {
    auto selected = selectOptimal(coverage_, "EMR", table_);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, ProductCombination("OPS", "FIN"));
}

TEST_F(PriorityTest, NoPreferenceIsNotAnError) {
    // Default table only knows MGX
    EXPECT_FALSE(selectOptimal(coverage_, "EMR", PriorityTable::defaults()).has_value());

    // Unknown center
    EXPECT_FALSE(selectOptimal(coverage_, "JPL", table_).has_value());

    // Empty priority lists
    EXPECT_FALSE(selectOptimal(coverage_, "COD", PriorityTable{}).has_value());
}

TEST_F(PriorityTest, DefaultTable) {
    auto defaults = PriorityTable::defaults();
    EXPECT_EQ(defaults.project_types, std::vector<std::string>{"MGX"});
    EXPECT_EQ(defaults.solution_types, (std::vector<std::string>{"FIN", "RAP", "ULT"}));

    std::vector<ProductCombination> combinations = {{"MGX", "ULT"}, {"MGX", "FIN"}, {"MGX", "RAP"}};
    auto selected = selectOptimal(combinations, defaults);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, ProductCombination("MGX", "FIN"));
}

TEST_F(PriorityTest, SolutionOrderFollowsTable) {
    std::vector<ProductCombination> combinations = {{"MGX", "FIN"}, {"MGX", "ULT"}};

    PriorityTable ultra_first;
    ultra_first.project_types = {"MGX"};
    ultra_first.solution_types = {"ULT", "FIN"};

    auto selected = selectOptimal(combinations, ultra_first);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, ProductCombination("MGX", "ULT"));
}

TEST_F(PriorityTest, UnlistedSolutionTypesAreNeverPicked) {
    std::vector<ProductCombination> combinations = {{"MGX", "PRD"}};
    EXPECT_FALSE(selectOptimal(combinations, table_).has_value());
}
