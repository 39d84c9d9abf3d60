#include <gtest/gtest.h>
#include <libprecise++/resolver.hpp>

using namespace libprecise;

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        // GPS week 2361 starts on 2025-04-06 (day 096)
        provider_.addLines(2360, {
            "COD0MGXFIN_20250950000_01D_01D_OSB.BIA.gz 2025:04:17 10:38:56    63.19KB",
            "COD0MGXFIN_20250950000_01D_05M_CLK.CLK.gz 2025:04:17 10:38:56  9.10MB",
            "COD0MGXFIN_20250950000_01D_05M_ORB.SP3.gz 2025:04:17 10:38:56  2.30MB",
            "COD0MGXRAP_20250950000_01D_05M_ORB.SP3.gz 2025:04:07 10:38:56  2.30MB",
            "README.txt",
        });
        provider_.addLines(2361, {
            "COD0MGXFIN_20250960000_01D_01D_OSB.BIA.gz",
            "COD0MGXFIN_20250960000_01D_05M_CLK.CLK.gz",
            "COD0MGXFIN_20250960000_01D_05M_ORB.SP3.gz",
            "COD0MGXRAP_20250960000_01D_01D_OSB.BIA.gz",
            "COD0MGXRAP_20250960000_01D_05M_CLK.CLK.gz",
            "COD0MGXRAP_20250960000_01D_05M_ORB.SP3.gz",
            "GFZ0MGXRAP_20250960000_01D_01D_OSB.BIA.gz",
            "GFZ0MGXRAP_20250960000_01D_05M_CLK.CLK.gz",
            "GFZ0MGXRAP_20250960000_01D_05M_ORB.SP3.gz",
        });
    }

    io::MemoryListingProvider provider_;
};

TEST_F(ResolverTest, EndToEndFromLines) {
    ProductResolver resolver;
    std::vector<std::string> lines = {
        "COD0MGXFIN_20250960000_01D_01D_OSB.BIA",
        "COD0MGXFIN_20250960000_01D_01D_OSB.CLK",
        "COD0MGXFIN_20250960000_01D_01D_OSB.SP3",
    };
    auto window = TimeWindow::fromStrings("2025-04-06_00:00:00", "2025-04-06_00:00:00");

    auto result = resolver.resolve(lines, window);

    ASSERT_TRUE(result.isCovered());
    EXPECT_EQ(result.analysisCenters(), std::vector<std::string>{"COD"});
    EXPECT_EQ(result.combinations("COD"), std::vector<ProductCombination>{ProductCombination("MGX", "FIN")});

    auto optimal = resolver.selectOptimal(result, "COD");
    ASSERT_TRUE(optimal.has_value());
    EXPECT_EQ(*optimal, ProductCombination("MGX", "FIN"));
}

TEST_F(ResolverTest, ResolveFromProvider) {
    ProductResolver resolver;
    // Both boundaries fall in week 2361
    auto window = TimeWindow::fromStrings("2025-04-06_00:00:00", "2025-04-06_12:00:00");

    auto result = resolver.resolve(provider_, window);

    ASSERT_TRUE(result.isCovered());
    EXPECT_EQ(result.combinations("COD"),
              (std::vector<ProductCombination>{{"MGX", "FIN"}, {"MGX", "RAP"}}));
    EXPECT_EQ(result.combinations("GFZ"), std::vector<ProductCombination>{ProductCombination("MGX", "RAP")});

    auto cod = resolver.selectOptimal(result, "COD");
    ASSERT_TRUE(cod.has_value());
    EXPECT_EQ(*cod, ProductCombination("MGX", "FIN"));

    auto gfz = resolver.selectOptimal(result, "GFZ");
    ASSERT_TRUE(gfz.has_value());
    EXPECT_EQ(*gfz, ProductCombination("MGX", "RAP"));

    auto stats = resolver.getStats();
    EXPECT_EQ(stats.weeks_fetched, 1u);
    EXPECT_EQ(stats.accepted_records, 9u);
    EXPECT_EQ(stats.rejected_lines, 0u);
    EXPECT_EQ(stats.candidates, 3u);
    EXPECT_EQ(stats.valid_combinations, 3u);
}

TEST_F(ResolverTest, WindowSpanningTwoWeeks) {
    ProductResolver resolver;
    // Saturday of week 2360 to Sunday of week 2361
    auto window = TimeWindow::fromStrings("2025-04-05_00:00:00", "2025-04-06_12:00:00");

    auto result = resolver.resolve(provider_, window);

    auto stats = resolver.getStats();
    EXPECT_EQ(stats.weeks_fetched, 2u);
    EXPECT_EQ(stats.total_lines, 14u);
    EXPECT_EQ(stats.accepted_records, 13u);
    EXPECT_EQ(stats.rejected_lines, 1u);
    EXPECT_EQ(stats.candidates, 3u);
    EXPECT_EQ(stats.valid_combinations, 2u);

    // COD RAP only has SP3 on day 095, which is settled at the window start
    ASSERT_TRUE(result.isCovered());
    EXPECT_TRUE(result.isValidCombination("COD", "MGX", "FIN"));
    EXPECT_FALSE(result.isValidCombination("COD", "MGX", "RAP"));
    EXPECT_TRUE(result.isValidCombination("GFZ", "MGX", "RAP"));
}

TEST_F(ResolverTest, NoCoverageIsAResultNotAnException) {
    ProductResolver resolver;
    auto window = TimeWindow::fromStrings("2025-04-06_00:00:00", "2025-04-08_00:00:00");

    CoverageResult result;
    ASSERT_NO_THROW(result = resolver.resolve(provider_, window));
    EXPECT_EQ(result.status, CoverageStatus::NO_COVERAGE);
    EXPECT_FALSE(resolver.selectOptimal(result, "COD").has_value());
}

TEST_F(ResolverTest, EmptyBatch) {
    ProductResolver resolver;
    auto window = TimeWindow::fromStrings("2025-04-06_00:00:00", "2025-04-06_00:00:00");

    auto result = resolver.resolve(std::vector<std::string>{}, window);

    EXPECT_EQ(result.status, CoverageStatus::NO_COVERAGE);
    EXPECT_EQ(resolver.getStats().total_lines, 0u);
}

TEST_F(ResolverTest, InvertedWindowSkipsFetch) {
    ProductResolver resolver;
    Timestamp start, end;
    ASSERT_TRUE(time_utils::parseDateTime("2025-04-07_00:00:00", start));
    ASSERT_TRUE(time_utils::parseDateTime("2025-04-06_00:00:00", end));

    auto result = resolver.resolve(provider_, TimeWindow(start, end));

    EXPECT_EQ(result.status, CoverageStatus::INVALID_WINDOW);
    EXPECT_EQ(resolver.getStats().weeks_fetched, 0u);
}

TEST_F(ResolverTest, ConfiguredCategoriesAndPriority) {
    ResolverConfig config;
    config.required_categories = {"SP3"};
    config.priority.project_types = {"MGX"};
    config.priority.solution_types = {"RAP", "FIN"};
    config.listing_workers = 1;

    ProductResolver resolver(config);
    auto window = TimeWindow::fromStrings("2025-04-05_00:00:00", "2025-04-06_12:00:00");

    auto result = resolver.resolve(provider_, window);

    // With only SP3 required the RAP line is complete on day 095
    EXPECT_TRUE(result.isValidCombination("COD", "MGX", "RAP"));

    auto optimal = resolver.selectOptimal(result, "COD");
    ASSERT_TRUE(optimal.has_value());
    EXPECT_EQ(*optimal, ProductCombination("MGX", "RAP"));
}

TEST_F(ResolverTest, LoadConfigFailureKeepsConfiguration) {
    ProductResolver resolver;
    std::string error;
    EXPECT_FALSE(resolver.loadConfig("/nonexistent/libprecise.yaml", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(resolver.getConfig().required_categories, (std::set<std::string>{"BIA", "CLK", "SP3"}));
}
