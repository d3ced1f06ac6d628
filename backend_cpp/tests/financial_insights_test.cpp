#include <gtest/gtest.h>
#include "financial_insights.hpp"

namespace comparables_rag {
namespace {

using json = nlohmann::json;

CompanyRecord with_metrics(json metrics) {
    json company = {{"name", "Acme"}, {"ticker", "ACME"}, {"financial_metrics", std::move(metrics)}};
    return CompanyRecord::from_json(company);
}

TEST(ParseMetricTest, ClassifiesRawValues) {
    EXPECT_EQ(parse_metric(json(12.5)).status, MetricStatus::Value);
    EXPECT_DOUBLE_EQ(parse_metric(json(12.5)).value, 12.5);
    EXPECT_DOUBLE_EQ(parse_metric(json(" 3.25 ")).value, 3.25);
    EXPECT_EQ(parse_metric(json("N/A")).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json("not available")).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json("")).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json(nullptr)).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json("12abc")).status, MetricStatus::Malformed);
    EXPECT_EQ(parse_metric(json("nan")).status, MetricStatus::Malformed);
    EXPECT_EQ(parse_metric(json(true)).status, MetricStatus::Malformed);
    EXPECT_EQ(parse_metric(json::array({1, 2})).status, MetricStatus::Malformed);
}

TEST(ParseMetricTest, NonAsciiSentinelsAreMalformed) {
    EXPECT_EQ(parse_metric(json(" N/A ")).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json("NOT AVAILABLE")).status, MetricStatus::NotAvailable);
    EXPECT_EQ(parse_metric(json("n/d\xC3\xA9")).status, MetricStatus::Malformed);
    EXPECT_EQ(parse_metric(json("\xE2\x80\x94")).status, MetricStatus::Malformed);
}

TEST(FinancialInsightsTest, MarketCapBoundaries) {
    auto large = extract_financial_insights(with_metrics({{"market_cap", 10000000001.0}}));
    ASSERT_EQ(large.size(), 1u);
    EXPECT_EQ(large[0], "Large-cap company (>$10B market cap)");

    auto exactly_ten = extract_financial_insights(with_metrics({{"market_cap", 10000000000.0}}));
    ASSERT_EQ(exactly_ten.size(), 1u);
    EXPECT_EQ(exactly_ten[0], "Mid-cap company ($2B-$10B market cap)");

    auto exactly_two = extract_financial_insights(with_metrics({{"market_cap", 2000000000}}));
    ASSERT_EQ(exactly_two.size(), 1u);
    EXPECT_EQ(exactly_two[0], "Small-cap company (<$2B market cap)");
}

TEST(FinancialInsightsTest, ThresholdsAreStrict) {
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"pe_ratio", 15}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"pe_ratio", 25}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"pb_ratio", 1}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"pb_ratio", 3}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"roe", 15}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"roe", 5}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"net_margin", 20}})).empty());
    EXPECT_TRUE(extract_financial_insights(with_metrics({{"net_margin", 5}})).empty());
}

TEST(FinancialInsightsTest, EmitsOneLabelPerMetricInFixedOrder) {
    auto insights = extract_financial_insights(with_metrics({
        {"net_margin", 25},
        {"roe", 2},
        {"pb_ratio", 0.8},
        {"pe_ratio", "30"},
        {"market_cap", "500000000"}
    }));

    std::vector<std::string> expected = {
        "Small-cap company (<$2B market cap)",
        "High P/E ratio (>25) - growth expectations",
        "Trading below book value (P/B < 1)",
        "Low ROE (<5%) - efficiency concerns",
        "High net margin (>20%) - strong profitability"
    };
    EXPECT_EQ(insights, expected);
}

TEST(FinancialInsightsTest, SkipsUnavailableAndMalformedValues) {
    auto insights = extract_financial_insights(with_metrics({
        {"market_cap", "N/A"},
        {"pe_ratio", "twelve"},
        {"pb_ratio", 4.2},
        {"roe", nullptr}
    }));
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_EQ(insights[0], "High P/B ratio (>3) - premium valuation");
}

TEST(FinancialInsightsTest, NoMetricsMeansNoInsights) {
    CompanyRecord bare;
    bare.name = "Bare Co";
    EXPECT_TRUE(extract_financial_insights(bare).empty());
}

TEST(FinancialInsightsTest, LowValuationAndStrongProfitability) {
    auto insights = extract_financial_insights(with_metrics({
        {"pe_ratio", 9.5},
        {"pb_ratio", 3.5},
        {"roe", 21},
        {"net_margin", 3}
    }));
    std::vector<std::string> expected = {
        "Low P/E ratio (<15) - potentially undervalued",
        "High P/B ratio (>3) - premium valuation",
        "Strong ROE (>15%) - efficient use of equity",
        "Low net margin (<5%) - thin margins"
    };
    EXPECT_EQ(insights, expected);
}

} // namespace
} // namespace comparables_rag
