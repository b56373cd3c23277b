#include <gtest/gtest.h>

#include "TerminalUI.h"

#include <ios>
#include <memory>
#include <sstream>
#include <string>

TEST(TerminalUITest, PrintCategoryTable_SortsByCountWithShare) {
    std::ostringstream out;
    TerminalUI::printCategoryTable(out, "[Types]", {{"Content", 1}, {"NSP", 3}});
    const std::string text = out.str();

    const size_t nsp = text.find("NSP");
    const size_t content = text.find("Content");
    ASSERT_NE(nsp, std::string::npos);
    ASSERT_NE(content, std::string::npos);
    EXPECT_LT(nsp, content);
    EXPECT_NE(text.find("75.0%"), std::string::npos);
    EXPECT_NE(text.find("25.0%"), std::string::npos);
}

TEST(TerminalUITest, PrintCategoryTable_EmptyTableSaysSo) {
    std::ostringstream out;
    TerminalUI::printCategoryTable(out, "[Scopes]", {});
    EXPECT_NE(out.str().find("No records carry this field"), std::string::npos);
}

TEST(TerminalUITest, PrintLoadReport_IncludesDiagnostic) {
    LoadResult result;
    result.records = std::make_shared<const NetworkCollection>();
    LoadDiagnostic diagnostic;
    diagnostic.kind = LoadDiagnostic::Kind::SOURCE_UNAVAILABLE;
    diagnostic.source = "net.json";
    diagnostic.message = "gone";
    result.diagnostic = diagnostic;

    std::ostringstream out;
    TerminalUI::printLoadReport(out, "net.json", result);
    EXPECT_NE(out.str().find("source unavailable (net.json): gone"), std::string::npos);
    EXPECT_NE(out.str().find("Networks loaded: 0"), std::string::npos);
}

TEST(TerminalUITest, PrintDashboardAndPrefixChart) {
    DashboardStats stats;
    stats.totalNetworks = 4;
    stats.networkTypes = {{"NSP", 4}};
    PrefixDistribution chart;
    chart.networks = {"Example"};
    chart.ipv4 = {120};
    chart.ipv6 = {8};

    std::ostringstream out;
    TerminalUI::printDashboard(out, stats);
    TerminalUI::printPrefixChart(out, chart);
    const std::string text = out.str();

    EXPECT_NE(text.find("NETWORK SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("Total networks: 4"), std::string::npos);
    EXPECT_NE(text.find("Example"), std::string::npos);
    EXPECT_NE(text.find("120"), std::string::npos);
}

TEST(TerminalUITest, PrintCategoryTable_RestoresStreamFormatting) {
    std::ostringstream out;
    const std::ios_base::fmtflags before = out.flags();
    const std::streamsize precisionBefore = out.precision();

    TerminalUI::printCategoryTable(out, "[Types]", {{"NSP", 3}});

    EXPECT_EQ(out.flags(), before);
    EXPECT_EQ(out.precision(), precisionBefore);

    out.str("");
    out << 2.5 << ' ' << 1.0 / 3.0;
    EXPECT_EQ(out.str(), "2.5 0.333333");
}
