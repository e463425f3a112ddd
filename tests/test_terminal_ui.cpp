#include <gtest/gtest.h>

#include "TerminalUI.h"
#include "TestData.h"

#include <sstream>

TEST(TerminalUITest, StatMatrixListsEveryCell) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3", "CD8"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    std::ostringstream os;
    TerminalUI::printStatMatrix(stats, true, os);
    const std::string text = os.str();
    EXPECT_NE(text.find("DOT MATRIX SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("MeanExpr"), std::string::npos);
    EXPECT_NE(text.find("67%"), std::string::npos);
    EXPECT_NE(text.find("4.000"), std::string::npos);
}

TEST(TerminalUITest, CrossTableCountsAndPercentages) {
    CrossTable table;
    table.rowLabels = {"a", "b"};
    table.columnLabels = {"u", "v"};
    table.values = {{1, 1}, {2, 1}};

    std::ostringstream counts;
    TerminalUI::printCrossTable(table, "cluster", "batch", false, counts);
    EXPECT_NE(counts.str().find("CROSS TABLE cluster x batch"), std::string::npos);
    EXPECT_EQ(counts.str().find("."), std::string::npos);

    table.values = {{50, 50}, {66.67, 33.33}};
    std::ostringstream percent;
    TerminalUI::printCrossTable(table, "cluster", "batch", true, percent);
    EXPECT_NE(percent.str().find("66.67"), std::string::npos);
}

TEST(TerminalUITest, CallerStreamFormattingIsRestored) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    CrossTable table;
    table.rowLabels = {"a"};
    table.columnLabels = {"u"};
    table.values = {{12.5}};

    std::ostringstream os;
    TerminalUI::printStatMatrix(stats, false, os);
    TerminalUI::printCrossTable(table, "cluster", "batch", true, os);
    EXPECT_EQ(os.flags() & std::ios_base::floatfield, std::ios_base::fmtflags(0));
    EXPECT_EQ(os.flags() & std::ios_base::adjustfield, std::ios_base::fmtflags(0));
    EXPECT_EQ(os.precision(), 6);

    os.str("");
    os << 0.5;
    EXPECT_EQ(os.str(), "0.5");
}
