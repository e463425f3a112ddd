#include <gtest/gtest.h>

#include "DotmatrixExceptions.h"
#include "GroupAggregator.h"
#include "TestData.h"

#include <limits>

// ---------------------------------------------------------------------------
// Independent mode
// ---------------------------------------------------------------------------

TEST(GroupAggregatorTest, IndependentFractionsAndMeans) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3", "CD8"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    ASSERT_EQ(stats.groupCount(), 2u);
    ASSERT_EQ(stats.featureCount(), 2u);
    EXPECT_EQ(stats.groupLabels(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(stats.groupSizes(), (std::vector<size_t>{3, 4}));

    const StatCell& a3 = stats.at(0, 0);
    EXPECT_EQ(a3.countExpressed, 2u);
    EXPECT_NEAR(a3.fraction, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(a3.meanAll, 1.0, 1e-12);
    EXPECT_NEAR(a3.meanExpressed, 1.5, 1e-12);

    const StatCell& b8 = stats.at(1, 1);
    EXPECT_EQ(b8.countExpressed, 1u);
    EXPECT_NEAR(b8.fraction, 0.25, 1e-12);
    EXPECT_NEAR(b8.meanAll, 1.0, 1e-12);
    EXPECT_NEAR(b8.meanExpressed, 4.0, 1e-12);
    EXPECT_NEAR(b8.mean(true), 4.0, 1e-12);
    EXPECT_NEAR(b8.mean(false), 1.0, 1e-12);
}

TEST(GroupAggregatorTest, NumericAnnotationResolvesBeforeExpression) {
    AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"score"}, false);
    ASSERT_EQ(features.size(), 1u);
    EXPECT_TRUE(features[0].found);
    EXPECT_DOUBLE_EQ(features[0].values[6], 0.7);
}

TEST(GroupAggregatorTest, MinGroupSizeDropsSmallGroupsAndKeepsOrder) {
    AnnotatedDataset data = TestData::groupedDataset({50, 3, 100}, {"f1", "f2"});
    const auto features = GroupAggregator::resolveFeatures(data, {"f1", "f2"}, false);

    AggregationOptions options;
    options.minGroupSize = 10;
    const StatMatrix stats = GroupAggregator(options).aggregate(features, data.categoricalAnnotation("cluster"));

    EXPECT_EQ(stats.groupLabels(), (std::vector<std::string>{"A", "C"}));
    EXPECT_EQ(stats.groupSizes(), (std::vector<size_t>{50, 100}));
    EXPECT_EQ(stats.featureCount(), 2u);
    EXPECT_EQ(stats.cells().size(), 4u);
}

TEST(GroupAggregatorTest, MinPresenceZeroesFractionAndDisplayedMean) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3"}, false);

    AggregationOptions options;
    options.minPresence = 2;
    const StatMatrix stats = GroupAggregator(options).aggregate(features, data.categoricalAnnotation("cluster"));

    EXPECT_NEAR(stats.at(0, 0).fraction, 2.0 / 3.0, 1e-12);
    const StatCell& b = stats.at(1, 0);
    EXPECT_EQ(b.countExpressed, 1u);
    EXPECT_DOUBLE_EQ(b.fraction, 0.0);
    EXPECT_DOUBLE_EQ(b.meanAll, 0.0);
    // The mean that is not displayed keeps its value for exported statistics.
    EXPECT_DOUBLE_EQ(b.meanExpressed, 3.0);
}

TEST(GroupAggregatorTest, MinPresenceZeroesExpressedMeanWhenSelected) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3"}, false);

    AggregationOptions options;
    options.minPresence = 2;
    options.meanOnlyExpressed = true;
    const StatMatrix stats = GroupAggregator(options).aggregate(features, data.categoricalAnnotation("cluster"));

    const StatCell& b = stats.at(1, 0);
    EXPECT_DOUBLE_EQ(b.fraction, 0.0);
    EXPECT_DOUBLE_EQ(b.meanExpressed, 0.0);
    EXPECT_DOUBLE_EQ(b.meanAll, 0.75);
}

TEST(GroupAggregatorTest, MissingValuesLeftOutOfMean) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    AnnotatedDataset data(3);
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels({"A", "A", "B"}));
    data.addNumericAnnotation("score", {nan, 2.0, nan});
    const auto features = GroupAggregator::resolveFeatures(data, {"score"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    const StatCell& a = stats.at(0, 0);
    EXPECT_DOUBLE_EQ(a.meanAll, 2.0);
    EXPECT_DOUBLE_EQ(a.meanExpressed, 2.0);
    EXPECT_DOUBLE_EQ(a.fraction, 0.5);

    const StatCell& b = stats.at(1, 0);
    EXPECT_DOUBLE_EQ(b.meanAll, 0.0);
    EXPECT_DOUBLE_EQ(b.fraction, 0.0);
}

TEST(GroupAggregatorTest, EmptyGroupGetsZeroCells) {
    AnnotatedDataset data(3);
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels({"A", "A", "A"}, {"A", "B"}));
    data.setExpression(TestData::matrix({"g"}, {{1, 2, 0}}));
    const auto features = GroupAggregator::resolveFeatures(data, {"g"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    ASSERT_EQ(stats.groupCount(), 2u);
    EXPECT_EQ(stats.groupSizes()[1], 0u);
    EXPECT_DOUBLE_EQ(stats.at(1, 0).fraction, 0.0);
    EXPECT_DOUBLE_EQ(stats.at(1, 0).meanAll, 0.0);
}

TEST(GroupAggregatorTest, MissingGroupValuesAreIgnored) {
    AnnotatedDataset data(4);
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels({"A", "", "A", "B"}));
    data.setExpression(TestData::matrix({"g"}, {{1, 5, 0, 2}}));
    const auto features = GroupAggregator::resolveFeatures(data, {"g"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));

    EXPECT_EQ(stats.groupSizes(), (std::vector<size_t>{2, 1}));
    EXPECT_DOUBLE_EQ(stats.at(0, 0).fraction, 0.5);
    EXPECT_DOUBLE_EQ(stats.at(0, 0).meanAll, 0.5);
}

TEST(GroupAggregatorTest, FractionsStayInUnitInterval) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3", "CD8", "score"}, false);
    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));
    for (const auto& cell : stats.cells()) {
        EXPECT_GE(cell.fraction, 0.0);
        EXPECT_LE(cell.fraction, 1.0);
        EXPECT_GE(cell.meanExpressed, 0.0);
    }
}

// ---------------------------------------------------------------------------
// Joint mode
// ---------------------------------------------------------------------------

TEST(GroupAggregatorTest, JointFractionCountsObservationsWithBothFeatures) {
    AnnotatedDataset data(10);
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels(std::vector<std::string>(10, "A")));
    data.setExpression(TestData::matrix({"f1", "f2"},
                                        {{2, 2, 2, 2, 1, 1, 0, 0, 0, 0},
                                         {1, 1, 1, 1, 0, 0, 3, 0, 0, 0}}));
    const auto features = GroupAggregator::resolveFeatures(data, {"f1", "f2"}, false);

    AggregationOptions options;
    options.jointFraction = true;
    const StatMatrix stats = GroupAggregator(options).aggregate(features, data.categoricalAnnotation("cluster"));

    ASSERT_EQ(stats.featureCount(), 1u);
    EXPECT_EQ(stats.featureLabels()[0], "f1 & f2");
    const StatCell& cell = stats.at(0, 0);
    EXPECT_EQ(cell.countExpressed, 4u);
    EXPECT_DOUBLE_EQ(cell.fraction, 0.4);
    // Means come from the first feature alone.
    EXPECT_DOUBLE_EQ(cell.meanAll, 1.0);
    EXPECT_NEAR(cell.meanExpressed, 10.0 / 6.0, 1e-12);
}

TEST(GroupAggregatorTest, JointModeRequiresExactlyTwoKeys) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3", "CD8", "score"}, false);
    AggregationOptions options;
    options.jointFraction = true;
    EXPECT_THROW(GroupAggregator(options).aggregate(features, data.categoricalAnnotation("cluster")),
                 Dotmatrix::InvalidArgumentException);
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

TEST(GroupAggregatorTest, UnknownKeyBecomesZeroColumn) {
    const AnnotatedDataset data = TestData::smallDataset();
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3", "NOPE"}, false);
    ASSERT_EQ(features.size(), 2u);
    EXPECT_FALSE(features[1].found);
    EXPECT_EQ(features[1].values, std::vector<double>(7, 0.0));

    const StatMatrix stats = GroupAggregator().aggregate(features, data.categoricalAnnotation("cluster"));
    EXPECT_DOUBLE_EQ(stats.at(0, 1).fraction, 0.0);
    EXPECT_DOUBLE_EQ(stats.at(1, 1).fraction, 0.0);
}

TEST(GroupAggregatorTest, EmptyKeysRejected) {
    const AnnotatedDataset data = TestData::smallDataset();
    EXPECT_THROW(GroupAggregator::resolveFeatures(data, {}, false), Dotmatrix::InvalidArgumentException);
}

TEST(GroupAggregatorTest, CategoricalKeyRejected) {
    const AnnotatedDataset data = TestData::smallDataset();
    EXPECT_THROW(GroupAggregator::resolveFeatures(data, {"cluster"}, false), Dotmatrix::InvalidArgumentException);
}

TEST(GroupAggregatorTest, RawMatrixUsedWhenRequested) {
    AnnotatedDataset data = TestData::smallDataset();
    data.setRawExpression(TestData::matrix({"CD3", "CD8"}, {std::vector<double>(7, 5.0), std::vector<double>(7, 0.0)}));
    const auto features = GroupAggregator::resolveFeatures(data, {"CD3"}, true);
    EXPECT_EQ(features[0].values, std::vector<double>(7, 5.0));
}

TEST(StatMatrixTest, RejectsShapeMismatch) {
    EXPECT_THROW(StatMatrix({"A"}, {1}, {"f", "g"}, {StatCell{}}), Dotmatrix::InvalidArgumentException);
}

TEST(StatMatrixTest, AtChecksBounds) {
    const StatMatrix stats({"A"}, {1}, {"f"}, {StatCell{}});
    EXPECT_NO_THROW(stats.at(0, 0));
    EXPECT_THROW(stats.at(1, 0), Dotmatrix::InvalidArgumentException);
}
