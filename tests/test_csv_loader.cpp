#include <gtest/gtest.h>

#include "CSVUtils.h"
#include "DatasetLoader.h"
#include "DotmatrixExceptions.h"
#include "TestData.h"

#include <cmath>
#include <sstream>

TEST(CSVUtilsTest, QuotedFieldsAndEscapes) {
    std::istringstream in("name, \"a,b\" ,\"say \"\"hi\"\"\"\n\"multi\nline\",2,3\n");
    bool malformed = true;
    EXPECT_EQ(CSVUtils::parseCSVLine(in, ',', &malformed),
              (std::vector<std::string>{"name", "a,b", "say \"hi\""}));
    EXPECT_FALSE(malformed);
    EXPECT_EQ(CSVUtils::parseCSVLine(in, ',', &malformed), (std::vector<std::string>{"multi\nline", "2", "3"}));
    EXPECT_TRUE(CSVUtils::parseCSVLine(in, ',').empty());
}

TEST(CSVUtilsTest, UnterminatedQuoteIsMalformed) {
    std::istringstream in("a,\"open\n");
    bool malformed = false;
    CSVUtils::parseCSVLine(in, ',', &malformed);
    EXPECT_TRUE(malformed);
}

TEST(CSVUtilsTest, HeaderNormalisation) {
    EXPECT_EQ(CSVUtils::normalizeHeader({"id", "", "id", "id"}),
              (std::vector<std::string>{"id", "column_2", "id_2", "id_3"}));
}

TEST(CSVUtilsTest, ReadTableSkipsBomAndBlankLines) {
    TestData::TempDir dir("csv_bom");
    const std::string path = dir.file("t.csv", "\xEF\xBB\xBFid;val\r\n\r\nc1;1.5\r\nc2;2\r\n");
    const CSVUtils::CsvTable table = CSVUtils::readTable(path, ';');
    EXPECT_EQ(table.header, (std::vector<std::string>{"id", "val"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1][1], "2");
    EXPECT_EQ(table.columnIndex("val"), 1);
    EXPECT_EQ(table.columnIndex("nope"), -1);
}

TEST(CSVUtilsTest, ReadTableErrors) {
    TestData::TempDir dir("csv_errors");
    EXPECT_THROW(CSVUtils::readTable(dir.path("missing.csv")), Dotmatrix::IOException);
    EXPECT_THROW(CSVUtils::readTable(dir.file("empty.csv", "")), Dotmatrix::DatasetException);
    EXPECT_THROW(CSVUtils::readTable(dir.file("ragged.csv", "a,b\n1,2\n3\n")), Dotmatrix::DatasetException);
    EXPECT_THROW(CSVUtils::readTable(dir.file("quote.csv", "a,b\n1,\"2\n")), Dotmatrix::DatasetException);
}

TEST(DatasetLoaderTest, DetectsAnnotationTypes) {
    TestData::TempDir dir("loader_types");
    DatasetSource source;
    source.annotationPath = dir.file("obs.csv",
                                     "cell,cluster,score,batch,tissue\n"
                                     "c1,1,0.5,b1,lung\n"
                                     "c2,2,,b2,\n"
                                     "c3,1,1.5,b1,liver\n");
    source.expressionPath = dir.file("x.csv", "cell,CD3,CD8\nc1,1,0\nc2,0,2.5\nc3,3,0\n");
    source.indexColumn = "cell";
    source.categoricalColumns = {"cluster"};

    const AnnotatedDataset data = DatasetLoader::load(source);
    EXPECT_EQ(data.nObs(), 3u);
    EXPECT_EQ(data.annotationNames(), (std::vector<std::string>{"cluster", "score", "batch", "tissue"}));
    EXPECT_TRUE(data.hasCategoricalAnnotation("cluster"));
    EXPECT_EQ(data.categoricalAnnotation("cluster").categories, (std::vector<std::string>{"1", "2"}));
    ASSERT_TRUE(data.hasNumericAnnotation("score"));
    EXPECT_TRUE(std::isnan(data.numericAnnotation("score")[1]));
    EXPECT_DOUBLE_EQ(data.numericAnnotation("score")[2], 1.5);
    EXPECT_TRUE(data.hasCategoricalAnnotation("batch"));
    EXPECT_EQ(data.categoricalAnnotation("tissue").codes[1], -1);

    EXPECT_EQ(data.expression().varNames, (std::vector<std::string>{"CD3", "CD8"}));
    EXPECT_DOUBLE_EQ(data.expression().columns[1][1], 2.5);
    EXPECT_FALSE(data.hasRaw());
}

TEST(DatasetLoaderTest, RowCountMismatch) {
    TestData::TempDir dir("loader_rows");
    DatasetSource source;
    source.annotationPath = dir.file("obs.csv", "cluster\nA\nB\n");
    source.expressionPath = dir.file("x.csv", "g\n1\n");
    EXPECT_THROW(DatasetLoader::load(source), Dotmatrix::DatasetException);
}

TEST(DatasetLoaderTest, IdMismatch) {
    TestData::TempDir dir("loader_ids");
    DatasetSource source;
    source.annotationPath = dir.file("obs.csv", "id,cluster\nc1,A\nc2,B\n");
    source.expressionPath = dir.file("x.csv", "id,g\nc2,1\nc1,0\n");
    source.indexColumn = "id";
    EXPECT_THROW(DatasetLoader::load(source), Dotmatrix::DatasetException);

    source.indexColumn = "barcode";
    EXPECT_THROW(DatasetLoader::load(source), Dotmatrix::DatasetException);
}

TEST(DatasetLoaderTest, NonNumericExpressionRejected) {
    TestData::TempDir dir("loader_values");
    DatasetSource source;
    source.expressionPath = dir.file("x.csv", "g,h\n1,high\n");
    EXPECT_THROW(DatasetLoader::load(source), Dotmatrix::DatasetException);

    DatasetSource nothing;
    EXPECT_THROW(DatasetLoader::load(nothing), Dotmatrix::DatasetException);
}

TEST(DatasetLoaderTest, RawExpressionLoaded) {
    TestData::TempDir dir("loader_raw");
    DatasetSource source;
    source.expressionPath = dir.file("x.csv", "g\n0.5\n0\n");
    source.rawExpressionPath = dir.file("raw.csv", "g\n3\n0\n");
    const AnnotatedDataset data = DatasetLoader::load(source);
    ASSERT_TRUE(data.hasRaw());
    EXPECT_DOUBLE_EQ(data.rawExpression().columns[0][0], 3.0);
}
