#include <gtest/gtest.h>

#include "CategoryRelabel.h"
#include "DotmatrixExceptions.h"

namespace {
CategoricalAnnotation clusters() {
    return CategoricalAnnotation::fromLabels({"A", "B", "A", "A", "C", "B"});
}
} // namespace

TEST(CategoryRelabelTest, AnnotatedLabels) {
    EXPECT_EQ(annotatedCategoryLabels(clusters()),
              (std::vector<std::string>{"0: A (n=3)", "1: B (n=2)", "2: C (n=1)"}));
}

TEST(CategoryRelabelTest, RestoresOnScopeExit) {
    CategoricalAnnotation annotation = clusters();
    {
        ScopedCategoryRelabel relabel(annotation, annotatedCategoryLabels(annotation));
        EXPECT_TRUE(relabel.active());
        EXPECT_EQ(annotation.categories[0], "0: A (n=3)");
    }
    EXPECT_EQ(annotation.categories, (std::vector<std::string>{"A", "B", "C"}));
}

TEST(CategoryRelabelTest, RestoresWhenExceptionUnwinds) {
    CategoricalAnnotation annotation = clusters();
    try {
        ScopedCategoryRelabel relabel(annotation, {"x", "y", "z"});
        throw Dotmatrix::RenderException("boom");
    } catch (const Dotmatrix::RenderException&) {
    }
    EXPECT_EQ(annotation.categories, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(annotation.codes, (std::vector<int>{0, 1, 0, 0, 2, 1}));
}

TEST(CategoryRelabelTest, ReleaseIsIdempotent) {
    CategoricalAnnotation annotation = clusters();
    ScopedCategoryRelabel relabel(annotation, {"x", "y", "z"});
    relabel.release();
    EXPECT_FALSE(relabel.active());
    EXPECT_EQ(annotation.categories[0], "A");
    relabel.release();
    EXPECT_EQ(annotation.categories[0], "A");
}

TEST(CategoryRelabelTest, WrongLabelCountRejected) {
    CategoricalAnnotation annotation = clusters();
    EXPECT_THROW({ ScopedCategoryRelabel relabel(annotation, {"x"}); }, Dotmatrix::DatasetException);
    EXPECT_THROW({ ScopedCategoryRelabel relabel(annotation, {"x", "x", "z"}); }, Dotmatrix::DatasetException);
    EXPECT_EQ(annotation.categories, (std::vector<std::string>{"A", "B", "C"}));
}
