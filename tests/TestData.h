#pragma once
#include "AnnotatedDataset.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace TestData {
// Categorical "cluster" with the given group sizes (labels A, B, C, ...) and one
// expression feature per entry in featureNames, all zero unless set later.
inline AnnotatedDataset groupedDataset(const std::vector<size_t>& sizes,
                                       const std::vector<std::string>& featureNames) {
    std::vector<std::string> labels;
    for (size_t g = 0; g < sizes.size(); ++g) {
        labels.insert(labels.end(), sizes[g], std::string(1, static_cast<char>('A' + g)));
    }
    AnnotatedDataset data(labels.size());
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels(labels));

    ExpressionMatrix x;
    for (const auto& name : featureNames) {
        x.varNames.push_back(name);
        x.columns.emplace_back(labels.size(), 0.0);
    }
    data.setExpression(std::move(x));
    return data;
}

inline ExpressionMatrix matrix(const std::vector<std::string>& names, const std::vector<std::vector<double>>& columns) {
    ExpressionMatrix m;
    m.varNames = names;
    m.columns = columns;
    return m;
}

// Small dataset used across pipeline tests:
//   cluster: A A A B B B B
//   CD3:     1 0 2 0 0 3 0
//   CD8:     0 0 1 4 0 0 0
//   score:   .1 .2 .3 .4 .5 .6 .7
inline AnnotatedDataset smallDataset() {
    AnnotatedDataset data(7);
    data.addCategoricalAnnotation("cluster", CategoricalAnnotation::fromLabels({"A", "A", "A", "B", "B", "B", "B"}));
    data.addNumericAnnotation("score", {0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7});
    data.addNumericAnnotation("batch", {2, 1, 2, 10, 1, 10, 2});
    data.setExpression(matrix({"CD3", "CD8"}, {{1, 0, 2, 0, 0, 3, 0}, {0, 0, 1, 4, 0, 0, 0}}));
    return data;
}

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("dotmatrix_test_" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name, const std::string& content) const {
        const std::filesystem::path p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }
    std::string path(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};
} // namespace TestData
