#pragma once
#include "AnnotatedDataset.h"

#include <string>
#include <vector>

enum class CrossNormalise { None, X, Y, XY, YX };

/**
 * @throws Dotmatrix::InvalidArgumentException for anything but none|x|y|xy|yx.
 */
CrossNormalise parseCrossNormalise(const std::string& value);
std::string crossNormaliseName(CrossNormalise mode);

// Contingency table of two categorical annotations; rows follow x, columns follow y.
struct CrossTable {
    std::vector<std::string> rowLabels;
    std::vector<std::string> columnLabels;
    std::vector<std::vector<double>> values;

    double at(size_t row, size_t column) const;
};

/**
 * @brief Counts co-occurrences of the categories of x and y.
 * @details Only categories observed in the (optionally subset) data appear. Normalisation
 * expresses counts as percentages rounded to two decimals: "x" per row, "y" per column,
 * "xy" per row then per column, "yx" per column then per row.
 * @param subset empty for all observations, otherwise one flag per observation.
 * @throws Dotmatrix::MissingKeyException when x or y does not exist.
 * @throws Dotmatrix::InvalidArgumentException when x or y is numeric or the subset length is wrong.
 */
CrossTable crossTable(const AnnotatedDataset& data,
                      const std::string& x,
                      const std::string& y,
                      CrossNormalise normalise = CrossNormalise::None,
                      const std::vector<bool>& subset = {});
