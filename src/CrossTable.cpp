#include "CrossTable.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

namespace {
const CategoricalAnnotation& requireCategorical(const AnnotatedDataset& data, const std::string& key) {
    if (data.hasNumericAnnotation(key)) {
        throw Dotmatrix::InvalidArgumentException("cannot cross-tabulate numeric annotation '" + key + "'");
    }
    return data.categoricalAnnotation(key);
}

void normaliseRows(CrossTable& table, bool round) {
    for (auto& row : table.values) {
        double total = 0.0;
        for (double v : row) total += v;
        if (total <= 0.0) continue;
        for (double& v : row) {
            v = v / total * 100.0;
            if (round) v = CommonUtils::roundTo(v, 2);
        }
    }
}

void normaliseColumns(CrossTable& table, bool round) {
    const size_t nCols = table.columnLabels.size();
    for (size_t c = 0; c < nCols; ++c) {
        double total = 0.0;
        for (const auto& row : table.values) total += row[c];
        if (total <= 0.0) continue;
        for (auto& row : table.values) {
            row[c] = row[c] / total * 100.0;
            if (round) row[c] = CommonUtils::roundTo(row[c], 2);
        }
    }
}
} // namespace

CrossNormalise parseCrossNormalise(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v.empty() || v == "none") return CrossNormalise::None;
    if (v == "x") return CrossNormalise::X;
    if (v == "y") return CrossNormalise::Y;
    if (v == "xy") return CrossNormalise::XY;
    if (v == "yx") return CrossNormalise::YX;
    throw Dotmatrix::InvalidArgumentException("normalise must be one of: none, x, y, xy, yx (got '" + value + "')");
}

std::string crossNormaliseName(CrossNormalise mode) {
    switch (mode) {
        case CrossNormalise::None: return "none";
        case CrossNormalise::X: return "x";
        case CrossNormalise::Y: return "y";
        case CrossNormalise::XY: return "xy";
        case CrossNormalise::YX: return "yx";
    }
    return "none";
}

double CrossTable::at(size_t row, size_t column) const {
    if (row >= values.size() || column >= columnLabels.size()) {
        throw Dotmatrix::InvalidArgumentException("cross table index (" + std::to_string(row) + ", " +
                                                  std::to_string(column) + ") out of range");
    }
    return values[row][column];
}

CrossTable crossTable(const AnnotatedDataset& data,
                      const std::string& x,
                      const std::string& y,
                      CrossNormalise normalise,
                      const std::vector<bool>& subset) {
    const CategoricalAnnotation& xs = requireCategorical(data, x);
    const CategoricalAnnotation& ys = requireCategorical(data, y);
    if (!subset.empty() && subset.size() != data.nObs()) {
        throw Dotmatrix::InvalidArgumentException("subset has " + std::to_string(subset.size()) +
                                                  " flags, expected " + std::to_string(data.nObs()));
    }

    std::vector<std::vector<size_t>> counts(xs.categoryCount(), std::vector<size_t>(ys.categoryCount(), 0));
    std::vector<size_t> rowTotals(xs.categoryCount(), 0);
    std::vector<size_t> colTotals(ys.categoryCount(), 0);
    for (size_t i = 0; i < data.nObs(); ++i) {
        if (!subset.empty() && !subset[i]) continue;
        const int r = xs.codes[i];
        const int c = ys.codes[i];
        if (r < 0 || c < 0) continue;
        ++counts[static_cast<size_t>(r)][static_cast<size_t>(c)];
        ++rowTotals[static_cast<size_t>(r)];
        ++colTotals[static_cast<size_t>(c)];
    }

    std::vector<size_t> keptCols;
    CrossTable table;
    for (size_t c = 0; c < colTotals.size(); ++c) {
        if (colTotals[c] == 0) continue;
        keptCols.push_back(c);
        table.columnLabels.push_back(ys.categories[c]);
    }
    for (size_t r = 0; r < rowTotals.size(); ++r) {
        if (rowTotals[r] == 0) continue;
        table.rowLabels.push_back(xs.categories[r]);
        std::vector<double> row;
        row.reserve(keptCols.size());
        for (size_t c : keptCols) row.push_back(static_cast<double>(counts[r][c]));
        table.values.push_back(std::move(row));
    }

    switch (normalise) {
        case CrossNormalise::None:
            break;
        case CrossNormalise::X:
            normaliseRows(table, true);
            break;
        case CrossNormalise::Y:
            normaliseColumns(table, true);
            break;
        case CrossNormalise::XY:
            normaliseRows(table, false);
            normaliseColumns(table, true);
            break;
        case CrossNormalise::YX:
            normaliseColumns(table, true);
            normaliseRows(table, true);
            break;
    }
    return table;
}
