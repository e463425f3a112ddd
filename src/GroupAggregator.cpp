#include "GroupAggregator.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#ifdef DOTMATRIX_USE_OPENMP
#include <omp.h>
#endif

namespace {
struct GroupAccumulator {
    size_t finite = 0;
    size_t positive = 0;
    double sum = 0.0;
};

StatCell finishCell(size_t countExpressed, size_t groupSize, const GroupAccumulator& meanSource) {
    StatCell cell;
    cell.countExpressed = countExpressed;
    if (groupSize == 0) return cell;
    const double n = static_cast<double>(groupSize);
    cell.fraction = static_cast<double>(countExpressed) / n;
    // Missing values are left out of the mean, not counted as zeros.
    cell.meanAll = (meanSource.finite > 0) ? meanSource.sum / static_cast<double>(meanSource.finite) : 0.0;
    cell.meanExpressed = (meanSource.positive > 0) ? meanSource.sum / static_cast<double>(meanSource.positive) : 0.0;
    return cell;
}

void accumulate(GroupAccumulator& acc, double v) {
    if (!std::isfinite(v)) return;
    ++acc.finite;
    acc.sum += v;
    if (v > 0.0) ++acc.positive;
}
} // namespace

StatMatrix::StatMatrix(std::vector<std::string> groupLabels,
                       std::vector<size_t> groupSizes,
                       std::vector<std::string> featureLabels,
                       std::vector<StatCell> cells)
    : groupLabels_(std::move(groupLabels)),
      groupSizes_(std::move(groupSizes)),
      featureLabels_(std::move(featureLabels)),
      cells_(std::move(cells)) {
    if (groupSizes_.size() != groupLabels_.size() || cells_.size() != groupLabels_.size() * featureLabels_.size()) {
        throw Dotmatrix::InvalidArgumentException("StatMatrix shape mismatch");
    }
}

const StatCell& StatMatrix::at(size_t group, size_t feature) const {
    if (group >= groupCount() || feature >= featureCount()) {
        throw Dotmatrix::InvalidArgumentException("StatMatrix index (" + std::to_string(group) + ", " +
                                                  std::to_string(feature) + ") out of range");
    }
    return cells_[group * featureCount() + feature];
}

double StatMatrix::maxFraction() const noexcept {
    double best = 0.0;
    for (const auto& c : cells_) best = std::max(best, c.fraction);
    return best;
}

GroupAggregator::GroupAggregator(AggregationOptions options) : options_(options) {}

std::vector<FeatureColumn> GroupAggregator::resolveFeatures(const AnnotatedDataset& data,
                                                            const std::vector<std::string>& keys,
                                                            bool useRaw) {
    if (keys.empty()) {
        throw Dotmatrix::InvalidArgumentException("keys must be a non-empty list of annotation keys or feature names");
    }
    const ExpressionMatrix& matrix = useRaw ? data.rawExpression() : data.expression();

    std::vector<FeatureColumn> out;
    out.reserve(keys.size());
    for (const auto& key : keys) {
        FeatureColumn col;
        col.key = key;
        if (data.hasNumericAnnotation(key)) {
            col.values = data.numericAnnotation(key);
        } else if (data.hasCategoricalAnnotation(key)) {
            throw Dotmatrix::InvalidArgumentException("'" + key + "' is a categorical annotation and has no magnitude");
        } else {
            const int idx = matrix.findVar(key);
            if (idx >= 0) {
                col.values = matrix.columns[static_cast<size_t>(idx)];
            } else {
                std::cerr << "[Dotmatrix][Aggregate] '" << key << "' not found, substituting zeros\n";
                col.values.assign(data.nObs(), 0.0);
                col.found = false;
            }
        }
        out.push_back(std::move(col));
    }
    return out;
}

void GroupAggregator::applyPresenceFloor(StatCell& cell) const noexcept {
    if (cell.countExpressed >= options_.minPresence) return;
    cell.fraction = 0.0;
    if (options_.meanOnlyExpressed) {
        cell.meanExpressed = 0.0;
    } else {
        cell.meanAll = 0.0;
    }
}

StatMatrix GroupAggregator::aggregate(const std::vector<FeatureColumn>& features,
                                      const CategoricalAnnotation& groups) const {
    if (features.empty()) {
        throw Dotmatrix::InvalidArgumentException("keys must be a non-empty list of annotation keys or feature names");
    }
    if (options_.jointFraction && features.size() != 2) {
        throw Dotmatrix::InvalidArgumentException("exactly two keys are required for joint fraction mode, got " +
                                                  std::to_string(features.size()));
    }
    const size_t nObs = groups.codes.size();
    if (nObs == 0) {
        throw Dotmatrix::InvalidArgumentException("dataset has no observations");
    }
    for (const auto& f : features) {
        if (f.values.size() != nObs) {
            throw Dotmatrix::InvalidArgumentException("feature '" + f.key + "' has " + std::to_string(f.values.size()) +
                                                      " values, expected " + std::to_string(nObs));
        }
    }

    // Map category codes to retained rows; dropped groups map to -1.
    const std::vector<size_t> sizes = groups.categorySizes();
    std::vector<int> rowOfCode(sizes.size(), -1);
    std::vector<std::string> groupLabels;
    std::vector<size_t> groupSizes;
    for (size_t c = 0; c < sizes.size(); ++c) {
        if (sizes[c] < options_.minGroupSize) continue;
        rowOfCode[c] = static_cast<int>(groupLabels.size());
        groupLabels.push_back(groups.categories[c]);
        groupSizes.push_back(sizes[c]);
    }
    const size_t nGroups = groupLabels.size();

    auto rowOf = [&](size_t obs) -> int {
        const int code = groups.codes[obs];
        if (code < 0 || static_cast<size_t>(code) >= rowOfCode.size()) return -1;
        return rowOfCode[static_cast<size_t>(code)];
    };

    if (options_.jointFraction) {
        const std::vector<double>& first = features[0].values;
        const std::vector<double>& second = features[1].values;
        std::vector<size_t> both(nGroups, 0);
        std::vector<GroupAccumulator> firstAcc(nGroups);
        for (size_t i = 0; i < nObs; ++i) {
            const int r = rowOf(i);
            if (r < 0) continue;
            if (first[i] > 0.0 && second[i] > 0.0) ++both[static_cast<size_t>(r)];
            accumulate(firstAcc[static_cast<size_t>(r)], first[i]);
        }

        std::vector<StatCell> cells(nGroups);
        for (size_t g = 0; g < nGroups; ++g) {
            cells[g] = finishCell(both[g], groupSizes[g], firstAcc[g]);
            applyPresenceFloor(cells[g]);
        }
        return StatMatrix(std::move(groupLabels),
                          std::move(groupSizes),
                          {features[0].key + " & " + features[1].key},
                          std::move(cells));
    }

    const size_t nFeatures = features.size();
    std::vector<StatCell> cells(nGroups * nFeatures);

    #ifdef DOTMATRIX_USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (size_t j = 0; j < nFeatures; ++j) {
        std::vector<GroupAccumulator> acc(nGroups);
        const std::vector<double>& values = features[j].values;
        for (size_t i = 0; i < nObs; ++i) {
            const int r = rowOf(i);
            if (r < 0) continue;
            accumulate(acc[static_cast<size_t>(r)], values[i]);
        }
        for (size_t g = 0; g < nGroups; ++g) {
            StatCell cell = finishCell(acc[g].positive, groupSizes[g], acc[g]);
            applyPresenceFloor(cell);
            cells[g * nFeatures + j] = cell;
        }
    }

    std::vector<std::string> featureLabels;
    featureLabels.reserve(nFeatures);
    for (const auto& f : features) featureLabels.push_back(f.key);
    return StatMatrix(std::move(groupLabels), std::move(groupSizes), std::move(featureLabels), std::move(cells));
}
