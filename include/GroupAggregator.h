#pragma once
#include "AnnotatedDataset.h"

#include <cstddef>
#include <string>
#include <vector>

struct StatCell {
    size_t countExpressed = 0;
    double fraction = 0.0;
    double meanAll = 0.0;
    double meanExpressed = 0.0;

    double mean(bool onlyExpressed) const noexcept { return onlyExpressed ? meanExpressed : meanAll; }
};

// Group-major matrix of StatCells: rows follow category order, columns follow feature input order.
class StatMatrix {
public:
    StatMatrix() = default;
    StatMatrix(std::vector<std::string> groupLabels,
               std::vector<size_t> groupSizes,
               std::vector<std::string> featureLabels,
               std::vector<StatCell> cells);

    size_t groupCount() const noexcept { return groupLabels_.size(); }
    size_t featureCount() const noexcept { return featureLabels_.size(); }

    const StatCell& at(size_t group, size_t feature) const;

    const std::vector<std::string>& groupLabels() const noexcept { return groupLabels_; }
    const std::vector<size_t>& groupSizes() const noexcept { return groupSizes_; }
    const std::vector<std::string>& featureLabels() const noexcept { return featureLabels_; }
    const std::vector<StatCell>& cells() const noexcept { return cells_; }

    double maxFraction() const noexcept;

private:
    std::vector<std::string> groupLabels_;
    std::vector<size_t> groupSizes_;
    std::vector<std::string> featureLabels_;
    std::vector<StatCell> cells_;
};

struct FeatureColumn {
    std::string key;
    std::vector<double> values;
    bool found = true;
};

struct AggregationOptions {
    size_t minGroupSize = 0;
    size_t minPresence = 0;
    bool jointFraction = false;
    bool meanOnlyExpressed = false; // which mean the presence floor zeroes
};

class GroupAggregator {
public:
    explicit GroupAggregator(AggregationOptions options = {});

    /**
     * @brief Looks up each key among numeric annotations, then expression features.
     * @details Keys found nowhere yield an all-zero column with found=false and a warning on stderr.
     * @throws Dotmatrix::InvalidArgumentException for an empty key list or a categorical annotation key.
     */
    static std::vector<FeatureColumn> resolveFeatures(const AnnotatedDataset& data,
                                                      const std::vector<std::string>& keys,
                                                      bool useRaw);

    /**
     * @brief Computes per-group statistics for the given feature columns.
     * @pre every column has groups.codes.size() values.
     * @post Groups smaller than minGroupSize are absent; cells below minPresence get fraction 0
     * and a zero displayed mean (meanExpressed or meanAll, per meanOnlyExpressed).
     * @throws Dotmatrix::InvalidArgumentException on empty input or a joint-mode key count other than two.
     */
    StatMatrix aggregate(const std::vector<FeatureColumn>& features, const CategoricalAnnotation& groups) const;

private:
    AggregationOptions options_;

    void applyPresenceFloor(StatCell& cell) const noexcept;
};
