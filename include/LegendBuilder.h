#pragma once
#include "ColorMap.h"
#include "ValueScaler.h"

#include <string>
#include <vector>

struct LegendStep {
    double step = 0.2;
    std::vector<double> values; // ascending, last == dotMax
};

struct SizeLegend {
    LegendStep ticks;
    std::vector<double> sizes;
    std::vector<std::string> labels;
    Rgba color;

    bool empty() const noexcept { return ticks.values.empty(); }
};

namespace LegendBuilder {
/**
 * @brief Tick increment for a displayed fraction span.
 */
double tickStep(double diff) noexcept;

/**
 * @brief Legend values stepping down from dotMax (exclusive of dotMin), returned ascending.
 */
LegendStep tickValues(const DotBounds& bounds);

/**
 * @brief Full size legend: values, dot sizes through the plot transform, percentage labels.
 * @details The top label is open-ended (">=") when dotMax < 1.
 */
SizeLegend build(const DotBounds& bounds, const ValueScaler& scaler);
} // namespace LegendBuilder
