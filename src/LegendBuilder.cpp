#include "LegendBuilder.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>

namespace LegendBuilder {
double tickStep(double diff) noexcept {
    if (diff > 0.2 && diff <= 0.6) return 0.1;
    if (diff > 0.06 && diff <= 0.2) return 0.05;
    if (diff > 0.03 && diff <= 0.06) return 0.02;
    if (diff <= 0.03) return 0.01;
    return 0.2;
}

LegendStep tickValues(const DotBounds& bounds) {
    LegendStep out;
    out.step = tickStep(bounds.dotMax - bounds.dotMin);
    if (bounds.dotMax <= bounds.dotMin) {
        out.values.push_back(bounds.dotMax);
        return out;
    }

    // Walk down from dotMax so it is always a tick, even when the span is not a multiple of step.
    const double count = std::ceil((bounds.dotMin - bounds.dotMax) / -out.step);
    const size_t n = static_cast<size_t>(std::max(0.0, count));
    out.values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.values.push_back(bounds.dotMax - static_cast<double>(i) * out.step);
    }
    std::reverse(out.values.begin(), out.values.end());
    return out;
}

SizeLegend build(const DotBounds& bounds, const ValueScaler& scaler) {
    SizeLegend legend;
    legend.ticks = tickValues(bounds);
    legend.color = scaler.colorFor(scaler.normalize().vmax());

    legend.sizes.reserve(legend.ticks.values.size());
    legend.labels.reserve(legend.ticks.values.size());
    for (double v : legend.ticks.values) {
        legend.sizes.push_back(ValueScaler::dotSize(bounds.transform(v)));
        legend.labels.push_back(CommonUtils::formatPercent(v));
    }
    if (!legend.labels.empty() && bounds.dotMax < 1.0) {
        legend.labels.back() = ">=" + legend.labels.back();
    }
    return legend;
}
} // namespace LegendBuilder
