#include "ValueScaler.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
void checkUnitInterval(double v, const char* name) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw Dotmatrix::InvalidArgumentException(std::string("`") + name + "` value has to be between 0 and 1");
    }
}
} // namespace

double DotBounds::transform(double fraction) const noexcept {
    if (!rescales()) return fraction;
    const double range = dotMax - dotMin;
    if (range <= 0.0) return 0.0;
    const double clipped = std::clamp(fraction, dotMin, dotMax);
    return (clipped - dotMin) / range;
}

ValueScaler::ValueScaler(ScaleOptions options, ColorMap colorMap)
    : options_(options), colorMap_(std::move(colorMap)), normalize_(options.vmin, options.vmax) {}

DotBounds ValueScaler::resolveBounds(const StatMatrix& stats) const {
    DotBounds bounds;
    if (options_.dotMax) {
        checkUnitInterval(*options_.dotMax, "dot_max");
        bounds.dotMax = *options_.dotMax;
    } else {
        bounds.dotMax = std::ceil(stats.maxFraction() * 10.0) / 10.0;
    }
    if (options_.dotMin) {
        checkUnitInterval(*options_.dotMin, "dot_min");
        bounds.dotMin = *options_.dotMin;
    } else {
        bounds.dotMin = 0.0;
    }
    if (bounds.dotMin > bounds.dotMax) {
        throw Dotmatrix::InvalidArgumentException("`dot_min` (" + std::to_string(bounds.dotMin) +
                                                  ") must not exceed `dot_max` (" + std::to_string(bounds.dotMax) + ")");
    }
    return bounds;
}

double ValueScaler::dotSize(double rescaledFraction) noexcept {
    const double r = rescaledFraction * 10.0;
    return r * r;
}

std::vector<ScaledCell> ValueScaler::scale(const StatMatrix& stats, const DotBounds& bounds) const {
    std::vector<ScaledCell> out;
    out.reserve(stats.cells().size());
    for (const auto& cell : stats.cells()) {
        ScaledCell sc;
        sc.size = dotSize(bounds.transform(cell.fraction));
        sc.color = colorFor(cell.mean(options_.meanOnlyExpressed));
        out.push_back(sc);
    }
    return out;
}
