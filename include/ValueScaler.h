#pragma once
#include "ColorMap.h"
#include "GroupAggregator.h"

#include <optional>
#include <vector>

// Resolved dot-size clip bounds and the fraction -> [0,1] transform they induce.
struct DotBounds {
    double dotMin = 0.0;
    double dotMax = 1.0;

    bool rescales() const noexcept { return dotMin != 0.0 || dotMax != 1.0; }

    /**
     * @brief Clips to [dotMin, dotMax] and rescales to [0,1] when the bounds differ from (0,1).
     */
    double transform(double fraction) const noexcept;
};

struct ScaleOptions {
    std::optional<double> dotMin;
    std::optional<double> dotMax;
    double vmin = 0.0;
    double vmax = 1.0;
    bool meanOnlyExpressed = false;
};

struct ScaledCell {
    double size = 0.0;
    Rgba color;
};

class ValueScaler {
public:
    /**
     * @throws Dotmatrix::InvalidArgumentException when vmin > vmax.
     */
    ValueScaler(ScaleOptions options, ColorMap colorMap);

    /**
     * @brief Resolves dotMin/dotMax, deriving dotMax from the data when unset.
     * @throws Dotmatrix::InvalidArgumentException when a bound is outside [0,1] or dotMin > dotMax.
     */
    DotBounds resolveBounds(const StatMatrix& stats) const;

    /**
     * @brief Sizes and colors for every cell, in StatMatrix cell order.
     */
    std::vector<ScaledCell> scale(const StatMatrix& stats, const DotBounds& bounds) const;

    static double dotSize(double rescaledFraction) noexcept;

    Rgba colorFor(double mean) const { return colorMap_(normalize_(mean)); }
    const Normalize& normalize() const noexcept { return normalize_; }
    const ColorMap& colorMap() const noexcept { return colorMap_; }

private:
    ScaleOptions options_;
    ColorMap colorMap_;
    Normalize normalize_;
};
