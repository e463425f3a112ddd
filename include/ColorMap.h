#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct Rgba {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    // "#rrggbb"
    std::string hex() const;
    // 0xRRGGBB as expected by gnuplot "lc rgb variable".
    uint32_t packedRgb() const noexcept;

    static Rgba fromHex(const std::string& hex);
};

/**
 * @brief Continuous color function interpolating linearly between evenly spaced anchors.
 */
class ColorMap {
public:
    ColorMap(std::string name, std::vector<Rgba> anchors);

    /**
     * @brief Maps t in [0,1] to a color; values outside are clamped, NaN maps to the low end.
     */
    Rgba operator()(double t) const;

    const std::string& name() const noexcept { return name_; }
    ColorMap reversed() const;

    /**
     * @brief Returns a built-in map: Reds, Blues, Greys, viridis, expression, or any of them with suffix "_r".
     * @throws Dotmatrix::InvalidArgumentException for unknown names.
     */
    static ColorMap named(const std::string& name);

    /**
     * @brief Grey background for the lowest backgroundLevel of the range, then Reds.
     */
    static ColorMap expression(double backgroundLevel = 0.01);

    static std::vector<std::string> builtinNames();

private:
    std::string name_;
    std::vector<Rgba> anchors_;
};

/**
 * @brief Linear map of [vmin, vmax] onto [0,1], clamped.
 * @details vmin == vmax maps everything to 0.
 * @throws Dotmatrix::InvalidArgumentException when vmin > vmax.
 */
class Normalize {
public:
    Normalize(double vmin, double vmax);
    double operator()(double value) const noexcept;

    double vmin() const noexcept { return vmin_; }
    double vmax() const noexcept { return vmax_; }

private:
    double vmin_;
    double vmax_;
};
