#pragma once
#include "LayoutEngine.h"

#include <sstream>
#include <string>

struct PlotConfig {
    std::string theme = "light"; // light|dark
    bool showGrid = false;
    double lineWidth = 1.0;
    double dotScale = 1.0;       // multiplier on rendered dot diameters
};

/**
 * @brief A figure being composed as a gnuplot multiplot script.
 * @details Panels are appended with beginPanel() followed by raw commands; save() runs
 * the gnuplot executable on the finished script. Several dot matrices can share one canvas.
 */
class GnuplotCanvas {
public:
    GnuplotCanvas(double widthInches, double heightInches, PlotConfig cfg = {});

    GnuplotCanvas(const GnuplotCanvas&) = delete;
    GnuplotCanvas& operator=(const GnuplotCanvas&) = delete;

    double widthInches() const noexcept { return width_; }
    double heightInches() const noexcept { return height_; }
    const PlotConfig& config() const noexcept { return cfg_; }
    size_t panelCount() const noexcept { return panels_; }

    /**
     * @brief Starts a new panel whose plot area is fixed to the given screen rectangle.
     */
    void beginPanel(const PanelRect& plotArea);

    // Raw gnuplot commands for the current panel.
    std::ostream& commands() { return body_; }

    /**
     * @brief Registers inline data and returns the datablock name to reference in plot commands.
     */
    std::string addDataBlock(const std::string& baseName, const std::string& content);

    /**
     * @brief Full script for the given terminal and output path.
     */
    std::string script(const std::string& terminal, const std::string& outputPath) const;

    /**
     * @brief Renders to outputPath; the terminal follows the extension (png, svg, pdf).
     * @post Returns the written path.
     * @throws Dotmatrix::IOException when the output directory is missing or the script cannot be written.
     * @throws Dotmatrix::RenderException when gnuplot is unavailable or fails.
     */
    std::string save(const std::string& outputPath, int dpi) const;

    static bool isAvailable();
    static std::string quote(const std::string& value);
    static std::string terminalFor(const std::string& outputPath, double widthInches, double heightInches, int dpi);

    std::string textColor() const;
    std::string borderColor() const;
    std::string backgroundColor() const;

private:
    double width_;
    double height_;
    PlotConfig cfg_;
    std::ostringstream data_;
    std::ostringstream body_;
    size_t panels_ = 0;
    size_t blocks_ = 0;
};
