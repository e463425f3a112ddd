#pragma once
#include "GnuplotCanvas.h"
#include "LayoutEngine.h"
#include "LegendBuilder.h"
#include "ValueScaler.h"

#include <string>
#include <vector>

enum class TitleLoc { Top, Right };

/**
 * @throws Dotmatrix::InvalidArgumentException for anything but top|right.
 */
TitleLoc parseTitleLoc(const std::string& value);
std::string titleLocName(TitleLoc loc);

struct DotplotScene {
    std::vector<std::string> groupLabels;
    std::vector<std::string> featureLabels;
    std::vector<ScaledCell> cells; // group-major, as in StatMatrix
    SizeLegend legend;
    std::string title;
    TitleLoc titleLoc = TitleLoc::Top;
    bool omitXLabels = false;
    bool omitYLabels = false;
};

// Room reserved around the grid for tick labels and titles, in inches.
struct LabelPadding {
    double left = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double top = 0.0;
};

struct DrawnPanel {
    PanelRect plotArea;
    AxisSpec xAxis;
    AxisSpec yAxis;
};

class DotplotRenderer {
public:
    static constexpr double kCharWidth = 0.075;  // inches per character at the tick font size
    static constexpr double kLineHeight = 0.2;   // inches
    static constexpr double kTitleFontSize = 15.0;
    // Diameter in points of a gnuplot circle at pointsize 1 on cairo terminals.
    static constexpr double kPointDiameter = 6.0;

    DotplotRenderer(LayoutEngine engine, FigureLayout layout);

    /**
     * @brief Margin needed around the layout's figure so no label is clipped.
     */
    LabelPadding padding(const DotplotScene& scene) const;

    /**
     * @brief Draws the main dot grid into region (screen fractions of the canvas).
     */
    DrawnPanel drawMain(GnuplotCanvas& canvas, const PanelRect& region, const DotplotScene& scene) const;

    void drawLegend(GnuplotCanvas& canvas, const PanelRect& region, const DotplotScene& scene) const;

    /**
     * @brief Font size of a title placed on the right: min(15, 100 * height / length).
     */
    static double rightTitleFontSize(double figureHeight, const std::string& title) noexcept;

    // gnuplot pointsize for a dot of the given area (points squared).
    static double pointSize(double area, double dotScale) noexcept;

    const FigureLayout& layout() const noexcept { return layout_; }

private:
    LayoutEngine engine_;
    FigureLayout layout_;

    void writeTics(std::ostream& os, const std::string& axis, const AxisSpec& spec, const std::string& options) const;
};
