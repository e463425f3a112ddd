#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class LegendLoc { Right, Bottom, None };

/**
 * @throws Dotmatrix::InvalidArgumentException for anything but right|bottom|none.
 */
LegendLoc parseLegendLoc(const std::string& value);
std::string legendLocName(LegendLoc loc);

struct GridPosition {
    int column = 0;
    int row = 0;

    bool operator==(const GridPosition& other) const noexcept {
        return column == other.column && row == other.row;
    }
};

// Rectangle in figure fractions, origin at the bottom-left corner.
struct PanelRect {
    double left = 0.0;
    double bottom = 0.0;
    double width = 1.0;
    double height = 1.0;
};

/**
 * @brief Maps a rectangle expressed in fractions of outer onto the coordinates outer lives in.
 */
PanelRect placeWithin(const PanelRect& outer, const PanelRect& inner) noexcept;

struct AxisSpec {
    std::vector<std::string> labels; // label i sits at coordinate i
    double lo = -0.5;
    double hi = 0.5;
    bool reversed = false;           // coordinate 0 at the top / right end
    int labelRotation = 0;           // degrees
};

struct FigureLayout {
    double width = 0.0;  // inches
    double height = 0.0; // inches
    size_t columnCount = 0;
    size_t rowCount = 0;
    bool swapAxis = false;
    LegendLoc legendLoc = LegendLoc::None;
    PanelRect main;
    PanelRect legend;     // meaningful only when legendLoc != None
    double splitGap = 0.0; // gap between panels as a fraction of the mean panel extent

    bool hasLegendPanel() const noexcept { return legendLoc != LegendLoc::None; }
};

/**
 * @brief Grid geometry for a groups x features dot matrix.
 * @details Canonical orientation puts groups on columns and features on rows; swapAxis
 * transposes that mapping and nothing else.
 */
class LayoutEngine {
public:
    static constexpr double kBaseExtent = 0.5;
    static constexpr double kColumnPitch = 0.25;
    static constexpr double kRowPitch = 0.2;
    static constexpr double kLegendExtent = 0.25;

    LayoutEngine(size_t groupCount, size_t featureCount, bool swapAxis, LegendLoc legendLoc);

    FigureLayout layout() const;

    GridPosition position(size_t group, size_t feature) const noexcept;

    size_t columnCount() const noexcept { return swapAxis_ ? featureCount_ : groupCount_; }
    size_t rowCount() const noexcept { return swapAxis_ ? groupCount_ : featureCount_; }

    AxisSpec xAxis(const std::vector<std::string>& groupLabels, const std::vector<std::string>& featureLabels) const;
    AxisSpec yAxis(const std::vector<std::string>& groupLabels, const std::vector<std::string>& featureLabels) const;

private:
    size_t groupCount_;
    size_t featureCount_;
    bool swapAxis_;
    LegendLoc legendLoc_;
};
