#include "LayoutEngine.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>

LegendLoc parseLegendLoc(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "right") return LegendLoc::Right;
    if (v == "bottom") return LegendLoc::Bottom;
    if (v == "none") return LegendLoc::None;
    throw Dotmatrix::InvalidArgumentException("legend location must be one of: right, bottom, none (got '" + value + "')");
}

std::string legendLocName(LegendLoc loc) {
    switch (loc) {
        case LegendLoc::Right: return "right";
        case LegendLoc::Bottom: return "bottom";
        case LegendLoc::None: return "none";
    }
    return "none";
}

PanelRect placeWithin(const PanelRect& outer, const PanelRect& inner) noexcept {
    return {outer.left + inner.left * outer.width,
            outer.bottom + inner.bottom * outer.height,
            inner.width * outer.width,
            inner.height * outer.height};
}

LayoutEngine::LayoutEngine(size_t groupCount, size_t featureCount, bool swapAxis, LegendLoc legendLoc)
    : groupCount_(groupCount), featureCount_(featureCount), swapAxis_(swapAxis), legendLoc_(legendLoc) {}

FigureLayout LayoutEngine::layout() const {
    FigureLayout out;
    out.swapAxis = swapAxis_;
    out.legendLoc = legendLoc_;
    out.columnCount = columnCount();
    out.rowCount = rowCount();
    out.width = kBaseExtent + static_cast<double>(out.columnCount) * kColumnPitch +
                (legendLoc_ == LegendLoc::Right ? kLegendExtent : 0.0);
    out.height = kBaseExtent + static_cast<double>(out.rowCount) * kRowPitch +
                 (legendLoc_ == LegendLoc::Bottom ? kLegendExtent : 0.0);

    if (legendLoc_ == LegendLoc::None) return out;

    // Ratio (extent - 0.25) : 0.25 along the split axis, gap shrinking with the cell count on that axis.
    const bool right = legendLoc_ == LegendLoc::Right;
    const double extent = right ? out.width : out.height;
    const size_t count = std::max<size_t>(1, right ? out.columnCount : out.rowCount);
    const double mainUnits = extent - kLegendExtent;
    const double legendUnits = kLegendExtent;
    out.splitGap = kLegendExtent / static_cast<double>(count);
    const double gapUnits = out.splitGap * (mainUnits + legendUnits) / 2.0;
    const double total = mainUnits + legendUnits + gapUnits;

    if (right) {
        out.main = {0.0, 0.0, mainUnits / total, 1.0};
        out.legend = {(mainUnits + gapUnits) / total, 0.0, legendUnits / total, 1.0};
    } else {
        out.legend = {0.0, 0.0, 1.0, legendUnits / total};
        out.main = {0.0, (legendUnits + gapUnits) / total, 1.0, mainUnits / total};
    }
    return out;
}

GridPosition LayoutEngine::position(size_t group, size_t feature) const noexcept {
    GridPosition p;
    if (swapAxis_) {
        p.column = static_cast<int>(feature);
        p.row = static_cast<int>(group);
    } else {
        p.column = static_cast<int>(group);
        p.row = static_cast<int>(feature);
    }
    return p;
}

AxisSpec LayoutEngine::xAxis(const std::vector<std::string>& groupLabels,
                             const std::vector<std::string>& featureLabels) const {
    AxisSpec axis;
    axis.labels = swapAxis_ ? featureLabels : groupLabels;
    axis.lo = -0.5;
    axis.hi = static_cast<double>(columnCount()) - 0.5;
    axis.labelRotation = 270;
    return axis;
}

AxisSpec LayoutEngine::yAxis(const std::vector<std::string>& groupLabels,
                             const std::vector<std::string>& featureLabels) const {
    AxisSpec axis;
    axis.labels = swapAxis_ ? groupLabels : featureLabels;
    axis.lo = -0.5;
    axis.hi = static_cast<double>(rowCount()) - 0.5;
    // Groups read top to bottom when they run along the vertical axis.
    axis.reversed = swapAxis_;
    return axis;
}
