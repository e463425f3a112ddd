#include "DotplotRenderer.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {
size_t longestLabel(const std::vector<std::string>& labels) {
    size_t out = 0;
    for (const auto& label : labels) out = std::max(out, label.size());
    return out;
}

void writePlot(std::ostream& os, const std::string& block, bool empty) {
    if (empty) {
        // Nothing to draw; keep the panel frame and ticks.
        os << "plot 1/0 notitle\n";
        return;
    }
    os << "plot " << block << " using 1:2:3:4 with points pt 7 ps variable lc rgb variable notitle\n";
}
} // namespace

TitleLoc parseTitleLoc(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "top") return TitleLoc::Top;
    if (v == "right") return TitleLoc::Right;
    throw Dotmatrix::InvalidArgumentException("title location must be one of: top, right (got '" + value + "')");
}

std::string titleLocName(TitleLoc loc) {
    return loc == TitleLoc::Right ? "right" : "top";
}

DotplotRenderer::DotplotRenderer(LayoutEngine engine, FigureLayout layout)
    : engine_(engine), layout_(std::move(layout)) {}

double DotplotRenderer::rightTitleFontSize(double figureHeight, const std::string& title) noexcept {
    if (title.empty()) return kTitleFontSize;
    return std::min(kTitleFontSize, 100.0 * figureHeight / static_cast<double>(title.size()));
}

double DotplotRenderer::pointSize(double area, double dotScale) noexcept {
    if (!(area > 0.0)) return 0.0;
    return std::sqrt(area) / kPointDiameter * dotScale;
}

LabelPadding DotplotRenderer::padding(const DotplotScene& scene) const {
    LabelPadding pad;
    const AxisSpec xAxis = engine_.xAxis(scene.groupLabels, scene.featureLabels);
    const AxisSpec yAxis = engine_.yAxis(scene.groupLabels, scene.featureLabels);

    if (!scene.omitYLabels) {
        pad.left = static_cast<double>(longestLabel(yAxis.labels)) * kCharWidth + 0.1;
    }
    if (!scene.omitXLabels) {
        const double extent = static_cast<double>(longestLabel(xAxis.labels)) * kCharWidth + 0.1;
        if (layout_.legendLoc == LegendLoc::Bottom) {
            pad.top += extent;
        } else {
            pad.bottom += extent;
        }
    }

    const double legendExtent = static_cast<double>(longestLabel(scene.legend.labels)) * kCharWidth + 0.1;
    if (layout_.legendLoc == LegendLoc::Right) pad.right += legendExtent;
    if (layout_.legendLoc == LegendLoc::Bottom) pad.bottom += legendExtent;

    if (!scene.title.empty()) {
        if (scene.titleLoc == TitleLoc::Top) {
            pad.top += kTitleFontSize / 72.0 * 1.6;
        } else if (layout_.legendLoc != LegendLoc::Right) {
            pad.right += rightTitleFontSize(layout_.height, scene.title) / 72.0 * 1.6 + 0.1;
        }
    }
    return pad;
}

void DotplotRenderer::writeTics(std::ostream& os,
                                const std::string& axis,
                                const AxisSpec& spec,
                                const std::string& options) const {
    if (spec.labels.empty()) {
        os << "unset " << axis << "\n";
        return;
    }
    os << "set " << axis << " noenhanced";
    if (spec.labelRotation != 0) os << " rotate by " << spec.labelRotation;
    if (!options.empty()) os << " " << options;
    os << " (";
    for (size_t i = 0; i < spec.labels.size(); ++i) {
        if (i) os << ", ";
        os << GnuplotCanvas::quote(spec.labels[i]) << " " << i;
    }
    os << ")\n";
}

DrawnPanel DotplotRenderer::drawMain(GnuplotCanvas& canvas, const PanelRect& region, const DotplotScene& scene) const {
    const size_t groups = scene.groupLabels.size();
    const size_t features = scene.featureLabels.size();
    if (scene.cells.size() != groups * features) {
        throw Dotmatrix::RenderException("scene has " + std::to_string(scene.cells.size()) +
                                         " cells for a " + std::to_string(groups) + "x" +
                                         std::to_string(features) + " grid");
    }

    DrawnPanel panel;
    panel.plotArea = region;
    panel.xAxis = engine_.xAxis(scene.groupLabels, scene.featureLabels);
    panel.yAxis = engine_.yAxis(scene.groupLabels, scene.featureLabels);

    std::ostringstream dots;
    bool anyDot = false;
    for (size_t g = 0; g < groups; ++g) {
        for (size_t f = 0; f < features; ++f) {
            const ScaledCell& cell = scene.cells[g * features + f];
            const double ps = pointSize(cell.size, canvas.config().dotScale);
            if (ps <= 0.0) continue;
            const GridPosition pos = engine_.position(g, f);
            dots << pos.column << " " << pos.row << " " << ps << " " << cell.color.packedRgb() << "\n";
            anyDot = true;
        }
    }
    const std::string block = anyDot ? canvas.addDataBlock("dots", dots.str()) : std::string();

    canvas.beginPanel(region);
    std::ostream& os = canvas.commands();
    const std::string text = GnuplotCanvas::quote(canvas.textColor());

    os << "set xrange [" << panel.xAxis.lo << ":" << panel.xAxis.hi << "]\n";
    if (panel.yAxis.reversed) {
        os << "set yrange [" << panel.yAxis.hi << ":" << panel.yAxis.lo << "]\n";
    } else {
        os << "set yrange [" << panel.yAxis.lo << ":" << panel.yAxis.hi << "]\n";
    }

    if (scene.omitXLabels) {
        os << "unset xtics\nunset x2tics\n";
    } else if (layout_.legendLoc == LegendLoc::Bottom) {
        // The legend occupies the bottom edge, so x ticks move to the top.
        os << "unset xtics\nset link x2\n";
        writeTics(os, "x2tics", panel.xAxis, "right");
    } else {
        writeTics(os, "xtics", panel.xAxis, "left");
    }
    if (scene.omitYLabels) {
        os << "unset ytics\n";
    } else {
        writeTics(os, "ytics", panel.yAxis, "");
    }

    if (!scene.title.empty()) {
        if (scene.titleLoc == TitleLoc::Top) {
            os << "set title " << GnuplotCanvas::quote(scene.title) << " noenhanced font '," << kTitleFontSize
               << "' textcolor rgb " << text << "\n";
        } else if (layout_.legendLoc != LegendLoc::Right) {
            os << "set y2label " << GnuplotCanvas::quote(scene.title) << " noenhanced rotate by 270 font ',"
               << rightTitleFontSize(layout_.height, scene.title) << "' textcolor rgb " << text << "\n";
        }
    }

    writePlot(os, block, !anyDot);
    return panel;
}

void DotplotRenderer::drawLegend(GnuplotCanvas& canvas, const PanelRect& region, const DotplotScene& scene) const {
    if (layout_.legendLoc == LegendLoc::None || scene.legend.empty()) return;

    const SizeLegend& legend = scene.legend;
    const size_t n = legend.ticks.values.size();
    const bool right = layout_.legendLoc == LegendLoc::Right;

    std::ostringstream dots;
    bool anyDot = false;
    for (size_t i = 0; i < n; ++i) {
        const double ps = pointSize(legend.sizes[i], canvas.config().dotScale);
        if (ps <= 0.0) continue;
        if (right) {
            dots << 0 << " " << i;
        } else {
            dots << i << " " << 0;
        }
        dots << " " << ps << " " << legend.color.packedRgb() << "\n";
        anyDot = true;
    }
    const std::string block = anyDot ? canvas.addDataBlock("legend", dots.str()) : std::string();

    canvas.beginPanel(region);
    std::ostream& os = canvas.commands();
    os << "unset border\nunset xtics\nunset ytics\n";

    AxisSpec ticks;
    ticks.labels = legend.labels;
    // Shift the legend dots next to the main grid, one dot pitch per extra cell.
    const double lo = -0.5;
    const double lastEdge = static_cast<double>(n) - 0.5;
    const double hi = lastEdge + 0.5; // half a cell of headroom past the last dot's edge
    if (right) {
        const double shrink = (static_cast<double>(layout_.rowCount) - 1.0) * 0.75;
        os << "set xrange [-0.5:0.5]\n";
        os << "set yrange [" << (lo - std::max(0.0, shrink)) << ":" << hi << "]\n";
        os << "set link y2\n";
        writeTics(os, "y2tics", ticks, "scale 0");
        if (!scene.title.empty() && scene.titleLoc == TitleLoc::Right) {
            os << "set ylabel " << GnuplotCanvas::quote(scene.title) << " noenhanced rotate by 270 font ',"
               << rightTitleFontSize(layout_.height, scene.title) << "' textcolor rgb "
               << GnuplotCanvas::quote(canvas.textColor()) << "\n";
        }
    } else {
        const double shrink = (static_cast<double>(layout_.columnCount) - 1.0) * 0.75;
        ticks.labelRotation = 270;
        os << "set xrange [" << (lo - std::max(0.0, shrink)) << ":" << hi << "]\n";
        os << "set yrange [-0.5:0.5]\n";
        writeTics(os, "xtics", ticks, "left scale 0");
    }
    writePlot(os, block, !anyDot);
}
