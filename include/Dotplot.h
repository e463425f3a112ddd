#pragma once
#include "AnnotatedDataset.h"
#include "DotplotRenderer.h"
#include "GnuplotCanvas.h"
#include "GroupAggregator.h"
#include "LayoutEngine.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct DotplotOptions {
    std::optional<std::string> groupby;      // unset: every observation in one group
    size_t minGroupSize = 0;
    size_t minPresence = 0;
    std::optional<bool> useRaw;              // unset: raw expression when the dataset has one
    bool meanOnlyExpressed = false;
    bool jointFraction = false;
    double vmin = 0.0;
    double vmax = 1.0;
    std::optional<double> dotMin;
    std::optional<double> dotMax;
    std::string colorMap = "Reds";
    bool swapAxis = false;
    LegendLoc legendLoc = LegendLoc::Right;
    std::string title;
    TitleLoc titleLoc = TitleLoc::Top;
    bool omitXLabels = false;
    bool omitYLabels = false;
    bool annotateGroups = false;
    std::string savePath;                    // empty: do not write a file
    int saveDpi = 80;
    PlotConfig plot;
};

// Standalone result: the figure and where its dot grid was drawn.
struct AxisHandle {
    std::shared_ptr<GnuplotCanvas> canvas;
    FigureLayout layout;
    PanelRect plotArea;
    AxisSpec xAxis;
    AxisSpec yAxis;
    std::string savedPath;
};

struct FigureSize {
    double width = 0.0;
    double height = 0.0;
};

using DotplotResult = std::variant<AxisHandle, FigureSize>;

// Region of an existing canvas to draw into instead of creating a figure.
struct EmbedTarget {
    std::shared_ptr<GnuplotCanvas> canvas;
    PanelRect region;
};

inline constexpr const char* kSingleGroupLabel = "all";

/**
 * @brief Runs aggregation only: the StatMatrix a dotplot with these options would display.
 * @throws Dotmatrix::InvalidArgumentException on invalid keys or options.
 * @throws Dotmatrix::MissingKeyException when groupby names no annotation.
 */
StatMatrix computeDotplotStatistics(const AnnotatedDataset& data,
                                    const std::vector<std::string>& keys,
                                    const DotplotOptions& options);

/**
 * @brief Aggregates, scales, lays out and renders a dot matrix of keys across groups.
 * @details Without an embed target a new canvas is created, written to savePath when set,
 * and an AxisHandle is returned. With one, the dot grid is drawn into the target region
 * (no legend) and the computed FigureSize is returned.
 * Group labels relabelled for annotateGroups are restored before returning, including on failure.
 * @throws Dotmatrix::DotmatrixException subclasses on invalid input or rendering failure.
 */
DotplotResult dotplot(AnnotatedDataset& data,
                      const std::vector<std::string>& keys,
                      const DotplotOptions& options,
                      const std::optional<EmbedTarget>& embed = std::nullopt);

DotplotResult dotplot(AnnotatedDataset& data,
                      const std::string& key,
                      const DotplotOptions& options,
                      const std::optional<EmbedTarget>& embed = std::nullopt);
