#include "Dotplot.h"
#include "CategoryRelabel.h"
#include "ColorMap.h"
#include "DotmatrixExceptions.h"
#include "LegendBuilder.h"
#include "ValueScaler.h"

#include <iostream>

namespace {
bool resolveUseRaw(const AnnotatedDataset& data, const DotplotOptions& options) {
    if (!options.useRaw.has_value()) return data.hasRaw();
    if (*options.useRaw && !data.hasRaw()) {
        throw Dotmatrix::InvalidArgumentException("raw expression requested but the dataset has none");
    }
    return *options.useRaw;
}

CategoricalAnnotation resolveGroups(const AnnotatedDataset& data, const std::optional<std::string>& groupby) {
    if (!groupby.has_value()) {
        CategoricalAnnotation all;
        all.categories = {kSingleGroupLabel};
        all.codes.assign(data.nObs(), 0);
        return all;
    }
    if (data.hasCategoricalAnnotation(*groupby)) return data.categoricalAnnotation(*groupby);
    if (data.hasNumericAnnotation(*groupby)) {
        return CategoricalAnnotation::fromNumeric(data.numericAnnotation(*groupby));
    }
    throw Dotmatrix::MissingKeyException("'" + *groupby + "' not found");
}

StatMatrix aggregateFor(const AnnotatedDataset& data,
                        const std::vector<std::string>& keys,
                        const DotplotOptions& options,
                        bool annotateDerivedGroups) {
    if (keys.empty()) {
        throw Dotmatrix::InvalidArgumentException("keys must be a non-empty list of annotation keys or feature names");
    }
    if (options.jointFraction && keys.size() != 2) {
        throw Dotmatrix::InvalidArgumentException("exactly two keys are required for joint fraction mode, got " +
                                                  std::to_string(keys.size()));
    }
    if (data.nObs() == 0) {
        throw Dotmatrix::InvalidArgumentException("dataset has no observations");
    }

    const bool useRaw = resolveUseRaw(data, options);
    CategoricalAnnotation groups = resolveGroups(data, options.groupby);
    if (annotateDerivedGroups) groups.setCategoryLabels(annotatedCategoryLabels(groups));

    AggregationOptions agg;
    agg.minGroupSize = options.minGroupSize;
    agg.minPresence = options.minPresence;
    agg.jointFraction = options.jointFraction;
    agg.meanOnlyExpressed = options.meanOnlyExpressed;

    const std::vector<FeatureColumn> features = GroupAggregator::resolveFeatures(data, keys, useRaw);
    StatMatrix stats = GroupAggregator(agg).aggregate(features, groups);
    if (stats.groupCount() == 0) {
        throw Dotmatrix::DatasetException("no group has at least " + std::to_string(options.minGroupSize) +
                                          " observations");
    }
    return stats;
}
} // namespace

StatMatrix computeDotplotStatistics(const AnnotatedDataset& data,
                                    const std::vector<std::string>& keys,
                                    const DotplotOptions& options) {
    return aggregateFor(data, keys, options, false);
}

DotplotResult dotplot(AnnotatedDataset& data,
                      const std::vector<std::string>& keys,
                      const DotplotOptions& options,
                      const std::optional<EmbedTarget>& embed) {
    if (embed.has_value() && !embed->canvas) {
        throw Dotmatrix::InvalidArgumentException("embed target has no canvas");
    }

    // Categorical group labels on the dataset itself are annotated for the whole call;
    // groupings derived on the fly carry their annotated labels in the local copy.
    std::optional<ScopedCategoryRelabel> relabel;
    bool annotateDerived = false;
    if (options.annotateGroups) {
        if (options.groupby.has_value() && data.hasCategoricalAnnotation(*options.groupby)) {
            CategoricalAnnotation& annotation = data.categoricalAnnotation(*options.groupby);
            relabel.emplace(annotation, annotatedCategoryLabels(annotation));
        } else {
            annotateDerived = true;
        }
    }

    const StatMatrix stats = aggregateFor(data, keys, options, annotateDerived);

    ScaleOptions scaleOptions;
    scaleOptions.dotMin = options.dotMin;
    scaleOptions.dotMax = options.dotMax;
    scaleOptions.vmin = options.vmin;
    scaleOptions.vmax = options.vmax;
    scaleOptions.meanOnlyExpressed = options.meanOnlyExpressed;
    const ValueScaler scaler(scaleOptions, ColorMap::named(options.colorMap));
    const DotBounds bounds = scaler.resolveBounds(stats);

    const LegendLoc legendLoc = embed.has_value() ? LegendLoc::None : options.legendLoc;
    const LayoutEngine engine(stats.groupCount(), stats.featureCount(), options.swapAxis, legendLoc);
    const FigureLayout layout = engine.layout();

    DotplotScene scene;
    scene.groupLabels = stats.groupLabels();
    scene.featureLabels = stats.featureLabels();
    scene.cells = scaler.scale(stats, bounds);
    if (layout.hasLegendPanel()) scene.legend = LegendBuilder::build(bounds, scaler);
    scene.title = options.title;
    scene.titleLoc = options.titleLoc;
    scene.omitXLabels = options.omitXLabels;
    scene.omitYLabels = options.omitYLabels;

    const DotplotRenderer renderer(engine, layout);

    if (embed.has_value()) {
        renderer.drawMain(*embed->canvas, embed->region, scene);
        return FigureSize{layout.width, layout.height};
    }

    const LabelPadding pad = renderer.padding(scene);
    const double width = layout.width + pad.left + pad.right;
    const double height = layout.height + pad.bottom + pad.top;
    auto canvas = std::make_shared<GnuplotCanvas>(width, height, options.plot);

    const PanelRect figure{pad.left / width, pad.bottom / height, layout.width / width, layout.height / height};
    const DrawnPanel panel = renderer.drawMain(*canvas, placeWithin(figure, layout.main), scene);
    if (layout.hasLegendPanel()) {
        renderer.drawLegend(*canvas, placeWithin(figure, layout.legend), scene);
    }

    AxisHandle handle;
    handle.canvas = canvas;
    handle.layout = layout;
    handle.plotArea = panel.plotArea;
    handle.xAxis = panel.xAxis;
    handle.yAxis = panel.yAxis;

    if (!options.savePath.empty()) {
        handle.savedPath = canvas->save(options.savePath, options.saveDpi);
        std::cout << "[Dotmatrix][Plot] Saved '" << handle.savedPath << "' (" << stats.groupCount() << " groups x "
                  << stats.featureCount() << " features)\n";
    }
    return handle;
}

DotplotResult dotplot(AnnotatedDataset& data,
                      const std::string& key,
                      const DotplotOptions& options,
                      const std::optional<EmbedTarget>& embed) {
    return dotplot(data, std::vector<std::string>{key}, options, embed);
}
