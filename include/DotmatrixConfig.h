#pragma once
#include "CrossTable.h"
#include "DatasetLoader.h"
#include "Dotplot.h"
#include "GnuplotCanvas.h"

#include <optional>
#include <string>
#include <vector>

struct DotmatrixConfig {
    std::string command = "dotplot";        // dotplot|crosstab

    // Inputs
    std::string annotationPath;
    std::string expressionPath;
    std::string rawExpressionPath;
    std::string indexColumn;
    std::vector<std::string> categoricalColumns;
    char delimiter = ',';

    // dotplot
    std::vector<std::string> keys;
    std::string groupby;                    // empty: all observations form one group
    size_t minGroupSize = 0;
    size_t minPresence = 0;
    std::string useRaw = "auto";            // auto|true|false
    bool meanOnlyExpressed = false;
    bool jointFraction = false;
    double vmin = 0.0;
    double vmax = 1.0;
    std::optional<double> dotMin;           // unset => 0
    std::optional<double> dotMax;           // unset => derived from the data
    std::string colorMap = "Reds";
    bool swapAxis = false;
    std::string legendLoc = "right";        // right|bottom|none
    std::string title;
    std::string titleLoc = "top";           // top|right
    bool omitXLabels = false;
    bool omitYLabels = false;
    bool annotateGroups = false;
    std::string output = "dotplot.png";     // empty: no image
    int dpi = 80;
    std::string statsOutput;                // base path without extension; empty: no export
    std::string statsFormat = "csv";        // csv|parquet

    // crosstab
    std::string crossX;
    std::string crossY;
    std::string normalise = "none";         // none|x|y|xy|yx

    bool printTables = true;
    bool verbose = false;

    PlotConfig plot;

    /**
     * @brief Builds config from CLI args, with an optional --config file applied first.
     * @pre argv[1] is optionally the command name; remaining args are --key value pairs.
     * @post Returns a validated config object.
     * @throws Dotmatrix::ConfigurationException on invalid arguments or values.
     */
    static DotmatrixConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Dotmatrix::ConfigurationException on parse/validation failures.
     */
    static DotmatrixConfig fromFile(const std::string& configPath, const DotmatrixConfig& base);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Dotmatrix::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage();

    DotplotOptions toDotplotOptions() const;
    DatasetSource toDatasetSource() const;
};
