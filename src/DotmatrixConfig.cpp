#include "DotmatrixConfig.h"
#include "ColorMap.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <fstream>
#include <optional>
#include <unordered_map>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Dotmatrix::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Dotmatrix::DotmatrixException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Dotmatrix::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Dotmatrix::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Dotmatrix::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

// "auto"/"none" leave a dot bound unset.
std::optional<double> parseOptionalBound(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "auto" || v == "none" || v.empty()) return std::nullopt;
    return parseDoubleStrict(v, key);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    if (key.rfind("--", 0) == 0) key.erase(0, 2);
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

void assignKeyValue(DotmatrixConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value.size() != 1) throw Dotmatrix::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "keys") {
        config.keys = CommonUtils::splitList(value);
        return;
    }
    if (key == "categorical") {
        config.categoricalColumns = CommonUtils::splitList(value);
        return;
    }
    if (key == "dot_min") {
        config.dotMin = parseOptionalBound(value, key);
        return;
    }
    if (key == "dot_max") {
        config.dotMax = parseOptionalBound(value, key);
        return;
    }

    struct SizeRule {
        size_t DotmatrixConfig::*member;
        int minValue;
    };
    struct PlotDoubleRule {
        double PlotConfig::*member;
    };

    static const std::unordered_map<std::string, std::string DotmatrixConfig::*> rawStringFields = {
        {"annotations", &DotmatrixConfig::annotationPath},
        {"expression", &DotmatrixConfig::expressionPath},
        {"raw_expression", &DotmatrixConfig::rawExpressionPath},
        {"index_column", &DotmatrixConfig::indexColumn},
        {"groupby", &DotmatrixConfig::groupby},
        {"color_map", &DotmatrixConfig::colorMap},
        {"title", &DotmatrixConfig::title},
        {"output", &DotmatrixConfig::output},
        {"stats_output", &DotmatrixConfig::statsOutput},
        {"x", &DotmatrixConfig::crossX},
        {"y", &DotmatrixConfig::crossY}
    };
    static const std::unordered_map<std::string, std::string DotmatrixConfig::*> lowerStringFields = {
        {"command", &DotmatrixConfig::command},
        {"use_raw", &DotmatrixConfig::useRaw},
        {"legend_loc", &DotmatrixConfig::legendLoc},
        {"title_loc", &DotmatrixConfig::titleLoc},
        {"stats_format", &DotmatrixConfig::statsFormat},
        {"normalise", &DotmatrixConfig::normalise}
    };
    static const std::unordered_map<std::string, bool DotmatrixConfig::*> boolFields = {
        {"mean_only_expressed", &DotmatrixConfig::meanOnlyExpressed},
        {"joint_fraction", &DotmatrixConfig::jointFraction},
        {"swap_axis", &DotmatrixConfig::swapAxis},
        {"omit_x_labels", &DotmatrixConfig::omitXLabels},
        {"omit_y_labels", &DotmatrixConfig::omitYLabels},
        {"annotate_groups", &DotmatrixConfig::annotateGroups},
        {"print_tables", &DotmatrixConfig::printTables},
        {"verbose", &DotmatrixConfig::verbose}
    };
    static const std::unordered_map<std::string, double DotmatrixConfig::*> doubleFields = {
        {"vmin", &DotmatrixConfig::vmin},
        {"vmax", &DotmatrixConfig::vmax}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"min_group_size", {&DotmatrixConfig::minGroupSize, 0}},
        {"min_presence", {&DotmatrixConfig::minPresence, 0}}
    };
    static const std::unordered_map<std::string, PlotDoubleRule> plotDoubleFields = {
        {"plot_line_width", {&PlotConfig::lineWidth}},
        {"plot_dot_scale", {&PlotConfig::dotScale}}
    };

    if (auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second) = parseDoubleStrict(value, key);
        return;
    }
    if (auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (auto it = plotDoubleFields.find(key); it != plotDoubleFields.end()) {
        config.plot.*(it->second.member) = parseDoubleStrict(value, key);
        return;
    }
    if (key == "dpi") {
        config.dpi = parseIntStrict(value, key, 1);
        return;
    }
    if (key == "plot_theme") {
        config.plot.theme = CommonUtils::toLower(value);
        return;
    }
    if (key == "plot_grid") {
        config.plot.showGrid = parseBoolStrict(value, key);
        return;
    }
    throw Dotmatrix::ConfigurationException("Unknown option: " + key);
}
} // namespace

std::string DotmatrixConfig::usage() {
    return "Usage: dotmatrix [dotplot|crosstab] [--config path] [--annotations obs.csv] [--expression x.csv] "
           "[--raw-expression raw.csv] [--index-column name] [--categorical a,b] [--delimiter ,] "
           "[--keys k1,k2] [--groupby key] [--min-group-size N] [--min-presence N] [--use-raw auto|true|false] "
           "[--mean-only-expressed true|false] [--joint-fraction true|false] [--vmin N] [--vmax N] "
           "[--dot-min auto|0..1] [--dot-max auto|0..1] [--color-map name] [--swap-axis true|false] "
           "[--legend-loc right|bottom|none] [--title text] [--title-loc top|right] [--omit-x-labels true|false] "
           "[--omit-y-labels true|false] [--annotate-groups true|false] [--output path.png|svg|pdf] [--dpi N] "
           "[--stats-output base] [--stats-format csv|parquet] [--x key] [--y key] [--normalise none|x|y|xy|yx] "
           "[--plot-theme light|dark] [--plot-grid true|false] [--plot-line-width >0] [--plot-dot-scale >0] "
           "[--print-tables true|false] [--verbose true|false]";
}

DotmatrixConfig DotmatrixConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Dotmatrix::ConfigurationException(usage());
    }

    DotmatrixConfig config;
    int first = 1;
    const std::string head = argv[1];
    if (head == "--help" || head == "-h") {
        throw Dotmatrix::ConfigurationException(usage());
    }
    if (head.rfind("--", 0) != 0) {
        config.command = CommonUtils::toLower(head);
        first = 2;
    }

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Dotmatrix::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Dotmatrix::ConfigurationException("Missing value for " + arg);
        }
        if (arg == "--config") {
            configPath = argv[++i];
        } else {
            overrides.emplace_back(normalizeConfigKey(arg), argv[++i]);
        }
    }

    if (!configPath.empty()) {
        const std::string command = config.command;
        config = fromFile(configPath, config);
        if (first == 2) config.command = command;
    }
    for (const auto& kv : overrides) {
        assignKeyValue(config, kv.first, kv.second);
    }

    config.validate();
    return config;
}

DotmatrixConfig DotmatrixConfig::fromFile(const std::string& configPath, const DotmatrixConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Dotmatrix::ConfigurationException("Could not open config file: " + configPath);

    DotmatrixConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Dotmatrix::DotmatrixException& ex) {
            throw Dotmatrix::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    return config;
}

void DotmatrixConfig::validate() const {
    if (command != "dotplot" && command != "crosstab") {
        throw Dotmatrix::ConfigurationException("command must be dotplot or crosstab (got '" + command + "')");
    }
    if (annotationPath.empty() && expressionPath.empty()) {
        throw Dotmatrix::ConfigurationException("at least one of --annotations or --expression is required");
    }
    if (useRaw != "auto" && useRaw != "true" && useRaw != "false") {
        throw Dotmatrix::ConfigurationException("use_raw must be auto, true or false");
    }
    if (dotMin && (*dotMin < 0.0 || *dotMin > 1.0)) {
        throw Dotmatrix::ConfigurationException("dot_min must be auto or within [0,1]");
    }
    if (dotMax && (*dotMax < 0.0 || *dotMax > 1.0)) {
        throw Dotmatrix::ConfigurationException("dot_max must be auto or within [0,1]");
    }
    if (dotMin && dotMax && *dotMin > *dotMax) {
        throw Dotmatrix::ConfigurationException("dot_min must be <= dot_max");
    }
    if (vmin > vmax) {
        throw Dotmatrix::ConfigurationException("vmin must be <= vmax");
    }
    if (dpi <= 0) {
        throw Dotmatrix::ConfigurationException("dpi must be > 0");
    }
    if (statsFormat != "csv" && statsFormat != "parquet") {
        throw Dotmatrix::ConfigurationException("stats_format must be csv or parquet");
    }
    if (plot.theme != "light" && plot.theme != "dark") {
        throw Dotmatrix::ConfigurationException("plot_theme must be light or dark");
    }
    if (plot.lineWidth <= 0.0 || plot.dotScale <= 0.0) {
        throw Dotmatrix::ConfigurationException("plot_line_width and plot_dot_scale must be > 0");
    }

    try {
        parseLegendLoc(legendLoc);
        parseTitleLoc(titleLoc);
        parseCrossNormalise(normalise);
        ColorMap::named(colorMap);
    } catch (const Dotmatrix::InvalidArgumentException& ex) {
        throw Dotmatrix::ConfigurationException(ex.what());
    }

    if (command == "dotplot") {
        if (keys.empty()) {
            throw Dotmatrix::ConfigurationException("dotplot requires --keys");
        }
        if (jointFraction && keys.size() != 2) {
            throw Dotmatrix::ConfigurationException("joint_fraction requires exactly two keys");
        }
    } else {
        if (annotationPath.empty()) {
            throw Dotmatrix::ConfigurationException("crosstab requires --annotations");
        }
        if (crossX.empty() || crossY.empty()) {
            throw Dotmatrix::ConfigurationException("crosstab requires --x and --y");
        }
    }
}

DotplotOptions DotmatrixConfig::toDotplotOptions() const {
    DotplotOptions options;
    if (!groupby.empty()) options.groupby = groupby;
    options.minGroupSize = minGroupSize;
    options.minPresence = minPresence;
    if (useRaw != "auto") options.useRaw = (useRaw == "true");
    options.meanOnlyExpressed = meanOnlyExpressed;
    options.jointFraction = jointFraction;
    options.vmin = vmin;
    options.vmax = vmax;
    options.dotMin = dotMin;
    options.dotMax = dotMax;
    options.colorMap = colorMap;
    options.swapAxis = swapAxis;
    options.legendLoc = parseLegendLoc(legendLoc);
    options.title = title;
    options.titleLoc = parseTitleLoc(titleLoc);
    options.omitXLabels = omitXLabels;
    options.omitYLabels = omitYLabels;
    options.annotateGroups = annotateGroups;
    options.savePath = output;
    options.saveDpi = dpi;
    options.plot = plot;
    return options;
}

DatasetSource DotmatrixConfig::toDatasetSource() const {
    DatasetSource source;
    source.annotationPath = annotationPath;
    source.expressionPath = expressionPath;
    source.rawExpressionPath = rawExpressionPath;
    source.indexColumn = indexColumn;
    source.categoricalColumns = categoricalColumns;
    source.delimiter = delimiter;
    return source;
}
