#include "ColorMap.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace {
// ColorBrewer sequential ramps, the same anchors matplotlib uses.
const std::vector<std::string> kReds = {
    "#fff5f0", "#fee0d2", "#fcbba1", "#fc9272", "#fb6a4a", "#ef3b2c", "#cb181d", "#a50f15", "#67000d"};
const std::vector<std::string> kBlues = {
    "#f7fbff", "#deebf7", "#c6dbef", "#9ecae1", "#6baed6", "#4292c6", "#2171b5", "#08519c", "#08306b"};
const std::vector<std::string> kGreys = {
    "#ffffff", "#f0f0f0", "#d9d9d9", "#bdbdbd", "#969696", "#737373", "#525252", "#252525", "#000000"};
const std::vector<std::string> kViridis = {
    "#440154", "#482475", "#414487", "#355f8d", "#2a788e", "#21918c", "#22a884", "#44bf70", "#7ad151",
    "#bddf26", "#fde725"};

std::vector<Rgba> anchorsFromHex(const std::vector<std::string>& hexes) {
    std::vector<Rgba> out;
    out.reserve(hexes.size());
    for (const auto& h : hexes) out.push_back(Rgba::fromHex(h));
    return out;
}

double channelToUnit(const std::string& hex, size_t offset) {
    const std::string part = hex.substr(offset, 2);
    char* end = nullptr;
    const long v = std::strtol(part.c_str(), &end, 16);
    if (end == part.c_str() || *end != '\0') {
        throw Dotmatrix::InvalidArgumentException("invalid hex color '" + hex + "'");
    }
    return static_cast<double>(v) / 255.0;
}

uint32_t unitToByte(double v) {
    return static_cast<uint32_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
}

// Evenly spaced samples of a map over [lo, hi], like cmap(np.linspace(lo, hi, n)).
std::vector<Rgba> sampleMap(const ColorMap& map, double lo, double hi, size_t n) {
    std::vector<Rgba> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double t = (n == 1) ? lo : lo + (hi - lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        out.push_back(map(t));
    }
    return out;
}
} // namespace

std::string Rgba::hex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", unitToByte(r), unitToByte(g), unitToByte(b));
    return std::string(buf);
}

uint32_t Rgba::packedRgb() const noexcept {
    return (unitToByte(r) << 16) | (unitToByte(g) << 8) | unitToByte(b);
}

Rgba Rgba::fromHex(const std::string& hex) {
    if (hex.size() != 7 || hex[0] != '#') {
        throw Dotmatrix::InvalidArgumentException("invalid hex color '" + hex + "'");
    }
    Rgba c;
    c.r = channelToUnit(hex, 1);
    c.g = channelToUnit(hex, 3);
    c.b = channelToUnit(hex, 5);
    c.a = 1.0;
    return c;
}

ColorMap::ColorMap(std::string name, std::vector<Rgba> anchors)
    : name_(std::move(name)), anchors_(std::move(anchors)) {
    if (anchors_.empty()) {
        throw Dotmatrix::InvalidArgumentException("color map '" + name_ + "' needs at least one anchor");
    }
}

Rgba ColorMap::operator()(double t) const {
    if (anchors_.size() == 1) return anchors_.front();
    if (std::isnan(t)) t = 0.0;
    t = std::clamp(t, 0.0, 1.0);

    const double pos = t * static_cast<double>(anchors_.size() - 1);
    const size_t lo = std::min(static_cast<size_t>(std::floor(pos)), anchors_.size() - 2);
    const double frac = pos - static_cast<double>(lo);
    const Rgba& a = anchors_[lo];
    const Rgba& b = anchors_[lo + 1];
    Rgba out;
    out.r = a.r + (b.r - a.r) * frac;
    out.g = a.g + (b.g - a.g) * frac;
    out.b = a.b + (b.b - a.b) * frac;
    out.a = a.a + (b.a - a.a) * frac;
    return out;
}

ColorMap ColorMap::reversed() const {
    std::vector<Rgba> rev(anchors_.rbegin(), anchors_.rend());
    const bool endsReversed = name_.size() > 2 && name_.compare(name_.size() - 2, 2, "_r") == 0;
    return ColorMap(endsReversed ? name_.substr(0, name_.size() - 2) : name_ + "_r", std::move(rev));
}

ColorMap ColorMap::named(const std::string& name) {
    if (name.size() > 2 && name.compare(name.size() - 2, 2, "_r") == 0) {
        return named(name.substr(0, name.size() - 2)).reversed();
    }
    if (name == "Reds") return ColorMap(name, anchorsFromHex(kReds));
    if (name == "Blues") return ColorMap(name, anchorsFromHex(kBlues));
    if (name == "Greys") return ColorMap(name, anchorsFromHex(kGreys));
    if (name == "viridis") return ColorMap(name, anchorsFromHex(kViridis));
    if (name == "expression") return expression();
    throw Dotmatrix::InvalidArgumentException("unknown color map '" + name + "'");
}

ColorMap ColorMap::expression(double backgroundLevel) {
    if (backgroundLevel < 0.0 || backgroundLevel >= 1.0) {
        throw Dotmatrix::InvalidArgumentException("expression background level must be within [0,1)");
    }
    const size_t backgroundBins = static_cast<size_t>(100.0 * backgroundLevel);
    std::vector<Rgba> anchors = sampleMap(named("Greys_r"), 0.7, 0.8, backgroundBins);
    const std::vector<Rgba> reds = sampleMap(named("Reds"), 0.0, 1.0, 100 - backgroundBins);
    anchors.insert(anchors.end(), reds.begin(), reds.end());
    return ColorMap("expression", std::move(anchors));
}

std::vector<std::string> ColorMap::builtinNames() {
    return {"Reds", "Blues", "Greys", "viridis", "expression"};
}

Normalize::Normalize(double vmin, double vmax) : vmin_(vmin), vmax_(vmax) {
    if (!(vmin <= vmax)) {
        throw Dotmatrix::InvalidArgumentException("vmin must be <= vmax (got " + std::to_string(vmin) + ", " +
                                                  std::to_string(vmax) + ")");
    }
}

double Normalize::operator()(double value) const noexcept {
    if (vmax_ == vmin_) return 0.0;
    if (std::isnan(value)) return 0.0;
    return std::clamp((value - vmin_) / (vmax_ - vmin_), 0.0, 1.0);
}
