#include "GnuplotCanvas.h"
#include "CommonUtils.h"
#include "DotmatrixExceptions.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnGnuplot(const std::string& executable,
                 const std::string& scriptPath,
                 const std::string& stderrPath) {
    const int errFd = ::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (errFd < 0) return -1;

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        ::close(errFd);
        return -1;
    }
    if (::posix_spawn_file_actions_adddup2(&actions, errFd, STDERR_FILENO) != 0 ||
        ::posix_spawn_file_actions_addclose(&actions, errFd) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        ::close(errFd);
        return -1;
    }

    const char* argvRaw[] = {executable.c_str(), scriptPath.c_str(), nullptr};
    char* const* argv = const_cast<char* const*>(argvRaw);
    pid_t pid = -1;
    const int spawnRc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv, environ);

    ::posix_spawn_file_actions_destroy(&actions);
    ::close(errFd);

    if (spawnRc != 0 || pid <= 0) return -1;

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::string extensionOf(const std::string& path) {
    return CommonUtils::toLower(std::filesystem::path(path).extension().string());
}
} // namespace

GnuplotCanvas::GnuplotCanvas(double widthInches, double heightInches, PlotConfig cfg)
    : width_(widthInches), height_(heightInches), cfg_(std::move(cfg)) {
    if (!(width_ > 0.0) || !(height_ > 0.0)) {
        throw Dotmatrix::InvalidArgumentException("canvas dimensions must be positive");
    }
}

std::string GnuplotCanvas::textColor() const {
    return cfg_.theme == "dark" ? "#e5e7eb" : "#000000";
}

std::string GnuplotCanvas::borderColor() const {
    return cfg_.theme == "dark" ? "#9ca3af" : "#000000";
}

std::string GnuplotCanvas::backgroundColor() const {
    return cfg_.theme == "dark" ? "#111827" : "#ffffff";
}

void GnuplotCanvas::beginPanel(const PanelRect& plotArea) {
    ++panels_;
    body_ << "\n# panel " << panels_ << "\n";
    body_ << "reset\n";
    body_ << "set lmargin at screen " << plotArea.left << "\n";
    body_ << "set rmargin at screen " << (plotArea.left + plotArea.width) << "\n";
    body_ << "set bmargin at screen " << plotArea.bottom << "\n";
    body_ << "set tmargin at screen " << (plotArea.bottom + plotArea.height) << "\n";
    body_ << "set border linewidth " << cfg_.lineWidth << " lc rgb " << quote(borderColor()) << "\n";
    body_ << "set tics textcolor rgb " << quote(textColor()) << " scale 0.5\n";
    body_ << "set tics out nomirror\n";
    body_ << "unset key\n";
    if (cfg_.showGrid) {
        body_ << "set grid back lc rgb '#e5e7eb' lw 1 dt 2\n";
    } else {
        body_ << "unset grid\n";
    }
}

std::string GnuplotCanvas::addDataBlock(const std::string& baseName, const std::string& content) {
    ++blocks_;
    std::string name = "$" + baseName + "_" + std::to_string(blocks_);
    data_ << name << " << EOD\n" << content;
    if (!content.empty() && content.back() != '\n') data_ << "\n";
    data_ << "EOD\n";
    return name;
}

std::string GnuplotCanvas::quote(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            escaped += "''";
        } else if (ch == '\n' || ch == '\r') {
            escaped.push_back(' ');
        } else {
            escaped.push_back(ch);
        }
    }
    escaped.push_back('\'');
    return escaped;
}

std::string GnuplotCanvas::terminalFor(const std::string& outputPath, double widthInches, double heightInches, int dpi) {
    const std::string ext = extensionOf(outputPath);
    const int w = std::max(1, static_cast<int>(std::lround(widthInches * dpi)));
    const int h = std::max(1, static_cast<int>(std::lround(heightInches * dpi)));
    std::ostringstream os;
    if (ext == ".svg") {
        os << "svg size " << w << "," << h << " font ',9'";
    } else if (ext == ".pdf") {
        os << "pdfcairo size " << widthInches << "in," << heightInches << "in font ',9'";
    } else if (ext == ".png" || ext.empty()) {
        // Font sizes are in points; scale them to the requested resolution.
        os << "pngcairo size " << w << "," << h << " font ',9' fontscale " << (static_cast<double>(dpi) / 72.0);
    } else {
        throw Dotmatrix::InvalidArgumentException("unsupported image format '" + ext + "' (use .png, .svg or .pdf)");
    }
    return os.str();
}

std::string GnuplotCanvas::script(const std::string& terminal, const std::string& outputPath) const {
    std::ostringstream script;
    script << "set terminal " << terminal << " enhanced background rgb " << quote(backgroundColor()) << "\n";
    script << "set output " << quote(outputPath) << "\n";
    script << "set encoding utf8\n";
    script << data_.str();
    script << "set multiplot\n";
    script << body_.str();
    script << "unset multiplot\n";
    script << "set output\n";
    return script.str();
}

bool GnuplotCanvas::isAvailable() {
    return !findExecutableInPath("gnuplot").empty();
}

std::string GnuplotCanvas::save(const std::string& outputPath, int dpi) const {
    if (outputPath.empty()) {
        throw Dotmatrix::IOException("output path must not be empty");
    }
    if (dpi <= 0) {
        throw Dotmatrix::InvalidArgumentException("dpi must be > 0");
    }
    const std::filesystem::path out(outputPath);
    const std::filesystem::path dir = out.has_parent_path() ? out.parent_path() : std::filesystem::path(".");
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw Dotmatrix::IOException("output directory does not exist: '" + dir.string() + "'");
    }
    const std::string terminal = terminalFor(outputPath, width_, height_, dpi);

    static const std::string gnuplotExeCached = findExecutableInPath("gnuplot");
    if (gnuplotExeCached.empty()) {
        throw Dotmatrix::RenderException("gnuplot executable not found in PATH");
    }

    const std::string scriptFile = outputPath + ".plt";
    const std::string errFile = outputPath + ".err.log";
    {
        std::ofstream sout(scriptFile, std::ios::binary);
        if (!sout) throw Dotmatrix::IOException("cannot write plot script '" + scriptFile + "'");
        sout << script(terminal, outputPath);
        if (!sout.good()) throw Dotmatrix::IOException("failed while writing plot script '" + scriptFile + "'");
    }

    const int rc = spawnGnuplot(gnuplotExeCached, scriptFile, errFile);
    std::filesystem::remove(scriptFile, ec);

    if (rc != 0 || !std::filesystem::exists(outputPath)) {
        std::ifstream errIn(errFile);
        std::string firstLine;
        std::getline(errIn, firstLine);
        std::cerr << "[Dotmatrix][Plot] Generation failed for output='" << outputPath
                  << "' rc=" << rc;
        if (!firstLine.empty()) std::cerr << " stderr='" << firstLine << "'";
        std::cerr << " full_log='" << errFile << "'\n";
        throw Dotmatrix::RenderException("gnuplot failed to render '" + outputPath + "' (rc=" + std::to_string(rc) + ")");
    }

    std::filesystem::remove(errFile, ec);
    return outputPath;
}
