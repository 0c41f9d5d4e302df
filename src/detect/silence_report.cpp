#include "detect/silence_report.hpp"
#include "detect/errors.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace noisedet {

namespace {

// Spans shorter than this are timestamp rounding, not audio.
constexpr double kSpanEpsilon = 0.01;

const std::regex& silenceStartRe() {
    static const std::regex re(R"( silence_start: (-?[0-9]+(?:\.[0-9]*)?(?:[eE][-+]?[0-9]+)?)\s*$)");
    return re;
}

const std::regex& silenceEndRe() {
    static const std::regex re(R"( silence_end: (-?[0-9]+(?:\.[0-9]*)?(?:[eE][-+]?[0-9]+)?))");
    return re;
}

const std::regex& progressTimeRe() {
    static const std::regex re(R"(time=([0-9]{2,}):([0-9]{2}):([0-9]{2}(\.[0-9]+)?))");
    return re;
}

const std::regex& headerDurationRe() {
    static const std::regex re(R"(Duration: ([0-9]{2,}):([0-9]{2}):([0-9]{2}(\.[0-9]+)?))");
    return re;
}

double toSeconds(const std::string& value, const char* what) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ExecutionError(std::string("unparseable ") + what + " value in tool output: " + value);
    }
}

double clockToSeconds(const std::smatch& m) {
    const double hours = toSeconds(m[1].str(), "hours");
    const double minutes = toSeconds(m[2].str(), "minutes");
    const double seconds = toSeconds(m[3].str(), "seconds");
    return hours * 3600.0 + minutes * 60.0 + seconds;
}

// ffmpeg separates progress updates with '\r', so split on both.
std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            if (!current.empty()) lines.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

} // namespace

SilenceReport parseSilenceOutput(const std::string& text) {
    SilenceReport report;
    std::optional<double> headerDuration;
    std::optional<double> progressDuration;

    for (const auto& line : splitLines(text)) {
        std::smatch m;
        if (std::regex_search(line, m, silenceStartRe())) {
            report.silences.push_back({toSeconds(m[1].str(), "silence_start"), std::nullopt});
            ++report.startMarkers;
        } else if (std::regex_search(line, m, silenceEndRe())) {
            // An end without an open start carries no information.
            if (!report.silences.empty() && !report.silences.back().end) {
                report.silences.back().end = toSeconds(m[1].str(), "silence_end");
            }
        } else if (std::regex_search(line, m, progressTimeRe())) {
            progressDuration = clockToSeconds(m);
        } else if (!headerDuration && std::regex_search(line, m, headerDurationRe())) {
            headerDuration = clockToSeconds(m);
        }
    }

    // The final progress line reflects what was actually decoded.
    report.totalDuration = progressDuration ? progressDuration : headerDuration;
    return report;
}

std::vector<TimeSpan> nonSilentChunks(const SilenceReport& report) {
    std::vector<TimeSpan> chunks;
    std::optional<double> cursor = 0.0;

    for (const auto& silence : report.silences) {
        if (silence.start > *cursor + kSpanEpsilon) {
            chunks.push_back({*cursor, silence.start});
        }
        if (!silence.end) {
            // Silence never stopped.
            cursor.reset();
            break;
        }
        cursor = std::max(*cursor, *silence.end);
    }

    if (cursor) {
        if (!report.totalDuration) {
            chunks.push_back({*cursor, std::nullopt});
        } else if (*report.totalDuration > *cursor + kSpanEpsilon) {
            chunks.push_back({*cursor, *report.totalDuration});
        }
    }
    return chunks;
}

bool isNoiseDetected(const SilenceReport& report) {
    if (report.startMarkers == 0) return true;
    return !nonSilentChunks(report).empty();
}

} // namespace noisedet
