#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace noisedet {

// One silence interval as reported by silencedetect. The end is missing when
// the silence runs to the end of the stream and the tool never closed it.
struct SilenceInterval {
    double start{0.0};
    std::optional<double> end;
};

// Non-silent span between two silences. An open end means "until the end of
// the media", used when the total duration could not be read.
struct TimeSpan {
    double start{0.0};
    std::optional<double> end;
};

struct SilenceReport {
    std::vector<SilenceInterval> silences;
    std::size_t startMarkers{0};
    std::optional<double> totalDuration;
};

// Parses the diagnostic text written by ffmpeg's silencedetect filter.
//
// Recognised lines:
//   [silencedetect @ 0x...] silence_start: 1.234
//   [silencedetect @ 0x...] silence_end: 2.5 | silence_duration: 1.266
//   size=N/A time=00:00:05.00 bitrate=N/A speed= 612x
//   Duration: 00:00:05.00, start: 0.000000, bitrate: 1411 kb/s
//
// Every other line is ignored. Throws ExecutionError when a matched marker
// carries a value that does not convert to a number.
SilenceReport parseSilenceOutput(const std::string& text);

// Spans of audio between the reported silences, in order. Zero-length spans
// (silence starting at 0, or ending exactly at the end of the media) are
// dropped.
std::vector<TimeSpan> nonSilentChunks(const SilenceReport& report);

// True when at least one non-silent span exists. With no silence markers at
// all the whole file counts as noise.
bool isNoiseDetected(const SilenceReport& report);

} // namespace noisedet
