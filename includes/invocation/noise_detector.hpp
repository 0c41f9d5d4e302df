#pragma once

#include "detect/ffmpeg_silence_detector.hpp"
#include "detect/silence_report.hpp"
#include "invocation/request.hpp"
#include "invocation/response.hpp"
#include "storage/object_store.hpp"

#include <functional>
#include <string>
#include <vector>

namespace noisedet {

struct FileAnalysis {
    SilenceReport report;
    std::vector<TimeSpan> chunks;
    bool noiseDetected{false};

    JsonValue toJson() const;
};

// One invocation: validate, fetch the object, run silencedetect, classify.
// Nothing escapes detect() or handleEvent(); every failure comes back as a
// success=false response.
class NoiseDetector {
public:
    NoiseDetector(ObjectStore& store, const FfmpegSilenceDetector& tool);

    DetectionResponse detect(const DetectionRequest& request);

    // Raw event in, transport envelope out.
    JsonValue handleEventText(const std::string& eventText);
    JsonValue handleEvent(const JsonValue& event);
    // An unreadable file is a failed invocation, not a crash.
    JsonValue handleEventFile(const std::string& path);

    // Classifies a file that is already local. Throws ExecutionError.
    FileAnalysis analyzeFile(const std::string& path,
                             double noiseToleranceDb,
                             double noiseDurationSec) const;

private:
    DetectionResponse guarded(const std::function<DetectionResponse()>& body);

    ObjectStore& store_;
    const FfmpegSilenceDetector& tool_;
};

} // namespace noisedet
