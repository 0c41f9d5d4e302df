#include "invocation/noise_detector.hpp"
#include "detect/errors.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace noisedet {

namespace {

JsonValue spanEnd(const std::optional<double>& end) {
    return end ? JsonValue(*end) : JsonValue(nullptr);
}

} // namespace

JsonValue FileAnalysis::toJson() const {
    JsonValue silences = JsonValue::array();
    for (const auto& s : report.silences) {
        silences.push_back({{"start", s.start}, {"end", spanEnd(s.end)}});
    }
    JsonValue spans = JsonValue::array();
    for (const auto& c : chunks) {
        spans.push_back({{"start", c.start}, {"end", spanEnd(c.end)}});
    }
    return JsonValue{
        {"noise_detected", noiseDetected},
        {"duration", spanEnd(report.totalDuration)},
        {"silences", silences},
        {"chunks", spans},
    };
}

NoiseDetector::NoiseDetector(ObjectStore& store, const FfmpegSilenceDetector& tool)
    : store_(store), tool_(tool) {}

FileAnalysis NoiseDetector::analyzeFile(const std::string& path,
                                        double noiseToleranceDb,
                                        double noiseDurationSec) const {
    FileAnalysis analysis;
    analysis.report = tool_.detect(path, noiseToleranceDb, noiseDurationSec);
    analysis.chunks = nonSilentChunks(analysis.report);
    analysis.noiseDetected = isNoiseDetected(analysis.report);
    return analysis;
}

DetectionResponse NoiseDetector::guarded(const std::function<DetectionResponse()>& body) {
    try {
        return body();
    } catch (const ValidationError& e) {
        std::cerr << "Error: invalid request: " << e.what() << std::endl;
        return DetectionResponse::failure(e.what());
    } catch (const ExecutionError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return DetectionResponse::failure(e.what());
    } catch (const std::exception& e) {
        std::cerr << "Error: unexpected failure: " << e.what() << std::endl;
        return DetectionResponse::failure(e.what());
    }
}

DetectionResponse NoiseDetector::detect(const DetectionRequest& request) {
    return guarded([&]() {
        if (!(request.noise_duration > 0.0)) {
            throw ValidationError("noise_duration must be greater than 0");
        }
        StagedObject object = store_.fetch(request.bucket_name, request.key_name);
        FileAnalysis analysis = analyzeFile(object.path().string(),
                                            request.noise_tolerance,
                                            request.noise_duration);
        return DetectionResponse::detected(analysis.noiseDetected);
    });
}

JsonValue NoiseDetector::handleEvent(const JsonValue& event) {
    DetectionResponse response = guarded([&]() {
        return detect(parseRequest(event));
    });
    return toInvocationResult(response);
}

JsonValue NoiseDetector::handleEventText(const std::string& eventText) {
    DetectionResponse response = guarded([&]() {
        return detect(parseRequestText(eventText));
    });
    return toInvocationResult(response);
}

JsonValue NoiseDetector::handleEventFile(const std::string& path) {
    DetectionResponse response = guarded([&]() {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ExecutionError("cannot open event file: " + path);
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        return detect(parseRequestText(ss.str()));
    });
    return toInvocationResult(response);
}

} // namespace noisedet
