#include "invocation/request.hpp"
#include "detect/errors.hpp"
#include "detect/ffmpeg_silence_detector.hpp"

#include <cmath>

namespace noisedet {

namespace {

const JsonValue& requireField(const JsonValue& body, const char* name) {
    if (!body.contains(name) || body.at(name).is_null()) {
        throw ValidationError(std::string(name) + " is required");
    }
    return body.at(name);
}

std::string requireString(const JsonValue& body, const char* name) {
    const JsonValue& v = requireField(body, name);
    if (!v.is_string()) {
        throw ValidationError(std::string(name) + " must be a string");
    }
    std::string s = v.get<std::string>();
    if (s.empty()) {
        throw ValidationError(std::string(name) + " must not be empty");
    }
    return s;
}

double requireNumber(const JsonValue& body, const char* name) {
    const JsonValue& v = requireField(body, name);
    if (!v.is_number()) {
        throw ValidationError(std::string(name) + " must be a number");
    }
    return v.get<double>();
}

JsonValue parseEventText(const std::string& text, const char* what) {
    try {
        return JsonValue::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string(what) + " is not valid JSON: " + e.what());
    }
}

} // namespace

DetectionRequest parseRequest(const JsonValue& event) {
    if (!event.is_object()) {
        throw ValidationError("event must be a JSON object");
    }

    JsonValue body = event;
    if (event.contains("body")) {
        const JsonValue& raw = event.at("body");
        if (raw.is_string()) {
            body = parseEventText(raw.get<std::string>(), "body");
        } else {
            body = raw;
        }
        if (!body.is_object()) {
            throw ValidationError("body must be a JSON object");
        }
    }

    DetectionRequest request;
    request.bucket_name = requireString(body, "bucket_name");
    request.key_name = requireString(body, "key_name");
    request.noise_tolerance = requireNumber(body, "noise_tolerance");
    request.noise_duration = requireNumber(body, "noise_duration");

    if (!(request.noise_duration > 0.0) || !std::isfinite(request.noise_duration)) {
        throw ValidationError("noise_duration must be greater than 0");
    }
    if (request.noise_duration < kMinNoiseDurationSec) {
        throw ValidationError("noise_duration must be at least 0.000001 seconds");
    }
    if (!std::isfinite(request.noise_tolerance)) {
        throw ValidationError("noise_tolerance must be a finite number");
    }
    return request;
}

DetectionRequest parseRequestText(const std::string& eventText) {
    return parseRequest(parseEventText(eventText, "event"));
}

} // namespace noisedet
