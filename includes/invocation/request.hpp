#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace noisedet {

using JsonValue = nlohmann::json;

struct DetectionRequest {
    std::string bucket_name;
    std::string key_name;
    double noise_tolerance{0.0};   // dB, usually negative (dBFS)
    double noise_duration{0.0};    // seconds, > 0
};

// Pulls the request out of an invocation event. The fields live under
// "body", which may be an object or a string holding a JSON object; an event
// without "body" is taken as the request itself.
//
// Throws ValidationError naming the first missing or invalid field.
DetectionRequest parseRequest(const JsonValue& event);

// Same as above from raw event text.
DetectionRequest parseRequestText(const std::string& eventText);

} // namespace noisedet
