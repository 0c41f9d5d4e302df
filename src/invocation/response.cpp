#include "invocation/response.hpp"

namespace noisedet {

DetectionResponse DetectionResponse::detected(bool noiseDetected) {
    DetectionResponse r;
    r.success = true;
    r.noise_detected = noiseDetected;
    return r;
}

DetectionResponse DetectionResponse::failure(const std::string& message) {
    DetectionResponse r;
    r.success = false;
    r.error = message.empty() ? std::string("unknown error") : message;
    return r;
}

JsonValue DetectionResponse::toJson() const {
    JsonValue j = JsonValue::object();
    j["success"] = success;
    j["noise_detected"] = noise_detected ? JsonValue(*noise_detected) : JsonValue(nullptr);
    j["error"] = error ? JsonValue(*error) : JsonValue(nullptr);
    return j;
}

JsonValue toInvocationResult(const DetectionResponse& response) {
    return JsonValue{
        {"statusCode", 200},
        {"data", response.toJson()},
    };
}

} // namespace noisedet
