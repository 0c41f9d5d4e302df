#pragma once

#include "invocation/request.hpp"

#include <optional>
#include <string>

namespace noisedet {

// Exactly one of noise_detected / error is set, depending on success.
struct DetectionResponse {
    bool success{false};
    std::optional<bool> noise_detected;
    std::optional<std::string> error;

    static DetectionResponse detected(bool noiseDetected);
    static DetectionResponse failure(const std::string& message);

    // {"success": ..., "noise_detected": ..., "error": ...}
    JsonValue toJson() const;
};

// Transport envelope. The status is 200 for every outcome; failures are only
// visible through data.success.
JsonValue toInvocationResult(const DetectionResponse& response);

} // namespace noisedet
