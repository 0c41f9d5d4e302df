#pragma once

#include "detect/silence_report.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace noisedet {

// silencedetect reads d= as a time value with microsecond resolution.
inline constexpr double kMinNoiseDurationSec = 0.000001;

// Runs ffmpeg's silencedetect filter over a local media file.
class FfmpegSilenceDetector {
public:
    struct Config {
        std::string ffmpegPath = "ffmpeg";
        std::chrono::milliseconds timeout{60000};
        bool verbose = false;
    };

    explicit FfmpegSilenceDetector(const Config& config);

    // Full argv for one run, program first. Throws ValidationError when the
    // duration is below kMinNoiseDurationSec.
    std::vector<std::string> buildCommand(const std::string& inputFile,
                                          double noiseToleranceDb,
                                          double noiseDurationSec) const;

    // Runs the tool and returns its diagnostic output. Throws ExecutionError
    // on launch failure, timeout, a fatal signal or a non-zero exit.
    std::string run(const std::string& inputFile,
                    double noiseToleranceDb,
                    double noiseDurationSec) const;

    SilenceReport detect(const std::string& inputFile,
                         double noiseToleranceDb,
                         double noiseDurationSec) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

// Plain decimal rendering accepted by ffmpeg option parsing ("0.3", "-36"),
// with as many fractional digits as the value needs.
std::string formatFilterNumber(double value);

} // namespace noisedet
