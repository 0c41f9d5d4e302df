#include "detect/ffmpeg_silence_detector.hpp"
#include "detect/errors.hpp"
#include "process/subprocess.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace noisedet {

std::string formatFilterNumber(double value) {
    // fewest fractional digits that still read back as the same value
    std::string s;
    for (int precision = 0; precision <= 24; ++precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << value;
        s = oss.str();
        if (std::strtod(s.c_str(), nullptr) == value) break;
    }
    if (s.find('.') != std::string::npos) {
        s.erase(s.find_last_not_of('0') + 1);
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

FfmpegSilenceDetector::FfmpegSilenceDetector(const Config& config) : config_(config) {}

std::vector<std::string> FfmpegSilenceDetector::buildCommand(const std::string& inputFile,
                                                             double noiseToleranceDb,
                                                             double noiseDurationSec) const {
    if (!(noiseDurationSec >= kMinNoiseDurationSec)) {
        throw ValidationError("noise_duration must be at least " +
                              formatFilterNumber(kMinNoiseDurationSec) + " seconds");
    }
    const std::string filter = "[0:a]silencedetect=d=" + formatFilterNumber(noiseDurationSec) +
                               ":n=" + formatFilterNumber(noiseToleranceDb) + "dB[s0]";
    return {
        config_.ffmpegPath,
        "-hide_banner",
        "-nostdin",
        "-i", inputFile,
        "-filter_complex", filter,
        "-map", "[s0]",
        "-f", "null",
        "-",
    };
}

std::string FfmpegSilenceDetector::run(const std::string& inputFile,
                                       double noiseToleranceDb,
                                       double noiseDurationSec) const {
    const auto argv = buildCommand(inputFile, noiseToleranceDb, noiseDurationSec);
    if (config_.verbose) {
        std::cerr << "Debug: running " << describeCommand(argv) << std::endl;
    }

    ProcessResult result = runProcess(argv, config_.timeout);

    if (result.termSignal) {
        std::cerr << "Error: " << config_.ffmpegPath << " killed by signal "
                  << *result.termSignal << "\n" << result.stderrText << std::endl;
        throw ExecutionError("ffmpeg terminated by signal " + std::to_string(*result.termSignal));
    }
    if (result.exitCode != 0) {
        std::cerr << "Error: " << config_.ffmpegPath << " exited with status "
                  << result.exitCode << "\n" << result.stderrText << std::endl;
        throw ExecutionError("ffmpeg exited with status " + std::to_string(result.exitCode) +
                             ". Check logs");
    }
    return result.stderrText;
}

SilenceReport FfmpegSilenceDetector::detect(const std::string& inputFile,
                                            double noiseToleranceDb,
                                            double noiseDurationSec) const {
    SilenceReport report = parseSilenceOutput(run(inputFile, noiseToleranceDb, noiseDurationSec));
    if (config_.verbose) {
        std::cerr << "Debug: " << report.startMarkers << " silence interval(s)";
        if (report.totalDuration) std::cerr << " in " << *report.totalDuration << " s";
        std::cerr << std::endl;
    }
    return report;
}

} // namespace noisedet
