#include "config.hpp"
#include "detect/ffmpeg_silence_detector.hpp"
#include "invocation/noise_detector.hpp"
#include "storage/object_store.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

// Defaults used by --file when no sensitivity is given.
static constexpr double kDefaultToleranceDb = -36.0;
static constexpr double kDefaultDurationSec = 0.3;

struct Args {
    std::string config_path = default_config_path();
    std::string event_path = "-";              // '-' = stdin
    std::optional<std::string> file;           // direct analysis mode
    double noise_tolerance = kDefaultToleranceDb;
    double noise_duration  = kDefaultDurationSec;
    AppConfig overrides;                       // flags win over file and env
};

static void print_usage(std::ostream& os) {
    os << "noisedet: silence/noise detection through ffmpeg silencedetect\n"
       << "  (default)                      Read one invocation event (JSON) and print the result\n"
       << "      --event <path|->           Event file (default: stdin)\n"
       << "      --file <path>              Analyse a local file instead of an event\n"
       << "      --noise-tolerance <dB>     Threshold for --file (default -36)\n"
       << "      --noise-duration <s>       Minimum silence for --file (default 0.3)\n"
       << "      --config <path>            Config file (default XDG)\n"
       << "      --ffmpeg <path>            ffmpeg executable (default: ffmpeg on PATH)\n"
       << "      --storage-root <dir>       Directory holding one subdirectory per bucket\n"
       << "      --staging-dir <dir>        Scratch directory for staged objects (default /tmp)\n"
       << "      --stage | --no-stage       Copy objects before analysis (default on)\n"
       << "      --timeout-ms <ms>          Bound on one ffmpeg run (default 60000)\n"
       << "  -v, --verbose                  Debug output on stderr\n";
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--event" && i + 1 < argc) a.event_path = argv[++i];
        else if (s == "--file" && i + 1 < argc) a.file = argv[++i];
        else if (s == "--noise-tolerance" && i + 1 < argc) a.noise_tolerance = std::stod(argv[++i]);
        else if (s == "--noise-duration" && i + 1 < argc) a.noise_duration = std::stod(argv[++i]);
        else if (s == "--config" && i + 1 < argc) a.config_path = expand_path(argv[++i]);

        else if (s == "--ffmpeg" && i + 1 < argc) a.overrides.ffmpeg_path = expand_path(argv[++i]);
        else if (s == "--storage-root" && i + 1 < argc) a.overrides.storage_root = expand_path(argv[++i]);
        else if (s == "--staging-dir" && i + 1 < argc) a.overrides.staging_dir = expand_path(argv[++i]);
        else if (s == "--stage") a.overrides.stage_objects = true;
        else if (s == "--no-stage") a.overrides.stage_objects = false;
        else if (s == "--timeout-ms" && i + 1 < argc) {
            a.overrides.timeout_ms = std::stoi(argv[++i]);
            if (*a.overrides.timeout_ms <= 0) throw std::invalid_argument("--timeout-ms must be positive");
        }
        else if (s == "--verbose" || s == "-v") a.overrides.verbose = true;

        else if (s == "--help" || s == "-h") {
            print_usage(std::cout);
            std::exit(0);
        }
        else {
            throw std::invalid_argument("unknown or incomplete option: " + s);
        }
    }
    return a;
}

static AppConfig resolve_config(const Args& args) {
    AppConfig cfg = load_config_file(args.config_path);
    apply_env_overrides(cfg);
    const AppConfig& o = args.overrides;
    if (o.ffmpeg_path) cfg.ffmpeg_path = o.ffmpeg_path;
    if (o.storage_root) cfg.storage_root = o.storage_root;
    if (o.staging_dir) cfg.staging_dir = o.staging_dir;
    if (o.stage_objects) cfg.stage_objects = o.stage_objects;
    if (o.timeout_ms) cfg.timeout_ms = o.timeout_ms;
    if (o.verbose) cfg.verbose = o.verbose;
    return cfg;
}

int main(int argc, char** argv) {
    Args args;
    AppConfig cfg;
    try {
        args = parse_args(argc, argv);
        cfg = resolve_config(args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    const bool verbose = cfg.verbose.value_or(false);

    noisedet::FfmpegSilenceDetector::Config toolConfig;
    toolConfig.ffmpegPath = cfg.ffmpeg_path.value_or("ffmpeg");
    toolConfig.timeout    = std::chrono::milliseconds(cfg.timeout_ms.value_or(60000));
    toolConfig.verbose    = verbose;
    noisedet::FfmpegSilenceDetector tool(toolConfig);

    noisedet::LocalObjectStore::Config storeConfig;
    if (cfg.storage_root) storeConfig.root = *cfg.storage_root;
    if (cfg.staging_dir) storeConfig.stagingDir = *cfg.staging_dir;
    storeConfig.stageObjects = cfg.stage_objects.value_or(true);
    storeConfig.verbose      = verbose;
    noisedet::LocalObjectStore store(storeConfig);

    noisedet::NoiseDetector detector(store, tool);

    if (args.file) {
        if (!(args.noise_duration > 0.0)) {
            std::cerr << "Error: --noise-duration must be greater than 0\n";
            return 2;
        }
        try {
            auto analysis = detector.analyzeFile(*args.file, args.noise_tolerance, args.noise_duration);
            auto out = analysis.toJson();
            out["file"] = *args.file;
            std::cout << out.dump(2) << std::endl;
            return 0;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    if (verbose) {
        std::cerr << "Debug: ffmpeg=" << toolConfig.ffmpegPath
                  << " storage_root=" << storeConfig.root
                  << " timeout=" << toolConfig.timeout.count() << "ms\n";
    }

    if (args.event_path == "-") {
        std::string eventText((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        std::cout << detector.handleEventText(eventText).dump() << std::endl;
    } else {
        std::cout << detector.handleEventFile(args.event_path).dump() << std::endl;
    }
    return 0;
}
