// Offline driver: replays an image directory through the guidance pipeline
// as if it were a live camera, committing a capture every N analyzed frames.
//
//   captureguide_demo <image_dir> [config.json] [--calibration]
//                     [--required id,id,...] [--capture-every N]
//                     [--diopters D]
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "os/rtos.hpp"

#include "apps/guide/AnalysisTask.hpp"
#include "apps/guide/CaptureResultStore.hpp"
#include "apps/guide/GuideConfig.hpp"
#include "apps/guide/SummaryJson.hpp"

namespace fs = std::filesystem;

static constexpr uint64_t FRAME_PERIOD_NS = 1000000000ull / 12;   // 12 Hz synthetic clock
static constexpr int      WAIT_STEP_MS    = 5;
static constexpr int      WAIT_MAX_MS     = 2000;

struct DemoArgs {
    std::string image_dir;
    std::string config_path;
    bool calibration = false;
    bool have_required = false;
    std::vector<int64_t> required;
    int capture_every = 5;
    bool have_diopters = false;
    float diopters = 0.0f;
};

static void usage() {
    std::cerr << "usage: captureguide_demo <image_dir> [config.json] [--calibration]\n"
                 "                         [--required id,id,...] [--capture-every N]\n"
                 "                         [--diopters D]\n";
}

static bool parseIdList(const std::string& s, std::vector<int64_t>& out) {
    out.clear();
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        if (tok.empty()) continue;
        char* end = nullptr;
        const long long v = std::strtoll(tok.c_str(), &end, 10);
        if (!end || *end != '\0') return false;
        out.push_back(static_cast<int64_t>(v));
    }
    return true;
}

static bool parseArgs(int argc, char** argv, DemoArgs& a) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--calibration") {
            a.calibration = true;
        } else if (arg == "--required" && i + 1 < argc) {
            if (!parseIdList(argv[++i], a.required)) return false;
            a.have_required = true;
        } else if (arg == "--capture-every" && i + 1 < argc) {
            a.capture_every = std::max(1, std::atoi(argv[++i]));
        } else if (arg == "--diopters" && i + 1 < argc) {
            a.diopters = static_cast<float>(std::atof(argv[++i]));
            a.have_diopters = true;
        } else if (arg.rfind("--", 0) == 0) {
            return false;
        } else if (a.image_dir.empty()) {
            a.image_dir = arg;
        } else if (a.config_path.empty()) {
            a.config_path = arg;
        } else {
            return false;
        }
    }
    return !a.image_dir.empty();
}

static std::vector<fs::path> listImages(const fs::path& dir) {
    std::vector<fs::path> files;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (!e.is_regular_file()) continue;
        std::string ext = e.path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".pgm") {
            files.push_back(e.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

int main(int argc, char** argv) {
    DemoArgs args;
    if (!parseArgs(argc, argv, args)) {
        usage();
        return 2;
    }

    std::error_code ec;
    if (!fs::is_directory(args.image_dir, ec)) {
        std::cerr << "[MAIN] Not a directory: " << args.image_dir << "\n";
        return 2;
    }

    guide::GuideConfig cfg;
    if (!args.config_path.empty() && !guide::loadGuideConfig(args.config_path, cfg)) {
        return 2;
    }
    if (args.have_required) cfg.required_ids = args.required;

    guide::CaptureResultStore store;
    if (args.have_diopters) store.setFocusDistance(args.diopters);

    guide::AnalysisTask task(cfg.task, cfg.quality, cfg.markers, &store);
    task.markerDetector().setRequiredIds(cfg.required_ids);

    guide::CaptureGuidanceTracker capture(cfg.capture);
    guide::CalibrationGuidanceTracker calibration(cfg.calibration);
    capture.onRequiredIdsChanged(cfg.required_ids);

    const std::vector<fs::path> images = listImages(args.image_dir);
    if (images.empty()) {
        std::cerr << "[MAIN] No images in " << args.image_dir << "\n";
        return 2;
    }
    std::cout << "[MAIN] " << images.size() << " images, "
              << (args.calibration ? "calibration" : "capture") << " session\n";

    if (!task.Start()) return 1;

    uint64_t t_ns = 1;
    uint32_t frame_id = 0;
    int analyzed = 0;
    int committed = 0;

    for (const auto& path : images) {
        cv::Mat gray = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (gray.empty()) {
            std::cerr << "[MAIN] Could not load " << path << ", skipped\n";
            continue;
        }
        if (!gray.isContinuous()) gray = gray.clone();

        msg::ImageFrame frame{};
        frame.data         = gray.data;
        frame.width        = static_cast<uint32_t>(gray.cols);
        frame.height       = static_cast<uint32_t>(gray.rows);
        frame.stride       = static_cast<uint32_t>(gray.step[0]);
        frame.bytes_per_px = 1;
        frame.t_ns         = t_ns;
        frame.frame_id     = frame_id++;
        t_ns += FRAME_PERIOD_NS;

        const uint64_t before = task.framesAnalyzed();
        if (!task.Submit(frame)) {
            std::cerr << "[MAIN] Frame " << frame.frame_id << " refused: "
                      << guide::AnalysisTask::StatusStr(task.lastStatus()) << "\n";
            continue;
        }

        // Replay is paced by the worker, not by wall time.
        int waited = 0;
        while (task.framesAnalyzed() == before && waited < WAIT_MAX_MS) {
            Rtos::SleepMs(WAIT_STEP_MS);
            waited += WAIT_STEP_MS;
        }
        ++analyzed;

        const auto markers = task.latestMarkers();
        const auto quality = task.latestQuality();
        const msg::MarkerSessionSummary session = task.markerDetector().sessionSummary();

        if (args.calibration) {
            const auto g = calibration.buildLiveGuidance(*markers, quality.get());
            std::cout << "[MAIN] " << path.filename().string() << " | " << g.message
                      << " | " << g.progress << " | " << g.coverage_text << "\n";
        } else {
            const auto g = capture.buildLiveGuidance(*markers, quality.get(), session);
            std::cout << "[MAIN] " << path.filename().string() << " | " << g.message
                      << " | " << g.phase_progress << " | " << g.coverage_text;
            if (g.block_reason) std::cout << " | blocked: " << *g.block_reason;
            std::cout << "\n";
        }

        if (analyzed % args.capture_every != 0) continue;

        const guide::CaptureSnapshot snap = task.freezeForCapture();
        bool counted = false;
        nlohmann::json sidecar;
        if (args.calibration) {
            counted = calibration.onCaptureSaved(snap.markers, snap.quality);
            sidecar = calibration.buildSidecarMarkerSummary(snap.markers, snap.quality);
        } else {
            counted = capture.onCaptureSaved(snap.markers, snap.quality, snap.session);
            sidecar = capture.buildSidecarMarkerSummary(snap.markers, snap.quality, snap.session);
        }
        ++committed;
        std::cout << "[MAIN] Capture " << committed << " (" << path.filename().string() << "): "
                  << (counted ? "counted" : "not counted, quality "
                                            + std::string(msg::QualityStatusStr(snap.quality.status)))
                  << "\n";
        std::cout << guide::dumpSummary(sidecar) << "\n";
    }

    task.RequestStop();
    task.Join();

    nlohmann::json manifest;
    if (args.calibration) {
        manifest = calibration.buildManifestSummary();
    } else {
        manifest = capture.buildManifestSummary(task.markerDetector().sessionSummary());
    }
    std::cout << guide::dumpSummary(manifest) << "\n";

    return manifest.value("enough", false) ? 0 : 1;
}
