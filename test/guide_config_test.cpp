#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "apps/guide/GuideConfig.hpp"

namespace fs = std::filesystem;

static int g_failures = 0;

static void expect(bool ok, const std::string& what) {
    std::cout << "  " << what << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

int main() {
    using namespace guide;

    std::cout << "=== guide_config_test ===\n";

    std::cout << "\n[Test 0] Defaults\n";
    {
        const GuideConfig cfg{};
        expect(cfg.quality.TARGET_FPS == 12 && cfg.quality.BLUR_THRESHOLD == 150.0, "quality defaults");
        expect(cfg.markers.ENABLED && cfg.markers.MODE == msg::MarkerMode::WARN, "marker defaults");
        expect(cfg.required_ids.empty(), "no required ids");
        expect(cfg.capture.GOOD_CAPTURES_TARGET == 60 && cfg.capture.GRID_TARGET_FILLED == 7, "capture defaults");
        expect(cfg.calibration.GOOD_CAPTURES_TARGET == 25 && cfg.calibration.GRID_TARGET_FILLED == 8, "calibration defaults");
    }

    std::cout << "\n[Test 1] Partial document overlays defaults\n";
    {
        GuideConfig cfg;
        const std::string doc = R"({
            "quality":     { "blur_threshold": 90.5, "clip_high": 250 },
            "markers":     { "mode": "BLOCK", "required_ids": [4, 2, 9], "downsample_step": 1 },
            "capture":     { "per_tag_target": 4, "cross_arch_required": false },
            "calibration": { "distance_target_cm": 40 },
            "task":        { "receive_timeout_ms": 20 }
        })";
        expect(parseGuideConfig(doc, cfg), "parsed");
        expect(cfg.quality.BLUR_THRESHOLD == 90.5 && cfg.quality.CLIP_HIGH == 250, "quality overlay");
        expect(cfg.quality.TARGET_FPS == 12, "untouched key keeps default");
        expect(cfg.markers.MODE == msg::MarkerMode::BLOCK, "marker mode");
        expect(cfg.required_ids == std::vector<int64_t>({4, 2, 9}), "required ids");
        expect(cfg.markers.DOWNSAMPLE_STEP == 1, "downsample step");
        expect(cfg.capture.PER_TAG_TARGET == 4 && !cfg.capture.CROSS_ARCH_REQUIRED, "capture overlay");
        expect(cfg.calibration.DISTANCE_TARGET_CM == 40.0, "calibration overlay");
        expect(cfg.task.RECEIVE_TIMEOUT_MS == 20, "task overlay");
    }

    std::cout << "\n[Test 2] Bad documents leave the config untouched\n";
    {
        GuideConfig cfg;
        cfg.capture.PER_TAG_TARGET = 3;

        expect(!parseGuideConfig("{ \"capture\": ", cfg), "syntax error rejected");
        expect(!parseGuideConfig("[1, 2]", cfg), "array root rejected");
        expect(!parseGuideConfig(R"({ "capture": { "per_tag_target": 9, "good_captures_target": "lots" } })", cfg),
               "wrongly typed value rejected");
        expect(cfg.capture.PER_TAG_TARGET == 3, "no partial application");

        expect(parseGuideConfig(R"({ "markers": { "mode": "LOUD" } })", cfg), "unknown mode is a warning");
        expect(cfg.markers.MODE == msg::MarkerMode::WARN, "mode kept");
    }

    std::cout << "\n[Test 3] Marker mode names\n";
    {
        msg::MarkerMode m = msg::MarkerMode::WARN;
        expect(parseMarkerMode("OFF", m) && m == msg::MarkerMode::OFF, "OFF");
        expect(parseMarkerMode("BLOCK", m) && m == msg::MarkerMode::BLOCK, "BLOCK");
        expect(!parseMarkerMode("block", m) && m == msg::MarkerMode::BLOCK, "case-sensitive");
    }

    std::cout << "\n[Test 4] Files\n";
    {
        const fs::path dir = fs::temp_directory_path() / "guide_config_test";
        fs::create_directories(dir);

        GuideConfig cfg;
        expect(loadGuideConfig((dir / "does_not_exist.json").string(), cfg), "missing file keeps defaults");
        expect(cfg.capture.PER_TAG_TARGET == 10, "defaults intact");

        const fs::path good = dir / "good.json";
        {
            std::ofstream ofs(good);
            ofs << R"({ "capture": { "stable_ids_n": 5 }, "markers": { "enabled": false } })";
        }
        expect(loadGuideConfig(good.string(), cfg), "file loaded");
        expect(cfg.capture.STABLE_IDS_N == 5 && !cfg.markers.ENABLED, "values applied");

        const fs::path bad = dir / "bad.json";
        {
            std::ofstream ofs(bad);
            ofs << "{ broken";
        }
        expect(!loadGuideConfig(bad.string(), cfg), "malformed file rejected");

        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::cout << "\n[Test 5] Clip levels outside 8 bits are clamped\n";
    {
        GuideConfig cfg;
        expect(parseGuideConfig(R"({ "quality": { "clip_high": 300, "clip_low": -5 } })", cfg), "parsed");
        expect(cfg.quality.CLIP_HIGH == 255, "300 -> 255");
        expect(cfg.quality.CLIP_LOW == 0, "-5 -> 0");

        expect(parseGuideConfig(R"({ "quality": { "clip_high": 250, "clip_low": 12 } })", cfg), "in-range values parsed");
        expect(cfg.quality.CLIP_HIGH == 250 && cfg.quality.CLIP_LOW == 12, "kept as given");

        expect(!parseGuideConfig(R"({ "quality": { "clip_high": "bright" } })", cfg), "non-numeric level rejected");
        expect(cfg.quality.CLIP_HIGH == 250, "config untouched");
    }

    std::cout << "\n[Main] Test complete, failures=" << g_failures << "\n";
    return g_failures == 0 ? 0 : 1;
}
