#include "apps/guide/GuideConfig.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

namespace guide {

bool parseMarkerMode(const std::string& s, msg::MarkerMode& out) {
    if (s == "OFF")   { out = msg::MarkerMode::OFF;   return true; }
    if (s == "WARN")  { out = msg::MarkerMode::WARN;  return true; }
    if (s == "BLOCK") { out = msg::MarkerMode::BLOCK; return true; }
    return false;
}

static void applyJson(const nlohmann::json& root, GuideConfig& cfg) {
    // Section-scoped loaders: absent keys keep their current value.
    auto section = [&root](const char* name) -> const nlohmann::json* {
        if (!root.contains(name)) return nullptr;
        const auto& s = root.at(name);
        return s.is_object() ? &s : nullptr;
    };

    auto load = [](const nlohmann::json* j, const char* key, auto& dst) {
        if (j && j->contains(key)) {
            dst = j->at(key).get<std::decay_t<decltype(dst)>>();
        }
    };

    // 8-bit levels: clamp before narrowing so 300 does not wrap to 44.
    auto loadLevel = [](const nlohmann::json* j, const char* key, uint8_t& dst) {
        if (j && j->contains(key)) {
            const int64_t v = j->at(key).get<int64_t>();
            if (v < 0 || v > 255) {
                std::cerr << "[CFG] " << key << "=" << v << " out of [0, 255], clamped\n";
            }
            dst = static_cast<uint8_t>(std::max<int64_t>(0, std::min<int64_t>(255, v)));
        }
    };

    if (const auto* q = section("quality")) {
        auto& c = cfg.quality;
        load(q, "target_fps", c.TARGET_FPS);
        load(q, "roi_frac", c.ROI_FRAC);
        load(q, "roi_min_px", c.ROI_MIN_PX);
        load(q, "blur_step", c.BLUR_STEP);
        load(q, "blur_threshold", c.BLUR_THRESHOLD);
        load(q, "exposure_step", c.EXPOSURE_STEP);
        loadLevel(q, "clip_high", c.CLIP_HIGH);
        loadLevel(q, "clip_low", c.CLIP_LOW);
        load(q, "over_thresh", c.OVER_THRESH);
        load(q, "under_thresh", c.UNDER_THRESH);
        load(q, "specular_max_clusters", c.SPECULAR_MAX_CLUSTERS);
        load(q, "specular_max_cluster_px", c.SPECULAR_MAX_CLUSTER_PX);
    }

    if (const auto* m = section("markers")) {
        auto& c = cfg.markers;
        load(m, "enabled", c.ENABLED);
        load(m, "roi_frac", c.ROI_FRAC);
        load(m, "roi_min_px", c.ROI_MIN_PX);
        load(m, "downsample_step", c.DOWNSAMPLE_STEP);
        load(m, "edge_margin_frac", c.EDGE_MARGIN_FRAC);
        load(m, "required_ids", cfg.required_ids);

        if (m->contains("mode")) {
            const std::string mode = m->at("mode").get<std::string>();
            if (!parseMarkerMode(mode, c.MODE)) {
                std::cerr << "[CFG] Unknown marker mode '" << mode << "', keeping "
                          << msg::MarkerModeStr(c.MODE) << "\n";
            }
        }
    }

    if (const auto* g = section("capture")) {
        auto& c = cfg.capture;
        load(g, "stable_ids_n", c.STABLE_IDS_N);
        load(g, "distance_min_cm", c.DISTANCE_MIN_CM);
        load(g, "distance_max_cm", c.DISTANCE_MAX_CM);
        load(g, "edge_margin_frac", c.EDGE_MARGIN_FRAC);
        load(g, "good_captures_target", c.GOOD_CAPTURES_TARGET);
        load(g, "per_tag_target", c.PER_TAG_TARGET);
        load(g, "grid_target_filled", c.GRID_TARGET_FILLED);
        load(g, "cross_arch_required", c.CROSS_ARCH_REQUIRED);
        load(g, "cross_arch_spread", c.CROSS_ARCH_SPREAD);
        load(g, "anchor_per_bin", c.ANCHOR_PER_BIN);
        load(g, "sweep_mid", c.SWEEP_MID);
        load(g, "sweep_high_low", c.SWEEP_HIGH_LOW);
        load(g, "cross_arch_total", c.CROSS_ARCH_TOTAL);
        load(g, "cross_arch_high_low", c.CROSS_ARCH_HIGH_LOW);
    }

    if (const auto* k = section("calibration")) {
        auto& c = cfg.calibration;
        load(k, "distance_target_cm", c.DISTANCE_TARGET_CM);
        load(k, "distance_min_cm", c.DISTANCE_MIN_CM);
        load(k, "distance_max_cm", c.DISTANCE_MAX_CM);
        load(k, "edge_margin_frac", c.EDGE_MARGIN_FRAC);
        load(k, "good_captures_target", c.GOOD_CAPTURES_TARGET);
        load(k, "grid_target_filled", c.GRID_TARGET_FILLED);
    }

    if (const auto* t = section("task")) {
        auto& c = cfg.task;
        load(t, "receive_timeout_ms", c.RECEIVE_TIMEOUT_MS);
        load(t, "max_frame_bytes", c.MAX_FRAME_BYTES);
    }
}

bool parseGuideConfig(const std::string& text, GuideConfig& cfg) {
    // Parse into a copy so a half-applied document never leaks out.
    GuideConfig next = cfg;
    try {
        const nlohmann::json root = nlohmann::json::parse(text);
        if (!root.is_object()) {
            std::cerr << "[CFG] Config root must be a JSON object\n";
            return false;
        }
        applyJson(root, next);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[CFG] Malformed config: " << e.what() << "\n";
        return false;
    }
    cfg = std::move(next);
    return true;
}

bool loadGuideConfig(const std::string& path, GuideConfig& cfg) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[CFG] Config file " << path << " not found. Using defaults.\n";
        return true;
    }

    std::ifstream ifs(path);
    if (!ifs) {
        std::cerr << "[CFG] Cannot open config file " << path << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();

    if (!parseGuideConfig(ss.str(), cfg)) return false;

    std::cout << "[CFG] Loaded " << path << "\n";
    return true;
}

} // namespace guide
