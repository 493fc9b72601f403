#include "apps/guide/SummaryJson.hpp"

#include <stdexcept>
#include <string>
#include <exception>
#include <iostream>

using nlohmann::json;

namespace msg {

static json gridToJson(const GridCounts& g) {
    json j = json::object();
    for (int i = 0; i < GRID_CELLS; ++i) j[std::to_string(i)] = g[i];
    return j;
}

static GridCounts gridFromJson(const json& j) {
    GridCounts g{};
    for (int i = 0; i < GRID_CELLS; ++i) g[i] = j.at(std::to_string(i)).get<int>();
    return g;
}

static json pointToJson(const Point2d& p) {
    return json::array({p.x, p.y});
}

// ---- capture manifest ----

void to_json(json& j, const CaptureManifestSummary& m) {
    json per_tag = json::object();
    for (const auto& kv : m.per_tag_capture_count) per_tag[std::to_string(kv.first)] = kv.second;

    json phases = {
        {"phaseA", {
            {"centerMid", m.phase_a.center_mid},
            {"leftMid",   m.phase_a.left_mid},
            {"rightMid",  m.phase_a.right_mid},
            {"highAny",   m.phase_a.high_any},
            {"lowAny",    m.phase_a.low_any},
        }},
        {"phaseB_left", {
            {"leftMid",  m.phase_b_left.mid},
            {"leftHigh", m.phase_b_left.high},
            {"leftLow",  m.phase_b_left.low},
        }},
        {"phaseC_right", {
            {"rightMid",  m.phase_c_right.mid},
            {"rightHigh", m.phase_c_right.high},
            {"rightLow",  m.phase_c_right.low},
        }},
        {"phaseD_crossArch", {
            {"total", m.phase_d_cross_arch.total},
            {"high",  m.phase_d_cross_arch.high},
            {"low",   m.phase_d_cross_arch.low},
        }},
    };

    j = json{
        {"version",          m.version},
        {"stableIdsN",       m.stable_ids_n},
        {"trackedIds",       m.tracked_ids},
        {"distanceRangeCm",  json::array({m.distance_min_cm, m.distance_max_cm})},
        {"edgeMarginFrac",   m.edge_margin_frac},
        {"goodCaptures",     m.good_captures},
        {"targets", {
            {"goodCaptures",      m.targets.good_captures},
            {"perTag",            m.targets.per_tag},
            {"gridFilled",        m.targets.grid_filled},
            {"crossArchRequired", m.targets.cross_arch_required},
        }},
        {"coverageGridCounts", gridToJson(m.grid_counts)},
        {"coverageGridFilled", m.grid_filled},
        {"perTagCaptureCount", per_tag},
        {"phaseProgress",      phases},
        {"enough",             m.enough},
        {"reasonsIfNotEnough", m.reasons_if_not_enough},
    };
}

void from_json(const json& j, CaptureManifestSummary& m) {
    m.version      = j.at("version").get<int>();
    m.stable_ids_n = j.at("stableIdsN").get<int>();
    m.tracked_ids  = j.at("trackedIds").get<std::vector<int64_t>>();

    const auto& range = j.at("distanceRangeCm");
    m.distance_min_cm = range.at(0).get<double>();
    m.distance_max_cm = range.at(1).get<double>();

    m.edge_margin_frac = j.at("edgeMarginFrac").get<double>();
    m.good_captures    = j.at("goodCaptures").get<int>();

    const auto& t = j.at("targets");
    m.targets.good_captures       = t.at("goodCaptures").get<int>();
    m.targets.per_tag             = t.at("perTag").get<int>();
    m.targets.grid_filled         = t.at("gridFilled").get<int>();
    m.targets.cross_arch_required = t.at("crossArchRequired").get<bool>();

    m.grid_counts = gridFromJson(j.at("coverageGridCounts"));
    m.grid_filled = j.at("coverageGridFilled").get<int>();

    m.per_tag_capture_count.clear();
    for (const auto& item : j.at("perTagCaptureCount").items()) {
        // std::stoll throws std::invalid_argument on a non-numeric key
        m.per_tag_capture_count[std::stoll(item.key())] = item.value().get<int>();
    }

    const auto& p = j.at("phaseProgress");
    const auto& a = p.at("phaseA");
    m.phase_a.center_mid = a.at("centerMid").get<int>();
    m.phase_a.left_mid   = a.at("leftMid").get<int>();
    m.phase_a.right_mid  = a.at("rightMid").get<int>();
    m.phase_a.high_any   = a.at("highAny").get<int>();
    m.phase_a.low_any    = a.at("lowAny").get<int>();

    const auto& b = p.at("phaseB_left");
    m.phase_b_left.mid  = b.at("leftMid").get<int>();
    m.phase_b_left.high = b.at("leftHigh").get<int>();
    m.phase_b_left.low  = b.at("leftLow").get<int>();

    const auto& c = p.at("phaseC_right");
    m.phase_c_right.mid  = c.at("rightMid").get<int>();
    m.phase_c_right.high = c.at("rightHigh").get<int>();
    m.phase_c_right.low  = c.at("rightLow").get<int>();

    const auto& d = p.at("phaseD_crossArch");
    m.phase_d_cross_arch.total = d.at("total").get<int>();
    m.phase_d_cross_arch.high  = d.at("high").get<int>();
    m.phase_d_cross_arch.low   = d.at("low").get<int>();

    m.enough = j.at("enough").get<bool>();
    m.reasons_if_not_enough = j.at("reasonsIfNotEnough").get<std::vector<std::string>>();
}

// ---- calibration manifest ----

void to_json(json& j, const CalibrationManifestSummary& m) {
    j = json{
        {"version",          m.version},
        {"distanceTargetCm", m.distance_target_cm},
        {"distanceRangeCm",  json::array({m.distance_min_cm, m.distance_max_cm})},
        {"edgeMarginFrac",   m.edge_margin_frac},
        {"goodCaptures",     m.good_captures},
        {"targets", {
            {"goodCaptures", m.targets.good_captures},
            {"gridFilled",   m.targets.grid_filled},
        }},
        {"coverageGridCounts", gridToJson(m.grid_counts)},
        {"coverageGridFilled", m.grid_filled},
        {"enough",             m.enough},
        {"reasonsIfNotEnough", m.reasons_if_not_enough},
    };
}

void from_json(const json& j, CalibrationManifestSummary& m) {
    m.version            = j.at("version").get<int>();
    m.distance_target_cm = j.at("distanceTargetCm").get<double>();

    const auto& range = j.at("distanceRangeCm");
    m.distance_min_cm = range.at(0).get<double>();
    m.distance_max_cm = range.at(1).get<double>();

    m.edge_margin_frac = j.at("edgeMarginFrac").get<double>();
    m.good_captures    = j.at("goodCaptures").get<int>();

    const auto& t = j.at("targets");
    m.targets.good_captures = t.at("goodCaptures").get<int>();
    m.targets.grid_filled   = t.at("gridFilled").get<int>();

    m.grid_counts = gridFromJson(j.at("coverageGridCounts"));
    m.grid_filled = j.at("coverageGridFilled").get<int>();

    m.enough = j.at("enough").get<bool>();
    m.reasons_if_not_enough = j.value("reasonsIfNotEnough", std::vector<std::string>{});
}

// ---- sidecar ----

void to_json(json& j, const SidecarMarkerSummary& s) {
    json dets = json::array();
    for (const auto& d : s.detections) {
        json corners = json::array();
        for (const auto& c : d.corners_px) corners.push_back(pointToJson(c));

        dets.push_back(json{
            {"id",         d.id},
            {"centerPx",   pointToJson(d.center_px)},
            {"centerNorm", d.center_norm ? pointToJson(*d.center_norm) : json(nullptr)},
            {"cornersPx",  corners},
            {"quality",    d.quality ? json(*d.quality) : json(nullptr)},
        });
    }

    j = json{
        {"mode",        s.mode},
        {"dictionary",  s.dictionary},
        {"frameSize",   json::array({s.frame_width, s.frame_height})},
        {"framingOk",   s.framing_ok},
        {"distanceCm",  s.distance_cm ? json(*s.distance_cm) : json(nullptr)},
        {"distanceOk",  s.distance_ok},
        {"detections",  dets},
    };

    if (s.capture) {
        const auto& c = *s.capture;
        j["requiredIds"]        = c.required_ids;
        j["trackedIds"]         = c.tracked_ids;
        j["missingRequiredIds"] = c.missing_required_ids;
        j["detectedIds"]        = c.detected_ids;
        j["allRequiredVisible"] = c.all_required_visible;
        j["phase"]              = c.phase;
        j["gridCell"]           = c.grid_cell ? json(*c.grid_cell) : json(nullptr);
        j["lateralBin"]         = c.lateral_bin ? json(*c.lateral_bin) : json(nullptr);
        j["heightBin"]          = c.height_bin ? json(*c.height_bin) : json(nullptr);
        j["crossArch"]          = c.cross_arch;
    }
}

} // namespace msg

namespace guide {

std::string dumpSummary(const json& j) {
    return j.dump(2);
}

bool parseCaptureManifest(const std::string& text, msg::CaptureManifestSummary& out) {
    try {
        out = json::parse(text).get<msg::CaptureManifestSummary>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[CG] Malformed capture manifest: " << e.what() << "\n";
    } catch (const std::logic_error& e) {
        std::cerr << "[CG] Malformed capture manifest key: " << e.what() << "\n";
    }
    return false;
}

bool parseCalibrationManifest(const std::string& text, msg::CalibrationManifestSummary& out) {
    try {
        out = json::parse(text).get<msg::CalibrationManifestSummary>();
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[CAL] Malformed calibration manifest: " << e.what() << "\n";
    }
    return false;
}

} // namespace guide
