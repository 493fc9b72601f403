#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "apps/guide/SummaryJson.hpp"

using nlohmann::json;

static int g_failures = 0;

static void expect(bool ok, const std::string& what) {
    std::cout << "  " << what << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static msg::CaptureManifestSummary sampleCaptureManifest() {
    msg::CaptureManifestSummary m;
    m.stable_ids_n = 8;
    m.tracked_ids = {3, 7, 12};
    m.distance_min_cm = 20.0;
    m.distance_max_cm = 30.0;
    m.edge_margin_frac = 0.1;
    m.good_captures = 17;
    m.targets = {60, 10, 7, true};
    m.grid_counts = {1, 0, 2, 3, 5, 0, 0, 4, 2};
    m.grid_filled = 6;
    m.per_tag_capture_count = {{3, 9}, {7, 0}, {12, 11}};
    m.phase_a = {2, 2, 1, 3, 4};
    m.phase_b_left = {5, 1, 0};
    m.phase_c_right = {2, 2, 2};
    m.phase_d_cross_arch = {1, 1, 0};
    m.enough = false;
    m.reasons_if_not_enough = {"Need more good shots: 17/60", "Coverage: 6/7", "Tag 7: 0/10"};
    return m;
}

int main() {
    using namespace guide;

    std::cout << "=== guide_summaryjson_test ===\n";

    std::cout << "\n[Test 0] Capture manifest keys\n";
    {
        const json j = sampleCaptureManifest();
        for (const char* key : {"version", "stableIdsN", "trackedIds", "distanceRangeCm", "edgeMarginFrac",
                                "goodCaptures", "targets", "coverageGridCounts", "coverageGridFilled",
                                "perTagCaptureCount", "phaseProgress", "enough", "reasonsIfNotEnough"}) {
            expect(j.contains(key), std::string("has ") + key);
        }
        expect(j.at("version") == 1, "version 1");
        expect(j.at("distanceRangeCm") == json::array({20.0, 30.0}), "distance range pair");
        expect(j.at("coverageGridCounts").size() == 9 && j.at("coverageGridCounts").at("4") == 5, "grid keyed \"0\"..\"8\"");
        expect(j.at("perTagCaptureCount").at("7") == 0, "zero per-tag entry kept");
        expect(j.at("targets").at("crossArchRequired") == true, "targets.crossArchRequired");

        const auto& p = j.at("phaseProgress");
        expect(p.at("phaseA").at("lowAny") == 4, "phaseA.lowAny");
        expect(p.at("phaseB_left").at("leftMid") == 5, "phaseB_left.leftMid");
        expect(p.at("phaseC_right").at("rightLow") == 2, "phaseC_right.rightLow");
        expect(p.at("phaseD_crossArch").at("total") == 1, "phaseD_crossArch.total");
    }

    std::cout << "\n[Test 1] Capture manifest survives dump and parse\n";
    {
        const auto in = sampleCaptureManifest();
        const std::string text = dumpSummary(in);

        msg::CaptureManifestSummary out;
        expect(parseCaptureManifest(text, out), "parsed");
        expect(out.tracked_ids == in.tracked_ids, "tracked ids");
        expect(out.good_captures == 17 && out.grid_filled == 6, "counts");
        expect(out.grid_counts == in.grid_counts, "grid");
        expect(out.per_tag_capture_count == in.per_tag_capture_count, "per-tag");
        expect(out.phase_a.right_mid == 1 && out.phase_b_left.high == 1 && out.phase_d_cross_arch.high == 1, "phases");
        expect(out.targets.per_tag == 10 && out.targets.cross_arch_required, "targets");
        expect(out.reasons_if_not_enough == in.reasons_if_not_enough, "reasons");
        expect(json(out) == json(in), "identical documents");
    }

    std::cout << "\n[Test 2] Calibration manifest\n";
    {
        msg::CalibrationManifestSummary in;
        in.distance_target_cm = 25.0;
        in.distance_min_cm = 20.0;
        in.distance_max_cm = 30.0;
        in.edge_margin_frac = 0.1;
        in.good_captures = 12;
        in.targets = {25, 8};
        in.grid_counts = {2, 2, 2, 2, 2, 2, 0, 0, 0};
        in.grid_filled = 6;
        in.reasons_if_not_enough = {"Need more good shots: 12/25", "Coverage: 6/8"};

        const json j = in;
        expect(j.at("distanceTargetCm") == 25.0, "distanceTargetCm");
        expect(!j.contains("trackedIds") && !j.contains("phaseProgress"), "no identity / phase keys");

        msg::CalibrationManifestSummary out;
        expect(parseCalibrationManifest(dumpSummary(j), out), "parsed");
        expect(json(out) == j, "identical documents");

        json no_reasons = j;
        no_reasons.erase("reasonsIfNotEnough");
        expect(parseCalibrationManifest(no_reasons.dump(), out) && out.reasons_if_not_enough.empty(),
               "missing reasons read as empty");
    }

    std::cout << "\n[Test 3] Malformed manifests are rejected\n";
    {
        msg::CaptureManifestSummary out;
        expect(!parseCaptureManifest("{ not json", out), "syntax error");

        json j = sampleCaptureManifest();
        j.erase("coverageGridCounts");
        expect(!parseCaptureManifest(j.dump(), out), "missing key");

        j = sampleCaptureManifest();
        j["perTagCaptureCount"] = {{"abc", 1}};
        expect(!parseCaptureManifest(j.dump(), out), "non-numeric tag key");

        j = sampleCaptureManifest();
        j["goodCaptures"] = "many";
        expect(!parseCaptureManifest(j.dump(), out), "wrong type");

        msg::CalibrationManifestSummary cal;
        expect(!parseCalibrationManifest("[]", cal), "array root");
    }

    std::cout << "\n[Test 4] Capture sidecar\n";
    {
        msg::SidecarMarkerSummary s;
        s.mode = "BLOCK";
        s.dictionary = "APRILTAG_36h11";
        s.frame_width = 640;
        s.frame_height = 480;
        s.framing_ok = true;
        s.distance_ok = true;

        msg::SidecarDetection d;
        d.id = 4;
        d.center_px = {320.0, 240.0};
        d.center_norm = msg::Point2d{0.5, 0.5};
        d.corners_px = {{310, 230}, {330, 230}, {330, 250}, {310, 250}};
        d.quality = 0.01;
        s.detections.push_back(d);

        msg::SidecarCaptureContext c;
        c.required_ids = {4, 5};
        c.tracked_ids = {4, 5};
        c.missing_required_ids = {5};
        c.detected_ids = {4};
        c.phase = "LEFT_SWEEP";
        s.capture = c;

        const json j = s;
        expect(j.at("frameSize") == json::array({640, 480}), "frameSize");
        expect(j.at("distanceCm").is_null(), "unknown distance is null");
        expect(j.at("missingRequiredIds") == json::array({5}), "missingRequiredIds");
        expect(j.at("phase") == "LEFT_SWEEP", "phase");
        expect(j.at("gridCell").is_null() && j.at("lateralBin").is_null(), "no placement -> nulls");
        expect(j.at("crossArch") == false, "crossArch");

        const auto& jd = j.at("detections").at(0);
        expect(jd.at("id") == 4 && jd.at("centerPx") == json::array({320.0, 240.0}), "detection center");
        expect(jd.at("cornersPx").size() == 4 && jd.at("cornersPx").at(2) == json::array({330.0, 250.0}), "corners");
        expect(jd.at("quality") == 0.01, "quality");

        s.capture.reset();
        s.distance_cm = 26.5;
        s.detections[0].center_norm.reset();
        s.detections[0].quality.reset();
        const json k = s;
        expect(!k.contains("requiredIds") && !k.contains("trackedIds") && !k.contains("phase"),
               "calibration sidecar has no identity keys");
        expect(k.at("distanceCm") == 26.5, "distance present");
        expect(k.at("detections").at(0).at("centerNorm").is_null(), "centerNorm null");
        expect(k.at("detections").at(0).at("quality").is_null(), "quality null");
    }

    std::cout << "\n[Test 5] Dump format\n";
    {
        const std::string text = dumpSummary(json{{"b", 1}, {"a", 2}});
        expect(text == "{\n  \"a\": 2,\n  \"b\": 1\n}", "2-space indent, sorted keys");
    }

    std::cout << "\n[Main] Test complete, failures=" << g_failures << "\n";
    return g_failures == 0 ? 0 : 1;
}
