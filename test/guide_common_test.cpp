#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "apps/guide/GuidanceCommon.hpp"

static int g_failures = 0;

static void expect(bool ok, const std::string& what) {
    std::cout << "  " << what << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static msg::TagDetection tagAt(int64_t id, double cx, double cy, double half = 0.0) {
    msg::TagDetection d;
    d.id = id;
    d.center_x = cx;
    d.center_y = cy;
    if (half > 0.0) {
        d.corners = {{cx - half, cy - half}, {cx + half, cy - half},
                     {cx + half, cy + half}, {cx - half, cy + half}};
    }
    return d;
}

int main() {
    using namespace guide;

    std::cout << "=== guide_common_test ===\n";

    std::cout << "\n[Test 0] 3x3 grid indexing\n";
    expect(gridIndex3x3(0.0, 0.0) == 0, "origin -> cell 0");
    expect(gridIndex3x3(0.5, 0.5) == 4, "center -> cell 4");
    expect(gridIndex3x3(1.0, 1.0) == 8, "far corner -> cell 8");
    expect(gridIndex3x3(0.333333, 0.0) == 1, "x on first split -> middle column");
    expect(gridIndex3x3(0.666666, 0.7) == 8, "x on second split -> right column");
    expect(gridIndex3x3(0.1, 0.9) == 6, "bottom-left");

    bool all_in_range = true;
    for (int i = 0; i <= 20; ++i) {
        for (int k = 0; k <= 20; ++k) {
            const int c = gridIndex3x3(i / 20.0, k / 20.0);
            if (c < 0 || c > 8) all_in_range = false;
        }
    }
    expect(all_in_range, "every point maps into 0..8");

    std::cout << "\n[Test 1] Lateral / height bins\n";
    expect(lateralBin(0.10) == LateralBin::LEFT, "0.10 LEFT");
    expect(lateralBin(0.33) == LateralBin::CENTER, "0.33 CENTER (outer bins are open)");
    expect(lateralBin(0.66) == LateralBin::CENTER, "0.66 CENTER");
    expect(lateralBin(0.70) == LateralBin::RIGHT, "0.70 RIGHT");
    expect(heightBin(0.20) == HeightBin::LOW, "0.20 LOW");
    expect(heightBin(0.50) == HeightBin::MID, "0.50 MID");
    expect(heightBin(0.90) == HeightBin::HIGH, "0.90 HIGH");
    expect(std::string(LateralBinStr(LateralBin::RIGHT)) == "RIGHT", "LateralBinStr");
    expect(std::string(HeightBinStr(HeightBin::LOW)) == "LOW", "HeightBinStr");

    std::cout << "\n[Test 2] Grid counting helpers\n";
    {
        msg::GridCounts g{};
        expect(filledGridCells(g) == 0, "empty grid has 0 filled");
        expect(firstEmptyGridCell(g) == 0, "first empty of empty grid is 0");
        g[0] = 3;
        g[1] = 1;
        g[4] = 2;
        expect(filledGridCells(g) == 3, "3 filled");
        expect(firstEmptyGridCell(g) == 2, "first empty is 2");
        g.fill(1);
        expect(firstEmptyGridCell(g) == -1, "full grid -> -1");
        expect(cellName(0) == "top-left", "cellName(0)");
        expect(cellName(4) == "mid-center", "cellName(4)");
        expect(cellName(8) == "bottom-right", "cellName(8)");
    }

    std::cout << "\n[Test 3] Detection geometry\n";
    {
        const uint32_t W = 1000, H = 800;
        std::vector<msg::TagDetection> dets = {tagAt(1, 200, 400, 20), tagAt(2, 900, 400, 20)};

        expect(std::abs(spreadXNorm(dets, W) - 0.7) < 1e-9, "spread 0.7");
        expect(hasBothSides(dets, W), "tags on both sides");
        expect(!hasBothSides({tagAt(1, 500, 400)}, W), "single center tag is not both sides");
        expect(spreadXNorm({}, W) == 0.0, "no detections -> spread 0");

        double x = 0, y = 0;
        expect(meanCenterNorm(dets, W, H, x, y), "mean center available");
        expect(std::abs(x - 0.55) < 1e-9 && std::abs(y - 0.5) < 1e-9, "mean center (0.55, 0.5)");
        expect(!meanCenterNorm({}, W, H, x, y), "no mean center without detections");
        expect(!meanCenterNorm(dets, 0, H, x, y), "no mean center without frame size");

        expect(!framingWithinMargin(dets, W, H, 0.10), "corner at x=920 breaks the 10% margin");
        expect(framingWithinMargin({tagAt(3, 500, 400, 50)}, W, H, 0.10), "centered tag frames ok");
        expect(!framingWithinMargin({tagAt(4, 50, 400)}, W, H, 0.10), "corner-less tag uses its center");
        expect(framingWithinMargin({}, W, H, 0.10), "no detections frames ok");
    }

    std::cout << "\n[Test 4] Distance gate\n";
    expect(distanceInRange(std::nullopt, 20, 30), "unknown distance passes");
    expect(distanceInRange(20.0, 20, 30), "inclusive lower bound");
    expect(distanceInRange(30.0, 20, 30), "inclusive upper bound");
    expect(!distanceInRange(19.9, 20, 30), "too close");
    expect(!distanceInRange(31.0, 20, 30), "too far");

    std::cout << "\n[Test 5] Stable id choice\n";
    {
        std::map<int64_t, uint64_t> tally = {{5, 10}, {3, 10}, {9, 2}, {1, 7}};
        const auto top3 = chooseStableIds(tally, 3);
        expect(top3 == std::vector<int64_t>({3, 5, 1}), "count desc, ties by id asc");
        expect(chooseStableIds(tally, 10).size() == 4, "n larger than tally");
        expect(chooseStableIds(tally, 0).empty(), "n = 0");
        expect(joinIds({3, 5, 1}) == "3,5,1", "joinIds default separator");
        expect(joinIds({}, " ") == "", "joinIds empty");
    }

    std::cout << "\n[Test 6] Freezing live results\n";
    {
        msg::MarkerStatus st;
        st.mode = msg::MarkerMode::BLOCK;
        st.frame_width = 640;
        st.frame_height = 480;
        st.detections = {tagAt(7, 100, 100), tagAt(2, 300, 200), tagAt(7, 120, 100)};
        st.required_ids = {2, 4};
        st.missing_required_ids = {4};
        st.all_required_visible = false;

        const auto snap = freezeMarkerStatus(st);
        expect(snap.detected_ids == std::vector<int64_t>({2, 7}), "detected ids distinct ascending");
        expect(snap.detections.size() == 3, "detections copied");
        expect(snap.missing_required_ids == std::vector<int64_t>({4}), "missing copied");
        expect(snap.mode == msg::MarkerMode::BLOCK, "mode copied");

        msg::QualityResult q;
        q.status = msg::QualityStatus::SPECULAR;
        q.distance_cm = 24.0;
        const auto qs = freezeQualityResult(q);
        expect(qs.exposure_flags == std::vector<std::string>({"SPECULAR"}), "SPECULAR flag");
        expect(qs.distance_cm && *qs.distance_cm == 24.0, "distance copied");

        q.status = msg::QualityStatus::BLUR;
        expect(freezeQualityResult(q).exposure_flags.empty(), "BLUR has no exposure flag");
    }

    std::cout << "\n[Test 7] Sidecar detection order\n";
    {
        std::vector<msg::TagDetection> dets = {tagAt(9, 10, 10), tagAt(2, 300, 50), tagAt(2, 100, 60)};
        const auto out = sidecarDetections(dets, 400, 200);
        expect(out.size() == 3, "3 entries");
        expect(out[0].id == 2 && out[0].center_px.x == 100, "(2, 100) first");
        expect(out[1].id == 2 && out[1].center_px.x == 300, "(2, 300) second");
        expect(out[2].id == 9, "id 9 last");
        expect(out[0].center_norm && std::abs(out[0].center_norm->x - 0.25) < 1e-9, "normalised center");
        expect(!sidecarDetections(dets, 0, 0)[0].center_norm, "no normalised center without frame size");
    }

    std::cout << "\n[Main] Test complete, failures=" << g_failures << "\n";
    return g_failures == 0 ? 0 : 1;
}
