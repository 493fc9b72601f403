#include <atomic>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include "apps/guide/MarkerDetector.hpp"

// 640x480 frame, default config (ROI 60%, step 2):
//   ROI = x [128, 512), y [96, 384) -> working buffer 192 x 144
static constexpr int W = 640;
static constexpr int H = 480;
static constexpr int ROI_X = 128;
static constexpr int ROI_Y = 96;

static int g_failures = 0;

static void expect(bool ok, const std::string& what) {
    std::cout << "  " << what << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

static bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

// Axis-aligned square in working-buffer pixels.
static guide::RawMarker square(int64_t id, double x0, double y0, double side) {
    guide::RawMarker m;
    m.id = id;
    m.corners = {{x0, y0}, {x0 + side, y0}, {x0 + side, y0 + side}, {x0, y0 + side}};
    return m;
}

// Backend double: hands back a scripted marker list, records what it was given.
struct ScriptedBackend {
    std::vector<guide::RawMarker> next;
    bool throw_next = false;
    bool throw_int = false;             // throw a non-std type
    int calls = 0;
    int last_w = 0, last_h = 0, last_stride = 0;
    std::vector<uint8_t> last_buf;
};

static guide::DetectFn scripted(ScriptedBackend& sb) {
    return [&sb](const uint8_t* data, int w, int h, int stride, std::vector<guide::RawMarker>& out) {
        ++sb.calls;
        sb.last_w = w;
        sb.last_h = h;
        sb.last_stride = stride;
        sb.last_buf.assign(data, data + static_cast<std::size_t>(stride) * h);
        if (sb.throw_next) {
            sb.throw_next = false;
            if (sb.throw_int) throw 42;
            throw std::runtime_error("backend failure");
        }
        out = sb.next;
    };
}

struct Frame {
    std::vector<uint8_t> px;
    msg::ImageFrame f{};
    Frame() : px(static_cast<std::size_t>(W) * H, 128) {
        f.data = px.data();
        f.width = W;
        f.height = H;
        f.stride = W;
        f.bytes_per_px = 1;
    }
};

int main() {
    using namespace guide;

    std::cout << "=== guide_markerdetector_test ===\n";

    std::cout << "\n[Test 0] Operator texts\n";
    {
        auto t = buildMarkerTexts(0, {}, {}, true);
        expect(t.guidance == "No markers detected", "no markers");
        expect(t.display == "Markers detected: 0", "display without required ids");

        t = buildMarkerTexts(2, {1, 2, 3}, {2, 3}, false);
        expect(t.guidance == "Missing required: 2,3", "missing wins over framing");
        expect(t.display == "Markers detected: 2 | required 1/3", "display with required ids");

        t = buildMarkerTexts(1, {}, {}, false);
        expect(t.guidance == "Keep markers away from frame edges", "framing");

        t = buildMarkerTexts(3, {4}, {}, true);
        expect(t.guidance == "Markers OK", "all good");
    }

    std::cout << "\n[Test 1] Disabled detector\n";
    {
        MarkerDetectorConfig cfg{};
        cfg.ENABLED = false;
        auto md = makeMarkerDetector(cfg);
        Frame fr;
        expect(md->mode() == msg::MarkerMode::OFF, "mode OFF");
        expect(!md->process(fr.f), "process() does nothing");
        expect(md->latest() && md->latest()->display_text == "Markers detected: N/A", "display N/A");
        expect(md->sessionSummary().frames_processed == 0, "no tallies");
    }

    std::cout << "\n[Test 2] Fresh detector publishes a default status\n";
    {
        ScriptedBackend sb;
        FiducialMarkerDetector md({}, scripted(sb));
        const auto st = md.latest();
        expect(st != nullptr, "latest() never null");
        expect(st->detectedCount() == 0 && st->display_text == "Markers detected: 0", "empty status");
        expect(md.mode() == msg::MarkerMode::WARN, "default mode WARN");
    }

    std::cout << "\n[Test 3] ROI downsample and remap to full-frame pixels\n";
    {
        ScriptedBackend sb;
        sb.next = {square(11, 10, 10, 20)};
        FiducialMarkerDetector md({}, scripted(sb));

        Frame fr;
        fr.px[static_cast<std::size_t>(ROI_Y + 2 * 7) * W + (ROI_X + 2 * 5)] = 200;
        fr.f.t_ns = 42;

        expect(md.process(fr.f), "process() ran a detection pass");
        expect(sb.last_w == 192 && sb.last_h == 144 && sb.last_stride == 192, "working buffer 192x144");
        expect(sb.last_buf.size() == 192u * 144u && sb.last_buf[7 * 192 + 5] == 200, "downsampled pixel lands at (5,7)");

        const auto st = md.latest();
        expect(st->detections.size() == 1, "1 detection");
        const auto& d = st->detections[0];
        expect(d.id == 11, "id 11");
        expect(d.corners.size() == 4 && near(d.corners[0].x, 148) && near(d.corners[0].y, 116), "first corner (148, 116)");
        expect(near(d.center_x, 168) && near(d.center_y, 136), "center (168, 136)");
        expect(d.quality && near(*d.quality, 1600.0 / (384.0 * 288.0)), "quality = area / ROI area");
        expect(st->framing_ok, "framing ok");
        expect(st->t_ns == 42 && st->frame_width == W && st->frame_height == H, "frame identity");
        expect(st->guidance_text == "Markers OK", "guidance Markers OK");
    }

    std::cout << "\n[Test 4] Required identities\n";
    {
        ScriptedBackend sb;
        sb.next = {square(3, 40, 40, 10), square(8, 80, 40, 10)};
        FiducialMarkerDetector md({}, scripted(sb));
        md.setRequiredIds({5, 3, 3});

        Frame fr;
        expect(md.process(fr.f), "processed");
        const auto st = md.latest();
        expect(st->required_ids == std::vector<int64_t>({3, 5}), "required sorted, de-duplicated");
        expect(st->missing_required_ids == std::vector<int64_t>({5}), "5 missing");
        expect(!st->all_required_visible, "not all visible");
        expect(st->guidance_text == "Missing required: 5", "guidance names the missing id");
        expect(st->display_text == "Markers detected: 2 | required 1/2", "display shows present/required");

        sb.next.push_back(square(5, 120, 40, 10));
        expect(md.process(fr.f), "processed");
        expect(md.latest()->all_required_visible && md.latest()->missing_required_ids.empty(), "all visible now");

        md.setRequiredIds({});
        expect(md.process(fr.f), "processed");
        expect(md.latest()->all_required_visible, "no required ids: vacuously visible");
    }

    std::cout << "\n[Test 5] Session tallies\n";
    {
        ScriptedBackend sb;
        FiducialMarkerDetector md({}, scripted(sb));
        md.setRequiredIds({1});
        Frame fr;

        sb.next = {square(1, 40, 40, 10), square(1, 80, 40, 10), square(2, 120, 40, 10)};
        md.process(fr.f);
        sb.next = {square(2, 40, 40, 10)};
        md.process(fr.f);
        sb.next.clear();
        md.process(fr.f);

        const auto s = md.sessionSummary();
        expect(s.frames_processed == 3, "3 frames processed");
        expect(s.frames_all_required_visible == 1, "required visible in 1 frame");
        expect(s.per_tag_count.at(1) == 1, "duplicate id counted once per frame");
        expect(s.per_tag_count.at(2) == 2, "id 2 seen in 2 frames");

        md.reset();
        const auto r = md.sessionSummary();
        expect(r.frames_processed == 0 && r.per_tag_count.empty(), "reset() clears tallies");
        expect(md.latest()->detectedCount() == 0, "reset() publishes an empty status");
    }

    std::cout << "\n[Test 6] Markers near the frame edge\n";
    {
        ScriptedBackend sb;
        // The default ROI never reaches the 10% margin, so search the whole frame.
        MarkerDetectorConfig cfg{};
        cfg.ROI_FRAC = 1.0;
        sb.next = {square(4, 2, 100, 10)};     // full frame x = 4 .. 24, margin is 64
        FiducialMarkerDetector md(cfg, scripted(sb));
        Frame fr;
        expect(md.process(fr.f), "processed");
        expect(!md.latest()->framing_ok, "framing not ok");
        expect(md.latest()->guidance_text == "Keep markers away from frame edges", "reframe guidance");
    }

    std::cout << "\n[Test 7] OFF mode\n";
    {
        ScriptedBackend sb;
        sb.next = {square(1, 40, 40, 10)};
        FiducialMarkerDetector md({}, scripted(sb));
        md.setMode(msg::MarkerMode::OFF);
        Frame fr;
        expect(!md.process(fr.f), "process() returns false");
        expect(sb.calls == 0, "backend not called");
        expect(md.latest()->display_text == "Markers: OFF", "display Markers: OFF");
        expect(md.latest()->detectedCount() == 0, "no detections");
        expect(md.sessionSummary().frames_processed == 0, "not tallied");
        expect(md.lastStatus() == FiducialMarkerDetector::Status::DISABLED, "status DISABLED");

        md.setMode(msg::MarkerMode::BLOCK);
        expect(md.process(fr.f) && md.latest()->mode == msg::MarkerMode::BLOCK, "BLOCK mode propagated");
    }

    std::cout << "\n[Test 8] Unsupported pixel layout\n";
    {
        ScriptedBackend sb;
        FiducialMarkerDetector md({}, scripted(sb));
        Frame fr;
        fr.f.bytes_per_px = 2;
        expect(!md.process(fr.f), "process() returns false");
        expect(md.latest()->guidance_text == "Unsupported image format", "guidance text");
        expect(md.latest()->display_text == "Unsupported image format", "display text");
        expect(md.lastStatus() == FiducialMarkerDetector::Status::UNSUPPORTED_FORMAT, "status");
        expect(sb.calls == 0, "backend not called");
    }

    std::cout << "\n[Test 9] Backend failure is an empty frame\n";
    {
        ScriptedBackend sb;
        sb.next = {square(1, 40, 40, 10)};
        sb.throw_next = true;
        FiducialMarkerDetector md({}, scripted(sb));
        Frame fr;
        expect(md.process(fr.f), "frame still processed");
        expect(md.lastStatus() == FiducialMarkerDetector::Status::DETECTOR_ERROR, "DETECTOR_ERROR");
        expect(md.latest()->detectedCount() == 0, "zero detections");
        expect(md.latest()->guidance_text == "No markers detected", "guidance");
        expect(md.sessionSummary().frames_processed == 1, "frame tallied");

        expect(md.process(fr.f) && md.latest()->detectedCount() == 1, "next frame recovers");

        sb.throw_next = true;
        sb.throw_int = true;
        expect(md.process(fr.f), "non-std throw contained");
        expect(md.lastStatus() == FiducialMarkerDetector::Status::DETECTOR_ERROR, "DETECTOR_ERROR again");
        expect(md.latest()->detectedCount() == 0, "zero detections");
        expect(md.sessionSummary().frames_processed == 3, "frame tallied");
    }

    std::cout << "\n[Test 10] AprilTag 36h11 through OpenCV\n";
    {
        const cv::aruco::Dictionary dict = cv::aruco::getPredefinedDictionary(cv::aruco::DICT_APRILTAG_36h11);
        cv::Mat tag;
        cv::aruco::generateImageMarker(dict, 7, 200, tag, 1);

        cv::Mat img(H, W, CV_8UC1, cv::Scalar(255));
        tag.copyTo(img(cv::Rect(220, 140, 200, 200)));

        msg::ImageFrame f{};
        f.data = img.data;
        f.width = W;
        f.height = H;
        f.stride = static_cast<uint32_t>(img.step[0]);
        f.bytes_per_px = 1;

        auto md = makeMarkerDetector({});
        md->setRequiredIds({7});
        expect(md->process(f), "processed");
        const auto st = md->latest();
        expect(st->detectedCount() == 1, "one tag found (got " + std::to_string(st->detectedCount()) + ")");
        if (st->detectedCount() == 1) {
            const auto& d = st->detections[0];
            expect(d.id == 7, "id 7");
            expect(near(d.center_x, 320.0, 4.0) && near(d.center_y, 240.0, 4.0), "center near (320, 240)");
            expect(d.corners.size() == 4, "4 corners");
        }
        expect(st->all_required_visible, "required id visible");
    }

    std::cout << "\n[Test 11] reset() from another thread while frames are processed\n";
    {
        ScriptedBackend sb;
        sb.next = {square(2, 40, 40, 10)};
        FiducialMarkerDetector md({}, scripted(sb));
        Frame fr;

        std::atomic<bool> done{false};
        std::thread ui([&md, &done]() {
            while (!done.load()) md.reset();
        });

        bool all_ok = true;
        for (int i = 0; i < 500; ++i) {
            all_ok = md.process(fr.f) && md.lastStatus() == FiducialMarkerDetector::Status::OK && all_ok;
        }
        done.store(true);
        ui.join();

        expect(all_ok, "every frame processed with status OK");
        md.reset();
        expect(md.sessionSummary().frames_processed == 0, "session cleared");
        expect(md.process(fr.f) && md.latest()->detectedCount() == 1, "detector still usable");
    }

    std::cout << "\n[Main] Test complete, failures=" << g_failures << "\n";
    return g_failures == 0 ? 0 : 1;
}
