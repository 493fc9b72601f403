#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "msg/SessionSummary.hpp"

// ---------------------------------------------------------------------------
// JSON wire form of the session summaries. Key names and the "0".."8" grid
// keys are consumed by downstream tooling; do not rename.
// nlohmann::json objects keep keys sorted, so dumps are deterministic.
// ---------------------------------------------------------------------------
namespace msg {

void to_json(nlohmann::json& j, const CaptureManifestSummary& m);
void from_json(const nlohmann::json& j, CaptureManifestSummary& m);

void to_json(nlohmann::json& j, const CalibrationManifestSummary& m);
void from_json(const nlohmann::json& j, CalibrationManifestSummary& m);

void to_json(nlohmann::json& j, const SidecarMarkerSummary& s);

} // namespace msg

namespace guide {

// 2-space indented dump.
std::string dumpSummary(const nlohmann::json& j);

// Parse helpers for tooling / tests. False (and a log line) on malformed input.
bool parseCaptureManifest(const std::string& text, msg::CaptureManifestSummary& out);
bool parseCalibrationManifest(const std::string& text, msg::CalibrationManifestSummary& out);

} // namespace guide
