#pragma once
#include <cstdint>

namespace msg {

struct ImageFrame {
    // Non-owning pointer to the first byte of the luma (Y) plane.
    // const to prevent modification. Only valid for the duration of one
    // analysis call; consumers never retain it.
    const uint8_t* data = nullptr;

    // Image dimensions in pixels
    uint32_t width  = 0;    // pixels
    uint32_t height = 0;    // pixels

    // Stride = number of BYTES between the start of row v and the start of row v+1.
    // For tightly packed images: stride == width * bytes_per_px.
    // For aligned/padded images: stride may be larger
    uint32_t stride = 0;    // bytes per row

    // Pixel stride: bytes between horizontally adjacent luma samples.
    // Only 1 (planar Y / GRAY8) is supported by the analyzers.
    uint8_t bytes_per_px = 1;

    uint64_t t_ns     = 0;  // monotonic frame timestamp (ns)
    uint32_t frame_id = 0;  // increasing counter

    constexpr uint32_t byteSize() const { return stride * height; }
};

} // namespace msg
