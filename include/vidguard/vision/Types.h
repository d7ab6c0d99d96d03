#pragma once
#include <cstdint>
#include <string>

namespace vision {

// 视频属性快照 (taken once when a session attaches its video)
struct VideoProperties {
    double  fps          = 0.0;     // frames per second
    int64_t total_frames = 0;       // CAP_PROP_FRAME_COUNT
    int     width        = 0;
    int     height       = 0;
    double  duration     = 0.0;     // seconds, total_frames / fps (0 if fps <= 0)

    // floor(timestamp * fps), or -1 when that frame is not in the video
    // (negative, past the end, NaN or too large for int64_t)
    int64_t frameIndexAt(double timestamp_sec) const;

    // frame index inside [0, total_frames)
    bool contains(int64_t frame_index) const {
        return frame_index >= 0 && frame_index < total_frames;
    }

    static double durationOf(int64_t total_frames, double fps) {
        return fps > 0.0 ? static_cast<double>(total_frames) / fps : 0.0;
    }
};

// classifier raw output
struct ClassifierOutput {
    std::string label;
    float       score = 0.f;        // 0~1
};

// 单帧分类结果 (transient, forwarded to the client and dropped)
struct ClassificationResult {
    double      timestamp   = 0.0;  // seconds
    int64_t     frame_index = -1;
    std::string label;
    float       confidence  = 0.f;
    bool        flagged     = false; // label != benign label
};

// case-insensitive label comparison against the benign category
bool isFlaggedLabel(const std::string& label, const std::string& benign_label);

} // namespace vision
