#pragma once
#include <cstdint>
#include <string>
#include "Classifier.h"

namespace vision {

// 离线标注: 逐帧画上分类标签后写出新视频
struct AnnotateOptions {
    int         frame_skip   = 30;       // classify every Nth frame, others reuse the last label
    std::string benign_label = "normal";
    std::string fourcc       = "mp4v";
};

struct AnnotateStats {
    int64_t frames_written        = 0;
    int64_t frames_classified     = 0;
    int64_t classification_errors = 0;   // frames that kept the previous label
};

// Reads input_path, writes output_path at the source fps and size.
// Throws std::runtime_error when the input cannot be opened or the writer cannot be created;
// a partially written output is removed before the exception leaves.
AnnotateStats annotateVideo(const std::string& input_path,
                            const std::string& output_path,
                            Classifier& classifier,
                            const AnnotateOptions& opt = {});

// draw "LABEL (0.93)" on a filled box in the top-left corner, plus the progress line
void drawClassification(cv::Mat& bgr, const ClassifierOutput& out, bool flagged,
                        int64_t frame_index, int64_t total_frames);

} // namespace vision
