#include "vidguard/vision/VideoAnnotator.h"

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vision {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void removePartial(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        std::cerr << "[VideoAnnotator] Removed partial output: " << path << "\n";
    } else if (ec) {
        std::cerr << "[VideoAnnotator] Failed to remove " << path << ": " << ec.message() << "\n";
    }
}

} // namespace

void drawClassification(cv::Mat& bgr, const ClassifierOutput& out, bool flagged,
                        int64_t frame_index, int64_t total_frames) {
    char score[16];
    std::snprintf(score, sizeof(score), "%.2f", out.score);
    const std::string text = upper(out.label) + " (" + score + ")";

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double scale = 1.0;
    const int thickness = 2;
    // BGR: 绿 = benign, 红 = flagged
    const cv::Scalar color = flagged ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 255, 0);
    const cv::Scalar bg    = flagged ? cv::Scalar(0, 0, 100) : cv::Scalar(0, 100, 0);

    int baseline = 0;
    const cv::Size ts = cv::getTextSize(text, font, scale, thickness, &baseline);
    cv::rectangle(bgr, cv::Point(10, 10), cv::Point(20 + ts.width, 20 + ts.height + baseline), bg, cv::FILLED);
    cv::putText(bgr, text, cv::Point(15, 15 + ts.height), font, scale, color, thickness);

    if (total_frames > 0) {
        char progress[48];
        std::snprintf(progress, sizeof(progress), "Progress: %.1f%%",
                      100.0 * static_cast<double>(frame_index) / static_cast<double>(total_frames));
        cv::putText(bgr, progress, cv::Point(bgr.cols - 200, bgr.rows - 20),
                    font, 0.5, cv::Scalar(255, 255, 255), 1);
    }
}

AnnotateStats annotateVideo(const std::string& input_path,
                            const std::string& output_path,
                            Classifier& classifier,
                            const AnnotateOptions& opt) {
    cv::VideoCapture cap(input_path);
    if (!cap.isOpened()) {
        throw std::runtime_error("Could not open video file: " + input_path);
    }

    double fps = cap.get(cv::CAP_PROP_FPS);
    if (fps <= 0.0) fps = 30.0;
    const int width  = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
    const int height = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT));
    const int64_t total = std::max<int64_t>(0, static_cast<int64_t>(cap.get(cv::CAP_PROP_FRAME_COUNT)));
    const int skip = std::max(1, opt.frame_skip);

    std::cout << "[VideoAnnotator] " << input_path << ": " << width << "x" << height
              << " @ " << fps << " fps, " << total << " frames, classify every " << skip << "\n";

    const std::string cc = opt.fourcc.size() == 4 ? opt.fourcc : std::string("mp4v");
    cv::VideoWriter writer(output_path, cv::VideoWriter::fourcc(cc[0], cc[1], cc[2], cc[3]),
                           fps, cv::Size(width, height));
    if (!writer.isOpened()) {
        removePartial(output_path);
        throw std::runtime_error("Could not create output video: " + output_path);
    }

    AnnotateStats stats;
    ClassifierOutput last{opt.benign_label, 0.f};
    cv::Mat frame, rgb;
    try {
        while (cap.read(frame) && !frame.empty()) {
            if (stats.frames_written % skip == 0) {
                try {
                    cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);
                    last = classifier.classify(rgb);
                    ++stats.frames_classified;
                } catch (const std::exception& e) {
                    ++stats.classification_errors;
                    std::cerr << "[VideoAnnotator] Classification failed at frame "
                              << stats.frames_written << ": " << e.what() << "\n";
                }
            }
            drawClassification(frame, last, isFlaggedLabel(last.label, opt.benign_label),
                               stats.frames_written, total);
            writer.write(frame);
            ++stats.frames_written;

            if (stats.frames_written % 100 == 0) {
                std::cout << "[VideoAnnotator] Processed " << stats.frames_written << "/" << total << " frames\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[VideoAnnotator] Error during processing: " << e.what() << "\n";
        writer.release();
        removePartial(output_path);
        throw;
    }
    writer.release();

    std::cout << "[VideoAnnotator] Done: " << output_path << " (" << stats.frames_written << " frames, "
              << stats.frames_classified << " classified, " << stats.classification_errors << " errors)\n";
    return stats;
}

} // namespace vision
