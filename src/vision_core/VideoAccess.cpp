#include "vidguard/vision/VideoAccess.h"
#include <iostream>

namespace vision {

bool VideoAccess::readFrameAt(double timestamp_sec, cv::Mat& bgr) {
    const auto props = properties();
    const int64_t frame_index = props.frameIndexAt(timestamp_sec);
    if (!props.contains(frame_index)) return false;
    return seekToFrame(frame_index) && readFrame(bgr);
}

CvVideoAccess::~CvVideoAccess() {
    close();
}

bool CvVideoAccess::open(const std::string& path) {
    close();
    if (!cap_.open(path)) {  // open video failed
        std::cerr << "[VideoAccess] Failed to open video: " << path << "\n";
        return false;
    }
    path_ = path;
    return true;
}

bool CvVideoAccess::isOpened() const {
    return cap_.isOpened();
}

void CvVideoAccess::close() {
    if (cap_.isOpened()) {
        cap_.release();
        std::cout << "[VideoAccess] Released: " << path_ << "\n";
    }
}

bool CvVideoAccess::seekToFrame(int64_t frame_index) {
    if (!cap_.isOpened()) return false;
    return cap_.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(frame_index));
}

bool CvVideoAccess::readFrame(cv::Mat& bgr) {
    if (!cap_.isOpened()) return false;
    // cap.read() advances the cursor by one frame
    if (!cap_.read(bgr) || bgr.empty()) {
        return false;
    }
    return true;
}

VideoProperties CvVideoAccess::properties() const {
    VideoProperties p;
    if (!cap_.isOpened()) return p;
    p.fps          = cap_.get(cv::CAP_PROP_FPS);
    p.total_frames = static_cast<int64_t>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
    p.width        = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    p.height       = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (p.total_frames < 0) p.total_frames = 0;
    p.duration     = VideoProperties::durationOf(p.total_frames, p.fps);
    return p;
}

} // namespace vision
