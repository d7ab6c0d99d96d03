#pragma once
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "Types.h"

namespace vision {

/*  VideoAccess 单个视频资源的解码游标
*
*   seekToFrame() and readFrame() move one stateful cursor, so an instance is single-owner:
*   callers sharing it across threads must serialize every seek+read pair themselves.
*/
class VideoAccess {
public:
    virtual ~VideoAccess() = default;

    virtual bool open(const std::string& path) = 0;
    virtual bool isOpened() const = 0;
    virtual void close() = 0;

    virtual bool seekToFrame(int64_t frame_index) = 0;
    virtual bool readFrame(cv::Mat& bgr) = 0;            // next frame at the cursor, BGR
    virtual VideoProperties properties() const = 0;

    // seek to floor(timestamp * fps) and read that frame
    bool readFrameAt(double timestamp_sec, cv::Mat& bgr);
};

using VideoOpener = std::function<std::unique_ptr<VideoAccess>()>;

// cv::VideoCapture backed implementation
class CvVideoAccess : public VideoAccess {
public:
    CvVideoAccess() = default;
    ~CvVideoAccess() override;

    bool open(const std::string& path) override;
    bool isOpened() const override;
    void close() override;

    bool seekToFrame(int64_t frame_index) override;
    bool readFrame(cv::Mat& bgr) override;
    VideoProperties properties() const override;

private:
    cv::VideoCapture cap_;
    std::string path_;
};

} // namespace vision
