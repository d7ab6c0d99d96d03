// Test doubles shared by the session-core suites.
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "vidguard/Config.h"
#include "vidguard/session/MessageChannel.h"
#include "vidguard/vision/Classifier.h"
#include "vidguard/vision/VideoAccess.h"

namespace vidguard::testing {

// -----------------------------------------------------------------------------
// Shared, inspectable state of every FakeVideoAccess built by one opener.
// -----------------------------------------------------------------------------
struct FakeVideoLog {
  vision::VideoProperties props;
  cv::Scalar frame_bgr{255, 0, 0};

  // scripted failures
  bool fail_open = false;
  bool fail_first_read = false;
  std::atomic<bool> fail_reads{false};
  std::atomic<int> read_delay_ms{0};
  std::function<void()> on_close;       // runs inside close(), while teardown is in progress

  // counters
  std::atomic<int> opens{0};
  std::atomic<int> closes{0};
  std::atomic<int> seeks{0};
  std::atomic<int> reads{0};
  std::atomic<int> interleaved{0};      // overlapping seek/read pairs observed
  std::atomic<int> used_after_close{0};
  std::atomic<bool> decoding{false};

  std::mutex mutex;
  std::vector<std::string> ops;         // "open", "seek:N", "read", "read_end", "close"
  std::vector<int64_t> seek_frames;

  void record(const std::string& op) {
    std::lock_guard<std::mutex> lock(mutex);
    ops.push_back(op);
  }
  std::vector<std::string> opsSnapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return ops;
  }
};

// Instrumented decoder: detects seek/read interleaving across threads and throws if used after close.
class FakeVideoAccess : public vision::VideoAccess {
 public:
  explicit FakeVideoAccess(std::shared_ptr<FakeVideoLog> log) : log_(std::move(log)) {}

  bool open(const std::string&) override {
    log_->record("open");
    if (log_->fail_open) return false;
    ++log_->opens;
    opened_ = true;
    return true;
  }
  bool isOpened() const override { return opened_; }
  void close() override {
    if (!opened_) return;
    opened_ = false;
    ++log_->closes;
    log_->record("close");
    if (log_->on_close) log_->on_close();
  }

  bool seekToFrame(int64_t frame_index) override {
    guard();
    {
      std::lock_guard<std::mutex> lock(log_->mutex);
      if (log_->decoding) ++log_->interleaved;   // seek while another call is reading
      pending_seek_ = std::this_thread::get_id();
      log_->ops.push_back("seek:" + std::to_string(frame_index));
      log_->seek_frames.push_back(frame_index);
    }
    ++log_->seeks;
    cursor_ = frame_index;
    return true;
  }

  bool readFrame(cv::Mat& bgr) override {
    guard();
    const auto me = std::this_thread::get_id();
    const auto seeker = pending_seek_.load();
    if (seeker != std::thread::id() && seeker != me) ++log_->interleaved;
    if (log_->decoding.exchange(true)) ++log_->interleaved;
    log_->record("read");
    if (const int d = log_->read_delay_ms.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(d));
    }
    pending_seek_ = std::thread::id();
    const bool first = (log_->reads.fetch_add(1) == 0);
    log_->decoding = false;
    log_->record("read_end");
    if (log_->fail_reads || (first && log_->fail_first_read)) return false;
    if (cursor_ >= log_->props.total_frames) return false;
    bgr = cv::Mat(8, 8, CV_8UC3, log_->frame_bgr);
    ++cursor_;
    return true;
  }

  vision::VideoProperties properties() const override { return log_->props; }

 private:
  void guard() {
    if (!opened_) {
      ++log_->used_after_close;
      throw std::logic_error("FakeVideoAccess used after close");
    }
  }

  std::shared_ptr<FakeVideoLog> log_;
  std::atomic<bool> opened_{false};
  std::atomic<std::thread::id> pending_seek_{};
  int64_t cursor_ = 0;
};

inline vision::VideoOpener fakeOpener(const std::shared_ptr<FakeVideoLog>& log) {
  return [log]() -> std::unique_ptr<vision::VideoAccess> { return std::make_unique<FakeVideoAccess>(log); };
}

// 30 fps, 300 frames -> 10 s
inline std::shared_ptr<FakeVideoLog> makeVideoLog(double fps = 30.0, int64_t frames = 300) {
  auto log = std::make_shared<FakeVideoLog>();
  log->props.fps = fps;
  log->props.total_frames = frames;
  log->props.width = 640;
  log->props.height = 360;
  log->props.duration = vision::VideoProperties::durationOf(frames, fps);
  return log;
}

// -----------------------------------------------------------------------------
// Scripted classifier.
// -----------------------------------------------------------------------------
class FakeClassifier : public vision::Classifier {
 public:
  FakeClassifier(std::string label = "normal", float score = 0.92f)
      : label_(std::move(label)), score_(score) {}

  bool isReady() const override { return ready.load(); }

  vision::ClassifierOutput classify(const cv::Mat& rgb) override {
    ++calls;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!rgb.empty()) last_pixel_ = rgb.at<cv::Vec3b>(0, 0);
    }
    if (fail) throw std::runtime_error("scripted inference failure");
    std::lock_guard<std::mutex> lock(mutex_);
    return vision::ClassifierOutput{label_, score_};
  }

  void script(const std::string& label, float score) {
    std::lock_guard<std::mutex> lock(mutex_);
    label_ = label;
    score_ = score;
  }
  cv::Vec3b lastPixel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_pixel_;
  }

  std::atomic<bool> ready{true};
  std::atomic<bool> fail{false};
  std::atomic<int> calls{0};

 private:
  std::mutex mutex_;
  std::string label_;
  float score_;
  cv::Vec3b last_pixel_{0, 0, 0};
};

// -----------------------------------------------------------------------------
// Channel recording every event; can be told to reject deliveries.
// -----------------------------------------------------------------------------
class RecordingChannel : public MessageChannel {
 public:
  bool send(const nlohmann::json& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (reject_from_ >= 0 && attempts_ > reject_from_) return false;
    events_.push_back(event);
    cv_.notify_all();
    return true;
  }

  void close(const std::string& reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    close_reason_ = reason;
    cv_.notify_all();
  }

  // deliveries after the first n fail
  void rejectAfter(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_from_ = n;
  }

  std::vector<nlohmann::json> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<nlohmann::json> ofType(const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    for (const auto& e : events_) if (e.value("type", "") == type) out.push_back(e);
    return out;
  }

  bool waitFor(const std::function<bool(const std::vector<nlohmann::json>&)>& pred,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return pred(events_); });
  }

  bool waitForType(const std::string& type, size_t count = 1,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    return waitFor([&](const std::vector<nlohmann::json>& evs) {
      size_t n = 0;
      for (const auto& e : evs) if (e.value("type", "") == type) ++n;
      return n >= count;
    }, timeout);
  }

  bool waitClosed(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return closed_; });
  }

  bool closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }
  std::string closeReason() {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
  }
  int attempts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<nlohmann::json> events_;
  int attempts_ = 0;
  int reject_from_ = -1;
  bool closed_ = false;
  std::string close_reason_;
};

// -----------------------------------------------------------------------------
// Scratch directory, removed with its content on destruction.
// -----------------------------------------------------------------------------
class TempDir {
 public:
  explicit TempDir(const std::string& tag) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("vidguard_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path writeFile(const std::string& name, const std::string& content = "data") const {
    const auto p = path_ / name;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
    return p;
  }

 private:
  std::filesystem::path path_;
};

// fast cadence for coordinator tests
inline ServerConfig testConfig(const std::filesystem::path& root = {}) {
  ServerConfig cfg;
  if (!root.empty()) {
    cfg.upload_dir = (root / "videos").string();
    cfg.temp_dir = (root / "temp").string();
  }
  cfg.scan_interval_s = 0.5;
  cfg.tick_delay_s = 0.01;
  return cfg;
}

}  // namespace vidguard::testing
