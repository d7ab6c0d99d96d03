#include "vidguard/vision/Types.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace vision {

int64_t VideoProperties::frameIndexAt(double timestamp_sec) const {
    const double idx = std::floor(timestamp_sec * fps);
    // range check in double space, the cast is undefined outside int64_t
    if (!std::isfinite(idx) || idx < 0.0 || idx >= static_cast<double>(total_frames)) return -1;
    return static_cast<int64_t>(idx);
}

bool isFlaggedLabel(const std::string& label, const std::string& benign_label) {
    if (label.size() != benign_label.size()) return true;
    return !std::equal(label.begin(), label.end(), benign_label.begin(),
                       [](unsigned char a, unsigned char b) {
                           return std::tolower(a) == std::tolower(b);
                       });
}

} // namespace vision
