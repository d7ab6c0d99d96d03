#pragma once
#include <memory>
#include "vidguard/Config.h"
#include "vidguard/vision/OrtClassifier.h"

namespace vidguard {

// ServerConfig -> classifier session options
vision::OrtClassifier::SessionOptions classifierOptions(const ServerConfig& cfg);

// build the process-wide classifier and run its startup self test.
// Never returns null; a failed load leaves isReady() == false.
std::unique_ptr<vision::OrtClassifier> loadClassifier(const ServerConfig& cfg);

} // namespace vidguard
