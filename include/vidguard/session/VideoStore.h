#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vidguard/Config.h"

namespace vidguard {

/*  VideoStore 视频文件存放
*
*   Videos live in upload_dir as <session_id><ext>. The store only provisions and locates files;
*   deleting a session's file on teardown belongs to SessionRegistry.
*/
class VideoStore {
public:
    explicit VideoStore(const ServerConfig& cfg);

    // create upload_dir / temp_dir if missing
    bool prepareDirectories() const;

    // <upload_dir>/<session_id><ext> for the first supported extension found
    std::optional<std::filesystem::path> locate(const std::string& session_id) const;

    // copy a local video into the upload dir under the session id.
    // Throws ScanException (UnsupportedFormat / FileTooLarge / ImportFailed).
    std::filesystem::path import(const std::string& session_id, const std::filesystem::path& source) const;

    // administrative cleanup: delete every regular file in upload_dir and temp_dir
    std::vector<std::string> cleanupAll() const;

    bool isSupported(const std::filesystem::path& file) const;

    const std::filesystem::path& uploadDir() const { return upload_dir_; }
    const std::filesystem::path& tempDir() const { return temp_dir_; }

private:
    std::filesystem::path upload_dir_;
    std::filesystem::path temp_dir_;
    std::uintmax_t max_upload_bytes_;
    std::vector<std::string> extensions_;
};

} // namespace vidguard
