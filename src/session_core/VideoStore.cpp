#include "vidguard/session/VideoStore.h"
#include "vidguard/Errors.h"

#include <QDebug>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace vidguard {

static std::string lowerExt(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return ext;
}

VideoStore::VideoStore(const ServerConfig& cfg)
    : upload_dir_(cfg.upload_dir),
      temp_dir_(cfg.temp_dir),
      max_upload_bytes_(static_cast<std::uintmax_t>(std::max(0, cfg.max_upload_mb)) * 1024 * 1024),
      extensions_(cfg.supported_extensions)
{
    for (auto& ext : extensions_) ext = lowerExt(fs::path("x" + ext));
}

bool VideoStore::prepareDirectories() const {
    std::error_code ec;
    for (const auto& dir : {upload_dir_, temp_dir_}) {
        fs::create_directories(dir, ec);
        if (ec) {
            qWarning() << "[VideoStore] Failed to create directory" << QString::fromStdString(dir.string())
                       << ":" << QString::fromStdString(ec.message());
            return false;
        }
    }
    return true;
}

bool VideoStore::isSupported(const fs::path& file) const {
    return std::find(extensions_.begin(), extensions_.end(), lowerExt(file)) != extensions_.end();
}

std::optional<fs::path> VideoStore::locate(const std::string& session_id) const {
    if (session_id.empty()) return std::nullopt;
    for (const auto& ext : extensions_) {
        fs::path candidate = upload_dir_ / (session_id + ext);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

fs::path VideoStore::import(const std::string& session_id, const fs::path& source) const {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw ScanException(ScanError::ImportFailed, "Video file not found: " + source.string());
    }
    if (!isSupported(source)) {
        throw ScanException(ScanError::UnsupportedFormat,
                            "Unsupported file type: " + source.extension().string());
    }
    const auto size = fs::file_size(source, ec);
    if (ec) {
        throw ScanException(ScanError::ImportFailed, "Cannot stat " + source.string() + ": " + ec.message());
    }
    if (size > max_upload_bytes_) {
        throw ScanException(ScanError::FileTooLarge,
                            "File too large. Maximum size is " + std::to_string(max_upload_bytes_ / (1024 * 1024)) + "MB.");
    }

    fs::create_directories(upload_dir_, ec);
    const fs::path target = upload_dir_ / (session_id + lowerExt(source));
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(target, rm_ec);  // 清理写了一半的文件
        throw ScanException(ScanError::ImportFailed, "Failed to save video: " + ec.message());
    }

    qInfo() << "[VideoStore] Saved" << QString::fromStdString(source.filename().string())
            << "as" << QString::fromStdString(target.string())
            << QString("(%1 MB)").arg(static_cast<double>(size) / (1024.0 * 1024.0), 0, 'f', 2);
    return target;
}

std::vector<std::string> VideoStore::cleanupAll() const {
    std::vector<std::string> removed;
    for (const auto& dir : {temp_dir_, upload_dir_}) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::error_code file_ec;
            if (!entry.is_regular_file(file_ec)) continue;
            if (fs::remove(entry.path(), file_ec)) {
                removed.push_back(entry.path().filename().string());
            } else if (file_ec) {
                qWarning() << "[VideoStore] Failed to remove" << QString::fromStdString(entry.path().string())
                           << ":" << QString::fromStdString(file_ec.message());
            }
        }
    }
    qInfo() << "[VideoStore] Cleaned up" << removed.size() << "temporary files";
    return removed;
}

} // namespace vidguard
