#include "disk_storage.hpp"
#include <fstream>
#include <sstream>

namespace Folio {
namespace Storage {

namespace fs = std::filesystem;

DiskStorage::DiskStorage(const fs::path& root, Core::LoggerPtr logger)
    : root_(fs::absolute(root).lexically_normal()), logger_(std::move(logger)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
        logger_->error("Failed to create storage directory: " + root_.string() + ": " + ec.message());
}

fs::path DiskStorage::locate(const fs::path& key) const {
    fs::path path     = (root_ / key).lexically_normal();
    fs::path relative = path.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..")
        return {};
    return path;
}

bool DiskStorage::save(const fs::path& key, const std::string& content) {
    fs::path path = locate(key);
    if (path.empty()) {
        logger_->error("Refusing to write outside " + root_.string() + ": " + key.string());
        return false;
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        logger_->error("FS Error: " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logger_->error("Write Error: " + path.string());
        return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        logger_->error("Write Error: " + path.string());
        return false;
    }
    logger_->debug("Saved: " + path.string());
    return true;
}

std::optional<std::string> DiskStorage::load(const fs::path& key) const {
    fs::path path = locate(key);
    if (path.empty())
        return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

}  // namespace Storage
}  // namespace Folio
