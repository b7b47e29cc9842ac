#pragma once
#include <filesystem>
#include <string>

#include "../core/logger/logger.hpp"
#include "storage.hpp"

namespace Folio {
namespace Storage {

class DiskStorage : public Storage {
public:
    DiskStorage(const std::filesystem::path& root, Core::LoggerPtr logger);
    ~DiskStorage() override = default;

    bool save(const std::filesystem::path& key, const std::string& content) override;
    std::optional<std::string> load(const std::filesystem::path& key) const override;

    const std::filesystem::path& root() const {
        return root_;
    }

    // Absolute location of key, or empty when it would escape the root.
    std::filesystem::path locate(const std::filesystem::path& key) const;

private:
    std::filesystem::path root_;
    Core::LoggerPtr       logger_;
};

}  // namespace Storage
}  // namespace Folio
