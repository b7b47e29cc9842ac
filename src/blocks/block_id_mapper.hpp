#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <unordered_map>

#include "../core/logger/logger.hpp"

namespace Folio {
namespace Blocks {

// raw id -> canonical id as rendered on the page
using BlockMap = std::map<std::string, std::string>;

// page id -> that page's block map
using BlockMapCache = std::unordered_map<std::string, BlockMap>;

class BlockIdMapper {
public:
    static constexpr const char* ATTRIBUTE = "data-block-id";

    explicit BlockIdMapper(Core::LoggerPtr logger);

    static BlockMap extract(const std::string& html);

    // The sidecar lives in the page's own directory.
    bool     save(const std::filesystem::path& page_dir, const BlockMap& map) const;
    BlockMap load(const std::filesystem::path& page_dir) const;

    static std::string formatted_id(const std::string& raw, const BlockMap* map);

    static std::filesystem::path sidecar_path(const std::filesystem::path& page_dir);

private:
    Core::LoggerPtr logger_;
};

}  // namespace Blocks
}  // namespace Folio
