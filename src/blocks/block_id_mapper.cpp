#include "block_id_mapper.hpp"
#include <fstream>
#include <gumbo.h>
#include <nlohmann/json.hpp>
#include "../core/types/constants.hpp"
#include "block_id.hpp"

namespace Folio {
namespace Blocks {

namespace {

void collect_block_ids(const GumboNode* node, BlockMap& map) {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    const GumboAttribute* attr =
        gumbo_get_attribute(&node->v.element.attributes, BlockIdMapper::ATTRIBUTE);
    if (attr && attr->value[0] != '\0') {
        std::string canonical = attr->value;
        std::string raw       = to_raw_block_id(canonical);
        if (is_raw_block_id(raw))
            map.emplace(raw, canonical);
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_block_ids(static_cast<const GumboNode*>(children->data[i]), map);
    }
}

}  // namespace

BlockIdMapper::BlockIdMapper(Core::LoggerPtr logger) : logger_(std::move(logger)) {
}

BlockMap BlockIdMapper::extract(const std::string& html) {
    BlockMap map;
    if (html.empty())
        return map;

    GumboOutput* output =
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_block_ids(output->root, map);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return map;
}

std::filesystem::path BlockIdMapper::sidecar_path(const std::filesystem::path& page_dir) {
    return page_dir / Core::Constants::SIDECAR_FILENAME;
}

bool BlockIdMapper::save(const std::filesystem::path& page_dir, const BlockMap& map) const {
    std::error_code ec;
    std::filesystem::create_directories(page_dir, ec);
    if (ec) {
        logger_->warn("Block map: cannot create " + page_dir.string() + ": " + ec.message());
        return false;
    }

    std::ofstream out(sidecar_path(page_dir));
    if (!out) {
        logger_->warn("Block map: cannot write " + sidecar_path(page_dir).string());
        return false;
    }
    out << nlohmann::json(map).dump(2);
    return static_cast<bool>(out);
}

BlockMap BlockIdMapper::load(const std::filesystem::path& page_dir) const {
    std::ifstream in(sidecar_path(page_dir));
    if (!in)
        return {};

    try {
        nlohmann::json json = nlohmann::json::parse(in);
        BlockMap       map;
        for (const auto& [raw, canonical] : json.items()) {
            if (canonical.is_string())
                map.emplace(raw, canonical.get<std::string>());
        }
        return map;
    } catch (const nlohmann::json::exception& e) {
        logger_->debug("Block map: ignoring " + sidecar_path(page_dir).string() + ": " + e.what());
        return {};
    }
}

std::string BlockIdMapper::formatted_id(const std::string& raw, const BlockMap* map) {
    if (map) {
        auto it = map->find(raw);
        if (it != map->end())
            return it->second;
    }
    return format_block_id(raw);
}

}  // namespace Blocks
}  // namespace Folio
