#include "block_id.hpp"
#include <algorithm>
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Folio {
namespace Blocks {

using Folio::Core::Constants;

bool is_raw_block_id(const std::string& id) {
    return id.size() == Constants::RAW_BLOCK_ID_LENGTH
           && std::all_of(id.begin(), id.end(), [](char c) {
                  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
              });
}

std::string strip_separators(const std::string& id) {
    std::string stripped;
    stripped.reserve(id.size());
    for (char c : id) {
        if (c != '-')
            stripped += c;
    }
    return stripped;
}

std::string to_raw_block_id(const std::string& id) {
    return Utils::Text::to_lower(strip_separators(id));
}

std::string format_block_id(const std::string& raw) {
    if (!is_raw_block_id(raw))
        return raw;
    return raw.substr(0, 8) + "-" + raw.substr(8, 4) + "-" + raw.substr(12, 4) + "-"
           + raw.substr(16, 4) + "-" + raw.substr(20);
}

}  // namespace Blocks
}  // namespace Folio
