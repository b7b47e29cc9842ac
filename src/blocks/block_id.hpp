#pragma once
#include <string>

namespace Folio {
namespace Blocks {

// 32 lowercase hex characters.
bool is_raw_block_id(const std::string& id);

std::string strip_separators(const std::string& id);

// Raw key for any spelling of a block id ("29D979EE-..." -> "29d979ee...").
std::string to_raw_block_id(const std::string& id);

// 8-4-4-4-12 rendering of a raw id; anything that is not a raw id is returned unchanged.
std::string format_block_id(const std::string& raw);

}  // namespace Blocks
}  // namespace Folio
