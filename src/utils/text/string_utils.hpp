#pragma once

#include <string>
#include <vector>

namespace Folio {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& separator);
bool        is_hex(const std::string& str);

// Escapes a value for a double-quoted HTML attribute.
std::string html_escape_attribute(const std::string& value);

// Filesystem-safe directory name for a page title.
std::string sanitize_segment(const std::string& title);

}  // namespace Text
}  // namespace Utils
}  // namespace Folio
