#include "string_utils.hpp"
#include <algorithm>
#include <boost/crc.hpp>
#include <cctype>
#include <cstdio>
#include "../../core/types/constants.hpp"
#include "../url/url.hpp"

namespace Folio {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            joined += separator;
        joined += parts[i];
    }
    return joined;
}

bool is_hex(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::string html_escape_attribute(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

namespace {

bool is_reserved(unsigned char c) {
    static const std::string reserved = "<>:\"/\\|?*";
    return c < 0x20 || c == 0x7f || reserved.find(static_cast<char>(c)) != std::string::npos;
}

bool is_allowed(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.' || c == ' ' || c == '\t';
}

std::string short_hash(const std::string& text) {
    boost::crc_32_type crc;
    crc.process_bytes(text.data(), text.size());
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%08x", static_cast<unsigned>(crc.checksum()));
    return buffer;
}

}  // namespace

std::string sanitize_segment(const std::string& title) {
    using Core::Constants;

    std::string decoded = Url::decode(trim(title));
    if (decoded.empty())
        return Constants::UNTITLED;

    std::string cleaned;
    for (unsigned char c : decoded) {
        if (is_reserved(c))
            cleaned += '_';
        else if (is_allowed(c))
            cleaned += static_cast<char>(c);
    }

    size_t first = cleaned.find_first_not_of('.');
    cleaned      = first == std::string::npos ? "" : cleaned.substr(first);

    std::string collapsed;
    for (char c : cleaned) {
        if (c == ' ' || c == '\t')
            c = '_';
        if (c == '_' && !collapsed.empty() && collapsed.back() == '_')
            continue;
        collapsed += c;
    }

    size_t begin = collapsed.find_first_not_of("._");
    size_t end   = collapsed.find_last_not_of("._");
    if (begin == std::string::npos)
        return Constants::UNTITLED;
    collapsed = collapsed.substr(begin, end - begin + 1);

    if (collapsed.size() > Constants::MAX_SEGMENT_LENGTH) {
        collapsed = collapsed.substr(0, Constants::TRUNCATED_SEGMENT_LEN) + "_"
                    + short_hash(collapsed);
    }
    return collapsed;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Folio
