#pragma once
#include <string>

namespace Folio {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_same_domain(const std::string& url1, const std::string& url2);
    static bool        is_http(const std::string& url);

    static std::string strip_fragment(const std::string& url);
    static std::string fragment(const std::string& url);

    // Last 32-hex run in the path, lowercased; empty when the URL carries none.
    static std::string extract_page_id(const std::string& url);

    // Percent-decoding; malformed escapes leave the input untouched.
    static std::string decode(const std::string& text);
};

}  // namespace Utils
}  // namespace Folio
