#include "url.hpp"
#include <regex>
#include <vector>
#include "../text/string_utils.hpp"

namespace Folio {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed        parsed;
    std::string_view sv = url;

    size_t hash = sv.find('#');
    if (hash != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(hash + 1));
        sv              = sv.substr(0, hash);
    }
    size_t q = sv.find('?');
    if (q != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q + 1));
        sv           = sv.substr(0, q);
    }

    size_t colon = sv.find(':');
    size_t slash = sv.find('/');
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon < slash)) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t           end_auth  = sv.find('/');
        std::string_view authority = sv.substr(0, end_auth);
        sv = end_auth == std::string_view::npos ? std::string_view() : sv.substr(end_auth);

        size_t at = authority.find_last_of('@');
        if (at != std::string_view::npos)
            authority.remove_prefix(at + 1);

        size_t port_colon = authority.find_last_of(':');
        size_t bracket    = authority.find_last_of(']');
        if (port_colon != std::string_view::npos
            && (bracket == std::string_view::npos || port_colon > bracket)) {
            parsed.port = std::string(authority.substr(port_colon + 1));
            authority   = authority.substr(0, port_colon);
        }
        parsed.host = Text::to_lower(std::string(authority));
    }

    parsed.path = sv.empty() ? "/" : std::string(sv);
    return parsed;
}

namespace {

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t                   start = 0;
    while (start <= path.size()) {
        size_t      end     = path.find('/', start);
        std::string segment = path.substr(start, end == std::string::npos ? end : end - start);
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
        }
        else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    std::string normalized = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized += segments[i];
        if (i + 1 < segments.size())
            normalized += "/";
    }
    bool trailing = path.size() > 1 && (path.back() == '/' || Text::ends_with(path, "/.")
                                        || Text::ends_with(path, "/.."));
    if (trailing && normalized.back() != '/')
        normalized += "/";
    return normalized;
}

std::string authority_of(const UrlParsed& p) {
    return p.port.empty() ? p.host : p.host + ":" + p.port;
}

}  // namespace

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return strip_fragment(base);

    if (relative[0] == '#')
        return strip_fragment(base) + relative;

    UrlParsed rel = parse(relative);
    if (!rel.scheme.empty())
        return relative;

    UrlParsed b = parse(base);
    if (relative.rfind("//", 0) == 0)
        return b.scheme + ":" + relative;

    std::string suffix;
    size_t      qf = relative.find_first_of("?#");
    std::string rel_path = qf == std::string::npos ? relative : relative.substr(0, qf);
    if (qf != std::string::npos)
        suffix = relative.substr(qf);

    std::string path;
    if (rel_path.empty()) {
        path = b.path;
        if (!suffix.empty() && suffix[0] == '#' && !b.query.empty())
            suffix = "?" + b.query + suffix;
    }
    else if (rel_path[0] == '/') {
        path = rel_path;
    }
    else {
        size_t last = b.path.find_last_of('/');
        path        = (last == std::string::npos ? "/" : b.path.substr(0, last + 1)) + rel_path;
    }

    return b.scheme + "://" + authority_of(b) + normalize_path(path) + suffix;
}

bool Url::is_same_domain(const std::string& url1, const std::string& url2) {
    auto clean_host = [](std::string h) {
        if (!h.empty() && h.back() == '.')
            h.pop_back();
        return h;
    };
    return clean_host(parse(url1).host) == clean_host(parse(url2).host);
}

bool Url::is_http(const std::string& url) {
    UrlParsed p = parse(url);
    return (p.scheme == "http" || p.scheme == "https") && !p.host.empty();
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string Url::fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? "" : url.substr(hash + 1);
}

std::string Url::extract_page_id(const std::string& url) {
    static const std::regex id_regex("(^|[^0-9a-fA-F])([0-9a-fA-F]{32})(?=$|[^0-9a-fA-F])");

    std::string path = parse(url).path;
    std::string id;
    for (auto it = std::sregex_iterator(path.begin(), path.end(), id_regex);
         it != std::sregex_iterator();
         ++it) {
        id = (*it)[2].str();
    }
    return Text::to_lower(id);
}

std::string Url::decode(const std::string& text) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            decoded += text[i];
            continue;
        }
        if (i + 2 >= text.size())
            return text;
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0)
            return text;
        decoded += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return decoded;
}

}  // namespace Utils
}  // namespace Folio
