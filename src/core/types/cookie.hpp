#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Folio {
namespace Core {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path      = "/";
    double      expires   = -1;
    bool        http_only = false;
    bool        secure    = false;

    bool operator==(const Cookie& other) const = default;
};

inline void to_json(nlohmann::json& j, const Cookie& c) {
    j = nlohmann::json{{"name", c.name},
                       {"value", c.value},
                       {"domain", c.domain},
                       {"path", c.path},
                       {"expires", c.expires},
                       {"httpOnly", c.http_only},
                       {"secure", c.secure}};
}

inline void from_json(const nlohmann::json& j, Cookie& c) {
    j.at("name").get_to(c.name);
    j.at("value").get_to(c.value);
    c.domain    = j.value("domain", "");
    c.path      = j.value("path", "/");
    c.expires   = j.value("expires", -1.0);
    c.http_only = j.value("httpOnly", false);
    c.secure    = j.value("secure", false);
}

}  // namespace Core
}  // namespace Folio
